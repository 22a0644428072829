#include "listen/forwarder_pool.hpp"

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <algorithm>
#include <array>
#include <exception>
#include <fmt/format.h>
#include <limits>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <optional>
#include <type_traits>
#include <utility>

#include "listen/request_builder.hpp"

namespace hookrelay {
namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

using TlsStream = ssl::stream<beast::tcp_stream>;
using Completion = std::function<void(LocalOutcome)>;

constexpr std::size_t kReadChunk = 8 * 1024;

bool IsIpLiteral(const std::string &host) {
  boost::system::error_code ec;
  net::ip::make_address(host, ec);
  return !ec;
}

// One local HTTP round-trip on its own strand. Every path ends in Finish(),
// which closes the socket before reporting.
template <class Stream>
class LocalCall : public ForwarderPool::ICall,
                  public std::enable_shared_from_this<LocalCall<Stream>> {
  static constexpr bool kTls = std::is_same_v<Stream, TlsStream>;

public:
  LocalCall(net::io_context &ioc, ssl::context &ctx, const ForwardTarget &target,
            LocalRequest request, std::chrono::milliseconds timeout,
            std::size_t body_cap, bool verify_tls, Completion done)
      : executor_(net::make_strand(ioc)), host_(target.host),
        port_(target.port), request_(std::move(request)), timeout_(timeout),
        body_cap_(body_cap), verify_tls_(verify_tls), done_(std::move(done)),
        resolver_(executor_), stream_(MakeStream(executor_, ctx)),
        deadline_(executor_) {}

  void Start() override {
    net::post(executor_, [self = this->shared_from_this()] {
      self->started_at_ = std::chrono::steady_clock::now();
      self->deadline_.expires_after(self->timeout_);
      self->deadline_.async_wait(beast::bind_front_handler(
          &LocalCall::OnDeadline, self->shared_from_this()));
      self->resolver_.async_resolve(
          self->host_, self->port_,
          beast::bind_front_handler(&LocalCall::OnResolve,
                                    self->shared_from_this()));
    });
  }

  void Cancel() override {
    net::post(executor_, [self = this->shared_from_this()] {
      LocalOutcome outcome;
      outcome.transport_error = TransportError::kCanceled;
      outcome.canceled = true;
      outcome.detail = "canceled by shutdown";
      self->Finish(std::move(outcome));
    });
  }

private:
  static Stream MakeStream(const net::strand<net::io_context::executor_type> &ex,
                           ssl::context &ctx) {
    if constexpr (kTls) {
      return Stream(ex, ctx);
    } else {
      (void)ctx;
      return Stream(ex);
    }
  }

  void OnDeadline(const beast::error_code &ec) {
    if (ec == net::error::operation_aborted) {
      return;
    }
    Fail(TransportError::kTimeout,
         fmt::format("no complete response within {} ms", timeout_.count()));
  }

  void OnResolve(const beast::error_code &ec,
                 tcp::resolver::results_type results) {
    if (ec) {
      Fail(TransportError::kDial,
           fmt::format("resolve {}: {}", host_, ec.message()));
      return;
    }
    beast::get_lowest_layer(stream_).async_connect(
        results,
        beast::bind_front_handler(&LocalCall::OnConnect, this->shared_from_this()));
  }

  void OnConnect(const beast::error_code &ec,
                 const tcp::resolver::results_type::endpoint_type &) {
    if (ec) {
      Fail(TransportError::kDial,
           fmt::format("connect {}:{}: {}", host_, port_, ec.message()));
      return;
    }
    if constexpr (kTls) {
      if (!IsIpLiteral(host_) &&
          !SSL_set_tlsext_host_name(stream_.native_handle(), host_.c_str())) {
        Fail(TransportError::kTls,
             fmt::format("set SNI: error {}", ::ERR_get_error()));
        return;
      }
      if (verify_tls_) {
        stream_.set_verify_mode(ssl::verify_peer);
        stream_.set_verify_callback(ssl::host_name_verification(host_));
      } else {
        stream_.set_verify_mode(ssl::verify_none);
      }
      stream_.async_handshake(
          ssl::stream_base::client,
          beast::bind_front_handler(&LocalCall::OnHandshake,
                                    this->shared_from_this()));
    } else {
      Write();
    }
  }

  void OnHandshake(const beast::error_code &ec) {
    if (ec) {
      Fail(TransportError::kTls,
           fmt::format("TLS handshake: {}", ec.message()));
      return;
    }
    Write();
  }

  void Write() {
    http::async_write(
        stream_, request_,
        beast::bind_front_handler(&LocalCall::OnWrite, this->shared_from_this()));
  }

  void OnWrite(const beast::error_code &ec, std::size_t) {
    if (ec) {
      Fail(TransportError::kWrite, fmt::format("write: {}", ec.message()));
      return;
    }
    ReadHeader();
  }

  void ReadHeader() {
    parser_.emplace();
    parser_->header_limit(64 * 1024);
    // Size is enforced below by truncation, not by the parser.
    parser_->body_limit((std::numeric_limits<std::uint64_t>::max)());
    http::async_read_header(
        stream_, buffer_, *parser_,
        beast::bind_front_handler(&LocalCall::OnHeader, this->shared_from_this()));
  }

  void OnHeader(const beast::error_code &ec, std::size_t) {
    if (ec) {
      Fail(TransportError::kRead, fmt::format("read header: {}", ec.message()));
      return;
    }
    const auto &res = parser_->get();
    const unsigned status = res.result_int();
    // Interim replies (100 Continue, 103 Early Hints) precede the real one.
    if (status / 100 == 1 && status != 101) {
      ReadHeader();
      return;
    }
    outcome_.status = static_cast<int>(status);
    for (const auto &field : res) {
      outcome_.headers.emplace_back(std::string(field.name_string()),
                                    std::string(field.value()));
    }
    ReadBody();
  }

  void ReadBody() {
    if (parser_->is_done()) {
      Succeed();
      return;
    }
    parser_->get().body().data = chunk_.data();
    parser_->get().body().size = chunk_.size();
    http::async_read(
        stream_, buffer_, *parser_,
        beast::bind_front_handler(&LocalCall::OnBody, this->shared_from_this()));
  }

  void OnBody(beast::error_code ec, std::size_t) {
    if (ec == http::error::need_buffer) {
      ec = {};
    }
    if (ec) {
      Fail(TransportError::kRead, fmt::format("read body: {}", ec.message()));
      return;
    }
    const std::size_t got = chunk_.size() - parser_->get().body().size;
    const std::size_t room = body_cap_ - std::min(body_cap_, outcome_.body.size());
    outcome_.body.append(chunk_.data(), std::min(got, room));
    if (got > room) {
      // Remaining bytes are not read; the connection is closed instead.
      outcome_.body_truncated = true;
      Succeed();
      return;
    }
    ReadBody();
  }

  void Succeed() {
    LocalOutcome outcome = std::move(outcome_);
    outcome.transport_error = TransportError::kNone;
    Finish(std::move(outcome));
  }

  void Fail(TransportError err, std::string detail) {
    LocalOutcome outcome;
    outcome.status = 0;
    outcome.transport_error = err;
    outcome.detail = std::move(detail);
    Finish(std::move(outcome));
  }

  void Finish(LocalOutcome outcome) {
    if (completed_) {
      return;
    }
    completed_ = true;
    deadline_.cancel();
    resolver_.cancel();
    beast::get_lowest_layer(stream_).close();
    if (started_at_.time_since_epoch().count() != 0) {
      outcome.latency_ms =
          std::chrono::duration_cast<std::chrono::milliseconds>(
              std::chrono::steady_clock::now() - started_at_)
              .count();
    }
    auto done = std::move(done_);
    done_ = nullptr;
    if (done) {
      done(std::move(outcome));
    }
  }

  net::strand<net::io_context::executor_type> executor_;
  std::string host_;
  std::string port_;
  LocalRequest request_;
  std::chrono::milliseconds timeout_;
  std::size_t body_cap_;
  bool verify_tls_;
  Completion done_;
  tcp::resolver resolver_;
  Stream stream_;
  net::steady_timer deadline_;
  beast::flat_buffer buffer_;
  std::optional<http::response_parser<http::buffer_body>> parser_;
  std::array<char, kReadChunk> chunk_{};
  LocalOutcome outcome_;
  std::chrono::steady_clock::time_point started_at_{};
  bool completed_{false};
};

} // namespace

ForwarderPool::ForwarderPool(net::io_context &ioc, ForwardTarget target,
                             Session session, ForwarderPoolOptions options,
                             IResponseRelay &relay, EventBus &bus,
                             FilterEvaluator filter)
    : ioc_(ioc), strand_(net::make_strand(ioc)), target_(std::move(target)),
      session_(std::move(session)), options_(options), relay_(relay),
      bus_(bus), filter_(std::move(filter)),
      ssl_ctx_(ssl::context::tls_client), drain_timer_(strand_) {
  if (options_.max_connections == 0) {
    options_.max_connections = 1;
  }
  if (options_.high_water_mark == 0) {
    options_.high_water_mark = 1;
  }
  if (options_.low_water_mark == 0 ||
      options_.low_water_mark >= options_.high_water_mark) {
    options_.low_water_mark = options_.high_water_mark / 2;
  }
  if (options_.verify_tls) {
    try {
      ssl_ctx_.set_default_verify_paths();
    } catch (const std::exception &ex) {
      BOOST_LOG_SEV(lg, trivial::warning)
          << "local TLS verify paths unavailable: " << ex.what();
    }
  }
}

void ForwarderPool::OnInboundEvent(std::uint64_t generation,
                                   InboundEvent event) {
  net::post(strand_, [self = shared_from_this(), generation,
                      event = std::move(event)]() mutable {
    self->Accept(generation, std::move(event));
  });
}

void ForwarderPool::Accept(std::uint64_t generation, InboundEvent event) {
  if (shutting_down_) {
    // Left unanswered; the service redelivers it.
    return;
  }
  const DeliveryTag tag{generation, ++next_sequence_, event.id};
  const auto *connection = session_.find_connection(event.connection_id);
  bus_.Publish(listen_events::EventReceived{
      event.id,
      connection && !connection->connection_name.empty()
          ? connection->connection_name
          : event.connection_id,
      event.method, event.path});

  if (options_.evaluate_filters && filter_ && session_.filters &&
      !session_.filters->empty() && !filter_(event, *session_.filters)) {
    BOOST_LOG_SEV(lg, trivial::debug) << "event " << event.id << " filtered";
    LocalOutcome outcome;
    outcome.filtered = true;
    bus_.Publish(listen_events::EventFiltered{event.id});
    RelayImmediately(tag, std::move(outcome));
    return;
  }

  if (event.body.size() > options_.max_request_body_bytes) {
    LocalOutcome outcome;
    outcome.transport_error = TransportError::kBodyTooLarge;
    outcome.detail = fmt::format("request body of {} bytes exceeds {} bytes",
                                 event.body.size(),
                                 options_.max_request_body_bytes);
    bus_.Publish(listen_events::EventFailed{event.id, outcome.transport_error,
                                            outcome.detail});
    RelayImmediately(tag, std::move(outcome));
    return;
  }

  pending_.push_back(Pending{generation, tag.sequence, std::move(event)});
  UpdateFlow();
  Pump();
}

void ForwarderPool::RelayImmediately(const DeliveryTag &tag,
                                     LocalOutcome outcome) {
  relay_.Relay(tag, std::move(outcome), [](bool) {});
}

void ForwarderPool::Pump() {
  while (!shutting_down_ && in_flight_ < options_.max_connections &&
         !pending_.empty()) {
    Pending item = std::move(pending_.front());
    pending_.pop_front();
    Dispatch(std::move(item));
  }
  UpdateFlow();
  SyncCounters();
}

void ForwarderPool::Dispatch(Pending item) {
  const auto *connection = session_.find_connection(item.event.connection_id);
  const std::string cli_path = effective_cli_path(target_, connection);
  DeliveryTag tag{item.generation, item.sequence, item.event.id};
  LocalRequest request;
  try {
    request = build_local_request(target_, cli_path, item.event);
  } catch (const std::exception &ex) {
    // Beast rejects oversized header names and values.
    LocalOutcome outcome;
    outcome.transport_error = TransportError::kWrite;
    outcome.detail = fmt::format("cannot build local request: {}", ex.what());
    BOOST_LOG_SEV(lg, trivial::warning)
        << "event " << item.event.id << ": " << outcome.detail;
    bus_.Publish(listen_events::EventFailed{item.event.id,
                                            outcome.transport_error,
                                            outcome.detail});
    RelayImmediately(tag, std::move(outcome));
    return;
  }

  BOOST_LOG_SEV(lg, trivial::debug)
      << "forwarding " << item.event.id << " to "
      << compose_local_url(target_, cli_path, item.event);

  auto done = [self = shared_from_this(), tag](LocalOutcome outcome) mutable {
    net::post(self->strand_, [self, tag = std::move(tag),
                              outcome = std::move(outcome)]() mutable {
      self->OnCallComplete(std::move(tag), std::move(outcome));
    });
  };

  std::shared_ptr<ICall> call;
  if (target_.secure()) {
    call = std::make_shared<LocalCall<TlsStream>>(
        ioc_, ssl_ctx_, target_, std::move(request), options_.request_timeout,
        options_.max_response_body_bytes, options_.verify_tls, std::move(done));
  } else {
    call = std::make_shared<LocalCall<beast::tcp_stream>>(
        ioc_, ssl_ctx_, target_, std::move(request), options_.request_timeout,
        options_.max_response_body_bytes, options_.verify_tls, std::move(done));
  }
  calls_.emplace(tag.sequence, call);
  ++in_flight_;
  ++dispatched_;
  if (in_flight_ > peak_in_flight_.load()) {
    peak_in_flight_ = in_flight_;
  }
  call->Start();
}

void ForwarderPool::OnCallComplete(DeliveryTag tag, LocalOutcome outcome) {
  auto it = calls_.find(tag.sequence);
  if (it == calls_.end()) {
    // Aborted by shutdown; its slot was already released.
    return;
  }
  calls_.erase(it);
  if (outcome.canceled) {
    ReleaseSlot();
    return;
  }
  if (outcome.transport_error == TransportError::kNone) {
    bus_.Publish(listen_events::EventForwarded{tag.event_id, outcome.status,
                                               outcome.latency_ms,
                                               outcome.body_truncated});
  } else {
    BOOST_LOG_SEV(lg, trivial::info)
        << "event " << tag.event_id << " failed ("
        << to_string(outcome.transport_error) << "): " << outcome.detail;
    bus_.Publish(listen_events::EventFailed{
        tag.event_id, outcome.transport_error, outcome.detail});
  }
  // The slot stays taken until the outbound queue accepted the response.
  relay_.Relay(tag, std::move(outcome),
               [self = shared_from_this()](bool) {
                 net::post(self->strand_, [self] { self->ReleaseSlot(); });
               });
}

void ForwarderPool::ReleaseSlot() {
  if (in_flight_ > 0) {
    --in_flight_;
  }
  Pump();
  MaybeFinishDrain();
}

void ForwarderPool::UpdateFlow() {
  if (!paused_ && pending_.size() >= options_.high_water_mark) {
    paused_ = true;
    BOOST_LOG_SEV(lg, trivial::info)
        << "forwarder queue at " << pending_.size()
        << " events, pausing the control channel";
    if (flow_) {
      flow_(true);
    }
  } else if (paused_ && pending_.size() <= options_.low_water_mark) {
    paused_ = false;
    BOOST_LOG_SEV(lg, trivial::info) << "forwarder queue drained, resuming";
    if (flow_) {
      flow_(false);
    }
  }
}

void ForwarderPool::OnLinkLost(std::uint64_t generation) {
  net::post(strand_, [self = shared_from_this(), generation] {
    const auto before = self->pending_.size();
    self->pending_.erase(
        std::remove_if(self->pending_.begin(), self->pending_.end(),
                       [generation](const Pending &p) {
                         return p.generation <= generation;
                       }),
        self->pending_.end());
    if (before != self->pending_.size()) {
      BOOST_LOG_SEV(self->lg, trivial::info)
          << "dropped " << before - self->pending_.size()
          << " queued events of a lost connection";
    }
    self->UpdateFlow();
    self->SyncCounters();
  });
}

void ForwarderPool::Shutdown(std::chrono::milliseconds grace,
                             std::function<void()> on_drained) {
  net::post(strand_, [self = shared_from_this(), grace,
                      on_drained = std::move(on_drained)]() mutable {
    if (self->shutting_down_) {
      if (on_drained) {
        on_drained();
      }
      return;
    }
    self->shutting_down_ = true;
    self->on_drained_ = std::move(on_drained);
    self->pending_.clear();
    self->SyncCounters();
    BOOST_LOG_SEV(self->lg, trivial::info)
        << "forwarder draining " << self->in_flight_ << " in-flight requests";
    if (self->in_flight_ == 0) {
      self->FinishDrain();
      return;
    }
    self->drain_timer_.expires_after(grace);
    self->drain_timer_.async_wait([self](const beast::error_code &ec) {
      if (ec == net::error::operation_aborted) {
        return;
      }
      BOOST_LOG_SEV(self->lg, trivial::warning)
          << "drain grace elapsed, aborting " << self->calls_.size()
          << " local requests";
      auto calls = std::move(self->calls_);
      self->calls_.clear();
      for (auto &[seq, call] : calls) {
        call->Cancel();
      }
      self->in_flight_ = 0;
      self->FinishDrain();
    });
  });
}

void ForwarderPool::MaybeFinishDrain() {
  if (shutting_down_ && in_flight_ == 0) {
    FinishDrain();
  }
}

void ForwarderPool::FinishDrain() {
  drain_timer_.cancel();
  SyncCounters();
  if (auto cb = std::move(on_drained_)) {
    on_drained_ = nullptr;
    cb();
  }
}

void ForwarderPool::SyncCounters() {
  in_flight_count_ = in_flight_;
  pending_count_ = pending_.size();
}

} // namespace hookrelay
