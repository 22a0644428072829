#include "listen/control_channel.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core/bind_handler.hpp>

#include <fmt/format.h>
#include <utility>

#include "listen/listen_messages.hpp"
#include "my_error_codes.hpp"

namespace hookrelay {
namespace net = boost::asio;
namespace beast = boost::beast;
namespace json = boost::json;

std::string_view to_string(ChannelState state) {
  switch (state) {
  case ChannelState::kIdle:
    return "idle";
  case ChannelState::kHandshaking:
    return "handshaking";
  case ChannelState::kRunning:
    return "running";
  case ChannelState::kBackoff:
    return "backoff";
  case ChannelState::kClosed:
    return "closed";
  }
  return "unknown";
}

ControlChannel::ControlChannel(net::io_context &ioc,
                               ControlTransportFactory factory,
                               ControlChannelOptions options, EventBus &bus,
                               CancellationToken token)
    : strand_(net::make_strand(ioc)), factory_(std::move(factory)),
      options_(std::move(options)), bus_(bus), token_(std::move(token)),
      heartbeat_(options_.default_heartbeat), handshake_timer_(strand_),
      idle_timer_(strand_), ping_timer_(strand_), reconnect_timer_(strand_),
      close_timer_(strand_), backoff_(options_.backoff),
      rng_(std::random_device{}()) {
  if (options_.outbound_queue_capacity == 0) {
    options_.outbound_queue_capacity = 1;
  }
  if (options_.malformed_frame_threshold <= 0) {
    options_.malformed_frame_threshold = 1;
  }
}

void ControlChannel::Start() {
  std::weak_ptr<ControlChannel> weak = weak_from_this();
  token_.OnCancel([weak] {
    if (auto self = weak.lock()) {
      net::post(self->strand_, [self] { self->OnCancelled(); });
    }
  });
  net::post(strand_, [self = shared_from_this()] {
    if (self->state_ == ChannelState::kIdle) {
      self->Connect();
    }
  });
}

void ControlChannel::Connect() {
  if (closing_ || token_.IsCancelled()) {
    state_ = ChannelState::kClosed;
    CompleteClose();
    return;
  }
  const auto gen = ++generation_;
  state_ = ChannelState::kHandshaking;
  connected_ = false;
  reading_ = false;
  writing_ = false;
  malformed_in_a_row_ = 0;
  transport_ = factory_(strand_);
  BOOST_LOG_SEV(lg, trivial::info)
      << "control channel connecting, generation " << gen;

  handshake_timer_.expires_after(options_.handshake_timeout);
  handshake_timer_.async_wait(beast::bind_front_handler(
      &ControlChannel::OnHandshakeTimeout, shared_from_this(), gen));
  transport_->AsyncConnect(beast::bind_front_handler(
      &ControlChannel::OnConnected, shared_from_this(), gen));
}

void ControlChannel::OnConnected(std::uint64_t gen, const beast::error_code &ec,
                                 std::string detail) {
  if (Stale(gen) || state_ != ChannelState::kHandshaking) {
    return;
  }
  if (ec) {
    LinkFailed(fmt::format("{} failed: {}", detail, ec.message()));
    return;
  }
  connected_ = true;
  HelloFrame hello;
  hello.session_id = options_.session_id;
  hello.device_name = options_.device_name;
  Enqueue(Outgoing{json::serialize(json::value_from(hello)), false});
  last_frame_at_ = std::chrono::steady_clock::now();
  StartRead();
}

void ControlChannel::OnHandshakeTimeout(std::uint64_t gen,
                                        const beast::error_code &ec) {
  if (ec == net::error::operation_aborted || Stale(gen) ||
      state_ != ChannelState::kHandshaking) {
    return;
  }
  LinkFailed(fmt::format("no welcome within {} ms",
                         options_.handshake_timeout.count()));
}

void ControlChannel::StartRead() {
  if (reading_ || read_paused_ || !connected_ || !transport_) {
    return;
  }
  reading_ = true;
  transport_->AsyncRead(beast::bind_front_handler(
      &ControlChannel::OnRead, shared_from_this(), generation_.load()));
}

void ControlChannel::OnRead(std::uint64_t gen, const beast::error_code &ec,
                            std::string payload) {
  if (Stale(gen)) {
    return;
  }
  reading_ = false;
  if (ec) {
    if (closing_) {
      FinishClose();
      return;
    }
    LinkFailed(fmt::format("read failed: {}", ec.message()));
    return;
  }
  ++frames_received_;
  last_frame_at_ = std::chrono::steady_clock::now();
  HandleFrame(gen, payload);
  // The frame may have torn the link down.
  if (!Stale(gen)) {
    StartRead();
  }
}

void ControlChannel::HandleFrame(std::uint64_t gen, const std::string &payload) {
  boost::system::error_code parse_ec;
  auto jv = json::parse(payload, parse_ec);
  if (parse_ec) {
    CountMalformed(gen, fmt::format("invalid JSON: {}", parse_ec.message()));
    return;
  }
  const std::string type = frame_type(jv);
  try {
    if (type == "welcome") {
      HandleWelcome(gen, jv);
    } else if (type == "event") {
      if (state_ != ChannelState::kRunning) {
        BOOST_LOG_SEV(lg, trivial::warning)
            << "control channel got an event before welcome, skipped";
        return;
      }
      auto event = json::value_to<InboundEvent>(jv);
      malformed_in_a_row_ = 0;
      BOOST_LOG_SEV(lg, trivial::debug)
          << "control channel event " << event.id << ' ' << event.method << ' '
          << event.path;
      if (sink_) {
        sink_->OnInboundEvent(gen, std::move(event));
      }
    } else if (type == "ping") {
      auto ping = json::value_to<PingFrame>(jv);
      malformed_in_a_row_ = 0;
      PongFrame pong{ping.nonce};
      Enqueue(Outgoing{json::serialize(json::value_from(pong)), false});
    } else if (type == "pong") {
      malformed_in_a_row_ = 0;
    } else {
      CountMalformed(gen, fmt::format("unknown frame type '{}'", type));
    }
  } catch (const std::exception &ex) {
    CountMalformed(gen, fmt::format("bad '{}' frame: {}", type, ex.what()));
  }
}

void ControlChannel::HandleWelcome(std::uint64_t gen,
                                   const json::value &jv) {
  auto welcome = json::value_to<WelcomeFrame>(jv);
  malformed_in_a_row_ = 0;
  heartbeat_ = welcome.heartbeat_ms > 0
                   ? std::chrono::milliseconds(welcome.heartbeat_ms)
                   : options_.default_heartbeat;
  if (state_ == ChannelState::kRunning) {
    return;
  }
  handshake_timer_.cancel();
  state_ = ChannelState::kRunning;
  backoff_.Reset();
  failures_in_a_row_ = 0;
  const auto attempt = ++connects_;
  BOOST_LOG_SEV(lg, trivial::info)
      << "control channel running, heartbeat " << heartbeat_.count()
      << " ms, server time " << welcome.server_time;
  bus_.Publish(listen_events::Connected{static_cast<std::uint32_t>(attempt)});
  ArmWatchdog(gen, IdleLimit());
  SchedulePing(gen);
  DoWrite();
}

void ControlChannel::CountMalformed(std::uint64_t gen, std::string_view why) {
  ++malformed_in_a_row_;
  BOOST_LOG_SEV(lg, trivial::warning)
      << "control channel skipped frame (" << malformed_in_a_row_ << '/'
      << options_.malformed_frame_threshold << "): " << why;
  if (malformed_in_a_row_ >= options_.malformed_frame_threshold && !Stale(gen)) {
    LinkFailed(fmt::format("{} malformed frames in a row", malformed_in_a_row_));
  }
}

void ControlChannel::ArmWatchdog(std::uint64_t gen,
                                 std::chrono::milliseconds after) {
  idle_timer_.expires_after(after);
  idle_timer_.async_wait(beast::bind_front_handler(
      &ControlChannel::OnWatchdog, shared_from_this(), gen));
}

void ControlChannel::OnWatchdog(std::uint64_t gen, const beast::error_code &ec) {
  if (ec == net::error::operation_aborted || Stale(gen) ||
      state_ != ChannelState::kRunning) {
    return;
  }
  const auto now = std::chrono::steady_clock::now();
  if (read_paused_) {
    last_frame_at_ = now;
    ArmWatchdog(gen, IdleLimit());
    return;
  }
  const auto idle = std::chrono::duration_cast<std::chrono::milliseconds>(
      now - last_frame_at_);
  if (idle >= IdleLimit()) {
    LinkFailed(fmt::format("no frame received for {} ms", idle.count()));
    return;
  }
  ArmWatchdog(gen, IdleLimit() - idle);
}

void ControlChannel::SchedulePing(std::uint64_t gen) {
  ping_timer_.expires_after(heartbeat_);
  ping_timer_.async_wait(beast::bind_front_handler(
      &ControlChannel::OnPingTimer, shared_from_this(), gen));
}

void ControlChannel::OnPingTimer(std::uint64_t gen, const beast::error_code &ec) {
  if (ec == net::error::operation_aborted || Stale(gen) ||
      state_ != ChannelState::kRunning) {
    return;
  }
  if (!read_paused_ && !closing_) {
    PingFrame ping{json::value(++ping_nonce_)};
    Enqueue(Outgoing{json::serialize(json::value_from(ping)), false});
  }
  SchedulePing(gen);
}

void ControlChannel::SendResponse(std::uint64_t generation,
                                  OutboundResponse response,
                                  QueuedHandler on_queued) {
  std::string text = json::serialize(json::value_from(response));
  net::dispatch(strand_, [self = shared_from_this(), generation,
                          text = std::move(text),
                          on_queued = std::move(on_queued)]() mutable {
    if (self->state_ != ChannelState::kRunning ||
        generation != self->generation_.load() || !self->transport_) {
      on_queued(false);
      return;
    }
    if (self->responses_queued_ < self->options_.outbound_queue_capacity &&
        self->waiters_.empty()) {
      ++self->responses_queued_;
      self->Enqueue(Outgoing{std::move(text), true});
      on_queued(true);
      return;
    }
    self->waiters_.push_back(
        Waiter{generation, std::move(text), std::move(on_queued)});
  });
}

void ControlChannel::AdmitWaiters() {
  while (!waiters_.empty() &&
         responses_queued_ < options_.outbound_queue_capacity) {
    Waiter w = std::move(waiters_.front());
    waiters_.pop_front();
    if (w.generation != generation_.load() ||
        state_ != ChannelState::kRunning) {
      w.on_queued(false);
      continue;
    }
    ++responses_queued_;
    Enqueue(Outgoing{std::move(w.text), true});
    w.on_queued(true);
  }
}

void ControlChannel::Enqueue(Outgoing out) {
  outbound_.push_back(std::move(out));
  DoWrite();
}

void ControlChannel::DoWrite() {
  if (writing_ || outbound_.empty() || !connected_ || !transport_) {
    return;
  }
  // Responses wait for the welcome; hello and pongs may go out earlier.
  if (outbound_.front().response && state_ != ChannelState::kRunning) {
    return;
  }
  writing_ = true;
  const bool response = outbound_.front().response;
  transport_->AsyncWrite(
      outbound_.front().text,
      beast::bind_front_handler(&ControlChannel::OnWrite, shared_from_this(),
                                generation_.load(), response));
}

void ControlChannel::OnWrite(std::uint64_t gen, bool response,
                             const beast::error_code &ec) {
  if (Stale(gen)) {
    return;
  }
  writing_ = false;
  if (ec) {
    if (closing_) {
      FinishClose();
      return;
    }
    LinkFailed(fmt::format("write failed: {}", ec.message()));
    return;
  }
  outbound_.pop_front();
  if (response) {
    --responses_queued_;
    ++responses_sent_;
    AdmitWaiters();
  }
  if (closing_ && outbound_.empty()) {
    FinishClose();
    return;
  }
  DoWrite();
}

void ControlChannel::DropOutbound() {
  outbound_.clear();
  responses_queued_ = 0;
  auto waiters = std::move(waiters_);
  waiters_.clear();
  for (auto &w : waiters) {
    w.on_queued(false);
  }
}

void ControlChannel::LinkFailed(std::string reason) {
  if (state_ == ChannelState::kClosed) {
    return;
  }
  const auto lost_gen = generation_.load();
  BOOST_LOG_SEV(lg, trivial::warning)
      << "control channel link lost (generation " << lost_gen
      << "): " << reason;
  if (transport_) {
    transport_->Cancel();
    transport_.reset();
  }
  connected_ = false;
  reading_ = false;
  writing_ = false;
  handshake_timer_.cancel();
  idle_timer_.cancel();
  ping_timer_.cancel();
  DropOutbound();
  if (sink_) {
    sink_->OnLinkLost(lost_gen);
  }
  bus_.Publish(listen_events::Disconnected{reason});
  if (closing_) {
    FinishClose();
    return;
  }
  ScheduleReconnect();
}

void ControlChannel::ScheduleReconnect() {
  if (token_.IsCancelled()) {
    state_ = ChannelState::kClosed;
    CompleteClose();
    return;
  }
  ++failures_in_a_row_;
  if (options_.max_reconnect_attempts > 0 &&
      failures_in_a_row_ > options_.max_reconnect_attempts) {
    state_ = ChannelState::kClosed;
    auto err = make_error(
        my_errors::LISTEN::CONTROL_CHANNEL_FATAL,
        fmt::format("control channel gave up after {} reconnect attempts",
                    options_.max_reconnect_attempts));
    BOOST_LOG_SEV(lg, trivial::error) << err.what;
    CompleteClose();
    if (on_fatal_) {
      on_fatal_(err);
    }
    return;
  }
  state_ = ChannelState::kBackoff;
  const auto delay = backoff_.NextDelay(rng_);
  BOOST_LOG_SEV(lg, trivial::info)
      << "control channel reconnecting in " << delay.count() << " ms (attempt "
      << failures_in_a_row_ << ")";
  bus_.Publish(listen_events::BackoffWaiting{
      delay, static_cast<std::uint32_t>(failures_in_a_row_)});
  reconnect_timer_.expires_after(delay);
  reconnect_timer_.async_wait(beast::bind_front_handler(
      &ControlChannel::OnReconnectTimer, shared_from_this()));
}

void ControlChannel::OnReconnectTimer(const beast::error_code &ec) {
  if (ec == net::error::operation_aborted ||
      state_ != ChannelState::kBackoff) {
    return;
  }
  Connect();
}

void ControlChannel::SetReadPaused(bool paused) {
  net::dispatch(strand_, [self = shared_from_this(), paused] {
    if (self->read_paused_ == paused) {
      return;
    }
    self->read_paused_ = paused;
    BOOST_LOG_SEV(self->lg, trivial::debug)
        << "control channel reads " << (paused ? "paused" : "resumed");
    if (!paused) {
      self->last_frame_at_ = std::chrono::steady_clock::now();
      self->StartRead();
    }
  });
}

void ControlChannel::OnCancelled() {
  // A live link stays up for the drain; Close() ends it.
  if (state_ == ChannelState::kBackoff ||
      state_ == ChannelState::kHandshaking || state_ == ChannelState::kIdle) {
    reconnect_timer_.cancel();
    handshake_timer_.cancel();
    if (transport_) {
      transport_->Cancel();
      transport_.reset();
    }
    connected_ = false;
    DropOutbound();
    state_ = ChannelState::kClosed;
    CompleteClose();
  }
}

void ControlChannel::Close(std::function<void()> on_closed) {
  net::post(strand_, [self = shared_from_this(),
                      on_closed = std::move(on_closed)]() mutable {
    if (self->state_ == ChannelState::kClosed && self->close_completed_) {
      if (on_closed) {
        on_closed();
      }
      return;
    }
    self->on_closed_ = std::move(on_closed);
    if (self->closing_) {
      return;
    }
    self->closing_ = true;
    self->reconnect_timer_.cancel();
    if (self->state_ != ChannelState::kRunning) {
      self->FinishClose();
      return;
    }
    // Parked responses would never fit before the deadline.
    auto waiters = std::move(self->waiters_);
    self->waiters_.clear();
    for (auto &w : waiters) {
      w.on_queued(false);
    }
    if (self->outbound_.empty() && !self->writing_) {
      self->FinishClose();
      return;
    }
    BOOST_LOG_SEV(self->lg, trivial::debug)
        << "control channel flushing " << self->outbound_.size()
        << " queued frames before close";
    self->close_timer_.expires_after(self->options_.close_flush_timeout);
    self->close_timer_.async_wait([self](const beast::error_code &ec) {
      if (ec == net::error::operation_aborted) {
        return;
      }
      self->FinishClose();
    });
  });
}

void ControlChannel::FinishClose() {
  if (close_completed_) {
    return;
  }
  state_ = ChannelState::kClosed;
  close_timer_.cancel();
  handshake_timer_.cancel();
  idle_timer_.cancel();
  ping_timer_.cancel();
  reconnect_timer_.cancel();
  if (!outbound_.empty()) {
    BOOST_LOG_SEV(lg, trivial::warning)
        << "control channel dropping " << outbound_.size()
        << " unflushed frames on close";
  }
  DropOutbound();
  auto transport = std::move(transport_);
  if (!transport || !connected_ || writing_) {
    connected_ = false;
    if (transport) {
      transport->Cancel();
    }
    CompleteClose();
    return;
  }
  connected_ = false;
  // Bound the close handshake; a silent peer must not hold shutdown.
  close_timer_.expires_after(options_.close_flush_timeout);
  close_timer_.async_wait([transport](const beast::error_code &ec) {
    if (ec != net::error::operation_aborted) {
      transport->Cancel();
    }
  });
  transport->AsyncClose([self = shared_from_this(),
                         transport](const beast::error_code &ec) {
    self->close_timer_.cancel();
    if (ec) {
      BOOST_LOG_SEV(self->lg, trivial::debug)
          << "control channel close: " << ec.message();
    }
    transport->Cancel();
    self->CompleteClose();
  });
}

void ControlChannel::CompleteClose() {
  if (close_completed_) {
    return;
  }
  close_completed_ = true;
  state_ = ChannelState::kClosed;
  BOOST_LOG_SEV(lg, trivial::info) << "control channel closed";
  if (auto cb = std::move(on_closed_)) {
    on_closed_ = nullptr;
    cb();
  }
}

} // namespace hookrelay
