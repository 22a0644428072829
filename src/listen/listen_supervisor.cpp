#include "listen/listen_supervisor.hpp"

#include <boost/asio/signal_set.hpp>

#include <algorithm>
#include <csignal>
#include <fmt/format.h>
#include <thread>

#include "listen/forward_target.hpp"
#include "listen/health_check.hpp"
#include "listen/request_builder.hpp"
#include "listen/session_bootstrap.hpp"
#include "my_error_codes.hpp"

namespace hookrelay {
namespace net = boost::asio;

namespace {

constexpr std::size_t kIoThreads = 4;

std::chrono::milliseconds Ms(int value) {
  return std::chrono::milliseconds(value < 0 ? 0 : value);
}

} // namespace

ListenSupervisor::ListenSupervisor(const HookrelayConfig &config,
                                   ListenOptions options, IApiClient &api,
                                   customio::ConsoleOutput &output)
    : config_(config), options_(std::move(options)), api_(api),
      output_(output),
      bus_(static_cast<std::size_t>(
          std::max(1, config.listen.event_bus_capacity))),
      lg_(make_logger_with_session("-")) {}

ListenSupervisor::~ListenSupervisor() {
  RequestShutdown("supervisor destroyed");
  if (io_pool_) {
    io_pool_->stop();
  }
  if (renderer_) {
    renderer_->Stop();
  }
}

void ListenSupervisor::RequestShutdown(std::string reason) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_reason_.empty()) {
      shutdown_reason_ = std::move(reason);
    }
  }
  blocker_.stop();
}

std::string ListenSupervisor::ShutdownReason() {
  std::lock_guard<std::mutex> lock(mutex_);
  return shutdown_reason_;
}

VoidResult ListenSupervisor::Run() {
  auto started = Startup();
  if (started.is_err()) {
    Teardown();
    return started;
  }

  std::unique_ptr<net::signal_set> signals;
  if (options_.handle_signals) {
    signals = std::make_unique<net::signal_set>(io_pool_->ioc(), SIGINT, SIGTERM);
    signals->async_wait([this](const boost::system::error_code &ec, int signo) {
      if (ec) {
        return;
      }
      RequestShutdown(signo == SIGINT ? "interrupted" : "terminated");
    });
  }

  channel_->Start();
  if (on_ready_) {
    on_ready_(*session_);
  }

  blocker_.wait();
  BOOST_LOG_SEV(*lg_, trivial::info)
      << "listen shutting down: " << ShutdownReason();
  if (signals) {
    boost::system::error_code ignore;
    signals->cancel(ignore);
  }
  Teardown();

  std::lock_guard<std::mutex> lock(mutex_);
  if (fatal_) {
    return VoidResult::Err(*fatal_);
  }
  return VoidResult::Ok();
}

VoidResult ListenSupervisor::Startup() {
  auto target_r = parse_forward_target(options_.target_arg,
                                       options_.cli_path.value_or(""));
  if (target_r.is_err()) {
    return VoidResult::Err(std::move(target_r.error()));
  }
  ForwardTarget target = std::move(target_r.value());
  target.rewrite_host = config_.listen.rewrite_host;

  BootstrapRequest boot;
  boot.source_name = options_.source_name.empty() ? config_.default_source
                                                  : options_.source_name;
  boot.connection = options_.connection;
  boot.cli_path = options_.cli_path;
  boot.device_name = config_.device_name;
  if (!options_.filters.empty()) {
    boot.filters = options_.filters;
  }
  boot.ws_base_url = config_.ws_base_url;

  SessionBootstrap bootstrap(api_, output_.logger());
  auto session_r = bootstrap.Run(boot);
  if (session_r.is_err()) {
    return VoidResult::Err(std::move(session_r.error()));
  }
  session_ = std::move(session_r.value());
  lg_ = make_logger_with_session(session_->session_id);
  BOOST_LOG_SEV(*lg_, trivial::info)
      << "session " << session_->session_id << " bound to "
      << session_->connection_ids.size() << " connection(s)";

  if (config_.listen.health_check) {
    auto probe = probe_forward_target(target);
    if (probe.is_err()) {
      output_.logger().warning()
          << "Local target " << target.base_url()
          << " is not reachable yet; events will fail until it starts ("
          << probe.error().what << ")" << std::endl;
    }
  }

  auto endpoint_r = parse_control_url(session_->control_url, options_.no_wss);
  if (endpoint_r.is_err()) {
    auto err = std::move(endpoint_r.error());
    err.code = my_errors::GENERAL::UNEXPECTED_RESULT;
    return VoidResult::Err(std::move(err));
  }

  io_pool_ = std::make_unique<IoContextPool>(kIoThreads, "listen");
  renderer_ = std::make_unique<ListenRenderer>(
      bus_, options_.output, output_, config_.dashboard_base_url);
  renderer_->Start();

  const auto &ls = config_.listen;
  ControlTransportOptions transport;
  transport.verify_tls = true;
  transport.unix_socket = config_.unix_socket;
  transport.user_agent = fmt::format("hookrelay/{}", HOOKRELAY_VERSION);
  transport.connect_timeout = Ms(ls.handshake_timeout_ms);
  transport.env = process_env;

  ControlChannelOptions channel_opts;
  channel_opts.session_id = session_->session_id;
  channel_opts.device_name = session_->device_name;
  channel_opts.handshake_timeout = Ms(ls.handshake_timeout_ms);
  channel_opts.default_heartbeat = Ms(ls.default_heartbeat_ms);
  channel_opts.outbound_queue_capacity =
      static_cast<std::size_t>(std::max(1, ls.outbound_queue_capacity));
  channel_opts.malformed_frame_threshold = ls.malformed_frame_threshold;
  channel_opts.backoff.initial_delay = Ms(ls.reconnect_initial_delay_ms);
  channel_opts.backoff.max_delay = Ms(ls.reconnect_max_delay_ms);
  channel_opts.backoff.jitter = Ms(ls.reconnect_jitter_ms);
  channel_opts.max_reconnect_attempts = ls.max_reconnect_attempts;

  channel_ = std::make_shared<ControlChannel>(
      io_pool_->ioc(),
      make_websocket_transport_factory(std::move(endpoint_r.value()), transport),
      channel_opts, bus_, token_);
  relay_ = std::make_unique<ResponseRelay>(channel_);

  ForwarderPoolOptions pool_opts;
  pool_opts.max_connections = static_cast<std::size_t>(
      std::max(1, options_.max_connections.value_or(ls.max_connections)));
  pool_opts.high_water_mark =
      static_cast<std::size_t>(std::max(1, ls.queue_high_water_mark));
  pool_opts.request_timeout =
      options_.request_timeout.value_or(Ms(ls.request_timeout_ms));
  pool_opts.max_response_body_bytes =
      static_cast<std::size_t>(std::max<std::int64_t>(0, ls.max_response_body_bytes));
  pool_opts.max_request_body_bytes =
      static_cast<std::size_t>(std::max<std::int64_t>(0, ls.max_request_body_bytes));
  pool_opts.verify_tls = !(options_.insecure || config_.insecure);
  pool_opts.evaluate_filters = ls.evaluate_filters_locally;
  pool_ = std::make_shared<ForwarderPool>(io_pool_->ioc(), target, *session_,
                                          pool_opts, *relay_, bus_);

  channel_->SetSink(pool_.get());
  pool_->SetFlowControl(
      [weak = std::weak_ptr<ControlChannel>(channel_)](bool paused) {
        if (auto channel = weak.lock()) {
          channel->SetReadPaused(paused);
        }
      });
  channel_->SetFatalHandler([this](const Error &err) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      fatal_ = err;
    }
    RequestShutdown(err.what);
  });

  listen_events::SessionReady ready;
  ready.session_id = session_->session_id;
  ready.source_name = session_->source_name;
  for (const auto &conn : session_->connections) {
    ready.connection_names.push_back(conn.connection_name);
  }
  const auto *first =
      session_->connections.empty() ? nullptr : &session_->connections.front();
  ready.target_url = target.base_url();
  const auto cli_path = effective_cli_path(target, first);
  if (!cli_path.empty() && cli_path != "/") {
    if (!ready.target_url.empty() && ready.target_url.back() == '/' &&
        cli_path.front() == '/') {
      ready.target_url.pop_back();
    }
    ready.target_url += cli_path;
  }
  std::string dashboard = config_.dashboard_base_url;
  while (!dashboard.empty() && dashboard.back() == '/') {
    dashboard.pop_back();
  }
  if (!dashboard.empty()) {
    ready.dashboard_url =
        fmt::format("{}/cli/sessions/{}", dashboard, session_->session_id);
  }
  BOOST_LOG_SEV(*lg_, trivial::debug)
      << "publishing session ready to " << bus_.subscriber_count()
      << " subscriber(s)";
  bus_.Publish(ready);
  return VoidResult::Ok();
}

void ListenSupervisor::Teardown() {
  token_.Cancel();
  const auto grace = Ms(config_.listen.drain_grace_ms);

  if (pool_) {
    auto drained = std::make_shared<misc::Blocker>();
    pool_->Shutdown(grace, [drained] { drained->stop(); });
    if (!drained->wait_for(grace + std::chrono::seconds(1))) {
      BOOST_LOG_SEV(*lg_, trivial::warning) << "forwarder did not drain in time";
    }
  }
  if (channel_) {
    auto closed = std::make_shared<misc::Blocker>();
    channel_->Close([closed] { closed->stop(); });
    if (!closed->wait_for(std::chrono::seconds(5))) {
      BOOST_LOG_SEV(*lg_, trivial::warning)
          << "control channel did not close in time";
    }
  }

  const auto reason = ShutdownReason();
  bus_.Publish(listen_events::Shutdown{reason.empty() ? "stopped" : reason});
  if (renderer_) {
    renderer_->Stop();
  }
  bus_.Close();
  if (io_pool_) {
    io_pool_->stop();
  }
}

} // namespace hookrelay
