#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "api_client.hpp"
#include "conf/hookrelay_config.hpp"
#include "customio/console_output.hpp"
#include "io_context_pool.hpp"
#include "listen/control_channel.hpp"
#include "listen/event_bus.hpp"
#include "listen/forwarder_pool.hpp"
#include "listen/listen_renderer.hpp"
#include "listen/listen_types.hpp"
#include "listen/response_relay.hpp"
#include "result.hpp"
#include "util/blocker.hpp"
#include "util/cancellation.hpp"
#include "util/my_logging.hpp"

namespace hookrelay {

// Everything `listen` was asked to do for this run.
struct ListenOptions {
  std::string target_arg;
  std::string source_name;
  std::optional<std::string> connection;
  std::optional<std::string> cli_path;
  OutputMode output{OutputMode::kInteractive};
  std::optional<int> max_connections;
  SessionFilters filters;
  bool no_wss{false};
  std::optional<std::chrono::milliseconds> request_timeout;
  bool insecure{false};
  // Off in tests that drive shutdown themselves.
  bool handle_signals{true};
};

/**
 * Owns one `listen` run.
 *
 * Startup: parse the target, bootstrap the session, probe the target, then
 * build the bus, forwarder pool, relay and control channel and start the
 * channel. Shutdown (signal, RequestShutdown() or a fatal channel error):
 * cancel, let the pool drain for the grace period, close the channel so
 * queued responses get flushed, publish Shutdown.
 */
class ListenSupervisor {
public:
  ListenSupervisor(const HookrelayConfig &config, ListenOptions options,
                   IApiClient &api, customio::ConsoleOutput &output);
  ~ListenSupervisor();

  ListenSupervisor(const ListenSupervisor &) = delete;
  ListenSupervisor &operator=(const ListenSupervisor &) = delete;

  // Blocks until the run ends. Ok after a clean shutdown.
  VoidResult Run();

  // Thread safe; the first reason wins.
  void RequestShutdown(std::string reason);

  // Called once the channel was started.
  void SetReadyCallback(std::function<void(const Session &)> cb) {
    on_ready_ = std::move(cb);
  }

  EventBus &bus() { return bus_; }
  std::shared_ptr<ForwarderPool> pool() const { return pool_; }
  std::shared_ptr<ControlChannel> channel() const { return channel_; }
  const std::optional<Session> &session() const { return session_; }

private:
  VoidResult Startup();
  void Teardown();
  std::string ShutdownReason();

  HookrelayConfig config_;
  ListenOptions options_;
  IApiClient &api_;
  customio::ConsoleOutput &output_;

  std::unique_ptr<IoContextPool> io_pool_;
  EventBus bus_;
  CancellationToken token_;
  misc::Blocker blocker_;
  std::optional<Session> session_;
  std::unique_ptr<ListenRenderer> renderer_;
  std::shared_ptr<ControlChannel> channel_;
  std::unique_ptr<ResponseRelay> relay_;
  std::shared_ptr<ForwarderPool> pool_;
  std::function<void(const Session &)> on_ready_;

  std::mutex mutex_;
  std::string shutdown_reason_;
  std::optional<Error> fatal_;
  LoggerPtr lg_;
};

} // namespace hookrelay
