#pragma once

#include <boost/asio/io_context.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>

#include "customio/console_output.hpp"
#include "customio/spinner.hpp"
#include "listen/event_bus.hpp"

namespace hookrelay {

enum class OutputMode { kInteractive, kCompact, kQuiet };

std::optional<OutputMode> parse_output_mode(std::string_view text);
std::string_view to_string(OutputMode mode);

// Event-bus consumer printing the listen session for a human. Runs on its
// own thread and never pushes back on the pipeline.
class ListenRenderer {
public:
  ListenRenderer(EventBus &bus, OutputMode mode,
                 customio::ConsoleOutput &output,
                 std::string dashboard_base_url);
  ~ListenRenderer();

  ListenRenderer(const ListenRenderer &) = delete;
  ListenRenderer &operator=(const ListenRenderer &) = delete;

  void Start();
  // Prints what is still queued, then joins.
  void Stop();

  // Renders one notification synchronously.
  void Render(const ListenEvent &event);

  std::uint64_t rendered() const { return rendered_.load(); }

private:
  struct PendingLine {
    std::string method;
    std::string path;
    std::string connection;
  };

  void Run();
  void On(const listen_events::SessionReady &ev);
  void On(const listen_events::Connected &ev);
  void On(const listen_events::Disconnected &ev);
  void On(const listen_events::BackoffWaiting &ev);
  void On(const listen_events::EventReceived &ev);
  void On(const listen_events::EventForwarded &ev);
  void On(const listen_events::EventFailed &ev);
  void On(const listen_events::EventFiltered &ev);
  void On(const listen_events::Shutdown &ev);

  PendingLine TakeLine(const std::string &event_id);
  std::string EventLink(const std::string &event_id) const;
  void StopSpinner();

  OutputMode mode_;
  customio::ConsoleOutput &output_;
  std::string dashboard_base_url_;
  std::shared_ptr<EventBus::Subscription> subscription_;
  boost::asio::io_context spinner_ioc_;
  std::shared_ptr<customio::Spinner> spinner_;
  std::unordered_map<std::string, PendingLine> lines_;
  std::thread thread_;
  std::atomic<bool> stop_{false};
  std::atomic<std::uint64_t> rendered_{0};
};

} // namespace hookrelay
