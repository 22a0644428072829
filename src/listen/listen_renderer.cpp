#include "listen/listen_renderer.hpp"

#include <chrono>
#include <ctime>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <variant>

#include "util/string_util.hpp"

namespace hookrelay {

namespace {

std::string Timestamp() {
  return fmt::format("{:%H:%M:%S}", fmt::localtime(std::time(nullptr)));
}

constexpr std::size_t kMaxTrackedLines = 4096;

} // namespace

std::optional<OutputMode> parse_output_mode(std::string_view text) {
  const auto lowered = stringutil::to_lower(std::string(text));
  if (lowered == "interactive") {
    return OutputMode::kInteractive;
  }
  if (lowered == "compact") {
    return OutputMode::kCompact;
  }
  if (lowered == "quiet") {
    return OutputMode::kQuiet;
  }
  return std::nullopt;
}

std::string_view to_string(OutputMode mode) {
  switch (mode) {
  case OutputMode::kInteractive:
    return "interactive";
  case OutputMode::kCompact:
    return "compact";
  case OutputMode::kQuiet:
    return "quiet";
  }
  return "interactive";
}

ListenRenderer::ListenRenderer(EventBus &bus, OutputMode mode,
                               customio::ConsoleOutput &output,
                               std::string dashboard_base_url)
    : mode_(mode), output_(output),
      dashboard_base_url_(std::move(dashboard_base_url)),
      subscription_(bus.Subscribe()) {
  while (!dashboard_base_url_.empty() && dashboard_base_url_.back() == '/') {
    dashboard_base_url_.pop_back();
  }
  if (mode_ == OutputMode::kInteractive && output_.interactive()) {
    spinner_ = std::make_shared<customio::Spinner>(
        spinner_ioc_.get_executor(), output_.events());
  }
}

ListenRenderer::~ListenRenderer() { Stop(); }

void ListenRenderer::Start() {
  if (thread_.joinable()) {
    return;
  }
  thread_ = std::thread([this] { Run(); });
}

void ListenRenderer::Stop() {
  stop_ = true;
  subscription_->Close();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void ListenRenderer::Run() {
  while (!stop_) {
    auto ev = subscription_->WaitPop(std::chrono::milliseconds(50));
    spinner_ioc_.restart();
    spinner_ioc_.poll();
    if (ev) {
      Render(*ev);
    }
  }
  while (auto ev = subscription_->TryPop()) {
    Render(*ev);
  }
  StopSpinner();
  output_.events().flush();
}

void ListenRenderer::Render(const ListenEvent &event) {
  std::visit([this](const auto &ev) { On(ev); }, event);
  ++rendered_;
}

void ListenRenderer::StopSpinner() {
  if (spinner_) {
    spinner_->stop();
  }
}

std::string ListenRenderer::EventLink(const std::string &event_id) const {
  if (dashboard_base_url_.empty()) {
    return {};
  }
  return fmt::format("{}/cli/events/{}", dashboard_base_url_, event_id);
}

ListenRenderer::PendingLine
ListenRenderer::TakeLine(const std::string &event_id) {
  PendingLine line;
  auto it = lines_.find(event_id);
  if (it != lines_.end()) {
    line = std::move(it->second);
    lines_.erase(it);
  }
  return line;
}

void ListenRenderer::On(const listen_events::SessionReady &ev) {
  if (mode_ == OutputMode::kQuiet) {
    return;
  }
  auto &p = output_.printer();
  if (mode_ == OutputMode::kInteractive) {
    p.bold() << "Listening on " << ev.source_name << " -> " << ev.target_url
             << std::endl;
    for (const auto &name : ev.connection_names) {
      p.dim() << "  connection " << name << std::endl;
    }
    if (!ev.dashboard_url.empty()) {
      p.cyan() << "Dashboard: " << ev.dashboard_url << std::endl;
    }
    if (spinner_) {
      spinner_->start("Connecting...");
    }
  } else {
    p.plain() << Timestamp() << " session " << ev.session_id << " source "
              << ev.source_name << " -> " << ev.target_url << std::endl;
  }
}

void ListenRenderer::On(const listen_events::Connected &ev) {
  if (mode_ == OutputMode::kQuiet) {
    return;
  }
  StopSpinner();
  auto &p = output_.printer();
  if (mode_ == OutputMode::kInteractive) {
    p.green() << (ev.attempt > 1 ? "Reconnected" : "Connected")
              << ", ready for events" << std::endl;
  } else {
    p.plain() << Timestamp() << " connected (#" << ev.attempt << ")"
              << std::endl;
  }
}

void ListenRenderer::On(const listen_events::Disconnected &ev) {
  if (mode_ == OutputMode::kQuiet) {
    return;
  }
  StopSpinner();
  auto &p = output_.printer();
  if (mode_ == OutputMode::kInteractive) {
    p.yellow() << "Connection lost: " << ev.reason << std::endl;
  } else {
    p.plain() << Timestamp() << " disconnected: " << ev.reason << std::endl;
  }
}

void ListenRenderer::On(const listen_events::BackoffWaiting &ev) {
  if (mode_ == OutputMode::kQuiet) {
    return;
  }
  const auto text = fmt::format("Reconnecting in {:.1f}s (attempt {})",
                                ev.duration.count() / 1000.0, ev.attempt);
  if (spinner_) {
    spinner_->start(text);
    return;
  }
  output_.printer().plain() << Timestamp() << " " << text << std::endl;
}

void ListenRenderer::On(const listen_events::EventReceived &ev) {
  if (lines_.size() >= kMaxTrackedLines) {
    lines_.clear();
  }
  lines_[ev.event_id] = PendingLine{ev.method, ev.path, ev.connection_name};
}

void ListenRenderer::On(const listen_events::EventForwarded &ev) {
  const auto line = TakeLine(ev.event_id);
  if (mode_ == OutputMode::kQuiet) {
    return;
  }
  auto &p = output_.printer();
  if (mode_ == OutputMode::kInteractive) {
    StopSpinner();
    p.dim() << Timestamp() << " ";
    p.for_status(ev.status) << "[" << ev.status << "]";
    p.plain() << " " << line.method << " " << line.path << " ("
              << ev.latency_ms << " ms)" << (ev.truncated ? " truncated" : "");
    const auto link = EventLink(ev.event_id);
    if (!link.empty()) {
      p.dim() << " " << link;
    }
    p.plain() << std::endl;
  } else {
    p.plain() << Timestamp() << " " << ev.status << " " << line.method << " "
              << line.path << " " << ev.event_id << " " << ev.latency_ms
              << "ms" << std::endl;
  }
}

void ListenRenderer::On(const listen_events::EventFailed &ev) {
  const auto line = TakeLine(ev.event_id);
  if (mode_ == OutputMode::kQuiet) {
    return;
  }
  auto &p = output_.printer();
  if (mode_ == OutputMode::kInteractive) {
    StopSpinner();
    p.dim() << Timestamp() << " ";
    p.red() << "[ERR " << to_string(ev.transport_error) << "]";
    p.plain() << " " << line.method << " " << line.path << ": " << ev.detail
              << std::endl;
  } else {
    p.plain() << Timestamp() << " error " << to_string(ev.transport_error)
              << " " << ev.event_id << " " << ev.detail << std::endl;
  }
}

void ListenRenderer::On(const listen_events::EventFiltered &ev) {
  const auto line = TakeLine(ev.event_id);
  if (mode_ == OutputMode::kQuiet) {
    return;
  }
  if (mode_ == OutputMode::kInteractive) {
    output_.printer().dim() << Timestamp() << " [filtered] " << line.method
                            << " " << line.path << std::endl;
  } else {
    output_.printer().plain()
        << Timestamp() << " filtered " << ev.event_id << std::endl;
  }
}

void ListenRenderer::On(const listen_events::Shutdown &ev) {
  StopSpinner();
  output_.printer().plain() << "Stopped: " << ev.reason << std::endl;
}

} // namespace hookrelay
