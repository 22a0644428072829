#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "listen/listen_types.hpp"

namespace hookrelay {
namespace listen_events {

struct SessionReady {
  std::string session_id;
  std::string source_name;
  std::vector<std::string> connection_names;
  std::string target_url;
  std::string dashboard_url;
};

struct Connected {
  std::uint32_t attempt{0};
};

struct Disconnected {
  std::string reason;
};

struct BackoffWaiting {
  std::chrono::milliseconds duration{0};
  std::uint32_t attempt{0};
};

struct EventReceived {
  std::string event_id;
  std::string connection_name;
  std::string method;
  std::string path;
};

struct EventForwarded {
  std::string event_id;
  int status{0};
  std::int64_t latency_ms{0};
  bool truncated{false};
};

struct EventFailed {
  std::string event_id;
  TransportError transport_error{TransportError::kNone};
  std::string detail;
};

struct EventFiltered {
  std::string event_id;
};

struct Shutdown {
  std::string reason;
};

} // namespace listen_events

using ListenEvent =
    std::variant<listen_events::SessionReady, listen_events::Connected,
                 listen_events::Disconnected, listen_events::BackoffWaiting,
                 listen_events::EventReceived, listen_events::EventForwarded,
                 listen_events::EventFailed, listen_events::EventFiltered,
                 listen_events::Shutdown>;

/**
 * In-process fan-out of lifecycle notifications. Publishing never blocks:
 * each subscriber owns a bounded queue and loses the newest notification
 * when that queue is full.
 */
class EventBus {
public:
  class Subscription {
  public:
    explicit Subscription(std::size_t capacity) : capacity_(capacity) {}

    std::optional<ListenEvent> TryPop();
    // Empty when the timeout elapsed or the subscription is closed and
    // drained.
    std::optional<ListenEvent> WaitPop(std::chrono::milliseconds timeout);

    void Close();
    bool closed() const;
    std::uint64_t dropped() const;

  private:
    friend class EventBus;
    bool Push(const ListenEvent &ev);

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<ListenEvent> queue_;
    std::uint64_t dropped_{0};
    bool closed_{false};
  };

  explicit EventBus(std::size_t default_capacity = 1024)
      : default_capacity_(default_capacity) {}

  std::shared_ptr<Subscription> Subscribe(std::size_t capacity = 0);

  void Publish(const ListenEvent &ev);

  // Closes every subscription; later publishes are ignored.
  void Close();

  std::size_t subscriber_count() const;

private:
  const std::size_t default_capacity_;
  mutable std::mutex mutex_;
  std::vector<std::weak_ptr<Subscription>> subscribers_;
  bool closed_{false};
};

} // namespace hookrelay
