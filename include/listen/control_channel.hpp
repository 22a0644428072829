#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/json.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <random>
#include <string>
#include <string_view>

#include "listen/control_transport.hpp"
#include "listen/event_bus.hpp"
#include "listen/listen_types.hpp"
#include "result.hpp"
#include "util/backoff.hpp"
#include "util/cancellation.hpp"
#include "util/my_logging.hpp"

namespace hookrelay {

enum class ChannelState { kIdle, kHandshaking, kRunning, kBackoff, kClosed };

std::string_view to_string(ChannelState state);

// Receives inbound events in wire order. Calls arrive on the channel's
// strand; implementations hand work off to their own executor.
class IInboundEventSink {
public:
  virtual ~IInboundEventSink() = default;
  // `generation` identifies the connection the event arrived on; responses
  // must carry it back.
  virtual void OnInboundEvent(std::uint64_t generation, InboundEvent event) = 0;
  virtual void OnLinkLost(std::uint64_t generation) = 0;
};

struct ControlChannelOptions {
  std::string session_id;
  std::string device_name;
  std::chrono::milliseconds handshake_timeout{10000};
  std::chrono::milliseconds default_heartbeat{30000};
  std::size_t outbound_queue_capacity{256};
  int malformed_frame_threshold{8};
  ExponentialBackoffOptions backoff{};
  // 0 retries forever.
  int max_reconnect_attempts{0};
  std::chrono::milliseconds close_flush_timeout{2000};
};

/**
 * The single persistent link to the service.
 *
 * Idle -> Handshaking -> Running, with any failure going through Backoff
 * and back to Handshaking. Close() or an exhausted retry budget ends in
 * Closed. All state lives on one strand; the public methods may be called
 * from any thread.
 */
class ControlChannel : public std::enable_shared_from_this<ControlChannel> {
public:
  // true once the response is in the outbound queue, false when it was
  // discarded (stale generation, link lost, channel closed).
  using QueuedHandler = std::function<void(bool)>;
  using FatalHandler = std::function<void(const Error &)>;

  ControlChannel(boost::asio::io_context &ioc, ControlTransportFactory factory,
                 ControlChannelOptions options, EventBus &bus,
                 CancellationToken token);

  ControlChannel(const ControlChannel &) = delete;
  ControlChannel &operator=(const ControlChannel &) = delete;

  // Both must be set before Start().
  void SetSink(IInboundEventSink *sink) { sink_ = sink; }
  void SetFatalHandler(FatalHandler handler) { on_fatal_ = std::move(handler); }

  void Start();

  // Queues a response frame for the connection `generation`. When the
  // bounded queue is full the call parks until room frees up.
  void SendResponse(std::uint64_t generation, OutboundResponse response,
                    QueuedHandler on_queued);

  // Backpressure: suspends reading, the idle watchdog and client pings.
  void SetReadPaused(bool paused);

  // Flushes queued responses for a bounded time, closes the link and stops
  // reconnecting. `on_closed` runs once the channel reached Closed.
  void Close(std::function<void()> on_closed);

  ChannelState state() const { return state_.load(); }
  std::uint64_t generation() const { return generation_.load(); }
  std::uint64_t frames_received() const { return frames_received_.load(); }
  std::uint64_t responses_sent() const { return responses_sent_.load(); }
  std::uint64_t connects() const { return connects_.load(); }

private:
  struct Outgoing {
    std::string text;
    bool response{false};
  };
  struct Waiter {
    std::uint64_t generation;
    std::string text;
    QueuedHandler on_queued;
  };

  void Connect();
  void OnConnected(std::uint64_t gen, const boost::beast::error_code &ec,
                   std::string detail);
  void OnHandshakeTimeout(std::uint64_t gen, const boost::beast::error_code &ec);

  void StartRead();
  void OnRead(std::uint64_t gen, const boost::beast::error_code &ec,
              std::string payload);
  void HandleFrame(std::uint64_t gen, const std::string &payload);
  void HandleWelcome(std::uint64_t gen, const boost::json::value &jv);
  void CountMalformed(std::uint64_t gen, std::string_view why);

  void ArmWatchdog(std::uint64_t gen, std::chrono::milliseconds after);
  void OnWatchdog(std::uint64_t gen, const boost::beast::error_code &ec);
  void SchedulePing(std::uint64_t gen);
  void OnPingTimer(std::uint64_t gen, const boost::beast::error_code &ec);

  void Enqueue(Outgoing out);
  void DoWrite();
  void OnWrite(std::uint64_t gen, bool response,
               const boost::beast::error_code &ec);
  void AdmitWaiters();
  void DropOutbound();

  void LinkFailed(std::string reason);
  void ScheduleReconnect();
  void OnReconnectTimer(const boost::beast::error_code &ec);
  void OnCancelled();
  void FinishClose();
  void CompleteClose();

  bool Stale(std::uint64_t gen) const {
    return gen != generation_.load() || !transport_;
  }
  std::chrono::milliseconds IdleLimit() const { return heartbeat_ * 2; }

  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  ControlTransportFactory factory_;
  ControlChannelOptions options_;
  EventBus &bus_;
  CancellationToken token_;
  IInboundEventSink *sink_{nullptr};
  FatalHandler on_fatal_;

  std::shared_ptr<IControlTransport> transport_;
  std::atomic<ChannelState> state_{ChannelState::kIdle};
  std::atomic<std::uint64_t> generation_{0};
  bool connected_{false};
  bool reading_{false};
  bool writing_{false};
  bool read_paused_{false};
  bool closing_{false};
  bool close_completed_{false};
  std::function<void()> on_closed_;

  std::chrono::milliseconds heartbeat_{30000};
  std::chrono::steady_clock::time_point last_frame_at_{};
  std::uint64_t ping_nonce_{0};
  int malformed_in_a_row_{0};
  int failures_in_a_row_{0};

  std::deque<Outgoing> outbound_;
  std::size_t responses_queued_{0};
  std::deque<Waiter> waiters_;

  boost::asio::steady_timer handshake_timer_;
  boost::asio::steady_timer idle_timer_;
  boost::asio::steady_timer ping_timer_;
  boost::asio::steady_timer reconnect_timer_;
  boost::asio::steady_timer close_timer_;
  JitteredExponentialBackoff backoff_;
  std::mt19937 rng_;

  std::atomic<std::uint64_t> frames_received_{0};
  std::atomic<std::uint64_t> responses_sent_{0};
  std::atomic<std::uint64_t> connects_{0};
  src::severity_logger<trivial::severity_level> lg;
};

} // namespace hookrelay
