#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

#include "listen/control_channel.hpp"
#include "listen/event_bus.hpp"
#include "listen/listen_types.hpp"
#include "listen/session_filter.hpp"
#include "util/my_logging.hpp"

namespace hookrelay {

// Identifies one delivery: the connection the event arrived on and the
// pool's own sequence number for it.
struct DeliveryTag {
  std::uint64_t generation{0};
  std::uint64_t sequence{0};
  std::string event_id;
};

class IResponseRelay {
public:
  virtual ~IResponseRelay() = default;
  // `on_accepted(true)` once the frame is queued for sending, `false` when
  // it was discarded. Either way the delivery is finished.
  virtual void Relay(const DeliveryTag &tag, LocalOutcome outcome,
                     std::function<void(bool)> on_accepted) = 0;
};

struct ForwarderPoolOptions {
  std::size_t max_connections{50};
  std::size_t high_water_mark{1024};
  // 0 selects high_water_mark / 2.
  std::size_t low_water_mark{0};
  std::chrono::milliseconds request_timeout{30000};
  std::size_t max_response_body_bytes{1024 * 1024};
  std::size_t max_request_body_bytes{10 * 1024 * 1024};
  bool verify_tls{true};
  bool evaluate_filters{true};
};

/**
 * Bounded-concurrency dispatcher of local HTTP requests.
 *
 * Events are taken in arrival order; at most max_connections of them are
 * in flight, counting from dispatch until the relay accepted the outcome.
 * The rest wait in a FIFO. Crossing the high-water mark asks the control
 * channel to stop reading; dropping below the low-water mark resumes it.
 */
class ForwarderPool : public IInboundEventSink,
                      public std::enable_shared_from_this<ForwarderPool> {
public:
  using FlowControl = std::function<void(bool paused)>;

  ForwarderPool(boost::asio::io_context &ioc, ForwardTarget target,
                Session session, ForwarderPoolOptions options,
                IResponseRelay &relay, EventBus &bus,
                FilterEvaluator filter = evaluate_session_filters);

  void SetFlowControl(FlowControl flow) { flow_ = std::move(flow); }

  void OnInboundEvent(std::uint64_t generation, InboundEvent event) override;
  void OnLinkLost(std::uint64_t generation) override;

  // Stops accepting events, drops the queue and waits up to `grace` for
  // in-flight deliveries. Calls still running then are aborted; their
  // outcomes are not relayed. `on_drained` runs exactly once.
  void Shutdown(std::chrono::milliseconds grace,
                std::function<void()> on_drained);

  std::size_t in_flight() const { return in_flight_count_.load(); }
  std::size_t peak_in_flight() const { return peak_in_flight_.load(); }
  std::size_t pending() const { return pending_count_.load(); }
  std::uint64_t dispatched() const { return dispatched_.load(); }

  class ICall {
  public:
    virtual ~ICall() = default;
    virtual void Start() = 0;
    virtual void Cancel() = 0;
  };

private:
  struct Pending {
    std::uint64_t generation;
    std::uint64_t sequence;
    InboundEvent event;
  };

  void Accept(std::uint64_t generation, InboundEvent event);
  void RelayImmediately(const DeliveryTag &tag, LocalOutcome outcome);
  void Pump();
  void Dispatch(Pending item);
  void OnCallComplete(DeliveryTag tag, LocalOutcome outcome);
  void ReleaseSlot();
  void UpdateFlow();
  void MaybeFinishDrain();
  void FinishDrain();
  void SyncCounters();

  boost::asio::io_context &ioc_;
  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  ForwardTarget target_;
  Session session_;
  ForwarderPoolOptions options_;
  IResponseRelay &relay_;
  EventBus &bus_;
  FilterEvaluator filter_;
  FlowControl flow_;
  boost::asio::ssl::context ssl_ctx_;

  std::deque<Pending> pending_;
  std::unordered_map<std::uint64_t, std::shared_ptr<ICall>> calls_;
  std::size_t in_flight_{0};
  std::uint64_t next_sequence_{0};
  bool paused_{false};
  bool shutting_down_{false};
  std::function<void()> on_drained_;
  boost::asio::steady_timer drain_timer_;

  std::atomic<std::size_t> in_flight_count_{0};
  std::atomic<std::size_t> peak_in_flight_{0};
  std::atomic<std::size_t> pending_count_{0};
  std::atomic<std::uint64_t> dispatched_{0};
  src::severity_logger<trivial::severity_level> lg;
};

} // namespace hookrelay
