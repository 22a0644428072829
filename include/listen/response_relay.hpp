#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "listen/control_channel.hpp"
#include "listen/forwarder_pool.hpp"
#include "util/my_logging.hpp"

namespace hookrelay {

// Synthetic header marking a response body cut at the size cap.
inline constexpr const char *kBodyTruncatedHeader = "x-cli-body-truncated";

// Frames an attempt's outcome for the service.
OutboundResponse make_outbound_response(const std::string &event_id,
                                        LocalOutcome outcome);

// Hands framed outcomes to the control channel, tagged with the connection
// generation they belong to. A frame for a lost connection is dropped by
// the channel, so each delivery yields at most one response.
class ResponseRelay : public IResponseRelay {
public:
  explicit ResponseRelay(std::shared_ptr<ControlChannel> channel)
      : channel_(std::move(channel)) {}

  void Relay(const DeliveryTag &tag, LocalOutcome outcome,
             std::function<void(bool)> on_accepted) override;

  std::uint64_t accepted() const { return accepted_.load(); }
  std::uint64_t discarded() const { return discarded_.load(); }

private:
  std::shared_ptr<ControlChannel> channel_;
  std::atomic<std::uint64_t> accepted_{0};
  std::atomic<std::uint64_t> discarded_{0};
  src::severity_logger<trivial::severity_level> lg;
};

} // namespace hookrelay
