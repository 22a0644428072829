#include "listen/response_relay.hpp"

#include <utility>

namespace hookrelay {

OutboundResponse make_outbound_response(const std::string &event_id,
                                        LocalOutcome outcome) {
  OutboundResponse res;
  res.event_id = event_id;
  res.latency_ms = outcome.latency_ms < 0 ? 0 : outcome.latency_ms;
  res.transport_error = outcome.transport_error;
  res.filtered = outcome.filtered;
  if (outcome.filtered || outcome.transport_error != TransportError::kNone) {
    res.status = 0;
    return res;
  }
  res.status = outcome.status;
  res.headers = std::move(outcome.headers);
  res.body = std::move(outcome.body);
  if (outcome.body_truncated) {
    res.headers.emplace_back(kBodyTruncatedHeader, "true");
  }
  return res;
}

void ResponseRelay::Relay(const DeliveryTag &tag, LocalOutcome outcome,
                          std::function<void(bool)> on_accepted) {
  auto response = make_outbound_response(tag.event_id, std::move(outcome));
  channel_->SendResponse(
      tag.generation, std::move(response),
      [this, event_id = tag.event_id, generation = tag.generation,
       on_accepted = std::move(on_accepted)](bool queued) {
        if (queued) {
          ++accepted_;
        } else {
          ++discarded_;
          BOOST_LOG_SEV(lg, trivial::debug)
              << "response for " << event_id << " (generation " << generation
              << ") discarded, the service will redeliver";
        }
        if (on_accepted) {
          on_accepted(queued);
        }
      });
}

} // namespace hookrelay
