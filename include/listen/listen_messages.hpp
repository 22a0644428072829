#pragma once

#include <boost/json.hpp>

#include <cstdint>
#include <string>

#include "listen/listen_types.hpp"

namespace hookrelay {

constexpr int kControlProtocolVersion = 1;

struct HelloFrame {
  std::string session_id;
  std::string device_name;
  int protocol{kControlProtocolVersion};
};

struct WelcomeFrame {
  std::int64_t heartbeat_ms{0};
  std::string server_time;
};

// The nonce is echoed back verbatim, whatever JSON type the peer used.
struct PingFrame {
  boost::json::value nonce;
};

struct PongFrame {
  boost::json::value nonce;
};

// "type" of a decoded frame, empty when absent or not a string.
std::string frame_type(const boost::json::value &jv);

// Octets as carried in a frame: UTF-8 text verbatim, anything else base64.
struct EncodedBody {
  std::string text;
  std::string encoding; // "utf8" | "base64"
};
EncodedBody encode_body(const std::string &octets);

// Inverse of encode_body; throws std::runtime_error on a bad encoding name
// or malformed base64.
std::string decode_body(const std::string &text, const std::string &encoding);

// {name: [values...]} grouping repeated names in first-seen order.
boost::json::object headers_to_json(const HeaderList &headers);
// Accepts {name: [values]} and {name: value}.
HeaderList headers_from_json(const boost::json::value &jv, const char *ctx);

void tag_invoke(const boost::json::value_from_tag &, boost::json::value &jv,
                const HelloFrame &hello);
void tag_invoke(const boost::json::value_from_tag &, boost::json::value &jv,
                const WelcomeFrame &welcome);
void tag_invoke(const boost::json::value_from_tag &, boost::json::value &jv,
                const PingFrame &ping);
void tag_invoke(const boost::json::value_from_tag &, boost::json::value &jv,
                const PongFrame &pong);
void tag_invoke(const boost::json::value_from_tag &, boost::json::value &jv,
                const InboundEvent &event);
void tag_invoke(const boost::json::value_from_tag &, boost::json::value &jv,
                const OutboundResponse &response);

HelloFrame tag_invoke(const boost::json::value_to_tag<HelloFrame> &,
                      const boost::json::value &jv);
WelcomeFrame tag_invoke(const boost::json::value_to_tag<WelcomeFrame> &,
                        const boost::json::value &jv);
PingFrame tag_invoke(const boost::json::value_to_tag<PingFrame> &,
                     const boost::json::value &jv);
PongFrame tag_invoke(const boost::json::value_to_tag<PongFrame> &,
                     const boost::json::value &jv);
InboundEvent tag_invoke(const boost::json::value_to_tag<InboundEvent> &,
                        const boost::json::value &jv);
OutboundResponse tag_invoke(const boost::json::value_to_tag<OutboundResponse> &,
                            const boost::json::value &jv);

} // namespace hookrelay
