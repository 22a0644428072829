#include "listen/listen_messages.hpp"

#include <fmt/format.h>
#include <stdexcept>

#include "util/string_util.hpp"

namespace hookrelay {
namespace json = boost::json;

namespace {

std::string ToStdString(const json::string &s) {
  return std::string(s.data(), s.size());
}

const json::object &RequireObject(const json::value &jv, const char *ctx) {
  if (!jv.is_object()) {
    throw std::runtime_error(fmt::format("{} must be an object", ctx));
  }
  return jv.as_object();
}

std::string RequireString(const json::object &obj, const char *key,
                          const char *ctx) {
  if (auto *p = obj.if_contains(key)) {
    if (p->is_string()) {
      return ToStdString(p->as_string());
    }
  }
  throw std::runtime_error(fmt::format("{} missing string field '{}'", ctx, key));
}

std::string OptionalString(const json::object &obj, const char *key) {
  if (auto *p = obj.if_contains(key)) {
    if (p->is_string()) {
      return ToStdString(p->as_string());
    }
    if (p->is_number()) {
      return json::serialize(*p);
    }
  }
  return {};
}

std::int64_t OptionalInt(const json::object &obj, const char *key,
                         const char *ctx, std::int64_t fallback) {
  if (auto *p = obj.if_contains(key)) {
    if (p->is_null()) {
      return fallback;
    }
    if (!p->is_number()) {
      throw std::runtime_error(
          fmt::format("{} field '{}' is not a number", ctx, key));
    }
    return p->to_number<std::int64_t>();
  }
  return fallback;
}

} // namespace

std::string frame_type(const json::value &jv) {
  if (const auto *obj = jv.if_object()) {
    if (const auto *t = obj->if_contains("type"); t && t->is_string()) {
      return std::string(t->as_string().c_str());
    }
  }
  return {};
}

EncodedBody encode_body(const std::string &octets) {
  if (stringutil::is_valid_utf8(octets)) {
    return EncodedBody{octets, "utf8"};
  }
  return EncodedBody{stringutil::base64_encode(octets), "base64"};
}

std::string decode_body(const std::string &text, const std::string &encoding) {
  if (encoding.empty() || encoding == "utf8") {
    return text;
  }
  if (encoding == "base64") {
    auto decoded = stringutil::base64_decode(text);
    if (!decoded) {
      throw std::runtime_error("body is not valid base64");
    }
    return std::move(*decoded);
  }
  throw std::runtime_error(
      fmt::format("unsupported body_encoding '{}'", encoding));
}

json::object headers_to_json(const HeaderList &headers) {
  json::object obj;
  for (const auto &[name, value] : headers) {
    auto &slot = obj[name];
    if (!slot.is_array()) {
      slot = json::array{};
    }
    slot.as_array().emplace_back(value);
  }
  return obj;
}

HeaderList headers_from_json(const json::value &jv, const char *ctx) {
  if (!jv.is_object()) {
    throw std::runtime_error(fmt::format("{} headers must be object", ctx));
  }
  HeaderList headers;
  for (const auto &kv : jv.as_object()) {
    const std::string name(kv.key());
    if (kv.value().is_string()) {
      headers.emplace_back(name, ToStdString(kv.value().as_string()));
      continue;
    }
    if (!kv.value().is_array()) {
      throw std::runtime_error(
          fmt::format("{} header '{}' is neither string nor array", ctx, name));
    }
    for (const auto &v : kv.value().as_array()) {
      if (!v.is_string()) {
        throw std::runtime_error(
            fmt::format("{} header '{}' has a non-string value", ctx, name));
      }
      headers.emplace_back(name, ToStdString(v.as_string()));
    }
  }
  return headers;
}

void tag_invoke(const json::value_from_tag &, json::value &jv,
                const HelloFrame &hello) {
  jv = json::object{{"type", "hello"},
                    {"session_id", hello.session_id},
                    {"device_name", hello.device_name},
                    {"protocol", hello.protocol}};
}

void tag_invoke(const json::value_from_tag &, json::value &jv,
                const WelcomeFrame &welcome) {
  jv = json::object{{"type", "welcome"},
                    {"heartbeat_ms", welcome.heartbeat_ms},
                    {"server_time", welcome.server_time}};
}

void tag_invoke(const json::value_from_tag &, json::value &jv,
                const PingFrame &ping) {
  jv = json::object{{"type", "ping"}, {"nonce", ping.nonce}};
}

void tag_invoke(const json::value_from_tag &, json::value &jv,
                const PongFrame &pong) {
  jv = json::object{{"type", "pong"}, {"nonce", pong.nonce}};
}

void tag_invoke(const json::value_from_tag &, json::value &jv,
                const InboundEvent &event) {
  auto body = encode_body(event.body);
  jv = json::object{{"type", "event"},
                    {"id", event.id},
                    {"session_id", event.session_id},
                    {"connection_id", event.connection_id},
                    {"source_id", event.source_id},
                    {"destination_id", event.destination_id},
                    {"method", event.method},
                    {"path", event.path},
                    {"query", event.query},
                    {"headers", headers_to_json(event.headers)},
                    {"body", std::move(body.text)},
                    {"body_encoding", std::move(body.encoding)},
                    {"received_at", event.received_at}};
}

void tag_invoke(const json::value_from_tag &, json::value &jv,
                const OutboundResponse &res) {
  auto body = encode_body(res.body);
  jv = json::object{{"type", "response"},
                    {"event_id", res.event_id},
                    {"status", res.status},
                    {"headers", headers_to_json(res.headers)},
                    {"body", std::move(body.text)},
                    {"body_encoding", std::move(body.encoding)},
                    {"latency_ms", res.latency_ms},
                    {"transport_error", std::string(to_string(res.transport_error))},
                    {"filtered", res.filtered}};
}

HelloFrame tag_invoke(const json::value_to_tag<HelloFrame> &,
                      const json::value &jv) {
  const auto &obj = RequireObject(jv, "HelloFrame");
  HelloFrame hello;
  hello.session_id = RequireString(obj, "session_id", "HelloFrame");
  hello.device_name = OptionalString(obj, "device_name");
  hello.protocol = static_cast<int>(
      OptionalInt(obj, "protocol", "HelloFrame", kControlProtocolVersion));
  return hello;
}

WelcomeFrame tag_invoke(const json::value_to_tag<WelcomeFrame> &,
                        const json::value &jv) {
  const auto &obj = RequireObject(jv, "WelcomeFrame");
  WelcomeFrame welcome;
  welcome.heartbeat_ms = OptionalInt(obj, "heartbeat_ms", "WelcomeFrame", 0);
  if (welcome.heartbeat_ms < 0) {
    throw std::runtime_error("WelcomeFrame heartbeat_ms is negative");
  }
  welcome.server_time = OptionalString(obj, "server_time");
  return welcome;
}

PingFrame tag_invoke(const json::value_to_tag<PingFrame> &,
                     const json::value &jv) {
  const auto &obj = RequireObject(jv, "PingFrame");
  PingFrame ping;
  if (auto *p = obj.if_contains("nonce")) {
    ping.nonce = *p;
  }
  return ping;
}

PongFrame tag_invoke(const json::value_to_tag<PongFrame> &,
                     const json::value &jv) {
  const auto &obj = RequireObject(jv, "PongFrame");
  PongFrame pong;
  if (auto *p = obj.if_contains("nonce")) {
    pong.nonce = *p;
  }
  return pong;
}

InboundEvent tag_invoke(const json::value_to_tag<InboundEvent> &,
                        const json::value &jv) {
  const auto &obj = RequireObject(jv, "InboundEvent");
  InboundEvent event;
  event.id = RequireString(obj, "id", "InboundEvent");
  if (event.id.empty()) {
    throw std::runtime_error("InboundEvent id is empty");
  }
  event.method = RequireString(obj, "method", "InboundEvent");
  event.path = OptionalString(obj, "path");
  if (event.path.empty()) {
    event.path = "/";
  }
  event.query = OptionalString(obj, "query");
  event.session_id = OptionalString(obj, "session_id");
  event.connection_id = OptionalString(obj, "connection_id");
  event.source_id = OptionalString(obj, "source_id");
  event.destination_id = OptionalString(obj, "destination_id");
  event.received_at = OptionalString(obj, "received_at");
  if (auto *headers = obj.if_contains("headers"); headers && !headers->is_null()) {
    event.headers = headers_from_json(*headers, "InboundEvent");
  }
  const std::string body = OptionalString(obj, "body");
  event.body = decode_body(body, OptionalString(obj, "body_encoding"));
  return event;
}

OutboundResponse tag_invoke(const json::value_to_tag<OutboundResponse> &,
                            const json::value &jv) {
  const auto &obj = RequireObject(jv, "OutboundResponse");
  OutboundResponse res;
  res.event_id = RequireString(obj, "event_id", "OutboundResponse");
  res.status = static_cast<int>(OptionalInt(obj, "status", "OutboundResponse", 0));
  res.latency_ms = OptionalInt(obj, "latency_ms", "OutboundResponse", 0);
  if (auto *headers = obj.if_contains("headers"); headers && !headers->is_null()) {
    res.headers = headers_from_json(*headers, "OutboundResponse");
  }
  res.body = decode_body(OptionalString(obj, "body"),
                         OptionalString(obj, "body_encoding"));
  const std::string err = OptionalString(obj, "transport_error");
  if (!err.empty()) {
    auto parsed = transport_error_from_string(err);
    if (!parsed) {
      throw std::runtime_error(
          fmt::format("OutboundResponse unknown transport_error '{}'", err));
    }
    res.transport_error = *parsed;
  }
  if (auto *p = obj.if_contains("filtered"); p && p->is_bool()) {
    res.filtered = p->as_bool();
  }
  return res;
}

} // namespace hookrelay
