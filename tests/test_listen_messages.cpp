#include <gtest/gtest.h>

#include <boost/json.hpp>

#include "listen/listen_messages.hpp"
#include "listen/listen_types.hpp"
#include "util/string_util.hpp"

namespace hookrelay {
namespace json = boost::json;

TEST(ListenMessagesTest, HelloCarriesProtocolVersion) {
  HelloFrame hello;
  hello.session_id = "ses_1";
  hello.device_name = "laptop";

  auto serialized = json::value_from(hello);
  ASSERT_TRUE(serialized.is_object());
  const auto &obj = serialized.as_object();
  EXPECT_EQ(obj.at("type"), "hello");
  EXPECT_EQ(obj.at("session_id"), "ses_1");
  EXPECT_EQ(obj.at("device_name"), "laptop");
  EXPECT_EQ(obj.at("protocol").to_number<int>(), 1);
}

TEST(ListenMessagesTest, WelcomeParsesHeartbeat) {
  auto jv = json::parse(
      R"({"type":"welcome","heartbeat_ms":15000,"server_time":"2025-01-01T00:00:00Z"})");
  auto welcome = json::value_to<WelcomeFrame>(jv);
  EXPECT_EQ(welcome.heartbeat_ms, 15000);
  EXPECT_EQ(welcome.server_time, "2025-01-01T00:00:00Z");
  EXPECT_EQ(frame_type(jv), "welcome");
}

TEST(ListenMessagesTest, WelcomeRejectsNegativeHeartbeat) {
  auto jv = json::parse(R"({"type":"welcome","heartbeat_ms":-5})");
  EXPECT_THROW(json::value_to<WelcomeFrame>(jv), std::runtime_error);
}

TEST(ListenMessagesTest, PingNonceIsEchoedWithItsType) {
  auto jv = json::parse(R"({"type":"ping","nonce":"abc"})");
  auto ping = json::value_to<PingFrame>(jv);
  PongFrame pong{ping.nonce};
  auto out = json::value_from(pong);
  EXPECT_EQ(out.as_object().at("type"), "pong");
  EXPECT_EQ(out.as_object().at("nonce"), "abc");

  auto numeric = json::value_to<PingFrame>(json::parse(R"({"type":"ping","nonce":42})"));
  EXPECT_TRUE(numeric.nonce.is_number());
}

TEST(ListenMessagesTest, EventDecodesHeadersAndBase64Body) {
  const std::string binary("\x00\xff\x10", 3);
  json::object frame{
      {"type", "event"},
      {"id", "evt_1"},
      {"connection_id", "web_1"},
      {"source_id", "src_1"},
      {"destination_id", "des_1"},
      {"method", "POST"},
      {"path", "/orders"},
      {"query", "a=1"},
      {"headers", json::object{{"X-Sig", json::array{"v1", "v2"}},
                               {"content-type", "application/octet-stream"}}},
      {"body", stringutil::base64_encode(binary)},
      {"body_encoding", "base64"},
      {"received_at", "2025-01-01T00:00:00Z"}};

  auto event = json::value_to<InboundEvent>(json::value(frame));
  EXPECT_EQ(event.id, "evt_1");
  EXPECT_EQ(event.connection_id, "web_1");
  EXPECT_EQ(event.method, "POST");
  EXPECT_EQ(event.path, "/orders");
  EXPECT_EQ(event.query, "a=1");
  EXPECT_EQ(event.body, binary);
  ASSERT_EQ(event.headers.size(), 3u);
  EXPECT_EQ(event.headers[0], (std::pair<std::string, std::string>{"X-Sig", "v1"}));
  EXPECT_EQ(event.headers[1], (std::pair<std::string, std::string>{"X-Sig", "v2"}));
}

TEST(ListenMessagesTest, EventWithoutIdIsRejected) {
  auto jv = json::parse(R"({"type":"event","method":"GET","path":"/"})");
  EXPECT_THROW(json::value_to<InboundEvent>(jv), std::runtime_error);
}

TEST(ListenMessagesTest, EventWithBadBase64IsRejected) {
  auto jv = json::parse(
      R"({"type":"event","id":"e","method":"POST","body":"@@@","body_encoding":"base64"})");
  EXPECT_THROW(json::value_to<InboundEvent>(jv), std::runtime_error);
}

TEST(ListenMessagesTest, EventEmptyPathBecomesRoot) {
  auto jv = json::parse(R"({"type":"event","id":"e","method":"GET"})");
  auto event = json::value_to<InboundEvent>(jv);
  EXPECT_EQ(event.path, "/");
  EXPECT_TRUE(event.body.empty());
}

TEST(ListenMessagesTest, ResponseFrameShape) {
  OutboundResponse res;
  res.event_id = "evt_9";
  res.status = 201;
  res.headers = {{"content-type", "text/plain"}, {"set-cookie", "a=1"},
                 {"set-cookie", "b=2"}};
  res.body = "created";
  res.latency_ms = 12;

  auto jv = json::value_from(res);
  const auto &obj = jv.as_object();
  EXPECT_EQ(obj.at("type"), "response");
  EXPECT_EQ(obj.at("event_id"), "evt_9");
  EXPECT_EQ(obj.at("status").to_number<int>(), 201);
  EXPECT_EQ(obj.at("body"), "created");
  EXPECT_EQ(obj.at("body_encoding"), "utf8");
  EXPECT_EQ(obj.at("transport_error"), "none");
  EXPECT_EQ(obj.at("filtered"), false);
  EXPECT_EQ(obj.at("headers").as_object().at("set-cookie").as_array().size(), 2u);
}

TEST(ListenMessagesTest, TransportErrorResponseHasZeroStatus) {
  OutboundResponse res;
  res.event_id = "evt_2";
  res.transport_error = TransportError::kTimeout;

  auto jv = json::value_from(res);
  EXPECT_EQ(jv.as_object().at("status").to_number<int>(), 0);
  EXPECT_EQ(jv.as_object().at("transport_error"), "timeout");

  auto back = json::value_to<OutboundResponse>(jv);
  EXPECT_EQ(back.transport_error, TransportError::kTimeout);
}

TEST(ListenMessagesTest, NonUtf8BodyIsBase64Encoded) {
  const std::string octets("\xc3\x28", 2);
  auto body = encode_body(octets);
  EXPECT_EQ(body.encoding, "base64");
  EXPECT_EQ(decode_body(body.text, body.encoding), octets);

  auto text = encode_body("héllo");
  EXPECT_EQ(text.encoding, "utf8");
  EXPECT_THROW(decode_body("x", "gzip"), std::runtime_error);
}

TEST(ListenMessagesTest, FrameTypeOfNonObject) {
  EXPECT_EQ(frame_type(json::parse("[1,2]")), "");
  EXPECT_EQ(frame_type(json::parse(R"({"type":7})")), "");
}

} // namespace hookrelay
