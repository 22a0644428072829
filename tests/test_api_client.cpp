#include <gtest/gtest.h>

#include <sstream>

#include "api_client.hpp"
#include "customio/output.hpp"
#include "listen_test_support.hpp"
#include "my_error_codes.hpp"

using namespace std::chrono_literals;

namespace hookrelay {
namespace {

using test_support::PickFreePort;
using test_support::TestLocalHttpServer;
namespace http = boost::beast::http;

class StaticConfigProvider : public IHookrelayConfigProvider {
public:
  explicit StaticConfigProvider(HookrelayConfig cfg) : config_(std::move(cfg)) {}
  const HookrelayConfig &get() const override { return config_; }
  HookrelayConfig &get() override { return config_; }

private:
  HookrelayConfig config_;
};

TEST(ApiErrorTest, PrefersJsonMessage) {
  auto err = api_error_from_reply(422, "Unprocessable Entity",
                                  R"({"message":"Source name taken"})");
  EXPECT_EQ(err.code, my_errors::LISTEN::API_ERROR);
  EXPECT_EQ(err.what, "Source name taken");
  EXPECT_EQ(err.http_status, 422);
}

TEST(ApiErrorTest, FallsBackToBodyThenStatusLine) {
  auto raw = api_error_from_reply(500, "Internal Server Error", "  boom \n");
  EXPECT_EQ(raw.what, "boom");

  auto empty = api_error_from_reply(502, "Bad Gateway", "");
  EXPECT_EQ(empty.what, "unexpected http status code: 502 Bad Gateway");
}

TEST(ApiErrorTest, AuthStatusesHaveDedicatedCodes) {
  EXPECT_EQ(api_error_from_reply(401, "Unauthorized", "").code,
            my_errors::GENERAL::UNAUTHORIZED);
  EXPECT_EQ(api_error_from_reply(403, "Forbidden", "").code,
            my_errors::GENERAL::FORBIDDEN);
  EXPECT_EQ(api_error_from_reply(404, "Not Found", "").code,
            my_errors::GENERAL::NOT_FOUND);
}

TEST(ApiErrorTest, BasicAuthUsesKeyAsUserName) {
  // base64("key_123:")
  EXPECT_EQ(basic_auth_header("key_123"), "Basic a2V5XzEyMzo=");
}

class HttpApiClientTest : public ::testing::Test {
protected:
  HttpApiClientTest()
      : port_(PickFreePort()), server_(port_), output_(5, sink_) {
    HookrelayConfig cfg;
    cfg.api_key = "key_123";
    cfg.project_id = "prj_9";
    cfg.api_base_url = "http://127.0.0.1:" + std::to_string(port_) + "/2025-01-01/";
    provider_ = std::make_unique<StaticConfigProvider>(cfg);
  }

  void SetUp() override { server_.Start(); }
  void TearDown() override { server_.Stop(); }

  unsigned short port_;
  TestLocalHttpServer server_;
  std::ostringstream sink_;
  customio::ConsoleOutputWithColor output_;
  std::unique_ptr<StaticConfigProvider> provider_;
};

TEST_F(HttpApiClientTest, FindSourceSendsCredentialsAndParsesModels) {
  server_.set_response(http::status::ok,
                       R"({"models":[{"id":"src_1","name":"shop","url":"https://h/shop"}]})");
  HttpApiClient client(*provider_, output_);
  client.set_timeout(3s);

  auto result = client.FindSourceByName("shop");
  ASSERT_TRUE(result.is_ok()) << result.error();
  ASSERT_TRUE(result.value().has_value());
  EXPECT_EQ(result.value()->id, "src_1");

  auto recorded = server_.WaitForRequest(2s);
  ASSERT_TRUE(recorded.has_value());
  EXPECT_EQ(recorded->method, "GET");
  EXPECT_EQ(recorded->target, "/2025-01-01/sources?name=shop");
  EXPECT_EQ(recorded->header("Authorization"), "Basic a2V5XzEyMzo=");
  EXPECT_EQ(recorded->header("X-Project-Id"), "prj_9");
}

TEST_F(HttpApiClientTest, EmptyListMeansNoSource) {
  server_.set_response(http::status::ok, "[]");
  HttpApiClient client(*provider_, output_);
  auto result = client.FindSourceByName("missing");
  ASSERT_TRUE(result.is_ok()) << result.error();
  EXPECT_FALSE(result.value().has_value());
}

TEST_F(HttpApiClientTest, CreateSessionPostsConnectionIds) {
  server_.set_response(http::status::ok,
                       R"({"id":"ses_1","url":"wss://ws.test/cli/sessions/ses_1"})");
  HttpApiClient client(*provider_, output_);
  data::CreateSessionRequest req;
  req.source_id = "src_1";
  req.connection_ids = {"web_a", "web_b"};
  req.device_name = "laptop";

  auto result = client.CreateSession(req);
  ASSERT_TRUE(result.is_ok()) << result.error();
  EXPECT_EQ(result.value().id, "ses_1");
  EXPECT_EQ(result.value().control_url, "wss://ws.test/cli/sessions/ses_1");

  auto recorded = server_.WaitForRequest(2s);
  ASSERT_TRUE(recorded.has_value());
  EXPECT_EQ(recorded->method, "POST");
  EXPECT_EQ(recorded->target, "/2025-01-01/cli-sessions");
  auto body = boost::json::parse(recorded->body).as_object();
  EXPECT_EQ(body.at("source_id").as_string(), "src_1");
  EXPECT_EQ(body.at("connection_ids").as_array().size(), 2u);
  EXPECT_FALSE(body.contains("filters"));
}

TEST_F(HttpApiClientTest, NonSuccessStatusCarriesServerMessage) {
  server_.set_response(http::status::unauthorized,
                       R"({"message":"Invalid API key"})");
  HttpApiClient client(*provider_, output_);
  auto result = client.ListConnections("src_1");
  ASSERT_TRUE(result.is_err());
  EXPECT_EQ(result.error().code, my_errors::GENERAL::UNAUTHORIZED);
  EXPECT_EQ(result.error().what, "Invalid API key");
  EXPECT_EQ(result.error().http_status, 401);
}

TEST_F(HttpApiClientTest, MalformedModelIsUnexpectedResult) {
  server_.set_response(http::status::ok, R"({"name":"no id"})");
  HttpApiClient client(*provider_, output_);
  auto result = client.CreateSource("shop");
  ASSERT_TRUE(result.is_err());
  EXPECT_EQ(result.error().code, my_errors::GENERAL::UNEXPECTED_RESULT);
}

TEST(HttpApiClientNetworkTest, UnreachableServiceIsNetworkError) {
  HookrelayConfig cfg;
  cfg.api_key = "key";
  cfg.api_base_url = "http://127.0.0.1:" + std::to_string(PickFreePort());
  StaticConfigProvider provider(cfg);
  std::ostringstream sink;
  customio::ConsoleOutputWithColor output(5, sink);
  HttpApiClient client(provider, output);
  client.set_timeout(2s);

  auto result = client.FindSourceByName("shop");
  ASSERT_TRUE(result.is_err());
  EXPECT_NE(result.error().code, my_errors::LISTEN::API_ERROR);
  EXPECT_EQ(result.error().http_status, 0);
}

} // namespace
} // namespace hookrelay
