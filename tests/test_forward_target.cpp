#include <gtest/gtest.h>

#include "listen/forward_target.hpp"
#include "my_error_codes.hpp"

namespace hookrelay {

TEST(ForwardTargetTest, BarePortMapsToLocalhost) {
  auto r = parse_forward_target("3000");
  ASSERT_TRUE(r.is_ok()) << r.error();
  EXPECT_EQ(r.value().scheme, "http");
  EXPECT_EQ(r.value().host, "localhost");
  EXPECT_EQ(r.value().port, "3000");
  EXPECT_EQ(r.value().base_path, "/");
  EXPECT_EQ(r.value().base_url(), "http://localhost:3000");
}

TEST(ForwardTargetTest, PortOutOfRangeIsRejected) {
  for (const char *arg : {"0", "65536", "99999999999999999999"}) {
    auto r = parse_forward_target(arg);
    ASSERT_TRUE(r.is_err()) << arg;
    EXPECT_EQ(r.error().code, my_errors::GENERAL::INVALID_ARGUMENT);
  }
}

TEST(ForwardTargetTest, HttpsUrlKeepsPathAndDefaultPort) {
  auto r = parse_forward_target("https://app.test/hooks");
  ASSERT_TRUE(r.is_ok()) << r.error();
  EXPECT_TRUE(r.value().secure());
  EXPECT_EQ(r.value().host, "app.test");
  EXPECT_EQ(r.value().port, "443");
  EXPECT_EQ(r.value().base_path, "/hooks");
  EXPECT_EQ(r.value().host_header(), "app.test");
}

TEST(ForwardTargetTest, SchemelessHostIsHttp) {
  auto r = parse_forward_target("app.test:8080/hooks");
  ASSERT_TRUE(r.is_ok()) << r.error();
  EXPECT_EQ(r.value().scheme, "http");
  EXPECT_EQ(r.value().port, "8080");
  EXPECT_EQ(r.value().host_header(), "app.test:8080");
}

TEST(ForwardTargetTest, QueryStringIsRejected) {
  auto r = parse_forward_target("http://localhost:3000/hooks?x=1");
  ASSERT_TRUE(r.is_err());
  EXPECT_EQ(r.error().code, my_errors::GENERAL::INVALID_ARGUMENT);
}

TEST(ForwardTargetTest, OtherSchemesAreRejected) {
  auto r = parse_forward_target("ftp://localhost/files");
  ASSERT_TRUE(r.is_err());
}

TEST(ForwardTargetTest, MissingHostIsRejected) {
  EXPECT_TRUE(parse_forward_target("http:///path").is_err());
  EXPECT_TRUE(parse_forward_target("").is_err());
}

TEST(ForwardTargetTest, CliPathIsValidated) {
  EXPECT_TRUE(parse_forward_target("3000", "/api").is_ok());
  auto bad = parse_forward_target("3000", "api");
  ASSERT_TRUE(bad.is_err());
  EXPECT_EQ(bad.error().code, my_errors::GENERAL::INVALID_ARGUMENT);
}

TEST(ForwardTargetTest, CliPathPattern) {
  EXPECT_TRUE(is_valid_cli_path("/"));
  EXPECT_TRUE(is_valid_cli_path("/a/b-c_d.e~f"));
  EXPECT_TRUE(is_valid_cli_path("//double"));
  EXPECT_TRUE(is_valid_cli_path("/with%20space"));
  EXPECT_FALSE(is_valid_cli_path(""));
  EXPECT_FALSE(is_valid_cli_path("relative"));
  EXPECT_FALSE(is_valid_cli_path("/has space"));
  EXPECT_FALSE(is_valid_cli_path("/query?x=1"));
}

TEST(ForwardTargetTest, Ipv6HostIsBracketedInHostHeader) {
  auto r = parse_forward_target("http://[::1]:9000/");
  ASSERT_TRUE(r.is_ok()) << r.error();
  EXPECT_EQ(r.value().host, "::1");
  EXPECT_EQ(r.value().host_header(), "[::1]:9000");
}

} // namespace hookrelay
