#include <gtest/gtest.h>

#include "conf/hookrelay_config.hpp"
#include "my_error_codes.hpp"
#include "test_config_utils.hpp"

namespace hookrelay {
namespace {

namespace json = boost::json;
using testinfra::fake_env;
using testinfra::ScopedTempDir;

TEST(ConfigDirTest, ResolutionOrder) {
  EXPECT_EQ(resolve_config_dir(std::string("/cli"),
                               fake_env({{"HOOKRELAY_CONFIG_DIR", "/env"}})),
            fs::path("/cli"));
  EXPECT_EQ(resolve_config_dir(std::nullopt,
                               fake_env({{"HOOKRELAY_CONFIG_DIR", "/env"},
                                         {"XDG_CONFIG_HOME", "/xdg"}})),
            fs::path("/env"));
  EXPECT_EQ(resolve_config_dir(std::nullopt,
                               fake_env({{"XDG_CONFIG_HOME", "/xdg"},
                                         {"HOME", "/home/dev"}})),
            fs::path("/xdg") / "hookrelay");
  EXPECT_EQ(resolve_config_dir(std::nullopt, fake_env({{"HOME", "/home/dev"}})),
            fs::path("/home/dev") / ".config" / "hookrelay");
  EXPECT_EQ(resolve_config_dir(std::string(), fake_env({})),
            fs::path(".hookrelay"));
}

TEST(LoadConfigTest, MissingFileYieldsDefaults) {
  ScopedTempDir dir("hookrelay-config");
  auto result = load_hookrelay_config(dir.path(), "default",
                                      fake_env({{"HOOKRELAY_DEVICE_NAME", "box"}}));
  ASSERT_TRUE(result.is_ok()) << result.error();
  const auto &cfg = result.value();
  EXPECT_TRUE(cfg.api_key.empty());
  EXPECT_EQ(cfg.device_name, "box");
  EXPECT_EQ(cfg.listen.max_connections, 50);
  EXPECT_EQ(cfg.listen.request_timeout_ms, 30000);
  EXPECT_TRUE(cfg.listen.evaluate_filters_locally);
}

TEST(LoadConfigTest, MissingFileWithNamedProfileIsAnError) {
  ScopedTempDir dir("hookrelay-config");
  auto result = load_hookrelay_config(dir.path(), "staging", fake_env({}));
  ASSERT_TRUE(result.is_err());
  EXPECT_EQ(result.error().code, my_errors::GENERAL::INVALID_ARGUMENT);
}

TEST(LoadConfigTest, ProfileOverlaysTopLevelAndMergesSections) {
  ScopedTempDir dir("hookrelay-config");
  testinfra::write_config_json(
      dir.path(),
      json::object{
          {"api_key", "key_default"},
          {"default_source", "shop"},
          {"listen", json::object{{"max_connections", 10},
                                  {"request_timeout_ms", 2000}}},
          {"profiles",
           json::object{{"staging",
                         json::object{{"api_key", "key_staging"},
                                      {"listen", json::object{
                                                     {"max_connections", 3}}}}}}}});

  auto base = load_hookrelay_config(dir.path(), "default", fake_env({}));
  ASSERT_TRUE(base.is_ok()) << base.error();
  EXPECT_EQ(base.value().api_key, "key_default");
  EXPECT_EQ(base.value().listen.max_connections, 10);

  auto staging = load_hookrelay_config(dir.path(), "staging", fake_env({}));
  ASSERT_TRUE(staging.is_ok()) << staging.error();
  EXPECT_EQ(staging.value().api_key, "key_staging");
  EXPECT_EQ(staging.value().default_source, "shop");
  EXPECT_EQ(staging.value().listen.max_connections, 3);
  EXPECT_EQ(staging.value().listen.request_timeout_ms, 2000);
}

TEST(LoadConfigTest, UnknownProfileIsAnError) {
  ScopedTempDir dir("hookrelay-config");
  testinfra::write_config_json(dir.path(), json::object{{"api_key", "k"}});
  auto result = load_hookrelay_config(dir.path(), "prod", fake_env({}));
  ASSERT_TRUE(result.is_err());
  EXPECT_NE(result.error().what.find("prod"), std::string::npos);
}

TEST(LoadConfigTest, EnvironmentOverridesFile) {
  ScopedTempDir dir("hookrelay-config");
  testinfra::write_config_json(
      dir.path(), json::object{{"api_key", "from_file"},
                               {"api_base_url", "https://file.test"},
                               {"device_name", "file-box"}});
  auto result = load_hookrelay_config(
      dir.path(), "default",
      fake_env({{"HOOKRELAY_API_KEY", "from_env"},
                {"HOOKRELAY_PROJECT_ID", "prj_env"},
                {"HOOKRELAY_WS_BASE_URL", "ws://127.0.0.1:9"},
                {"HOOKRELAY_UNIX_SOCKET", "/tmp/hr.sock"}}));
  ASSERT_TRUE(result.is_ok()) << result.error();
  const auto &cfg = result.value();
  EXPECT_EQ(cfg.api_key, "from_env");
  EXPECT_EQ(cfg.project_id, "prj_env");
  EXPECT_EQ(cfg.api_base_url, "https://file.test");
  EXPECT_EQ(cfg.ws_base_url, "ws://127.0.0.1:9");
  EXPECT_EQ(cfg.unix_socket, "/tmp/hr.sock");
  EXPECT_EQ(cfg.device_name, "file-box");
}

TEST(LoadConfigTest, MalformedFilesAreArgumentErrors) {
  ScopedTempDir dir("hookrelay-config");
  testinfra::write_text(dir.path() / "config.json", "{ not json");
  auto bad_json = load_hookrelay_config(dir.path(), "default", fake_env({}));
  ASSERT_TRUE(bad_json.is_err());
  EXPECT_EQ(bad_json.error().code, my_errors::GENERAL::INVALID_ARGUMENT);

  testinfra::write_text(dir.path() / "config.json", "[1,2]");
  auto not_object = load_hookrelay_config(dir.path(), "default", fake_env({}));
  ASSERT_TRUE(not_object.is_err());

  testinfra::write_config_json(
      dir.path(), json::object{{"listen", json::object{{"max_connections", "many"}}}});
  auto bad_type = load_hookrelay_config(dir.path(), "default", fake_env({}));
  ASSERT_TRUE(bad_type.is_err());
  EXPECT_EQ(bad_type.error().code, my_errors::GENERAL::INVALID_ARGUMENT);
}

} // namespace
} // namespace hookrelay
