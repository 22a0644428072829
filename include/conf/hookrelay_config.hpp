#pragma once

#include <boost/json.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>

#include "customio/output.hpp"
#include "result.hpp"

namespace hookrelay {
namespace fs = std::filesystem;

struct CliCtx;

struct LoggingConfig {
  std::string level{"warning"};
  std::string log_dir;
  std::string log_file{"hookrelay"};
  std::uint64_t rotation_size{10 * 1024 * 1024};

  friend LoggingConfig tag_invoke(const boost::json::value_to_tag<LoggingConfig> &,
                                  const boost::json::value &jv) {
    if (!jv.is_object()) {
      throw std::runtime_error("LoggingConfig is not an object");
    }
    const auto &obj = jv.as_object();
    LoggingConfig cfg{};
    if (auto *p = obj.if_contains("level"); p && p->is_string()) {
      cfg.level = std::string(p->as_string().c_str());
    }
    if (auto *p = obj.if_contains("log_dir"); p && p->is_string()) {
      cfg.log_dir = std::string(p->as_string().c_str());
    }
    if (auto *p = obj.if_contains("log_file"); p && p->is_string()) {
      cfg.log_file = std::string(p->as_string().c_str());
    }
    if (auto *p = obj.if_contains("rotation_size")) {
      cfg.rotation_size = p->to_number<std::uint64_t>();
    }
    return cfg;
  }
};

// Tunables of the forwarding engine; every field has a usable default.
struct ListenSettings {
  int max_connections{50};
  int queue_high_water_mark{1024};
  int request_timeout_ms{30000};
  int handshake_timeout_ms{10000};
  int default_heartbeat_ms{30000};
  int drain_grace_ms{5000};
  std::int64_t max_response_body_bytes{1024 * 1024};
  std::int64_t max_request_body_bytes{10 * 1024 * 1024};
  int outbound_queue_capacity{256};
  int malformed_frame_threshold{8};
  int reconnect_initial_delay_ms{500};
  int reconnect_max_delay_ms{30000};
  int reconnect_jitter_ms{250};
  int max_reconnect_attempts{0};
  bool rewrite_host{true};
  bool evaluate_filters_locally{true};
  bool health_check{true};
  int event_bus_capacity{1024};

  friend ListenSettings tag_invoke(const boost::json::value_to_tag<ListenSettings> &,
                                   const boost::json::value &jv) {
    ListenSettings cfg{};
    auto *obj = jv.if_object();
    if (!obj) {
      throw std::runtime_error("ListenSettings is not an object");
    }
    auto read_int = [obj](const char *key, auto &field) {
      if (auto *p = obj->if_contains(key)) {
        field = p->to_number<std::remove_reference_t<decltype(field)>>();
      }
    };
    auto read_bool = [obj](const char *key, bool &field) {
      if (auto *p = obj->if_contains(key)) {
        field = p->as_bool();
      }
    };
    read_int("max_connections", cfg.max_connections);
    read_int("queue_high_water_mark", cfg.queue_high_water_mark);
    read_int("request_timeout_ms", cfg.request_timeout_ms);
    read_int("handshake_timeout_ms", cfg.handshake_timeout_ms);
    read_int("default_heartbeat_ms", cfg.default_heartbeat_ms);
    read_int("drain_grace_ms", cfg.drain_grace_ms);
    read_int("max_response_body_bytes", cfg.max_response_body_bytes);
    read_int("max_request_body_bytes", cfg.max_request_body_bytes);
    read_int("outbound_queue_capacity", cfg.outbound_queue_capacity);
    read_int("malformed_frame_threshold", cfg.malformed_frame_threshold);
    read_int("reconnect_initial_delay_ms", cfg.reconnect_initial_delay_ms);
    read_int("reconnect_max_delay_ms", cfg.reconnect_max_delay_ms);
    read_int("reconnect_jitter_ms", cfg.reconnect_jitter_ms);
    read_int("max_reconnect_attempts", cfg.max_reconnect_attempts);
    read_bool("rewrite_host", cfg.rewrite_host);
    read_bool("evaluate_filters_locally", cfg.evaluate_filters_locally);
    read_bool("health_check", cfg.health_check);
    read_int("event_bus_capacity", cfg.event_bus_capacity);
    return cfg;
  }
};

struct HookrelayConfig {
  std::string api_key;
  std::string project_id;
  std::string device_name;
  std::string api_base_url{"https://api.hookdeck.com/2025-01-01"};
  std::string ws_base_url{"wss://ws.hookdeck.com"};
  std::string dashboard_base_url{"https://dashboard.hookdeck.com"};
  std::string default_source;
  std::string verbose{"info"};
  bool insecure{false};
  // Local Unix-domain socket for both REST and control-channel traffic.
  std::string unix_socket;
  LoggingConfig log{};
  ListenSettings listen{};

  friend HookrelayConfig tag_invoke(const boost::json::value_to_tag<HookrelayConfig> &,
                                    const boost::json::value &jv) {
    HookrelayConfig cfg{};
    if (auto *obj = jv.if_object()) {
      auto read_string = [obj](const char *key, std::string &field) {
        if (auto *p = obj->if_contains(key); p && p->is_string()) {
          field = std::string(p->as_string().c_str());
        }
      };
      read_string("api_key", cfg.api_key);
      read_string("project_id", cfg.project_id);
      read_string("device_name", cfg.device_name);
      read_string("api_base_url", cfg.api_base_url);
      read_string("ws_base_url", cfg.ws_base_url);
      read_string("dashboard_base_url", cfg.dashboard_base_url);
      read_string("default_source", cfg.default_source);
      read_string("verbose", cfg.verbose);
      read_string("unix_socket", cfg.unix_socket);
      if (auto *p = obj->if_contains("insecure")) {
        cfg.insecure = p->as_bool();
      }
      if (auto *p = obj->if_contains("log")) {
        cfg.log = boost::json::value_to<LoggingConfig>(*p);
      }
      if (auto *p = obj->if_contains("listen")) {
        cfg.listen = boost::json::value_to<ListenSettings>(*p);
      }
      return cfg;
    }
    throw std::runtime_error("HookrelayConfig is not an object");
  }
};

using EnvLookup = std::function<std::optional<std::string>(const char *)>;

// Reads the process environment; empty values count as unset.
std::optional<std::string> process_env(const char *name);

// --config-dir, then $HOOKRELAY_CONFIG_DIR, then $XDG_CONFIG_HOME/hookrelay,
// then $HOME/.config/hookrelay.
fs::path resolve_config_dir(const std::optional<std::string> &cli_dir,
                            const EnvLookup &env);

// Loads <config_dir>/config.json, overlays profiles.<profile> and applies
// the HOOKRELAY_* environment overrides. A missing file yields defaults.
Result<HookrelayConfig> load_hookrelay_config(const fs::path &config_dir,
                                              const std::string &profile,
                                              const EnvLookup &env);

class IHookrelayConfigProvider {
 public:
  virtual ~IHookrelayConfigProvider() = default;
  virtual const HookrelayConfig &get() const = 0;
  virtual HookrelayConfig &get() = 0;
};

// Resolves the configuration for the current invocation: config file and
// profile, environment, then the global command-line overrides.
class HookrelayConfigProviderFile : public IHookrelayConfigProvider {
 public:
  HookrelayConfigProviderFile(CliCtx &cli_ctx, customio::IOutput &output);

  const HookrelayConfig &get() const override { return config_; }
  HookrelayConfig &get() override { return config_; }

 private:
  HookrelayConfig config_{};
};

} // namespace hookrelay
