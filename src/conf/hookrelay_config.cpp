#include "conf/hookrelay_config.hpp"

#include <boost/asio/ip/host_name.hpp>

#include <cstdlib>
#include <fmt/format.h>
#include <fstream>
#include <iterator>

#include "hookrelay_common.hpp"
#include "my_error_codes.hpp"

namespace json = boost::json;

namespace hookrelay {

namespace {

Error config_error(std::string what) {
  return make_error(my_errors::GENERAL::INVALID_ARGUMENT, std::move(what));
}

// Nested sections merge key by key; everything else is replaced.
void overlay(json::object &base, const json::object &top) {
  for (const auto &[key, value] : top) {
    if (key == "listen" || key == "log") {
      auto *current = base.if_contains(key);
      if (current && current->is_object() && value.is_object()) {
        for (const auto &[inner_key, inner_value] : value.as_object()) {
          current->as_object()[inner_key] = inner_value;
        }
        continue;
      }
    }
    base[key] = value;
  }
}

std::string local_host_name() {
  boost::system::error_code ec;
  std::string name = boost::asio::ip::host_name(ec);
  if (ec || name.empty()) {
    return "hookrelay-cli";
  }
  return name;
}

} // namespace

std::optional<std::string> process_env(const char *name) {
  if (const char *value = std::getenv(name); value && *value) {
    return std::string(value);
  }
  return std::nullopt;
}

fs::path resolve_config_dir(const std::optional<std::string> &cli_dir,
                            const EnvLookup &env) {
  if (cli_dir && !cli_dir->empty()) {
    return fs::path(*cli_dir);
  }
  if (auto dir = env("HOOKRELAY_CONFIG_DIR")) {
    return fs::path(*dir);
  }
  if (auto xdg = env("XDG_CONFIG_HOME")) {
    return fs::path(*xdg) / "hookrelay";
  }
  if (auto home = env("HOME")) {
    return fs::path(*home) / ".config" / "hookrelay";
  }
  return fs::path(".hookrelay");
}

Result<HookrelayConfig> load_hookrelay_config(const fs::path &config_dir,
                                              const std::string &profile,
                                              const EnvLookup &env) {
  json::object merged;
  const fs::path file = config_dir / "config.json";
  std::error_code fs_ec;
  if (fs::exists(file, fs_ec)) {
    std::ifstream ifs(file);
    if (!ifs) {
      return Result<HookrelayConfig>::Err(
          make_error(my_errors::GENERAL::FILE_READ_WRITE,
                     fmt::format("unable to read {}", file.string())));
    }
    std::string content((std::istreambuf_iterator<char>(ifs)),
                        std::istreambuf_iterator<char>());
    boost::system::error_code ec;
    json::value root = json::parse(content, ec);
    if (ec) {
      return Result<HookrelayConfig>::Err(config_error(
          fmt::format("{} is not valid JSON: {}", file.string(), ec.message())));
    }
    if (!root.is_object()) {
      return Result<HookrelayConfig>::Err(config_error(
          fmt::format("{} must contain a JSON object", file.string())));
    }
    for (const auto &[key, value] : root.as_object()) {
      if (key != "profiles") {
        merged[key] = value;
      }
    }
    const json::value *profile_value = nullptr;
    if (auto *profiles = root.as_object().if_contains("profiles");
        profiles && profiles->is_object()) {
      profile_value = profiles->as_object().if_contains(profile);
    }
    if (profile_value) {
      if (!profile_value->is_object()) {
        return Result<HookrelayConfig>::Err(config_error(
            fmt::format("profile '{}' must be a JSON object", profile)));
      }
      overlay(merged, profile_value->as_object());
    } else if (profile != "default") {
      return Result<HookrelayConfig>::Err(config_error(
          fmt::format("profile '{}' not found in {}", profile, file.string())));
    }
  } else if (profile != "default") {
    return Result<HookrelayConfig>::Err(config_error(fmt::format(
        "profile '{}' requested but {} does not exist", profile, file.string())));
  }

  HookrelayConfig config;
  try {
    config = json::value_to<HookrelayConfig>(json::value(std::move(merged)));
  } catch (const std::exception &ex) {
    return Result<HookrelayConfig>::Err(
        config_error(fmt::format("invalid configuration: {}", ex.what())));
  }

  if (auto v = env("HOOKRELAY_API_KEY")) {
    config.api_key = *v;
  }
  if (auto v = env("HOOKRELAY_PROJECT_ID")) {
    config.project_id = *v;
  }
  if (auto v = env("HOOKRELAY_API_BASE_URL")) {
    config.api_base_url = *v;
  }
  if (auto v = env("HOOKRELAY_WS_BASE_URL")) {
    config.ws_base_url = *v;
  }
  if (auto v = env("HOOKRELAY_DEVICE_NAME")) {
    config.device_name = *v;
  }
  if (auto v = env("HOOKRELAY_UNIX_SOCKET")) {
    config.unix_socket = *v;
  }
  if (config.device_name.empty()) {
    config.device_name = local_host_name();
  }
  return Result<HookrelayConfig>::Ok(std::move(config));
}

HookrelayConfigProviderFile::HookrelayConfigProviderFile(
    CliCtx &cli_ctx, customio::IOutput &output) {
  const fs::path dir = resolve_config_dir(cli_ctx.params.config_dir, process_env);
  auto config_r = load_hookrelay_config(dir, cli_ctx.params.profile, process_env);
  if (config_r.is_err()) {
    throw std::runtime_error(config_r.error().what);
  }
  config_ = std::move(config_r.value());
  output.debug() << "Configuration directory: " << dir.string() << std::endl;

  const auto &params = cli_ctx.params;
  if (params.api_key_override && !params.api_key_override->empty()) {
    config_.api_key = *params.api_key_override;
  }
  if (params.project_id_override && !params.project_id_override->empty()) {
    config_.project_id = *params.project_id_override;
  }
  if (params.api_base_override && !params.api_base_override->empty()) {
    config_.api_base_url = *params.api_base_override;
    output.info() << "Using runtime API base override: "
                  << config_.api_base_url << std::endl;
  }
  if (cli_ctx.is_specified_by_user("verbose")) {
    config_.verbose = params.verbose;
  }
}

} // namespace hookrelay
