#include "handlers/listen_handler.hpp"

#include <fmt/format.h>

#include <iostream>
#include <sstream>

#include "listen/forward_target.hpp"
#include "listen/listen_renderer.hpp"
#include "listen/session_filter.hpp"
#include "my_error_codes.hpp"

namespace hookrelay {

namespace {

constexpr std::size_t kMaxPositionals = 3;

Result<ListenOptions> invalid(std::string msg) {
  return Result<ListenOptions>::Err(
      make_error(my_errors::GENERAL::INVALID_ARGUMENT, std::move(msg)));
}

} // namespace

po::options_description listen_options_description() {
  po::options_description desc("listen options");
  desc.add_options()                                                     //
      ("path", po::value<std::string>()->value_name("PATH"),
       "path prefix prepended to every forwarded request.")              //
      ("cli-path", po::value<std::string>()->value_name("PATH"),
       "alias of --path.")                                               //
      ("max-connections", po::value<int>()->value_name("N"),
       "maximum concurrent requests to the local target.")               //
      ("output",
       po::value<std::string>()->default_value("interactive")->value_name(
           "MODE"),
       "interactive, compact or quiet.")                                 //
      ("filter-body", po::value<std::string>()->value_name("JSON"),
       "only forward events whose body matches.")                        //
      ("filter-headers", po::value<std::string>()->value_name("JSON"),
       "only forward events whose headers match.")                       //
      ("filter-query", po::value<std::string>()->value_name("JSON"),
       "only forward events whose query matches.")                       //
      ("filter-path", po::value<std::string>()->value_name("JSON"),
       "only forward events whose path matches.")                        //
      ("no-wss", po::bool_switch()->default_value(false),
       "use an unencrypted control channel.")                            //
      ("timeout", po::value<int>()->value_name("SECONDS"),
       "per-request timeout toward the local target.")                   //
      ("insecure", po::bool_switch()->default_value(false),
       "skip TLS verification toward the local target.")                 //
      ("help,h", "print listen usage.");
  return desc;
}

std::string listen_usage() {
  std::ostringstream oss;
  oss << "Usage:\n"
      << "  hookrelay listen <port|url> [<source>] [<connection>] [options]\n"
      << "\n"
      << "Examples:\n"
      << "  hookrelay listen 3000 shopify\n"
      << "  hookrelay listen https://localhost:8443/hooks stripe --path /api\n"
      << "\n"
      << listen_options_description();
  return oss.str();
}

Result<ListenOptions> parse_listen_options(const std::vector<std::string> &args) {
  po::options_description visible = listen_options_description();
  po::options_description hidden("hidden");
  hidden.add_options()("listen-args", po::value<std::vector<std::string>>());
  po::options_description all;
  all.add(visible).add(hidden);
  po::positional_options_description positional;
  positional.add("listen-args", -1);

  po::variables_map vm;
  try {
    po::store(po::command_line_parser(args)
                  .options(all)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error &ex) {
    return invalid(ex.what());
  }

  if (vm.count("help")) {
    return Result<ListenOptions>::Err(
        make_error(my_errors::GENERAL::SHOW_OPT_DESC, listen_usage()));
  }

  std::vector<std::string> positionals;
  if (vm.count("listen-args")) {
    positionals = vm["listen-args"].as<std::vector<std::string>>();
  }
  if (positionals.empty()) {
    return invalid("listen requires a port or URL to forward to");
  }
  if (positionals.size() > kMaxPositionals) {
    return invalid(fmt::format(
        "listen accepts at most {} arguments (<port|url> [<source>] "
        "[<connection>]), got {}",
        kMaxPositionals, positionals.size()));
  }

  ListenOptions options;
  options.target_arg = positionals[0];
  if (positionals.size() > 1) {
    options.source_name = positionals[1];
  }
  if (positionals.size() > 2) {
    options.connection = positionals[2];
  }

  if (vm.count("path") && vm.count("cli-path") &&
      vm["path"].as<std::string>() != vm["cli-path"].as<std::string>()) {
    return invalid("--path and --cli-path disagree");
  }
  for (const char *key : {"path", "cli-path"}) {
    if (vm.count(key)) {
      options.cli_path = vm[key].as<std::string>();
    }
  }
  if (options.cli_path && !is_valid_cli_path(*options.cli_path)) {
    return invalid(fmt::format(
        "invalid --path '{}': it must start with '/' and contain only URL "
        "path characters",
        *options.cli_path));
  }

  // Surface a malformed target now rather than after bootstrap.
  auto target_r =
      parse_forward_target(options.target_arg, options.cli_path.value_or(""));
  if (target_r.is_err()) {
    return Result<ListenOptions>::Err(std::move(target_r.error()));
  }

  const std::string output_text = vm["output"].as<std::string>();
  auto mode = parse_output_mode(output_text);
  if (!mode) {
    return invalid(fmt::format(
        "invalid --output '{}': expected interactive, compact or quiet",
        output_text));
  }
  options.output = *mode;

  if (vm.count("max-connections")) {
    int n = vm["max-connections"].as<int>();
    if (n < 1) {
      return invalid(
          fmt::format("--max-connections must be at least 1, got {}", n));
    }
    options.max_connections = n;
  }

  if (vm.count("timeout")) {
    int seconds = vm["timeout"].as<int>();
    if (seconds < 1) {
      return invalid(
          fmt::format("--timeout must be at least 1 second, got {}", seconds));
    }
    options.request_timeout = std::chrono::seconds(seconds);
  }

  try {
    if (vm.count("filter-body")) {
      options.filters.body = parse_filter_argument(
          vm["filter-body"].as<std::string>(), "--filter-body");
    }
    if (vm.count("filter-headers")) {
      options.filters.headers = parse_filter_argument(
          vm["filter-headers"].as<std::string>(), "--filter-headers");
    }
    if (vm.count("filter-query")) {
      options.filters.query = parse_filter_argument(
          vm["filter-query"].as<std::string>(), "--filter-query");
    }
    if (vm.count("filter-path")) {
      options.filters.path = parse_filter_argument(
          vm["filter-path"].as<std::string>(), "--filter-path");
    }
  } catch (const std::runtime_error &ex) {
    return invalid(ex.what());
  }

  options.no_wss = vm["no-wss"].as<bool>();
  options.insecure = vm["insecure"].as<bool>();
  return Result<ListenOptions>::Ok(std::move(options));
}

VoidResult ListenHandler::start() {
  auto options_r = parse_listen_options(cli_ctx_.subcommand_args());
  if (options_r.is_err()) {
    if (options_r.error().code == my_errors::GENERAL::SHOW_OPT_DESC) {
      std::cout << options_r.error().what << std::endl;
      return VoidResult::Ok();
    }
    return VoidResult::Err(std::move(options_r.error()));
  }

  const HookrelayConfig &config = config_provider_.get();
  if (config.api_key.empty() && config.unix_socket.empty()) {
    return VoidResult::Err(make_error(
        my_errors::GENERAL::INVALID_ARGUMENT,
        "no API key configured; pass --api-key, set HOOKRELAY_API_KEY or add "
        "api_key to config.json"));
  }

  ListenOptions options = std::move(options_r.value());
  BOOST_LOG_SEV(lg, trivial::debug)
      << "listen target=" << options.target_arg
      << " source=" << options.source_name
      << " output=" << to_string(options.output);
  output_hub_.logger().trace()
      << "listen options parsed, output mode " << to_string(options.output)
      << std::endl;

  ListenSupervisor supervisor(config, std::move(options), api_client_,
                              output_hub_);
  return supervisor.Run();
}

} // namespace hookrelay
