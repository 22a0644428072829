#pragma once

#include <algorithm>
#include <boost/program_options.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace po = boost::program_options;

namespace hookrelay {

struct CliParams {
  std::optional<std::string> config_dir;
  std::string profile{"default"};
  std::string subcmd;
  std::string verbose; // trace|debug|info|warning|error or vvvv
  bool silent = false;
  std::optional<std::string> api_key_override;
  std::optional<std::string> project_id_override;
  std::optional<std::string> api_base_override;
};

struct CliCtx {
  po::variables_map vm;
  std::vector<std::string> positionals;
  std::vector<std::string> unrecognized;
  hookrelay::CliParams params;
  CliCtx(po::variables_map &&vm,                  //
         std::vector<std::string> &&positionals,  //
         std::vector<std::string> &&unrecognized, //
         hookrelay::CliParams &&params_)
      : vm(std::move(vm)), positionals(std::move(positionals)),
        unrecognized(std::move(unrecognized)), params(std::move(params_)) {}

  // True when the option was given explicitly rather than defaulted.
  bool is_specified_by_user(const std::string &opt_name) const {
    auto it = vm.find(opt_name);
    if (it == vm.end()) {
      return false;
    }
    return !it->second.defaulted();
  }

  size_t positional_count() const { return positionals.size(); }

  // Tokens that belong to the subcommand: everything the global parser did
  // not consume, minus the subcommand name itself.
  std::vector<std::string> subcommand_args() const {
    std::vector<std::string> args;
    bool skipped = false;
    for (const auto &token : unrecognized) {
      if (!skipped && token == params.subcmd) {
        skipped = true;
        continue;
      }
      args.push_back(token);
    }
    return args;
  }

  size_t verbosity_level() const {
    if (params.silent) {
      return 0;
    }
    if (params.verbose.empty()) {
      return 3;
    }
    if (params.verbose == "trace") {
      return 5;
    } else if (params.verbose == "debug") {
      return 4;
    } else if (params.verbose == "info") {
      return 3;
    } else if (params.verbose == "warning") {
      return 2;
    } else if (params.verbose == "error") {
      return 1;
    }
    return std::min<size_t>(
        5, std::count(params.verbose.begin(), params.verbose.end(), 'v'));
  }
};

} // namespace hookrelay
