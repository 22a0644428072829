#pragma once

#include <boost/program_options.hpp>

#include <memory>
#include <string>
#include <vector>

#include "api_client.hpp"
#include "conf/hookrelay_config.hpp"
#include "customio/console_output.hpp"
#include "handlers/i_handler.hpp"
#include "hookrelay_common.hpp"
#include "listen/listen_supervisor.hpp"
#include "result.hpp"
#include "util/my_logging.hpp" // IWYU pragma: keep

namespace po = boost::program_options;

namespace hookrelay {

// Option table of `listen`, shared by the parser and the usage text.
po::options_description listen_options_description();

std::string listen_usage();

// Parses the tokens following `listen`. Validation failures come back as
// GENERAL::INVALID_ARGUMENT; `--help` as GENERAL::SHOW_OPT_DESC carrying
// the usage text.
Result<ListenOptions> parse_listen_options(const std::vector<std::string> &args);

class ListenHandler : public hookrelay::IHandler {
  IHookrelayConfigProvider &config_provider_;
  IApiClient &api_client_;
  customio::ConsoleOutput &output_hub_;
  CliCtx &cli_ctx_;
  src::severity_logger<trivial::severity_level> lg;

public:
  ListenHandler(IHookrelayConfigProvider &config_provider,
                IApiClient &api_client, CliCtx &cli_ctx,
                customio::ConsoleOutput &output_hub)
      : config_provider_(config_provider), api_client_(api_client),
        output_hub_(output_hub), cli_ctx_(cli_ctx) {}

  // IHandler
  std::string command() const override { return "listen"; }

  VoidResult start() override;
};

} // namespace hookrelay
