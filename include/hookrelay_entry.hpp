#pragma once

#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <unistd.h>

#include "boost/di.hpp"
#include "api_client.hpp"
#include "conf/hookrelay_config.hpp"
#include "customio/console_output.hpp"
#include "handlers/handler_dispatcher.hpp"
#include "handlers/i_handler.hpp"
#include "handlers/listen_handler.hpp"
#include "hookrelay_common.hpp"
#include "my_error_codes.hpp"
#include "util/my_logging.hpp"

#ifdef to
#error "macro to defined"
#endif

namespace di = boost::di;
namespace hookrelay {

class App : public std::enable_shared_from_this<App> {
  hookrelay::CliCtx &cli_ctx_;
  customio::ConsoleOutput *output_hub_{nullptr};
  src::severity_logger<trivial::severity_level> lg;

public:
  explicit App(hookrelay::CliCtx &cli_ctx) : cli_ctx_(cli_ctx) {}

  void print_error(const Error &err) {
    BOOST_LOG_SEV(lg, trivial::error) << err;
    if (err.code == my_errors::GENERAL::SHOW_OPT_DESC) {
      std::cerr << err.what << std::endl;
    } else {
      output_hub_->logger().error() << err.what << std::endl;
    }
  }

  // Runs the requested subcommand and returns the process exit status.
  int start() {
    static customio::ConsoleOutputWithColor output_hub(
        cli_ctx_.verbosity_level());
    output_hub.set_colors(::isatty(STDERR_FILENO) == 1);
    static customio::ConsoleOutput console_output(output_hub);

    auto handler_module = []() {
      return di::make_injector(
          di::bind<hookrelay::ListenHandler>().in(di::unique),
          di::bind<hookrelay::IHandlerFactory>().to(
              [](const auto &inj) -> hookrelay::IHandlerFactory & {
                static hookrelay::HandlerFactoryImpl factory(
                    [&inj](const std::string &subcmd)
                        -> std::shared_ptr<hookrelay::IHandler> {
                      if (subcmd == "listen") {
                        return inj.template create<
                            std::shared_ptr<hookrelay::ListenHandler>>();
                      } else {
                        throw std::runtime_error("Unsupported subcommand: " +
                                                 subcmd);
                      }
                    });
                return factory;
              }));
    };

    auto injector = di::make_injector(
        handler_module(),
        di::bind<hookrelay::IHookrelayConfigProvider>()
            .to<hookrelay::HookrelayConfigProviderFile>(),
        di::bind<hookrelay::IApiClient>().to<hookrelay::HttpApiClient>(),
        di::bind<customio::IOutput>().to(output_hub),
        di::bind<customio::ConsoleOutput>().to(console_output),
        di::bind<hookrelay::CliCtx>().to(cli_ctx_));

    output_hub_ = &injector.template create<customio::ConsoleOutput &>();

    auto &dispatcher =
        injector.template create<hookrelay::HandlerDispatcher &>();

    int exit_code = EXIT_SUCCESS;
    bool dispatched = dispatcher.dispatch_run(
        cli_ctx_.params.subcmd, [this, &exit_code](VoidResult &&r) {
          if (r.is_err()) {
            print_error(r.error());
            exit_code = my_errors::exit_code_for(r.error().code);
          } else {
            output_hub_->logger().debug()
                << "Handler completed successfully." << std::endl;
          }
        });

    if (!dispatched) {
      if (cli_ctx_.params.subcmd.empty()) {
        output_hub_->logger().error()
            << "No subcommand provided. Available: listen" << std::endl;
      } else {
        output_hub_->logger().error()
            << "Unknown subcommand '" << cli_ctx_.params.subcmd
            << "'. Available: listen" << std::endl;
      }
      return 2;
    }
    return exit_code;
  }
};

inline int launch(hookrelay::CliCtx &ctx) {
  auto app = std::make_shared<hookrelay::App>(ctx);
  return app->start();
}

} // namespace hookrelay
