#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "customio/output.hpp"
#include "handlers/i_handler.hpp"
#include "hookrelay_common.hpp"
#include "result.hpp"

namespace hookrelay {

// Lifetime: created through DI inside App::start and kept for the duration
// of the CLI session. Handlers are created per dispatch and released when
// the run completes.
class HandlerDispatcher {
  customio::IOutput &output_;
  hookrelay::CliCtx &cli_ctx_;
  IHandlerFactory &handler_factory_;

public:
  HandlerDispatcher(customio::IOutput &out, //
                    hookrelay::CliCtx &ctx, //
                    IHandlerFactory &handler_factory)
      : output_(out), cli_ctx_(ctx), handler_factory_(handler_factory) {}

  // Runs the handler registered for `subcmd`. Returns false when no handler
  // accepts the name; otherwise the handler's result goes to `cont`.
  bool dispatch_run(const std::string &subcmd,
                    const std::function<void(VoidResult &&)> &cont) {
    std::shared_ptr<IHandler> handler;
    try {
      handler = handler_factory_.create(subcmd);
    } catch (const std::exception &ex) {
      output_.debug() << "No handler for '" << subcmd << "': " << ex.what()
                      << std::endl;
      return false;
    }
    if (!handler) {
      return false;
    }
    cont(handler->start());
    return true;
  }
};

} // namespace hookrelay
