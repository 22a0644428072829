#pragma once

#include <iostream>
#include <ostream>

#include "customio/color_printer.hpp"
#include "customio/output.hpp"

namespace customio {

// Bundles the leveled diagnostics stream with the colour printer used for
// the per-event lines of `listen`. Event lines go to stdout unless a
// different sink is given.
class ConsoleOutput {

  customio::IOutput &logger_;
  ColorPrinter printer_;

public:
  ConsoleOutput(customio::IOutput &logger)
      : logger_(logger), printer_(std::cout) {}

  ConsoleOutput(customio::IOutput &logger, std::ostream &events,
                bool colors = false)
      : logger_(logger), printer_(events, colors) {}

  customio::IOutput &logger() { return logger_; }
  ColorPrinter &printer() { return printer_; }
  std::ostream &events() { return printer_.stream(); }
  bool interactive() const { return printer_.enabled(); }
};

} // namespace customio
