#pragma once

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <unistd.h>

// ANSI colour printer. Colours are enabled only when the stream is a TTY
// and TERM is not "dumb", unless forced through the constructor.
//
//   customio::ColorPrinter cp(std::cout);
//   cp.green() << "200" << ' ' << path << std::endl; // reset emitted at end
namespace customio {

class ColorPrinter {
 public:
  class ColorProxy {
   public:
    ColorProxy(std::ostream& os, const char* code, bool enabled)
        : os_(os), enabled_(enabled) {
      if (enabled_) os_ << code;
    }
    ~ColorProxy() {
      if (enabled_) os_ << "\033[0m";
    }
    template <typename T>
    ColorProxy& operator<<(const T& v) {
      os_ << v;
      return *this;
    }
    using Manip = std::ostream& (*)(std::ostream&);
    ColorProxy& operator<<(Manip m) {
      m(os_);
      return *this;
    }

   private:
    std::ostream& os_;
    bool enabled_;
  };

  ColorPrinter()
      : stream_(&std::cout), enable_colors_(detect_tty_for_stream(*stream_)) {}

  explicit ColorPrinter(std::ostream& os)
      : stream_(&os), enable_colors_(detect_tty_for_stream(os)) {}

  ColorPrinter(std::ostream& os, bool enable_colors)
      : stream_(&os), enable_colors_(enable_colors) {}

  void set_enabled(bool enabled) { enable_colors_ = enabled; }
  bool enabled() const { return enable_colors_; }

  std::ostream& stream() const { return *stream_; }

  ColorProxy plain() { return ColorProxy(stream(), "", false); }
  ColorProxy bold() { return ColorProxy(stream(), "\033[1m", enable_colors_); }
  ColorProxy dim() { return ColorProxy(stream(), "\033[2m", enable_colors_); }
  ColorProxy red() { return ColorProxy(stream(), "\033[31m", enable_colors_); }
  ColorProxy green() {
    return ColorProxy(stream(), "\033[32m", enable_colors_);
  }
  ColorProxy yellow() {
    return ColorProxy(stream(), "\033[33m", enable_colors_);
  }
  ColorProxy cyan() {
    return ColorProxy(stream(), "\033[36m", enable_colors_);
  }

  // Status colour: 2xx green, 3xx cyan, 4xx yellow, everything else red.
  ColorProxy for_status(int status) {
    if (status >= 200 && status < 300) return green();
    if (status >= 300 && status < 400) return cyan();
    if (status >= 400 && status < 500) return yellow();
    return red();
  }

 private:
  std::ostream* stream_;
  bool enable_colors_;

  static bool detect_tty_for_stream(std::ostream& os) {
    bool is_tty = false;
    if (&os == &std::cout) {
      is_tty = ::isatty(fileno(stdout));
    } else if (&os == &std::cerr) {
      is_tty = ::isatty(fileno(stderr));
    }
    const char* term = std::getenv("TERM");
    bool term_ok = term && std::strcmp(term, "dumb") != 0;
    return is_tty && term_ok;
  }
};

} // namespace customio
