#pragma once

#include <cstddef>
#include <iostream>
#include <mutex>
#include <ostream>
#include <streambuf>

namespace customio {

// Leveled user-facing output. Level 0 is silent, 5 prints everything.
class IOutput {
public:
  virtual ~IOutput() = default;

  virtual std::ostream &trace() = 0;
  virtual std::ostream &debug() = 0;
  virtual std::ostream &info() = 0;
  virtual std::ostream &warning() = 0;
  virtual std::ostream &error() = 0;

  virtual std::size_t verbosity() const = 0;
};

namespace detail {

class NullBuffer : public std::streambuf {
protected:
  int overflow(int c) override { return traits_type::not_eof(c); }
  std::streamsize xsputn(const char *, std::streamsize n) override {
    return n;
  }
};

} // namespace detail

class ConsoleOutputWithColor : public IOutput {
public:
  explicit ConsoleOutputWithColor(std::size_t verbosity,
                                  std::ostream &os = std::cerr)
      : verbosity_(verbosity), os_(os), null_stream_(&null_buffer_) {}

  std::ostream &trace() override { return level(5, "\033[2m", "TRACE"); }
  std::ostream &debug() override { return level(4, "\033[36m", "DEBUG"); }
  std::ostream &info() override { return level(3, "", ""); }
  std::ostream &warning() override {
    return level(2, "\033[33m", "WARNING");
  }
  std::ostream &error() override { return level(1, "\033[31m", "ERROR"); }

  std::size_t verbosity() const override { return verbosity_; }

  void set_colors(bool enabled) { colors_ = enabled; }

private:
  std::ostream &level(std::size_t min_level, const char *color,
                      const char *label) {
    if (verbosity_ < min_level) {
      return null_stream_;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (label[0] != '\0') {
      if (colors_ && color[0] != '\0') {
        os_ << color << label << "\033[0m" << ": ";
      } else {
        os_ << label << ": ";
      }
    }
    return os_;
  }

  std::size_t verbosity_;
  std::ostream &os_;
  detail::NullBuffer null_buffer_;
  std::ostream null_stream_;
  std::mutex mutex_;
  bool colors_{false};
};

} // namespace customio
