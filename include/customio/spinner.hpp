#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstddef>
#include <iostream>
#include <memory>
#include <string>

namespace customio {

// Single-line status spinner. Not thread safe: the owner drives the
// executor from the same thread that writes to the stream.
class Spinner : public std::enable_shared_from_this<Spinner> {
 public:
  Spinner(boost::asio::any_io_executor ex, std::ostream& os,
          std::chrono::milliseconds interval = std::chrono::milliseconds(120))
      : os_(os), interval_(interval), timer_(ex) {}

  void start(std::string text) {
    text_ = std::move(text);
    if (running_) {
      render();
      return;
    }
    running_ = true;
    render();
    schedule();
  }

  // Clears the spinner line; callers print their own line afterwards.
  void stop() {
    if (!running_) return;
    running_ = false;
    timer_.cancel();
    clear_line();
    os_.flush();
  }

  bool running() const { return running_; }

 private:
  void schedule() {
    timer_.expires_after(interval_);
    timer_.async_wait(
        [weak = weak_from_this()](const boost::system::error_code& ec) {
          auto self = weak.lock();
          if (ec || !self || !self->running_) return;
          self->frame_idx_ = (self->frame_idx_ + 1) % 4;
          self->render();
          self->schedule();
        });
  }

  void render() {
    static constexpr const char* frames = "|/-\\";
    std::string line = std::string(1, frames[frame_idx_]) + ' ' + text_;
    os_ << '\r' << line;
    if (line.size() < last_len_) {
      os_ << std::string(last_len_ - line.size(), ' ') << '\r' << line;
    }
    os_.flush();
    last_len_ = line.size();
  }

  void clear_line() {
    if (last_len_ > 0) {
      os_ << '\r' << std::string(last_len_, ' ') << '\r';
      last_len_ = 0;
    }
  }

  std::ostream& os_;
  std::chrono::milliseconds interval_;
  boost::asio::steady_timer timer_;
  std::string text_;
  bool running_{false};
  std::size_t frame_idx_{0};
  std::size_t last_len_{0};
};

} // namespace customio
