#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include <cstddef>
#include <exception>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "util/my_logging.hpp"

namespace hookrelay {

// Owns an io_context and the threads that run it. stop() releases the
// work guard, stops the context and joins; it is idempotent.
class IoContextPool {
public:
  explicit IoContextPool(std::size_t threads = 2, std::string name = "hookrelay")
      : name_(std::move(name)), work_(boost::asio::make_work_guard(ioc_)) {
    if (threads == 0) {
      threads = 1;
    }
    threads_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
      threads_.emplace_back([this, i] { Run(i); });
    }
  }

  ~IoContextPool() { stop(); }

  IoContextPool(const IoContextPool &) = delete;
  IoContextPool &operator=(const IoContextPool &) = delete;

  boost::asio::io_context &ioc() { return ioc_; }

  void stop() {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    if (stopped_) {
      return;
    }
    stopped_ = true;
    work_.reset();
    ioc_.stop();
    for (auto &t : threads_) {
      if (t.joinable() && t.get_id() != std::this_thread::get_id()) {
        t.join();
      } else if (t.joinable()) {
        t.detach();
      }
    }
    BOOST_LOG_SEV(lg, trivial::debug) << name_ << " io_context stopped";
  }

private:
  void Run(std::size_t index) {
    for (;;) {
      try {
        ioc_.run();
        return;
      } catch (const std::exception &ex) {
        BOOST_LOG_SEV(lg, trivial::error)
            << name_ << "[" << index << "] handler threw: " << ex.what();
      }
    }
  }

  std::string name_;
  src::severity_logger<trivial::severity_level> lg;
  boost::asio::io_context ioc_;
  std::optional<boost::asio::executor_work_guard<
      boost::asio::io_context::executor_type>>
      work_;
  std::vector<std::thread> threads_;
  std::mutex stop_mutex_;
  bool stopped_{false};
};

} // namespace hookrelay
