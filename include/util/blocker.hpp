#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace misc {

// One-shot latch: wait() returns once stop() has been called.
class Blocker {
public:
  void stop() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stopped_ = true;
    }
    cv_.notify_all();
  }

  void wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return stopped_; });
  }

  bool wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return stopped_; });
  }

  bool stopped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stopped_;
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool stopped_{false};
};

} // namespace misc
