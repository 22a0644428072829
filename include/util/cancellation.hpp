#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace hookrelay {

// Shared cancellation flag. Copies observe the same state. Callbacks run
// once, on the thread that calls Cancel(), or immediately when registered
// after cancellation.
class CancellationToken {
public:
  CancellationToken() : state_(std::make_shared<State>()) {}

  void Cancel() {
    std::vector<std::function<void()>> callbacks;
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      if (state_->cancelled) {
        return;
      }
      state_->cancelled = true;
      callbacks.swap(state_->callbacks);
    }
    for (auto &cb : callbacks) {
      cb();
    }
  }

  bool IsCancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
  }

  void OnCancel(std::function<void()> callback) {
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      if (!state_->cancelled) {
        state_->callbacks.push_back(std::move(callback));
        return;
      }
    }
    callback();
  }

private:
  struct State {
    mutable std::mutex mutex;
    bool cancelled{false};
    std::vector<std::function<void()>> callbacks;
  };
  std::shared_ptr<State> state_;
};

} // namespace hookrelay
