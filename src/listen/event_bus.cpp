#include "listen/event_bus.hpp"

#include <algorithm>

namespace hookrelay {

bool EventBus::Subscription::Push(const ListenEvent &ev) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return false;
    }
    if (queue_.size() >= capacity_) {
      ++dropped_;
      return false;
    }
    queue_.push_back(ev);
  }
  cv_.notify_one();
  return true;
}

std::optional<ListenEvent> EventBus::Subscription::TryPop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (queue_.empty()) {
    return std::nullopt;
  }
  ListenEvent ev = std::move(queue_.front());
  queue_.pop_front();
  return ev;
}

std::optional<ListenEvent>
EventBus::Subscription::WaitPop(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
  if (queue_.empty()) {
    return std::nullopt;
  }
  ListenEvent ev = std::move(queue_.front());
  queue_.pop_front();
  return ev;
}

void EventBus::Subscription::Close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool EventBus::Subscription::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

std::uint64_t EventBus::Subscription::dropped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_;
}

std::shared_ptr<EventBus::Subscription>
EventBus::Subscribe(std::size_t capacity) {
  auto sub = std::make_shared<Subscription>(
      capacity == 0 ? default_capacity_ : capacity);
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    sub->Close();
    return sub;
  }
  subscribers_.push_back(sub);
  return sub;
}

void EventBus::Publish(const ListenEvent &ev) {
  std::vector<std::shared_ptr<Subscription>> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return;
    }
    subscribers_.erase(
        std::remove_if(subscribers_.begin(), subscribers_.end(),
                       [](const auto &w) { return w.expired(); }),
        subscribers_.end());
    targets.reserve(subscribers_.size());
    for (const auto &w : subscribers_) {
      if (auto sub = w.lock()) {
        targets.push_back(std::move(sub));
      }
    }
  }
  for (const auto &sub : targets) {
    sub->Push(ev);
  }
}

void EventBus::Close() {
  std::vector<std::shared_ptr<Subscription>> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return;
    }
    closed_ = true;
    for (const auto &w : subscribers_) {
      if (auto sub = w.lock()) {
        targets.push_back(std::move(sub));
      }
    }
    subscribers_.clear();
  }
  for (const auto &sub : targets) {
    sub->Close();
  }
}

std::size_t EventBus::subscriber_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t n = 0;
  for (const auto &w : subscribers_) {
    if (!w.expired()) {
      ++n;
    }
  }
  return n;
}

} // namespace hookrelay
