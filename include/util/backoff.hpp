#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <random>

namespace hookrelay {

struct ExponentialBackoffOptions {
  std::chrono::milliseconds initial_delay{500};
  std::chrono::milliseconds max_delay{30000};
  std::chrono::milliseconds jitter{250};
};

// delay(n) = min(max_delay, initial_delay * 2^n + U[0, jitter']) where
// jitter' = min(jitter, initial_delay). The sequence never decreases.
class JitteredExponentialBackoff {
public:
  explicit JitteredExponentialBackoff(ExponentialBackoffOptions options = {})
      : options_(options) {}

  void Reset() { attempt_ = 0; }
  int attempt() const { return attempt_; }

  template <typename Rng> std::chrono::milliseconds NextDelay(Rng &rng) {
    const auto base = std::max<std::int64_t>(1, options_.initial_delay.count());
    const auto cap = std::max<std::int64_t>(base, options_.max_delay.count());
    std::int64_t delay = base;
    for (int i = 0; i < attempt_ && delay < cap; ++i) {
      delay *= 2;
    }
    const auto jitter_cap =
        std::clamp<std::int64_t>(options_.jitter.count(), 0, base);
    if (jitter_cap > 0) {
      std::uniform_int_distribution<std::int64_t> dist(0, jitter_cap);
      delay += dist(rng);
    }
    ++attempt_;
    return std::chrono::milliseconds(std::min(delay, cap));
  }

private:
  ExponentialBackoffOptions options_;
  int attempt_{0};
};

} // namespace hookrelay
