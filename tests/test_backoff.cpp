#include <gtest/gtest.h>

#include <random>

#include "util/backoff.hpp"

namespace hookrelay {
using std::chrono::milliseconds;

TEST(BackoffTest, DoublesUntilCapWithoutJitter) {
  JitteredExponentialBackoff backoff({milliseconds(500), milliseconds(4000),
                                      milliseconds(0)});
  std::mt19937 rng(1);
  EXPECT_EQ(backoff.NextDelay(rng), milliseconds(500));
  EXPECT_EQ(backoff.NextDelay(rng), milliseconds(1000));
  EXPECT_EQ(backoff.NextDelay(rng), milliseconds(2000));
  EXPECT_EQ(backoff.NextDelay(rng), milliseconds(4000));
  EXPECT_EQ(backoff.NextDelay(rng), milliseconds(4000));
  EXPECT_EQ(backoff.attempt(), 5);
}

TEST(BackoffTest, JitteredSequenceIsMonotoneAndBounded) {
  for (unsigned seed = 0; seed < 50; ++seed) {
    JitteredExponentialBackoff backoff({milliseconds(500), milliseconds(30000),
                                        milliseconds(250)});
    std::mt19937 rng(seed);
    milliseconds previous{0};
    for (int i = 0; i < 20; ++i) {
      auto delay = backoff.NextDelay(rng);
      EXPECT_GE(delay, previous) << "seed " << seed << " attempt " << i;
      EXPECT_LE(delay, milliseconds(30000));
      previous = delay;
    }
  }
}

TEST(BackoffTest, JitterLargerThanBaseIsCapped) {
  JitteredExponentialBackoff backoff({milliseconds(100), milliseconds(10000),
                                      milliseconds(5000)});
  std::mt19937 rng(7);
  for (int i = 0; i < 100; ++i) {
    backoff.Reset();
    auto first = backoff.NextDelay(rng);
    EXPECT_GE(first, milliseconds(100));
    EXPECT_LE(first, milliseconds(200));
  }
}

TEST(BackoffTest, ResetStartsOver) {
  JitteredExponentialBackoff backoff({milliseconds(10), milliseconds(1000),
                                      milliseconds(0)});
  std::mt19937 rng(3);
  backoff.NextDelay(rng);
  backoff.NextDelay(rng);
  backoff.Reset();
  EXPECT_EQ(backoff.attempt(), 0);
  EXPECT_EQ(backoff.NextDelay(rng), milliseconds(10));
}

} // namespace hookrelay
