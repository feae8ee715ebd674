#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "agentflow/core/cancellation.hpp"

using namespace agentflow;
using namespace std::chrono_literals;

TEST(CancellationTokenTest, StartsUncancelled) {
  CancellationToken token;
  EXPECT_FALSE(token.cancelled());
}

TEST(CancellationTokenTest, CopiesShareState) {
  CancellationToken token;
  CancellationToken copy = token;

  copy.cancel();
  EXPECT_TRUE(token.cancelled());
}

TEST(CancellationTokenTest, WaitForTimesOut) {
  CancellationToken token;

  auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(token.wait_for(20ms));
  EXPECT_GE(std::chrono::steady_clock::now() - start, 20ms);
}

TEST(CancellationTokenTest, CancelWakesWaiter) {
  CancellationToken token;

  std::thread canceller([token]() mutable {
    std::this_thread::sleep_for(20ms);
    token.cancel();
  });

  auto start = std::chrono::steady_clock::now();
  EXPECT_TRUE(token.wait_for(10s));
  EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);

  canceller.join();
}

TEST(CancellationTokenTest, WaitAfterCancelReturnsImmediately) {
  CancellationToken token;
  token.cancel();
  EXPECT_TRUE(token.wait_for(10s));
}

TEST(CancellationTokenTest, CancelThroughConstReference) {
  CancellationToken token;
  const CancellationToken& view = token;

  view.cancel();
  EXPECT_TRUE(token.cancelled());
}
