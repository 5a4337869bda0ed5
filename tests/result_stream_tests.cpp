#include "gtest/gtest.h"
#include "upload/status_stream.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace arloader;

TEST(ResultStream, DeliversEveryInput) {
  ResultStream<int, int> stream({1, 2, 3, 4, 5, 6, 7}, [](const int &x) { return x * x; }, 3);
  EXPECT_EQ(stream.size(), 7u);
  std::vector<int> values;
  for (auto &outcome : stream.collect())
    values.push_back(outcome.get());
  std::sort(values.begin(), values.end());
  EXPECT_EQ(values, (std::vector<int>{1, 4, 9, 16, 25, 36, 49}));
  EXPECT_FALSE(stream.next());
}

TEST(ResultStream, BoundsConcurrency) {
  std::atomic<int> running{0};
  std::atomic<int> peak{0};
  std::vector<int> inputs(20);
  ResultStream<int, int> stream(
      inputs,
      [&](const int &) {
        int now = ++running;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        --running;
        return 0;
      },
      4);
  EXPECT_EQ(stream.collect().size(), 20u);
  EXPECT_LE(peak.load(), 4);
  EXPECT_GE(peak.load(), 1);
}

TEST(ResultStream, ErrorsAreItems) {
  ResultStream<int, int> stream(
      {1, 2, 3},
      [](const int &x) {
        if (x == 2)
          throw std::runtime_error("boom");
        return x;
      },
      2);
  auto outcomes = stream.collect();
  ASSERT_EQ(outcomes.size(), 3u);
  int failures = 0;
  for (auto &outcome : outcomes) {
    if (!outcome.ok()) {
      ++failures;
      EXPECT_EQ(outcome.errorMessage(), "boom");
      EXPECT_THROW(outcome.get(), std::runtime_error);
    }
  }
  EXPECT_EQ(failures, 1);
}

TEST(ResultStream, CompletionOrder) {
  ResultStream<int, int> stream(
      {50, 1},
      [](const int &ms) {
        std::this_thread::sleep_for(std::chrono::milliseconds(ms));
        return ms;
      },
      2);
  auto first = stream.next();
  ASSERT_TRUE(first);
  EXPECT_EQ(first->get(), 1);
  auto second = stream.next();
  ASSERT_TRUE(second);
  EXPECT_EQ(second->get(), 50);
}

TEST(ResultStream, LazyUntilFirstPull) {
  std::atomic<int> calls{0};
  {
    ResultStream<int, int> stream({1, 2, 3}, [&](const int &x) { ++calls; return x; }, 2);
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    EXPECT_EQ(calls.load(), 0);
  }
  EXPECT_EQ(calls.load(), 0);
}

TEST(ResultStream, EarlyDestructionStopsWork) {
  std::atomic<int> calls{0};
  std::vector<int> inputs(100);
  {
    ResultStream<int, int> stream(
        inputs,
        [&](const int &) {
          ++calls;
          std::this_thread::sleep_for(std::chrono::milliseconds(2));
          return 0;
        },
        2);
    ASSERT_TRUE(stream.next());
  }
  EXPECT_LT(calls.load(), 100);
}

TEST(ResultStream, EmptyInput) {
  ResultStream<int, int> stream({}, [](const int &x) { return x; }, 4);
  EXPECT_FALSE(stream.next());
}

TEST(ResultStream, NextAfterStopEnds) {
  std::atomic<int> calls{0};
  std::vector<int> inputs(100);
  ResultStream<int, int> stream(
      inputs,
      [&](const int &) {
        ++calls;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        return 0;
      },
      2);
  ASSERT_TRUE(stream.next());
  stream.stop();

  size_t remaining = 0;
  while (stream.next())
    ++remaining;
  EXPECT_LE(remaining, 2u);
  EXPECT_LT(calls.load(), 100);
  EXPECT_FALSE(stream.next());
}
