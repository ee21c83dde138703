/**
 * @file single_flight_test.cpp
 * @brief Unit tests for duplicate call suppression
 */

#include "canal/single_flight.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace binlogsync::canal;

TEST(SingleFlightTest, SingleCallerRunsFunction) {
  SingleFlight<std::string, int> flight;
  bool shared = true;
  int result = flight.Do("users", []() { return 7; }, &shared);
  EXPECT_EQ(result, 7);
  EXPECT_FALSE(shared);
  EXPECT_EQ(flight.InFlight(), 0u);
}

TEST(SingleFlightTest, ConcurrentCallersShareOneExecution) {
  SingleFlight<std::string, int> flight;
  std::atomic<int> executions{0};
  std::promise<void> release;
  std::shared_future<void> gate = release.get_future().share();

  auto slow = [&]() {
    ++executions;
    gate.wait();
    return 42;
  };

  constexpr int kCallers = 8;
  std::vector<std::future<int>> results;
  std::atomic<int> shared_count{0};
  for (int i = 0; i < kCallers; ++i) {
    results.push_back(std::async(std::launch::async, [&]() {
      bool shared = false;
      int value = flight.Do("users", slow, &shared);
      if (shared) {
        ++shared_count;
      }
      return value;
    }));
  }

  // Give every caller time to reach the pending call
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  EXPECT_EQ(flight.InFlight(), 1u);
  release.set_value();

  for (auto& result : results) {
    EXPECT_EQ(result.get(), 42);
  }
  EXPECT_EQ(executions.load(), 1);
  EXPECT_EQ(shared_count.load(), kCallers - 1);
  EXPECT_EQ(flight.InFlight(), 0u);
}

TEST(SingleFlightTest, DifferentKeysRunIndependently) {
  SingleFlight<std::string, std::string> flight;
  std::atomic<int> executions{0};
  auto first = std::async(std::launch::async, [&]() {
    return flight.Do("a", [&]() {
      ++executions;
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
      return std::string("A");
    });
  });
  auto second = std::async(std::launch::async, [&]() {
    return flight.Do("b", [&]() {
      ++executions;
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
      return std::string("B");
    });
  });
  EXPECT_EQ(first.get(), "A");
  EXPECT_EQ(second.get(), "B");
  EXPECT_EQ(executions.load(), 2);
}

TEST(SingleFlightTest, ResultsAreNotCached) {
  SingleFlight<int, int> flight;
  int counter = 0;
  EXPECT_EQ(flight.Do(1, [&]() { return ++counter; }), 1);
  EXPECT_EQ(flight.Do(1, [&]() { return ++counter; }), 2);
}

TEST(SingleFlightTest, ExceptionReachesEveryCaller) {
  SingleFlight<std::string, int> flight;
  std::promise<void> release;
  std::shared_future<void> gate = release.get_future().share();

  auto failing = [&]() -> int {
    gate.wait();
    throw std::runtime_error("load failed");
  };

  auto leader = std::async(std::launch::async, [&]() { return flight.Do("t", failing); });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  auto follower = std::async(std::launch::async, [&]() { return flight.Do("t", failing); });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  release.set_value();

  EXPECT_THROW(leader.get(), std::runtime_error);
  EXPECT_THROW(follower.get(), std::runtime_error);
  EXPECT_EQ(flight.InFlight(), 0u);

  // The failed entry is gone, so the next call runs again
  EXPECT_EQ(flight.Do("t", []() { return 1; }), 1);
}
