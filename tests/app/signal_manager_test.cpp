/**
 * @file signal_manager_test.cpp
 * @brief Tests for SignalManager shutdown and log reopen flags
 */

#include "app/signal_manager.h"

#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <thread>

namespace binlogsync::app {
namespace {

class SignalManagerTest : public ::testing::Test {
 protected:
  void SetUp() override { SignalManager::Reset(); }
  void TearDown() override { SignalManager::Reset(); }

  static void Deliver(int signum) {
    raise(signum);
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
};

TEST_F(SignalManagerTest, CreateSucceeds) {
  auto result = SignalManager::Create();
  ASSERT_TRUE(result.has_value());
  EXPECT_NE(result.value(), nullptr);
  EXPECT_FALSE(SignalManager::IsShutdownRequested());
  EXPECT_FALSE(SignalManager::ConsumeLogReopenRequest());
}

TEST_F(SignalManagerTest, SigtermRequestsShutdown) {
  auto signal_mgr = SignalManager::Create();
  ASSERT_TRUE(signal_mgr.has_value());

  Deliver(SIGTERM);
  EXPECT_TRUE(SignalManager::IsShutdownRequested());
  // Not cleared by reading
  EXPECT_TRUE(SignalManager::IsShutdownRequested());
}

TEST_F(SignalManagerTest, SigintRequestsShutdown) {
  auto signal_mgr = SignalManager::Create();
  ASSERT_TRUE(signal_mgr.has_value());

  Deliver(SIGINT);
  EXPECT_TRUE(SignalManager::IsShutdownRequested());
  EXPECT_FALSE(SignalManager::ConsumeLogReopenRequest());
}

TEST_F(SignalManagerTest, SigusrOneIsConsumedOnce) {
  auto signal_mgr = SignalManager::Create();
  ASSERT_TRUE(signal_mgr.has_value());

  Deliver(SIGUSR1);
  Deliver(SIGUSR1);
  EXPECT_TRUE(SignalManager::ConsumeLogReopenRequest());
  EXPECT_FALSE(SignalManager::ConsumeLogReopenRequest());
  EXPECT_FALSE(SignalManager::IsShutdownRequested());
}

TEST_F(SignalManagerTest, SigpipeIsIgnored) {
  auto signal_mgr = SignalManager::Create();
  ASSERT_TRUE(signal_mgr.has_value());

  Deliver(SIGPIPE);
  EXPECT_FALSE(SignalManager::IsShutdownRequested());
}

TEST_F(SignalManagerTest, ResetClearsFlags) {
  auto signal_mgr = SignalManager::Create();
  ASSERT_TRUE(signal_mgr.has_value());

  Deliver(SIGTERM);
  Deliver(SIGUSR1);
  SignalManager::Reset();
  EXPECT_FALSE(SignalManager::IsShutdownRequested());
  EXPECT_FALSE(SignalManager::ConsumeLogReopenRequest());
}

TEST_F(SignalManagerTest, DestructionRestoresPreviousHandlers) {
  struct sigaction before {};
  ASSERT_EQ(sigaction(SIGUSR1, nullptr, &before), 0);
  {
    auto signal_mgr = SignalManager::Create();
    ASSERT_TRUE(signal_mgr.has_value());
    struct sigaction during {};
    ASSERT_EQ(sigaction(SIGUSR1, nullptr, &during), 0);
    EXPECT_NE(during.sa_handler, before.sa_handler);
  }
  struct sigaction after {};
  ASSERT_EQ(sigaction(SIGUSR1, nullptr, &after), 0);
  EXPECT_EQ(after.sa_handler, before.sa_handler);
}

}  // namespace
}  // namespace binlogsync::app
