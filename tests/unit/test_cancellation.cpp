/**
 * @file test_cancellation.cpp
 * @brief Unit tests for cooperative cancellation
 */

#include <clipsafe/cancellation.h>
#include <gtest/gtest.h>

#include <atomic>
#include <thread>

using namespace clipsafe;
using namespace std::chrono_literals;

// ============================================================================
// Token
// ============================================================================

TEST(CancellationTest, DefaultTokenNeverCancelled) {
  auto token = CancellationToken::none();

  EXPECT_FALSE(token.can_be_cancelled());
  EXPECT_FALSE(token.is_cancellation_requested());
  EXPECT_FALSE(token.wait_for(5ms));
}

TEST(CancellationTest, SourceCancelsToken) {
  CancellationSource source;
  auto token = source.token();

  EXPECT_TRUE(token.can_be_cancelled());
  EXPECT_FALSE(token.is_cancellation_requested());

  source.cancel();
  EXPECT_TRUE(token.is_cancellation_requested());
  EXPECT_TRUE(source.is_cancellation_requested());

  // Idempotent
  source.cancel();
  EXPECT_TRUE(token.is_cancellation_requested());
}

TEST(CancellationTest, WaitTimesOutWithoutCancel) {
  CancellationSource source;

  auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(source.token().wait_for(30ms));
  EXPECT_GE(std::chrono::steady_clock::now() - start, 30ms);
}

TEST(CancellationTest, CancelWakesWaiter) {
  CancellationSource source;
  auto token = source.token();

  std::thread canceller([&source] {
    std::this_thread::sleep_for(20ms);
    source.cancel();
  });

  auto start = std::chrono::steady_clock::now();
  EXPECT_TRUE(token.wait_for(5s));
  EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);

  canceller.join();
}

// ============================================================================
// Callbacks
// ============================================================================

TEST(CancellationTest, CallbackRunsOnCancel) {
  CancellationSource source;
  int calls = 0;

  auto registration = source.token().register_callback([&calls] { ++calls; });
  EXPECT_EQ(calls, 0);

  source.cancel();
  source.cancel();
  EXPECT_EQ(calls, 1);
}

TEST(CancellationTest, CallbackRunsImmediatelyWhenAlreadyCancelled) {
  CancellationSource source;
  source.cancel();

  int calls = 0;
  auto registration = source.token().register_callback([&calls] { ++calls; });
  EXPECT_EQ(calls, 1);
}

TEST(CancellationTest, ResetRegistrationDropsCallback) {
  CancellationSource source;
  int calls = 0;

  auto registration = source.token().register_callback([&calls] { ++calls; });
  registration.reset();

  source.cancel();
  EXPECT_EQ(calls, 0);
}

// ============================================================================
// Linked Sources
// ============================================================================

TEST(CancellationTest, LinkedFollowsParent) {
  CancellationSource parent;
  auto child = CancellationSource::linked(parent.token());

  EXPECT_FALSE(child.is_cancellation_requested());
  parent.cancel();
  EXPECT_TRUE(child.is_cancellation_requested());
}

TEST(CancellationTest, LinkedCancelDoesNotReachParent) {
  CancellationSource parent;
  auto child = CancellationSource::linked(parent.token());

  child.cancel();
  EXPECT_TRUE(child.is_cancellation_requested());
  EXPECT_FALSE(parent.is_cancellation_requested());
}

TEST(CancellationTest, LinkedToCancelledParentStartsCancelled) {
  CancellationSource parent;
  parent.cancel();

  auto child = CancellationSource::linked(parent.token());
  EXPECT_TRUE(child.is_cancellation_requested());
}

TEST(CancellationTest, LinkedToNoneIsIndependent) {
  auto child = CancellationSource::linked(CancellationToken::none());

  EXPECT_FALSE(child.is_cancellation_requested());
  child.cancel();
  EXPECT_TRUE(child.token().is_cancellation_requested());
}

TEST(CancellationTest, DisposeUnlinksParent) {
  CancellationSource parent;
  auto child = CancellationSource::linked(parent.token());
  auto token = child.token();

  child.dispose();
  parent.cancel();

  EXPECT_FALSE(token.is_cancellation_requested());
}

TEST(CancellationTest, ParentOutlivesDestroyedChild) {
  CancellationSource parent;
  {
    auto child = CancellationSource::linked(parent.token());
  }
  // No dangling callback
  parent.cancel();
  EXPECT_TRUE(parent.is_cancellation_requested());
}
