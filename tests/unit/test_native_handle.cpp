/**
 * @file test_native_handle.cpp
 * @brief Unit tests for native instance ownership
 */

#include "fake_native_clipboard.h"

#include <clipsafe/native_handle.h>
#include <gtest/gtest.h>

#include <thread>
#include <vector>

using namespace clipsafe;
using clipsafe::test::FakeNativeClipboard;

class NativeHandleTest : public ::testing::Test {
protected:
  std::shared_ptr<FakeNativeClipboard> fake =
      std::make_shared<FakeNativeClipboard>();
};

// ============================================================================
// Acquire
// ============================================================================

TEST_F(NativeHandleTest, AcquireValid) {
  auto handle = NativeHandle::acquire(fake);

  ASSERT_TRUE(handle);
  EXPECT_TRUE(handle.value()->is_valid());
  EXPECT_NE(handle.value()->get(), nullptr);
  EXPECT_EQ(fake->create_calls.load(), 1);
}

TEST_F(NativeHandleTest, MissingLibrary) {
  auto handle = NativeHandle::acquire(nullptr);

  ASSERT_FALSE(handle);
  EXPECT_EQ(handle.error().code, ErrorCode::LibraryNotFound);
  EXPECT_TRUE(is_initialization_error(handle.error().code));
}

TEST_F(NativeHandleTest, NullInstanceRejected) {
  fake->create_mode = FakeNativeClipboard::CreateMode::Null;

  auto handle = NativeHandle::acquire(fake);
  ASSERT_FALSE(handle);
  EXPECT_EQ(handle.error().code, ErrorCode::CreationRejected);
}

TEST_F(NativeHandleTest, AllOnesInstanceRejected) {
  fake->create_mode = FakeNativeClipboard::CreateMode::AllOnes;

  auto handle = NativeHandle::acquire(fake);
  ASSERT_FALSE(handle);
  EXPECT_EQ(handle.error().code, ErrorCode::CreationRejected);
  EXPECT_EQ(fake->destroy_calls.load(), 0);
}

TEST_F(NativeHandleTest, ThrowingCreateWrapped) {
  fake->create_mode = FakeNativeClipboard::CreateMode::Throw;

  auto handle = NativeHandle::acquire(fake);
  ASSERT_FALSE(handle);
  EXPECT_EQ(handle.error().code, ErrorCode::InitializationFailed);
  EXPECT_NE(handle.error().details.find("display connection refused"),
            std::string::npos);
}

TEST_F(NativeHandleTest, InvalidValueSentinels) {
  EXPECT_TRUE(NativeHandle::is_invalid_value(nullptr));
  EXPECT_TRUE(NativeHandle::is_invalid_value(
      reinterpret_cast<clipboard_c *>(~static_cast<uintptr_t>(0))));

  int dummy = 0;
  EXPECT_FALSE(
      NativeHandle::is_invalid_value(reinterpret_cast<clipboard_c *>(&dummy)));
}

// ============================================================================
// Release
// ============================================================================

TEST_F(NativeHandleTest, ReleaseDestroysOnce) {
  auto handle = NativeHandle::acquire(fake).value();

  EXPECT_TRUE(handle->release());
  EXPECT_FALSE(handle->release());
  EXPECT_FALSE(handle->is_valid());
  EXPECT_EQ(handle->get(), nullptr);

  handle.reset();
  EXPECT_EQ(fake->destroy_calls.load(), 1);
}

TEST_F(NativeHandleTest, DroppedHandleDestroysInstance) {
  {
    auto handle = NativeHandle::acquire(fake).value();
    EXPECT_TRUE(handle->is_valid());
  }
  EXPECT_EQ(fake->destroy_calls.load(), 1);
  EXPECT_EQ(fake->calls_after_destroy.load(), 0);
}

TEST_F(NativeHandleTest, ConcurrentReleaseDestroysOnce) {
  auto handle = NativeHandle::acquire(fake).value();

  std::atomic<int> winners{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&] {
      if (handle->release()) {
        ++winners;
      }
    });
  }
  for (auto &t : threads) {
    t.join();
  }

  EXPECT_EQ(winners.load(), 1);
  EXPECT_EQ(fake->destroy_calls.load(), 1);
}

TEST_F(NativeHandleTest, DestroyFailureSwallowed) {
  fake->destroy_throws = true;
  auto handle = NativeHandle::acquire(fake).value();

  EXPECT_TRUE(handle->release());
  EXPECT_FALSE(handle->is_valid());
  EXPECT_FALSE(handle->release());
  EXPECT_EQ(fake->destroy_calls.load(), 1);
}
