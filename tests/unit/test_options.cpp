/**
 * @file test_options.cpp
 * @brief Unit tests for session options
 */

#include <clipsafe/options.h>
#include <gtest/gtest.h>

using namespace clipsafe;

TEST(OptionsTest, Defaults) {
  ClipboardOptions options;

  EXPECT_EQ(options.polling_interval, std::chrono::milliseconds(100));
  EXPECT_TRUE(options.change_detection_enabled);
  EXPECT_EQ(options.max_data_size, 10u * 1024 * 1024);
  EXPECT_FALSE(options.trim_whitespace);
  EXPECT_TRUE(options.library_path.empty());
  EXPECT_TRUE(options.validate().is_ok());
}

TEST(OptionsTest, RejectsNonPositiveInterval) {
  ClipboardOptions options;

  options.polling_interval = std::chrono::milliseconds(0);
  EXPECT_EQ(options.validate().error().code, ErrorCode::InvalidArgument);

  options.polling_interval = std::chrono::milliseconds(-5);
  EXPECT_EQ(options.validate().error().code, ErrorCode::InvalidArgument);
}

TEST(OptionsTest, SizeLimit) {
  ClipboardOptions options;
  options.max_data_size = 10;

  EXPECT_FALSE(options.exceeds_size_limit(10));
  EXPECT_TRUE(options.exceeds_size_limit(11));
}

TEST(OptionsTest, ZeroMeansUnlimited) {
  ClipboardOptions options;
  options.max_data_size = 0;

  EXPECT_FALSE(options.exceeds_size_limit(SIZE_MAX));
}
