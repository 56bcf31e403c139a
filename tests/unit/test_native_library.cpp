/**
 * @file test_native_library.cpp
 * @brief Unit tests for native library discovery
 */

#include <clipsafe/native_library.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <cstdlib>

using namespace clipsafe;

class NativeLibraryTest : public ::testing::Test {
protected:
  void SetUp() override {
    const char *value = std::getenv(CLIPSAFE_LIBRARY_PATH_ENV);
    had_value_ = value != nullptr;
    if (had_value_) {
      saved_ = value;
    }
  }

  void TearDown() override {
    if (had_value_) {
      setenv(CLIPSAFE_LIBRARY_PATH_ENV, saved_.c_str(), 1);
    } else {
      unsetenv(CLIPSAFE_LIBRARY_PATH_ENV);
    }
  }

private:
  bool had_value_ = false;
  std::string saved_;
};

// ============================================================================
// Candidates
// ============================================================================

TEST_F(NativeLibraryTest, ConventionalNamesFirst) {
  unsetenv(CLIPSAFE_LIBRARY_PATH_ENV);
  auto candidates = native_library_candidates();

  ASSERT_EQ(candidates.size(), 6u);
  EXPECT_EQ(candidates[0],
            std::string("libclipboard") + CLIPSAFE_SHARED_LIBRARY_SUFFIX);
  EXPECT_EQ(candidates[1],
            std::string("clipboard") + CLIPSAFE_SHARED_LIBRARY_SUFFIX);
  EXPECT_EQ(candidates[2], std::string("/usr/local/lib/libclipboard") +
                               CLIPSAFE_SHARED_LIBRARY_SUFFIX);
  EXPECT_EQ(candidates[3],
            std::string("/usr/lib/libclipboard") + CLIPSAFE_SHARED_LIBRARY_SUFFIX);
}

TEST_F(NativeLibraryTest, SearchPathEntriesAppended) {
  setenv(CLIPSAFE_LIBRARY_PATH_ENV, "/opt/clip/lib::/home/user/lib", 1);
  auto candidates = native_library_candidates();

  ASSERT_EQ(candidates.size(), 10u);
  EXPECT_EQ(candidates[6], std::string("/opt/clip/lib/libclipboard") +
                               CLIPSAFE_SHARED_LIBRARY_SUFFIX);
  EXPECT_EQ(candidates[8], std::string("/home/user/lib/libclipboard") +
                               CLIPSAFE_SHARED_LIBRARY_SUFFIX);
}

// ============================================================================
// Loading
// ============================================================================

TEST_F(NativeLibraryTest, MissingExplicitPath) {
  auto api = load_native_clipboard("/nonexistent/dir/libclipboard.so");

  ASSERT_FALSE(api);
  EXPECT_EQ(api.error().code, ErrorCode::LibraryNotFound);
  EXPECT_FALSE(api.error().details.empty());
}

#ifdef CLIPSAFE_PLATFORM_LINUX
TEST_F(NativeLibraryTest, IncompatibleLibraryRejected) {
  // Loads fine but has none of the clipboard symbols
  auto api = load_native_clipboard("libm.so.6");

  ASSERT_FALSE(api);
  EXPECT_EQ(api.error().code, ErrorCode::LibraryNotFound);
  EXPECT_EQ(api.error().details, "missing symbol clipboard_new");
}
#endif
