/**
 * @file options.h
 * @brief Configuration for a clipboard session
 */

#ifndef CLIPSAFE_OPTIONS_H
#define CLIPSAFE_OPTIONS_H

#include "error.h"
#include "platform.h"
#include "types.h"
#include <chrono>
#include <string>

namespace clipsafe {

/// Default interval between two change-detection polls
constexpr std::chrono::milliseconds DEFAULT_POLLING_INTERVAL{100};

/**
 * @brief Configuration for a ClipboardSession
 *
 * Copied into the session when it is opened; changing an options object
 * afterwards has no effect on an open session.
 */
struct CLIPSAFE_API ClipboardOptions {
  /// Interval between polls of the native library
  std::chrono::milliseconds polling_interval = DEFAULT_POLLING_INTERVAL;

  /// Allow start_monitoring() to spawn a polling run
  bool change_detection_enabled = true;

  /// Maximum text/image payload in bytes (0 = unlimited)
  size_t max_data_size = DEFAULT_MAX_DATA_SIZE;

  /// Trim leading/trailing whitespace from text on set and get
  bool trim_whitespace = false;

  /// Explicit path of the native library (empty = search default locations)
  std::string library_path;

  /**
   * @brief Validate configuration
   * @return Success or InvalidArgument
   */
  Result<void> validate() const;

  /// Check a payload size against max_data_size
  bool exceeds_size_limit(size_t size) const {
    return max_data_size > 0 && size > max_data_size;
  }
};

} // namespace clipsafe

#endif // CLIPSAFE_OPTIONS_H
