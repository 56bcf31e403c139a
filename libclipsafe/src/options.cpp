/**
 * @file options.cpp
 * @brief Session configuration implementation
 */

#include "clipsafe/options.h"

namespace clipsafe {

Result<void> ClipboardOptions::validate() const {
  CLIPSAFE_REQUIRE(polling_interval.count() > 0, ErrorCode::InvalidArgument,
                   "Polling interval must be greater than zero");
  return Result<void>::ok();
}

} // namespace clipsafe
