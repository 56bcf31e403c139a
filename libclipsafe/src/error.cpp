/**
 * @file error.cpp
 * @brief Error handling implementation
 */

#include "clipsafe/error.h"
#include <sstream>

namespace clipsafe {

// ============================================================================
// Error Code Names
// ============================================================================

const char *error_code_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return "Success";
  case ErrorCode::Unknown:
    return "Unknown";
  case ErrorCode::InvalidArgument:
    return "InvalidArgument";
  case ErrorCode::InvalidState:
    return "InvalidState";
  case ErrorCode::PlatformError:
    return "PlatformError";

  case ErrorCode::InitializationFailed:
    return "InitializationFailed";
  case ErrorCode::LibraryNotFound:
    return "LibraryNotFound";
  case ErrorCode::CreationRejected:
    return "CreationRejected";

  case ErrorCode::AccessFailed:
    return "AccessFailed";
  case ErrorCode::SizeLimitExceeded:
    return "SizeLimitExceeded";

  case ErrorCode::Disposed:
    return "Disposed";

  default:
    return "UnknownError";
  }
}

// ============================================================================
// Error Code Descriptions
// ============================================================================

const char *error_code_description(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return "Operation completed successfully";
  case ErrorCode::Unknown:
    return "An unknown error occurred";
  case ErrorCode::InvalidArgument:
    return "Invalid argument provided";
  case ErrorCode::InvalidState:
    return "Operation not valid in current state";
  case ErrorCode::PlatformError:
    return "Platform-specific error occurred";

  case ErrorCode::InitializationFailed:
    return "Failed to initialize the native clipboard instance";
  case ErrorCode::LibraryNotFound:
    return "Native clipboard library not found";
  case ErrorCode::CreationRejected:
    return "Native clipboard library rejected instance creation";

  case ErrorCode::AccessFailed:
    return "Native clipboard operation failed";
  case ErrorCode::SizeLimitExceeded:
    return "Clipboard data exceeds the configured size limit";

  case ErrorCode::Disposed:
    return "Clipboard session has been disposed";

  default:
    return "Unknown error occurred";
  }
}

// ============================================================================
// Recoverability
// ============================================================================

bool is_recoverable(ErrorCode code) {
  switch (code) {
  // Non-recoverable errors
  case ErrorCode::InitializationFailed:
  case ErrorCode::LibraryNotFound:
  case ErrorCode::CreationRejected:
  case ErrorCode::Disposed:
    return false;

  // All others are potentially recoverable
  default:
    return true;
  }
}

bool is_initialization_error(ErrorCode code) {
  int value = static_cast<int>(code);
  return value >= 100 && value < 200;
}

// ============================================================================
// Error::to_string
// ============================================================================

std::string Error::to_string() const {
  std::ostringstream oss;

  oss << error_code_name(code);

  if (!message.empty()) {
    oss << ": " << message;
  }

  if (!details.empty()) {
    oss << " (" << details << ")";
  }

  if (native_status != 0) {
    oss << " [native status " << native_status << "]";
  }

  if (!location.empty()) {
    oss << " [" << location << "]";
  }

  return oss.str();
}

} // namespace clipsafe
