/**
 * @file clipsafe.h
 * @brief Main clipsafe API Header
 *
 * clipsafe - safe access to the native system clipboard
 *
 * This is the main header file for the clipsafe library. It provides:
 * - Lifetime-safe ownership of a libclipboard instance
 * - Text and image access with size limits
 * - Change monitoring through a cancellable polling run
 *
 * Quick Start:
 * @code
 *   #include <clipsafe/clipsafe.h>
 *
 *   auto clipboard = clipsafe::ClipboardSession::open();
 *   if (clipboard) {
 *       clipboard.value()->set_text("Hello");
 *   }
 * @endcode
 */

#ifndef CLIPSAFE_CLIPSAFE_H
#define CLIPSAFE_CLIPSAFE_H

// Core headers (in dependency order)
#include "error.h"
#include "platform.h"
#include "types.h"

// Feature modules (in dependency order)
#include "cancellation.h"
#include "change_event.h"
#include "clipboard.h"
#include "logging.h"
#include "native_api.h"
#include "native_handle.h"
#include "native_library.h"
#include "options.h"
#include "polling_engine.h"
#include "state_machine.h"

namespace clipsafe {

// ============================================================================
// Version Information
// ============================================================================

/// clipsafe major version
constexpr int VERSION_MAJOR = 1;

/// clipsafe minor version
constexpr int VERSION_MINOR = 0;

/// clipsafe patch version
constexpr int VERSION_PATCH = 0;

/// clipsafe version string
constexpr const char *VERSION_STRING = "1.0.0";

/**
 * @brief Get version information
 */
struct VersionInfo {
  int major = VERSION_MAJOR;
  int minor = VERSION_MINOR;
  int patch = VERSION_PATCH;
  const char *version_string = VERSION_STRING;
  const char *platform = CLIPSAFE_PLATFORM_NAME;
  const char *build_date = __DATE__;
};

CLIPSAFE_API VersionInfo get_version();

} // namespace clipsafe

#endif // CLIPSAFE_CLIPSAFE_H
