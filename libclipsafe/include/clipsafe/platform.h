/**
 * @file platform.h
 * @brief Platform detection and abstraction macros for clipsafe
 *
 * This header provides compile-time platform detection and defines
 * the appropriate macros for cross-platform development.
 *
 * clipsafe loads the native clipboard library with dlopen, so only
 * POSIX platforms (Linux and macOS) are supported.
 */

#ifndef CLIPSAFE_PLATFORM_H
#define CLIPSAFE_PLATFORM_H

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define CLIPSAFE_PLATFORM_LINUX 1
#define CLIPSAFE_PLATFORM_NAME "Linux"
#define CLIPSAFE_SHARED_LIBRARY_SUFFIX ".so"
#define CLIPSAFE_LIBRARY_PATH_ENV "LD_LIBRARY_PATH"
#elif defined(__APPLE__)
#define CLIPSAFE_PLATFORM_MACOS 1
#define CLIPSAFE_PLATFORM_NAME "macOS"
#define CLIPSAFE_SHARED_LIBRARY_SUFFIX ".dylib"
#define CLIPSAFE_LIBRARY_PATH_ENV "DYLD_LIBRARY_PATH"
#else
#error "Unsupported platform. clipsafe only supports Linux and macOS."
#endif

// ============================================================================
// Compiler Detection (GCC and Clang only)
// ============================================================================

#if defined(__clang__)
#define CLIPSAFE_COMPILER_CLANG 1
#define CLIPSAFE_COMPILER_NAME "Clang"
#elif defined(__GNUC__)
#define CLIPSAFE_COMPILER_GCC 1
#define CLIPSAFE_COMPILER_NAME "GCC"
#else
#define CLIPSAFE_COMPILER_UNKNOWN 1
#define CLIPSAFE_COMPILER_NAME "Unknown"
#endif

// ============================================================================
// Export/Import Macros
// ============================================================================

#ifdef CLIPSAFE_BUILDING_SHARED
#define CLIPSAFE_API __attribute__((visibility("default")))
#else
#define CLIPSAFE_API
#endif

// ============================================================================
// Utility Macros
// ============================================================================

// Deprecation warnings
#define CLIPSAFE_DEPRECATED(msg) __attribute__((deprecated(msg)))

#endif // CLIPSAFE_PLATFORM_H
