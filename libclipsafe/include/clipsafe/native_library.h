/**
 * @file native_library.h
 * @brief Discovery and loading of the native libclipboard library
 */

#ifndef CLIPSAFE_NATIVE_LIBRARY_H
#define CLIPSAFE_NATIVE_LIBRARY_H

#include "error.h"
#include "native_api.h"
#include "platform.h"
#include <memory>
#include <string>
#include <vector>

namespace clipsafe {

/// Base name of the native library
constexpr const char *NATIVE_LIBRARY_NAME = "clipboard";

/**
 * @brief List the paths tried when loading the native library
 *
 * Order: conventional names resolved by the dynamic loader, then
 * /usr/local/lib and /usr/lib, then every entry of the library path
 * environment variable (LD_LIBRARY_PATH, DYLD_LIBRARY_PATH on macOS).
 */
CLIPSAFE_API std::vector<std::string> native_library_candidates();

/**
 * @brief Load libclipboard and resolve its capability surface
 * @param explicit_path Library to load; empty searches the candidates
 * @return Capability surface, or LibraryNotFound
 *
 * The library stays loaded for as long as the returned object lives.
 */
CLIPSAFE_API Result<std::shared_ptr<NativeClipboardApi>>
load_native_clipboard(const std::string &explicit_path = "");

} // namespace clipsafe

#endif // CLIPSAFE_NATIVE_LIBRARY_H
