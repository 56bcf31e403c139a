/**
 * @file clipsafe.cpp
 * @brief Library-level functions
 */

#include "clipsafe/clipsafe.h"

namespace clipsafe {

VersionInfo get_version() { return VersionInfo{}; }

} // namespace clipsafe
