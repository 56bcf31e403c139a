/**
 * @file logging.h
 * @brief Named spdlog loggers for clipsafe
 *
 * All loggers created here write to one shared stderr sink. The level of
 * a logger named "foo" is taken from the LOG_foo environment variable,
 * then from LOG, and defaults to info.
 */

#ifndef CLIPSAFE_LOGGING_H
#define CLIPSAFE_LOGGING_H

#include "platform.h"
#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace clipsafe {
namespace logging {

using Logger = std::shared_ptr<spdlog::logger>;

/// Name of the library's default logger
constexpr const char *DEFAULT_LOGGER_NAME = "clipsafe";

/**
 * @brief Get a registered logger, creating it on first use
 */
CLIPSAFE_API Logger get(const std::string &name = DEFAULT_LOGGER_NAME);

/**
 * @brief Set the level of a logger from the LOG_<name> / LOG variables
 */
CLIPSAFE_API void init_log_level(const Logger &logger);

} // namespace logging
} // namespace clipsafe

#endif // CLIPSAFE_LOGGING_H
