/**
 * @file logging.cpp
 * @brief spdlog logger registry
 */

#include "clipsafe/logging.h"

#include <cstdlib>
#include <mutex>
#include <optional>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace clipsafe {
namespace logging {

namespace {

std::optional<spdlog::level::level_enum>
level_from_env(const std::string &var_name) {
  const char *value = std::getenv(var_name.c_str());
  if (!value || value[0] == '\0') {
    return std::nullopt;
  }

  // from_str() maps unknown names to "off"; only accept real matches
  auto level = spdlog::level::from_str(value);
  if (level == spdlog::level::off && std::string(value) != "off") {
    return std::nullopt;
  }
  return level;
}

spdlog::sink_ptr shared_sink() {
  static spdlog::sink_ptr sink =
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  return sink;
}

std::mutex &registry_mutex() {
  static std::mutex m;
  return m;
}

} // namespace

void init_log_level(const Logger &logger) {
  if (!logger) {
    return;
  }

  if (auto level = level_from_env("LOG_" + logger->name())) {
    logger->set_level(*level);
    return;
  }

  if (auto level = level_from_env("LOG")) {
    logger->set_level(*level);
    return;
  }

  logger->set_level(spdlog::level::info);
}

Logger get(const std::string &name) {
  std::lock_guard<std::mutex> lock(registry_mutex());

  if (auto existing = spdlog::get(name)) {
    return existing;
  }

  auto logger = std::make_shared<spdlog::logger>(name, shared_sink());
  logger->set_pattern("[%d/%m %T.%e][T-%t][%n]%^[%l]%$ %v");
  logger->flush_on(spdlog::level::err);
  init_log_level(logger);
  spdlog::register_logger(logger);
  return logger;
}

} // namespace logging
} // namespace clipsafe
