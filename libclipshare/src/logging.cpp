/**
 * @file logging.cpp
 * @brief spdlog logger setup
 */

#include "clipshare/logging.h"
#include <cstdlib>
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace clipshare {
namespace logging {

namespace {

std::mutex &register_mutex() {
  static std::mutex m;
  return m;
}

bool parse_level(const std::string &name, spdlog::level::level_enum &out) {
  if (name.empty()) {
    return false;
  }
  auto level = spdlog::level::from_str(name);
  // from_str maps unknown names to off, only accept an explicit "off"
  if (level == spdlog::level::off && name != "off") {
    return false;
  }
  out = level;
  return true;
}

} // namespace

Logger get() {
  auto logger = spdlog::get(LOGGER_NAME);
  if (logger) {
    return logger;
  }

  std::lock_guard<std::mutex> lock(register_mutex());

  // Another thread may have registered it in between
  logger = spdlog::get(LOGGER_NAME);
  if (logger) {
    return logger;
  }

  logger = spdlog::stdout_color_mt(LOGGER_NAME);
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
  logger->set_level(spdlog::level::info);
  logger->flush_on(spdlog::level::warn);

  spdlog::level::level_enum level;
  const char *env = std::getenv(LOG_LEVEL_ENV);
  if (env && parse_level(env, level)) {
    logger->set_level(level);
  }

  return logger;
}

void init(const std::string &level_name) {
  spdlog::level::level_enum level;
  if (parse_level(level_name, level)) {
    get()->set_level(level);
  }
}

void set_level(spdlog::level::level_enum level) { get()->set_level(level); }

} // namespace logging
} // namespace clipshare
