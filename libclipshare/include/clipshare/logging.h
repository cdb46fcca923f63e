/**
 * @file logging.h
 * @brief spdlog logger shared by all clipshare components
 */

#ifndef CLIPSHARE_LOGGING_H
#define CLIPSHARE_LOGGING_H

#include "platform.h"
#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace clipshare {
namespace logging {

using Logger = std::shared_ptr<spdlog::logger>;

/// Name of the library logger
constexpr const char *LOGGER_NAME = "clipshare";

/// Environment variable that overrides the log level
constexpr const char *LOG_LEVEL_ENV = "CLIPSHARE_LOG";

/**
 * @brief Get (creating on first use) the clipshare logger
 *
 * The level defaults to info, or whatever CLIPSHARE_LOG names.
 */
CLIPSHARE_API Logger get();

/**
 * @brief Set the log level by name
 * @param level_name trace|debug|info|warn|error|critical|off
 *
 * An empty or unknown name leaves the current level untouched.
 */
CLIPSHARE_API void init(const std::string &level_name = "");

/// Set the log level
CLIPSHARE_API void set_level(spdlog::level::level_enum level);

} // namespace logging
} // namespace clipshare

#define CLIPSHARE_LOG_TRACE(...) ::clipshare::logging::get()->trace(__VA_ARGS__)
#define CLIPSHARE_LOG_DEBUG(...) ::clipshare::logging::get()->debug(__VA_ARGS__)
#define CLIPSHARE_LOG_INFO(...) ::clipshare::logging::get()->info(__VA_ARGS__)
#define CLIPSHARE_LOG_WARNING(...) ::clipshare::logging::get()->warn(__VA_ARGS__)
#define CLIPSHARE_LOG_ERROR(...) ::clipshare::logging::get()->error(__VA_ARGS__)

#endif // CLIPSHARE_LOGGING_H
