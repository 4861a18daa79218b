/*
 * logging.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: spdlog based logging setup for airmon

**************************************************/

#ifndef AIRMON_LOG_LOGGING_HPP
#define AIRMON_LOG_LOGGING_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/common.h>
#include <spdlog/logger.h>

namespace airmon::log {

inline constexpr std::string_view LOGGER_NAME = "airmon";

/**
 * @brief Settings used to build the default logger.
 */
struct LogSettings {
    std::string level{"info"};
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v"};
    /// Rotating file sink target; empty disables file logging.
    std::string file;
    std::size_t maxFileSize{1048576};
    std::size_t maxFiles{3};
};

/**
 * @brief Parse a level name (trace, debug, info, warn, error, critical, off).
 *
 * Accepts "warning" as an alias of "warn". Case-insensitive.
 * @throws airmon::error::InvalidArgument for unknown names.
 */
[[nodiscard]] auto parseLevel(std::string_view name) -> spdlog::level::level_enum;

/**
 * @brief Install the "airmon" logger as spdlog's default logger.
 *
 * Always logs to a colored stderr sink; adds a rotating file sink when
 * settings.file is set. Calling it again replaces the previous logger.
 * @return The logger that was installed.
 */
auto initLogging(const LogSettings& settings) -> std::shared_ptr<spdlog::logger>;

/**
 * @brief Change the level of the default logger.
 */
void setLevel(std::string_view name);

}  // namespace airmon::log

#endif  // AIRMON_LOG_LOGGING_HPP
