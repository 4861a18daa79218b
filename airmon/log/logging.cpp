/*
 * logging.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: spdlog based logging setup for airmon

**************************************************/

#include "logging.hpp"

#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "airmon/error/exception.hpp"
#include "airmon/utils/string.hpp"

namespace airmon::log {

auto parseLevel(std::string_view name) -> spdlog::level::level_enum {
    const std::string lowered = utils::toLower(utils::trim(name));
    if (lowered == "trace") {
        return spdlog::level::trace;
    }
    if (lowered == "debug") {
        return spdlog::level::debug;
    }
    if (lowered == "info") {
        return spdlog::level::info;
    }
    if (lowered == "warn" || lowered == "warning") {
        return spdlog::level::warn;
    }
    if (lowered == "error" || lowered == "err") {
        return spdlog::level::err;
    }
    if (lowered == "critical") {
        return spdlog::level::critical;
    }
    if (lowered == "off") {
        return spdlog::level::off;
    }
    THROW_INVALID_ARGUMENT("Unknown log level: '", name, "'");
}

auto initLogging(const LogSettings& settings)
    -> std::shared_ptr<spdlog::logger> {
    const auto level = parseLevel(settings.level);

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!settings.file.empty()) {
        try {
            sinks.push_back(
                std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    settings.file, settings.maxFileSize, settings.maxFiles));
        } catch (const spdlog::spdlog_ex& ex) {
            THROW_RUNTIME_ERROR("Failed to open log file '", settings.file,
                                "': ", ex.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>(
        std::string(LOGGER_NAME), sinks.begin(), sinks.end());
    logger->set_pattern(settings.pattern);
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);

    spdlog::drop(std::string(LOGGER_NAME));
    spdlog::set_default_logger(logger);
    spdlog::debug("Logging initialized (level={}, file='{}')",
                  spdlog::level::to_string_view(level), settings.file);
    return logger;
}

void setLevel(std::string_view name) {
    spdlog::set_level(parseLevel(name));
}

}  // namespace airmon::log
