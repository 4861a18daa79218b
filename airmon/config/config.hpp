/*
 * config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Runtime configuration: probe timeouts, logging, monitor

**************************************************/

#ifndef AIRMON_CONFIG_CONFIG_HPP
#define AIRMON_CONFIG_CONFIG_HPP

#include <chrono>
#include <filesystem>

#include <nlohmann/json_fwd.hpp>

#include "airmon/log/logging.hpp"

namespace airmon::config {

using Seconds = std::chrono::duration<double>;

/**
 * @brief Upper bound for every external command the detectors run.
 */
struct CommandTimeouts {
    std::chrono::milliseconds bluetoothctl{5000};
    std::chrono::milliseconds bluetoothProfiler{10000};
    std::chrono::milliseconds bluetoothPower{5000};
    std::chrono::milliseconds lsusb{10000};
    std::chrono::milliseconds usbProfiler{15000};
    std::chrono::milliseconds iwconfig{5000};
    std::chrono::milliseconds netshWlan{10000};
    std::chrono::milliseconds networksetup{10000};
    std::chrono::milliseconds linkToggle{5000};

    /**
     * @brief Multiply every timeout by `factor`.
     * @throws airmon::error::ConfigError when factor is not positive
     */
    void scale(double factor);
};

struct MonitorSettings {
    Seconds interval{2.0};
};

struct AirmonConfig {
    CommandTimeouts timeouts;
    MonitorSettings monitor;
    log::LogSettings log;
};

/**
 * @brief Read a configuration object. Keys that are absent keep defaults.
 *
 * Timeouts and the monitor interval are given in seconds.
 * @throws airmon::error::ConfigError on a wrong type or invalid value
 */
[[nodiscard]] auto parseConfig(const nlohmann::json& json) -> AirmonConfig;

/**
 * @brief Load and parse a JSON file.
 * @throws airmon::error::ConfigError when the file is unreadable or malformed
 */
[[nodiscard]] auto loadConfig(const std::filesystem::path& path)
    -> AirmonConfig;

/**
 * @brief Apply AIRMON_LOG_LEVEL, AIRMON_LOG_FILE, AIRMON_MONITOR_INTERVAL and
 * AIRMON_COMMAND_TIMEOUT_SCALE from the environment.
 * @throws airmon::error::ConfigError when a variable cannot be parsed
 */
void applyEnvironment(AirmonConfig& config);

/**
 * @brief Serialize with the same layout parseConfig() accepts.
 */
[[nodiscard]] auto toJson(const AirmonConfig& config) -> nlohmann::json;

}  // namespace airmon::config

#endif  // AIRMON_CONFIG_CONFIG_HPP
