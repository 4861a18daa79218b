/*
 * config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Runtime configuration: probe timeouts, logging, monitor

**************************************************/

#include "config.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "airmon/error/exception.hpp"

namespace airmon::config {

using json = nlohmann::json;

namespace {

auto toMillis(double seconds, const char* key) -> std::chrono::milliseconds {
    if (!(seconds > 0.0)) {
        THROW_CONFIG_ERROR("'", key, "' must be a positive number of seconds");
    }
    return std::chrono::milliseconds(
        static_cast<std::chrono::milliseconds::rep>(seconds * 1000.0));
}

auto toSeconds(std::chrono::milliseconds ms) -> double {
    return static_cast<double>(ms.count()) / 1000.0;
}

void readTimeout(const json& section, const char* key,
                 std::chrono::milliseconds& target) {
    if (auto it = section.find(key); it != section.end()) {
        target = toMillis(it->get<double>(), key);
    }
}

auto parseDouble(const char* name, const std::string& text) -> double {
    try {
        size_t idx = 0;
        double value = std::stod(text, &idx);
        if (idx != text.size()) {
            THROW_CONFIG_ERROR(name, " has trailing characters: '", text, "'");
        }
        return value;
    } catch (const std::invalid_argument&) {
        THROW_CONFIG_ERROR(name, " is not a number: '", text, "'");
    } catch (const std::out_of_range&) {
        THROW_CONFIG_ERROR(name, " is out of range: '", text, "'");
    }
}

}  // namespace

void CommandTimeouts::scale(double factor) {
    if (!(factor > 0.0)) {
        THROW_CONFIG_ERROR("Timeout scale must be positive, got ", factor);
    }
    for (auto* timeout :
         {&bluetoothctl, &bluetoothProfiler, &bluetoothPower, &lsusb,
          &usbProfiler, &iwconfig, &netshWlan, &networksetup, &linkToggle}) {
        *timeout = std::chrono::milliseconds(
            static_cast<std::chrono::milliseconds::rep>(
                static_cast<double>(timeout->count()) * factor));
    }
}

auto parseConfig(const json& root) -> AirmonConfig {
    AirmonConfig config;
    if (!root.is_object()) {
        THROW_CONFIG_ERROR("Configuration root must be a JSON object");
    }

    try {
        if (auto section = root.find("log"); section != root.end()) {
            config.log.level = section->value("level", config.log.level);
            config.log.pattern = section->value("pattern", config.log.pattern);
            config.log.file = section->value("file", config.log.file);
            config.log.maxFileSize =
                section->value("max_file_size", config.log.maxFileSize);
            config.log.maxFiles = section->value("max_files", config.log.maxFiles);
        }

        if (auto monitor = root.find("monitor"); monitor != root.end()) {
            if (auto it = monitor->find("interval"); it != monitor->end()) {
                double interval = it->get<double>();
                if (!(interval > 0.0)) {
                    THROW_CONFIG_ERROR("'monitor.interval' must be positive");
                }
                config.monitor.interval = Seconds(interval);
            }
        }

        if (auto timeouts = root.find("timeouts"); timeouts != root.end()) {
            auto& t = config.timeouts;
            readTimeout(*timeouts, "bluetoothctl", t.bluetoothctl);
            readTimeout(*timeouts, "bluetooth_profiler", t.bluetoothProfiler);
            readTimeout(*timeouts, "bluetooth_power", t.bluetoothPower);
            readTimeout(*timeouts, "lsusb", t.lsusb);
            readTimeout(*timeouts, "usb_profiler", t.usbProfiler);
            readTimeout(*timeouts, "iwconfig", t.iwconfig);
            readTimeout(*timeouts, "netsh_wlan", t.netshWlan);
            readTimeout(*timeouts, "networksetup", t.networksetup);
            readTimeout(*timeouts, "link_toggle", t.linkToggle);
        }
    } catch (const json::exception& ex) {
        THROW_CONFIG_ERROR("Invalid configuration value: ", ex.what());
    }

    // Reject unknown levels early rather than at logger setup.
    try {
        (void)log::parseLevel(config.log.level);
    } catch (const error::InvalidArgument& ex) {
        THROW_CONFIG_ERROR(ex.getMessage());
    }
    return config;
}

auto loadConfig(const std::filesystem::path& path) -> AirmonConfig {
    std::ifstream file(path);
    if (!file.is_open()) {
        THROW_CONFIG_ERROR("Cannot open configuration file: ", path.string());
    }

    json root;
    try {
        root = json::parse(file);
    } catch (const json::parse_error& ex) {
        THROW_CONFIG_ERROR("Malformed configuration file ", path.string(),
                           ": ", ex.what());
    }
    spdlog::debug("Loaded configuration from {}", path.string());
    return parseConfig(root);
}

void applyEnvironment(AirmonConfig& config) {
    if (const char* level = std::getenv("AIRMON_LOG_LEVEL")) {
        try {
            (void)log::parseLevel(level);
        } catch (const error::InvalidArgument& ex) {
            THROW_CONFIG_ERROR("AIRMON_LOG_LEVEL: ", ex.getMessage());
        }
        config.log.level = level;
    }
    if (const char* file = std::getenv("AIRMON_LOG_FILE")) {
        config.log.file = file;
    }
    if (const char* interval = std::getenv("AIRMON_MONITOR_INTERVAL")) {
        double value = parseDouble("AIRMON_MONITOR_INTERVAL", interval);
        if (!(value > 0.0)) {
            THROW_CONFIG_ERROR("AIRMON_MONITOR_INTERVAL must be positive");
        }
        config.monitor.interval = Seconds(value);
    }
    if (const char* scale = std::getenv("AIRMON_COMMAND_TIMEOUT_SCALE")) {
        config.timeouts.scale(
            parseDouble("AIRMON_COMMAND_TIMEOUT_SCALE", scale));
    }
}

auto toJson(const AirmonConfig& config) -> json {
    const auto& t = config.timeouts;
    return json{
        {"log",
         {{"level", config.log.level},
          {"pattern", config.log.pattern},
          {"file", config.log.file},
          {"max_file_size", config.log.maxFileSize},
          {"max_files", config.log.maxFiles}}},
        {"monitor", {{"interval", config.monitor.interval.count()}}},
        {"timeouts",
         {{"bluetoothctl", toSeconds(t.bluetoothctl)},
          {"bluetooth_profiler", toSeconds(t.bluetoothProfiler)},
          {"bluetooth_power", toSeconds(t.bluetoothPower)},
          {"lsusb", toSeconds(t.lsusb)},
          {"usb_profiler", toSeconds(t.usbProfiler)},
          {"iwconfig", toSeconds(t.iwconfig)},
          {"netsh_wlan", toSeconds(t.netshWlan)},
          {"networksetup", toSeconds(t.networksetup)},
          {"link_toggle", toSeconds(t.linkToggle)}}}};
}

}  // namespace airmon::config
