/*
 * battery.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Battery state readers for Linux, macOS and Windows

**************************************************/

#ifndef AIRMON_SYSINFO_BATTERY_HPP
#define AIRMON_SYSINFO_BATTERY_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>

#include "airmon/system/command.hpp"

namespace airmon::sysinfo {

/**
 * @brief Battery state. Fields the platform does not report stay empty.
 */
struct BatteryReport {
    std::optional<int> percentage;
    bool plugged{false};
    std::optional<std::int64_t> secondsLeft;
    std::optional<double> powerWatts;
    std::optional<double> temperatureCelsius;

    [[nodiscard]] auto present() const -> bool {
        return percentage.has_value();
    }

    auto operator==(const BatteryReport& other) const -> bool = default;
};

/**
 * @brief First "BAT*" entry below `root`, if any.
 */
[[nodiscard]] auto findBatteryDirectory(
    const std::filesystem::path& root = "/sys/class/power_supply")
    -> std::optional<std::filesystem::path>;

/**
 * @brief Read capacity, status, time_to_*_now, power_now and temp from a
 * sysfs battery directory. Unreadable attributes are skipped.
 */
[[nodiscard]] auto readSysfsBattery(const std::filesystem::path& dir)
    -> BatteryReport;

/**
 * @brief Parse the "Battery Information" section of
 * `system_profiler SPPowerDataType`.
 */
[[nodiscard]] auto parseSystemProfilerPower(std::string_view output)
    -> BatteryReport;

/**
 * @brief Battery state of this host. Never throws; failures are logged and
 * give an empty report.
 */
[[nodiscard]] auto getBatteryReport(system::CommandRunner& runner,
                                    std::chrono::milliseconds profilerTimeout =
                                        std::chrono::seconds(10))
    -> BatteryReport;

}  // namespace airmon::sysinfo

#endif  // AIRMON_SYSINFO_BATTERY_HPP
