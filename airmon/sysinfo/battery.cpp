/*
 * battery.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Battery state readers for Linux, macOS and Windows

**************************************************/

#include "battery.hpp"

#include <algorithm>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#endif

#include <spdlog/spdlog.h>

#include "airmon/system/platform.hpp"
#include "airmon/utils/string.hpp"

namespace airmon::sysinfo {

namespace fs = std::filesystem;

namespace {

auto readLine(const fs::path& file) -> std::optional<std::string> {
    std::ifstream in(file);
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::string line;
    if (!std::getline(in, line)) {
        return std::nullopt;
    }
    return utils::trim(line);
}

auto readInteger(const fs::path& file) -> std::optional<std::int64_t> {
    auto text = readLine(file);
    if (!text || text->empty()) {
        return std::nullopt;
    }
    try {
        return std::stoll(*text);
    } catch (const std::exception& ex) {
        spdlog::debug("Ignoring non-numeric {}: {}", file.string(), ex.what());
        return std::nullopt;
    }
}

// "2:30" -> 9000 seconds.
auto parseHoursMinutes(const std::string& text) -> std::optional<std::int64_t> {
    auto parts = utils::splitString(text, ':');
    if (parts.size() != 2) {
        return std::nullopt;
    }
    try {
        return (std::stoll(parts[0]) * 60 + std::stoll(parts[1])) * 60;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

}  // namespace

auto findBatteryDirectory(const fs::path& root) -> std::optional<fs::path> {
    std::error_code ec;
    fs::directory_iterator it(root, ec);
    if (ec) {
        return std::nullopt;
    }
    std::vector<fs::path> candidates;
    for (const auto& entry : it) {
        if (entry.path().filename().string().starts_with("BAT")) {
            candidates.push_back(entry.path());
        }
    }
    if (candidates.empty()) {
        return std::nullopt;
    }
    std::ranges::sort(candidates);
    return candidates.front();
}

auto readSysfsBattery(const fs::path& dir) -> BatteryReport {
    BatteryReport report;
    if (auto capacity = readInteger(dir / "capacity")) {
        report.percentage = static_cast<int>(std::clamp<std::int64_t>(*capacity, 0, 100));
    }
    if (auto status = readLine(dir / "status")) {
        const auto lowered = utils::toLower(*status);
        report.plugged = lowered == "charging" || lowered == "full";
    }
    report.secondsLeft = readInteger(
        dir / (report.plugged ? "time_to_full_now" : "time_to_empty_now"));
    // power_now is reported in microwatts.
    if (auto power = readInteger(dir / "power_now")) {
        report.powerWatts = static_cast<double>(*power) / 1'000'000.0;
    }
    // temp is reported in tenths of a degree.
    if (auto temp = readInteger(dir / "temp")) {
        report.temperatureCelsius = static_cast<double>(*temp) / 10.0;
    }
    return report;
}

auto parseSystemProfilerPower(std::string_view output) -> BatteryReport {
    BatteryReport report;
    bool inBattery = false;
    std::optional<std::int64_t> remainingMah;
    std::optional<std::int64_t> fullMah;

    for (const auto& raw : utils::splitLines(output)) {
        const std::string line = utils::trim(raw);
        if (line.find("Battery Information:") != std::string::npos) {
            inBattery = true;
            continue;
        }
        if (!inBattery) {
            continue;
        }
        try {
            if (auto value = utils::valueAfter(line, "State of Charge (%):")) {
                report.percentage = std::clamp(std::stoi(*value), 0, 100);
            } else if (auto value =
                           utils::valueAfter(line, "Charge Remaining (mAh):")) {
                remainingMah = std::stoll(*value);
            } else if (auto value = utils::valueAfter(
                           line, "Full Charge Capacity (mAh):")) {
                fullMah = std::stoll(*value);
            } else if (auto value = utils::valueAfter(line, "Fully Charged:")) {
                report.plugged = report.plugged || *value == "Yes";
            } else if (auto value = utils::valueAfter(line, "Charging:")) {
                report.plugged = report.plugged || *value == "Yes";
            } else if (auto value = utils::valueAfter(line, "Time Remaining:")) {
                if (*value != "0:00") {
                    report.secondsLeft = parseHoursMinutes(*value);
                }
            }
        } catch (const std::exception& ex) {
            spdlog::debug("Skipping power line '{}': {}", line, ex.what());
        }
    }

    if (!report.percentage && remainingMah && fullMah && *fullMah > 0) {
        report.percentage = static_cast<int>(
            std::clamp<std::int64_t>(*remainingMah * 100 / *fullMah, 0, 100));
    }
    return report;
}

auto getBatteryReport([[maybe_unused]] system::CommandRunner& runner,
                      [[maybe_unused]] std::chrono::milliseconds
                          profilerTimeout) -> BatteryReport {
    BatteryReport report;
#ifdef _WIN32
    SYSTEM_POWER_STATUS powerStatus;
    if (GetSystemPowerStatus(&powerStatus) == 0) {
        spdlog::error("GetSystemPowerStatus failed: {}", GetLastError());
        return report;
    }
    // 128 = no system battery, 255 = unknown.
    if ((powerStatus.BatteryFlag & 128) == 0 &&
        powerStatus.BatteryLifePercent != 255) {
        report.percentage = powerStatus.BatteryLifePercent;
    }
    report.plugged = powerStatus.ACLineStatus == 1;
    if (powerStatus.BatteryLifeTime != static_cast<DWORD>(-1)) {
        report.secondsLeft = powerStatus.BatteryLifeTime;
    }
#elif defined(__linux__)
    if (auto dir = findBatteryDirectory()) {
        report = readSysfsBattery(*dir);
    } else {
        spdlog::debug("No battery found under /sys/class/power_supply");
    }
#elif defined(__APPLE__)
    try {
        auto result = runner.run({"system_profiler", "SPPowerDataType"},
                                 profilerTimeout);
        if (result.succeeded()) {
            report = parseSystemProfilerPower(result.output);
        }
    } catch (const std::exception& ex) {
        spdlog::error("macOS battery detection error: {}", ex.what());
    }
#endif
    return report;
}

}  // namespace airmon::sysinfo
