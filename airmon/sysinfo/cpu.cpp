/*
 * cpu.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: CPU usage sampling

**************************************************/

#include "cpu.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>

#ifdef _WIN32
#include <windows.h>
#elif defined(__APPLE__)
#include <mach/mach.h>
#endif

#include <spdlog/spdlog.h>

#include "airmon/utils/string.hpp"

namespace airmon::sysinfo {

namespace {

auto readCpuTimes() -> std::optional<CpuTimes> {
#ifdef _WIN32
    FILETIME idle;
    FILETIME kernel;
    FILETIME user;
    if (GetSystemTimes(&idle, &kernel, &user) == 0) {
        spdlog::error("GetSystemTimes failed: {}", GetLastError());
        return std::nullopt;
    }
    auto toTicks = [](const FILETIME& ft) {
        return (static_cast<std::uint64_t>(ft.dwHighDateTime) << 32) |
               ft.dwLowDateTime;
    };
    // Kernel time already includes idle time.
    return CpuTimes{toTicks(idle), toTicks(kernel) + toTicks(user)};
#elif defined(__APPLE__)
    host_cpu_load_info_data_t load;
    mach_msg_type_number_t count = HOST_CPU_LOAD_INFO_COUNT;
    if (host_statistics(mach_host_self(), HOST_CPU_LOAD_INFO,
                        reinterpret_cast<host_info_t>(&load),
                        &count) != KERN_SUCCESS) {
        spdlog::error("host_statistics(HOST_CPU_LOAD_INFO) failed");
        return std::nullopt;
    }
    CpuTimes times;
    for (int state = 0; state < CPU_STATE_MAX; ++state) {
        times.total += load.cpu_ticks[state];
    }
    times.idle = load.cpu_ticks[CPU_STATE_IDLE];
    return times;
#elif defined(__linux__)
    std::ifstream file("/proc/stat");
    if (!file.is_open()) {
        spdlog::error("Failed to open /proc/stat");
        return std::nullopt;
    }
    std::string line;
    std::getline(file, line);
    return parseProcStatCpu(line);
#else
    return std::nullopt;
#endif
}

}  // namespace

auto parseProcStatCpu(std::string_view content) -> std::optional<CpuTimes> {
    for (const auto& line : utils::splitLines(content)) {
        auto fields = utils::splitWhitespace(line);
        if (fields.empty() || fields[0] != "cpu") {
            continue;
        }
        // user nice system idle iowait irq softirq steal
        if (fields.size() < 5) {
            return std::nullopt;
        }
        CpuTimes times;
        try {
            for (std::size_t i = 1; i < fields.size() && i <= 8; ++i) {
                const auto value = std::stoull(fields[i]);
                times.total += value;
                if (i == 4 || i == 5) {
                    times.idle += value;
                }
            }
        } catch (const std::exception& ex) {
            spdlog::debug("Malformed /proc/stat cpu line: {}", ex.what());
            return std::nullopt;
        }
        return times;
    }
    return std::nullopt;
}

auto cpuUsageBetween(const CpuTimes& before, const CpuTimes& after) -> float {
    if (after.total <= before.total || after.idle < before.idle) {
        return 0.0F;
    }
    const auto totalDelta = static_cast<double>(after.total - before.total);
    const auto idleDelta = static_cast<double>(after.idle - before.idle);
    const auto usage = (totalDelta - idleDelta) / totalDelta * 100.0;
    return static_cast<float>(std::clamp(usage, 0.0, 100.0));
}

auto getCurrentCpuUsage(std::chrono::milliseconds window) -> float {
    auto before = readCpuTimes();
    if (!before) {
        return 0.0F;
    }
    std::this_thread::sleep_for(window);
    auto after = readCpuTimes();
    if (!after) {
        return 0.0F;
    }
    return cpuUsageBetween(*before, *after);
}

}  // namespace airmon::sysinfo
