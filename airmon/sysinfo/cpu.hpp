/*
 * cpu.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: CPU usage sampling

**************************************************/

#ifndef AIRMON_SYSINFO_CPU_HPP
#define AIRMON_SYSINFO_CPU_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

namespace airmon::sysinfo {

/**
 * @brief Aggregate CPU tick counters.
 */
struct CpuTimes {
    std::uint64_t idle{0};
    std::uint64_t total{0};
};

/**
 * @brief Parse the aggregate "cpu" line of /proc/stat. iowait counts as idle.
 */
[[nodiscard]] auto parseProcStatCpu(std::string_view content)
    -> std::optional<CpuTimes>;

/**
 * @brief Busy percentage between two samples, clamped to [0, 100].
 */
[[nodiscard]] auto cpuUsageBetween(const CpuTimes& before,
                                   const CpuTimes& after) -> float;

/**
 * @brief Current CPU usage in percent, measured over `window`.
 * @return 0.0 when the platform counters are unavailable.
 */
[[nodiscard]] auto getCurrentCpuUsage(
    std::chrono::milliseconds window = std::chrono::milliseconds(100))
    -> float;

}  // namespace airmon::sysinfo

#endif  // AIRMON_SYSINFO_CPU_HPP
