/*
 * memory.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Physical memory usage

**************************************************/

#ifndef AIRMON_SYSINFO_MEMORY_HPP
#define AIRMON_SYSINFO_MEMORY_HPP

#include <optional>
#include <string_view>

namespace airmon::sysinfo {

/**
 * @brief Used-memory percentage from /proc/meminfo content.
 *
 * MemAvailable is preferred; older kernels fall back to
 * MemFree + Buffers + Cached.
 */
[[nodiscard]] auto parseMeminfoUsage(std::string_view content)
    -> std::optional<float>;

/**
 * @brief Physical memory usage in percent, 0.0 when unavailable.
 */
[[nodiscard]] auto getMemoryUsage() -> float;

}  // namespace airmon::sysinfo

#endif  // AIRMON_SYSINFO_MEMORY_HPP
