/*
 * platform.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Host platform identification

**************************************************/

#ifndef AIRMON_SYSTEM_PLATFORM_HPP
#define AIRMON_SYSTEM_PLATFORM_HPP

#include <string>
#include <string_view>

namespace airmon::system {

/**
 * @brief Operating system family. Selects which probes a detector runs.
 */
enum class Platform { Windows, Linux, MacOS, Other };

/**
 * @brief Platform this binary was compiled for.
 */
[[nodiscard]] constexpr auto currentPlatform() -> Platform {
#ifdef _WIN32
    return Platform::Windows;
#elif defined(__APPLE__)
    return Platform::MacOS;
#elif defined(__linux__)
    return Platform::Linux;
#else
    return Platform::Other;
#endif
}

[[nodiscard]] auto platformName(Platform platform) -> std::string_view;

/**
 * @brief Kernel or OS release string, "unknown" when unavailable.
 */
[[nodiscard]] auto getOsVersion() -> std::string;

/**
 * @brief Machine architecture such as "x86_64" or "arm64".
 */
[[nodiscard]] auto getArchitecture() -> std::string;

}  // namespace airmon::system

#endif  // AIRMON_SYSTEM_PLATFORM_HPP
