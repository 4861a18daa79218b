/*
 * platform.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Host platform identification

**************************************************/

#include "platform.hpp"

#ifdef _WIN32
#include <windows.h>
#else
#include <sys/utsname.h>
#endif

#include <spdlog/spdlog.h>

namespace airmon::system {

auto platformName(Platform platform) -> std::string_view {
    switch (platform) {
        case Platform::Windows:
            return "Windows";
        case Platform::Linux:
            return "Linux";
        case Platform::MacOS:
            return "Darwin";
        case Platform::Other:
            break;
    }
    return "Unknown";
}

auto getOsVersion() -> std::string {
#ifdef _WIN32
    char buffer[256] = {0};
    DWORD size = sizeof(buffer);
    if (RegGetValueA(HKEY_LOCAL_MACHINE,
                     "SOFTWARE\\Microsoft\\Windows NT\\CurrentVersion",
                     "CurrentBuild", RRF_RT_REG_SZ, nullptr, buffer,
                     &size) == ERROR_SUCCESS) {
        return std::string("build ") + buffer;
    }
    spdlog::debug("Unable to read Windows build number from registry");
    return "unknown";
#else
    struct utsname info {};
    if (uname(&info) != 0) {
        spdlog::debug("uname() failed while reading OS version");
        return "unknown";
    }
    return info.release;
#endif
}

auto getArchitecture() -> std::string {
#ifdef _WIN32
    SYSTEM_INFO info;
    GetNativeSystemInfo(&info);
    switch (info.wProcessorArchitecture) {
        case PROCESSOR_ARCHITECTURE_AMD64:
            return "x86_64";
        case PROCESSOR_ARCHITECTURE_ARM64:
            return "arm64";
        case PROCESSOR_ARCHITECTURE_INTEL:
            return "x86";
        case PROCESSOR_ARCHITECTURE_ARM:
            return "arm";
        default:
            return "unknown";
    }
#else
    struct utsname info {};
    if (uname(&info) != 0) {
        return "unknown";
    }
    return info.machine;
#endif
}

}  // namespace airmon::system
