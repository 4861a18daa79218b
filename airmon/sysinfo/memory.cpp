/*
 * memory.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Physical memory usage

**************************************************/

#include "memory.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <map>
#include <sstream>
#include <string>

#ifdef _WIN32
#include <windows.h>
#elif defined(__APPLE__)
#include <mach/mach.h>
#include <sys/sysctl.h>
#endif

#include <spdlog/spdlog.h>

#include "airmon/utils/string.hpp"

namespace airmon::sysinfo {

auto parseMeminfoUsage(std::string_view content) -> std::optional<float> {
    std::map<std::string, std::uint64_t> fields;
    for (const auto& line : utils::splitLines(content)) {
        auto tokens = utils::splitWhitespace(line);
        if (tokens.size() < 2 || !tokens[0].ends_with(':')) {
            continue;
        }
        try {
            fields[tokens[0].substr(0, tokens[0].size() - 1)] =
                std::stoull(tokens[1]);
        } catch (const std::exception&) {
            continue;
        }
    }

    auto total = fields.find("MemTotal");
    if (total == fields.end() || total->second == 0) {
        return std::nullopt;
    }
    std::uint64_t available = 0;
    if (auto it = fields.find("MemAvailable"); it != fields.end()) {
        available = it->second;
    } else {
        available = fields["MemFree"] + fields["Buffers"] + fields["Cached"];
    }
    available = std::min(available, total->second);
    const auto used = static_cast<double>(total->second - available);
    return static_cast<float>(used / static_cast<double>(total->second) *
                              100.0);
}

auto getMemoryUsage() -> float {
#ifdef _WIN32
    MEMORYSTATUSEX status;
    status.dwLength = sizeof(status);
    if (GlobalMemoryStatusEx(&status) == 0) {
        spdlog::error("GlobalMemoryStatusEx failed: {}", GetLastError());
        return 0.0F;
    }
    return static_cast<float>(status.dwMemoryLoad);
#elif defined(__APPLE__)
    std::uint64_t totalBytes = 0;
    std::size_t length = sizeof(totalBytes);
    int mib[2] = {CTL_HW, HW_MEMSIZE};
    if (sysctl(mib, 2, &totalBytes, &length, nullptr, 0) != 0 ||
        totalBytes == 0) {
        spdlog::error("sysctl(HW_MEMSIZE) failed");
        return 0.0F;
    }
    vm_statistics64_data_t vmStats;
    mach_msg_type_number_t count = HOST_VM_INFO64_COUNT;
    if (host_statistics64(mach_host_self(), HOST_VM_INFO64,
                          reinterpret_cast<host_info64_t>(&vmStats),
                          &count) != KERN_SUCCESS) {
        spdlog::error("host_statistics64(HOST_VM_INFO64) failed");
        return 0.0F;
    }
    const auto pageSize = static_cast<std::uint64_t>(vm_kernel_page_size);
    const auto used = (static_cast<std::uint64_t>(vmStats.active_count) +
                       vmStats.wire_count + vmStats.compressor_page_count) *
                      pageSize;
    return static_cast<float>(std::min<double>(
        100.0, static_cast<double>(used) / static_cast<double>(totalBytes) *
                   100.0));
#elif defined(__linux__)
    std::ifstream file("/proc/meminfo");
    if (!file.is_open()) {
        spdlog::error("Failed to open /proc/meminfo");
        return 0.0F;
    }
    std::ostringstream content;
    content << file.rdbuf();
    if (auto usage = parseMeminfoUsage(content.str())) {
        return *usage;
    }
    spdlog::error("/proc/meminfo has no usable MemTotal");
    return 0.0F;
#else
    return 0.0F;
#endif
}

}  // namespace airmon::sysinfo
