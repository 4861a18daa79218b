/*
 * system_monitor.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Host telemetry snapshot and background sampler

**************************************************/

#ifndef AIRMON_SYSINFO_SYSTEM_MONITOR_HPP
#define AIRMON_SYSINFO_SYSTEM_MONITOR_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "airmon/device/net_interfaces.hpp"
#include "airmon/sysinfo/battery.hpp"
#include "airmon/system/command.hpp"

namespace airmon::sysinfo {

struct SystemInfo {
    std::string platform;
    std::string platformVersion;
    std::string architecture;
    std::optional<int> batteryPercentage;
    bool batteryPlugged{false};
    float cpuUsage{0.0F};
    float memoryUsage{0.0F};
    std::vector<std::string> networkInterfaces;
};

/**
 * @brief One sampling round of the monitor.
 */
struct TelemetrySample {
    SystemInfo system;
    BatteryReport battery;
};

/**
 * @brief Collect a full snapshot of this host.
 *
 * Each reader degrades independently: a failing reader leaves its fields at
 * their defaults and the rest of the snapshot is still filled.
 *
 * @param runner used for command-based readers (macOS battery)
 * @param interfaces interface enumerator; nullptr skips interface names
 */
[[nodiscard]] auto collectSample(system::CommandRunner& runner,
                                 device::NetInterfaceSource* interfaces)
    -> TelemetrySample;

/**
 * @brief Convenience wrapper using the process runner and the default
 * interface source.
 */
[[nodiscard]] auto collectSystemInfo() -> SystemInfo;

void to_json(nlohmann::json& j, const SystemInfo& info);
void to_json(nlohmann::json& j, const BatteryReport& report);

/**
 * @brief Samples host telemetry on a background thread.
 *
 * Callbacks run on the monitor thread. An exception escaping a callback is
 * logged and does not stop the loop or the remaining callbacks.
 */
class SystemMonitor {
public:
    using Callback =
        std::function<void(const SystemInfo&, const BatteryReport&)>;
    using Sampler = std::function<TelemetrySample()>;

    /**
     * @param sampler produces one sample per round; defaults to
     * collectSample() with the process runner and getifaddrs source.
     */
    explicit SystemMonitor(Sampler sampler = {});
    ~SystemMonitor();

    SystemMonitor(const SystemMonitor&) = delete;
    auto operator=(const SystemMonitor&) -> SystemMonitor& = delete;

    /**
     * @brief Start sampling every `interval`.
     * @return false when already running or the interval is not positive.
     */
    auto start(Callback callback,
               std::chrono::duration<double> interval =
                   std::chrono::duration<double>(2.0)) -> bool;

    /**
     * @brief Stop and join the monitor thread. Safe to call when stopped.
     */
    void stop();

    [[nodiscard]] auto isRunning() const noexcept -> bool;

    [[nodiscard]] auto cachedSystemInfo() const -> std::optional<SystemInfo>;
    [[nodiscard]] auto cachedBattery() const -> BatteryReport;

    /// Number of completed sampling rounds since construction.
    [[nodiscard]] auto sampleCount() const noexcept -> std::size_t;

private:
    void run(std::chrono::duration<double> interval);

    Sampler sampler_;
    std::vector<Callback> callbacks_;

    std::atomic<bool> running_{false};
    std::atomic<std::size_t> samples_{0};
    std::thread thread_;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::optional<SystemInfo> cachedInfo_;
    BatteryReport cachedBattery_;
};

}  // namespace airmon::sysinfo

#endif  // AIRMON_SYSINFO_SYSTEM_MONITOR_HPP
