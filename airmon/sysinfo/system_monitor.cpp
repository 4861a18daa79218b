/*
 * system_monitor.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Host telemetry snapshot and background sampler

**************************************************/

#include "system_monitor.hpp"

#include <spdlog/spdlog.h>

#include "airmon/sysinfo/cpu.hpp"
#include "airmon/sysinfo/memory.hpp"
#include "airmon/system/platform.hpp"

namespace airmon::sysinfo {

auto collectSample(system::CommandRunner& runner,
                   device::NetInterfaceSource* interfaces) -> TelemetrySample {
    TelemetrySample sample;
    SystemInfo& info = sample.system;

    info.platform =
        std::string(system::platformName(system::currentPlatform()));
    try {
        info.platformVersion = system::getOsVersion();
        info.architecture = system::getArchitecture();
    } catch (const std::exception& ex) {
        spdlog::error("Error getting platform details: {}", ex.what());
    }
    if (info.architecture.empty()) {
        info.architecture = "Unknown";
    }

    info.cpuUsage = getCurrentCpuUsage();
    info.memoryUsage = getMemoryUsage();

    if (interfaces != nullptr) {
        try {
            for (const auto& snapshot : interfaces->listInterfaces()) {
                info.networkInterfaces.push_back(snapshot.name);
            }
        } catch (const std::exception& ex) {
            spdlog::warn("Interface enumeration failed: {}", ex.what());
        }
    }

    sample.battery = getBatteryReport(runner);
    info.batteryPercentage = sample.battery.percentage;
    info.batteryPlugged = sample.battery.plugged;
    return sample;
}

auto collectSystemInfo() -> SystemInfo {
    system::ProcessCommandRunner runner;
    auto interfaces = device::createNetInterfaceSource();
    return collectSample(runner, interfaces.get()).system;
}

void to_json(nlohmann::json& j, const SystemInfo& info) {
    j = nlohmann::json{
        {"platform", info.platform},
        {"platform_version", info.platformVersion},
        {"architecture", info.architecture},
        {"battery_percentage", nullptr},
        {"battery_plugged", info.batteryPlugged},
        {"cpu_usage", info.cpuUsage},
        {"memory_usage", info.memoryUsage},
        {"network_interfaces", info.networkInterfaces}};
    if (info.batteryPercentage) {
        j["battery_percentage"] = *info.batteryPercentage;
    }
}

void to_json(nlohmann::json& j, const BatteryReport& report) {
    j = nlohmann::json{{"percentage", nullptr},
                       {"plugged", report.plugged},
                       {"time_left", nullptr},
                       {"power_consumption", nullptr},
                       {"temperature", nullptr}};
    if (report.percentage) {
        j["percentage"] = *report.percentage;
    }
    if (report.secondsLeft) {
        j["time_left"] = *report.secondsLeft;
    }
    if (report.powerWatts) {
        j["power_consumption"] = *report.powerWatts;
    }
    if (report.temperatureCelsius) {
        j["temperature"] = *report.temperatureCelsius;
    }
}

SystemMonitor::SystemMonitor(Sampler sampler) : sampler_(std::move(sampler)) {
    if (!sampler_) {
        sampler_ = [runner = std::make_shared<system::ProcessCommandRunner>(),
                    interfaces = device::createNetInterfaceSource()]() {
            return collectSample(*runner, interfaces.get());
        };
    }
}

SystemMonitor::~SystemMonitor() { stop(); }

auto SystemMonitor::start(Callback callback,
                          std::chrono::duration<double> interval) -> bool {
    if (interval.count() <= 0.0) {
        spdlog::error("Monitor interval must be positive, got {}s",
                      interval.count());
        return false;
    }
    if (running_.exchange(true)) {
        spdlog::warn("System monitor is already running");
        return false;
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    if (callback) {
        callbacks_.push_back(std::move(callback));
    }
    thread_ = std::thread([this, interval] { run(interval); });
    spdlog::info("System monitor started ({}s interval)", interval.count());
    return true;
}

void SystemMonitor::stop() {
    if (running_.exchange(false)) {
        {
            std::lock_guard lock(mutex_);
        }
        wake_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }
        spdlog::info("System monitor stopped");
    }
}

auto SystemMonitor::isRunning() const noexcept -> bool {
    return running_.load();
}

auto SystemMonitor::cachedSystemInfo() const -> std::optional<SystemInfo> {
    std::lock_guard lock(mutex_);
    return cachedInfo_;
}

auto SystemMonitor::cachedBattery() const -> BatteryReport {
    std::lock_guard lock(mutex_);
    return cachedBattery_;
}

auto SystemMonitor::sampleCount() const noexcept -> std::size_t {
    return samples_.load();
}

void SystemMonitor::run(std::chrono::duration<double> interval) {
    const auto period =
        std::chrono::duration_cast<std::chrono::milliseconds>(interval);
    while (running_.load()) {
        try {
            auto sample = sampler_();
            {
                std::lock_guard lock(mutex_);
                cachedInfo_ = sample.system;
                cachedBattery_ = sample.battery;
            }
            ++samples_;
            for (const auto& callback : callbacks_) {
                try {
                    callback(sample.system, sample.battery);
                } catch (const std::exception& ex) {
                    spdlog::error("Error in system monitor callback: {}",
                                  ex.what());
                }
            }
        } catch (const std::exception& ex) {
            spdlog::error("Error in system monitoring: {}", ex.what());
        }

        std::unique_lock lock(mutex_);
        wake_.wait_for(lock, period, [this] { return !running_.load(); });
    }
}

}  // namespace airmon::sysinfo
