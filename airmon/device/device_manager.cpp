/*
 * device_manager.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Aggregates detectors and routes device management

**************************************************/

#include "device_manager.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

#include <spdlog/spdlog.h>

#include "airmon/device/bluetooth_detector.hpp"
#include "airmon/device/network_detector.hpp"
#include "airmon/device/usb_detector.hpp"

namespace airmon::device {

DeviceManager::DeviceManager(DetectionBackends backends,
                             config::CommandTimeouts timeouts) {
    detectors_.push_back(
        std::make_unique<BluetoothDetector>(backends, timeouts));
    detectors_.push_back(
        std::make_unique<UsbWirelessDetector>(backends, timeouts));
    detectors_.push_back(
        std::make_unique<NetworkWirelessDetector>(std::move(backends),
                                                  timeouts));
}

DeviceManager::DeviceManager(
    std::vector<std::unique_ptr<WirelessDetector>> detectors)
    : detectors_(std::move(detectors)) {}

DeviceManager::~DeviceManager() = default;

void DeviceManager::addScanObserver(ScanObserver observer) {
    observers_.push_back(std::move(observer));
}

auto DeviceManager::scan() -> const std::vector<WirelessDevice>& {
    devices_.clear();

    for (const auto& detector : detectors_) {
        try {
            auto found = detector->detect();
            spdlog::debug("{} detector found {} devices", detector->name(),
                          found.size());
            std::ranges::move(found, std::back_inserter(devices_));
        } catch (const std::exception& ex) {
            spdlog::error("Error with detector {}: {}", detector->name(),
                          ex.what());
        } catch (...) {
            spdlog::error("Unknown exception in detector {}", detector->name());
        }
    }
    spdlog::info("Scan complete: {} wireless devices", devices_.size());

    for (const auto& observer : observers_) {
        try {
            observer(devices_);
        } catch (const std::exception& ex) {
            spdlog::error("Error in scan observer: {}", ex.what());
        } catch (...) {
            spdlog::error("Unknown exception in scan observer");
        }
    }
    return devices_;
}

auto DeviceManager::devices() const -> const std::vector<WirelessDevice>& {
    return devices_;
}

auto DeviceManager::devicesByType(DeviceType type) const
    -> std::vector<WirelessDevice> {
    std::vector<WirelessDevice> result;
    std::ranges::copy_if(devices_, std::back_inserter(result),
                         [type](const auto& d) { return d.deviceType == type; });
    return result;
}

auto DeviceManager::devicesByStatus(DeviceStatus status) const
    -> std::vector<WirelessDevice> {
    std::vector<WirelessDevice> result;
    std::ranges::copy_if(devices_, std::back_inserter(result),
                         [status](const auto& d) { return d.status == status; });
    return result;
}

auto DeviceManager::findByName(std::string_view name) -> WirelessDevice* {
    auto it = std::ranges::find_if(
        devices_, [name](const auto& d) { return d.name == name; });
    return it != devices_.end() ? &*it : nullptr;
}

auto DeviceManager::findByMac(std::string_view mac) -> WirelessDevice* {
    auto it = std::ranges::find_if(devices_, [mac](const auto& d) {
        return d.macAddress && *d.macAddress == mac;
    });
    return it != devices_.end() ? &*it : nullptr;
}

auto DeviceManager::findMatching(const WirelessDevice& device)
    -> WirelessDevice* {
    auto it = std::ranges::find_if(
        devices_, [&device](const auto& d) { return d.matches(device); });
    return it != devices_.end() ? &*it : nullptr;
}

auto DeviceManager::enable(WirelessDevice& device) -> bool {
    return manage(device, &WirelessDetector::enable, DeviceStatus::Enabled,
                  "enable");
}

auto DeviceManager::disable(WirelessDevice& device) -> bool {
    return manage(device, &WirelessDetector::disable, DeviceStatus::Disabled,
                  "disable");
}

auto DeviceManager::manage(WirelessDevice& device, Action action,
                           DeviceStatus onSuccess, std::string_view verb)
    -> bool {
    auto* detector = detectorFor(device);
    if (detector == nullptr) {
        spdlog::warn("No detector can {} '{}'", verb, device.name);
        return false;
    }

    bool success = false;
    try {
        success = (detector->*action)(device);
    } catch (const std::exception& ex) {
        spdlog::error("{} detector failed to {} '{}': {}", detector->name(),
                      verb, device.name, ex.what());
    }
    if (success) {
        device.status = onSuccess;
        spdlog::info("{}d '{}' via {} detector", verb, device.name,
                     detector->name());
    } else {
        spdlog::warn("Failed to {} '{}'", verb, device.name);
    }
    return success;
}

auto DeviceManager::canManage(const WirelessDevice& device) const -> bool {
    return detectorFor(device) != nullptr;
}

auto DeviceManager::manageableDevices() const -> std::vector<WirelessDevice> {
    std::vector<WirelessDevice> result;
    std::ranges::copy_if(devices_, std::back_inserter(result),
                         [this](const auto& d) { return canManage(d); });
    return result;
}

auto DeviceManager::detectorFor(const WirelessDevice& device) const
    -> WirelessDetector* {
    for (const auto& detector : detectors_) {
        if (detector->canManage(device)) {
            return detector.get();
        }
    }
    return nullptr;
}

auto DeviceManager::statistics() const -> DeviceStatistics {
    DeviceStatistics stats;
    stats.totalDevices = devices_.size();
    for (const auto& device : devices_) {
        ++stats.byType[device.deviceType];
        ++stats.byStatus[device.status];
        if (canManage(device)) {
            ++stats.manageable;
        }
    }
    return stats;
}

auto DeviceManager::refresh(const WirelessDevice& device)
    -> std::optional<WirelessDevice> {
    const WirelessDevice wanted = device;
    scan();
    if (auto* fresh = findMatching(wanted)) {
        return *fresh;
    }
    return std::nullopt;
}

}  // namespace airmon::device
