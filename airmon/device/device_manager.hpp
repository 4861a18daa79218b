/*
 * device_manager.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Aggregates detectors and routes device management

**************************************************/

#ifndef AIRMON_DEVICE_DEVICE_MANAGER_HPP
#define AIRMON_DEVICE_DEVICE_MANAGER_HPP

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "airmon/config/config.hpp"
#include "airmon/device/backends.hpp"
#include "airmon/device/detector.hpp"
#include "airmon/device/wireless_device.hpp"

namespace airmon::device {

/**
 * @brief Counts over the current device collection. Buckets with a zero
 * count are never present.
 */
struct DeviceStatistics {
    std::size_t totalDevices{0};
    std::map<DeviceType, std::size_t> byType;
    std::map<DeviceStatus, std::size_t> byStatus;
    std::size_t manageable{0};
};

using ScanObserver = std::function<void(const std::vector<WirelessDevice>&)>;

/**
 * @brief Runs every detector and keeps the latest combined result.
 *
 * Detectors are consulted in a fixed order: Bluetooth, USB, Network. The
 * collection is replaced on every scan and nothing is de-duplicated, so a
 * device seen by two detectors appears twice.
 */
class DeviceManager {
public:
    /**
     * @brief Build the standard three detectors over `backends`.
     */
    explicit DeviceManager(DetectionBackends backends,
                           config::CommandTimeouts timeouts = {});

    /**
     * @brief Use the given detectors, in order.
     */
    explicit DeviceManager(
        std::vector<std::unique_ptr<WirelessDetector>> detectors);

    ~DeviceManager();

    DeviceManager(const DeviceManager&) = delete;
    auto operator=(const DeviceManager&) -> DeviceManager& = delete;

    /**
     * @brief Register a callback run after every scan with the new
     * collection. Callback exceptions are logged and ignored.
     */
    void addScanObserver(ScanObserver observer);

    /**
     * @brief Replace the collection with a fresh result from all detectors.
     *
     * A detector that throws is logged and contributes nothing.
     */
    auto scan() -> const std::vector<WirelessDevice>&;

    [[nodiscard]] auto devices() const -> const std::vector<WirelessDevice>&;

    [[nodiscard]] auto devicesByType(DeviceType type) const
        -> std::vector<WirelessDevice>;
    [[nodiscard]] auto devicesByStatus(DeviceStatus status) const
        -> std::vector<WirelessDevice>;

    /// First device with exactly this name, or nullptr.
    [[nodiscard]] auto findByName(std::string_view name) -> WirelessDevice*;
    /// First device with exactly this mac address, or nullptr.
    [[nodiscard]] auto findByMac(std::string_view mac) -> WirelessDevice*;
    /// First device for which WirelessDevice::matches() holds, or nullptr.
    [[nodiscard]] auto findMatching(const WirelessDevice& device)
        -> WirelessDevice*;

    /**
     * @brief Enable through the first detector that can manage the device.
     *
     * On success `device.status` becomes Enabled; on failure it is untouched.
     */
    auto enable(WirelessDevice& device) -> bool;
    auto disable(WirelessDevice& device) -> bool;

    [[nodiscard]] auto canManage(const WirelessDevice& device) const -> bool;
    [[nodiscard]] auto manageableDevices() const -> std::vector<WirelessDevice>;

    /// Detector that enable()/disable() would use, or nullptr.
    [[nodiscard]] auto detectorFor(const WirelessDevice& device) const
        -> WirelessDetector*;

    [[nodiscard]] auto statistics() const -> DeviceStatistics;

    /**
     * @brief Rescan and return the fresh record matching `device`.
     */
    auto refresh(const WirelessDevice& device) -> std::optional<WirelessDevice>;

    [[nodiscard]] auto detectorCount() const -> std::size_t {
        return detectors_.size();
    }

private:
    using Action = bool (WirelessDetector::*)(const WirelessDevice&);
    auto manage(WirelessDevice& device, Action action, DeviceStatus onSuccess,
                std::string_view verb) -> bool;

    std::vector<std::unique_ptr<WirelessDetector>> detectors_;
    std::vector<WirelessDevice> devices_;
    std::vector<ScanObserver> observers_;
};

}  // namespace airmon::device

#endif  // AIRMON_DEVICE_DEVICE_MANAGER_HPP
