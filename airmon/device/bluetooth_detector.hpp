/*
 * bluetooth_detector.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Bluetooth controller and peripheral detection

**************************************************/

#ifndef AIRMON_DEVICE_BLUETOOTH_DETECTOR_HPP
#define AIRMON_DEVICE_BLUETOOTH_DETECTOR_HPP

#include <string_view>
#include <vector>

#include "airmon/config/config.hpp"
#include "airmon/device/backends.hpp"
#include "airmon/device/detector.hpp"

namespace airmon::device {

/**
 * @brief Parse `bluetoothctl list` or `bluetoothctl paired-devices` output.
 *
 * Lines whose trimmed text starts with `prefix` ("Controller" or "Device")
 * and carry at least three tokens become one record: token 2 is the mac,
 * the rest is the name.
 */
[[nodiscard]] auto parseBluetoothctlOutput(std::string_view output,
                                           std::string_view prefix,
                                           std::string_view interface,
                                           DeviceStatus status)
    -> std::vector<WirelessDevice>;

/**
 * @brief Parse `system_profiler SPBluetoothDataType` output.
 *
 * Every line containing "Address:" yields a device. Its name is the nearest
 * non-empty line without a colon among the five lines above it.
 */
[[nodiscard]] auto parseSystemProfilerBluetooth(std::string_view output)
    -> std::vector<WirelessDevice>;

class BluetoothDetector : public WirelessDetector {
public:
    BluetoothDetector(DetectionBackends backends,
                      config::CommandTimeouts timeouts = {});

    [[nodiscard]] auto name() const -> std::string_view override {
        return "Bluetooth";
    }
    auto detect() -> std::vector<WirelessDevice> override;
    [[nodiscard]] auto canManage(const WirelessDevice& device) const
        -> bool override;
    auto enable(const WirelessDevice& device) -> bool override;
    auto disable(const WirelessDevice& device) -> bool override;

private:
    auto detectWindows() -> std::vector<WirelessDevice>;
    auto detectLinux() -> std::vector<WirelessDevice>;
    auto detectMacos() -> std::vector<WirelessDevice>;
    auto setPower(bool on) -> bool;

    DetectionBackends backends_;
    config::CommandTimeouts timeouts_;
};

}  // namespace airmon::device

#endif  // AIRMON_DEVICE_BLUETOOTH_DETECTOR_HPP
