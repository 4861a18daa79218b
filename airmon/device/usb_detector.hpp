/*
 * usb_detector.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: USB wireless dongle and adapter detection

**************************************************/

#ifndef AIRMON_DEVICE_USB_DETECTOR_HPP
#define AIRMON_DEVICE_USB_DETECTOR_HPP

#include <string_view>
#include <vector>

#include "airmon/config/config.hpp"
#include "airmon/device/backends.hpp"
#include "airmon/device/detector.hpp"

namespace airmon::device {

/**
 * @brief Parse `lsusb` output, keeping lines that name wireless hardware.
 *
 * Expected layout: `Bus 001 Device 004: ID 046d:c52b Logitech, Inc. ...`.
 * Lines with fewer than six tokens or a malformed id token are skipped.
 */
[[nodiscard]] auto parseLsusbOutput(std::string_view output)
    -> std::vector<WirelessDevice>;

/**
 * @brief Parse `system_profiler SPUSBDataType` output.
 *
 * A line ending in ':' whose name has a wireless keyword starts a device;
 * the following "Vendor ID:" line completes and emits it.
 */
[[nodiscard]] auto parseSystemProfilerUsb(std::string_view output)
    -> std::vector<WirelessDevice>;

/**
 * @brief Build the record for a device reported by a structured backend.
 *
 * Never throws: unexpected failures produce an "Unknown USB Wireless Device"
 * record carrying the error text.
 */
[[nodiscard]] auto makeEnumeratedUsbRecord(UsbBackend& backend,
                                           const UsbDeviceInfo& info)
    -> WirelessDevice;

class UsbWirelessDetector : public WirelessDetector {
public:
    UsbWirelessDetector(DetectionBackends backends,
                        config::CommandTimeouts timeouts = {});

    [[nodiscard]] auto name() const -> std::string_view override {
        return "USB";
    }
    auto detect() -> std::vector<WirelessDevice> override;
    [[nodiscard]] auto canManage(const WirelessDevice& device) const
        -> bool override;

    /// USB devices are not toggled by this tool; always false.
    auto enable(const WirelessDevice& device) -> bool override;
    auto disable(const WirelessDevice& device) -> bool override;

private:
    auto detectWithBackend() -> std::vector<WirelessDevice>;
    auto detectFallback() -> std::vector<WirelessDevice>;
    auto detectWindowsFallback() -> std::vector<WirelessDevice>;
    auto detectLinuxFallback() -> std::vector<WirelessDevice>;
    auto detectMacosFallback() -> std::vector<WirelessDevice>;

    DetectionBackends backends_;
    config::CommandTimeouts timeouts_;
};

}  // namespace airmon::device

#endif  // AIRMON_DEVICE_USB_DETECTOR_HPP
