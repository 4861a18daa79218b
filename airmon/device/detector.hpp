/*
 * detector.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Common interface of the per-category device detectors

**************************************************/

#ifndef AIRMON_DEVICE_DETECTOR_HPP
#define AIRMON_DEVICE_DETECTOR_HPP

#include <string_view>
#include <vector>

#include "airmon/device/wireless_device.hpp"

namespace airmon::device {

/**
 * @brief Probes one category of wireless hardware.
 *
 * None of the methods throw. Probe failures are logged and reduce the result
 * to whatever was found so far; management failures return false.
 */
class WirelessDetector {
public:
    virtual ~WirelessDetector() = default;

    /// Category name used in log messages, e.g. "Bluetooth".
    [[nodiscard]] virtual auto name() const -> std::string_view = 0;

    /**
     * @brief Find the devices of this category currently present.
     */
    virtual auto detect() -> std::vector<WirelessDevice> = 0;

    /**
     * @brief Whether enable()/disable() apply to this device. Decided by
     * device type only.
     */
    [[nodiscard]] virtual auto canManage(const WirelessDevice& device) const
        -> bool = 0;

    virtual auto enable(const WirelessDevice& device) -> bool = 0;
    virtual auto disable(const WirelessDevice& device) -> bool = 0;
};

}  // namespace airmon::device

#endif  // AIRMON_DEVICE_DETECTOR_HPP
