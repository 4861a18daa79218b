/*
 * network_detector.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Wireless network interface detection and link control

**************************************************/

#ifndef AIRMON_DEVICE_NETWORK_DETECTOR_HPP
#define AIRMON_DEVICE_NETWORK_DETECTOR_HPP

#include <string>
#include <string_view>
#include <vector>

#include "airmon/config/config.hpp"
#include "airmon/device/backends.hpp"
#include "airmon/device/detector.hpp"

namespace airmon::device {

/**
 * @brief Record for an interface reported by the structured source.
 */
[[nodiscard]] auto makeInterfaceRecord(const NetInterfaceSnapshot& snapshot)
    -> WirelessDevice;

/**
 * @brief Parse `iwconfig`: each line with "IEEE 802.11" names an interface
 * in its first token.
 */
[[nodiscard]] auto parseIwconfigOutput(std::string_view output)
    -> std::vector<WirelessDevice>;

/**
 * @brief Parse `netsh wlan show interfaces`: a "Name" line opens a block
 * which the next "State" line completes.
 */
[[nodiscard]] auto parseNetshWlanOutput(std::string_view output)
    -> std::vector<WirelessDevice>;

/**
 * @brief Parse `networksetup -listallhardwareports`: a Wi-Fi "Hardware
 * Port:" block is completed by its "Device:" line.
 */
[[nodiscard]] auto parseNetworksetupOutput(std::string_view output)
    -> std::vector<WirelessDevice>;

class NetworkWirelessDetector : public WirelessDetector {
public:
    NetworkWirelessDetector(DetectionBackends backends,
                            config::CommandTimeouts timeouts = {});

    [[nodiscard]] auto name() const -> std::string_view override {
        return "Network";
    }
    auto detect() -> std::vector<WirelessDevice> override;
    [[nodiscard]] auto canManage(const WirelessDevice& device) const
        -> bool override;

    /**
     * @brief Bring the link up (`ip link` on Linux, `netsh` on Windows).
     *
     * Succeeds whenever the command could be run; a non-zero exit status is
     * only logged.
     */
    auto enable(const WirelessDevice& device) -> bool override;
    auto disable(const WirelessDevice& device) -> bool override;

private:
    auto detectFallback() -> std::vector<WirelessDevice>;
    auto runFallback(const std::vector<std::string>& argv,
                     std::chrono::milliseconds timeout,
                     std::vector<WirelessDevice> (*parser)(std::string_view))
        -> std::vector<WirelessDevice>;
    auto setLink(const WirelessDevice& device, bool up) -> bool;

    DetectionBackends backends_;
    config::CommandTimeouts timeouts_;
};

}  // namespace airmon::device

#endif  // AIRMON_DEVICE_NETWORK_DETECTOR_HPP
