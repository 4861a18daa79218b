/*
 * wireless_device.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Normalized wireless device record

**************************************************/

#ifndef AIRMON_DEVICE_WIRELESS_DEVICE_HPP
#define AIRMON_DEVICE_WIRELESS_DEVICE_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace airmon::device {

/**
 * @brief Category a detector assigned to a device.
 */
enum class DeviceType {
    Bluetooth,
    RFDongle,
    WiFiAdapter,
    WirelessAudio,
    UnknownWireless
};

/**
 * @brief Last known state of a device.
 */
enum class DeviceStatus {
    Connected,
    Disconnected,
    Paired,
    Discoverable,
    Enabled,
    Disabled,
    Unknown
};

/// Display name, e.g. "RF Dongle".
[[nodiscard]] auto toString(DeviceType type) -> std::string_view;
[[nodiscard]] auto toString(DeviceStatus status) -> std::string_view;

/// Inverse of toString(); nullopt for unknown text.
[[nodiscard]] auto deviceTypeFromString(std::string_view text)
    -> std::optional<DeviceType>;
[[nodiscard]] auto deviceStatusFromString(std::string_view text)
    -> std::optional<DeviceStatus>;

/// Extra per-source data attached to a record.
using AttributeValue = std::variant<std::string, std::int64_t, double>;
using AttributeMap = std::map<std::string, AttributeValue>;

/**
 * @brief Render an attribute for display. Integers without decimals.
 */
[[nodiscard]] auto attributeToString(const AttributeValue& value)
    -> std::string;

/**
 * @brief One wireless capable device found by a detector.
 *
 * Records are plain values rebuilt on every scan. Two records refer to the
 * same device when matches() says so.
 */
struct WirelessDevice {
    std::string name;
    DeviceType deviceType{DeviceType::UnknownWireless};
    /// OS level handle, e.g. "wlan0" or "USB (Bus 1, Device 4)".
    std::string interface;
    std::optional<std::string> macAddress;
    DeviceStatus status{DeviceStatus::Unknown};
    std::optional<std::string> vendorId;
    std::optional<std::string> productId;
    /// 0-100, not filled by any detector yet.
    std::optional<int> batteryLevel;
    /// 0-100, not filled by any detector yet.
    std::optional<int> signalStrength;
    AttributeMap additionalInfo;

    /**
     * @brief Identity test used to find a device again after a rescan.
     *
     * True when name, type and interface are all equal, or when both records
     * carry the same mac address.
     */
    [[nodiscard]] auto matches(const WirelessDevice& other) const -> bool;

    /**
     * @brief String attribute lookup; nullopt when absent or not a string.
     */
    [[nodiscard]] auto info(const std::string& key) const
        -> std::optional<std::string>;

    auto operator==(const WirelessDevice& other) const -> bool = default;
};

}  // namespace airmon::device

#endif  // AIRMON_DEVICE_WIRELESS_DEVICE_HPP
