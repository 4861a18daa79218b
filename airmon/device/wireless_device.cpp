/*
 * wireless_device.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Normalized wireless device record

**************************************************/

#include "wireless_device.hpp"

#include <array>
#include <type_traits>
#include <utility>

#include <spdlog/fmt/fmt.h>

namespace airmon::device {

namespace {

constexpr std::array<std::pair<DeviceType, std::string_view>, 5> TYPE_NAMES{{
    {DeviceType::Bluetooth, "Bluetooth"},
    {DeviceType::RFDongle, "RF Dongle"},
    {DeviceType::WiFiAdapter, "WiFi Adapter"},
    {DeviceType::WirelessAudio, "Wireless Audio"},
    {DeviceType::UnknownWireless, "Unknown Wireless"},
}};

constexpr std::array<std::pair<DeviceStatus, std::string_view>, 7>
    STATUS_NAMES{{
        {DeviceStatus::Connected, "Connected"},
        {DeviceStatus::Disconnected, "Disconnected"},
        {DeviceStatus::Paired, "Paired"},
        {DeviceStatus::Discoverable, "Discoverable"},
        {DeviceStatus::Enabled, "Enabled"},
        {DeviceStatus::Disabled, "Disabled"},
        {DeviceStatus::Unknown, "Unknown"},
    }};

}  // namespace

auto toString(DeviceType type) -> std::string_view {
    for (const auto& [value, name] : TYPE_NAMES) {
        if (value == type) {
            return name;
        }
    }
    return "Unknown Wireless";
}

auto toString(DeviceStatus status) -> std::string_view {
    for (const auto& [value, name] : STATUS_NAMES) {
        if (value == status) {
            return name;
        }
    }
    return "Unknown";
}

auto deviceTypeFromString(std::string_view text) -> std::optional<DeviceType> {
    for (const auto& [value, name] : TYPE_NAMES) {
        if (name == text) {
            return value;
        }
    }
    return std::nullopt;
}

auto deviceStatusFromString(std::string_view text)
    -> std::optional<DeviceStatus> {
    for (const auto& [value, name] : STATUS_NAMES) {
        if (name == text) {
            return value;
        }
    }
    return std::nullopt;
}

auto attributeToString(const AttributeValue& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else {
                return fmt::format("{}", v);
            }
        },
        value);
}

auto WirelessDevice::matches(const WirelessDevice& other) const -> bool {
    if (name == other.name && deviceType == other.deviceType &&
        interface == other.interface) {
        return true;
    }
    return macAddress.has_value() && other.macAddress.has_value() &&
           *macAddress == *other.macAddress;
}

auto WirelessDevice::info(const std::string& key) const
    -> std::optional<std::string> {
    auto it = additionalInfo.find(key);
    if (it == additionalInfo.end()) {
        return std::nullopt;
    }
    if (const auto* text = std::get_if<std::string>(&it->second)) {
        return *text;
    }
    return std::nullopt;
}

}  // namespace airmon::device
