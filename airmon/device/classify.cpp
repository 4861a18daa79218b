/*
 * classify.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Heuristic classification of wireless hardware by name

**************************************************/

#include "classify.hpp"

#include <algorithm>
#include <array>
#include <string>
#include <utility>

#include "airmon/utils/string.hpp"

namespace airmon::device {

namespace {

constexpr std::array<std::pair<std::uint16_t, std::string_view>, 8>
    WIRELESS_VENDORS{{
        {0x046d, "Logitech"},
        {0x045e, "Microsoft"},
        {0x1532, "Razer"},
        {0x0b05, "ASUS"},
        {0x0bda, "Realtek"},
        {0x148f, "Ralink"},
        {0x0cf3, "Atheros"},
        {0x8087, "Intel"},
    }};

auto isWifiName(std::string_view lowered) -> bool {
    return utils::containsAny(lowered,
                              {"wifi", "wireless lan", "802.11", "wlan"});
}

auto isAudioName(std::string_view lowered) -> bool {
    return utils::containsAny(lowered,
                              {"audio", "headset", "speaker", "microphone"});
}

}  // namespace

auto knownWirelessVendor(std::uint16_t vendorId)
    -> std::optional<std::string_view> {
    for (const auto& [id, name] : WIRELESS_VENDORS) {
        if (id == vendorId) {
            return name;
        }
    }
    return std::nullopt;
}

auto isWirelessUsbCandidate(std::uint16_t vendorId, std::uint8_t deviceClass,
                            std::span<const std::uint8_t> interfaceClasses)
    -> bool {
    if (knownWirelessVendor(vendorId)) {
        return true;
    }
    if (deviceClass == USB_CLASS_HID || deviceClass == USB_CLASS_HUB) {
        return true;
    }
    return std::ranges::any_of(interfaceClasses, [](std::uint8_t cls) {
        return cls == USB_CLASS_HID || cls == USB_CLASS_WIRELESS_CONTROLLER;
    });
}

auto classifyEnumeratedUsb(std::string_view productName) -> DeviceType {
    const std::string lowered = utils::toLower(productName);
    if (namesRadioReceiver(lowered)) {
        return DeviceType::RFDongle;
    }
    if (isWifiName(lowered)) {
        return DeviceType::WiFiAdapter;
    }
    if (lowered.find("bluetooth") != std::string::npos) {
        return DeviceType::Bluetooth;
    }
    if (isAudioName(lowered)) {
        return DeviceType::WirelessAudio;
    }
    return DeviceType::RFDongle;
}

auto classifyUsbByName(std::string_view name) -> DeviceType {
    const std::string lowered = utils::toLower(name);
    if (namesRadioReceiver(lowered)) {
        return DeviceType::RFDongle;
    }
    if (isWifiName(lowered)) {
        return DeviceType::WiFiAdapter;
    }
    if (isAudioName(lowered)) {
        return DeviceType::WirelessAudio;
    }
    return DeviceType::UnknownWireless;
}

auto namesRadioReceiver(std::string_view name) -> bool {
    return utils::containsAny(utils::toLower(name),
                              {"receiver", "dongle", "unifying"});
}

auto hasWirelessKeyword(std::string_view name) -> bool {
    return utils::containsAny(utils::toLower(name),
                              {"wireless", "wifi", "bluetooth", "dongle"});
}

auto isWirelessInterfaceName(std::string_view name) -> bool {
    return utils::containsAny(utils::toLower(name),
                              {"wlan", "wifi", "wl", "ath", "ra", "wireless"});
}

}  // namespace airmon::device
