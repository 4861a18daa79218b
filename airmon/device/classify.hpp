/*
 * classify.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Heuristic classification of wireless hardware by name

**************************************************/

#ifndef AIRMON_DEVICE_CLASSIFY_HPP
#define AIRMON_DEVICE_CLASSIFY_HPP

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

#include "airmon/device/wireless_device.hpp"

namespace airmon::device {

/// USB device class codes used by the relevance test.
inline constexpr std::uint8_t USB_CLASS_HID = 3;
inline constexpr std::uint8_t USB_CLASS_HUB = 9;
inline constexpr std::uint8_t USB_CLASS_WIRELESS_CONTROLLER = 224;

/**
 * @brief Vendor name for a known wireless hardware vendor id.
 */
[[nodiscard]] auto knownWirelessVendor(std::uint16_t vendorId)
    -> std::optional<std::string_view>;

/**
 * @brief Relevance test for devices reported by a structured USB backend.
 *
 * Known vendor, or device class Hub/HID, or any HID or wireless controller
 * interface.
 */
[[nodiscard]] auto isWirelessUsbCandidate(
    std::uint16_t vendorId, std::uint8_t deviceClass,
    std::span<const std::uint8_t> interfaceClasses) -> bool;

/**
 * @brief Classifier for products found through a structured USB backend.
 *
 * Unmatched names default to RFDongle.
 */
[[nodiscard]] auto classifyEnumeratedUsb(std::string_view productName)
    -> DeviceType;

/**
 * @brief Classifier shared by the lsusb, system_profiler and WMI parsers.
 *
 * Has no Bluetooth branch and defaults to UnknownWireless.
 */
[[nodiscard]] auto classifyUsbByName(std::string_view name) -> DeviceType;

/**
 * @brief True for receiver, dongle and unifying names (case-insensitive).
 */
[[nodiscard]] auto namesRadioReceiver(std::string_view name) -> bool;

/**
 * @brief Keyword filter applied to names coming from the fallback parsers
 * (wireless, wifi, bluetooth, dongle).
 */
[[nodiscard]] auto hasWirelessKeyword(std::string_view name) -> bool;

/**
 * @brief Name based test for wireless network interfaces.
 *
 * Deliberately broad: "ra" and "wl" also match unrelated names.
 */
[[nodiscard]] auto isWirelessInterfaceName(std::string_view name) -> bool;

}  // namespace airmon::device

#endif  // AIRMON_DEVICE_CLASSIFY_HPP
