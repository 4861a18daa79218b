/*
 * usb_detector.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: USB wireless dongle and adapter detection

**************************************************/

#include "usb_detector.hpp"

#include <optional>
#include <utility>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "airmon/device/classify.hpp"
#include "airmon/error/exception.hpp"
#include "airmon/utils/string.hpp"

namespace airmon::device {

namespace {

constexpr std::size_t LSUSB_MIN_TOKENS = 6;

auto makeFallbackRecord(std::string name, std::string method)
    -> WirelessDevice {
    WirelessDevice device;
    device.deviceType = classifyUsbByName(name);
    device.name = std::move(name);
    device.interface = "USB";
    device.status = DeviceStatus::Connected;
    device.additionalInfo["detection_method"] = std::move(method);
    return device;
}

}  // namespace

auto parseLsusbOutput(std::string_view output) -> std::vector<WirelessDevice> {
    std::vector<WirelessDevice> devices;
    for (const auto& line : utils::splitLines(output)) {
        auto parts = utils::splitWhitespace(line);
        if (parts.size() < LSUSB_MIN_TOKENS) {
            continue;
        }
        std::string description = utils::joinStrings(parts, " ", 6);
        // Receivers rarely say "wireless" in their lsusb description.
        if (!hasWirelessKeyword(description) &&
            !namesRadioReceiver(description)) {
            continue;
        }

        auto ids = utils::splitString(parts[5], ':');
        if (ids.size() != 2 || !utils::parseHex16(ids[0]) ||
            !utils::parseHex16(ids[1])) {
            spdlog::debug("Skipping lsusb line with malformed id: '{}'", line);
            continue;
        }

        std::string address = parts[3];
        while (!address.empty() && address.back() == ':') {
            address.pop_back();
        }

        auto device = makeFallbackRecord(std::move(description), "lsusb");
        device.interface =
            fmt::format("USB (Bus {}, Device {})", parts[1], address);
        device.vendorId = ids[0];
        device.productId = ids[1];
        devices.push_back(std::move(device));
    }
    return devices;
}

auto parseSystemProfilerUsb(std::string_view output)
    -> std::vector<WirelessDevice> {
    std::vector<WirelessDevice> devices;
    std::optional<WirelessDevice> current;

    for (const auto& rawLine : utils::splitLines(output)) {
        const std::string line = utils::trim(rawLine);
        if (line.ends_with(':')) {
            std::string name = line.substr(0, line.size() - 1);
            if (hasWirelessKeyword(name)) {
                current = makeFallbackRecord(std::move(name),
                                             "system_profiler");
            }
        } else if (current && line.find("Product ID:") != std::string::npos) {
            current->productId = utils::valueAfter(line, "Product ID:");
        } else if (current && line.find("Vendor ID:") != std::string::npos) {
            current->vendorId = utils::valueAfter(line, "Vendor ID:");
            devices.push_back(std::move(*current));
            current.reset();
        }
    }
    return devices;
}

auto makeEnumeratedUsbRecord(UsbBackend& backend, const UsbDeviceInfo& info)
    -> WirelessDevice {
    try {
        const std::string vendorName(
            knownWirelessVendor(info.vendorId).value_or("Unknown"));
        const std::string vendorHex = utils::toHex4(info.vendorId);
        const std::string productHex = utils::toHex4(info.productId);

        std::optional<std::string> product;
        try {
            product = backend.readProduct(info);
        } catch (const error::UsbBackendError& ex) {
            spdlog::debug("No product string for {}:{}: {}", vendorHex,
                          productHex, ex.getMessage());
        }
        const std::string productName =
            product.value_or(fmt::format("USB Device {}:{}", vendorHex,
                                         productHex));

        WirelessDevice device;
        device.name = fmt::format("{} {}", vendorName, productName);
        device.deviceType = classifyEnumeratedUsb(productName);
        device.interface =
            fmt::format("USB (Bus {}, Device {})", info.bus, info.address);
        device.vendorId = vendorHex;
        device.productId = productHex;
        device.status = DeviceStatus::Connected;
        device.additionalInfo["bus"] = static_cast<std::int64_t>(info.bus);
        device.additionalInfo["address"] =
            static_cast<std::int64_t>(info.address);
        device.additionalInfo["vendor_name"] = vendorName;
        device.additionalInfo["detection_method"] = std::string(backend.name());
        return device;
    } catch (const std::exception& ex) {
        spdlog::warn("Failed to describe USB device {}:{}: {}", info.bus,
                     info.address, ex.what());
        WirelessDevice device;
        device.name = "Unknown USB Wireless Device";
        device.deviceType = DeviceType::UnknownWireless;
        device.interface = "USB";
        device.status = DeviceStatus::Unknown;
        device.additionalInfo["error"] = std::string(ex.what());
        return device;
    }
}

UsbWirelessDetector::UsbWirelessDetector(DetectionBackends backends,
                                         config::CommandTimeouts timeouts)
    : backends_(std::move(backends)), timeouts_(timeouts) {
    if (!backends_.commands) {
        backends_.commands = std::make_shared<system::ProcessCommandRunner>();
    }
}

auto UsbWirelessDetector::detect() -> std::vector<WirelessDevice> {
    if (!backends_.usb) {
        return detectFallback();
    }
    try {
        return detectWithBackend();
    } catch (const std::exception& ex) {
        spdlog::error("Error detecting USB wireless devices: {}", ex.what());
        return detectFallback();
    }
}

auto UsbWirelessDetector::detectWithBackend() -> std::vector<WirelessDevice> {
    std::vector<WirelessDevice> devices;
    for (const auto& info : backends_.usb->listDevices()) {
        if (!isWirelessUsbCandidate(info.vendorId, info.deviceClass,
                                    info.interfaceClasses)) {
            continue;
        }
        devices.push_back(makeEnumeratedUsbRecord(*backends_.usb, info));
    }
    spdlog::debug("{} backend found {} wireless USB candidates",
                  backends_.usb->name(), devices.size());
    return devices;
}

auto UsbWirelessDetector::detectFallback() -> std::vector<WirelessDevice> {
    switch (backends_.platform) {
        case system::Platform::Windows:
            return detectWindowsFallback();
        case system::Platform::Linux:
            return detectLinuxFallback();
        case system::Platform::MacOS:
            return detectMacosFallback();
        case system::Platform::Other:
            break;
    }
    return {};
}

auto UsbWirelessDetector::detectWindowsFallback()
    -> std::vector<WirelessDevice> {
    std::vector<WirelessDevice> devices;
    if (!backends_.wmi) {
        return devices;
    }
    try {
        for (auto& name : backends_.wmi->usbDependentNames()) {
            if (!name.empty() && hasWirelessKeyword(name)) {
                devices.push_back(makeFallbackRecord(std::move(name), "WMI"));
            }
        }
    } catch (const std::exception& ex) {
        spdlog::error("Windows USB fallback error: {}", ex.what());
    }
    return devices;
}

auto UsbWirelessDetector::detectLinuxFallback() -> std::vector<WirelessDevice> {
    try {
        auto result = backends_.commands->run({"lsusb"}, timeouts_.lsusb);
        if (result.succeeded()) {
            return parseLsusbOutput(result.output);
        }
        spdlog::debug("lsusb exited with {}", result.exitCode);
    } catch (const std::exception& ex) {
        spdlog::error("Linux USB fallback error: {}", ex.what());
    }
    return {};
}

auto UsbWirelessDetector::detectMacosFallback() -> std::vector<WirelessDevice> {
    try {
        auto result = backends_.commands->run(
            {"system_profiler", "SPUSBDataType"}, timeouts_.usbProfiler);
        if (result.succeeded()) {
            return parseSystemProfilerUsb(result.output);
        }
        spdlog::debug("system_profiler SPUSBDataType exited with {}",
                      result.exitCode);
    } catch (const std::exception& ex) {
        spdlog::error("macOS USB fallback error: {}", ex.what());
    }
    return {};
}

auto UsbWirelessDetector::canManage(const WirelessDevice& device) const
    -> bool {
    return device.deviceType == DeviceType::RFDongle ||
           device.deviceType == DeviceType::WiFiAdapter;
}

auto UsbWirelessDetector::enable(const WirelessDevice& device) -> bool {
    spdlog::info("Enabling USB device '{}' is not supported", device.name);
    return false;
}

auto UsbWirelessDetector::disable(const WirelessDevice& device) -> bool {
    spdlog::info("Disabling USB device '{}' is not supported", device.name);
    return false;
}

}  // namespace airmon::device
