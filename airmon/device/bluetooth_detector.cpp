/*
 * bluetooth_detector.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Bluetooth controller and peripheral detection

**************************************************/

#include "bluetooth_detector.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

#include <spdlog/spdlog.h>

#include "airmon/utils/string.hpp"

namespace airmon::device {

namespace {

constexpr std::size_t NAME_LOOKBACK_LINES = 5;
constexpr std::string_view DEFAULT_BLUETOOTH_NAME = "Bluetooth Device";

}  // namespace

auto parseBluetoothctlOutput(std::string_view output, std::string_view prefix,
                             std::string_view interface, DeviceStatus status)
    -> std::vector<WirelessDevice> {
    std::vector<WirelessDevice> devices;
    for (const auto& line : utils::splitLines(output)) {
        if (!utils::trim(line).starts_with(prefix)) {
            continue;
        }
        auto parts = utils::splitWhitespace(line);
        if (parts.size() < 3) {
            spdlog::debug("Skipping short bluetoothctl line: '{}'", line);
            continue;
        }
        WirelessDevice device;
        device.name = utils::joinStrings(parts, " ", 2);
        device.deviceType = DeviceType::Bluetooth;
        device.interface = std::string(interface);
        device.macAddress = parts[1];
        device.status = status;
        devices.push_back(std::move(device));
    }
    return devices;
}

auto parseSystemProfilerBluetooth(std::string_view output)
    -> std::vector<WirelessDevice> {
    std::vector<WirelessDevice> devices;
    const auto lines = utils::splitLines(output);
    for (std::size_t i = 0; i < lines.size(); ++i) {
        auto mac = utils::valueAfter(lines[i], "Address:");
        if (!mac) {
            continue;
        }

        std::string name(DEFAULT_BLUETOOTH_NAME);
        const std::size_t first =
            i > NAME_LOOKBACK_LINES ? i - NAME_LOOKBACK_LINES : 0;
        for (std::size_t j = i; j > first; --j) {
            const std::string candidate = utils::trim(lines[j - 1]);
            if (!candidate.empty() &&
                candidate.find(':') == std::string::npos) {
                name = candidate;
                break;
            }
        }

        WirelessDevice device;
        device.name = std::move(name);
        device.deviceType = DeviceType::Bluetooth;
        device.interface = "Bluetooth";
        device.macAddress = std::move(*mac);
        device.status = DeviceStatus::Connected;
        devices.push_back(std::move(device));
    }
    return devices;
}

BluetoothDetector::BluetoothDetector(DetectionBackends backends,
                                     config::CommandTimeouts timeouts)
    : backends_(std::move(backends)), timeouts_(timeouts) {
    if (!backends_.commands) {
        backends_.commands = std::make_shared<system::ProcessCommandRunner>();
    }
}

auto BluetoothDetector::detect() -> std::vector<WirelessDevice> {
    switch (backends_.platform) {
        case system::Platform::Windows:
            return detectWindows();
        case system::Platform::Linux:
            return detectLinux();
        case system::Platform::MacOS:
            return detectMacos();
        case system::Platform::Other:
            break;
    }
    return {};
}

auto BluetoothDetector::detectWindows() -> std::vector<WirelessDevice> {
    std::vector<WirelessDevice> devices;
    if (!backends_.wmi) {
        return devices;
    }
    try {
        auto rows = backends_.wmi->query(
            "SELECT Name, Status, DeviceID, Manufacturer FROM Win32_PnPEntity",
            {"Name", "Status", "DeviceID", "Manufacturer"});
        for (auto& row : rows) {
            auto nameIt = row.find("Name");
            if (nameIt == row.end() || nameIt->second.empty() ||
                utils::toLower(nameIt->second).find("bluetooth") ==
                    std::string::npos) {
                continue;
            }
            WirelessDevice device;
            device.name = nameIt->second;
            device.deviceType = DeviceType::Bluetooth;
            device.interface = "Bluetooth";
            auto statusIt = row.find("Status");
            device.status = statusIt != row.end() && statusIt->second == "OK"
                                ? DeviceStatus::Enabled
                                : DeviceStatus::Disabled;
            if (auto it = row.find("DeviceID"); it != row.end()) {
                device.additionalInfo["device_id"] = it->second;
            }
            if (auto it = row.find("Manufacturer"); it != row.end()) {
                device.additionalInfo["manufacturer"] = it->second;
            }
            devices.push_back(std::move(device));
        }
    } catch (const std::exception& ex) {
        spdlog::error("Error detecting Windows Bluetooth devices: {}",
                      ex.what());
    }
    return devices;
}

auto BluetoothDetector::detectLinux() -> std::vector<WirelessDevice> {
    std::vector<WirelessDevice> devices;
    try {
        auto result = backends_.commands->run({"bluetoothctl", "list"},
                                              timeouts_.bluetoothctl);
        if (result.succeeded()) {
            auto controllers =
                parseBluetoothctlOutput(result.output, "Controller",
                                        "Bluetooth Controller",
                                        DeviceStatus::Enabled);
            std::ranges::move(controllers, std::back_inserter(devices));
        } else {
            spdlog::debug("bluetoothctl list exited with {}", result.exitCode);
        }
    } catch (const std::exception& ex) {
        spdlog::error("Error listing Bluetooth controllers: {}", ex.what());
    }

    try {
        auto result = backends_.commands->run(
            {"bluetoothctl", "paired-devices"}, timeouts_.bluetoothctl);
        if (result.succeeded()) {
            auto paired = parseBluetoothctlOutput(
                result.output, "Device", "Bluetooth Device",
                DeviceStatus::Paired);
            std::ranges::move(paired, std::back_inserter(devices));
        } else {
            spdlog::debug("bluetoothctl paired-devices exited with {}",
                          result.exitCode);
        }
    } catch (const std::exception& ex) {
        spdlog::error("Error listing paired Bluetooth devices: {}", ex.what());
    }
    return devices;
}

auto BluetoothDetector::detectMacos() -> std::vector<WirelessDevice> {
    try {
        auto result = backends_.commands->run(
            {"system_profiler", "SPBluetoothDataType"},
            timeouts_.bluetoothProfiler);
        if (result.succeeded()) {
            return parseSystemProfilerBluetooth(result.output);
        }
        spdlog::debug("system_profiler SPBluetoothDataType exited with {}",
                      result.exitCode);
    } catch (const std::exception& ex) {
        spdlog::error("Error detecting macOS Bluetooth devices: {}",
                      ex.what());
    }
    return {};
}

auto BluetoothDetector::canManage(const WirelessDevice& device) const -> bool {
    return device.deviceType == DeviceType::Bluetooth;
}

auto BluetoothDetector::enable(const WirelessDevice& device) -> bool {
    spdlog::info("Powering on Bluetooth for '{}'", device.name);
    return setPower(true);
}

auto BluetoothDetector::disable(const WirelessDevice& device) -> bool {
    spdlog::info("Powering off Bluetooth for '{}'", device.name);
    return setPower(false);
}

auto BluetoothDetector::setPower(bool on) -> bool {
    if (backends_.platform != system::Platform::Linux) {
        return false;
    }
    try {
        auto result = backends_.commands->run(
            {"bluetoothctl", "power", on ? "on" : "off"},
            timeouts_.bluetoothPower);
        if (!result.succeeded()) {
            spdlog::warn("bluetoothctl power {} exited with {}",
                         on ? "on" : "off", result.exitCode);
        }
        return true;
    } catch (const std::exception& ex) {
        spdlog::error("bluetoothctl power {} failed: {}", on ? "on" : "off",
                      ex.what());
    }
    return false;
}

}  // namespace airmon::device
