/*
 * network_detector.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Wireless network interface detection and link control

**************************************************/

#include "network_detector.hpp"

#include <optional>
#include <utility>

#include <spdlog/spdlog.h>

#include "airmon/device/classify.hpp"
#include "airmon/utils/string.hpp"

namespace airmon::device {

namespace {

auto makeInterfaceDevice(const std::string& label, std::string interface,
                         DeviceStatus status, std::string method)
    -> WirelessDevice {
    WirelessDevice device;
    device.name = "Wireless Interface " + label;
    device.deviceType = DeviceType::WiFiAdapter;
    device.interface = std::move(interface);
    device.status = status;
    device.additionalInfo["detection_method"] = std::move(method);
    return device;
}

auto valueAfterColon(std::string_view line) -> std::string {
    auto pos = line.find(':');
    if (pos == std::string_view::npos) {
        return {};
    }
    return utils::trim(line.substr(pos + 1));
}

}  // namespace

auto makeInterfaceRecord(const NetInterfaceSnapshot& snapshot)
    -> WirelessDevice {
    DeviceStatus status = DeviceStatus::Unknown;
    if (snapshot.stats) {
        status = snapshot.stats->isUp ? DeviceStatus::Enabled
                                      : DeviceStatus::Disabled;
    }
    auto device =
        makeInterfaceDevice(snapshot.name, snapshot.name, status, "netif");
    device.macAddress = snapshot.linkAddress();
    device.additionalInfo["interface_name"] = snapshot.name;
    device.additionalInfo["addresses"] =
        static_cast<std::int64_t>(snapshot.addresses.size());
    return device;
}

auto parseIwconfigOutput(std::string_view output)
    -> std::vector<WirelessDevice> {
    std::vector<WirelessDevice> devices;
    for (const auto& line : utils::splitLines(output)) {
        if (line.find("IEEE 802.11") == std::string::npos) {
            continue;
        }
        auto tokens = utils::splitWhitespace(line);
        if (tokens.empty()) {
            continue;
        }
        devices.push_back(makeInterfaceDevice(tokens[0], tokens[0],
                                              DeviceStatus::Enabled,
                                              "iwconfig"));
    }
    return devices;
}

auto parseNetshWlanOutput(std::string_view output)
    -> std::vector<WirelessDevice> {
    std::vector<WirelessDevice> devices;
    std::optional<std::string> current;
    for (const auto& rawLine : utils::splitLines(output)) {
        const std::string line = utils::trim(rawLine);
        if (line.starts_with("Name")) {
            current = valueAfterColon(line);
        } else if (current && line.starts_with("State")) {
            const std::string state = utils::toLower(valueAfterColon(line));
            // "disconnected" contains "connected" and also maps to Enabled.
            const auto status = state.find("connected") != std::string::npos
                                     ? DeviceStatus::Enabled
                                     : DeviceStatus::Disabled;
            devices.push_back(
                makeInterfaceDevice(*current, *current, status, "netsh"));
            current.reset();
        }
    }
    return devices;
}

auto parseNetworksetupOutput(std::string_view output)
    -> std::vector<WirelessDevice> {
    std::vector<WirelessDevice> devices;
    std::optional<std::string> currentPort;
    for (const auto& rawLine : utils::splitLines(output)) {
        const std::string line = utils::trim(rawLine);
        if (line.starts_with("Hardware Port:")) {
            std::string port = valueAfterColon(line);
            if (utils::containsAny(utils::toLower(port),
                                   {"wi-fi", "wireless"})) {
                currentPort = std::move(port);
            }
        } else if (currentPort && line.starts_with("Device:")) {
            devices.push_back(makeInterfaceDevice(
                *currentPort, valueAfterColon(line), DeviceStatus::Enabled,
                "networksetup"));
            currentPort.reset();
        }
    }
    return devices;
}

NetworkWirelessDetector::NetworkWirelessDetector(
    DetectionBackends backends, config::CommandTimeouts timeouts)
    : backends_(std::move(backends)), timeouts_(timeouts) {
    if (!backends_.commands) {
        backends_.commands = std::make_shared<system::ProcessCommandRunner>();
    }
}

auto NetworkWirelessDetector::detect() -> std::vector<WirelessDevice> {
    if (!backends_.network) {
        return detectFallback();
    }
    try {
        std::vector<WirelessDevice> devices;
        for (const auto& snapshot : backends_.network->listInterfaces()) {
            if (isWirelessInterfaceName(snapshot.name)) {
                devices.push_back(makeInterfaceRecord(snapshot));
            }
        }
        return devices;
    } catch (const std::exception& ex) {
        spdlog::error("Error detecting network wireless devices: {}",
                      ex.what());
        return detectFallback();
    }
}

auto NetworkWirelessDetector::detectFallback() -> std::vector<WirelessDevice> {
    switch (backends_.platform) {
        case system::Platform::Linux:
            return runFallback({"iwconfig"}, timeouts_.iwconfig,
                               &parseIwconfigOutput);
        case system::Platform::Windows:
            return runFallback({"netsh", "wlan", "show", "interfaces"},
                               timeouts_.netshWlan, &parseNetshWlanOutput);
        case system::Platform::MacOS:
            return runFallback({"networksetup", "-listallhardwareports"},
                               timeouts_.networksetup,
                               &parseNetworksetupOutput);
        case system::Platform::Other:
            break;
    }
    return {};
}

auto NetworkWirelessDetector::runFallback(
    const std::vector<std::string>& argv, std::chrono::milliseconds timeout,
    std::vector<WirelessDevice> (*parser)(std::string_view))
    -> std::vector<WirelessDevice> {
    try {
        auto result = backends_.commands->run(argv, timeout);
        if (result.succeeded()) {
            return parser(result.output);
        }
        spdlog::debug("'{}' exited with {}", system::formatCommand(argv),
                      result.exitCode);
    } catch (const std::exception& ex) {
        spdlog::error("Network fallback '{}' failed: {}",
                      system::formatCommand(argv), ex.what());
    }
    return {};
}

auto NetworkWirelessDetector::canManage(const WirelessDevice& device) const
    -> bool {
    return device.deviceType == DeviceType::WiFiAdapter;
}

auto NetworkWirelessDetector::enable(const WirelessDevice& device) -> bool {
    return setLink(device, true);
}

auto NetworkWirelessDetector::disable(const WirelessDevice& device) -> bool {
    return setLink(device, false);
}

auto NetworkWirelessDetector::setLink(const WirelessDevice& device, bool up)
    -> bool {
    const std::string interfaceName =
        device.info("interface_name").value_or(device.interface);

    std::vector<std::string> argv;
    switch (backends_.platform) {
        case system::Platform::Linux:
            argv = {"ip", "link", "set", interfaceName, up ? "up" : "down"};
            break;
        case system::Platform::Windows:
            argv = {"netsh",     "interface",   "set",
                    "interface", interfaceName, up ? "enabled" : "disabled"};
            break;
        default:
            spdlog::info("Interface control is not supported on {}",
                         system::platformName(backends_.platform));
            return false;
    }

    try {
        auto result = backends_.commands->run(argv, timeouts_.linkToggle);
        if (!result.succeeded()) {
            spdlog::warn("'{}' exited with {}", system::formatCommand(argv),
                         result.exitCode);
        }
        return true;
    } catch (const std::exception& ex) {
        spdlog::error("'{}' failed: {}", system::formatCommand(argv),
                      ex.what());
    }
    return false;
}

}  // namespace airmon::device
