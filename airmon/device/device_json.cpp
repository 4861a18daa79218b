/*
 * device_json.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: JSON serialization of device records and statistics

**************************************************/

#include "device_json.hpp"

#include <string>

namespace airmon::device {

using json = nlohmann::json;

namespace {

template <typename T>
auto optionalToJson(const std::optional<T>& value) -> json {
    return value ? json(*value) : json(nullptr);
}

template <typename T>
auto optionalFromJson(const json& obj, const char* key) -> std::optional<T> {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<T>();
}

}  // namespace

void to_json(json& j, const WirelessDevice& device) {
    json info = json::object();
    for (const auto& [key, value] : device.additionalInfo) {
        std::visit([&info, &key](const auto& v) { info[key] = v; }, value);
    }
    j = json{{"name", device.name},
             {"device_type", std::string(toString(device.deviceType))},
             {"interface", device.interface},
             {"mac_address", optionalToJson(device.macAddress)},
             {"status", std::string(toString(device.status))},
             {"vendor_id", optionalToJson(device.vendorId)},
             {"product_id", optionalToJson(device.productId)},
             {"battery_level", optionalToJson(device.batteryLevel)},
             {"signal_strength", optionalToJson(device.signalStrength)},
             {"additional_info", std::move(info)}};
}

void from_json(const json& j, WirelessDevice& device) {
    device.name = j.at("name").get<std::string>();
    const auto typeName = j.at("device_type").get<std::string>();
    device.deviceType =
        deviceTypeFromString(typeName).value_or(DeviceType::UnknownWireless);
    device.interface = j.at("interface").get<std::string>();
    device.macAddress = optionalFromJson<std::string>(j, "mac_address");
    const auto statusName = j.value("status", std::string("Unknown"));
    device.status =
        deviceStatusFromString(statusName).value_or(DeviceStatus::Unknown);
    device.vendorId = optionalFromJson<std::string>(j, "vendor_id");
    device.productId = optionalFromJson<std::string>(j, "product_id");
    device.batteryLevel = optionalFromJson<int>(j, "battery_level");
    device.signalStrength = optionalFromJson<int>(j, "signal_strength");

    device.additionalInfo.clear();
    if (auto it = j.find("additional_info"); it != j.end() && it->is_object()) {
        for (const auto& [key, value] : it->items()) {
            if (value.is_string()) {
                device.additionalInfo[key] = value.get<std::string>();
            } else if (value.is_number_integer()) {
                device.additionalInfo[key] = value.get<std::int64_t>();
            } else if (value.is_number_float()) {
                device.additionalInfo[key] = value.get<double>();
            }
        }
    }
}

void to_json(json& j, const DeviceStatistics& stats) {
    json byType = json::object();
    for (const auto& [type, count] : stats.byType) {
        byType[std::string(toString(type))] = count;
    }
    json byStatus = json::object();
    for (const auto& [status, count] : stats.byStatus) {
        byStatus[std::string(toString(status))] = count;
    }
    j = json{{"total_devices", stats.totalDevices},
             {"by_type", std::move(byType)},
             {"by_status", std::move(byStatus)},
             {"manageable", stats.manageable}};
}

auto describeBackends(const DetectionBackends& backends) -> json {
    return json{
        {"platform", std::string(system::platformName(backends.platform))},
        {"usb", backends.usb ? json(std::string(backends.usb->name()))
                             : json(nullptr)},
        {"network", backends.network
                        ? json(std::string(backends.network->name()))
                        : json(nullptr)},
        {"wmi", backends.wmi != nullptr}};
}

}  // namespace airmon::device
