/*
 * device_json.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: JSON serialization of device records and statistics

**************************************************/

#ifndef AIRMON_DEVICE_DEVICE_JSON_HPP
#define AIRMON_DEVICE_DEVICE_JSON_HPP

#include <nlohmann/json.hpp>

#include "airmon/device/backends.hpp"
#include "airmon/device/device_manager.hpp"
#include "airmon/device/wireless_device.hpp"

namespace airmon::device {

/**
 * Optional fields are written as null. Enumerations use their display names.
 */
void to_json(nlohmann::json& json, const WirelessDevice& device);

/**
 * @throws nlohmann::json::exception on missing or mistyped fields
 */
void from_json(const nlohmann::json& json, WirelessDevice& device);

/// Layout: total_devices, by_type, by_status, manageable.
void to_json(nlohmann::json& json, const DeviceStatistics& stats);

/**
 * @brief Which data source each detector will use on this host.
 */
[[nodiscard]] auto describeBackends(const DetectionBackends& backends)
    -> nlohmann::json;

}  // namespace airmon::device

#endif  // AIRMON_DEVICE_DEVICE_JSON_HPP
