/*
 * wmi.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Windows Management Instrumentation queries

**************************************************/

#ifndef AIRMON_SYSTEM_WMI_HPP
#define AIRMON_SYSTEM_WMI_HPP

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace airmon::system {

/// One result object, property name to its string rendering.
using WmiRow = std::map<std::string, std::string>;

/**
 * @brief Read-only access to the WMI ROOT\\CIMV2 namespace.
 *
 * Each call opens and closes its own COM session.
 */
class WmiQueryService {
public:
    virtual ~WmiQueryService() = default;

    /**
     * @brief Run a WQL query and read the requested properties.
     *
     * Properties that are null or not strings are left out of the row.
     * @throws airmon::error::SystemError when COM or WMI fails
     */
    virtual auto query(const std::string& wql,
                       const std::vector<std::string>& properties)
        -> std::vector<WmiRow> = 0;

    /**
     * @brief Names of the devices attached to USB controllers, resolved
     * through the Win32_USBControllerDevice association.
     * @throws airmon::error::SystemError when COM or WMI fails
     */
    virtual auto usbDependentNames() -> std::vector<std::string> = 0;
};

/**
 * @brief Create the COM backed service, or nullptr when WMI does not exist
 * on this platform.
 */
[[nodiscard]] auto createWmiQueryService() -> std::shared_ptr<WmiQueryService>;

}  // namespace airmon::system

#endif  // AIRMON_SYSTEM_WMI_HPP
