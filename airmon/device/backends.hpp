/*
 * backends.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Data sources shared by the detectors

**************************************************/

#ifndef AIRMON_DEVICE_BACKENDS_HPP
#define AIRMON_DEVICE_BACKENDS_HPP

#include <memory>

#include "airmon/device/net_interfaces.hpp"
#include "airmon/device/usb_backend.hpp"
#include "airmon/system/command.hpp"
#include "airmon/system/platform.hpp"
#include "airmon/system/wmi.hpp"

namespace airmon::device {

/**
 * @brief Result of probing which data sources exist on this host.
 *
 * Built once and handed to every detector. A null pointer means that source
 * is unavailable and the detector must use its fallback probes.
 */
struct DetectionBackends {
    system::Platform platform{system::currentPlatform()};
    std::shared_ptr<system::CommandRunner> commands;
    std::shared_ptr<UsbBackend> usb;
    std::shared_ptr<NetInterfaceSource> network;
    std::shared_ptr<system::WmiQueryService> wmi;
};

/**
 * @brief Probe the host: real process runner, first working USB backend,
 * OS interface enumeration and WMI on Windows.
 */
[[nodiscard]] auto probeBackends() -> DetectionBackends;

}  // namespace airmon::device

#endif  // AIRMON_DEVICE_BACKENDS_HPP
