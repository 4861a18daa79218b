/*
 * backends.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Data sources shared by the detectors

**************************************************/

#include "backends.hpp"

#include <spdlog/spdlog.h>

namespace airmon::device {

auto probeBackends() -> DetectionBackends {
    DetectionBackends backends;
    backends.platform = system::currentPlatform();
    backends.commands = std::make_shared<system::ProcessCommandRunner>();

    auto factories = defaultUsbBackendFactories();
    backends.usb = selectUsbBackend(factories);
    backends.network = createNetInterfaceSource();
    backends.wmi = system::createWmiQueryService();

    spdlog::debug("Backends probed: platform={}, usb={}, network={}, wmi={}",
                  system::platformName(backends.platform),
                  backends.usb ? backends.usb->name() : "none",
                  backends.network ? backends.network->name() : "none",
                  backends.wmi ? "available" : "none");
    return backends;
}

}  // namespace airmon::device
