/*
 * main.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: airmon command line tool

**************************************************/

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "airmon/config/config.hpp"
#include "airmon/device/backends.hpp"
#include "airmon/device/device_json.hpp"
#include "airmon/device/device_manager.hpp"
#include "airmon/log/logging.hpp"
#include "airmon/sysinfo/system_monitor.hpp"
#include "airmon/utils/args.hpp"

namespace {

using airmon::utils::ArgumentParser;
using json = nlohmann::json;

constexpr int EXIT_USAGE = 2;

std::atomic<bool> g_interrupted{false};

void onSignal(int) { g_interrupted.store(true); }

void configureParser(ArgumentParser& parser) {
    parser.setDescription("Inventory and control of wireless devices");
    parser.addArgument("config", ArgumentParser::ArgType::STRING, {},
                       "JSON configuration file", {"c"});
    parser.addArgument("log-level", ArgumentParser::ArgType::STRING, {},
                       "trace, debug, info, warn, error, critical or off");

    auto& scan = parser.addSubcommand("scan", "List detected wireless devices");
    scan.addFlag("json", "Print JSON instead of a table");

    auto& stats = parser.addSubcommand("stats", "Summarize the last scan");
    stats.addFlag("json", "Print JSON instead of text");

    auto& enable = parser.addSubcommand("enable", "Enable a device");
    enable.addPositional("device", "Device name or mac address");

    auto& disable = parser.addSubcommand("disable", "Disable a device");
    disable.addPositional("device", "Device name or mac address");

    auto& monitor =
        parser.addSubcommand("monitor", "Print host telemetry periodically");
    monitor.addArgument("count", ArgumentParser::ArgType::INTEGER, 0,
                        "Stop after N samples (0 runs until interrupted)",
                        {"n"});
    monitor.addArgument("interval", ArgumentParser::ArgType::DOUBLE, {},
                        "Seconds between samples", {"i"});
    monitor.addFlag("json", "Print one JSON object per sample");

    parser.addSubcommand("backends", "Show the data source of each detector");
}

auto loadSettings(const ArgumentParser& parser) -> airmon::config::AirmonConfig {
    airmon::config::AirmonConfig config;
    if (auto path = parser.get<std::string>("config")) {
        config = airmon::config::loadConfig(*path);
    }
    airmon::config::applyEnvironment(config);
    if (auto level = parser.get<std::string>("log-level")) {
        // Validated here so a typo fails before any work starts.
        static_cast<void>(airmon::log::parseLevel(*level));
        config.log.level = *level;
    }
    return config;
}

void printDeviceTable(const std::vector<airmon::device::WirelessDevice>& devices) {
    if (devices.empty()) {
        std::cout << "No wireless devices found\n";
        return;
    }
    std::cout << fmt::format("{:<32} {:<16} {:<12} {:<28} {}\n", "NAME", "TYPE",
                             "STATUS", "INTERFACE", "MAC");
    for (const auto& device : devices) {
        std::cout << fmt::format(
            "{:<32} {:<16} {:<12} {:<28} {}\n", device.name,
            airmon::device::toString(device.deviceType),
            airmon::device::toString(device.status), device.interface,
            device.macAddress.value_or("-"));
    }
}

auto runScan(airmon::device::DeviceManager& manager, bool asJson) -> int {
    const auto& devices = manager.scan();
    if (asJson) {
        std::cout << json(devices).dump(2) << '\n';
    } else {
        printDeviceTable(devices);
    }
    return 0;
}

auto runStats(airmon::device::DeviceManager& manager, bool asJson) -> int {
    manager.scan();
    const auto stats = manager.statistics();
    if (asJson) {
        std::cout << json(stats).dump(2) << '\n';
        return 0;
    }
    std::cout << "Total devices: " << stats.totalDevices << '\n';
    std::cout << "Manageable:    " << stats.manageable << '\n';
    for (const auto& [type, count] : stats.byType) {
        std::cout << fmt::format("  {:<18} {}\n", airmon::device::toString(type),
                                 count);
    }
    for (const auto& [status, count] : stats.byStatus) {
        std::cout << fmt::format("  {:<18} {}\n",
                                 airmon::device::toString(status), count);
    }
    return 0;
}

auto runToggle(airmon::device::DeviceManager& manager, const std::string& target,
               bool enable) -> int {
    manager.scan();
    auto* device = manager.findByName(target);
    if (device == nullptr) {
        device = manager.findByMac(target);
    }
    if (device == nullptr) {
        spdlog::error("No device named or addressed '{}'", target);
        return 1;
    }
    if (!manager.canManage(*device)) {
        spdlog::error("Device '{}' cannot be managed on this host",
                      device->name);
        return 1;
    }
    const bool ok = enable ? manager.enable(*device) : manager.disable(*device);
    std::cout << fmt::format("{} {}: {}\n", enable ? "enable" : "disable",
                             device->name, ok ? "ok" : "failed");
    return ok ? 0 : 1;
}

auto runMonitor(const ArgumentParser& args,
                const airmon::config::AirmonConfig& config) -> int {
    const int count = args.get<int>("count").value_or(0);
    if (count < 0) {
        spdlog::error("--count must not be negative");
        return EXIT_USAGE;
    }
    airmon::config::Seconds interval = config.monitor.interval;
    if (auto value = args.get<double>("interval")) {
        interval = airmon::config::Seconds(*value);
    }
    const bool asJson = args.getFlag("json");

    std::atomic<int> printed{0};
    airmon::sysinfo::SystemMonitor monitor;
    auto callback = [&](const airmon::sysinfo::SystemInfo& info,
                        const airmon::sysinfo::BatteryReport& battery) {
        if (count > 0 && printed.load() >= count) {
            return;
        }
        if (asJson) {
            std::cout << json{{"system", info}, {"battery", battery}}.dump()
                      << std::endl;
        } else {
            std::cout << fmt::format(
                             "cpu {:5.1f}%  mem {:5.1f}%  battery {}{}  "
                             "interfaces {}",
                             info.cpuUsage, info.memoryUsage,
                             info.batteryPercentage
                                 ? fmt::format("{}%", *info.batteryPercentage)
                                 : std::string("n/a"),
                             info.batteryPlugged ? " (plugged)" : "",
                             info.networkInterfaces.size())
                      << std::endl;
        }
        ++printed;
    };
    if (!monitor.start(callback, interval)) {
        return 1;
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);
    while (!g_interrupted.load() && (count == 0 || printed.load() < count)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    monitor.stop();
    return 0;
}

auto dispatch(const ArgumentParser& parser,
              const airmon::config::AirmonConfig& config) -> int {
    const std::string& command = parser.activeSubcommand();
    const auto& args = parser.subcommand(command);

    if (command == "monitor") {
        return runMonitor(args, config);
    }

    auto backends = airmon::device::probeBackends();
    if (command == "backends") {
        std::cout << airmon::device::describeBackends(backends).dump(2) << '\n';
        return 0;
    }

    airmon::device::DeviceManager manager(std::move(backends), config.timeouts);
    if (command == "scan") {
        return runScan(manager, args.getFlag("json"));
    }
    if (command == "stats") {
        return runStats(manager, args.getFlag("json"));
    }
    if (command == "enable" || command == "disable") {
        auto target = args.getPositional("device");
        if (!target) {
            std::cerr << args.helpText();
            return EXIT_USAGE;
        }
        return runToggle(manager, *target, command == "enable");
    }
    std::cerr << parser.helpText();
    return EXIT_USAGE;
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
    ArgumentParser parser("airmon");
    configureParser(parser);

    std::vector<std::string> arguments(argv, argv + argc);
    try {
        parser.parse(arguments);
    } catch (const airmon::error::InvalidArgument& ex) {
        std::cerr << "airmon: " << ex.getMessage() << "\n\n"
                  << parser.helpText();
        return EXIT_USAGE;
    }

    const std::string& command = parser.activeSubcommand();
    if (parser.helpRequested() || command.empty()) {
        std::cout << parser.helpText();
        return command.empty() && !parser.helpRequested() ? EXIT_USAGE : 0;
    }
    if (parser.subcommand(command).helpRequested()) {
        std::cout << parser.subcommand(command).helpText();
        return 0;
    }

    airmon::config::AirmonConfig config;
    try {
        config = loadSettings(parser);
    } catch (const airmon::error::Exception& ex) {
        std::cerr << "airmon: " << ex.getMessage() << '\n';
        return EXIT_USAGE;
    }

    try {
        airmon::log::initLogging(config.log);
    } catch (const airmon::error::Exception& ex) {
        std::cerr << "airmon: cannot initialize logging: " << ex.getMessage()
                  << '\n';
        return 1;
    }

    try {
        return dispatch(parser, config);
    } catch (const std::exception& ex) {
        spdlog::critical("Unhandled error: {}", ex.what());
        return 1;
    }
}
