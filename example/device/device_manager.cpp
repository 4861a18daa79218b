#include "airmon/device/backends.hpp"
#include "airmon/device/device_manager.hpp"
#include "airmon/log/logging.hpp"

#include <iostream>

using namespace airmon::device;

int main() {
    // Log detector fallbacks while we scan
    airmon::log::LogSettings settings;
    settings.level = "debug";
    airmon::log::initLogging(settings);

    // Probe the available data sources once and build the manager
    DeviceManager manager(probeBackends());

    // Run the Bluetooth, USB and network detectors
    const auto& devices = manager.scan();
    std::cout << "Found " << devices.size() << " wireless devices" << std::endl;
    for (const auto& device : devices) {
        std::cout << "Name: " << device.name
                  << ", Type: " << toString(device.deviceType)
                  << ", Status: " << toString(device.status)
                  << ", Interface: " << device.interface
                  << ", MAC: " << device.macAddress.value_or("-")
                  << ", Manageable: " << (manager.canManage(device) ? "yes" : "no")
                  << std::endl;
    }

    // Only Wi-Fi adapters
    for (const auto& adapter : manager.devicesByType(DeviceType::WiFiAdapter)) {
        std::cout << "Wi-Fi adapter: " << adapter.name << std::endl;
    }

    // Summary of the last scan
    auto stats = manager.statistics();
    std::cout << "Total: " << stats.totalDevices
              << ", Manageable: " << stats.manageable << std::endl;
    for (const auto& [type, count] : stats.byType) {
        std::cout << "  " << toString(type) << ": " << count << std::endl;
    }

    // Look a device up by name and ask for its current state
    if (auto* device = manager.findByName("wlan0")) {
        if (auto fresh = manager.refresh(*device)) {
            std::cout << "wlan0 is " << toString(fresh->status) << std::endl;
        }
    }

    return 0;
}
