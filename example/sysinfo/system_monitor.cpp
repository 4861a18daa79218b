#include "airmon/sysinfo/system_monitor.hpp"

#include <chrono>
#include <iostream>
#include <thread>

using namespace airmon::sysinfo;

int main() {
    // One-off snapshot of this host
    SystemInfo info = collectSystemInfo();
    std::cout << "Platform: " << info.platform << " " << info.platformVersion
              << " (" << info.architecture << ")" << std::endl;
    std::cout << "CPU usage: " << info.cpuUsage << "%" << std::endl;
    std::cout << "Memory usage: " << info.memoryUsage << "%" << std::endl;
    if (info.batteryPercentage) {
        std::cout << "Battery: " << *info.batteryPercentage << "%"
                  << (info.batteryPlugged ? " (plugged)" : "") << std::endl;
    } else {
        std::cout << "Battery: not present" << std::endl;
    }
    std::cout << "Network interfaces: " << info.networkInterfaces.size()
              << std::endl;

    // Sample every second in the background
    SystemMonitor monitor;
    monitor.start(
        [](const SystemInfo& sample, const BatteryReport& battery) {
            std::cout << "cpu " << sample.cpuUsage << "%, mem "
                      << sample.memoryUsage << "%";
            if (battery.powerWatts) {
                std::cout << ", draw " << *battery.powerWatts << " W";
            }
            std::cout << std::endl;
        },
        std::chrono::duration<double>(1.0));

    std::this_thread::sleep_for(std::chrono::seconds(5));
    monitor.stop();
    std::cout << "Collected " << monitor.sampleCount() << " samples"
              << std::endl;

    return 0;
}
