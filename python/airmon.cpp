#include "airmon/device/backends.hpp"
#include "airmon/device/device_json.hpp"
#include "airmon/device/device_manager.hpp"
#include "airmon/error/exception.hpp"
#include "airmon/log/logging.hpp"
#include "airmon/sysinfo/system_monitor.hpp"

#include <pybind11/chrono.h>
#include <pybind11/functional.h>
#include <pybind11/operators.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <memory>
#include <string>

namespace py = pybind11;
using namespace airmon::device;
using namespace airmon::sysinfo;

PYBIND11_MODULE(airmon, m) {
    m.doc() = "Wireless device inventory and host telemetry";

    py::register_exception_translator([](std::exception_ptr p) {
        try {
            if (p)
                std::rethrow_exception(p);
        } catch (const airmon::error::InvalidArgument& e) {
            PyErr_SetString(PyExc_ValueError, e.getMessage().c_str());
        } catch (const airmon::error::Exception& e) {
            PyErr_SetString(PyExc_RuntimeError, e.getMessage().c_str());
        }
    });

    py::enum_<DeviceType>(m, "DeviceType")
        .value("BLUETOOTH", DeviceType::Bluetooth)
        .value("RF_DONGLE", DeviceType::RFDongle)
        .value("WIFI_ADAPTER", DeviceType::WiFiAdapter)
        .value("WIRELESS_AUDIO", DeviceType::WirelessAudio)
        .value("UNKNOWN_WIRELESS", DeviceType::UnknownWireless)
        .def("__str__",
             [](DeviceType type) { return std::string(toString(type)); });

    py::enum_<DeviceStatus>(m, "DeviceStatus")
        .value("CONNECTED", DeviceStatus::Connected)
        .value("DISCONNECTED", DeviceStatus::Disconnected)
        .value("PAIRED", DeviceStatus::Paired)
        .value("DISCOVERABLE", DeviceStatus::Discoverable)
        .value("ENABLED", DeviceStatus::Enabled)
        .value("DISABLED", DeviceStatus::Disabled)
        .value("UNKNOWN", DeviceStatus::Unknown)
        .def("__str__",
             [](DeviceStatus status) { return std::string(toString(status)); });

    py::class_<WirelessDevice>(m, "WirelessDevice",
                               R"(One wireless capable device found by a scan.

Examples:
    >>> import airmon
    >>> manager = airmon.DeviceManager()
    >>> for device in manager.scan():
    ...     print(device.name, device.device_type, device.status)
)")
        .def(py::init<>())
        .def_readwrite("name", &WirelessDevice::name)
        .def_readwrite("device_type", &WirelessDevice::deviceType)
        .def_readwrite("interface", &WirelessDevice::interface)
        .def_readwrite("mac_address", &WirelessDevice::macAddress)
        .def_readwrite("status", &WirelessDevice::status)
        .def_readwrite("vendor_id", &WirelessDevice::vendorId)
        .def_readwrite("product_id", &WirelessDevice::productId)
        .def_readwrite("battery_level", &WirelessDevice::batteryLevel)
        .def_readwrite("signal_strength", &WirelessDevice::signalStrength)
        .def_readwrite("additional_info", &WirelessDevice::additionalInfo)
        .def("matches", &WirelessDevice::matches, py::arg("other"),
             "True when both records denote the same device")
        .def("to_json",
             [](const WirelessDevice& device) {
                 return nlohmann::json(device).dump();
             })
        .def(py::self == py::self)
        .def("__repr__", [](const WirelessDevice& device) {
            return "<WirelessDevice name='" + device.name + "' type='" +
                   std::string(toString(device.deviceType)) + "' status='" +
                   std::string(toString(device.status)) + "'>";
        });

    py::class_<DeviceStatistics>(m, "DeviceStatistics")
        .def_readonly("total_devices", &DeviceStatistics::totalDevices)
        .def_readonly("by_type", &DeviceStatistics::byType)
        .def_readonly("by_status", &DeviceStatistics::byStatus)
        .def_readonly("manageable", &DeviceStatistics::manageable);

    py::class_<DeviceManager>(m, "DeviceManager",
                              R"(Runs the Bluetooth, USB and network detectors.

Enable and disable update the status of the record passed in when the
platform command succeeds.
)")
        .def(py::init([]() {
            return std::make_unique<DeviceManager>(probeBackends());
        }))
        .def("scan", &DeviceManager::scan,
             py::call_guard<py::gil_scoped_release>(),
             "Run every detector and return the new device list")
        .def("devices", &DeviceManager::devices)
        .def("devices_by_type", &DeviceManager::devicesByType, py::arg("type"))
        .def("devices_by_status", &DeviceManager::devicesByStatus,
             py::arg("status"))
        .def("find_by_name", &DeviceManager::findByName, py::arg("name"),
             py::return_value_policy::reference_internal)
        .def("find_by_mac", &DeviceManager::findByMac, py::arg("mac"),
             py::return_value_policy::reference_internal)
        .def("enable", &DeviceManager::enable, py::arg("device"))
        .def("disable", &DeviceManager::disable, py::arg("device"))
        .def("can_manage", &DeviceManager::canManage, py::arg("device"))
        .def("manageable_devices", &DeviceManager::manageableDevices)
        .def("statistics", &DeviceManager::statistics)
        .def("refresh", &DeviceManager::refresh, py::arg("device"))
        .def("add_scan_observer", &DeviceManager::addScanObserver,
             py::arg("observer"));

    py::class_<BatteryReport>(m, "BatteryReport")
        .def(py::init<>())
        .def_readwrite("percentage", &BatteryReport::percentage)
        .def_readwrite("plugged", &BatteryReport::plugged)
        .def_readwrite("time_left", &BatteryReport::secondsLeft)
        .def_readwrite("power_consumption", &BatteryReport::powerWatts)
        .def_readwrite("temperature", &BatteryReport::temperatureCelsius);

    py::class_<SystemInfo>(m, "SystemInfo")
        .def(py::init<>())
        .def_readwrite("platform", &SystemInfo::platform)
        .def_readwrite("platform_version", &SystemInfo::platformVersion)
        .def_readwrite("architecture", &SystemInfo::architecture)
        .def_readwrite("battery_percentage", &SystemInfo::batteryPercentage)
        .def_readwrite("battery_plugged", &SystemInfo::batteryPlugged)
        .def_readwrite("cpu_usage", &SystemInfo::cpuUsage)
        .def_readwrite("memory_usage", &SystemInfo::memoryUsage)
        .def_readwrite("network_interfaces", &SystemInfo::networkInterfaces);

    m.def("collect_system_info", &collectSystemInfo,
          py::call_guard<py::gil_scoped_release>(),
          "Sample platform, CPU, memory, battery and interface names");

    py::class_<SystemMonitor>(m, "SystemMonitor",
                              "Samples host telemetry on a background thread")
        .def(py::init<>())
        .def(
            "start",
            [](SystemMonitor& self, SystemMonitor::Callback callback,
               double interval) {
                return self.start(std::move(callback),
                                  std::chrono::duration<double>(interval));
            },
            py::arg("callback"), py::arg("interval") = 2.0)
        .def("stop", &SystemMonitor::stop,
             py::call_guard<py::gil_scoped_release>())
        .def("is_running", &SystemMonitor::isRunning)
        .def("cached_system_info", &SystemMonitor::cachedSystemInfo)
        .def("cached_battery", &SystemMonitor::cachedBattery)
        .def("sample_count", &SystemMonitor::sampleCount);

    m.def(
        "init_logging",
        [](const std::string& level, const std::string& file) {
            airmon::log::LogSettings settings;
            settings.level = level;
            settings.file = file;
            airmon::log::initLogging(settings);
        },
        py::arg("level") = "info", py::arg("file") = "");
}
