/*
 * libusb_backend.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: libusb-1.0 USB enumeration backend

**************************************************/

#include "usb_backend.hpp"

#include <array>
#include <map>
#include <span>
#include <utility>

#include <libusb-1.0/libusb.h>
#include <spdlog/spdlog.h>

#include "airmon/error/exception.hpp"

namespace airmon::device {

namespace {

struct DeviceListDeleter {
    void operator()(libusb_device** list) const {
        libusb_free_device_list(list, 1);
    }
};

using DeviceList = std::unique_ptr<libusb_device*, DeviceListDeleter>;

auto interfaceClassesOf(libusb_device* device) -> std::vector<std::uint8_t> {
    std::vector<std::uint8_t> classes;
    libusb_config_descriptor* config = nullptr;
    int ret = libusb_get_active_config_descriptor(device, &config);
    if (ret != LIBUSB_SUCCESS) {
        ret = libusb_get_config_descriptor(device, 0, &config);
    }
    if (ret != LIBUSB_SUCCESS || config == nullptr) {
        return classes;
    }
    for (int i = 0; i < config->bNumInterfaces; ++i) {
        const libusb_interface& iface = config->interface[i];
        for (int alt = 0; alt < iface.num_altsetting; ++alt) {
            classes.push_back(iface.altsetting[alt].bInterfaceClass);
        }
    }
    libusb_free_config_descriptor(config);
    return classes;
}

}  // namespace

class LibusbBackend::Impl {
public:
    Impl() {
        int ret = libusb_init(&ctx_);
        if (ret != LIBUSB_SUCCESS) {
            THROW_USB_BACKEND_ERROR("Failed to initialize libusb: ",
                                    libusb_error_name(ret));
        }
    }

    ~Impl() {
        byLocation_.clear();
        snapshot_.reset();
        if (ctx_ != nullptr) {
            libusb_exit(ctx_);
        }
    }

    Impl(const Impl&) = delete;
    auto operator=(const Impl&) -> Impl& = delete;

    /// Replace the held device list with a fresh one from libusb.
    auto refresh() -> std::span<libusb_device* const> {
        libusb_device** list = nullptr;
        ssize_t count = libusb_get_device_list(ctx_, &list);
        if (count < 0) {
            THROW_USB_BACKEND_ERROR(
                "Failed to get USB device list: ",
                libusb_error_name(static_cast<int>(count)));
        }
        byLocation_.clear();
        snapshot_.reset(list);
        std::span<libusb_device* const> devices(list,
                                                static_cast<size_t>(count));
        for (libusb_device* device : devices) {
            byLocation_[{libusb_get_bus_number(device),
                         libusb_get_device_address(device)}] = device;
        }
        return devices;
    }

    /// Device at bus:address in the held list, refreshing once on a miss.
    auto find(int bus, int address) -> libusb_device* {
        if (auto it = byLocation_.find({bus, address});
            it != byLocation_.end()) {
            return it->second;
        }
        refresh();
        auto it = byLocation_.find({bus, address});
        return it != byLocation_.end() ? it->second : nullptr;
    }

private:
    libusb_context* ctx_{nullptr};
    // The list holds a reference on each device until it is freed.
    DeviceList snapshot_;
    std::map<std::pair<int, int>, libusb_device*> byLocation_;
};

LibusbBackend::LibusbBackend() : impl_(std::make_unique<Impl>()) {}

LibusbBackend::~LibusbBackend() = default;

auto LibusbBackend::listDevices() -> std::vector<UsbDeviceInfo> {
    auto list = impl_->refresh();

    std::vector<UsbDeviceInfo> devices;
    devices.reserve(list.size());
    for (libusb_device* device : list) {
        libusb_device_descriptor desc{};
        int ret = libusb_get_device_descriptor(device, &desc);
        if (ret != LIBUSB_SUCCESS) {
            spdlog::debug("Failed to get device descriptor: {}",
                          libusb_error_name(ret));
            continue;
        }

        UsbDeviceInfo info;
        info.vendorId = desc.idVendor;
        info.productId = desc.idProduct;
        info.deviceClass = desc.bDeviceClass;
        info.bus = libusb_get_bus_number(device);
        info.address = libusb_get_device_address(device);
        info.productIndex = desc.iProduct;
        info.interfaceClasses = interfaceClassesOf(device);
        devices.push_back(std::move(info));
    }
    spdlog::debug("libusb reported {} USB devices", devices.size());
    return devices;
}

auto LibusbBackend::readProduct(const UsbDeviceInfo& info)
    -> std::optional<std::string> {
    if (info.productIndex == 0) {
        return std::nullopt;
    }

    libusb_device* device = impl_->find(info.bus, info.address);
    if (device == nullptr) {
        THROW_USB_BACKEND_ERROR("USB device ", info.bus, ":", info.address,
                                " is no longer attached");
    }

    libusb_device_handle* handle = nullptr;
    int ret = libusb_open(device, &handle);
    if (ret != LIBUSB_SUCCESS) {
        THROW_USB_BACKEND_ERROR("Cannot open USB device ", info.bus, ":",
                                info.address, ": ", libusb_error_name(ret));
    }
    std::array<unsigned char, 256> buffer{};
    int len = libusb_get_string_descriptor_ascii(
        handle, info.productIndex, buffer.data(),
        static_cast<int>(buffer.size()));
    libusb_close(handle);
    if (len < 0) {
        THROW_USB_BACKEND_ERROR("Cannot read product string of ", info.bus,
                                ":", info.address, ": ",
                                libusb_error_name(len));
    }
    return std::string(reinterpret_cast<const char*>(buffer.data()),
                       static_cast<size_t>(len));
}

}  // namespace airmon::device
