/*
 * usb_backend.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: USB backend selection and the sysfs backend

**************************************************/

#include "usb_backend.hpp"

#include <fstream>
#include <system_error>

#include <spdlog/spdlog.h>

#include "airmon/error/exception.hpp"
#include "airmon/utils/string.hpp"

namespace airmon::device {

namespace fs = std::filesystem;

namespace {

auto readAttribute(const fs::path& dir, const char* attribute)
    -> std::optional<std::string> {
    std::ifstream file(dir / attribute);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::string value;
    std::getline(file, value);
    return utils::trim(value);
}

auto readHexAttribute(const fs::path& dir, const char* attribute)
    -> std::optional<unsigned> {
    auto text = readAttribute(dir, attribute);
    if (!text) {
        return std::nullopt;
    }
    return utils::parseHex16(*text);
}

auto readIntAttribute(const fs::path& dir, const char* attribute)
    -> std::optional<int> {
    auto text = readAttribute(dir, attribute);
    if (!text || text->empty()) {
        return std::nullopt;
    }
    try {
        return std::stoi(*text);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

}  // namespace

SysfsUsbBackend::SysfsUsbBackend(fs::path root) : root_(std::move(root)) {
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        THROW_USB_BACKEND_ERROR("USB sysfs directory not available: ",
                                root_.string());
    }
}

auto SysfsUsbBackend::listDevices() -> std::vector<UsbDeviceInfo> {
    std::error_code ec;
    fs::directory_iterator it(root_, ec);
    if (ec) {
        THROW_USB_BACKEND_ERROR("Cannot read ", root_.string(), ": ",
                                ec.message());
    }

    std::vector<UsbDeviceInfo> devices;
    for (const auto& entry : it) {
        const std::string sysname = entry.path().filename().string();
        // Interface directories look like "1-1:1.0".
        if (sysname.find(':') != std::string::npos) {
            continue;
        }
        const fs::path dir = entry.path();
        auto vendor = readHexAttribute(dir, "idVendor");
        auto product = readHexAttribute(dir, "idProduct");
        auto busnum = readIntAttribute(dir, "busnum");
        auto devnum = readIntAttribute(dir, "devnum");
        if (!vendor || !product || !busnum || !devnum) {
            spdlog::debug("Skipping sysfs entry {} with incomplete descriptor",
                          sysname);
            continue;
        }

        UsbDeviceInfo info;
        info.vendorId = static_cast<std::uint16_t>(*vendor);
        info.productId = static_cast<std::uint16_t>(*product);
        info.deviceClass = static_cast<std::uint8_t>(
            readHexAttribute(dir, "bDeviceClass").value_or(0));
        info.bus = *busnum;
        info.address = *devnum;
        info.location = dir.string();

        std::error_code subEc;
        for (const auto& sub : fs::directory_iterator(dir, subEc)) {
            const std::string subname = sub.path().filename().string();
            if (!subname.starts_with(sysname + ":")) {
                continue;
            }
            if (auto cls = readHexAttribute(sub.path(), "bInterfaceClass")) {
                info.interfaceClasses.push_back(
                    static_cast<std::uint8_t>(*cls));
            }
        }
        devices.push_back(std::move(info));
    }
    spdlog::debug("sysfs reported {} USB devices", devices.size());
    return devices;
}

auto SysfsUsbBackend::readProduct(const UsbDeviceInfo& info)
    -> std::optional<std::string> {
    if (info.location.empty()) {
        THROW_USB_BACKEND_ERROR("Device ", info.bus, ":", info.address,
                                " has no sysfs location");
    }
    auto product = readAttribute(info.location, "product");
    if (product && product->empty()) {
        return std::nullopt;
    }
    return product;
}

auto defaultUsbBackendFactories() -> std::vector<UsbBackendFactory> {
    std::vector<UsbBackendFactory> factories;
    factories.emplace_back(
        []() -> std::shared_ptr<UsbBackend> {
            return std::make_shared<LibusbBackend>();
        });
#ifdef __linux__
    factories.emplace_back(
        []() -> std::shared_ptr<UsbBackend> {
            return std::make_shared<SysfsUsbBackend>();
        });
#endif
#ifdef _WIN32
    factories.emplace_back(
        []() -> std::shared_ptr<UsbBackend> {
            return std::make_shared<SetupApiUsbBackend>();
        });
#endif
    return factories;
}

auto selectUsbBackend(std::span<const UsbBackendFactory> factories)
    -> std::shared_ptr<UsbBackend> {
    for (const auto& factory : factories) {
        try {
            if (auto backend = factory()) {
                spdlog::info("Using USB backend: {}", backend->name());
                return backend;
            }
        } catch (const std::exception& ex) {
            spdlog::debug("USB backend unavailable: {}", ex.what());
        }
    }
    spdlog::warn(
        "No USB backend available. USB device detection will be limited.");
    return nullptr;
}

}  // namespace airmon::device
