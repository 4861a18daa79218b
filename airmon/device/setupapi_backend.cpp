/*
 * setupapi_backend.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Windows SetupAPI USB enumeration backend

**************************************************/

#ifdef _WIN32

#include "usb_backend.hpp"

#include <array>
#include <regex>

// clang-format off
#include <windows.h>
#include <setupapi.h>
// clang-format on
#if !defined(__MINGW32__) && !defined(__MINGW64__)
#pragma comment(lib, "setupapi.lib")
#endif

#include <spdlog/spdlog.h>

#include "airmon/error/exception.hpp"
#include "airmon/utils/string.hpp"

namespace airmon::device {

namespace {

constexpr DWORD BUFFER_SIZE = 1024;

auto registryString(HDEVINFO set, SP_DEVINFO_DATA& data, DWORD property)
    -> std::optional<std::string> {
    std::array<wchar_t, BUFFER_SIZE> buffer{};
    DWORD dataType = 0;
    DWORD size = 0;
    if (!SetupDiGetDeviceRegistryPropertyW(
            set, &data, property, &dataType,
            reinterpret_cast<PBYTE>(buffer.data()),
            static_cast<DWORD>(buffer.size() * sizeof(wchar_t)), &size)) {
        return std::nullopt;
    }
    // Multi-sz values: only the first entry is used.
    return utils::wstringToString(std::wstring_view(buffer.data()));
}

auto matchHex(const std::string& text, const std::regex& pattern)
    -> std::optional<unsigned> {
    std::smatch match;
    if (std::regex_search(text, match, pattern)) {
        return utils::parseHex16(match[1].str());
    }
    return std::nullopt;
}

}  // namespace

auto SetupApiUsbBackend::listDevices() -> std::vector<UsbDeviceInfo> {
    HDEVINFO set = SetupDiGetClassDevsW(nullptr, L"USB", nullptr,
                                        DIGCF_PRESENT | DIGCF_ALLCLASSES);
    if (set == INVALID_HANDLE_VALUE) {
        THROW_USB_BACKEND_ERROR("SetupDiGetClassDevs failed: ",
                                GetLastError());
    }

    static const std::regex VID_PATTERN("VID_([0-9A-Fa-f]{4})");
    static const std::regex PID_PATTERN("PID_([0-9A-Fa-f]{4})");
    static const std::regex CLASS_PATTERN("Class_([0-9A-Fa-f]{2})");
    static const std::regex PORT_PATTERN("Port_#([0-9]+)\\.Hub_#([0-9]+)");

    std::vector<UsbDeviceInfo> devices;
    SP_DEVINFO_DATA data{};
    data.cbSize = sizeof(SP_DEVINFO_DATA);
    for (DWORD i = 0; SetupDiEnumDeviceInfo(set, i, &data); ++i) {
        auto hardwareId = registryString(set, data, SPDRP_HARDWAREID);
        if (!hardwareId) {
            continue;
        }
        auto vid = matchHex(*hardwareId, VID_PATTERN);
        auto pid = matchHex(*hardwareId, PID_PATTERN);
        if (!vid || !pid) {
            continue;
        }

        UsbDeviceInfo info;
        info.vendorId = static_cast<std::uint16_t>(*vid);
        info.productId = static_cast<std::uint16_t>(*pid);
        if (auto compatible = registryString(set, data, SPDRP_COMPATIBLEIDS)) {
            if (auto cls = matchHex(*compatible, CLASS_PATTERN)) {
                info.deviceClass = static_cast<std::uint8_t>(*cls);
                info.interfaceClasses.push_back(info.deviceClass);
            }
        }
        if (auto location =
                registryString(set, data, SPDRP_LOCATION_INFORMATION)) {
            std::smatch match;
            if (std::regex_search(*location, match, PORT_PATTERN)) {
                info.address = std::stoi(match[1].str());
                info.bus = std::stoi(match[2].str());
            }
        }
        info.product = registryString(set, data, SPDRP_FRIENDLYNAME);
        if (!info.product) {
            info.product = registryString(set, data, SPDRP_DEVICEDESC);
        }
        info.location = *hardwareId;
        devices.push_back(std::move(info));
    }
    SetupDiDestroyDeviceInfoList(set);

    spdlog::debug("SetupAPI reported {} USB devices", devices.size());
    return devices;
}

auto SetupApiUsbBackend::readProduct(const UsbDeviceInfo& info)
    -> std::optional<std::string> {
    return info.product;
}

}  // namespace airmon::device

#endif  // _WIN32
