/*
 * usb_backend.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Structured USB enumeration backends (libusb, sysfs, SetupAPI)

**************************************************/

#ifndef AIRMON_DEVICE_USB_BACKEND_HPP
#define AIRMON_DEVICE_USB_BACKEND_HPP

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace airmon::device {

/**
 * @brief Descriptor data of one attached USB device.
 */
struct UsbDeviceInfo {
    std::uint16_t vendorId{0};
    std::uint16_t productId{0};
    std::uint8_t deviceClass{0};
    int bus{0};
    int address{0};
    std::vector<std::uint8_t> interfaceClasses;
    /// Index of the product string descriptor, 0 when the device has none.
    std::uint8_t productIndex{0};
    /// Product text already known from enumeration, if any.
    std::optional<std::string> product;
    /// Backend specific location, e.g. the sysfs directory.
    std::string location;
};

/**
 * @brief A structured source of USB device descriptors.
 */
class UsbBackend {
public:
    virtual ~UsbBackend() = default;

    /// Short name recorded as the detection method, e.g. "libusb".
    [[nodiscard]] virtual auto name() const -> std::string_view = 0;

    /**
     * @brief Enumerate attached devices.
     *
     * Devices whose descriptors cannot be read are left out.
     * @throws airmon::error::UsbBackendError when enumeration fails as a whole
     */
    virtual auto listDevices() -> std::vector<UsbDeviceInfo> = 0;

    /**
     * @brief Read the product string of a device.
     * @return nullopt when the device has no product string
     * @throws airmon::error::UsbBackendError when the device cannot be read
     */
    virtual auto readProduct(const UsbDeviceInfo& info)
        -> std::optional<std::string> = 0;
};

/**
 * @brief libusb-1.0 backend. Owns one libusb context for its lifetime.
 */
class LibusbBackend : public UsbBackend {
public:
    /**
     * @brief Initialize libusb.
     * @throws airmon::error::UsbBackendError when libusb_init fails
     */
    LibusbBackend();
    ~LibusbBackend() override;

    LibusbBackend(const LibusbBackend&) = delete;
    auto operator=(const LibusbBackend&) -> LibusbBackend& = delete;

    [[nodiscard]] auto name() const -> std::string_view override {
        return "libusb";
    }
    auto listDevices() -> std::vector<UsbDeviceInfo> override;
    auto readProduct(const UsbDeviceInfo& info)
        -> std::optional<std::string> override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Reads /sys/bus/usb/devices (or another root given for testing).
 */
class SysfsUsbBackend : public UsbBackend {
public:
    /**
     * @throws airmon::error::UsbBackendError when `root` is not a directory
     */
    explicit SysfsUsbBackend(
        std::filesystem::path root = "/sys/bus/usb/devices");

    [[nodiscard]] auto name() const -> std::string_view override {
        return "sysfs";
    }
    auto listDevices() -> std::vector<UsbDeviceInfo> override;
    auto readProduct(const UsbDeviceInfo& info)
        -> std::optional<std::string> override;

private:
    std::filesystem::path root_;
};

#ifdef _WIN32
/**
 * @brief Windows SetupAPI backend over the present USB device set.
 */
class SetupApiUsbBackend : public UsbBackend {
public:
    [[nodiscard]] auto name() const -> std::string_view override {
        return "setupapi";
    }
    auto listDevices() -> std::vector<UsbDeviceInfo> override;
    auto readProduct(const UsbDeviceInfo& info)
        -> std::optional<std::string> override;
};
#endif

using UsbBackendFactory = std::function<std::shared_ptr<UsbBackend>()>;

/**
 * @brief Factories in preference order: libusb, sysfs, SetupAPI. Entries for
 * backends that do not exist on this platform are omitted.
 */
[[nodiscard]] auto defaultUsbBackendFactories() -> std::vector<UsbBackendFactory>;

/**
 * @brief Return the first backend whose factory succeeds.
 *
 * A factory fails by throwing or by returning nullptr. Returns nullptr when
 * every factory fails.
 */
[[nodiscard]] auto selectUsbBackend(std::span<const UsbBackendFactory> factories)
    -> std::shared_ptr<UsbBackend>;

}  // namespace airmon::device

#endif  // AIRMON_DEVICE_USB_BACKEND_HPP
