/*
 * net_interfaces.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Structured enumeration of host network interfaces

**************************************************/

#ifndef AIRMON_DEVICE_NET_INTERFACES_HPP
#define AIRMON_DEVICE_NET_INTERFACES_HPP

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace airmon::device {

enum class AddressFamily { Inet, Inet6, Link };

struct InterfaceAddress {
    AddressFamily family{AddressFamily::Inet};
    std::string address;
};

struct InterfaceStats {
    bool isUp{false};
};

/**
 * @brief Addresses and link state of one interface at enumeration time.
 */
struct NetInterfaceSnapshot {
    std::string name;
    std::vector<InterfaceAddress> addresses;
    /// Absent when the OS reported no link statistics for the interface.
    std::optional<InterfaceStats> stats;

    /**
     * @brief First link-layer (MAC) address, if any.
     */
    [[nodiscard]] auto linkAddress() const -> std::optional<std::string>;
};

/**
 * @brief Source of interface snapshots.
 */
class NetInterfaceSource {
public:
    virtual ~NetInterfaceSource() = default;

    [[nodiscard]] virtual auto name() const -> std::string_view = 0;

    /**
     * @throws airmon::error::SystemError when the OS call fails
     */
    virtual auto listInterfaces() -> std::vector<NetInterfaceSnapshot> = 0;
};

/**
 * @brief getifaddrs() on POSIX systems, GetAdaptersAddresses() on Windows.
 */
[[nodiscard]] auto createNetInterfaceSource()
    -> std::shared_ptr<NetInterfaceSource>;

/**
 * @brief Format six bytes as "AA:BB:CC:DD:EE:FF".
 */
[[nodiscard]] auto formatMacAddress(const unsigned char* bytes,
                                    std::size_t length) -> std::string;

}  // namespace airmon::device

#endif  // AIRMON_DEVICE_NET_INTERFACES_HPP
