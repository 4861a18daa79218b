/*
 * net_interfaces.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Structured enumeration of host network interfaces

**************************************************/

#include "net_interfaces.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <map>

#ifdef _WIN32
// clang-format off
#include <winsock2.h>
#include <ws2tcpip.h>
#include <iphlpapi.h>
// clang-format on
#if !defined(__MINGW32__) && !defined(__MINGW64__)
#pragma comment(lib, "iphlpapi.lib")
#pragma comment(lib, "ws2_32.lib")
#endif
#else
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>
#ifdef __linux__
#include <linux/if_packet.h>
#elif defined(__APPLE__)
#include <net/if_dl.h>
#endif
#endif

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "airmon/error/exception.hpp"
#include "airmon/utils/string.hpp"

namespace airmon::device {

auto NetInterfaceSnapshot::linkAddress() const -> std::optional<std::string> {
    for (const auto& addr : addresses) {
        if (addr.family == AddressFamily::Link && !addr.address.empty()) {
            return addr.address;
        }
    }
    return std::nullopt;
}

auto formatMacAddress(const unsigned char* bytes, std::size_t length)
    -> std::string {
    std::string mac;
    for (std::size_t i = 0; i < length; ++i) {
        if (i > 0) {
            mac += ':';
        }
        mac += fmt::format("{:02X}", bytes[i]);
    }
    return mac;
}

namespace {

#ifdef _WIN32
class AdaptersInterfaceSource : public NetInterfaceSource {
public:
    [[nodiscard]] auto name() const -> std::string_view override {
        return "GetAdaptersAddresses";
    }

    auto listInterfaces() -> std::vector<NetInterfaceSnapshot> override {
        constexpr ULONG INITIAL_BUFFER_SIZE = 15000;
        ULONG outBufLen = INITIAL_BUFFER_SIZE;
        std::vector<BYTE> buffer(outBufLen);
        auto* addresses =
            reinterpret_cast<PIP_ADAPTER_ADDRESSES>(buffer.data());

        DWORD ret = GetAdaptersAddresses(AF_UNSPEC, GAA_FLAG_INCLUDE_PREFIX,
                                         nullptr, addresses, &outBufLen);
        if (ret == ERROR_BUFFER_OVERFLOW) {
            buffer.resize(outBufLen);
            addresses = reinterpret_cast<PIP_ADAPTER_ADDRESSES>(buffer.data());
            ret = GetAdaptersAddresses(AF_UNSPEC, GAA_FLAG_INCLUDE_PREFIX,
                                       nullptr, addresses, &outBufLen);
        }
        if (ret != NO_ERROR) {
            THROW_SYSTEM_ERROR("GetAdaptersAddresses failed with error: ",
                               ret);
        }

        std::vector<NetInterfaceSnapshot> interfaces;
        for (auto* adapter = addresses; adapter != nullptr;
             adapter = adapter->Next) {
            NetInterfaceSnapshot snapshot;
            snapshot.name = utils::wstringToString(adapter->FriendlyName);

            for (auto* unicast = adapter->FirstUnicastAddress;
                 unicast != nullptr; unicast = unicast->Next) {
                std::array<char, INET6_ADDRSTRLEN> ipStr{};
                if (getnameinfo(unicast->Address.lpSockaddr,
                                unicast->Address.iSockaddrLength,
                                ipStr.data(), static_cast<DWORD>(ipStr.size()),
                                nullptr, 0, NI_NUMERICHOST) == 0) {
                    snapshot.addresses.push_back(
                        {unicast->Address.lpSockaddr->sa_family == AF_INET6
                             ? AddressFamily::Inet6
                             : AddressFamily::Inet,
                         ipStr.data()});
                }
            }
            if (adapter->PhysicalAddressLength > 0) {
                snapshot.addresses.push_back(
                    {AddressFamily::Link,
                     formatMacAddress(adapter->PhysicalAddress,
                                      adapter->PhysicalAddressLength)});
            }
            snapshot.stats = InterfaceStats{adapter->OperStatus ==
                                            IfOperStatusUp};
            interfaces.push_back(std::move(snapshot));
        }
        return interfaces;
    }
};
#else
class IfAddrsInterfaceSource : public NetInterfaceSource {
public:
    [[nodiscard]] auto name() const -> std::string_view override {
        return "getifaddrs";
    }

    auto listInterfaces() -> std::vector<NetInterfaceSnapshot> override {
        struct ifaddrs* ifAddrStruct = nullptr;
        if (getifaddrs(&ifAddrStruct) == -1) {
            THROW_SYSTEM_ERROR("getifaddrs failed: ", strerror(errno));
        }

        // Keep first-seen order of interface names.
        std::vector<NetInterfaceSnapshot> interfaces;
        std::map<std::string, size_t> indexByName;

        for (auto* ifa = ifAddrStruct; ifa != nullptr; ifa = ifa->ifa_next) {
            if (ifa->ifa_name == nullptr) {
                continue;
            }
            std::string ifName = ifa->ifa_name;
            auto [it, inserted] =
                indexByName.emplace(ifName, interfaces.size());
            if (inserted) {
                NetInterfaceSnapshot snapshot;
                snapshot.name = ifName;
                interfaces.push_back(std::move(snapshot));
            }
            auto& snapshot = interfaces[it->second];
            snapshot.stats = InterfaceStats{(ifa->ifa_flags & IFF_UP) != 0};

            if (ifa->ifa_addr == nullptr) {
                continue;
            }
            switch (ifa->ifa_addr->sa_family) {
                case AF_INET: {
                    std::array<char, INET_ADDRSTRLEN> address{};
                    inet_ntop(AF_INET,
                              &reinterpret_cast<sockaddr_in*>(ifa->ifa_addr)
                                   ->sin_addr,
                              address.data(), address.size());
                    snapshot.addresses.push_back(
                        {AddressFamily::Inet, address.data()});
                    break;
                }
                case AF_INET6: {
                    std::array<char, INET6_ADDRSTRLEN> address{};
                    inet_ntop(AF_INET6,
                              &reinterpret_cast<sockaddr_in6*>(ifa->ifa_addr)
                                   ->sin6_addr,
                              address.data(), address.size());
                    snapshot.addresses.push_back(
                        {AddressFamily::Inet6, address.data()});
                    break;
                }
#ifdef __linux__
                case AF_PACKET: {
                    const auto* ll =
                        reinterpret_cast<sockaddr_ll*>(ifa->ifa_addr);
                    if (ll->sll_halen > 0) {
                        snapshot.addresses.push_back(
                            {AddressFamily::Link,
                             formatMacAddress(ll->sll_addr, ll->sll_halen)});
                    }
                    break;
                }
#elif defined(__APPLE__)
                case AF_LINK: {
                    const auto* dl =
                        reinterpret_cast<sockaddr_dl*>(ifa->ifa_addr);
                    if (dl->sdl_alen > 0) {
                        snapshot.addresses.push_back(
                            {AddressFamily::Link,
                             formatMacAddress(reinterpret_cast<const unsigned char*>(
                                                  LLADDR(dl)),
                                              dl->sdl_alen)});
                    }
                    break;
                }
#endif
                default:
                    break;
            }
        }

        freeifaddrs(ifAddrStruct);
        return interfaces;
    }
};
#endif

}  // namespace

auto createNetInterfaceSource() -> std::shared_ptr<NetInterfaceSource> {
#ifdef _WIN32
    return std::make_shared<AdaptersInterfaceSource>();
#else
    return std::make_shared<IfAddrsInterfaceSource>();
#endif
}

}  // namespace airmon::device
