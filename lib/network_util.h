#ifndef NETWORK_UTIL_H
#define NETWORK_UTIL_H

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <ifaddrs.h>
#include <memory>
#include <netpacket/packet.h>
#include <sys/socket.h>
#include <string>
#include <vector>
#include "guid/guid_error.h"

struct NetworkInterface {
    std::string name;
    std::vector<uint8_t> hardware_addr;
};

/**
 * Lists the host's network interfaces in the order the kernel reports them,
 * one entry per link, together with their hardware (MAC) address.
 *
 * An all-zero address, as reported for the loopback interface, is returned
 * as an empty hardware_addr. Addresses longer than sockaddr_ll::sll_addr
 * (8 bytes, e.g. 20-byte InfiniBand addresses) are truncated to 8 bytes.
 *
 * @throws GuidError(InterfaceEnumerationFailure) if getifaddrs() fails.
 */
inline std::vector<NetworkInterface> list_network_interfaces() {
    struct ifaddrs *interfaces = nullptr;
    struct ifaddrs *temp_addr = nullptr;
    std::vector<NetworkInterface> result;

    if (getifaddrs(&interfaces) != 0) {
        throw GuidError(GuidErrc::InterfaceEnumerationFailure,
                        std::string("Unable to get interfaces: ") + strerror(errno));
    }
    std::unique_ptr<struct ifaddrs, decltype(&freeifaddrs)> guard(interfaces, &freeifaddrs);

    temp_addr = interfaces;
    while (temp_addr != nullptr) {
        // Find the entry for this link or add one in enumeration order
        NetworkInterface *iface = nullptr;
        for (auto &existing : result) {
            if (existing.name == temp_addr->ifa_name) {
                iface = &existing;
                break;
            }
        }
        if (iface == nullptr) {
            result.push_back(NetworkInterface{temp_addr->ifa_name, {}});
            iface = &result.back();
        }

        if (temp_addr->ifa_addr != nullptr && temp_addr->ifa_addr->sa_family == AF_PACKET) {
            struct sockaddr_ll *ll = (struct sockaddr_ll *)temp_addr->ifa_addr;
            size_t halen = ll->sll_halen < sizeof(ll->sll_addr) ? ll->sll_halen : sizeof(ll->sll_addr);
            bool nonzero = false;
            for (size_t i = 0; i < halen; ++i) {
                if (ll->sll_addr[i] != 0) {
                    nonzero = true;
                }
            }
            if (nonzero) {
                iface->hardware_addr.assign(ll->sll_addr, ll->sll_addr + halen);
            }
        }
        temp_addr = temp_addr->ifa_next;
    }

    return result;
}

/**
 * Picks the interface whose hardware address seeds the machine identifier:
 * the first one with a non-empty address, otherwise the very first one.
 *
 * @throws GuidError(InterfaceEnumerationFailure) if the list is empty.
 */
inline const NetworkInterface &select_seed_interface(const std::vector<NetworkInterface> &interfaces) {
    if (interfaces.empty()) {
        throw GuidError(GuidErrc::InterfaceEnumerationFailure, "No network interfaces found");
    }

    for (const auto &iface : interfaces) {
        if (!iface.hardware_addr.empty()) {
            return iface;
        }
    }
    return interfaces.front();
}

#endif // NETWORK_UTIL_H
