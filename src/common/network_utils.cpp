// src/common/network_utils.cpp
#include "network_utils.hpp"
#include <arpa/inet.h>
#include <cstring>

namespace UdpRelay
{
    namespace Common
    {
        // ==================== IP address utilities ====================

        bool NetworkUtils::isValidIPv4(const std::string &ip)
        {
            struct in_addr addr;
            return inet_pton(AF_INET, ip.c_str(), &addr) == 1;
        }

        uint32_t NetworkUtils::ipStringToInt(const std::string &ip)
        {
            struct in_addr addr;
            if (inet_pton(AF_INET, ip.c_str(), &addr) == 1) {
                return ntohl(addr.s_addr);
            }
            return 0;
        }

        bool NetworkUtils::parseIPv4NetworkOrder(const std::string &ip, uint32_t &address)
        {
            struct in_addr addr;
            if (inet_pton(AF_INET, ip.c_str(), &addr) != 1) {
                return false;
            }
            address = addr.s_addr;
            return true;
        }

        std::string NetworkUtils::networkOrderToString(uint32_t address)
        {
            struct in_addr addr;
            addr.s_addr = address;
            char str[INET_ADDRSTRLEN];
            if (inet_ntop(AF_INET, &addr, str, INET_ADDRSTRLEN)) {
                return std::string(str);
            }
            return "";
        }

        bool NetworkUtils::isMulticastIP(const std::string &ip)
        {
            if (!isValidIPv4(ip)) {
                return false;
            }

            uint32_t ip_int = ipStringToInt(ip);
            // 224.0.0.0/4
            return (ip_int >= 0xE0000000) && (ip_int <= 0xEFFFFFFF);
        }

        // ==================== Port utilities ====================

        bool NetworkUtils::isValidPort(int port)
        {
            return port >= 1 && port <= 65535;
        }

        // ==================== sockaddr helpers ====================

        std::string NetworkUtils::sockaddrToString(const struct sockaddr *addr)
        {
            if (!addr) {
                return "";
            }

            char str[INET6_ADDRSTRLEN];
            if (addr->sa_family == AF_INET) {
                const auto *in = reinterpret_cast<const struct sockaddr_in *>(addr);
                if (inet_ntop(AF_INET, &in->sin_addr, str, sizeof(str))) {
                    return std::string(str);
                }
            } else if (addr->sa_family == AF_INET6) {
                const auto *in6 = reinterpret_cast<const struct sockaddr_in6 *>(addr);
                if (inet_ntop(AF_INET6, &in6->sin6_addr, str, sizeof(str))) {
                    return std::string(str);
                }
            }
            return "";
        }

        int NetworkUtils::sockaddrPrefixLength(const struct sockaddr *netmask)
        {
            if (!netmask) {
                return 0;
            }

            if (netmask->sa_family == AF_INET) {
                const auto *in = reinterpret_cast<const struct sockaddr_in *>(netmask);
                return calculatePrefixLength(ntohl(in->sin_addr.s_addr));
            }

            if (netmask->sa_family == AF_INET6) {
                const auto *in6 = reinterpret_cast<const struct sockaddr_in6 *>(netmask);
                int prefix_len = 0;
                for (int i = 0; i < 16; ++i) {
                    uint8_t byte = in6->sin6_addr.s6_addr[i];
                    while (byte & 0x80) {
                        prefix_len++;
                        byte = static_cast<uint8_t>(byte << 1);
                    }
                    if (in6->sin6_addr.s6_addr[i] != 0xFF) {
                        break;
                    }
                }
                return prefix_len;
            }

            return 0;
        }

        // ==================== Network calculation utilities ====================

        int NetworkUtils::calculatePrefixLength(uint32_t subnet_mask)
        {
            if (subnet_mask == 0) {
                return 0;
            }

            int prefix_len = 0;
            while (subnet_mask & 0x80000000) {
                prefix_len++;
                subnet_mask <<= 1;
            }

            return prefix_len;
        }

    } // namespace Common
} // namespace UdpRelay
