// src/common/network_utils.hpp
#ifndef UDP_RELAY_NETWORK_UTILS_HPP
#define UDP_RELAY_NETWORK_UTILS_HPP

#include <cstdint>
#include <string>
#include <sys/socket.h>
#include <netinet/in.h>

namespace UdpRelay
{
    namespace Common
    {
        /**
         * @brief Address and port helpers
         *
         * Integer addresses are host byte order unless the name says otherwise.
         */
        class NetworkUtils
        {
        public:
            /**
             * @brief IP address utilities
             */
            static bool isValidIPv4(const std::string &ip);
            static uint32_t ipStringToInt(const std::string &ip);

            /**
             * @brief Parse a dotted quad into a network byte order address
             * @return false if @p ip is not a valid IPv4 address
             */
            static bool parseIPv4NetworkOrder(const std::string &ip, uint32_t &address);

            /**
             * @brief Format a network byte order address
             */
            static std::string networkOrderToString(uint32_t address);

            static bool isMulticastIP(const std::string &ip);

            /**
             * @brief Port utilities
             */
            static bool isValidPort(int port);

            /**
             * @brief sockaddr helpers, used for libpcap address lists
             *
             * Both accept AF_INET and AF_INET6, and return "" / 0 for anything else.
             */
            static std::string sockaddrToString(const struct sockaddr *addr);
            static int sockaddrPrefixLength(const struct sockaddr *netmask);

            /**
             * @brief Network calculation utilities
             */
            static int calculatePrefixLength(uint32_t subnet_mask);

        private:
            NetworkUtils() = default;
        };

    } // namespace Common
} // namespace UdpRelay

#endif // UDP_RELAY_NETWORK_UTILS_HPP
