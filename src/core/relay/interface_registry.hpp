// src/core/relay/interface_registry.hpp
#ifndef UDP_RELAY_INTERFACE_REGISTRY_HPP
#define UDP_RELAY_INTERFACE_REGISTRY_HPP

#include "relay_types.hpp"
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace UdpRelay
{
    namespace Relay
    {
        /**
         * @brief One address of a host interface
         */
        struct InterfaceAddress
        {
            int family;                 // AF_INET or AF_INET6
            std::string address;
            int prefix_length;          // -1 when no netmask was reported
            std::string broadcast;      // empty if none
            std::string peer;           // point-to-point destination, empty if none
            uint32_t ipv4_addr;         // network byte order, 0 unless AF_INET

            InterfaceAddress() : family(0), prefix_length(-1), ipv4_addr(0) {}
        };

        /**
         * @brief Registry entry: interface name and its addresses
         */
        struct InterfaceEntry
        {
            std::string name;
            std::string description;
            std::vector<InterfaceAddress> addresses;

            /**
             * @brief First IPv4 address in enumeration order
             * @return false if the interface has no IPv4 address
             */
            bool firstIPv4(InterfaceAddress &address) const;
        };

        /**
         * @class InterfaceRegistry
         * @brief Resolves interface names to their addresses
         *
         * The host is enumerated once, on the first query; later queries reuse
         * that snapshot for the lifetime of the registry. Interfaces without
         * any address are left out of the snapshot.
         */
        class InterfaceRegistry
        {
        public:
            using Enumerator = std::function<bool(std::vector<InterfaceEntry> &entries, std::string &error)>;

            InterfaceRegistry();
            explicit InterfaceRegistry(Enumerator enumerator);

            InterfaceRegistry(const InterfaceRegistry &) = delete;
            InterfaceRegistry &operator=(const InterfaceRegistry &) = delete;

            /**
             * @brief Look up @p name
             * @return INTERFACE_UNAVAILABLE if enumeration failed or the name is unknown
             */
            RelayStatus resolve(const std::string &name, InterfaceEntry &entry);

            /**
             * @brief Every interface with at least one address
             */
            RelayStatus all(std::vector<InterfaceEntry> &entries);

            /**
             * @brief Enumerator backed by pcap_findalldevs()
             */
            static bool enumeratePcapDevices(std::vector<InterfaceEntry> &entries, std::string &error);

        private:
            RelayStatus populateLocked();

            Enumerator enumerator_;
            std::vector<InterfaceEntry> entries_;
            bool populated_;
            std::mutex mutex_;
        };

    } // namespace Relay
} // namespace UdpRelay

#endif // UDP_RELAY_INTERFACE_REGISTRY_HPP
