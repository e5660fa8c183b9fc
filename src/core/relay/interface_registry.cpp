// src/core/relay/interface_registry.cpp
#include "interface_registry.hpp"
#include "network_utils.hpp"
#include <netinet/in.h>
#include <sys/socket.h>
#include <pcap/pcap.h>
#include <spdlog/spdlog.h>

namespace UdpRelay
{
    namespace Relay
    {
        bool InterfaceEntry::firstIPv4(InterfaceAddress &address) const
        {
            for (const auto &addr : addresses)
            {
                if (addr.family == AF_INET)
                {
                    address = addr;
                    return true;
                }
            }
            return false;
        }

        // ==================== InterfaceRegistry ====================

        InterfaceRegistry::InterfaceRegistry()
            : InterfaceRegistry(&InterfaceRegistry::enumeratePcapDevices)
        {
        }

        InterfaceRegistry::InterfaceRegistry(Enumerator enumerator)
            : enumerator_(std::move(enumerator)),
              populated_(false)
        {
        }

        RelayStatus InterfaceRegistry::resolve(const std::string &name, InterfaceEntry &entry)
        {
            std::lock_guard<std::mutex> lock(mutex_);

            RelayStatus status = populateLocked();
            if (!status.ok())
            {
                return status;
            }

            for (const auto &candidate : entries_)
            {
                if (candidate.name == name)
                {
                    entry = candidate;
                    return RelayStatus();
                }
            }

            return RelayStatus(RelayError::INTERFACE_UNAVAILABLE,
                               "Interface " + name + " does not exist or has no addresses");
        }

        RelayStatus InterfaceRegistry::all(std::vector<InterfaceEntry> &entries)
        {
            std::lock_guard<std::mutex> lock(mutex_);

            RelayStatus status = populateLocked();
            if (status.ok())
            {
                entries = entries_;
            }
            return status;
        }

        RelayStatus InterfaceRegistry::populateLocked()
        {
            if (populated_)
            {
                return RelayStatus();
            }

            if (!enumerator_)
            {
                return RelayStatus(RelayError::INTERFACE_UNAVAILABLE, "No interface enumerator configured");
            }

            std::vector<InterfaceEntry> found;
            std::string error;
            if (!enumerator_(found, error))
            {
                return RelayStatus(RelayError::INTERFACE_UNAVAILABLE,
                                   "Interface enumeration failed: " + error);
            }

            entries_.clear();
            for (auto &entry : found)
            {
                if (entry.addresses.empty())
                {
                    continue;
                }
                entries_.push_back(std::move(entry));
            }

            populated_ = true;
            spdlog::debug("Interface registry populated with {} interface(s)", entries_.size());
            return RelayStatus();
        }

        bool InterfaceRegistry::enumeratePcapDevices(std::vector<InterfaceEntry> &entries, std::string &error)
        {
            char errbuf[PCAP_ERRBUF_SIZE];
            pcap_if_t *alldevs = nullptr;

            if (pcap_findalldevs(&alldevs, errbuf) == -1)
            {
                error = errbuf;
                return false;
            }

            for (pcap_if_t *dev = alldevs; dev != nullptr; dev = dev->next)
            {
                InterfaceEntry entry;
                entry.name = dev->name;
                entry.description = dev->description ? dev->description : "";

                for (pcap_addr_t *a = dev->addresses; a != nullptr; a = a->next)
                {
                    if (!a->addr || (a->addr->sa_family != AF_INET && a->addr->sa_family != AF_INET6))
                    {
                        continue;
                    }

                    InterfaceAddress addr;
                    addr.family = a->addr->sa_family;
                    addr.address = Common::NetworkUtils::sockaddrToString(a->addr);
                    if (a->netmask)
                    {
                        addr.prefix_length = Common::NetworkUtils::sockaddrPrefixLength(a->netmask);
                    }
                    if (a->broadaddr)
                    {
                        addr.broadcast = Common::NetworkUtils::sockaddrToString(a->broadaddr);
                    }
                    if (a->dstaddr)
                    {
                        addr.peer = Common::NetworkUtils::sockaddrToString(a->dstaddr);
                    }
                    if (addr.family == AF_INET)
                    {
                        addr.ipv4_addr = reinterpret_cast<const struct sockaddr_in *>(a->addr)->sin_addr.s_addr;
                    }

                    entry.addresses.push_back(addr);
                }

                entries.push_back(entry);
            }

            pcap_freealldevs(alldevs);
            return true;
        }

    } // namespace Relay
} // namespace UdpRelay
