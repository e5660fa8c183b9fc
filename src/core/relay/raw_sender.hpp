// src/core/relay/raw_sender.hpp
#ifndef UDP_RELAY_RAW_SENDER_HPP
#define UDP_RELAY_RAW_SENDER_HPP

#include "capture_source.hpp"
#include "relay_types.hpp"
#include <cstdint>
#include <string>

namespace UdpRelay
{
    namespace Relay
    {
        /**
         * @class RawSocketSender
         * @brief IP_HDRINCL socket injecting rebuilt datagrams on one interface
         *
         * Every write names the egress interface and source address explicitly
         * through IP_PKTINFO, so the routing table never picks the interface.
         */
        class RawSocketSender : public DatagramSender
        {
        public:
            RawSocketSender();
            ~RawSocketSender() override;

            RawSocketSender(const RawSocketSender &) = delete;
            RawSocketSender &operator=(const RawSocketSender &) = delete;

            /**
             * @brief Open the socket and bind it to @p local_addr
             * @param interface Egress interface name
             * @param local_addr Interface's first IPv4 address, network byte order
             */
            RelayStatus open(const std::string &interface, uint32_t local_addr);

            bool send(const Common::OutboundDatagram &datagram, std::string &error) override;

        private:
            void closeSocket();

            int sockfd_;
            unsigned int ifindex_;
            uint32_t local_addr_;
            std::string interface_;
        };

    } // namespace Relay
} // namespace UdpRelay

#endif // UDP_RELAY_RAW_SENDER_HPP
