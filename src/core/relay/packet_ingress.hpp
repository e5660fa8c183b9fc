// src/core/relay/packet_ingress.hpp
#ifndef UDP_RELAY_PACKET_INGRESS_HPP
#define UDP_RELAY_PACKET_INGRESS_HPP

#include "capture_source.hpp"
#include "relay_types.hpp"
#include <cstdint>
#include <string>
#include <pcap/pcap.h>

namespace UdpRelay
{
    namespace Relay
    {
        /**
         * @brief Capture settings for one interface
         */
        struct IngressConfig
        {
            std::string interface;
            std::string bpf_filter;
            int snaplen;
            int timeout_ms;
            bool promiscuous;

            IngressConfig()
                : snaplen(kSnapLength),
                  timeout_ms(250),
                  promiscuous(false) {}
        };

        /**
         * @class PacketIngress
         * @brief libpcap capture subscription of one endpoint
         *
         * Inbound direction only, non-blocking, filter applied before the
         * handle is handed to the relay loop.
         */
        class PacketIngress : public CaptureSource
        {
        public:
            explicit PacketIngress(const IngressConfig &config);
            ~PacketIngress() override;

            PacketIngress(const PacketIngress &) = delete;
            PacketIngress &operator=(const PacketIngress &) = delete;

            /**
             * @brief Create, configure and activate the pcap handle
             *
             * Order: create, snaplen/promisc/timeout/immediate, activate,
             * filter, direction, non-blocking, link type check.
             */
            RelayStatus initialize();

            int linkType() const override { return link_type_; }
            int selectableFd() const override { return selectable_fd_; }
            int dispatch(const FrameHandler &handler) override;
            std::string lastError() const override { return last_error_; }

            bool getKernelStats(uint64_t &received, uint64_t &dropped) const override;

            /**
             * @brief Map a pcap_activate() result to a setup error
             * @return NONE for success and for every PCAP_WARNING_* value
             */
            static RelayError activationError(int activate_result);

        private:
            static void pcapCallback(u_char *user, const struct pcap_pkthdr *header, const u_char *packet);

            RelayStatus fail(RelayError error, const std::string &message);
            RelayStatus applyFilter();

            IngressConfig config_;
            pcap_t *pcap_handle_;
            int link_type_;
            int selectable_fd_;
            std::string last_error_;
            const FrameHandler *active_handler_;
        };

    } // namespace Relay
} // namespace UdpRelay

#endif // UDP_RELAY_PACKET_INGRESS_HPP
