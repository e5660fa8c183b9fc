// src/core/relay/packet_ingress.cpp

#include "packet_ingress.hpp"
#include "packet_codec.hpp"
#include <spdlog/spdlog.h>

namespace UdpRelay
{
    namespace Relay
    {
        // ==================== PacketIngress Implementation ====================

        PacketIngress::PacketIngress(const IngressConfig &config)
            : config_(config),
              pcap_handle_(nullptr),
              link_type_(-1),
              selectable_fd_(-1),
              active_handler_(nullptr)
        {
            spdlog::debug("PacketIngress created for interface: {}", config_.interface);
        }

        PacketIngress::~PacketIngress()
        {
            if (pcap_handle_)
            {
                pcap_close(pcap_handle_);
                pcap_handle_ = nullptr;
            }

            spdlog::debug("PacketIngress destroyed for interface: {}", config_.interface);
        }

        RelayStatus PacketIngress::initialize()
        {
            if (pcap_handle_)
            {
                spdlog::warn("PacketIngress already initialized for {}", config_.interface);
                return RelayStatus();
            }

            // 1. Create the handle (pcap_open_live gives no control over activation)
            char errbuf[PCAP_ERRBUF_SIZE];
            pcap_handle_ = pcap_create(config_.interface.c_str(), errbuf);

            if (!pcap_handle_)
            {
                return RelayStatus(RelayError::CAPTURE_OPEN_FAILED,
                                   "Failed to create pcap handle for " + config_.interface + ": " + errbuf);
            }

            // 2. Pre-activation settings
            if (pcap_set_snaplen(pcap_handle_, config_.snaplen) != 0)
            {
                spdlog::warn("{}: failed to set snaplen: {}", config_.interface, pcap_geterr(pcap_handle_));
            }

            if (pcap_set_promisc(pcap_handle_, config_.promiscuous ? 1 : 0) != 0)
            {
                spdlog::warn("{}: failed to set promiscuous mode: {}", config_.interface, pcap_geterr(pcap_handle_));
            }

            if (pcap_set_timeout(pcap_handle_, config_.timeout_ms) != 0)
            {
                spdlog::warn("{}: failed to set timeout: {}", config_.interface, pcap_geterr(pcap_handle_));
            }

            if (pcap_set_immediate_mode(pcap_handle_, 1) != 0)
            {
                spdlog::debug("{}: failed to set immediate mode: {}", config_.interface, pcap_geterr(pcap_handle_));
            }

            // 3. Activate
            int activate_result = pcap_activate(pcap_handle_);

            RelayError activate_error = activationError(activate_result);

            if (activate_error != RelayError::NONE)
            {
                if (activate_result == PCAP_ERROR_PERM_DENIED)
                {
                    return fail(activate_error,
                                "Permission denied activating capture on " + config_.interface +
                                    " (need root or CAP_NET_RAW)");
                }
                else if (activate_result == PCAP_ERROR_NO_SUCH_DEVICE)
                {
                    return fail(activate_error, "No such capture device: " + config_.interface);
                }
                return fail(activate_error,
                            "Failed to activate " + config_.interface + ": " + pcap_geterr(pcap_handle_));
            }

            if (activate_result == PCAP_WARNING_PROMISC_NOTSUP)
            {
                spdlog::warn("Promiscuous mode not supported on {}", config_.interface);
            }
            else if (activate_result == PCAP_WARNING)
            {
                spdlog::warn("{}: activation warning: {}", config_.interface, pcap_geterr(pcap_handle_));
            }
            else if (activate_result > 0)
            {
                spdlog::warn("{}: activation warning: {}", config_.interface, pcap_statustostr(activate_result));
            }

            // 4. Filter
            if (!config_.bpf_filter.empty())
            {
                RelayStatus status = applyFilter();
                if (!status.ok())
                {
                    return status;
                }
                spdlog::info("{}: BPF filter applied: {}", config_.interface, config_.bpf_filter);
            }

            // 5. Only frames arriving on the wire, never our own injections
            if (pcap_setdirection(pcap_handle_, PCAP_D_IN) != 0)
            {
                return fail(RelayError::CAPTURE_ACTIVATE_FAILED,
                            "Failed to set inbound direction on " + config_.interface + ": " +
                                pcap_geterr(pcap_handle_));
            }

            if (pcap_setnonblock(pcap_handle_, 1, errbuf) != 0)
            {
                return fail(RelayError::CAPTURE_ACTIVATE_FAILED,
                            "Failed to set non-blocking mode on " + config_.interface + ": " + errbuf);
            }

            selectable_fd_ = pcap_get_selectable_fd(pcap_handle_);
            if (selectable_fd_ < 0)
            {
                return fail(RelayError::CAPTURE_ACTIVATE_FAILED,
                            "Capture handle of " + config_.interface + " has no selectable descriptor");
            }

            // 6. Link type
            link_type_ = pcap_datalink(pcap_handle_);
            const char *datalink_name = pcap_datalink_val_to_name(link_type_);

            if (!Common::PacketCodec::isSupportedLinkType(link_type_))
            {
                return fail(RelayError::UNSUPPORTED_LINK_TYPE,
                            "Unsupported link type " + std::to_string(link_type_) + " (" +
                                (datalink_name ? datalink_name : "unknown") + ") on " + config_.interface);
            }

            spdlog::info("PacketIngress initialized for {}", config_.interface);
            spdlog::info("  - Datalink: {}", datalink_name ? datalink_name : "unknown");
            spdlog::info("  - Snaplen: {} bytes", config_.snaplen);
            spdlog::info("  - Promiscuous: {}", config_.promiscuous ? "enabled" : "disabled");
            spdlog::info("  - Timeout: {} ms", config_.timeout_ms);

            return RelayStatus();
        }

        int PacketIngress::dispatch(const FrameHandler &handler)
        {
            if (!pcap_handle_)
            {
                last_error_ = "capture handle is not open";
                return -1;
            }

            active_handler_ = &handler;
            int result = pcap_dispatch(pcap_handle_, -1, pcapCallback, reinterpret_cast<u_char *>(this));
            active_handler_ = nullptr;

            if (result == PCAP_ERROR)
            {
                last_error_ = pcap_geterr(pcap_handle_);
                return -1;
            }

            // PCAP_ERROR_BREAK is never requested here, treat it as nothing read
            return result < 0 ? 0 : result;
        }

        RelayError PacketIngress::activationError(int activate_result)
        {
            // Positive results are warnings on an active handle
            if (activate_result >= 0)
            {
                return RelayError::NONE;
            }

            if (activate_result == PCAP_ERROR_NO_SUCH_DEVICE)
            {
                return RelayError::INTERFACE_UNAVAILABLE;
            }
            return RelayError::CAPTURE_ACTIVATE_FAILED;
        }

        void PacketIngress::pcapCallback(u_char *user, const struct pcap_pkthdr *header,
                                         const u_char *packet)
        {
            PacketIngress *self = reinterpret_cast<PacketIngress *>(user);
            if (self->active_handler_ && *self->active_handler_)
            {
                (*self->active_handler_)(packet, header->caplen);
            }
        }

        bool PacketIngress::getKernelStats(uint64_t &received, uint64_t &dropped) const
        {
            if (!pcap_handle_)
            {
                return false;
            }

            struct pcap_stat pstats;
            if (pcap_stats(pcap_handle_, &pstats) != 0)
            {
                return false;
            }

            received = pstats.ps_recv;
            dropped = pstats.ps_drop;
            return true;
        }

        RelayStatus PacketIngress::applyFilter()
        {
            struct bpf_program fp;
            bpf_u_int32 net = 0;
            bpf_u_int32 mask = 0;

            char errbuf[PCAP_ERRBUF_SIZE];
            if (pcap_lookupnet(config_.interface.c_str(), &net, &mask, errbuf) == -1)
            {
                spdlog::debug("{}: pcap_lookupnet failed: {}", config_.interface, errbuf);
                net = 0;
                mask = 0;
            }

            if (pcap_compile(pcap_handle_, &fp, config_.bpf_filter.c_str(), 1, mask) == -1)
            {
                return fail(RelayError::FILTER_FAILED,
                            "Failed to compile BPF filter \"" + config_.bpf_filter + "\" on " +
                                config_.interface + ": " + pcap_geterr(pcap_handle_));
            }

            if (pcap_setfilter(pcap_handle_, &fp) == -1)
            {
                std::string message = "Failed to set BPF filter on " + config_.interface + ": " +
                                      pcap_geterr(pcap_handle_);
                pcap_freecode(&fp);
                return fail(RelayError::FILTER_FAILED, message);
            }

            pcap_freecode(&fp);
            return RelayStatus();
        }

        RelayStatus PacketIngress::fail(RelayError error, const std::string &message)
        {
            if (pcap_handle_)
            {
                pcap_close(pcap_handle_);
                pcap_handle_ = nullptr;
            }
            selectable_fd_ = -1;
            return RelayStatus(error, message);
        }

    } // namespace Relay
} // namespace UdpRelay
