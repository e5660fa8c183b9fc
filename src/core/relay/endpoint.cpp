// src/core/relay/endpoint.cpp
#include "endpoint.hpp"
#include "network_utils.hpp"
#include "packet_ingress.hpp"
#include "raw_sender.hpp"
#include <cerrno>
#include <chrono>
#include <cstring>
#include <poll.h>
#include <system_error>
#include <spdlog/spdlog.h>

namespace UdpRelay
{
    namespace Relay
    {
        namespace
        {
            // Upper bound on one poll() so the loop notices a stop request
            constexpr int kPollIntervalMs = 250;
        }

        Endpoint::Endpoint(const EndpointConfig &config,
                           std::unique_ptr<CaptureSource> capture,
                           std::unique_ptr<DatagramSender> sender,
                           std::shared_ptr<RelayQueue> queue)
            : config_(config),
              capture_(std::move(capture)),
              sender_(std::move(sender)),
              queue_(std::move(queue)),
              frames_captured_(0),
              frames_relayed_(0),
              frames_rejected_(0),
              datagrams_sent_(0),
              send_failures_(0),
              kernel_received_(0),
              kernel_dropped_(0)
        {
        }

        Endpoint::~Endpoint()
        {
            spdlog::debug("Endpoint {} released", config_.interface);
        }

        RelayStatus Endpoint::open(const EndpointConfig &config,
                                   InterfaceRegistry &registry,
                                   std::unique_ptr<Endpoint> &endpoint)
        {
            // 1. Interface must exist and carry addresses
            InterfaceEntry entry;
            RelayStatus status = registry.resolve(config.interface, entry);
            if (!status.ok())
            {
                return status;
            }

            // 2-3. Capture subscription with the filter applied
            IngressConfig ingress_config;
            ingress_config.interface = config.interface;
            ingress_config.bpf_filter = config.bpf_filter;
            ingress_config.snaplen = kSnapLength;
            ingress_config.timeout_ms = config.timeout_ms;
            ingress_config.promiscuous = config.promiscuous;

            auto capture = std::make_unique<PacketIngress>(ingress_config);
            status = capture->initialize();
            if (!status.ok())
            {
                return status;
            }

            // 4. First IPv4 address
            InterfaceAddress local;
            if (!entry.firstIPv4(local))
            {
                return RelayStatus(RelayError::NO_IPV4_ADDRESS,
                                   "Interface " + config.interface + " has no IPv4 address");
            }

            // 5. Raw egress socket bound to it
            auto sender = std::make_unique<RawSocketSender>();
            status = sender->open(config.interface, local.ipv4_addr);
            if (!status.ok())
            {
                return status;
            }

            std::shared_ptr<RelayQueue> queue;
            try
            {
                queue = std::make_shared<RelayQueue>(config.interface, kSendQueueCapacity, config.overflow_policy);
            }
            catch (const std::system_error &e)
            {
                return RelayStatus(RelayError::QUEUE_FAILED,
                                   "Failed to create send queue for " + config.interface + ": " + e.what());
            }

            endpoint = std::make_unique<Endpoint>(config, std::move(capture), std::move(sender), std::move(queue));

            spdlog::info("Endpoint {} ready: local {} -> destination {}",
                         config.interface, local.address, config.destination);
            return RelayStatus();
        }

        void Endpoint::handleCapturedFrame(const Distributor &distributor, const uint8_t *data, size_t length)
        {
            frames_captured_.fetch_add(1);

            Common::DecodedDatagram decoded;
            if (!codec_.decode(data, length, capture_->linkType(), decoded))
            {
                frames_rejected_.fetch_add(1);
                spdlog::warn("{}: dropping captured frame ({} bytes): {}: {}",
                             config_.interface, length,
                             Common::PacketCodec::decodeErrorToString(decoded.error),
                             decoded.error_detail);
                return;
            }

            spdlog::debug("{}: captured {}:{} -> {}:{} ({} bytes)", config_.interface,
                          Common::NetworkUtils::networkOrderToString(decoded.ipv4.src_ip), decoded.udp.src_port,
                          Common::NetworkUtils::networkOrderToString(decoded.ipv4.dst_ip), decoded.udp.dst_port,
                          length);

            auto message = std::make_shared<const RelayMessage>(data, length, config_.interface, capture_->linkType());
            distributor.broadcast(message);
            frames_relayed_.fetch_add(1);
        }

        size_t Endpoint::drainQueue()
        {
            size_t drained = 0;
            RelayMessagePtr message;
            while (queue_->tryPop(message))
            {
                transmit(*message);
                drained++;
            }
            return drained;
        }

        bool Endpoint::transmit(const RelayMessage &message)
        {
            Common::DecodedDatagram decoded;
            if (!codec_.decode(message.frame.data(), message.frame.size(), message.link_type, decoded))
            {
                frames_rejected_.fetch_add(1);
                spdlog::warn("{}: dropping frame from {}: {}: {}", config_.interface, message.source_interface,
                             Common::PacketCodec::decodeErrorToString(decoded.error), decoded.error_detail);
                return false;
            }

            Common::OutboundDatagram outbound;
            std::string error;
            if (!codec_.rewrite(decoded, config_.destination_addr, outbound, error))
            {
                frames_rejected_.fetch_add(1);
                spdlog::warn("{}: dropping frame from {}: {}", config_.interface, message.source_interface, error);
                return false;
            }

            if (!sender_->send(outbound, error))
            {
                send_failures_.fetch_add(1);
                spdlog::error("{}: failed to send {} bytes to {}: {}", config_.interface, outbound.bytes.size(),
                              config_.destination, error);
                return false;
            }

            datagrams_sent_.fetch_add(1);
            spdlog::debug("{}: relayed {} bytes from {} to {}", config_.interface, outbound.bytes.size(),
                          message.source_interface, config_.destination);
            return true;
        }

        RelayStatus Endpoint::pollOnce(const Distributor &distributor, int timeout_ms)
        {
            struct pollfd fds[2];
            fds[0].fd = capture_->selectableFd();
            fds[0].events = POLLIN;
            fds[0].revents = 0;
            fds[1].fd = queue_->waitFd();
            fds[1].events = POLLIN;
            fds[1].revents = 0;

            int ready = ::poll(fds, 2, timeout_ms);
            if (ready < 0)
            {
                if (errno == EINTR)
                {
                    return RelayStatus();
                }
                return RelayStatus(RelayError::CAPTURE_LOST,
                                   config_.interface + ": poll failed: " + std::strerror(errno));
            }

            // Both sources are serviced on every wakeup. Capture and queue are
            // non-blocking, and a pcap ring buffer may hold frames without the
            // descriptor turning readable.
            FrameHandler handler = [this, &distributor](const uint8_t *data, size_t length) {
                handleCapturedFrame(distributor, data, length);
            };

            if (capture_->dispatch(handler) < 0)
            {
                return RelayStatus(RelayError::CAPTURE_LOST,
                                   "Capture on " + config_.interface + " failed: " + capture_->lastError());
            }

            drainQueue();
            return RelayStatus();
        }

        RelayStatus Endpoint::run(const Distributor &distributor, const std::atomic<bool> &running)
        {
            spdlog::info("Relay loop started on {}", config_.interface);

            int timeout_ms = config_.timeout_ms > 0 && config_.timeout_ms < kPollIntervalMs
                                 ? config_.timeout_ms
                                 : kPollIntervalMs;
            auto next_heartbeat = std::chrono::steady_clock::now() + kHeartbeatInterval;

            RelayStatus status;
            while (running.load())
            {
                status = pollOnce(distributor, timeout_ms);
                if (!status.ok())
                {
                    spdlog::critical("{}", status.message);
                    break;
                }

                auto now = std::chrono::steady_clock::now();
                if (now >= next_heartbeat)
                {
                    refreshKernelStats();
                    logStats("heartbeat");
                    next_heartbeat = now + kHeartbeatInterval;
                }
            }

            if (status.ok())
            {
                refreshKernelStats();
            }
            spdlog::info("Relay loop stopped on {}", config_.interface);
            return status;
        }

        void Endpoint::refreshKernelStats()
        {
            uint64_t received = 0;
            uint64_t dropped = 0;
            if (!capture_->getKernelStats(received, dropped))
            {
                return;
            }

            kernel_received_.store(received);
            uint64_t previous = kernel_dropped_.exchange(dropped);
            if (dropped > previous)
            {
                spdlog::warn("{}: kernel dropped {} frame(s) since the last check ({} total)",
                             config_.interface, dropped - previous, dropped);
            }
        }

        EndpointStats Endpoint::getStats() const
        {
            EndpointStats stats;
            stats.frames_captured = frames_captured_.load();
            stats.frames_relayed = frames_relayed_.load();
            stats.frames_rejected = frames_rejected_.load();
            stats.datagrams_sent = datagrams_sent_.load();
            stats.send_failures = send_failures_.load();
            stats.queue_drops = queue_->droppedCount();
            stats.kernel_received = kernel_received_.load();
            stats.kernel_dropped = kernel_dropped_.load();
            return stats;
        }

        void Endpoint::logStats(const std::string &label) const
        {
            EndpointStats stats = getStats();
            spdlog::debug("[{}] {}: captured {} | relayed {} | rejected {} | sent {} | send errors {} | queue {}/{} drops {}"
                          " | kernel recv {} drop {}",
                          config_.interface, label,
                          stats.frames_captured, stats.frames_relayed, stats.frames_rejected,
                          stats.datagrams_sent, stats.send_failures,
                          queue_->size(), queue_->capacity(), stats.queue_drops,
                          stats.kernel_received, stats.kernel_dropped);
        }

    } // namespace Relay
} // namespace UdpRelay
