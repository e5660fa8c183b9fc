// src/core/relay/endpoint.hpp
#ifndef UDP_RELAY_ENDPOINT_HPP
#define UDP_RELAY_ENDPOINT_HPP

#include "capture_source.hpp"
#include "config_manager.hpp"
#include "distributor.hpp"
#include "interface_registry.hpp"
#include "packet_codec.hpp"
#include "relay_queue.hpp"
#include "relay_types.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace UdpRelay
{
    namespace Relay
    {
        /**
         * @brief Immutable settings of one relay leg
         */
        struct EndpointConfig
        {
            std::string interface;
            std::string bpf_filter;
            std::vector<int> ports;
            std::string destination;        // dotted quad as configured
            uint32_t destination_addr;      // network byte order
            bool promiscuous;
            int timeout_ms;
            Common::OverflowPolicy overflow_policy;

            EndpointConfig()
                : destination_addr(0),
                  promiscuous(false),
                  timeout_ms(250),
                  overflow_policy(Common::OverflowPolicy::DROP_OLDEST) {}
        };

        /**
         * @brief Counters of one endpoint, snapshot
         */
        struct EndpointStats
        {
            uint64_t frames_captured;       // frames read from the capture
            uint64_t frames_relayed;        // frames handed to the distributor
            uint64_t frames_rejected;       // decode or rewrite failures, both directions
            uint64_t datagrams_sent;
            uint64_t send_failures;
            uint64_t queue_drops;           // overflow drops of this endpoint's queue
            uint64_t kernel_received;       // as of the last refreshKernelStats()
            uint64_t kernel_dropped;        // lost below the capture, never seen as frames

            EndpointStats()
                : frames_captured(0), frames_relayed(0), frames_rejected(0),
                  datagrams_sent(0), send_failures(0), queue_drops(0),
                  kernel_received(0), kernel_dropped(0) {}
        };

        /**
         * @class Endpoint
         * @brief One configured interface: capture, raw egress socket and inbound queue
         *
         * All three resources are owned exclusively by the endpoint and released
         * with it. Only the relay loop running in run() touches the capture and
         * the socket; other endpoints reach this one through its queue.
         */
        class Endpoint
        {
        public:
            Endpoint(const EndpointConfig &config,
                     std::unique_ptr<CaptureSource> capture,
                     std::unique_ptr<DatagramSender> sender,
                     std::shared_ptr<RelayQueue> queue);
            ~Endpoint();

            Endpoint(const Endpoint &) = delete;
            Endpoint &operator=(const Endpoint &) = delete;

            /**
             * @brief Acquire every OS resource of a leg
             *
             * 1. resolve the interface, 2. open the capture with the filter,
             * 3. pick the first IPv4 address, 4. open and bind the raw socket,
             * 5. create the queue. The first failure is returned and nothing
             * stays open.
             */
            static RelayStatus open(const EndpointConfig &config,
                                    InterfaceRegistry &registry,
                                    std::unique_ptr<Endpoint> &endpoint);

            /**
             * @brief Decode a frame captured here and broadcast it to the other legs
             */
            void handleCapturedFrame(const Distributor &distributor, const uint8_t *data, size_t length);

            /**
             * @brief Transmit everything currently queued
             * @return number of messages taken off the queue
             */
            size_t drainQueue();

            /**
             * @brief Rewrite a message for this leg and write it on the raw socket
             * @return false if the message was dropped
             */
            bool transmit(const RelayMessage &message);

            /**
             * @brief One wait-and-service step of the relay loop
             *
             * Waits up to @p timeout_ms for the capture or the queue to become
             * readable, then reads every pending frame and drains the queue.
             * @return CAPTURE_LOST if the capture handle failed
             */
            RelayStatus pollOnce(const Distributor &distributor, int timeout_ms);

            /**
             * @brief Relay loop, returns when @p running turns false or the capture fails
             */
            RelayStatus run(const Distributor &distributor, const std::atomic<bool> &running);

            const std::string &name() const { return config_.interface; }
            const EndpointConfig &config() const { return config_; }
            std::shared_ptr<RelayQueue> queue() const { return queue_; }

            /**
             * @brief Sample the capture's kernel counters into the endpoint stats
             *
             * Touches the capture handle, so it runs on the relay loop thread
             * (heartbeat and loop exit) or while no loop is running.
             */
            void refreshKernelStats();

            EndpointStats getStats() const;
            void logStats(const std::string &label) const;

        private:
            EndpointConfig config_;
            std::unique_ptr<CaptureSource> capture_;
            std::unique_ptr<DatagramSender> sender_;
            std::shared_ptr<RelayQueue> queue_;
            Common::PacketCodec codec_;

            std::atomic<uint64_t> frames_captured_;
            std::atomic<uint64_t> frames_relayed_;
            std::atomic<uint64_t> frames_rejected_;
            std::atomic<uint64_t> datagrams_sent_;
            std::atomic<uint64_t> send_failures_;
            std::atomic<uint64_t> kernel_received_;
            std::atomic<uint64_t> kernel_dropped_;
        };

    } // namespace Relay
} // namespace UdpRelay

#endif // UDP_RELAY_ENDPOINT_HPP
