// src/core/relay/capture_source.hpp
#ifndef UDP_RELAY_CAPTURE_SOURCE_HPP
#define UDP_RELAY_CAPTURE_SOURCE_HPP

#include "packet_codec.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace UdpRelay
{
    namespace Relay
    {
        /**
         * @brief Called once per captured frame, data valid only during the call
         */
        using FrameHandler = std::function<void(const uint8_t *data, size_t length)>;

        /**
         * @class CaptureSource
         * @brief Inbound side of an endpoint
         */
        class CaptureSource
        {
        public:
            virtual ~CaptureSource() = default;

            /**
             * @brief pcap DLT_ value of the frames this source yields
             */
            virtual int linkType() const = 0;

            /**
             * @brief Descriptor that polls readable when frames may be pending
             */
            virtual int selectableFd() const = 0;

            /**
             * @brief Deliver every frame available right now without blocking
             * @return number of frames delivered, or -1 if the source is lost
             */
            virtual int dispatch(const FrameHandler &handler) = 0;

            virtual std::string lastError() const = 0;

            /**
             * @brief Kernel receive and drop counters of the capture
             * @return false if the source keeps no such counters
             */
            virtual bool getKernelStats(uint64_t &received, uint64_t &dropped) const = 0;
        };

        /**
         * @class DatagramSender
         * @brief Outbound side of an endpoint
         */
        class DatagramSender
        {
        public:
            virtual ~DatagramSender() = default;

            /**
             * @brief Write one rebuilt datagram on the endpoint's interface
             * @return false with @p error set if the write failed
             */
            virtual bool send(const Common::OutboundDatagram &datagram, std::string &error) = 0;
        };

    } // namespace Relay
} // namespace UdpRelay

#endif // UDP_RELAY_CAPTURE_SOURCE_HPP
