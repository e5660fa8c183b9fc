// src/core/relay/relay_types.hpp
#ifndef UDP_RELAY_RELAY_TYPES_HPP
#define UDP_RELAY_RELAY_TYPES_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace UdpRelay
{
    namespace Relay
    {
        constexpr size_t kSendQueueCapacity = 100;
        constexpr int kSnapLength = 9000;
        constexpr std::chrono::seconds kHeartbeatInterval(5);

        /**
         * @brief A captured frame travelling from its source endpoint to every other one
         *
         * Shared read-only between all targets of one broadcast.
         */
        struct RelayMessage
        {
            std::vector<uint8_t> frame;
            std::string source_interface;
            int link_type;                  // pcap DLT_ value of the source capture

            RelayMessage(const uint8_t *data, size_t length, const std::string &source, int link)
                : frame(data, data + length), source_interface(source), link_type(link) {}
        };

        using RelayMessagePtr = std::shared_ptr<const RelayMessage>;

        /**
         * @brief Failure tags for endpoint setup and steady state
         */
        enum class RelayError
        {
            NONE = 0,
            INTERFACE_UNAVAILABLE,
            NO_IPV4_ADDRESS,
            CAPTURE_OPEN_FAILED,
            CAPTURE_ACTIVATE_FAILED,
            FILTER_FAILED,
            UNSUPPORTED_LINK_TYPE,
            SOCKET_FAILED,
            QUEUE_FAILED,
            DUPLICATE_INTERFACE,
            CAPTURE_LOST
        };

        /**
         * @brief Error tag plus a message naming the interface and OS error
         */
        struct RelayStatus
        {
            RelayError error;
            std::string message;

            RelayStatus() : error(RelayError::NONE) {}
            RelayStatus(RelayError err, const std::string &msg) : error(err), message(msg) {}

            bool ok() const { return error == RelayError::NONE; }
        };

        std::string relayErrorToString(RelayError error);

    } // namespace Relay
} // namespace UdpRelay

#endif // UDP_RELAY_RELAY_TYPES_HPP
