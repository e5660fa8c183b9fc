// src/core/relay/relay_types.cpp
#include "relay_types.hpp"

namespace UdpRelay
{
    namespace Relay
    {
        std::string relayErrorToString(RelayError error)
        {
            switch (error)
            {
                case RelayError::NONE:                    return "ok";
                case RelayError::INTERFACE_UNAVAILABLE:   return "interface unavailable";
                case RelayError::NO_IPV4_ADDRESS:         return "no IPv4 address";
                case RelayError::CAPTURE_OPEN_FAILED:     return "capture open failed";
                case RelayError::CAPTURE_ACTIVATE_FAILED: return "capture activate failed";
                case RelayError::FILTER_FAILED:           return "filter failed";
                case RelayError::UNSUPPORTED_LINK_TYPE:   return "unsupported link type";
                case RelayError::SOCKET_FAILED:           return "socket failed";
                case RelayError::QUEUE_FAILED:            return "queue failed";
                case RelayError::DUPLICATE_INTERFACE:     return "duplicate interface";
                case RelayError::CAPTURE_LOST:            return "capture lost";
                default:                                  return "unknown";
            }
        }

    } // namespace Relay
} // namespace UdpRelay
