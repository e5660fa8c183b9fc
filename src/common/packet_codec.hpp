// src/common/packet_codec.hpp
#ifndef UDP_RELAY_PACKET_CODEC_HPP
#define UDP_RELAY_PACKET_CODEC_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace UdpRelay
{
    namespace Common
    {
        /**
         * @brief Link-layer envelopes a captured frame may arrive in
         */
        enum class FrameEnvelope
        {
            LOOPBACK,       // BSD null/loop: 4-byte address family
            ETHERNET        // DIX Ethernet, optionally one 802.1Q tag
        };

        /**
         * @brief Why a frame could not be turned into an outbound datagram
         */
        enum class DecodeError
        {
            NONE = 0,
            TRUNCATED,
            UNSUPPORTED_LINK_TYPE,
            NOT_IPV4,
            NOT_UDP,
            BAD_HEADER
        };

        // ==================== IPv4 Header ====================
        /**
         * @brief Decoded IPv4 header, addresses in network byte order
         */
        struct IPv4Header
        {
            uint8_t version;
            uint8_t ihl;                        // 32-bit words
            uint8_t tos;
            uint16_t total_length;              // bytes, header included
            uint16_t identification;
            uint8_t flags;                      // 3 bits: reserved, DF, MF
            uint16_t fragment_offset;           // 13 bits, 8-byte units
            uint8_t ttl;
            uint8_t protocol;
            uint16_t checksum;
            uint32_t src_ip;
            uint32_t dst_ip;
            std::vector<uint8_t> options;       // raw option bytes, padding included

            IPv4Header()
                : version(0), ihl(0), tos(0), total_length(0), identification(0),
                  flags(0), fragment_offset(0), ttl(0), protocol(0), checksum(0),
                  src_ip(0), dst_ip(0) {}

            size_t headerLength() const { return static_cast<size_t>(ihl) * 4; }
            bool moreFragments() const { return (flags & 0x01) != 0; }
        };

        // ==================== UDP Header ====================
        struct UDPHeader
        {
            uint16_t src_port;
            uint16_t dst_port;
            uint16_t length;                    // header + data
            uint16_t checksum;

            UDPHeader() : src_port(0), dst_port(0), length(0), checksum(0) {}
        };

        /**
         * @brief Result of decoding one captured frame
         *
         * `segment` is the IPv4 payload exactly as captured: the UDP header
         * followed by the UDP data.
         */
        struct DecodedDatagram
        {
            FrameEnvelope envelope;
            bool has_vlan;
            uint16_t vlan_id;

            bool has_ipv4;
            IPv4Header ipv4;

            bool has_udp;
            UDPHeader udp;

            std::vector<uint8_t> segment;

            DecodeError error;
            std::string error_detail;

            DecodedDatagram()
                : envelope(FrameEnvelope::ETHERNET), has_vlan(false), vlan_id(0),
                  has_ipv4(false), has_udp(false), error(DecodeError::NONE) {}

            /**
             * @brief UDP data after the 8-byte header
             */
            std::vector<uint8_t> payload() const;
        };

        /**
         * @brief Rebuilt datagram ready for a raw IP_HDRINCL socket
         */
        struct OutboundDatagram
        {
            IPv4Header header;
            std::vector<uint8_t> bytes;         // serialized header + segment

            uint32_t source() const { return header.src_ip; }
            uint32_t destination() const { return header.dst_ip; }
        };

        /**
         * @class PacketCodec
         * @brief Stateless link/IPv4/UDP decoder and IPv4 header rewriter
         *
         * Decoding is strict: the frame must hold exactly a supported link
         * header, an IPv4 header and a UDP header. Rewriting keeps every IPv4
         * field except the destination and checksum.
         */
        class PacketCodec
        {
        public:
            static constexpr uint8_t kProtocolUDP = 17;
            static constexpr size_t kMinIPv4HeaderLength = 20;
            static constexpr size_t kUDPHeaderLength = 8;

            /**
             * @brief Map a pcap DLT_ value to its envelope
             * @return false for link types the relay does not handle
             */
            static bool envelopeForLinkType(int link_type, FrameEnvelope &envelope);
            static bool isSupportedLinkType(int link_type);

            /**
             * @brief Decode a captured frame
             * @return false with decoded.error / decoded.error_detail set on failure
             */
            bool decode(const uint8_t *data, size_t length, int link_type, DecodedDatagram &decoded) const;

            /**
             * @brief Build the outbound datagram for one egress leg
             *
             * TTL is copied unchanged, the checksum is left zero for the kernel,
             * and the destination becomes @p destination (network byte order).
             */
            bool rewrite(const DecodedDatagram &decoded, uint32_t destination,
                         OutboundDatagram &out, std::string &error) const;

            /**
             * @brief Serialize an IPv4 header to wire bytes
             */
            static std::vector<uint8_t> serializeHeader(const IPv4Header &header);

            static std::string decodeErrorToString(DecodeError error);
            static std::string envelopeToString(FrameEnvelope envelope);

            // ==================== Layer parsers ====================
            bool parseLoopback(const uint8_t *data, size_t length, DecodedDatagram &decoded, size_t &offset) const;
            bool parseEthernet(const uint8_t *data, size_t length, DecodedDatagram &decoded, size_t &offset) const;
            bool parseIPv4(const uint8_t *data, size_t length, DecodedDatagram &decoded, size_t &offset) const;
            bool parseUDP(const uint8_t *data, size_t length, DecodedDatagram &decoded, size_t &offset) const;

        private:
            bool validateIPv4Options(const uint8_t *data, size_t length) const;
            bool fail(DecodedDatagram &decoded, DecodeError error, const std::string &detail) const;
        };

    } // namespace Common
} // namespace UdpRelay

#endif // UDP_RELAY_PACKET_CODEC_HPP
