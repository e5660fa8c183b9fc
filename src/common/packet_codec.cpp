// src/common/packet_codec.cpp
#include "packet_codec.hpp"
#include <cstdio>
#include <cstring>
#include <map>
#include <netinet/in.h>
#include <pcap/pcap.h>

namespace UdpRelay
{
    namespace Common
    {
        namespace
        {
            constexpr size_t kLoopbackHeaderLength = 4;
            constexpr size_t kEthernetHeaderLength = 14;
            constexpr size_t kVlanTagLength = 4;
            constexpr uint16_t kEtherTypeIPv4 = 0x0800;
            constexpr uint16_t kEtherTypeVlan = 0x8100;
            constexpr uint32_t kLoopbackFamilyInet = 2;

            using LinkParser = bool (PacketCodec::*)(const uint8_t *, size_t, DecodedDatagram &, size_t &) const;

            const std::map<int, FrameEnvelope> kLinkTypes = {
                {DLT_NULL, FrameEnvelope::LOOPBACK},
                {DLT_LOOP, FrameEnvelope::LOOPBACK},
                {DLT_EN10MB, FrameEnvelope::ETHERNET}};

            const std::map<FrameEnvelope, LinkParser> kLinkParsers = {
                {FrameEnvelope::LOOPBACK, &PacketCodec::parseLoopback},
                {FrameEnvelope::ETHERNET, &PacketCodec::parseEthernet}};

            uint16_t readU16(const uint8_t *p)
            {
                return static_cast<uint16_t>((p[0] << 8) | p[1]);
            }

            void writeU16(uint8_t *p, uint16_t value)
            {
                p[0] = static_cast<uint8_t>(value >> 8);
                p[1] = static_cast<uint8_t>(value & 0xFF);
            }
        }

        std::vector<uint8_t> DecodedDatagram::payload() const
        {
            if (segment.size() <= PacketCodec::kUDPHeaderLength)
            {
                return {};
            }

            size_t end = segment.size();
            if (udp.length >= PacketCodec::kUDPHeaderLength && udp.length < end)
            {
                end = udp.length;
            }
            return std::vector<uint8_t>(segment.begin() + static_cast<std::ptrdiff_t>(PacketCodec::kUDPHeaderLength),
                                        segment.begin() + static_cast<std::ptrdiff_t>(end));
        }

        // ==================== Link types ====================

        bool PacketCodec::envelopeForLinkType(int link_type, FrameEnvelope &envelope)
        {
            auto it = kLinkTypes.find(link_type);
            if (it == kLinkTypes.end())
            {
                return false;
            }
            envelope = it->second;
            return true;
        }

        bool PacketCodec::isSupportedLinkType(int link_type)
        {
            return kLinkTypes.find(link_type) != kLinkTypes.end();
        }

        // ==================== Main decode ====================

        bool PacketCodec::decode(const uint8_t *data, size_t length, int link_type, DecodedDatagram &decoded) const
        {
            decoded = DecodedDatagram();

            if (!data || length == 0)
            {
                return fail(decoded, DecodeError::TRUNCATED, "empty frame");
            }

            if (!envelopeForLinkType(link_type, decoded.envelope))
            {
                char buf[16];
                snprintf(buf, sizeof(buf), "0x%02x", link_type);
                return fail(decoded, DecodeError::UNSUPPORTED_LINK_TYPE,
                            std::string("unsupported source linktype ") + buf);
            }

            size_t offset = 0;
            LinkParser parser = kLinkParsers.at(decoded.envelope);
            if (!(this->*parser)(data, length, decoded, offset))
            {
                return false;
            }

            size_t ip_start = offset;
            if (!parseIPv4(data, length, decoded, offset))
            {
                return false;
            }

            // Link padding past the IPv4 total length is not part of the datagram
            size_t ip_end = ip_start + decoded.ipv4.total_length;
            size_t segment_start = offset;

            if (!parseUDP(data, ip_end, decoded, offset))
            {
                return false;
            }

            decoded.segment.assign(data + segment_start, data + ip_end);
            return true;
        }

        // ==================== Link layer ====================

        bool PacketCodec::parseLoopback(const uint8_t *data, size_t length,
                                        DecodedDatagram &decoded, size_t &offset) const
        {
            if (length - offset < kLoopbackHeaderLength)
            {
                return fail(decoded, DecodeError::TRUNCATED, "frame shorter than loopback header");
            }

            // DLT_NULL carries the family in host order, DLT_LOOP in network order
            const uint8_t *p = data + offset;
            uint32_t big_endian = (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
                                  (static_cast<uint32_t>(p[2]) << 8) | p[3];
            uint32_t little_endian = (static_cast<uint32_t>(p[3]) << 24) | (static_cast<uint32_t>(p[2]) << 16) |
                                     (static_cast<uint32_t>(p[1]) << 8) | p[0];

            if (big_endian != kLoopbackFamilyInet && little_endian != kLoopbackFamilyInet)
            {
                return fail(decoded, DecodeError::NOT_IPV4,
                            "loopback family " + std::to_string(big_endian) + " is not AF_INET");
            }

            decoded.envelope = FrameEnvelope::LOOPBACK;
            offset += kLoopbackHeaderLength;
            return true;
        }

        bool PacketCodec::parseEthernet(const uint8_t *data, size_t length,
                                        DecodedDatagram &decoded, size_t &offset) const
        {
            if (length - offset < kEthernetHeaderLength)
            {
                return fail(decoded, DecodeError::TRUNCATED, "frame shorter than Ethernet header");
            }

            uint16_t ether_type = readU16(data + offset + 12);
            offset += kEthernetHeaderLength;

            // Single 802.1Q tag
            if (ether_type == kEtherTypeVlan)
            {
                if (length - offset < kVlanTagLength)
                {
                    return fail(decoded, DecodeError::TRUNCATED, "truncated 802.1Q tag");
                }

                decoded.has_vlan = true;
                decoded.vlan_id = readU16(data + offset) & 0x0FFF;
                ether_type = readU16(data + offset + 2);
                offset += kVlanTagLength;
            }

            if (ether_type != kEtherTypeIPv4)
            {
                char buf[8];
                snprintf(buf, sizeof(buf), "%04x", ether_type);
                return fail(decoded, DecodeError::NOT_IPV4, std::string("ethertype 0x") + buf);
            }

            decoded.envelope = FrameEnvelope::ETHERNET;
            return true;
        }

        // ==================== Network layer ====================

        bool PacketCodec::parseIPv4(const uint8_t *data, size_t length,
                                    DecodedDatagram &decoded, size_t &offset) const
        {
            size_t available = length - offset;
            if (available < kMinIPv4HeaderLength)
            {
                return fail(decoded, DecodeError::TRUNCATED, "frame shorter than IPv4 header");
            }

            const uint8_t *ip = data + offset;
            IPv4Header &ipv4 = decoded.ipv4;

            ipv4.version = ip[0] >> 4;
            ipv4.ihl = ip[0] & 0x0F;

            if (ipv4.version != 4)
            {
                return fail(decoded, DecodeError::NOT_IPV4, "IP version " + std::to_string(ipv4.version));
            }

            if (ipv4.ihl < 5)
            {
                return fail(decoded, DecodeError::BAD_HEADER, "IHL " + std::to_string(ipv4.ihl) + " below minimum");
            }

            size_t header_length = ipv4.headerLength();
            if (header_length > available)
            {
                return fail(decoded, DecodeError::TRUNCATED, "IPv4 options exceed captured length");
            }

            ipv4.tos = ip[1];
            ipv4.total_length = readU16(ip + 2);
            ipv4.identification = readU16(ip + 4);
            uint16_t flags_fragment = readU16(ip + 6);
            ipv4.flags = static_cast<uint8_t>(flags_fragment >> 13);
            ipv4.fragment_offset = flags_fragment & 0x1FFF;
            ipv4.ttl = ip[8];
            ipv4.protocol = ip[9];
            ipv4.checksum = readU16(ip + 10);
            std::memcpy(&ipv4.src_ip, ip + 12, 4);
            std::memcpy(&ipv4.dst_ip, ip + 16, 4);

            if (ipv4.total_length < header_length)
            {
                return fail(decoded, DecodeError::BAD_HEADER,
                            "total length " + std::to_string(ipv4.total_length) + " shorter than header");
            }

            if (ipv4.total_length > available)
            {
                return fail(decoded, DecodeError::TRUNCATED,
                            "total length " + std::to_string(ipv4.total_length) + " exceeds captured " +
                                std::to_string(available) + " bytes");
            }

            if (header_length > kMinIPv4HeaderLength)
            {
                const uint8_t *options = ip + kMinIPv4HeaderLength;
                size_t options_len = header_length - kMinIPv4HeaderLength;
                if (!validateIPv4Options(options, options_len))
                {
                    return fail(decoded, DecodeError::BAD_HEADER, "malformed IPv4 options");
                }
                ipv4.options.assign(options, options + options_len);
            }

            decoded.has_ipv4 = true;

            if (ipv4.protocol != kProtocolUDP)
            {
                return fail(decoded, DecodeError::NOT_UDP, "IP protocol " + std::to_string(ipv4.protocol));
            }

            if (ipv4.fragment_offset != 0)
            {
                return fail(decoded, DecodeError::NOT_UDP, "non-initial IPv4 fragment");
            }

            offset += header_length;
            return true;
        }

        bool PacketCodec::validateIPv4Options(const uint8_t *data, size_t length) const
        {
            size_t offset = 0;

            while (offset < length)
            {
                uint8_t type = data[offset];

                // End of options, the rest is padding
                if (type == 0)
                {
                    return true;
                }

                // NOP
                if (type == 1)
                {
                    offset += 1;
                    continue;
                }

                if (offset + 1 >= length)
                {
                    return false;
                }

                uint8_t option_length = data[offset + 1];
                if (option_length < 2 || offset + option_length > length)
                {
                    return false;
                }

                offset += option_length;
            }

            return true;
        }

        // ==================== Transport layer ====================

        bool PacketCodec::parseUDP(const uint8_t *data, size_t length,
                                   DecodedDatagram &decoded, size_t &offset) const
        {
            if (length < offset || length - offset < kUDPHeaderLength)
            {
                return fail(decoded, DecodeError::TRUNCATED, "datagram shorter than UDP header");
            }

            const uint8_t *udp = data + offset;
            decoded.udp.src_port = readU16(udp);
            decoded.udp.dst_port = readU16(udp + 2);
            decoded.udp.length = readU16(udp + 4);
            decoded.udp.checksum = readU16(udp + 6);

            if (decoded.udp.length < kUDPHeaderLength)
            {
                return fail(decoded, DecodeError::BAD_HEADER,
                            "UDP length " + std::to_string(decoded.udp.length) + " below minimum");
            }

            // A first fragment legitimately carries less than udp.length
            if (decoded.udp.length > length - offset && !decoded.ipv4.moreFragments())
            {
                return fail(decoded, DecodeError::BAD_HEADER,
                            "UDP length " + std::to_string(decoded.udp.length) + " exceeds IPv4 payload");
            }

            decoded.has_udp = true;
            offset += kUDPHeaderLength;
            return true;
        }

        // ==================== Rewrite ====================

        bool PacketCodec::rewrite(const DecodedDatagram &decoded, uint32_t destination,
                                  OutboundDatagram &out, std::string &error) const
        {
            if (!decoded.has_ipv4 || !decoded.has_udp)
            {
                error = "datagram did not contain an IPv4/UDP packet";
                return false;
            }

            if (destination == INADDR_ANY)
            {
                error = "destination address is 0.0.0.0";
                return false;
            }

            const IPv4Header &captured = decoded.ipv4;

            out = OutboundDatagram();
            IPv4Header &header = out.header;
            header.version = 4;
            header.ihl = captured.ihl;
            header.tos = captured.tos;
            header.total_length = captured.total_length;
            header.identification = captured.identification;
            header.flags = captured.flags;
            header.fragment_offset = captured.fragment_offset;
            header.ttl = captured.ttl;              // bridged, not routed: no decrement
            header.protocol = kProtocolUDP;
            header.checksum = 0;                    // filled in by the kernel
            header.src_ip = captured.src_ip;
            header.dst_ip = destination;
            header.options = captured.options;

            out.bytes = serializeHeader(header);
            out.bytes.insert(out.bytes.end(), decoded.segment.begin(), decoded.segment.end());

            if (out.bytes.size() != header.total_length)
            {
                error = "rebuilt datagram is " + std::to_string(out.bytes.size()) +
                        " bytes, header says " + std::to_string(header.total_length);
                return false;
            }

            return true;
        }

        std::vector<uint8_t> PacketCodec::serializeHeader(const IPv4Header &header)
        {
            std::vector<uint8_t> bytes(kMinIPv4HeaderLength, 0);

            bytes[0] = static_cast<uint8_t>((header.version << 4) | (header.ihl & 0x0F));
            bytes[1] = header.tos;
            writeU16(&bytes[2], header.total_length);
            writeU16(&bytes[4], header.identification);
            writeU16(&bytes[6], static_cast<uint16_t>((header.flags << 13) | (header.fragment_offset & 0x1FFF)));
            bytes[8] = header.ttl;
            bytes[9] = header.protocol;
            writeU16(&bytes[10], header.checksum);
            std::memcpy(&bytes[12], &header.src_ip, 4);
            std::memcpy(&bytes[16], &header.dst_ip, 4);

            bytes.insert(bytes.end(), header.options.begin(), header.options.end());
            return bytes;
        }

        // ==================== Helpers ====================

        bool PacketCodec::fail(DecodedDatagram &decoded, DecodeError error, const std::string &detail) const
        {
            decoded.error = error;
            decoded.error_detail = detail;
            return false;
        }

        std::string PacketCodec::decodeErrorToString(DecodeError error)
        {
            switch (error)
            {
                case DecodeError::NONE:                  return "none";
                case DecodeError::TRUNCATED:             return "truncated";
                case DecodeError::UNSUPPORTED_LINK_TYPE: return "unsupported link type";
                case DecodeError::NOT_IPV4:              return "not IPv4";
                case DecodeError::NOT_UDP:               return "not UDP";
                case DecodeError::BAD_HEADER:            return "bad header";
                default:                                 return "unknown";
            }
        }

        std::string PacketCodec::envelopeToString(FrameEnvelope envelope)
        {
            return envelope == FrameEnvelope::LOOPBACK ? "loopback" : "ethernet";
        }

    } // namespace Common
} // namespace UdpRelay
