// tests/unit/test_common_packet_codec.cpp
#include <gtest/gtest.h>
#include "../../src/common/packet_codec.hpp"
#include "../common/test_frames.hpp"
#include <pcap/pcap.h>

using namespace UdpRelay::Common;
using namespace UdpRelay::Testing;

class PacketCodecTest : public ::testing::Test
{
protected:
    PacketCodec codec;
    DecodedDatagram decoded;

    static constexpr size_t kEthernetLength = 14;

    bool decodeEthernet(const std::vector<uint8_t> &frame)
    {
        return codec.decode(frame.data(), frame.size(), DLT_EN10MB, decoded);
    }
};

// ==================== Decode ====================

TEST_F(PacketCodecTest, DecodesEthernetBroadcast)
{
    FrameSpec spec;
    std::vector<uint8_t> frame = buildFrame(spec);

    ASSERT_TRUE(decodeEthernet(frame)) << decoded.error_detail;

    EXPECT_EQ(decoded.envelope, FrameEnvelope::ETHERNET);
    EXPECT_FALSE(decoded.has_vlan);
    EXPECT_TRUE(decoded.has_ipv4);
    EXPECT_TRUE(decoded.has_udp);
    EXPECT_EQ(decoded.ipv4.version, 4);
    EXPECT_EQ(decoded.ipv4.ihl, 5);
    EXPECT_EQ(decoded.ipv4.ttl, 64);
    EXPECT_EQ(decoded.ipv4.protocol, PacketCodec::kProtocolUDP);
    EXPECT_EQ(decoded.ipv4.identification, 0x1234);
    EXPECT_EQ(decoded.ipv4.src_ip, ip("192.168.1.50"));
    EXPECT_EQ(decoded.ipv4.dst_ip, ip("192.168.1.255"));
    EXPECT_EQ(decoded.udp.src_port, 12345);
    EXPECT_EQ(decoded.udp.dst_port, 9999);
    EXPECT_EQ(decoded.udp.length, 8 + spec.payload.size());
    EXPECT_EQ(decoded.segment, buildUdpSegment(spec));
    EXPECT_EQ(decoded.payload(), spec.payload);
    EXPECT_EQ(decoded.error, DecodeError::NONE);
}

TEST_F(PacketCodecTest, DecodesSingleVlanTag)
{
    FrameSpec spec;
    spec.envelope = Envelope::ETHERNET_VLAN;
    std::vector<uint8_t> frame = buildFrame(spec);

    ASSERT_TRUE(decodeEthernet(frame)) << decoded.error_detail;
    EXPECT_TRUE(decoded.has_vlan);
    EXPECT_EQ(decoded.vlan_id, 42);
    EXPECT_EQ(decoded.segment, buildUdpSegment(spec));
}

TEST_F(PacketCodecTest, DecodesLoopbackInBothByteOrders)
{
    FrameSpec spec;

    spec.envelope = Envelope::LOOPBACK_HOST_ORDER;
    std::vector<uint8_t> null_frame = buildFrame(spec);
    ASSERT_TRUE(codec.decode(null_frame.data(), null_frame.size(), DLT_NULL, decoded)) << decoded.error_detail;
    EXPECT_EQ(decoded.envelope, FrameEnvelope::LOOPBACK);
    EXPECT_EQ(decoded.udp.dst_port, 9999);

    spec.envelope = Envelope::LOOPBACK_NETWORK_ORDER;
    std::vector<uint8_t> loop_frame = buildFrame(spec);
    ASSERT_TRUE(codec.decode(loop_frame.data(), loop_frame.size(), DLT_LOOP, decoded)) << decoded.error_detail;
    EXPECT_EQ(decoded.envelope, FrameEnvelope::LOOPBACK);
    EXPECT_EQ(decoded.payload(), spec.payload);
}

TEST_F(PacketCodecTest, RejectsLoopbackWithForeignFamily)
{
    FrameSpec spec;
    spec.envelope = Envelope::LOOPBACK_NETWORK_ORDER;
    std::vector<uint8_t> frame = buildFrame(spec);
    frame[3] = 30;  // AF_INET6 on BSD

    EXPECT_FALSE(codec.decode(frame.data(), frame.size(), DLT_LOOP, decoded));
    EXPECT_EQ(decoded.error, DecodeError::NOT_IPV4);
}

TEST_F(PacketCodecTest, IgnoresLinkPaddingAfterDatagram)
{
    FrameSpec spec;
    spec.payload = {'x'};
    spec.link_padding = 17;
    std::vector<uint8_t> frame = buildFrame(spec);

    ASSERT_TRUE(decodeEthernet(frame)) << decoded.error_detail;
    EXPECT_EQ(decoded.segment.size(), 9u);
    EXPECT_EQ(decoded.payload(), spec.payload);
}

TEST_F(PacketCodecTest, RejectsIcmp)
{
    FrameSpec spec;
    spec.protocol = 1;
    std::vector<uint8_t> frame = buildFrame(spec);

    EXPECT_FALSE(decodeEthernet(frame));
    EXPECT_EQ(decoded.error, DecodeError::NOT_UDP);
    EXPECT_TRUE(decoded.has_ipv4);
    EXPECT_FALSE(decoded.has_udp);

    OutboundDatagram out;
    std::string error;
    EXPECT_FALSE(codec.rewrite(decoded, ip("192.168.2.255"), out, error));
    EXPECT_FALSE(error.empty());
}

TEST_F(PacketCodecTest, RejectsNonIPv4EtherType)
{
    std::vector<uint8_t> frame = buildFrame(FrameSpec());
    frame[12] = 0x86;
    frame[13] = 0xdd;

    EXPECT_FALSE(decodeEthernet(frame));
    EXPECT_EQ(decoded.error, DecodeError::NOT_IPV4);
    EXPECT_FALSE(decoded.has_ipv4);
}

TEST_F(PacketCodecTest, RejectsUnsupportedLinkType)
{
    std::vector<uint8_t> frame = buildFrame(FrameSpec());

    EXPECT_FALSE(codec.decode(frame.data(), frame.size(), DLT_LINUX_SLL, decoded));
    EXPECT_EQ(decoded.error, DecodeError::UNSUPPORTED_LINK_TYPE);

    EXPECT_TRUE(PacketCodec::isSupportedLinkType(DLT_EN10MB));
    EXPECT_TRUE(PacketCodec::isSupportedLinkType(DLT_NULL));
    EXPECT_TRUE(PacketCodec::isSupportedLinkType(DLT_LOOP));
    EXPECT_FALSE(PacketCodec::isSupportedLinkType(DLT_LINUX_SLL));
}

TEST_F(PacketCodecTest, RejectsTruncatedFrames)
{
    std::vector<uint8_t> frame = buildFrame(FrameSpec());

    EXPECT_FALSE(codec.decode(frame.data(), 10, DLT_EN10MB, decoded));
    EXPECT_EQ(decoded.error, DecodeError::TRUNCATED);

    EXPECT_FALSE(codec.decode(frame.data(), kEthernetLength + 12, DLT_EN10MB, decoded));
    EXPECT_EQ(decoded.error, DecodeError::TRUNCATED);

    // Header complete, datagram cut short
    EXPECT_FALSE(codec.decode(frame.data(), frame.size() - 2, DLT_EN10MB, decoded));
    EXPECT_EQ(decoded.error, DecodeError::TRUNCATED);

    EXPECT_FALSE(codec.decode(nullptr, 0, DLT_EN10MB, decoded));
    EXPECT_EQ(decoded.error, DecodeError::TRUNCATED);
}

TEST_F(PacketCodecTest, RejectsBadIPv4Header)
{
    std::vector<uint8_t> frame = buildFrame(FrameSpec());
    frame[kEthernetLength] = 0x44;  // IHL 4

    EXPECT_FALSE(decodeEthernet(frame));
    EXPECT_EQ(decoded.error, DecodeError::BAD_HEADER);

    frame = buildFrame(FrameSpec());
    frame[kEthernetLength] = 0x65;  // version 6

    EXPECT_FALSE(decodeEthernet(frame));
    EXPECT_EQ(decoded.error, DecodeError::NOT_IPV4);
}

TEST_F(PacketCodecTest, RejectsUdpLengthBeyondDatagram)
{
    std::vector<uint8_t> frame = buildFrame(FrameSpec());
    size_t udp_length_offset = kEthernetLength + 20 + 4;
    frame[udp_length_offset] = 0x01;
    frame[udp_length_offset + 1] = 0x00;

    EXPECT_FALSE(decodeEthernet(frame));
    EXPECT_EQ(decoded.error, DecodeError::BAD_HEADER);
}

TEST_F(PacketCodecTest, AcceptsFirstFragmentShorterThanUdpLength)
{
    FrameSpec spec;
    spec.flags_fragment = 0x2000;  // MF, offset 0
    std::vector<uint8_t> frame = buildFrame(spec);
    size_t udp_length_offset = kEthernetLength + 20 + 4;
    frame[udp_length_offset] = 0x05;
    frame[udp_length_offset + 1] = 0xDC;

    ASSERT_TRUE(decodeEthernet(frame)) << decoded.error_detail;
    EXPECT_TRUE(decoded.ipv4.moreFragments());

    OutboundDatagram out;
    std::string error;
    EXPECT_TRUE(codec.rewrite(decoded, ip("10.0.0.255"), out, error)) << error;
}

TEST_F(PacketCodecTest, RejectsNonInitialFragment)
{
    FrameSpec spec;
    spec.flags_fragment = 0x00B9;  // offset 185 * 8
    std::vector<uint8_t> frame = buildFrame(spec);

    EXPECT_FALSE(decodeEthernet(frame));
    EXPECT_EQ(decoded.error, DecodeError::NOT_UDP);
}

TEST_F(PacketCodecTest, RejectsMalformedOptions)
{
    FrameSpec spec;
    spec.options = {0x44, 0x10, 0x05, 0x00};  // timestamp option claiming 16 bytes
    std::vector<uint8_t> frame = buildFrame(spec);

    EXPECT_FALSE(decodeEthernet(frame));
    EXPECT_EQ(decoded.error, DecodeError::BAD_HEADER);
}

// ==================== Rewrite ====================

TEST_F(PacketCodecTest, RewriteReplacesOnlyDestinationAndChecksum)
{
    FrameSpec spec;
    spec.tos = 0xB8;
    spec.flags_fragment = 0x4000;  // DF
    spec.payload = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07};
    std::vector<uint8_t> frame = buildFrame(spec);
    ASSERT_TRUE(decodeEthernet(frame)) << decoded.error_detail;

    OutboundDatagram out;
    std::string error;
    ASSERT_TRUE(codec.rewrite(decoded, ip("192.168.2.255"), out, error)) << error;

    EXPECT_EQ(out.header.version, 4);
    EXPECT_EQ(out.header.src_ip, ip("192.168.1.50"));
    EXPECT_EQ(out.header.dst_ip, ip("192.168.2.255"));
    EXPECT_EQ(out.source(), ip("192.168.1.50"));
    EXPECT_EQ(out.destination(), ip("192.168.2.255"));
    EXPECT_EQ(out.header.ttl, 64);
    EXPECT_EQ(out.header.protocol, 17);
    EXPECT_EQ(out.header.checksum, 0);

    std::vector<uint8_t> original = buildIPv4Datagram(spec);
    ASSERT_EQ(out.bytes.size(), original.size());

    // Checksum zeroed, destination replaced, everything else identical
    std::vector<uint8_t> expected = original;
    expected[10] = 0;
    expected[11] = 0;
    uint32_t dst = ip("192.168.2.255");
    std::memcpy(&expected[16], &dst, 4);
    EXPECT_EQ(out.bytes, expected);
}

TEST_F(PacketCodecTest, RewriteKeepsOptionsByteIdentical)
{
    FrameSpec spec;
    spec.options = {0x94, 0x04, 0x00, 0x00,    // router alert
                    0x01, 0x01, 0x01, 0x00};   // NOP NOP NOP EOL
    std::vector<uint8_t> frame = buildFrame(spec);
    ASSERT_TRUE(decodeEthernet(frame)) << decoded.error_detail;
    EXPECT_EQ(decoded.ipv4.ihl, 7);
    EXPECT_EQ(decoded.ipv4.options, spec.options);

    OutboundDatagram out;
    std::string error;
    ASSERT_TRUE(codec.rewrite(decoded, ip("10.1.1.255"), out, error)) << error;

    EXPECT_EQ(out.header.ihl, 7);
    EXPECT_EQ(out.header.options, spec.options);
    ASSERT_GE(out.bytes.size(), 28u);
    EXPECT_EQ(std::vector<uint8_t>(out.bytes.begin() + 20, out.bytes.begin() + 28), spec.options);
    EXPECT_EQ(std::vector<uint8_t>(out.bytes.begin() + 28, out.bytes.end()), buildUdpSegment(spec));
}

TEST_F(PacketCodecTest, RewritePassesUdpChecksumThrough)
{
    std::vector<uint8_t> frame = buildFrame(FrameSpec());
    ASSERT_TRUE(decodeEthernet(frame));

    OutboundDatagram out;
    std::string error;
    ASSERT_TRUE(codec.rewrite(decoded, ip("192.168.2.255"), out, error)) << error;
    EXPECT_EQ(out.bytes[26], 0xBE);
    EXPECT_EQ(out.bytes[27], 0xEF);
}

TEST_F(PacketCodecTest, RewriteRefusesUnspecifiedDestination)
{
    std::vector<uint8_t> frame = buildFrame(FrameSpec());
    ASSERT_TRUE(decodeEthernet(frame));

    OutboundDatagram out;
    std::string error;
    EXPECT_FALSE(codec.rewrite(decoded, 0, out, error));
    EXPECT_FALSE(error.empty());
}

TEST_F(PacketCodecTest, RewriteRefusesEmptyDecode)
{
    DecodedDatagram empty;
    OutboundDatagram out;
    std::string error;
    EXPECT_FALSE(codec.rewrite(empty, ip("192.168.2.255"), out, error));
}

// ==================== Helpers ====================

TEST_F(PacketCodecTest, SerializeHeaderLayout)
{
    IPv4Header header;
    header.version = 4;
    header.ihl = 5;
    header.tos = 0x10;
    header.total_length = 48;
    header.identification = 0xCAFE;
    header.flags = 0x02;
    header.fragment_offset = 0;
    header.ttl = 1;
    header.protocol = 17;
    header.src_ip = ip("1.2.3.4");
    header.dst_ip = ip("5.6.7.8");

    std::vector<uint8_t> bytes = PacketCodec::serializeHeader(header);
    ASSERT_EQ(bytes.size(), 20u);
    EXPECT_EQ(bytes[0], 0x45);
    EXPECT_EQ(bytes[1], 0x10);
    EXPECT_EQ(bytes[2], 0x00);
    EXPECT_EQ(bytes[3], 48);
    EXPECT_EQ(bytes[4], 0xCA);
    EXPECT_EQ(bytes[5], 0xFE);
    EXPECT_EQ(bytes[6], 0x40);
    EXPECT_EQ(bytes[7], 0x00);
    EXPECT_EQ(bytes[8], 1);
    EXPECT_EQ(bytes[9], 17);
    EXPECT_EQ(bytes[12], 1);
    EXPECT_EQ(bytes[15], 4);
    EXPECT_EQ(bytes[16], 5);
    EXPECT_EQ(bytes[19], 8);
}

TEST_F(PacketCodecTest, ErrorNames)
{
    EXPECT_EQ(PacketCodec::decodeErrorToString(DecodeError::NOT_UDP), "not UDP");
    EXPECT_EQ(PacketCodec::decodeErrorToString(DecodeError::TRUNCATED), "truncated");
    EXPECT_EQ(PacketCodec::envelopeToString(FrameEnvelope::LOOPBACK), "loopback");
    EXPECT_EQ(PacketCodec::envelopeToString(FrameEnvelope::ETHERNET), "ethernet");
}
