#include <vector>

#include <cstdint>
#include <gtest/gtest.h>
#include <pktstack.hpp>

#include "support/packet_bytes.hpp"

using namespace pktstack;

class Ipv6PacketTest : public ::testing::Test {
protected:
    void SetUp() override { register_builtin_decoders(); }
};

TEST_F(Ipv6PacketTest, DecodeHeaderFields) {
    auto bytes = test::ipv6_bytes(ip_number_no_next_header, {}, 0);
    bytes[0] = 0x6a; // traffic class high nibble 0xa
    bytes[1] = 0xb1; // traffic class low nibble 0xb, flow label 0x12345
    bytes[2] = 0x23;
    bytes[3] = 0x45;

    auto result = Ipv6Packet::decode(bytes);
    ASSERT_TRUE(result.has_value());

    auto packet = layer_cast<Ipv6Packet>(*result);
    ASSERT_TRUE(packet);
    const auto* header = packet->header();
    EXPECT_EQ(header->version(), 6);
    EXPECT_EQ(header->traffic_class(), 0xab);
    EXPECT_EQ(header->flow_label(), 0x12345u);
    EXPECT_EQ(header->payload_length(), 0);
    EXPECT_EQ(header->next_header(), ip_number_no_next_header);
    EXPECT_EQ(header->hop_limit(), 64);
    EXPECT_EQ(header->src_addr(), test::src_addr);
    EXPECT_EQ(header->dst_addr(), test::dst_addr);
    EXPECT_EQ(packet->payload(), nullptr);
    EXPECT_EQ(packet->to_bytes(), bytes);
}

// Test 1: Buffer shorter than the fixed header
TEST_F(Ipv6PacketTest, TooShortIsMalformedInput) {
    auto bytes = test::bare_ipv6_bytes();
    bytes.resize(39);

    auto result = Ipv6Packet::decode(bytes);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::malformed_input);
    EXPECT_EQ(result.error().layer, LayerKind::ipv6);
}

// Test 2: Version nibble other than 6
TEST_F(Ipv6PacketTest, WrongVersionIsTypeMismatch) {
    auto bytes = test::ipv6_bytes(ip_number_no_next_header, {}, 0, 4);

    auto result = Ipv6Packet::decode(bytes);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::type_mismatch);
}

// Test 3: Payload length past the end of the buffer
TEST_F(Ipv6PacketTest, PayloadLengthPastEndIsInconsistent) {
    auto bytes = test::ipv6_bytes(200, {0x01, 0x02}, 3);

    auto result = Ipv6Packet::decode(bytes);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::inconsistent_length);
}

// Test that the payload is dispatched by next header
TEST_F(Ipv6PacketTest, UdpPayloadIsDispatched) {
    auto udp = test::udp_bytes(11, {'a', 'b', 'c'});
    auto bytes = test::ipv6_bytes(ip_number_udp, udp, static_cast<uint16_t>(udp.size()));

    auto result = decode(Contract::ether_type, ether_type_ipv6, bytes);
    ASSERT_TRUE(result.has_value());

    auto payload = layer_cast<UdpPacket>((*result)->payload());
    ASSERT_TRUE(payload);
    EXPECT_EQ(payload->header()->length(), 11);
    EXPECT_EQ((*result)->to_bytes(), bytes);
}

TEST_F(Ipv6PacketTest, UnknownNextHeaderIsRaw) {
    auto bytes = test::ipv6_bytes(253, {0xde, 0xad}, 2);

    auto result = Ipv6Packet::decode(bytes);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ((*result)->payload()->kind(), LayerKind::raw);
    EXPECT_EQ((*result)->to_bytes(), bytes);
}

// Test that a payload failing to decode becomes a sentinel, not an error
TEST_F(Ipv6PacketTest, BadPayloadBecomesMalformedLayer) {
    auto udp = test::udp_bytes(20, {'a', 'b', 'c'});
    auto bytes = test::ipv6_bytes(ip_number_udp, udp, static_cast<uint16_t>(udp.size()));

    auto result = Ipv6Packet::decode(bytes);
    ASSERT_TRUE(result.has_value());

    auto payload = (*result)->payload();
    ASSERT_TRUE(payload);
    EXPECT_TRUE(payload->is_malformed());
    EXPECT_EQ(layer_cast<MalformedLayer>(payload)->cause().layer, LayerKind::udp);
    EXPECT_TRUE((*result)->contains_malformed());
    EXPECT_EQ((*result)->to_bytes(), bytes);
}

// Test that bytes past the declared payload length are not part of the packet
TEST_F(Ipv6PacketTest, TrailingBytesAreExcluded) {
    auto bytes = test::ipv6_bytes(253, {0x01, 0x02, 0x03, 0x04}, 2);

    auto result = Ipv6Packet::decode(bytes);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ((*result)->size_bytes(), 42u);
    EXPECT_EQ((*result)->payload()->to_bytes(), (std::vector<uint8_t>{0x01, 0x02}));
}

// Test that bytes inside the payload length but past a short UDP datagram are kept
TEST_F(Ipv6PacketTest, BytesAfterShortUdpAreKept) {
    auto udp = test::udp_bytes(8, {0xaa, 0xbb, 0xcc, 0xdd});
    auto bytes = test::ipv6_bytes(ip_number_udp, udp, 12);
    ASSERT_EQ(bytes.size(), 52u);

    auto result = Ipv6Packet::decode(bytes);
    ASSERT_TRUE(result.has_value());
    auto packet = layer_cast<Ipv6Packet>(*result);
    ASSERT_TRUE(packet);
    ASSERT_EQ(packet->payload()->kind(), LayerKind::udp);
    EXPECT_EQ(packet->payload()->size_bytes(), 8u);
    EXPECT_EQ(packet->trailing_bytes(), (std::vector<uint8_t>{0xaa, 0xbb, 0xcc, 0xdd}));
    EXPECT_EQ(packet->size_bytes(), 52u);
    EXPECT_EQ(packet->to_bytes(), bytes);

    // Length correction counts the trailing bytes too
    auto builder = packet->to_builder();
    builder->set_correction({true, false});
    auto rebuilt = builder->build();
    ASSERT_TRUE(rebuilt.has_value());
    EXPECT_EQ(layer_cast<Ipv6Packet>(*rebuilt)->header()->payload_length(), 12);
    EXPECT_EQ((*rebuilt)->to_bytes(), bytes);
}

TEST_F(Ipv6PacketTest, BuildWithLengthCorrection) {
    Ipv6Packet::Builder builder;
    builder.traffic_class(0x12)
        .flow_label(0xfffff)
        .next_header(253)
        .hop_limit(255)
        .src_addr(test::src_addr)
        .dst_addr(test::dst_addr)
        .payload_length(1000)
        .payload_builder(std::make_unique<RawLayer::Builder>(std::vector<uint8_t>(24, 0xaa)))
        .correct_length_at_build(true);

    auto result = builder.build();
    ASSERT_TRUE(result.has_value());

    auto packet = layer_cast<Ipv6Packet>(*result);
    EXPECT_EQ(packet->header()->payload_length(), 24);
    EXPECT_EQ(packet->header()->flow_label(), 0xfffffu);
    EXPECT_EQ(packet->size_bytes(), 64u);

    // Decoding the built bytes yields the same packet
    auto decoded = Ipv6Packet::decode(packet->to_bytes());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_TRUE(**decoded == *packet);
}

// Test that without correction a stale length is written verbatim
TEST_F(Ipv6PacketTest, BuildWithoutCorrectionKeepsLength) {
    Ipv6Packet::Builder builder;
    builder.payload_length(1000).payload_builder(
        std::make_unique<RawLayer::Builder>(std::vector<uint8_t>(4, 0)));

    auto result = builder.build();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(layer_cast<Ipv6Packet>(*result)->header()->payload_length(), 1000);
}

TEST_F(Ipv6PacketTest, BuildWithoutPayload) {
    Ipv6Packet::Builder builder;
    builder.src_addr(test::src_addr).dst_addr(test::dst_addr).hop_limit(64);

    auto result = builder.build();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ((*result)->to_bytes(), test::bare_ipv6_bytes());
}

TEST_F(Ipv6PacketTest, ToStringNamesFields) {
    auto result = Ipv6Packet::decode(test::bare_ipv6_bytes());
    ASSERT_TRUE(result.has_value());

    auto text = (*result)->to_string();
    EXPECT_NE(text.find("[IPv6 Header (40 bytes)]"), std::string::npos);
    EXPECT_NE(text.find("Hop Limit: 64"), std::string::npos);
    EXPECT_NE(text.find("fe:80:00:00"), std::string::npos);
}
