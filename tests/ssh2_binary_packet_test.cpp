#include <vector>

#include <cstdint>
#include <gtest/gtest.h>
#include <pktstack.hpp>

#include "support/packet_bytes.hpp"

using namespace pktstack;

class Ssh2BinaryPacketTest : public ::testing::Test {
protected:
    void SetUp() override { register_builtin_decoders(); }

    const std::vector<uint8_t> payload_{0x05, 0x01, 0x02, 0x03, 0x04, 0x05};
    const std::vector<uint8_t> padding_ = std::vector<uint8_t>(6, 0xaa);

    static std::unique_ptr<RawLayer::Builder> raw_builder(size_t size) {
        return std::make_unique<RawLayer::Builder>(std::vector<uint8_t>(size, 0x11));
    }

    static std::shared_ptr<const Ssh2BinaryPacket> build(const Ssh2BinaryPacket::Builder& builder) {
        auto result = builder.build();
        EXPECT_TRUE(result.has_value());
        return result ? layer_cast<Ssh2BinaryPacket>(*result) : nullptr;
    }
};

// Test 1: Well-formed packet with 6-byte payload and 6 bytes of padding
TEST_F(Ssh2BinaryPacketTest, DecodeWellFormedPacket) {
    auto bytes = test::ssh2_bytes(13, 6, payload_, padding_, {});
    ASSERT_EQ(bytes.size(), 18u);

    auto result = Ssh2BinaryPacket::decode(bytes);
    ASSERT_TRUE(result.has_value());

    auto packet = layer_cast<Ssh2BinaryPacket>(*result);
    ASSERT_TRUE(packet);
    EXPECT_EQ(packet->header()->packet_length(), 13u);
    EXPECT_EQ(packet->header()->padding_length(), 6);
    ASSERT_TRUE(packet->payload());
    EXPECT_EQ(packet->payload()->kind(), LayerKind::raw);
    EXPECT_EQ(packet->payload()->to_bytes(), payload_);
    EXPECT_EQ(packet->random_padding(), padding_);
    EXPECT_TRUE(packet->mac().empty());
    EXPECT_EQ(packet->size_bytes(), 18u);
    EXPECT_EQ(packet->to_bytes(), bytes);
}

// Test that recomputing the length fields reproduces a consistent packet exactly
TEST_F(Ssh2BinaryPacketTest, RebuildWithLengthCorrectionIsIdentical) {
    auto bytes = test::ssh2_bytes(13, 6, payload_, padding_, {});
    auto result = Ssh2BinaryPacket::decode(bytes);
    ASSERT_TRUE(result.has_value());

    auto builder = (*result)->to_builder();
    builder->set_correction({true, false});
    auto rebuilt = builder->build();
    ASSERT_TRUE(rebuilt.has_value());
    EXPECT_EQ((*rebuilt)->to_bytes(), bytes);
}

// Test 2: Padding consumes the whole packet, leaving no payload
TEST_F(Ssh2BinaryPacketTest, EmptyPayloadIsMalformedInput) {
    auto bytes = test::ssh2_bytes(6, 5, {}, std::vector<uint8_t>(5, 0), {});

    auto result = Ssh2BinaryPacket::decode(bytes);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::malformed_input);
    EXPECT_NE(result.error().detail.find("Payload is required"), std::string::npos);
}

// Test 3: Fewer bytes than the 5-byte header
TEST_F(Ssh2BinaryPacketTest, TooShortIsMalformedInput) {
    const std::vector<uint8_t> bytes{0x00, 0x00, 0x00, 0x0d};

    auto result = Ssh2BinaryPacket::decode(bytes);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::malformed_input);
    EXPECT_EQ(result.error().layer, LayerKind::ssh2_binary);
}

// Test 4: Packet length with the sign bit set
TEST_F(Ssh2BinaryPacketTest, SignBitLengthIsInconsistent) {
    auto bytes = test::ssh2_bytes(0x80000000, 4, payload_, std::vector<uint8_t>(4, 0), {});

    auto result = Ssh2BinaryPacket::decode(bytes);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::inconsistent_length);
}

// Test 5: Padding length larger than the packet length
TEST_F(Ssh2BinaryPacketTest, NegativePayloadLengthIsInconsistent) {
    auto bytes = test::ssh2_bytes(3, 5, {0x01, 0x02}, {}, {});

    auto result = Ssh2BinaryPacket::decode(bytes);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::inconsistent_length);
}

// Test 6: Payload runs past the end of the buffer
TEST_F(Ssh2BinaryPacketTest, PayloadPastEndIsInconsistent) {
    auto bytes = test::ssh2_bytes(100, 4, payload_, {}, {});

    auto result = Ssh2BinaryPacket::decode(bytes);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::inconsistent_length);
}

// Test 7: Padding runs past the end of the buffer
TEST_F(Ssh2BinaryPacketTest, PaddingPastEndIsInconsistent) {
    auto bytes = test::ssh2_bytes(13, 6, payload_, {0xaa, 0xaa, 0xaa}, {});

    auto result = Ssh2BinaryPacket::decode(bytes);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::inconsistent_length);
}

// Test that bytes after the padding are the MAC
TEST_F(Ssh2BinaryPacketTest, TrailingBytesAreMac) {
    const std::vector<uint8_t> mac{0xde, 0xad, 0xbe, 0xef};
    auto bytes = test::ssh2_bytes(13, 6, payload_, padding_, mac);

    auto result = Ssh2BinaryPacket::decode(bytes);
    ASSERT_TRUE(result.has_value());

    auto packet = layer_cast<Ssh2BinaryPacket>(*result);
    EXPECT_EQ(packet->mac(), mac);
    EXPECT_EQ(packet->size_bytes(), 22u);
    EXPECT_EQ(packet->to_bytes(), bytes);

    auto rebuilt = packet->to_builder()->build();
    ASSERT_TRUE(rebuilt.has_value());
    EXPECT_EQ((*rebuilt)->to_bytes(), bytes);
}

// Test that the payload is dispatched by its first byte
TEST_F(Ssh2BinaryPacketTest, PayloadDispatchedByMessageNumber) {
    constexpr uint8_t msg_channel_data = 94;
    auto& registry = DecoderRegistry::global();
    registry.register_decoder(Contract::ssh2_message_number, msg_channel_data,
                              [](std::span<const uint8_t> bytes) -> CodecResult<LayerPtr> {
                                  return make_decode_error(ErrorCode::malformed_input,
                                                           LayerKind::raw, "test", bytes);
                              });

    const std::vector<uint8_t> payload{msg_channel_data, 0x00, 0x00, 0x00};
    auto bytes = test::ssh2_bytes(9, 4, payload, std::vector<uint8_t>(4, 0), {});
    auto result = Ssh2BinaryPacket::decode(bytes);
    registry.register_decoder(Contract::ssh2_message_number, msg_channel_data, DecodeFn{});

    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE((*result)->payload());
    EXPECT_TRUE((*result)->payload()->is_malformed());
    EXPECT_EQ((*result)->payload()->to_bytes(), payload);
    EXPECT_EQ((*result)->to_bytes(), bytes);
}

// -----------------------------------------------------------------------------
// Build
// -----------------------------------------------------------------------------

TEST_F(Ssh2BinaryPacketTest, BuildRequiresPayload) {
    Ssh2BinaryPacket::Builder builder;
    builder.random_padding(padding_);

    auto result = builder.build();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::invalid_builder_state);
}

TEST_F(Ssh2BinaryPacketTest, BuildRequiresPaddingUnlessGenerated) {
    Ssh2BinaryPacket::Builder builder;
    builder.payload_builder(raw_builder(6));

    auto result = builder.build();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::invalid_builder_state);
}

// Test that the frame length law holds with length correction
TEST_F(Ssh2BinaryPacketTest, BuildAppliesLengthLaw) {
    const std::vector<uint8_t> mac{1, 2, 3, 4, 5, 6, 7, 8};
    Ssh2BinaryPacket::Builder builder;
    builder.payload_builder(raw_builder(10))
        .random_padding(std::vector<uint8_t>(7, 0))
        .mac(mac)
        .correct_length_at_build(true);

    auto packet = build(builder);
    ASSERT_TRUE(packet);
    EXPECT_EQ(packet->header()->packet_length(), 18u);
    EXPECT_EQ(packet->header()->padding_length(), 7);
    EXPECT_EQ(packet->size_bytes(), 4 + packet->header()->packet_length() + mac.size());
}

// Test that without correction stale lengths are written verbatim
TEST_F(Ssh2BinaryPacketTest, BuildWithoutCorrectionKeepsLengths) {
    Ssh2BinaryPacket::Builder builder;
    builder.payload_builder(raw_builder(6))
        .random_padding(padding_)
        .packet_length(99)
        .padding_length(1);

    auto packet = build(builder);
    ASSERT_TRUE(packet);
    EXPECT_EQ(packet->header()->packet_length(), 99u);
    EXPECT_EQ(packet->header()->padding_length(), 1);
}

TEST_F(Ssh2BinaryPacketTest, BuildRejectsSignBitLength) {
    Ssh2BinaryPacket::Builder builder;
    builder.payload_builder(raw_builder(6)).random_padding(padding_).packet_length(0x80000000);

    auto result = builder.build();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::inconsistent_length);
}

// Test generated padding against the default block size of 8
TEST_F(Ssh2BinaryPacketTest, PaddingAtBuildDefaultBlockSize) {
    Ssh2BinaryPacket::Builder builder;
    builder.payload_builder(raw_builder(6)).padding_at_build(true).correct_length_at_build(true);

    auto packet = build(builder);
    ASSERT_TRUE(packet);
    EXPECT_EQ(packet->random_padding(), std::vector<uint8_t>(6, 0));
    EXPECT_EQ(packet->header()->padding_length(), 6);
    EXPECT_EQ(packet->header()->packet_length(), 13u);
}

TEST_F(Ssh2BinaryPacketTest, PaddingAtBuildUsesCipherBlockSize) {
    Ssh2BinaryPacket::Builder builder;
    builder.payload_builder(raw_builder(10))
        .padding_at_build(true)
        .cipher_block_size(16)
        .correct_length_at_build(true);

    auto packet = build(builder);
    ASSERT_TRUE(packet);
    EXPECT_EQ(packet->random_padding().size(), 10u);
    EXPECT_EQ(packet->header()->packet_length(), 21u);
}

// Test that block sizes below 8 are raised to 8
TEST_F(Ssh2BinaryPacketTest, PaddingAtBuildMinimumBlockSize) {
    Ssh2BinaryPacket::Builder builder;
    builder.payload_builder(raw_builder(10)).padding_at_build(true).cipher_block_size(4);

    auto packet = build(builder);
    ASSERT_TRUE(packet);
    EXPECT_EQ(packet->random_padding().size(), 2u);
}

// Test that padding the 8-bit padding_length cannot describe is refused
TEST_F(Ssh2BinaryPacketTest, PaddingAtBuildRejectsOverlongPadding) {
    Ssh2BinaryPacket::Builder builder;
    builder.payload_builder(raw_builder(300))
        .cipher_block_size(512)
        .padding_at_build(true)
        .correct_length_at_build(true);

    auto result = builder.build();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::inconsistent_length);
    EXPECT_EQ(result.error().layer, LayerKind::ssh2_binary);
}

TEST_F(Ssh2BinaryPacketTest, PaddingAtBuildIgnoresStagedPadding) {
    Ssh2BinaryPacket::Builder builder;
    builder.payload_builder(raw_builder(16))
        .random_padding(padding_)
        .padding_at_build(true)
        .correct_length_at_build(true);

    auto packet = build(builder);
    ASSERT_TRUE(packet);
    EXPECT_TRUE(packet->random_padding().empty());
    EXPECT_EQ(packet->header()->packet_length(), 17u);
}

TEST_F(Ssh2BinaryPacketTest, ToStringShowsPaddingAndMac) {
    auto bytes = test::ssh2_bytes(13, 6, payload_, padding_, {0x01, 0x02});
    auto result = Ssh2BinaryPacket::decode(bytes);
    ASSERT_TRUE(result.has_value());

    auto text = (*result)->to_string();
    EXPECT_NE(text.find("packet_length: 13"), std::string::npos);
    EXPECT_NE(text.find("random padding: aa aa aa aa aa aa"), std::string::npos);
    EXPECT_NE(text.find("mac: 01 02"), std::string::npos);
}
