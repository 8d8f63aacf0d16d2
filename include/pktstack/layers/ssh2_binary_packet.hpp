#pragma once

#include <algorithm>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <cstdint>
#include <pktstack/types.hpp>

#include "../builder.hpp"
#include "../detail/buffer_io.hpp"
#include "../detail/codec_result.hpp"
#include "../layer.hpp"
#include "../registry.hpp"

namespace pktstack {

// SSH binary packet (RFC 4253 section 6)
//
//   uint32    packet_length   excludes itself and the MAC
//   byte      padding_length
//   byte[n1]  payload         n1 = packet_length - padding_length - 1
//   byte[n2]  random padding  n2 = padding_length
//   byte[m]   mac             m depends on the negotiated algorithm
namespace ssh2 {
inline constexpr size_t packet_length_offset = 0;
inline constexpr size_t padding_length_offset = 4;
inline constexpr size_t payload_offset = ssh2_binary_header_size;
} // namespace ssh2

/**
 * @brief SSH binary packet: length-prefixed, padded, MAC-trailing frame
 *
 * The payload is decoded through the registry by its first byte (the SSH
 * message number). The MAC length is negotiated out of band, so on decode
 * the MAC is every byte left after the padding.
 */
class Ssh2BinaryPacket final : public Layer {
    struct Passkey {
        explicit Passkey() = default;
    };

public:
    static constexpr LayerKind layer_kind = LayerKind::ssh2_binary;

    class Builder;

    class Header final : public pktstack::Header {
    public:
        uint32_t packet_length() const noexcept { return packet_length_; }
        uint8_t padding_length() const noexcept { return padding_length_; }

        size_t size_bytes() const noexcept override { return ssh2_binary_header_size; }

        std::vector<std::vector<uint8_t>> raw_fields() const override {
            return {detail::u32_field(packet_length_), detail::u8_field(padding_length_)};
        }

        std::string to_string() const override {
            std::string out = "[SSH2 Binary Packet Header (5 bytes)]\n";
            out += "  packet_length: " + std::to_string(packet_length_) + "\n";
            out += "  padding_length: " + std::to_string(padding_length_) + "\n";
            return out;
        }

    private:
        friend class Ssh2BinaryPacket;
        friend class Ssh2BinaryPacket::Builder;

        Header() = default;

        uint32_t packet_length_ = 0;
        uint8_t padding_length_ = 0;
    };

    /**
     * @brief Decode an SSH binary packet
     *
     * - fewer than 5 bytes: MalformedInput
     * - packet_length above 2^31 - 1: InconsistentLength
     * - payload length (packet_length - padding_length - 1) of zero: MalformedInput
     * - negative payload length, or payload/padding past the buffer: InconsistentLength
     */
    [[nodiscard]] static CodecResult<LayerPtr> decode(std::span<const uint8_t> bytes) {
        if (bytes.size() < ssh2_binary_header_size) {
            return make_decode_error(ErrorCode::malformed_input, layer_kind,
                                     "The data is too short to build an SSH2 Binary header(" +
                                         std::to_string(ssh2_binary_header_size) + " bytes).",
                                     bytes);
        }

        Header header;
        header.packet_length_ = detail::read_u32(bytes.data(), ssh2::packet_length_offset);
        header.padding_length_ = detail::read_u8(bytes.data(), ssh2::padding_length_offset);

        if (header.packet_length_ > ssh2_max_packet_length) {
            return make_decode_error(ErrorCode::inconsistent_length, layer_kind,
                                     "The packet length which is longer than " +
                                         std::to_string(ssh2_max_packet_length) +
                                         " is not supported. packet length: " +
                                         std::to_string(header.packet_length_),
                                     bytes);
        }

        int64_t payload_length = static_cast<int64_t>(header.packet_length_) -
                                 static_cast<int64_t>(header.padding_length_) - 1;
        if (payload_length == 0) {
            return make_decode_error(ErrorCode::malformed_input, layer_kind,
                                     "Payload is required for Ssh2BinaryPacket.", bytes);
        }
        if (payload_length < 0) {
            return make_decode_error(ErrorCode::inconsistent_length, layer_kind,
                                     "The padding length " +
                                         std::to_string(header.padding_length_) +
                                         " does not fit in the packet length " +
                                         std::to_string(header.packet_length_) + ".",
                                     bytes);
        }

        auto payload_bytes =
            detail::slice(bytes, ssh2::payload_offset, static_cast<size_t>(payload_length));
        if (!payload_bytes) {
            return make_decode_error(ErrorCode::inconsistent_length, layer_kind,
                                     "The packet length " +
                                         std::to_string(header.packet_length_) +
                                         " exceeds the " + std::to_string(bytes.size()) +
                                         " bytes available.",
                                     bytes);
        }

        size_t padding_offset = ssh2::payload_offset + payload_bytes->size();
        auto padding = detail::slice(bytes, padding_offset, header.padding_length_);
        if (!padding) {
            return make_decode_error(ErrorCode::inconsistent_length, layer_kind,
                                     "The padding length " +
                                         std::to_string(header.padding_length_) +
                                         " exceeds the bytes available.",
                                     bytes);
        }

        LayerPtr payload =
            decode_nested(Contract::ssh2_message_number, (*payload_bytes)[0], *payload_bytes);
        auto mac = detail::slice_from(bytes, padding_offset + padding->size());

        return std::make_shared<const Ssh2BinaryPacket>(Passkey{}, header, std::move(payload),
                                                        detail::copy_bytes(*padding),
                                                        detail::copy_bytes(mac));
    }

    LayerKind kind() const noexcept override { return layer_kind; }

    const Header* header() const noexcept override { return &header_; }

    LayerPtr payload() const noexcept override { return payload_; }

    size_t size_bytes() const noexcept override {
        return header_.size_bytes() + payload_->size_bytes() + random_padding_.size() +
               mac_.size();
    }

    void write_to(std::span<uint8_t> out) const override {
        Layer::write_to(out);
        auto it = out.begin() + header_.size_bytes() + payload_->size_bytes();
        it = std::copy(random_padding_.begin(), random_padding_.end(), it);
        std::copy(mac_.begin(), mac_.end(), it);
    }

    /// Copy of the random padding
    std::vector<uint8_t> random_padding() const { return random_padding_; }

    /// Copy of the MAC
    std::vector<uint8_t> mac() const { return mac_; }

    std::unique_ptr<LayerBuilder> to_builder() const override;

    std::string to_string() const override {
        std::string out = header_.to_string();
        out += payload_->to_string();
        out += "  random padding: " + detail::to_hex_string(random_padding_) + "\n";
        out += "  mac: " + detail::to_hex_string(mac_) + "\n";
        return out;
    }

    Ssh2BinaryPacket(Passkey, Header header, LayerPtr payload,
                     std::vector<uint8_t> random_padding, std::vector<uint8_t> mac)
        : header_(std::move(header)),
          payload_(std::move(payload)),
          random_padding_(std::move(random_padding)),
          mac_(std::move(mac)) {}

private:
    Header header_;
    LayerPtr payload_;
    std::vector<uint8_t> random_padding_;
    std::vector<uint8_t> mac_;
};

/**
 * @brief Builder for Ssh2BinaryPacket
 *
 * - payload builder is required;
 * - random padding is required unless padding_at_build is on, in which case
 *   (payload size % block size) zero bytes are generated, block size being
 *   cipher_block_size or 8, whichever is larger;
 * - length correction sets packet_length = 1 + payload + padding and
 *   padding_length = padding size; padding longer than 255 bytes cannot be
 *   described by padding_length and fails with InconsistentLength.
 */
class Ssh2BinaryPacket::Builder final : public detail::BuilderBase<Ssh2BinaryPacket::Builder> {
public:
    static constexpr LayerKind layer_kind = LayerKind::ssh2_binary;
    static constexpr bool has_payload_slot = true;
    static constexpr bool length_correction = true;
    static constexpr bool checksum_correction = false;

    Builder() = default;

    Builder& packet_length(uint32_t value) noexcept {
        packet_length_ = value;
        return *this;
    }

    Builder& padding_length(uint8_t value) noexcept {
        padding_length_ = value;
        return *this;
    }

    Builder& random_padding(std::span<const uint8_t> bytes) {
        random_padding_ = detail::copy_bytes(bytes);
        return *this;
    }

    Builder& mac(std::span<const uint8_t> bytes) {
        mac_ = detail::copy_bytes(bytes);
        return *this;
    }

    /// Cipher block size for padding_at_build (values below 8 mean 8)
    Builder& cipher_block_size(size_t value) noexcept {
        cipher_block_size_ = value;
        return *this;
    }

    Builder& padding_at_build(bool enable) noexcept {
        padding_at_build_ = enable;
        return *this;
    }

    CodecResult<LayerPtr> build() const override {
        if (!payload_builder_) {
            return make_build_error(ErrorCode::invalid_builder_state, layer_kind,
                                    "payload_builder is required.");
        }
        if (!padding_at_build_ && !random_padding_) {
            return make_build_error(ErrorCode::invalid_builder_state, layer_kind,
                                    "random_padding must be set if padding_at_build is false.");
        }

        auto payload = payload_builder_->build();
        if (!payload) {
            return unexpected(std::move(payload.error()));
        }
        size_t payload_size = (*payload)->size_bytes();

        std::vector<uint8_t> padding;
        if (padding_at_build_) {
            size_t block_size = std::max(cipher_block_size_, ssh2_min_cipher_block_size);
            padding.assign(payload_size % block_size, 0);
        } else {
            padding = *random_padding_;
        }

        Header header;
        if (correction_.correct_length_at_build) {
            if (padding.size() > ssh2_max_padding_length) {
                return make_build_error(ErrorCode::inconsistent_length, layer_kind,
                                        "The padding is too long for the padding length "
                                        "field. padding length: " +
                                            std::to_string(padding.size()));
            }
            uint64_t length = 1 + static_cast<uint64_t>(payload_size) + padding.size();
            if (length > ssh2_max_packet_length) {
                return make_build_error(ErrorCode::inconsistent_length, layer_kind,
                                        "The packet length which is longer than " +
                                            std::to_string(ssh2_max_packet_length) +
                                            " is not supported. packet length: " +
                                            std::to_string(length));
            }
            header.packet_length_ = static_cast<uint32_t>(length);
            header.padding_length_ = static_cast<uint8_t>(padding.size());
        } else {
            if (packet_length_ > ssh2_max_packet_length) {
                return make_build_error(ErrorCode::inconsistent_length, layer_kind,
                                        "The packet length which is longer than " +
                                            std::to_string(ssh2_max_packet_length) +
                                            " is not supported. packet length: " +
                                            std::to_string(packet_length_));
            }
            header.packet_length_ = packet_length_;
            header.padding_length_ = padding_length_;
        }

        return std::make_shared<const Ssh2BinaryPacket>(Passkey{}, std::move(header),
                                                        std::move(*payload), std::move(padding),
                                                        mac_);
    }

private:
    uint32_t packet_length_ = 0;
    uint8_t padding_length_ = 0;
    std::optional<std::vector<uint8_t>> random_padding_;
    std::vector<uint8_t> mac_;
    size_t cipher_block_size_ = 0;
    bool padding_at_build_ = false;
};

inline std::unique_ptr<LayerBuilder> Ssh2BinaryPacket::to_builder() const {
    auto builder = std::make_unique<Builder>();
    builder->packet_length(header_.packet_length_)
        .padding_length(header_.padding_length_)
        .random_padding(random_padding_)
        .mac(mac_)
        .payload(payload_);
    return builder;
}

} // namespace pktstack
