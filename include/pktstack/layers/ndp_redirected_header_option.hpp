#pragma once

#include <algorithm>
#include <array>
#include <memory>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <cstdint>
#include <pktstack/types.hpp>

#include "../builder.hpp"
#include "../containment.hpp"
#include "../detail/buffer_io.hpp"
#include "../detail/codec_result.hpp"
#include "../layer.hpp"
#include "../registry.hpp"

namespace pktstack {

// Redirected Header option (RFC 4861 section 4.6.3)
//
//   0                   1                   2                   3
//   0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
//  +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//  |     Type      |    Length     |                               |
//  +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+                               +
//  |                           Reserved                            |
//  +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//  |                                                               |
//  ~                       IP header + data                        ~
//  |                                                               |
//  +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
namespace ndp_redirected_header {
inline constexpr size_t type_offset = 0;
inline constexpr size_t length_offset = 1;
inline constexpr size_t reserved_offset = 2;
inline constexpr size_t ip_packet_offset = ndp_redirected_header_prefix_size;
inline constexpr size_t max_option_size = 0xFF * ndp_option_unit_size;
} // namespace ndp_redirected_header

/**
 * @brief ND Redirected Header option: an option that embeds a full IPv6 packet
 *
 * The embedded packet is decoded through the registry as ether type IPv6.
 * When that packet contains a malformed sub-layer the option still decodes;
 * the embedded chain is passed through contain_malformed() so none of its
 * builders will recompute length or checksum fields over the bad bytes.
 *
 * Bytes after the end of the embedded packet (the zero padding that rounds
 * the option up to a multiple of 8) are kept as trailing bytes.
 */
class NdpRedirectedHeaderOption final : public Layer {
    struct Passkey {
        explicit Passkey() = default;
    };

public:
    static constexpr LayerKind layer_kind = LayerKind::ndp_redirected_header;

    class Builder;

    class Header final : public pktstack::Header {
    public:
        uint8_t type() const noexcept { return ndp_option_type_redirected_header; }

        /// Length in units of 8 bytes
        uint8_t length() const noexcept { return length_; }

        /// Copy of the 6 reserved bytes
        std::vector<uint8_t> reserved() const {
            return std::vector<uint8_t>(reserved_.begin(), reserved_.end());
        }

        size_t size_bytes() const noexcept override { return ndp_redirected_header_prefix_size; }

        std::vector<std::vector<uint8_t>> raw_fields() const override {
            return {detail::u8_field(type()), detail::u8_field(length_),
                    std::vector<uint8_t>(reserved_.begin(), reserved_.end())};
        }

        std::string to_string() const override {
            std::string out = "[Type: " + std::to_string(type()) + " (Redirected Header)]";
            out += " [Length: " + std::to_string(length_) + " (" +
                   std::to_string(length_ * ndp_option_unit_size) + " bytes)]";
            out += " [Reserved: " + detail::to_hex_string(reserved_) + "]\n";
            return out;
        }

    private:
        friend class NdpRedirectedHeaderOption;
        friend class NdpRedirectedHeaderOption::Builder;

        Header() = default;

        uint8_t length_ = 0;
        std::array<uint8_t, ndp_redirected_header_reserved_size> reserved_{};
    };

    /**
     * @brief Decode the option directly (bypassing the registry)
     *
     * - fewer than 8 + 40 bytes: MalformedInput
     * - type byte not 4: TypeMismatch
     * - length * 8 past the end of the buffer: InconsistentLength
     *
     * Everything after the 8-byte prefix is the embedded packet; what the
     * packet does not consume becomes trailing_bytes().
     */
    [[nodiscard]] static CodecResult<LayerPtr> decode(std::span<const uint8_t> bytes) {
        constexpr size_t min_size = ndp_redirected_header_prefix_size + ipv6_header_size;
        if (bytes.size() < min_size) {
            return make_decode_error(ErrorCode::malformed_input, layer_kind,
                                     "The raw data length must be more than " +
                                         std::to_string(min_size - 1) + ".",
                                     bytes);
        }

        uint8_t type = detail::read_u8(bytes.data(), ndp_redirected_header::type_offset);
        if (type != ndp_option_type_redirected_header) {
            return make_decode_error(
                ErrorCode::type_mismatch, layer_kind,
                "The type must be: " + std::to_string(ndp_option_type_redirected_header) +
                    " but is " + std::to_string(type) + ".",
                bytes);
        }

        Header header;
        header.length_ = detail::read_u8(bytes.data(), ndp_redirected_header::length_offset);
        if (static_cast<size_t>(header.length_) * ndp_option_unit_size > bytes.size()) {
            return make_decode_error(
                ErrorCode::inconsistent_length, layer_kind,
                "The raw data is too short to build this option. " +
                    std::to_string(header.length_ * ndp_option_unit_size) +
                    " bytes data is needed.",
                bytes);
        }
        std::copy_n(bytes.begin() + ndp_redirected_header::reserved_offset,
                    ndp_redirected_header_reserved_size, header.reserved_.begin());

        auto ip_bytes = bytes.subspan(ndp_redirected_header::ip_packet_offset);
        LayerPtr ip_packet = decode_nested(Contract::ether_type, ether_type_ipv6, ip_bytes);
        auto contained = contain_malformed(ip_packet);
        if (!contained) {
            ip_packet = MalformedLayer::wrap(ip_bytes, std::move(contained.error()));
        } else {
            ip_packet = std::move(*contained);
        }
        auto trailing =
            detail::copy_bytes(detail::slice_from(ip_bytes, ip_packet->size_bytes()));

        return std::make_shared<const NdpRedirectedHeaderOption>(Passkey{}, header,
                                                                 std::move(ip_packet),
                                                                 std::move(trailing));
    }

    LayerKind kind() const noexcept override { return layer_kind; }

    const Header* header() const noexcept override { return &header_; }

    LayerPtr payload() const noexcept override { return ip_packet_; }

    /// The embedded IP packet (same as payload())
    LayerPtr ip_packet() const noexcept { return ip_packet_; }

    /// Copy of the bytes following the embedded packet
    std::vector<uint8_t> trailing_bytes() const { return trailing_; }

    size_t size_bytes() const noexcept override { return Layer::size_bytes() + trailing_.size(); }

    void write_to(std::span<uint8_t> out) const override {
        Layer::write_to(out);
        std::copy(trailing_.begin(), trailing_.end(), out.begin() + Layer::size_bytes());
    }

    std::unique_ptr<LayerBuilder> to_builder() const override;

    std::string to_string() const override {
        std::string out = "[ND Option: Redirected Header] ";
        out += header_.to_string();
        out += "  [IP header + data: {\n";
        out += ip_packet_->to_string();
        out += "  }]\n";
        if (!trailing_.empty()) {
            out += "  [Trailing bytes: " + detail::to_hex_string(trailing_) + "]\n";
        }
        return out;
    }

    NdpRedirectedHeaderOption(Passkey, Header header, LayerPtr ip_packet,
                              std::vector<uint8_t> trailing)
        : header_(std::move(header)),
          ip_packet_(std::move(ip_packet)),
          trailing_(std::move(trailing)) {}

private:
    Header header_;
    LayerPtr ip_packet_;
    std::vector<uint8_t> trailing_;
};

/**
 * @brief Builder for NdpRedirectedHeaderOption
 *
 * The embedded packet is required. With length correction the length field
 * is (8 + packet size + trailing bytes) / 8, and the total must be an exact
 * multiple of 8.
 */
class NdpRedirectedHeaderOption::Builder final
    : public detail::BuilderBase<NdpRedirectedHeaderOption::Builder> {
public:
    static constexpr LayerKind layer_kind = LayerKind::ndp_redirected_header;
    static constexpr bool has_payload_slot = true;
    static constexpr bool length_correction = true;
    static constexpr bool checksum_correction = false;

    Builder() = default;

    /// Length in units of 8 bytes (used verbatim without length correction)
    Builder& length(uint8_t value) noexcept {
        length_ = value;
        return *this;
    }

    /// Reserved bytes; must be exactly 6 bytes at build time
    Builder& reserved(std::span<const uint8_t> bytes) {
        reserved_ = detail::copy_bytes(bytes);
        return *this;
    }

    /// Embedded IP packet builder
    Builder& ip_packet_builder(std::unique_ptr<LayerBuilder> builder) {
        return payload_builder(std::move(builder));
    }

    /// Embedded IP packet (snapshotted)
    Builder& ip_packet(const LayerPtr& packet) { return payload(packet); }

    /// Bytes serialized after the embedded packet (usually zero padding)
    Builder& trailing_bytes(std::span<const uint8_t> bytes) {
        trailing_ = detail::copy_bytes(bytes);
        return *this;
    }

    CodecResult<LayerPtr> build() const override {
        if (!payload_builder_) {
            return make_build_error(ErrorCode::invalid_builder_state, layer_kind,
                                    "ip_packet is required.");
        }
        if (reserved_.size() != ndp_redirected_header_reserved_size) {
            return make_build_error(ErrorCode::invalid_builder_state, layer_kind,
                                    "Invalid reserved: " + detail::to_hex_string(reserved_));
        }

        auto ip_packet = payload_builder_->build();
        if (!ip_packet) {
            return unexpected(std::move(ip_packet.error()));
        }

        Header header;
        std::copy(reserved_.begin(), reserved_.end(), header.reserved_.begin());

        if (correction_.correct_length_at_build) {
            size_t total =
                ndp_redirected_header_prefix_size + (*ip_packet)->size_bytes() + trailing_.size();
            if (total % ndp_option_unit_size != 0) {
                return make_build_error(ErrorCode::inconsistent_length, layer_kind,
                                        "ip_packet's length is invalid. ip_packet: " +
                                            detail::to_hex_string((*ip_packet)->to_bytes()));
            }
            if (total > ndp_redirected_header::max_option_size) {
                return make_build_error(ErrorCode::inconsistent_length, layer_kind,
                                        "ip_packet is too long for the length field. "
                                        "option length: " +
                                            std::to_string(total));
            }
            header.length_ = static_cast<uint8_t>(total / ndp_option_unit_size);
        } else {
            header.length_ = length_;
        }

        return std::make_shared<const NdpRedirectedHeaderOption>(Passkey{}, std::move(header),
                                                                 std::move(*ip_packet), trailing_);
    }

private:
    uint8_t length_ = 0;
    std::vector<uint8_t> reserved_ = std::vector<uint8_t>(ndp_redirected_header_reserved_size, 0);
    std::vector<uint8_t> trailing_;
};

inline std::unique_ptr<LayerBuilder> NdpRedirectedHeaderOption::to_builder() const {
    auto builder = std::make_unique<Builder>();
    builder->length(header_.length_)
        .reserved(header_.reserved_)
        .trailing_bytes(trailing_)
        .ip_packet(ip_packet_);
    return builder;
}

} // namespace pktstack
