#pragma once

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
#include "../detail/checksum.hpp"
#include "../detail/codec_result.hpp"
#include "../layer.hpp"
#include "ipv6_packet.hpp"
#include "raw_layer.hpp"

namespace pktstack {

namespace udp {
inline constexpr size_t src_port_offset = 0;
inline constexpr size_t dst_port_offset = 2;
inline constexpr size_t length_offset = 4;
inline constexpr size_t checksum_offset = 6;
} // namespace udp

/**
 * @brief UDP datagram (RFC 768)
 *
 * The payload is not dispatched by port; it is kept as a RawLayer.
 */
class UdpPacket final : public Layer {
    struct Passkey {
        explicit Passkey() = default;
    };

public:
    static constexpr LayerKind layer_kind = LayerKind::udp;

    class Builder;

    class Header final : public pktstack::Header {
    public:
        uint16_t src_port() const noexcept { return src_port_; }
        uint16_t dst_port() const noexcept { return dst_port_; }
        uint16_t length() const noexcept { return length_; }
        uint16_t checksum() const noexcept { return checksum_; }

        size_t size_bytes() const noexcept override { return udp_header_size; }

        std::vector<std::vector<uint8_t>> raw_fields() const override {
            return {detail::u16_field(src_port_), detail::u16_field(dst_port_),
                    detail::u16_field(length_), detail::u16_field(checksum_)};
        }

        std::string to_string() const override {
            std::string out = "[UDP Header (8 bytes)]\n";
            out += "  Source port: " + std::to_string(src_port_) + "\n";
            out += "  Destination port: " + std::to_string(dst_port_) + "\n";
            out += "  Length: " + std::to_string(length_) + " [bytes]\n";
            out += "  Checksum: 0x" + detail::to_hex_string(detail::u16_field(checksum_), "") +
                   "\n";
            return out;
        }

    private:
        friend class UdpPacket;
        friend class UdpPacket::Builder;

        Header() = default;

        uint16_t src_port_ = 0;
        uint16_t dst_port_ = 0;
        uint16_t length_ = 0;
        uint16_t checksum_ = 0;
    };

    /**
     * @brief Decode a UDP datagram
     *
     * - fewer than 8 bytes: MalformedInput
     * - length field below 8 or past the buffer: InconsistentLength
     */
    [[nodiscard]] static CodecResult<LayerPtr> decode(std::span<const uint8_t> bytes) {
        if (bytes.size() < udp_header_size) {
            return make_decode_error(ErrorCode::malformed_input, layer_kind,
                                     "The data is too short to build a UDP header(" +
                                         std::to_string(udp_header_size) + " bytes).",
                                     bytes);
        }

        Header header;
        header.src_port_ = detail::read_u16(bytes.data(), udp::src_port_offset);
        header.dst_port_ = detail::read_u16(bytes.data(), udp::dst_port_offset);
        header.length_ = detail::read_u16(bytes.data(), udp::length_offset);
        header.checksum_ = detail::read_u16(bytes.data(), udp::checksum_offset);

        if (header.length_ < udp_header_size || header.length_ > bytes.size()) {
            return make_decode_error(ErrorCode::inconsistent_length, layer_kind,
                                     "The length field " + std::to_string(header.length_) +
                                         " is inconsistent with the " +
                                         std::to_string(bytes.size()) + " bytes available.",
                                     bytes);
        }

        LayerPtr payload;
        auto payload_bytes = bytes.subspan(udp_header_size, header.length_ - udp_header_size);
        if (!payload_bytes.empty()) {
            auto raw = RawLayer::decode(payload_bytes);
            payload = std::move(*raw);
        }
        return std::make_shared<const UdpPacket>(Passkey{}, header, std::move(payload));
    }

    LayerKind kind() const noexcept override { return layer_kind; }

    const Header* header() const noexcept override { return &header_; }

    LayerPtr payload() const noexcept override { return payload_; }

    std::unique_ptr<LayerBuilder> to_builder() const override;

    std::string to_string() const override {
        std::string out = header_.to_string();
        if (payload_) {
            out += payload_->to_string();
        }
        return out;
    }

    UdpPacket(Passkey, Header header, LayerPtr payload)
        : header_(std::move(header)),
          payload_(std::move(payload)) {}

private:
    Header header_;
    LayerPtr payload_;
};

/**
 * @brief Builder for UdpPacket
 *
 * Length correction sets length = 8 + payload size. Checksum correction
 * computes the checksum over the IPv6 pseudo-header, so both addresses must
 * be set; a computed value of 0 is sent as 0xFFFF.
 */
class UdpPacket::Builder final : public detail::BuilderBase<UdpPacket::Builder> {
public:
    static constexpr LayerKind layer_kind = LayerKind::udp;
    static constexpr bool has_payload_slot = true;
    static constexpr bool length_correction = true;
    static constexpr bool checksum_correction = true;

    Builder() = default;

    Builder& src_port(uint16_t port) noexcept {
        src_port_ = port;
        return *this;
    }

    Builder& dst_port(uint16_t port) noexcept {
        dst_port_ = port;
        return *this;
    }

    Builder& length(uint16_t value) noexcept {
        length_ = value;
        return *this;
    }

    Builder& checksum(uint16_t value) noexcept {
        checksum_ = value;
        return *this;
    }

    /// Pseudo-header source address (checksum correction only)
    Builder& src_addr(const Ipv6Address& addr) noexcept {
        src_addr_ = addr;
        return *this;
    }

    /// Pseudo-header destination address (checksum correction only)
    Builder& dst_addr(const Ipv6Address& addr) noexcept {
        dst_addr_ = addr;
        return *this;
    }

    CodecResult<LayerPtr> build() const override {
        auto payload = build_payload();
        if (!payload) {
            return unexpected(std::move(payload.error()));
        }

        Header header;
        header.src_port_ = src_port_;
        header.dst_port_ = dst_port_;

        size_t payload_size = *payload ? (*payload)->size_bytes() : 0;
        if (correction_.correct_length_at_build) {
            size_t total = udp_header_size + payload_size;
            if (total > 0xFFFF) {
                return make_build_error(ErrorCode::inconsistent_length, layer_kind,
                                        "The payload is too long for the length field. "
                                        "length: " +
                                            std::to_string(total));
            }
            header.length_ = static_cast<uint16_t>(total);
        } else {
            header.length_ = length_;
        }

        if (correction_.correct_checksum_at_build) {
            if (!src_addr_ || !dst_addr_) {
                return make_build_error(ErrorCode::invalid_builder_state, layer_kind,
                                        "src_addr and dst_addr are required to compute the "
                                        "checksum.");
            }
            header.checksum_ = 0;
            UdpPacket unsummed(Passkey{}, header, *payload);
            auto datagram = unsummed.to_bytes();
            uint16_t sum =
                detail::ipv6_pseudo_header_checksum(*src_addr_, *dst_addr_, ip_number_udp, datagram);
            header.checksum_ = (sum == 0) ? 0xFFFF : sum;
        } else {
            header.checksum_ = checksum_;
        }

        return std::make_shared<const UdpPacket>(Passkey{}, std::move(header),
                                                 std::move(*payload));
    }

private:
    uint16_t src_port_ = 0;
    uint16_t dst_port_ = 0;
    uint16_t length_ = 0;
    uint16_t checksum_ = 0;
    std::optional<Ipv6Address> src_addr_;
    std::optional<Ipv6Address> dst_addr_;
};

inline std::unique_ptr<LayerBuilder> UdpPacket::to_builder() const {
    auto builder = std::make_unique<Builder>();
    builder->src_port(header_.src_port_)
        .dst_port(header_.dst_port_)
        .length(header_.length_)
        .checksum(header_.checksum_)
        .payload(payload_);
    return builder;
}

} // namespace pktstack
