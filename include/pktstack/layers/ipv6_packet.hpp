#pragma once

#include <algorithm>
#include <memory>
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
#include "../registry.hpp"

namespace pktstack {

using Ipv6Address = detail::Ipv6Address;

// IPv6 fixed header (RFC 8200 section 3)
//
//   0                   1                   2                   3
//   0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
//  +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//  |Version| Traffic Class |           Flow Label                  |
//  +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//  |         Payload Length        |  Next Header  |   Hop Limit   |
//  +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//  |                     Source Address (128 bits)                 |
//  +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//  |                  Destination Address (128 bits)               |
//  +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
namespace ipv6 {
inline constexpr size_t version_flow_offset = 0;
inline constexpr size_t payload_length_offset = 4;
inline constexpr size_t next_header_offset = 6;
inline constexpr size_t hop_limit_offset = 7;
inline constexpr size_t src_addr_offset = 8;
inline constexpr size_t dst_addr_offset = 24;

inline constexpr uint32_t flow_label_mask = 0x000FFFFF;
inline constexpr uint32_t traffic_class_shift = 20;
inline constexpr uint32_t version_shift = 28;
} // namespace ipv6

/**
 * @brief IPv6 packet: 40-byte fixed header plus a payload dispatched by next header
 *
 * Extension headers are not interpreted; they decode as whatever the
 * registry maps their next-header number to (RawLayer by default).
 *
 * When the payload layer ends before the declared payload length (a UDP
 * length shorter than the IPv6 payload, for instance), the leftover bytes
 * are kept as trailing bytes and serialized after the payload.
 */
class Ipv6Packet final : public Layer {
    struct Passkey {
        explicit Passkey() = default;
    };

public:
    static constexpr LayerKind layer_kind = LayerKind::ipv6;

    class Builder;

    class Header final : public pktstack::Header {
    public:
        uint8_t version() const noexcept { return version_; }
        uint8_t traffic_class() const noexcept { return traffic_class_; }
        uint32_t flow_label() const noexcept { return flow_label_; }
        uint16_t payload_length() const noexcept { return payload_length_; }
        uint8_t next_header() const noexcept { return next_header_; }
        uint8_t hop_limit() const noexcept { return hop_limit_; }
        Ipv6Address src_addr() const noexcept { return src_addr_; }
        Ipv6Address dst_addr() const noexcept { return dst_addr_; }

        size_t size_bytes() const noexcept override { return ipv6_header_size; }

        std::vector<std::vector<uint8_t>> raw_fields() const override {
            uint32_t first_word = (static_cast<uint32_t>(version_) << ipv6::version_shift) |
                                  (static_cast<uint32_t>(traffic_class_)
                                   << ipv6::traffic_class_shift) |
                                  (flow_label_ & ipv6::flow_label_mask);
            return {detail::u32_field(first_word),
                    detail::u16_field(payload_length_),
                    detail::u8_field(next_header_),
                    detail::u8_field(hop_limit_),
                    std::vector<uint8_t>(src_addr_.begin(), src_addr_.end()),
                    std::vector<uint8_t>(dst_addr_.begin(), dst_addr_.end())};
        }

        std::string to_string() const override {
            std::string out = "[IPv6 Header (40 bytes)]\n";
            out += "  Version: " + std::to_string(version_) + "\n";
            out += "  Traffic Class: " + std::to_string(traffic_class_) + "\n";
            out += "  Flow Label: " + std::to_string(flow_label_) + "\n";
            out += "  Payload length: " + std::to_string(payload_length_) + " [bytes]\n";
            out += "  Next Header: " + std::to_string(next_header_) + "\n";
            out += "  Hop Limit: " + std::to_string(hop_limit_) + "\n";
            out += "  Source address: " + detail::to_hex_string(src_addr_, ":") + "\n";
            out += "  Destination address: " + detail::to_hex_string(dst_addr_, ":") + "\n";
            return out;
        }

    private:
        friend class Ipv6Packet;
        friend class Ipv6Packet::Builder;

        Header() = default;

        uint8_t version_ = ipv6_version;
        uint8_t traffic_class_ = 0;
        uint32_t flow_label_ = 0;
        uint16_t payload_length_ = 0;
        uint8_t next_header_ = ip_number_no_next_header;
        uint8_t hop_limit_ = 0;
        Ipv6Address src_addr_{};
        Ipv6Address dst_addr_{};
    };

    /**
     * @brief Decode an IPv6 packet
     *
     * - fewer than 40 bytes: MalformedInput
     * - version nibble not 6: TypeMismatch
     * - payload length past the end of the buffer: InconsistentLength
     *
     * The payload is decoded through the registry by next header; a payload
     * that fails to decode becomes a MalformedLayer. Bytes past the declared
     * payload length are not part of the packet; bytes inside it that the
     * payload layer does not consume become trailing_bytes().
     */
    [[nodiscard]] static CodecResult<LayerPtr> decode(std::span<const uint8_t> bytes) {
        if (bytes.size() < ipv6_header_size) {
            return make_decode_error(ErrorCode::malformed_input, layer_kind,
                                     "The data is too short to build an IPv6 header(" +
                                         std::to_string(ipv6_header_size) + " bytes).",
                                     bytes);
        }

        Header header;
        uint32_t first_word = detail::read_u32(bytes.data(), ipv6::version_flow_offset);
        header.version_ = static_cast<uint8_t>(first_word >> ipv6::version_shift);
        header.traffic_class_ = static_cast<uint8_t>(first_word >> ipv6::traffic_class_shift);
        header.flow_label_ = first_word & ipv6::flow_label_mask;
        header.payload_length_ = detail::read_u16(bytes.data(), ipv6::payload_length_offset);
        header.next_header_ = detail::read_u8(bytes.data(), ipv6::next_header_offset);
        header.hop_limit_ = detail::read_u8(bytes.data(), ipv6::hop_limit_offset);
        std::copy_n(bytes.begin() + ipv6::src_addr_offset, ipv6_address_size,
                    header.src_addr_.begin());
        std::copy_n(bytes.begin() + ipv6::dst_addr_offset, ipv6_address_size,
                    header.dst_addr_.begin());

        if (header.version_ != ipv6_version) {
            return make_decode_error(ErrorCode::type_mismatch, layer_kind,
                                     "The version must be 6 but is " +
                                         std::to_string(header.version_) + ".",
                                     bytes);
        }

        auto rest = bytes.subspan(ipv6_header_size);
        auto payload_bytes = detail::slice(rest, 0, header.payload_length_);
        if (!payload_bytes) {
            return make_decode_error(ErrorCode::inconsistent_length, layer_kind,
                                     "The payload length " +
                                         std::to_string(header.payload_length_) +
                                         " exceeds the remaining " +
                                         std::to_string(rest.size()) + " bytes.",
                                     bytes);
        }

        LayerPtr payload;
        std::vector<uint8_t> trailing;
        if (!payload_bytes->empty()) {
            payload = decode_nested(Contract::ip_number, header.next_header_, *payload_bytes);
            trailing =
                detail::copy_bytes(detail::slice_from(*payload_bytes, payload->size_bytes()));
        }
        return std::make_shared<const Ipv6Packet>(Passkey{}, header, std::move(payload),
                                                  std::move(trailing));
    }

    LayerKind kind() const noexcept override { return layer_kind; }

    const Header* header() const noexcept override { return &header_; }

    LayerPtr payload() const noexcept override { return payload_; }

    size_t size_bytes() const noexcept override { return Layer::size_bytes() + trailing_.size(); }

    void write_to(std::span<uint8_t> out) const override {
        Layer::write_to(out);
        std::copy(trailing_.begin(), trailing_.end(), out.begin() + Layer::size_bytes());
    }

    /// Copy of the bytes inside the payload length that follow the payload layer
    std::vector<uint8_t> trailing_bytes() const { return trailing_; }

    std::unique_ptr<LayerBuilder> to_builder() const override;

    std::string to_string() const override {
        std::string out = header_.to_string();
        if (payload_) {
            out += payload_->to_string();
        }
        if (!trailing_.empty()) {
            out += "  trailing bytes: " + detail::to_hex_string(trailing_) + "\n";
        }
        return out;
    }

    Ipv6Packet(Passkey, Header header, LayerPtr payload, std::vector<uint8_t> trailing)
        : header_(std::move(header)),
          payload_(std::move(payload)),
          trailing_(std::move(trailing)) {}

private:
    Header header_;
    LayerPtr payload_;
    std::vector<uint8_t> trailing_;
};

/**
 * @brief Builder for Ipv6Packet
 *
 * Length correction sets the payload length field from the built payload
 * plus any trailing bytes.
 */
class Ipv6Packet::Builder final : public detail::BuilderBase<Ipv6Packet::Builder> {
public:
    static constexpr LayerKind layer_kind = LayerKind::ipv6;
    static constexpr bool has_payload_slot = true;
    static constexpr bool length_correction = true;
    static constexpr bool checksum_correction = false;

    Builder() = default;

    Builder& traffic_class(uint8_t value) noexcept {
        traffic_class_ = value;
        return *this;
    }

    /// Flow label (20 bits; upper bits are dropped on the wire)
    Builder& flow_label(uint32_t value) noexcept {
        flow_label_ = value;
        return *this;
    }

    Builder& payload_length(uint16_t value) noexcept {
        payload_length_ = value;
        return *this;
    }

    Builder& next_header(uint8_t value) noexcept {
        next_header_ = value;
        return *this;
    }

    Builder& hop_limit(uint8_t value) noexcept {
        hop_limit_ = value;
        return *this;
    }

    Builder& src_addr(const Ipv6Address& addr) noexcept {
        src_addr_ = addr;
        return *this;
    }

    Builder& dst_addr(const Ipv6Address& addr) noexcept {
        dst_addr_ = addr;
        return *this;
    }

    /// Bytes serialized after the payload, inside the payload length
    Builder& trailing_bytes(std::span<const uint8_t> bytes) {
        trailing_ = detail::copy_bytes(bytes);
        return *this;
    }

    CodecResult<LayerPtr> build() const override {
        auto payload = build_payload();
        if (!payload) {
            return unexpected(std::move(payload.error()));
        }

        Header header;
        header.traffic_class_ = traffic_class_;
        header.flow_label_ = flow_label_ & ipv6::flow_label_mask;
        header.next_header_ = next_header_;
        header.hop_limit_ = hop_limit_;
        header.src_addr_ = src_addr_;
        header.dst_addr_ = dst_addr_;

        if (correction_.correct_length_at_build) {
            size_t length = (*payload ? (*payload)->size_bytes() : 0) + trailing_.size();
            if (length > 0xFFFF) {
                return make_build_error(ErrorCode::inconsistent_length, layer_kind,
                                        "The payload is too long for the payload length "
                                        "field. payload length: " +
                                            std::to_string(length));
            }
            header.payload_length_ = static_cast<uint16_t>(length);
        } else {
            header.payload_length_ = payload_length_;
        }

        return std::make_shared<const Ipv6Packet>(Passkey{}, std::move(header),
                                                  std::move(*payload), trailing_);
    }

private:
    uint8_t traffic_class_ = 0;
    uint32_t flow_label_ = 0;
    uint16_t payload_length_ = 0;
    uint8_t next_header_ = ip_number_no_next_header;
    uint8_t hop_limit_ = 0;
    Ipv6Address src_addr_{};
    Ipv6Address dst_addr_{};
    std::vector<uint8_t> trailing_;
};

inline std::unique_ptr<LayerBuilder> Ipv6Packet::to_builder() const {
    auto builder = std::make_unique<Builder>();
    builder->traffic_class(header_.traffic_class_)
        .flow_label(header_.flow_label_)
        .payload_length(header_.payload_length_)
        .next_header(header_.next_header_)
        .hop_limit(header_.hop_limit_)
        .src_addr(header_.src_addr_)
        .dst_addr(header_.dst_addr_)
        .trailing_bytes(trailing_)
        .payload(payload_);
    return builder;
}

} // namespace pktstack
