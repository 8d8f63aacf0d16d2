#pragma once

#include <cstddef>
#include <cstdint>

namespace pktstack {

// ============================================================================
// Protocol constants
// ============================================================================

inline constexpr uint16_t ether_type_ipv6 = 0x86DD;
inline constexpr uint8_t ip_number_udp = 17;
inline constexpr uint8_t ip_number_no_next_header = 59;
inline constexpr uint8_t ndp_option_type_redirected_header = 4;

inline constexpr size_t ipv6_header_size = 40;
inline constexpr size_t ipv6_address_size = 16;
inline constexpr uint8_t ipv6_version = 6;
inline constexpr size_t udp_header_size = 8;

inline constexpr size_t ndp_option_unit_size = 8; ///< ND option length is in 8-byte units
inline constexpr size_t ndp_redirected_header_prefix_size = 8;
inline constexpr size_t ndp_redirected_header_reserved_size = 6;

inline constexpr size_t ssh2_binary_header_size = 5;
inline constexpr size_t ssh2_min_cipher_block_size = 8;
inline constexpr uint32_t ssh2_max_packet_length = 0x7FFFFFFF;
inline constexpr size_t ssh2_max_padding_length = 0xFF;

/**
 * @brief Namespace a discriminator value belongs to
 *
 * The registry is keyed by (Contract, value): the same number means
 * different things in different contracts (17 is UDP as an IP number but
 * a different message as an SSH message number).
 */
enum class Contract : uint8_t {
    ether_type = 0,         ///< Ether type (0x86DD = IPv6)
    ip_number = 1,          ///< IPv6 next header / IPv4 protocol
    ndp_option_type = 2,    ///< Neighbor Discovery option type
    ssh2_message_number = 3 ///< First byte of an SSH binary packet payload
};

/**
 * @brief Classification tag carried by every layer
 */
enum class LayerKind : uint8_t {
    raw = 0,       ///< Opaque bytes (unknown protocol or terminal payload)
    malformed = 1, ///< Bytes that failed to decode
    ipv6 = 2,
    udp = 3,
    ndp_redirected_header = 4,
    ssh2_binary = 5
};

/**
 * @brief Failure categories reported by decode and build
 */
enum class ErrorCode : uint8_t {
    malformed_input = 0,      ///< Buffer too short or a mandatory sub-field empty
    type_mismatch = 1,        ///< Embedded type code disagrees with the decoder
    inconsistent_length = 2,  ///< Declared or derived length violates size/unit rules
    invalid_builder_state = 3 ///< Required builder slot missing or malformed
};

/**
 * @brief Get a human-readable string for an error code
 * @param code The error code
 * @return Static string describing the failure category
 */
constexpr const char* error_code_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::malformed_input:
            return "Malformed input";
        case ErrorCode::type_mismatch:
            return "Type mismatch";
        case ErrorCode::inconsistent_length:
            return "Inconsistent length";
        case ErrorCode::invalid_builder_state:
            return "Invalid builder state";
    }
    return "Unknown error";
}

constexpr const char* layer_kind_string(LayerKind kind) noexcept {
    switch (kind) {
        case LayerKind::raw:
            return "Raw";
        case LayerKind::malformed:
            return "Malformed";
        case LayerKind::ipv6:
            return "IPv6";
        case LayerKind::udp:
            return "UDP";
        case LayerKind::ndp_redirected_header:
            return "ND Redirected Header Option";
        case LayerKind::ssh2_binary:
            return "SSH2 Binary Packet";
    }
    return "Unknown";
}

constexpr const char* contract_string(Contract contract) noexcept {
    switch (contract) {
        case Contract::ether_type:
            return "ether_type";
        case Contract::ip_number:
            return "ip_number";
        case Contract::ndp_option_type:
            return "ndp_option_type";
        case Contract::ssh2_message_number:
            return "ssh2_message_number";
    }
    return "unknown";
}

} // namespace pktstack
