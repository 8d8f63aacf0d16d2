#pragma once

#include <array>
#include <span>

#include <cstddef>
#include <cstdint>

#include "../types.hpp"

namespace pktstack::detail {

using Ipv6Address = std::array<uint8_t, ipv6_address_size>;

/**
 * @brief Accumulate 16-bit big-endian words into a one's-complement sum
 *
 * An odd trailing byte is padded with a zero low byte (RFC 1071).
 * The sum is not folded; pass it to fold_checksum() when done.
 */
inline uint32_t checksum_accumulate(uint32_t sum, std::span<const uint8_t> bytes) noexcept {
    size_t i = 0;
    for (; i + 1 < bytes.size(); i += 2) {
        sum += (static_cast<uint32_t>(bytes[i]) << 8) | bytes[i + 1];
    }
    if (i < bytes.size()) {
        sum += static_cast<uint32_t>(bytes[i]) << 8;
    }
    return sum;
}

/// Fold carries and take the one's complement
inline uint16_t fold_checksum(uint32_t sum) noexcept {
    while (sum >> 16) {
        sum = (sum & 0xFFFF) + (sum >> 16);
    }
    return static_cast<uint16_t>(~sum);
}

/**
 * @brief Internet checksum over an upper-layer datagram with the IPv6 pseudo-header
 *
 * Pseudo-header (RFC 8200 section 8.1): source address, destination address,
 * upper-layer packet length (32 bits), three zero bytes, next header.
 *
 * @param src Source address
 * @param dst Destination address
 * @param next_header Upper-layer protocol number
 * @param datagram Upper-layer header and payload with its checksum field zeroed
 * @return Folded checksum (0 is returned as is; callers map it per protocol)
 */
inline uint16_t ipv6_pseudo_header_checksum(const Ipv6Address& src, const Ipv6Address& dst,
                                            uint8_t next_header,
                                            std::span<const uint8_t> datagram) noexcept {
    uint32_t sum = 0;
    sum = checksum_accumulate(sum, src);
    sum = checksum_accumulate(sum, dst);
    uint32_t length = static_cast<uint32_t>(datagram.size());
    sum += length >> 16;
    sum += length & 0xFFFF;
    sum += next_header;
    sum = checksum_accumulate(sum, datagram);
    return fold_checksum(sum);
}

} // namespace pktstack::detail
