#pragma once

#include <pktstack/types.hpp>

#include "layers/ipv6_packet.hpp"
#include "layers/ndp_redirected_header_option.hpp"
#include "layers/ssh2_binary_packet.hpp"
#include "layers/udp_packet.hpp"
#include "registry.hpp"

namespace pktstack {

/**
 * @brief Register the decoders shipped with the library
 *
 * | Contract          | Value  | Decoder                            |
 * |-------------------|--------|------------------------------------|
 * | ether_type        | 0x86DD | Ipv6Packet::decode                 |
 * | ip_number         | 17     | UdpPacket::decode                  |
 * | ndp_option_type   | 4      | NdpRedirectedHeaderOption::decode  |
 *
 * SSH message numbers have no built-in decoders; SSH payloads decode as
 * RawLayer until an application registers its own.
 *
 * Call at start-up, before decoding on multiple threads. Idempotent: entries
 * already present (including ones the application registered first) are
 * left alone.
 */
inline void register_builtin_decoders(DecoderRegistry& registry) {
    registry.try_register_decoder(Contract::ether_type, ether_type_ipv6, &Ipv6Packet::decode);
    registry.try_register_decoder(Contract::ip_number, ip_number_udp, &UdpPacket::decode);
    registry.try_register_decoder(Contract::ndp_option_type, ndp_option_type_redirected_header,
                                  &NdpRedirectedHeaderOption::decode);
}

/// register_builtin_decoders() on the global registry
inline void register_builtin_decoders() {
    register_builtin_decoders(DecoderRegistry::global());
}

} // namespace pktstack
