#pragma once

/**
 * @file pktstack.hpp
 * @brief Layered binary-protocol codec
 *
 * Decodes raw byte buffers into stacks of immutable layers and serializes
 * them back byte for byte.
 *
 * Types provided:
 * - Layer / Header - immutable decoded layer contract
 * - LayerBuilder / CorrectionPolicy - mutable staging contract
 * - DecoderRegistry - (Contract, discriminator) -> decoder dispatch
 * - MalformedLayer / RawLayer - containment sentinel and opaque payload
 * - Ipv6Packet, UdpPacket, NdpRedirectedHeaderOption, Ssh2BinaryPacket
 *
 * Usage:
 *   pktstack::register_builtin_decoders();
 *   auto result = pktstack::decode(pktstack::Contract::ndp_option_type, 4, bytes);
 *   if (result) {
 *       std::cout << (*result)->to_string();
 *   } else {
 *       std::cerr << result.error().describe() << "\n";
 *   }
 */

#include "pktstack/builder.hpp"
#include "pktstack/builtin.hpp"
#include "pktstack/containment.hpp"
#include "pktstack/detail/buffer_io.hpp"
#include "pktstack/detail/checksum.hpp"
#include "pktstack/detail/codec_result.hpp"
#include "pktstack/expected.hpp"
#include "pktstack/layer.hpp"
#include "pktstack/layers/ipv6_packet.hpp"
#include "pktstack/layers/malformed_layer.hpp"
#include "pktstack/layers/ndp_redirected_header_option.hpp"
#include "pktstack/layers/raw_layer.hpp"
#include "pktstack/layers/ssh2_binary_packet.hpp"
#include "pktstack/layers/udp_packet.hpp"
#include "pktstack/registry.hpp"
#include "pktstack/types.hpp"
