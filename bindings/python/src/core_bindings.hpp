#pragma once
// Core bindings: Contract and LayerKind enums, discriminator constants, registration

#include <nanobind/nanobind.h>
#include <nanobind/stl/string.h>

#include <pktstack/builtin.hpp>
#include <pktstack/types.hpp>

#include <string>

namespace nb = nanobind;
using namespace nb::literals;

namespace pktstack_python {

inline void bind_core(nb::module_& m) {
    // =========================================================================
    // Enums
    // =========================================================================

    nb::enum_<pktstack::Contract>(m, "Contract", "Namespace a discriminator value belongs to")
        .value("ether_type", pktstack::Contract::ether_type, "Ether type (0x86DD = IPv6)")
        .value("ip_number", pktstack::Contract::ip_number, "IPv6 next header / IP protocol")
        .value("ndp_option_type", pktstack::Contract::ndp_option_type,
               "Neighbor Discovery option type")
        .value("ssh2_message_number", pktstack::Contract::ssh2_message_number,
               "First byte of an SSH binary packet payload")
        .def("__str__", [](pktstack::Contract c) {
            return std::string(pktstack::contract_string(c));
        });

    nb::enum_<pktstack::LayerKind>(m, "LayerKind", "Classification tag carried by every layer")
        .value("raw", pktstack::LayerKind::raw, "Opaque bytes")
        .value("malformed", pktstack::LayerKind::malformed, "Bytes that failed to decode")
        .value("ipv6", pktstack::LayerKind::ipv6, "IPv6 packet")
        .value("udp", pktstack::LayerKind::udp, "UDP datagram")
        .value("ndp_redirected_header", pktstack::LayerKind::ndp_redirected_header,
               "ND Redirected Header option")
        .value("ssh2_binary", pktstack::LayerKind::ssh2_binary, "SSH binary packet")
        .def("__str__", [](pktstack::LayerKind k) {
            return std::string(pktstack::layer_kind_string(k));
        });

    // Registration
    m.def(
        "register_builtins", [] { pktstack::register_builtin_decoders(); },
        "Register the built-in decoders on the global registry (idempotent)");

    // Constants
    m.attr("ETHER_TYPE_IPV6") = pktstack::ether_type_ipv6;
    m.attr("IP_NUMBER_UDP") = pktstack::ip_number_udp;
    m.attr("IP_NUMBER_NO_NEXT_HEADER") = pktstack::ip_number_no_next_header;
    m.attr("NDP_OPTION_TYPE_REDIRECTED_HEADER") = pktstack::ndp_option_type_redirected_header;
    m.attr("SSH2_MAX_PACKET_LENGTH") = pktstack::ssh2_max_packet_length;
}

} // namespace pktstack_python
