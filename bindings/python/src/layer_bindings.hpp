#pragma once
// Layer bindings: Layer handle, decode()

#include <nanobind/nanobind.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/string.h>

#include <pktstack.hpp>

#include "py_types.hpp"

#include <functional>
#include <optional>
#include <sstream>

namespace nb = nanobind;
using namespace nb::literals;

namespace pktstack_python {

inline void bind_layers(nb::module_& m) {
    // =========================================================================
    // Layer - immutable decoded layer; shares the chain it came from
    // =========================================================================

    nb::class_<PyLayer>(m, "Layer", "Immutable decoded protocol layer")
        .def_prop_ro("kind", [](const PyLayer& l) { return l.layer->kind(); },
                     "Classification tag")
        .def_prop_ro("size_bytes", [](const PyLayer& l) { return l.layer->size_bytes(); },
                     "Serialized size in bytes")
        .def_prop_ro("is_malformed", [](const PyLayer& l) { return l.layer->is_malformed(); },
                     "True for a layer that failed to decode")
        .def_prop_ro("contains_malformed",
                     [](const PyLayer& l) { return l.layer->contains_malformed(); },
                     "True if this layer or a nested one failed to decode")
        .def_prop_ro(
            "payload",
            [](const PyLayer& l) -> std::optional<PyLayer> {
                if (auto payload = l.layer->payload()) {
                    return PyLayer{std::move(payload)};
                }
                return std::nullopt;
            },
            "Nested payload layer, or None")
        .def(
            "to_bytes", [](const PyLayer& l) { return to_py_bytes(l.layer->to_bytes()); },
            "Serialized bytes")
        .def("__eq__",
             [](const PyLayer& a, const PyLayer& b) { return *a.layer == *b.layer; })
        .def("__hash__",
             [](const PyLayer& l) { return std::hash<pktstack::Layer>{}(*l.layer); })
        .def("__str__", [](const PyLayer& l) { return l.layer->to_string(); })
        .def("__repr__", [](const PyLayer& l) {
            std::ostringstream oss;
            oss << "Layer(kind=" << pktstack::layer_kind_string(l.layer->kind())
                << ", size=" << l.layer->size_bytes() << " bytes";
            if (l.layer->is_malformed()) {
                oss << ", malformed";
            }
            oss << ")";
            return oss.str();
        });

    // =========================================================================
    // Decode entry point
    // =========================================================================

    m.def(
        "decode",
        [](pktstack::Contract contract, uint32_t value, nb::bytes data) {
            return decode_or_raise(contract, value, as_span(data));
        },
        "Decode bytes as the layer registered for (contract, value). "
        "Raises ParseError when the outermost layer fails to decode.",
        "contract"_a, "value"_a, "data"_a);
}

} // namespace pktstack_python
