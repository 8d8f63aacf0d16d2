#pragma once
// Python wrapper types for pktstack bindings

#include <nanobind/nanobind.h>

#include <pktstack.hpp>

#include <span>
#include <string>
#include <utility>
#include <vector>

namespace nb = nanobind;

namespace pktstack_python {

// Exception type pointer (set during module init)
extern PyObject* parse_error_type;

/**
 * @brief Read-only layer handle for Python
 *
 * Layers are immutable, so the handle shares the decoded chain; payload()
 * hands out handles to the same nested layers.
 */
struct PyLayer {
    pktstack::LayerPtr layer;
};

/// Raise ParseError with the error's full description
[[noreturn]] inline void raise_parse_error(const pktstack::CodecError& error) {
    PyErr_SetString(parse_error_type, error.describe().c_str());
    throw nb::python_error();
}

inline std::span<const uint8_t> as_span(const nb::bytes& data) {
    return {reinterpret_cast<const uint8_t*>(data.c_str()), data.size()};
}

inline nb::bytes to_py_bytes(const std::vector<uint8_t>& data) {
    return nb::bytes(reinterpret_cast<const char*>(data.data()), data.size());
}

inline PyLayer decode_or_raise(pktstack::Contract contract, uint32_t value,
                               std::span<const uint8_t> data) {
    auto result = pktstack::decode(contract, value, data);
    if (!result.has_value()) {
        raise_parse_error(result.error());
    }
    return PyLayer{std::move(*result)};
}

} // namespace pktstack_python
