#pragma once
// Error bindings: ErrorCode, ParseError

#include <nanobind/nanobind.h>

#include <pktstack/types.hpp>

#include "py_types.hpp"

#include <stdexcept>
#include <string>

namespace nb = nanobind;

namespace pktstack_python {

inline void bind_errors(nb::module_& m) {
    nb::enum_<pktstack::ErrorCode>(m, "ErrorCode", "Failure categories reported by decode and build")
        .value("malformed_input", pktstack::ErrorCode::malformed_input,
               "Buffer too short or a mandatory sub-field empty")
        .value("type_mismatch", pktstack::ErrorCode::type_mismatch,
               "Embedded type code disagrees with the decoder")
        .value("inconsistent_length", pktstack::ErrorCode::inconsistent_length,
               "Declared or derived length violates size or unit rules")
        .value("invalid_builder_state", pktstack::ErrorCode::invalid_builder_state,
               "Required builder slot missing or malformed")
        .def("__str__", [](pktstack::ErrorCode e) {
            return std::string(pktstack::error_code_string(e));
        });

    // ParseError - raised when the outermost decode fails.
    // The message is "<layer>: <category>: <detail>".
    auto parse_error = nb::exception<std::runtime_error>(m, "ParseError", PyExc_ValueError);
    parse_error_type = parse_error.ptr();
}

} // namespace pktstack_python
