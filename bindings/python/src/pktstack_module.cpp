// pktstack Python Bindings
// Main module entry point - includes component bindings

#include <nanobind/nanobind.h>

// Binding components
#include "core_bindings.hpp"
#include "error_bindings.hpp"
#include "layer_bindings.hpp"

namespace nb = nanobind;

// Define the exception type pointer (declared extern in py_types.hpp)
namespace pktstack_python {
PyObject* parse_error_type = nullptr;
} // namespace pktstack_python

NB_MODULE(pktstack, m) {
    m.doc() = "pktstack - layered binary-protocol codec";

    // 1. Core enums, constants, registration
    pktstack_python::bind_core(m);

    // 2. Error types (sets parse_error_type)
    pktstack_python::bind_errors(m);

    // 3. Layer and decode() - needs parse_error_type
    pktstack_python::bind_layers(m);
}
