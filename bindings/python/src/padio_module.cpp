// padio Python bindings
// Main module entry point - includes component bindings

#include <nanobind/nanobind.h>

// Binding components
#include "core_bindings.hpp"
#include "error_bindings.hpp"
#include "reader_bindings.hpp"

namespace nb = nanobind;

// Define the exception type pointers (declared extern in py_types.hpp)
namespace padio_python {
PyObject* parse_error_type = nullptr;
PyObject* capture_io_error_type = nullptr;
} // namespace padio_python

NB_MODULE(padio, m) {
    m.doc() = "padio - protocol analyzer capture file reader";

    // 1. Core types (enums, header, record) - no dependencies
    padio_python::bind_core(m);

    // 2. Error types (sets parse_error_type, capture_io_error_type)
    padio_python::bind_errors(m);

    // 3. CaptureFile - needs core types and error types
    padio_python::bind_readers(m);
}
