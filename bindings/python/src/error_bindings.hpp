#pragma once
// Error bindings: IOErrorKind, CaptureIOError, ParseError

#include <nanobind/nanobind.h>

#include <padio/utils/detail/reader_error.hpp>

#include "py_types.hpp"

#include <stdexcept>

namespace nb = nanobind;
using namespace nb::literals;

namespace padio_python {

inline void bind_errors(nb::module_& m) {
    // =========================================================================
    // IOErrorKind enum (from reader errors)
    // =========================================================================

    nb::enum_<padio::utils::IOError::Kind>(m, "IOErrorKind", "I/O error types for capture reading")
        .value("open_failed", padio::utils::IOError::Kind::open_failed,
               "File could not be opened")
        .value("read_error", padio::utils::IOError::Kind::read_error, "File read failed")
        .value("seek_error", padio::utils::IOError::Kind::seek_error, "File seek failed")
        .value("truncated_header", padio::utils::IOError::Kind::truncated_header,
               "File ended inside the header")
        .value("truncated_record", padio::utils::IOError::Kind::truncated_record,
               "File ended inside a record block")
        .value("truncated_payload", padio::utils::IOError::Kind::truncated_payload,
               "File ended inside a payload");

    // =========================================================================
    // Custom Exceptions
    // =========================================================================

    // ParseError - capture bytes do not decode
    auto parse_error = nb::exception<std::runtime_error>(m, "ParseError", PyExc_ValueError);
    parse_error_type = parse_error.ptr();

    // CaptureIOError - inherits from OSError to match Python conventions for I/O errors
    auto io_error = nb::exception<std::runtime_error>(m, "CaptureIOError", PyExc_OSError);
    capture_io_error_type = io_error.ptr();
}

} // namespace padio_python
