#pragma once
// Python wrapper types and error translation for padio bindings

#include <nanobind/nanobind.h>
#include <nanobind/stl/string.h>

#include <padio/utils/detail/reader_error.hpp>
#include <padio/utils/fileio/capture_file_reader.hpp>

#include <cerrno>
#include <span>
#include <string>
#include <utility>
#include <variant>

namespace nb = nanobind;

namespace padio_python {

// Exception type pointers (set during module init)
extern PyObject* parse_error_type;
extern PyObject* capture_io_error_type;

/**
 * @brief Python wrapper for CaptureFileReader
 */
struct PyCaptureFile {
    padio::utils::fileio::CaptureFileReader reader;

    explicit PyCaptureFile(padio::utils::fileio::CaptureFileReader&& r) : reader(std::move(r)) {}

    PyCaptureFile(const PyCaptureFile&) = delete;
    PyCaptureFile& operator=(const PyCaptureFile&) = delete;
    PyCaptureFile(PyCaptureFile&&) = default;
    PyCaptureFile& operator=(PyCaptureFile&&) = default;
};

inline nb::bytes to_bytes(std::span<const uint8_t> data) {
    return nb::bytes(reinterpret_cast<const char*>(data.data()), data.size());
}

/**
 * @brief Raise the Python exception matching a reader error
 *
 * IOError -> CaptureIOError (OSError subclass, errno attached when known)
 * ParseError -> ParseError (ValueError subclass)
 * EndOfStream -> StopIteration
 */
[[noreturn]] inline void raise_reader_error(const padio::utils::ReaderError& err) {
    if (padio::utils::is_eof(err)) {
        throw nb::stop_iteration();
    }

    if (const auto* io_err = std::get_if<padio::utils::IOError>(&err)) {
        std::string msg = io_err->message();
        msg += " at offset " + std::to_string(io_err->offset);
        if (io_err->errno_value != 0) {
            PyErr_SetObject(capture_io_error_type,
                            nb::make_tuple(io_err->errno_value, msg).ptr());
        } else {
            PyErr_SetString(capture_io_error_type, msg.c_str());
        }
        throw nb::python_error();
    }

    const auto& parse_err = std::get<padio::ParseError>(err);
    std::string msg = parse_err.message();
    if (parse_err.code == padio::ValidationError::record_number_mismatch) {
        msg += ": expected " + std::to_string(parse_err.expected_number) + ", got " +
               std::to_string(parse_err.actual_number);
    }
    PyErr_SetString(parse_error_type, msg.c_str());
    throw nb::python_error();
}

} // namespace padio_python
