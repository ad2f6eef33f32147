#pragma once
// Reader bindings: CaptureFile

#include <nanobind/nanobind.h>
#include <nanobind/stl/string.h>

#include <padio/utils/detail/reader_error.hpp>
#include <padio/utils/fileio/capture_file_reader.hpp>

#include "py_types.hpp"

#include <new>
#include <sstream>

namespace nb = nanobind;
using namespace nb::literals;

namespace padio_python {

inline nb::bytes fetch_payload(PyCaptureFile& f, const padio::Record& record,
                               padio::PayloadMode mode) {
    auto payload = [&]() {
        nb::gil_scoped_release release;
        return f.reader.read_payload(record, mode);
    }();
    if (!payload) {
        raise_reader_error(payload.error());
    }
    return to_bytes(*payload);
}

inline void bind_readers(nb::module_& m) {
    // =========================================================================
    // CaptureFile
    // =========================================================================

    nb::class_<PyCaptureFile>(m, "CaptureFile", "Capture file reader")
        .def(
            "__init__",
            [](PyCaptureFile* self, const std::string& filepath) {
                auto opened = [&]() {
                    nb::gil_scoped_release release;
                    return padio::utils::fileio::CaptureFileReader::open(filepath);
                }();
                if (!opened) {
                    raise_reader_error(opened.error());
                }
                new (self) PyCaptureFile(*std::move(opened));
            },
            "Open a capture file. Raises CaptureIOError or ParseError.", "filepath"_a)
        .def_prop_ro(
            "header", [](PyCaptureFile& f) -> const padio::CaptureHeader& { return f.reader.header(); },
            nb::rv_policy::reference_internal, "Decoded capture header")
        // read_next_record - returns Record or None at end of stream
        .def(
            "read_next_record",
            [](PyCaptureFile& f) -> nb::object {
                auto result = [&]() {
                    nb::gil_scoped_release release;
                    return f.reader.read_next_record();
                }();
                if (!result) {
                    if (padio::utils::is_eof(result.error())) {
                        return nb::none();
                    }
                    raise_reader_error(result.error());
                }
                return nb::cast(*result);
            },
            "Read next record. Returns Record, or None at end of stream.")
        .def(
            "read_full_payload",
            [](PyCaptureFile& f, const padio::Record& record) {
                return fetch_payload(f, record, padio::PayloadMode::full);
            },
            "Read all data_len payload bytes of a record", "record"_a)
        .def(
            "read_payload_without_metadata",
            [](PyCaptureFile& f, const padio::Record& record) {
                return fetch_payload(f, record, padio::PayloadMode::exclude_trailing_metadata);
            },
            "Read a record's payload up to its trailing metadata", "record"_a)
        .def("read_payload", &fetch_payload, "Read a record's payload in the given mode",
             "record"_a, "mode"_a = padio::PayloadMode::full)
        // Iterator protocol: yields (Record, bytes)
        .def("__iter__", [](PyCaptureFile& f) -> PyCaptureFile& { return f; },
             nb::rv_policy::reference)
        .def("__next__",
             [](PyCaptureFile& f) {
                 auto record = [&]() {
                     nb::gil_scoped_release release;
                     return f.reader.read_next_record();
                 }();
                 if (!record) {
                     raise_reader_error(record.error()); // EndOfStream -> StopIteration
                 }
                 nb::bytes payload = fetch_payload(f, *record, padio::PayloadMode::full);
                 return nb::make_tuple(*record, payload);
             })
        // Properties
        .def_prop_ro("records_read", [](PyCaptureFile& f) { return f.reader.records_read(); },
                     "Number of records read so far")
        .def("__repr__", [](PyCaptureFile& f) {
            const auto& h = f.reader.header();
            std::ostringstream oss;
            oss << "CaptureFile(module_type='" << h.module_type
                << "', records_read=" << f.reader.records_read() << ")";
            return oss.str();
        });
}

} // namespace padio_python
