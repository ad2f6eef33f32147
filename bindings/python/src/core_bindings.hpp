#pragma once
// Core bindings: enums, CaptureHeader, Record, decode functions, constants

#include <nanobind/nanobind.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/pair.h>
#include <nanobind/stl/string.h>

#include <padio/header.hpp>
#include <padio/record.hpp>
#include <padio/trigger.hpp>
#include <padio/types.hpp>

#include "py_types.hpp"

#include <sstream>

namespace nb = nanobind;
using namespace nb::literals;

namespace padio_python {

inline void bind_core(nb::module_& m) {
    // =========================================================================
    // Enums
    // =========================================================================

    nb::enum_<padio::ValidationError>(m, "ValidationError",
                                      "Reasons a capture file failed to decode")
        .value("none", padio::ValidationError::none, "No error")
        .value("buffer_too_small", padio::ValidationError::buffer_too_small,
               "More bytes are needed to finish decoding")
        .value("malformed_header", padio::ValidationError::malformed_header,
               "Header grammar cannot be satisfied")
        .value("unsupported_record_length", padio::ValidationError::unsupported_record_length,
               "record_len is not 40")
        .value("unsupported_timestamp_array_size",
               padio::ValidationError::unsupported_timestamp_array_size,
               "timestamp_array_size is not 8")
        .value("record_number_mismatch", padio::ValidationError::record_number_mismatch,
               "Record number out of sequence")
        .value("payload_offset_out_of_range", padio::ValidationError::payload_offset_out_of_range,
               "Payload lies outside the addressable file range")
        .def("__str__", [](padio::ValidationError e) {
            return std::string(padio::validation_error_string(e));
        });

    nb::enum_<padio::PayloadMode>(m, "PayloadMode", "Which part of a payload to read")
        .value("full", padio::PayloadMode::full, "All data_len bytes")
        .value("exclude_trailing_metadata", padio::PayloadMode::exclude_trailing_metadata,
               "Stop at metadata_offset when it is non-zero");

    // Constants
    m.attr("RECORD_SIZE") = padio::record_size;
    m.attr("NANOSECONDS_PER_SECOND") = padio::nanoseconds_per_second;

    // =========================================================================
    // Header
    // =========================================================================

    nb::class_<padio::TimestampsNs>(m, "TimestampsNs", "Header timestamps in nanoseconds")
        .def_ro("first", &padio::TimestampsNs::first)
        .def_ro("last", &padio::TimestampsNs::last)
        .def_ro("stop", &padio::TimestampsNs::stop)
        .def_ro("trigger", &padio::TimestampsNs::trigger)
        .def("__eq__", [](const padio::TimestampsNs& a, const padio::TimestampsNs& b) {
            return a == b;
        });

    nb::class_<padio::ChannelNames>(m, "ChannelNames")
        .def_ro("a", &padio::ChannelNames::a)
        .def_ro("b", &padio::ChannelNames::b);

    nb::class_<padio::CoarseTimestamp>(m, "CoarseTimestamp",
                                       "Wall-clock marker (hour, minute, millisecond)")
        .def_ro("hour", &padio::CoarseTimestamp::hour)
        .def_ro("minute", &padio::CoarseTimestamp::minute)
        .def_ro("millisec", &padio::CoarseTimestamp::millisec)
        .def_prop_ro("is_null", &padio::CoarseTimestamp::is_null,
                     "True when the marker was not recorded")
        .def("__repr__", [](const padio::CoarseTimestamp& t) {
            std::ostringstream oss;
            oss << "CoarseTimestamp(hour=" << t.hour << ", minute=" << t.minute
                << ", millisec=" << t.millisec << ")";
            return oss.str();
        });

    nb::class_<padio::CaptureHeader>(m, "CaptureHeader", "Capture file metadata header")
        .def_ro("module_type", &padio::CaptureHeader::module_type)
        .def_ro("port_id", &padio::CaptureHeader::port_id)
        .def_ro("rx_or_tx", &padio::CaptureHeader::rx_or_tx)
        .def_ro("description", &padio::CaptureHeader::description)
        .def_ro("format_code", &padio::CaptureHeader::format_code)
        .def_ro("numbers0", &padio::CaptureHeader::numbers0)
        .def_ro("trigger_record_number", &padio::CaptureHeader::trigger_record_number)
        .def_ro("three", &padio::CaptureHeader::three)
        .def_ro("first_record_number", &padio::CaptureHeader::first_record_number)
        .def_ro("last_record_number", &padio::CaptureHeader::last_record_number)
        .def_ro("record_len", &padio::CaptureHeader::record_len)
        .def_ro("timestamp_array_size", &padio::CaptureHeader::timestamp_array_size)
        .def_ro("timestamps_ns", &padio::CaptureHeader::timestamps_ns)
        .def_ro("guid", &padio::CaptureHeader::guid)
        .def_ro("channel_names", &padio::CaptureHeader::channel_names)
        .def_ro("start_time", &padio::CaptureHeader::start_time)
        .def_ro("stop_time", &padio::CaptureHeader::stop_time)
        .def_ro("records_offset", &padio::CaptureHeader::records_offset)
        .def_ro("record_data_offset", &padio::CaptureHeader::record_data_offset)
        .def_ro("start", &padio::CaptureHeader::start)
        .def_ro("encoded_size", &padio::CaptureHeader::encoded_size,
                "Number of bytes the header occupies on disk")
        .def_prop_ro(
            "is_supported_module_type",
            [](const padio::CaptureHeader& h) {
                return padio::is_supported_module_type(h.module_type);
            },
            "True for PCIe analyzer captures")
        .def("__repr__", [](const padio::CaptureHeader& h) {
            std::ostringstream oss;
            oss << "CaptureHeader(module_type='" << h.module_type << "', port_id='" << h.port_id
                << "', records=" << h.first_record_number << ".." << h.last_record_number
                << ")";
            return oss.str();
        });

    // =========================================================================
    // Record
    // =========================================================================

    nb::class_<padio::Record>(m, "Record", "One captured event")
        .def_ro("number", &padio::Record::number)
        .def_ro("data_len", &padio::Record::data_len)
        .def_ro("count", &padio::Record::count)
        .def_ro("timestamp_ns", &padio::Record::timestamp_ns)
        .def_ro("lfsr", &padio::Record::lfsr)
        .def_ro("extra_metadata_present", &padio::Record::extra_metadata_present)
        .def_ro("metadata_offset", &padio::Record::metadata_offset)
        .def_ro("flags", &padio::Record::flags)
        .def_ro("data_offset", &padio::Record::data_offset)
        .def_prop_ro("is_upstream", &padio::Record::is_upstream,
                     "True for upstream traffic (flag bit 28)")
        .def_prop_ro("metadata_info", &padio::Record::metadata_info,
                     "The on-disk 16-bit metadata word")
        .def("__eq__",
             [](const padio::Record& a, const padio::Record& b) { return a == b; })
        .def("__repr__", [](const padio::Record& r) {
            std::ostringstream oss;
            oss << "Record(number=" << r.number << ", data_len=" << r.data_len
                << ", timestamp_ns=" << r.timestamp_ns << ", flags=0x" << std::hex << r.flags
                << std::dec << ", data_offset=" << r.data_offset << ")";
            return oss.str();
        });

    // =========================================================================
    // Buffer decoders
    // =========================================================================

    m.def(
        "decode_record",
        [](nb::bytes data) {
            std::span<const uint8_t> block(reinterpret_cast<const uint8_t*>(data.c_str()),
                                           data.size());
            auto record = padio::decode_record(block);
            if (!record) {
                raise_reader_error(record.error());
            }
            return *record;
        },
        "Decode one 40-byte record block", "data"_a);

    m.def(
        "decode_header",
        [](nb::bytes data) {
            std::span<const uint8_t> bytes(reinterpret_cast<const uint8_t*>(data.c_str()),
                                           data.size());
            auto header = padio::decode_header(bytes);
            if (!header) {
                raise_reader_error(header.error());
            }
            return *std::move(header);
        },
        "Decode a capture header from the front of a buffer", "data"_a);

    m.def("trigger_comment", &padio::trigger_comment,
          "Trigger annotation for the record, or None if it is not the trigger record",
          "header"_a, "record"_a);
}

} // namespace padio_python
