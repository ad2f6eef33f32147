#pragma once

/**
 * @file padio_io.hpp
 * @brief Convenience header for capture file I/O
 *
 * Primary types:
 * - CaptureFileReader: Opens a capture file and yields its header, records and payloads (RECOMMENDED)
 * - RecordStream / PayloadReader: The two halves CaptureFileReader is built from
 * - HeaderParser: Reads a header of unknown length from any ByteSource
 * - PcapngCaptureWriter: Converts decoded records to a pcapng capture
 */

#include "padio.hpp"
#include "utils/detail/reader_error.hpp"
#include "utils/fileio/byte_source.hpp"
#include "utils/fileio/capture_file_reader.hpp"
#include "utils/fileio/header_parser.hpp"
#include "utils/fileio/payload_reader.hpp"
#include "utils/fileio/record_stream.hpp"
#include "utils/pcapio/pcapng_capture_writer.hpp"

namespace padio {

// Primary capture file reader (RECOMMENDED)
using CaptureFileReader = utils::fileio::CaptureFileReader;

using HeaderParser = utils::fileio::HeaderParser;

template <utils::fileio::ByteSource Source>
using RecordStream = utils::fileio::RecordStream<Source>;

template <utils::fileio::ByteSource Source>
using PayloadReader = utils::fileio::PayloadReader<Source>;

using PcapngCaptureWriter = utils::pcapio::PcapngCaptureWriter;

using utils::EndOfStream;
using utils::IOError;
using utils::ReaderError;

} // namespace padio
