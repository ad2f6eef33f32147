#pragma once

#include <span>
#include <string>
#include <utility>
#include <vector>

#include <cstddef>
#include <cstdint>

#include "../../expected.hpp"
#include "../../header.hpp"
#include "../../record.hpp"
#include "../../types.hpp"
#include "../detail/iteration_helpers.hpp"
#include "../detail/reader_error.hpp"
#include "detail/file_cursor.hpp"
#include "header_parser.hpp"
#include "payload_reader.hpp"
#include "record_stream.hpp"

namespace padio::utils::fileio {

/**
 * @brief Capture file reader
 *
 * **This is the recommended entry point for reading capture files.**
 *
 * Opens the file twice: one cursor walks the record array, the other the
 * payload region. Both only move forward while records are read in order,
 * so the two regions are streamed without seeking back and forth on a
 * single file position.
 *
 * Provides:
 * - The decoded header (validated for record_len and timestamp_array_size)
 * - Sequential record access via read_next_record()
 * - Payload access via read_full_payload() / read_payload_without_metadata()
 * - for_each_record() pairing each record with its payload
 *
 * @warning This class is MOVE-ONLY due to FILE* ownership.
 *
 * Example usage:
 * @code
 * auto reader = padio::utils::fileio::CaptureFileReader::open("trace.pad");
 * if (!reader) {
 *     std::cerr << padio::utils::error_message(reader.error()) << "\n";
 *     return 1;
 * }
 *
 * auto count = reader->for_each_record([](const padio::Record& rec, auto payload) {
 *     std::cout << rec.number << ": " << payload.size() << " bytes\n";
 *     return true; // continue
 * });
 * @endcode
 */
class CaptureFileReader {
public:
    using Cursor = detail::FileCursor;
    using Records = RecordStream<Cursor>;
    using Payloads = PayloadReader<Cursor>;
    using OpenResult = expected<CaptureFileReader, ReaderError>;

    /**
     * @brief Open and validate a capture file
     *
     * @param filepath Path to the capture file
     * @return Reader positioned at the first record, or:
     *         - IOError{open_failed} if the file cannot be opened
     *         - IOError{truncated_header} if the file ends inside the header
     *         - ParseError{malformed_header} if the header cannot be decoded
     *         - ParseError{unsupported_record_length} / {unsupported_timestamp_array_size}
     */
    static OpenResult open(const char* filepath) {
        auto record_cursor = Cursor::open(filepath);
        if (!record_cursor) {
            return unexpected(ReaderError{record_cursor.error()});
        }
        auto payload_cursor = Cursor::open(filepath);
        if (!payload_cursor) {
            return unexpected(ReaderError{payload_cursor.error()});
        }

        HeaderParser parser;
        auto header = parser.parse(*record_cursor);
        if (!header) {
            return unexpected(header.error());
        }

        if (auto invalid = validate_header(*header); invalid != ValidationError::none) {
            return unexpected(ReaderError{ParseError{.code = invalid}});
        }

        if (auto seek = record_cursor->seek(header->records_offset); !seek) {
            return unexpected(ReaderError{seek.error()});
        }
        if (auto seek = payload_cursor->seek(header->record_data_offset); !seek) {
            return unexpected(ReaderError{seek.error()});
        }

        const uint32_t first = header->first_record_number;
        const uint32_t last = header->last_record_number;
        const uint64_t region = header->record_data_offset;
        return CaptureFileReader(*std::move(header), Records(*std::move(record_cursor), first, last),
                                 Payloads(*std::move(payload_cursor), region));
    }

    static OpenResult open(const std::string& filepath) { return open(filepath.c_str()); }

    // Non-copyable (owns FILE* cursors)
    CaptureFileReader(const CaptureFileReader&) = delete;
    CaptureFileReader& operator=(const CaptureFileReader&) = delete;

    CaptureFileReader(CaptureFileReader&&) noexcept = default;
    CaptureFileReader& operator=(CaptureFileReader&&) noexcept = default;

    [[nodiscard]] const CaptureHeader& header() const noexcept { return header_; }

    Records& records() noexcept { return records_; }
    const Records& records() const noexcept { return records_; }

    Payloads& payloads() noexcept { return payloads_; }
    const Payloads& payloads() const noexcept { return payloads_; }

    /**
     * @brief Read the next record in file order
     *
     * @return expected<Record, ReaderError>:
     *         - Value: next record
     *         - unexpected(EndOfStream{}): no more records
     *         - unexpected(IOError{...}) / unexpected(ParseError{...}): fatal
     */
    Records::ReadResult read_next_record() noexcept { return records_.read_next_record(); }

    Payloads::ReadResult read_full_payload(const Record& record) {
        return payloads_.read_full_payload(record);
    }

    Payloads::ReadResult read_payload_without_metadata(const Record& record) {
        return payloads_.read_payload_without_metadata(record);
    }

    Payloads::ReadResult read_payload(const Record& record, PayloadMode mode) {
        return payloads_.fetch(record, mode);
    }

    /**
     * @brief Iterate over the remaining records with their full payloads
     *
     * @tparam Callback Function type with signature:
     *         bool(const Record&, std::span<const uint8_t>)
     * @param callback Return false to stop iteration
     * @return Number of records processed, or the first fatal error
     */
    template <typename Callback>
    expected<std::size_t, ReaderError> for_each_record(Callback&& callback) {
        return utils::detail::for_each_record(*this, std::forward<Callback>(callback));
    }

    /// Number of records read so far
    [[nodiscard]] std::size_t records_read() const noexcept { return records_.records_read(); }

private:
    CaptureFileReader(CaptureHeader header, Records records, Payloads payloads) noexcept
        : header_(std::move(header)),
          records_(std::move(records)),
          payloads_(std::move(payloads)) {}

    CaptureHeader header_;
    Records records_;
    Payloads payloads_;
};

static_assert(utils::detail::RecordReader<CaptureFileReader>);

} // namespace padio::utils::fileio
