#pragma once

#include <type_traits>
#include <variant>

#include <cstdint>

#include "../../detail/parse_error.hpp"

namespace padio::utils {

/**
 * @brief Represents end-of-stream (no error, just no more data)
 *
 * Returned when the record stream reaches its sentinel block or the last
 * declared record number.
 */
struct EndOfStream {};

/**
 * @brief I/O-level error (distinct from parse errors)
 *
 * Represents failures of the underlying file: open, read, seek, or a read
 * that ended before the expected number of bytes.
 */
struct IOError {
    enum class Kind : uint8_t {
        open_failed,       ///< File could not be opened
        read_error,        ///< Read failed
        seek_error,        ///< Seek failed or landed outside the file
        truncated_header,  ///< File ended inside the header
        truncated_record,  ///< File ended inside a record block
        truncated_payload  ///< File ended inside a payload
    };

    Kind kind;
    int errno_value{0};
    uint64_t offset{0}; ///< File position the operation started at

    [[nodiscard]] const char* message() const noexcept {
        switch (kind) {
            case Kind::open_failed:
                return "Failed to open capture file";
            case Kind::read_error:
                return "I/O read error";
            case Kind::seek_error:
                return "I/O seek error";
            case Kind::truncated_header:
                return "Truncated header";
            case Kind::truncated_record:
                return "Truncated record";
            case Kind::truncated_payload:
                return "Truncated payload";
        }
        return "Unknown I/O error";
    }
};

/**
 * @brief Unified reader error type
 *
 * A variant that can represent:
 * - EndOfStream: Normal end of the record stream
 * - IOError: System-level I/O failure
 * - ParseError: Bytes were read but do not form a valid capture
 */
using ReaderError = std::variant<EndOfStream, IOError, padio::ParseError>;

[[nodiscard]] inline bool is_eof(const ReaderError& e) noexcept {
    return std::holds_alternative<EndOfStream>(e);
}

[[nodiscard]] inline bool is_io_error(const ReaderError& e) noexcept {
    return std::holds_alternative<IOError>(e);
}

[[nodiscard]] inline bool is_parse_error(const ReaderError& e) noexcept {
    return std::holds_alternative<padio::ParseError>(e);
}

/**
 * @brief Get human-readable error message from any ReaderError
 */
[[nodiscard]] inline const char* error_message(const ReaderError& e) noexcept {
    return std::visit(
        [](auto&& err) -> const char* {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, EndOfStream>) {
                return "End of stream";
            } else {
                return err.message();
            }
        },
        e);
}

} // namespace padio::utils
