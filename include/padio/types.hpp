#pragma once

#include <cstddef>
#include <cstdint>

namespace padio {

// Size of one record block in the record stream
inline constexpr std::size_t record_size = 40;

// The only record length and timestamp array size this decoder understands
inline constexpr uint32_t supported_record_len = 40;
inline constexpr uint32_t supported_timestamp_array_size = 8;

// Header strings carry a 16-bit length prefix
inline constexpr std::size_t string_length_prefix_size = 2;

inline constexpr uint64_t nanoseconds_per_second = 1'000'000'000ULL;

/**
 * @brief Reasons a capture file or one of its blocks failed to decode
 */
enum class ValidationError : uint8_t {
    none = 0,
    buffer_too_small,                 ///< More bytes are needed to finish decoding
    malformed_header,                 ///< Header grammar cannot be satisfied
    unsupported_record_length,        ///< record_len is not 40
    unsupported_timestamp_array_size, ///< timestamp_array_size is not 8
    record_number_mismatch,           ///< Record number out of sequence
    payload_offset_out_of_range       ///< Payload lies outside addressable file range
};

[[nodiscard]] constexpr const char* validation_error_string(ValidationError error) noexcept {
    switch (error) {
        case ValidationError::none:
            return "No error";
        case ValidationError::buffer_too_small:
            return "Buffer too small";
        case ValidationError::malformed_header:
            return "Malformed capture header";
        case ValidationError::unsupported_record_length:
            return "Unsupported record length";
        case ValidationError::unsupported_timestamp_array_size:
            return "Unsupported timestamp array size";
        case ValidationError::record_number_mismatch:
            return "Record number mismatch";
        case ValidationError::payload_offset_out_of_range:
            return "Payload offset out of range";
    }
    return "Unknown error";
}

/**
 * @brief Which part of a record's payload to fetch
 */
enum class PayloadMode : uint8_t {
    full,                     ///< All data_len bytes
    exclude_trailing_metadata ///< Stop at metadata_offset when it is non-zero
};

} // namespace padio
