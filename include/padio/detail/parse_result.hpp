#pragma once

#include "../expected.hpp"
#include "parse_error.hpp"

namespace padio {

/**
 * @brief Result type for decode operations
 *
 * Alias for expected<T, ParseError>. Holds either the decoded value or a
 * ParseError describing why decoding stopped.
 *
 * @code
 *   auto header = padio::decode_header(bytes);
 *   if (!header && header.error().is_incomplete()) {
 *       grow_by(header.error().needed);
 *   }
 * @endcode
 */
template <typename T>
using ParseResult = expected<T, ParseError>;

/**
 * @brief Build an unexpected<ParseError> for the given code
 */
inline auto make_parse_error(ValidationError code, uint64_t offset = 0) noexcept {
    return unexpected(ParseError{.code = code, .offset = offset});
}

/**
 * @brief Build the "need N more bytes" error used by streaming decoders
 */
inline auto make_incomplete(std::size_t needed, uint64_t offset) noexcept {
    return unexpected(
        ParseError{.code = ValidationError::buffer_too_small, .needed = needed, .offset = offset});
}

} // namespace padio
