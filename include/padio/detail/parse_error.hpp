#pragma once

#include <cstddef>
#include <cstdint>

#include "../types.hpp"

namespace padio {

/**
 * @brief Error information from a failed decode
 *
 * Carries the validation error plus the context needed to act on it:
 * - buffer_too_small: `needed` is the number of additional bytes required
 * - record_number_mismatch: `expected_number` and `actual_number`
 * - `offset` is the file (or buffer) position the failure refers to, when known
 */
struct ParseError {
    ValidationError code{ValidationError::none};
    std::size_t needed{0};
    uint32_t expected_number{0};
    uint32_t actual_number{0};
    uint64_t offset{0};

    [[nodiscard]] const char* message() const noexcept { return validation_error_string(code); }

    [[nodiscard]] bool is_incomplete() const noexcept {
        return code == ValidationError::buffer_too_small;
    }
};

} // namespace padio
