#pragma once

#include <span>
#include <string>

#include <cstddef>
#include <cstdint>

namespace padio::detail {

// U+FFFD REPLACEMENT CHARACTER encoded as UTF-8
inline constexpr char replacement_character[] = "\xEF\xBF\xBD";

/**
 * @brief Decode bytes as UTF-8, replacing invalid sequences
 *
 * Header strings are written by the instrument software and are not
 * guaranteed to be valid UTF-8. Each maximal invalid subsequence is replaced
 * by a single U+FFFD; valid sequences are copied through unchanged. Decoding
 * never fails.
 */
[[nodiscard]] inline std::string lossy_utf8(std::span<const uint8_t> bytes) {
    std::string out;
    out.reserve(bytes.size());

    const std::size_t n = bytes.size();
    std::size_t i = 0;
    while (i < n) {
        const uint8_t lead = bytes[i];
        if (lead < 0x80) {
            out.push_back(static_cast<char>(lead));
            ++i;
            continue;
        }

        // Sequence length and the permitted range of the second byte
        std::size_t len = 0;
        uint8_t lo = 0x80;
        uint8_t hi = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            len = 2;
        } else if (lead == 0xE0) {
            len = 3;
            lo = 0xA0;
        } else if ((lead >= 0xE1 && lead <= 0xEC) || lead == 0xEE || lead == 0xEF) {
            len = 3;
        } else if (lead == 0xED) {
            len = 3;
            hi = 0x9F; // excludes surrogates
        } else if (lead == 0xF0) {
            len = 4;
            lo = 0x90;
        } else if (lead >= 0xF1 && lead <= 0xF3) {
            len = 4;
        } else if (lead == 0xF4) {
            len = 4;
            hi = 0x8F;
        } else {
            out += replacement_character;
            ++i;
            continue;
        }

        std::size_t valid = 1;
        if (i + 1 < n && bytes[i + 1] >= lo && bytes[i + 1] <= hi) {
            valid = 2;
            while (valid < len && i + valid < n && bytes[i + valid] >= 0x80 &&
                   bytes[i + valid] <= 0xBF) {
                ++valid;
            }
        }

        if (valid == len) {
            out.append(reinterpret_cast<const char*>(bytes.data() + i), len);
        } else {
            out += replacement_character;
        }
        i += valid;
    }

    return out;
}

} // namespace padio::detail
