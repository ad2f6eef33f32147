#pragma once

#include <span>
#include <string>

#include <cstddef>
#include <cstdint>

#include "../types.hpp"
#include "endian.hpp"
#include "lossy_utf8.hpp"
#include "parse_result.hpp"

namespace padio::detail {

/**
 * @brief Streaming field grammar over a byte buffer
 *
 * Reads typed fields front to back. When a field does not fit in the bytes
 * that remain, the read fails with ValidationError::buffer_too_small and
 * ParseError::needed set to the exact deficit, so the caller can grow its
 * buffer by that amount.
 *
 * The reader does not keep partial state across buffers: after a
 * buffer_too_small failure the caller starts a new FieldReader over the
 * grown buffer and decodes again from byte 0.
 */
class FieldReader {
public:
    explicit FieldReader(std::span<const uint8_t> bytes) noexcept : bytes_(bytes) {}

    [[nodiscard]] std::size_t position() const noexcept { return pos_; }
    [[nodiscard]] std::size_t remaining() const noexcept { return bytes_.size() - pos_; }

    [[nodiscard]] ParseResult<uint16_t> read_be16() noexcept { return read_big<uint16_t>(); }
    [[nodiscard]] ParseResult<uint32_t> read_be32() noexcept { return read_big<uint32_t>(); }
    [[nodiscard]] ParseResult<uint64_t> read_be64() noexcept { return read_big<uint64_t>(); }

    [[nodiscard]] ParseResult<uint16_t> read_le16() noexcept { return read_little<uint16_t>(); }
    [[nodiscard]] ParseResult<uint32_t> read_le32() noexcept { return read_little<uint32_t>(); }

    /**
     * @brief Read a length-prefixed byte string without decoding it
     *
     * Layout: 16-bit big-endian length, then that many bytes. The returned
     * span aliases the reader's buffer.
     */
    [[nodiscard]] ParseResult<std::span<const uint8_t>> read_length_data() noexcept {
        const std::size_t start = pos_;
        auto length = read_be16();
        if (!length) {
            return unexpected(length.error());
        }
        if (remaining() < *length) {
            const std::size_t needed = *length - remaining();
            pos_ = start;
            return make_incomplete(needed, start);
        }
        auto data = bytes_.subspan(pos_, *length);
        pos_ += *length;
        return data;
    }

    /**
     * @brief Read a length-prefixed string, decoding it permissively as UTF-8
     */
    [[nodiscard]] ParseResult<std::string> read_string() {
        auto data = read_length_data();
        if (!data) {
            return unexpected(data.error());
        }
        return lossy_utf8(*data);
    }

private:
    std::span<const uint8_t> bytes_;
    std::size_t pos_{0};

    template <typename T>
    ParseResult<T> read_big() noexcept {
        if (remaining() < sizeof(T)) {
            return make_incomplete(sizeof(T) - remaining(), pos_);
        }
        T value = load_big<T>(bytes_.data() + pos_);
        pos_ += sizeof(T);
        return value;
    }

    template <typename T>
    ParseResult<T> read_little() noexcept {
        if (remaining() < sizeof(T)) {
            return make_incomplete(sizeof(T) - remaining(), pos_);
        }
        T value = load_little<T>(bytes_.data() + pos_);
        pos_ += sizeof(T);
        return value;
    }
};

} // namespace padio::detail
