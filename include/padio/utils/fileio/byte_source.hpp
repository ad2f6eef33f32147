#pragma once

#include <concepts>
#include <span>

#include <cstddef>
#include <cstdint>
#include <cstring>

#include "../../expected.hpp"
#include "../detail/reader_error.hpp"

namespace padio::utils::fileio {

/**
 * @brief Concept for forward byte cursors the decoders pull from
 *
 * A source has a current position and supports:
 * - read_exact(buf, kind): fill buf completely or fail; a read that runs out
 *   of data fails with IOError{kind}, so the caller names what was truncated
 * - seek_relative(delta): move the position by a signed amount
 * - seek(pos): move to an absolute position
 * - tell(): current absolute position
 *
 * FileCursor implements this over a FILE*; SpanByteSource over memory.
 */
template <typename T>
concept ByteSource = requires(T& source, std::span<uint8_t> buf, IOError::Kind kind,
                              int64_t delta, uint64_t pos) {
    { source.read_exact(buf, kind) } -> std::same_as<expected<void, IOError>>;
    { source.seek_relative(delta) } -> std::same_as<expected<void, IOError>>;
    { source.seek(pos) } -> std::same_as<expected<void, IOError>>;
    { source.tell() } -> std::convertible_to<uint64_t>;
};

/**
 * @brief In-memory byte source
 *
 * Reads from a caller-owned buffer that must outlive the source. Seeking past
 * the end is allowed (a following read fails as truncated), seeking before
 * the start is a seek_error, matching FileCursor.
 */
class SpanByteSource {
public:
    explicit SpanByteSource(std::span<const uint8_t> bytes) noexcept : bytes_(bytes) {}

    expected<void, IOError> read_exact(std::span<uint8_t> out, IOError::Kind short_read) noexcept {
        if (pos_ > bytes_.size() || bytes_.size() - pos_ < out.size()) {
            return unexpected(IOError{short_read, 0, pos_});
        }
        if (!out.empty()) {
            std::memcpy(out.data(), bytes_.data() + pos_, out.size());
        }
        pos_ += out.size();
        ++reads_;
        return {};
    }

    expected<void, IOError> seek_relative(int64_t delta) noexcept {
        if (delta < 0 && static_cast<uint64_t>(-(delta + 1)) + 1 > pos_) {
            return unexpected(IOError{IOError::Kind::seek_error, 0, pos_});
        }
        pos_ = static_cast<uint64_t>(static_cast<int64_t>(pos_) + delta);
        return {};
    }

    expected<void, IOError> seek(uint64_t pos) noexcept {
        pos_ = pos;
        return {};
    }

    [[nodiscard]] uint64_t tell() const noexcept { return pos_; }
    [[nodiscard]] uint64_t size() const noexcept { return bytes_.size(); }

    /// Number of successful read_exact() calls
    [[nodiscard]] std::size_t reads() const noexcept { return reads_; }

private:
    std::span<const uint8_t> bytes_;
    uint64_t pos_{0};
    std::size_t reads_{0};
};

static_assert(ByteSource<SpanByteSource>);

} // namespace padio::utils::fileio
