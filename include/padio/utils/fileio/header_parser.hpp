#pragma once

#include <vector>

#include <cstddef>
#include <cstdint>

#include "../../expected.hpp"
#include "../../header.hpp"
#include "../detail/reader_error.hpp"
#include "byte_source.hpp"

namespace padio::utils::fileio {

/**
 * @brief Reads a capture header of unknown length from a byte source
 *
 * The header carries no total-length field, so its size is discovered by
 * repeated decode attempts over a growing buffer:
 *
 * 1. Grow the buffer by the last reported deficit (0 on the first pass)
 *    and read that many bytes from the current source position.
 * 2. Decode. On success the source is left just past the header.
 * 3. On "need N more bytes", rewind the source by the buffer size and retry
 *    with the buffer grown by N.
 *
 * A deficit of zero cannot make progress and is reported as
 * ValidationError::malformed_header. Running out of data while growing is
 * IOError{truncated_header}.
 *
 * Each attempt restarts decoding from byte 0 of the header.
 */
class HeaderParser {
public:
    using ParseResult = expected<CaptureHeader, ReaderError>;

    template <ByteSource Source>
    ParseResult parse(Source& source) {
        buffer_.clear();
        attempts_ = 0;
        std::size_t grow = 0;
        const uint64_t start = source.tell();

        while (true) {
            buffer_.resize(buffer_.size() + grow);
            if (auto read = source.read_exact(buffer_, IOError::Kind::truncated_header); !read) {
                return unexpected(ReaderError{read.error()});
            }
            ++attempts_;

            auto header = decode_header(buffer_);
            if (header) {
                return *std::move(header);
            }

            ParseError err = header.error();
            if (!err.is_incomplete()) {
                return unexpected(ReaderError{err});
            }
            if (err.needed == 0) {
                return unexpected(ReaderError{
                    ParseError{.code = ValidationError::malformed_header, .offset = start}});
            }

            if (auto rewind = source.seek_relative(-static_cast<int64_t>(buffer_.size()));
                !rewind) {
                return unexpected(ReaderError{rewind.error()});
            }
            grow = err.needed;
        }
    }

    /// Number of decode attempts made by the last parse()
    [[nodiscard]] std::size_t attempts() const noexcept { return attempts_; }

private:
    std::vector<uint8_t> buffer_;
    std::size_t attempts_{0};
};

/**
 * @brief One-shot convenience wrapper around HeaderParser
 */
template <ByteSource Source>
[[nodiscard]] expected<CaptureHeader, ReaderError> read_header(Source& source) {
    HeaderParser parser;
    return parser.parse(source);
}

} // namespace padio::utils::fileio
