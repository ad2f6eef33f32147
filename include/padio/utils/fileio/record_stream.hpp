#pragma once

#include <array>
#include <optional>
#include <utility>

#include <cstddef>
#include <cstdint>

#include "../../expected.hpp"
#include "../../record.hpp"
#include "../detail/reader_error.hpp"
#include "byte_source.hpp"

namespace padio::utils::fileio {

/**
 * @brief Sequential reader over the fixed-size record array
 *
 * Owns a forward cursor positioned at the first record block. Every call to
 * read_next_record() consumes exactly one 40-byte block and checks that the
 * record numbers run consecutively from first_record_number.
 *
 * Return type: expected<Record, ReaderError>
 * - Value = next record in order
 * - unexpected(EndOfStream{}) = sentinel block seen, or last_record_number passed
 * - unexpected(IOError{truncated_record}) = file ended inside a block
 * - unexpected(ParseError{record_number_mismatch}) = ordering broken
 *
 * A mismatch is fatal: the stream does not resynchronize, and every later
 * call returns the same error.
 *
 * @warning This class is MOVE-ONLY when Source is.
 */
template <ByteSource Source>
class RecordStream {
public:
    using ReadResult = expected<Record, ReaderError>;

    /**
     * @param source Cursor already positioned at records_offset
     * @param first_record_number Number the first record must carry
     * @param last_record_number Inclusive upper bound on record numbers
     */
    RecordStream(Source source, uint32_t first_record_number, uint32_t last_record_number) noexcept
        : source_(std::move(source)),
          next_number_(first_record_number),
          last_number_(last_record_number) {}

    ReadResult read_next_record() noexcept {
        if (failure_) {
            return unexpected(*failure_);
        }
        if (exhausted_ || next_number_ > last_number_) {
            return unexpected(ReaderError{EndOfStream{}});
        }

        const uint64_t offset = source_.tell();
        std::array<uint8_t, record_size> block{};
        if (auto read = source_.read_exact(block, IOError::Kind::truncated_record); !read) {
            return unexpected(ReaderError{read.error()});
        }

        if (is_sentinel_block(block)) {
            exhausted_ = true;
            return unexpected(ReaderError{EndOfStream{}});
        }

        auto record = decode_record(block);
        if (!record) {
            return unexpected(ReaderError{record.error()});
        }

        if (record->number != next_number_) {
            failure_ = ReaderError{ParseError{.code = ValidationError::record_number_mismatch,
                                              .expected_number = next_number_,
                                              .actual_number = record->number,
                                              .offset = offset}};
            return unexpected(*failure_);
        }

        // Stop cleanly instead of wrapping when last_record_number is UINT32_MAX
        if (next_number_ == last_number_) {
            exhausted_ = true;
        } else {
            ++next_number_;
        }
        ++records_read_;
        return *record;
    }

    /// Number of records yielded so far
    [[nodiscard]] std::size_t records_read() const noexcept { return records_read_; }

    /// Number the next record is expected to carry
    [[nodiscard]] uint32_t next_record_number() const noexcept { return next_number_; }

    /// True once the sentinel or the last record has been consumed
    [[nodiscard]] bool exhausted() const noexcept {
        return exhausted_ || next_number_ > last_number_;
    }

    [[nodiscard]] bool failed() const noexcept { return failure_.has_value(); }

private:
    Source source_;
    uint32_t next_number_;
    uint32_t last_number_;
    std::size_t records_read_{0};
    bool exhausted_{false};
    std::optional<ReaderError> failure_;
};

} // namespace padio::utils::fileio
