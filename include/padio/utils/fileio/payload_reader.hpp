#pragma once

#include <limits>
#include <utility>
#include <vector>

#include <cstddef>
#include <cstdint>

#include "../../expected.hpp"
#include "../../record.hpp"
#include "../../types.hpp"
#include "../detail/reader_error.hpp"
#include "byte_source.hpp"

namespace padio::utils::fileio {

/**
 * @brief Fetches record payloads from the payload region
 *
 * Owns a second cursor over the capture file, independent of the record
 * stream's cursor. A record's data_offset is relative to record_data_offset,
 * the start of the payload region.
 *
 * The reader remembers where its cursor is and moves there with a relative
 * seek, so fetching payloads in stream order never seeks backwards and a
 * contiguous payload needs no seek at all.
 *
 * @warning This class is MOVE-ONLY when Source is.
 */
template <ByteSource Source>
class PayloadReader {
public:
    using ReadResult = expected<std::vector<uint8_t>, ReaderError>;

    /**
     * @param source Cursor already positioned at record_data_offset
     * @param record_data_offset Absolute offset of the payload region
     */
    PayloadReader(Source source, uint64_t record_data_offset) noexcept
        : source_(std::move(source)),
          region_offset_(record_data_offset),
          cursor_offset_(record_data_offset) {}

    /**
     * @brief Read a record's payload
     *
     * @param record Record whose payload to read
     * @param mode full reads data_len bytes; exclude_trailing_metadata stops
     *             at metadata_offset when it is non-zero
     * @return Payload bytes, IOError{truncated_payload} if the file ends first,
     *         or ParseError{payload_offset_out_of_range} if the payload address
     *         is not a valid file offset
     */
    ReadResult fetch(const Record& record, PayloadMode mode) {
        constexpr auto max_offset = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());

        if (region_offset_ > max_offset || record.data_offset > max_offset - region_offset_) {
            return unexpected(ReaderError{ParseError{
                .code = ValidationError::payload_offset_out_of_range, .offset = record.data_offset}});
        }
        const uint64_t target = region_offset_ + record.data_offset;
        const auto delta = static_cast<int64_t>(target) - static_cast<int64_t>(cursor_offset_);

        if (auto seek = source_.seek_relative(delta); !seek) {
            return unexpected(ReaderError{seek.error()});
        }
        cursor_offset_ = target;

        std::vector<uint8_t> payload(payload_length(record, mode));
        if (auto read = source_.read_exact(payload, IOError::Kind::truncated_payload); !read) {
            // A short read leaves the cursor somewhere unknown
            cursor_offset_ = source_.tell();
            return unexpected(ReaderError{read.error()});
        }
        cursor_offset_ = target + payload.size();
        return payload;
    }

    ReadResult read_full_payload(const Record& record) { return fetch(record, PayloadMode::full); }

    ReadResult read_payload_without_metadata(const Record& record) {
        return fetch(record, PayloadMode::exclude_trailing_metadata);
    }

    /// Number of bytes fetch() will return for the record in the given mode
    [[nodiscard]] static constexpr std::size_t payload_length(const Record& record,
                                                              PayloadMode mode) noexcept {
        if (mode == PayloadMode::exclude_trailing_metadata && record.metadata_offset > 0) {
            return record.metadata_offset;
        }
        return record.data_len;
    }

    /// Absolute offset the owned cursor is positioned at
    [[nodiscard]] uint64_t cursor_offset() const noexcept { return cursor_offset_; }

    [[nodiscard]] uint64_t region_offset() const noexcept { return region_offset_; }

private:
    Source source_;
    uint64_t region_offset_;
    uint64_t cursor_offset_;
};

} // namespace padio::utils::fileio
