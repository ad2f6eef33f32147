#pragma once

#include <algorithm>
#include <array>
#include <span>

#include <cstdint>

#include "detail/bitfield.hpp"
#include "detail/endian.hpp"
#include "detail/parse_result.hpp"
#include "types.hpp"

namespace padio {

/**
 * @brief Field layout of one 40-byte record block (little-endian)
 *
 * | bytes | field                                        |
 * |-------|----------------------------------------------|
 * | 0-3   | number                                       |
 * | 4-7   | data_len                                     |
 * | 8-15  | count (hi, lo)                               |
 * | 16-23 | timestamp_ns (hi, lo)                        |
 * | 24-25 | lfsr                                         |
 * | 26-27 | metadata info: bit 15 extra metadata present,|
 * |       | bits 14-0 metadata offset                    |
 * | 28-31 | flags                                        |
 * | 32-39 | data_offset (hi, lo)                         |
 *
 * Lane 6 packs lfsr and the metadata word into one little-endian 32-bit
 * word, so the metadata word occupies bits 31-16.
 */
namespace record_layout {
using Number = detail::LaneField<0>;
using DataLen = detail::LaneField<1>;
using CountHi = detail::LaneField<2>;
using CountLo = detail::LaneField<3>;
using TimestampHi = detail::LaneField<4>;
using TimestampLo = detail::LaneField<5>;
using Lfsr = detail::BitField<uint32_t, 0, 16, 6>;
using MetadataOffset = detail::BitField<uint32_t, 16, 15, 6>;
using ExtraMetadataPresent = detail::BitFlag<31, 6>;
using Flags = detail::LaneField<7>;
using DataOffsetHi = detail::LaneField<8>;
using DataOffsetLo = detail::LaneField<9>;

using Layout = detail::BitFieldLayout<Number, DataLen, CountHi, CountLo, TimestampHi, TimestampLo,
                                      Lfsr, MetadataOffset, ExtraMetadataPresent, Flags,
                                      DataOffsetHi, DataOffsetLo>;

static_assert(Layout::required_bytes == record_size, "record layout must cover 40 bytes");
} // namespace record_layout

/// Flag bits with a known meaning
namespace record_flags {
/// Set for upstream traffic, clear for downstream
using Upstream = detail::BitFlag<28>;
} // namespace record_flags

/**
 * @brief One captured event
 */
struct Record {
    uint32_t number{0};
    uint32_t data_len{0};
    uint64_t count{0};
    uint64_t timestamp_ns{0};
    uint16_t lfsr{0};
    bool extra_metadata_present{false};
    uint16_t metadata_offset{0};
    uint32_t flags{0};
    uint64_t data_offset{0};

    [[nodiscard]] constexpr bool is_upstream() const noexcept {
        return record_flags::Upstream::extract(flags);
    }

    /// The on-disk 16-bit metadata word
    [[nodiscard]] constexpr uint16_t metadata_info() const noexcept {
        return static_cast<uint16_t>((extra_metadata_present ? 0x8000u : 0u) |
                                     (metadata_offset & 0x7FFFu));
    }

    bool operator==(const Record&) const = default;
};

/**
 * @brief True if the block is the all-zero end-of-stream sentinel
 */
[[nodiscard]] inline bool is_sentinel_block(std::span<const uint8_t> block) noexcept {
    return block.size() == record_size &&
           std::all_of(block.begin(), block.end(), [](uint8_t b) { return b == 0; });
}

/**
 * @brief Decode one record block
 *
 * The block must be exactly record_size bytes; anything else indicates a
 * framing error in the caller and fails with buffer_too_small. The sentinel
 * is not special-cased here (it decodes to an all-zero Record); use
 * is_sentinel_block() first.
 */
[[nodiscard]] inline ParseResult<Record> decode_record(std::span<const uint8_t> block) noexcept {
    if (block.size() != record_size) {
        return make_incomplete(block.size() < record_size ? record_size - block.size() : 0, 0);
    }

    using namespace record_layout;
    detail::ConstBitFieldAccessor<Layout> fields(block.first<record_size>());

    Record record;
    record.number = fields.get<Number>();
    record.data_len = fields.get<DataLen>();
    record.count = detail::join_hi_lo(fields.get<CountHi>(), fields.get<CountLo>());
    record.timestamp_ns = detail::join_hi_lo(fields.get<TimestampHi>(), fields.get<TimestampLo>());
    record.lfsr = fields.get<Lfsr>();
    record.extra_metadata_present = fields.get<ExtraMetadataPresent>();
    record.metadata_offset = fields.get<MetadataOffset>();
    record.flags = fields.get<Flags>();
    record.data_offset =
        detail::join_hi_lo(fields.get<DataOffsetHi>(), fields.get<DataOffsetLo>());
    return record;
}

} // namespace padio
