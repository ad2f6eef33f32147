#pragma once

#include <array>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include <cstddef>
#include <cstdint>

#include "detail/field_reader.hpp"
#include "detail/parse_result.hpp"
#include "types.hpp"

namespace padio {

/**
 * @brief The four nanosecond timestamps stored in the header
 */
struct TimestampsNs {
    uint64_t first{0};
    uint64_t last{0};
    uint64_t stop{0};
    uint64_t trigger{0};

    bool operator==(const TimestampsNs&) const = default;
};

struct ChannelNames {
    std::string a;
    std::string b;

    bool operator==(const ChannelNames&) const = default;
};

/**
 * @brief Wall-clock marker with hour / minute / millisecond resolution
 */
struct CoarseTimestamp {
    uint16_t hour{0};
    uint16_t minute{0};
    uint16_t millisec{0};

    /// All three components zero means the marker was not recorded
    [[nodiscard]] constexpr bool is_null() const noexcept {
        return hour == 0 && minute == 0 && millisec == 0;
    }

    bool operator==(const CoarseTimestamp&) const = default;
};

/**
 * @brief Capture file metadata header
 *
 * Immutable once decoded. Field order matches the on-disk order; every
 * numeric field is big-endian on disk and every string is a 16-bit
 * big-endian length followed by raw bytes.
 */
struct CaptureHeader {
    std::string module_type;
    std::string port_id;
    std::string rx_or_tx;
    std::string description;
    std::string format_code;
    std::pair<uint32_t, uint32_t> numbers0{0, 0};
    uint32_t trigger_record_number{0};
    uint32_t three{0};
    uint32_t first_record_number{0};
    uint32_t last_record_number{0};
    uint32_t record_len{0};
    uint32_t timestamp_array_size{0};
    TimestampsNs timestamps_ns;
    std::string guid;
    ChannelNames channel_names;
    CoarseTimestamp start_time;
    CoarseTimestamp stop_time;
    uint64_t records_offset{0};
    uint64_t record_data_offset{0};
    std::string start;

    /// Number of bytes the header occupied on disk
    std::size_t encoded_size{0};

    bool operator==(const CaptureHeader&) const = default;
};

namespace detail {

template <typename T, typename Out>
bool take_field(ParseResult<T>&& result, Out& out, ParseError& error) {
    if (!result) {
        error = result.error();
        return false;
    }
    out = std::move(*result);
    return true;
}

inline bool take_coarse(FieldReader& reader, CoarseTimestamp& out, ParseError& error) {
    return take_field(reader.read_be16(), out.hour, error) &&
           take_field(reader.read_be16(), out.minute, error) &&
           take_field(reader.read_be16(), out.millisec, error);
}

} // namespace detail

/**
 * @brief Attempt to decode a complete header from the front of a buffer
 *
 * The header has no length field. If the buffer ends before the last field,
 * decoding fails with ValidationError::buffer_too_small and
 * ParseError::needed holding the number of additional bytes the next field
 * requires; the attempt cannot be resumed and must be repeated over a larger
 * buffer (see HeaderParser). Trailing bytes after the header are ignored.
 *
 * @param bytes Buffer starting at the first header byte
 * @return Decoded header or the reason decoding stopped
 */
[[nodiscard]] inline ParseResult<CaptureHeader> decode_header(std::span<const uint8_t> bytes) {
    using detail::take_coarse;
    using detail::take_field;

    detail::FieldReader reader(bytes);
    CaptureHeader h;
    ParseError error;

    const bool ok = take_field(reader.read_string(), h.module_type, error) &&
                    take_field(reader.read_string(), h.port_id, error) &&
                    take_field(reader.read_string(), h.rx_or_tx, error) &&
                    take_field(reader.read_string(), h.description, error) &&
                    take_field(reader.read_string(), h.format_code, error) &&
                    take_field(reader.read_be32(), h.numbers0.first, error) &&
                    take_field(reader.read_be32(), h.numbers0.second, error) &&
                    take_field(reader.read_be32(), h.trigger_record_number, error) &&
                    take_field(reader.read_be32(), h.three, error) &&
                    take_field(reader.read_be32(), h.first_record_number, error) &&
                    take_field(reader.read_be32(), h.last_record_number, error) &&
                    take_field(reader.read_be32(), h.record_len, error) &&
                    take_field(reader.read_be32(), h.timestamp_array_size, error) &&
                    take_field(reader.read_be64(), h.timestamps_ns.first, error) &&
                    take_field(reader.read_be64(), h.timestamps_ns.last, error) &&
                    take_field(reader.read_be64(), h.timestamps_ns.stop, error) &&
                    take_field(reader.read_be64(), h.timestamps_ns.trigger, error) &&
                    take_field(reader.read_string(), h.guid, error) &&
                    take_field(reader.read_string(), h.channel_names.a, error) &&
                    take_field(reader.read_string(), h.channel_names.b, error) &&
                    take_coarse(reader, h.start_time, error) &&
                    take_coarse(reader, h.stop_time, error) &&
                    take_field(reader.read_be64(), h.records_offset, error) &&
                    take_field(reader.read_be64(), h.record_data_offset, error) &&
                    take_field(reader.read_string(), h.start, error);

    if (!ok) {
        return unexpected(error);
    }

    h.encoded_size = reader.position();
    return h;
}

/**
 * @brief Check the structural invariants the record decoder depends on
 *
 * @return ValidationError::none when record_len is 40 and
 *         timestamp_array_size is 8, otherwise the offending field's error
 */
[[nodiscard]] constexpr ValidationError validate_header(const CaptureHeader& header) noexcept {
    if (header.record_len != supported_record_len) {
        return ValidationError::unsupported_record_length;
    }
    if (header.timestamp_array_size != supported_timestamp_array_size) {
        return ValidationError::unsupported_timestamp_array_size;
    }
    return ValidationError::none;
}

/// Module identifiers of the PCIe analyzer modules
inline constexpr std::array<std::string_view, 6> pcie_module_types = {
    "AGT_MODULE_ONEPORT_PCIEXPRESS_X8",       "AGT_MODULE_ONEPORT_PCIEXPRESS_X16",
    "AGT_MODULE_ONEPORT_PCIEXPRESS_GEN2",     "AGT_MODULE_ONEPORT_PCIEXPRESS_GEN2_X16",
    "AGT_MODULE_ONEPORT_PCIEXPRESS_MRIOV_X8", "AGT_MODULE_ONEPORT_PCIEXPRESS_MRIOV_X16",
};

/**
 * @brief True if the header comes from a PCIe analyzer module
 *
 * The decoder itself accepts every module type; the pcapng conversion only
 * knows how to label PCIe captures.
 */
[[nodiscard]] constexpr bool is_supported_module_type(std::string_view module_type) noexcept {
    for (auto known : pcie_module_types) {
        if (module_type == known) {
            return true;
        }
    }
    return false;
}

} // namespace padio
