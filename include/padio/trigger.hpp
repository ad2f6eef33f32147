#pragma once

#include <optional>
#include <string>

#include <cstdint>
#include <cstdio>

#include "header.hpp"
#include "record.hpp"
#include "types.hpp"

namespace padio {

/**
 * @brief Nanosecond count split into whole seconds and the remainder
 */
struct SplitNanoseconds {
    uint64_t seconds{0};
    uint32_t nanoseconds{0};
};

[[nodiscard]] constexpr SplitNanoseconds split_nanoseconds(uint64_t ns) noexcept {
    return {ns / nanoseconds_per_second, static_cast<uint32_t>(ns % nanoseconds_per_second)};
}

/**
 * @brief Format nanoseconds as "S.NNNNNNNNN" (nine fractional digits)
 */
[[nodiscard]] inline std::string format_seconds(uint64_t ns) {
    auto split = split_nanoseconds(ns);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%llu.%09u", static_cast<unsigned long long>(split.seconds),
                  static_cast<unsigned>(split.nanoseconds));
    return buf;
}

/**
 * @brief True for the record that should carry the trigger annotation
 *
 * That is the record whose number equals trigger_record_number. When the
 * trigger lies outside the captured range it is attributed to the nearest
 * end: the first record if it precedes the range, the last if it follows.
 */
[[nodiscard]] constexpr bool is_trigger_record(const CaptureHeader& header,
                                               const Record& record) noexcept {
    const uint32_t trigger = header.trigger_record_number;
    return record.number == trigger ||
           (record.number == header.first_record_number && trigger < header.first_record_number) ||
           (record.number == header.last_record_number && trigger > header.last_record_number);
}

/**
 * @brief Human-readable offset between the trigger and a record
 *
 * @return Comment text for the trigger record, empty for every other record
 */
[[nodiscard]] inline std::optional<std::string> trigger_comment(const CaptureHeader& header,
                                                                const Record& record) {
    if (!is_trigger_record(header, record)) {
        return std::nullopt;
    }

    const uint64_t trigger_ns = header.timestamps_ns.trigger;
    if (trigger_ns == record.timestamp_ns) {
        return std::string("Triggered on this record.");
    }
    if (trigger_ns < record.timestamp_ns) {
        return "Triggered " + format_seconds(record.timestamp_ns - trigger_ns) +
               "s before this record.";
    }
    return "Triggered " + format_seconds(trigger_ns - record.timestamp_ns) +
           "s after this record.";
}

} // namespace padio
