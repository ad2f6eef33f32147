#pragma once

#include <concepts>
#include <span>
#include <vector>

#include <cstddef>
#include <cstdint>

#include "../../expected.hpp"
#include "../../record.hpp"
#include "reader_error.hpp"

namespace padio::utils::detail {

/**
 * @brief Concept for readers that pair each record with its payload
 */
template <typename T>
concept RecordReader = requires(T& reader, const Record& record) {
    { reader.read_next_record() } -> std::same_as<padio::expected<Record, ReaderError>>;
    {
        reader.read_full_payload(record)
    } -> std::same_as<padio::expected<std::vector<uint8_t>, ReaderError>>;
};

/**
 * @brief Iterate over every record with its full payload
 *
 * Error handling contract:
 * - EndOfStream: Stop iteration, return the count
 * - IOError / ParseError: Stop iteration, return the error
 *
 * Unlike packet streams there is nothing to skip to after a bad record: a
 * mismatch or truncation ends the capture.
 *
 * @tparam Callback Function type with signature:
 *         bool(const Record&, std::span<const uint8_t>)
 * @return Number of records passed to the callback, or the fatal error
 */
template <RecordReader Reader, typename Callback>
padio::expected<std::size_t, ReaderError> for_each_record(Reader& reader, Callback&& callback) {
    std::size_t count = 0;

    while (true) {
        auto record = reader.read_next_record();
        if (!record.has_value()) {
            if (is_eof(record.error())) {
                return count;
            }
            return padio::unexpected(record.error());
        }

        auto payload = reader.read_full_payload(*record);
        if (!payload.has_value()) {
            return padio::unexpected(payload.error());
        }

        ++count;
        if (!callback(*record, std::span<const uint8_t>(*payload))) {
            return count;
        }
    }
}

} // namespace padio::utils::detail
