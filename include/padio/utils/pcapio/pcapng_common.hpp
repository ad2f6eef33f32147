#pragma once

#include <algorithm>
#include <span>
#include <string_view>
#include <vector>

#include <cstddef>
#include <cstdint>

#include "../../detail/endian.hpp"

namespace padio::utils::pcapio {

// =============================================================================
// pcapng Block Constants
// =============================================================================

/**
 * @brief pcapng block types
 *
 * See: https://www.ietf.org/archive/id/draft-ietf-opsawg-pcapng-02.html
 */
constexpr uint32_t PCAPNG_BLOCK_SECTION_HEADER = 0x0A0D0D0A;
constexpr uint32_t PCAPNG_BLOCK_INTERFACE_DESCRIPTION = 0x00000001;
constexpr uint32_t PCAPNG_BLOCK_ENHANCED_PACKET = 0x00000006;

/// Readers use this to detect the byte order of the section
constexpr uint32_t PCAPNG_BYTE_ORDER_MAGIC = 0x1A2B3C4D;

constexpr uint16_t PCAPNG_VERSION_MAJOR = 1;
constexpr uint16_t PCAPNG_VERSION_MINOR = 0;

/// Section length -1 means "not specified"
constexpr int64_t PCAPNG_SECTION_LENGTH_UNSPECIFIED = -1;

/**
 * @brief Link-layer types
 *
 * Captures are tagged with a user-reserved link type so a dedicated
 * dissector can pick them up.
 */
constexpr uint16_t PCAPNG_LINKTYPE_USER0 = 147;
constexpr uint16_t PCAPNG_LINKTYPE_PAD_RECORD = PCAPNG_LINKTYPE_USER0 + 11;

/**
 * @brief Option codes
 */
constexpr uint16_t PCAPNG_OPT_ENDOFOPT = 0;
constexpr uint16_t PCAPNG_OPT_COMMENT = 1;
constexpr uint16_t PCAPNG_OPT_IF_NAME = 2;
constexpr uint16_t PCAPNG_OPT_IF_TSRESOL = 9;
constexpr uint16_t PCAPNG_OPT_IF_HARDWARE = 15;

/// if_tsresol value for nanosecond timestamps (10^-9)
constexpr uint8_t PCAPNG_TSRESOL_NANOSECONDS = 9;

/**
 * @brief Fixed block framing sizes
 */
constexpr size_t PCAPNG_BLOCK_FRAMING_SIZE = 12; ///< type + leading and trailing total length
constexpr size_t PCAPNG_OPTION_HEADER_SIZE = 4;  ///< option code + option length
constexpr size_t PCAPNG_ALIGNMENT = 4;

/// Bytes of record metadata placed in front of each payload in an EPB
constexpr size_t PAD_RECORD_METADATA_SIZE = 4 + 8 + 2 + 2 + 4;
static_assert(PAD_RECORD_METADATA_SIZE == 20);

// =============================================================================
// Helper Functions
// =============================================================================

/**
 * @brief Number of zero bytes needed to pad size to a 32-bit boundary
 */
constexpr size_t pcapng_padding(size_t size) noexcept {
    return (PCAPNG_ALIGNMENT - size % PCAPNG_ALIGNMENT) % PCAPNG_ALIGNMENT;
}

/**
 * @brief Assembles the body of one pcapng block
 *
 * Collects little-endian fields and options; finish() wraps the body in the
 * block type and the two total-length fields.
 */
class PcapngBlockBuilder {
public:
    explicit PcapngBlockBuilder(uint32_t block_type) : block_type_(block_type) {}

    void put_u16(uint16_t value) { put_scalar(value); }
    void put_u32(uint32_t value) { put_scalar(value); }
    void put_u64(uint64_t value) { put_scalar(value); }

    void put_bytes(std::span<const uint8_t> bytes) {
        body_.insert(body_.end(), bytes.begin(), bytes.end());
    }

    void pad_to_alignment() { body_.resize(body_.size() + pcapng_padding(body_.size()), 0); }

    /**
     * @brief Append an option (code, length, value, padding)
     *
     * @return false if the value does not fit the 16-bit option length
     */
    bool put_option(uint16_t code, std::span<const uint8_t> value) {
        if (value.size() > UINT16_MAX) {
            return false;
        }
        put_u16(code);
        put_u16(static_cast<uint16_t>(value.size()));
        put_bytes(value);
        pad_to_alignment();
        return true;
    }

    bool put_option(uint16_t code, std::string_view text) {
        return put_option(code, std::span<const uint8_t>(
                                    reinterpret_cast<const uint8_t*>(text.data()), text.size()));
    }

    void put_end_of_options() {
        put_u16(PCAPNG_OPT_ENDOFOPT);
        put_u16(0);
    }

    [[nodiscard]] size_t body_size() const noexcept { return body_.size(); }

    /**
     * @brief Produce the complete framed block
     */
    [[nodiscard]] std::vector<uint8_t> finish() const {
        const auto total = static_cast<uint32_t>(body_.size() + PCAPNG_BLOCK_FRAMING_SIZE);
        std::vector<uint8_t> block(total);
        padio::detail::store_little<uint32_t>(block.data(), block_type_);
        padio::detail::store_little<uint32_t>(block.data() + 4, total);
        std::copy(body_.begin(), body_.end(), block.begin() + 8);
        padio::detail::store_little<uint32_t>(block.data() + 8 + body_.size(), total);
        return block;
    }

private:
    uint32_t block_type_;
    std::vector<uint8_t> body_;

    template <typename T>
    void put_scalar(T value) {
        const size_t pos = body_.size();
        body_.resize(pos + sizeof(T));
        padio::detail::store_little<T>(body_.data() + pos, value);
    }
};

} // namespace padio::utils::pcapio
