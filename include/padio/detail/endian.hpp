#pragma once

/**
 * @file endian.hpp
 * @brief Byte order helpers for capture file decoding
 *
 * Capture files mix byte orders: the metadata header is big-endian while the
 * fixed-size record blocks are little-endian. The helpers here convert between
 * host order and either file order, and load/store unaligned values from raw
 * byte buffers.
 */

#include <concepts>

#include <cstdint>
#include <cstring>

namespace padio::detail {

// ============================================================================
// Byte swap implementations
// ============================================================================

inline uint16_t byteswap16(uint16_t value) noexcept {
    return __builtin_bswap16(value);
}

inline uint32_t byteswap32(uint32_t value) noexcept {
    return __builtin_bswap32(value);
}

inline uint64_t byteswap64(uint64_t value) noexcept {
    return __builtin_bswap64(value);
}

// ============================================================================
// Platform endianness detection
// ============================================================================

#if defined(__BYTE_ORDER__) && defined(__ORDER_LITTLE_ENDIAN__)
inline constexpr bool is_little_endian = (__BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__);
#else
// Fallback assumption: most modern systems are little-endian
inline constexpr bool is_little_endian = true;
#endif

inline constexpr bool is_big_endian = !is_little_endian;

// ============================================================================
// Network (big-endian) byte order conversion
// ============================================================================

inline uint16_t host_to_network16(uint16_t value) noexcept {
    if constexpr (is_little_endian) {
        return byteswap16(value);
    } else {
        return value;
    }
}

inline uint32_t host_to_network32(uint32_t value) noexcept {
    if constexpr (is_little_endian) {
        return byteswap32(value);
    } else {
        return value;
    }
}

inline uint64_t host_to_network64(uint64_t value) noexcept {
    if constexpr (is_little_endian) {
        return byteswap64(value);
    } else {
        return value;
    }
}

// Conversion is symmetric
inline uint16_t network_to_host16(uint16_t value) noexcept {
    return host_to_network16(value);
}

inline uint32_t network_to_host32(uint32_t value) noexcept {
    return host_to_network32(value);
}

inline uint64_t network_to_host64(uint64_t value) noexcept {
    return host_to_network64(value);
}

// ============================================================================
// Little-endian byte order conversion (record blocks, pcapng output)
// ============================================================================

inline uint16_t host_to_little16(uint16_t value) noexcept {
    if constexpr (is_big_endian) {
        return byteswap16(value);
    } else {
        return value;
    }
}

inline uint32_t host_to_little32(uint32_t value) noexcept {
    if constexpr (is_big_endian) {
        return byteswap32(value);
    } else {
        return value;
    }
}

inline uint64_t host_to_little64(uint64_t value) noexcept {
    if constexpr (is_big_endian) {
        return byteswap64(value);
    } else {
        return value;
    }
}

inline uint16_t little_to_host16(uint16_t value) noexcept {
    return host_to_little16(value);
}

inline uint32_t little_to_host32(uint32_t value) noexcept {
    return host_to_little32(value);
}

inline uint64_t little_to_host64(uint64_t value) noexcept {
    return host_to_little64(value);
}

// ============================================================================
// Unaligned loads and stores
// ============================================================================

template <std::unsigned_integral T>
[[nodiscard]] inline T load_big(const uint8_t* data) noexcept {
    T value{};
    std::memcpy(&value, data, sizeof(T));
    if constexpr (sizeof(T) == 2) {
        return network_to_host16(value);
    } else if constexpr (sizeof(T) == 4) {
        return network_to_host32(value);
    } else if constexpr (sizeof(T) == 8) {
        return network_to_host64(value);
    } else {
        return value;
    }
}

template <std::unsigned_integral T>
[[nodiscard]] inline T load_little(const uint8_t* data) noexcept {
    T value{};
    std::memcpy(&value, data, sizeof(T));
    if constexpr (sizeof(T) == 2) {
        return little_to_host16(value);
    } else if constexpr (sizeof(T) == 4) {
        return little_to_host32(value);
    } else if constexpr (sizeof(T) == 8) {
        return little_to_host64(value);
    } else {
        return value;
    }
}

template <std::unsigned_integral T>
inline void store_little(uint8_t* data, T value) noexcept {
    if constexpr (sizeof(T) == 2) {
        value = host_to_little16(value);
    } else if constexpr (sizeof(T) == 4) {
        value = host_to_little32(value);
    } else if constexpr (sizeof(T) == 8) {
        value = host_to_little64(value);
    }
    std::memcpy(data, &value, sizeof(T));
}

template <std::unsigned_integral T>
inline void store_big(uint8_t* data, T value) noexcept {
    if constexpr (sizeof(T) == 2) {
        value = host_to_network16(value);
    } else if constexpr (sizeof(T) == 4) {
        value = host_to_network32(value);
    } else if constexpr (sizeof(T) == 8) {
        value = host_to_network64(value);
    }
    std::memcpy(data, &value, sizeof(T));
}

/**
 * @brief Join two 32-bit halves into a 64-bit value
 *
 * Records split every 64-bit quantity into a high word followed by a low word.
 */
[[nodiscard]] constexpr uint64_t join_hi_lo(uint32_t hi, uint32_t lo) noexcept {
    return (static_cast<uint64_t>(hi) << 32) | static_cast<uint64_t>(lo);
}

[[nodiscard]] constexpr uint32_t high_word(uint64_t value) noexcept {
    return static_cast<uint32_t>(value >> 32);
}

[[nodiscard]] constexpr uint32_t low_word(uint64_t value) noexcept {
    return static_cast<uint32_t>(value & 0xFFFF'FFFFULL);
}

} // namespace padio::detail
