#pragma once

#include "padio/detail/endian.hpp"

#include <algorithm>
#include <array>
#include <concepts>
#include <span>
#include <tuple>
#include <type_traits>

#include <cstddef>
#include <cstdint>

namespace padio::detail {

// Fixed-size blocks are addressed in 4-byte lanes. A field names the lane it
// starts in, its storage type, and a bit range inside that storage word.
inline constexpr std::size_t lane_size = 4;

template <typename T>
concept UnsignedIntegral =
    std::unsigned_integral<T> && (std::same_as<T, uint8_t> || std::same_as<T, uint16_t> ||
                                  std::same_as<T, uint32_t> || std::same_as<T, uint64_t>);

template <typename T>
concept IsBitField = requires {
    typename T::storage_type;
    typename T::value_type;
    { T::lane_index } -> std::convertible_to<std::size_t>;
    { T::byte_offset } -> std::convertible_to<std::size_t>;
    { T::offset } -> std::convertible_to<std::size_t>;
    { T::width } -> std::convertible_to<std::size_t>;
    { T::mask } -> std::convertible_to<typename T::storage_type>;
};

/// Narrowest type able to hold Width bits (bool for a single bit)
template <std::size_t Width>
using field_value_t = std::conditional_t<
    Width == 1, bool,
    std::conditional_t<Width <= 8, uint8_t,
                       std::conditional_t<Width <= 16, uint16_t,
                                          std::conditional_t<Width <= 32, uint32_t, uint64_t>>>>;

template <typename StorageType, std::size_t Width>
constexpr StorageType low_bits_mask() noexcept {
    // Shifting by the full width is undefined
    if constexpr (Width == sizeof(StorageType) * 8) {
        return static_cast<StorageType>(~StorageType{0});
    } else {
        return static_cast<StorageType>((StorageType{1} << Width) - 1);
    }
}

/**
 * @brief True if two fields touch any common bit of the block
 *
 * Fields stored in the same word are compared bit by bit; otherwise any
 * shared byte counts as an overlap.
 */
template <IsBitField A, IsBitField B>
constexpr bool fields_overlap() noexcept {
    constexpr std::size_t a_begin = A::byte_offset;
    constexpr std::size_t a_end = a_begin + sizeof(typename A::storage_type);
    constexpr std::size_t b_begin = B::byte_offset;
    constexpr std::size_t b_end = b_begin + sizeof(typename B::storage_type);

    if constexpr (a_end <= b_begin || b_end <= a_begin) {
        return false;
    } else if constexpr (a_begin == b_begin && a_end == b_end) {
        return A::offset < B::offset + B::width && B::offset < A::offset + A::width;
    } else {
        return true;
    }
}

template <typename StorageType, std::size_t Offset, std::size_t Width, std::size_t LaneIndex = 0>
struct BitField {
    static_assert(UnsignedIntegral<StorageType>, "storage must be an unsigned integer type");
    static_assert(Width > 0 && Offset + Width <= sizeof(StorageType) * 8,
                  "field must lie inside its storage word");

    using storage_type = StorageType;
    using value_type = field_value_t<Width>;

    static constexpr std::size_t lane_index = LaneIndex;
    static constexpr std::size_t byte_offset = LaneIndex * lane_size;
    static constexpr std::size_t offset = Offset;
    static constexpr std::size_t width = Width;
    static constexpr StorageType mask = low_bits_mask<StorageType, Width>();

    static constexpr value_type extract(StorageType word) noexcept {
        return static_cast<value_type>((word >> offset) & mask);
    }

    static constexpr StorageType insert(StorageType word, value_type value) noexcept {
        const auto field_bits = static_cast<StorageType>(mask << offset);
        return static_cast<StorageType>((word & ~field_bits) |
                                        ((static_cast<StorageType>(value) << offset) & field_bits));
    }

    template <typename Other>
    static constexpr bool overlaps_with() noexcept {
        return fields_overlap<BitField, Other>();
    }
};

/// Single-bit flag inside a 32-bit lane
template <std::size_t BitPos, std::size_t LaneIndex = 0>
using BitFlag = BitField<uint32_t, BitPos, 1, LaneIndex>;

/// Whole 32-bit lane
template <std::size_t LaneIndex>
using LaneField = BitField<uint32_t, 0, 32, LaneIndex>;

template <typename First, typename... Rest>
constexpr bool pairwise_disjoint() noexcept {
    if constexpr (sizeof...(Rest) == 0) {
        return true;
    } else {
        return (!fields_overlap<First, Rest>() && ...) && pairwise_disjoint<Rest...>();
    }
}

template <typename... Fields>
constexpr bool validate_no_overlaps() noexcept {
    if constexpr (sizeof...(Fields) < 2) {
        return true;
    } else {
        return pairwise_disjoint<Fields...>();
    }
}

/**
 * @brief A set of fields describing one fixed-size block
 *
 * required_bytes is the smallest block that holds every field.
 */
template <typename... Fields>
struct BitFieldLayout {
    static_assert((IsBitField<Fields> && ...), "layout members must be BitField types");
    static_assert(validate_no_overlaps<Fields...>(), "layout contains overlapping fields");

    static constexpr std::size_t required_bytes =
        std::max({std::size_t{0}, (Fields::byte_offset + sizeof(typename Fields::storage_type))...});

    template <typename Field>
    static constexpr bool has_field = (std::same_as<Field, Fields> || ...);
};

/**
 * @brief Typed view of a block laid out by Layout
 *
 * Byte is uint8_t for a mutable view or const uint8_t for a read-only one.
 * Storage words are little-endian unless BigEndian is set.
 */
template <typename Layout, typename Byte, bool BigEndian = false>
class BasicBitFieldAccessor {
public:
    using span_type = std::span<Byte, Layout::required_bytes>;

    constexpr explicit BasicBitFieldAccessor(span_type block) noexcept : block_(block) {}

    template <typename Field>
        requires IsBitField<Field> && Layout::template has_field<Field>
    [[nodiscard]] auto get() const noexcept {
        return Field::extract(load<typename Field::storage_type>(Field::byte_offset));
    }

    template <typename... Fields>
        requires(Layout::template has_field<Fields> && ...)
    [[nodiscard]] auto get_multiple() const noexcept {
        return std::make_tuple(get<Fields>()...);
    }

    template <typename Field>
        requires IsBitField<Field> && Layout::template has_field<Field> &&
                 (!std::is_const_v<Byte>)
    void set(typename Field::value_type value) noexcept {
        using Word = typename Field::storage_type;
        store<Word>(Field::byte_offset, Field::insert(load<Word>(Field::byte_offset), value));
    }

    [[nodiscard]] std::span<const uint8_t, Layout::required_bytes> buffer() const noexcept {
        return block_;
    }

private:
    span_type block_;

    template <typename Word>
    Word load(std::size_t at) const noexcept {
        if constexpr (BigEndian) {
            return load_big<Word>(block_.data() + at);
        } else {
            return load_little<Word>(block_.data() + at);
        }
    }

    template <typename Word>
    void store(std::size_t at, Word value) const noexcept {
        if constexpr (BigEndian) {
            store_big<Word>(block_.data() + at, value);
        } else {
            store_little<Word>(block_.data() + at, value);
        }
    }
};

template <typename Layout, bool BigEndian = false>
using BitFieldAccessor = BasicBitFieldAccessor<Layout, uint8_t, BigEndian>;

template <typename Layout, bool BigEndian = false>
using ConstBitFieldAccessor = BasicBitFieldAccessor<Layout, const uint8_t, BigEndian>;

/// Combined in-word mask of several fields sharing a storage type
template <typename... Fields>
    requires(IsBitField<Fields> && ...)
constexpr auto create_bitmask() noexcept {
    using Word = std::common_type_t<typename Fields::storage_type...>;
    return static_cast<Word>((Word{0} | ... | static_cast<Word>(Fields::mask << Fields::offset)));
}

} // namespace padio::detail
