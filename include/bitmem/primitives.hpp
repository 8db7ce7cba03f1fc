#ifndef BITMEM_PRIMITIVES_HPP_
#define BITMEM_PRIMITIVES_HPP_

#include <bitmem/bitmem_export.h>
#include <bitmem/result.hpp>

#include <concepts>
#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>
#include <utility>

namespace bitmem {

// ============================================================================
// Fixed-width Value Domains
// ============================================================================
//
// Each named domain maps onto the native integer of the same width:
//   BYTE  -> std::uint8_t     SBYTE -> std::int8_t
//   SHORT -> std::int16_t     USHORT -> std::uint16_t
//   INT   -> std::int32_t     UINT  -> std::uint32_t
//   LONG  -> std::int64_t     ULONG -> std::uint64_t
// Out-of-range input is reported through result<T>, never thrown.

constexpr int COMPARISON_LESS = -1;
constexpr int COMPARISON_EQUAL = 0;
constexpr int COMPARISON_GREATER = 1;

namespace detail {

[[nodiscard]] BITMEM_EXPORT std::string range_error_message(bool is_signed,
                                                            const std::string& min,
                                                            const std::string& max,
                                                            const std::string& received);

} // namespace detail

template <std::integral T, std::integral V>
[[nodiscard]] constexpr bool is_in_domain(V value) noexcept {
    return std::in_range<T>(value);
}

template <std::integral T, std::integral V>
[[nodiscard]] result<T> parse_as(V value) {
    if (std::in_range<T>(value)) {
        return result<T>::success(static_cast<T>(value));
    }
    // unary + promotes 8-bit types so they format as numbers
    return result<T>::failure(detail::range_error_message(
        std::is_signed_v<T>,
        std::to_string(+std::numeric_limits<T>::min()),
        std::to_string(+std::numeric_limits<T>::max()),
        std::to_string(+value)));
}

template <std::integral T, std::integral V>
[[nodiscard]] constexpr T clamp_to(V value) noexcept {
    if (std::cmp_less(value, std::numeric_limits<T>::min())) {
        return std::numeric_limits<T>::min();
    }
    if (std::cmp_greater(value, std::numeric_limits<T>::max())) {
        return std::numeric_limits<T>::max();
    }
    return static_cast<T>(value);
}

template <std::integral T>
[[nodiscard]] constexpr int compare(T a, T b) noexcept {
    if (a < b) return COMPARISON_LESS;
    if (a > b) return COMPARISON_GREATER;
    return COMPARISON_EQUAL;
}

// BYTE
template <std::integral V> [[nodiscard]] result<std::uint8_t> parse_byte(V v) { return parse_as<std::uint8_t>(v); }
template <std::integral V> [[nodiscard]] constexpr bool is_byte(V v) noexcept { return is_in_domain<std::uint8_t>(v); }
template <std::integral V> [[nodiscard]] constexpr std::uint8_t clamp_to_byte(V v) noexcept { return clamp_to<std::uint8_t>(v); }

// SBYTE
template <std::integral V> [[nodiscard]] result<std::int8_t> parse_sbyte(V v) { return parse_as<std::int8_t>(v); }
template <std::integral V> [[nodiscard]] constexpr bool is_sbyte(V v) noexcept { return is_in_domain<std::int8_t>(v); }
template <std::integral V> [[nodiscard]] constexpr std::int8_t clamp_to_sbyte(V v) noexcept { return clamp_to<std::int8_t>(v); }

// SHORT
template <std::integral V> [[nodiscard]] result<std::int16_t> parse_short(V v) { return parse_as<std::int16_t>(v); }
template <std::integral V> [[nodiscard]] constexpr bool is_short(V v) noexcept { return is_in_domain<std::int16_t>(v); }
template <std::integral V> [[nodiscard]] constexpr std::int16_t clamp_to_short(V v) noexcept { return clamp_to<std::int16_t>(v); }

// USHORT
template <std::integral V> [[nodiscard]] result<std::uint16_t> parse_ushort(V v) { return parse_as<std::uint16_t>(v); }
template <std::integral V> [[nodiscard]] constexpr bool is_ushort(V v) noexcept { return is_in_domain<std::uint16_t>(v); }
template <std::integral V> [[nodiscard]] constexpr std::uint16_t clamp_to_ushort(V v) noexcept { return clamp_to<std::uint16_t>(v); }

// INT
template <std::integral V> [[nodiscard]] result<std::int32_t> parse_int(V v) { return parse_as<std::int32_t>(v); }
template <std::integral V> [[nodiscard]] constexpr bool is_int(V v) noexcept { return is_in_domain<std::int32_t>(v); }
template <std::integral V> [[nodiscard]] constexpr std::int32_t clamp_to_int(V v) noexcept { return clamp_to<std::int32_t>(v); }

// UINT
template <std::integral V> [[nodiscard]] result<std::uint32_t> parse_uint(V v) { return parse_as<std::uint32_t>(v); }
template <std::integral V> [[nodiscard]] constexpr bool is_uint(V v) noexcept { return is_in_domain<std::uint32_t>(v); }
template <std::integral V> [[nodiscard]] constexpr std::uint32_t clamp_to_uint(V v) noexcept { return clamp_to<std::uint32_t>(v); }

// LONG
template <std::integral V> [[nodiscard]] result<std::int64_t> parse_long(V v) { return parse_as<std::int64_t>(v); }
template <std::integral V> [[nodiscard]] constexpr bool is_long(V v) noexcept { return is_in_domain<std::int64_t>(v); }
template <std::integral V> [[nodiscard]] constexpr std::int64_t clamp_to_long(V v) noexcept { return clamp_to<std::int64_t>(v); }

// ULONG
template <std::integral V> [[nodiscard]] result<std::uint64_t> parse_ulong(V v) { return parse_as<std::uint64_t>(v); }
template <std::integral V> [[nodiscard]] constexpr bool is_ulong(V v) noexcept { return is_in_domain<std::uint64_t>(v); }
template <std::integral V> [[nodiscard]] constexpr std::uint64_t clamp_to_ulong(V v) noexcept { return clamp_to<std::uint64_t>(v); }

} // namespace bitmem

#endif // BITMEM_PRIMITIVES_HPP_
