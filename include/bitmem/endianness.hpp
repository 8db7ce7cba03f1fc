#ifndef BITMEM_ENDIANNESS_HPP_
#define BITMEM_ENDIANNESS_HPP_

#include <bitmem/bitmem_export.h>
#include <bitmem/bit_memory.hpp>
#include <bitmem/types.hpp>

#include <cstddef>
#include <cstdint>

namespace bitmem {

// ============================================================================
// Host Byte Order
// ============================================================================

/**
 * Probe the host byte order by storing 0x0102 in a native 16-bit word and
 * inspecting its first byte. Not cached; the answer never changes.
 */
[[nodiscard]] BITMEM_EXPORT endianness system_endianness() noexcept;

[[nodiscard]] inline bool is_little_endian() noexcept {
    return system_endianness() == endianness::little;
}

[[nodiscard]] inline bool is_big_endian() noexcept {
    return system_endianness() == endianness::big;
}

// ============================================================================
// Byte Swapping
// ============================================================================

[[nodiscard]] constexpr std::uint16_t swap_bytes16(std::uint16_t v) noexcept {
    return static_cast<std::uint16_t>(((v & 0x00FFu) << 8) | ((v >> 8) & 0x00FFu));
}

[[nodiscard]] constexpr std::uint32_t swap_bytes32(std::uint32_t v) noexcept {
    return ((v & 0x000000FFu) << 24) |
           ((v & 0x0000FF00u) << 8) |
           ((v & 0x00FF0000u) >> 8) |
           ((v & 0xFF000000u) >> 24);
}

[[nodiscard]] constexpr std::uint64_t swap_bytes64(std::uint64_t v) noexcept {
    std::uint64_t out = 0;
    for (int i = 0; i < 8; ++i) {
        out = (out << 8) | ((v >> (i * 8)) & 0xFFu);
    }
    return out;
}

/**
 * Convert the low byte_size bytes of value between byte orders.
 * Returns value unchanged when from == to.
 * @throws memory_error (unsupported_byte_size) unless byte_size is 2, 4 or 8
 */
[[nodiscard]] BITMEM_EXPORT std::uint64_t convert_endianness(std::uint64_t value,
                                                             endianness from,
                                                             endianness to,
                                                             int byte_size);

// ============================================================================
// Bounds Checking
// ============================================================================

/**
 * Validate that [address, address + size) lies inside memory.
 * @return The first byte index of the range
 * @throws memory_error (address_out_of_bounds) with
 *         "Address {addr} out of bounds for {size*8}-bit {read|write}"
 */
BITMEM_EXPORT std::size_t check_bounds(const bit_memory& memory,
                                       byte_address address,
                                       std::size_t size,
                                       access_kind kind);

/**
 * As check_bounds, for an address computed in floating point. Negative
 * addresses are rejected as given; otherwise the address is truncated
 * toward zero before the range test.
 */
BITMEM_EXPORT std::size_t check_fractional_bounds(const bit_memory& memory,
                                                  double address,
                                                  std::size_t size,
                                                  access_kind kind);

// ============================================================================
// Multi-byte Integer Access
// ============================================================================
//
// Writes return a copy of memory with the value stored; the input memory is
// never modified, so a failed write leaves it intact. Values wider than the
// slot wrap (two's complement truncation). All byte orders default to the
// host's.

[[nodiscard]] BITMEM_EXPORT bit_memory write_int16(const bit_memory& memory, byte_address address,
                                                   std::int64_t value,
                                                   endianness order = system_endianness());
[[nodiscard]] BITMEM_EXPORT std::int16_t read_int16(const bit_memory& memory, byte_address address,
                                                    endianness order = system_endianness());

[[nodiscard]] BITMEM_EXPORT bit_memory write_uint16(const bit_memory& memory, byte_address address,
                                                    std::int64_t value,
                                                    endianness order = system_endianness());
[[nodiscard]] BITMEM_EXPORT std::uint16_t read_uint16(const bit_memory& memory, byte_address address,
                                                      endianness order = system_endianness());

[[nodiscard]] BITMEM_EXPORT bit_memory write_int32(const bit_memory& memory, byte_address address,
                                                   std::int64_t value,
                                                   endianness order = system_endianness());
[[nodiscard]] BITMEM_EXPORT std::int32_t read_int32(const bit_memory& memory, byte_address address,
                                                    endianness order = system_endianness());

[[nodiscard]] BITMEM_EXPORT bit_memory write_uint32(const bit_memory& memory, byte_address address,
                                                    std::int64_t value,
                                                    endianness order = system_endianness());
[[nodiscard]] BITMEM_EXPORT std::uint32_t read_uint32(const bit_memory& memory, byte_address address,
                                                      endianness order = system_endianness());

[[nodiscard]] BITMEM_EXPORT bit_memory write_int64(const bit_memory& memory, byte_address address,
                                                   std::int64_t value,
                                                   endianness order = system_endianness());
[[nodiscard]] BITMEM_EXPORT std::int64_t read_int64(const bit_memory& memory, byte_address address,
                                                    endianness order = system_endianness());

// Same bit pattern as write_int64
[[nodiscard]] BITMEM_EXPORT bit_memory write_uint64(const bit_memory& memory, byte_address address,
                                                    std::uint64_t value,
                                                    endianness order = system_endianness());
[[nodiscard]] BITMEM_EXPORT std::uint64_t read_uint64(const bit_memory& memory, byte_address address,
                                                      endianness order = system_endianness());

// ============================================================================
// IEEE-754 Access
// ============================================================================

/**
 * Store value as binary32. Magnitudes beyond the binary32 range become the
 * correspondingly signed infinity.
 */
[[nodiscard]] BITMEM_EXPORT bit_memory write_float32(const bit_memory& memory, byte_address address,
                                                     double value,
                                                     endianness order = system_endianness());
[[nodiscard]] BITMEM_EXPORT float read_float32(const bit_memory& memory, byte_address address,
                                               endianness order = system_endianness());

[[nodiscard]] BITMEM_EXPORT bit_memory write_float64(const bit_memory& memory, byte_address address,
                                                     double value,
                                                     endianness order = system_endianness());
[[nodiscard]] BITMEM_EXPORT double read_float64(const bit_memory& memory, byte_address address,
                                                endianness order = system_endianness());

} // namespace bitmem

#endif // BITMEM_ENDIANNESS_HPP_
