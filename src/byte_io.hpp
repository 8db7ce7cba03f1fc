#pragma once

#include <bitmem/bit_memory.hpp>
#include <bitmem/types.hpp>

#include <cstddef>
#include <cstdint>

namespace bitmem {

// Assemble size bytes starting at start into an unsigned pattern.
// Little: byte 0 is least significant. Big: byte 0 is most significant.
inline std::uint64_t load_pattern(const bit_memory& memory, std::size_t start,
                                  std::size_t size, endianness order) {
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < size; ++i) {
        const std::uint64_t byte = memory.load(static_cast<byte_address>(start + i));
        const std::size_t shift = order == endianness::little ? i * 8 : (size - 1 - i) * 8;
        value |= byte << shift;
    }
    return value;
}

// Decompose the low size bytes of value into memory at start, in place
inline void store_pattern(bit_memory& memory, std::size_t start, std::size_t size,
                          std::uint64_t value, endianness order) {
    for (std::size_t i = 0; i < size; ++i) {
        const std::size_t shift = order == endianness::little ? i * 8 : (size - 1 - i) * 8;
        memory.store(static_cast<byte_address>(start + i),
                     static_cast<unsigned>((value >> shift) & 0xFFu));
    }
}

} // namespace bitmem
