#ifndef BITMEM_BITMEM_HPP_
#define BITMEM_BITMEM_HPP_

#include <bitmem/bitmem_export.h>
#include <bitmem/types.hpp>
#include <bitmem/result.hpp>
#include <bitmem/primitives.hpp>
#include <bitmem/bit_memory.hpp>
#include <bitmem/endianness.hpp>
#include <bitmem/log.hpp>

namespace bitmem {

// All public API is included via the headers above.
// See:
//   - types.hpp:       bit, bit_position, endianness, memory_errc, memory_error
//   - result.hpp:      result<T>, collect()
//   - primitives.hpp:  BYTE..ULONG value domains (parse, clamp, compare)
//   - bit_memory.hpp:  bit_memory and bit/byte accessors
//   - endianness.hpp:  byte order probe, byte swaps, multi-byte read/write
//   - log.hpp:         leveled diagnostics on stderr

} // namespace bitmem

#endif // BITMEM_BITMEM_HPP_
