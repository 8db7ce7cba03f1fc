#ifndef BITMEM_TYPES_HPP_
#define BITMEM_TYPES_HPP_

#include <bitmem/bitmem_export.h>

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace bitmem {

// ============================================================================
// Addresses and Bits
// ============================================================================

using byte_address = std::int64_t;

enum class bit : std::uint8_t {
    zero = 0,
    one = 1
};

[[nodiscard]] constexpr bit invert(bit b) noexcept {
    return b == bit::one ? bit::zero : bit::one;
}

constexpr int BITS_PER_BYTE = 8;
constexpr int MIN_BIT_POSITION = 0;
constexpr int MAX_BIT_POSITION = 7;

template <typename T>
class result;

/**
 * Position of a bit within a byte, LSB-first (0 = LSB, 7 = MSB).
 * Always holds a value in [0, 7].
 */
class BITMEM_EXPORT bit_position {
public:
    constexpr bit_position() noexcept = default;

    /**
     * @param value Bit index in [0, 7]
     * @throws memory_error (invalid_bit_position) if value is out of range
     */
    explicit bit_position(int value);

    [[nodiscard]] static result<bit_position> parse(int value);

    [[nodiscard]] constexpr int value() const noexcept { return value_; }

    friend constexpr bool operator==(bit_position, bit_position) noexcept = default;

private:
    int value_ = 0;
};

struct bit_location {
    byte_address address = 0;
    bit_position position;

    friend bool operator==(const bit_location&, const bit_location&) = default;
};

struct bit_operation {
    byte_address address = 0;
    bit_position position;
    bit value = bit::zero;
};

// ============================================================================
// Byte Order
// ============================================================================

enum class endianness {
    little,
    big
};

[[nodiscard]] BITMEM_EXPORT const char* to_string(endianness e) noexcept;

enum class access_kind {
    read,
    write
};

[[nodiscard]] BITMEM_EXPORT const char* to_string(access_kind kind) noexcept;

// ============================================================================
// Errors
// ============================================================================

enum class memory_errc {
    address_out_of_bounds = 32,
    invalid_bit_count = 33,
    invalid_bit_position = 34,
    unsupported_byte_size = 35
};

[[nodiscard]] BITMEM_EXPORT const char* to_string(memory_errc err) noexcept;

/**
 * Thrown when a call violates the memory API contract
 * (bounds, bit-array length, byte size). The call has no effect.
 */
class BITMEM_EXPORT memory_error : public std::runtime_error {
public:
    memory_error(memory_errc code, const std::string& message);

    [[nodiscard]] memory_errc code() const noexcept { return code_; }

private:
    memory_errc code_;
};

} // namespace bitmem

#endif // BITMEM_TYPES_HPP_
