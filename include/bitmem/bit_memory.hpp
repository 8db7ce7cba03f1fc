#ifndef BITMEM_BIT_MEMORY_HPP_
#define BITMEM_BIT_MEMORY_HPP_

#include <bitmem/bitmem_export.h>
#include <bitmem/types.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace bitmem {

// ============================================================================
// Bit Memory
// ============================================================================

/**
 * Fixed-length, byte-addressable buffer.
 *
 * The free functions below treat it as a value: every "mutation" returns a
 * new buffer and leaves its argument untouched. The member accessors are the
 * bounds-checked primitives those functions are built on.
 */
class BITMEM_EXPORT bit_memory {
public:
    bit_memory() = default;
    explicit bit_memory(std::size_t size_in_bytes);
    explicit bit_memory(std::vector<std::uint8_t> bytes) noexcept;

    [[nodiscard]] std::size_t size() const noexcept { return bytes_.size(); }
    [[nodiscard]] bool empty() const noexcept { return bytes_.empty(); }
    [[nodiscard]] std::span<const std::uint8_t> bytes() const noexcept { return bytes_; }

    /**
     * @throws memory_error (address_out_of_bounds) unless 0 <= address < size()
     */
    [[nodiscard]] std::uint8_t load(byte_address address) const;

    /**
     * Store the low 8 bits of value at address, in place.
     * @throws memory_error (address_out_of_bounds) unless 0 <= address < size()
     */
    void store(byte_address address, unsigned value);

    friend bool operator==(const bit_memory&, const bit_memory&) = default;

private:
    [[nodiscard]] std::size_t index_of(byte_address address) const;

    std::vector<std::uint8_t> bytes_;
};

// ============================================================================
// Single Byte Helpers
// ============================================================================

[[nodiscard]] constexpr std::uint8_t create_bit_mask(bit_position pos) noexcept {
    return static_cast<std::uint8_t>(1u << pos.value());
}

[[nodiscard]] constexpr std::uint8_t set_bit_in_byte(std::uint8_t byte, bit_position pos) noexcept {
    return static_cast<std::uint8_t>(byte | create_bit_mask(pos));
}

[[nodiscard]] constexpr std::uint8_t clear_bit_in_byte(std::uint8_t byte, bit_position pos) noexcept {
    return static_cast<std::uint8_t>(byte & ~create_bit_mask(pos) & 0xFF);
}

[[nodiscard]] constexpr bool is_bit_set_in_byte(std::uint8_t byte, bit_position pos) noexcept {
    return (byte & create_bit_mask(pos)) != 0;
}

// ============================================================================
// Memory Operations
// ============================================================================

[[nodiscard]] BITMEM_EXPORT bit_memory create_bit_memory(std::size_t size_in_bytes);

[[nodiscard]] BITMEM_EXPORT std::uint8_t get_byte(const bit_memory& memory, byte_address address);

/**
 * Return a copy of memory with the byte at address replaced.
 * The value is masked to 8 bits.
 */
[[nodiscard]] BITMEM_EXPORT bit_memory set_byte(const bit_memory& memory,
                                                byte_address address,
                                                unsigned value);

[[nodiscard]] BITMEM_EXPORT bit get_bit(const bit_memory& memory,
                                        byte_address address,
                                        bit_position pos);

[[nodiscard]] BITMEM_EXPORT bit_memory set_bit(const bit_memory& memory,
                                               byte_address address,
                                               bit_position pos,
                                               bit value);

[[nodiscard]] BITMEM_EXPORT bit_memory flip_bit(const bit_memory& memory,
                                                byte_address address,
                                                bit_position pos);

/**
 * Apply bit writes in order. Later operations see earlier ones.
 * Stops at the first failing operation; memory is never modified.
 */
[[nodiscard]] BITMEM_EXPORT bit_memory set_bits(const bit_memory& memory,
                                                std::span<const bit_operation> ops);

[[nodiscard]] BITMEM_EXPORT std::vector<bit> get_bits(const bit_memory& memory,
                                                      std::span<const bit_location> locations);

// Bit patterns are LSB-first: index 0 holds bit 0
[[nodiscard]] BITMEM_EXPORT std::array<bit, 8> byte_to_bits(std::uint8_t byte) noexcept;

/**
 * @throws memory_error (invalid_bit_count) unless bits.size() == 8
 */
[[nodiscard]] BITMEM_EXPORT std::uint8_t bits_to_byte(std::span<const bit> bits);

[[nodiscard]] BITMEM_EXPORT std::array<bit, 8> get_memory_bits(const bit_memory& memory,
                                                               byte_address address);

[[nodiscard]] BITMEM_EXPORT bit_memory set_memory_bits(const bit_memory& memory,
                                                       byte_address address,
                                                       std::span<const bit> bits);

// ============================================================================
// Analysis and Inspection
// ============================================================================

[[nodiscard]] BITMEM_EXPORT std::size_t count_set_bits(const bit_memory& memory) noexcept;

[[nodiscard]] BITMEM_EXPORT std::optional<bit_location> find_first_set_bit(const bit_memory& memory) noexcept;

[[nodiscard]] inline std::size_t memory_size(const bit_memory& memory) noexcept {
    return memory.size();
}

[[nodiscard]] inline std::size_t total_bit_capacity(const bit_memory& memory) noexcept {
    return memory.size() * BITS_PER_BYTE;
}

[[nodiscard]] BITMEM_EXPORT std::string memory_to_hex(const bit_memory& memory);
[[nodiscard]] BITMEM_EXPORT std::string memory_to_binary(const bit_memory& memory);

[[nodiscard]] constexpr bool is_valid_bit_position(int position) noexcept {
    return position >= MIN_BIT_POSITION && position <= MAX_BIT_POSITION;
}

[[nodiscard]] inline bool is_valid_address(const bit_memory& memory, byte_address address) noexcept {
    return address >= 0 && static_cast<std::uint64_t>(address) < memory.size();
}

} // namespace bitmem

#endif // BITMEM_BIT_MEMORY_HPP_
