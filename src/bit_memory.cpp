#include <bitmem/bit_memory.hpp>
#include <bitmem/log.hpp>

#include <cstdio>
#include <string>
#include <utility>

namespace bitmem {

// ============================================================================
// bit_memory
// ============================================================================

bit_memory::bit_memory(std::size_t size_in_bytes)
    : bytes_(size_in_bytes, 0) {}

bit_memory::bit_memory(std::vector<std::uint8_t> bytes) noexcept
    : bytes_(std::move(bytes)) {}

std::size_t bit_memory::index_of(byte_address address) const {
    if (address < 0 || static_cast<std::uint64_t>(address) >= bytes_.size()) {
        BITMEM_LOG_DEBUG("address %lld outside %zu-byte memory",
                         static_cast<long long>(address), bytes_.size());
        throw memory_error(memory_errc::address_out_of_bounds,
                           "Address " + std::to_string(address) + " out of bounds");
    }
    return static_cast<std::size_t>(address);
}

std::uint8_t bit_memory::load(byte_address address) const {
    return bytes_[index_of(address)];
}

void bit_memory::store(byte_address address, unsigned value) {
    bytes_[index_of(address)] = static_cast<std::uint8_t>(value & 0xFFu);
}

// ============================================================================
// Byte and Bit Access
// ============================================================================

bit_memory create_bit_memory(std::size_t size_in_bytes) {
    return bit_memory(size_in_bytes);
}

std::uint8_t get_byte(const bit_memory& memory, byte_address address) {
    return memory.load(address);
}

bit_memory set_byte(const bit_memory& memory, byte_address address, unsigned value) {
    bit_memory out = memory;
    out.store(address, value);
    return out;
}

bit get_bit(const bit_memory& memory, byte_address address, bit_position pos) {
    return is_bit_set_in_byte(memory.load(address), pos) ? bit::one : bit::zero;
}

bit_memory set_bit(const bit_memory& memory, byte_address address, bit_position pos, bit value) {
    const std::uint8_t current = memory.load(address);
    const std::uint8_t updated = value == bit::one ? set_bit_in_byte(current, pos)
                                                   : clear_bit_in_byte(current, pos);
    bit_memory out = memory;
    out.store(address, updated);
    return out;
}

bit_memory flip_bit(const bit_memory& memory, byte_address address, bit_position pos) {
    return set_bit(memory, address, pos, invert(get_bit(memory, address, pos)));
}

bit_memory set_bits(const bit_memory& memory, std::span<const bit_operation> ops) {
    bit_memory out = memory;
    for (const auto& op : ops) {
        const std::uint8_t current = out.load(op.address);
        out.store(op.address, op.value == bit::one ? set_bit_in_byte(current, op.position)
                                                   : clear_bit_in_byte(current, op.position));
    }
    return out;
}

std::vector<bit> get_bits(const bit_memory& memory, std::span<const bit_location> locations) {
    std::vector<bit> bits;
    bits.reserve(locations.size());
    for (const auto& loc : locations) {
        bits.push_back(get_bit(memory, loc.address, loc.position));
    }
    return bits;
}

// ============================================================================
// Bit Patterns
// ============================================================================

std::array<bit, 8> byte_to_bits(std::uint8_t byte) noexcept {
    std::array<bit, 8> bits{};
    for (int i = 0; i < BITS_PER_BYTE; ++i) {
        bits[static_cast<std::size_t>(i)] = ((byte >> i) & 0x01) ? bit::one : bit::zero;
    }
    return bits;
}

std::uint8_t bits_to_byte(std::span<const bit> bits) {
    if (bits.size() != static_cast<std::size_t>(BITS_PER_BYTE)) {
        BITMEM_LOG_DEBUG("bit array of length %zu given where 8 expected", bits.size());
        throw memory_error(memory_errc::invalid_bit_count, "Must provide exactly 8 bits");
    }

    std::uint8_t byte = 0;
    for (std::size_t i = 0; i < bits.size(); ++i) {
        if (bits[i] == bit::one) {
            byte = static_cast<std::uint8_t>(byte | (1u << i));
        }
    }
    return byte;
}

std::array<bit, 8> get_memory_bits(const bit_memory& memory, byte_address address) {
    return byte_to_bits(get_byte(memory, address));
}

bit_memory set_memory_bits(const bit_memory& memory, byte_address address, std::span<const bit> bits) {
    return set_byte(memory, address, bits_to_byte(bits));
}

// ============================================================================
// Analysis
// ============================================================================

namespace {

// Kernighan: each iteration clears the lowest set bit
int count_set_bits_in_byte(std::uint8_t byte) noexcept {
    int count = 0;
    unsigned bits = byte;
    while (bits != 0) {
        ++count;
        bits &= bits - 1;
    }
    return count;
}

int lowest_set_bit(std::uint8_t byte) noexcept {
    for (int i = 0; i < BITS_PER_BYTE; ++i) {
        if ((byte >> i) & 0x01) {
            return i;
        }
    }
    return -1;
}

} // namespace

std::size_t count_set_bits(const bit_memory& memory) noexcept {
    std::size_t total = 0;
    for (const std::uint8_t byte : memory.bytes()) {
        total += static_cast<std::size_t>(count_set_bits_in_byte(byte));
    }
    return total;
}

std::optional<bit_location> find_first_set_bit(const bit_memory& memory) noexcept {
    const auto bytes = memory.bytes();
    for (std::size_t addr = 0; addr < bytes.size(); ++addr) {
        if (bytes[addr] != 0) {
            bit_location loc;
            loc.address = static_cast<byte_address>(addr);
            loc.position = bit_position(lowest_set_bit(bytes[addr]));
            return loc;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Representation
// ============================================================================

std::string memory_to_hex(const bit_memory& memory) {
    std::string out;
    out.reserve(memory.size() * 3);
    for (const std::uint8_t byte : memory.bytes()) {
        if (!out.empty()) {
            out += ' ';
        }
        char buf[3];
        std::snprintf(buf, sizeof(buf), "%02x", byte);
        out += buf;
    }
    return out;
}

std::string memory_to_binary(const bit_memory& memory) {
    std::string out;
    out.reserve(memory.size() * 9);
    for (const std::uint8_t byte : memory.bytes()) {
        if (!out.empty()) {
            out += ' ';
        }
        for (int i = BITS_PER_BYTE - 1; i >= 0; --i) {
            out += ((byte >> i) & 0x01) ? '1' : '0';
        }
    }
    return out;
}

} // namespace bitmem
