#include <bitmem/endianness.hpp>
#include <bitmem/log.hpp>
#include "byte_io.hpp"

#include <bit>
#include <charconv>
#include <cmath>
#include <cstring>
#include <limits>
#include <string>
#include <system_error>

namespace bitmem {

// ============================================================================
// Host Byte Order
// ============================================================================

endianness system_endianness() noexcept {
    const std::uint16_t probe = 0x0102;
    std::uint8_t bytes[2] = {0, 0};
    std::memcpy(bytes, &probe, sizeof(probe));
    return bytes[0] == 0x01 ? endianness::big : endianness::little;
}

std::uint64_t convert_endianness(std::uint64_t value, endianness from, endianness to, int byte_size) {
    if (from == to) {
        return value;
    }

    switch (byte_size) {
        case 2: return swap_bytes16(static_cast<std::uint16_t>(value));
        case 4: return swap_bytes32(static_cast<std::uint32_t>(value));
        case 8: return swap_bytes64(value);
        default:
            break;
    }

    BITMEM_LOG_DEBUG("convert_endianness: byte size %d rejected", byte_size);
    throw memory_error(memory_errc::unsupported_byte_size,
                       "Unsupported byte size: " + std::to_string(byte_size));
}

// ============================================================================
// Bounds Checking
// ============================================================================

namespace {

[[noreturn]] void throw_out_of_bounds(const std::string& address, std::size_t size, access_kind kind) {
    std::string msg = "Address " + address + " out of bounds for " +
                      std::to_string(size * 8) + "-bit " + to_string(kind);
    BITMEM_LOG_DEBUG("%s", msg.c_str());
    throw memory_error(memory_errc::address_out_of_bounds, msg);
}

// Shortest round-trip form: 15.0 prints as "15", -0.5 as "-0.5"
std::string format_address(double address) {
    char buf[32];
    const auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), address);
    if (ec != std::errc{}) {
        return std::to_string(address);
    }
    return std::string(buf, end);
}

// Whole range [start, start + size) must fit; written to avoid overflow
bool range_fits(const bit_memory& memory, std::uint64_t start, std::size_t size) noexcept {
    return size <= memory.size() && start <= memory.size() - size;
}

} // namespace

std::size_t check_bounds(const bit_memory& memory, byte_address address,
                         std::size_t size, access_kind kind) {
    if (address < 0 || !range_fits(memory, static_cast<std::uint64_t>(address), size)) {
        throw_out_of_bounds(std::to_string(address), size, kind);
    }
    return static_cast<std::size_t>(address);
}

std::size_t check_fractional_bounds(const bit_memory& memory, double address,
                                    std::size_t size, access_kind kind) {
    if (std::isnan(address) || address < 0.0) {
        throw_out_of_bounds(format_address(address), size, kind);
    }

    const double truncated = std::floor(address);
    if (truncated >= static_cast<double>(std::numeric_limits<std::size_t>::max()) ||
        !range_fits(memory, static_cast<std::uint64_t>(truncated), size)) {
        throw_out_of_bounds(format_address(truncated), size, kind);
    }
    return static_cast<std::size_t>(truncated);
}

// ============================================================================
// Integer Access
// ============================================================================

namespace {

bit_memory write_pattern(const bit_memory& memory, byte_address address, std::size_t size,
                         std::uint64_t pattern, endianness order) {
    const std::size_t start = check_bounds(memory, address, size, access_kind::write);
    bit_memory out = memory;
    store_pattern(out, start, size, pattern, order);
    return out;
}

std::uint64_t read_pattern(const bit_memory& memory, byte_address address, std::size_t size,
                           endianness order) {
    const std::size_t start = check_bounds(memory, address, size, access_kind::read);
    return load_pattern(memory, start, size, order);
}

} // namespace

// Signed values are stored as their two's complement pattern; the cast to
// std::uint64_t is arithmetic modulo 2^64 and the store keeps the low bytes.

bit_memory write_int16(const bit_memory& memory, byte_address address, std::int64_t value, endianness order) {
    return write_pattern(memory, address, 2, static_cast<std::uint64_t>(value), order);
}

std::int16_t read_int16(const bit_memory& memory, byte_address address, endianness order) {
    return static_cast<std::int16_t>(static_cast<std::uint16_t>(read_pattern(memory, address, 2, order)));
}

bit_memory write_uint16(const bit_memory& memory, byte_address address, std::int64_t value, endianness order) {
    return write_pattern(memory, address, 2, static_cast<std::uint64_t>(value), order);
}

std::uint16_t read_uint16(const bit_memory& memory, byte_address address, endianness order) {
    return static_cast<std::uint16_t>(read_pattern(memory, address, 2, order));
}

bit_memory write_int32(const bit_memory& memory, byte_address address, std::int64_t value, endianness order) {
    return write_pattern(memory, address, 4, static_cast<std::uint64_t>(value), order);
}

std::int32_t read_int32(const bit_memory& memory, byte_address address, endianness order) {
    return static_cast<std::int32_t>(static_cast<std::uint32_t>(read_pattern(memory, address, 4, order)));
}

bit_memory write_uint32(const bit_memory& memory, byte_address address, std::int64_t value, endianness order) {
    return write_pattern(memory, address, 4, static_cast<std::uint64_t>(value), order);
}

std::uint32_t read_uint32(const bit_memory& memory, byte_address address, endianness order) {
    return static_cast<std::uint32_t>(read_pattern(memory, address, 4, order));
}

bit_memory write_int64(const bit_memory& memory, byte_address address, std::int64_t value, endianness order) {
    return write_pattern(memory, address, 8, static_cast<std::uint64_t>(value), order);
}

std::int64_t read_int64(const bit_memory& memory, byte_address address, endianness order) {
    return static_cast<std::int64_t>(read_pattern(memory, address, 8, order));
}

bit_memory write_uint64(const bit_memory& memory, byte_address address, std::uint64_t value, endianness order) {
    return write_int64(memory, address, static_cast<std::int64_t>(value), order);
}

std::uint64_t read_uint64(const bit_memory& memory, byte_address address, endianness order) {
    return static_cast<std::uint64_t>(read_int64(memory, address, order));
}

// ============================================================================
// IEEE-754 Access
// ============================================================================

namespace {

// Smallest magnitude that rounds to infinity in binary32:
// FLT_MAX plus half an ulp, where ties go to the even (infinite) neighbour
constexpr double FLOAT32_OVERFLOW_THRESHOLD = 0x1.ffffffp127;

float narrow_to_float32(double value) noexcept {
    if (std::isfinite(value) && std::fabs(value) >= FLOAT32_OVERFLOW_THRESHOLD) {
        constexpr float inf = std::numeric_limits<float>::infinity();
        return std::signbit(value) ? -inf : inf;
    }
    return static_cast<float>(value);
}

} // namespace

bit_memory write_float32(const bit_memory& memory, byte_address address, double value, endianness order) {
    const std::uint32_t pattern = std::bit_cast<std::uint32_t>(narrow_to_float32(value));
    return write_pattern(memory, address, 4, pattern, order);
}

float read_float32(const bit_memory& memory, byte_address address, endianness order) {
    return std::bit_cast<float>(static_cast<std::uint32_t>(read_pattern(memory, address, 4, order)));
}

bit_memory write_float64(const bit_memory& memory, byte_address address, double value, endianness order) {
    return write_pattern(memory, address, 8, std::bit_cast<std::uint64_t>(value), order);
}

double read_float64(const bit_memory& memory, byte_address address, endianness order) {
    return std::bit_cast<double>(read_pattern(memory, address, 8, order));
}

} // namespace bitmem
