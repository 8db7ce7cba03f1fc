#include <bitmem/types.hpp>
#include <bitmem/result.hpp>
#include <bitmem/log.hpp>

#include <string>

namespace bitmem {

namespace {

std::string bit_position_message(int value) {
    return "Bit position " + std::to_string(value) + " out of range [" +
           std::to_string(MIN_BIT_POSITION) + ", " + std::to_string(MAX_BIT_POSITION) + "]";
}

} // namespace

bit_position::bit_position(int value) : value_(value) {
    if (value < MIN_BIT_POSITION || value > MAX_BIT_POSITION) {
        BITMEM_LOG_DEBUG("rejecting bit position %d", value);
        throw memory_error(memory_errc::invalid_bit_position, bit_position_message(value));
    }
}

result<bit_position> bit_position::parse(int value) {
    if (value < MIN_BIT_POSITION || value > MAX_BIT_POSITION) {
        return result<bit_position>::failure(bit_position_message(value));
    }
    return result<bit_position>::success(bit_position(value));
}

const char* to_string(endianness e) noexcept {
    switch (e) {
        case endianness::little: return "little";
        case endianness::big:    return "big";
    }
    return "unknown";
}

const char* to_string(access_kind kind) noexcept {
    switch (kind) {
        case access_kind::read:  return "read";
        case access_kind::write: return "write";
    }
    return "unknown";
}

const char* to_string(memory_errc err) noexcept {
    switch (err) {
        case memory_errc::address_out_of_bounds: return "address_out_of_bounds";
        case memory_errc::invalid_bit_count:     return "invalid_bit_count";
        case memory_errc::invalid_bit_position:  return "invalid_bit_position";
        case memory_errc::unsupported_byte_size: return "unsupported_byte_size";
    }
    return "unknown";
}

memory_error::memory_error(memory_errc code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

} // namespace bitmem
