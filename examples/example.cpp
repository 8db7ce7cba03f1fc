#include <bitmem/bitmem.hpp>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] <type> <value>\n";
    std::cerr << "Encodes a value in both byte orders and dumps the buffer.\n\n";
    std::cerr << "Types:\n";
    std::cerr << "  int16 uint16 int32 uint32 int64 uint64 float32 float64\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  -e, --endianness  Print host byte order\n";
    std::cerr << "  -v, --verbose     Enable debug diagnostics\n";
    std::cerr << "  -h, --help        Show this help\n";
}

struct value_type {
    const char* name;
    std::size_t size;
    bool is_float;
    bool is_signed;
};

constexpr value_type VALUE_TYPES[] = {
    {"int16", 2, false, true},   {"uint16", 2, false, false},
    {"int32", 4, false, true},   {"uint32", 4, false, false},
    {"int64", 8, false, true},   {"uint64", 8, false, false},
    {"float32", 4, true, true},  {"float64", 8, true, true},
};

const value_type* find_type(std::string_view name) {
    for (const auto& type : VALUE_TYPES) {
        if (name == type.name) {
            return &type;
        }
    }
    return nullptr;
}

// Integers go through the value-domain parsers so out-of-range input is
// reported instead of silently wrapping.
bitmem::result<std::int64_t> parse_signed(std::string_view text, std::size_t size) {
    std::int64_t value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return bitmem::result<std::int64_t>::failure("Not an integer: " + std::string(text));
    }
    switch (size) {
        case 2: return bitmem::parse_short(value).map([](std::int16_t v) { return std::int64_t{v}; });
        case 4: return bitmem::parse_int(value).map([](std::int32_t v) { return std::int64_t{v}; });
        default: return bitmem::parse_long(value);
    }
}

bitmem::result<std::uint64_t> parse_unsigned(std::string_view text, std::size_t size) {
    // Parsed wide and signed first so "-1" reaches the range check
    if (!text.empty() && text.front() == '-') {
        std::int64_t negative = 0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), negative);
        if (ec != std::errc{} || ptr != text.data() + text.size()) {
            return bitmem::result<std::uint64_t>::failure("Not an integer: " + std::string(text));
        }
        return bitmem::parse_ulong(negative);
    }

    std::uint64_t value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return bitmem::result<std::uint64_t>::failure("Not an integer: " + std::string(text));
    }
    switch (size) {
        case 2: return bitmem::parse_ushort(value).map([](std::uint16_t v) { return std::uint64_t{v}; });
        case 4: return bitmem::parse_uint(value).map([](std::uint32_t v) { return std::uint64_t{v}; });
        default: return bitmem::parse_ulong(value);
    }
}

bitmem::result<double> parse_float(const std::string& text) {
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (text.empty() || end != text.c_str() + text.size()) {
        return bitmem::result<double>::failure("Not a number: " + text);
    }
    return bitmem::result<double>::success(value);
}

bitmem::bit_memory encode(const value_type& type, const std::string& text, bitmem::endianness order) {
    const auto memory = bitmem::create_bit_memory(type.size);

    if (type.is_float) {
        const auto value = parse_float(text);
        if (!value) {
            throw std::invalid_argument(value.error());
        }
        return type.size == 4 ? bitmem::write_float32(memory, 0, value.value(), order)
                              : bitmem::write_float64(memory, 0, value.value(), order);
    }

    if (type.is_signed) {
        const auto value = parse_signed(text, type.size);
        if (!value) {
            throw std::invalid_argument(value.error());
        }
        switch (type.size) {
            case 2: return bitmem::write_int16(memory, 0, value.value(), order);
            case 4: return bitmem::write_int32(memory, 0, value.value(), order);
            default: return bitmem::write_int64(memory, 0, value.value(), order);
        }
    }

    const auto value = parse_unsigned(text, type.size);
    if (!value) {
        throw std::invalid_argument(value.error());
    }
    switch (type.size) {
        case 2: return bitmem::write_uint16(memory, 0, static_cast<std::int64_t>(value.value()), order);
        case 4: return bitmem::write_uint32(memory, 0, static_cast<std::int64_t>(value.value()), order);
        default: return bitmem::write_uint64(memory, 0, value.value(), order);
    }
}

std::string decode(const value_type& type, const bitmem::bit_memory& memory, bitmem::endianness order) {
    const std::string_view name = type.name;
    if (name == "int16") return std::to_string(bitmem::read_int16(memory, 0, order));
    if (name == "uint16") return std::to_string(bitmem::read_uint16(memory, 0, order));
    if (name == "int32") return std::to_string(bitmem::read_int32(memory, 0, order));
    if (name == "uint32") return std::to_string(bitmem::read_uint32(memory, 0, order));
    if (name == "int64") return std::to_string(bitmem::read_int64(memory, 0, order));
    if (name == "uint64") return std::to_string(bitmem::read_uint64(memory, 0, order));
    if (name == "float32") return std::to_string(bitmem::read_float32(memory, 0, order));
    return std::to_string(bitmem::read_float64(memory, 0, order));
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    int arg = 1;
    for (; arg < argc && argv[arg][0] == '-'; ++arg) {
        if (std::strcmp(argv[arg], "-h") == 0 || std::strcmp(argv[arg], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }
        if (std::strcmp(argv[arg], "-e") == 0 || std::strcmp(argv[arg], "--endianness") == 0) {
            std::cout << "Host byte order: " << bitmem::to_string(bitmem::system_endianness()) << "\n";
            if (argc == 2) {
                return 0;
            }
            continue;
        }
        if (std::strcmp(argv[arg], "-v") == 0 || std::strcmp(argv[arg], "--verbose") == 0) {
            bitmem::set_log_level(bitmem::log_level::debug);
            continue;
        }
        std::cerr << "Error: Unknown option: " << argv[arg] << "\n";
        return 1;
    }

    if (argc - arg != 2) {
        print_usage(argv[0]);
        return 1;
    }

    const auto* type = find_type(argv[arg]);
    if (!type) {
        std::cerr << "Error: Unknown type: " << argv[arg] << "\n";
        return 1;
    }
    const std::string text = argv[arg + 1];

    BITMEM_LOG_INFO("encoding %s as %s", text.c_str(), type->name);

    for (const auto order : {bitmem::endianness::little, bitmem::endianness::big}) {
        try {
            const auto memory = encode(*type, text, order);
            std::cout << bitmem::to_string(order) << "-endian:\n";
            std::cout << "  hex:    " << bitmem::memory_to_hex(memory) << "\n";
            std::cout << "  binary: " << bitmem::memory_to_binary(memory) << "\n";
            std::cout << "  read:   " << decode(*type, memory, order) << "\n";
        } catch (const std::invalid_argument& e) {
            BITMEM_LOG_ERROR("%s", e.what());
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        } catch (const bitmem::memory_error& e) {
            BITMEM_LOG_ERROR("%s (%s)", e.what(), bitmem::to_string(e.code()));
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
    }

    return 0;
}
