#include <doctest/doctest.h>
#include <bitmem/bitmem.hpp>

#include <array>
#include <cstdint>
#include <utility>
#include <vector>

using bitmem::bit;
using bitmem::bit_position;

namespace {

bitmem::bit_memory memory_of(std::vector<std::uint8_t> bytes) {
    return bitmem::bit_memory(std::move(bytes));
}

} // namespace

TEST_CASE("Bit memory: creation") {
    SUBCASE("Zero filled") {
        auto mem = bitmem::create_bit_memory(4);
        CHECK(mem.size() == 4);
        for (const auto byte : mem.bytes()) {
            CHECK(byte == 0);
        }
    }

    SUBCASE("Empty memory is valid") {
        auto mem = bitmem::create_bit_memory(0);
        CHECK(mem.empty());
        CHECK(bitmem::memory_size(mem) == 0);
        CHECK_THROWS_AS((void)bitmem::get_byte(mem, 0), bitmem::memory_error);
        CHECK_THROWS_AS((void)bitmem::set_bit(mem, 0, bit_position(0), bit::one), bitmem::memory_error);
    }

    SUBCASE("Capacity") {
        auto mem = bitmem::create_bit_memory(16);
        CHECK(bitmem::memory_size(mem) == 16);
        CHECK(bitmem::total_bit_capacity(mem) == 128);
    }
}

TEST_CASE("Bit memory: byte access") {
    auto mem = bitmem::create_bit_memory(4);

    SUBCASE("Set returns new memory, input untouched") {
        auto updated = bitmem::set_byte(mem, 2, 0xAB);
        CHECK(bitmem::get_byte(updated, 2) == 0xAB);
        CHECK(bitmem::get_byte(mem, 2) == 0x00);
        CHECK(bitmem::get_byte(updated, 0) == 0x00);
        CHECK(bitmem::get_byte(updated, 1) == 0x00);
        CHECK(bitmem::get_byte(updated, 3) == 0x00);
    }

    SUBCASE("Value is masked to 8 bits") {
        auto updated = bitmem::set_byte(mem, 0, 0x1FF);
        CHECK(bitmem::get_byte(updated, 0) == 0xFF);
        CHECK(bitmem::get_byte(bitmem::set_byte(mem, 0, 256), 0) == 0x00);
    }

    SUBCASE("Out of bounds") {
        CHECK_THROWS_WITH((void)bitmem::get_byte(mem, 4), "Address 4 out of bounds");
        CHECK_THROWS_WITH((void)bitmem::set_byte(mem, 10, 1), "Address 10 out of bounds");
    }

    SUBCASE("Negative addresses are rejected") {
        CHECK_THROWS_WITH((void)bitmem::get_byte(mem, -1), "Address -1 out of bounds");
        CHECK_THROWS_AS((void)bitmem::set_byte(mem, -1, 1), bitmem::memory_error);
        CHECK_THROWS_AS((void)bitmem::get_bit(mem, -3, bit_position(0)), bitmem::memory_error);
    }

    SUBCASE("Error code") {
        try {
            (void)bitmem::get_byte(mem, 99);
            FAIL("expected memory_error");
        } catch (const bitmem::memory_error& e) {
            CHECK(e.code() == bitmem::memory_errc::address_out_of_bounds);
        }
    }
}

TEST_CASE("Bit memory: bit access") {
    auto mem = bitmem::create_bit_memory(2);

    SUBCASE("Set and get every position") {
        for (int pos = 0; pos < 8; ++pos) {
            auto updated = bitmem::set_bit(mem, 1, bit_position(pos), bit::one);
            CHECK(bitmem::get_byte(updated, 1) == (1 << pos));
            CHECK(bitmem::get_bit(updated, 1, bit_position(pos)) == bit::one);
            CHECK(bitmem::get_byte(updated, 0) == 0);
        }
    }

    SUBCASE("Clearing leaves other bits") {
        auto full = bitmem::set_byte(mem, 0, 0xFF);
        auto cleared = bitmem::set_bit(full, 0, bit_position(3), bit::zero);
        CHECK(bitmem::get_byte(cleared, 0) == 0xF7);
        CHECK(bitmem::get_byte(full, 0) == 0xFF);
    }

    SUBCASE("Flip") {
        auto once = bitmem::flip_bit(mem, 0, bit_position(7));
        CHECK(bitmem::get_byte(once, 0) == 0x80);
        auto twice = bitmem::flip_bit(once, 0, bit_position(7));
        CHECK(twice == mem);
    }

    SUBCASE("Out of bounds") {
        CHECK_THROWS_WITH((void)bitmem::get_bit(mem, 2, bit_position(0)), "Address 2 out of bounds");
        CHECK_THROWS_AS((void)bitmem::flip_bit(mem, 5, bit_position(1)), bitmem::memory_error);
    }
}

TEST_CASE("Bit memory: batch operations") {
    auto mem = bitmem::create_bit_memory(2);

    SUBCASE("Applied in order") {
        const std::vector<bitmem::bit_operation> ops = {
            {0, bit_position(0), bit::one},
            {0, bit_position(1), bit::one},
            {1, bit_position(7), bit::one},
            {0, bit_position(0), bit::zero},
        };
        auto updated = bitmem::set_bits(mem, ops);
        CHECK(bitmem::get_byte(updated, 0) == 0x02);
        CHECK(bitmem::get_byte(updated, 1) == 0x80);

        const std::vector<bitmem::bit_location> locs = {
            {0, bit_position(0)}, {0, bit_position(1)}, {1, bit_position(7)}, {1, bit_position(6)},
        };
        const auto bits = bitmem::get_bits(updated, locs);
        CHECK(bits == std::vector<bit>{bit::zero, bit::one, bit::one, bit::zero});
    }

    SUBCASE("Stops at first failure, input untouched") {
        const std::vector<bitmem::bit_operation> ops = {
            {0, bit_position(0), bit::one},
            {9, bit_position(0), bit::one},
            {1, bit_position(0), bit::one},
        };
        CHECK_THROWS_WITH((void)bitmem::set_bits(mem, ops), "Address 9 out of bounds");
        CHECK(bitmem::count_set_bits(mem) == 0);

        const std::vector<bitmem::bit_location> locs = {{0, bit_position(0)}, {4, bit_position(0)}};
        CHECK_THROWS_AS((void)bitmem::get_bits(mem, locs), bitmem::memory_error);
    }

    SUBCASE("Empty batch") {
        CHECK(bitmem::set_bits(mem, {}) == mem);
        CHECK(bitmem::get_bits(mem, {}).empty());
    }
}

TEST_CASE("Bit memory: bit patterns") {
    SUBCASE("LSB first") {
        const auto bits = bitmem::byte_to_bits(0x05);
        CHECK(bits[0] == bit::one);
        CHECK(bits[1] == bit::zero);
        CHECK(bits[2] == bit::one);
        for (std::size_t i = 3; i < 8; ++i) {
            CHECK(bits[i] == bit::zero);
        }
    }

    SUBCASE("Round trip for every byte") {
        for (int b = 0; b < 256; ++b) {
            const auto bits = bitmem::byte_to_bits(static_cast<std::uint8_t>(b));
            CHECK(bitmem::bits_to_byte(bits) == b);
        }
    }

    SUBCASE("Wrong length") {
        const std::vector<bit> seven(7, bit::one);
        const std::vector<bit> nine(9, bit::zero);
        CHECK_THROWS_WITH((void)bitmem::bits_to_byte(seven), "Must provide exactly 8 bits");
        CHECK_THROWS_WITH((void)bitmem::bits_to_byte(nine), "Must provide exactly 8 bits");
        CHECK_THROWS_AS((void)bitmem::bits_to_byte(std::vector<bit>{}), bitmem::memory_error);
    }

    SUBCASE("Memory bit arrays") {
        auto mem = bitmem::create_bit_memory(2);
        const std::array<bit, 8> pattern = {bit::zero, bit::one, bit::zero, bit::zero,
                                            bit::zero, bit::zero, bit::zero, bit::one};
        auto updated = bitmem::set_memory_bits(mem, 1, pattern);
        CHECK(bitmem::get_byte(updated, 1) == 0x82);
        CHECK(bitmem::get_memory_bits(updated, 1) == pattern);
    }
}

TEST_CASE("Bit memory: byte helpers") {
    CHECK(bitmem::create_bit_mask(bit_position(0)) == 0x01);
    CHECK(bitmem::create_bit_mask(bit_position(7)) == 0x80);
    CHECK(bitmem::set_bit_in_byte(0x00, bit_position(4)) == 0x10);
    CHECK(bitmem::clear_bit_in_byte(0xFF, bit_position(4)) == 0xEF);
    CHECK(bitmem::is_bit_set_in_byte(0x10, bit_position(4)));
    CHECK_FALSE(bitmem::is_bit_set_in_byte(0x10, bit_position(3)));
}

TEST_CASE("Bit memory: analysis") {
    SUBCASE("All ones") {
        auto mem = memory_of(std::vector<std::uint8_t>(10, 0xFF));
        CHECK(bitmem::count_set_bits(mem) == 80);
    }

    SUBCASE("All zeros") {
        for (std::size_t n : {0u, 1u, 33u}) {
            auto mem = bitmem::create_bit_memory(n);
            CHECK(bitmem::count_set_bits(mem) == 0);
            CHECK_FALSE(bitmem::find_first_set_bit(mem).has_value());
        }
    }

    SUBCASE("Mixed population") {
        auto mem = memory_of({0x01, 0x03, 0x80, 0xF0});
        CHECK(bitmem::count_set_bits(mem) == 1 + 2 + 1 + 4);
    }

    SUBCASE("First set bit") {
        auto mem = memory_of({0x00, 0x00, 0x28, 0x01});
        const auto loc = bitmem::find_first_set_bit(mem);
        REQUIRE(loc.has_value());
        CHECK(loc->address == 2);
        CHECK(loc->position.value() == 3);
    }

    SUBCASE("Validation helpers") {
        auto mem = bitmem::create_bit_memory(3);
        CHECK(bitmem::is_valid_address(mem, 0));
        CHECK(bitmem::is_valid_address(mem, 2));
        CHECK_FALSE(bitmem::is_valid_address(mem, 3));
        CHECK_FALSE(bitmem::is_valid_address(mem, -1));
        CHECK(bitmem::is_valid_bit_position(7));
        CHECK_FALSE(bitmem::is_valid_bit_position(8));
        CHECK_FALSE(bitmem::is_valid_bit_position(-1));
    }
}

TEST_CASE("Bit memory: representation") {
    auto mem = memory_of({0x00, 0x0F, 0xA5, 0xFF});

    SUBCASE("Hex") {
        CHECK(bitmem::memory_to_hex(mem) == "00 0f a5 ff");
    }

    SUBCASE("Binary") {
        CHECK(bitmem::memory_to_binary(mem) == "00000000 00001111 10100101 11111111");
    }

    SUBCASE("Empty") {
        CHECK(bitmem::memory_to_hex(bitmem::create_bit_memory(0)).empty());
        CHECK(bitmem::memory_to_binary(bitmem::create_bit_memory(0)).empty());
    }
}
