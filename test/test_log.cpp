#include <doctest/doctest.h>
#include <bitmem/bitmem.hpp>

#include <cstring>

namespace {

struct log_level_guard {
    bitmem::log_level saved = bitmem::get_log_level();
    ~log_level_guard() { bitmem::set_log_level(saved); }
};

} // namespace

TEST_CASE("Log: level names") {
    CHECK(std::strcmp(bitmem::to_string(bitmem::log_level::trace), "TRACE") == 0);
    CHECK(std::strcmp(bitmem::to_string(bitmem::log_level::debug), "DEBUG") == 0);
    CHECK(std::strcmp(bitmem::to_string(bitmem::log_level::info), "INFO") == 0);
    CHECK(std::strcmp(bitmem::to_string(bitmem::log_level::warn), "WARN") == 0);
    CHECK(std::strcmp(bitmem::to_string(bitmem::log_level::error), "ERROR") == 0);
    CHECK(std::strcmp(bitmem::to_string(bitmem::log_level::off), "OFF") == 0);
}

TEST_CASE("Log: threshold") {
    log_level_guard guard;

    SUBCASE("Set and get") {
        bitmem::set_log_level(bitmem::log_level::debug);
        CHECK(bitmem::get_log_level() == bitmem::log_level::debug);
    }

    SUBCASE("Messages at or above threshold pass") {
        bitmem::set_log_level(bitmem::log_level::info);
        CHECK_FALSE(bitmem::log_enabled(bitmem::log_level::trace));
        CHECK_FALSE(bitmem::log_enabled(bitmem::log_level::debug));
        CHECK(bitmem::log_enabled(bitmem::log_level::info));
        CHECK(bitmem::log_enabled(bitmem::log_level::warn));
        CHECK(bitmem::log_enabled(bitmem::log_level::error));
    }

    SUBCASE("Off silences everything") {
        bitmem::set_log_level(bitmem::log_level::off);
        CHECK_FALSE(bitmem::log_enabled(bitmem::log_level::error));
        CHECK_FALSE(bitmem::log_enabled(bitmem::log_level::off));
    }

    SUBCASE("Off is never a message level") {
        bitmem::set_log_level(bitmem::log_level::trace);
        CHECK_FALSE(bitmem::log_enabled(bitmem::log_level::off));
    }

    SUBCASE("Diagnostics do not change behaviour") {
        bitmem::set_log_level(bitmem::log_level::trace);
        auto mem = bitmem::create_bit_memory(2);
        CHECK_THROWS_WITH((void)bitmem::get_byte(mem, 2), "Address 2 out of bounds");
        CHECK_THROWS_WITH((void)bitmem::write_int32(mem, 0, 1), "Address 0 out of bounds for 32-bit write");
    }
}
