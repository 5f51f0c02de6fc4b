#include <catch2/catch.hpp>
#include <chrono>
#include "util/clock.hpp"
#include "util/ids.hpp"

using namespace mahilo::util;

TEST_CASE("ISO-8601 formatting is UTC with milliseconds", "[clock]") {
    auto tp = from_unix_millis(1706702400123LL);
    REQUIRE(to_iso8601(tp) == "2024-01-31T12:00:00.123Z");
}

TEST_CASE("ISO-8601 parsing", "[clock]") {
    SECTION("with fraction and zone") {
        auto tp = parse_iso8601("2024-01-31T12:00:00.123Z");
        REQUIRE(tp);
        REQUIRE(to_unix_millis(*tp) == 1706702400123LL);
    }

    SECTION("without fraction") {
        auto tp = parse_iso8601("2024-01-31T12:00:00");
        REQUIRE(tp);
        REQUIRE(to_unix_seconds(*tp) == 1706702400LL);
    }

    SECTION("garbage") {
        REQUIRE_FALSE(parse_iso8601("yesterday"));
        REQUIRE_FALSE(parse_iso8601("2024-01-31T12:00:00Zjunk"));
    }
}

TEST_CASE("manual clock only moves when advanced", "[clock]") {
    ManualClock clock;
    auto start = clock.now();
    REQUIRE(clock.now() == start);

    clock.advance(std::chrono::milliseconds(1500));
    REQUIRE(clock.now() - start == std::chrono::milliseconds(1500));
}

TEST_CASE("generated identifiers", "[ids]") {
    auto a = generate_id();
    auto b = generate_id();
    REQUIRE(a.size() == 21);
    REQUIRE(a != b);
    for (char c : a) {
        bool allowed = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                       (c >= '0' && c <= '9') || c == '_' || c == '-';
        REQUIRE(allowed);
    }

    REQUIRE(generate_secret().size() == 32);
}
