#include <catch2/catch_test_macros.hpp>
#include "../src/provider_day.hpp"
#include "fakes.hpp"

TEST_CASE("US Pacific daylight saving rules", "[provider_day]") {
    SECTION("Spring forward at 10:00 UTC on the second Sunday of March") {
        REQUIRE_FALSE(provider_day::is_pacific_dst(at("2026-03-08T09:59:59Z")));
        REQUIRE(provider_day::is_pacific_dst(at("2026-03-08T10:00:00Z")));
    }

    SECTION("Fall back at 09:00 UTC on the first Sunday of November") {
        REQUIRE(provider_day::is_pacific_dst(at("2026-11-01T08:59:59Z")));
        REQUIRE_FALSE(provider_day::is_pacific_dst(at("2026-11-01T09:00:00Z")));
    }

    SECTION("Offsets") {
        REQUIRE(provider_day::pacific_offset(at("2026-07-15T12:00:00Z")) == std::chrono::hours(-7));
        REQUIRE(provider_day::pacific_offset(at("2026-01-15T12:00:00Z")) == std::chrono::hours(-8));
    }
}

TEST_CASE("Provider day boundaries", "[provider_day]") {
    SECTION("Summer date flips at 07:00 UTC") {
        REQUIRE(provider_day::pacific_date(at("2026-07-15T06:59:59Z")) == "2026-07-14");
        REQUIRE(provider_day::pacific_date(at("2026-07-15T07:00:00Z")) == "2026-07-15");
    }

    SECTION("Winter date flips at 08:00 UTC") {
        REQUIRE(provider_day::pacific_date(at("2026-01-10T07:59:59Z")) == "2026-01-09");
        REQUIRE(provider_day::pacific_date(at("2026-01-10T08:00:00Z")) == "2026-01-10");
    }

    SECTION("Last and next midnight") {
        auto now = at("2026-01-10T12:00:00Z");
        REQUIRE(provider_day::last_pacific_midnight(now) == at("2026-01-10T08:00:00Z"));
        REQUIRE(provider_day::next_pacific_midnight(now) == at("2026-01-11T08:00:00Z"));
    }

    SECTION("Midnights around the spring transition") {
        auto now = at("2026-03-08T12:00:00Z");
        REQUIRE(provider_day::last_pacific_midnight(now) == at("2026-03-08T08:00:00Z"));
        REQUIRE(provider_day::next_pacific_midnight(now) == at("2026-03-09T07:00:00Z"));
    }

    SECTION("Midnights around the autumn transition") {
        auto now = at("2026-11-01T12:00:00Z");
        REQUIRE(provider_day::last_pacific_midnight(now) == at("2026-11-01T07:00:00Z"));
        REQUIRE(provider_day::next_pacific_midnight(now) == at("2026-11-02T08:00:00Z"));
    }

    SECTION("Year boundary") {
        REQUIRE(provider_day::pacific_date(at("2027-01-01T05:00:00Z")) == "2026-12-31");
    }
}
