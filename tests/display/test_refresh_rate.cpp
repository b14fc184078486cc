// vidmode_display refresh rate resolution tests

#include <catch2/catch_test_macros.hpp>
#include <vidmode/display/refresh_rate.hpp>

#include <cmath>
#include <limits>

using namespace vidmode_display;

TEST_CASE("Reported refresh rates round to nearest", "[display][refresh]") {
    REQUIRE(resolve_refresh_rate(60.0, std::nullopt) == 60);
    REQUIRE(resolve_refresh_rate(59.94, std::nullopt) == 60);
    REQUIRE(resolve_refresh_rate(74.5, std::nullopt) == 75);
    REQUIRE(resolve_refresh_rate(143.4, std::nullopt) == 143);
}

TEST_CASE("Reported rate wins over the timing source", "[display][refresh]") {
    RefreshPeriod period{1000, 120000, false};
    REQUIRE(resolve_refresh_rate(60.0, period) == 60);
}

TEST_CASE("Zero rate falls back to the timing source", "[display][refresh]") {
    SECTION("well-defined period") {
        REQUIRE(resolve_refresh_rate(0.0, RefreshPeriod{1000, 60000, false}) == 60);
        REQUIRE(resolve_refresh_rate(0.0, RefreshPeriod{1001, 60000, false}) == 60);
        REQUIRE(resolve_refresh_rate(0.0, RefreshPeriod{1, 120, false}) == 120);
    }

    SECTION("indefinite period") {
        REQUIRE(resolve_refresh_rate(0.0, RefreshPeriod{1000, 60000, true}) == 0);
    }

    SECTION("zero period") {
        REQUIRE(resolve_refresh_rate(0.0, RefreshPeriod{0, 60000, false}) == 0);
        REQUIRE(resolve_refresh_rate(0.0, RefreshPeriod{1000, 0, false}) == 0);
    }

    SECTION("no timing source") {
        REQUIRE(resolve_refresh_rate(0.0, std::nullopt) == 0);
    }
}

TEST_CASE("Nonsense reported rates count as unreported", "[display][refresh]") {
    RefreshPeriod period{1000, 75000, false};
    REQUIRE(resolve_refresh_rate(-60.0, period) == 75);
    REQUIRE(resolve_refresh_rate(std::numeric_limits<double>::quiet_NaN(), period) == 75);
    REQUIRE(resolve_refresh_rate(0.2, std::nullopt) == 0);
}

TEST_CASE("Oversized rates saturate", "[display][refresh]") {
    constexpr auto k_max = std::numeric_limits<std::uint32_t>::max();
    REQUIRE(resolve_refresh_rate(1e12, std::nullopt) == k_max);
    REQUIRE(resolve_refresh_rate(std::numeric_limits<double>::max(), std::nullopt) == k_max);
    REQUIRE(resolve_refresh_rate(4294967294.4, std::nullopt) == k_max - 1);
    REQUIRE(resolve_refresh_rate(std::numeric_limits<double>::infinity(), RefreshPeriod{1, 60, false}) == 60);
}
