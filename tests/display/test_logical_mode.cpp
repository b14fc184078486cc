// vidmode_display LogicalMode tests

#include <catch2/catch_test_macros.hpp>
#include <vidmode/display/logical_mode.hpp>
#include <vidmode/display/simulated_platform.hpp>

#include "fixtures.hpp"

#include <utility>

using namespace vidmode_display;
using namespace vidmode_test;

TEST_CASE("LogicalMode candidates", "[display][logical_mode]") {
    SimulatedPlatform platform;
    platform.add_display(make_display(1, true));
    NativeModeRef a = platform.add_descriptor(1, make_info(1920, 1080, 60.0));
    NativeModeRef b = platform.add_descriptor(1, make_info(1920, 1080, 60.0));
    NativeModeRef c = platform.add_descriptor(1, make_info(1920, 1080, 60.0));

    const DisplayMode desc = make_mode(1920, 1080, 60);
    LogicalMode mode(desc, NativeModeHandle::retain(platform, a));

    REQUIRE(mode.mode() == desc);
    REQUIRE(mode.candidate_count() == 1);

    SECTION("insertion preserves order") {
        REQUIRE(mode.add_candidate(NativeModeHandle::retain(platform, b)));
        REQUIRE(mode.add_candidate(NativeModeHandle::retain(platform, c)));
        REQUIRE(mode.candidates()[0].get() == a);
        REQUIRE(mode.candidates()[1].get() == b);
        REQUIRE(mode.candidates()[2].get() == c);
    }

    SECTION("same descriptor is not held twice") {
        REQUIRE_FALSE(mode.add_candidate(NativeModeHandle::retain(platform, a)));
        REQUIRE(mode.candidate_count() == 1);
        REQUIRE(platform.references(a) == 1);
    }

    SECTION("merge takes the other mode's candidates") {
        LogicalMode other(desc, NativeModeHandle::retain(platform, b));
        other.add_candidate(NativeModeHandle::retain(platform, a));

        REQUIRE(mode.merge(std::move(other)) == 1);
        REQUIRE(mode.candidate_count() == 2);
        REQUIRE(mode.has_candidate(b));
        REQUIRE(platform.references(a) == 1);
        REQUIRE(platform.references(b) == 1);
    }

    SECTION("promote moves the winner to the front") {
        mode.add_candidate(NativeModeHandle::retain(platform, b));
        mode.add_candidate(NativeModeHandle::retain(platform, c));

        mode.promote(2);
        REQUIRE(mode.candidates()[0].get() == c);
        REQUIRE(mode.candidates()[1].get() == a);
        REQUIRE(mode.candidates()[2].get() == b);

        mode.promote(0);
        REQUIRE(mode.candidates()[0].get() == c);

        mode.promote(17);
        REQUIRE(mode.candidate_count() == 3);
    }

    SECTION("release drops every reference exactly once") {
        mode.add_candidate(NativeModeHandle::retain(platform, b));
        mode.release_candidates();
        REQUIRE(mode.is_released());
        REQUIRE(platform.outstanding_references() == 0);

        mode.release_candidates();
        REQUIRE(platform.over_release_count() == 0);
    }

    SECTION("equality ignores candidates") {
        LogicalMode other(desc, NativeModeHandle::retain(platform, b));
        REQUIRE(mode == other);
        REQUIRE(mode == desc);
        REQUIRE(mode != make_mode(1920, 1080, 50));
    }
}

TEST_CASE("LogicalMode destruction releases candidates", "[display][logical_mode]") {
    SimulatedPlatform platform;
    platform.add_display(make_display(1, true));
    NativeModeRef a = platform.add_descriptor(1, make_info(800, 600, 60.0));

    {
        LogicalMode mode(make_mode(800, 600, 60), NativeModeHandle::retain(platform, a));
        LogicalMode moved = std::move(mode);
        REQUIRE(moved.candidate_count() == 1);
    }

    REQUIRE(platform.references(a) == 0);
    REQUIRE(platform.over_release_count() == 0);
}
