// vidmode_display NativeModeHandle tests

#include <catch2/catch_test_macros.hpp>
#include <vidmode/display/native_mode.hpp>
#include <vidmode/display/simulated_platform.hpp>

#include "fixtures.hpp"

#include <utility>

using namespace vidmode_display;
using namespace vidmode_test;

TEST_CASE("NativeModeHandle ownership", "[display][native_mode]") {
    SimulatedPlatform platform;
    platform.add_display(make_display(1, true));
    NativeModeRef ref = platform.add_descriptor(1, make_info(1920, 1080, 60.0));

    SECTION("empty handle") {
        NativeModeHandle handle;
        REQUIRE_FALSE(handle.is_valid());
        REQUIRE_FALSE(static_cast<bool>(handle));
        REQUIRE(handle.platform() == nullptr);
    }

    SECTION("adopt releases once on destruction") {
        platform.retain_mode(ref);
        {
            auto handle = NativeModeHandle::adopt(platform, ref);
            REQUIRE(handle.get() == ref);
            REQUIRE(platform.references(ref) == 1);
        }
        REQUIRE(platform.references(ref) == 0);
        REQUIRE(platform.over_release_count() == 0);
    }

    SECTION("adopting Null yields an empty handle") {
        auto handle = NativeModeHandle::adopt(platform, NativeModeRef::Null);
        REQUIRE_FALSE(handle.is_valid());
    }

    SECTION("retain adds a reference") {
        auto handle = NativeModeHandle::retain(platform, ref);
        REQUIRE(platform.references(ref) == 1);
        handle.reset();
        REQUIRE(platform.references(ref) == 0);
        handle.reset();
        REQUIRE(platform.over_release_count() == 0);
    }

    SECTION("clone holds a second reference") {
        auto first = NativeModeHandle::retain(platform, ref);
        auto second = first.clone();
        REQUIRE(second.get() == ref);
        REQUIRE(platform.references(ref) == 2);
        first.reset();
        REQUIRE(platform.references(ref) == 1);
    }

    SECTION("move transfers ownership") {
        auto first = NativeModeHandle::retain(platform, ref);
        NativeModeHandle second = std::move(first);
        REQUIRE_FALSE(first.is_valid());
        REQUIRE(second.get() == ref);
        REQUIRE(platform.references(ref) == 1);

        NativeModeHandle third;
        third = std::move(second);
        REQUIRE(platform.references(ref) == 1);
        third.reset();
        REQUIRE(platform.references(ref) == 0);
        REQUIRE(platform.over_release_count() == 0);
    }

    SECTION("move assignment releases the previous reference") {
        NativeModeRef other = platform.add_descriptor(1, make_info(1280, 720, 60.0));
        auto a = NativeModeHandle::retain(platform, ref);
        auto b = NativeModeHandle::retain(platform, other);
        a = std::move(b);
        REQUIRE(platform.references(ref) == 0);
        REQUIRE(platform.references(other) == 1);
    }

    SECTION("info queries the descriptor") {
        auto handle = NativeModeHandle::retain(platform, ref);
        NativeModeInfo info = handle.info();
        REQUIRE(info.width == 1920);
        REQUIRE(info.height == 1080);
    }
}
