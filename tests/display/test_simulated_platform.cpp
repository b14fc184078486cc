// vidmode_display SimulatedPlatform tests

#include <catch2/catch_test_macros.hpp>
#include <vidmode/display/simulated_platform.hpp>
#include <vidmode/display/device_registry.hpp>

#include "fixtures.hpp"

#include <nlohmann/json.hpp>

#include <string>

using namespace vidmode_display;
using namespace vidmode_test;

TEST_CASE("Descriptor reference counting", "[display][simulated]") {
    SimulatedPlatform platform;
    platform.add_display(make_display(1, true));
    NativeModeRef ref = platform.add_descriptor(1, make_info(1920, 1080, 60.0));
    platform.set_current_mode(1, ref);

    SECTION("copies hand out references") {
        NativeModeRef current = platform.copy_current_mode(1);
        REQUIRE(current == ref);
        auto all = platform.copy_all_modes(1);
        REQUIRE(all.size() == 1);
        REQUIRE(platform.references(ref) == 2);

        platform.release_mode(current);
        platform.release_mode(all[0]);
        REQUIRE(platform.outstanding_references() == 0);
    }

    SECTION("over-release is counted, not applied") {
        platform.release_mode(ref);
        REQUIRE(platform.references(ref) == 0);
        REQUIRE(platform.over_release_count() == 1);
    }

    SECTION("unlisted descriptors are not in the bulk copy") {
        NativeModeRef hidden = platform.add_descriptor(1, make_info(1024, 768, 60.0), false);
        auto all = platform.copy_all_modes(1);
        REQUIRE(all.size() == 1);
        REQUIRE(all[0] != hidden);
        platform.release_mode(all[0]);
    }

    SECTION("unavailable current mode") {
        platform.set_current_mode_available(1, false);
        REQUIRE(platform.copy_current_mode(1) == NativeModeRef::Null);
        REQUIRE(platform.outstanding_references() == 0);
    }
}

TEST_CASE("Scripted platform calls", "[display][simulated]") {
    SimulatedPlatform platform;
    platform.add_display(make_display(1, true));
    platform.add_display(make_display(2, false));
    NativeModeRef own = platform.add_descriptor(1, make_info(1280, 720, 60.0));
    NativeModeRef foreign = platform.add_descriptor(2, make_info(1280, 720, 60.0));

    SECTION("apply updates the current mode and bounds") {
        REQUIRE(platform.set_display_mode(1, own) == PlatformStatus::Success);
        REQUIRE(platform.current_mode(1) == own);
        REQUIRE(platform.bounds(1) == Rect{0, 0, 1280, 720});
    }

    SECTION("descriptors belong to one display") {
        REQUIRE(platform.set_display_mode(1, foreign) == PlatformStatus::IllegalArgument);
        REQUIRE(platform.apply_attempts().size() == 1);
    }

    SECTION("scripted apply failure") {
        platform.set_apply_status(own, PlatformStatus::NoneAvailable);
        REQUIRE(platform.set_display_mode(1, own) == PlatformStatus::NoneAvailable);
        REQUIRE(platform.current_mode(1) == NativeModeRef::Null);
    }

    SECTION("capture") {
        REQUIRE(platform.capture_display(2) == PlatformStatus::Success);
        REQUIRE(platform.capture_display(2) == PlatformStatus::Success);
        REQUIRE(platform.is_captured(2));
        REQUIRE_FALSE(platform.is_captured(1));
        REQUIRE(platform.capture_display(99) == PlatformStatus::IllegalArgument);

        REQUIRE(platform.release_display(2) == PlatformStatus::Success);
        REQUIRE_FALSE(platform.any_captured());

        platform.set_capture_status(PlatformStatus::CannotComplete);
        REQUIRE(platform.capture_all_displays() == PlatformStatus::CannotComplete);
        REQUIRE_FALSE(platform.any_captured());
    }

    SECTION("fade reservations") {
        auto token = platform.acquire_fade_reservation(5.0);
        REQUIRE(token.has_value());
        REQUIRE(platform.fade(*token, 0.3, FadeBlend::Normal, FadeBlend::SolidColor, true)
            == PlatformStatus::Success);
        platform.release_fade_reservation(*token);
        REQUIRE(platform.active_fade_reservations() == 0);
        REQUIRE(platform.fade(*token, 0.5, FadeBlend::SolidColor, FadeBlend::Normal, false)
            == PlatformStatus::IllegalArgument);
        REQUIRE(platform.fade_calls().size() == 1);

        REQUIRE_FALSE(platform.acquire_fade_reservation(0.0).has_value());
        platform.set_fade_available(false);
        REQUIRE_FALSE(platform.acquire_fade_reservation(5.0).has_value());
    }

    SECTION("enumeration failure") {
        platform.set_enumeration_status(PlatformStatus::Failure);
        std::vector<DeviceId> ids{7};
        REQUIRE(platform.online_displays(ids) == PlatformStatus::Failure);
        REQUIRE(ids.empty());
    }
}

TEST_CASE("Platform description from JSON", "[display][simulated]") {
    nlohmann::json j = {
        {"capture_status", "Failure"},
        {"displays", {
            {
                {"id", 5},
                {"main", true},
                {"names", {"Panel"}},
                {"bounds", {0, 0, 1920, 1080}},
                {"current", "desk"},
                {"modes", {
                    {{"name", "desk"}, {"width", 1920}, {"height", 1080}, {"refresh_rate", 60}},
                    {{"name", "small"}, {"width", 1280}, {"height", 720}, {"refresh_rate", 60},
                     {"apply_status", "RangeCheck"}},
                }},
            },
        }},
    };

    auto loaded = SimulatedPlatform::from_json(j);
    REQUIRE(loaded);
    SimulatedPlatform& platform = **loaded;

    REQUIRE(platform.is_main(5));
    REQUIRE(platform.product_names(5) == std::vector<std::string>{"Panel"});
    REQUIRE(platform.current_mode(5) == platform.descriptor("desk"));
    REQUIRE(platform.capture_all_displays() == PlatformStatus::Failure);
    REQUIRE(platform.set_display_mode(5, platform.descriptor("small")) == PlatformStatus::RangeCheck);
    REQUIRE(platform.descriptor("nope") == NativeModeRef::Null);
}

TEST_CASE("Malformed platform descriptions", "[display][simulated]") {
    SECTION("no displays") {
        auto loaded = SimulatedPlatform::from_json(nlohmann::json::object());
        REQUIRE_FALSE(loaded);
        REQUIRE(loaded.error().code() == vidmode_core::ErrorCode::ParseError);
    }

    SECTION("unknown status name") {
        auto loaded = SimulatedPlatform::from_json({{"capture_status", "Sometimes"}, {"displays", nlohmann::json::array()}});
        REQUIRE_FALSE(loaded);
        REQUIRE(loaded.error().code() == vidmode_core::ErrorCode::InvalidArgument);
    }

    SECTION("unknown flag name") {
        nlohmann::json j = {{"displays", {{
            {"id", 1},
            {"modes", {{{"width", 640}, {"height", 480}, {"flags", {"shiny"}}}}},
        }}}};
        auto loaded = SimulatedPlatform::from_json(j);
        REQUIRE_FALSE(loaded);
        REQUIRE(loaded.error().message() == "Invalid value for modes.flags: shiny");
    }

    SECTION("current mode names no descriptor") {
        nlohmann::json j = {{"displays", {{{"id", 1}, {"current", "ghost"}}}}};
        auto loaded = SimulatedPlatform::from_json(j);
        REQUIRE_FALSE(loaded);
        REQUIRE(loaded.error().code() == vidmode_core::ErrorCode::InvalidArgument);
    }

    SECTION("wrong value type") {
        nlohmann::json j = {{"displays", {{{"id", "one"}}}}};
        auto loaded = SimulatedPlatform::from_json(j);
        REQUIRE_FALSE(loaded);
        REQUIRE(loaded.error().code() == vidmode_core::ErrorCode::ParseError);
    }

    SECTION("missing file") {
        auto loaded = SimulatedPlatform::load_file("/nonexistent/displays.json");
        REQUIRE_FALSE(loaded);
        REQUIRE(loaded.error().code() == vidmode_core::ErrorCode::NotFound);
    }
}

TEST_CASE("Sample platform discovers", "[display][simulated]") {
    auto loaded = SimulatedPlatform::load_file(std::string(VIDMODE_TEST_DATA_DIR) + "/displays.json");
    REQUIRE(loaded);
    SimulatedPlatform& platform = **loaded;

    {
        DisplayStore store;
        DeviceRegistry registry(platform, store);
        auto devices = registry.discover_devices();
        REQUIRE(devices);

        // Mirror is skipped
        REQUIRE(devices->size() == 2);

        Device& builtin = *(*devices)[0];
        REQUIRE(builtin.primary);
        REQUIRE(builtin.desktop_mode == make_mode(1512, 982, 120));
        REQUIRE(builtin.modes.size() == 6);
        REQUIRE(builtin.find_mode(make_mode(1280, 832, 120))->candidate_count() == 2);
        REQUIRE(builtin.find_mode(make_mode(800, 600, 60)) == nullptr);

        Device& dell = *(*devices)[1];
        REQUIRE(dell.desktop_mode == make_mode(2560, 1440, 60));
        REQUIRE(dell.modes.size() == 4);
        REQUIRE(dell.find_mode(make_mode(1920, 1080, 60, PixelFormat::Argb2101010)) != nullptr);

        auto usable = registry.usable_bounds(dell);
        REQUIRE(usable);
        REQUIRE(usable->y == 0);
    }

    REQUIRE(platform.outstanding_references() == 0);
}
