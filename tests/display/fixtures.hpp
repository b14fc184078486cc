#pragma once

// Shared setup for vidmode_display tests

#include <vidmode/display/simulated_platform.hpp>
#include <vidmode/display/types.hpp>

#include <string>

namespace vidmode_test {

using namespace vidmode_display;

/// Descriptor info with usable flags
inline NativeModeInfo make_info(std::uint32_t width, std::uint32_t height, double refresh,
                                const char* encoding = pixel_encoding::k_direct32,
                                std::uint32_t flags = mode_flags::k_usable) {
    NativeModeInfo info;
    info.width = width;
    info.height = height;
    info.refresh_rate = refresh;
    info.pixel_encoding = encoding;
    info.io_flags = flags;
    return info;
}

/// Display description with a 60Hz timing source
inline SimulatedDisplay make_display(DeviceId id, bool main, std::int32_t width = 1920,
                                     std::int32_t height = 1080, std::int32_t x = 0) {
    SimulatedDisplay display;
    display.id = id;
    display.main = main;
    display.product_names = {"Display " + std::to_string(id)};
    display.bounds = Rect{x, 0, width, height};
    display.refresh_period = RefreshPeriod{1000, 60000, false};
    return display;
}

/// Logical description
inline DisplayMode make_mode(std::uint32_t width, std::uint32_t height, std::uint32_t refresh,
                             PixelFormat format = PixelFormat::Argb8888) {
    DisplayMode mode;
    mode.width = width;
    mode.height = height;
    mode.refresh_rate = refresh;
    mode.format = format;
    return mode;
}

} // namespace vidmode_test
