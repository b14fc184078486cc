/// @file mode_discovery.cpp
/// @brief Mode discovery implementation

#include <vidmode/display/mode_discovery.hpp>
#include <vidmode/display/platform.hpp>
#include <vidmode/display/refresh_rate.hpp>
#include <vidmode/core/log.hpp>

#include <algorithm>
#include <utility>

namespace vidmode_display {

bool ModeDiscovery::has_valid_flags(std::uint32_t io_flags) noexcept {
    // Flags we don't want
    if (io_flags & (mode_flags::k_never_show | mode_flags::k_not_graphics_quality)) {
        return false;
    }

    // Flags we need
    if (!(io_flags & mode_flags::k_valid) || !(io_flags & mode_flags::k_safe)) {
        return false;
    }

    return true;
}

std::optional<LogicalMode> ModeDiscovery::build_mode(
    NativeModeHandle handle,
    bool is_current,
    const std::optional<RefreshPeriod>& timing_source) const {

    Rejection rejection = Rejection::None;
    return build_mode_impl(std::move(handle), is_current, timing_source, rejection);
}

std::optional<LogicalMode> ModeDiscovery::build_mode_impl(
    NativeModeHandle handle,
    bool is_current,
    const std::optional<RefreshPeriod>& timing_source,
    Rejection& rejection) const {

    if (!handle) {
        return std::nullopt;
    }

    NativeModeInfo info = m_platform.mode_info(handle.get());

    // The current mode may lack the safe flag; filtering it would leave the
    // display without a desktop mode
    if (!is_current && !has_valid_flags(info.io_flags)) {
        rejection = Rejection::Flags;
        vidmode_core::display_logger()->trace("Dropping {}x{} descriptor: flags 0x{:x}",
            info.width, info.height, info.io_flags);
        return std::nullopt;
    }

    PixelFormat format = pixel_format_from_encoding(info.pixel_encoding);
    if (format == PixelFormat::Unknown) {
        rejection = Rejection::Format;
        vidmode_core::display_logger()->trace("Dropping {}x{} descriptor: unsupported encoding '{}'",
            info.width, info.height, info.pixel_encoding);
        return std::nullopt;
    }

    DisplayMode mode;
    mode.width = info.width;
    mode.height = info.height;
    mode.refresh_rate = resolve_refresh_rate(info.refresh_rate, timing_source);
    mode.format = format;

    if (mode.width == 0 || mode.height == 0) {
        rejection = Rejection::Flags;
        return std::nullopt;
    }

    return LogicalMode(mode, std::move(handle));
}

bool ModeDiscovery::insert_or_merge(std::vector<LogicalMode>& modes, LogicalMode&& mode) {
    auto it = std::find(modes.begin(), modes.end(), mode);
    if (it != modes.end()) {
        // A re-reported descriptor adds nothing and is not a merge
        return it->merge(std::move(mode)) > 0;
    }
    modes.push_back(std::move(mode));
    return false;
}

DiscoveredModes ModeDiscovery::discover(DeviceId display) const {
    DiscoveredModes result;
    const auto timing = m_platform.nominal_refresh_period(display);

    // Bulk enumeration may omit the active mode (custom or scaled resolutions),
    // so the current mode always goes in first
    auto current = NativeModeHandle::adopt(m_platform, m_platform.copy_current_mode(display));
    if (current) {
        auto listed_ref = current.clone();
        result.desktop_mode = build_mode(std::move(current), true, timing);
        if (result.desktop_mode) {
            auto listed = build_mode(std::move(listed_ref), true, timing);
            if (listed) {
                result.modes.push_back(std::move(*listed));
            }
        }
    }

    for (auto ref : m_platform.copy_all_modes(display)) {
        auto handle = NativeModeHandle::adopt(m_platform, ref);

        Rejection rejection = Rejection::None;
        auto mode = build_mode_impl(std::move(handle), false, timing, rejection);
        if (!mode) {
            if (rejection == Rejection::Format) {
                ++result.unsupported_count;
            } else {
                ++result.filtered_count;
            }
            continue;
        }

        if (insert_or_merge(result.modes, std::move(*mode))) {
            ++result.merged_count;
        }
    }

    vidmode_core::display_logger()->debug(
        "Display {}: {} modes ({} filtered, {} unsupported, {} merged)",
        display, result.modes.size(), result.filtered_count,
        result.unsupported_count, result.merged_count);

    return result;
}

} // namespace vidmode_display
