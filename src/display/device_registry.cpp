/// @file device_registry.cpp
/// @brief Display enumeration implementation

#include <vidmode/display/device_registry.hpp>
#include <vidmode/display/platform.hpp>
#include <vidmode/core/log.hpp>

#include <utility>

namespace vidmode_display {

std::optional<std::string> DeviceRegistry::display_name(DeviceId id) const {
    auto names = m_platform.product_names(id);
    if (names.empty() || names.front().empty()) {
        return std::nullopt;
    }
    return names.front();
}

vidmode_core::Result<Device> DeviceRegistry::build_device(DeviceId id) const {
    DiscoveredModes discovered = m_discovery.discover(id);
    if (!discovered.desktop_mode) {
        // Without a known-good fallback mode the display cannot be switched
        return vidmode_core::Err<Device>(vidmode_core::DiscoveryError::no_desktop_mode(id));
    }

    Device device;
    device.id = id;
    device.name = display_name(id);
    device.bounds = m_platform.bounds(id);
    device.primary = m_platform.is_main(id);
    device.desktop_mode = std::move(*discovered.desktop_mode);
    device.current_mode = device.desktop_mode.mode();
    device.modes = std::move(discovered.modes);

    return vidmode_core::Ok(std::move(device));
}

vidmode_core::Result<std::vector<Device*>> DeviceRegistry::discover_devices() {
    VIDMODE_LOG_SCOPE("DeviceRegistry::discover_devices");
    auto logger = vidmode_core::display_logger();

    m_skipped = 0;

    std::vector<DeviceId> displays;
    PlatformStatus status = m_platform.online_displays(displays);
    if (status != PlatformStatus::Success) {
        vidmode_core::Error err = vidmode_core::DiscoveryError::enumeration_failed(
            "online_displays()", platform_status_name(status));
        vidmode_core::set_last_error(err);
        logger->error("Display enumeration failed: {}", err.message());
        return vidmode_core::Err<std::vector<Device*>>(std::move(err));
    }

    std::vector<Device*> registered;

    // Pick up the main display in the first pass, then get the rest
    for (int pass = 0; pass < 2; ++pass) {
        for (DeviceId id : displays) {
            const bool main = m_platform.is_main(id);
            if ((pass == 0) != main) {
                continue;
            }

            const DeviceId mirror_of = m_platform.mirrors(id);
            if (mirror_of != k_null_device) {
                logger->debug("Skipping display {}: mirrors display {}", id, mirror_of);
                continue;
            }

            auto built = build_device(id);
            if (!built) {
                ++m_skipped;
                logger->warn("{}", built.error().message());
                continue;
            }

            Device staged = std::move(built).value();
            std::vector<LogicalMode> modes = std::move(staged.modes);
            staged.modes.clear();
            Device& device = m_store.add_device(std::move(staged));

            for (auto& mode : modes) {
                if (m_store.add_mode(device, mode) == AddModeResult::Duplicate) {
                    // Store did not take ownership
                    mode.release_candidates();
                }
            }

            logger->info("Registered {}: desktop {} ({} modes){}",
                device.label(), device.desktop_mode.to_string(), device.modes.size(),
                device.primary ? " [main]" : "");
            registered.push_back(&device);
        }
    }

    return vidmode_core::Ok(std::move(registered));
}

Rect DeviceRegistry::display_bounds(const Device& device) const {
    return m_platform.bounds(device.id);
}

vidmode_core::Result<Rect> DeviceRegistry::usable_bounds(const Device& device) const {
    auto frame = m_platform.visible_frame(device.id);
    if (!frame) {
        return vidmode_core::Err<Rect>(vidmode_core::Error(vidmode_core::ErrorCode::NotFound,
            "No screen found for display " + std::to_string(device.id)));
    }

    // Visible frame is bottom-left origin; flip against the main display
    Rect rect;
    rect.x = frame->x;
    rect.y = m_platform.main_display_height() - frame->y - frame->h;
    rect.w = frame->w;
    rect.h = frame->h;
    return vidmode_core::Ok(rect);
}

} // namespace vidmode_display
