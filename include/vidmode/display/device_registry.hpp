#pragma once

/// @file device_registry.hpp
/// @brief Display enumeration and registration

#include "fwd.hpp"
#include "types.hpp"
#include "device.hpp"
#include "mode_discovery.hpp"

#include <vidmode/core/error.hpp>

#include <optional>
#include <string>
#include <vector>

namespace vidmode_display {

// =============================================================================
// DeviceRegistry
// =============================================================================

/// Enumerates online displays and registers them with a store.
///
/// The main display is registered first, then the rest in platform order.
/// Mirroring displays are never registered. A display whose current mode
/// cannot be described is skipped; the others still register.
class DeviceRegistry {
public:
    DeviceRegistry(IDisplayPlatform& platform, IDisplayStore& store)
        : m_platform(platform), m_store(store), m_discovery(platform) {}

    /// Discover and register every usable display.
    /// Fails only if the online display list cannot be read.
    [[nodiscard]] vidmode_core::Result<std::vector<Device*>> discover_devices();

    /// Build one device without registering it
    [[nodiscard]] vidmode_core::Result<Device> build_device(DeviceId id) const;

    /// Get the display's bounds in global coordinates
    [[nodiscard]] Rect display_bounds(const Device& device) const;

    /// Get the display's bounds minus system chrome (menu bar, dock),
    /// in top-left-origin global coordinates
    [[nodiscard]] vidmode_core::Result<Rect> usable_bounds(const Device& device) const;

    /// Get the best-effort product name of a display
    [[nodiscard]] std::optional<std::string> display_name(DeviceId id) const;

    /// Get number of displays skipped by the last discovery
    [[nodiscard]] std::size_t skipped_count() const noexcept { return m_skipped; }

private:
    IDisplayPlatform& m_platform;
    IDisplayStore& m_store;
    ModeDiscovery m_discovery;
    std::size_t m_skipped = 0;
};

} // namespace vidmode_display
