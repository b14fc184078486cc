#pragma once

/// @file platform.hpp
/// @brief Platform display services consumed by vidmode_display
///
/// The engine never talks to a windowing system directly. Everything it needs
/// from the host is expressed by IDisplayPlatform:
///
/// - Device enumeration (online list, main display, mirroring, geometry)
/// - Native mode descriptors (copy current, copy all, retain/release, query)
/// - A timing source used when a descriptor has no refresh rate
/// - Exclusive capture and mode application
/// - Screen fade reservations
///
/// Descriptor references returned by copy_current_mode() and copy_all_modes()
/// carry one reference owned by the caller; wrap them with
/// NativeModeHandle::adopt().

#include "fwd.hpp"
#include "types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vidmode_display {

// =============================================================================
// Fade
// =============================================================================

/// Fade blend endpoints
enum class FadeBlend : std::uint8_t {
    Normal,      ///< Screen content shown normally
    SolidColor,  ///< Screen covered by the fade color
};

/// Reservation token for a screen fade
struct FadeToken {
    std::uint32_t value = 0;

    [[nodiscard]] bool operator==(const FadeToken& other) const {
        return value == other.value;
    }
};

// =============================================================================
// IDisplayPlatform
// =============================================================================

/// Host display services
class IDisplayPlatform {
public:
    virtual ~IDisplayPlatform() = default;

    // =========================================================================
    // Devices
    // =========================================================================

    /// Get the list of online displays
    virtual PlatformStatus online_displays(std::vector<DeviceId>& out) = 0;

    /// Check if display is the main display
    [[nodiscard]] virtual bool is_main(DeviceId display) const = 0;

    /// Get the display this one mirrors (k_null_device if none)
    [[nodiscard]] virtual DeviceId mirrors(DeviceId display) const = 0;

    /// Get localized product names of the display (may be empty)
    [[nodiscard]] virtual std::vector<std::string> product_names(DeviceId display) const = 0;

    /// Get display bounds in global coordinates
    [[nodiscard]] virtual Rect bounds(DeviceId display) const = 0;

    /// Get the visible frame of the screen showing this display.
    /// Origin is bottom-left of the main display. Nullopt if no screen matches.
    [[nodiscard]] virtual std::optional<Rect> visible_frame(DeviceId display) const = 0;

    /// Get the height in pixels of the main display
    [[nodiscard]] virtual std::int32_t main_display_height() const = 0;

    // =========================================================================
    // Mode Descriptors
    // =========================================================================

    /// Copy the descriptor of the mode currently in use (Null on failure)
    [[nodiscard]] virtual NativeModeRef copy_current_mode(DeviceId display) = 0;

    /// Copy all descriptors the display offers.
    /// May omit the current mode if it is not a listed mode.
    [[nodiscard]] virtual std::vector<NativeModeRef> copy_all_modes(DeviceId display) = 0;

    /// Add a reference to a descriptor
    virtual void retain_mode(NativeModeRef mode) = 0;

    /// Drop a reference to a descriptor
    virtual void release_mode(NativeModeRef mode) = 0;

    /// Query descriptor properties
    [[nodiscard]] virtual NativeModeInfo mode_info(NativeModeRef mode) const = 0;

    /// Query the display's timing source (nullopt if none can be created)
    [[nodiscard]] virtual std::optional<RefreshPeriod> nominal_refresh_period(DeviceId display) const = 0;

    // =========================================================================
    // Capture and Switching
    // =========================================================================

    /// Capture one display exclusively
    virtual PlatformStatus capture_display(DeviceId display) = 0;

    /// Capture all displays exclusively
    virtual PlatformStatus capture_all_displays() = 0;

    /// Release one captured display
    virtual PlatformStatus release_display(DeviceId display) = 0;

    /// Release all captured displays
    virtual PlatformStatus release_all_displays() = 0;

    /// Switch the display to a descriptor
    virtual PlatformStatus set_display_mode(DeviceId display, NativeModeRef mode) = 0;

    // =========================================================================
    // Fade
    // =========================================================================

    /// Reserve the fade hardware for up to `seconds` (nullopt if unavailable)
    [[nodiscard]] virtual std::optional<FadeToken> acquire_fade_reservation(double seconds) = 0;

    /// Fade between blend endpoints; asynchronous fades return immediately
    virtual PlatformStatus fade(FadeToken token, double seconds, FadeBlend from, FadeBlend to,
                                bool synchronous) = 0;

    /// Release a fade reservation
    virtual void release_fade_reservation(FadeToken token) = 0;
};

} // namespace vidmode_display
