#pragma once

/// @file switch_engine.hpp
/// @brief Capture, apply and fade state machine for mode switches

#include "fwd.hpp"
#include "types.hpp"
#include "platform.hpp"

#include <vidmode/core/error.hpp>

#include <cstdint>
#include <optional>
#include <vector>

namespace vidmode_display {

// =============================================================================
// SwitchState
// =============================================================================

/// States of one switch attempt.
///
/// Success: Idle -> FadeOut -> (Captured | SkipCapture) -> ModeApplied -> FadeIn -> Idle
/// Capture failure: ... -> CaptureFailed -> FadeIn -> Idle
/// Apply failure: ... -> ApplyFailed -> ReleaseCapture -> FadeIn -> Idle
enum class SwitchState : std::uint8_t {
    Idle,
    FadeOut,
    Captured,
    SkipCapture,
    ModeApplied,
    FadeIn,
    CaptureFailed,
    ApplyFailed,
    ReleaseCapture,
};

/// Get switch state name
[[nodiscard]] const char* switch_state_name(SwitchState state);

// =============================================================================
// SwitchConfig
// =============================================================================

/// Fade timing for switches
struct SwitchConfig {
    /// Mask switches with a screen fade
    bool fade_enabled = true;
    /// How long the fade hardware is reserved
    double reservation_seconds = 5.0;
    /// Fade to solid color before the switch (synchronous)
    double fade_out_seconds = 0.3;
    /// Fade back to normal after the switch (asynchronous)
    double fade_in_seconds = 0.5;

    [[nodiscard]] static SwitchConfig no_fade() {
        SwitchConfig config;
        config.fade_enabled = false;
        return config;
    }
};

// =============================================================================
// SwitchEngine
// =============================================================================

/// Switches devices between their desktop mode and requested modes.
///
/// Requests for the desktop mode take the restore path: no capture, apply,
/// then release capture and restore chrome. Any other mode takes the capture
/// path: capture, apply, then suppress chrome. Capture covers all displays
/// when the device is the main display. Every failure rolls back what the
/// attempt acquired, leaves the device's current mode unchanged and records
/// the error in the last-error slot.
class SwitchEngine {
public:
    SwitchEngine(IDisplayPlatform& platform, IWindowChrome& chrome, SwitchConfig config = {})
        : m_platform(platform), m_chrome(chrome), m_config(config) {}

    // Non-copyable
    SwitchEngine(const SwitchEngine&) = delete;
    SwitchEngine& operator=(const SwitchEngine&) = delete;

    /// Switch a device to one of its modes (or its desktop mode)
    vidmode_core::Result<void> switch_to(Device& device, LogicalMode& target);

    /// Switch a device to the listed mode equal to a description.
    /// Fails with NotFound if the device lists no such mode.
    vidmode_core::Result<void> switch_to(Device& device, const DisplayMode& requested);

    /// Switch a device back to its desktop mode
    vidmode_core::Result<void> restore_desktop(Device& device);

    /// Restore every device not at its desktop mode, release all mode data
    /// and restore chrome. Returns the first restore error, if any.
    vidmode_core::Result<void> shutdown(IDisplayStore& store);

    /// Get current state (Idle between attempts)
    [[nodiscard]] SwitchState state() const noexcept { return m_state; }

    /// Get states entered by the last attempt
    [[nodiscard]] const std::vector<SwitchState>& transitions() const noexcept { return m_transitions; }

    /// Get configuration
    [[nodiscard]] const SwitchConfig& config() const noexcept { return m_config; }

    /// Set configuration
    void set_config(const SwitchConfig& config) { m_config = config; }

    /// Get number of successful switches
    [[nodiscard]] std::uint64_t switch_count() const noexcept { return m_switch_count; }

private:
    void enter(SwitchState state);
    [[nodiscard]] std::optional<FadeToken> fade_out();
    void fade_in(const std::optional<FadeToken>& token);
    void release_capture(DeviceId device, bool main);
    vidmode_core::Result<void> fail(vidmode_core::Error error);

    IDisplayPlatform& m_platform;
    IWindowChrome& m_chrome;
    SwitchConfig m_config;

    SwitchState m_state = SwitchState::Idle;
    std::vector<SwitchState> m_transitions;
    std::uint64_t m_switch_count = 0;
};

} // namespace vidmode_display
