/// @file switch_engine.cpp
/// @brief SwitchEngine implementation

#include <vidmode/display/switch_engine.hpp>
#include <vidmode/display/device.hpp>
#include <vidmode/display/logical_mode.hpp>
#include <vidmode/display/window_chrome.hpp>
#include <vidmode/core/log.hpp>

#include <utility>

namespace vidmode_display {

const char* switch_state_name(SwitchState state) {
    switch (state) {
        case SwitchState::Idle: return "Idle";
        case SwitchState::FadeOut: return "FadeOut";
        case SwitchState::Captured: return "Captured";
        case SwitchState::SkipCapture: return "SkipCapture";
        case SwitchState::ModeApplied: return "ModeApplied";
        case SwitchState::FadeIn: return "FadeIn";
        case SwitchState::CaptureFailed: return "CaptureFailed";
        case SwitchState::ApplyFailed: return "ApplyFailed";
        case SwitchState::ReleaseCapture: return "ReleaseCapture";
        default: return "Unknown";
    }
}

// =============================================================================
// State Helpers
// =============================================================================

void SwitchEngine::enter(SwitchState state) {
    m_state = state;
    m_transitions.push_back(state);
    vidmode_core::display_logger()->trace("Switch state -> {}", switch_state_name(state));
}

std::optional<FadeToken> SwitchEngine::fade_out() {
    enter(SwitchState::FadeOut);
    if (!m_config.fade_enabled) {
        return std::nullopt;
    }

    // A missing reservation only disables the visual fade
    auto token = m_platform.acquire_fade_reservation(m_config.reservation_seconds);
    if (!token) {
        vidmode_core::display_logger()->debug("No fade reservation available");
        return std::nullopt;
    }

    PlatformStatus status = m_platform.fade(*token, m_config.fade_out_seconds,
        FadeBlend::Normal, FadeBlend::SolidColor, true);
    if (status != PlatformStatus::Success) {
        vidmode_core::display_logger()->warn("Fade out failed: {}", platform_status_name(status));
    }
    return token;
}

void SwitchEngine::fade_in(const std::optional<FadeToken>& token) {
    enter(SwitchState::FadeIn);
    if (!token) {
        return;
    }

    PlatformStatus status = m_platform.fade(*token, m_config.fade_in_seconds,
        FadeBlend::SolidColor, FadeBlend::Normal, false);
    if (status != PlatformStatus::Success) {
        vidmode_core::display_logger()->warn("Fade in failed: {}", platform_status_name(status));
    }
    m_platform.release_fade_reservation(*token);
}

void SwitchEngine::release_capture(DeviceId device, bool main) {
    PlatformStatus status = main ? m_platform.release_all_displays() : m_platform.release_display(device);
    if (status != PlatformStatus::Success) {
        vidmode_core::display_logger()->warn("{} failed: {}",
            main ? "release_all_displays()" : "release_display()", platform_status_name(status));
    }
}

vidmode_core::Result<void> SwitchEngine::fail(vidmode_core::Error error) {
    vidmode_core::set_last_error(error);
    vidmode_core::display_logger()->error("Mode switch failed: {}", error.message());
    return vidmode_core::Err(std::move(error));
}

// =============================================================================
// Switching
// =============================================================================

vidmode_core::Result<void> SwitchEngine::switch_to(Device& device, LogicalMode& target) {
    VIDMODE_LOG_SCOPE("SwitchEngine::switch_to");
    auto logger = vidmode_core::display_logger();

    m_transitions.clear();
    m_state = SwitchState::Idle;

    const bool restoring = (target == device.desktop_mode);
    const bool main = m_platform.is_main(device.id);

    logger->info("Switching {} to {}{}", device.label(), target.to_string(),
        restoring ? " (desktop)" : "");

    std::optional<FadeToken> token = fade_out();

    // Capture
    if (restoring) {
        enter(SwitchState::SkipCapture);
    } else {
        PlatformStatus status = main ? m_platform.capture_all_displays()
                                     : m_platform.capture_display(device.id);
        if (status != PlatformStatus::Success) {
            enter(SwitchState::CaptureFailed);
            vidmode_core::Error error = vidmode_core::CaptureError::capture_failed(
                main ? "capture_all_displays()" : "capture_display()",
                platform_status_name(status), device.id);
            error.with_context("device", device.label());
            fade_in(token);
            enter(SwitchState::Idle);
            return fail(std::move(error));
        }
        enter(SwitchState::Captured);
    }

    // Apply: candidates are alternates, first success wins
    std::optional<std::size_t> applied;
    PlatformStatus last_status = PlatformStatus::Success;
    const auto& candidates = target.candidates();
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        last_status = m_platform.set_display_mode(device.id, candidates[i].get());
        logger->debug("Candidate {}/{} for {}: {}", i + 1, candidates.size(),
            target.to_string(), platform_status_name(last_status));
        if (last_status == PlatformStatus::Success) {
            applied = i;
            break;
        }
    }

    if (!applied) {
        enter(SwitchState::ApplyFailed);
        vidmode_core::Error error = candidates.empty()
            ? vidmode_core::Error(vidmode_core::ApplyError::no_candidates(target.to_string(), device.id))
            : vidmode_core::Error(vidmode_core::ApplyError::apply_failed(
                  "set_display_mode()", platform_status_name(last_status), device.id));
        error.with_context("device", device.label());
        error.with_context("mode", target.to_string());

        enter(SwitchState::ReleaseCapture);
        if (restoring) {
            logger->warn("Desktop restore of {} failed, releasing displays", device.label());
            release_capture(device.id, main);
            if (main) {
                m_chrome.restore_chrome();
            }
        } else {
            logger->warn("Rolling back capture of {}", device.label());
            release_capture(device.id, main);
        }

        fade_in(token);
        enter(SwitchState::Idle);
        return fail(std::move(error));
    }

    target.promote(*applied);
    device.current_mode = target.mode();
    enter(SwitchState::ModeApplied);

    if (restoring) {
        release_capture(device.id, main);
        if (main) {
            m_chrome.restore_chrome();
        }
    } else if (main) {
        // Keep the menu bar out of the captured main display
        m_chrome.suppress_chrome();
    }

    fade_in(token);
    enter(SwitchState::Idle);
    ++m_switch_count;

    logger->info("{} now at {}", device.label(), device.current_mode.to_string());
    return vidmode_core::Ok();
}

vidmode_core::Result<void> SwitchEngine::switch_to(Device& device, const DisplayMode& requested) {
    if (requested == device.desktop_mode.mode()) {
        return restore_desktop(device);
    }

    LogicalMode* target = device.find_mode(requested);
    if (!target) {
        m_transitions.clear();
        vidmode_core::Error error(vidmode_core::ErrorCode::NotFound,
            "Mode " + requested.to_string() + " not supported by " + device.label());
        return fail(std::move(error));
    }
    return switch_to(device, *target);
}

vidmode_core::Result<void> SwitchEngine::restore_desktop(Device& device) {
    return switch_to(device, device.desktop_mode);
}

vidmode_core::Result<void> SwitchEngine::shutdown(IDisplayStore& store) {
    VIDMODE_LOG_SCOPE("SwitchEngine::shutdown");
    auto logger = vidmode_core::display_logger();

    std::optional<vidmode_core::Error> first_error;
    auto devices = store.devices();

    for (Device* device : devices) {
        if (device->is_at_desktop()) {
            continue;
        }
        auto result = restore_desktop(*device);
        if (!result && !first_error) {
            first_error = result.error();
        }
    }

    for (Device* device : devices) {
        device->desktop_mode.release_candidates();
        for (auto& mode : device->modes) {
            mode.release_candidates();
        }
    }

    m_chrome.restore_chrome();

    if (first_error) {
        logger->warn("Shutdown finished with errors: {}", first_error->message());
        return vidmode_core::Err(std::move(*first_error));
    }
    logger->debug("Shutdown released {} devices", devices.size());
    return vidmode_core::Ok();
}

} // namespace vidmode_display
