#pragma once

/// @file simulated_platform.hpp
/// @brief In-memory display platform (headless runs, testing)

#include "fwd.hpp"
#include "types.hpp"
#include "platform.hpp"

#include <vidmode/core/error.hpp>

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace vidmode_display {

// =============================================================================
// SimulatedDisplay
// =============================================================================

/// Description of one simulated display
struct SimulatedDisplay {
    DeviceId id = k_null_device;
    bool main = false;
    /// Display this one mirrors (k_null_device if none)
    DeviceId mirror_of = k_null_device;
    std::vector<std::string> product_names;
    Rect bounds;
    /// Bottom-left-origin visible frame (nullopt: no screen)
    std::optional<Rect> visible_frame;
    /// Timing source (nullopt: none can be created)
    std::optional<RefreshPeriod> refresh_period;
};

/// One recorded fade call
struct FadeCall {
    double seconds = 0.0;
    FadeBlend from = FadeBlend::Normal;
    FadeBlend to = FadeBlend::Normal;
    bool synchronous = false;
};

// =============================================================================
// SimulatedPlatform
// =============================================================================

/// IDisplayPlatform backed by memory.
///
/// Descriptors are reference counted like the real thing: copy calls hand
/// the caller a reference, release_mode() drops one. Releasing a descriptor
/// with no outstanding references is counted as an over-release instead of
/// going negative. Failures are scripted per call family (enumeration,
/// capture) or per descriptor (apply).
class SimulatedPlatform : public IDisplayPlatform {
public:
    SimulatedPlatform() = default;

    // Non-copyable, non-movable (handles keep a pointer to the platform)
    SimulatedPlatform(const SimulatedPlatform&) = delete;
    SimulatedPlatform& operator=(const SimulatedPlatform&) = delete;
    SimulatedPlatform(SimulatedPlatform&&) = delete;
    SimulatedPlatform& operator=(SimulatedPlatform&&) = delete;

    // =========================================================================
    // Setup
    // =========================================================================

    /// Add a display
    void add_display(const SimulatedDisplay& display);

    /// Create a descriptor owned by a display.
    /// Listed descriptors are returned by copy_all_modes().
    NativeModeRef add_descriptor(DeviceId display, const NativeModeInfo& info, bool listed = true);

    /// Make a descriptor the display's current mode
    void set_current_mode(DeviceId display, NativeModeRef mode);

    /// Make copy_current_mode() fail for a display
    void set_current_mode_available(DeviceId display, bool available);

    /// Script the status of set_display_mode() for a descriptor
    void set_apply_status(NativeModeRef mode, PlatformStatus status);

    /// Script the status of capture calls
    void set_capture_status(PlatformStatus status) { m_capture_status = status; }

    /// Script the status of online_displays()
    void set_enumeration_status(PlatformStatus status) { m_enumeration_status = status; }

    /// Enable or disable fade reservations
    void set_fade_available(bool available) { m_fade_available = available; }

    /// Load a platform description
    [[nodiscard]] static vidmode_core::Result<std::unique_ptr<SimulatedPlatform>> from_json(
        const nlohmann::json& json);

    /// Load a platform description from a JSON file
    [[nodiscard]] static vidmode_core::Result<std::unique_ptr<SimulatedPlatform>> load_file(
        const std::string& path);

    // =========================================================================
    // IDisplayPlatform
    // =========================================================================

    PlatformStatus online_displays(std::vector<DeviceId>& out) override;
    [[nodiscard]] bool is_main(DeviceId display) const override;
    [[nodiscard]] DeviceId mirrors(DeviceId display) const override;
    [[nodiscard]] std::vector<std::string> product_names(DeviceId display) const override;
    [[nodiscard]] Rect bounds(DeviceId display) const override;
    [[nodiscard]] std::optional<Rect> visible_frame(DeviceId display) const override;
    [[nodiscard]] std::int32_t main_display_height() const override;

    [[nodiscard]] NativeModeRef copy_current_mode(DeviceId display) override;
    [[nodiscard]] std::vector<NativeModeRef> copy_all_modes(DeviceId display) override;
    void retain_mode(NativeModeRef mode) override;
    void release_mode(NativeModeRef mode) override;
    [[nodiscard]] NativeModeInfo mode_info(NativeModeRef mode) const override;
    [[nodiscard]] std::optional<RefreshPeriod> nominal_refresh_period(DeviceId display) const override;

    PlatformStatus capture_display(DeviceId display) override;
    PlatformStatus capture_all_displays() override;
    PlatformStatus release_display(DeviceId display) override;
    PlatformStatus release_all_displays() override;
    PlatformStatus set_display_mode(DeviceId display, NativeModeRef mode) override;

    [[nodiscard]] std::optional<FadeToken> acquire_fade_reservation(double seconds) override;
    PlatformStatus fade(FadeToken token, double seconds, FadeBlend from, FadeBlend to,
                        bool synchronous) override;
    void release_fade_reservation(FadeToken token) override;

    // =========================================================================
    // Inspection
    // =========================================================================

    /// Get descriptor the display is set to
    [[nodiscard]] NativeModeRef current_mode(DeviceId display) const;

    /// Get outstanding caller references to one descriptor
    [[nodiscard]] std::uint32_t references(NativeModeRef mode) const;

    /// Get outstanding caller references across all descriptors
    [[nodiscard]] std::uint64_t outstanding_references() const;

    /// Get number of releases that found no outstanding reference
    [[nodiscard]] std::uint64_t over_release_count() const noexcept { return m_over_releases; }

    /// Check if display is captured (individually or through capture-all)
    [[nodiscard]] bool is_captured(DeviceId display) const;

    /// Check if any display is captured
    [[nodiscard]] bool any_captured() const noexcept { return m_all_captured || !m_captured.empty(); }

    [[nodiscard]] std::uint32_t capture_count() const noexcept { return m_capture_count; }
    [[nodiscard]] std::uint32_t release_count() const noexcept { return m_release_count; }

    /// Get every set_display_mode() call in order
    [[nodiscard]] const std::vector<std::pair<DeviceId, NativeModeRef>>& apply_attempts() const noexcept {
        return m_apply_attempts;
    }

    /// Get every fade call in order
    [[nodiscard]] const std::vector<FadeCall>& fade_calls() const noexcept { return m_fade_calls; }

    /// Get number of fade reservations still held
    [[nodiscard]] std::size_t active_fade_reservations() const noexcept { return m_fade_reservations.size(); }

    /// Look up a descriptor created by from_json() by its name
    [[nodiscard]] NativeModeRef descriptor(const std::string& name) const;

    /// Clear call records (not references or capture state)
    void reset_counters();

private:
    struct DisplayEntry {
        SimulatedDisplay display;
        NativeModeRef current = NativeModeRef::Null;
        bool current_available = true;
        std::vector<NativeModeRef> listed;
    };

    struct DescriptorEntry {
        DeviceId owner = k_null_device;
        NativeModeInfo info;
        PlatformStatus apply_status = PlatformStatus::Success;
        std::uint32_t references = 0;
    };

    [[nodiscard]] const DisplayEntry* find_display(DeviceId display) const;
    [[nodiscard]] DisplayEntry* find_display(DeviceId display);

    std::vector<DisplayEntry> m_displays;
    std::map<NativeModeRef, DescriptorEntry> m_descriptors;
    std::map<std::string, NativeModeRef> m_descriptor_names;
    std::uintptr_t m_next_descriptor = 1;

    PlatformStatus m_enumeration_status = PlatformStatus::Success;
    PlatformStatus m_capture_status = PlatformStatus::Success;
    std::set<DeviceId> m_captured;
    bool m_all_captured = false;
    std::uint32_t m_capture_count = 0;
    std::uint32_t m_release_count = 0;
    std::uint64_t m_over_releases = 0;
    std::vector<std::pair<DeviceId, NativeModeRef>> m_apply_attempts;

    bool m_fade_available = true;
    std::uint32_t m_next_fade_token = 1;
    std::set<std::uint32_t> m_fade_reservations;
    std::vector<FadeCall> m_fade_calls;
};

} // namespace vidmode_display
