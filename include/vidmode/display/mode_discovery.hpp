#pragma once

/// @file mode_discovery.hpp
/// @brief Native descriptor enumeration and logical mode de-duplication

#include "fwd.hpp"
#include "types.hpp"
#include "logical_mode.hpp"

#include <optional>
#include <vector>

namespace vidmode_display {

// =============================================================================
// Discovery Result
// =============================================================================

/// Modes discovered for one display
struct DiscoveredModes {
    /// Mode in use when discovery ran (nullopt if it could not be built)
    std::optional<LogicalMode> desktop_mode;
    /// De-duplicated supported modes, desktop mode included
    std::vector<LogicalMode> modes;
    /// Descriptors dropped by the flag filter
    std::size_t filtered_count = 0;
    /// Descriptors dropped for an unsupported pixel encoding
    std::size_t unsupported_count = 0;
    /// Descriptors merged into an existing entry
    std::size_t merged_count = 0;
};

// =============================================================================
// ModeDiscovery
// =============================================================================

/// Converts native descriptors into de-duplicated logical modes
class ModeDiscovery {
public:
    explicit ModeDiscovery(IDisplayPlatform& platform)
        : m_platform(platform) {}

    /// Check descriptor flags: no never-show or not-graphics-quality bits,
    /// and both valid and safe bits set
    [[nodiscard]] static bool has_valid_flags(std::uint32_t io_flags) noexcept;

    /// Convert one descriptor to a logical mode.
    ///
    /// The flag filter is skipped when `is_current` is set: a mode already
    /// in use is never rejected. Returns nullopt (dropping the handle) if the
    /// descriptor is filtered or its encoding is unsupported.
    [[nodiscard]] std::optional<LogicalMode> build_mode(
        NativeModeHandle handle,
        bool is_current,
        const std::optional<RefreshPeriod>& timing_source) const;

    /// Discover the desktop mode and every supported mode of a display
    [[nodiscard]] DiscoveredModes discover(DeviceId display) const;

    /// Insert a mode, merging its candidates into an equal entry if present.
    /// Returns true if the equal entry gained at least one new candidate.
    static bool insert_or_merge(std::vector<LogicalMode>& modes, LogicalMode&& mode);

private:
    enum class Rejection : std::uint8_t { None, Flags, Format };

    [[nodiscard]] std::optional<LogicalMode> build_mode_impl(
        NativeModeHandle handle,
        bool is_current,
        const std::optional<RefreshPeriod>& timing_source,
        Rejection& rejection) const;

    IDisplayPlatform& m_platform;
};

} // namespace vidmode_display
