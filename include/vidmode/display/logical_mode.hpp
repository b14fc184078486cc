#pragma once

/// @file logical_mode.hpp
/// @brief Logical display mode with its native candidates

#include "fwd.hpp"
#include "types.hpp"
#include "native_mode.hpp"

#include <cstddef>
#include <vector>

namespace vidmode_display {

// =============================================================================
// LogicalMode
// =============================================================================

/// A DisplayMode plus the ordered native descriptors that present it.
///
/// Candidates are logically equivalent but not all of them apply on every
/// device, so the switch engine tries them in order and promotes the one
/// that worked. The collection is non-empty while the mode is reachable and
/// is released exactly once, by release_candidates() or destruction.
class LogicalMode {
public:
    LogicalMode() = default;

    /// Construct from a description and its first candidate
    LogicalMode(const DisplayMode& mode, NativeModeHandle first);

    // Move-only (owns native references)
    LogicalMode(const LogicalMode&) = delete;
    LogicalMode& operator=(const LogicalMode&) = delete;
    LogicalMode(LogicalMode&&) noexcept = default;
    LogicalMode& operator=(LogicalMode&&) noexcept = default;

    /// Get the logical description
    [[nodiscard]] const DisplayMode& mode() const noexcept { return m_mode; }

    [[nodiscard]] std::uint32_t width() const noexcept { return m_mode.width; }
    [[nodiscard]] std::uint32_t height() const noexcept { return m_mode.height; }
    [[nodiscard]] std::uint32_t refresh_rate() const noexcept { return m_mode.refresh_rate; }
    [[nodiscard]] PixelFormat format() const noexcept { return m_mode.format; }

    // =========================================================================
    // Candidates
    // =========================================================================

    /// Get candidates in try order
    [[nodiscard]] const std::vector<NativeModeHandle>& candidates() const noexcept { return m_candidates; }

    /// Get candidate count
    [[nodiscard]] std::size_t candidate_count() const noexcept { return m_candidates.size(); }

    /// Check if candidate references a descriptor
    [[nodiscard]] bool has_candidate(NativeModeRef ref) const;

    /// Append a candidate. Returns false (and releases it) if the same
    /// descriptor is already held.
    bool add_candidate(NativeModeHandle handle);

    /// Move all candidates of an equal mode to the back of this one.
    /// Returns the number of candidates taken over.
    std::size_t merge(LogicalMode&& other);

    /// Move the candidate at index to the front
    void promote(std::size_t index);

    /// Release every candidate
    void release_candidates() noexcept;

    /// Check if candidates were released
    [[nodiscard]] bool is_released() const noexcept { return m_candidates.empty(); }

    // =========================================================================
    // Comparison
    // =========================================================================

    /// Logical equality (candidates are ignored)
    [[nodiscard]] bool operator==(const LogicalMode& other) const { return m_mode == other.m_mode; }
    [[nodiscard]] bool operator!=(const LogicalMode& other) const { return !(*this == other); }
    [[nodiscard]] bool operator==(const DisplayMode& other) const { return m_mode == other; }
    [[nodiscard]] bool operator!=(const DisplayMode& other) const { return !(m_mode == other); }

    /// Get mode as string
    [[nodiscard]] std::string to_string() const { return m_mode.to_string(); }

private:
    DisplayMode m_mode;
    std::vector<NativeModeHandle> m_candidates;
};

} // namespace vidmode_display
