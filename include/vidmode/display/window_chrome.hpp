#pragma once

/// @file window_chrome.hpp
/// @brief Window-manager chrome collaborator (menu bar and the like)

#include "fwd.hpp"

#include <cstdint>

namespace vidmode_display {

// =============================================================================
// IWindowChrome
// =============================================================================

/// Hides and shows window-manager chrome around full-screen switches.
/// Both calls are best-effort.
class IWindowChrome {
public:
    virtual ~IWindowChrome() = default;

    /// Hide chrome while the main display is captured
    virtual void suppress_chrome() = 0;

    /// Show chrome again
    virtual void restore_chrome() = 0;
};

// =============================================================================
// RecordingWindowChrome
// =============================================================================

/// Chrome implementation that records calls (headless runs, testing)
class RecordingWindowChrome : public IWindowChrome {
public:
    RecordingWindowChrome() = default;

    void suppress_chrome() override;
    void restore_chrome() override;

    [[nodiscard]] bool is_suppressed() const noexcept { return m_suppressed; }
    [[nodiscard]] std::uint32_t suppress_count() const noexcept { return m_suppress_count; }
    [[nodiscard]] std::uint32_t restore_count() const noexcept { return m_restore_count; }

    void reset_counters() noexcept {
        m_suppress_count = 0;
        m_restore_count = 0;
    }

private:
    bool m_suppressed = false;
    std::uint32_t m_suppress_count = 0;
    std::uint32_t m_restore_count = 0;
};

} // namespace vidmode_display
