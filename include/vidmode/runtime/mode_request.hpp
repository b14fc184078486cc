#pragma once

/// @file mode_request.hpp
/// @brief Parsing and resolution of user mode requests

#include <vidmode/core/error.hpp>
#include <vidmode/display/types.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace vidmode_display {
struct Device;
class LogicalMode;
}

namespace vidmode_runtime {

// =============================================================================
// ModeRequest
// =============================================================================

/// Requested mode, as typed by a user: `WIDTHxHEIGHT[@HZ][:FORMAT]`.
/// Unset refresh rate or format match any listed mode.
struct ModeRequest {
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    /// Requested refresh rate in Hz (0 = any)
    std::uint32_t refresh_rate = 0;
    std::optional<vidmode_display::PixelFormat> format;

    [[nodiscard]] bool operator==(const ModeRequest& other) const {
        return width == other.width && height == other.height &&
               refresh_rate == other.refresh_rate && format == other.format;
    }

    /// Check if a logical mode satisfies the request
    [[nodiscard]] bool matches(const vidmode_display::DisplayMode& mode) const;

    /// Get request as string (e.g., "1280x720@60:ARGB8888")
    [[nodiscard]] std::string to_string() const;
};

/// Parse `WIDTHxHEIGHT[@HZ][:FORMAT]`
[[nodiscard]] vidmode_core::Result<ModeRequest> parse_mode_request(std::string_view text);

/// Find the listed mode that best satisfies a request.
/// Among matches, the requested format (or ARGB8888) and the highest
/// refresh rate win. Returns nullptr if nothing matches.
[[nodiscard]] vidmode_display::LogicalMode* find_best_mode(vidmode_display::Device& device,
                                                           const ModeRequest& request);

} // namespace vidmode_runtime
