#pragma once

/// @file types.hpp
/// @brief Core value types for vidmode_display

#include "fwd.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace vidmode_display {

// =============================================================================
// Identifiers
// =============================================================================

/// Native display identifier (0 is never a valid display)
using DeviceId = std::uint32_t;

/// Null display identifier
inline constexpr DeviceId k_null_device = 0;

/// Opaque reference to one platform mode descriptor
enum class NativeModeRef : std::uintptr_t {
    Null = 0,
};

// =============================================================================
// Pixel Format
// =============================================================================

/// Pixel formats a display mode can present
enum class PixelFormat : std::uint8_t {
    Unknown,
    Argb8888,     ///< 32-bit direct pixels
    Argb1555,     ///< 16-bit direct pixels
    Argb2101010,  ///< 30-bit direct pixels
};

/// Get format name
[[nodiscard]] inline const char* to_string(PixelFormat format) {
    switch (format) {
        case PixelFormat::Unknown: return "UNKNOWN";
        case PixelFormat::Argb8888: return "ARGB8888";
        case PixelFormat::Argb1555: return "ARGB1555";
        case PixelFormat::Argb2101010: return "ARGB2101010";
    }
    return "UNKNOWN";
}

/// Get bits per pixel for a format (0 for Unknown)
[[nodiscard]] inline std::uint32_t bits_per_pixel(PixelFormat format) {
    switch (format) {
        case PixelFormat::Argb8888: return 32;
        case PixelFormat::Argb1555: return 16;
        case PixelFormat::Argb2101010: return 32;
        case PixelFormat::Unknown: return 0;
    }
    return 0;
}

/// Parse a format name (case-insensitive, e.g. "argb8888")
[[nodiscard]] std::optional<PixelFormat> parse_pixel_format(std::string_view name);

/// Reported pixel encodings of native mode descriptors
namespace pixel_encoding {
    inline constexpr const char* k_direct32 = "--------RRRRRRRRGGGGGGGGBBBBBBBB";
    inline constexpr const char* k_direct16 = "-RRRRRGGGGGBBBBB";
    inline constexpr const char* k_direct30 = "--RRRRRRRRRRGGGGGGGGGGBBBBBBBBBB";
    inline constexpr const char* k_indexed8 = "PPPPPPPP";
}

/// Map a reported pixel encoding to a supported format.
/// Comparison is case-insensitive; anything else maps to Unknown.
[[nodiscard]] PixelFormat pixel_format_from_encoding(std::string_view encoding);

// =============================================================================
// Mode Flags
// =============================================================================

/// Native descriptor flag bits
namespace mode_flags {
    inline constexpr std::uint32_t k_valid = 0x00000001;
    inline constexpr std::uint32_t k_safe = 0x00000002;
    inline constexpr std::uint32_t k_default = 0x00000004;
    inline constexpr std::uint32_t k_always_show = 0x00000008;
    inline constexpr std::uint32_t k_not_resize = 0x00000010;
    inline constexpr std::uint32_t k_requires_pan = 0x00000020;
    inline constexpr std::uint32_t k_interlaced = 0x00000040;
    inline constexpr std::uint32_t k_never_show = 0x00000080;
    inline constexpr std::uint32_t k_simulscan = 0x00000100;
    inline constexpr std::uint32_t k_not_preset = 0x00000200;
    inline constexpr std::uint32_t k_built_in = 0x00000400;
    inline constexpr std::uint32_t k_stretched = 0x00000800;
    inline constexpr std::uint32_t k_not_graphics_quality = 0x00001000;

    /// Flags carried by an ordinary usable mode
    inline constexpr std::uint32_t k_usable = k_valid | k_safe;
}

/// Parse a single flag name (e.g. "valid", "never_show")
[[nodiscard]] std::optional<std::uint32_t> parse_mode_flag(std::string_view name);

// =============================================================================
// Platform Status
// =============================================================================

/// Status codes returned by platform calls
enum class PlatformStatus : std::int32_t {
    Success = 0,
    Failure = 1000,
    IllegalArgument = 1001,
    InvalidConnection = 1002,
    InvalidContext = 1003,
    CannotComplete = 1004,
    NotImplemented = 1006,
    RangeCheck = 1007,
    TypeCheck = 1008,
    InvalidOperation = 1010,
    NoneAvailable = 1011,
};

/// Translate a platform status to its name ("Unknown Error" if unrecognized)
[[nodiscard]] const char* platform_status_name(PlatformStatus status);

/// Parse a platform status name
[[nodiscard]] std::optional<PlatformStatus> parse_platform_status(std::string_view name);

// =============================================================================
// Geometry
// =============================================================================

/// Rectangle in global display coordinates
struct Rect {
    std::int32_t x = 0;
    std::int32_t y = 0;
    std::int32_t w = 0;
    std::int32_t h = 0;

    [[nodiscard]] bool operator==(const Rect& other) const {
        return x == other.x && y == other.y && w == other.w && h == other.h;
    }

    [[nodiscard]] bool empty() const {
        return w <= 0 || h <= 0;
    }
};

// =============================================================================
// Display Mode
// =============================================================================

/// Hardware-independent description of a display mode
struct DisplayMode {
    /// Width in pixels
    std::uint32_t width = 0;
    /// Height in pixels
    std::uint32_t height = 0;
    /// Refresh rate in Hz (0 = unknown)
    std::uint32_t refresh_rate = 0;
    /// Pixel format
    PixelFormat format = PixelFormat::Unknown;

    /// Two modes are equal iff all four attributes match
    [[nodiscard]] bool operator==(const DisplayMode& other) const {
        return width == other.width &&
               height == other.height &&
               refresh_rate == other.refresh_rate &&
               format == other.format;
    }

    [[nodiscard]] bool operator!=(const DisplayMode& other) const {
        return !(*this == other);
    }

    /// Check that the mode describes something a display can present
    [[nodiscard]] bool is_valid() const {
        return width > 0 && height > 0 && format != PixelFormat::Unknown;
    }

    /// Get mode as string (e.g., "1920x1080@60Hz ARGB8888")
    [[nodiscard]] std::string to_string() const {
        std::string s = std::to_string(width) + "x" + std::to_string(height);
        if (refresh_rate > 0) {
            s += "@" + std::to_string(refresh_rate) + "Hz";
        }
        s += " ";
        s += vidmode_display::to_string(format);
        return s;
    }
};

// =============================================================================
// Native Descriptor Data
// =============================================================================

/// Nominal output period reported by a display's timing source
struct RefreshPeriod {
    /// Period length in `time_scale` units
    std::int64_t time_value = 0;
    /// Units per second
    std::int32_t time_scale = 0;
    /// Period is not defined (e.g. variable-rate output)
    bool indefinite = false;
};

/// Properties reported for one native mode descriptor
struct NativeModeInfo {
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    /// Reported refresh rate, may be 0 (e.g. built-in panels)
    double refresh_rate = 0.0;
    /// Descriptor flag bits (see mode_flags)
    std::uint32_t io_flags = 0;
    /// Reported pixel encoding (see pixel_encoding)
    std::string pixel_encoding;
};

} // namespace vidmode_display
