/// @file types.cpp
/// @brief Value type helpers for vidmode_display

#include <vidmode/display/types.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace vidmode_display {

namespace {

[[nodiscard]] bool equals_ignore_case(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

// =============================================================================
// Pixel Format
// =============================================================================

std::optional<PixelFormat> parse_pixel_format(std::string_view name) {
    if (equals_ignore_case(name, "argb8888")) return PixelFormat::Argb8888;
    if (equals_ignore_case(name, "argb1555")) return PixelFormat::Argb1555;
    if (equals_ignore_case(name, "argb2101010")) return PixelFormat::Argb2101010;
    return std::nullopt;
}

PixelFormat pixel_format_from_encoding(std::string_view encoding) {
    if (equals_ignore_case(encoding, pixel_encoding::k_direct32)) {
        return PixelFormat::Argb8888;
    }
    if (equals_ignore_case(encoding, pixel_encoding::k_direct16)) {
        return PixelFormat::Argb1555;
    }
    if (equals_ignore_case(encoding, pixel_encoding::k_direct30)) {
        return PixelFormat::Argb2101010;
    }
    // Indexed and other exotic encodings are not presented
    return PixelFormat::Unknown;
}

// =============================================================================
// Mode Flags
// =============================================================================

std::optional<std::uint32_t> parse_mode_flag(std::string_view name) {
    static constexpr std::array<std::pair<const char*, std::uint32_t>, 13> k_names = {{
        {"valid", mode_flags::k_valid},
        {"safe", mode_flags::k_safe},
        {"default", mode_flags::k_default},
        {"always_show", mode_flags::k_always_show},
        {"not_resize", mode_flags::k_not_resize},
        {"requires_pan", mode_flags::k_requires_pan},
        {"interlaced", mode_flags::k_interlaced},
        {"never_show", mode_flags::k_never_show},
        {"simulscan", mode_flags::k_simulscan},
        {"not_preset", mode_flags::k_not_preset},
        {"built_in", mode_flags::k_built_in},
        {"stretched", mode_flags::k_stretched},
        {"not_graphics_quality", mode_flags::k_not_graphics_quality},
    }};

    auto it = std::find_if(k_names.begin(), k_names.end(),
        [name](const auto& entry) { return equals_ignore_case(name, entry.first); });
    if (it == k_names.end()) {
        return std::nullopt;
    }
    return it->second;
}

// =============================================================================
// Platform Status
// =============================================================================

const char* platform_status_name(PlatformStatus status) {
    switch (status) {
        case PlatformStatus::Success: return "Success";
        case PlatformStatus::Failure: return "Failure";
        case PlatformStatus::IllegalArgument: return "IllegalArgument";
        case PlatformStatus::InvalidConnection: return "InvalidConnection";
        case PlatformStatus::InvalidContext: return "InvalidContext";
        case PlatformStatus::CannotComplete: return "CannotComplete";
        case PlatformStatus::NotImplemented: return "NotImplemented";
        case PlatformStatus::RangeCheck: return "RangeCheck";
        case PlatformStatus::TypeCheck: return "TypeCheck";
        case PlatformStatus::InvalidOperation: return "InvalidOperation";
        case PlatformStatus::NoneAvailable: return "NoneAvailable";
    }
    return "Unknown Error";
}

std::optional<PlatformStatus> parse_platform_status(std::string_view name) {
    static constexpr std::array<PlatformStatus, 11> k_all = {
        PlatformStatus::Success,
        PlatformStatus::Failure,
        PlatformStatus::IllegalArgument,
        PlatformStatus::InvalidConnection,
        PlatformStatus::InvalidContext,
        PlatformStatus::CannotComplete,
        PlatformStatus::NotImplemented,
        PlatformStatus::RangeCheck,
        PlatformStatus::TypeCheck,
        PlatformStatus::InvalidOperation,
        PlatformStatus::NoneAvailable,
    };

    for (auto status : k_all) {
        if (equals_ignore_case(name, platform_status_name(status))) {
            return status;
        }
    }
    return std::nullopt;
}

} // namespace vidmode_display
