/// @file mode_request.cpp
/// @brief Mode request parsing and resolution

#include <vidmode/runtime/mode_request.hpp>
#include <vidmode/display/device.hpp>
#include <vidmode/display/logical_mode.hpp>

#include <charconv>
#include <system_error>
#include <limits>

namespace vidmode_runtime {

namespace {

[[nodiscard]] std::optional<std::uint32_t> parse_uint(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

[[nodiscard]] vidmode_core::Error invalid_request(std::string_view text, const char* reason) {
    return vidmode_core::ConfigError::invalid_value("mode", std::string(text) + " (" + reason + ")");
}

} // anonymous namespace

bool ModeRequest::matches(const vidmode_display::DisplayMode& mode) const {
    if (mode.width != width || mode.height != height) {
        return false;
    }
    if (refresh_rate != 0 && mode.refresh_rate != refresh_rate) {
        return false;
    }
    if (format && mode.format != *format) {
        return false;
    }
    return true;
}

std::string ModeRequest::to_string() const {
    std::string s = std::to_string(width) + "x" + std::to_string(height);
    if (refresh_rate > 0) {
        s += "@" + std::to_string(refresh_rate);
    }
    if (format) {
        s += ":";
        s += vidmode_display::to_string(*format);
    }
    return s;
}

vidmode_core::Result<ModeRequest> parse_mode_request(std::string_view text) {
    ModeRequest request;
    std::string_view rest = text;

    // Format suffix
    if (auto colon = rest.find(':'); colon != std::string_view::npos) {
        auto format = vidmode_display::parse_pixel_format(rest.substr(colon + 1));
        if (!format) {
            return vidmode_core::Err<ModeRequest>(invalid_request(text, "unknown pixel format"));
        }
        request.format = *format;
        rest = rest.substr(0, colon);
    }

    // Refresh suffix (accepts a trailing "Hz")
    if (auto at = rest.find('@'); at != std::string_view::npos) {
        std::string_view hz = rest.substr(at + 1);
        if (hz.size() > 2 && (hz.substr(hz.size() - 2) == "Hz" || hz.substr(hz.size() - 2) == "hz")) {
            hz.remove_suffix(2);
        }
        auto rate = parse_uint(hz);
        if (!rate) {
            return vidmode_core::Err<ModeRequest>(invalid_request(text, "bad refresh rate"));
        }
        request.refresh_rate = *rate;
        rest = rest.substr(0, at);
    }

    auto x = rest.find_first_of("xX");
    if (x == std::string_view::npos) {
        return vidmode_core::Err<ModeRequest>(invalid_request(text, "expected WIDTHxHEIGHT"));
    }

    auto width = parse_uint(rest.substr(0, x));
    auto height = parse_uint(rest.substr(x + 1));
    if (!width || !height || *width == 0 || *height == 0) {
        return vidmode_core::Err<ModeRequest>(invalid_request(text, "bad dimensions"));
    }
    request.width = *width;
    request.height = *height;

    return vidmode_core::Ok(request);
}

vidmode_display::LogicalMode* find_best_mode(vidmode_display::Device& device, const ModeRequest& request) {
    vidmode_display::LogicalMode* best = nullptr;
    std::int64_t best_score = std::numeric_limits<std::int64_t>::min();

    for (auto& mode : device.modes) {
        if (!request.matches(mode.mode())) {
            continue;
        }

        std::int64_t score = 0;

        // Prefer the everyday 32-bit format when none was requested
        if (!request.format && mode.format() == vidmode_display::PixelFormat::Argb8888) {
            score += 10000;
        }

        // Prefer higher refresh rates
        score += static_cast<std::int64_t>(mode.refresh_rate()) * 10;

        if (score > best_score) {
            best_score = score;
            best = &mode;
        }
    }

    return best;
}

} // namespace vidmode_runtime
