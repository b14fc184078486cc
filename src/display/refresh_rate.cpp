/// @file refresh_rate.cpp
/// @brief Refresh rate resolution

#include <vidmode/display/refresh_rate.hpp>

#include <cmath>
#include <limits>

namespace vidmode_display {

namespace {

/// Round to the nearest whole hertz, saturating at the largest storable rate
std::uint32_t round_hz(double hz) {
    constexpr auto k_max = static_cast<double>(std::numeric_limits<std::uint32_t>::max());
    double rounded = std::floor(hz + 0.5);
    if (rounded >= k_max) {
        return std::numeric_limits<std::uint32_t>::max();
    }
    return static_cast<std::uint32_t>(rounded);
}

} // anonymous namespace

std::uint32_t refresh_rate_from_period(const RefreshPeriod& period) {
    if (period.indefinite || period.time_value <= 0 || period.time_scale <= 0) {
        return 0;
    }
    double hz = static_cast<double>(period.time_scale) / static_cast<double>(period.time_value);
    return round_hz(hz);
}

std::uint32_t resolve_refresh_rate(
    double reported_hz,
    const std::optional<RefreshPeriod>& timing_source) {

    // Negative or NaN rates are treated as unreported
    std::uint32_t rate = 0;
    if (std::isfinite(reported_hz) && reported_hz > 0.0) {
        rate = round_hz(reported_hz);
    }

    // Built-in panels commonly report 0
    if (rate == 0 && timing_source) {
        rate = refresh_rate_from_period(*timing_source);
    }

    return rate;
}

} // namespace vidmode_display
