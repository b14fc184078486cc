#pragma once

/// @file refresh_rate.hpp
/// @brief Refresh rate resolution for native descriptors

#include "types.hpp"

#include <cstdint>
#include <optional>

namespace vidmode_display {

/// Resolve the integer refresh rate of a descriptor.
///
/// A nonzero reported rate is rounded to the nearest Hz. Otherwise the
/// timing source's nominal period is used (`round(time_scale / time_value)`)
/// when it is defined and nonzero. Returns 0 when neither is available; the
/// mode stays usable with an unreported rate.
[[nodiscard]] std::uint32_t resolve_refresh_rate(
    double reported_hz,
    const std::optional<RefreshPeriod>& timing_source);

/// Rate derived from a nominal period alone (0 if undefined)
[[nodiscard]] std::uint32_t refresh_rate_from_period(const RefreshPeriod& period);

} // namespace vidmode_display
