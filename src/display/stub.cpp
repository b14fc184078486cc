/// @file stub.cpp
/// @brief vidmode_display module version information

#include <vidmode/display/display_module.hpp>

namespace vidmode_display {

/// Module version
static constexpr const char* k_version = "1.0.0";

/// Module name
static constexpr const char* k_module_name = "vidmode_display";

const char* version() noexcept {
    return k_version;
}

const char* module_name() noexcept {
    return k_module_name;
}

} // namespace vidmode_display
