#pragma once

/// @file display_module.hpp
/// @brief Main include header for vidmode_display
///
/// vidmode_display discovers display devices and switches them between
/// their desktop mode and application-requested modes:
///
/// ## Features
///
/// - **Discovery**
///   - Main display first, mirrored displays excluded
///   - Validity filtering of native descriptors (current mode exempt)
///   - Logical de-duplication with candidate merging
///   - Refresh rate fallback to the display's timing source
///
/// - **Switching**
///   - Fade out, capture, apply, fade in
///   - Candidate retry with promotion of the descriptor that worked
///   - Full rollback on capture or apply failure
///   - Desktop restore at shutdown
///
/// ## Quick Start
///
/// ```cpp
/// #include <vidmode/display/display_module.hpp>
///
/// using namespace vidmode_display;
///
/// auto platform = SimulatedPlatform::load_file("displays.json");
/// DisplayStore store;
/// RecordingWindowChrome chrome;
///
/// DeviceRegistry registry(**platform, store);
/// auto devices = registry.discover_devices();
/// if (!devices) {
///     // vidmode_core::last_error() holds the reason
/// }
///
/// SwitchEngine engine(**platform, chrome);
/// Device& main = *devices->front();
/// auto result = engine.switch_to(main, DisplayMode{1280, 720, 60, PixelFormat::Argb8888});
///
/// // Restores every device and releases all mode data
/// engine.shutdown(store);
/// ```

#include "fwd.hpp"
#include "types.hpp"
#include "platform.hpp"
#include "native_mode.hpp"
#include "logical_mode.hpp"
#include "refresh_rate.hpp"
#include "mode_discovery.hpp"
#include "device.hpp"
#include "device_registry.hpp"
#include "window_chrome.hpp"
#include "switch_engine.hpp"
#include "simulated_platform.hpp"

namespace vidmode_display {

/// Get module version string
[[nodiscard]] const char* version() noexcept;

/// Get module name
[[nodiscard]] const char* module_name() noexcept;

} // namespace vidmode_display
