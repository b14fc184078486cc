#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for vidmode_display

#include <cstdint>

namespace vidmode_display {

// Core types
enum class PixelFormat : std::uint8_t;
enum class PlatformStatus : std::int32_t;
enum class NativeModeRef : std::uintptr_t;
struct Rect;
struct DisplayMode;
struct RefreshPeriod;
struct NativeModeInfo;

// Platform types
enum class FadeBlend : std::uint8_t;
struct FadeToken;
class IDisplayPlatform;
class SimulatedPlatform;

// Mode types
class NativeModeHandle;
class LogicalMode;
class ModeDiscovery;
struct DiscoveredModes;

// Device types
struct Device;
enum class AddModeResult : std::uint8_t;
class IDisplayStore;
class DisplayStore;
class DeviceRegistry;

// Switching types
class IWindowChrome;
class RecordingWindowChrome;
enum class SwitchState : std::uint8_t;
struct SwitchConfig;
class SwitchEngine;

} // namespace vidmode_display
