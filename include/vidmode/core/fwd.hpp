#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for vidmode_core module

#include <cstdint>

namespace vidmode_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct DiscoveryError;
struct CaptureError;
struct ApplyError;
struct ConfigError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

enum class LogChannel : std::uint8_t;
struct LogConfig;
class TraceScope;

} // namespace vidmode_core
