#pragma once

/// @file log.hpp
/// @brief Logging channels for vidmode
///
/// Two spdlog loggers, one per subsystem, write through a single set of
/// sinks: the console and, when a log directory is configured, a rotating
/// `vidmode.log`. Loggers exist before configure_logging() runs and pick up
/// new sinks and levels when it does.

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace vidmode_core {

// =============================================================================
// Log Configuration
// =============================================================================

/// Sink and level settings, built from ToolConfig::log_config()
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;
    std::size_t max_file_size = 1024 * 1024;  // 1 MB
    std::size_t max_files = 2;
    spdlog::level::level_enum level = spdlog::level::info;
};

/// Rebuild the shared sinks and apply the level to every channel
void configure_logging(const LogConfig& config);

/// File written inside LogConfig::log_directory
inline constexpr const char* k_log_file_name = "vidmode.log";

// =============================================================================
// Channels
// =============================================================================

enum class LogChannel : std::uint8_t {
    Display,  ///< discovery, registry, switching
    Runtime,  ///< command line, configuration, output
};

/// Logger name for a channel ("vidmode_display", "vidmode_runtime")
[[nodiscard]] const char* log_channel_name(LogChannel channel);

[[nodiscard]] std::shared_ptr<spdlog::logger> channel_logger(LogChannel channel);

inline std::shared_ptr<spdlog::logger> display_logger() {
    return channel_logger(LogChannel::Display);
}

inline std::shared_ptr<spdlog::logger> runtime_logger() {
    return channel_logger(LogChannel::Runtime);
}

/// Accepts spdlog level names, case-insensitive, plus "warning", "error" and "fatal"
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name);

// =============================================================================
// Trace Scope
// =============================================================================

/// Logs entry and exit of a block at trace level, with the elapsed time
class TraceScope {
public:
    TraceScope(LogChannel channel, std::string_view what);
    ~TraceScope();

    TraceScope(const TraceScope&) = delete;
    TraceScope& operator=(const TraceScope&) = delete;

private:
    std::shared_ptr<spdlog::logger> m_logger;
    std::string m_what;
    std::chrono::steady_clock::time_point m_start;
    bool m_active = false;
};

#define VIDMODE_LOG_CONCAT_IMPL(a, b) a##b
#define VIDMODE_LOG_CONCAT(a, b) VIDMODE_LOG_CONCAT_IMPL(a, b)

/// Trace the enclosing block on the display channel
#define VIDMODE_LOG_SCOPE(what) \
    ::vidmode_core::TraceScope VIDMODE_LOG_CONCAT(vidmode_trace_scope_, __LINE__)( \
        ::vidmode_core::LogChannel::Display, what)

// =============================================================================
// Lifecycle
// =============================================================================

/// Flush and drop both channels; later calls to channel_logger() recreate them
void shutdown_logging();

} // namespace vidmode_core
