/// @file log.cpp
/// @brief Logging channels for vidmode_core

#include <vidmode/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <array>
#include <cctype>
#include <filesystem>
#include <mutex>
#include <vector>

namespace vidmode_core {

namespace {

constexpr std::size_t k_channel_count = 2;

struct LevelName {
    std::string_view name;
    spdlog::level::level_enum level;
};

constexpr LevelName k_level_names[] = {
    {"trace", spdlog::level::trace},
    {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},
    {"warn", spdlog::level::warn},
    {"warning", spdlog::level::warn},
    {"err", spdlog::level::err},
    {"error", spdlog::level::err},
    {"critical", spdlog::level::critical},
    {"fatal", spdlog::level::critical},
    {"off", spdlog::level::off},
};

struct LogState {
    std::mutex mutex;
    std::array<std::shared_ptr<spdlog::logger>, k_channel_count> loggers;
    std::vector<spdlog::sink_ptr> sinks;
    bool sinks_ready = false;
    spdlog::level::level_enum level = spdlog::level::info;
};

LogState& log_state() {
    static LogState state;
    return state;
}

std::vector<spdlog::sink_ptr> make_sinks(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.console_enabled) {
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
        sinks.push_back(std::move(console));
    }

    if (config.file_enabled && !config.log_directory.empty()) {
        std::filesystem::path path = std::filesystem::path(config.log_directory) / k_log_file_name;
        try {
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                path.string(), config.max_file_size, config.max_files);
            file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
            sinks.push_back(std::move(file));
        } catch (const spdlog::spdlog_ex& ex) {
            spdlog::warn("Cannot open log file {}: {}", path.string(), ex.what());
        }
    }

    return sinks;
}

} // anonymous namespace

// =============================================================================
// Configuration
// =============================================================================

void configure_logging(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks = make_sinks(config);

    auto& state = log_state();
    std::lock_guard<std::mutex> lock(state.mutex);

    state.sinks = std::move(sinks);
    state.sinks_ready = true;
    state.level = config.level;

    for (auto& logger : state.loggers) {
        if (logger) {
            logger->sinks() = state.sinks;
            logger->set_level(state.level);
        }
    }
}

// =============================================================================
// Channels
// =============================================================================

const char* log_channel_name(LogChannel channel) {
    switch (channel) {
        case LogChannel::Display: return "vidmode_display";
        case LogChannel::Runtime: return "vidmode_runtime";
    }
    return "vidmode";
}

std::shared_ptr<spdlog::logger> channel_logger(LogChannel channel) {
    auto& state = log_state();
    std::lock_guard<std::mutex> lock(state.mutex);

    auto& slot = state.loggers[static_cast<std::size_t>(channel)];
    if (!slot) {
        if (!state.sinks_ready) {
            state.sinks = make_sinks(LogConfig{});
            state.sinks_ready = true;
        }
        slot = std::make_shared<spdlog::logger>(log_channel_name(channel),
            state.sinks.begin(), state.sinks.end());
        slot->set_level(state.level);
    }
    return slot;
}

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name) {
    std::string lowered(name);
    for (char& c : lowered) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    for (const auto& entry : k_level_names) {
        if (entry.name == lowered) {
            return entry.level;
        }
    }
    return std::nullopt;
}

// =============================================================================
// TraceScope
// =============================================================================

TraceScope::TraceScope(LogChannel channel, std::string_view what)
    : m_logger(channel_logger(channel))
    , m_active(m_logger->should_log(spdlog::level::trace))
{
    if (m_active) {
        m_what = std::string(what);
        m_start = std::chrono::steady_clock::now();
        m_logger->trace("> {}", m_what);
    }
}

TraceScope::~TraceScope() {
    if (m_active) {
        auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - m_start);
        m_logger->trace("< {} ({}us)", m_what, elapsed.count());
    }
}

// =============================================================================
// Lifecycle
// =============================================================================

void shutdown_logging() {
    auto& state = log_state();
    std::lock_guard<std::mutex> lock(state.mutex);

    for (auto& logger : state.loggers) {
        if (logger) {
            logger->flush();
            logger.reset();
        }
    }
    state.sinks.clear();
    state.sinks_ready = false;
}

} // namespace vidmode_core
