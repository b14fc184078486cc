/// @file error.cpp
/// @brief Error handling implementation for vidmode_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Explicit instantiations of the Result types the display layer returns
/// - Error formatting utilities
/// - The process-wide last-error slot

#include <vidmode/core/error.hpp>
#include <atomic>
#include <mutex>
#include <sstream>
#include <vector>

namespace vidmode_core {

// =============================================================================
// Error Message Formatting (Out-of-line for complex cases)
// =============================================================================

namespace detail {

/// Format discovery error with full context
std::string format_discovery_error(const DiscoveryError& err) {
    std::ostringstream oss;
    oss << "[DiscoveryError] " << err.message;

    if (err.device != 0) {
        oss << " (display: " << err.device << ")";
    }

    return oss.str();
}

/// Format capture error with full context
std::string format_capture_error(const CaptureError& err) {
    std::ostringstream oss;
    oss << "[CaptureError] " << err.message;

    if (err.device != 0) {
        oss << " (display: " << err.device << ")";
    }

    return oss.str();
}

/// Format apply error with full context
std::string format_apply_error(const ApplyError& err) {
    std::ostringstream oss;
    oss << "[ApplyError] " << err.message;

    if (err.device != 0) {
        oss << " (display: " << err.device << ")";
    }

    return oss.str();
}

std::string format_config_error(const ConfigError& err) {
    std::ostringstream oss;
    oss << "[ConfigError] " << err.message;
    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

/// Build a full error message with context chain
std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    // Error code
    oss << "[" << error_code_name(error.code()) << "] ";

    // Main message based on variant type
    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, DiscoveryError>) {
            oss << detail::format_discovery_error(err);
        } else if constexpr (std::is_same_v<T, CaptureError>) {
            oss << detail::format_capture_error(err);
        } else if constexpr (std::is_same_v<T, ApplyError>) {
            oss << detail::format_apply_error(err);
        } else if constexpr (std::is_same_v<T, ConfigError>) {
            oss << detail::format_config_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << " {" << key << "=" << value << "}";
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<std::uint32_t, Error>;

// =============================================================================
// Last Error Slot
// =============================================================================

namespace {

struct LastErrorSlot {
    std::mutex mutex;
    std::optional<Error> error;
};

LastErrorSlot& last_error_slot() {
    static LastErrorSlot slot;
    return slot;
}

} // anonymous namespace

void set_last_error(const Error& error) {
    auto& slot = last_error_slot();
    std::lock_guard<std::mutex> lock(slot.mutex);
    slot.error = error;
    debug::record_error(error);
}

std::string last_error() {
    auto& slot = last_error_slot();
    std::lock_guard<std::mutex> lock(slot.mutex);
    return slot.error ? slot.error->message() : std::string();
}

std::optional<Error> last_error_value() {
    auto& slot = last_error_slot();
    std::lock_guard<std::mutex> lock(slot.mutex);
    return slot.error;
}

void clear_last_error() {
    auto& slot = last_error_slot();
    std::lock_guard<std::mutex> lock(slot.mutex);
    slot.error.reset();
}

// =============================================================================
// Error Statistics (Debug/Development)
// =============================================================================

namespace debug {

/// Global error statistics for debugging
struct ErrorStats {
    std::atomic<std::uint64_t> total_errors{0};
    std::atomic<std::uint64_t> discovery_errors{0};
    std::atomic<std::uint64_t> capture_errors{0};
    std::atomic<std::uint64_t> apply_errors{0};
    std::atomic<std::uint64_t> config_errors{0};
    std::atomic<std::uint64_t> generic_errors{0};
};

static ErrorStats s_error_stats;

/// Record error occurrence
void record_error(const Error& error) {
    s_error_stats.total_errors.fetch_add(1, std::memory_order_relaxed);

    if (error.is<DiscoveryError>()) {
        s_error_stats.discovery_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<CaptureError>()) {
        s_error_stats.capture_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<ApplyError>()) {
        s_error_stats.apply_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<ConfigError>()) {
        s_error_stats.config_errors.fetch_add(1, std::memory_order_relaxed);
    } else {
        s_error_stats.generic_errors.fetch_add(1, std::memory_order_relaxed);
    }
}

/// Get total error count
std::uint64_t total_error_count() {
    return s_error_stats.total_errors.load(std::memory_order_relaxed);
}

std::uint64_t capture_error_count() {
    return s_error_stats.capture_errors.load(std::memory_order_relaxed);
}

std::uint64_t apply_error_count() {
    return s_error_stats.apply_errors.load(std::memory_order_relaxed);
}

/// Reset error statistics
void reset_error_stats() {
    s_error_stats.total_errors.store(0, std::memory_order_relaxed);
    s_error_stats.discovery_errors.store(0, std::memory_order_relaxed);
    s_error_stats.capture_errors.store(0, std::memory_order_relaxed);
    s_error_stats.apply_errors.store(0, std::memory_order_relaxed);
    s_error_stats.config_errors.store(0, std::memory_order_relaxed);
    s_error_stats.generic_errors.store(0, std::memory_order_relaxed);
}

/// Get error statistics as formatted string
std::string error_stats_summary() {
    std::ostringstream oss;
    oss << "Error Statistics:\n"
        << "  Total: " << s_error_stats.total_errors.load() << "\n"
        << "  Discovery: " << s_error_stats.discovery_errors.load() << "\n"
        << "  Capture: " << s_error_stats.capture_errors.load() << "\n"
        << "  Apply: " << s_error_stats.apply_errors.load() << "\n"
        << "  Config: " << s_error_stats.config_errors.load() << "\n"
        << "  Generic: " << s_error_stats.generic_errors.load() << "\n";
    return oss.str();
}

} // namespace debug

} // namespace vidmode_core
