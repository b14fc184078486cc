#pragma once

/// @file config.hpp
/// @brief Layered configuration for the vidmode tool
///
/// Sources, later overriding earlier:
/// 1. Defaults
/// 2. Environment variables (VIDMODE_*)
/// 3. JSON config file (--config or VIDMODE_CONFIG)
/// 4. Command-line arguments

#include "mode_request.hpp"

#include <vidmode/core/error.hpp>
#include <vidmode/core/log.hpp>
#include <vidmode/display/switch_engine.hpp>

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace vidmode_runtime {

// =============================================================================
// Environment
// =============================================================================

/// Environment variable names
struct ConfigEnvironmentVars {
    static constexpr const char* PLATFORM = "VIDMODE_PLATFORM";
    static constexpr const char* CONFIG = "VIDMODE_CONFIG";
    static constexpr const char* LOG_LEVEL = "VIDMODE_LOG_LEVEL";
    static constexpr const char* LOG_DIR = "VIDMODE_LOG_DIR";
    static constexpr const char* FADE = "VIDMODE_FADE";
    static constexpr const char* VERBOSE = "VIDMODE_VERBOSE";
};

/// Get environment variable value
[[nodiscard]] std::optional<std::string> get_env_var(const char* name);

/// Get environment variable as bool (supports: 1/0, true/false, yes/no, on/off)
[[nodiscard]] std::optional<bool> get_env_bool(const char* name);

// =============================================================================
// Commands
// =============================================================================

/// Tool command
enum class Command : std::uint8_t {
    List,     ///< List devices and their modes
    Info,     ///< Show device details (bounds, usable bounds, desktop mode)
    Switch,   ///< Switch a device to a requested mode
    Restore,  ///< Switch a device back to its desktop mode
};

/// Parse command name
[[nodiscard]] std::optional<Command> parse_command(std::string_view name);

/// Get command name
[[nodiscard]] constexpr const char* command_name(Command command) noexcept {
    switch (command) {
        case Command::List: return "list";
        case Command::Info: return "info";
        case Command::Switch: return "switch";
        case Command::Restore: return "restore";
        default: return "unknown";
    }
}

// =============================================================================
// ToolConfig
// =============================================================================

/// Final configuration of one tool run
struct ToolConfig {
    /// JSON description of the simulated platform
    std::string platform_path;
    /// JSON config file that was applied (empty if none)
    std::string config_path;

    Command command = Command::List;
    /// Requested mode for `switch`
    std::optional<ModeRequest> target;
    /// Registration index of the device to operate on (0 = main display)
    std::uint32_t device = 0;

    /// Fade timing handed to the switch engine
    vidmode_display::SwitchConfig fade;

    spdlog::level::level_enum log_level = spdlog::level::info;
    /// Directory for rotating log files (empty = console only)
    std::string log_directory;
    bool verbose = false;

    bool show_help = false;
    bool show_version = false;

    /// Build the logging configuration
    [[nodiscard]] vidmode_core::LogConfig log_config() const;
};

// =============================================================================
// ConfigLoader
// =============================================================================

/// Applies configuration sources in priority order
///
/// Usage:
/// ```cpp
/// ConfigLoader loader;
/// loader.apply_defaults();
/// loader.apply_environment();
/// loader.apply_file("vidmode.json");
/// loader.apply_cli(argc, argv);
/// const ToolConfig& config = loader.config();
/// ```
class ConfigLoader {
public:
    ConfigLoader() = default;

    // -------------------------------------------------------------------------
    // Configuration Sources
    // -------------------------------------------------------------------------

    /// Apply default values
    void apply_defaults();

    /// Apply values from environment variables
    [[nodiscard]] vidmode_core::Result<void> apply_environment();

    /// Apply values from a JSON config file
    [[nodiscard]] vidmode_core::Result<void> apply_file(const std::string& path);

    /// Apply values from a parsed JSON document
    [[nodiscard]] vidmode_core::Result<void> apply_json(const nlohmann::json& j);

    /// Apply values from command-line arguments
    [[nodiscard]] vidmode_core::Result<void> apply_cli(int argc, const char* const argv[]);

    /// Get the configuration built so far
    [[nodiscard]] const ToolConfig& config() const noexcept { return m_config; }

    // -------------------------------------------------------------------------
    // Help and Information
    // -------------------------------------------------------------------------

    /// Find the value of --config/-c without applying anything else
    [[nodiscard]] static std::optional<std::string> find_config_arg(int argc, const char* const argv[]);

    /// Print usage information
    static void print_usage(const char* program_name);

    /// Print version information
    static void print_version();

private:
    vidmode_core::Result<void> set_log_level(const std::string& key, const std::string& value);
    vidmode_core::Result<void> set_target(const std::string& value);

    ToolConfig m_config;
};

/// Run all sources: defaults, environment, config file, command line
[[nodiscard]] vidmode_core::Result<ToolConfig> configure_from_cli(int argc, const char* const argv[]);

} // namespace vidmode_runtime
