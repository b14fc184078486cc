/// @file config.cpp
/// @brief Layered configuration implementation

#include <vidmode/runtime/config.hpp>
#include <vidmode/display/display_module.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <system_error>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace vidmode_runtime {

// =============================================================================
// Environment Variable Helpers
// =============================================================================

std::optional<std::string> get_env_var(const char* name) {
    const char* value = std::getenv(name);
    if (!value) {
        return std::nullopt;
    }
    return std::string(value);
}

std::optional<bool> get_env_bool(const char* name) {
    auto value = get_env_var(name);
    if (!value) {
        return std::nullopt;
    }

    std::string lower = *value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
        return true;
    }
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
        return false;
    }
    return std::nullopt;
}

std::optional<Command> parse_command(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "list" || lower == "ls") {
        return Command::List;
    }
    if (lower == "info" || lower == "show") {
        return Command::Info;
    }
    if (lower == "switch" || lower == "set") {
        return Command::Switch;
    }
    if (lower == "restore" || lower == "reset") {
        return Command::Restore;
    }
    return std::nullopt;
}

namespace {

[[nodiscard]] vidmode_core::Result<double> parse_seconds(const std::string& key, const std::string& value) {
    try {
        std::size_t used = 0;
        double seconds = std::stod(value, &used);
        if (used != value.size() || seconds < 0.0) {
            return vidmode_core::Err<double>(vidmode_core::ConfigError::invalid_value(key, value));
        }
        return vidmode_core::Ok(seconds);
    } catch (const std::exception&) {
        return vidmode_core::Err<double>(vidmode_core::ConfigError::invalid_value(key, value));
    }
}

[[nodiscard]] vidmode_core::Result<std::uint32_t> parse_index(const std::string& key, const std::string& value) {
    std::uint32_t index = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), index);
    if (value.empty() || ec != std::errc() || ptr != value.data() + value.size()) {
        return vidmode_core::Err<std::uint32_t>(vidmode_core::ConfigError::invalid_value(key, value));
    }
    return vidmode_core::Ok(index);
}

} // anonymous namespace

// =============================================================================
// ToolConfig
// =============================================================================

vidmode_core::LogConfig ToolConfig::log_config() const {
    vidmode_core::LogConfig config;
    config.level = log_level;
    if (verbose && config.level > spdlog::level::debug) {
        config.level = spdlog::level::debug;
    }
    if (!log_directory.empty()) {
        config.file_enabled = true;
        config.log_directory = log_directory;
    }
    return config;
}

// =============================================================================
// ConfigLoader Implementation
// =============================================================================

void ConfigLoader::apply_defaults() {
    m_config = ToolConfig{};
    m_config.command = Command::List;
    m_config.device = 0;
    m_config.fade = vidmode_display::SwitchConfig{};
    m_config.log_level = spdlog::level::info;
}

vidmode_core::Result<void> ConfigLoader::set_log_level(const std::string& key, const std::string& value) {
    auto level = vidmode_core::parse_log_level(value);
    if (!level) {
        return vidmode_core::Err(vidmode_core::ConfigError::invalid_value(key, value));
    }
    m_config.log_level = *level;
    return vidmode_core::Ok();
}

vidmode_core::Result<void> ConfigLoader::set_target(const std::string& value) {
    auto request = parse_mode_request(value);
    if (!request) {
        return vidmode_core::Err(request.error());
    }
    m_config.target = *request;
    return vidmode_core::Ok();
}

vidmode_core::Result<void> ConfigLoader::apply_environment() {
    auto logger = vidmode_core::runtime_logger();

    if (auto platform = get_env_var(ConfigEnvironmentVars::PLATFORM)) {
        m_config.platform_path = *platform;
        logger->debug("Platform from environment: {}", *platform);
    }
    if (auto level = get_env_var(ConfigEnvironmentVars::LOG_LEVEL)) {
        if (auto result = set_log_level(ConfigEnvironmentVars::LOG_LEVEL, *level); !result) {
            return result;
        }
    }
    if (auto dir = get_env_var(ConfigEnvironmentVars::LOG_DIR)) {
        m_config.log_directory = *dir;
    }
    if (get_env_var(ConfigEnvironmentVars::FADE)) {
        auto fade = get_env_bool(ConfigEnvironmentVars::FADE);
        if (!fade) {
            return vidmode_core::Err(vidmode_core::ConfigError::invalid_value(
                ConfigEnvironmentVars::FADE, *get_env_var(ConfigEnvironmentVars::FADE)));
        }
        m_config.fade.fade_enabled = *fade;
    }
    if (auto verbose = get_env_bool(ConfigEnvironmentVars::VERBOSE)) {
        m_config.verbose = *verbose;
    }

    return vidmode_core::Ok();
}

vidmode_core::Result<void> ConfigLoader::apply_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return vidmode_core::Err(vidmode_core::ConfigError::file_not_found(path));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(buffer.str());
    } catch (const nlohmann::json::parse_error& e) {
        return vidmode_core::Err(vidmode_core::ConfigError::parse_failed(path, e.what()));
    }

    auto result = apply_json(j);
    if (result) {
        m_config.config_path = path;
        vidmode_core::runtime_logger()->debug("Config file applied: {}", path);
    }
    return result;
}

vidmode_core::Result<void> ConfigLoader::apply_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return vidmode_core::Err(vidmode_core::ConfigError::parse_failed("config", "root must be an object"));
    }

    try {
        if (j.contains("platform")) {
            m_config.platform_path = j["platform"].get<std::string>();
        }
        if (j.contains("command")) {
            std::string name = j["command"].get<std::string>();
            auto command = parse_command(name);
            if (!command) {
                return vidmode_core::Err(vidmode_core::ConfigError::invalid_value("command", name));
            }
            m_config.command = *command;
        }
        if (j.contains("mode")) {
            if (auto result = set_target(j["mode"].get<std::string>()); !result) {
                return result;
            }
        }
        if (j.contains("device")) {
            const auto index = j["device"].get<std::int64_t>();
            if (index < 0 || index > std::numeric_limits<std::uint32_t>::max()) {
                return vidmode_core::Err(vidmode_core::ConfigError::invalid_value("device", std::to_string(index)));
            }
            m_config.device = static_cast<std::uint32_t>(index);
        }

        if (j.contains("fade")) {
            const auto& fade = j["fade"];
            m_config.fade.fade_enabled = fade.value("enabled", m_config.fade.fade_enabled);
            m_config.fade.reservation_seconds = fade.value("reservation_seconds", m_config.fade.reservation_seconds);
            m_config.fade.fade_out_seconds = fade.value("fade_out_seconds", m_config.fade.fade_out_seconds);
            m_config.fade.fade_in_seconds = fade.value("fade_in_seconds", m_config.fade.fade_in_seconds);

            if (m_config.fade.reservation_seconds < 0.0 || m_config.fade.fade_out_seconds < 0.0 ||
                m_config.fade.fade_in_seconds < 0.0) {
                return vidmode_core::Err(vidmode_core::ConfigError::invalid_value("fade", fade.dump()));
            }
        }

        if (j.contains("log")) {
            const auto& log = j["log"];
            if (log.contains("level")) {
                if (auto result = set_log_level("log.level", log["level"].get<std::string>()); !result) {
                    return result;
                }
            }
            if (log.contains("directory")) {
                m_config.log_directory = log["directory"].get<std::string>();
            }
        }

        if (j.contains("verbose")) {
            m_config.verbose = j["verbose"].get<bool>();
        }
    } catch (const nlohmann::json::exception& e) {
        return vidmode_core::Err(vidmode_core::ConfigError::parse_failed("config", e.what()));
    }

    return vidmode_core::Ok();
}

vidmode_core::Result<void> ConfigLoader::apply_cli(int argc, const char* const argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    bool command_seen = false;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        const bool has_value = i + 1 < args.size();

        // Sources
        if ((arg == "--platform" || arg == "-p") && has_value) {
            m_config.platform_path = args[++i];
        } else if ((arg == "--config" || arg == "-c") && has_value) {
            // Applied before the command line by configure_from_cli()
            ++i;
        }

        // Target
        else if ((arg == "--mode" || arg == "-m") && has_value) {
            if (auto result = set_target(args[++i]); !result) {
                return result;
            }
        } else if ((arg == "--device" || arg == "-d") && has_value) {
            auto index = parse_index("device", args[++i]);
            if (!index) {
                return vidmode_core::Err(index.error());
            }
            m_config.device = *index;
        }

        // Fade
        else if (arg == "--no-fade") {
            m_config.fade.fade_enabled = false;
        } else if (arg == "--fade") {
            m_config.fade.fade_enabled = true;
        } else if (arg == "--fade-out" && has_value) {
            auto seconds = parse_seconds("fade-out", args[++i]);
            if (!seconds) {
                return vidmode_core::Err(seconds.error());
            }
            m_config.fade.fade_out_seconds = *seconds;
        } else if (arg == "--fade-in" && has_value) {
            auto seconds = parse_seconds("fade-in", args[++i]);
            if (!seconds) {
                return vidmode_core::Err(seconds.error());
            }
            m_config.fade.fade_in_seconds = *seconds;
        } else if (arg == "--fade-reservation" && has_value) {
            auto seconds = parse_seconds("fade-reservation", args[++i]);
            if (!seconds) {
                return vidmode_core::Err(seconds.error());
            }
            m_config.fade.reservation_seconds = *seconds;
        }

        // Logging
        else if ((arg == "--log-level" || arg == "-l") && has_value) {
            if (auto result = set_log_level("log-level", args[++i]); !result) {
                return result;
            }
        } else if (arg == "--log-dir" && has_value) {
            m_config.log_directory = args[++i];
        } else if (arg == "--verbose" || arg == "-v") {
            m_config.verbose = true;
        }

        // Help / version
        else if (arg == "--help" || arg == "-h") {
            m_config.show_help = true;
        } else if (arg == "--version" || arg == "-V") {
            m_config.show_version = true;
        }

        // Unknown flag
        else if (!arg.empty() && arg[0] == '-') {
            vidmode_core::runtime_logger()->warn("Unknown argument: {}", arg);
        }

        // Positionals: command, then mode for `switch`
        else if (!command_seen) {
            auto command = parse_command(arg);
            if (!command) {
                return vidmode_core::Err(vidmode_core::ConfigError::invalid_value("command", arg));
            }
            m_config.command = *command;
            command_seen = true;
        } else if (m_config.command == Command::Switch) {
            if (auto result = set_target(arg); !result) {
                return result;
            }
        } else {
            vidmode_core::runtime_logger()->warn("Ignoring argument: {}", arg);
        }
    }

    return vidmode_core::Ok();
}

std::optional<std::string> ConfigLoader::find_config_arg(int argc, const char* const argv[]) {
    for (int i = 1; i + 1 < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--config" || arg == "-c") {
            return std::string(argv[i + 1]);
        }
    }
    return std::nullopt;
}

void ConfigLoader::print_usage(const char* program_name) {
    auto logger = vidmode_core::runtime_logger();
    logger->info("vidmode - display mode registry and switcher");
    logger->info("");
    logger->info("Usage: {} <command> [mode] [options]", program_name);
    logger->info("");
    logger->info("Commands:");
    logger->info("  list                List displays and their modes (default)");
    logger->info("  info                Show display bounds and desktop mode");
    logger->info("  switch <WxH[@Hz][:FORMAT]>  Switch a display to a mode");
    logger->info("  restore             Switch a display back to its desktop mode");
    logger->info("");
    logger->info("Sources:");
    logger->info("  -p, --platform <path>    Platform description (JSON)");
    logger->info("  -c, --config <path>      Config file (JSON)");
    logger->info("");
    logger->info("Target:");
    logger->info("  -m, --mode <mode>        Requested mode (e.g. 1280x720@60:ARGB8888)");
    logger->info("  -d, --device <n>         Display index (default: 0, the main display)");
    logger->info("");
    logger->info("Fade:");
    logger->info("  --no-fade                Switch without screen fade");
    logger->info("  --fade-out <s>           Fade-out duration (default: 0.3)");
    logger->info("  --fade-in <s>            Fade-in duration (default: 0.5)");
    logger->info("  --fade-reservation <s>   Fade reservation (default: 5.0)");
    logger->info("");
    logger->info("Logging:");
    logger->info("  -l, --log-level <level>  trace/debug/info/warn/error/critical/off");
    logger->info("  --log-dir <dir>          Write rotating log files to dir");
    logger->info("  -v, --verbose            Verbose logging");
    logger->info("");
    logger->info("Other:");
    logger->info("  -h, --help               Show this help");
    logger->info("  -V, --version            Show version");
    logger->info("");
    logger->info("Environment variables:");
    logger->info("  VIDMODE_PLATFORM         Platform description path");
    logger->info("  VIDMODE_CONFIG           Config file path");
    logger->info("  VIDMODE_LOG_LEVEL        Log level");
    logger->info("  VIDMODE_LOG_DIR          Log file directory");
    logger->info("  VIDMODE_FADE             Enable screen fade (1/0)");
    logger->info("  VIDMODE_VERBOSE          Enable verbose logging (1/0)");
}

void ConfigLoader::print_version() {
    auto logger = vidmode_core::runtime_logger();
    logger->info("vidmode version {}", vidmode_display::version());
#ifdef NDEBUG
    logger->info("  Configuration: Release");
#else
    logger->info("  Configuration: Debug");
#endif
}

// =============================================================================
// Convenience Functions
// =============================================================================

vidmode_core::Result<ToolConfig> configure_from_cli(int argc, const char* const argv[]) {
    ConfigLoader loader;
    loader.apply_defaults();

    if (auto result = loader.apply_environment(); !result) {
        return vidmode_core::Err<ToolConfig>(result.error());
    }

    std::optional<std::string> config_path = ConfigLoader::find_config_arg(argc, argv);
    if (!config_path) {
        config_path = get_env_var(ConfigEnvironmentVars::CONFIG);
    }
    if (config_path) {
        if (auto result = loader.apply_file(*config_path); !result) {
            return vidmode_core::Err<ToolConfig>(result.error());
        }
    }

    if (auto result = loader.apply_cli(argc, argv); !result) {
        return vidmode_core::Err<ToolConfig>(result.error());
    }

    const ToolConfig& config = loader.config();
    if (!config.show_help && !config.show_version) {
        if (config.command == Command::Switch && !config.target) {
            return vidmode_core::Err<ToolConfig>(
                vidmode_core::ConfigError::invalid_value("mode", "switch requires a mode"));
        }
        if (config.platform_path.empty()) {
            return vidmode_core::Err<ToolConfig>(
                vidmode_core::ConfigError::invalid_value("platform", "no platform description given"));
        }
    }

    return vidmode_core::Ok(config);
}

} // namespace vidmode_runtime
