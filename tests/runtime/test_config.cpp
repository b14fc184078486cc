// vidmode_runtime configuration tests

#include <catch2/catch_test_macros.hpp>
#include <vidmode/runtime/config.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <string>
#include <vector>

using namespace vidmode_runtime;

namespace {

/// Sets an environment variable for the lifetime of the guard
class EnvGuard {
public:
    EnvGuard(const char* name, const char* value) : m_name(name) {
        ::setenv(name, value, 1);
    }
    ~EnvGuard() { ::unsetenv(m_name); }

    EnvGuard(const EnvGuard&) = delete;
    EnvGuard& operator=(const EnvGuard&) = delete;

private:
    const char* m_name;
};

/// Keeps argv storage alive for apply_cli()
struct Args {
    std::vector<std::string> storage;
    std::vector<const char*> argv;

    Args(std::initializer_list<const char*> args) {
        storage.emplace_back("vidmode");
        for (const char* a : args) {
            storage.emplace_back(a);
        }
        for (const auto& s : storage) {
            argv.push_back(s.c_str());
        }
    }

    [[nodiscard]] int argc() const { return static_cast<int>(argv.size()); }
    [[nodiscard]] const char* const* data() const { return argv.data(); }
};

} // anonymous namespace

TEST_CASE("Command names", "[runtime][config]") {
    REQUIRE(parse_command("list") == Command::List);
    REQUIRE(parse_command("LS") == Command::List);
    REQUIRE(parse_command("show") == Command::Info);
    REQUIRE(parse_command("set") == Command::Switch);
    REQUIRE(parse_command("reset") == Command::Restore);
    REQUIRE_FALSE(parse_command("reboot").has_value());
    REQUIRE(std::string(command_name(Command::Restore)) == "restore");
}

TEST_CASE("Environment helpers", "[runtime][config]") {
    ::unsetenv("VIDMODE_TEST_FLAG");
    REQUIRE_FALSE(get_env_var("VIDMODE_TEST_FLAG").has_value());

    {
        EnvGuard guard("VIDMODE_TEST_FLAG", "Yes");
        REQUIRE(get_env_bool("VIDMODE_TEST_FLAG") == true);
    }
    {
        EnvGuard guard("VIDMODE_TEST_FLAG", "off");
        REQUIRE(get_env_bool("VIDMODE_TEST_FLAG") == false);
    }
    {
        EnvGuard guard("VIDMODE_TEST_FLAG", "maybe");
        REQUIRE_FALSE(get_env_bool("VIDMODE_TEST_FLAG").has_value());
    }
}

TEST_CASE("Defaults", "[runtime][config]") {
    ConfigLoader loader;
    loader.apply_defaults();
    const ToolConfig& config = loader.config();

    REQUIRE(config.command == Command::List);
    REQUIRE(config.device == 0);
    REQUIRE_FALSE(config.target.has_value());
    REQUIRE(config.fade.fade_enabled);
    REQUIRE(config.fade.reservation_seconds == 5.0);
    REQUIRE(config.fade.fade_out_seconds == 0.3);
    REQUIRE(config.fade.fade_in_seconds == 0.5);
    REQUIRE(config.log_level == spdlog::level::info);
}

TEST_CASE("Command line", "[runtime][config]") {
    ConfigLoader loader;
    loader.apply_defaults();

    SECTION("switch with positional mode") {
        Args args{"switch", "1280x720@60", "-p", "displays.json", "--device", "1", "--no-fade"};
        REQUIRE(loader.apply_cli(args.argc(), args.data()));

        const ToolConfig& config = loader.config();
        REQUIRE(config.command == Command::Switch);
        REQUIRE(config.target.has_value());
        REQUIRE(config.target->width == 1280);
        REQUIRE(config.target->refresh_rate == 60);
        REQUIRE(config.platform_path == "displays.json");
        REQUIRE(config.device == 1);
        REQUIRE_FALSE(config.fade.fade_enabled);
    }

    SECTION("fade timing and logging") {
        Args args{"--fade-out", "0.1", "--fade-in", "1.5", "--fade-reservation", "3",
                  "-l", "warn", "--log-dir", "/tmp/vidmode-logs", "-v"};
        REQUIRE(loader.apply_cli(args.argc(), args.data()));

        const ToolConfig& config = loader.config();
        REQUIRE(config.fade.fade_out_seconds == 0.1);
        REQUIRE(config.fade.fade_in_seconds == 1.5);
        REQUIRE(config.fade.reservation_seconds == 3.0);
        REQUIRE(config.log_level == spdlog::level::warn);
        REQUIRE(config.verbose);
    }

    SECTION("largest device index") {
        Args args{"--device", "4294967295"};
        REQUIRE(loader.apply_cli(args.argc(), args.data()));
        REQUIRE(loader.config().device == 4294967295u);
    }

    SECTION("help and version") {
        Args args{"-h", "-V"};
        REQUIRE(loader.apply_cli(args.argc(), args.data()));
        REQUIRE(loader.config().show_help);
        REQUIRE(loader.config().show_version);
    }

    SECTION("unknown flags are ignored") {
        Args args{"--frobnicate", "info"};
        REQUIRE(loader.apply_cli(args.argc(), args.data()));
        REQUIRE(loader.config().command == Command::Info);
    }

    SECTION("invalid values") {
        Args bad_command{"reboot"};
        REQUIRE_FALSE(loader.apply_cli(bad_command.argc(), bad_command.data()));

        Args bad_seconds{"--fade-out", "soon"};
        REQUIRE_FALSE(loader.apply_cli(bad_seconds.argc(), bad_seconds.data()));

        Args negative{"--fade-in", "-1"};
        REQUIRE_FALSE(loader.apply_cli(negative.argc(), negative.data()));

        Args bad_device{"-d", "main"};
        REQUIRE_FALSE(loader.apply_cli(bad_device.argc(), bad_device.data()));

        Args negative_device{"-d", "-1"};
        REQUIRE_FALSE(loader.apply_cli(negative_device.argc(), negative_device.data()));

        Args huge_device{"--device", "4294967297"};
        REQUIRE_FALSE(loader.apply_cli(huge_device.argc(), huge_device.data()));
        REQUIRE(loader.config().device == 0);

        Args trailing_device{"--device", "1x"};
        REQUIRE_FALSE(loader.apply_cli(trailing_device.argc(), trailing_device.data()));

        Args bad_level{"--log-level", "loud"};
        auto result = loader.apply_cli(bad_level.argc(), bad_level.data());
        REQUIRE_FALSE(result);
        REQUIRE(result.error().is<vidmode_core::ConfigError>());
    }

    SECTION("config flag is left to configure_from_cli") {
        Args args{"-c", "vidmode.json"};
        REQUIRE(ConfigLoader::find_config_arg(args.argc(), args.data()) == std::string("vidmode.json"));
        REQUIRE(loader.apply_cli(args.argc(), args.data()));
        REQUIRE(loader.config().config_path.empty());
    }
}

TEST_CASE("JSON configuration", "[runtime][config]") {
    ConfigLoader loader;
    loader.apply_defaults();

    SECTION("all keys") {
        nlohmann::json j = {
            {"platform", "displays.json"},
            {"command", "switch"},
            {"mode", "1024x768"},
            {"device", 2},
            {"fade", {{"enabled", false}, {"fade_in_seconds", 0.75}}},
            {"log", {{"level", "error"}, {"directory", "logs"}}},
            {"verbose", true},
        };
        REQUIRE(loader.apply_json(j));

        const ToolConfig& config = loader.config();
        REQUIRE(config.platform_path == "displays.json");
        REQUIRE(config.command == Command::Switch);
        REQUIRE(config.target->height == 768);
        REQUIRE(config.device == 2);
        REQUIRE_FALSE(config.fade.fade_enabled);
        REQUIRE(config.fade.fade_in_seconds == 0.75);
        REQUIRE(config.fade.fade_out_seconds == 0.3);
        REQUIRE(config.log_level == spdlog::level::err);
        REQUIRE(config.log_directory == "logs");
        REQUIRE(config.verbose);
    }

    SECTION("rejected documents") {
        REQUIRE_FALSE(loader.apply_json(nlohmann::json::array()));
        REQUIRE_FALSE(loader.apply_json({{"command", "reboot"}}));
        REQUIRE_FALSE(loader.apply_json({{"fade", {{"fade_out_seconds", -0.5}}}}));

        auto wrong_type = loader.apply_json({{"device", "main"}});
        REQUIRE_FALSE(wrong_type);
        REQUIRE(wrong_type.error().code() == vidmode_core::ErrorCode::ParseError);

        auto huge = loader.apply_json({{"device", 4294967297ULL}});
        REQUIRE_FALSE(huge);
        REQUIRE(huge.error().code() == vidmode_core::ErrorCode::InvalidArgument);
        REQUIRE_FALSE(loader.apply_json({{"device", -1}}));
        REQUIRE(loader.config().device == 0);
    }

    SECTION("sample file") {
        const std::string path = std::string(VIDMODE_TEST_DATA_DIR) + "/vidmode.json";
        REQUIRE(loader.apply_file(path));
        REQUIRE(loader.config().config_path == path);
        REQUIRE(loader.config().command == Command::Switch);
        REQUIRE(loader.config().fade.fade_out_seconds == 0.25);
    }

    SECTION("missing file") {
        auto result = loader.apply_file("/nonexistent/vidmode.json");
        REQUIRE_FALSE(result);
        REQUIRE(result.error().code() == vidmode_core::ErrorCode::NotFound);
    }
}

TEST_CASE("Log configuration", "[runtime][config]") {
    ToolConfig config;

    SECTION("console only by default") {
        vidmode_core::LogConfig log = config.log_config();
        REQUIRE(log.level == spdlog::level::info);
        REQUIRE_FALSE(log.file_enabled);
    }

    SECTION("verbose lowers the level") {
        config.verbose = true;
        REQUIRE(config.log_config().level == spdlog::level::debug);

        config.log_level = spdlog::level::trace;
        REQUIRE(config.log_config().level == spdlog::level::trace);
    }

    SECTION("log directory enables the file sink") {
        config.log_directory = "/tmp/vidmode-logs";
        vidmode_core::LogConfig log = config.log_config();
        REQUIRE(log.file_enabled);
        REQUIRE(log.log_directory == "/tmp/vidmode-logs");
    }
}

TEST_CASE("Layered configuration", "[runtime][config]") {
    const std::string config_file = std::string(VIDMODE_TEST_DATA_DIR) + "/vidmode.json";

    SECTION("command line overrides file, file overrides environment") {
        EnvGuard platform(ConfigEnvironmentVars::PLATFORM, "from-env.json");
        EnvGuard level(ConfigEnvironmentVars::LOG_LEVEL, "critical");

        Args args{"-c", config_file.c_str(), "-p", "from-cli.json"};
        auto result = configure_from_cli(args.argc(), args.data());
        REQUIRE(result);
        REQUIRE(result->platform_path == "from-cli.json");
        REQUIRE(result->log_level == spdlog::level::debug);
        REQUIRE(result->command == Command::Switch);
        REQUIRE(result->config_path == config_file);
    }

    SECTION("environment names the config file") {
        EnvGuard config(ConfigEnvironmentVars::CONFIG, config_file.c_str());
        Args args{};
        auto result = configure_from_cli(args.argc(), args.data());
        REQUIRE(result);
        REQUIRE(result->platform_path == "displays.json");
        REQUIRE(result->target.has_value());
    }

    SECTION("environment fade switch") {
        EnvGuard fade(ConfigEnvironmentVars::FADE, "0");
        Args args{"-p", "displays.json"};
        auto result = configure_from_cli(args.argc(), args.data());
        REQUIRE(result);
        REQUIRE_FALSE(result->fade.fade_enabled);
    }

    SECTION("switch without a mode") {
        Args args{"switch", "-p", "displays.json"};
        REQUIRE_FALSE(configure_from_cli(args.argc(), args.data()));
    }

    SECTION("no platform description") {
        ::unsetenv(ConfigEnvironmentVars::PLATFORM);
        ::unsetenv(ConfigEnvironmentVars::CONFIG);
        Args args{"list"};
        REQUIRE_FALSE(configure_from_cli(args.argc(), args.data()));

        Args help{"--help"};
        REQUIRE(configure_from_cli(help.argc(), help.data()));
    }
}
