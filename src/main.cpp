/// @file main.cpp
/// @brief vidmode entry point - lists and switches display modes
///
/// Loads a platform description, discovers its displays, runs one command
/// and shuts down, which restores every display to its desktop mode and
/// releases all mode data.

#include <vidmode/display/display_module.hpp>
#include <vidmode/runtime/config.hpp>
#include <vidmode/runtime/mode_request.hpp>
#include <vidmode/core/error.hpp>
#include <vidmode/core/log.hpp>

#include <memory>
#include <string>
#include <vector>

using namespace vidmode_display;

namespace {

constexpr int k_exit_ok = 0;
constexpr int k_exit_failure = 1;
constexpr int k_exit_usage = 2;

// =============================================================================
// Commands
// =============================================================================

void run_list(const std::vector<Device*>& devices) {
    auto logger = vidmode_core::runtime_logger();

    for (std::size_t index = 0; index < devices.size(); ++index) {
        const Device& device = *devices[index];
        logger->info("[{}] {}{}", index, device.label(), device.primary ? " (main)" : "");

        for (const auto& mode : device.modes) {
            std::string marks;
            if (mode == device.desktop_mode) {
                marks += " desktop";
            }
            if (mode == device.current_mode) {
                marks += " current";
            }
            logger->info("    {:<28} {} candidate(s){}", mode.to_string(), mode.candidate_count(), marks);
        }
    }
}

void run_info(const DeviceRegistry& registry, const Device& device) {
    auto logger = vidmode_core::runtime_logger();

    Rect bounds = registry.display_bounds(device);
    logger->info("{}", device.label());
    logger->info("  Main:          {}", device.primary ? "yes" : "no");
    logger->info("  Bounds:        {},{} {}x{}", bounds.x, bounds.y, bounds.w, bounds.h);

    auto usable = registry.usable_bounds(device);
    if (usable) {
        logger->info("  Usable bounds: {},{} {}x{}", usable->x, usable->y, usable->w, usable->h);
    } else {
        logger->info("  Usable bounds: unavailable ({})", usable.error().message());
    }

    logger->info("  Desktop mode:  {}", device.desktop_mode.to_string());
    logger->info("  Current mode:  {}", device.current_mode.to_string());
    logger->info("  Modes:         {}", device.modes.size());
}

vidmode_core::Result<void> run_switch(SwitchEngine& engine, Device& device,
                                      const vidmode_runtime::ModeRequest& request) {
    LogicalMode* mode = vidmode_runtime::find_best_mode(device, request);
    if (!mode) {
        vidmode_core::Error error(vidmode_core::ErrorCode::NotFound,
            "No mode matching " + request.to_string() + " on " + device.label());
        vidmode_core::set_last_error(error);
        return vidmode_core::Err(std::move(error));
    }
    return engine.switch_to(device, *mode);
}

} // anonymous namespace

// =============================================================================
// Main
// =============================================================================

int main(int argc, char** argv) {
    auto logger = vidmode_core::runtime_logger();

    auto configured = vidmode_runtime::configure_from_cli(argc, argv);
    if (!configured) {
        logger->error("{}", vidmode_core::build_error_chain(configured.error()));
        vidmode_runtime::ConfigLoader::print_usage(argv[0]);
        return k_exit_usage;
    }
    const vidmode_runtime::ToolConfig& config = *configured;

    if (config.show_help) {
        vidmode_runtime::ConfigLoader::print_usage(argv[0]);
        return k_exit_ok;
    }
    if (config.show_version) {
        vidmode_runtime::ConfigLoader::print_version();
        return k_exit_ok;
    }

    vidmode_core::configure_logging(config.log_config());

    auto loaded = SimulatedPlatform::load_file(config.platform_path);
    if (!loaded) {
        logger->error("Failed to load platform: {}", vidmode_core::build_error_chain(loaded.error()));
        return k_exit_failure;
    }
    std::unique_ptr<SimulatedPlatform> platform = std::move(*loaded);

    int exit_code = k_exit_ok;
    {
        DisplayStore store;
        RecordingWindowChrome chrome;
        DeviceRegistry registry(*platform, store);
        SwitchEngine engine(*platform, chrome, config.fade);

        auto devices = registry.discover_devices();
        if (!devices) {
            logger->error("Discovery failed: {}", vidmode_core::last_error());
            return k_exit_failure;
        }

        Device* device = store.at(config.device);
        if (!device && config.command != vidmode_runtime::Command::List) {
            logger->error("No display at index {} ({} registered)", config.device, store.device_count());
            exit_code = k_exit_failure;
        } else {
            vidmode_core::Result<void> result = vidmode_core::Ok();
            switch (config.command) {
                case vidmode_runtime::Command::List:
                    run_list(*devices);
                    break;
                case vidmode_runtime::Command::Info:
                    run_info(registry, *device);
                    break;
                case vidmode_runtime::Command::Switch:
                    result = run_switch(engine, *device, *config.target);
                    break;
                case vidmode_runtime::Command::Restore:
                    result = engine.restore_desktop(*device);
                    break;
            }
            if (!result) {
                logger->error("{} failed: {}", vidmode_runtime::command_name(config.command),
                    vidmode_core::build_error_chain(result.error()));
                exit_code = k_exit_failure;
            }
        }

        auto shutdown = engine.shutdown(store);
        if (!shutdown) {
            logger->error("Shutdown failed: {}", shutdown.error().message());
            exit_code = k_exit_failure;
        }
    }

    if (platform->outstanding_references() != 0 || platform->over_release_count() != 0) {
        logger->warn("Mode descriptor leak: {} outstanding, {} over-released",
            platform->outstanding_references(), platform->over_release_count());
    }

    logger->debug("{}", vidmode_core::debug::error_stats_summary());
    vidmode_core::shutdown_logging();
    return exit_code;
}
