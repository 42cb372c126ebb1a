// ModeWarden Runtime
// Config-based runtime with CLI argument parsing

#include <filesystem>
#include <iostream>
#include <string>

#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/runtime.hpp"
#include "runtime/signal_handler.hpp"

int main(int argc, char **argv) {
    std::string config_path = "modewarden.yaml";  // Default

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg.substr(0, 9) == "--config=") {
            config_path = arg.substr(9);
        } else if (arg == "--help" || arg == "-h") {
            std::cerr << "Usage: modewarden-runtime [OPTIONS]\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --config=PATH    Path to config file (default: modewarden.yaml)\n";
            std::cerr << "  --help, -h       Show this help\n";
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    if (!std::filesystem::exists(config_path)) {
        // Logger level is not configured yet
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        std::cerr << "\nCreate a config file or specify path with --config=PATH\n";
        return 1;
    }

    LOG_INFO("ModeWarden runtime starting...");
    LOG_INFO("Loading config: " << config_path);

    modewarden::runtime::RuntimeConfig config;
    std::string error;

    if (!modewarden::runtime::load_config(config_path, config, error)) {
        LOG_ERROR("Failed to load config: " << error);
        return 1;
    }

    modewarden::logging::Logger::set_level(modewarden::logging::string_to_level(config.logging.level));

    modewarden::runtime::Runtime runtime(config);

    if (!runtime.initialize(error)) {
        LOG_ERROR("Runtime initialization failed: " << error);
        return 1;
    }

    modewarden::runtime::SignalHandler::install();

    LOG_INFO("Runtime Ready");
    LOG_INFO("  Wifi toggle: " << (config.settings.wifi_enabled ? "on" : "off"));
    LOG_INFO("  Airplane mode: " << (config.settings.airplane_mode ? "on" : "off"));
    LOG_INFO("  Recovery delay: " << config.orchestrator.recovery_delay_ms << "ms");

    runtime.run();
    runtime.shutdown();

    LOG_INFO("Shutdown complete");
    return 0;
}
