// Relay server
// Config-based runtime with CLI argument parsing

#include <filesystem>
#include <iostream>
#include <string>

#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/runtime.hpp"
#include "runtime/signal_handler.hpp"

int main(int argc, char **argv) {
    // Parse CLI arguments
    std::string config_path = "relay-server.yaml";  // Default

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg.substr(0, 9) == "--config=") {
            config_path = arg.substr(9);
        } else if (arg == "--help" || arg == "-h") {
            std::cerr << "Usage: relay-server [OPTIONS]\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --config=PATH    Path to config file (default: relay-server.yaml)\n";
            std::cerr << "  --help, -h       Show this help\n\n";
            std::cerr << "Environment:\n";
            std::cerr << "  API_KEY          Overrides auth.api_key (variable name set by auth.api_key_env)\n";
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    if (!std::filesystem::exists(config_path)) {
        // Using cerr here as logger might not be initialized/configured
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        std::cerr << "\nCreate a config file or specify path with --config=PATH\n";
        return 1;
    }

    LOG_INFO("Relay server starting...");
    LOG_INFO("Loading config: " + config_path);

    relay::runtime::RelayConfig config;
    std::string error;

    if (!relay::runtime::load_config(config_path, config, error)) {
        LOG_ERROR("Failed to load config: " + error);
        return 1;
    }

    relay::logging::Logger::set_level(relay::logging::string_to_level(config.logging.level));

    relay::runtime::Runtime runtime(config);

    if (!runtime.initialize(error)) {
        LOG_ERROR("Runtime initialization failed: " + error);
        return 1;
    }

    relay::runtime::SignalHandler::install();

    LOG_INFO("Relay Ready");
    LOG_INFO("  HTTP:    " << (config.http.enabled
                                   ? config.http.bind + ":" + std::to_string(config.http.port)
                                   : std::string("disabled")));
    LOG_INFO("  Devices: ws://" << config.channel.bind << ":" << config.channel.port << config.channel.path_prefix
                                << "{device_id}");

    // Run main loop (blocking)
    runtime.run();
    runtime.shutdown();

    LOG_INFO("Shutdown complete");
    return 0;
}
