// ascot gateway
// Discovers LAN devices, caches their manifests and forwards operator commands

#include <iostream>
#include <string>
#include <filesystem>
#include "runtime/gateway.hpp"
#include "runtime/config.hpp"
#include "runtime/signal_handler.hpp"
#include "logging/logger.hpp"

int main(int argc, char **argv)
{
    // Parse CLI arguments
    std::string config_path = "ascot-gateway.yaml"; // Default

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc)
        {
            config_path = argv[++i];
        }
        else if (arg.substr(0, 9) == "--config=")
        {
            config_path = arg.substr(9);
        }
        else if (arg == "--help" || arg == "-h")
        {
            std::cerr << "Usage: ascot-gateway [OPTIONS]\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --config=PATH    Path to config file (default: ascot-gateway.yaml)\n";
            std::cerr << "  --help, -h       Show this help\n";
            return 0;
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    // Check if config exists
    if (!std::filesystem::exists(config_path))
    {
        // Using cerr here as logger might not be initialized/configured
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        std::cerr << "\nCreate a config file or specify path with --config=PATH\n";
        return 1;
    }

    LOG_INFO("ascot gateway starting...");
    LOG_INFO("Loading config: " + config_path);

    // Load configuration
    ascot::runtime::GatewayConfig config;
    std::string error;

    if (!ascot::runtime::load_config(config_path, config, error))
    {
        LOG_ERROR("Failed to load config: " + error);
        return 1;
    }

    // Initialize logger level
    ascot::logging::Logger::set_level(ascot::logging::string_to_level(config.logging.level));

    // Install signal handler before any worker thread exists
    ascot::runtime::SignalHandler::install();

    ascot::runtime::Gateway gateway(config);

    if (!gateway.initialize(error))
    {
        LOG_ERROR("Gateway initialization failed: " + error);
        gateway.shutdown();
        return 1;
    }

    LOG_INFO("Gateway Ready");
    LOG_INFO("  Known devices: " << gateway.registry().device_count());
    LOG_INFO("  Discovery: " << (config.discovery.enabled ? config.discovery.service_type : std::string("disabled")));

    // Run main loop (blocking)
    gateway.run();
    gateway.shutdown();

    LOG_INFO("Shutdown complete");
    return 0;
}
