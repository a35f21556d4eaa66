#pragma once

#include <string>

#include "control/command_dispatcher.hpp"
#include "discovery/discovery_config.hpp"
#include "registry/device_registry.hpp"
#include "resolver/capability_resolver.hpp"

namespace ascot {
namespace runtime {

struct PersistenceConfig {
    bool enabled = true;                    // Remember devices across restarts
    std::string path = "ascot_devices.json";  // JSON file rewritten on every change
};

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error, none
};

struct GatewayConfig {
    discovery::DiscoveryConfig discovery;
    resolver::ResolverConfig resolver;
    control::DispatchConfig dispatch;
    registry::HealthConfig health;
    PersistenceConfig persistence;
    LoggingConfig logging;
};

// Loads configuration from a YAML file. Missing sections and keys keep their defaults.
bool load_config(const std::string &config_path, GatewayConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const GatewayConfig &config, std::string &error);

}  // namespace runtime
}  // namespace ascot
