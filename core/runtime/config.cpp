#include "runtime/config.hpp"

#include <yaml-cpp/yaml.h>

#include <sstream>
#include <vector>

#include "logging/logger.hpp"

namespace ascot {
namespace runtime {

namespace {

void warn_unknown_keys(const YAML::Node &node, const std::string &section, const std::vector<std::string> &valid_keys) {
    if (!node.IsMap()) {
        return;
    }
    for (const auto &key_node : node) {
        std::string key = key_node.first.as<std::string>();
        bool known = false;
        for (const auto &valid_key : valid_keys) {
            if (key == valid_key) {
                known = true;
                break;
            }
        }
        if (!known) {
            if (section.empty()) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            } else {
                LOG_WARN("[Config] Unknown key '" << section << "." << key << "' (will be ignored)");
            }
        }
    }
}

void load_discovery(const YAML::Node &node, discovery::DiscoveryConfig &discovery) {
    warn_unknown_keys(node, "discovery",
                      {"enabled", "service_type", "browse_command", "allow_ipv6", "poll_timeout_ms", "rescan_grace_ms",
                       "restart_policy"});

    if (node["enabled"]) {
        discovery.enabled = node["enabled"].as<bool>();
    }
    if (node["service_type"]) {
        discovery.service_type = node["service_type"].as<std::string>();
    }
    if (node["browse_command"]) {
        discovery.browse_command = node["browse_command"].as<std::string>();
    }
    if (node["allow_ipv6"]) {
        discovery.allow_ipv6 = node["allow_ipv6"].as<bool>();
    }
    if (node["poll_timeout_ms"]) {
        discovery.poll_timeout_ms = node["poll_timeout_ms"].as<int>();
    }
    if (node["rescan_grace_ms"]) {
        discovery.rescan_grace_ms = node["rescan_grace_ms"].as<int>();
    }

    if (node["restart_policy"]) {
        const auto &rp = node["restart_policy"];
        warn_unknown_keys(rp, "discovery.restart_policy", {"enabled", "max_attempts", "backoff_ms", "success_reset_ms"});

        if (rp["enabled"]) {
            discovery.restart_policy.enabled = rp["enabled"].as<bool>();
        }
        if (rp["max_attempts"]) {
            discovery.restart_policy.max_attempts = rp["max_attempts"].as<int>();
        }
        if (rp["backoff_ms"]) {
            discovery.restart_policy.backoff_ms.clear();
            for (const auto &backoff : rp["backoff_ms"]) {
                discovery.restart_policy.backoff_ms.push_back(backoff.as<int>());
            }
        }
        if (rp["success_reset_ms"]) {
            discovery.restart_policy.success_reset_ms = rp["success_reset_ms"].as<int>();
        }
    }
}

void load_resolver(const YAML::Node &node, resolver::ResolverConfig &resolver) {
    warn_unknown_keys(node, "resolver",
                      {"manifest_path", "timeout_ms", "max_retries", "backoff_initial_ms", "backoff_max_ms", "workers",
                       "refresh_interval_ms"});

    if (node["manifest_path"]) {
        resolver.manifest_path = node["manifest_path"].as<std::string>();
    }
    if (node["timeout_ms"]) {
        resolver.timeout_ms = node["timeout_ms"].as<int>();
    }
    if (node["max_retries"]) {
        resolver.max_retries = node["max_retries"].as<int>();
    }
    if (node["backoff_initial_ms"]) {
        resolver.backoff_initial_ms = node["backoff_initial_ms"].as<int>();
    }
    if (node["backoff_max_ms"]) {
        resolver.backoff_max_ms = node["backoff_max_ms"].as<int>();
    }
    if (node["workers"]) {
        resolver.workers = node["workers"].as<int>();
    }
    if (node["refresh_interval_ms"]) {
        resolver.refresh_interval_ms = node["refresh_interval_ms"].as<int>();
    }
}

}  // namespace

bool validate_config(const GatewayConfig &config, std::string &error) {
    // Validate discovery settings
    const auto &discovery = config.discovery;
    if (discovery.enabled) {
        if (discovery.service_type.empty()) {
            error = "discovery.service_type must not be empty";
            return false;
        }
        if (discovery.browse_command.empty()) {
            error = "discovery.browse_command must not be empty";
            return false;
        }
        if (discovery.poll_timeout_ms < 10) {
            error = "discovery.poll_timeout_ms must be >= 10ms";
            return false;
        }
        if (discovery.rescan_grace_ms < 0) {
            error = "discovery.rescan_grace_ms must be >= 0";
            return false;
        }

        const auto &policy = discovery.restart_policy;
        if (policy.enabled) {
            if (policy.max_attempts < 1) {
                error = "discovery restart policy max_attempts must be >= 1";
                return false;
            }
            if (policy.backoff_ms.empty()) {
                error = "discovery restart policy backoff_ms cannot be empty";
                return false;
            }
            if (policy.backoff_ms.size() != static_cast<size_t>(policy.max_attempts)) {
                error = "discovery restart policy backoff_ms array length (" +
                        std::to_string(policy.backoff_ms.size()) + ") must match max_attempts (" +
                        std::to_string(policy.max_attempts) + ")";
                return false;
            }
            for (size_t i = 0; i < policy.backoff_ms.size(); ++i) {
                if (policy.backoff_ms[i] < 0) {
                    error = "discovery restart policy backoff_ms[" + std::to_string(i) + "] must be >= 0";
                    return false;
                }
            }
            if (policy.success_reset_ms < 1000) {
                error = "discovery restart policy success_reset_ms must be >= 1000ms";
                return false;
            }
        }
    }

    // Validate resolver settings
    const auto &resolver = config.resolver;
    if (resolver.manifest_path.empty() || resolver.manifest_path[0] != '/') {
        error = "resolver.manifest_path must start with '/'";
        return false;
    }
    if (resolver.timeout_ms < 100) {
        error = "resolver.timeout_ms must be >= 100ms";
        return false;
    }
    if (resolver.max_retries < 0 || resolver.max_retries > 10) {
        error = "resolver.max_retries must be between 0 and 10";
        return false;
    }
    if (resolver.backoff_initial_ms < 0) {
        error = "resolver.backoff_initial_ms must be >= 0";
        return false;
    }
    if (resolver.backoff_max_ms < resolver.backoff_initial_ms) {
        error = "resolver.backoff_max_ms must be >= backoff_initial_ms";
        return false;
    }
    if (resolver.workers < 1 || resolver.workers > 64) {
        error = "resolver.workers must be between 1 and 64";
        return false;
    }
    if (resolver.refresh_interval_ms != 0 && resolver.refresh_interval_ms < 1000) {
        error = "resolver.refresh_interval_ms must be 0 (off) or >= 1000ms";
        return false;
    }

    if (config.dispatch.timeout_ms < 100) {
        error = "dispatch.timeout_ms must be >= 100ms";
        return false;
    }

    // Validate health settings
    if (config.health.stale_after_ms < 1000) {
        error = "health.stale_after_ms must be >= 1000ms";
        return false;
    }
    if (config.health.unreachable_after_failures < 1) {
        error = "health.unreachable_after_failures must be >= 1";
        return false;
    }

    if (config.persistence.enabled && config.persistence.path.empty()) {
        error = "Persistence enabled but persistence.path not specified";
        return false;
    }

    if (!logging::is_valid_level(config.logging.level)) {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, GatewayConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        // An empty file is a valid, all-defaults configuration
        if (yaml.IsNull()) {
            LOG_WARN("[Config] " << config_path << " is empty, using defaults");
            return validate_config(config, error);
        }
        if (!yaml.IsMap()) {
            error = "Config root must be a mapping";
            return false;
        }

        warn_unknown_keys(yaml, "", {"discovery", "resolver", "dispatch", "health", "persistence", "logging"});

        if (yaml["discovery"]) {
            load_discovery(yaml["discovery"], config.discovery);
        }

        if (yaml["resolver"]) {
            load_resolver(yaml["resolver"], config.resolver);
        }

        if (yaml["dispatch"]) {
            warn_unknown_keys(yaml["dispatch"], "dispatch", {"timeout_ms"});
            if (yaml["dispatch"]["timeout_ms"]) {
                config.dispatch.timeout_ms = yaml["dispatch"]["timeout_ms"].as<int>();
            }
        }

        if (yaml["health"]) {
            warn_unknown_keys(yaml["health"], "health", {"stale_after_ms", "unreachable_after_failures"});
            if (yaml["health"]["stale_after_ms"]) {
                config.health.stale_after_ms = yaml["health"]["stale_after_ms"].as<int>();
            }
            if (yaml["health"]["unreachable_after_failures"]) {
                config.health.unreachable_after_failures = yaml["health"]["unreachable_after_failures"].as<int>();
            }
        }

        if (yaml["persistence"]) {
            warn_unknown_keys(yaml["persistence"], "persistence", {"enabled", "path"});
            if (yaml["persistence"]["enabled"]) {
                config.persistence.enabled = yaml["persistence"]["enabled"].as<bool>();
            }
            if (yaml["persistence"]["path"]) {
                config.persistence.path = yaml["persistence"]["path"].as<std::string>();
            }
        }

        if (yaml["logging"]) {
            if (yaml["logging"]["level"]) {
                config.logging.level = yaml["logging"]["level"].as<std::string>();
            }
        }

        if (!validate_config(config, error)) {
            return false;
        }

        std::stringstream discovery_msg;
        discovery_msg << "[Config] Discovery: " << (config.discovery.enabled ? "enabled" : "disabled");
        if (config.discovery.enabled) {
            discovery_msg << " (" << config.discovery.service_type << " via " << config.discovery.browse_command
                          << (config.discovery.allow_ipv6 ? ", IPv6 allowed" : "") << ")";
        }
        LOG_INFO(discovery_msg.str());

        LOG_INFO("[Config] Resolver: " << config.resolver.manifest_path << ", timeout " << config.resolver.timeout_ms
                                       << "ms, " << config.resolver.max_retries << " retries, "
                                       << config.resolver.workers << " workers");
        LOG_INFO("[Config] Dispatch timeout: " << config.dispatch.timeout_ms << "ms");

        std::stringstream persistence_msg;
        persistence_msg << "[Config] Persistence: " << (config.persistence.enabled ? "enabled" : "disabled");
        if (config.persistence.enabled) {
            persistence_msg << " (" << config.persistence.path << ")";
        }
        LOG_INFO(persistence_msg.str());

        LOG_INFO("[Config] Log level: " << config.logging.level);

        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace ascot
