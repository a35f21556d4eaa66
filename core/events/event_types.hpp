#pragma once

/**
 * @file event_types.hpp
 * @brief Event types flowing through the gateway's event stream
 *
 * Two families share one stream:
 * - Discovery events, produced by the DiscoveryListener from browse
 *   records and consumed by the gateway's orchestrator thread
 * - Registry events, produced by the DeviceRegistry on state changes and
 *   consumed by the panel layer
 *
 * Events are immutable value types. Timestamps are epoch milliseconds.
 */

#include <chrono>
#include <cstdint>
#include <string>
#include <variant>

#include "discovery/device_identity.hpp"
#include "net/network_endpoint.hpp"

namespace ascot {
namespace events {

inline int64_t now_epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

/**
 * @brief A device was resolved on the network for the first time
 */
struct DeviceAppeared {
    uint64_t event_id = 0;
    discovery::DeviceIdentity identity;
    net::NetworkEndpoint endpoint;
    discovery::ServiceMetadata metadata;
    int64_t timestamp_ms = 0;
};

/**
 * @brief The last advertisement of a device was withdrawn
 */
struct DeviceVanished {
    uint64_t event_id = 0;
    discovery::DeviceIdentity identity;
    int64_t timestamp_ms = 0;
};

/**
 * @brief A known device now answers on a different endpoint
 */
struct DeviceUpdated {
    uint64_t event_id = 0;
    discovery::DeviceIdentity identity;
    net::NetworkEndpoint endpoint;
    discovery::ServiceMetadata metadata;
    int64_t timestamp_ms = 0;
};

/**
 * @brief A record entered the registry (discovered or restored)
 */
struct DeviceRegistered {
    uint64_t event_id = 0;
    discovery::DeviceIdentity identity;
    net::NetworkEndpoint endpoint;
    int64_t timestamp_ms = 0;
};

/**
 * @brief A freshly fetched manifest was attached to a registry record
 */
struct ManifestAttached {
    uint64_t event_id = 0;
    discovery::DeviceIdentity identity;
    size_t action_count = 0;
    bool has_unknown_hazards = false;
    int64_t timestamp_ms = 0;
};

/**
 * @brief Registry health transition (e.g. "fresh" -> "unreachable")
 */
struct HealthChanged {
    uint64_t event_id = 0;
    discovery::DeviceIdentity identity;
    std::string old_health;
    std::string new_health;
    int64_t timestamp_ms = 0;
};

/**
 * @brief A record left the registry
 */
struct DeviceRemoved {
    uint64_t event_id = 0;
    discovery::DeviceIdentity identity;
    int64_t timestamp_ms = 0;
};

using Event = std::variant<DeviceAppeared, DeviceVanished, DeviceUpdated, DeviceRegistered, ManifestAttached,
                           HealthChanged, DeviceRemoved>;

inline bool is_discovery_event(const Event &event) {
    return std::holds_alternative<DeviceAppeared>(event) || std::holds_alternative<DeviceVanished>(event) ||
           std::holds_alternative<DeviceUpdated>(event);
}

inline const discovery::DeviceIdentity &get_identity(const Event &event) {
    return std::visit([](auto &&e) -> const discovery::DeviceIdentity & { return e.identity; }, event);
}

inline uint64_t get_event_id(const Event &event) {
    return std::visit([](auto &&e) { return e.event_id; }, event);
}

inline int64_t get_timestamp_ms(const Event &event) {
    return std::visit([](auto &&e) { return e.timestamp_ms; }, event);
}

}  // namespace events
}  // namespace ascot
