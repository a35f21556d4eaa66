#ifndef ASCOT_REGISTRY_DEVICE_REGISTRY_HPP
#define ASCOT_REGISTRY_DEVICE_REGISTRY_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "discovery/device_identity.hpp"
#include "manifest/manifest.hpp"
#include "net/network_endpoint.hpp"

namespace ascot {
namespace events {
class EventEmitter;
}
namespace persistence {
class PersistenceWriter;
}

namespace registry {

using discovery::DeviceIdentity;

enum class HealthState { FRESH, STALE, UNREACHABLE };

const char *health_state_to_string(HealthState state);

// What a fetch or dispatch observed about a device
enum class HealthOutcome {
    SUCCESS,        // device answered
    FAILURE,        // transport failure or server error
    PROTOCOL_ERROR  // device answered with something unusable
};

struct HealthConfig {
    int stale_after_ms = 300000;        // Fresh -> Stale after this long without a success
    int unreachable_after_failures = 3;  // Consecutive failures before Unreachable
};

// Registry entry. Callers only ever hold copies.
struct DeviceRecord {
    DeviceIdentity identity;
    net::NetworkEndpoint endpoint;
    discovery::ServiceMetadata metadata;
    manifest::ManifestPtr manifest;  // null until the first successful resolve
    HealthState health = HealthState::UNREACHABLE;
    int consecutive_failures = 0;
    std::chrono::system_clock::time_point last_seen;  // last success; zero if never
    uint64_t epoch = 0;  // changes when the record is (re)inserted or its endpoint moves

    bool has_manifest() const { return manifest != nullptr; }
};

// Work item handed to the resolve trigger
struct ResolveRequest {
    DeviceIdentity identity;
    net::NetworkEndpoint endpoint;
    discovery::ServiceMetadata metadata;
    uint64_t epoch = 0;
};

// Device Registry - single source of truth for known devices
/**
 * Thread Safety:
 * - The identity map is guarded by a shared_mutex; every record has its own mutex
 * - Operations on an existing identity hold the map lock shared plus that
 *   record's lock, so different identities proceed in parallel and the same
 *   identity is linearized
 * - Insert, remove and snapshot hold the map lock exclusively
 * - Callbacks, event emission and persistence run after all locks are released
 * - Returns by value; no reference into the registry ever escapes
 *
 * Epochs: resolve results carry the epoch they were started for and are
 * discarded when the record was removed, re-inserted or moved since.
 */
class DeviceRegistry {
public:
    using ResolveTrigger = std::function<void(const ResolveRequest &)>;

    explicit DeviceRegistry(const HealthConfig &config = HealthConfig{});

    // Wiring; call before the registry is shared between threads
    void set_resolve_trigger(ResolveTrigger trigger);
    void set_event_emitter(std::shared_ptr<events::EventEmitter> emitter);
    void set_persistence(std::shared_ptr<persistence::PersistenceWriter> writer);

    // Insert (Unreachable, no manifest) or update in place.
    // Returns the record's epoch; a new epoch triggers a resolve and a save.
    uint64_t upsert(const DeviceIdentity &identity, const net::NetworkEndpoint &endpoint,
                    const discovery::ServiceMetadata &metadata = {});

    // Startup insert of a persisted device; no save. False if already present.
    bool restore(const DeviceIdentity &identity, const net::NetworkEndpoint &endpoint);

    // Idempotent. Returns true if a record was dropped.
    bool remove(const DeviceIdentity &identity);

    // Replace the manifest and mark Fresh. epoch 0 matches any epoch.
    // Returns false (and logs) when the result is stale.
    bool attach_manifest(const DeviceIdentity &identity, manifest::ManifestPtr manifest, uint64_t epoch = 0);

    // Apply a fetch/dispatch outcome. epoch 0 matches any epoch.
    bool mark_health(const DeviceIdentity &identity, HealthOutcome outcome, uint64_t epoch = 0);

    // Fresh records silent for longer than stale_after_ms become Stale.
    // Returns the number of records changed.
    size_t expire_stale(std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    // Fire the resolve trigger again for an existing record
    bool request_resolve(const DeviceIdentity &identity);

    // Point-in-time copy of every record, sorted by identity
    std::vector<DeviceRecord> snapshot() const;

    std::optional<DeviceRecord> get(const DeviceIdentity &identity) const;
    bool contains(const DeviceIdentity &identity) const;
    size_t device_count() const;

    const HealthConfig &health_config() const { return config_; }

private:
    struct Slot {
        mutable std::mutex mutex;
        DeviceRecord record;
    };

    // Side effects collected under lock, applied after unlocking
    struct Effects {
        std::optional<ResolveRequest> resolve;
        bool registered = false;
        bool save = false;
        bool remove = false;
        net::NetworkEndpoint endpoint;
        std::optional<std::pair<HealthState, HealthState>> health_change;
        bool manifest_attached = false;
        size_t action_count = 0;
        bool unknown_hazards = false;
    };

    std::shared_ptr<Slot> find_slot(const DeviceIdentity &identity) const;  // caller holds map lock
    void apply_update(DeviceRecord &record, const net::NetworkEndpoint &endpoint,
                      const discovery::ServiceMetadata &metadata, Effects &effects);
    void apply_outcome(DeviceRecord &record, HealthOutcome outcome, Effects &effects) const;
    void run_effects(const DeviceIdentity &identity, const Effects &effects);

    const HealthConfig config_;

    mutable std::shared_mutex map_mutex_;
    std::unordered_map<DeviceIdentity, std::shared_ptr<Slot>> slots_;
    std::atomic<uint64_t> next_epoch_{1};

    ResolveTrigger resolve_trigger_;
    std::shared_ptr<events::EventEmitter> emitter_;
    std::shared_ptr<persistence::PersistenceWriter> persistence_;
};

}  // namespace registry
}  // namespace ascot

#endif  // ASCOT_REGISTRY_DEVICE_REGISTRY_HPP
