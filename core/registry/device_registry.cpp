#include "registry/device_registry.hpp"

#include <algorithm>

#include "events/event_emitter.hpp"
#include "logging/logger.hpp"
#include "persistence/persistence_writer.hpp"

namespace ascot {
namespace registry {

const char *health_state_to_string(HealthState state) {
    switch (state) {
        case HealthState::FRESH:
            return "fresh";
        case HealthState::STALE:
            return "stale";
        case HealthState::UNREACHABLE:
            return "unreachable";
        default:
            return "unreachable";
    }
}

DeviceRegistry::DeviceRegistry(const HealthConfig &config) : config_(config) {}

void DeviceRegistry::set_resolve_trigger(ResolveTrigger trigger) { resolve_trigger_ = std::move(trigger); }

void DeviceRegistry::set_event_emitter(std::shared_ptr<events::EventEmitter> emitter) {
    emitter_ = std::move(emitter);
}

void DeviceRegistry::set_persistence(std::shared_ptr<persistence::PersistenceWriter> writer) {
    persistence_ = std::move(writer);
}

std::shared_ptr<DeviceRegistry::Slot> DeviceRegistry::find_slot(const DeviceIdentity &identity) const {
    auto it = slots_.find(identity);
    if (it == slots_.end()) {
        return nullptr;
    }
    return it->second;
}

void DeviceRegistry::apply_update(DeviceRecord &record, const net::NetworkEndpoint &endpoint,
                                  const discovery::ServiceMetadata &metadata, Effects &effects) {
    bool moved = record.endpoint != endpoint;
    bool path_changed = false;
    auto old_path = record.metadata.find("path");
    auto new_path = metadata.find("path");
    if ((old_path == record.metadata.end()) != (new_path == metadata.end()) ||
        (old_path != record.metadata.end() && new_path != metadata.end() && old_path->second != new_path->second)) {
        path_changed = true;
    }

    record.metadata = metadata;
    if (!moved && !path_changed) {
        return;
    }

    record.endpoint = endpoint;
    record.epoch = next_epoch_.fetch_add(1);
    effects.resolve = ResolveRequest{record.identity, record.endpoint, record.metadata, record.epoch};
    if (moved) {
        effects.save = true;
        effects.endpoint = endpoint;
        LOG_INFO("[Registry] " << record.identity << " moved to " << endpoint.base_url());
    }
}

uint64_t DeviceRegistry::upsert(const DeviceIdentity &identity, const net::NetworkEndpoint &endpoint,
                                const discovery::ServiceMetadata &metadata) {
    Effects effects;
    uint64_t epoch = 0;

    {
        std::shared_lock<std::shared_mutex> map_lock(map_mutex_);
        if (auto slot = find_slot(identity)) {
            std::lock_guard<std::mutex> lock(slot->mutex);
            apply_update(slot->record, endpoint, metadata, effects);
            epoch = slot->record.epoch;
        }
    }

    if (epoch == 0) {
        std::unique_lock<std::shared_mutex> map_lock(map_mutex_);
        auto &slot = slots_[identity];
        if (slot) {
            // Inserted by another thread between the two locks
            std::lock_guard<std::mutex> lock(slot->mutex);
            apply_update(slot->record, endpoint, metadata, effects);
            epoch = slot->record.epoch;
        } else {
            slot = std::make_shared<Slot>();
            auto &record = slot->record;
            record.identity = identity;
            record.endpoint = endpoint;
            record.metadata = metadata;
            record.health = HealthState::UNREACHABLE;
            record.epoch = next_epoch_.fetch_add(1);
            epoch = record.epoch;

            effects.resolve = ResolveRequest{identity, endpoint, metadata, epoch};
            effects.registered = true;
            effects.save = true;
            effects.endpoint = endpoint;
            LOG_INFO("[Registry] Registered " << identity << " at " << endpoint.base_url());
        }
    }

    run_effects(identity, effects);
    return epoch;
}

bool DeviceRegistry::restore(const DeviceIdentity &identity, const net::NetworkEndpoint &endpoint) {
    Effects effects;
    {
        std::unique_lock<std::shared_mutex> map_lock(map_mutex_);
        if (slots_.count(identity) > 0) {
            return false;
        }
        auto slot = std::make_shared<Slot>();
        slot->record.identity = identity;
        slot->record.endpoint = endpoint;
        slot->record.health = HealthState::UNREACHABLE;
        slot->record.epoch = next_epoch_.fetch_add(1);
        effects.resolve = ResolveRequest{identity, endpoint, {}, slot->record.epoch};
        effects.registered = true;
        effects.endpoint = endpoint;
        slots_[identity] = std::move(slot);
    }

    LOG_INFO("[Registry] Restored " << identity << " at " << endpoint.base_url());
    run_effects(identity, effects);
    return true;
}

bool DeviceRegistry::remove(const DeviceIdentity &identity) {
    Effects effects;
    {
        std::unique_lock<std::shared_mutex> map_lock(map_mutex_);
        auto it = slots_.find(identity);
        if (it == slots_.end()) {
            return false;
        }
        // Wait out any operation still holding the record
        std::lock_guard<std::mutex> lock(it->second->mutex);
        slots_.erase(it);
    }
    effects.remove = true;

    LOG_INFO("[Registry] Removed " << identity);
    run_effects(identity, effects);
    return true;
}

bool DeviceRegistry::attach_manifest(const DeviceIdentity &identity, manifest::ManifestPtr manifest, uint64_t epoch) {
    if (!manifest) {
        return false;
    }

    Effects effects;
    {
        std::shared_lock<std::shared_mutex> map_lock(map_mutex_);
        auto slot = find_slot(identity);
        if (!slot) {
            LOG_INFO("[Registry] Discarding manifest for " << identity << ": device no longer registered");
            return false;
        }

        std::lock_guard<std::mutex> lock(slot->mutex);
        auto &record = slot->record;
        if (epoch != 0 && epoch != record.epoch) {
            LOG_INFO("[Registry] Discarding manifest for " << identity << ": resolved for epoch " << epoch
                                                           << ", record is at " << record.epoch);
            return false;
        }

        HealthState old_health = record.health;
        record.manifest = std::move(manifest);
        record.health = HealthState::FRESH;
        record.consecutive_failures = 0;
        record.last_seen = std::chrono::system_clock::now();

        effects.manifest_attached = true;
        effects.action_count = record.manifest->actions.size();
        effects.unknown_hazards = record.manifest->has_unknown_hazards();
        if (old_health != record.health) {
            effects.health_change = std::make_pair(old_health, record.health);
        }
    }

    LOG_INFO("[Registry] Manifest attached to " << identity << " (" << effects.action_count << " actions)");
    run_effects(identity, effects);
    return true;
}

void DeviceRegistry::apply_outcome(DeviceRecord &record, HealthOutcome outcome, Effects &effects) const {
    HealthState old_health = record.health;
    switch (outcome) {
        case HealthOutcome::SUCCESS:
            record.consecutive_failures = 0;
            record.health = HealthState::FRESH;
            record.last_seen = std::chrono::system_clock::now();
            break;
        case HealthOutcome::FAILURE:
            record.consecutive_failures++;
            if (record.consecutive_failures >= config_.unreachable_after_failures) {
                record.health = HealthState::UNREACHABLE;
            }
            break;
        case HealthOutcome::PROTOCOL_ERROR:
            record.consecutive_failures++;
            record.health = HealthState::UNREACHABLE;
            break;
    }
    if (old_health != record.health) {
        effects.health_change = std::make_pair(old_health, record.health);
    }
}

bool DeviceRegistry::mark_health(const DeviceIdentity &identity, HealthOutcome outcome, uint64_t epoch) {
    Effects effects;
    {
        std::shared_lock<std::shared_mutex> map_lock(map_mutex_);
        auto slot = find_slot(identity);
        if (!slot) {
            return false;
        }
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (epoch != 0 && epoch != slot->record.epoch) {
            LOG_DEBUG("[Registry] Ignoring health outcome for " << identity << " from epoch " << epoch);
            return false;
        }
        apply_outcome(slot->record, outcome, effects);
    }

    run_effects(identity, effects);
    return true;
}

size_t DeviceRegistry::expire_stale(std::chrono::system_clock::time_point now) {
    std::vector<std::pair<DeviceIdentity, Effects>> changed;
    const auto threshold = std::chrono::milliseconds(config_.stale_after_ms);
    {
        std::shared_lock<std::shared_mutex> map_lock(map_mutex_);
        for (auto &[identity, slot] : slots_) {
            std::lock_guard<std::mutex> lock(slot->mutex);
            auto &record = slot->record;
            if (record.health == HealthState::FRESH && now - record.last_seen > threshold) {
                record.health = HealthState::STALE;
                Effects effects;
                effects.health_change = std::make_pair(HealthState::FRESH, HealthState::STALE);
                changed.emplace_back(identity, std::move(effects));
            }
        }
    }

    for (const auto &[identity, effects] : changed) {
        LOG_INFO("[Registry] " << identity << " is stale");
        run_effects(identity, effects);
    }
    return changed.size();
}

bool DeviceRegistry::request_resolve(const DeviceIdentity &identity) {
    Effects effects;
    {
        std::shared_lock<std::shared_mutex> map_lock(map_mutex_);
        auto slot = find_slot(identity);
        if (!slot) {
            return false;
        }
        std::lock_guard<std::mutex> lock(slot->mutex);
        const auto &record = slot->record;
        effects.resolve = ResolveRequest{record.identity, record.endpoint, record.metadata, record.epoch};
    }
    run_effects(identity, effects);
    return true;
}

std::vector<DeviceRecord> DeviceRegistry::snapshot() const {
    std::vector<DeviceRecord> records;
    {
        // Exclusive: no per-record operation can be in flight while copying
        std::unique_lock<std::shared_mutex> map_lock(map_mutex_);
        records.reserve(slots_.size());
        for (const auto &[identity, slot] : slots_) {
            static_cast<void>(identity);
            std::lock_guard<std::mutex> lock(slot->mutex);
            records.push_back(slot->record);
        }
    }
    std::sort(records.begin(), records.end(),
              [](const DeviceRecord &a, const DeviceRecord &b) { return a.identity < b.identity; });
    return records;
}

std::optional<DeviceRecord> DeviceRegistry::get(const DeviceIdentity &identity) const {
    std::shared_lock<std::shared_mutex> map_lock(map_mutex_);
    auto slot = find_slot(identity);
    if (!slot) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->record;
}

bool DeviceRegistry::contains(const DeviceIdentity &identity) const {
    std::shared_lock<std::shared_mutex> map_lock(map_mutex_);
    return slots_.count(identity) > 0;
}

size_t DeviceRegistry::device_count() const {
    std::shared_lock<std::shared_mutex> map_lock(map_mutex_);
    return slots_.size();
}

void DeviceRegistry::run_effects(const DeviceIdentity &identity, const Effects &effects) {
    if (persistence_) {
        if (effects.save) {
            persistence_->enqueue_save(identity, effects.endpoint);
        } else if (effects.remove) {
            persistence_->enqueue_delete(identity);
        }
    }

    if (emitter_) {
        const int64_t now_ms = events::now_epoch_ms();
        if (effects.registered) {
            emitter_->emit(events::DeviceRegistered{0, identity, effects.endpoint, now_ms});
        }
        if (effects.manifest_attached) {
            emitter_->emit(events::ManifestAttached{0, identity, effects.action_count, effects.unknown_hazards, now_ms});
        }
        if (effects.health_change) {
            emitter_->emit(events::HealthChanged{0, identity, health_state_to_string(effects.health_change->first),
                                                 health_state_to_string(effects.health_change->second), now_ms});
        }
        if (effects.remove) {
            emitter_->emit(events::DeviceRemoved{0, identity, now_ms});
        }
    }

    if (effects.resolve && resolve_trigger_) {
        resolve_trigger_(*effects.resolve);
    }
}

}  // namespace registry
}  // namespace ascot
