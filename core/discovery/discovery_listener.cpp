#include "discovery/discovery_listener.hpp"

#include <optional>

#include "logging/logger.hpp"

namespace ascot {
namespace discovery {

namespace {

std::string resolution_key(const BrowseRecord &record) { return record.interface_name + "/" + record.protocol; }

}  // namespace

DiscoveryListener::DiscoveryListener(std::shared_ptr<IDiscoveryTransport> transport,
                                     std::shared_ptr<events::EventEmitter> emitter, const DiscoveryConfig &config)
    : transport_(std::move(transport)),
      emitter_(std::move(emitter)),
      config_(config),
      supervisor_("Discovery transport", config.restart_policy) {}

DiscoveryListener::~DiscoveryListener() { stop(); }

bool DiscoveryListener::start() {
    if (running_.load()) {
        LOG_WARN("[Discovery] Listener already running");
        return false;
    }
    if (!transport_ || !emitter_) {
        LOG_ERROR("[Discovery] Listener needs a transport and an event emitter");
        return false;
    }

    running_.store(true);
    thread_ = std::thread(&DiscoveryListener::listen_loop, this);
    LOG_INFO("[Discovery] Listening for " << config_.service_type);
    return true;
}

void DiscoveryListener::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
    }
    wake_cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    LOG_INFO("[Discovery] Listener stopped");
}

void DiscoveryListener::wait_interruptible(int timeout_ms) {
    std::unique_lock<std::mutex> lock(wake_mutex_);
    wake_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] { return !running_.load(); });
}

bool DiscoveryListener::ensure_transport() {
    if (transport_->is_running()) {
        return true;
    }

    // The first start is unconditional; later ones wait for the supervisor
    if (supervisor_.is_circuit_open()) {
        wait_interruptible(config_.poll_timeout_ms);
        return false;
    }
    if (supervisor_.get_attempt_count() > 0 && !supervisor_.should_restart()) {
        wait_interruptible(50);
        return false;
    }

    if (!transport_->start()) {
        LOG_WARN("[Discovery] Failed to start browse transport: " << transport_->last_error());
        supervisor_.record_crash();
        return false;
    }
    LOG_INFO("[Discovery] Browse transport started");
    if (transport_started_) {
        begin_rescan();
    }
    transport_started_ = true;
    return true;
}

void DiscoveryListener::begin_rescan() {
    if (sightings_.empty()) {
        return;
    }
    for (auto &[identity, sighting] : sightings_) {
        static_cast<void>(identity);
        for (auto &[key, resolution] : sighting.resolutions) {
            static_cast<void>(key);
            resolution.confirmed = false;
        }
    }
    rescan_deadline_ = std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.rescan_grace_ms);
    LOG_INFO("[Discovery] Re-confirming " << sightings_.size() << " devices within " << config_.rescan_grace_ms
                                          << "ms");
}

void DiscoveryListener::finish_rescan() {
    rescan_deadline_.reset();

    std::vector<events::Event> events;
    for (auto it = sightings_.begin(); it != sightings_.end();) {
        auto &sighting = it->second;
        bool lost = false;
        for (auto res = sighting.resolutions.begin(); res != sighting.resolutions.end();) {
            if (res->second.confirmed) {
                ++res;
            } else {
                res = sighting.resolutions.erase(res);
                lost = true;
            }
        }
        if (!lost) {
            ++it;
            continue;
        }
        if (auto event = after_resolution_loss(it->first, sighting)) {
            events.push_back(std::move(*event));
        }
        if (sighting.resolutions.empty()) {
            LOG_INFO("[Discovery] " << it->first << " was not re-confirmed after restart");
            it = sightings_.erase(it);
        } else {
            ++it;
        }
    }
    emit_events(std::move(events));
}

void DiscoveryListener::emit_events(std::vector<events::Event> events) {
    for (auto &event : events) {
        if (std::holds_alternative<events::DeviceVanished>(event)) {
            LOG_INFO("[Discovery] Device vanished: " << events::get_identity(event));
        } else if (const auto *updated = std::get_if<events::DeviceUpdated>(&event)) {
            LOG_INFO("[Discovery] Device updated: " << updated->identity << " now at "
                                                    << updated->endpoint.base_url());
        }
        emitter_->emit(std::move(event));
    }
}

void DiscoveryListener::listen_loop() {
    while (running_.load()) {
        if (!ensure_transport()) {
            continue;
        }

        BrowseRecord record;
        auto result = transport_->poll(record, config_.poll_timeout_ms);
        switch (result) {
            case IDiscoveryTransport::PollResult::RECORD:
                supervisor_.record_heartbeat();
                handle_record(record);
                break;
            case IDiscoveryTransport::PollResult::TIMEOUT:
                supervisor_.record_heartbeat();
                break;
            case IDiscoveryTransport::PollResult::FAILED:
                LOG_WARN("[Discovery] Browse transport failed: " << transport_->last_error());
                transport_->stop();
                supervisor_.record_crash();
                // Nothing can be confirmed while the transport is down
                rescan_deadline_.reset();
                break;
        }

        if (rescan_deadline_ && std::chrono::steady_clock::now() >= *rescan_deadline_) {
            finish_rescan();
        }

        if (supervisor_.should_mark_recovered()) {
            supervisor_.record_success();
        }
    }

    transport_->stop();
}

void DiscoveryListener::handle_record(const BrowseRecord &record) {
    if (!record.service_type.empty() && record.service_type != config_.service_type) {
        LOG_DEBUG("[Discovery] Ignoring service type " << record.service_type);
        return;
    }

    DeviceIdentity identity = make_device_identity(record.service_name);
    if (identity.empty()) {
        LOG_WARN("[Discovery] Ignoring record with unusable service name '" << record.service_name << "'");
        return;
    }

    switch (record.kind) {
        case BrowseRecord::Kind::ADDED:
            LOG_DEBUG("[Discovery] Browsed " << identity << " on " << resolution_key(record));
            break;
        case BrowseRecord::Kind::RESOLVED:
            handle_resolved(identity, record);
            break;
        case BrowseRecord::Kind::REMOVED:
            handle_removed(identity, record);
            break;
    }
}

const DiscoveryListener::Resolution *DiscoveryListener::preferred_resolution(const Sighting &sighting) const {
    const Resolution *fallback = nullptr;
    for (const auto &[key, resolution] : sighting.resolutions) {
        static_cast<void>(key);
        if (!resolution.ipv6) {
            return &resolution;
        }
        if (!fallback) fallback = &resolution;
    }
    return fallback;
}

void DiscoveryListener::handle_resolved(const DeviceIdentity &identity, const BrowseRecord &record) {
    bool ipv6 = record.protocol == "IPv6";
    if (ipv6 && !config_.allow_ipv6) {
        LOG_DEBUG("[Discovery] Ignoring IPv6 resolution of " << identity);
        return;
    }
    if (record.address.empty() || record.port == 0) {
        LOG_WARN("[Discovery] Resolution of " << identity << " has no usable address");
        return;
    }

    Resolution resolution;
    resolution.ipv6 = ipv6;
    resolution.metadata = record.txt;
    resolution.endpoint.host = record.address;
    resolution.endpoint.port = record.port;
    auto scheme_it = record.txt.find("scheme");
    resolution.endpoint.scheme =
        (scheme_it != record.txt.end() && !scheme_it->second.empty()) ? scheme_it->second : "http";

    std::optional<events::Event> event;
    auto &sighting = sightings_[identity];
    sighting.resolutions[resolution_key(record)] = resolution;

    const Resolution *preferred = preferred_resolution(sighting);
    if (!sighting.announced) {
        sighting.announced = true;
        sighting.announced_endpoint = preferred->endpoint;
        sighting.announced_metadata = preferred->metadata;
        event = events::DeviceAppeared{0, identity, preferred->endpoint, preferred->metadata, events::now_epoch_ms()};
    } else if (sighting.announced_endpoint != preferred->endpoint ||
               sighting.announced_metadata != preferred->metadata) {
        sighting.announced_endpoint = preferred->endpoint;
        sighting.announced_metadata = preferred->metadata;
        event = events::DeviceUpdated{0, identity, preferred->endpoint, preferred->metadata, events::now_epoch_ms()};
    }

    if (!event) {
        LOG_DEBUG("[Discovery] Duplicate sighting of " << identity << " ignored");
        return;
    }
    if (std::holds_alternative<events::DeviceAppeared>(*event)) {
        LOG_INFO("[Discovery] Device appeared: " << identity << " at " << resolution.endpoint.base_url());
    } else {
        LOG_INFO("[Discovery] Device updated: " << identity << " now at "
                                                << std::get<events::DeviceUpdated>(*event).endpoint.base_url());
    }
    emitter_->emit(std::move(*event));
}

void DiscoveryListener::handle_removed(const DeviceIdentity &identity, const BrowseRecord &record) {
    auto it = sightings_.find(identity);
    if (it == sightings_.end() || it->second.resolutions.erase(resolution_key(record)) == 0) {
        return;
    }

    std::vector<events::Event> events;
    if (auto event = after_resolution_loss(identity, it->second)) {
        events.push_back(std::move(*event));
    }
    if (it->second.resolutions.empty()) {
        sightings_.erase(it);
    } else {
        LOG_DEBUG("[Discovery] " << identity << " lost " << resolution_key(record) << ", still advertised elsewhere");
    }
    emit_events(std::move(events));
}

std::optional<events::Event> DiscoveryListener::after_resolution_loss(const DeviceIdentity &identity,
                                                                      Sighting &sighting) {
    if (!sighting.announced) {
        return std::nullopt;
    }
    if (sighting.resolutions.empty()) {
        return events::Event{events::DeviceVanished{0, identity, events::now_epoch_ms()}};
    }

    // Another interface still advertises the device
    const Resolution *preferred = preferred_resolution(sighting);
    if (sighting.announced_endpoint == preferred->endpoint && sighting.announced_metadata == preferred->metadata) {
        return std::nullopt;
    }
    sighting.announced_endpoint = preferred->endpoint;
    sighting.announced_metadata = preferred->metadata;
    return events::Event{
        events::DeviceUpdated{0, identity, preferred->endpoint, preferred->metadata, events::now_epoch_ms()}};
}

}  // namespace discovery
}  // namespace ascot
