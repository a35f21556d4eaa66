#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <vector>

#include "discovery/discovery_config.hpp"
#include "discovery/i_discovery_transport.hpp"
#include "discovery/restart_supervisor.hpp"
#include "events/event_emitter.hpp"
#include "net/network_endpoint.hpp"

namespace ascot {
namespace discovery {

/**
 * @brief Background task turning browse records into discovery events
 *
 * Emits DeviceAppeared / DeviceUpdated / DeviceVanished on the shared
 * EventEmitter. A device advertised on several interfaces is one device:
 * it appears with its first resolution and vanishes with its last.
 * Repeated resolutions with the same endpoint and TXT properties emit
 * nothing.
 *
 * Transport failures never escape the listener thread; the transport is
 * restarted under a RestartSupervisor until its circuit opens. A restarted
 * browse reports only services still present, so resolutions known before
 * the restart that are not seen again within rescan_grace_ms are withdrawn.
 *
 * The listener never touches the registry.
 */
class DiscoveryListener {
public:
    DiscoveryListener(std::shared_ptr<IDiscoveryTransport> transport, std::shared_ptr<events::EventEmitter> emitter,
                      const DiscoveryConfig &config);
    ~DiscoveryListener();

    DiscoveryListener(const DiscoveryListener &) = delete;
    DiscoveryListener &operator=(const DiscoveryListener &) = delete;

    bool start();
    void stop();
    bool is_running() const { return running_.load(); }

    RestartSupervisor::Snapshot supervision() const { return supervisor_.get_snapshot(); }

private:
    struct Resolution {
        net::NetworkEndpoint endpoint;
        ServiceMetadata metadata;
        bool ipv6 = false;
        bool confirmed = true;  // seen since the last transport start
    };

    struct Sighting {
        std::map<std::string, Resolution> resolutions;  // key: interface/protocol
        bool announced = false;
        net::NetworkEndpoint announced_endpoint;
        ServiceMetadata announced_metadata;
    };

    void listen_loop();
    bool ensure_transport();
    void handle_record(const BrowseRecord &record);
    void handle_resolved(const DeviceIdentity &identity, const BrowseRecord &record);
    void handle_removed(const DeviceIdentity &identity, const BrowseRecord &record);
    const Resolution *preferred_resolution(const Sighting &sighting) const;
    std::optional<events::Event> after_resolution_loss(const DeviceIdentity &identity, Sighting &sighting);
    void begin_rescan();
    void finish_rescan();
    void emit_events(std::vector<events::Event> events);
    void wait_interruptible(int timeout_ms);

    std::shared_ptr<IDiscoveryTransport> transport_;
    std::shared_ptr<events::EventEmitter> emitter_;
    DiscoveryConfig config_;
    RestartSupervisor supervisor_;

    std::atomic<bool> running_{false};
    std::thread thread_;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;

    // Listener thread only
    bool transport_started_ = false;
    std::optional<std::chrono::steady_clock::time_point> rescan_deadline_;
    std::unordered_map<DeviceIdentity, Sighting> sightings_;
};

}  // namespace discovery
}  // namespace ascot
