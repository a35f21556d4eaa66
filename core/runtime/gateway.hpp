#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "config.hpp"
#include "control/command_dispatcher.hpp"
#include "discovery/discovery_listener.hpp"
#include "discovery/i_discovery_transport.hpp"
#include "events/event_emitter.hpp"
#include "net/i_device_http_client.hpp"
#include "persistence/i_persistence_adapter.hpp"
#include "persistence/persistence_writer.hpp"
#include "registry/device_registry.hpp"
#include "resolver/capability_resolver.hpp"
#include "resolver/resolve_worker.hpp"

namespace ascot {
namespace runtime {

// Replaceable collaborators; null members get the production implementation
struct GatewayDependencies {
    std::shared_ptr<net::IDeviceHttpClient> http_client;
    std::shared_ptr<discovery::IDiscoveryTransport> transport;
    std::shared_ptr<persistence::IPersistenceAdapter> persistence;
};

class Gateway {
public:
    explicit Gateway(const GatewayConfig &config, GatewayDependencies deps = GatewayDependencies{});
    ~Gateway();

    Gateway(const Gateway &) = delete;
    Gateway &operator=(const Gateway &) = delete;

    // Build and start all components (persistence, registry, resolver, discovery)
    bool initialize(std::string &error);

    // Maintenance loop (blocking) until stop() or a shutdown signal
    void run();

    // Triggers the main loop to exit
    void stop() { running_ = false; }

    // Stop discovery, drain resolves and flush persistence
    void shutdown();

    // One pass of the maintenance loop: staleness and periodic re-resolve
    void maintain(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    // Access to core components for the panel layer
    registry::DeviceRegistry &registry() { return *registry_; }
    control::CommandDispatcher &dispatcher() { return *dispatcher_; }
    events::EventEmitter &events() { return *event_emitter_; }
    resolver::ResolveWorker &resolve_worker() { return *resolve_worker_; }
    discovery::DiscoveryListener *listener() { return listener_.get(); }

private:
    // Staged initialization helpers
    bool init_persistence(std::string &error);
    bool init_core_services(std::string &error);
    bool init_discovery(std::string &error);
    void restore_known_devices();

    // Applies discovery events to the registry
    void orchestrate_loop();

    GatewayConfig config_;
    GatewayDependencies deps_;

    std::shared_ptr<events::EventEmitter> event_emitter_;  // Shared with registry and listener
    std::shared_ptr<persistence::PersistenceWriter> persistence_writer_;
    std::unique_ptr<registry::DeviceRegistry> registry_;
    std::unique_ptr<resolver::CapabilityResolver> resolver_;
    std::unique_ptr<resolver::ResolveWorker> resolve_worker_;
    std::unique_ptr<control::CommandDispatcher> dispatcher_;
    std::unique_ptr<discovery::DiscoveryListener> listener_;

    std::unique_ptr<events::Subscription> discovery_subscription_;
    std::thread orchestrator_thread_;
    std::atomic<bool> orchestrating_{false};

    std::chrono::steady_clock::time_point last_refresh_;
    std::atomic<bool> running_{false};
    bool initialized_ = false;
};

}  // namespace runtime
}  // namespace ascot
