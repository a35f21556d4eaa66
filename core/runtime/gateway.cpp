#include "gateway.hpp"

#include <type_traits>
#include <variant>

#include "discovery/avahi_browse_transport.hpp"
#include "logging/logger.hpp"
#include "net/device_http_client.hpp"
#include "persistence/json_file_store.hpp"
#include "signal_handler.hpp"

namespace ascot {
namespace runtime {

namespace {
// Absorbs discovery bursts (a whole LAN answering at startup); beyond this the listener waits
constexpr size_t kDiscoveryQueueSize = 1024;
constexpr int kShutdownFlushTimeoutMs = 2000;
}  // namespace

Gateway::Gateway(const GatewayConfig &config, GatewayDependencies deps) : config_(config), deps_(std::move(deps)) {}

Gateway::~Gateway() { shutdown(); }

bool Gateway::initialize(std::string &error) {
    LOG_INFO("[Gateway] Initializing ascot gateway");

    // Default: 100 events per subscriber queue, max 32 subscribers
    event_emitter_ = std::make_shared<events::EventEmitter>(100, 32);

    if (!init_persistence(error)) {
        return false;
    }

    if (!init_core_services(error)) {
        return false;
    }

    restore_known_devices();

    if (!init_discovery(error)) {
        return false;
    }

    last_refresh_ = std::chrono::steady_clock::now();
    initialized_ = true;
    LOG_INFO("[Gateway] Initialization complete");
    return true;
}

bool Gateway::init_persistence(std::string &error) {
    if (!config_.persistence.enabled) {
        LOG_INFO("[Gateway] Persistence disabled in config");
        return true;
    }

    if (!deps_.persistence) {
        deps_.persistence = std::make_shared<persistence::JsonFileStore>(config_.persistence.path);
    }

    persistence_writer_ = std::make_shared<persistence::PersistenceWriter>(deps_.persistence);
    if (!persistence_writer_->start()) {
        error = "Failed to start persistence writer";
        return false;
    }
    return true;
}

bool Gateway::init_core_services(std::string &error) {
    if (!deps_.http_client) {
        deps_.http_client = std::make_shared<net::DeviceHttpClient>();
    }

    registry_ = std::make_unique<registry::DeviceRegistry>(config_.health);
    registry_->set_event_emitter(event_emitter_);
    if (persistence_writer_) {
        registry_->set_persistence(persistence_writer_);
    }

    resolver_ = std::make_unique<resolver::CapabilityResolver>(*deps_.http_client, config_.resolver);
    resolve_worker_ =
        std::make_unique<resolver::ResolveWorker>(*resolver_, *registry_, config_.resolver.workers);
    if (!resolve_worker_->start()) {
        error = "Failed to start resolve workers";
        return false;
    }

    // Every new or moved record is resolved in the background
    registry_->set_resolve_trigger(
        [worker = resolve_worker_.get()](const registry::ResolveRequest &request) { worker->submit(request); });

    dispatcher_ = std::make_unique<control::CommandDispatcher>(*registry_, *deps_.http_client, config_.dispatch);

    LOG_INFO("[Gateway] Core services created (" << config_.resolver.workers << " resolve workers)");
    return true;
}

void Gateway::restore_known_devices() {
    if (!deps_.persistence) {
        return;
    }

    std::vector<persistence::KnownDevice> known;
    std::string load_error;
    if (!deps_.persistence->load_known_devices(known, load_error)) {
        // Discovery repopulates the registry; a bad store only costs the warm start
        LOG_ERROR("[Gateway] Could not load known devices: " << load_error);
        return;
    }

    size_t restored = 0;
    for (const auto &device : known) {
        if (registry_->restore(device.identity, device.endpoint)) {
            ++restored;
        }
    }
    LOG_INFO("[Gateway] Restored " << restored << " known device(s)");
}

bool Gateway::init_discovery(std::string &error) {
    discovery_subscription_ =
        event_emitter_->subscribe(events::EventFilter::discovery_only(), kDiscoveryQueueSize, "orchestrator",
                                  events::OverflowPolicy::BLOCK);
    if (!discovery_subscription_) {
        error = "Failed to subscribe orchestrator to discovery events";
        return false;
    }

    orchestrating_ = true;
    orchestrator_thread_ = std::thread(&Gateway::orchestrate_loop, this);

    if (!config_.discovery.enabled) {
        LOG_INFO("[Gateway] Discovery disabled in config");
        return true;
    }

    if (!deps_.transport) {
        deps_.transport = std::make_shared<discovery::AvahiBrowseTransport>(config_.discovery);
    }

    listener_ = std::make_unique<discovery::DiscoveryListener>(deps_.transport, event_emitter_, config_.discovery);
    if (!listener_->start()) {
        error = "Failed to start discovery listener";
        return false;
    }
    return true;
}

void Gateway::orchestrate_loop() {
    LOG_DEBUG("[Gateway] Orchestrator started");
    while (orchestrating_) {
        auto event = discovery_subscription_->pop(100);
        if (!event) {
            continue;
        }

        std::visit(
            [this](auto &&e) {
                using T = std::decay_t<decltype(e)>;
                if constexpr (std::is_same_v<T, events::DeviceAppeared> || std::is_same_v<T, events::DeviceUpdated>) {
                    registry_->upsert(e.identity, e.endpoint, e.metadata);
                } else if constexpr (std::is_same_v<T, events::DeviceVanished>) {
                    registry_->remove(e.identity);
                }
            },
            *event);
    }
    LOG_DEBUG("[Gateway] Orchestrator stopped");
}

void Gateway::maintain(std::chrono::steady_clock::time_point now) {
    registry_->expire_stale();

    const int interval_ms = config_.resolver.refresh_interval_ms;
    if (interval_ms <= 0 || now - last_refresh_ < std::chrono::milliseconds(interval_ms)) {
        return;
    }
    last_refresh_ = now;

    size_t requested = 0;
    for (const auto &record : registry_->snapshot()) {
        if (!record.has_manifest() || record.health != registry::HealthState::FRESH) {
            if (registry_->request_resolve(record.identity)) {
                ++requested;
            }
        }
    }
    if (requested > 0) {
        LOG_DEBUG("[Gateway] Re-resolving " << requested << " device(s)");
    }
}

void Gateway::run() {
    LOG_INFO("[Gateway] Starting main loop");
    running_ = true;

    LOG_INFO("[Gateway] Press Ctrl+C to exit");

    while (running_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        // Check for shutdown signal
        if (SignalHandler::is_shutdown_requested()) {
            LOG_INFO("[Gateway] Signal received, stopping...");
            running_ = false;
            break;
        }

        maintain();
    }

    LOG_INFO("[Gateway] Shutting down");
}

void Gateway::shutdown() {
    running_ = false;

    // Stop producers first: discovery, then the orchestrator that feeds the registry
    if (listener_) {
        LOG_INFO("[Gateway] Stopping discovery listener");
        listener_->stop();
    }

    if (orchestrator_thread_.joinable()) {
        orchestrating_ = false;
        orchestrator_thread_.join();
    }
    discovery_subscription_.reset();

    if (resolve_worker_) {
        resolve_worker_->stop();
    }

    if (persistence_writer_ && persistence_writer_->is_running()) {
        if (!persistence_writer_->flush(kShutdownFlushTimeoutMs)) {
            LOG_WARN("[Gateway] Persistence queue not drained within " << kShutdownFlushTimeoutMs << "ms");
        }
        persistence_writer_->stop();
    }

    if (initialized_) {
        LOG_INFO("[Gateway] Shutdown complete");
        initialized_ = false;
    }
}

}  // namespace runtime
}  // namespace ascot
