#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "registry/device_registry.hpp"
#include "resolver/capability_resolver.hpp"

namespace ascot {
namespace resolver {

/**
 * @brief Fixed pool of threads running manifest resolves
 *
 * Each job is one CapabilityResolver::resolve() whose outcome is written
 * back through the registry with the job's epoch, so results for removed
 * or moved devices are dropped there. A job for an identity replaces any
 * queued job for an older epoch of the same identity, and is itself dropped
 * when a newer epoch is already queued or running. An identical job already
 * queued or running is coalesced.
 */
class ResolveWorker {
public:
    ResolveWorker(CapabilityResolver &resolver, registry::DeviceRegistry &registry, int workers,
                  size_t max_pending = 256);
    ~ResolveWorker();

    ResolveWorker(const ResolveWorker &) = delete;
    ResolveWorker &operator=(const ResolveWorker &) = delete;

    bool start();

    // Pending jobs are discarded; running resolves finish first
    void stop();

    // Returns false when the job was coalesced, dropped or the pool is stopped
    bool submit(const registry::ResolveRequest &request);

    // Wait until no job is queued or running
    bool wait_idle(int timeout_ms);

    size_t pending() const;
    size_t in_flight() const;

private:
    using JobKey = std::pair<discovery::DeviceIdentity, uint64_t>;

    void worker_loop();
    void complete(const registry::ResolveRequest &request, const ResolveResult &result);

    CapabilityResolver &resolver_;
    registry::DeviceRegistry &registry_;
    const int worker_count_;
    const size_t max_pending_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<registry::ResolveRequest> queue_;
    std::set<JobKey> scheduled_;  // queued or running
    size_t running_jobs_ = 0;

    std::atomic<bool> running_{false};
    std::vector<std::thread> threads_;
};

}  // namespace resolver
}  // namespace ascot
