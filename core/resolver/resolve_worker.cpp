#include "resolver/resolve_worker.hpp"

#include <algorithm>

#include "logging/logger.hpp"

namespace ascot {
namespace resolver {

ResolveWorker::ResolveWorker(CapabilityResolver &resolver, registry::DeviceRegistry &registry, int workers,
                             size_t max_pending)
    : resolver_(resolver), registry_(registry), worker_count_(std::max(1, workers)), max_pending_(max_pending) {}

ResolveWorker::~ResolveWorker() { stop(); }

bool ResolveWorker::start() {
    if (running_.load()) {
        LOG_WARN("[Resolver] Worker pool already running");
        return false;
    }
    running_.store(true);
    for (int i = 0; i < worker_count_; ++i) {
        threads_.emplace_back(&ResolveWorker::worker_loop, this);
    }
    LOG_INFO("[Resolver] Started " << worker_count_ << " resolve workers");
    return true;
}

void ResolveWorker::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    size_t discarded = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        discarded = queue_.size();
        for (const auto &request : queue_) {
            scheduled_.erase(JobKey{request.identity, request.epoch});
        }
        queue_.clear();
    }
    cv_.notify_all();
    for (auto &thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
    idle_cv_.notify_all();
    LOG_INFO("[Resolver] Worker pool stopped (" << discarded << " pending resolves discarded)");
}

bool ResolveWorker::submit(const registry::ResolveRequest &request) {
    if (!running_.load()) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        JobKey key{request.identity, request.epoch};
        if (scheduled_.count(key) > 0) {
            LOG_DEBUG("[Resolver] Resolve of " << request.identity << " already scheduled");
            return false;
        }

        // A job for a newer epoch already queued or running makes this one stale
        auto newest = scheduled_.lower_bound(JobKey{request.identity, request.epoch});
        if (newest != scheduled_.end() && newest->first == request.identity) {
            LOG_DEBUG("[Resolver] Resolve of " << request.identity << " epoch " << request.epoch
                                               << " superseded by epoch " << newest->second);
            return false;
        }

        // Older queued epochs are superseded; a running one finishes and is discarded by the registry
        for (auto it = queue_.begin(); it != queue_.end();) {
            if (it->identity == request.identity && it->epoch < request.epoch) {
                scheduled_.erase(JobKey{it->identity, it->epoch});
                it = queue_.erase(it);
            } else {
                ++it;
            }
        }

        if (queue_.size() >= max_pending_) {
            LOG_WARN("[Resolver] Queue full (" << max_pending_ << "), dropping resolve of " << request.identity);
            return false;
        }

        scheduled_.insert(key);
        queue_.push_back(request);
    }
    cv_.notify_one();
    return true;
}

bool ResolveWorker::wait_idle(int timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                             [this] { return queue_.empty() && running_jobs_ == 0; });
}

size_t ResolveWorker::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

size_t ResolveWorker::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_jobs_;
}

void ResolveWorker::worker_loop() {
    while (true) {
        registry::ResolveRequest request;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || !running_.load(); });
            if (!running_.load()) {
                break;
            }
            request = std::move(queue_.front());
            queue_.pop_front();
            running_jobs_++;
        }

        std::string manifest_path;
        auto path_it = request.metadata.find("path");
        if (path_it != request.metadata.end()) {
            manifest_path = path_it->second;
        }

        ResolveResult result = resolver_.resolve(request.identity, request.endpoint, manifest_path);
        complete(request, result);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            scheduled_.erase(JobKey{request.identity, request.epoch});
            running_jobs_--;
        }
        idle_cv_.notify_all();
    }
}

void ResolveWorker::complete(const registry::ResolveRequest &request, const ResolveResult &result) {
    if (result.success) {
        registry_.attach_manifest(request.identity, result.manifest, request.epoch);
        return;
    }

    auto outcome = result.error == ResolveError::MALFORMED_MANIFEST ? registry::HealthOutcome::PROTOCOL_ERROR
                                                                    : registry::HealthOutcome::FAILURE;
    LOG_WARN("[Resolver] Could not resolve " << request.identity << " (" << resolve_error_to_string(result.error)
                                             << "): " << result.error_message);
    registry_.mark_health(request.identity, outcome, request.epoch);
}

}  // namespace resolver
}  // namespace ascot
