#include "discovery/restart_supervisor.hpp"

#include "logging/logger.hpp"

namespace ascot {
namespace discovery {

RestartSupervisor::RestartSupervisor(const std::string &name, const RestartPolicyConfig &policy)
    : name_(name), policy_(policy) {}

bool RestartSupervisor::should_restart() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!policy_.enabled || circuit_open_) {
        return false;
    }
    return std::chrono::steady_clock::now() >= next_restart_time_;
}

int RestartSupervisor::get_backoff_ms() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (attempt_count_ == 0 || circuit_open_) {
        return 0;
    }
    int attempt_index = attempt_count_ - 1;
    if (attempt_index < static_cast<int>(policy_.backoff_ms.size())) {
        return policy_.backoff_ms[attempt_index];
    }
    return 0;
}

bool RestartSupervisor::record_crash() {
    std::lock_guard<std::mutex> lock(mutex_);

    start_time_ = std::chrono::steady_clock::time_point{};

    if (!policy_.enabled) {
        circuit_open_ = true;
        LOG_ERROR("[Supervisor] " << name_ << " failed (restart policy disabled)");
        return false;
    }

    attempt_count_++;
    if (attempt_count_ > policy_.max_attempts) {
        circuit_open_ = true;
        LOG_ERROR("[Supervisor] " << name_ << " failed (circuit breaker open, exceeded " << policy_.max_attempts
                                  << " restart attempts)");
        return false;
    }

    int attempt_index = attempt_count_ - 1;
    int backoff_ms = attempt_index < static_cast<int>(policy_.backoff_ms.size())
                         ? policy_.backoff_ms[attempt_index]
                         : (policy_.backoff_ms.empty() ? 0 : policy_.backoff_ms.back());
    next_restart_time_ = std::chrono::steady_clock::now() + std::chrono::milliseconds(backoff_ms);

    LOG_WARN("[Supervisor] " << name_ << " failed (attempt " << attempt_count_ << "/" << policy_.max_attempts
                             << ", retry in " << backoff_ms << "ms)");
    return true;
}

void RestartSupervisor::record_success() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (attempt_count_ > 0) {
        LOG_INFO("[Supervisor] " << name_ << " recovered (after " << attempt_count_ << " restart attempts)");
    }
    attempt_count_ = 0;
    circuit_open_ = false;
    next_restart_time_ = std::chrono::steady_clock::time_point{};
}

void RestartSupervisor::record_heartbeat() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (start_time_ == std::chrono::steady_clock::time_point{}) {
        start_time_ = std::chrono::steady_clock::now();
    }
}

bool RestartSupervisor::should_mark_recovered() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!policy_.enabled || circuit_open_ || attempt_count_ == 0) {
        return false;
    }
    if (start_time_ == std::chrono::steady_clock::time_point{}) {
        return false;
    }
    auto stable_for =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_time_).count();
    return stable_for >= policy_.success_reset_ms;
}

bool RestartSupervisor::is_circuit_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return circuit_open_;
}

int RestartSupervisor::get_attempt_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attempt_count_;
}

RestartSupervisor::Snapshot RestartSupervisor::get_snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = std::chrono::steady_clock::now();

    Snapshot snap;
    snap.supervision_enabled = policy_.enabled;
    snap.attempt_count = attempt_count_;
    snap.max_attempts = policy_.max_attempts;
    snap.circuit_open = circuit_open_;

    if (circuit_open_ || attempt_count_ == 0) {
        snap.next_restart_in_ms = std::nullopt;
    } else if (now >= next_restart_time_) {
        snap.next_restart_in_ms = int64_t{0};
    } else {
        snap.next_restart_in_ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(next_restart_time_ - now).count();
    }

    if (start_time_ != std::chrono::steady_clock::time_point{}) {
        snap.uptime_seconds = std::chrono::duration_cast<std::chrono::seconds>(now - start_time_).count();
    }
    return snap;
}

}  // namespace discovery
}  // namespace ascot
