#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "discovery/discovery_config.hpp"

namespace ascot {
namespace discovery {

// RestartSupervisor decides when a failed background component may be
// restarted. Implements a fixed backoff schedule and a circuit breaker.
class RestartSupervisor {
public:
    struct Snapshot {
        bool supervision_enabled = false;
        int attempt_count = 0;
        int max_attempts = 0;
        bool circuit_open = false;
        std::optional<int64_t> next_restart_in_ms;  // nullopt: healthy or circuit open
        int64_t uptime_seconds = 0;                 // 0 before first heartbeat
    };

    RestartSupervisor(const std::string &name, const RestartPolicyConfig &policy);

    // True if a restart is allowed and the backoff delay has elapsed
    bool should_restart() const;

    // Backoff delay scheduled for the current attempt, 0 if none
    int get_backoff_ms() const;

    // Record a failure; returns false once max attempts are exceeded (circuit opens)
    bool record_crash();

    // Reset attempts and close the circuit
    void record_success();

    // Called while the component runs; starts the uptime window on the first call
    void record_heartbeat();

    // True once the component has run for success_reset_ms after a restart
    bool should_mark_recovered() const;

    bool is_circuit_open() const;
    int get_attempt_count() const;
    Snapshot get_snapshot() const;

private:
    const std::string name_;
    const RestartPolicyConfig policy_;

    mutable std::mutex mutex_;
    int attempt_count_ = 0;
    bool circuit_open_ = false;
    std::chrono::steady_clock::time_point next_restart_time_;
    std::chrono::steady_clock::time_point start_time_;  // zero until first heartbeat after (re)start
};

}  // namespace discovery
}  // namespace ascot
