#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

#include "discovery/i_discovery_transport.hpp"

namespace ascot::tests {

using namespace ascot;

// Scripted browse transport: tests push records and failures, the listener polls them
class FakeDiscoveryTransport : public discovery::IDiscoveryTransport {
public:
    bool start() override {
        std::lock_guard<std::mutex> lock(mutex_);
        start_calls_++;
        if (fail_starts_ > 0) {
            fail_starts_--;
            error_ = "start refused";
            return false;
        }
        running_ = true;
        return true;
    }

    void stop() override {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
        stop_calls_++;
    }

    bool is_running() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return running_;
    }

    PollResult poll(discovery::BrowseRecord &record, int timeout_ms) override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] { return !script_.empty(); });
        if (script_.empty()) {
            return PollResult::TIMEOUT;
        }
        Step step = script_.front();
        script_.pop_front();
        if (step.fail) {
            error_ = "browse process exited";
            return PollResult::FAILED;
        }
        record = step.record;
        return PollResult::RECORD;
    }

    const std::string &last_error() const override { return error_; }

    void push(const discovery::BrowseRecord &record) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            script_.push_back(Step{false, record});
        }
        cv_.notify_all();
    }

    void push_failure() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            script_.push_back(Step{true, {}});
        }
        cv_.notify_all();
    }

    void fail_next_starts(int count) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_starts_ = count;
    }

    int start_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return start_calls_;
    }

    int stop_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stop_calls_;
    }

    size_t remaining() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return script_.size();
    }

private:
    struct Step {
        bool fail = false;
        discovery::BrowseRecord record;
    };

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Step> script_;
    bool running_ = false;
    int start_calls_ = 0;
    int stop_calls_ = 0;
    int fail_starts_ = 0;
    std::string error_;
};

// Resolved record for the default test service type
inline discovery::BrowseRecord resolved_record(const std::string &name, const std::string &address, uint16_t port,
                                               const std::string &iface = "eth0", const std::string &protocol = "IPv4",
                                               const discovery::ServiceMetadata &txt = {}) {
    discovery::BrowseRecord record;
    record.kind = discovery::BrowseRecord::Kind::RESOLVED;
    record.interface_name = iface;
    record.protocol = protocol;
    record.service_name = name;
    record.service_type = "_ascot._tcp";
    record.domain = "local";
    record.host_name = name + ".local";
    record.address = address;
    record.port = port;
    record.txt = txt;
    return record;
}

inline discovery::BrowseRecord removed_record(const std::string &name, const std::string &iface = "eth0",
                                              const std::string &protocol = "IPv4") {
    discovery::BrowseRecord record;
    record.kind = discovery::BrowseRecord::Kind::REMOVED;
    record.interface_name = iface;
    record.protocol = protocol;
    record.service_name = name;
    record.service_type = "_ascot._tcp";
    record.domain = "local";
    return record;
}

// Poll until pred() holds or timeout_ms elapses
template <typename Pred>
bool wait_until(Pred pred, int timeout_ms = 2000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

}  // namespace ascot::tests
