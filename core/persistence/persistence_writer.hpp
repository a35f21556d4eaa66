#pragma once

/**
 * @file persistence_writer.hpp
 * @brief Fire-and-forget persistence side channel for the registry
 *
 * Registry operations enqueue saves and deletes and return immediately.
 * A background thread applies them to the IPersistenceAdapter in order.
 * Adapter failures are counted and logged (rate-limited); they never
 * reach the registry.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "persistence/i_persistence_adapter.hpp"

namespace ascot {
namespace persistence {

class PersistenceWriter {
public:
    /**
     * @param adapter Storage backend
     * @param max_queue_size Pending operations kept before the oldest is dropped
     */
    explicit PersistenceWriter(std::shared_ptr<IPersistenceAdapter> adapter, size_t max_queue_size = 1024);
    ~PersistenceWriter();

    PersistenceWriter(const PersistenceWriter &) = delete;
    PersistenceWriter &operator=(const PersistenceWriter &) = delete;

    bool start();

    /**
     * @brief Apply pending operations, then stop the worker
     */
    void stop();

    bool is_running() const { return running_.load(); }

    void enqueue_save(const discovery::DeviceIdentity &identity, const net::NetworkEndpoint &endpoint);
    void enqueue_delete(const discovery::DeviceIdentity &identity);

    /**
     * @brief Wait until the queue is drained (or timeout)
     *
     * @return true if nothing is pending
     */
    bool flush(int timeout_ms);

    size_t pending() const;
    size_t total_written() const { return total_written_.load(); }
    size_t total_failed() const { return total_failed_.load(); }
    size_t total_dropped() const { return total_dropped_.load(); }

private:
    struct Operation {
        enum class Kind { SAVE, DELETE };
        Kind kind;
        discovery::DeviceIdentity identity;
        net::NetworkEndpoint endpoint;
    };

    void enqueue(Operation op);
    void write_loop();
    void apply(const Operation &op);

    std::shared_ptr<IPersistenceAdapter> adapter_;
    const size_t max_queue_size_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable drained_cv_;
    std::deque<Operation> queue_;
    bool in_progress_ = false;

    std::atomic<bool> running_{false};
    std::thread thread_;

    std::atomic<size_t> total_written_{0};
    std::atomic<size_t> total_failed_{0};
    std::atomic<size_t> total_dropped_{0};

    // Last failure log time for rate-limited logging
    std::chrono::steady_clock::time_point last_error_log_;
};

}  // namespace persistence
}  // namespace ascot
