#include "persistence/persistence_writer.hpp"

#include "logging/logger.hpp"

namespace ascot {
namespace persistence {

PersistenceWriter::PersistenceWriter(std::shared_ptr<IPersistenceAdapter> adapter, size_t max_queue_size)
    : adapter_(std::move(adapter)), max_queue_size_(max_queue_size) {}

PersistenceWriter::~PersistenceWriter() { stop(); }

bool PersistenceWriter::start() {
    if (running_.load()) {
        LOG_WARN("[Persistence] Writer already running");
        return false;
    }
    if (!adapter_) {
        LOG_ERROR("[Persistence] No adapter configured");
        return false;
    }
    running_.store(true);
    thread_ = std::thread(&PersistenceWriter::write_loop, this);
    return true;
}

void PersistenceWriter::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    LOG_INFO("[Persistence] Writer stopped. Written: " << total_written_.load() << ", Failed: "
                                                       << total_failed_.load());
}

void PersistenceWriter::enqueue_save(const discovery::DeviceIdentity &identity, const net::NetworkEndpoint &endpoint) {
    enqueue(Operation{Operation::Kind::SAVE, identity, endpoint});
}

void PersistenceWriter::enqueue_delete(const discovery::DeviceIdentity &identity) {
    enqueue(Operation{Operation::Kind::DELETE, identity, {}});
}

void PersistenceWriter::enqueue(Operation op) {
    bool dropped = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.size() >= max_queue_size_) {
            queue_.pop_front();
            dropped = true;
        }
        queue_.push_back(std::move(op));
    }
    cv_.notify_one();

    if (dropped && total_dropped_.fetch_add(1) % 100 == 0) {
        LOG_WARN("[Persistence] Queue full, dropped " << total_dropped_.load() << " operations total");
    }
}

bool PersistenceWriter::flush(int timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    return drained_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                                [this] { return queue_.empty() && !in_progress_; });
}

size_t PersistenceWriter::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void PersistenceWriter::write_loop() {
    while (true) {
        Operation op;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || !running_.load(); });
            if (queue_.empty()) {
                // Stopped and drained
                break;
            }
            op = std::move(queue_.front());
            queue_.pop_front();
            in_progress_ = true;
        }

        apply(op);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            in_progress_ = false;
        }
        drained_cv_.notify_all();
    }
    drained_cv_.notify_all();
}

void PersistenceWriter::apply(const Operation &op) {
    std::string error;
    bool ok = op.kind == Operation::Kind::SAVE ? adapter_->save_device(op.identity, op.endpoint, error)
                                               : adapter_->delete_device(op.identity, error);
    if (ok) {
        total_written_.fetch_add(1);
        return;
    }

    total_failed_.fetch_add(1);
    auto now = std::chrono::steady_clock::now();
    if (std::chrono::duration_cast<std::chrono::seconds>(now - last_error_log_).count() >= 10) {
        LOG_WARN("[Persistence] " << (op.kind == Operation::Kind::SAVE ? "Save" : "Delete") << " of " << op.identity
                                  << " failed: " << error << " (" << total_failed_.load() << " failures total)");
        last_error_log_ = now;
    }
}

}  // namespace persistence
}  // namespace ascot
