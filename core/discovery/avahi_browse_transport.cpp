#include "discovery/avahi_browse_transport.hpp"

#include <chrono>
#include <vector>

#include "discovery/avahi_browse_parser.hpp"
#include "logging/logger.hpp"

namespace ascot {
namespace discovery {

AvahiBrowseTransport::AvahiBrowseTransport(const DiscoveryConfig &config) : config_(config) {}

AvahiBrowseTransport::~AvahiBrowseTransport() { stop(); }

bool AvahiBrowseTransport::start() {
    stop();
    error_.clear();

    std::vector<std::string> argv = {config_.browse_command, "--parsable", "--resolve", "--no-db-lookup",
                                     config_.service_type};
    process_ = std::make_unique<BrowseProcess>(argv);
    if (!process_->spawn()) {
        error_ = process_->last_error();
        process_.reset();
        return false;
    }
    return true;
}

void AvahiBrowseTransport::stop() {
    if (process_) {
        process_->shutdown();
        process_.reset();
    }
}

bool AvahiBrowseTransport::is_running() const { return process_ != nullptr; }

IDiscoveryTransport::PollResult AvahiBrowseTransport::poll(BrowseRecord &record, int timeout_ms) {
    if (!process_) {
        error_ = "Transport not started";
        return PollResult::FAILED;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (true) {
        auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
        if (remaining < 0) remaining = 0;

        std::string line;
        switch (process_->read_line(line, static_cast<int>(remaining))) {
            case BrowseProcess::ReadResult::LINE: {
                std::string parse_error;
                if (parse_browse_line(line, record, parse_error)) {
                    return PollResult::RECORD;
                }
                LOG_DEBUG("[Discovery] Skipping browse output '" << line << "': " << parse_error);
                if (remaining == 0) {
                    return PollResult::TIMEOUT;
                }
                break;
            }
            case BrowseProcess::ReadResult::TIMEOUT:
                return PollResult::TIMEOUT;
            case BrowseProcess::ReadResult::CLOSED:
            case BrowseProcess::ReadResult::ERROR:
                error_ = process_->last_error();
                return PollResult::FAILED;
        }
    }
}

}  // namespace discovery
}  // namespace ascot
