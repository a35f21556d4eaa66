#pragma once

#include <memory>
#include <string>

#include "discovery/browse_process.hpp"
#include "discovery/discovery_config.hpp"
#include "discovery/i_discovery_transport.hpp"

namespace ascot {
namespace discovery {

/**
 * @brief Browse transport backed by `avahi-browse --parsable --resolve`
 *
 * Requires avahi-daemon on the host. Lines avahi-browse prints that are
 * not browse records are skipped.
 */
class AvahiBrowseTransport : public IDiscoveryTransport {
public:
    explicit AvahiBrowseTransport(const DiscoveryConfig &config);
    ~AvahiBrowseTransport() override;

    bool start() override;
    void stop() override;
    bool is_running() const override;
    PollResult poll(BrowseRecord &record, int timeout_ms) override;
    const std::string &last_error() const override { return error_; }

private:
    DiscoveryConfig config_;
    std::unique_ptr<BrowseProcess> process_;
    std::string error_;
};

}  // namespace discovery
}  // namespace ascot
