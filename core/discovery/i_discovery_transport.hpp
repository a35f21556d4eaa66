#pragma once

#include <cstdint>
#include <string>

#include "discovery/device_identity.hpp"

namespace ascot {
namespace discovery {

/**
 * @brief One raw observation from the browse transport
 *
 * ADDED and REMOVED carry only the service key fields; RESOLVED also
 * carries host, address, port and TXT properties. A service is reported
 * once per (interface, protocol) pair.
 */
struct BrowseRecord {
    enum class Kind { ADDED, REMOVED, RESOLVED };

    Kind kind = Kind::ADDED;
    std::string interface_name;
    std::string protocol;  // "IPv4" or "IPv6"
    std::string service_name;
    std::string service_type;
    std::string domain;
    std::string host_name;
    std::string address;
    uint16_t port = 0;
    ServiceMetadata txt;
};

/**
 * @brief Source of browse records for the DiscoveryListener
 *
 * Called from the listener thread only. After poll() reports FAILED the
 * listener calls stop() and may start() the transport again later.
 */
class IDiscoveryTransport {
public:
    enum class PollResult { RECORD, TIMEOUT, FAILED };

    virtual ~IDiscoveryTransport() = default;

    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool is_running() const = 0;

    // Wait up to timeout_ms for the next record
    virtual PollResult poll(BrowseRecord &record, int timeout_ms) = 0;

    virtual const std::string &last_error() const = 0;
};

}  // namespace discovery
}  // namespace ascot
