#pragma once

#include <cstdint>
#include <string>

namespace ascot {
namespace net {

/**
 * @brief Where a device answers HTTP, as resolved from discovery.
 */
struct NetworkEndpoint {
    std::string scheme = "http";
    std::string host;
    uint16_t port = 80;

    // scheme://host:port, IPv6 literals bracketed
    std::string base_url() const {
        std::string url = scheme + "://";
        if (host.find(':') != std::string::npos) {
            url += "[" + host + "]";
        } else {
            url += host;
        }
        url += ":" + std::to_string(port);
        return url;
    }

    bool valid() const { return !host.empty() && port != 0 && !scheme.empty(); }
};

inline bool operator==(const NetworkEndpoint &a, const NetworkEndpoint &b) {
    return a.scheme == b.scheme && a.host == b.host && a.port == b.port;
}

inline bool operator!=(const NetworkEndpoint &a, const NetworkEndpoint &b) { return !(a == b); }

}  // namespace net
}  // namespace ascot
