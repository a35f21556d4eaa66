#pragma once

#include <string>

#include "discovery/device_identity.hpp"
#include "manifest/manifest.hpp"
#include "net/i_device_http_client.hpp"

namespace ascot {
namespace resolver {

struct ResolverConfig {
    std::string manifest_path = "/.well-known/ascot";  // overridden per device by the TXT "path" property
    int timeout_ms = 3000;                             // Per-attempt HTTP timeout
    int max_retries = 3;                               // Retries after the first attempt
    int backoff_initial_ms = 200;                      // Doubles per retry
    int backoff_max_ms = 2000;
    int workers = 4;                      // Concurrent resolves
    int refresh_interval_ms = 60000;      // Re-resolve cadence for stale or unresolved devices (0 = off)
};

enum class ResolveError { NONE, TIMEOUT, CONNECTION_FAILED, MALFORMED_MANIFEST, UNREACHABLE };

const char *resolve_error_to_string(ResolveError error);

struct ResolveResult {
    bool success = false;
    ResolveError error = ResolveError::NONE;
    std::string error_message;
    manifest::ManifestPtr manifest;
    int attempts = 0;
};

/**
 * @brief Fetches and validates a device manifest
 *
 * Transient failures (timeout, connection failure, HTTP 5xx) are retried
 * with exponential backoff. A malformed document or an HTTP 4xx ends the
 * resolve immediately. Never throws.
 */
class CapabilityResolver {
public:
    CapabilityResolver(net::IDeviceHttpClient &client, const ResolverConfig &config);

    /**
     * @param manifest_path Device-specific path; empty uses the configured default
     */
    ResolveResult resolve(const discovery::DeviceIdentity &identity, const net::NetworkEndpoint &endpoint,
                          const std::string &manifest_path = "") const;

    const ResolverConfig &config() const { return config_; }

private:
    int backoff_for_retry(int retry) const;

    net::IDeviceHttpClient &client_;
    ResolverConfig config_;
};

}  // namespace resolver
}  // namespace ascot
