#include "resolver/capability_resolver.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

#include "logging/logger.hpp"
#include "manifest/manifest_codec.hpp"

namespace ascot {
namespace resolver {

const char *resolve_error_to_string(ResolveError error) {
    switch (error) {
        case ResolveError::NONE:
            return "none";
        case ResolveError::TIMEOUT:
            return "timeout";
        case ResolveError::CONNECTION_FAILED:
            return "connection_failed";
        case ResolveError::MALFORMED_MANIFEST:
            return "malformed_manifest";
        case ResolveError::UNREACHABLE:
            return "unreachable";
        default:
            return "unknown";
    }
}

CapabilityResolver::CapabilityResolver(net::IDeviceHttpClient &client, const ResolverConfig &config)
    : client_(client), config_(config) {}

int CapabilityResolver::backoff_for_retry(int retry) const {
    long long delay = config_.backoff_initial_ms;
    for (int i = 1; i < retry && delay < config_.backoff_max_ms; ++i) {
        delay *= 2;
    }
    return static_cast<int>(std::min<long long>(delay, config_.backoff_max_ms));
}

ResolveResult CapabilityResolver::resolve(const discovery::DeviceIdentity &identity,
                                          const net::NetworkEndpoint &endpoint,
                                          const std::string &manifest_path) const {
    ResolveResult result;

    net::HttpRequest request;
    request.method = "GET";
    request.path = manifest_path.empty() ? config_.manifest_path : manifest_path;
    if (request.path.empty() || request.path.front() != '/') {
        request.path.insert(request.path.begin(), '/');
    }
    request.timeout_ms = config_.timeout_ms;

    const int max_attempts = 1 + std::max(0, config_.max_retries);
    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        if (attempt > 1) {
            int delay = backoff_for_retry(attempt - 1);
            LOG_DEBUG("[Resolver] " << identity << ": retry " << (attempt - 1) << " in " << delay << "ms");
            std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        }
        result.attempts = attempt;

        net::HttpResponse response = client_.send(endpoint, request);

        if (!response.delivered()) {
            result.error = response.transport == net::TransportStatus::TIMEOUT ? ResolveError::TIMEOUT
                                                                               : ResolveError::CONNECTION_FAILED;
            result.error_message = std::string("GET ") + endpoint.base_url() + request.path + ": " +
                                   net::transport_status_to_string(response.transport) +
                                   (response.error.empty() ? "" : " (" + response.error + ")");
            LOG_DEBUG("[Resolver] " << identity << ": " << result.error_message);
            continue;
        }

        if (response.is_server_error()) {
            result.error = ResolveError::UNREACHABLE;
            result.error_message = "Device returned HTTP " + std::to_string(response.status);
            LOG_DEBUG("[Resolver] " << identity << ": " << result.error_message);
            continue;
        }

        if (!response.is_success()) {
            result.error = ResolveError::UNREACHABLE;
            result.error_message = "Device returned HTTP " + std::to_string(response.status) + " for " +
                                   request.path;
            LOG_WARN("[Resolver] " << identity << ": " << result.error_message);
            return result;
        }

        manifest::Manifest parsed;
        std::string parse_error;
        if (!manifest::parse_manifest(response.body, identity, parsed, parse_error)) {
            result.error = ResolveError::MALFORMED_MANIFEST;
            result.error_message = parse_error;
            LOG_WARN("[Resolver] " << identity << ": malformed manifest: " << parse_error);
            return result;
        }

        result.success = true;
        result.error = ResolveError::NONE;
        result.error_message.clear();
        result.manifest = std::make_shared<const manifest::Manifest>(std::move(parsed));
        LOG_INFO("[Resolver] " << identity << ": " << result.manifest->actions.size() << " actions from "
                               << endpoint.base_url() << request.path);
        return result;
    }

    LOG_WARN("[Resolver] " << identity << ": giving up after " << result.attempts
                           << " attempts: " << result.error_message);
    return result;
}

}  // namespace resolver
}  // namespace ascot
