#pragma once

#include <string>

#include "net/network_endpoint.hpp"

namespace ascot {
namespace net {

/**
 * @brief Transport-level result of a device request
 *
 * CONNECTION_FAILED: no connection was established; the request never reached the device
 * IO_ERROR: the connection broke after it was established; the device may have acted
 * TIMEOUT: the device did not answer within the request timeout
 */
enum class TransportStatus { OK, TIMEOUT, CONNECTION_FAILED, IO_ERROR };

inline const char *transport_status_to_string(TransportStatus status) {
    switch (status) {
        case TransportStatus::OK:
            return "ok";
        case TransportStatus::TIMEOUT:
            return "timeout";
        case TransportStatus::CONNECTION_FAILED:
            return "connection_failed";
        case TransportStatus::IO_ERROR:
            return "io_error";
        default:
            return "unknown";
    }
}

struct HttpRequest {
    std::string method = "GET";
    std::string path;
    std::string body;
    std::string content_type = "application/json";
    int timeout_ms = 3000;
};

struct HttpResponse {
    TransportStatus transport = TransportStatus::OK;
    int status = 0;
    std::string body;
    std::string error;  // transport error description

    bool delivered() const { return transport == TransportStatus::OK; }
    bool is_success() const { return delivered() && status >= 200 && status < 300; }
    bool is_client_error() const { return delivered() && status >= 400 && status < 500; }
    bool is_server_error() const { return delivered() && status >= 500; }
};

/**
 * @brief Outbound HTTP to devices
 *
 * Implementations must honor HttpRequest::timeout_ms and never throw.
 * Safe to call from several threads at once.
 */
class IDeviceHttpClient {
public:
    virtual ~IDeviceHttpClient() = default;

    virtual HttpResponse send(const NetworkEndpoint &endpoint, const HttpRequest &request) = 0;
};

}  // namespace net
}  // namespace ascot
