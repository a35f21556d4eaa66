#include "net/device_http_client.hpp"

#include <httplib.h>

#include <chrono>

#include "logging/logger.hpp"

namespace ascot {
namespace net {

namespace {

// Read and write failures happen after the connection was up, so the device
// may have seen the request; only those can be timeouts. Every other error
// (refused, unreachable, connect timeout, TLS setup) means nothing was sent.
TransportStatus classify_error(httplib::Error err, std::chrono::milliseconds elapsed, int timeout_ms) {
    if (err == httplib::Error::Read || err == httplib::Error::Write) {
        return elapsed.count() + 50 >= timeout_ms ? TransportStatus::TIMEOUT : TransportStatus::IO_ERROR;
    }
    if (err == httplib::Error::Canceled || err == httplib::Error::Compression || err == httplib::Error::Unknown ||
        err == httplib::Error::ExceedRedirectCount) {
        return TransportStatus::IO_ERROR;
    }
    return TransportStatus::CONNECTION_FAILED;
}

}  // namespace

HttpResponse DeviceHttpClient::send(const NetworkEndpoint &endpoint, const HttpRequest &request) {
    HttpResponse response;

    httplib::Client client(endpoint.base_url());
    if (!client.is_valid()) {
        response.transport = TransportStatus::CONNECTION_FAILED;
        response.error = "Unsupported endpoint " + endpoint.base_url();
        return response;
    }

    auto timeout = std::chrono::milliseconds(request.timeout_ms);
    client.set_connection_timeout(timeout);
    client.set_read_timeout(timeout);
    client.set_write_timeout(timeout);

    httplib::Headers headers = {{"Accept", "application/json"}};

    if (request.method != "GET" && request.method != "PUT" && request.method != "POST" &&
        request.method != "DELETE") {
        response.transport = TransportStatus::CONNECTION_FAILED;
        response.error = "Unsupported method " + request.method;
        return response;
    }

    auto start = std::chrono::steady_clock::now();
    auto result = [&]() {
        if (request.method == "GET") {
            return client.Get(request.path, headers);
        }
        if (request.method == "PUT") {
            return client.Put(request.path, headers, request.body, request.content_type);
        }
        if (request.method == "POST") {
            return client.Post(request.path, headers, request.body, request.content_type);
        }
        return client.Delete(request.path, headers, request.body, request.content_type);
    }();
    auto elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    if (!result) {
        auto err = result.error();
        response.transport = classify_error(err, elapsed, request.timeout_ms);
        response.error = httplib::to_string(err);
        LOG_DEBUG("[HttpClient] " << request.method << " " << endpoint.base_url() << request.path
                                  << " failed: " << response.error << " after " << elapsed.count() << "ms");
        return response;
    }

    response.status = result->status;
    response.body = result->body;
    return response;
}

}  // namespace net
}  // namespace ascot
