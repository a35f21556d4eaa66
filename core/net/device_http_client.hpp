#pragma once

#include "net/i_device_http_client.hpp"

namespace ascot {
namespace net {

/**
 * @brief cpp-httplib backed device client
 *
 * One httplib::Client per request; device traffic is sparse and endpoints
 * move between requests, so connections are not pooled.
 */
class DeviceHttpClient : public IDeviceHttpClient {
public:
    DeviceHttpClient() = default;

    HttpResponse send(const NetworkEndpoint &endpoint, const HttpRequest &request) override;
};

}  // namespace net
}  // namespace ascot
