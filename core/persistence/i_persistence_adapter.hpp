#pragma once

#include <string>
#include <vector>

#include "discovery/device_identity.hpp"
#include "net/network_endpoint.hpp"

namespace ascot {
namespace persistence {

// Device remembered across gateway restarts
struct KnownDevice {
    discovery::DeviceIdentity identity;
    net::NetworkEndpoint endpoint;
};

/**
 * @brief Storage contract the registry relies on
 *
 * Implementations may block; the registry only reaches them through a
 * PersistenceWriter thread, except for the startup load.
 */
class IPersistenceAdapter {
public:
    virtual ~IPersistenceAdapter() = default;

    virtual bool load_known_devices(std::vector<KnownDevice> &devices, std::string &error) = 0;
    virtual bool save_device(const discovery::DeviceIdentity &identity, const net::NetworkEndpoint &endpoint,
                             std::string &error) = 0;
    virtual bool delete_device(const discovery::DeviceIdentity &identity, std::string &error) = 0;
};

}  // namespace persistence
}  // namespace ascot
