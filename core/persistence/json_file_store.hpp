#pragma once

#include <map>
#include <mutex>
#include <string>

#include "persistence/i_persistence_adapter.hpp"

namespace ascot {
namespace persistence {

/**
 * @brief Known devices in a single JSON document
 *
 *   {"version": 1, "devices": [{"identity": "...", "scheme": "http",
 *                               "host": "192.168.1.20", "port": 8080}]}
 *
 * Every change rewrites the whole file through a temporary file and
 * rename(), so a crash never leaves a truncated document. A missing file
 * is an empty store.
 */
class JsonFileStore : public IPersistenceAdapter {
public:
    explicit JsonFileStore(const std::string &path);

    bool load_known_devices(std::vector<KnownDevice> &devices, std::string &error) override;
    bool save_device(const discovery::DeviceIdentity &identity, const net::NetworkEndpoint &endpoint,
                     std::string &error) override;
    bool delete_device(const discovery::DeviceIdentity &identity, std::string &error) override;

    const std::string &path() const { return path_; }

private:
    bool ensure_loaded(std::string &error);
    bool read_file(std::map<discovery::DeviceIdentity, net::NetworkEndpoint> &devices, std::string &error) const;
    bool write_file(std::string &error) const;

    const std::string path_;
    std::mutex mutex_;
    bool loaded_ = false;
    std::map<discovery::DeviceIdentity, net::NetworkEndpoint> devices_;
};

}  // namespace persistence
}  // namespace ascot
