#include "persistence/json_file_store.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

#include "logging/logger.hpp"

namespace ascot {
namespace persistence {

namespace {
constexpr int kFormatVersion = 1;
}

JsonFileStore::JsonFileStore(const std::string &path) : path_(path) {}

bool JsonFileStore::read_file(std::map<discovery::DeviceIdentity, net::NetworkEndpoint> &devices,
                              std::string &error) const {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return true;
    }

    std::ifstream in(path_);
    if (!in) {
        error = "Cannot open " + path_;
        return false;
    }

    nlohmann::json doc;
    try {
        in >> doc;
    } catch (const nlohmann::json::parse_error &e) {
        error = "Corrupt device store " + path_ + ": " + e.what();
        return false;
    }

    if (!doc.is_object() || !doc.contains("devices") || !doc["devices"].is_array()) {
        error = "Device store " + path_ + " has no 'devices' array";
        return false;
    }

    for (const auto &entry : doc["devices"]) {
        try {
            net::NetworkEndpoint endpoint;
            std::string identity = entry.at("identity").get<std::string>();
            endpoint.scheme = entry.value("scheme", std::string("http"));
            endpoint.host = entry.at("host").get<std::string>();
            int port = entry.at("port").get<int>();
            if (identity.empty() || port <= 0 || port > 65535) {
                LOG_WARN("[Persistence] Skipping invalid device entry in " << path_);
                continue;
            }
            endpoint.port = static_cast<uint16_t>(port);
            devices[identity] = endpoint;
        } catch (const nlohmann::json::exception &e) {
            LOG_WARN("[Persistence] Skipping malformed device entry in " << path_ << ": " << e.what());
        }
    }
    return true;
}

bool JsonFileStore::write_file(std::string &error) const {
    nlohmann::json doc;
    doc["version"] = kFormatVersion;
    doc["devices"] = nlohmann::json::array();
    for (const auto &[identity, endpoint] : devices_) {
        doc["devices"].push_back(
            {{"identity", identity}, {"scheme", endpoint.scheme}, {"host", endpoint.host}, {"port", endpoint.port}});
    }

    std::filesystem::path target(path_);
    std::error_code ec;
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            error = "Cannot create directory " + target.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    std::string tmp_path = path_ + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out) {
            error = "Cannot write " + tmp_path;
            return false;
        }
        out << doc.dump(2) << "\n";
        out.flush();
        if (!out) {
            error = "Write to " + tmp_path + " failed";
            return false;
        }
    }

    std::filesystem::rename(tmp_path, target, ec);
    if (ec) {
        error = "Cannot replace " + path_ + ": " + ec.message();
        std::filesystem::remove(tmp_path, ec);
        return false;
    }
    return true;
}

bool JsonFileStore::ensure_loaded(std::string &error) {
    if (loaded_) {
        return true;
    }
    std::map<discovery::DeviceIdentity, net::NetworkEndpoint> devices;
    if (!read_file(devices, error)) {
        return false;
    }
    devices_ = std::move(devices);
    loaded_ = true;
    return true;
}

bool JsonFileStore::load_known_devices(std::vector<KnownDevice> &devices, std::string &error) {
    std::lock_guard<std::mutex> lock(mutex_);
    loaded_ = false;
    if (!ensure_loaded(error)) {
        return false;
    }
    devices.clear();
    for (const auto &[identity, endpoint] : devices_) {
        devices.push_back(KnownDevice{identity, endpoint});
    }
    return true;
}

bool JsonFileStore::save_device(const discovery::DeviceIdentity &identity, const net::NetworkEndpoint &endpoint,
                                std::string &error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ensure_loaded(error)) {
        return false;
    }
    auto it = devices_.find(identity);
    if (it != devices_.end() && it->second == endpoint) {
        return true;
    }
    devices_[identity] = endpoint;
    return write_file(error);
}

bool JsonFileStore::delete_device(const discovery::DeviceIdentity &identity, std::string &error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ensure_loaded(error)) {
        return false;
    }
    if (devices_.erase(identity) == 0) {
        return true;
    }
    return write_file(error);
}

}  // namespace persistence
}  // namespace ascot
