#ifndef ASCOT_CONTROL_COMMAND_DISPATCHER_HPP
#define ASCOT_CONTROL_COMMAND_DISPATCHER_HPP

#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "manifest/manifest.hpp"
#include "net/i_device_http_client.hpp"
#include "registry/device_registry.hpp"

namespace ascot {
namespace control {

// Command request - one operator action against one device
struct CommandRequest {
    std::string device;  // device identity
    std::string action;
    std::map<std::string, manifest::ArgValue> args;
    bool hazards_acknowledged = false;  // operator confirmed the action's hazards
};

enum class DispatchError {
    NONE,
    UNKNOWN_DEVICE,
    CAPABILITIES_UNKNOWN,
    UNKNOWN_ACTION,
    INVALID_ARGUMENT,
    HAZARD_NOT_ACKNOWLEDGED,
    TIMEOUT,
    CONNECTION_FAILED,
    DEVICE_ERROR,
    PROTOCOL_ERROR
};

enum class ErrorCategory { NONE, TRANSPORT, PROTOCOL, VALIDATION, POLICY };

const char *dispatch_error_to_string(DispatchError error);
const char *error_category_to_string(ErrorCategory category);
ErrorCategory category_of(DispatchError error);

// Command outcome - never thrown, always returned
struct CommandOutcome {
    bool success = false;
    DispatchError error = DispatchError::NONE;
    ErrorCategory category = ErrorCategory::NONE;
    std::string error_message;
    std::string invalid_argument;  // offending parameter for INVALID_ARGUMENT

    std::vector<manifest::HazardTag> hazards;  // hazards of the requested action
    bool hazards_acknowledged = false;

    int http_status = 0;       // 0 if the device never answered
    nlohmann::json payload;    // parsed response body on success (null if empty)
    bool network_attempted = false;
};

struct DispatchConfig {
    int timeout_ms = 5000;
};

/**
 * @brief Validates commands against cached manifests and forwards them to devices
 *
 * Thread Safety:
 * - Commands to the same device are serialized by a per-device mutex
 * - Commands to different devices run concurrently
 * - Works on a record copy; no registry lock is held across network I/O
 */
class CommandDispatcher {
public:
    CommandDispatcher(registry::DeviceRegistry &registry, net::IDeviceHttpClient &http_client,
                      const DispatchConfig &config = DispatchConfig{});

    CommandOutcome dispatch(const CommandRequest &request);

    // Lookup, argument and hazard checks only (no network)
    bool validate(const CommandRequest &request, CommandOutcome &outcome) const;

    // Hazards the operator must acknowledge before dispatching this action.
    // Empty when the device or action is unknown.
    std::vector<manifest::HazardTag> hazards_for(const std::string &identity, const std::string &action) const;

    // Devices with a command queued or in flight
    size_t busy_device_count() const;

private:
    struct DeviceLock {
        std::mutex mutex;
        size_t users = 0;
    };

    struct Prepared {
        registry::DeviceRecord record;
        const manifest::ActionSchema *action = nullptr;  // points into record.manifest
        nlohmann::json body;
    };

    bool prepare(const CommandRequest &request, Prepared &prepared, CommandOutcome &outcome) const;
    bool validate_arguments(const manifest::ActionSchema &action,
                            const std::map<std::string, manifest::ArgValue> &args, nlohmann::json &body,
                            CommandOutcome &outcome) const;
    void interpret_response(const net::HttpResponse &response, const Prepared &prepared,
                            CommandOutcome &outcome);

    static void fail(CommandOutcome &outcome, DispatchError error, const std::string &message);

    DeviceLock &acquire_device_lock(const std::string &identity);
    void release_device_lock(const std::string &identity);

    registry::DeviceRegistry &registry_;
    net::IDeviceHttpClient &http_client_;
    const DispatchConfig config_;

    // Per-device mutexes, held only while a command for the device is pending
    std::map<std::string, std::unique_ptr<DeviceLock>> device_locks_;
    mutable std::mutex map_mutex_;  // Protects device_locks_ map access
};

}  // namespace control
}  // namespace ascot

#endif  // ASCOT_CONTROL_COMMAND_DISPATCHER_HPP
