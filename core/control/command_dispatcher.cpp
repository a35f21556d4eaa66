#include "control/command_dispatcher.hpp"

#include "logging/logger.hpp"

namespace ascot {
namespace control {

const char *dispatch_error_to_string(DispatchError error) {
    switch (error) {
        case DispatchError::NONE:
            return "none";
        case DispatchError::UNKNOWN_DEVICE:
            return "unknown_device";
        case DispatchError::CAPABILITIES_UNKNOWN:
            return "capabilities_unknown";
        case DispatchError::UNKNOWN_ACTION:
            return "unknown_action";
        case DispatchError::INVALID_ARGUMENT:
            return "invalid_argument";
        case DispatchError::HAZARD_NOT_ACKNOWLEDGED:
            return "hazard_not_acknowledged";
        case DispatchError::TIMEOUT:
            return "timeout";
        case DispatchError::CONNECTION_FAILED:
            return "connection_failed";
        case DispatchError::DEVICE_ERROR:
            return "device_error";
        case DispatchError::PROTOCOL_ERROR:
            return "protocol_error";
        default:
            return "unknown";
    }
}

const char *error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:
            return "none";
        case ErrorCategory::TRANSPORT:
            return "transport";
        case ErrorCategory::PROTOCOL:
            return "protocol";
        case ErrorCategory::VALIDATION:
            return "validation";
        case ErrorCategory::POLICY:
            return "policy";
        default:
            return "unknown";
    }
}

ErrorCategory category_of(DispatchError error) {
    switch (error) {
        case DispatchError::NONE:
            return ErrorCategory::NONE;
        case DispatchError::TIMEOUT:
        case DispatchError::CONNECTION_FAILED:
            return ErrorCategory::TRANSPORT;
        case DispatchError::DEVICE_ERROR:
        case DispatchError::PROTOCOL_ERROR:
            return ErrorCategory::PROTOCOL;
        case DispatchError::INVALID_ARGUMENT:
            return ErrorCategory::VALIDATION;
        case DispatchError::UNKNOWN_DEVICE:
        case DispatchError::CAPABILITIES_UNKNOWN:
        case DispatchError::UNKNOWN_ACTION:
        case DispatchError::HAZARD_NOT_ACKNOWLEDGED:
        default:
            return ErrorCategory::POLICY;
    }
}

namespace {

nlohmann::json arg_to_json(manifest::ParameterType type, const manifest::ArgValue &value) {
    // Integers given for a float parameter are sent as floats
    if (type == manifest::ParameterType::FLOAT) {
        if (auto number = manifest::arg_value_as_double(value)) {
            return *number;
        }
    }
    if (std::holds_alternative<double>(value)) return std::get<double>(value);
    if (std::holds_alternative<int64_t>(value)) return std::get<int64_t>(value);
    if (std::holds_alternative<bool>(value)) return std::get<bool>(value);
    return std::get<std::string>(value);
}

// Structured error text from a device error body, if it carries one
std::string device_error_message(const net::HttpResponse &response) {
    std::string message = "Device returned HTTP " + std::to_string(response.status);
    if (response.body.empty()) {
        return message;
    }
    try {
        auto body = nlohmann::json::parse(response.body);
        if (body.is_object()) {
            for (const char *key : {"error", "message"}) {
                auto it = body.find(key);
                if (it != body.end() && it->is_string()) {
                    return message + ": " + it->get<std::string>();
                }
            }
        }
    } catch (const nlohmann::json::parse_error &) {
        // Plain-text error body
        constexpr size_t kMaxBodyEcho = 200;
        return message + ": " + response.body.substr(0, kMaxBodyEcho);
    }
    return message;
}

}  // namespace

CommandDispatcher::CommandDispatcher(registry::DeviceRegistry &registry, net::IDeviceHttpClient &http_client,
                                     const DispatchConfig &config)
    : registry_(registry), http_client_(http_client), config_(config) {}

void CommandDispatcher::fail(CommandOutcome &outcome, DispatchError error, const std::string &message) {
    outcome.success = false;
    outcome.error = error;
    outcome.category = category_of(error);
    outcome.error_message = message;
}

CommandDispatcher::DeviceLock &CommandDispatcher::acquire_device_lock(const std::string &identity) {
    std::lock_guard<std::mutex> lock(map_mutex_);
    auto &entry = device_locks_[identity];
    if (!entry) {
        entry = std::make_unique<DeviceLock>();
    }
    entry->users++;
    return *entry;
}

void CommandDispatcher::release_device_lock(const std::string &identity) {
    std::lock_guard<std::mutex> lock(map_mutex_);
    auto it = device_locks_.find(identity);
    if (it != device_locks_.end() && --it->second->users == 0) {
        device_locks_.erase(it);
    }
}

size_t CommandDispatcher::busy_device_count() const {
    std::lock_guard<std::mutex> lock(map_mutex_);
    return device_locks_.size();
}

bool CommandDispatcher::validate(const CommandRequest &request, CommandOutcome &outcome) const {
    Prepared prepared;
    return prepare(request, prepared, outcome);
}

std::vector<manifest::HazardTag> CommandDispatcher::hazards_for(const std::string &identity,
                                                                const std::string &action) const {
    auto record = registry_.get(identity);
    if (!record.has_value() || !record->has_manifest()) {
        return {};
    }
    const auto *schema = record->manifest->find_action(action);
    if (schema == nullptr) {
        return {};
    }
    return schema->hazards;
}

bool CommandDispatcher::prepare(const CommandRequest &request, Prepared &prepared, CommandOutcome &outcome) const {
    outcome.hazards_acknowledged = request.hazards_acknowledged;

    auto record = registry_.get(request.device);
    if (!record.has_value()) {
        fail(outcome, DispatchError::UNKNOWN_DEVICE, "Device not found: " + request.device);
        return false;
    }
    prepared.record = std::move(record.value());

    if (!prepared.record.has_manifest()) {
        fail(outcome, DispatchError::CAPABILITIES_UNKNOWN,
             "Capabilities of " + request.device + " are not known yet");
        return false;
    }

    prepared.action = prepared.record.manifest->find_action(request.action);
    if (prepared.action == nullptr) {
        fail(outcome, DispatchError::UNKNOWN_ACTION,
             "Action not found: " + request.action + " on device " + request.device);
        return false;
    }
    outcome.hazards = prepared.action->hazards;

    if (!validate_arguments(*prepared.action, request.args, prepared.body, outcome)) {
        return false;
    }

    if (prepared.action->has_hazards() && !request.hazards_acknowledged) {
        std::string tags;
        for (const auto &hazard : prepared.action->hazards) {
            if (!tags.empty()) {
                tags += ", ";
            }
            tags += hazard.tag;
        }
        fail(outcome, DispatchError::HAZARD_NOT_ACKNOWLEDGED,
             "Action '" + request.action + "' requires acknowledgment of hazards: " + tags);
        return false;
    }

    return true;
}

bool CommandDispatcher::validate_arguments(const manifest::ActionSchema &action,
                                           const std::map<std::string, manifest::ArgValue> &args,
                                           nlohmann::json &body, CommandOutcome &outcome) const {
    body = nlohmann::json::object();

    // Declared parameters first, in declaration order
    for (const auto &param : action.parameters) {
        auto it = args.find(param.name);
        if (it == args.end()) {
            if (param.default_value.has_value()) {
                body[param.name] = arg_to_json(param.type, *param.default_value);
                continue;
            }
            if (param.required) {
                outcome.invalid_argument = param.name;
                fail(outcome, DispatchError::INVALID_ARGUMENT, "Missing required argument: " + param.name);
                return false;
            }
            continue;
        }

        std::string reason;
        if (!manifest::validate_value(param, it->second, reason)) {
            outcome.invalid_argument = param.name;
            fail(outcome, DispatchError::INVALID_ARGUMENT, "Argument '" + param.name + "': " + reason);
            return false;
        }
        body[param.name] = arg_to_json(param.type, it->second);
    }

    // Then anything the action does not declare (args is ordered by name)
    for (const auto &[name, value] : args) {
        static_cast<void>(value);
        if (action.find_parameter(name) == nullptr) {
            outcome.invalid_argument = name;
            fail(outcome, DispatchError::INVALID_ARGUMENT, "Unknown argument: " + name);
            return false;
        }
    }

    return true;
}

CommandOutcome CommandDispatcher::dispatch(const CommandRequest &request) {
    CommandOutcome outcome;

    Prepared prepared;
    if (!prepare(request, prepared, outcome)) {
        LOG_WARN("[Dispatcher] Rejected " << request.device << "/" << request.action << ": "
                                          << outcome.error_message);
        return outcome;
    }

    net::HttpRequest http_request;
    http_request.method = manifest::http_method_to_string(prepared.action->method);
    http_request.path = prepared.action->path;
    http_request.body = prepared.body.dump();
    http_request.timeout_ms = config_.timeout_ms;

    // Per-device serialization; IDeviceHttpClient::send() does not throw
    net::HttpResponse response;
    DeviceLock &device = acquire_device_lock(request.device);
    {
        std::lock_guard<std::mutex> lock(device.mutex);

        outcome.network_attempted = true;
        response = http_client_.send(prepared.record.endpoint, http_request);
        if (response.transport == net::TransportStatus::CONNECTION_FAILED) {
            // Nothing reached the device, so one retry cannot double-apply the command
            LOG_DEBUG("[Dispatcher] Connection to " << request.device << " failed, retrying once");
            response = http_client_.send(prepared.record.endpoint, http_request);
        }
    }
    release_device_lock(request.device);

    interpret_response(response, prepared, outcome);
    return outcome;
}

void CommandDispatcher::interpret_response(const net::HttpResponse &response, const Prepared &prepared,
                                           CommandOutcome &outcome) {
    const auto &identity = prepared.record.identity;
    const auto epoch = prepared.record.epoch;
    const std::string target = identity + "/" + prepared.action->name;

    if (!response.delivered()) {
        if (response.transport == net::TransportStatus::TIMEOUT) {
            fail(outcome, DispatchError::TIMEOUT, "Device did not answer within " +
                                                      std::to_string(config_.timeout_ms) + "ms");
        } else {
            fail(outcome, DispatchError::CONNECTION_FAILED,
                 std::string("Device unreachable (") + net::transport_status_to_string(response.transport) +
                     "): " + response.error);
        }
        LOG_ERROR("[Dispatcher] " << target << " failed: " << outcome.error_message);
        registry_.mark_health(identity, registry::HealthOutcome::FAILURE, epoch);
        return;
    }

    outcome.http_status = response.status;

    if (response.is_success()) {
        if (response.body.empty()) {
            outcome.payload = nullptr;
        } else {
            try {
                outcome.payload = nlohmann::json::parse(response.body);
            } catch (const nlohmann::json::parse_error &e) {
                fail(outcome, DispatchError::PROTOCOL_ERROR,
                     std::string("Device response is not valid JSON: ") + e.what());
                LOG_ERROR("[Dispatcher] " << target << ": " << outcome.error_message);
                registry_.mark_health(identity, registry::HealthOutcome::PROTOCOL_ERROR, epoch);
                return;
            }
        }
        outcome.success = true;
        outcome.error = DispatchError::NONE;
        outcome.category = ErrorCategory::NONE;
        LOG_INFO("[Dispatcher] " << target << " succeeded (HTTP " << response.status << ")");
        registry_.mark_health(identity, registry::HealthOutcome::SUCCESS, epoch);
        return;
    }

    fail(outcome, DispatchError::DEVICE_ERROR, device_error_message(response));
    LOG_WARN("[Dispatcher] " << target << ": " << outcome.error_message);
    if (response.is_client_error()) {
        // The device answered and rejected the command
        registry_.mark_health(identity, registry::HealthOutcome::SUCCESS, epoch);
    } else {
        registry_.mark_health(identity, registry::HealthOutcome::FAILURE, epoch);
    }
}

}  // namespace control
}  // namespace ascot
