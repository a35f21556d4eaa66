#include "manifest/manifest_codec.hpp"

#include <chrono>
#include <cstdint>
#include <limits>
#include <set>

#include "logging/logger.hpp"
#include "manifest/hazard_catalog.hpp"

namespace ascot {
namespace manifest {

namespace {

bool read_optional_string(const nlohmann::json &obj, const char *key, std::string &out, std::string &error,
                          const std::string &context) {
    if (!obj.contains(key) || obj[key].is_null()) {
        return true;
    }
    if (!obj[key].is_string()) {
        error = context + ": '" + key + "' must be a string";
        return false;
    }
    out = obj[key].get<std::string>();
    return true;
}

// Decode a bound or default for a numeric parameter. Integers stay int64_t
// for INTEGER parameters; everything numeric becomes double for FLOAT.
bool decode_numeric(const nlohmann::json &json, ParameterType type, ArgValue &out) {
    if (type == ParameterType::INTEGER) {
        if (!json.is_number_integer()) return false;
        if (json.is_number_unsigned() &&
            json.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return false;
        }
        out = json.get<int64_t>();
        return true;
    }
    if (!json.is_number()) return false;
    out = json.get<double>();
    return true;
}

bool parse_parameter(const nlohmann::json &json, const std::string &action_name, ParameterSpec &param,
                     std::string &error) {
    const std::string context = "Action '" + action_name + "'";
    if (!json.is_object()) {
        error = context + ": parameter entries must be objects";
        return false;
    }
    if (!json.contains("name") || !json["name"].is_string() || json["name"].get<std::string>().empty()) {
        error = context + ": parameter name must be a non-empty string";
        return false;
    }
    param.name = json["name"].get<std::string>();
    const std::string pcontext = context + " parameter '" + param.name + "'";

    if (!json.contains("type") || !json["type"].is_string()) {
        error = pcontext + ": missing type";
        return false;
    }
    auto type = parameter_type_from_string(json["type"].get<std::string>());
    if (!type) {
        error = pcontext + ": unrecognized type '" + json["type"].get<std::string>() + "'";
        return false;
    }
    param.type = *type;

    if (!read_optional_string(json, "description", param.description, error, pcontext)) {
        return false;
    }

    bool numeric = param.type == ParameterType::INTEGER || param.type == ParameterType::FLOAT;
    for (const char *key : {"min", "max"}) {
        if (!json.contains(key) || json[key].is_null()) continue;
        if (!numeric) {
            error = pcontext + ": '" + key + "' is only valid for numeric parameters";
            return false;
        }
        ArgValue bound;
        if (!decode_numeric(json[key], param.type, bound)) {
            error = pcontext + ": '" + key + "' must be " +
                    (param.type == ParameterType::INTEGER ? "an integer" : "a number");
            return false;
        }
        (std::string(key) == "min" ? param.minimum : param.maximum) = bound;
    }
    if (param.minimum && param.maximum &&
        *arg_value_as_double(*param.minimum) > *arg_value_as_double(*param.maximum)) {
        error = pcontext + ": min " + arg_value_to_string(*param.minimum) + " exceeds max " +
                arg_value_to_string(*param.maximum);
        return false;
    }

    if (json.contains("step") && !json["step"].is_null()) {
        if (!numeric || !json["step"].is_number() || json["step"].get<double>() <= 0.0) {
            error = pcontext + ": 'step' must be a positive number on a numeric parameter";
            return false;
        }
        param.step = json["step"].get<double>();
    }

    if (param.type == ParameterType::ENUM) {
        if (!json.contains("values") || !json["values"].is_array() || json["values"].empty()) {
            error = pcontext + ": enum parameters require a non-empty 'values' array";
            return false;
        }
        for (const auto &v : json["values"]) {
            if (!v.is_string()) {
                error = pcontext + ": enum values must be strings";
                return false;
            }
            param.allowed_values.push_back(v.get<std::string>());
        }
    } else if (json.contains("values") && !json["values"].is_null()) {
        error = pcontext + ": 'values' is only valid for enum parameters";
        return false;
    }

    if (json.contains("default") && !json["default"].is_null()) {
        ArgValue def;
        std::string decode_error;
        if (numeric) {
            if (!decode_numeric(json["default"], param.type, def)) {
                error = pcontext + ": default does not match type " + parameter_type_to_string(param.type);
                return false;
            }
        } else if (!decode_arg_value(json["default"], def, decode_error)) {
            error = pcontext + ": " + decode_error;
            return false;
        }
        std::string reason;
        if (!validate_value(param, def, reason)) {
            error = pcontext + ": invalid default: " + reason;
            return false;
        }
        param.default_value = def;
        param.required = false;
    }

    if (json.contains("required") && !json["required"].is_null()) {
        if (!json["required"].is_boolean()) {
            error = pcontext + ": 'required' must be a boolean";
            return false;
        }
        param.required = json["required"].get<bool>();
    }
    return true;
}

bool parse_action(const nlohmann::json &json, const std::string &main_route, ActionSchema &action,
                  std::vector<std::string> &warnings, std::string &error) {
    if (!json.is_object()) {
        error = "Action entries must be objects";
        return false;
    }
    if (!json.contains("name") || !json["name"].is_string() || json["name"].get<std::string>().empty()) {
        error = "Action name must be a non-empty string";
        return false;
    }
    action.name = json["name"].get<std::string>();
    const std::string context = "Action '" + action.name + "'";

    if (!read_optional_string(json, "description", action.description, error, context)) {
        return false;
    }

    std::string method = "PUT";
    if (!read_optional_string(json, "method", method, error, context)) {
        return false;
    }
    auto parsed_method = http_method_from_string(method);
    if (!parsed_method) {
        error = context + ": unsupported method '" + method + "'";
        return false;
    }
    action.method = *parsed_method;

    if (!read_optional_string(json, "path", action.path, error, context)) {
        return false;
    }
    if (action.path.empty()) {
        action.path = main_route + "/" + action.name;
    }
    if (action.path.front() != '/') {
        action.path.insert(action.path.begin(), '/');
    }

    if (json.contains("parameters") && !json["parameters"].is_null()) {
        if (!json["parameters"].is_array()) {
            error = context + ": 'parameters' must be an array";
            return false;
        }
        std::set<std::string> seen;
        for (const auto &pjson : json["parameters"]) {
            ParameterSpec param;
            if (!parse_parameter(pjson, action.name, param, error)) {
                return false;
            }
            if (!seen.insert(param.name).second) {
                error = context + ": duplicate parameter '" + param.name + "'";
                return false;
            }
            action.parameters.push_back(std::move(param));
        }
    }

    if (json.contains("hazards") && !json["hazards"].is_null()) {
        if (!json["hazards"].is_array()) {
            error = context + ": 'hazards' must be an array";
            return false;
        }
        std::set<std::string> seen;
        for (const auto &hjson : json["hazards"]) {
            if (!hjson.is_string() || hjson.get<std::string>().empty()) {
                error = context + ": hazard tags must be non-empty strings";
                return false;
            }
            std::string tag = hjson.get<std::string>();
            if (!seen.insert(tag).second) continue;
            HazardTag hazard{tag, is_known_hazard(tag)};
            if (!hazard.known) {
                warnings.push_back(context + " declares unknown hazard '" + tag + "'");
            }
            action.hazards.push_back(std::move(hazard));
        }
    }
    return true;
}

}  // namespace

bool parse_manifest(const std::string &body, const std::string &device_identity, Manifest &out,
                    std::string &error) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error &e) {
        error = std::string("Manifest is not valid JSON: ") + e.what();
        return false;
    }
    return parse_manifest_json(doc, device_identity, out, error);
}

bool parse_manifest_json(const nlohmann::json &doc, const std::string &device_identity, Manifest &out,
                         std::string &error) {
    if (!doc.is_object()) {
        error = "Manifest must be a JSON object";
        return false;
    }
    if (!doc.contains("actions") || !doc["actions"].is_array()) {
        error = "Manifest must contain an 'actions' array";
        return false;
    }

    Manifest manifest;
    manifest.device_identity = device_identity;
    if (!read_optional_string(doc, "kind", manifest.kind, error, "Manifest") ||
        !read_optional_string(doc, "main_route", manifest.main_route, error, "Manifest")) {
        return false;
    }
    while (!manifest.main_route.empty() && manifest.main_route.back() == '/') {
        manifest.main_route.pop_back();
    }

    std::set<std::string> seen;
    for (const auto &ajson : doc["actions"]) {
        ActionSchema action;
        if (!parse_action(ajson, manifest.main_route, action, manifest.warnings, error)) {
            return false;
        }
        if (!seen.insert(action.name).second) {
            error = "Duplicate action name '" + action.name + "'";
            return false;
        }
        manifest.actions.push_back(std::move(action));
    }

    for (const auto &warning : manifest.warnings) {
        LOG_WARN("[Manifest] " << device_identity << ": " << warning);
    }

    manifest.fetched_at = std::chrono::system_clock::now();
    out = std::move(manifest);
    return true;
}

nlohmann::json encode_arg_value(const ArgValue &value) {
    if (std::holds_alternative<double>(value)) return std::get<double>(value);
    if (std::holds_alternative<int64_t>(value)) return std::get<int64_t>(value);
    if (std::holds_alternative<bool>(value)) return std::get<bool>(value);
    return std::get<std::string>(value);
}

bool decode_arg_value(const nlohmann::json &json, ArgValue &value, std::string &error) {
    if (json.is_boolean()) {
        value = json.get<bool>();
        return true;
    }
    if (json.is_number_unsigned()) {
        if (json.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            error = "Integer value out of range";
            return false;
        }
        value = static_cast<int64_t>(json.get<uint64_t>());
        return true;
    }
    if (json.is_number_integer()) {
        value = json.get<int64_t>();
        return true;
    }
    if (json.is_number_float()) {
        value = json.get<double>();
        return true;
    }
    if (json.is_string()) {
        value = json.get<std::string>();
        return true;
    }
    error = std::string("Unsupported value type: ") + json.type_name();
    return false;
}

bool decode_arguments(const nlohmann::json &json, std::map<std::string, ArgValue> &args, std::string &error) {
    if (json.is_null()) {
        return true;
    }
    if (!json.is_object()) {
        error = "Arguments must be a JSON object";
        return false;
    }
    for (auto it = json.begin(); it != json.end(); ++it) {
        ArgValue value;
        std::string value_error;
        if (!decode_arg_value(it.value(), value, value_error)) {
            error = "Argument '" + it.key() + "': " + value_error;
            return false;
        }
        args[it.key()] = std::move(value);
    }
    return true;
}

nlohmann::json encode_parameter(const ParameterSpec &param) {
    nlohmann::json j;
    j["name"] = param.name;
    j["type"] = parameter_type_to_string(param.type);
    if (!param.description.empty()) j["description"] = param.description;
    j["required"] = param.required;
    if (param.minimum) j["min"] = encode_arg_value(*param.minimum);
    if (param.maximum) j["max"] = encode_arg_value(*param.maximum);
    if (param.step) j["step"] = *param.step;
    if (param.default_value) j["default"] = encode_arg_value(*param.default_value);
    if (param.type == ParameterType::ENUM) j["values"] = param.allowed_values;
    return j;
}

nlohmann::json encode_action(const ActionSchema &action) {
    nlohmann::json j;
    j["name"] = action.name;
    if (!action.description.empty()) j["description"] = action.description;
    j["method"] = http_method_to_string(action.method);
    j["path"] = action.path;

    nlohmann::json params = nlohmann::json::array();
    for (const auto &param : action.parameters) {
        params.push_back(encode_parameter(param));
    }
    j["parameters"] = params;

    nlohmann::json hazards = nlohmann::json::array();
    for (const auto &hazard : action.hazards) {
        hazards.push_back(hazard.tag);
    }
    j["hazards"] = hazards;
    return j;
}

nlohmann::json encode_manifest(const Manifest &manifest) {
    nlohmann::json j;
    j["device"] = manifest.device_identity;
    if (!manifest.kind.empty()) j["kind"] = manifest.kind;
    if (!manifest.main_route.empty()) j["main_route"] = manifest.main_route;

    nlohmann::json actions = nlohmann::json::array();
    for (const auto &action : manifest.actions) {
        actions.push_back(encode_action(action));
    }
    j["actions"] = actions;

    j["fetched_at_ms"] =
        std::chrono::duration_cast<std::chrono::milliseconds>(manifest.fetched_at.time_since_epoch()).count();
    return j;
}

nlohmann::json encode_hazard(const HazardTag &hazard) {
    nlohmann::json j;
    j["tag"] = hazard.tag;
    j["known"] = hazard.known;
    if (const HazardInfo *info = find_hazard(hazard.tag)) {
        j["name"] = info->name;
        j["description"] = info->description;
        j["category"] = hazard_category_to_string(info->category);
    }
    return j;
}

}  // namespace manifest
}  // namespace ascot
