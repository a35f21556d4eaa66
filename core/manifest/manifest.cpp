#include "manifest/manifest.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace ascot {
namespace manifest {

const char *http_method_to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::PUT:
            return "PUT";
        case HttpMethod::POST:
            return "POST";
        default:
            return "PUT";
    }
}

std::optional<HttpMethod> http_method_from_string(const std::string &name) {
    if (name == "PUT" || name == "put") return HttpMethod::PUT;
    if (name == "POST" || name == "post") return HttpMethod::POST;
    return std::nullopt;
}

const ParameterSpec *ActionSchema::find_parameter(const std::string &param_name) const {
    for (const auto &param : parameters) {
        if (param.name == param_name) {
            return &param;
        }
    }
    return nullptr;
}

const ActionSchema *Manifest::find_action(const std::string &action_name) const {
    for (const auto &action : actions) {
        if (action.name == action_name) {
            return &action;
        }
    }
    return nullptr;
}

bool Manifest::has_unknown_hazards() const {
    for (const auto &action : actions) {
        for (const auto &hazard : action.hazards) {
            if (!hazard.known) return true;
        }
    }
    return false;
}

namespace {

bool check_range(const ParameterSpec &spec, const ArgValue &value, std::string &reason) {
    if (spec.type == ParameterType::INTEGER) {
        int64_t v = std::get<int64_t>(value);
        if (spec.minimum && std::holds_alternative<int64_t>(*spec.minimum) && v < std::get<int64_t>(*spec.minimum)) {
            reason = "Value " + std::to_string(v) + " below minimum " + std::to_string(std::get<int64_t>(*spec.minimum));
            return false;
        }
        if (spec.maximum && std::holds_alternative<int64_t>(*spec.maximum) && v > std::get<int64_t>(*spec.maximum)) {
            reason = "Value " + std::to_string(v) + " above maximum " + std::to_string(std::get<int64_t>(*spec.maximum));
            return false;
        }
        return true;
    }

    // FLOAT: integers were already accepted as widened values
    double v = *arg_value_as_double(value);
    if (!std::isfinite(v)) {
        reason = "Value must be a finite number";
        return false;
    }
    if (spec.minimum) {
        auto min = arg_value_as_double(*spec.minimum);
        if (min && v < *min) {
            reason = "Value " + arg_value_to_string(value) + " below minimum " + arg_value_to_string(*spec.minimum);
            return false;
        }
    }
    if (spec.maximum) {
        auto max = arg_value_as_double(*spec.maximum);
        if (max && v > *max) {
            reason = "Value " + arg_value_to_string(value) + " above maximum " + arg_value_to_string(*spec.maximum);
            return false;
        }
    }
    return true;
}

std::string join_values(const std::vector<std::string> &values) {
    std::ostringstream oss;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << values[i];
    }
    return oss.str();
}

}  // namespace

bool validate_value(const ParameterSpec &spec, const ArgValue &value, std::string &reason) {
    if (!arg_value_matches_type(spec.type, value)) {
        reason = std::string("Type mismatch: expected ") + parameter_type_to_string(spec.type) + ", got " +
                 arg_value_type_name(value);
        return false;
    }

    switch (spec.type) {
        case ParameterType::INTEGER:
        case ParameterType::FLOAT:
            return check_range(spec, value, reason);
        case ParameterType::ENUM: {
            const auto &s = std::get<std::string>(value);
            if (std::find(spec.allowed_values.begin(), spec.allowed_values.end(), s) == spec.allowed_values.end()) {
                reason = "Value '" + s + "' not in allowed values [" + join_values(spec.allowed_values) + "]";
                return false;
            }
            return true;
        }
        default:
            return true;
    }
}

}  // namespace manifest
}  // namespace ascot
