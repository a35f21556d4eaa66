#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace ascot {
namespace manifest {

/**
 * @brief Closed set of parameter types a device manifest may declare.
 *
 * ENUM parameters carry string values restricted to a declared list.
 */
enum class ParameterType { BOOLEAN, INTEGER, FLOAT, STRING, ENUM };

/**
 * @brief Canonical value type for command arguments and parameter defaults.
 */
using ArgValue = std::variant<double, int64_t, bool, std::string>;

/**
 * @brief Convert ParameterType to its manifest string.
 */
inline const char *parameter_type_to_string(ParameterType type) {
    switch (type) {
        case ParameterType::BOOLEAN:
            return "boolean";
        case ParameterType::INTEGER:
            return "integer";
        case ParameterType::FLOAT:
            return "float";
        case ParameterType::STRING:
            return "string";
        case ParameterType::ENUM:
            return "enum";
        default:
            return "unknown";
    }
}

/**
 * @brief Parse a manifest type string into ParameterType.
 */
inline std::optional<ParameterType> parameter_type_from_string(const std::string_view type_name) {
    if (type_name == "boolean") {
        return ParameterType::BOOLEAN;
    }
    if (type_name == "integer") {
        return ParameterType::INTEGER;
    }
    if (type_name == "float") {
        return ParameterType::FLOAT;
    }
    if (type_name == "string") {
        return ParameterType::STRING;
    }
    if (type_name == "enum") {
        return ParameterType::ENUM;
    }
    return std::nullopt;
}

/**
 * @brief Get runtime type name for an ArgValue instance.
 */
inline const char *arg_value_type_name(const ArgValue &value) {
    if (std::holds_alternative<double>(value)) return "float";
    if (std::holds_alternative<int64_t>(value)) return "integer";
    if (std::holds_alternative<bool>(value)) return "boolean";
    if (std::holds_alternative<std::string>(value)) return "string";
    return "unknown";
}

/**
 * @brief Check whether a value is acceptable for a declared type.
 *
 * Integers are accepted where a float is declared.
 */
inline bool arg_value_matches_type(ParameterType type, const ArgValue &value) {
    switch (type) {
        case ParameterType::FLOAT:
            return std::holds_alternative<double>(value) || std::holds_alternative<int64_t>(value);
        case ParameterType::INTEGER:
            return std::holds_alternative<int64_t>(value);
        case ParameterType::BOOLEAN:
            return std::holds_alternative<bool>(value);
        case ParameterType::STRING:
        case ParameterType::ENUM:
            return std::holds_alternative<std::string>(value);
        default:
            return false;
    }
}

/**
 * @brief Numeric view of an integer or float value.
 */
inline std::optional<double> arg_value_as_double(const ArgValue &value) {
    if (std::holds_alternative<double>(value)) return std::get<double>(value);
    if (std::holds_alternative<int64_t>(value)) return static_cast<double>(std::get<int64_t>(value));
    return std::nullopt;
}

/**
 * @brief Convert an ArgValue to a deterministic string representation.
 */
inline std::string arg_value_to_string(const ArgValue &value) {
    if (std::holds_alternative<double>(value)) {
        return std::to_string(std::get<double>(value));
    }
    if (std::holds_alternative<int64_t>(value)) {
        return std::to_string(std::get<int64_t>(value));
    }
    if (std::holds_alternative<bool>(value)) {
        return std::get<bool>(value) ? "true" : "false";
    }
    if (std::holds_alternative<std::string>(value)) {
        return std::get<std::string>(value);
    }
    return {};
}

}  // namespace manifest
}  // namespace ascot
