#ifndef ASCOT_MANIFEST_MANIFEST_HPP
#define ASCOT_MANIFEST_MANIFEST_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "manifest/parameter_types.hpp"

namespace ascot {
namespace manifest {

/**
 * @brief Declared input of an action.
 *
 * minimum/maximum hold int64_t for INTEGER parameters and double for FLOAT.
 * step is advisory for the panel and is not enforced on dispatch.
 */
struct ParameterSpec {
    std::string name;
    ParameterType type = ParameterType::STRING;
    std::string description;
    bool required = true;
    std::optional<ArgValue> minimum;
    std::optional<ArgValue> maximum;
    std::optional<double> step;
    std::optional<ArgValue> default_value;
    std::vector<std::string> allowed_values;  // ENUM only
};

/**
 * @brief Hazard attached to an action. Unknown tags are kept with known=false.
 */
struct HazardTag {
    std::string tag;
    bool known = false;
};

inline bool operator==(const HazardTag &a, const HazardTag &b) { return a.tag == b.tag && a.known == b.known; }

enum class HttpMethod { PUT, POST };

const char *http_method_to_string(HttpMethod method);
std::optional<HttpMethod> http_method_from_string(const std::string &name);

struct ActionSchema {
    std::string name;
    std::string description;
    HttpMethod method = HttpMethod::PUT;
    std::string path;
    std::vector<ParameterSpec> parameters;  // declaration order
    std::vector<HazardTag> hazards;

    const ParameterSpec *find_parameter(const std::string &param_name) const;
    bool has_hazards() const { return !hazards.empty(); }
};

/**
 * @brief Capabilities a device advertised at fetch time.
 *
 * Instances are shared as std::shared_ptr<const Manifest> and never
 * modified after parsing; a new fetch replaces the pointer.
 */
struct Manifest {
    std::string device_identity;
    std::string kind;
    std::string main_route;
    std::vector<ActionSchema> actions;  // declaration order
    std::vector<std::string> warnings;  // non-fatal findings, e.g. unknown hazard tags
    std::chrono::system_clock::time_point fetched_at;

    const ActionSchema *find_action(const std::string &action_name) const;
    bool has_unknown_hazards() const;
};

using ManifestPtr = std::shared_ptr<const Manifest>;

/**
 * @brief Check a value against a parameter's type and constraints.
 *
 * @param reason Set to a human-readable explanation on failure
 * @return true if the value is acceptable for the parameter
 */
bool validate_value(const ParameterSpec &spec, const ArgValue &value, std::string &reason);

}  // namespace manifest
}  // namespace ascot

#endif  // ASCOT_MANIFEST_MANIFEST_HPP
