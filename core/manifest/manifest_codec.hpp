#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <string>

#include "manifest/manifest.hpp"

namespace ascot {
namespace manifest {

/**
 * @brief JSON codec for device manifests and command arguments
 *
 * Device manifest document:
 *   {
 *     "kind": "light", "main_route": "/light",
 *     "actions": [
 *       {"name": "on", "method": "PUT", "path": "/light/on", "description": "...",
 *        "parameters": [{"name": "brightness", "type": "float", "min": 0, "max": 20,
 *                        "step": 0.1, "default": 4.0}],
 *        "hazards": ["fire_hazard"]}
 *     ]
 *   }
 *
 * Parsing is strict about structure and lenient about hazard tags: an
 * unrecognized tag is kept (known=false) and recorded in Manifest::warnings.
 */

/**
 * @brief Parse and validate a manifest document.
 *
 * @param body Raw HTTP response body
 * @param device_identity Identity of the device the document came from
 * @param out Filled on success; fetched_at is set to now
 * @param error Reason the document was rejected
 */
bool parse_manifest(const std::string &body, const std::string &device_identity, Manifest &out,
                    std::string &error);

bool parse_manifest_json(const nlohmann::json &doc, const std::string &device_identity, Manifest &out,
                         std::string &error);

/**
 * @brief Serialize a cached manifest in the same document shape it was parsed from.
 *
 * Adds "device" and "fetched_at_ms"; unknown hazard tags are written back verbatim.
 */
nlohmann::json encode_manifest(const Manifest &manifest);
nlohmann::json encode_action(const ActionSchema &action);
nlohmann::json encode_parameter(const ParameterSpec &param);

/**
 * @brief Describe a hazard for display, including catalog name and category when known.
 */
nlohmann::json encode_hazard(const HazardTag &hazard);

nlohmann::json encode_arg_value(const ArgValue &value);
bool decode_arg_value(const nlohmann::json &json, ArgValue &value, std::string &error);

/**
 * @brief Decode a JSON object of command arguments (name -> scalar).
 */
bool decode_arguments(const nlohmann::json &json, std::map<std::string, ArgValue> &args, std::string &error);

}  // namespace manifest
}  // namespace ascot
