#pragma once

#include <string>
#include <vector>

namespace ascot {
namespace manifest {

enum class HazardCategory { SAFETY, PRIVACY, FINANCIAL };

const char *hazard_category_to_string(HazardCategory category);

/**
 * @brief Descriptive entry for a hazard tag the gateway recognizes.
 */
struct HazardInfo {
    std::string tag;
    std::string name;
    std::string description;
    HazardCategory category;
};

/**
 * @brief All hazard tags known to this gateway build, sorted by tag.
 */
const std::vector<HazardInfo> &known_hazards();

/**
 * @brief Look up a hazard tag. Returns nullptr for tags outside the catalog.
 */
const HazardInfo *find_hazard(const std::string &tag);

inline bool is_known_hazard(const std::string &tag) { return find_hazard(tag) != nullptr; }

}  // namespace manifest
}  // namespace ascot
