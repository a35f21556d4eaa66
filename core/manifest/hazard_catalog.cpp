#include "hazard_catalog.hpp"

#include <algorithm>

namespace ascot {
namespace manifest {

const char *hazard_category_to_string(HazardCategory category) {
    switch (category) {
        case HazardCategory::SAFETY:
            return "safety";
        case HazardCategory::PRIVACY:
            return "privacy";
        case HazardCategory::FINANCIAL:
            return "financial";
        default:
            return "unknown";
    }
}

const std::vector<HazardInfo> &known_hazards() {
    // Kept sorted by tag for find_hazard()
    static const std::vector<HazardInfo> catalog = {
        {"air_poisoning", "Air Poisoning", "The execution may release toxic gases.", HazardCategory::SAFETY},
        {"asphyxia", "Asphyxia", "The execution may cause oxygen deficiency by gaseous substances.",
         HazardCategory::SAFETY},
        {"audio_video_display", "Audio Video Display", "The execution authorises the app to display a video with audio coming from the device.",
         HazardCategory::PRIVACY},
        {"audio_video_record_and_store", "Audio Video Record and Store",
         "The execution authorises the app to record and save a video with audio on persistent storage.",
         HazardCategory::PRIVACY},
        {"electric_energy_consumption", "Electric Energy Consumption",
         "The execution enables a device that consumes electricity.", HazardCategory::FINANCIAL},
        {"explosion", "Explosion", "The execution may cause an explosion.", HazardCategory::SAFETY},
        {"fire_hazard", "Fire Hazard", "The execution may cause fire.", HazardCategory::SAFETY},
        {"gas_consumption", "Gas Consumption", "The execution enables a device that consumes gas.",
         HazardCategory::FINANCIAL},
        {"log_energy_consumption", "Log Energy Consumption",
         "The execution authorises the app to get and save information about the app's energy impact on the device the app runs on.",
         HazardCategory::PRIVACY},
        {"log_usage_time", "Log Usage Time",
         "The execution authorises the app to get and save information about the app's duration of use.",
         HazardCategory::PRIVACY},
        {"pay_subscription_fee", "Pay Subscription Fee",
         "The execution authorises the app to use payment information and make a periodic payment.",
         HazardCategory::FINANCIAL},
        {"power_outage", "Power Outage", "The execution may cause an interruption in the supply of electricity.",
         HazardCategory::SAFETY},
        {"power_surge", "Power Surge", "The execution may lead to exposure to high voltages.",
         HazardCategory::SAFETY},
        {"record_issued_commands", "Record Issued Commands",
         "The execution authorises the app to get and save user inputs.", HazardCategory::PRIVACY},
        {"record_user_preferences", "Record User Preferences",
         "The execution authorises the app to get and save information about user's preferences.",
         HazardCategory::PRIVACY},
        {"spend_money", "Spend Money", "The execution authorises the app to use payment information and make a payment transaction.",
         HazardCategory::FINANCIAL},
        {"spoiled_food", "Spoiled Food", "The execution may lead rotten food.", HazardCategory::SAFETY},
        {"take_device_screenshots", "Take Device Screenshots",
         "The execution authorises the app to read the display output and take screenshots of it.",
         HazardCategory::PRIVACY},
        {"take_pictures", "Take Pictures", "The execution authorises the app to use a camera and take photos.",
         HazardCategory::PRIVACY},
        {"unauthorized_physical_access", "Unauthorised Physical Access",
         "The execution disables a protection mechanism and unauthorised individuals may physically enter home.",
         HazardCategory::SAFETY},
        {"water_consumption", "Water Consumption", "The execution enables a device that consumes water.",
         HazardCategory::FINANCIAL},
        {"water_flooding", "Water Flooding", "The execution allows water usage which may lead to flood.",
         HazardCategory::SAFETY},
    };
    return catalog;
}

const HazardInfo *find_hazard(const std::string &tag) {
    const auto &catalog = known_hazards();
    auto it = std::lower_bound(catalog.begin(), catalog.end(), tag,
                               [](const HazardInfo &info, const std::string &t) { return info.tag < t; });
    if (it == catalog.end() || it->tag != tag) {
        return nullptr;
    }
    return &(*it);
}

}  // namespace manifest
}  // namespace ascot
