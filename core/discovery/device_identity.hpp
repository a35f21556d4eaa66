#pragma once

#include <map>
#include <string>

namespace ascot {
namespace discovery {

/// Registry key: the advertised DNS-SD service instance name.
using DeviceIdentity = std::string;

/// TXT record properties of a sighting (e.g. "scheme", "path").
using ServiceMetadata = std::map<std::string, std::string>;

/**
 * @brief Derive a device identity from an advertised service name.
 *
 * Decodes DNS-SD escapes (\032, \.), strips a trailing service type and
 * domain (e.g. "._ascot._tcp.local") and surrounding whitespace.
 * Returns an empty string when nothing usable remains.
 */
DeviceIdentity make_device_identity(const std::string &service_name);

/**
 * @brief Decode avahi/DNS-SD escape sequences (\DDD decimal, \X literal).
 */
std::string unescape_dns_label(const std::string &label);

}  // namespace discovery
}  // namespace ascot
