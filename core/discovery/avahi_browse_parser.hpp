#pragma once

#include <string>

#include "discovery/i_discovery_transport.hpp"

namespace ascot {
namespace discovery {

/**
 * Parse one line of `avahi-browse --parsable --resolve` output:
 *
 *   +;eth0;IPv4;Kitchen\032Light;_ascot._tcp;local
 *   =;eth0;IPv4;Kitchen\032Light;_ascot._tcp;local;kitchen.local;192.168.1.20;8080;"path=/x" "scheme=http"
 *   -;eth0;IPv4;Kitchen\032Light;_ascot._tcp;local
 *
 * Service names keep their DNS escapes; make_device_identity() decodes them.
 * Returns false (with error set) for anything else, including avahi's
 * diagnostic lines.
 */
bool parse_browse_line(const std::string &line, BrowseRecord &record, std::string &error);

/**
 * Parse avahi's TXT rendering: space separated quoted strings, each
 * "key=value" or a bare "key" (empty value). Keys are lowercased.
 */
ServiceMetadata parse_txt_records(const std::string &txt);

}  // namespace discovery
}  // namespace ascot
