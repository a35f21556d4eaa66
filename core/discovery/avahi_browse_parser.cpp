#include "discovery/avahi_browse_parser.hpp"

#include <cctype>
#include <cstdlib>
#include <vector>

#include "discovery/device_identity.hpp"

namespace ascot {
namespace discovery {

namespace {

constexpr size_t kKeyFields = 6;       // kind;iface;proto;name;type;domain
constexpr size_t kResolvedFields = 9;  // + host;address;port (TXT follows as the remainder)

// Split on ';' into at most max_fields, the last one keeping the remainder
std::vector<std::string> split_fields(const std::string &line, size_t max_fields) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (fields.size() + 1 < max_fields) {
        size_t pos = line.find(';', start);
        if (pos == std::string::npos) break;
        fields.push_back(line.substr(start, pos - start));
        start = pos + 1;
    }
    fields.push_back(line.substr(start));
    return fields;
}

bool parse_port(const std::string &text, uint16_t &port) {
    if (text.empty() || text.size() > 5) return false;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    long value = std::strtol(text.c_str(), nullptr, 10);
    if (value <= 0 || value > 65535) return false;
    port = static_cast<uint16_t>(value);
    return true;
}

}  // namespace

ServiceMetadata parse_txt_records(const std::string &txt) {
    ServiceMetadata out;
    size_t i = 0;
    while (i < txt.size()) {
        while (i < txt.size() && txt[i] != '"') ++i;
        if (i >= txt.size()) break;
        ++i;

        std::string raw;
        while (i < txt.size() && txt[i] != '"') {
            if (txt[i] == '\\' && i + 1 < txt.size()) {
                raw += txt[i];
                raw += txt[i + 1];
                i += 2;
                continue;
            }
            raw += txt[i++];
        }
        ++i;  // closing quote

        std::string entry = unescape_dns_label(raw);
        if (entry.empty()) continue;

        auto eq = entry.find('=');
        std::string key = entry.substr(0, eq);
        for (auto &c : key) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (key.empty()) continue;
        // First occurrence of a key wins (RFC 6763 section 6.4)
        if (out.count(key) == 0) {
            out[key] = eq == std::string::npos ? std::string() : entry.substr(eq + 1);
        }
    }
    return out;
}

bool parse_browse_line(const std::string &line, BrowseRecord &record, std::string &error) {
    if (line.size() < 2 || line[1] != ';') {
        error = "Not a parsable browse line";
        return false;
    }

    BrowseRecord::Kind kind;
    switch (line[0]) {
        case '+':
            kind = BrowseRecord::Kind::ADDED;
            break;
        case '-':
            kind = BrowseRecord::Kind::REMOVED;
            break;
        case '=':
            kind = BrowseRecord::Kind::RESOLVED;
            break;
        default:
            error = std::string("Unknown record kind '") + line[0] + "'";
            return false;
    }

    const size_t max_fields = kind == BrowseRecord::Kind::RESOLVED ? kResolvedFields + 1 : kKeyFields;
    auto fields = split_fields(line, max_fields);
    if (fields.size() < (kind == BrowseRecord::Kind::RESOLVED ? kResolvedFields : kKeyFields)) {
        error = "Truncated browse line (" + std::to_string(fields.size()) + " fields)";
        return false;
    }

    BrowseRecord out;
    out.kind = kind;
    out.interface_name = fields[1];
    out.protocol = fields[2];
    out.service_name = fields[3];
    out.service_type = fields[4];
    out.domain = fields[5];

    if (out.service_name.empty()) {
        error = "Browse line without service name";
        return false;
    }

    if (kind == BrowseRecord::Kind::RESOLVED) {
        out.host_name = fields[6];
        out.address = fields[7];
        if (!parse_port(fields[8], out.port)) {
            error = "Invalid port '" + fields[8] + "'";
            return false;
        }
        if (fields.size() > kResolvedFields) {
            out.txt = parse_txt_records(fields[kResolvedFields]);
        }
    }

    record = std::move(out);
    return true;
}

}  // namespace discovery
}  // namespace ascot
