#include "discovery/device_identity.hpp"

#include <cctype>

namespace ascot {
namespace discovery {

std::string unescape_dns_label(const std::string &label) {
    std::string out;
    out.reserve(label.size());
    for (size_t i = 0; i < label.size(); ++i) {
        char c = label[i];
        if (c != '\\' || i + 1 >= label.size()) {
            out += c;
            continue;
        }
        if (i + 3 < label.size() && std::isdigit(static_cast<unsigned char>(label[i + 1])) &&
            std::isdigit(static_cast<unsigned char>(label[i + 2])) &&
            std::isdigit(static_cast<unsigned char>(label[i + 3]))) {
            int code = (label[i + 1] - '0') * 100 + (label[i + 2] - '0') * 10 + (label[i + 3] - '0');
            if (code <= 255) {
                out += static_cast<char>(code);
                i += 3;
                continue;
            }
        }
        out += label[i + 1];
        ++i;
    }
    return out;
}

DeviceIdentity make_device_identity(const std::string &service_name) {
    // "<instance>._<service>._<proto>.<domain>" -> "<instance>"; an escaped
    // dot belongs to the instance name
    std::string raw = service_name;
    for (size_t pos = raw.find("._"); pos != std::string::npos; pos = raw.find("._", pos + 1)) {
        if (pos == 0 || raw[pos - 1] != '\\') {
            raw.erase(pos);
            break;
        }
    }
    std::string name = unescape_dns_label(raw);

    size_t begin = 0;
    while (begin < name.size() && std::isspace(static_cast<unsigned char>(name[begin]))) ++begin;
    size_t end = name.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(name[end - 1]))) --end;
    return name.substr(begin, end - begin);
}

}  // namespace discovery
}  // namespace ascot
