#pragma once

#include <string>
#include <vector>

namespace ascot {
namespace discovery {

struct RestartPolicyConfig {
    bool enabled = true;                                       // Restart the browse transport when it fails
    int max_attempts = 5;                                      // Consecutive failures before the circuit opens
    std::vector<int> backoff_ms{500, 1000, 2000, 5000, 10000};  // Delay before each restart attempt (ms)
    int success_reset_ms = 30000;                              // Stable running time that clears the attempt count
};

struct DiscoveryConfig {
    bool enabled = true;
    std::string service_type = "_ascot._tcp";
    std::string browse_command = "avahi-browse";
    bool allow_ipv6 = false;    // IPv6 resolutions are ignored unless set
    int poll_timeout_ms = 250;  // Listener wake-up interval while the network is quiet
    int rescan_grace_ms = 5000;  // After a transport restart, devices not re-resolved within this window vanish
    RestartPolicyConfig restart_policy;
};

}  // namespace discovery
}  // namespace ascot
