#include "runtime/config.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using namespace ascot::runtime;

class ConfigTest : public ::testing::Test {
protected:
    fs::path temp_dir;

    void SetUp() override {
        // Create temporary test directory
        temp_dir = fs::temp_directory_path() / "ascot_config_test";
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        // Clean up temporary files
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    std::string create_config_file(const std::string& name, const std::string& content) {
        fs::path config_path = temp_dir / name;
        std::ofstream file(config_path);
        file << content;
        file.close();
        return config_path.string();
    }

    bool load(const std::string& content, GatewayConfig& config, std::string& error) {
        return load_config(create_config_file("gateway.yaml", content), config, error);
    }
};

TEST_F(ConfigTest, FullConfig) {
    std::string config_content = R"(
discovery:
  enabled: true
  service_type: _lights._tcp
  browse_command: /usr/bin/avahi-browse
  allow_ipv6: true
  poll_timeout_ms: 100
  rescan_grace_ms: 2500
  restart_policy:
    max_attempts: 2
    backoff_ms: [100, 200]
    success_reset_ms: 5000

resolver:
  manifest_path: /manifest
  timeout_ms: 1000
  max_retries: 1
  backoff_initial_ms: 50
  backoff_max_ms: 400
  workers: 8
  refresh_interval_ms: 30000

dispatch:
  timeout_ms: 2500

health:
  stale_after_ms: 60000
  unreachable_after_failures: 5

persistence:
  enabled: true
  path: /var/lib/ascot/devices.json

logging:
  level: debug
)";

    GatewayConfig config;
    std::string error;
    ASSERT_TRUE(load(config_content, config, error)) << "Error: " << error;

    EXPECT_EQ(config.discovery.service_type, "_lights._tcp");
    EXPECT_EQ(config.discovery.browse_command, "/usr/bin/avahi-browse");
    EXPECT_TRUE(config.discovery.allow_ipv6);
    EXPECT_EQ(config.discovery.poll_timeout_ms, 100);
    EXPECT_EQ(config.discovery.rescan_grace_ms, 2500);
    EXPECT_EQ(config.discovery.restart_policy.max_attempts, 2);
    EXPECT_EQ(config.discovery.restart_policy.backoff_ms, (std::vector<int>{100, 200}));
    EXPECT_EQ(config.discovery.restart_policy.success_reset_ms, 5000);

    EXPECT_EQ(config.resolver.manifest_path, "/manifest");
    EXPECT_EQ(config.resolver.timeout_ms, 1000);
    EXPECT_EQ(config.resolver.max_retries, 1);
    EXPECT_EQ(config.resolver.backoff_initial_ms, 50);
    EXPECT_EQ(config.resolver.backoff_max_ms, 400);
    EXPECT_EQ(config.resolver.workers, 8);
    EXPECT_EQ(config.resolver.refresh_interval_ms, 30000);

    EXPECT_EQ(config.dispatch.timeout_ms, 2500);
    EXPECT_EQ(config.health.stale_after_ms, 60000);
    EXPECT_EQ(config.health.unreachable_after_failures, 5);
    EXPECT_EQ(config.persistence.path, "/var/lib/ascot/devices.json");
    EXPECT_EQ(config.logging.level, "debug");
}

TEST_F(ConfigTest, MissingSectionsKeepDefaults) {
    std::string config_content = R"(
dispatch:
  timeout_ms: 800
)";

    GatewayConfig config;
    std::string error;
    ASSERT_TRUE(load(config_content, config, error)) << "Error: " << error;
    EXPECT_EQ(config.dispatch.timeout_ms, 800);
    EXPECT_TRUE(config.discovery.enabled);
    EXPECT_EQ(config.discovery.service_type, "_ascot._tcp");
    EXPECT_FALSE(config.discovery.allow_ipv6);
    EXPECT_EQ(config.resolver.manifest_path, "/.well-known/ascot");
    EXPECT_EQ(config.health.unreachable_after_failures, 3);
    EXPECT_EQ(config.logging.level, "info");
}

TEST_F(ConfigTest, EmptyFileIsAllDefaults) {
    GatewayConfig config;
    std::string error;
    EXPECT_TRUE(load("", config, error)) << "Error: " << error;
}

TEST_F(ConfigTest, UnknownKeysAreIgnored) {
    std::string config_content = R"(
http:
  port: 8080
resolver:
  timeout_ms: 500
  colour: blue
)";

    GatewayConfig config;
    std::string error;
    ASSERT_TRUE(load(config_content, config, error)) << "Error: " << error;
    EXPECT_EQ(config.resolver.timeout_ms, 500);
}

TEST_F(ConfigTest, MissingFileFails) {
    GatewayConfig config;
    std::string error;
    EXPECT_FALSE(load_config((temp_dir / "missing.yaml").string(), config, error));
    EXPECT_NE(error.find("Cannot open config file"), std::string::npos);
}

TEST_F(ConfigTest, MalformedYamlFails) {
    GatewayConfig config;
    std::string error;
    EXPECT_FALSE(load("resolver: [unclosed\n", config, error));
    EXPECT_NE(error.find("YAML parse error"), std::string::npos);
}

TEST_F(ConfigTest, NonMappingRootFails) {
    GatewayConfig config;
    std::string error;
    EXPECT_FALSE(load("- just\n- a list\n", config, error));
    EXPECT_NE(error.find("mapping"), std::string::npos);
}

TEST_F(ConfigTest, WrongValueTypeFails) {
    GatewayConfig config;
    std::string error;
    EXPECT_FALSE(load("dispatch:\n  timeout_ms: soon\n", config, error));
    EXPECT_FALSE(error.empty());
}

TEST_F(ConfigTest, BackoffLengthMustMatchMaxAttempts) {
    std::string config_content = R"(
discovery:
  restart_policy:
    max_attempts: 3
    backoff_ms: [100, 200]
)";

    GatewayConfig config;
    std::string error;
    EXPECT_FALSE(load(config_content, config, error));
    EXPECT_NE(error.find("must match max_attempts"), std::string::npos);
}

TEST_F(ConfigTest, RestartPolicyIgnoredWhenDiscoveryDisabled) {
    std::string config_content = R"(
discovery:
  enabled: false
  restart_policy:
    max_attempts: 0
)";

    GatewayConfig config;
    std::string error;
    EXPECT_TRUE(load(config_content, config, error)) << "Error: " << error;
    EXPECT_FALSE(config.discovery.enabled);
}

TEST_F(ConfigTest, InvalidLogLevelFails) {
    GatewayConfig config;
    std::string error;
    EXPECT_FALSE(load("logging:\n  level: chatty\n", config, error));
    EXPECT_NE(error.find("Invalid log level"), std::string::npos);
}

TEST_F(ConfigTest, RefreshIntervalZeroDisablesRefresh) {
    GatewayConfig config;
    std::string error;
    EXPECT_TRUE(load("resolver:\n  refresh_interval_ms: 0\n", config, error)) << "Error: " << error;

    GatewayConfig bad;
    EXPECT_FALSE(load("resolver:\n  refresh_interval_ms: 10\n", bad, error));
}

struct InvalidCase {
    const char* name;
    const char* yaml;
    const char* fragment;
};

class ConfigValidationTest : public ConfigTest, public ::testing::WithParamInterface<InvalidCase> {};

TEST_P(ConfigValidationTest, RejectsOutOfRangeValue) {
    const auto& param = GetParam();
    GatewayConfig config;
    std::string error;
    EXPECT_FALSE(load(param.yaml, config, error));
    EXPECT_NE(error.find(param.fragment), std::string::npos) << error;
}

INSTANTIATE_TEST_SUITE_P(
    Ranges, ConfigValidationTest,
    ::testing::Values(InvalidCase{"EmptyServiceType", "discovery:\n  service_type: ''\n", "service_type"},
                      InvalidCase{"TinyPollTimeout", "discovery:\n  poll_timeout_ms: 1\n", "poll_timeout_ms"},
                      InvalidCase{"NegativeRescanGrace", "discovery:\n  rescan_grace_ms: -1\n", "rescan_grace_ms"},
                      InvalidCase{"RelativeManifestPath", "resolver:\n  manifest_path: manifest\n", "manifest_path"},
                      InvalidCase{"ShortResolverTimeout", "resolver:\n  timeout_ms: 10\n", "resolver.timeout_ms"},
                      InvalidCase{"TooManyRetries", "resolver:\n  max_retries: 11\n", "max_retries"},
                      InvalidCase{"BackoffMaxBelowInitial",
                                  "resolver:\n  backoff_initial_ms: 500\n  backoff_max_ms: 100\n", "backoff_max_ms"},
                      InvalidCase{"NoWorkers", "resolver:\n  workers: 0\n", "workers"},
                      InvalidCase{"ShortDispatchTimeout", "dispatch:\n  timeout_ms: 5\n", "dispatch.timeout_ms"},
                      InvalidCase{"ShortStaleWindow", "health:\n  stale_after_ms: 10\n", "stale_after_ms"},
                      InvalidCase{"ZeroFailureThreshold", "health:\n  unreachable_after_failures: 0\n",
                                  "unreachable_after_failures"},
                      InvalidCase{"EmptyPersistencePath", "persistence:\n  path: ''\n", "persistence.path"}),
    [](const ::testing::TestParamInfo<InvalidCase>& info) { return std::string(info.param.name); });
