#include "runtime/config.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using namespace modewarden;
using namespace modewarden::runtime;

class ConfigTest : public ::testing::Test {
protected:
    fs::path temp_dir;

    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "modewarden_config_test";
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    std::string create_config_file(const std::string &name, const std::string &content) {
        fs::path config_path = temp_dir / name;
        std::ofstream file(config_path);
        file << content;
        file.close();
        return config_path.string();
    }
};

TEST_F(ConfigTest, EmptyFileKeepsDefaults) {
    std::string config_path = create_config_file("empty.yaml", "{}\n");
    RuntimeConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
    EXPECT_EQ(config.logging.level, "info");
    EXPECT_EQ(config.runtime.status_interval_ms, 10000);
    EXPECT_EQ(config.orchestrator.recovery_delay_ms, 2000);
    EXPECT_TRUE(config.orchestrator.track_emergency_call_state);
    EXPECT_FALSE(config.orchestrator.concurrency.local_only_enabled);
    EXPECT_EQ(config.recovery.max_restarts_in_window, 2);
    EXPECT_TRUE(config.settings.wifi_enabled);
    EXPECT_EQ(config.simulation.max_client_interfaces, 2);
}

TEST_F(ConfigTest, FullConfig) {
    std::string config_content = R"(
runtime:
  name: bench-1
  status_interval_ms: 0

logging:
  level: debug

orchestrator:
  recovery_delay_ms: 1500
  verbose_logging: true
  track_emergency_call_state: false

concurrency:
  local_only_enabled: true
  secondary_long_lived_enabled: true
  secondary_transient_enabled: false

recovery:
  max_restarts_in_window: 5
  restart_window_ms: 600000

settings:
  wifi_enabled: false
  scan_always_available: true
  airplane_mode: true
  location_mode: false
  disable_wifi_in_emergency: true

simulation:
  start_latency_ms: 10
  stop_latency_ms: 5
  max_client_interfaces: 3
  max_ap_interfaces: 2
  sta_ap_concurrency: false
  fail_start_roles: [CLIENT_SECONDARY_TRANSIENT, AP_LOCAL_ONLY]
)";

    std::string config_path = create_config_file("full.yaml", config_content);
    RuntimeConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
    EXPECT_EQ(config.runtime.name, "bench-1");
    EXPECT_EQ(config.runtime.status_interval_ms, 0);
    EXPECT_EQ(config.logging.level, "debug");

    EXPECT_EQ(config.orchestrator.recovery_delay_ms, 1500);
    EXPECT_TRUE(config.orchestrator.verbose_logging);
    EXPECT_FALSE(config.orchestrator.track_emergency_call_state);
    EXPECT_TRUE(config.orchestrator.concurrency.local_only_enabled);
    EXPECT_TRUE(config.orchestrator.concurrency.secondary_long_lived_enabled);
    EXPECT_FALSE(config.orchestrator.concurrency.secondary_transient_enabled);

    EXPECT_EQ(config.recovery.max_restarts_in_window, 5);
    EXPECT_EQ(config.recovery.restart_window_ms, 600000);

    EXPECT_FALSE(config.settings.wifi_enabled);
    EXPECT_TRUE(config.settings.scan_always_available);
    EXPECT_TRUE(config.settings.airplane_mode);
    EXPECT_FALSE(config.settings.location_mode);
    EXPECT_TRUE(config.settings.disable_wifi_in_emergency);

    EXPECT_EQ(config.simulation.start_latency_ms, 10);
    EXPECT_EQ(config.simulation.stop_latency_ms, 5);
    EXPECT_EQ(config.simulation.max_client_interfaces, 3);
    EXPECT_EQ(config.simulation.max_ap_interfaces, 2);
    EXPECT_FALSE(config.simulation.sta_ap_concurrency);
    ASSERT_EQ(config.simulation.fail_start_roles.size(), 2u);
    EXPECT_EQ(config.simulation.fail_start_roles[0], modes::Role::CLIENT_SECONDARY_TRANSIENT);
    EXPECT_EQ(config.simulation.fail_start_roles[1], modes::Role::AP_LOCAL_ONLY);
}

TEST_F(ConfigTest, RecoveryDelayClampedToCeiling) {
    std::string config_content = R"(
orchestrator:
  recovery_delay_ms: 30000
)";

    std::string config_path = create_config_file("clamp.yaml", config_content);
    RuntimeConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
    EXPECT_EQ(config.orchestrator.recovery_delay_ms, orchestrator::kMaxRecoveryDelayMs);
}

TEST_F(ConfigTest, InvalidFailStartRole) {
    std::string config_content = R"(
simulation:
  fail_start_roles: [CLIENT_PRIMARY, MESH_POINT]
)";

    std::string config_path = create_config_file("bad_role.yaml", config_content);
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("MESH_POINT"), std::string::npos);
}

TEST_F(ConfigTest, FailStartRolesParsingIsIdempotent) {
    std::string config_content = R"(
simulation:
  fail_start_roles: [AP_TETHERED]
)";

    std::string config_path = create_config_file("roles.yaml", config_content);
    RuntimeConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
    ASSERT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
    EXPECT_EQ(config.simulation.fail_start_roles.size(), 1u);
}

TEST_F(ConfigTest, InvalidLogLevel) {
    std::string config_content = R"(
logging:
  level: verbose
)";

    std::string config_path = create_config_file("bad_level.yaml", config_content);
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("Invalid log level"), std::string::npos);
}

TEST_F(ConfigTest, UnknownTopLevelKeyIsIgnored) {
    std::string config_content = R"(
http:
  port: 8080

logging:
  level: warn
)";

    std::string config_path = create_config_file("unknown.yaml", config_content);
    RuntimeConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
    EXPECT_EQ(config.logging.level, "warn");
}

TEST_F(ConfigTest, MissingFile) {
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(load_config((temp_dir / "missing.yaml").string(), config, error));
    EXPECT_NE(error.find("Cannot open config file"), std::string::npos);
}

TEST_F(ConfigTest, MalformedYaml) {
    std::string config_path = create_config_file("malformed.yaml", "logging: [level: info\n");
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_FALSE(error.empty());
}

TEST_F(ConfigTest, WrongValueType) {
    std::string config_content = R"(
recovery:
  max_restarts_in_window: many
)";

    std::string config_path = create_config_file("wrong_type.yaml", config_content);
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_FALSE(error.empty());
}

// ============================================================================
// validate_config ranges
// ============================================================================

TEST(ValidateConfigTest, DefaultsAreValid) {
    RuntimeConfig config;
    std::string error;
    EXPECT_TRUE(validate_config(config, error)) << error;
}

TEST(ValidateConfigTest, RejectsNegativeRecoveryDelay) {
    RuntimeConfig config;
    config.orchestrator.recovery_delay_ms = -1;
    std::string error;
    EXPECT_FALSE(validate_config(config, error));
    EXPECT_NE(error.find("recovery_delay_ms"), std::string::npos);
}

TEST(ValidateConfigTest, RejectsShortRestartWindow) {
    RuntimeConfig config;
    config.recovery.restart_window_ms = 500;
    std::string error;
    EXPECT_FALSE(validate_config(config, error));
    EXPECT_NE(error.find("restart_window_ms"), std::string::npos);
}

TEST(ValidateConfigTest, RejectsNegativeStatusInterval) {
    RuntimeConfig config;
    config.runtime.status_interval_ms = -5;
    std::string error;
    EXPECT_FALSE(validate_config(config, error));
}

TEST(ValidateConfigTest, RejectsRadioWithoutClientInterface) {
    RuntimeConfig config;
    config.simulation.max_client_interfaces = 0;
    std::string error;
    EXPECT_FALSE(validate_config(config, error));
    EXPECT_NE(error.find("max_client_interfaces"), std::string::npos);
}

TEST(ValidateConfigTest, RejectsNegativeLatency) {
    RuntimeConfig config;
    config.simulation.stop_latency_ms = -1;
    std::string error;
    EXPECT_FALSE(validate_config(config, error));
}
