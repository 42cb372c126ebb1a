#include "modes/mode_types.hpp"

#include <gtest/gtest.h>

#include "orchestrator/json.hpp"

using namespace modewarden;
using modes::Role;

// ============================================================================
// Role classification
// ============================================================================

TEST(ModeTypesTest, RoleNamesRoundTrip) {
    for (Role role : {Role::CLIENT_PRIMARY, Role::CLIENT_SCAN_ONLY, Role::CLIENT_LOCAL_ONLY,
                      Role::CLIENT_SECONDARY_LONG_LIVED, Role::CLIENT_SECONDARY_TRANSIENT, Role::AP_TETHERED,
                      Role::AP_LOCAL_ONLY}) {
        auto parsed = modes::string_to_role(modes::role_to_string(role));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, role);
    }
    EXPECT_FALSE(modes::string_to_role("client_primary").has_value());
}

TEST(ModeTypesTest, RoleClassification) {
    EXPECT_TRUE(modes::is_client_role(Role::CLIENT_SCAN_ONLY));
    EXPECT_FALSE(modes::is_client_role(Role::AP_TETHERED));
    EXPECT_TRUE(modes::is_ap_role(Role::AP_LOCAL_ONLY));

    EXPECT_FALSE(modes::is_connectivity_role(Role::CLIENT_SCAN_ONLY));
    EXPECT_TRUE(modes::is_connectivity_role(Role::CLIENT_LOCAL_ONLY));

    EXPECT_TRUE(modes::is_internet_connectivity_role(Role::CLIENT_PRIMARY));
    EXPECT_TRUE(modes::is_internet_connectivity_role(Role::CLIENT_SECONDARY_LONG_LIVED));
    EXPECT_FALSE(modes::is_internet_connectivity_role(Role::CLIENT_SECONDARY_TRANSIENT));

    EXPECT_TRUE(modes::is_additional_client_role(Role::CLIENT_SECONDARY_TRANSIENT));
    EXPECT_FALSE(modes::is_additional_client_role(Role::CLIENT_PRIMARY));
}

TEST(ModeTypesTest, RecoveryReasonStrings) {
    EXPECT_STREQ(modes::recovery_reason_to_string(modes::RecoveryReason::STA_IFACE_DOWN), "Sta Interface Down");
    EXPECT_STREQ(modes::recovery_reason_to_string(modes::RecoveryReason::API_CALL_TIMEOUT), "API call timeout");
}

// ============================================================================
// Network matching
// ============================================================================

TEST(ModeTypesTest, NetworkTargetMatching) {
    modes::NetworkTarget any_bssid{"home", ""};
    modes::NetworkTarget exact{"home", "aa:bb:cc:dd:ee:01"};
    modes::NetworkTarget other_ap{"home", "aa:bb:cc:dd:ee:02"};

    EXPECT_TRUE(any_bssid.matches(exact));
    EXPECT_TRUE(exact.matches(any_bssid));
    EXPECT_TRUE(exact.matches(exact));
    EXPECT_FALSE(exact.matches(other_ap));
    EXPECT_FALSE(any_bssid.matches(modes::NetworkTarget{"cafe", ""}));
    EXPECT_FALSE(modes::NetworkTarget{}.matches(modes::NetworkTarget{}));
}

TEST(ModeTypesTest, ApModeConfigurationEquality) {
    modes::ApModeConfiguration a;
    modes::ApConfig config;
    config.ssid = "hotspot";
    a.config = config;

    modes::ApModeConfiguration b = a;
    EXPECT_TRUE(a == b);

    b.config->passphrase = "secret";
    EXPECT_FALSE(a == b);
}

// ============================================================================
// Dump encoding
// ============================================================================

TEST(DumpEncodingTest, ApConfigOmitsPassphrase) {
    modes::ApConfig config;
    config.ssid = "hotspot";
    config.passphrase = "hunter22";
    config.band = modes::ApBand::BAND_5GHZ;

    auto j = orchestrator::encode_ap_config(config);
    EXPECT_EQ(j["ssid"], "hotspot");
    EXPECT_EQ(j["band"], "5GHz");
    EXPECT_TRUE(j["secured"].get<bool>());
    EXPECT_EQ(j.dump().find("hunter22"), std::string::npos);
}

TEST(DumpEncodingTest, ManagerInfoOmitsEmptyInterface) {
    modes::ManagerInfo info;
    info.id = 7;
    info.role = Role::CLIENT_SCAN_ONLY;
    info.requestor = modes::WorkSource{1000, "settings"};

    auto j = orchestrator::encode_manager_info(info);
    EXPECT_EQ(j["id"], 7);
    EXPECT_EQ(j["role"], "CLIENT_SCAN_ONLY");
    EXPECT_EQ(j["requestor"]["package"], "settings");
    EXPECT_FALSE(j.contains("interface"));

    info.interface_name = "wlan0";
    EXPECT_EQ(orchestrator::encode_manager_info(info)["interface"], "wlan0");
}

TEST(DumpEncodingTest, MissingApConfigIsNull) {
    modes::ApModeConfiguration config;
    auto j = orchestrator::encode_ap_mode_configuration(config);
    EXPECT_TRUE(j["config"].is_null());
    EXPECT_EQ(j["target_role"], "AP_TETHERED");
}
