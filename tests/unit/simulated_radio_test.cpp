/**
 * simulated_radio_test.cpp - Simulated radio back end
 *
 * Most tests run with zero latency so start/stop complete inline on the
 * calling thread. One test runs the timer thread with real latencies.
 */

#include "sim/simulated_radio.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>

#include "mocks/mock_collaborators.hpp"
#include "mocks/mock_mode_manager.hpp"

using namespace modewarden;
using namespace modewarden::tests;
using modes::Role;

class SimulatedRadioTest : public Test {
protected:
    void SetUp() override {
        config.start_latency_ms = 0;
        config.stop_latency_ms = 0;
        listener = std::make_shared<NiceMock<MockModeManagerListener>>();
        second_listener = std::make_shared<NiceMock<MockModeManagerListener>>();
        ap_callback = std::make_shared<NiceMock<MockAccessPointCallback>>();
    }

    std::unique_ptr<sim::SimulatedRadio> make_radio() { return std::make_unique<sim::SimulatedRadio>(config); }

    static modes::ApModeConfiguration tethered(modes::ApBand band = modes::ApBand::BAND_2GHZ) {
        modes::ApModeConfiguration result;
        modes::ApConfig softap;
        softap.ssid = "hotspot";
        softap.band = band;
        result.config = softap;
        return result;
    }

    sim::SimulationConfig config;
    std::shared_ptr<NiceMock<MockModeManagerListener>> listener;
    std::shared_ptr<NiceMock<MockModeManagerListener>> second_listener;
    std::shared_ptr<NiceMock<MockAccessPointCallback>> ap_callback;
    modes::WorkSource requestor{1000, "settings"};
};

TEST_F(SimulatedRadioTest, ClientStartAndStopManageInterfaces) {
    auto radio = make_radio();
    auto client = radio->make_client_mode_manager(listener, requestor, Role::CLIENT_PRIMARY, false);
    ASSERT_NE(client, nullptr);

    EXPECT_CALL(*listener, on_started()).Times(1);
    client->start();
    EXPECT_EQ(client->interface_name(), "wlan0");
    EXPECT_EQ(radio->client_interfaces_in_use(), 1u);

    EXPECT_CALL(*listener, on_stopped()).Times(1);
    client->stop();
    EXPECT_EQ(client->interface_name(), "");
    EXPECT_EQ(radio->client_interfaces_in_use(), 0u);

    // Stopped managers ignore further requests
    client->stop();
    client->start();
}

TEST_F(SimulatedRadioTest, ConfiguredRoleFailsToStart) {
    config.fail_start_roles = {Role::CLIENT_SECONDARY_TRANSIENT};
    auto radio = make_radio();
    auto client = radio->make_client_mode_manager(listener, requestor, Role::CLIENT_SECONDARY_TRANSIENT, false);

    EXPECT_CALL(*listener, on_started()).Times(0);
    EXPECT_CALL(*listener, on_start_failure()).Times(1);
    client->start();
    EXPECT_EQ(radio->client_interfaces_in_use(), 0u);
}

TEST_F(SimulatedRadioTest, ClientInterfaceLimit) {
    config.max_client_interfaces = 1;
    auto radio = make_radio();
    EXPECT_FALSE(radio->is_sta_sta_concurrency_supported());

    auto first = radio->make_client_mode_manager(listener, requestor, Role::CLIENT_PRIMARY, false);
    first->start();
    EXPECT_FALSE(radio->can_create_client_interface(requestor));

    auto second = radio->make_client_mode_manager(second_listener, requestor, Role::CLIENT_LOCAL_ONLY, false);
    EXPECT_CALL(*second_listener, on_start_failure()).Times(1);
    second->start();
}

TEST_F(SimulatedRadioTest, FactoryRejectsMismatchedRole) {
    auto radio = make_radio();
    EXPECT_EQ(radio->make_client_mode_manager(listener, requestor, Role::AP_TETHERED, false), nullptr);
    EXPECT_EQ(radio->make_access_point_manager(listener, ap_callback, tethered(), requestor, Role::CLIENT_PRIMARY,
                                               false),
              nullptr);
    EXPECT_EQ(radio->make_client_mode_manager(nullptr, requestor, Role::CLIENT_PRIMARY, false), nullptr);
}

TEST_F(SimulatedRadioTest, AccessPointReportsLifecycle) {
    auto radio = make_radio();
    auto ap = radio->make_access_point_manager(listener, ap_callback, tethered(modes::ApBand::BAND_5GHZ), requestor,
                                               Role::AP_TETHERED, false);
    ASSERT_NE(ap, nullptr);

    {
        InSequence seq;
        EXPECT_CALL(*ap_callback, on_state_changed(modes::ApState::ENABLING, _));
        EXPECT_CALL(*ap_callback, on_state_changed(modes::ApState::ENABLED, _));
        EXPECT_CALL(*ap_callback, on_info_changed(Field(&modes::ApInfo::frequency_mhz, 5180)));
        EXPECT_CALL(*listener, on_started());
        EXPECT_CALL(*ap_callback, on_state_changed(modes::ApState::DISABLING, _));
        EXPECT_CALL(*ap_callback, on_state_changed(modes::ApState::DISABLED, _));
        EXPECT_CALL(*listener, on_stopped());
    }

    ap->start();
    EXPECT_EQ(ap->interface_name(), "ap0");
    EXPECT_FALSE(radio->can_create_ap_interface(requestor));

    ap->stop();
    EXPECT_EQ(radio->ap_interfaces_in_use(), 0u);
    EXPECT_TRUE(radio->can_create_ap_interface(requestor));
}

TEST_F(SimulatedRadioTest, AccessPointFailureReportsFailedState) {
    config.max_ap_interfaces = 0;
    auto radio = make_radio();
    auto ap = radio->make_access_point_manager(listener, ap_callback, tethered(), requestor, Role::AP_TETHERED, false);

    EXPECT_CALL(*ap_callback, on_state_changed(_, _)).Times(AnyNumber());
    EXPECT_CALL(*ap_callback, on_state_changed(modes::ApState::FAILED, modes::ApStartFailure::GENERAL)).Times(1);
    EXPECT_CALL(*listener, on_start_failure()).Times(1);
    ap->start();
}

TEST_F(SimulatedRadioTest, AccessPointPreemptsClientsWithoutStaApConcurrency) {
    config.sta_ap_concurrency = false;
    auto radio = make_radio();
    EXPECT_FALSE(radio->is_sta_ap_concurrency_supported());

    auto client = radio->make_client_mode_manager(listener, requestor, Role::CLIENT_PRIMARY, false);
    client->start();

    EXPECT_CALL(*listener, on_stopped()).Times(1);
    auto ap = radio->make_access_point_manager(second_listener, ap_callback, tethered(), requestor, Role::AP_TETHERED,
                                               false);
    ap->start();

    EXPECT_EQ(radio->client_interfaces_in_use(), 0u);
    EXPECT_FALSE(radio->can_create_client_interface(requestor));
}

TEST_F(SimulatedRadioTest, ConnectedNetworkOnlyForConnectivityRoles) {
    auto radio = make_radio();
    radio->set_connected_network(modes::NetworkTarget{"home", ""});

    auto primary = radio->make_client_mode_manager(listener, requestor, Role::CLIENT_PRIMARY, false);
    auto scanner = radio->make_client_mode_manager(second_listener, requestor, Role::CLIENT_SCAN_ONLY, false);

    EXPECT_FALSE(primary->connected_network().has_value());

    primary->start();
    scanner->start();

    ASSERT_TRUE(primary->connected_network().has_value());
    EXPECT_EQ(primary->connected_network()->ssid, "home");
    EXPECT_FALSE(scanner->connected_network().has_value());
}

TEST_F(SimulatedRadioTest, SetRoleReportsRoleChanged) {
    auto radio = make_radio();
    radio->set_connected_network(modes::NetworkTarget{"home", ""});
    auto client = radio->make_client_mode_manager(listener, requestor, Role::CLIENT_SCAN_ONLY, false);
    client->start();

    EXPECT_CALL(*listener, on_role_changed()).Times(1);
    client->set_role(Role::CLIENT_PRIMARY, requestor);

    EXPECT_TRUE(client->connected_network().has_value());
}

TEST_F(SimulatedRadioTest, RecordsMultiStaHints) {
    auto radio = make_radio();
    EXPECT_FALSE(radio->multi_sta_use_case().has_value());

    radio->set_multi_sta_use_case(modes::MultiStaUseCase::DUAL_STA_TRANSIENT_PREFER_PRIMARY);
    radio->set_multi_sta_primary_connection("wlan0");

    EXPECT_EQ(radio->multi_sta_use_case(), modes::MultiStaUseCase::DUAL_STA_TRANSIENT_PREFER_PRIMARY);
    EXPECT_EQ(radio->multi_sta_primary_interface(), "wlan0");
}

TEST_F(SimulatedRadioTest, TimerThreadCompletesWithLatency) {
    config.start_latency_ms = 20;
    config.stop_latency_ms = 10;
    auto radio = make_radio();
    ASSERT_TRUE(radio->start());
    EXPECT_FALSE(radio->start());

    std::promise<void> started;
    EXPECT_CALL(*listener, on_started()).WillOnce(Invoke([&started] { started.set_value(); }));

    auto client = radio->make_client_mode_manager(listener, requestor, Role::CLIENT_PRIMARY, false);
    client->start();

    // Nothing completes inline once the timer is running
    EXPECT_EQ(client->interface_name(), "");

    auto future = started.get_future();
    ASSERT_EQ(future.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(client->interface_name(), "wlan0");

    radio->stop();
}
