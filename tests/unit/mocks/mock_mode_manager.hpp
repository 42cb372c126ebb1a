#pragma once
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <string>

#include "modes/mode_manager.hpp"
#include "modes/mode_manager_factory.hpp"

namespace modewarden::tests {

using namespace testing;

class MockModeManagerListener : public modes::ModeManagerListener {
public:
    MOCK_METHOD(void, on_started, (), (override));
    MOCK_METHOD(void, on_start_failure, (), (override));
    MOCK_METHOD(void, on_stopped, (), (override));
    MOCK_METHOD(void, on_role_changed, (), (override));
};

class MockClientModeManager : public modes::ClientModeManager {
public:
    MOCK_METHOD(void, start, (), (override));
    MOCK_METHOD(void, stop, (), (override));
    MOCK_METHOD(std::string, interface_name, (), (const, override));
    MOCK_METHOD(void, enable_verbose_logging, (bool), (override));
    MOCK_METHOD(void, set_role, (modes::Role, const modes::WorkSource &), (override));
    MOCK_METHOD(std::optional<modes::NetworkTarget>, connected_network, (), (const, override));

    // Captured at creation so tests can drive lifecycle events
    std::shared_ptr<modes::ModeManagerListener> listener;
    modes::Role created_role = modes::Role::CLIENT_PRIMARY;
    modes::WorkSource requestor;
    bool verbose = false;
};

class MockAccessPointManager : public modes::AccessPointManager {
public:
    MOCK_METHOD(void, start, (), (override));
    MOCK_METHOD(void, stop, (), (override));
    MOCK_METHOD(std::string, interface_name, (), (const, override));
    MOCK_METHOD(void, enable_verbose_logging, (bool), (override));
    MOCK_METHOD(void, update_capability, (const modes::ApCapability &), (override));
    MOCK_METHOD(void, update_configuration, (const modes::ApConfig &), (override));

    std::shared_ptr<modes::ModeManagerListener> listener;
    std::shared_ptr<modes::AccessPointCallback> callback;
    modes::ApModeConfiguration config;
    modes::WorkSource requestor;
    bool verbose = false;
};

class MockModeManagerFactory : public modes::ModeManagerFactory {
public:
    MOCK_METHOD(std::shared_ptr<modes::ClientModeManager>, make_client_mode_manager,
                (std::shared_ptr<modes::ModeManagerListener>, const modes::WorkSource &, modes::Role, bool),
                (override));
    MOCK_METHOD(std::shared_ptr<modes::AccessPointManager>, make_access_point_manager,
                (std::shared_ptr<modes::ModeManagerListener>, std::shared_ptr<modes::AccessPointCallback>,
                 const modes::ApModeConfiguration &, const modes::WorkSource &, modes::Role, bool),
                (override));
};

}  // namespace modewarden::tests
