#pragma once

#include <optional>
#include <string>

#include "modes/mode_types.hpp"

namespace modewarden {
namespace modes {

/**
 * Lifecycle events a mode manager reports back to the orchestrator.
 *
 * Managers may call these from any thread; the orchestrator's listener
 * implementation only enqueues a message, it never touches orchestrator state.
 */
class ModeManagerListener {
public:
    virtual ~ModeManagerListener() = default;

    // Start completed, the manager is running
    virtual void on_started() = 0;

    // Start (or a role switch) failed; the manager will not run
    virtual void on_start_failure() = 0;

    // Stop completed; the handle must not be used afterwards
    virtual void on_stopped() = 0;

    // An in-place role switch completed
    virtual void on_role_changed() = 0;
};

/**
 * Unit implementing one radio role.
 *
 * start()/stop() are fire-and-forget: completion is observed later through the
 * listener handed to the factory. The concrete radio work happens outside the
 * orchestrator.
 */
class ModeManager {
public:
    virtual ~ModeManager() = default;

    virtual void start() = 0;
    virtual void stop() = 0;

    // Interface name, empty until the manager is running
    virtual std::string interface_name() const = 0;

    virtual void enable_verbose_logging(bool verbose) = 0;
};

class ClientModeManager : public ModeManager {
public:
    /**
     * Switch role in place (e.g. scan-only -> primary).
     * Completion is reported through on_role_changed(), failure through on_start_failure().
     */
    virtual void set_role(Role role, const WorkSource &requestor) = 0;

    // Network the manager is connected or connecting to, if any
    virtual std::optional<NetworkTarget> connected_network() const = 0;
};

class AccessPointManager : public ModeManager {
public:
    virtual void update_capability(const ApCapability &capability) = 0;
    virtual void update_configuration(const ApConfig &config) = 0;
};

/**
 * Observer for access point state, scoped per AP role.
 *
 * One callback serves the tethered role, another the local-only hotspot role;
 * the orchestrator hands each AP manager the callback matching its role.
 */
class AccessPointCallback {
public:
    virtual ~AccessPointCallback() = default;

    virtual void on_state_changed(ApState state, ApStartFailure failure) = 0;
    virtual void on_connected_clients_changed(int client_count) = 0;
    virtual void on_info_changed(const ApInfo &info) = 0;
};

}  // namespace modes
}  // namespace modewarden
