#pragma once

#include <memory>

#include "modes/mode_manager.hpp"
#include "modes/mode_types.hpp"

namespace modewarden {
namespace modes {

/**
 * Builds concrete mode managers for a requested role.
 *
 * Returned managers are not started; the orchestrator registers them in its
 * active set and then calls start(). A null return is treated as a start failure.
 */
class ModeManagerFactory {
public:
    virtual ~ModeManagerFactory() = default;

    virtual std::shared_ptr<ClientModeManager> make_client_mode_manager(std::shared_ptr<ModeManagerListener> listener,
                                                                        const WorkSource &requestor, Role role,
                                                                        bool verbose) = 0;

    virtual std::shared_ptr<AccessPointManager> make_access_point_manager(
        std::shared_ptr<ModeManagerListener> listener, std::shared_ptr<AccessPointCallback> callback,
        const ApModeConfiguration &config, const WorkSource &requestor, Role role, bool verbose) = 0;
};

}  // namespace modes
}  // namespace modewarden
