#include "orchestrator/emergency_overlay.hpp"

#include "logging/logger.hpp"

namespace modewarden {
namespace orchestrator {

const char *emergency_state_to_string(EmergencyState state) {
    switch (state) {
        case EmergencyState::NONE:
            return "NONE";
        case EmergencyState::ACTIVE:
            return "ACTIVE";
        case EmergencyState::ACTIVE_PENDING_EXIT:
            return "ACTIVE_PENDING_EXIT";
        default:
            return "UNKNOWN";
    }
}

const char *emergency_transition_to_string(EmergencyTransition transition) {
    switch (transition) {
        case EmergencyTransition::NONE:
            return "NONE";
        case EmergencyTransition::ENTER:
            return "ENTER";
        case EmergencyTransition::EXIT_PENDING:
            return "EXIT_PENDING";
        case EmergencyTransition::EXIT:
            return "EXIT";
        case EmergencyTransition::RESUMED:
            return "RESUMED";
        default:
            return "UNKNOWN";
    }
}

EmergencyOverlay::EmergencyOverlay(bool track_call_state) : track_call_state_(track_call_state) {}

EmergencyTransition EmergencyOverlay::set_callback_mode_active(bool active, bool teardown_in_flight) {
    const bool was_latched = latched();
    callback_mode_active_ = active;
    return update(was_latched, teardown_in_flight);
}

EmergencyTransition EmergencyOverlay::set_call_state_active(bool active, bool teardown_in_flight) {
    if (!track_call_state_) {
        LOG_DEBUG("[Emergency] Ignoring call state " << (active ? "active" : "inactive") << ": tracking disabled");
        return EmergencyTransition::NONE;
    }

    const bool was_latched = latched();
    call_state_active_ = active;
    return update(was_latched, teardown_in_flight);
}

EmergencyTransition EmergencyOverlay::on_teardown_complete() {
    if (state_ != EmergencyState::ACTIVE_PENDING_EXIT || latched()) {
        return EmergencyTransition::NONE;
    }

    state_ = EmergencyState::NONE;
    LOG_INFO("[Emergency] Teardown complete, exiting emergency mode");
    return EmergencyTransition::EXIT;
}

EmergencyTransition EmergencyOverlay::update(bool was_latched, bool teardown_in_flight) {
    const bool now_latched = latched();

    if (!was_latched && now_latched) {
        if (state_ == EmergencyState::ACTIVE_PENDING_EXIT) {
            state_ = EmergencyState::ACTIVE;
            LOG_INFO("[Emergency] Re-entered before pending exit completed");
            return EmergencyTransition::RESUMED;
        }
        if (state_ == EmergencyState::NONE) {
            state_ = EmergencyState::ACTIVE;
            LOG_INFO("[Emergency] Entering emergency mode (callback=" << callback_mode_active_
                                                                     << ", call=" << call_state_active_ << ")");
            return EmergencyTransition::ENTER;
        }
        return EmergencyTransition::NONE;
    }

    if (was_latched && !now_latched && state_ == EmergencyState::ACTIVE) {
        if (teardown_in_flight) {
            state_ = EmergencyState::ACTIVE_PENDING_EXIT;
            LOG_INFO("[Emergency] Exit requested while teardown in flight, deferring");
            return EmergencyTransition::EXIT_PENDING;
        }
        state_ = EmergencyState::NONE;
        LOG_INFO("[Emergency] Exiting emergency mode");
        return EmergencyTransition::EXIT;
    }

    return EmergencyTransition::NONE;
}

}  // namespace orchestrator
}  // namespace modewarden
