#pragma once

#include <string>

namespace modewarden {
namespace orchestrator {

/**
 * Emergency sub-state, tracked independently of the Disabled/Enabled axis.
 *
 * State transitions:
 * - NONE -> ACTIVE (either latch goes true)
 * - ACTIVE -> NONE (both latches false, no emergency teardown in flight)
 * - ACTIVE -> ACTIVE_PENDING_EXIT (both latches false, teardown still in flight)
 * - ACTIVE_PENDING_EXIT -> NONE (teardown completed)
 * - ACTIVE_PENDING_EXIT -> ACTIVE (a latch goes true again, no new side effects)
 */
enum class EmergencyState { NONE, ACTIVE, ACTIVE_PENDING_EXIT };

const char *emergency_state_to_string(EmergencyState state);

/**
 * Side effect the owner must apply after a latch update.
 */
enum class EmergencyTransition {
    NONE,          // Nothing to do
    ENTER,         // Stop access points (and clients if policy says so)
    EXIT_PENDING,  // Exit requested, restore once teardown completes
    EXIT,          // Restore the client axis
    RESUMED        // Re-entered before the pending exit finished
};

const char *emergency_transition_to_string(EmergencyTransition transition);

/**
 * EmergencyOverlay - OR of the callback-mode and call-state latches.
 *
 * Pure state: the overlay never touches managers. Every latch update returns
 * the transition to apply, and repeated identical signals return NONE, so a
 * burst of duplicates yields exactly one ENTER and one EXIT.
 *
 * Not thread-safe; owned by the orchestrator's queue thread.
 */
class EmergencyOverlay {
public:
    /**
     * @param track_call_state When false, call-state signals are ignored and
     *        only the callback-mode latch drives the overlay
     */
    explicit EmergencyOverlay(bool track_call_state = true);

    /**
     * @param teardown_in_flight Managers stopped on entry have not all reported stopped yet
     */
    EmergencyTransition set_callback_mode_active(bool active, bool teardown_in_flight);
    EmergencyTransition set_call_state_active(bool active, bool teardown_in_flight);

    // Returns EXIT when a pending exit can now complete
    EmergencyTransition on_teardown_complete();

    EmergencyState state() const { return state_; }

    // True for ACTIVE and ACTIVE_PENDING_EXIT
    bool is_active() const { return state_ != EmergencyState::NONE; }

    bool callback_mode_active() const { return callback_mode_active_; }
    bool call_state_active() const { return call_state_active_; }
    bool tracks_call_state() const { return track_call_state_; }

    // Result of the disable-wifi-in-emergency policy, sampled once at entry
    void set_client_axis_disabled(bool disabled) { client_axis_disabled_ = disabled; }
    bool client_axis_disabled() const { return client_axis_disabled_; }

private:
    EmergencyTransition update(bool was_latched, bool teardown_in_flight);
    bool latched() const { return callback_mode_active_ || call_state_active_; }

    bool track_call_state_;
    bool callback_mode_active_ = false;
    bool call_state_active_ = false;
    bool client_axis_disabled_ = false;
    EmergencyState state_ = EmergencyState::NONE;
};

}  // namespace orchestrator
}  // namespace modewarden
