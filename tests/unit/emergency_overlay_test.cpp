/**
 * emergency_overlay_test.cpp - Emergency overlay latch and debouncing
 *
 * Two independent signals (callback mode, call state) latch the overlay.
 * Enter fires once on the first signal, exit once when both clear, and an
 * exit with teardown still in flight is parked until teardown completes.
 */

#include "orchestrator/emergency_overlay.hpp"

#include <gtest/gtest.h>

using namespace modewarden::orchestrator;

TEST(EmergencyOverlayTest, StartsInactive) {
    EmergencyOverlay overlay;
    EXPECT_FALSE(overlay.is_active());
    EXPECT_EQ(overlay.state(), EmergencyState::NONE);
    EXPECT_TRUE(overlay.tracks_call_state());
}

TEST(EmergencyOverlayTest, SingleSignalEntersAndExits) {
    EmergencyOverlay overlay;

    EXPECT_EQ(overlay.set_callback_mode_active(true, false), EmergencyTransition::ENTER);
    EXPECT_TRUE(overlay.is_active());
    EXPECT_EQ(overlay.state(), EmergencyState::ACTIVE);

    EXPECT_EQ(overlay.set_callback_mode_active(false, false), EmergencyTransition::EXIT);
    EXPECT_FALSE(overlay.is_active());
}

TEST(EmergencyOverlayTest, DuplicateSignalsDoNotRepeatTransitions) {
    EmergencyOverlay overlay;

    EXPECT_EQ(overlay.set_callback_mode_active(true, false), EmergencyTransition::ENTER);
    EXPECT_EQ(overlay.set_callback_mode_active(true, false), EmergencyTransition::NONE);

    EXPECT_EQ(overlay.set_callback_mode_active(false, false), EmergencyTransition::EXIT);
    EXPECT_EQ(overlay.set_callback_mode_active(false, false), EmergencyTransition::NONE);
}

TEST(EmergencyOverlayTest, OverlappingSignalsEnterOnceExitOnce) {
    EmergencyOverlay overlay;

    EXPECT_EQ(overlay.set_callback_mode_active(true, false), EmergencyTransition::ENTER);
    EXPECT_EQ(overlay.set_call_state_active(true, false), EmergencyTransition::NONE);

    // One signal still latched
    EXPECT_EQ(overlay.set_callback_mode_active(false, false), EmergencyTransition::NONE);
    EXPECT_TRUE(overlay.is_active());

    EXPECT_EQ(overlay.set_call_state_active(false, false), EmergencyTransition::EXIT);
    EXPECT_FALSE(overlay.is_active());
}

TEST(EmergencyOverlayTest, OutOfOrderClearBeforeSet) {
    EmergencyOverlay overlay;

    // A stray "off" before any "on" is a no-op
    EXPECT_EQ(overlay.set_call_state_active(false, false), EmergencyTransition::NONE);
    EXPECT_EQ(overlay.set_call_state_active(true, false), EmergencyTransition::ENTER);
    EXPECT_EQ(overlay.set_callback_mode_active(false, false), EmergencyTransition::NONE);
    EXPECT_TRUE(overlay.is_active());
}

TEST(EmergencyOverlayTest, ExitDeferredWhileTeardownInFlight) {
    EmergencyOverlay overlay;

    overlay.set_callback_mode_active(true, false);
    EXPECT_EQ(overlay.set_callback_mode_active(false, true), EmergencyTransition::EXIT_PENDING);
    EXPECT_EQ(overlay.state(), EmergencyState::ACTIVE_PENDING_EXIT);
    EXPECT_TRUE(overlay.is_active());

    EXPECT_EQ(overlay.on_teardown_complete(), EmergencyTransition::EXIT);
    EXPECT_EQ(overlay.state(), EmergencyState::NONE);

    // Nothing left to complete
    EXPECT_EQ(overlay.on_teardown_complete(), EmergencyTransition::NONE);
}

TEST(EmergencyOverlayTest, ReentryCancelsPendingExit) {
    EmergencyOverlay overlay;

    overlay.set_callback_mode_active(true, false);
    overlay.set_callback_mode_active(false, true);
    ASSERT_EQ(overlay.state(), EmergencyState::ACTIVE_PENDING_EXIT);

    EXPECT_EQ(overlay.set_call_state_active(true, false), EmergencyTransition::RESUMED);
    EXPECT_EQ(overlay.state(), EmergencyState::ACTIVE);

    // Teardown completing now must not end the emergency
    EXPECT_EQ(overlay.on_teardown_complete(), EmergencyTransition::NONE);
    EXPECT_TRUE(overlay.is_active());
}

TEST(EmergencyOverlayTest, CallStateIgnoredWhenNotTracked) {
    EmergencyOverlay overlay(false);

    EXPECT_FALSE(overlay.tracks_call_state());
    EXPECT_EQ(overlay.set_call_state_active(true, false), EmergencyTransition::NONE);
    EXPECT_FALSE(overlay.is_active());
    EXPECT_FALSE(overlay.call_state_active());

    EXPECT_EQ(overlay.set_callback_mode_active(true, false), EmergencyTransition::ENTER);
}

TEST(EmergencyOverlayTest, ClientAxisFlag) {
    EmergencyOverlay overlay;
    EXPECT_FALSE(overlay.client_axis_disabled());
    overlay.set_client_axis_disabled(true);
    EXPECT_TRUE(overlay.client_axis_disabled());
}
