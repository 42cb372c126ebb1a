#include "orchestrator/broadcast_sequencer.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace modewarden;
using namespace modewarden::orchestrator;

class BroadcastSequencerTest : public ::testing::Test {
protected:
    BroadcastSequencerTest()
        : sequencer([this](modes::ManagerId source, const Broadcast &broadcast) {
              delivered.emplace_back(source, broadcast.action);
          }) {}

    std::vector<std::pair<modes::ManagerId, std::string>> delivered;
    BroadcastSequencer sequencer;
};

TEST_F(BroadcastSequencerTest, PrimaryBroadcastsDispatchImmediately) {
    sequencer.on_primary_changed(modes::kInvalidManagerId, 1);
    sequencer.enqueue(1, {"NETWORK_STATE_CHANGED", "CONNECTED"});

    ASSERT_EQ(delivered.size(), 1u);
    EXPECT_EQ(delivered[0].first, 1u);
    EXPECT_EQ(delivered[0].second, "NETWORK_STATE_CHANGED");
    EXPECT_EQ(sequencer.total_pending(), 0u);
}

TEST_F(BroadcastSequencerTest, NonPrimaryBroadcastsAreHeld) {
    sequencer.on_primary_changed(modes::kInvalidManagerId, 1);
    sequencer.enqueue(2, {"RSSI_CHANGED", ""});

    EXPECT_TRUE(delivered.empty());
    EXPECT_EQ(sequencer.pending(2), 1u);
}

TEST_F(BroadcastSequencerTest, PrimaryChangeFlushesNewPrimaryInOrder) {
    sequencer.on_primary_changed(modes::kInvalidManagerId, 1);
    sequencer.enqueue(2, {"A", ""});
    sequencer.enqueue(2, {"B", ""});
    sequencer.enqueue(3, {"C", ""});

    sequencer.on_primary_changed(1, 2);

    ASSERT_EQ(delivered.size(), 2u);
    EXPECT_EQ(delivered[0].second, "A");
    EXPECT_EQ(delivered[1].second, "B");
    EXPECT_EQ(delivered[0].first, 2u);

    // Other queues are dropped on a primary change
    EXPECT_EQ(sequencer.pending(3), 0u);
    EXPECT_EQ(sequencer.total_pending(), 0u);
    EXPECT_EQ(sequencer.current_primary(), 2u);
}

TEST_F(BroadcastSequencerTest, BroadcastsHeldWithNoPrimary) {
    sequencer.enqueue(1, {"CLIENT_MODE_STARTED", "wlan0"});
    EXPECT_TRUE(delivered.empty());

    sequencer.on_primary_changed(modes::kInvalidManagerId, 1);
    ASSERT_EQ(delivered.size(), 1u);
    EXPECT_EQ(delivered[0].second, "CLIENT_MODE_STARTED");
}

TEST_F(BroadcastSequencerTest, RemovedManagerQueueIsDiscarded) {
    sequencer.on_primary_changed(modes::kInvalidManagerId, 1);
    sequencer.enqueue(2, {"A", ""});

    sequencer.on_manager_removed(2);
    EXPECT_EQ(sequencer.pending(2), 0u);

    sequencer.on_primary_changed(1, 2);
    EXPECT_TRUE(delivered.empty());
}

TEST_F(BroadcastSequencerTest, RemovingPrimaryClearsIt) {
    sequencer.on_primary_changed(modes::kInvalidManagerId, 1);
    sequencer.on_manager_removed(1);

    EXPECT_EQ(sequencer.current_primary(), modes::kInvalidManagerId);
    sequencer.enqueue(1, {"LATE", ""});
    EXPECT_TRUE(delivered.empty());
}

TEST(BroadcastSequencerDispatcherTest, DispatcherErrorIsContained) {
    int calls = 0;
    BroadcastSequencer sequencer([&calls](modes::ManagerId, const Broadcast &) {
        ++calls;
        throw std::runtime_error("receiver gone");
    });

    sequencer.on_primary_changed(modes::kInvalidManagerId, 5);
    sequencer.enqueue(5, {"A", ""});
    sequencer.enqueue(5, {"B", ""});
    EXPECT_EQ(calls, 2);
}
