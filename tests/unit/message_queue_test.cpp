/**
 * message_queue_test.cpp - MessageQueue ordering and delayed delivery
 *
 * Tests:
 * 1. FIFO dispatch on the calling thread
 * 2. Messages posted by the handler are drained in the same pass
 * 3. Delayed messages wait for the injected clock
 * 4. A due delayed message queues behind ready messages
 * 5. Handler exceptions do not stop the drain
 * 6. Worker thread lifecycle
 */

#include "orchestrator/message_queue.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace modewarden;
using namespace modewarden::orchestrator;
using namespace std::chrono_literals;

class MessageQueueTest : public ::testing::Test {
protected:
    void SetUp() override {
        now = std::chrono::steady_clock::time_point{} + 1h;
        queue = std::make_unique<MessageQueue>([this] { return now; });
        queue->set_handler([this](const Message &message) { handled.push_back(message_name(message)); });
    }

    MessageQueue::TimePoint now;
    std::unique_ptr<MessageQueue> queue;
    std::vector<std::string> handled;
};

TEST_F(MessageQueueTest, DispatchesInPostingOrder) {
    queue->post(msg::Boot{});
    queue->post(msg::LocationModeChanged{});
    queue->post(msg::AirplaneModeToggled{});

    EXPECT_EQ(queue->pending(), 3u);
    EXPECT_EQ(queue->dispatch_all(), 3u);

    ASSERT_EQ(handled.size(), 3u);
    EXPECT_EQ(handled[0], "Boot");
    EXPECT_EQ(handled[1], "LocationModeChanged");
    EXPECT_EQ(handled[2], "AirplaneModeToggled");
    EXPECT_EQ(queue->pending(), 0u);
}

TEST_F(MessageQueueTest, HandlerPostsAreDrainedInSamePass) {
    queue->set_handler([this](const Message &message) {
        handled.push_back(message_name(message));
        if (std::holds_alternative<msg::Boot>(message)) {
            queue->post(msg::HardwareFault{});
        }
    });

    queue->post(msg::Boot{});
    queue->post(msg::RecoveryDisable{});

    EXPECT_EQ(queue->dispatch_all(), 3u);
    ASSERT_EQ(handled.size(), 3u);
    EXPECT_EQ(handled[0], "Boot");
    EXPECT_EQ(handled[1], "RecoveryDisable");
    EXPECT_EQ(handled[2], "HardwareFault");
}

TEST_F(MessageQueueTest, DelayedMessageWaitsForClock) {
    queue->post_delayed(msg::RecoveryContinue{7}, 2000ms);

    EXPECT_EQ(queue->dispatch_all(), 0u);
    EXPECT_EQ(queue->pending_delayed(), 1u);

    now += 1999ms;
    EXPECT_EQ(queue->dispatch_all(), 0u);

    now += 1ms;
    EXPECT_EQ(queue->dispatch_all(), 1u);
    ASSERT_EQ(handled.size(), 1u);
    EXPECT_EQ(handled[0], "RecoveryContinue");
    EXPECT_EQ(queue->pending_delayed(), 0u);
}

TEST_F(MessageQueueTest, DelayedMessagesKeepDueOrder) {
    queue->post_delayed(msg::RecoveryDisable{}, 50ms);
    queue->post_delayed(msg::HardwareFault{}, 10ms);
    queue->post_delayed(msg::LocationModeChanged{}, 10ms);

    now += 100ms;
    queue->post(msg::Boot{});
    queue->dispatch_all();

    ASSERT_EQ(handled.size(), 4u);
    EXPECT_EQ(handled[0], "Boot");
    EXPECT_EQ(handled[1], "HardwareFault");
    EXPECT_EQ(handled[2], "LocationModeChanged");
    EXPECT_EQ(handled[3], "RecoveryDisable");
}

TEST_F(MessageQueueTest, HandlerExceptionDoesNotStopDrain) {
    queue->set_handler([this](const Message &message) {
        if (std::holds_alternative<msg::Boot>(message)) {
            throw std::runtime_error("boom");
        }
        handled.push_back(message_name(message));
    });

    queue->post(msg::Boot{});
    queue->post(msg::HardwareFault{});

    EXPECT_EQ(queue->dispatch_all(), 2u);
    ASSERT_EQ(handled.size(), 1u);
    EXPECT_EQ(handled[0], "HardwareFault");
}

TEST_F(MessageQueueTest, StartRequiresHandler) {
    MessageQueue bare;
    EXPECT_FALSE(bare.start());
    EXPECT_FALSE(bare.is_running());
}

TEST(MessageQueueWorkerTest, WorkerDeliversMessages) {
    MessageQueue queue;
    std::mutex mutex;
    std::vector<std::string> handled;
    queue.set_handler([&](const Message &message) {
        std::lock_guard<std::mutex> lock(mutex);
        handled.push_back(message_name(message));
    });

    ASSERT_TRUE(queue.start());
    EXPECT_TRUE(queue.is_running());
    EXPECT_FALSE(queue.start());

    queue.post(msg::Boot{});
    queue.post_delayed(msg::HardwareFault{}, 20ms);

    // dispatch_all() is refused while the worker owns the queue
    EXPECT_EQ(queue.dispatch_all(), 0u);

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (std::chrono::steady_clock::now() < deadline) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (handled.size() == 2) {
                break;
            }
        }
        std::this_thread::sleep_for(5ms);
    }

    queue.stop();
    EXPECT_FALSE(queue.is_running());

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(handled.size(), 2u);
    EXPECT_EQ(handled[0], "Boot");
    EXPECT_EQ(handled[1], "HardwareFault");
}
