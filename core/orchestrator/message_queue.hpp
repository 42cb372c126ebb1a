#pragma once

/**
 * @file message_queue.hpp
 * @brief Single-consumer ordered message queue with delayed delivery
 *
 * Producers on any thread post messages; exactly one consumer processes them,
 * either the queue's own worker thread (start()/stop()) or the caller of
 * dispatch_all(). Messages are handled strictly in posting order. A delayed
 * message joins the ready queue once its due time passes, behind anything
 * already queued.
 *
 * The clock is injectable so tests can drive delayed messages without sleeping.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "orchestrator/messages.hpp"

namespace modewarden {
namespace orchestrator {

class MessageQueue {
public:
    using TimePoint = std::chrono::steady_clock::time_point;
    using Clock = std::function<TimePoint()>;
    using Handler = std::function<void(const Message &)>;

    /**
     * @param clock Time source for delayed messages (default: steady_clock::now)
     */
    explicit MessageQueue(Clock clock = nullptr);
    ~MessageQueue();

    MessageQueue(const MessageQueue &) = delete;
    MessageQueue &operator=(const MessageQueue &) = delete;

    // Must be set before the first dispatch
    void set_handler(Handler handler);

    // Thread-safe, never blocks on message processing
    void post(Message message);
    void post_delayed(Message message, std::chrono::milliseconds delay);

    /**
     * Process every message that is ready now, including messages posted by
     * the handler while draining. Only valid while the worker thread is not
     * running.
     *
     * @return Number of messages handled
     */
    size_t dispatch_all();

    // Start the worker thread; false if already running or no handler is set
    bool start();

    // Stop and join the worker thread; queued messages stay queued
    void stop();

    bool is_running() const { return running_.load(); }

    // Ready plus delayed messages
    size_t pending() const;

    // Delayed messages not yet due
    size_t pending_delayed() const;

private:
    struct DelayedMessage {
        TimePoint due;
        uint64_t sequence;
        Message message;
    };

    void run_loop();
    size_t drain();
    void promote_due_locked(TimePoint now);

    Clock clock_;
    Handler handler_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Message> ready_;
    std::vector<DelayedMessage> delayed_;  // Sorted by (due, sequence)
    uint64_t next_sequence_ = 0;

    std::atomic<bool> running_{false};
    std::unique_ptr<std::thread> worker_thread_;
};

}  // namespace orchestrator
}  // namespace modewarden
