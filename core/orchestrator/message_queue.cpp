#include "orchestrator/message_queue.hpp"

#include <algorithm>
#include <exception>

#include "logging/logger.hpp"

namespace modewarden {
namespace orchestrator {

namespace {
// Upper bound on a single worker wait so an injected clock is re-read periodically
constexpr std::chrono::milliseconds kMaxIdleWait{100};
}  // namespace

MessageQueue::MessageQueue(Clock clock) : clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::steady_clock::now(); };
    }
}

MessageQueue::~MessageQueue() { stop(); }

void MessageQueue::set_handler(Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handler_ = std::move(handler);
}

void MessageQueue::post(Message message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ready_.push_back(std::move(message));
    }
    cv_.notify_one();
}

void MessageQueue::post_delayed(Message message, std::chrono::milliseconds delay) {
    if (delay.count() <= 0) {
        post(std::move(message));
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        DelayedMessage entry{clock_() + delay, next_sequence_++, std::move(message)};
        auto pos = std::upper_bound(delayed_.begin(), delayed_.end(), entry,
                                    [](const DelayedMessage &a, const DelayedMessage &b) {
                                        if (a.due != b.due) {
                                            return a.due < b.due;
                                        }
                                        return a.sequence < b.sequence;
                                    });
        delayed_.insert(pos, std::move(entry));
    }
    cv_.notify_one();
}

size_t MessageQueue::dispatch_all() {
    if (running_) {
        LOG_ERROR("[MessageQueue] dispatch_all() called while worker thread is running");
        return 0;
    }
    return drain();
}

bool MessageQueue::start() {
    if (running_) {
        LOG_ERROR("[MessageQueue] Already running");
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!handler_) {
            LOG_ERROR("[MessageQueue] No handler set, call set_handler() first");
            return false;
        }
    }

    running_ = true;
    worker_thread_ = std::make_unique<std::thread>(&MessageQueue::run_loop, this);

    LOG_DEBUG("[MessageQueue] Worker thread started");
    return true;
}

void MessageQueue::stop() {
    if (!running_) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    cv_.notify_all();

    if (worker_thread_ && worker_thread_->joinable()) {
        worker_thread_->join();
    }
    worker_thread_.reset();

    LOG_DEBUG("[MessageQueue] Worker thread stopped");
}

size_t MessageQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ready_.size() + delayed_.size();
}

size_t MessageQueue::pending_delayed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return delayed_.size();
}

void MessageQueue::run_loop() {
    while (running_) {
        drain();

        std::unique_lock<std::mutex> lock(mutex_);
        promote_due_locked(clock_());
        if (!ready_.empty() || !running_) {
            continue;
        }

        auto wait = kMaxIdleWait;
        if (!delayed_.empty()) {
            auto until_due = std::chrono::duration_cast<std::chrono::milliseconds>(delayed_.front().due - clock_());
            wait = std::clamp(until_due, std::chrono::milliseconds(0), kMaxIdleWait);
        }
        cv_.wait_for(lock, wait, [this] { return !running_ || !ready_.empty(); });
    }
}

size_t MessageQueue::drain() {
    size_t handled = 0;

    while (true) {
        Message message;
        Handler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            promote_due_locked(clock_());
            if (ready_.empty()) {
                break;
            }
            message = std::move(ready_.front());
            ready_.pop_front();
            handler = handler_;
        }

        if (!handler) {
            LOG_WARN("[MessageQueue] Dropping " << message_name(message) << ": no handler");
            continue;
        }

        try {
            handler(message);
        } catch (const std::exception &e) {
            LOG_ERROR("[MessageQueue] Handler failed on " << message_name(message) << ": " << e.what());
        }
        ++handled;
    }

    return handled;
}

void MessageQueue::promote_due_locked(TimePoint now) {
    auto it = delayed_.begin();
    while (it != delayed_.end() && it->due <= now) {
        ready_.push_back(std::move(it->message));
        ++it;
    }
    delayed_.erase(delayed_.begin(), it);
}

}  // namespace orchestrator
}  // namespace modewarden
