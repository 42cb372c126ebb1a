#include "orchestrator/broadcast_sequencer.hpp"

#include <exception>

#include "logging/logger.hpp"

namespace modewarden {
namespace orchestrator {

BroadcastSequencer::BroadcastSequencer(Dispatcher dispatcher) : dispatcher_(std::move(dispatcher)) {}

void BroadcastSequencer::enqueue(modes::ManagerId source, const Broadcast &broadcast) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (source != modes::kInvalidManagerId && source == current_primary_) {
        dispatch_locked(source, broadcast);
        return;
    }

    held_[source].push_back(broadcast);
    LOG_DEBUG("[Broadcast] Holding " << broadcast.action << " from non-primary manager " << source << " ("
                                     << held_[source].size() << " queued)");
}

void BroadcastSequencer::on_primary_changed(modes::ManagerId old_primary, modes::ManagerId new_primary) {
    std::lock_guard<std::mutex> lock(mutex_);

    current_primary_ = new_primary;

    std::deque<Broadcast> flush;
    auto it = held_.find(new_primary);
    if (it != held_.end()) {
        flush = std::move(it->second);
        held_.erase(it);
    }

    size_t discarded = 0;
    for (const auto &entry : held_) {
        discarded += entry.second.size();
    }
    held_.clear();

    LOG_DEBUG("[Broadcast] Primary " << old_primary << " -> " << new_primary << ": flushing " << flush.size()
                                     << ", discarding " << discarded);

    for (const auto &broadcast : flush) {
        dispatch_locked(new_primary, broadcast);
    }
}

void BroadcastSequencer::on_manager_removed(modes::ManagerId id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = held_.find(id);
    if (it != held_.end()) {
        LOG_DEBUG("[Broadcast] Discarding " << it->second.size() << " broadcasts of removed manager " << id);
        held_.erase(it);
    }
    if (current_primary_ == id) {
        current_primary_ = modes::kInvalidManagerId;
    }
}

modes::ManagerId BroadcastSequencer::current_primary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_primary_;
}

size_t BroadcastSequencer::pending(modes::ManagerId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = held_.find(id);
    return it == held_.end() ? 0 : it->second.size();
}

size_t BroadcastSequencer::total_pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = 0;
    for (const auto &entry : held_) {
        total += entry.second.size();
    }
    return total;
}

void BroadcastSequencer::dispatch_locked(modes::ManagerId source, const Broadcast &broadcast) {
    if (!dispatcher_) {
        return;
    }
    try {
        dispatcher_(source, broadcast);
    } catch (const std::exception &e) {
        LOG_ERROR("[Broadcast] Dispatcher failed on " << broadcast.action << ": " << e.what());
    }
}

}  // namespace orchestrator
}  // namespace modewarden
