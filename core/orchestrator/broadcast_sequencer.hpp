#pragma once

/**
 * @file broadcast_sequencer.hpp
 * @brief Holds role-scoped broadcasts until their source manager is primary
 *
 * Observers only ever see broadcasts attributed to the manager that is primary
 * at dispatch time, in submission order:
 * - enqueue() from the primary dispatches immediately
 * - enqueue() from any other manager is held in that manager's queue
 * - primary change A -> B flushes B's queue (FIFO) and discards all others
 * - removal of a manager discards its queue
 */

#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

#include "modes/mode_types.hpp"

namespace modewarden {
namespace orchestrator {

struct Broadcast {
    std::string action;  // e.g. "NETWORK_STATE_CHANGED"
    std::string payload;
};

class BroadcastSequencer {
public:
    using Dispatcher = std::function<void(modes::ManagerId source, const Broadcast &broadcast)>;

    /**
     * @param dispatcher Delivery transport. Invoked with the sequencer lock held,
     *        so it must not call back into the sequencer.
     */
    explicit BroadcastSequencer(Dispatcher dispatcher);

    void enqueue(modes::ManagerId source, const Broadcast &broadcast);

    void on_primary_changed(modes::ManagerId old_primary, modes::ManagerId new_primary);
    void on_manager_removed(modes::ManagerId id);

    modes::ManagerId current_primary() const;

    // Broadcasts held for a manager
    size_t pending(modes::ManagerId id) const;
    size_t total_pending() const;

private:
    void dispatch_locked(modes::ManagerId source, const Broadcast &broadcast);

    Dispatcher dispatcher_;

    mutable std::mutex mutex_;
    modes::ManagerId current_primary_ = modes::kInvalidManagerId;
    std::unordered_map<modes::ManagerId, std::deque<Broadcast>> held_;
};

}  // namespace orchestrator
}  // namespace modewarden
