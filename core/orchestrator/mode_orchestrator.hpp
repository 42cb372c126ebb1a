#pragma once

/**
 * @file mode_orchestrator.hpp
 * @brief Central authority over which radio roles are active
 *
 * Every public intent enqueues a message and returns immediately; all state is
 * mutated on the queue's consumer thread only. Mode manager lifecycle events
 * arrive on the same queue, so intents and events are totally ordered.
 *
 * Threading:
 * - Intents, observer registration and the concurrency pass-through queries
 *   may be called from any thread.
 * - Read-side queries (current_state(), primary_client_manager(), dump(), ...)
 *   must run on the queue thread, or while the queue worker is not running.
 */

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "logging/logger.hpp"
#include "modes/collaborators.hpp"
#include "modes/mode_manager.hpp"
#include "modes/mode_manager_factory.hpp"
#include "modes/mode_types.hpp"
#include "orchestrator/emergency_overlay.hpp"
#include "orchestrator/message_queue.hpp"
#include "orchestrator/messages.hpp"
#include "orchestrator/role_assignment_policy.hpp"

namespace modewarden {
namespace orchestrator {

// Top-level client axis. AP managers are independent of it.
enum class OrchestratorState { DISABLED, ENABLED };

const char *orchestrator_state_to_string(OrchestratorState state);

// Ceiling for the delay between the last recovery stop and re-creation
constexpr int kMaxRecoveryDelayMs = 4000;

struct OrchestratorConfig {
    int recovery_delay_ms = 2000;
    bool verbose_logging = false;
    bool track_emergency_call_state = true;
    ConcurrencyFlags concurrency;
};

/**
 * Observer of the active manager set.
 *
 * Added fires once a manager reports started. Removed fires exactly once per
 * manager, on stop completion or start failure.
 */
class ModeChangeCallback {
public:
    virtual ~ModeChangeCallback() = default;

    virtual void on_active_manager_added(const modes::ManagerInfo &info) = 0;
    virtual void on_active_manager_removed(const modes::ManagerInfo &info) = 0;
    virtual void on_active_manager_role_changed(const modes::ManagerInfo &info) = 0;
};

/**
 * Primary client change notification.
 * Either side is std::nullopt when there was/is no running primary.
 */
using PrimaryChangedCallback = std::function<void(const std::optional<modes::ManagerInfo> &previous,
                                                  const std::optional<modes::ManagerInfo> &current)>;

class ModeOrchestrator {
public:
    /**
     * Collaborators are borrowed and must outlive the orchestrator.
     *
     * @param clock Time source for the recovery delay (default: steady_clock)
     */
    ModeOrchestrator(const OrchestratorConfig &config, modes::ModeManagerFactory &factory,
                     modes::SettingsStore &settings, modes::InterfaceController &interfaces,
                     modes::SelfRecovery &self_recovery, modes::Diagnostics &diagnostics,
                     MessageQueue::Clock clock = nullptr);
    ~ModeOrchestrator();

    ModeOrchestrator(const ModeOrchestrator &) = delete;
    ModeOrchestrator &operator=(const ModeOrchestrator &) = delete;

    // Serial queue driving this orchestrator (start() its worker or call dispatch_all())
    MessageQueue &queue() { return *queue_; }

    // Seed the client axis from the settings store
    void start();

    // ---- Inbound intents ----

    void wifi_toggled(bool enabled, const modes::WorkSource &requestor);
    void scan_always_mode_changed(const modes::WorkSource &requestor = modes::internal_work_source());
    void location_mode_changed();
    void airplane_mode_toggled();

    void start_access_point(const modes::ApModeConfiguration &config, const modes::WorkSource &requestor);

    // std::nullopt stops every access point
    void stop_access_point(std::optional<modes::Role> role = std::nullopt);

    void update_access_point_capability(const modes::ApCapability &capability);
    void update_access_point_configuration(const modes::ApConfig &config);

    /**
     * Request an additional client manager.
     *
     * The callback runs on the queue thread with the granted manager (possibly
     * an existing one) or std::nullopt when refused. A granted manager stays
     * reserved until remove_client_manager() is called for it.
     */
    void request_client_manager(modes::Role role, const modes::WorkSource &requestor,
                                const modes::NetworkTarget &hint, ClientManagerRequestCallback callback);
    void request_local_only_client_manager(const modes::WorkSource &requestor, const modes::NetworkTarget &hint,
                                           ClientManagerRequestCallback callback);
    void request_secondary_long_lived_client_manager(const modes::WorkSource &requestor,
                                                     const modes::NetworkTarget &hint,
                                                     ClientManagerRequestCallback callback);
    void request_secondary_transient_client_manager(const modes::WorkSource &requestor,
                                                    const modes::NetworkTarget &hint,
                                                    ClientManagerRequestCallback callback);

    // Release one reservation obtained through request_*_client_manager()
    void remove_client_manager(modes::ManagerId id);

    void report_hardware_fault();
    void restart_all(modes::RecoveryReason reason);
    void recovery_disable();

    // One-way latch; suppresses hardware fault handling from now on
    void notify_shutting_down();

    void set_emergency_callback_mode_active(bool active);
    void set_emergency_call_state_active(bool active);

    void enable_verbose_logging(bool verbose);

    // Snapshot state on the queue thread
    void request_dump(std::function<void(const nlohmann::json &)> callback);

    // ---- Observers (thread-safe) ----

    void register_mode_change_callback(const std::shared_ptr<ModeChangeCallback> &callback);
    void unregister_mode_change_callback(const std::shared_ptr<ModeChangeCallback> &callback);
    void register_primary_changed_callback(const PrimaryChangedCallback &callback);

    // AP state observers: tethered role and local-only hotspot role
    void register_access_point_callback(const std::shared_ptr<modes::AccessPointCallback> &callback);
    void register_local_only_hotspot_callback(const std::shared_ptr<modes::AccessPointCallback> &callback);

    // ---- Concurrency pass-through (thread-safe) ----

    bool can_request_more_client_managers(const modes::WorkSource &requestor) const;
    bool can_request_more_ap_managers(const modes::WorkSource &requestor) const;
    bool is_sta_ap_concurrency_supported() const;
    bool is_sta_sta_concurrency_supported() const;

    // ---- Read-side queries (queue thread only) ----

    OrchestratorState current_state() const;
    bool is_in_emergency_mode() const { return emergency_.is_active(); }
    EmergencyState emergency_state() const { return emergency_.state(); }
    bool is_recovery_in_progress() const { return recovery_.has_value(); }
    bool has_pending_toggle() const { return pending_toggle_.has_value(); }
    bool is_shutting_down() const { return shutting_down_.load(); }
    bool is_verbose_logging_enabled() const { return verbose_; }

    std::optional<modes::ManagerInfo> primary_client_manager() const;
    std::optional<modes::ManagerInfo> scan_only_client_manager() const;
    std::optional<modes::ManagerInfo> tethered_ap_manager() const;
    std::optional<modes::ManagerInfo> local_only_ap_manager() const;

    std::vector<modes::ManagerInfo> client_managers() const;
    std::vector<modes::ManagerInfo> internet_connectivity_client_managers() const;
    std::vector<modes::ManagerInfo> active_managers() const;

    nlohmann::json dump() const;

private:
    enum class ManagerState { STARTING, RUNNING, STOPPING };

    static const char *manager_state_to_string(ManagerState state);

    // Reservation held by a caller of request_*_client_manager()
    struct RoleRequest {
        modes::Role role;
        modes::WorkSource requestor;
        modes::NetworkTarget hint;
    };

    struct ManagerRecord {
        modes::ManagerId id = modes::kInvalidManagerId;
        std::shared_ptr<modes::ClientModeManager> client;
        std::shared_ptr<modes::AccessPointManager> ap;
        modes::Role role = modes::Role::CLIENT_PRIMARY;
        modes::WorkSource requestor;
        ManagerState state = ManagerState::STARTING;
        bool stop_pending = false;                     // Stop requested while starting
        std::optional<modes::Role> pending_role;       // In-place role switch not yet confirmed
        std::optional<modes::ApModeConfiguration> ap_config;
        std::vector<RoleRequest> requests;
        std::vector<ClientManagerRequestCallback> waiters;  // Answered once running

        modes::ModeManager &manager() const;
        bool is_client() const { return client != nullptr; }
        modes::Role target_role() const { return pending_role.value_or(role); }
    };

    struct PendingToggle {
        modes::WorkSource requestor;
    };

    struct PendingApStart {
        modes::ApModeConfiguration config;
        modes::WorkSource requestor;
    };

    struct RecoveryState {
        modes::RecoveryReason reason;
        uint64_t generation = 0;
        bool continuation_scheduled = false;
        bool held_for_emergency = false;  // Continuation arrived during emergency
        modes::WorkSource client_requestor;
        std::vector<PendingApStart> access_points;
    };

    struct GraveyardEntry {
        modes::ManagerInfo info;
        std::string cause;
        int64_t removed_at_ms = 0;
    };

    class ManagerListener;

    void handle_message(const Message &message);

    void on_boot();
    void on_wifi_toggled(const msg::WifiToggled &m);
    void on_settings_changed(const modes::WorkSource &requestor, const char *what);
    void on_airplane_mode_toggled();
    void apply_airplane_mode(bool on);
    void on_start_access_point(const msg::StartAccessPoint &m);
    void on_stop_access_point(const msg::StopAccessPoint &m);
    void on_update_ap_capability(const msg::UpdateApCapability &m);
    void on_update_ap_configuration(const msg::UpdateApConfiguration &m);
    void on_request_client_manager(const msg::RequestClientManager &m);
    void on_remove_client_manager(const msg::RemoveClientManager &m);
    void on_hardware_fault();
    void on_restart_all(const msg::RestartAll &m);
    void on_recovery_continue(const msg::RecoveryContinue &m);
    void on_recovery_disable();
    void on_emergency_signal(EmergencyTransition transition);
    void on_verbose_logging(const msg::VerboseLogging &m);
    void on_manager_event(const msg::ManagerEvent &m);

    void on_manager_started(ManagerRecord &record);
    void on_manager_role_changed(ManagerRecord &record);
    void remove_manager(modes::ManagerId id, const char *cause);
    void after_manager_removed(const modes::ManagerInfo &info, bool was_client);

    // Client axis
    bool should_enable_client() const;
    void evaluate_client_axis(const modes::WorkSource &requestor);
    void ensure_client_manager(modes::Role role, const modes::WorkSource &requestor);
    modes::ManagerId create_client_manager(modes::Role role, const modes::WorkSource &requestor);
    void stop_client_managers(bool additional_only);
    bool client_teardown_in_flight() const;
    bool any_manager_stopping() const;
    bool must_defer_client_change() const;
    void apply_pending_toggle();

    // Access points
    void try_start_access_point(const modes::ApModeConfiguration &config, const modes::WorkSource &requestor);
    modes::ManagerId create_ap_manager(const modes::ApModeConfiguration &config, const modes::WorkSource &requestor);
    void stop_access_points(std::optional<modes::Role> role);
    std::shared_ptr<modes::AccessPointCallback> ap_callback_for(modes::Role role) const;
    void notify_ap_start_failure(modes::Role role, modes::ApStartFailure failure) const;

    // Emergency and recovery
    void enter_emergency();
    void exit_emergency();
    void schedule_recovery_continuation();
    void complete_recovery();
    void stop_all_managers();

    // Manager bookkeeping
    void stop_manager(ManagerRecord &record);
    ManagerRecord *find_record(modes::ManagerId id);
    const ManagerRecord *find_record(modes::ManagerId id) const;
    const ManagerRecord *find_live_role_holder(modes::Role role) const;
    // Holder of an additional role, preferring one already on the hinted network
    const ManagerRecord *find_role_holder_for(modes::Role role, const modes::NetworkTarget &hint) const;
    const ManagerRecord *find_current_primary() const;
    const ManagerRecord *find_by_role(modes::Role role) const;
    modes::ManagerInfo info_of(const ManagerRecord &record) const;
    std::optional<ClientCandidate> candidate_of(const ManagerRecord *record) const;
    void apply_multi_sta_hints(const ManagerRecord &record);
    void answer_waiters(ManagerRecord &record, bool granted);
    void update_primary();
    void log_state_transition();
    void bury(const modes::ManagerInfo &info, bool was_client, const char *cause);
    int64_t elapsed_ms() const;

    // Observer fan-out (copy under lock, invoke unlocked)
    void notify_added(const modes::ManagerInfo &info);
    void notify_removed(const modes::ManagerInfo &info);
    void notify_role_changed(const modes::ManagerInfo &info);
    void notify_primary_changed(const std::optional<modes::ManagerInfo> &previous,
                                const std::optional<modes::ManagerInfo> &current);

    OrchestratorConfig config_;
    modes::ModeManagerFactory &factory_;
    modes::SettingsStore &settings_;
    modes::InterfaceController &interfaces_;
    modes::SelfRecovery &self_recovery_;
    modes::Diagnostics &diagnostics_;

    MessageQueue::Clock clock_;
    MessageQueue::TimePoint started_at_;
    std::shared_ptr<MessageQueue> queue_;
    RoleAssignmentPolicy policy_;

    // Queue-thread state
    std::map<modes::ManagerId, ManagerRecord> managers_;  // Ordered by creation
    modes::ManagerId next_id_ = 1;
    bool booted_ = false;
    bool toggle_enabled_ = false;
    bool airplane_on_ = false;
    bool recovery_disabled_ = false;
    bool verbose_ = false;
    logging::Level base_log_level_ = logging::Level::LVL_INFO;
    std::optional<PendingToggle> pending_toggle_;
    std::map<modes::Role, PendingApStart> pending_ap_starts_;
    std::optional<RecoveryState> recovery_;
    uint64_t recovery_generation_ = 0;
    EmergencyOverlay emergency_;
    std::optional<modes::ManagerInfo> announced_primary_;
    OrchestratorState last_state_ = OrchestratorState::DISABLED;
    std::deque<GraveyardEntry> client_graveyard_;
    std::deque<GraveyardEntry> ap_graveyard_;

    std::atomic<bool> shutting_down_{false};

    // Observer registry, touched from caller threads
    mutable std::mutex callbacks_mutex_;
    std::vector<std::shared_ptr<ModeChangeCallback>> mode_change_callbacks_;
    std::vector<PrimaryChangedCallback> primary_changed_callbacks_;
    std::shared_ptr<modes::AccessPointCallback> tethered_ap_callback_;
    std::shared_ptr<modes::AccessPointCallback> local_only_ap_callback_;
};

}  // namespace orchestrator
}  // namespace modewarden
