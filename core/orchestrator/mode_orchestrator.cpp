#include "orchestrator/mode_orchestrator.hpp"

#include <algorithm>
#include <exception>
#include <type_traits>

#include "orchestrator/json.hpp"

namespace modewarden {
namespace orchestrator {

using modes::ManagerId;
using modes::ManagerInfo;
using modes::Role;
using modes::WorkSource;

namespace {

constexpr size_t kGraveyardSize = 3;

void answer_request(const ClientManagerRequestCallback &callback, const std::optional<ManagerInfo> &info) {
    if (!callback) {
        return;
    }
    try {
        callback(info);
    } catch (const std::exception &e) {
        LOG_ERROR("[Orchestrator] Error in client manager request callback: " << e.what());
    }
}

}  // namespace

const char *orchestrator_state_to_string(OrchestratorState state) {
    switch (state) {
        case OrchestratorState::DISABLED:
            return "DISABLED";
        case OrchestratorState::ENABLED:
            return "ENABLED";
        default:
            return "UNKNOWN";
    }
}

/**
 * Per-manager listener handed to the factory.
 *
 * Only posts to the queue, so managers may call it from any thread and after
 * the orchestrator is gone (the queue is held weakly).
 */
class ModeOrchestrator::ManagerListener : public modes::ModeManagerListener {
public:
    ManagerListener(std::weak_ptr<MessageQueue> queue, ManagerId id) : queue_(std::move(queue)), id_(id) {}

    void on_started() override { post(msg::ManagerEventKind::STARTED); }
    void on_start_failure() override { post(msg::ManagerEventKind::START_FAILURE); }
    void on_stopped() override { post(msg::ManagerEventKind::STOPPED); }
    void on_role_changed() override { post(msg::ManagerEventKind::ROLE_CHANGED); }

private:
    void post(msg::ManagerEventKind kind) {
        if (auto queue = queue_.lock()) {
            queue->post(msg::ManagerEvent{id_, kind});
        }
    }

    std::weak_ptr<MessageQueue> queue_;
    ManagerId id_;
};

modes::ModeManager &ModeOrchestrator::ManagerRecord::manager() const {
    if (client) {
        return *client;
    }
    return *ap;
}

const char *ModeOrchestrator::manager_state_to_string(ManagerState state) {
    switch (state) {
        case ManagerState::STARTING:
            return "STARTING";
        case ManagerState::RUNNING:
            return "RUNNING";
        case ManagerState::STOPPING:
            return "STOPPING";
        default:
            return "UNKNOWN";
    }
}

ModeOrchestrator::ModeOrchestrator(const OrchestratorConfig &config, modes::ModeManagerFactory &factory,
                                   modes::SettingsStore &settings, modes::InterfaceController &interfaces,
                                   modes::SelfRecovery &self_recovery, modes::Diagnostics &diagnostics,
                                   MessageQueue::Clock clock)
    : config_(config),
      factory_(factory),
      settings_(settings),
      interfaces_(interfaces),
      self_recovery_(self_recovery),
      diagnostics_(diagnostics),
      clock_(clock ? std::move(clock) : MessageQueue::Clock([] { return std::chrono::steady_clock::now(); })),
      started_at_(clock_()),
      queue_(std::make_shared<MessageQueue>(clock_)),
      policy_(interfaces, config.concurrency),
      emergency_(config.track_emergency_call_state) {
    if (config_.recovery_delay_ms > kMaxRecoveryDelayMs) {
        LOG_WARN("[Orchestrator] recovery_delay_ms " << config_.recovery_delay_ms << " clamped to "
                                                     << kMaxRecoveryDelayMs);
        config_.recovery_delay_ms = kMaxRecoveryDelayMs;
    } else if (config_.recovery_delay_ms < 0) {
        config_.recovery_delay_ms = 0;
    }

    base_log_level_ = logging::Logger::level();
    if (config_.verbose_logging) {
        verbose_ = true;
        logging::Logger::set_level(logging::Level::LVL_DEBUG);
    }

    queue_->set_handler([this](const Message &message) { handle_message(message); });
}

ModeOrchestrator::~ModeOrchestrator() {
    queue_->stop();
    if (verbose_) {
        logging::Logger::set_level(base_log_level_);
    }
}

// ---------------------------------------------------------------------------
// Inbound intents (any thread)
// ---------------------------------------------------------------------------

void ModeOrchestrator::start() { queue_->post(msg::Boot{}); }

void ModeOrchestrator::wifi_toggled(bool enabled, const WorkSource &requestor) {
    queue_->post(msg::WifiToggled{enabled, requestor});
}

void ModeOrchestrator::scan_always_mode_changed(const WorkSource &requestor) {
    queue_->post(msg::ScanAlwaysModeChanged{requestor});
}

void ModeOrchestrator::location_mode_changed() { queue_->post(msg::LocationModeChanged{}); }

void ModeOrchestrator::airplane_mode_toggled() { queue_->post(msg::AirplaneModeToggled{}); }

void ModeOrchestrator::start_access_point(const modes::ApModeConfiguration &config, const WorkSource &requestor) {
    queue_->post(msg::StartAccessPoint{config, requestor});
}

void ModeOrchestrator::stop_access_point(std::optional<Role> role) { queue_->post(msg::StopAccessPoint{role}); }

void ModeOrchestrator::update_access_point_capability(const modes::ApCapability &capability) {
    queue_->post(msg::UpdateApCapability{capability});
}

void ModeOrchestrator::update_access_point_configuration(const modes::ApConfig &config) {
    queue_->post(msg::UpdateApConfiguration{config});
}

void ModeOrchestrator::request_client_manager(Role role, const WorkSource &requestor,
                                              const modes::NetworkTarget &hint,
                                              ClientManagerRequestCallback callback) {
    queue_->post(msg::RequestClientManager{role, requestor, hint, std::move(callback)});
}

void ModeOrchestrator::request_local_only_client_manager(const WorkSource &requestor,
                                                         const modes::NetworkTarget &hint,
                                                         ClientManagerRequestCallback callback) {
    request_client_manager(Role::CLIENT_LOCAL_ONLY, requestor, hint, std::move(callback));
}

void ModeOrchestrator::request_secondary_long_lived_client_manager(const WorkSource &requestor,
                                                                   const modes::NetworkTarget &hint,
                                                                   ClientManagerRequestCallback callback) {
    request_client_manager(Role::CLIENT_SECONDARY_LONG_LIVED, requestor, hint, std::move(callback));
}

void ModeOrchestrator::request_secondary_transient_client_manager(const WorkSource &requestor,
                                                                  const modes::NetworkTarget &hint,
                                                                  ClientManagerRequestCallback callback) {
    request_client_manager(Role::CLIENT_SECONDARY_TRANSIENT, requestor, hint, std::move(callback));
}

void ModeOrchestrator::remove_client_manager(ManagerId id) { queue_->post(msg::RemoveClientManager{id}); }

void ModeOrchestrator::report_hardware_fault() { queue_->post(msg::HardwareFault{}); }

void ModeOrchestrator::restart_all(modes::RecoveryReason reason) { queue_->post(msg::RestartAll{reason}); }

void ModeOrchestrator::recovery_disable() { queue_->post(msg::RecoveryDisable{}); }

void ModeOrchestrator::notify_shutting_down() {
    if (!shutting_down_.exchange(true)) {
        LOG_INFO("[Orchestrator] Device shutting down, hardware fault recovery suppressed");
    }
}

void ModeOrchestrator::set_emergency_callback_mode_active(bool active) {
    queue_->post(msg::EmergencyCallbackMode{active});
}

void ModeOrchestrator::set_emergency_call_state_active(bool active) {
    queue_->post(msg::EmergencyCallState{active});
}

void ModeOrchestrator::enable_verbose_logging(bool verbose) { queue_->post(msg::VerboseLogging{verbose}); }

void ModeOrchestrator::request_dump(std::function<void(const nlohmann::json &)> callback) {
    queue_->post(msg::DumpRequest{std::move(callback)});
}

// ---------------------------------------------------------------------------
// Observers
// ---------------------------------------------------------------------------

void ModeOrchestrator::register_mode_change_callback(const std::shared_ptr<ModeChangeCallback> &callback) {
    if (!callback) {
        return;
    }
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    mode_change_callbacks_.push_back(callback);
}

void ModeOrchestrator::unregister_mode_change_callback(const std::shared_ptr<ModeChangeCallback> &callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    mode_change_callbacks_.erase(std::remove(mode_change_callbacks_.begin(), mode_change_callbacks_.end(), callback),
                                 mode_change_callbacks_.end());
}

void ModeOrchestrator::register_primary_changed_callback(const PrimaryChangedCallback &callback) {
    if (!callback) {
        return;
    }
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    primary_changed_callbacks_.push_back(callback);
}

void ModeOrchestrator::register_access_point_callback(const std::shared_ptr<modes::AccessPointCallback> &callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    tethered_ap_callback_ = callback;
}

void ModeOrchestrator::register_local_only_hotspot_callback(
    const std::shared_ptr<modes::AccessPointCallback> &callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    local_only_ap_callback_ = callback;
}

void ModeOrchestrator::notify_added(const ManagerInfo &info) {
    std::vector<std::shared_ptr<ModeChangeCallback>> callbacks;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callbacks = mode_change_callbacks_;
    }
    for (const auto &callback : callbacks) {
        try {
            callback->on_active_manager_added(info);
        } catch (const std::exception &e) {
            LOG_ERROR("[Orchestrator] Error in manager added callback: " << e.what());
        }
    }
}

void ModeOrchestrator::notify_removed(const ManagerInfo &info) {
    std::vector<std::shared_ptr<ModeChangeCallback>> callbacks;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callbacks = mode_change_callbacks_;
    }
    for (const auto &callback : callbacks) {
        try {
            callback->on_active_manager_removed(info);
        } catch (const std::exception &e) {
            LOG_ERROR("[Orchestrator] Error in manager removed callback: " << e.what());
        }
    }
}

void ModeOrchestrator::notify_role_changed(const ManagerInfo &info) {
    std::vector<std::shared_ptr<ModeChangeCallback>> callbacks;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callbacks = mode_change_callbacks_;
    }
    for (const auto &callback : callbacks) {
        try {
            callback->on_active_manager_role_changed(info);
        } catch (const std::exception &e) {
            LOG_ERROR("[Orchestrator] Error in role changed callback: " << e.what());
        }
    }
}

void ModeOrchestrator::notify_primary_changed(const std::optional<ManagerInfo> &previous,
                                              const std::optional<ManagerInfo> &current) {
    std::vector<PrimaryChangedCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callbacks = primary_changed_callbacks_;
    }
    for (const auto &callback : callbacks) {
        try {
            callback(previous, current);
        } catch (const std::exception &e) {
            LOG_ERROR("[Orchestrator] Error in primary changed callback: " << e.what());
        }
    }
}

std::shared_ptr<modes::AccessPointCallback> ModeOrchestrator::ap_callback_for(Role role) const {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    return role == Role::AP_LOCAL_ONLY ? local_only_ap_callback_ : tethered_ap_callback_;
}

void ModeOrchestrator::notify_ap_start_failure(Role role, modes::ApStartFailure failure) const {
    auto callback = ap_callback_for(role);
    if (!callback) {
        return;
    }
    try {
        callback->on_state_changed(modes::ApState::FAILED, failure);
    } catch (const std::exception &e) {
        LOG_ERROR("[Orchestrator] Error in access point callback: " << e.what());
    }
}

// ---------------------------------------------------------------------------
// Concurrency pass-through
// ---------------------------------------------------------------------------

bool ModeOrchestrator::can_request_more_client_managers(const WorkSource &requestor) const {
    return interfaces_.can_create_client_interface(requestor);
}

bool ModeOrchestrator::can_request_more_ap_managers(const WorkSource &requestor) const {
    return interfaces_.can_create_ap_interface(requestor);
}

bool ModeOrchestrator::is_sta_ap_concurrency_supported() const { return interfaces_.is_sta_ap_concurrency_supported(); }

bool ModeOrchestrator::is_sta_sta_concurrency_supported() const {
    return interfaces_.is_sta_sta_concurrency_supported();
}

// ---------------------------------------------------------------------------
// Message dispatch (queue thread)
// ---------------------------------------------------------------------------

void ModeOrchestrator::handle_message(const Message &message) {
    LOG_DEBUG("[Orchestrator] Processing " << message_name(message));

    std::visit(
        [this](const auto &m) {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, msg::Boot>) {
                on_boot();
            } else if constexpr (std::is_same_v<T, msg::WifiToggled>) {
                on_wifi_toggled(m);
            } else if constexpr (std::is_same_v<T, msg::ScanAlwaysModeChanged>) {
                on_settings_changed(m.requestor, "scan-always mode");
            } else if constexpr (std::is_same_v<T, msg::LocationModeChanged>) {
                on_settings_changed(modes::internal_work_source(), "location mode");
            } else if constexpr (std::is_same_v<T, msg::AirplaneModeToggled>) {
                on_airplane_mode_toggled();
            } else if constexpr (std::is_same_v<T, msg::StartAccessPoint>) {
                on_start_access_point(m);
            } else if constexpr (std::is_same_v<T, msg::StopAccessPoint>) {
                on_stop_access_point(m);
            } else if constexpr (std::is_same_v<T, msg::UpdateApCapability>) {
                on_update_ap_capability(m);
            } else if constexpr (std::is_same_v<T, msg::UpdateApConfiguration>) {
                on_update_ap_configuration(m);
            } else if constexpr (std::is_same_v<T, msg::RequestClientManager>) {
                on_request_client_manager(m);
            } else if constexpr (std::is_same_v<T, msg::RemoveClientManager>) {
                on_remove_client_manager(m);
            } else if constexpr (std::is_same_v<T, msg::HardwareFault>) {
                on_hardware_fault();
            } else if constexpr (std::is_same_v<T, msg::RestartAll>) {
                on_restart_all(m);
            } else if constexpr (std::is_same_v<T, msg::RecoveryContinue>) {
                on_recovery_continue(m);
            } else if constexpr (std::is_same_v<T, msg::RecoveryDisable>) {
                on_recovery_disable();
            } else if constexpr (std::is_same_v<T, msg::EmergencyCallbackMode>) {
                on_emergency_signal(emergency_.set_callback_mode_active(m.active, any_manager_stopping()));
            } else if constexpr (std::is_same_v<T, msg::EmergencyCallState>) {
                on_emergency_signal(emergency_.set_call_state_active(m.active, any_manager_stopping()));
            } else if constexpr (std::is_same_v<T, msg::VerboseLogging>) {
                on_verbose_logging(m);
            } else if constexpr (std::is_same_v<T, msg::DumpRequest>) {
                if (m.callback) {
                    m.callback(dump());
                }
            } else if constexpr (std::is_same_v<T, msg::ManagerEvent>) {
                on_manager_event(m);
            }
        },
        message);

    log_state_transition();
}

void ModeOrchestrator::on_boot() {
    if (booted_) {
        LOG_WARN("[Orchestrator] Already started");
        return;
    }
    booted_ = true;

    toggle_enabled_ = settings_.is_toggle_enabled();
    airplane_on_ = settings_.is_airplane_mode_on();

    LOG_INFO("[Orchestrator] Starting (wifi " << (toggle_enabled_ ? "on" : "off") << ", airplane "
                                              << (airplane_on_ ? "on" : "off") << ")");

    evaluate_client_axis(modes::settings_work_source());
}

void ModeOrchestrator::on_wifi_toggled(const msg::WifiToggled &m) {
    toggle_enabled_ = m.enabled;
    recovery_disabled_ = false;

    LOG_INFO("[Orchestrator] Wifi toggled " << (m.enabled ? "on" : "off") << " by "
                                            << modes::work_source_to_string(m.requestor));

    if (emergency_.is_active()) {
        LOG_INFO("[Orchestrator] Emergency mode active, toggle recorded for exit");
        return;
    }

    if (must_defer_client_change()) {
        pending_toggle_ = PendingToggle{m.requestor};
        LOG_INFO("[Orchestrator] Client teardown in flight, toggle deferred");
        return;
    }

    evaluate_client_axis(m.requestor);
}

void ModeOrchestrator::on_settings_changed(const WorkSource &requestor, const char *what) {
    LOG_INFO("[Orchestrator] " << what << " changed");

    if (emergency_.is_active()) {
        return;
    }

    if (must_defer_client_change()) {
        pending_toggle_ = PendingToggle{requestor};
        LOG_INFO("[Orchestrator] Client teardown in flight, " << what << " change deferred");
        return;
    }

    evaluate_client_axis(requestor);
}

void ModeOrchestrator::on_airplane_mode_toggled() {
    const bool on = settings_.is_airplane_mode_on();

    if (emergency_.is_active()) {
        LOG_INFO("[Orchestrator] Airplane mode " << (on ? "on" : "off") << " ignored during emergency mode");
        return;
    }

    apply_airplane_mode(on);
}

void ModeOrchestrator::apply_airplane_mode(bool on) {
    airplane_on_ = on;
    LOG_INFO("[Orchestrator] Airplane mode " << (on ? "on" : "off"));

    if (on) {
        toggle_enabled_ = false;
        pending_toggle_.reset();
        pending_ap_starts_.clear();
        recovery_.reset();
        stop_all_managers();
        return;
    }

    toggle_enabled_ = settings_.is_toggle_enabled();
    if (must_defer_client_change()) {
        pending_toggle_ = PendingToggle{modes::settings_work_source()};
        LOG_INFO("[Orchestrator] Client teardown in flight, airplane mode off deferred");
        return;
    }
    evaluate_client_axis(modes::settings_work_source());
}

// ---------------------------------------------------------------------------
// Client axis
// ---------------------------------------------------------------------------

bool ModeOrchestrator::should_enable_client() const {
    if (recovery_disabled_) {
        return false;
    }
    if (toggle_enabled_) {
        return true;
    }
    return !airplane_on_ && settings_.is_scan_always_available() && settings_.is_location_mode_enabled();
}

void ModeOrchestrator::evaluate_client_axis(const WorkSource &requestor) {
    if (!should_enable_client()) {
        stop_client_managers(false);
        return;
    }

    const Role role = toggle_enabled_ ? Role::CLIENT_PRIMARY : Role::CLIENT_SCAN_ONLY;
    if (role == Role::CLIENT_SCAN_ONLY) {
        stop_client_managers(true);
    }
    ensure_client_manager(role, requestor);
}

void ModeOrchestrator::ensure_client_manager(Role role, const WorkSource &requestor) {
    for (auto &entry : managers_) {
        ManagerRecord &record = entry.second;
        if (!record.is_client() || record.state == ManagerState::STOPPING || record.stop_pending) {
            continue;
        }
        const Role target = record.target_role();
        if (target != Role::CLIENT_PRIMARY && target != Role::CLIENT_SCAN_ONLY) {
            continue;
        }

        if (target == role) {
            return;
        }

        record.pending_role = role;
        record.requestor = requestor;
        if (record.state == ManagerState::RUNNING) {
            LOG_INFO("[Orchestrator] Switching manager " << record.id << " " << modes::role_to_string(record.role)
                                                         << " -> " << modes::role_to_string(role));
            record.client->set_role(role, requestor);
        }
        return;
    }

    create_client_manager(role, requestor);
}

ManagerId ModeOrchestrator::create_client_manager(Role role, const WorkSource &requestor) {
    const ManagerId id = next_id_++;
    auto listener = std::make_shared<ManagerListener>(queue_, id);

    auto manager = factory_.make_client_mode_manager(listener, requestor, role, verbose_);
    if (!manager) {
        LOG_ERROR("[Orchestrator] Factory returned no client manager for " << modes::role_to_string(role));
        return modes::kInvalidManagerId;
    }

    ManagerRecord record;
    record.id = id;
    record.client = manager;
    record.role = role;
    record.requestor = requestor;
    managers_.emplace(id, std::move(record));

    LOG_INFO("[Orchestrator] Starting " << modes::role_to_string(role) << " manager " << id << " for "
                                        << modes::work_source_to_string(requestor));
    manager->start();
    return id;
}

void ModeOrchestrator::stop_client_managers(bool additional_only) {
    for (auto &entry : managers_) {
        ManagerRecord &record = entry.second;
        if (!record.is_client()) {
            continue;
        }
        if (additional_only && !modes::is_additional_client_role(record.target_role())) {
            continue;
        }
        stop_manager(record);
    }
}

bool ModeOrchestrator::client_teardown_in_flight() const {
    for (const auto &entry : managers_) {
        const ManagerRecord &record = entry.second;
        if (record.is_client() && (record.state == ManagerState::STOPPING || record.stop_pending)) {
            return true;
        }
    }
    return false;
}

bool ModeOrchestrator::any_manager_stopping() const {
    for (const auto &entry : managers_) {
        if (entry.second.state == ManagerState::STOPPING || entry.second.stop_pending) {
            return true;
        }
    }
    return false;
}

bool ModeOrchestrator::must_defer_client_change() const { return client_teardown_in_flight() || recovery_; }

void ModeOrchestrator::apply_pending_toggle() {
    if (!pending_toggle_ || emergency_.is_active() || recovery_ || client_teardown_in_flight()) {
        return;
    }

    const WorkSource requestor = pending_toggle_->requestor;
    pending_toggle_.reset();

    LOG_INFO("[Orchestrator] Applying deferred toggle (wifi " << (toggle_enabled_ ? "on" : "off") << ")");
    evaluate_client_axis(requestor);
}

// ---------------------------------------------------------------------------
// Access points
// ---------------------------------------------------------------------------

void ModeOrchestrator::on_start_access_point(const msg::StartAccessPoint &m) {
    const Role role = m.config.target_role;
    if (!modes::is_ap_role(role)) {
        LOG_ERROR("[Orchestrator] Invalid access point role: " << modes::role_to_string(role));
        return;
    }

    if (emergency_.is_active()) {
        LOG_INFO("[Orchestrator] Refusing " << modes::role_to_string(role) << ": emergency mode active");
        notify_ap_start_failure(role, modes::ApStartFailure::EMERGENCY_ACTIVE);
        return;
    }
    if (recovery_) {
        LOG_INFO("[Orchestrator] Refusing " << modes::role_to_string(role) << ": recovery in progress");
        notify_ap_start_failure(role, modes::ApStartFailure::RECOVERY_IN_PROGRESS);
        return;
    }

    bool predecessor_stopping = false;
    for (auto &entry : managers_) {
        ManagerRecord &record = entry.second;
        if (record.is_client() || record.role != role) {
            continue;
        }
        if (record.state == ManagerState::STOPPING || record.stop_pending) {
            predecessor_stopping = true;
            continue;
        }

        if (record.ap_config && *record.ap_config == m.config) {
            LOG_DEBUG("[Orchestrator] " << modes::role_to_string(role) << " already running with this config");
            pending_ap_starts_.erase(role);
            return;
        }

        LOG_INFO("[Orchestrator] Replacing " << modes::role_to_string(role) << " manager " << record.id
                                             << " with new configuration");
        pending_ap_starts_[role] = PendingApStart{m.config, m.requestor};
        stop_manager(record);
        return;
    }

    if (predecessor_stopping) {
        LOG_INFO("[Orchestrator] " << modes::role_to_string(role) << " still stopping, start queued");
        pending_ap_starts_[role] = PendingApStart{m.config, m.requestor};
        return;
    }

    try_start_access_point(m.config, m.requestor);
}

void ModeOrchestrator::try_start_access_point(const modes::ApModeConfiguration &config,
                                              const WorkSource &requestor) {
    const Role role = config.target_role;

    if (!interfaces_.can_create_ap_interface(requestor)) {
        LOG_WARN("[Orchestrator] No interface available for " << modes::role_to_string(role));
        notify_ap_start_failure(role, modes::ApStartFailure::CONCURRENCY_NOT_ALLOWED);
        return;
    }

    if (create_ap_manager(config, requestor) == modes::kInvalidManagerId) {
        notify_ap_start_failure(role, modes::ApStartFailure::GENERAL);
    }
}

ManagerId ModeOrchestrator::create_ap_manager(const modes::ApModeConfiguration &config,
                                              const WorkSource &requestor) {
    const Role role = config.target_role;
    const ManagerId id = next_id_++;
    auto listener = std::make_shared<ManagerListener>(queue_, id);

    auto manager =
        factory_.make_access_point_manager(listener, ap_callback_for(role), config, requestor, role, verbose_);
    if (!manager) {
        LOG_ERROR("[Orchestrator] Factory returned no access point manager for " << modes::role_to_string(role));
        return modes::kInvalidManagerId;
    }

    ManagerRecord record;
    record.id = id;
    record.ap = manager;
    record.role = role;
    record.requestor = requestor;
    record.ap_config = config;
    managers_.emplace(id, std::move(record));

    LOG_INFO("[Orchestrator] Starting " << modes::role_to_string(role) << " manager " << id << " for "
                                        << modes::work_source_to_string(requestor));
    manager->start();
    return id;
}

void ModeOrchestrator::on_stop_access_point(const msg::StopAccessPoint &m) {
    if (m.role) {
        pending_ap_starts_.erase(*m.role);
    } else {
        pending_ap_starts_.clear();
    }
    stop_access_points(m.role);
}

void ModeOrchestrator::stop_access_points(std::optional<Role> role) {
    for (auto &entry : managers_) {
        ManagerRecord &record = entry.second;
        if (record.is_client() || (role && record.role != *role)) {
            continue;
        }
        stop_manager(record);
    }
}

void ModeOrchestrator::on_update_ap_capability(const msg::UpdateApCapability &m) {
    for (auto &pending : pending_ap_starts_) {
        pending.second.config.capability = m.capability;
    }
    for (auto &entry : managers_) {
        ManagerRecord &record = entry.second;
        if (record.is_client() || record.state == ManagerState::STOPPING) {
            continue;
        }
        record.ap_config->capability = m.capability;
        record.ap->update_capability(m.capability);
    }
}

void ModeOrchestrator::on_update_ap_configuration(const msg::UpdateApConfiguration &m) {
    for (auto &pending : pending_ap_starts_) {
        pending.second.config.config = m.config;
    }
    for (auto &entry : managers_) {
        ManagerRecord &record = entry.second;
        if (record.is_client() || record.state == ManagerState::STOPPING) {
            continue;
        }
        record.ap_config->config = m.config;
        record.ap->update_configuration(m.config);
    }
}

// ---------------------------------------------------------------------------
// Additional client managers
// ---------------------------------------------------------------------------

void ModeOrchestrator::on_request_client_manager(const msg::RequestClientManager &m) {
    PolicyContext context;
    context.client_axis_enabled =
        find_live_role_holder(Role::CLIENT_PRIMARY) != nullptr || find_live_role_holder(Role::CLIENT_SCAN_ONLY) != nullptr;
    context.emergency_active = emergency_.is_active();
    context.recovery_in_progress = recovery_.has_value();
    context.role_holder = candidate_of(find_role_holder_for(m.role, m.hint));
    context.primary = candidate_of(find_live_role_holder(Role::CLIENT_PRIMARY));

    const PolicyDecision decision = policy_.decide(m.role, m.requestor, m.hint, context);
    LOG_INFO("[RolePolicy] " << modes::role_to_string(m.role) << " for " << modes::work_source_to_string(m.requestor)
                             << ": " << policy_action_to_string(decision.action) << " (" << decision.reason << ")");

    switch (decision.action) {
        case PolicyAction::REFUSE:
            answer_request(m.callback, std::nullopt);
            return;

        case PolicyAction::REUSE_EXISTING:
        case PolicyAction::USE_PRIMARY: {
            ManagerRecord *record = find_record(decision.manager);
            if (!record) {
                answer_request(m.callback, std::nullopt);
                return;
            }
            record->requests.push_back(RoleRequest{m.role, m.requestor, m.hint});
            if (record->state == ManagerState::RUNNING) {
                answer_request(m.callback, info_of(*record));
            } else {
                record->waiters.push_back(m.callback);
            }
            return;
        }

        case PolicyAction::CREATE: {
            const ManagerId id = create_client_manager(m.role, m.requestor);
            ManagerRecord *record = find_record(id);
            if (!record) {
                answer_request(m.callback, std::nullopt);
                return;
            }
            record->requests.push_back(RoleRequest{m.role, m.requestor, m.hint});
            record->waiters.push_back(m.callback);
            return;
        }
    }
}

void ModeOrchestrator::on_remove_client_manager(const msg::RemoveClientManager &m) {
    ManagerRecord *record = find_record(m.id);
    if (!record || !record->is_client()) {
        LOG_DEBUG("[Orchestrator] Remove request for unknown client manager " << m.id);
        return;
    }

    if (!record->requests.empty()) {
        record->requests.pop_back();
    } else {
        LOG_DEBUG("[Orchestrator] Client manager " << m.id << " has no outstanding requests");
    }

    // Primary and scan-only managers only leave through the client axis
    if (!modes::is_additional_client_role(record->target_role())) {
        return;
    }
    if (!record->requests.empty()) {
        LOG_DEBUG("[Orchestrator] Client manager " << m.id << " still used by " << record->requests.size()
                                                   << " requests");
        return;
    }

    stop_manager(*record);
}

void ModeOrchestrator::apply_multi_sta_hints(const ManagerRecord &record) {
    const auto use_case = record.role == Role::CLIENT_SECONDARY_TRANSIENT
                              ? modes::MultiStaUseCase::DUAL_STA_TRANSIENT_PREFER_PRIMARY
                              : modes::MultiStaUseCase::DUAL_STA_NON_TRANSIENT_UNBIASED;
    interfaces_.set_multi_sta_use_case(use_case);

    const ManagerRecord *primary = find_current_primary();
    if (primary) {
        interfaces_.set_multi_sta_primary_connection(primary->manager().interface_name());
    }
}

void ModeOrchestrator::answer_waiters(ManagerRecord &record, bool granted) {
    std::vector<ClientManagerRequestCallback> waiters;
    waiters.swap(record.waiters);
    if (waiters.empty()) {
        return;
    }

    std::optional<ManagerInfo> answer;
    if (granted) {
        answer = info_of(record);
    }
    for (const auto &waiter : waiters) {
        answer_request(waiter, answer);
    }
}

// ---------------------------------------------------------------------------
// Recovery
// ---------------------------------------------------------------------------

void ModeOrchestrator::on_hardware_fault() {
    if (shutting_down_) {
        LOG_INFO("[Orchestrator] Ignoring hardware fault: device shutting down");
        return;
    }

    LOG_WARN("[Orchestrator] Hardware fault reported, triggering recovery");
    diagnostics_.capture_bug_report_data(modes::RecoveryReason::WIFINATIVE_FAILURE);
    self_recovery_.trigger(modes::RecoveryReason::WIFINATIVE_FAILURE);
}

void ModeOrchestrator::on_restart_all(const msg::RestartAll &m) {
    const std::string reason = modes::recovery_reason_to_string(m.reason);

    if (emergency_.is_active()) {
        LOG_INFO("[Orchestrator] Dropping restart (" << reason << "): emergency mode active");
        return;
    }
    if (recovery_) {
        LOG_INFO("[Orchestrator] Dropping restart (" << reason << "): recovery already in progress");
        return;
    }

    if (m.reason != modes::RecoveryReason::LAST_RESORT_WATCHDOG) {
        diagnostics_.take_bug_report("Wi-Fi BugReport: " + reason, "Wi-Fi recovery triggered: " + reason);
    }

    RecoveryState state;
    state.reason = m.reason;
    state.generation = ++recovery_generation_;
    state.client_requestor = modes::settings_work_source();

    for (const Role role : {Role::CLIENT_PRIMARY, Role::CLIENT_SCAN_ONLY}) {
        const ManagerRecord *holder = find_live_role_holder(role);
        if (holder) {
            state.client_requestor = holder->requestor;
            break;
        }
    }

    for (const Role role : {Role::AP_TETHERED, Role::AP_LOCAL_ONLY}) {
        auto pending = pending_ap_starts_.find(role);
        if (pending != pending_ap_starts_.end()) {
            state.access_points.push_back(pending->second);
            continue;
        }
        const ManagerRecord *holder = find_live_role_holder(role);
        if (holder && holder->ap_config) {
            state.access_points.push_back(PendingApStart{*holder->ap_config, holder->requestor});
        }
    }

    pending_ap_starts_.clear();
    pending_toggle_.reset();
    recovery_ = std::move(state);

    LOG_WARN("[Orchestrator] Restarting all managers (" << reason << ", " << managers_.size() << " active)");
    stop_all_managers();

    if (managers_.empty()) {
        schedule_recovery_continuation();
    }
}

void ModeOrchestrator::schedule_recovery_continuation() {
    if (!recovery_ || recovery_->continuation_scheduled) {
        return;
    }
    recovery_->continuation_scheduled = true;

    LOG_INFO("[Orchestrator] All managers stopped, restarting in " << config_.recovery_delay_ms << "ms");
    queue_->post_delayed(msg::RecoveryContinue{recovery_->generation},
                         std::chrono::milliseconds(config_.recovery_delay_ms));
}

void ModeOrchestrator::on_recovery_continue(const msg::RecoveryContinue &m) {
    if (!recovery_ || recovery_->generation != m.generation) {
        LOG_DEBUG("[Orchestrator] Ignoring stale recovery continuation " << m.generation);
        return;
    }

    if (emergency_.is_active()) {
        recovery_->held_for_emergency = true;
        LOG_INFO("[Orchestrator] Recovery restart held until emergency mode ends");
        return;
    }

    complete_recovery();
}

void ModeOrchestrator::complete_recovery() {
    RecoveryState state = std::move(*recovery_);
    recovery_.reset();

    LOG_INFO("[Orchestrator] Recovery restart (" << modes::recovery_reason_to_string(state.reason) << ")");

    evaluate_client_axis(state.client_requestor);
    for (const auto &ap : state.access_points) {
        try_start_access_point(ap.config, ap.requestor);
    }
}

void ModeOrchestrator::on_recovery_disable() {
    LOG_WARN("[Orchestrator] Recovery disabled, stopping all managers until wifi is toggled");

    recovery_disabled_ = true;
    recovery_.reset();
    pending_toggle_.reset();
    pending_ap_starts_.clear();
    stop_all_managers();
}

void ModeOrchestrator::stop_all_managers() {
    for (auto &entry : managers_) {
        stop_manager(entry.second);
    }
}

// ---------------------------------------------------------------------------
// Emergency overlay
// ---------------------------------------------------------------------------

void ModeOrchestrator::on_emergency_signal(EmergencyTransition transition) {
    switch (transition) {
        case EmergencyTransition::ENTER:
            enter_emergency();
            break;
        case EmergencyTransition::EXIT:
            exit_emergency();
            break;
        default:
            break;
    }
}

void ModeOrchestrator::enter_emergency() {
    pending_ap_starts_.clear();
    stop_access_points(std::nullopt);

    const bool disable_clients = settings_.is_wifi_disabled_in_emergency();
    emergency_.set_client_axis_disabled(disable_clients);

    if (disable_clients) {
        LOG_INFO("[Orchestrator] Disabling client managers for emergency mode");
        pending_toggle_.reset();
        stop_client_managers(false);
    }
}

void ModeOrchestrator::exit_emergency() {
    emergency_.set_client_axis_disabled(false);
    pending_toggle_.reset();

    if (recovery_) {
        if (recovery_->held_for_emergency) {
            complete_recovery();
        } else {
            LOG_INFO("[Orchestrator] Recovery in flight, not restoring after emergency mode");
        }
        return;
    }

    const bool airplane_on = settings_.is_airplane_mode_on();
    if (airplane_on != airplane_on_) {
        apply_airplane_mode(airplane_on);
        return;
    }

    evaluate_client_axis(modes::settings_work_source());
}

// ---------------------------------------------------------------------------
// Lifecycle events
// ---------------------------------------------------------------------------

void ModeOrchestrator::on_manager_event(const msg::ManagerEvent &m) {
    ManagerRecord *record = find_record(m.id);
    if (!record) {
        LOG_DEBUG("[Orchestrator] Ignoring " << msg::manager_event_kind_to_string(m.kind) << " from removed manager "
                                             << m.id);
        return;
    }

    switch (m.kind) {
        case msg::ManagerEventKind::STARTED:
            if (record->state != ManagerState::STARTING) {
                LOG_DEBUG("[Orchestrator] Ignoring duplicate STARTED from manager " << m.id);
                return;
            }
            on_manager_started(*record);
            return;

        case msg::ManagerEventKind::START_FAILURE:
            LOG_WARN("[Orchestrator] " << modes::role_to_string(record->role) << " manager " << m.id
                                       << " failed to start");
            remove_manager(m.id, "start failure");
            return;

        case msg::ManagerEventKind::STOPPED:
            remove_manager(m.id, "stopped");
            return;

        case msg::ManagerEventKind::ROLE_CHANGED:
            on_manager_role_changed(*record);
            return;
    }
}

void ModeOrchestrator::on_manager_started(ManagerRecord &record) {
    record.state = ManagerState::RUNNING;
    LOG_INFO("[Orchestrator] " << modes::role_to_string(record.role) << " manager " << record.id << " started on "
                               << record.manager().interface_name());

    notify_added(info_of(record));

    if (record.stop_pending) {
        record.stop_pending = false;
        record.pending_role.reset();
        answer_waiters(record, false);
        stop_manager(record);
        return;
    }

    if (record.is_client()) {
        if (record.pending_role && *record.pending_role == record.role) {
            record.pending_role.reset();
        } else if (record.pending_role) {
            LOG_INFO("[Orchestrator] Switching manager " << record.id << " " << modes::role_to_string(record.role)
                                                         << " -> " << modes::role_to_string(*record.pending_role));
            record.client->set_role(*record.pending_role, record.requestor);
        }
        if (modes::is_additional_client_role(record.role)) {
            apply_multi_sta_hints(record);
        }
    }

    answer_waiters(record, true);
    update_primary();
}

void ModeOrchestrator::on_manager_role_changed(ManagerRecord &record) {
    if (!record.pending_role) {
        LOG_DEBUG("[Orchestrator] Ignoring unsolicited ROLE_CHANGED from manager " << record.id);
        return;
    }

    const Role previous = record.role;
    record.role = *record.pending_role;
    record.pending_role.reset();

    LOG_INFO("[Orchestrator] Manager " << record.id << " role changed " << modes::role_to_string(previous) << " -> "
                                       << modes::role_to_string(record.role));

    notify_role_changed(info_of(record));
    update_primary();
}

void ModeOrchestrator::remove_manager(ManagerId id, const char *cause) {
    auto it = managers_.find(id);
    if (it == managers_.end()) {
        return;
    }

    const ManagerInfo info = info_of(it->second);
    const bool was_client = it->second.is_client();
    std::vector<ClientManagerRequestCallback> waiters;
    waiters.swap(it->second.waiters);

    managers_.erase(it);
    LOG_INFO("[Orchestrator] " << modes::role_to_string(info.role) << " manager " << id << " removed (" << cause
                               << ")");

    for (const auto &waiter : waiters) {
        answer_request(waiter, std::nullopt);
    }

    bury(info, was_client, cause);
    notify_removed(info);
    update_primary();
    after_manager_removed(info, was_client);
}

void ModeOrchestrator::after_manager_removed(const ManagerInfo &info, bool was_client) {
    if (!was_client) {
        auto pending = pending_ap_starts_.find(info.role);
        if (pending != pending_ap_starts_.end() && !find_by_role(info.role)) {
            const PendingApStart start = pending->second;
            pending_ap_starts_.erase(pending);
            LOG_INFO("[Orchestrator] Starting queued " << modes::role_to_string(info.role));
            try_start_access_point(start.config, start.requestor);
        }
    }

    if (!any_manager_stopping() && emergency_.on_teardown_complete() == EmergencyTransition::EXIT) {
        exit_emergency();
    }

    if (recovery_ && managers_.empty()) {
        schedule_recovery_continuation();
    }

    apply_pending_toggle();

    // A client pre-empted for an access point comes back once the AP is gone
    if (!was_client && !emergency_.is_active() && !recovery_ && !pending_toggle_ &&
        current_state() == OrchestratorState::DISABLED && should_enable_client()) {
        LOG_INFO("[Orchestrator] Access point removed, restoring client mode");
        evaluate_client_axis(modes::internal_work_source());
    }
}

// ---------------------------------------------------------------------------
// Bookkeeping
// ---------------------------------------------------------------------------

void ModeOrchestrator::stop_manager(ManagerRecord &record) {
    if (record.state == ManagerState::STOPPING || record.stop_pending) {
        return;
    }

    if (record.state == ManagerState::STARTING) {
        record.stop_pending = true;
        LOG_DEBUG("[Orchestrator] Manager " << record.id << " still starting, stop deferred");
        return;
    }

    record.state = ManagerState::STOPPING;
    LOG_INFO("[Orchestrator] Stopping " << modes::role_to_string(record.role) << " manager " << record.id);
    record.manager().stop();
}

ModeOrchestrator::ManagerRecord *ModeOrchestrator::find_record(ManagerId id) {
    auto it = managers_.find(id);
    return it == managers_.end() ? nullptr : &it->second;
}

const ModeOrchestrator::ManagerRecord *ModeOrchestrator::find_record(ManagerId id) const {
    auto it = managers_.find(id);
    return it == managers_.end() ? nullptr : &it->second;
}

const ModeOrchestrator::ManagerRecord *ModeOrchestrator::find_live_role_holder(Role role) const {
    for (const auto &entry : managers_) {
        const ManagerRecord &record = entry.second;
        if (record.state == ManagerState::STOPPING || record.stop_pending) {
            continue;
        }
        if (record.target_role() == role) {
            return &record;
        }
    }
    return nullptr;
}

const ModeOrchestrator::ManagerRecord *ModeOrchestrator::find_role_holder_for(Role role,
                                                                             const modes::NetworkTarget &hint) const {
    const ManagerRecord *fallback = nullptr;
    for (const auto &entry : managers_) {
        const ManagerRecord &record = entry.second;
        if (record.state == ManagerState::STOPPING || record.stop_pending || record.target_role() != role) {
            continue;
        }
        if (!record.is_client()) {
            continue;
        }
        auto network = record.client->connected_network();
        if (network && network->matches(hint)) {
            return &record;
        }
        if (!fallback) {
            fallback = &record;
        }
    }
    return fallback;
}

const ModeOrchestrator::ManagerRecord *ModeOrchestrator::find_current_primary() const {
    for (const auto &entry : managers_) {
        const ManagerRecord &record = entry.second;
        if (record.state != ManagerState::STARTING && record.role == Role::CLIENT_PRIMARY) {
            return &record;
        }
    }
    return nullptr;
}

const ModeOrchestrator::ManagerRecord *ModeOrchestrator::find_by_role(Role role) const {
    for (const auto &entry : managers_) {
        if (entry.second.role == role) {
            return &entry.second;
        }
    }
    return nullptr;
}

ManagerInfo ModeOrchestrator::info_of(const ManagerRecord &record) const {
    ManagerInfo info;
    info.id = record.id;
    info.role = record.role;
    info.requestor = record.requestor;
    info.interface_name = record.manager().interface_name();
    return info;
}

std::optional<ClientCandidate> ModeOrchestrator::candidate_of(const ManagerRecord *record) const {
    if (!record || !record->is_client()) {
        return std::nullopt;
    }
    ClientCandidate candidate;
    candidate.id = record->id;
    candidate.network = record->client->connected_network();
    return candidate;
}

void ModeOrchestrator::update_primary() {
    const ManagerRecord *primary = find_current_primary();

    if (primary && announced_primary_ && announced_primary_->id == primary->id) {
        return;
    }
    if (!primary && !announced_primary_) {
        return;
    }

    std::optional<ManagerInfo> current;
    if (primary) {
        current = info_of(*primary);
    }
    const std::optional<ManagerInfo> previous = announced_primary_;
    announced_primary_ = current;

    LOG_INFO("[Orchestrator] Primary client manager changed: "
             << (previous ? std::to_string(previous->id) : "none") << " -> "
             << (current ? std::to_string(current->id) : "none"));
    notify_primary_changed(previous, current);
}

void ModeOrchestrator::log_state_transition() {
    const OrchestratorState state = current_state();
    if (state != last_state_) {
        LOG_INFO("[Orchestrator] State " << orchestrator_state_to_string(last_state_) << " -> "
                                         << orchestrator_state_to_string(state));
        last_state_ = state;
    }
}

void ModeOrchestrator::bury(const ManagerInfo &info, bool was_client, const char *cause) {
    auto &graveyard = was_client ? client_graveyard_ : ap_graveyard_;
    graveyard.push_back(GraveyardEntry{info, cause, elapsed_ms()});
    while (graveyard.size() > kGraveyardSize) {
        graveyard.pop_front();
    }
}

int64_t ModeOrchestrator::elapsed_ms() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(clock_() - started_at_).count();
}

void ModeOrchestrator::on_verbose_logging(const msg::VerboseLogging &m) {
    if (m.enabled && !verbose_) {
        base_log_level_ = logging::Logger::level();
    }
    verbose_ = m.enabled;
    logging::Logger::set_level(verbose_ ? logging::Level::LVL_DEBUG : base_log_level_);

    for (auto &entry : managers_) {
        entry.second.manager().enable_verbose_logging(verbose_);
    }
    LOG_INFO("[Orchestrator] Verbose logging " << (verbose_ ? "enabled" : "disabled"));
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

OrchestratorState ModeOrchestrator::current_state() const {
    for (const auto &entry : managers_) {
        if (entry.second.is_client()) {
            return OrchestratorState::ENABLED;
        }
    }
    return OrchestratorState::DISABLED;
}

std::optional<ManagerInfo> ModeOrchestrator::primary_client_manager() const {
    const ManagerRecord *record = find_by_role(Role::CLIENT_PRIMARY);
    if (!record) {
        return std::nullopt;
    }
    return info_of(*record);
}

std::optional<ManagerInfo> ModeOrchestrator::scan_only_client_manager() const {
    const ManagerRecord *record = find_by_role(Role::CLIENT_SCAN_ONLY);
    if (!record) {
        return std::nullopt;
    }
    return info_of(*record);
}

std::optional<ManagerInfo> ModeOrchestrator::tethered_ap_manager() const {
    const ManagerRecord *record = find_by_role(Role::AP_TETHERED);
    if (!record) {
        return std::nullopt;
    }
    return info_of(*record);
}

std::optional<ManagerInfo> ModeOrchestrator::local_only_ap_manager() const {
    const ManagerRecord *record = find_by_role(Role::AP_LOCAL_ONLY);
    if (!record) {
        return std::nullopt;
    }
    return info_of(*record);
}

std::vector<ManagerInfo> ModeOrchestrator::client_managers() const {
    std::vector<ManagerInfo> result;
    for (const auto &entry : managers_) {
        if (entry.second.is_client()) {
            result.push_back(info_of(entry.second));
        }
    }
    return result;
}

std::vector<ManagerInfo> ModeOrchestrator::internet_connectivity_client_managers() const {
    std::vector<ManagerInfo> result;
    for (const auto &entry : managers_) {
        if (entry.second.is_client() && modes::is_internet_connectivity_role(entry.second.role)) {
            result.push_back(info_of(entry.second));
        }
    }
    return result;
}

std::vector<ManagerInfo> ModeOrchestrator::active_managers() const {
    std::vector<ManagerInfo> result;
    result.reserve(managers_.size());
    for (const auto &entry : managers_) {
        result.push_back(info_of(entry.second));
    }
    return result;
}

nlohmann::json ModeOrchestrator::dump() const {
    nlohmann::json result;
    result["state"] = orchestrator_state_to_string(current_state());
    result["wifi_toggle_enabled"] = toggle_enabled_;
    result["airplane_mode"] = airplane_on_;
    result["recovery_disabled"] = recovery_disabled_;
    result["verbose_logging"] = verbose_;
    result["shutting_down"] = shutting_down_.load();

    result["emergency"] = {
        {"state", emergency_state_to_string(emergency_.state())},
        {"callback_mode_active", emergency_.callback_mode_active()},
        {"call_state_active", emergency_.call_state_active()},
        {"client_axis_disabled", emergency_.client_axis_disabled()},
    };

    result["pending_toggle"] =
        pending_toggle_ ? encode_work_source(pending_toggle_->requestor) : nlohmann::json(nullptr);

    nlohmann::json pending_aps = nlohmann::json::array();
    for (const auto &pending : pending_ap_starts_) {
        pending_aps.push_back(encode_ap_mode_configuration(pending.second.config));
    }
    result["pending_ap_starts"] = pending_aps;

    if (recovery_) {
        result["recovery"] = {
            {"reason", modes::recovery_reason_to_string(recovery_->reason)},
            {"continuation_scheduled", recovery_->continuation_scheduled},
            {"held_for_emergency", recovery_->held_for_emergency},
            {"access_points", recovery_->access_points.size()},
        };
    } else {
        result["recovery"] = nullptr;
    }

    nlohmann::json managers = nlohmann::json::array();
    for (const auto &entry : managers_) {
        const ManagerRecord &record = entry.second;
        nlohmann::json item = encode_manager_info(info_of(record));
        item["state"] = manager_state_to_string(record.state);
        item["stop_pending"] = record.stop_pending;
        if (record.pending_role) {
            item["pending_role"] = modes::role_to_string(*record.pending_role);
        }
        if (record.ap_config) {
            item["ap"] = encode_ap_mode_configuration(*record.ap_config);
        }
        if (record.is_client()) {
            item["requests"] = record.requests.size();
        }
        managers.push_back(item);
    }
    result["active_managers"] = managers;

    auto encode_graveyard = [](const std::deque<GraveyardEntry> &graveyard) {
        nlohmann::json entries = nlohmann::json::array();
        for (const auto &entry : graveyard) {
            nlohmann::json item = encode_manager_info(entry.info);
            item["cause"] = entry.cause;
            item["removed_at_ms"] = entry.removed_at_ms;
            entries.push_back(item);
        }
        return entries;
    };
    result["graveyard"] = {
        {"clients", encode_graveyard(client_graveyard_)},
        {"access_points", encode_graveyard(ap_graveyard_)},
    };

    return result;
}

}  // namespace orchestrator
}  // namespace modewarden
