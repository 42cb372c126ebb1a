#include "runtime.hpp"

#include <chrono>
#include <thread>

#include "../logging/logger.hpp"
#include "signal_handler.hpp"

namespace modewarden {
namespace runtime {

using modes::ManagerInfo;

// Logs active manager changes and feeds client lifecycle broadcasts to the sequencer
class Runtime::ModeChangeLogger : public orchestrator::ModeChangeCallback {
public:
    explicit ModeChangeLogger(orchestrator::BroadcastSequencer &broadcasts) : broadcasts_(broadcasts) {}

    void on_active_manager_added(const ManagerInfo &info) override {
        LOG_INFO("[Runtime] Manager added: id=" << info.id << " role=" << modes::role_to_string(info.role)
                                                << " iface=" << info.interface_name);
        if (modes::is_client_role(info.role)) {
            broadcasts_.enqueue(info.id, {"CLIENT_MODE_STARTED", info.interface_name});
        }
    }

    void on_active_manager_removed(const ManagerInfo &info) override {
        LOG_INFO("[Runtime] Manager removed: id=" << info.id << " role=" << modes::role_to_string(info.role));
        broadcasts_.on_manager_removed(info.id);
    }

    void on_active_manager_role_changed(const ManagerInfo &info) override {
        LOG_INFO("[Runtime] Manager role changed: id=" << info.id << " role=" << modes::role_to_string(info.role));
        if (modes::is_client_role(info.role)) {
            broadcasts_.enqueue(info.id, {"CLIENT_ROLE_CHANGED", modes::role_to_string(info.role)});
        }
    }

private:
    orchestrator::BroadcastSequencer &broadcasts_;
};

class Runtime::AccessPointLogger : public modes::AccessPointCallback {
public:
    explicit AccessPointLogger(std::string label) : label_(std::move(label)) {}

    void on_state_changed(modes::ApState state, modes::ApStartFailure failure) override {
        if (state == modes::ApState::FAILED) {
            LOG_WARN("[Runtime] " << label_ << " AP failed: " << modes::ap_start_failure_to_string(failure));
            return;
        }
        LOG_INFO("[Runtime] " << label_ << " AP " << modes::ap_state_to_string(state));
    }

    void on_connected_clients_changed(int count) override {
        LOG_INFO("[Runtime] " << label_ << " AP clients: " << count);
    }

    void on_info_changed(const modes::ApInfo &info) override {
        LOG_DEBUG("[Runtime] " << label_ << " AP info: " << info.frequency_mhz << "MHz/" << info.bandwidth_mhz
                               << "MHz bssid=" << info.bssid);
    }

private:
    std::string label_;
};

Runtime::Runtime(const RuntimeConfig &config) : config_(config) {}

Runtime::~Runtime() {
    if (started_) {
        shutdown();
    }
}

bool Runtime::initialize(std::string &error) {
    logging::Logger::set_instance(config_.runtime.name);
    LOG_INFO("[Runtime] Initializing"
             << (config_.runtime.name.empty() ? std::string() : " instance '" + config_.runtime.name + "'"));

    if (!init_collaborators(error)) {
        return false;
    }
    if (!init_orchestrator(error)) {
        return false;
    }
    init_broadcasts();

    LOG_INFO("[Runtime] Initialization complete");
    return true;
}

bool Runtime::init_collaborators(std::string &error) {
    settings_ = std::make_unique<ConfigSettingsStore>(config_.settings);
    radio_ = std::make_unique<sim::SimulatedRadio>(config_.simulation);
    diagnostics_ = std::make_unique<LoggingDiagnostics>();
    recovery_ = std::make_unique<SelfRecoveryService>(config_.recovery);

    if (config_.simulation.max_client_interfaces < 1) {
        error = "Simulated radio needs at least one client interface";
        return false;
    }

    LOG_INFO("[Runtime] Simulated radio: " << config_.simulation.max_client_interfaces << " client / "
                                           << config_.simulation.max_ap_interfaces << " AP interfaces, STA+AP "
                                           << (config_.simulation.sta_ap_concurrency ? "supported" : "unsupported"));
    return true;
}

bool Runtime::init_orchestrator(std::string &error) {
    orchestrator_ = std::make_unique<orchestrator::ModeOrchestrator>(config_.orchestrator, *radio_, *settings_,
                                                                     *radio_, *recovery_, *diagnostics_);
    recovery_->attach(orchestrator_.get());

    if (orchestrator_->queue().is_running()) {
        error = "Orchestrator queue already running";
        return false;
    }

    orchestrator_->register_access_point_callback(std::make_shared<AccessPointLogger>("Tethered"));
    orchestrator_->register_local_only_hotspot_callback(std::make_shared<AccessPointLogger>("Local-only"));
    return true;
}

void Runtime::init_broadcasts() {
    broadcasts_ = std::make_unique<orchestrator::BroadcastSequencer>(
        [](modes::ManagerId source, const orchestrator::Broadcast &broadcast) {
            LOG_INFO("[Broadcast] " << broadcast.action << " from manager " << source
                                    << (broadcast.payload.empty() ? std::string() : ": " + broadcast.payload));
        });

    orchestrator_->register_primary_changed_callback(
        [this](const std::optional<ManagerInfo> &previous, const std::optional<ManagerInfo> &current) {
            broadcasts_->on_primary_changed(previous ? previous->id : modes::kInvalidManagerId,
                                            current ? current->id : modes::kInvalidManagerId);
        });

    mode_change_logger_ = std::make_shared<ModeChangeLogger>(*broadcasts_);
    orchestrator_->register_mode_change_callback(mode_change_logger_);
}

void Runtime::run() {
    LOG_INFO("[Runtime] Starting main loop");
    running_ = true;

    if (!radio_->start()) {
        LOG_WARN("[Runtime] Radio timer failed to start, managers will complete inline");
    }
    orchestrator_->start();
    if (!orchestrator_->queue().start()) {
        LOG_ERROR("[Runtime] Orchestrator queue failed to start");
        running_ = false;
        radio_->stop();
        return;
    }
    started_ = true;

    LOG_INFO("[Runtime] Press Ctrl+C to exit");

    auto last_status = std::chrono::steady_clock::now();
    while (running_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        if (SignalHandler::is_shutdown_requested()) {
            LOG_INFO("[Runtime] " << SignalHandler::signal_name(SignalHandler::last_signal())
                                  << " received, stopping...");
            running_ = false;
            break;
        }

        if (config_.runtime.status_interval_ms > 0) {
            auto now = std::chrono::steady_clock::now();
            if (now - last_status >= std::chrono::milliseconds(config_.runtime.status_interval_ms)) {
                last_status = now;
                log_status();
            }
        }
    }

    LOG_INFO("[Runtime] Main loop exited");
}

void Runtime::log_status() {
    orchestrator_->request_dump([](const nlohmann::json &snapshot) {
        LOG_INFO("[Runtime] Status: state=" << snapshot["state"].get<std::string>()
                                            << " managers=" << snapshot["active_managers"].size()
                                            << " emergency=" << snapshot["emergency"]["state"].get<std::string>()
                                            << " recovery=" << (snapshot["recovery"].is_null() ? "idle" : "active"));
    });
}

void Runtime::shutdown() {
    if (!orchestrator_) {
        return;
    }
    started_ = false;

    LOG_INFO("[Runtime] Stopping orchestrator");
    orchestrator_->notify_shutting_down();
    orchestrator_->queue().stop();

    if (radio_) {
        LOG_INFO("[Runtime] Stopping simulated radio");
        radio_->stop();
    }

    // Queue worker is stopped, so reading state directly is safe
    LOG_DEBUG("[Runtime] Final state: " << orchestrator_->dump().dump(2));
    LOG_INFO("[Runtime] Shutdown complete, " << diagnostics_->bug_report_count() << " bug report(s) taken");
}

}  // namespace runtime
}  // namespace modewarden
