#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "config.hpp"
#include "orchestrator/broadcast_sequencer.hpp"
#include "orchestrator/mode_orchestrator.hpp"
#include "recovery_service.hpp"
#include "settings_store.hpp"
#include "sim/simulated_radio.hpp"

namespace modewarden {
namespace runtime {

class Runtime {
public:
    explicit Runtime(const RuntimeConfig &config);
    ~Runtime();

    // Build the radio back end, collaborators and orchestrator
    bool initialize(std::string &error);

    // Main runtime loop (blocking)
    void run();

    // Triggers the main loop to exit
    void stop() { running_ = false; }

    // Stop the queue and radio; logs the final state snapshot
    void shutdown();

    orchestrator::ModeOrchestrator &get_orchestrator() { return *orchestrator_; }
    orchestrator::BroadcastSequencer &get_broadcast_sequencer() { return *broadcasts_; }
    ConfigSettingsStore &get_settings() { return *settings_; }
    sim::SimulatedRadio &get_radio() { return *radio_; }

private:
    class ModeChangeLogger;
    class AccessPointLogger;

    // Staged initialization helpers
    bool init_collaborators(std::string &error);
    bool init_orchestrator(std::string &error);
    void init_broadcasts();

    void log_status();

    RuntimeConfig config_;

    std::unique_ptr<ConfigSettingsStore> settings_;
    std::unique_ptr<sim::SimulatedRadio> radio_;
    std::unique_ptr<LoggingDiagnostics> diagnostics_;
    std::unique_ptr<SelfRecoveryService> recovery_;
    std::unique_ptr<orchestrator::ModeOrchestrator> orchestrator_;
    std::unique_ptr<orchestrator::BroadcastSequencer> broadcasts_;
    std::shared_ptr<ModeChangeLogger> mode_change_logger_;

    std::atomic<bool> running_{false};
    bool started_ = false;
};

}  // namespace runtime
}  // namespace modewarden
