#pragma once

#include <string>
#include <vector>

#include "orchestrator/mode_orchestrator.hpp"
#include "sim/simulated_radio.hpp"

namespace modewarden {
namespace runtime {

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

// Runtime section (runtime: in YAML)
struct RuntimeModeConfig {
    std::string name;                // Instance identifier (optional)
    int status_interval_ms = 10000;  // Periodic status log (0 = disabled)
};

// Initial values for the built-in settings store (settings: in YAML)
struct SettingsConfig {
    bool wifi_enabled = true;
    bool scan_always_available = false;
    bool airplane_mode = false;
    bool location_mode = true;
    bool disable_wifi_in_emergency = false;
};

// Self-recovery throttling (recovery: in YAML)
struct RecoveryConfig {
    int max_restarts_in_window = 2;   // Restarts allowed before recovery disables wifi
    int restart_window_ms = 3600000;  // Sliding window for the restart budget
};

struct RuntimeConfig {
    RuntimeModeConfig runtime;
    LoggingConfig logging;
    orchestrator::OrchestratorConfig orchestrator;
    RecoveryConfig recovery;
    SettingsConfig settings;
    sim::SimulationConfig simulation;
};

// Loads configuration from a YAML file
bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const RuntimeConfig &config, std::string &error);

}  // namespace runtime
}  // namespace modewarden
