#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <sstream>

#include "../logging/logger.hpp"

namespace modewarden {
namespace runtime {

bool validate_config(const RuntimeConfig &config, std::string &error) {
    // Validate runtime settings
    if (config.runtime.status_interval_ms < 0) {
        error = "runtime.status_interval_ms must be >= 0";
        return false;
    }

    // Validate Logging settings
    if (config.logging.level != "debug" && config.logging.level != "info" && config.logging.level != "warn" &&
        config.logging.level != "error") {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    // Validate orchestrator settings (delays above the ceiling are clamped at load time)
    if (config.orchestrator.recovery_delay_ms < 0) {
        error = "orchestrator.recovery_delay_ms must be >= 0";
        return false;
    }

    // Validate recovery settings
    if (config.recovery.max_restarts_in_window < 0) {
        error = "recovery.max_restarts_in_window must be >= 0";
        return false;
    }
    if (config.recovery.restart_window_ms < 1000) {
        error = "recovery.restart_window_ms must be >= 1000ms";
        return false;
    }

    // Validate simulation settings
    if (config.simulation.start_latency_ms < 0 || config.simulation.stop_latency_ms < 0) {
        error = "simulation latencies must be >= 0";
        return false;
    }
    if (config.simulation.max_client_interfaces < 1) {
        error = "simulation.max_client_interfaces must be >= 1";
        return false;
    }
    if (config.simulation.max_ap_interfaces < 0) {
        error = "simulation.max_ap_interfaces must be >= 0";
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        // Check for unknown top-level keys
        const std::vector<std::string> valid_keys = {"runtime",  "logging",    "orchestrator", "concurrency",
                                                     "recovery", "settings", "simulation"};
        for (const auto &key_node : yaml) {
            std::string key = key_node.first.as<std::string>();
            bool known = false;
            for (const auto &valid_key : valid_keys) {
                if (key == valid_key) {
                    known = true;
                    break;
                }
            }
            if (!known) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            }
        }

        // Load runtime config
        if (yaml["runtime"]) {
            if (yaml["runtime"]["name"]) {
                config.runtime.name = yaml["runtime"]["name"].as<std::string>();
            }
            if (yaml["runtime"]["status_interval_ms"]) {
                config.runtime.status_interval_ms = yaml["runtime"]["status_interval_ms"].as<int>();
            }
        }

        // Load logging config
        if (yaml["logging"]) {
            if (yaml["logging"]["level"]) {
                config.logging.level = yaml["logging"]["level"].as<std::string>();
            }
        }

        // Load orchestrator config
        if (yaml["orchestrator"]) {
            auto node = yaml["orchestrator"];
            if (node["recovery_delay_ms"]) {
                config.orchestrator.recovery_delay_ms = node["recovery_delay_ms"].as<int>();
                if (config.orchestrator.recovery_delay_ms > orchestrator::kMaxRecoveryDelayMs) {
                    LOG_WARN("[Config] orchestrator.recovery_delay_ms " << config.orchestrator.recovery_delay_ms
                                                                        << " exceeds "
                                                                        << orchestrator::kMaxRecoveryDelayMs
                                                                        << "ms, clamping");
                    config.orchestrator.recovery_delay_ms = orchestrator::kMaxRecoveryDelayMs;
                }
            }
            if (node["verbose_logging"]) {
                config.orchestrator.verbose_logging = node["verbose_logging"].as<bool>();
            }
            if (node["track_emergency_call_state"]) {
                config.orchestrator.track_emergency_call_state = node["track_emergency_call_state"].as<bool>();
            }
        }

        // Load concurrency feature flags
        if (yaml["concurrency"]) {
            auto node = yaml["concurrency"];
            auto &flags = config.orchestrator.concurrency;
            if (node["local_only_enabled"]) {
                flags.local_only_enabled = node["local_only_enabled"].as<bool>();
            }
            if (node["secondary_long_lived_enabled"]) {
                flags.secondary_long_lived_enabled = node["secondary_long_lived_enabled"].as<bool>();
            }
            if (node["secondary_transient_enabled"]) {
                flags.secondary_transient_enabled = node["secondary_transient_enabled"].as<bool>();
            }
        }

        // Load self-recovery throttling
        if (yaml["recovery"]) {
            if (yaml["recovery"]["max_restarts_in_window"]) {
                config.recovery.max_restarts_in_window = yaml["recovery"]["max_restarts_in_window"].as<int>();
            }
            if (yaml["recovery"]["restart_window_ms"]) {
                config.recovery.restart_window_ms = yaml["recovery"]["restart_window_ms"].as<int>();
            }
        }

        // Load initial settings
        if (yaml["settings"]) {
            auto node = yaml["settings"];
            if (node["wifi_enabled"]) {
                config.settings.wifi_enabled = node["wifi_enabled"].as<bool>();
            }
            if (node["scan_always_available"]) {
                config.settings.scan_always_available = node["scan_always_available"].as<bool>();
            }
            if (node["airplane_mode"]) {
                config.settings.airplane_mode = node["airplane_mode"].as<bool>();
            }
            if (node["location_mode"]) {
                config.settings.location_mode = node["location_mode"].as<bool>();
            }
            if (node["disable_wifi_in_emergency"]) {
                config.settings.disable_wifi_in_emergency = node["disable_wifi_in_emergency"].as<bool>();
            }
        }

        // Load simulated radio config
        if (yaml["simulation"]) {
            auto node = yaml["simulation"];
            if (node["start_latency_ms"]) {
                config.simulation.start_latency_ms = node["start_latency_ms"].as<int>();
            }
            if (node["stop_latency_ms"]) {
                config.simulation.stop_latency_ms = node["stop_latency_ms"].as<int>();
            }
            if (node["max_client_interfaces"]) {
                config.simulation.max_client_interfaces = node["max_client_interfaces"].as<int>();
            }
            if (node["max_ap_interfaces"]) {
                config.simulation.max_ap_interfaces = node["max_ap_interfaces"].as<int>();
            }
            if (node["sta_ap_concurrency"]) {
                config.simulation.sta_ap_concurrency = node["sta_ap_concurrency"].as<bool>();
            }
            if (node["fail_start_roles"]) {
                config.simulation.fail_start_roles.clear();  // Ensure idempotent parsing
                for (const auto &role_node : node["fail_start_roles"]) {
                    auto role_str = role_node.as<std::string>();
                    auto role = modes::string_to_role(role_str);
                    if (!role) {
                        error = "Invalid role in simulation.fail_start_roles: '" + role_str + "'";
                        return false;
                    }
                    config.simulation.fail_start_roles.push_back(*role);
                }
            }
        }

        if (!validate_config(config, error)) {
            return false;
        }

        // Log configuration summary
        LOG_INFO("[Config] Loaded " << config_path
                                    << (config.runtime.name.empty() ? "" : " (instance: " + config.runtime.name + ")"));
        LOG_INFO("[Config] Log level: " << config.logging.level);
        LOG_INFO("[Config] Recovery delay: " << config.orchestrator.recovery_delay_ms << "ms, emergency call tracking "
                                             << (config.orchestrator.track_emergency_call_state ? "on" : "off"));

        const auto &flags = config.orchestrator.concurrency;
        LOG_INFO("[Config] Additional clients: local-only=" << flags.local_only_enabled
                                                            << ", long-lived=" << flags.secondary_long_lived_enabled
                                                            << ", transient=" << flags.secondary_transient_enabled);

        std::stringstream sim_msg;
        sim_msg << "[Config] Simulated radio: " << config.simulation.max_client_interfaces << " client / "
                << config.simulation.max_ap_interfaces << " AP interfaces, latency "
                << config.simulation.start_latency_ms << "/" << config.simulation.stop_latency_ms << "ms";
        if (!config.simulation.fail_start_roles.empty()) {
            sim_msg << ", " << config.simulation.fail_start_roles.size() << " failing roles";
        }
        LOG_INFO(sim_msg.str());

        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace modewarden
