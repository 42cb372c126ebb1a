#pragma once

/**
 * @file collaborators.hpp
 * @brief Interfaces of the external systems the orchestrator consults
 *
 * Implementations must be safe to call from the orchestrator's queue thread.
 * Settings queries are expected to be cheap snapshots.
 */

#include <string>

#include "modes/mode_types.hpp"

namespace modewarden {
namespace modes {

class SettingsStore {
public:
    virtual ~SettingsStore() = default;

    virtual bool is_toggle_enabled() const = 0;
    virtual bool is_scan_always_available() const = 0;
    virtual bool is_airplane_mode_on() const = 0;
    virtual bool is_location_mode_enabled() const = 0;

    // Device policy: turn the client axis off while in emergency callback mode
    virtual bool is_wifi_disabled_in_emergency() const = 0;
};

/**
 * Radio chip / driver layer: interface admission and multi-STA hints.
 */
class InterfaceController {
public:
    virtual ~InterfaceController() = default;

    virtual bool can_create_client_interface(const WorkSource &requestor) const = 0;
    virtual bool can_create_ap_interface(const WorkSource &requestor) const = 0;
    virtual bool is_sta_ap_concurrency_supported() const = 0;
    virtual bool is_sta_sta_concurrency_supported() const = 0;

    virtual void set_multi_sta_use_case(MultiStaUseCase use_case) = 0;
    virtual void set_multi_sta_primary_connection(const std::string &interface_name) = 0;
};

class SelfRecovery {
public:
    virtual ~SelfRecovery() = default;

    virtual void trigger(RecoveryReason reason) = 0;
};

class Diagnostics {
public:
    virtual ~Diagnostics() = default;

    // Capture firmware/driver state around a fault
    virtual void capture_bug_report_data(RecoveryReason reason) = 0;

    virtual void take_bug_report(const std::string &title, const std::string &detail) = 0;
};

}  // namespace modes
}  // namespace modewarden
