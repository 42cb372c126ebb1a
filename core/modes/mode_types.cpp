#include "modes/mode_types.hpp"

namespace modewarden {
namespace modes {

const char *role_to_string(Role role) {
    switch (role) {
        case Role::CLIENT_PRIMARY:
            return "CLIENT_PRIMARY";
        case Role::CLIENT_SCAN_ONLY:
            return "CLIENT_SCAN_ONLY";
        case Role::CLIENT_LOCAL_ONLY:
            return "CLIENT_LOCAL_ONLY";
        case Role::CLIENT_SECONDARY_LONG_LIVED:
            return "CLIENT_SECONDARY_LONG_LIVED";
        case Role::CLIENT_SECONDARY_TRANSIENT:
            return "CLIENT_SECONDARY_TRANSIENT";
        case Role::AP_TETHERED:
            return "AP_TETHERED";
        case Role::AP_LOCAL_ONLY:
            return "AP_LOCAL_ONLY";
        default:
            return "UNKNOWN";
    }
}

std::optional<Role> string_to_role(const std::string &str) {
    if (str == "CLIENT_PRIMARY") return Role::CLIENT_PRIMARY;
    if (str == "CLIENT_SCAN_ONLY") return Role::CLIENT_SCAN_ONLY;
    if (str == "CLIENT_LOCAL_ONLY") return Role::CLIENT_LOCAL_ONLY;
    if (str == "CLIENT_SECONDARY_LONG_LIVED") return Role::CLIENT_SECONDARY_LONG_LIVED;
    if (str == "CLIENT_SECONDARY_TRANSIENT") return Role::CLIENT_SECONDARY_TRANSIENT;
    if (str == "AP_TETHERED") return Role::AP_TETHERED;
    if (str == "AP_LOCAL_ONLY") return Role::AP_LOCAL_ONLY;

    return std::nullopt;
}

bool is_client_role(Role role) { return !is_ap_role(role); }

bool is_ap_role(Role role) { return role == Role::AP_TETHERED || role == Role::AP_LOCAL_ONLY; }

bool is_connectivity_role(Role role) { return is_client_role(role) && role != Role::CLIENT_SCAN_ONLY; }

bool is_internet_connectivity_role(Role role) {
    return role == Role::CLIENT_PRIMARY || role == Role::CLIENT_SECONDARY_LONG_LIVED;
}

bool is_additional_client_role(Role role) {
    return role == Role::CLIENT_LOCAL_ONLY || role == Role::CLIENT_SECONDARY_LONG_LIVED ||
           role == Role::CLIENT_SECONDARY_TRANSIENT;
}

const WorkSource &internal_work_source() {
    static const WorkSource ws{1010, "modewarden"};
    return ws;
}

const WorkSource &settings_work_source() {
    static const WorkSource ws{1000, "settings"};
    return ws;
}

std::string work_source_to_string(const WorkSource &ws) {
    return "WorkSource{" + std::to_string(ws.uid) + (ws.package.empty() ? "" : " " + ws.package) + "}";
}

bool NetworkTarget::matches(const NetworkTarget &other) const {
    if (ssid.empty() || ssid != other.ssid) {
        return false;
    }
    if (bssid.empty() || other.bssid.empty()) {
        return true;
    }
    return bssid == other.bssid;
}

bool ApConfig::operator==(const ApConfig &other) const {
    return ssid == other.ssid && passphrase == other.passphrase && band == other.band && channel == other.channel &&
           hidden == other.hidden && max_clients == other.max_clients;
}

bool ApCapability::operator==(const ApCapability &other) const {
    return max_supported_clients == other.max_supported_clients && acs_offload == other.acs_offload &&
           client_force_disconnect == other.client_force_disconnect;
}

bool ApModeConfiguration::operator==(const ApModeConfiguration &other) const {
    return target_role == other.target_role && config == other.config && capability == other.capability;
}

const char *ap_state_to_string(ApState state) {
    switch (state) {
        case ApState::DISABLING:
            return "DISABLING";
        case ApState::DISABLED:
            return "DISABLED";
        case ApState::ENABLING:
            return "ENABLING";
        case ApState::ENABLED:
            return "ENABLED";
        case ApState::FAILED:
            return "FAILED";
        default:
            return "UNKNOWN";
    }
}

const char *ap_start_failure_to_string(ApStartFailure failure) {
    switch (failure) {
        case ApStartFailure::GENERAL:
            return "GENERAL";
        case ApStartFailure::EMERGENCY_ACTIVE:
            return "EMERGENCY_ACTIVE";
        case ApStartFailure::CONCURRENCY_NOT_ALLOWED:
            return "CONCURRENCY_NOT_ALLOWED";
        case ApStartFailure::RECOVERY_IN_PROGRESS:
            return "RECOVERY_IN_PROGRESS";
        default:
            return "UNKNOWN";
    }
}

const char *recovery_reason_to_string(RecoveryReason reason) {
    switch (reason) {
        case RecoveryReason::LAST_RESORT_WATCHDOG:
            return "Last Resort Watchdog";
        case RecoveryReason::WIFINATIVE_FAILURE:
            return "WifiNative Failure";
        case RecoveryReason::STA_IFACE_DOWN:
            return "Sta Interface Down";
        case RecoveryReason::API_CALL_TIMEOUT:
            return "API call timeout";
        default:
            return "";
    }
}

const char *multi_sta_use_case_to_string(MultiStaUseCase use_case) {
    switch (use_case) {
        case MultiStaUseCase::DUAL_STA_TRANSIENT_PREFER_PRIMARY:
            return "DUAL_STA_TRANSIENT_PREFER_PRIMARY";
        case MultiStaUseCase::DUAL_STA_NON_TRANSIENT_UNBIASED:
            return "DUAL_STA_NON_TRANSIENT_UNBIASED";
        default:
            return "UNKNOWN";
    }
}

}  // namespace modes
}  // namespace modewarden
