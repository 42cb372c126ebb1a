#include "orchestrator/messages.hpp"

#include <type_traits>

namespace modewarden {
namespace orchestrator {

namespace msg {

const char *manager_event_kind_to_string(ManagerEventKind kind) {
    switch (kind) {
        case ManagerEventKind::STARTED:
            return "STARTED";
        case ManagerEventKind::START_FAILURE:
            return "START_FAILURE";
        case ManagerEventKind::STOPPED:
            return "STOPPED";
        case ManagerEventKind::ROLE_CHANGED:
            return "ROLE_CHANGED";
        default:
            return "UNKNOWN";
    }
}

}  // namespace msg

const char *message_name(const Message &message) {
    return std::visit(
        [](const auto &m) -> const char * {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, msg::Boot>) {
                return "Boot";
            } else if constexpr (std::is_same_v<T, msg::WifiToggled>) {
                return "WifiToggled";
            } else if constexpr (std::is_same_v<T, msg::ScanAlwaysModeChanged>) {
                return "ScanAlwaysModeChanged";
            } else if constexpr (std::is_same_v<T, msg::LocationModeChanged>) {
                return "LocationModeChanged";
            } else if constexpr (std::is_same_v<T, msg::AirplaneModeToggled>) {
                return "AirplaneModeToggled";
            } else if constexpr (std::is_same_v<T, msg::StartAccessPoint>) {
                return "StartAccessPoint";
            } else if constexpr (std::is_same_v<T, msg::StopAccessPoint>) {
                return "StopAccessPoint";
            } else if constexpr (std::is_same_v<T, msg::UpdateApCapability>) {
                return "UpdateApCapability";
            } else if constexpr (std::is_same_v<T, msg::UpdateApConfiguration>) {
                return "UpdateApConfiguration";
            } else if constexpr (std::is_same_v<T, msg::RequestClientManager>) {
                return "RequestClientManager";
            } else if constexpr (std::is_same_v<T, msg::RemoveClientManager>) {
                return "RemoveClientManager";
            } else if constexpr (std::is_same_v<T, msg::HardwareFault>) {
                return "HardwareFault";
            } else if constexpr (std::is_same_v<T, msg::RestartAll>) {
                return "RestartAll";
            } else if constexpr (std::is_same_v<T, msg::RecoveryContinue>) {
                return "RecoveryContinue";
            } else if constexpr (std::is_same_v<T, msg::RecoveryDisable>) {
                return "RecoveryDisable";
            } else if constexpr (std::is_same_v<T, msg::EmergencyCallbackMode>) {
                return "EmergencyCallbackMode";
            } else if constexpr (std::is_same_v<T, msg::EmergencyCallState>) {
                return "EmergencyCallState";
            } else if constexpr (std::is_same_v<T, msg::VerboseLogging>) {
                return "VerboseLogging";
            } else if constexpr (std::is_same_v<T, msg::DumpRequest>) {
                return "DumpRequest";
            } else {
                return "ManagerEvent";
            }
        },
        message);
}

}  // namespace orchestrator
}  // namespace modewarden
