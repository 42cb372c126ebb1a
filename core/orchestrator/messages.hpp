#pragma once

/**
 * @file messages.hpp
 * @brief Messages processed by the orchestrator's serial queue
 *
 * Caller intents and mode manager lifecycle events share one variant so they
 * are totally ordered by arrival on a single queue.
 */

#include <cstdint>
#include <functional>
#include <optional>
#include <variant>

#include <nlohmann/json.hpp>

#include "modes/mode_types.hpp"

namespace modewarden {
namespace orchestrator {

/**
 * Answer to an additional client manager request.
 * std::nullopt means the request was refused.
 */
using ClientManagerRequestCallback = std::function<void(const std::optional<modes::ManagerInfo> &)>;

namespace msg {

// Seed the state machine from the settings store
struct Boot {};

struct WifiToggled {
    bool enabled = false;
    modes::WorkSource requestor;
};

struct ScanAlwaysModeChanged {
    modes::WorkSource requestor;
};

struct LocationModeChanged {};

struct AirplaneModeToggled {};

struct StartAccessPoint {
    modes::ApModeConfiguration config;
    modes::WorkSource requestor;
};

// role == std::nullopt stops every AP
struct StopAccessPoint {
    std::optional<modes::Role> role;
};

struct UpdateApCapability {
    modes::ApCapability capability;
};

struct UpdateApConfiguration {
    modes::ApConfig config;
};

struct RequestClientManager {
    modes::Role role = modes::Role::CLIENT_LOCAL_ONLY;
    modes::WorkSource requestor;
    modes::NetworkTarget hint;
    ClientManagerRequestCallback callback;
};

struct RemoveClientManager {
    modes::ManagerId id = modes::kInvalidManagerId;
};

struct HardwareFault {};

struct RestartAll {
    modes::RecoveryReason reason = modes::RecoveryReason::LAST_RESORT_WATCHDOG;
};

// Fires after the recovery delay; stale generations are ignored
struct RecoveryContinue {
    uint64_t generation = 0;
};

struct RecoveryDisable {};

struct EmergencyCallbackMode {
    bool active = false;
};

struct EmergencyCallState {
    bool active = false;
};

struct VerboseLogging {
    bool enabled = false;
};

// Snapshot state on the queue thread and hand it to the callback
struct DumpRequest {
    std::function<void(const nlohmann::json &)> callback;
};

enum class ManagerEventKind { STARTED, START_FAILURE, STOPPED, ROLE_CHANGED };

const char *manager_event_kind_to_string(ManagerEventKind kind);

struct ManagerEvent {
    modes::ManagerId id = modes::kInvalidManagerId;
    ManagerEventKind kind = ManagerEventKind::STARTED;
};

}  // namespace msg

using Message = std::variant<msg::Boot, msg::WifiToggled, msg::ScanAlwaysModeChanged, msg::LocationModeChanged,
                             msg::AirplaneModeToggled, msg::StartAccessPoint, msg::StopAccessPoint,
                             msg::UpdateApCapability, msg::UpdateApConfiguration, msg::RequestClientManager,
                             msg::RemoveClientManager, msg::HardwareFault, msg::RestartAll, msg::RecoveryContinue,
                             msg::RecoveryDisable, msg::EmergencyCallbackMode, msg::EmergencyCallState,
                             msg::VerboseLogging, msg::DumpRequest, msg::ManagerEvent>;

// Short name for log lines ("WifiToggled", "ManagerEvent", ...)
const char *message_name(const Message &message);

}  // namespace orchestrator
}  // namespace modewarden
