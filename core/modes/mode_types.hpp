#pragma once

/**
 * @file mode_types.hpp
 * @brief Value types shared by the orchestrator, its collaborators and its observers
 *
 * Everything in this header is a plain value type (cheap to copy, no
 * ownership). Mode managers themselves are referenced from outside the
 * orchestrator only through a ManagerId handle and a ManagerInfo snapshot.
 */

#include <cstdint>
#include <optional>
#include <string>

namespace modewarden {
namespace modes {

/**
 * Logical function a mode manager performs.
 *
 * Client roles:
 * - CLIENT_PRIMARY: main connectivity path, answers public APIs
 * - CLIENT_SCAN_ONLY: interface up for scans only
 * - CLIENT_LOCAL_ONLY: secondary STA for a local (no internet) connection
 * - CLIENT_SECONDARY_LONG_LIVED: secondary STA for duplication/bonding
 * - CLIENT_SECONDARY_TRANSIENT: secondary STA for make-before-break, may become primary
 *
 * Access point roles:
 * - AP_TETHERED: hotspot shared with tethering
 * - AP_LOCAL_ONLY: local-only hotspot
 */
enum class Role {
    CLIENT_PRIMARY,
    CLIENT_SCAN_ONLY,
    CLIENT_LOCAL_ONLY,
    CLIENT_SECONDARY_LONG_LIVED,
    CLIENT_SECONDARY_TRANSIENT,
    AP_TETHERED,
    AP_LOCAL_ONLY
};

const char *role_to_string(Role role);

/**
 * Parse a role name ("CLIENT_PRIMARY", "AP_TETHERED", ...).
 * Returns std::nullopt for unknown names (case-sensitive).
 */
std::optional<Role> string_to_role(const std::string &str);

bool is_client_role(Role role);
bool is_ap_role(Role role);

// Client roles that may initiate a connection (everything except scan-only)
bool is_connectivity_role(Role role);

// Long running client roles used for internet connectivity
bool is_internet_connectivity_role(Role role);

// Roles only reachable through an explicit additional-client request
bool is_additional_client_role(Role role);

// Attribution context of a request (who asked for the radio)
struct WorkSource {
    int uid = 0;
    std::string package;

    bool operator==(const WorkSource &other) const { return uid == other.uid && package == other.package; }
    bool operator!=(const WorkSource &other) const { return !(*this == other); }
};

// Lowest-priority requestor used for implicit, non-user requests (scan-always, location)
const WorkSource &internal_work_source();

// Requestor used when the client axis is restored from persisted settings
const WorkSource &settings_work_source();

std::string work_source_to_string(const WorkSource &ws);

/**
 * Identity of a network a client manager is connected (or connecting) to.
 * An empty bssid acts as a wildcard; an empty ssid never matches.
 */
struct NetworkTarget {
    std::string ssid;
    std::string bssid;

    bool matches(const NetworkTarget &other) const;
};

enum class ApBand { BAND_2GHZ, BAND_5GHZ, BAND_6GHZ, BAND_ANY };

struct ApConfig {
    std::string ssid;
    std::string passphrase;
    ApBand band = ApBand::BAND_2GHZ;
    int channel = 0;  // 0 = automatic selection
    bool hidden = false;
    int max_clients = 0;  // 0 = driver limit

    bool operator==(const ApConfig &other) const;
    bool operator!=(const ApConfig &other) const { return !(*this == other); }
};

struct ApCapability {
    int max_supported_clients = 0;
    bool acs_offload = false;
    bool client_force_disconnect = false;

    bool operator==(const ApCapability &other) const;
    bool operator!=(const ApCapability &other) const { return !(*this == other); }
};

/**
 * Request to bring up an access point.
 * `config` is std::nullopt when the persisted AP configuration should be used.
 */
struct ApModeConfiguration {
    Role target_role = Role::AP_TETHERED;
    std::optional<ApConfig> config;
    ApCapability capability;

    bool operator==(const ApModeConfiguration &other) const;
    bool operator!=(const ApModeConfiguration &other) const { return !(*this == other); }
};

enum class ApState { DISABLING, DISABLED, ENABLING, ENABLED, FAILED };

const char *ap_state_to_string(ApState state);

// Reason reported through the AP callback when a start request is refused
enum class ApStartFailure { GENERAL, EMERGENCY_ACTIVE, CONCURRENCY_NOT_ALLOWED, RECOVERY_IN_PROGRESS };

const char *ap_start_failure_to_string(ApStartFailure failure);

struct ApInfo {
    int frequency_mhz = 0;
    int bandwidth_mhz = 0;
    std::string bssid;
};

enum class RecoveryReason { LAST_RESORT_WATCHDOG, WIFINATIVE_FAILURE, STA_IFACE_DOWN, API_CALL_TIMEOUT };

const char *recovery_reason_to_string(RecoveryReason reason);

// Hardware bias hint for dual-STA operation
enum class MultiStaUseCase { DUAL_STA_TRANSIENT_PREFER_PRIMARY, DUAL_STA_NON_TRANSIENT_UNBIASED };

const char *multi_sta_use_case_to_string(MultiStaUseCase use_case);

/**
 * Opaque manager handle.
 * Ids are assigned by the orchestrator, start at 1 and are never reused.
 */
using ManagerId = uint64_t;

constexpr ManagerId kInvalidManagerId = 0;

/**
 * Read-only snapshot of an active manager, handed to observers and requesters.
 * The role is owned by the orchestrator; a snapshot never changes after it is taken.
 */
struct ManagerInfo {
    ManagerId id = kInvalidManagerId;
    Role role = Role::CLIENT_PRIMARY;
    WorkSource requestor;
    std::string interface_name;
};

}  // namespace modes
}  // namespace modewarden
