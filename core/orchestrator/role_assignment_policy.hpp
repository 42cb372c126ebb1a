#pragma once

#include <optional>
#include <string>

#include "modes/collaborators.hpp"
#include "modes/mode_types.hpp"

namespace modewarden {
namespace orchestrator {

// Feature flags gating each additional client role family
struct ConcurrencyFlags {
    bool local_only_enabled = false;
    bool secondary_long_lived_enabled = false;
    bool secondary_transient_enabled = false;
};

// Client manager as seen by the policy: handle plus current association
struct ClientCandidate {
    modes::ManagerId id = modes::kInvalidManagerId;
    std::optional<modes::NetworkTarget> network;
};

/**
 * Snapshot of orchestrator state the policy decides on.
 * Built by the orchestrator on its queue thread for each request.
 */
struct PolicyContext {
    bool client_axis_enabled = false;
    bool emergency_active = false;
    bool recovery_in_progress = false;
    std::optional<ClientCandidate> role_holder;  // Holder of the requested role, preferably on the hinted network
    std::optional<ClientCandidate> primary;      // Current primary client manager
};

enum class PolicyAction {
    REFUSE,          // Answer the caller with no manager
    REUSE_EXISTING,  // Hand out the manager already holding the role
    USE_PRIMARY,     // Hand out the primary manager instead of a dedicated one
    CREATE           // Create a new manager for the role
};

const char *policy_action_to_string(PolicyAction action);

struct PolicyDecision {
    PolicyAction action = PolicyAction::REFUSE;
    modes::ManagerId manager = modes::kInvalidManagerId;  // Set for REUSE_EXISTING / USE_PRIMARY
    std::string reason;
};

/**
 * RoleAssignmentPolicy - admission for additional client roles.
 *
 * Check order:
 * 1. Client axis disabled, emergency, or recovery in flight: refuse
 * 2. Role already held by a manager on the hinted network: reuse it. A holder
 *    on any other network does not count and the checks below decide
 * 3. Local-only / long-lived hint equal to the primary's network: use the primary
 * 4. Interface admission and the role's feature flag; on failure fall back to
 *    the primary if the hint matches its network, otherwise refuse
 * 5. Create
 */
class RoleAssignmentPolicy {
public:
    RoleAssignmentPolicy(const modes::InterfaceController &interfaces, const ConcurrencyFlags &flags);

    PolicyDecision decide(modes::Role role, const modes::WorkSource &requestor, const modes::NetworkTarget &hint,
                          const PolicyContext &context) const;

    // Feature flag for an additional client role (false for any other role)
    bool is_role_enabled(modes::Role role) const;

    const ConcurrencyFlags &flags() const { return flags_; }

private:
    static bool hint_matches(const std::optional<ClientCandidate> &candidate, const modes::NetworkTarget &hint);

    const modes::InterfaceController &interfaces_;
    ConcurrencyFlags flags_;
};

}  // namespace orchestrator
}  // namespace modewarden
