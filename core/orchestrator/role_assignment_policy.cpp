#include "orchestrator/role_assignment_policy.hpp"

#include "logging/logger.hpp"

namespace modewarden {
namespace orchestrator {

using modes::Role;

const char *policy_action_to_string(PolicyAction action) {
    switch (action) {
        case PolicyAction::REFUSE:
            return "REFUSE";
        case PolicyAction::REUSE_EXISTING:
            return "REUSE_EXISTING";
        case PolicyAction::USE_PRIMARY:
            return "USE_PRIMARY";
        case PolicyAction::CREATE:
            return "CREATE";
        default:
            return "UNKNOWN";
    }
}

RoleAssignmentPolicy::RoleAssignmentPolicy(const modes::InterfaceController &interfaces, const ConcurrencyFlags &flags)
    : interfaces_(interfaces), flags_(flags) {}

bool RoleAssignmentPolicy::is_role_enabled(Role role) const {
    switch (role) {
        case Role::CLIENT_LOCAL_ONLY:
            return flags_.local_only_enabled;
        case Role::CLIENT_SECONDARY_LONG_LIVED:
            return flags_.secondary_long_lived_enabled;
        case Role::CLIENT_SECONDARY_TRANSIENT:
            return flags_.secondary_transient_enabled;
        default:
            return false;
    }
}

bool RoleAssignmentPolicy::hint_matches(const std::optional<ClientCandidate> &candidate,
                                        const modes::NetworkTarget &hint) {
    return candidate && candidate->network && candidate->network->matches(hint);
}

PolicyDecision RoleAssignmentPolicy::decide(Role role, const modes::WorkSource &requestor,
                                            const modes::NetworkTarget &hint, const PolicyContext &context) const {
    PolicyDecision decision;

    if (!modes::is_additional_client_role(role)) {
        decision.reason = std::string("not an additional client role: ") + modes::role_to_string(role);
        return decision;
    }

    if (!context.client_axis_enabled) {
        decision.reason = "client axis disabled";
        return decision;
    }
    if (context.emergency_active) {
        decision.reason = "emergency mode active";
        return decision;
    }
    if (context.recovery_in_progress) {
        decision.reason = "recovery in progress";
        return decision;
    }

    // A holder on another network does not serve this request
    if (hint_matches(context.role_holder, hint)) {
        decision.action = PolicyAction::REUSE_EXISTING;
        decision.manager = context.role_holder->id;
        decision.reason = "role holder on same network";
        return decision;
    }

    // Local-only and long-lived never duplicate the primary's association
    if (role != Role::CLIENT_SECONDARY_TRANSIENT && hint_matches(context.primary, hint)) {
        decision.action = PolicyAction::USE_PRIMARY;
        decision.manager = context.primary->id;
        decision.reason = "primary on same network";
        return decision;
    }

    std::string refusal;
    if (!is_role_enabled(role)) {
        refusal = std::string("feature disabled for ") + modes::role_to_string(role);
    } else if (!interfaces_.can_create_client_interface(requestor)) {
        refusal = "no client interface available";
    }

    if (!refusal.empty()) {
        if (hint_matches(context.primary, hint)) {
            decision.action = PolicyAction::USE_PRIMARY;
            decision.manager = context.primary->id;
            decision.reason = refusal + ", falling back to primary";
        } else {
            decision.reason = refusal;
        }
        return decision;
    }

    decision.action = PolicyAction::CREATE;
    decision.reason = "admitted";
    return decision;
}

}  // namespace orchestrator
}  // namespace modewarden
