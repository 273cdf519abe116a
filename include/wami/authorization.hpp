#pragma once

#include "wami/arn.hpp"
#include "wami/context.hpp"
#include "wami/store.hpp"

#include <string>
#include <vector>

namespace wami {

// ── Configuration ─────────────────────────────────────────────────────────────

struct AuthorizationOptions {
    /// When false a stored policy that fails to parse is treated as an empty
    /// document. When true the decision fails with Error(InvalidParameter).
    bool fail_closed_on_malformed_policy = false;
};

// ── Trace ─────────────────────────────────────────────────────────────────────

enum class PolicyOutcome { Allow, Deny, NoMatch, Malformed };

inline std::ostream& operator<<(std::ostream& os, PolicyOutcome o) {
    switch (o) {
        case PolicyOutcome::Allow:     return os << "Allow";
        case PolicyOutcome::Deny:      return os << "Deny";
        case PolicyOutcome::NoMatch:   return os << "NoMatch";
        case PolicyOutcome::Malformed: return os << "Malformed";
        default:                       return os << "Unknown";
    }
}

/// One stored policy consulted during a decision.
struct PolicyStep {
    std::string      source;    // policy ARN or inline policy name
    PolicySourceKind kind;
    PolicyOutcome    outcome;
};

struct AuthorizationTrace {
    bool                    root_bypass = false;
    std::vector<PolicyStep> steps;
};

struct AuthorizationResult {
    bool               allowed = false;
    AuthorizationTrace trace;
};

// ── AuthorizationService ──────────────────────────────────────────────────────

/**
 * AuthorizationService
 *
 * Decides whether the caller in a WamiContext may perform an action on a
 * resource ARN, using the caller's stored policies.
 *
 * Order of evaluation:
 *   1. Root contexts are allowed without consulting any policy.
 *   2. The caller must be a user ARN; its resource id is the user name.
 *   3. Attached managed policies, then inline policies, each evaluated on
 *      its own. The first policy with a matching Deny denies; the first
 *      with a matching Allow allows.
 *   4. No match anywhere is an implicit deny.
 */
class AuthorizationService {
public:
    explicit AuthorizationService(const PolicyStore& store, AuthorizationOptions options = {});

    AuthorizationResult evaluate(const WamiContext& context, const std::string& action,
                                 const WamiArn& resource) const;

    bool authorize(const WamiContext& context, const std::string& action,
                   const WamiArn& resource) const;

    /// Throws AccessDeniedError when authorize() would return false.
    void check_or_deny(const WamiContext& context, const std::string& action,
                       const WamiArn& resource) const;

    // Wildcard helpers shared with policy evaluation.
    static bool matches_action(const std::string& pattern, const std::string& action);
    static bool matches_resource(const std::string& pattern, const std::string& resource);
    static bool wildcard_match(const std::string& pattern, const std::string& value);

private:
    const PolicyStore&   store_;
    AuthorizationOptions options_;
};

} // namespace wami
