#pragma once

#include "wami/policy.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace wami {

// ── Pattern matching ──────────────────────────────────────────────────────────

/**
 * IAM wildcard match. Without '*' the pattern must equal the value. With
 * '*' the value must start with the text before the first '*', end with the
 * text after the last '*', and contain each interior piece in order,
 * scanning left to right without overlapping the anchored ends.
 */
bool matches_pattern(const std::string& pattern, const std::string& value);

/// True if any pattern matches.
bool matches_any(const std::vector<std::string>& patterns, const std::string& value);

// ── Per-statement / per-document evaluation ───────────────────────────────────

enum class PolicyEffect { Allow, Deny, NoMatch };

inline std::ostream& operator<<(std::ostream& os, PolicyEffect e) {
    switch (e) {
        case PolicyEffect::Allow:   return os << "Allow";
        case PolicyEffect::Deny:    return os << "Deny";
        case PolicyEffect::NoMatch: return os << "NoMatch";
        default:                    return os << "Unknown";
    }
}

bool statement_matches(const PolicyStatement& statement, const std::string& action,
                       const std::string& resource);

/// Deny if any matching statement denies, else Allow if any allows, else NoMatch.
PolicyEffect evaluate_document(const PolicyDocument& document, const std::string& action,
                               const std::string& resource);

/// Same rule folded over every document: a Deny anywhere wins over an Allow anywhere.
PolicyEffect evaluate_documents(const std::vector<PolicyDocument>& documents,
                                const std::string& action, const std::string& resource);

// ── Simulation types ──────────────────────────────────────────────────────────

enum class Decision { Allowed, Denied };

inline std::ostream& operator<<(std::ostream& os, Decision d) {
    return os << (d == Decision::Allowed ? "allowed" : "denied");
}

/// Condition context supplied by a caller. Passed through, not evaluated.
struct ContextEntry {
    std::string              key_name;
    std::vector<std::string> key_values;
    std::string              key_type;
};

struct StatementMatch {
    std::optional<std::string> source_policy_id;
    Effect                     effect;
    bool                       matched_action;
    bool                       matched_resource;
};

struct SimulationResult {
    std::string                 action;
    std::string                 resource;
    Decision                    decision = Decision::Denied;
    std::vector<StatementMatch> matched_statements;
    std::vector<std::string>    missing_context_values;

    bool allowed() const { return decision == Decision::Allowed; }
};

struct SimulatePolicyResponse {
    std::vector<SimulationResult> evaluation_results;
    bool                          is_truncated = false;
};

struct SimulateCustomPolicyRequest {
    std::vector<std::string>                policy_input_list;  // raw policy JSON
    std::vector<std::string>                action_names;
    std::optional<std::vector<std::string>> resource_arns;      // defaults to {"*"}
    std::vector<ContextEntry>               context_entries;
};

// ── PolicyEvaluationEngine ────────────────────────────────────────────────────

/**
 * PolicyEvaluationEngine
 *
 * Holds an ordered set of policy documents and evaluates (action, resource)
 * pairs against all of them at once.
 *
 * Resolution (deny-overrides):
 *   1. Any matching Deny statement in any document denies.
 *   2. Otherwise any matching Allow statement allows.
 *   3. Otherwise implicit deny.
 */
class PolicyEvaluationEngine {
public:
    void add_policy(PolicyDocument document, std::optional<std::string> source_id = std::nullopt);

    /// Parses and adds; throws Error(InvalidParameter) on malformed JSON.
    void add_policy_json(const std::string& json, std::optional<std::string> source_id = std::nullopt);

    SimulationResult evaluate(const std::string& action, const std::string& resource,
                              const std::vector<ContextEntry>& context = {}) const;

    /// Every action crossed with every resource, in action-major order.
    SimulatePolicyResponse simulate(const std::vector<std::string>& actions,
                                    const std::vector<std::string>& resources,
                                    const std::vector<ContextEntry>& context = {}) const;

    std::size_t policy_count() const { return policies_.size(); }

private:
    struct SourcedPolicy {
        PolicyDocument             document;
        std::optional<std::string> source_id;
    };

    std::vector<SourcedPolicy> policies_;
};

/// Evaluates raw policy documents against every action x resource pair.
/// Any malformed document fails the whole simulation with Error(InvalidParameter).
SimulatePolicyResponse simulate_custom_policy(const SimulateCustomPolicyRequest& request);

} // namespace wami
