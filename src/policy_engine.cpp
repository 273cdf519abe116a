#include "wami/policy_engine.hpp"

#include <utility>

namespace wami {

// ── Pattern matching ──────────────────────────────────────────────────────────

bool matches_pattern(const std::string& pattern, const std::string& value) {
    if (pattern == "*") return true;

    auto first_star = pattern.find('*');
    if (first_star == std::string::npos) return pattern == value;

    auto last_star = pattern.rfind('*');
    const std::string head = pattern.substr(0, first_star);
    const std::string tail = pattern.substr(last_star + 1);

    if (value.size() < head.size() + tail.size()) return false;
    if (value.compare(0, head.size(), head) != 0) return false;
    if (value.compare(value.size() - tail.size(), tail.size(), tail) != 0) return false;

    // Interior pieces must fit between the anchored head and tail.
    std::size_t pos = head.size();
    const std::size_t limit = value.size() - tail.size();
    std::size_t piece_start = first_star + 1;
    while (piece_start <= last_star) {
        auto piece_end = pattern.find('*', piece_start);
        if (piece_end > piece_start) {
            const std::string piece = pattern.substr(piece_start, piece_end - piece_start);
            auto found = value.find(piece, pos);
            if (found == std::string::npos || found + piece.size() > limit) return false;
            pos = found + piece.size();
        }
        piece_start = piece_end + 1;
    }
    return true;
}

bool matches_any(const std::vector<std::string>& patterns, const std::string& value) {
    for (const auto& pattern : patterns) {
        if (matches_pattern(pattern, value)) return true;
    }
    return false;
}

// ── Statement / document evaluation ───────────────────────────────────────────

bool statement_matches(const PolicyStatement& statement, const std::string& action,
                       const std::string& resource) {
    return matches_any(statement.action, action) && matches_any(statement.resource, resource);
}

PolicyEffect evaluate_document(const PolicyDocument& document, const std::string& action,
                               const std::string& resource) {
    for (const auto& statement : document.statement) {
        if (statement.effect == Effect::Deny && statement_matches(statement, action, resource)) {
            return PolicyEffect::Deny;
        }
    }
    for (const auto& statement : document.statement) {
        if (statement.effect == Effect::Allow && statement_matches(statement, action, resource)) {
            return PolicyEffect::Allow;
        }
    }
    return PolicyEffect::NoMatch;
}

PolicyEffect evaluate_documents(const std::vector<PolicyDocument>& documents,
                                const std::string& action, const std::string& resource) {
    bool allowed = false;
    for (const auto& document : documents) {
        switch (evaluate_document(document, action, resource)) {
            case PolicyEffect::Deny:    return PolicyEffect::Deny;
            case PolicyEffect::Allow:   allowed = true; break;
            case PolicyEffect::NoMatch: break;
        }
    }
    return allowed ? PolicyEffect::Allow : PolicyEffect::NoMatch;
}

// ── PolicyEvaluationEngine ────────────────────────────────────────────────────

void PolicyEvaluationEngine::add_policy(PolicyDocument document,
                                        std::optional<std::string> source_id) {
    policies_.push_back({ std::move(document), std::move(source_id) });
}

void PolicyEvaluationEngine::add_policy_json(const std::string& json,
                                             std::optional<std::string> source_id) {
    add_policy(parse_policy_document(json), std::move(source_id));
}

SimulationResult PolicyEvaluationEngine::evaluate(const std::string& action,
                                                  const std::string& resource,
                                                  const std::vector<ContextEntry>&) const {
    SimulationResult result;
    result.action   = action;
    result.resource = resource;

    bool has_allow = false;
    bool has_deny  = false;

    for (const auto& policy : policies_) {
        for (const auto& statement : policy.document.statement) {
            const bool action_hit   = matches_any(statement.action, action);
            const bool resource_hit = matches_any(statement.resource, resource);
            if (!action_hit && !resource_hit) continue;

            result.matched_statements.push_back(
                { policy.source_id, statement.effect, action_hit, resource_hit });
            if (!action_hit || !resource_hit) continue;

            if (statement.effect == Effect::Deny) {
                has_deny = true;
            } else {
                has_allow = true;
            }
        }
    }

    result.decision = (!has_deny && has_allow) ? Decision::Allowed : Decision::Denied;
    return result;
}

SimulatePolicyResponse PolicyEvaluationEngine::simulate(const std::vector<std::string>& actions,
                                                        const std::vector<std::string>& resources,
                                                        const std::vector<ContextEntry>& context) const {
    SimulatePolicyResponse response;
    for (const auto& action : actions) {
        for (const auto& resource : resources) {
            response.evaluation_results.push_back(evaluate(action, resource, context));
        }
    }
    return response;
}

SimulatePolicyResponse simulate_custom_policy(const SimulateCustomPolicyRequest& request) {
    PolicyEvaluationEngine engine;
    for (std::size_t i = 0; i < request.policy_input_list.size(); ++i) {
        engine.add_policy_json(request.policy_input_list[i],
                               "PolicyInputList." + std::to_string(i + 1));
    }

    const std::vector<std::string> default_resources{ "*" };
    const auto& resources = request.resource_arns ? *request.resource_arns : default_resources;
    return engine.simulate(request.action_names, resources, request.context_entries);
}

} // namespace wami
