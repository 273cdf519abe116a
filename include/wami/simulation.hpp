#pragma once

#include "wami/policy_engine.hpp"
#include "wami/store.hpp"

#include <optional>
#include <string>
#include <vector>

namespace wami {

struct SimulatePrincipalPolicyRequest {
    std::string                             policy_source_arn;  // WAMI user ARN
    std::vector<std::string>                action_names;
    std::optional<std::vector<std::string>> resource_arns;      // defaults to {"*"}
    std::vector<std::string>                policy_input_list;  // extra raw policy JSON
    std::vector<ContextEntry>               context_entries;
};

/**
 * Simulates the user named by policy_source_arn: its attached managed
 * policies, then its inline policies, then any extra inputs, evaluated
 * together with deny-overrides.
 *
 * Throws Error(InvalidParameter) for an unparseable or non-user ARN or a
 * malformed policy, and Error(ResourceNotFound) for an unknown user.
 */
SimulatePolicyResponse simulate_principal_policy(const PolicyStore& store,
                                                 const SimulatePrincipalPolicyRequest& request);

} // namespace wami
