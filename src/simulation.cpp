#include "wami/simulation.hpp"
#include "wami/arn.hpp"
#include "wami/error.hpp"

namespace wami {

SimulatePolicyResponse simulate_principal_policy(const PolicyStore& store,
                                                 const SimulatePrincipalPolicyRequest& request) {
    const WamiArn principal = parse_arn(request.policy_source_arn);
    if (principal.resource_type() != "user") {
        throw Error(ErrorKind::InvalidParameter,
                    "policy source is not a user: " + request.policy_source_arn);
    }

    const std::string& user_name = principal.resource_id();
    if (!store.user_exists(user_name)) {
        throw Error(ErrorKind::ResourceNotFound, "User " + user_name + " not found");
    }

    PolicyEvaluationEngine engine;
    for (const auto& policy : collect_user_policies(store, user_name)) {
        engine.add_policy_json(policy.document, policy.source_id);
    }
    for (std::size_t i = 0; i < request.policy_input_list.size(); ++i) {
        engine.add_policy_json(request.policy_input_list[i],
                               "PolicyInputList." + std::to_string(i + 1));
    }

    const std::vector<std::string> default_resources{ "*" };
    const auto& resources = request.resource_arns ? *request.resource_arns : default_resources;
    return engine.simulate(request.action_names, resources, request.context_entries);
}

} // namespace wami
