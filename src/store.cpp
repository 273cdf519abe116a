#include "wami/store.hpp"

#include <utility>

namespace wami {

std::vector<StoredPolicy> collect_user_policies(const PolicyStore& store,
                                                const std::string& user_name) {
    std::vector<StoredPolicy> result;

    for (const auto& policy_arn : store.list_attached_user_policies(user_name)) {
        if (auto policy = store.get_policy(policy_arn)) {
            result.push_back({ PolicySourceKind::Managed, policy_arn,
                               std::move(policy->policy_document) });
        }
    }

    for (const auto& policy_name : store.list_user_policies(user_name)) {
        if (auto document = store.get_user_policy(user_name, policy_name)) {
            result.push_back({ PolicySourceKind::Inline, policy_name, std::move(*document) });
        }
    }
    return result;
}

} // namespace wami
