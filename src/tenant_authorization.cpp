#include "wami/tenant_authorization.hpp"
#include "wami/error.hpp"
#include "wami/json.hpp"
#include "wami/policy_engine.hpp"

#include <algorithm>
#include <utility>

namespace wami {

const char* to_action_string(TenantAction action) {
    switch (action) {
        case TenantAction::Read:            return "tenant:Read";
        case TenantAction::Update:          return "tenant:Update";
        case TenantAction::Delete:          return "tenant:Delete";
        case TenantAction::CreateSubTenant: return "tenant:CreateSubTenant";
        case TenantAction::ManageUsers:     return "tenant:ManageUsers";
        case TenantAction::ManageRoles:     return "tenant:ManageRoles";
        case TenantAction::ManagePolicies:  return "tenant:ManagePolicies";
        case TenantAction::All:             return "tenant:*";
        default:                            return "tenant:Unknown";
    }
}

std::string tenant_resource_arn(const std::string& tenant_id) {
    return "arn:wami:tenant::" + tenant_id;
}

// ── TenantAuthorizer ──────────────────────────────────────────────────────────

TenantAuthorizer::TenantAuthorizer(const std::vector<std::string>& policy_json_list) {
    for (const auto& json : policy_json_list) {
        try {
            policies_.push_back(parse_policy_document(json));
        } catch (const Error&) {
            // unparseable documents grant nothing
            continue;
        }
    }
}

TenantAuthorizer TenantAuthorizer::from_documents(std::vector<PolicyDocument> documents) {
    TenantAuthorizer authorizer;
    authorizer.policies_ = std::move(documents);
    return authorizer;
}

bool TenantAuthorizer::check_permission(const std::string& /*principal_arn*/,
                                        const std::string& tenant_id,
                                        TenantAction action) const {
    return evaluate_documents(policies_, to_action_string(action),
                              tenant_resource_arn(tenant_id)) == PolicyEffect::Allow;
}

// ── Policy templates ──────────────────────────────────────────────────────────

std::string build_tenant_admin_policy(const std::string& tenant_id) {
    PolicyStatement statement;
    statement.effect   = Effect::Allow;
    statement.action   = { to_action_string(TenantAction::All) };
    statement.resource = { tenant_resource_arn(tenant_id), tenant_resource_arn(tenant_id) + "/*" };

    PolicyDocument doc;
    doc.statement.push_back(std::move(statement));
    return to_json(doc);
}

std::string build_tenant_readonly_policy(const std::string& tenant_id) {
    PolicyStatement statement;
    statement.effect   = Effect::Allow;
    statement.action   = { to_action_string(TenantAction::Read) };
    statement.resource = { tenant_resource_arn(tenant_id) };

    PolicyDocument doc;
    doc.statement.push_back(std::move(statement));
    return to_json(doc);
}

// ── Store-backed admin check ──────────────────────────────────────────────────

bool check_tenant_admin(const TenantStore& store, const std::string& principal_arn,
                        const TenantId& tenant_id) {
    auto is_admin = [&](const Tenant& tenant) {
        const auto& admins = tenant.admin_principals;
        return std::find(admins.begin(), admins.end(), principal_arn) != admins.end();
    };

    if (auto tenant = store.get_tenant(tenant_id); tenant && is_admin(*tenant)) {
        return true;
    }
    for (const auto& ancestor : tenant_ancestors(store, tenant_id)) {
        if (is_admin(ancestor)) return true;
    }
    return false;
}

} // namespace wami
