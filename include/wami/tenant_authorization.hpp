#pragma once

#include "wami/policy.hpp"
#include "wami/store.hpp"
#include "wami/tenant.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace wami {

enum class TenantAction {
    Read,
    Update,
    Delete,
    CreateSubTenant,
    ManageUsers,
    ManageRoles,
    ManagePolicies,
    All,
};

/// "tenant:Read" ... "tenant:*".
const char* to_action_string(TenantAction action);

inline std::ostream& operator<<(std::ostream& os, TenantAction a) {
    return os << to_action_string(a);
}

/// Resource ARN that tenant policies target: "arn:wami:tenant::<tenant_id>".
std::string tenant_resource_arn(const std::string& tenant_id);

/**
 * TenantAuthorizer
 *
 * Answers tenant operations (read, update, create sub-tenant, ...) from a
 * fixed set of IAM policy documents. Tenants are addressed by the resource
 * ARN "arn:wami:tenant::<tenant_id>"; a Deny anywhere overrides an Allow.
 */
class TenantAuthorizer {
public:
    /// Parses each JSON document; documents that fail to parse are skipped.
    explicit TenantAuthorizer(const std::vector<std::string>& policy_json_list);

    static TenantAuthorizer from_documents(std::vector<PolicyDocument> documents);

    /// The principal is informational; only the documents decide.
    bool check_permission(const std::string& principal_arn, const std::string& tenant_id,
                          TenantAction action) const;

    std::size_t policy_count() const { return policies_.size(); }

private:
    TenantAuthorizer() = default;

    std::vector<PolicyDocument> policies_;
};

/// tenant:* on the tenant itself and everything below it.
std::string build_tenant_admin_policy(const std::string& tenant_id);

/// tenant:Read on the tenant itself.
std::string build_tenant_readonly_policy(const std::string& tenant_id);

/// True if principal is listed as an admin of the tenant or any stored ancestor.
bool check_tenant_admin(const TenantStore& store, const std::string& principal_arn,
                        const TenantId& tenant_id);

} // namespace wami
