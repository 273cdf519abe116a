#pragma once

#include "wami/tenant.hpp"

#include <optional>
#include <string>
#include <vector>

namespace wami {

struct ManagedPolicy {
    std::string policy_name;
    std::string arn;
    std::string policy_document;   // raw IAM JSON
};

/**
 * PolicyStore
 *
 * Read side of the IAM persistence layer as seen by authorization and
 * simulation. Implementations own their concurrency; each call returns a
 * consistent snapshot. Failures are reported as Error(StoreError).
 */
class PolicyStore {
public:
    virtual ~PolicyStore() = default;

    virtual bool user_exists(const std::string& user_name) const = 0;

    /// Managed policy ARNs attached to the user, in attachment order.
    virtual std::vector<std::string> list_attached_user_policies(const std::string& user_name) const = 0;
    virtual std::optional<ManagedPolicy> get_policy(const std::string& policy_arn) const = 0;

    /// Inline policy names of the user, in creation order.
    virtual std::vector<std::string> list_user_policies(const std::string& user_name) const = 0;
    virtual std::optional<std::string> get_user_policy(const std::string& user_name,
                                                       const std::string& policy_name) const = 0;
};

/// Read side of tenant persistence; used for quota and ancestor queries.
class TenantStore {
public:
    virtual ~TenantStore() = default;

    virtual std::optional<Tenant> get_tenant(const TenantId& id) const = 0;
    virtual std::vector<Tenant> list_tenants() const = 0;
    virtual std::vector<Tenant> list_child_tenants(const TenantId& parent_id) const = 0;
};

// ── Policy gathering ──────────────────────────────────────────────────────────

enum class PolicySourceKind { Managed, Inline };

struct StoredPolicy {
    PolicySourceKind kind;
    std::string      source_id;   // policy ARN or inline policy name
    std::string      document;    // raw IAM JSON
};

/// The user's attached managed policies followed by its inline policies.
/// Attached ARNs whose policy no longer exists are skipped.
std::vector<StoredPolicy> collect_user_policies(const PolicyStore& store,
                                                const std::string& user_name);

} // namespace wami
