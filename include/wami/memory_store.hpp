#pragma once

#include "wami/store.hpp"

#include <map>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

namespace wami {

/**
 * InMemoryStore
 *
 * Map-backed PolicyStore and TenantStore. Readers share the lock, writers
 * take it exclusively.
 */
class InMemoryStore : public PolicyStore, public TenantStore {
public:
    // ── Users and policies ───────────────────────────────────────────────────

    /// Throws Error(ResourceExists) if the user exists.
    void create_user(const std::string& user_name);

    /// Throws Error(ResourceExists) if a policy with that ARN exists.
    void create_policy(ManagedPolicy policy);

    /// Throws Error(ResourceNotFound) for an unknown user or policy. Re-attaching is a no-op.
    void attach_user_policy(const std::string& user_name, const std::string& policy_arn);

    /// Creates or replaces an inline policy. Throws Error(ResourceNotFound) for an unknown user.
    void put_user_policy(const std::string& user_name, const std::string& policy_name,
                         std::string policy_document);

    bool user_exists(const std::string& user_name) const override;
    std::vector<std::string> list_attached_user_policies(const std::string& user_name) const override;
    std::optional<ManagedPolicy> get_policy(const std::string& policy_arn) const override;
    std::vector<std::string> list_user_policies(const std::string& user_name) const override;
    std::optional<std::string> get_user_policy(const std::string& user_name,
                                               const std::string& policy_name) const override;

    // ── Tenants ──────────────────────────────────────────────────────────────

    void create_tenant(Tenant tenant);
    void update_tenant(Tenant tenant);
    void delete_tenant(const TenantId& id);

    std::optional<Tenant> get_tenant(const TenantId& id) const override;
    std::vector<Tenant> list_tenants() const override;
    std::vector<Tenant> list_child_tenants(const TenantId& parent_id) const override;

private:
    struct InlinePolicy {
        std::string name;
        std::string document;
    };

    mutable std::shared_mutex mutex_;

    std::set<std::string>                              users_;
    std::map<std::string, ManagedPolicy>               policies_;
    std::map<std::string, std::vector<std::string>>    attachments_;
    std::map<std::string, std::vector<InlinePolicy>>   inline_policies_;
    std::map<std::string, Tenant>                      tenants_;
};

} // namespace wami
