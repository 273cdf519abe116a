#include "wami/memory_store.hpp"
#include "wami/error.hpp"

#include <algorithm>
#include <mutex>
#include <utility>

namespace wami {

// ── Users and policies ────────────────────────────────────────────────────────

void InMemoryStore::create_user(const std::string& user_name) {
    std::unique_lock lock(mutex_);
    if (!users_.insert(user_name).second) {
        throw Error(ErrorKind::ResourceExists, "User " + user_name);
    }
}

void InMemoryStore::create_policy(ManagedPolicy policy) {
    std::unique_lock lock(mutex_);
    auto arn = policy.arn;
    if (!policies_.emplace(arn, std::move(policy)).second) {
        throw Error(ErrorKind::ResourceExists, "Policy " + arn);
    }
}

void InMemoryStore::attach_user_policy(const std::string& user_name, const std::string& policy_arn) {
    std::unique_lock lock(mutex_);
    if (users_.count(user_name) == 0) {
        throw Error(ErrorKind::ResourceNotFound, "User " + user_name);
    }
    if (policies_.count(policy_arn) == 0) {
        throw Error(ErrorKind::ResourceNotFound, "Policy " + policy_arn);
    }
    auto& attached = attachments_[user_name];
    if (std::find(attached.begin(), attached.end(), policy_arn) == attached.end()) {
        attached.push_back(policy_arn);
    }
}

void InMemoryStore::put_user_policy(const std::string& user_name, const std::string& policy_name,
                                    std::string policy_document) {
    std::unique_lock lock(mutex_);
    if (users_.count(user_name) == 0) {
        throw Error(ErrorKind::ResourceNotFound, "User " + user_name);
    }
    auto& policies = inline_policies_[user_name];
    for (auto& existing : policies) {
        if (existing.name == policy_name) {
            existing.document = std::move(policy_document);
            return;
        }
    }
    policies.push_back({ policy_name, std::move(policy_document) });
}

bool InMemoryStore::user_exists(const std::string& user_name) const {
    std::shared_lock lock(mutex_);
    return users_.count(user_name) > 0;
}

std::vector<std::string> InMemoryStore::list_attached_user_policies(const std::string& user_name) const {
    std::shared_lock lock(mutex_);
    auto it = attachments_.find(user_name);
    return it == attachments_.end() ? std::vector<std::string>{} : it->second;
}

std::optional<ManagedPolicy> InMemoryStore::get_policy(const std::string& policy_arn) const {
    std::shared_lock lock(mutex_);
    auto it = policies_.find(policy_arn);
    if (it == policies_.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> InMemoryStore::list_user_policies(const std::string& user_name) const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> names;
    auto it = inline_policies_.find(user_name);
    if (it != inline_policies_.end()) {
        for (const auto& policy : it->second) names.push_back(policy.name);
    }
    return names;
}

std::optional<std::string> InMemoryStore::get_user_policy(const std::string& user_name,
                                                          const std::string& policy_name) const {
    std::shared_lock lock(mutex_);
    auto it = inline_policies_.find(user_name);
    if (it == inline_policies_.end()) return std::nullopt;
    for (const auto& policy : it->second) {
        if (policy.name == policy_name) return policy.document;
    }
    return std::nullopt;
}

// ── Tenants ───────────────────────────────────────────────────────────────────

void InMemoryStore::create_tenant(Tenant tenant) {
    std::unique_lock lock(mutex_);
    auto key = tenant.id.as_str();
    if (!tenants_.emplace(key, std::move(tenant)).second) {
        throw Error(ErrorKind::ResourceExists, "Tenant " + key);
    }
}

void InMemoryStore::update_tenant(Tenant tenant) {
    std::unique_lock lock(mutex_);
    auto it = tenants_.find(tenant.id.as_str());
    if (it == tenants_.end()) {
        throw Error(ErrorKind::ResourceNotFound, "Tenant " + tenant.id.as_str() + " not found");
    }
    it->second = std::move(tenant);
}

void InMemoryStore::delete_tenant(const TenantId& id) {
    std::unique_lock lock(mutex_);
    if (tenants_.erase(id.as_str()) == 0) {
        throw Error(ErrorKind::ResourceNotFound, "Tenant " + id.as_str() + " not found");
    }
}

std::optional<Tenant> InMemoryStore::get_tenant(const TenantId& id) const {
    std::shared_lock lock(mutex_);
    auto it = tenants_.find(id.as_str());
    if (it == tenants_.end()) return std::nullopt;
    return it->second;
}

std::vector<Tenant> InMemoryStore::list_tenants() const {
    std::shared_lock lock(mutex_);
    std::vector<Tenant> result;
    for (const auto& entry : tenants_) result.push_back(entry.second);
    return result;
}

std::vector<Tenant> InMemoryStore::list_child_tenants(const TenantId& parent_id) const {
    std::shared_lock lock(mutex_);
    std::vector<Tenant> result;
    for (const auto& entry : tenants_) {
        const auto& tenant = entry.second;
        if (tenant.parent_id && *tenant.parent_id == parent_id) result.push_back(tenant);
    }
    return result;
}

} // namespace wami
