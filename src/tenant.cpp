#include "wami/tenant.hpp"
#include "wami/error.hpp"
#include "wami/store.hpp"

#include <cctype>
#include <set>
#include <utility>

namespace wami {

// ── TenantId ──────────────────────────────────────────────────────────────────

std::optional<TenantId> TenantId::parent() const {
    auto slash = id_.rfind('/');
    if (slash == std::string::npos) return std::nullopt;
    return TenantId(id_.substr(0, slash));
}

std::size_t TenantId::depth() const {
    std::size_t count = 0;
    for (char c : id_) {
        if (c == '/') ++count;
    }
    return count;
}

std::vector<TenantId> TenantId::ancestors() const {
    std::vector<TenantId> result;
    auto slash = id_.find('/');
    while (slash != std::string::npos) {
        result.emplace_back(id_.substr(0, slash));
        slash = id_.find('/', slash + 1);
    }
    return result;
}

bool TenantId::is_descendant_of(const TenantId& other) const {
    const std::string prefix = other.id_ + "/";
    return id_.size() > prefix.size() && id_.compare(0, prefix.size(), prefix) == 0;
}

// ── TenantQuotas ──────────────────────────────────────────────────────────────

void TenantQuotas::validate_against_parent(const TenantQuotas& parent) const {
    const std::pair<const char*, bool> checks[] = {
        { "max_users",       max_users > parent.max_users },
        { "max_roles",       max_roles > parent.max_roles },
        { "max_policies",    max_policies > parent.max_policies },
        { "max_groups",      max_groups > parent.max_groups },
        { "max_sub_tenants", max_sub_tenants > parent.max_sub_tenants },
    };
    for (const auto& [field, exceeds] : checks) {
        if (exceeds) {
            throw Error(ErrorKind::InvalidParameter, std::string(field) + " exceeds parent limit");
        }
    }
}

bool TenantQuotas::operator==(const TenantQuotas& other) const {
    return max_users == other.max_users && max_roles == other.max_roles &&
           max_policies == other.max_policies && max_groups == other.max_groups &&
           max_access_keys == other.max_access_keys &&
           max_sub_tenants == other.max_sub_tenants && api_rate_limit == other.api_rate_limit;
}

// ── Pure operations ───────────────────────────────────────────────────────────

void validate_tenant_name(const std::string& name) {
    if (name.empty()) {
        throw Error(ErrorKind::InvalidParameter, "Tenant name cannot be empty");
    }
    if (name.size() > 64) {
        throw Error(ErrorKind::InvalidParameter, "Tenant name cannot exceed 64 characters");
    }
    for (unsigned char c : name) {
        if (!std::isalnum(c) && c != '-' && c != '_') {
            throw Error(ErrorKind::InvalidParameter,
                "Tenant name can only contain alphanumeric characters, hyphens, and underscores");
        }
    }
}

Tenant build_tenant(TenantId id, std::string name, std::optional<std::string> organization,
                    std::optional<TenantId> parent_id) {
    Tenant tenant{ std::move(id), std::move(parent_id), std::move(name), std::move(organization) };
    return tenant;
}

// ── Store-backed queries ──────────────────────────────────────────────────────

TenantQuotas effective_quotas(const TenantStore& store, const TenantId& id) {
    auto current = store.get_tenant(id);
    if (!current) {
        throw Error(ErrorKind::ResourceNotFound, "Tenant " + id.as_str() + " not found");
    }

    std::set<std::string> visited{ id.as_str() };
    while (current->quota_mode == QuotaMode::Inherited && current->parent_id) {
        const TenantId parent_id = *current->parent_id;
        if (!visited.insert(parent_id.as_str()).second) {
            throw Error(ErrorKind::InvalidParameter,
                "Tenant " + id.as_str() + " has a cyclic parent chain at " + parent_id.as_str());
        }
        auto parent = store.get_tenant(parent_id);
        if (!parent) {
            throw Error(ErrorKind::ResourceNotFound,
                "Parent tenant " + parent_id.as_str() + " of " + current->id.as_str() +
                " not found");
        }
        current = std::move(parent);
    }
    return current->quotas;
}

std::vector<Tenant> tenant_ancestors(const TenantStore& store, const TenantId& id) {
    std::vector<Tenant> result;
    for (const auto& ancestor_id : id.ancestors()) {
        if (auto tenant = store.get_tenant(ancestor_id)) {
            result.push_back(std::move(*tenant));
        }
    }
    return result;
}

std::vector<TenantId> tenant_descendants(const TenantStore& store, const TenantId& id) {
    std::vector<TenantId> result;
    for (const auto& tenant : store.list_tenants()) {
        if (tenant.id.is_descendant_of(id)) result.push_back(tenant.id);
    }
    return result;
}

// ── TenantNode ────────────────────────────────────────────────────────────────

namespace {

void attach_children(TenantNode& node, const std::vector<Tenant>& tenants,
                     std::set<std::string>& seen) {
    for (const auto& candidate : tenants) {
        if (!candidate.parent_id || *candidate.parent_id != node.tenant.id) continue;
        if (!seen.insert(candidate.id.as_str()).second) continue;
        TenantNode child{ candidate, {} };
        attach_children(child, tenants, seen);
        node.children.push_back(std::move(child));
    }
}

} // namespace

std::optional<TenantNode> TenantNode::build_tree(const std::vector<Tenant>& tenants,
                                                 const TenantId& root_id) {
    for (const auto& tenant : tenants) {
        if (tenant.id != root_id) continue;
        TenantNode root{ tenant, {} };
        std::set<std::string> seen{ root_id.as_str() };
        attach_children(root, tenants, seen);
        return root;
    }
    return std::nullopt;
}

std::vector<TenantId> TenantNode::all_descendants() const {
    std::vector<TenantId> result;
    for (const auto& child : children) {
        result.push_back(child.tenant.id);
        auto below = child.all_descendants();
        result.insert(result.end(), below.begin(), below.end());
    }
    return result;
}

std::size_t TenantNode::descendant_count() const {
    std::size_t count = children.size();
    for (const auto& child : children) count += child.descendant_count();
    return count;
}

} // namespace wami
