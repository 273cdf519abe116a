#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace wami {

class TenantStore;

// ── TenantId ──────────────────────────────────────────────────────────────────

/**
 * TenantId
 *
 * Hierarchical tenant identifier: segments joined by '/', root first.
 * A root id ("acme") has depth 0; "acme/eng/web" has depth 2.
 */
class TenantId {
public:
    explicit TenantId(std::string id) : id_(std::move(id)) {}

    static TenantId root(const std::string& name) { return TenantId(name); }

    TenantId child(const std::string& name) const { return TenantId(id_ + "/" + name); }
    std::optional<TenantId> parent() const;

    std::size_t depth() const;

    /// Every strict prefix, root first, immediate parent last. Empty for a root id.
    std::vector<TenantId> ancestors() const;

    bool is_descendant_of(const TenantId& other) const;

    const std::string& as_str() const { return id_; }

    bool operator==(const TenantId& other) const { return id_ == other.id_; }
    bool operator!=(const TenantId& other) const { return id_ != other.id_; }
    bool operator<(const TenantId& other) const { return id_ < other.id_; }

private:
    std::string id_;
};

inline std::ostream& operator<<(std::ostream& os, const TenantId& id) {
    return os << id.as_str();
}

// ── Tenant ────────────────────────────────────────────────────────────────────

enum class TenantStatus { Active, Suspended, Pending, Deleted };
enum class QuotaMode { Inherited, Override };

inline std::ostream& operator<<(std::ostream& os, TenantStatus s) {
    switch (s) {
        case TenantStatus::Active:    return os << "Active";
        case TenantStatus::Suspended: return os << "Suspended";
        case TenantStatus::Pending:   return os << "Pending";
        case TenantStatus::Deleted:   return os << "Deleted";
        default:                      return os << "Unknown";
    }
}

struct TenantQuotas {
    std::size_t max_users       = 1000;
    std::size_t max_roles       = 500;
    std::size_t max_policies    = 100;
    std::size_t max_groups      = 100;
    std::size_t max_access_keys = 2000;
    std::size_t max_sub_tenants = 10;
    std::size_t api_rate_limit  = 1000;  // requests per minute

    /// Throws Error(InvalidParameter) naming the first limit above the parent's.
    void validate_against_parent(const TenantQuotas& parent) const;

    bool operator==(const TenantQuotas& other) const;
    bool operator!=(const TenantQuotas& other) const { return !(*this == other); }
};

struct Tenant {
    TenantId                           id;
    std::optional<TenantId>            parent_id;
    std::string                        name;
    std::optional<std::string>         organization;
    TenantStatus                       status = TenantStatus::Active;
    TenantQuotas                       quotas;
    QuotaMode                          quota_mode = QuotaMode::Inherited;
    std::size_t                        max_child_depth = 3;
    bool                               can_create_sub_tenants = true;
    std::vector<std::string>           admin_principals;
    std::map<std::string, std::string> metadata;
};

// ── Pure operations ───────────────────────────────────────────────────────────

/// Non-empty, at most 64 characters, alphanumeric, '-' or '_'. Throws Error(InvalidParameter).
void validate_tenant_name(const std::string& name);

/// New active tenant with default quotas, inheriting quotas from its parent.
Tenant build_tenant(TenantId id, std::string name,
                    std::optional<std::string> organization = std::nullopt,
                    std::optional<TenantId> parent_id = std::nullopt);

inline bool is_valid_depth(const TenantId& id, std::size_t max_depth) {
    return id.depth() <= max_depth;
}

inline bool can_create_child(const Tenant& tenant) {
    return tenant.can_create_sub_tenants && tenant.status == TenantStatus::Active;
}

// ── Store-backed queries ──────────────────────────────────────────────────────

/**
 * Quotas in force for a tenant. An Override tenant uses its own quotas;
 * an Inherited one defers to its parent, up to a root, which always uses
 * its own. Throws Error(ResourceNotFound) for a missing tenant or a
 * dangling parent reference.
 */
TenantQuotas effective_quotas(const TenantStore& store, const TenantId& id);

/// Stored ancestors of id, root first. Ids without a stored tenant are skipped.
std::vector<Tenant> tenant_ancestors(const TenantStore& store, const TenantId& id);

/// Every stored tenant id below id, at any depth.
std::vector<TenantId> tenant_descendants(const TenantStore& store, const TenantId& id);

// ── Tree view ─────────────────────────────────────────────────────────────────

struct TenantNode {
    Tenant                  tenant;
    std::vector<TenantNode> children;

    /// Tree rooted at root_id, linked through parent_id. nullopt if root_id is absent.
    static std::optional<TenantNode> build_tree(const std::vector<Tenant>& tenants,
                                                const TenantId& root_id);

    /// Depth-first, pre-order.
    std::vector<TenantId> all_descendants() const;
    std::size_t descendant_count() const;
};

} // namespace wami
