#pragma once

#include "wami/tenant_path.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace wami {

// ── Service ───────────────────────────────────────────────────────────────────

/**
 * Service
 *
 * The service token of an ARN. Unknown tokens are kept verbatim as Custom
 * so that newer services round-trip through older code.
 */
class Service {
public:
    enum class Kind { Iam, Sts, SsoAdmin, Custom };

    static Service iam()       { return Service(Kind::Iam, ""); }
    static Service sts()       { return Service(Kind::Sts, ""); }
    static Service sso_admin() { return Service(Kind::SsoAdmin, ""); }
    static Service custom(std::string name);

    /// Lossy: "iam", "sts" and "sso-admin" map to their kinds, anything else is Custom.
    static Service from_str(const std::string& token);

    Kind kind() const { return kind_; }
    std::string as_str() const;

    bool operator==(const Service& other) const {
        return kind_ == other.kind_ && custom_ == other.custom_;
    }
    bool operator!=(const Service& other) const { return !(*this == other); }

private:
    Service(Kind kind, std::string custom) : kind_(kind), custom_(std::move(custom)) {}

    Kind        kind_;
    std::string custom_;
};

inline std::ostream& operator<<(std::ostream& os, const Service& s) {
    return os << s.as_str();
}

// ── Cloud mapping / resource ──────────────────────────────────────────────────

struct CloudMapping {
    std::string                provider;
    std::string                account_id;
    std::optional<std::string> region;     // nullopt serializes as "global"

    static CloudMapping global(std::string provider, std::string account_id) {
        return { std::move(provider), std::move(account_id), std::nullopt };
    }
    static CloudMapping regional(std::string provider, std::string account_id, std::string region) {
        return { std::move(provider), std::move(account_id), std::move(region) };
    }

    bool is_regional() const { return region.has_value(); }
    std::string region_or_global() const { return region ? *region : "global"; }

    bool operator==(const CloudMapping& other) const {
        return provider == other.provider && account_id == other.account_id &&
               region == other.region;
    }
    bool operator!=(const CloudMapping& other) const { return !(*this == other); }
};

struct Resource {
    std::string resource_type;
    std::string resource_id;   // may itself contain '/'

    std::string as_path() const { return resource_type + "/" + resource_id; }

    bool operator==(const Resource& other) const {
        return resource_type == other.resource_type && resource_id == other.resource_id;
    }
    bool operator!=(const Resource& other) const { return !(*this == other); }
};

class ArnBuilder;

// ── WamiArn ───────────────────────────────────────────────────────────────────

/**
 * WamiArn
 *
 * Immutable, structurally compared resource identifier. Canonical forms:
 *
 *   arn:wami:<service>:<tenant-path>:wami:<instance>:<type>/<id>
 *   arn:wami:<service>:<tenant-path>:wami:<instance>:<provider>:<account>:<region|global>:<type>/<id>
 *
 * The legacy cloud form without a region token is accepted by parse() but
 * never written.
 */
class WamiArn {
public:
    static ArnBuilder builder();

    /// Strict parser. Throws Error with kind InvalidFormat, MissingComponent or InvalidComponent.
    static WamiArn parse(const std::string& text);

    const Service& service() const { return service_; }
    const TenantPath& tenant_path() const { return tenant_path_; }
    const std::string& wami_instance_id() const { return wami_instance_id_; }
    const std::optional<CloudMapping>& cloud_mapping() const { return cloud_mapping_; }
    const Resource& resource() const { return resource_; }

    const std::string& resource_type() const { return resource_.resource_type; }
    const std::string& resource_id() const { return resource_.resource_id; }

    bool is_cloud_synced() const { return cloud_mapping_.has_value(); }
    std::optional<std::string> provider() const;

    std::optional<TenantPath::Segment> primary_tenant() const { return tenant_path_.root(); }
    std::optional<TenantPath::Segment> leaf_tenant() const { return tenant_path_.leaf(); }
    std::string full_tenant_path() const { return tenant_path_.to_string(); }

    /// Everything before the resource token.
    std::string prefix() const;
    std::string to_string() const;

    bool matches_prefix(const std::string& prefix) const;

    /// Same tenant path, or a descendant of it.
    bool belongs_to_tenant(const TenantPath& path) const;

    bool operator==(const WamiArn& other) const;
    bool operator!=(const WamiArn& other) const { return !(*this == other); }

private:
    friend class ArnBuilder;

    WamiArn(Service service, TenantPath tenant_path, std::string wami_instance_id,
            std::optional<CloudMapping> cloud_mapping, Resource resource);

    Service                     service_;
    TenantPath                  tenant_path_;
    std::string                 wami_instance_id_;
    std::optional<CloudMapping> cloud_mapping_;
    Resource                    resource_;
};

inline std::ostream& operator<<(std::ostream& os, const WamiArn& arn) {
    return os << arn.to_string();
}

/// Shape of an ARN string, decided from its ':'-split parts.
enum class ArnLayout { Native, CloudRegional, CloudLegacy };

inline std::ostream& operator<<(std::ostream& os, ArnLayout l) {
    switch (l) {
        case ArnLayout::Native:        return os << "Native";
        case ArnLayout::CloudRegional: return os << "CloudRegional";
        case ArnLayout::CloudLegacy:   return os << "CloudLegacy";
        default:                       return os << "Unknown";
    }
}

/**
 * Decides which canonical form a split ARN is in. The legacy grammar has no
 * marker between native and cloud-synced forms, so the decision is made from
 * the part count and from whether the candidate cloud fields are free of '/':
 *
 *   >= 10 parts and parts[6..8] slash-free  -> CloudRegional
 *   >= 10 parts otherwise                   -> Native
 *   9 parts and parts[6..7] slash-free      -> CloudLegacy
 *   9 parts otherwise                       -> Native
 *   7 or 8 parts                            -> Native
 */
ArnLayout detect_arn_layout(const std::vector<std::string>& parts);

/// Parse for outer layers: same as WamiArn::parse, but every failure is
/// reported as ErrorKind::InvalidParameter.
WamiArn parse_arn(const std::string& text);

// ── ArnBuilder ────────────────────────────────────────────────────────────────

/**
 * ArnBuilder
 *
 * Fluent accumulator for WamiArn. build() validates that service, tenant
 * path, instance id and resource are present and non-empty, and that no
 * field would break the canonical ':'-delimited form. Violations throw
 * Error(InvalidParameter) naming the field.
 */
class ArnBuilder {
public:
    ArnBuilder& service(Service service);
    ArnBuilder& service_str(const std::string& name);

    ArnBuilder& tenant_path(TenantPath path);
    ArnBuilder& tenant(TenantPath::Segment tenant_id);
    ArnBuilder& tenant(const std::string& tenant_id);
    ArnBuilder& tenant_hierarchy(const std::vector<std::string>& segments);

    ArnBuilder& wami_instance(std::string instance_id);

    ArnBuilder& cloud_provider(std::string provider, std::string account_id);
    ArnBuilder& cloud_provider_with_region(std::string provider, std::string account_id,
                                           std::string region);
    /// Sets the region on the current mapping; no-op without one.
    ArnBuilder& region(std::string region);
    ArnBuilder& cloud_mapping(CloudMapping mapping);
    ArnBuilder& no_cloud_mapping();

    ArnBuilder& resource(std::string resource_type, std::string resource_id);
    ArnBuilder& resource_obj(Resource resource);

    WamiArn build() const;

private:
    std::optional<Service>                  service_;
    std::optional<TenantPath>               tenant_path_;
    std::optional<std::vector<std::string>> raw_tenant_segments_;
    std::optional<std::string>              wami_instance_id_;
    std::optional<CloudMapping>             cloud_mapping_;
    std::optional<Resource>                 resource_;
};

} // namespace wami
