#include "wami/arn.hpp"
#include "wami/error.hpp"

namespace wami {

namespace {

bool contains_any(const std::string& s, const char* chars) {
    return s.find_first_of(chars) != std::string::npos;
}

void require(bool condition, const std::string& message) {
    if (!condition) throw Error(ErrorKind::InvalidParameter, "ARN builder: " + message);
}

} // namespace

// ── Service ───────────────────────────────────────────────────────────────────

// Reserved tokens always map to their built-in kind so that a custom
// service never serializes to a token that parses back differently.
Service Service::custom(std::string name) {
    if (name == "iam")       return iam();
    if (name == "sts")       return sts();
    if (name == "sso-admin") return sso_admin();
    return Service(Kind::Custom, std::move(name));
}

Service Service::from_str(const std::string& token) {
    return custom(token);
}

std::string Service::as_str() const {
    switch (kind_) {
        case Kind::Iam:      return "iam";
        case Kind::Sts:      return "sts";
        case Kind::SsoAdmin: return "sso-admin";
        case Kind::Custom:   return custom_;
        default:             return custom_;
    }
}

// ── WamiArn ───────────────────────────────────────────────────────────────────

WamiArn::WamiArn(Service service, TenantPath tenant_path, std::string wami_instance_id,
                 std::optional<CloudMapping> cloud_mapping, Resource resource)
    : service_(std::move(service)),
      tenant_path_(std::move(tenant_path)),
      wami_instance_id_(std::move(wami_instance_id)),
      cloud_mapping_(std::move(cloud_mapping)),
      resource_(std::move(resource)) {}

ArnBuilder WamiArn::builder() {
    return ArnBuilder();
}

std::optional<std::string> WamiArn::provider() const {
    if (!cloud_mapping_) return std::nullopt;
    return cloud_mapping_->provider;
}

std::string WamiArn::prefix() const {
    std::string base = "arn:wami:" + service_.as_str() + ":" + tenant_path_.to_string() +
                       ":wami:" + wami_instance_id_;
    if (cloud_mapping_) {
        base += ":" + cloud_mapping_->provider + ":" + cloud_mapping_->account_id + ":" +
                cloud_mapping_->region_or_global();
    }
    return base;
}

std::string WamiArn::to_string() const {
    return prefix() + ":" + resource_.as_path();
}

bool WamiArn::matches_prefix(const std::string& prefix) const {
    return to_string().compare(0, prefix.size(), prefix) == 0;
}

bool WamiArn::belongs_to_tenant(const TenantPath& path) const {
    return tenant_path_.starts_with(path);
}

bool WamiArn::operator==(const WamiArn& other) const {
    return service_ == other.service_ && tenant_path_ == other.tenant_path_ &&
           wami_instance_id_ == other.wami_instance_id_ &&
           cloud_mapping_ == other.cloud_mapping_ && resource_ == other.resource_;
}

// ── ArnBuilder ────────────────────────────────────────────────────────────────

ArnBuilder& ArnBuilder::service(Service service) {
    service_ = std::move(service);
    return *this;
}

ArnBuilder& ArnBuilder::service_str(const std::string& name) {
    service_ = Service::from_str(name);
    return *this;
}

ArnBuilder& ArnBuilder::tenant_path(TenantPath path) {
    tenant_path_ = std::move(path);
    raw_tenant_segments_.reset();
    return *this;
}

ArnBuilder& ArnBuilder::tenant(TenantPath::Segment tenant_id) {
    return tenant_path(TenantPath::single(tenant_id));
}

ArnBuilder& ArnBuilder::tenant(const std::string& tenant_id) {
    return tenant_hierarchy({ tenant_id });
}

ArnBuilder& ArnBuilder::tenant_hierarchy(const std::vector<std::string>& segments) {
    // Segments are validated in build() so the fluent chain never throws.
    raw_tenant_segments_ = segments;
    tenant_path_.reset();
    return *this;
}

ArnBuilder& ArnBuilder::wami_instance(std::string instance_id) {
    wami_instance_id_ = std::move(instance_id);
    return *this;
}

ArnBuilder& ArnBuilder::cloud_provider(std::string provider, std::string account_id) {
    cloud_mapping_ = CloudMapping::global(std::move(provider), std::move(account_id));
    return *this;
}

ArnBuilder& ArnBuilder::cloud_provider_with_region(std::string provider, std::string account_id,
                                                   std::string region) {
    cloud_mapping_ = CloudMapping::regional(std::move(provider), std::move(account_id),
                                            std::move(region));
    return *this;
}

ArnBuilder& ArnBuilder::region(std::string region) {
    if (cloud_mapping_) cloud_mapping_->region = std::move(region);
    return *this;
}

ArnBuilder& ArnBuilder::cloud_mapping(CloudMapping mapping) {
    cloud_mapping_ = std::move(mapping);
    return *this;
}

ArnBuilder& ArnBuilder::no_cloud_mapping() {
    cloud_mapping_.reset();
    return *this;
}

ArnBuilder& ArnBuilder::resource(std::string resource_type, std::string resource_id) {
    resource_ = Resource{ std::move(resource_type), std::move(resource_id) };
    return *this;
}

ArnBuilder& ArnBuilder::resource_obj(Resource resource) {
    resource_ = std::move(resource);
    return *this;
}

WamiArn ArnBuilder::build() const {
    require(service_.has_value(), "service is required");
    require(tenant_path_.has_value() || raw_tenant_segments_.has_value(),
            "tenant_path is required");
    require(wami_instance_id_.has_value(), "wami_instance_id is required");
    require(resource_.has_value(), "resource is required");

    require(!contains_any(service_->as_str(), ":"), "service cannot contain ':'");

    TenantPath path;
    if (raw_tenant_segments_) {
        std::vector<TenantPath::Segment> segments;
        for (const auto& raw : *raw_tenant_segments_) {
            auto segment = parse_tenant_segment(raw);
            require(segment.has_value(),
                    "tenant segment '" + raw + "' must be an unsigned integer");
            segments.push_back(*segment);
        }
        path = TenantPath(std::move(segments));
    } else {
        path = *tenant_path_;
    }
    require(!path.empty(), "tenant_path cannot be empty");

    require(!wami_instance_id_->empty(), "wami_instance_id cannot be empty");
    require(!contains_any(*wami_instance_id_, ":"), "wami_instance_id cannot contain ':'");

    require(!resource_->resource_type.empty(), "resource_type cannot be empty");
    require(!resource_->resource_id.empty(), "resource_id cannot be empty");
    require(!contains_any(resource_->resource_type, ":/"),
            "resource_type cannot contain ':' or '/'");

    if (cloud_mapping_) {
        require(!cloud_mapping_->provider.empty(), "cloud provider cannot be empty");
        require(!cloud_mapping_->account_id.empty(), "cloud account_id cannot be empty");
        require(!contains_any(cloud_mapping_->provider, ":/"),
                "cloud provider cannot contain ':' or '/'");
        require(!contains_any(cloud_mapping_->account_id, ":/"),
                "cloud account_id cannot contain ':' or '/'");
        if (cloud_mapping_->region) {
            require(!cloud_mapping_->region->empty(), "region cannot be empty");
            require(*cloud_mapping_->region != "global",
                    "region 'global' is reserved, omit the region instead");
            require(!contains_any(*cloud_mapping_->region, ":/"),
                    "region cannot contain ':' or '/'");
        }
    }

    return WamiArn(*service_, std::move(path), *wami_instance_id_, cloud_mapping_, *resource_);
}

} // namespace wami
