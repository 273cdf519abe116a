#include "wami/arn_transformer.hpp"
#include "wami/error.hpp"

namespace wami {

namespace {

std::vector<std::string> split(const std::string& text, char delimiter) {
    std::vector<std::string> parts;
    std::string::size_type start = 0;
    while (true) {
        auto pos = text.find(delimiter, start);
        if (pos == std::string::npos) {
            parts.push_back(text.substr(start));
            return parts;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
}

std::string join(const std::vector<std::string>& parts, std::size_t from, char delimiter) {
    std::string out;
    for (std::size_t i = from; i < parts.size(); ++i) {
        if (i > from) out += delimiter;
        out += parts[i];
    }
    return out;
}

[[noreturn]] void invalid(const std::string& message) {
    throw Error(ErrorKind::InvalidParameter, message);
}

/// Splits a "type/id" tail; the id keeps any further '/'.
Resource split_resource_tail(const std::string& tail, const char* provider_label) {
    auto slash = tail.find('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 == tail.size()) {
        invalid(std::string("Invalid ") + provider_label +
                " resource format: expected 'type/id', got '" + tail + "'");
    }
    return { tail.substr(0, slash), tail.substr(slash + 1) };
}

std::string aws_service(const Service& service) {
    switch (service.kind()) {
        case Service::Kind::Iam:      return "iam";
        case Service::Kind::Sts:      return "sts";
        case Service::Kind::SsoAdmin: return "sso";
        default:                      return service.as_str();
    }
}

std::string gcp_service(const Service& service) {
    switch (service.kind()) {
        case Service::Kind::SsoAdmin: return "cloudidentity.googleapis.com";
        case Service::Kind::Custom:   return service.as_str();
        default:                      return "iam.googleapis.com";
    }
}

std::string azure_namespace(const Service& service) {
    switch (service.kind()) {
        case Service::Kind::SsoAdmin: return "Microsoft.AzureActiveDirectory";
        case Service::Kind::Custom:   return service.as_str();
        default:                      return "Microsoft.Authorization";
    }
}

std::string scaleway_service(const Service& service) {
    switch (service.kind()) {
        case Service::Kind::SsoAdmin: return "sso";
        case Service::Kind::Custom:   return service.as_str();
        default:                      return "iam";
    }
}

} // namespace

const CloudMapping& ArnTransformer::require_mapping(const WamiArn& arn) const {
    const auto& mapping = arn.cloud_mapping();
    if (!mapping) invalid("ARN is not cloud-synced");
    if (mapping->provider != provider_name()) {
        invalid("ARN provider is '" + mapping->provider + "', expected '" + provider_name() + "'");
    }
    return *mapping;
}

// ── AWS ───────────────────────────────────────────────────────────────────────

std::string AwsArnTransformer::to_provider_arn(const WamiArn& arn) const {
    const auto& mapping = require_mapping(arn);
    return "arn:aws:" + aws_service(arn.service()) + ":" + mapping.region.value_or("") + ":" +
           mapping.account_id + ":" + arn.resource().as_path();
}

ProviderArnInfo AwsArnTransformer::from_provider_arn(const std::string& provider_arn) const {
    auto parts = split(provider_arn, ':');
    if (parts.size() < 6) {
        invalid("Invalid AWS ARN format: expected at least 6 parts, got " +
                std::to_string(parts.size()));
    }
    if (parts[0] != "arn" || parts[1] != "aws") {
        invalid("Invalid AWS ARN prefix: expected 'arn:aws', got '" + parts[0] + ":" + parts[1] +
                "'");
    }

    auto resource = split_resource_tail(join(parts, 5, ':'), "AWS ARN");

    ProviderArnInfo info;
    info.provider      = "aws";
    info.account_id    = parts[4];
    info.service       = parts[2];
    info.resource_type = std::move(resource.resource_type);
    info.resource_id   = std::move(resource.resource_id);
    if (!parts[3].empty()) info.region = parts[3];
    return info;
}

// ── GCP ───────────────────────────────────────────────────────────────────────

std::string GcpArnTransformer::to_provider_arn(const WamiArn& arn) const {
    const auto& mapping = require_mapping(arn);
    return "//" + gcp_service(arn.service()) + "/projects/" + mapping.account_id + "/" +
           arn.resource_type() + "s/" + arn.resource_id();
}

ProviderArnInfo GcpArnTransformer::from_provider_arn(const std::string& provider_arn) const {
    if (provider_arn.compare(0, 2, "//") != 0) {
        invalid("Invalid GCP resource name: expected '//' prefix");
    }

    auto parts = split(provider_arn.substr(2), '/');
    if (parts.size() < 5) {
        invalid("Invalid GCP resource name format: expected at least 5 parts, got " +
                std::to_string(parts.size()));
    }
    if (parts[1] != "projects") {
        invalid("Invalid GCP resource name: expected 'projects', got '" + parts[1] + "'");
    }

    std::string resource_type = parts[3];
    if (!resource_type.empty() && resource_type.back() == 's') resource_type.pop_back();
    std::string resource_id = join(parts, 4, '/');
    if (resource_type.empty() || resource_id.empty()) {
        invalid("Invalid GCP resource name: empty resource type or id in '" + provider_arn + "'");
    }

    ProviderArnInfo info;
    info.provider      = "gcp";
    info.account_id    = parts[2];
    info.service       = parts[0];
    info.resource_type = std::move(resource_type);
    info.resource_id   = std::move(resource_id);
    return info;
}

// ── Azure ─────────────────────────────────────────────────────────────────────

std::string AzureArnTransformer::to_provider_arn(const WamiArn& arn) const {
    const auto& mapping = require_mapping(arn);
    return "/subscriptions/" + mapping.account_id + "/resourceGroups/" + kResourceGroup +
           "/providers/" + azure_namespace(arn.service()) + "/" + arn.resource().as_path();
}

ProviderArnInfo AzureArnTransformer::from_provider_arn(const std::string& provider_arn) const {
    // "", subscriptions, <sub>, resourceGroups, <rg>, providers, <ns>, <type>, <id...>
    auto parts = split(provider_arn, '/');
    if (parts.size() < 9 || !parts[0].empty()) {
        invalid("Invalid Azure resource ID format");
    }
    if (parts[1] != "subscriptions") {
        invalid("Invalid Azure resource ID: expected 'subscriptions', got '" + parts[1] + "'");
    }
    if (parts[3] != "resourceGroups" || parts[5] != "providers") {
        invalid("Invalid Azure resource ID: expected 'resourceGroups' and 'providers' segments");
    }

    std::string resource_id = join(parts, 8, '/');
    if (parts[7].empty() || resource_id.empty()) {
        invalid("Invalid Azure resource ID: empty resource type or id in '" + provider_arn + "'");
    }

    ProviderArnInfo info;
    info.provider      = "azure";
    info.account_id    = parts[2];
    info.service       = parts[6];
    info.resource_type = parts[7];
    info.resource_id   = std::move(resource_id);
    return info;
}

// ── Scaleway ──────────────────────────────────────────────────────────────────

std::string ScalewayArnTransformer::to_provider_arn(const WamiArn& arn) const {
    const auto& mapping = require_mapping(arn);
    return "scw:" + mapping.account_id + ":" + scaleway_service(arn.service()) + ":" +
           arn.resource().as_path();
}

ProviderArnInfo ScalewayArnTransformer::from_provider_arn(const std::string& provider_arn) const {
    auto parts = split(provider_arn, ':');
    if (parts.size() < 4) {
        invalid("Invalid Scaleway resource format: expected at least 4 parts, got " +
                std::to_string(parts.size()));
    }
    if (parts[0] != "scw") {
        invalid("Invalid Scaleway resource prefix: expected 'scw', got '" + parts[0] + "'");
    }

    auto resource = split_resource_tail(join(parts, 3, ':'), "Scaleway");

    ProviderArnInfo info;
    info.provider      = "scaleway";
    info.account_id    = parts[1];
    info.service       = parts[2];
    info.resource_type = std::move(resource.resource_type);
    info.resource_id   = std::move(resource.resource_id);
    return info;
}

// ── Registry ──────────────────────────────────────────────────────────────────

std::unique_ptr<ArnTransformer> get_transformer(const std::string& provider) {
    if (provider == "aws")      return std::make_unique<AwsArnTransformer>();
    if (provider == "gcp")      return std::make_unique<GcpArnTransformer>();
    if (provider == "azure")    return std::make_unique<AzureArnTransformer>();
    if (provider == "scaleway") return std::make_unique<ScalewayArnTransformer>();
    return nullptr;
}

std::vector<std::string> supported_providers() {
    return { "aws", "gcp", "azure", "scaleway" };
}

WamiArn to_wami_arn(const ProviderArnInfo& info, Service service, TenantPath tenant_path,
                    std::string wami_instance_id) {
    auto builder = WamiArn::builder();
    builder.service(std::move(service))
           .tenant_path(std::move(tenant_path))
           .wami_instance(std::move(wami_instance_id))
           .resource(info.resource_type, info.resource_id);
    if (info.region) {
        builder.cloud_provider_with_region(info.provider, info.account_id, *info.region);
    } else {
        builder.cloud_provider(info.provider, info.account_id);
    }
    return builder.build();
}

} // namespace wami
