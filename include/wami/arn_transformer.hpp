#pragma once

#include "wami/arn.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace wami {

/// What a provider-native identifier carries. Tenant path and WAMI instance
/// are not part of any provider format and cannot be recovered from here.
struct ProviderArnInfo {
    std::string                provider;
    std::string                account_id;
    std::string                service;
    std::string                resource_type;
    std::string                resource_id;
    std::optional<std::string> region;

    bool operator==(const ProviderArnInfo& other) const {
        return provider == other.provider && account_id == other.account_id &&
               service == other.service && resource_type == other.resource_type &&
               resource_id == other.resource_id && region == other.region;
    }
};

/**
 * ArnTransformer
 *
 * Codec between a cloud-synced WamiArn and one provider's native identifier.
 * to_provider_arn() throws Error(InvalidParameter) when the ARN has no cloud
 * mapping or maps to a different provider; from_provider_arn() throws
 * Error(InvalidParameter) on malformed native input.
 */
class ArnTransformer {
public:
    virtual ~ArnTransformer() = default;

    virtual const char* provider_name() const = 0;
    virtual std::string to_provider_arn(const WamiArn& arn) const = 0;
    virtual ProviderArnInfo from_provider_arn(const std::string& provider_arn) const = 0;

protected:
    /// Returns the mapping when it belongs to this transformer's provider.
    const CloudMapping& require_mapping(const WamiArn& arn) const;
};

/// arn:aws:<service>:<region-or-empty>:<account>:<type>/<id>
class AwsArnTransformer final : public ArnTransformer {
public:
    const char* provider_name() const override { return "aws"; }
    std::string to_provider_arn(const WamiArn& arn) const override;
    ProviderArnInfo from_provider_arn(const std::string& provider_arn) const override;
};

/// //<service>.googleapis.com/projects/<account>/<type>s/<id>
class GcpArnTransformer final : public ArnTransformer {
public:
    const char* provider_name() const override { return "gcp"; }
    std::string to_provider_arn(const WamiArn& arn) const override;
    ProviderArnInfo from_provider_arn(const std::string& provider_arn) const override;
};

/// /subscriptions/<account>/resourceGroups/wami-resources/providers/<namespace>/<type>/<id>
class AzureArnTransformer final : public ArnTransformer {
public:
    static constexpr const char* kResourceGroup = "wami-resources";

    const char* provider_name() const override { return "azure"; }
    std::string to_provider_arn(const WamiArn& arn) const override;
    ProviderArnInfo from_provider_arn(const std::string& provider_arn) const override;
};

/// scw:<account>:<service>:<type>/<id>
class ScalewayArnTransformer final : public ArnTransformer {
public:
    const char* provider_name() const override { return "scaleway"; }
    std::string to_provider_arn(const WamiArn& arn) const override;
    ProviderArnInfo from_provider_arn(const std::string& provider_arn) const override;
};

/// Transformer for "aws", "gcp", "azure" or "scaleway"; nullptr for any other name.
std::unique_ptr<ArnTransformer> get_transformer(const std::string& provider);

/// Names accepted by get_transformer().
std::vector<std::string> supported_providers();

/**
 * Rebuilds a cloud-synced WamiArn from provider information. The caller
 * supplies the service, tenant path and instance the provider format lacks.
 */
WamiArn to_wami_arn(const ProviderArnInfo& info, Service service, TenantPath tenant_path,
                    std::string wami_instance_id);

} // namespace wami
