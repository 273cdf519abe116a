#pragma once

#include "wami/arn.hpp"
#include "wami/tenant_path.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace wami {

struct SessionInfo {
    std::string            session_token;
    std::int64_t           expiration = 0;   // unix seconds
    std::optional<WamiArn> assumed_role_arn;
};

class WamiContextBuilder;

/**
 * WamiContext
 *
 * Immutable result of authentication: which tenant and instance a caller
 * acts in, who the caller is, and whether policy evaluation is bypassed.
 * Every authorization decision is made against one of these.
 *
 * Contexts are produced by the authentication step. The builder is public
 * for that step and for tests; other code must not fabricate contexts.
 */
class WamiContext {
public:
    static WamiContextBuilder builder();

    const TenantPath& tenant_path() const { return tenant_path_; }
    const std::string& instance_id() const { return instance_id_; }
    const WamiArn& caller_arn() const { return caller_arn_; }
    bool is_root() const { return is_root_; }
    const std::optional<std::string>& region() const { return region_; }
    const std::optional<SessionInfo>& session_info() const { return session_info_; }

    /// Root reaches every tenant; anyone else only their own tenant and its descendants.
    bool can_access_tenant(const TenantPath& target) const {
        return is_root_ || target.starts_with(tenant_path_);
    }

    /// False without a session. now defaults to the current wall-clock time.
    bool is_expired(std::optional<std::int64_t> now = std::nullopt) const;

private:
    friend class WamiContextBuilder;

    WamiContext(TenantPath tenant_path, std::string instance_id, WamiArn caller_arn, bool is_root,
                std::optional<std::string> region, std::optional<SessionInfo> session_info);

    TenantPath                 tenant_path_;
    std::string                instance_id_;
    WamiArn                    caller_arn_;
    bool                       is_root_;
    std::optional<std::string> region_;
    std::optional<SessionInfo> session_info_;
};

class WamiContextBuilder {
public:
    WamiContextBuilder& tenant_path(TenantPath tenant_path);
    WamiContextBuilder& instance_id(std::string instance_id);
    WamiContextBuilder& caller_arn(WamiArn caller_arn);
    WamiContextBuilder& is_root(bool is_root);
    WamiContextBuilder& region(std::string region);
    WamiContextBuilder& session_info(SessionInfo session_info);

    /// Throws Error(InvalidParameter) when tenant path, instance id or caller
    /// ARN is missing, the tenant path is empty, or the instance id is blank.
    WamiContext build() const;

private:
    std::optional<TenantPath>  tenant_path_;
    std::optional<std::string> instance_id_;
    std::optional<WamiArn>     caller_arn_;
    bool                       is_root_ = false;
    std::optional<std::string> region_;
    std::optional<SessionInfo> session_info_;
};

} // namespace wami
