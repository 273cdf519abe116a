#include "wami/context.hpp"
#include "wami/error.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <utility>

namespace wami {

// ── WamiContext ───────────────────────────────────────────────────────────────

WamiContext::WamiContext(TenantPath tenant_path, std::string instance_id, WamiArn caller_arn,
                         bool is_root, std::optional<std::string> region,
                         std::optional<SessionInfo> session_info)
    : tenant_path_(std::move(tenant_path)),
      instance_id_(std::move(instance_id)),
      caller_arn_(std::move(caller_arn)),
      is_root_(is_root),
      region_(std::move(region)),
      session_info_(std::move(session_info)) {}

WamiContextBuilder WamiContext::builder() {
    return WamiContextBuilder();
}

bool WamiContext::is_expired(std::optional<std::int64_t> now) const {
    if (!session_info_) return false;
    const std::int64_t current = now ? *now
        : std::chrono::duration_cast<std::chrono::seconds>(
              std::chrono::system_clock::now().time_since_epoch()).count();
    return current >= session_info_->expiration;
}

// ── WamiContextBuilder ────────────────────────────────────────────────────────

WamiContextBuilder& WamiContextBuilder::tenant_path(TenantPath tenant_path) {
    tenant_path_ = std::move(tenant_path);
    return *this;
}

WamiContextBuilder& WamiContextBuilder::instance_id(std::string instance_id) {
    instance_id_ = std::move(instance_id);
    return *this;
}

WamiContextBuilder& WamiContextBuilder::caller_arn(WamiArn caller_arn) {
    caller_arn_ = std::move(caller_arn);
    return *this;
}

WamiContextBuilder& WamiContextBuilder::is_root(bool is_root) {
    is_root_ = is_root;
    return *this;
}

WamiContextBuilder& WamiContextBuilder::region(std::string region) {
    region_ = std::move(region);
    return *this;
}

WamiContextBuilder& WamiContextBuilder::session_info(SessionInfo session_info) {
    session_info_ = std::move(session_info);
    return *this;
}

WamiContext WamiContextBuilder::build() const {
    if (!tenant_path_) throw Error(ErrorKind::InvalidParameter, "tenant_path is required");
    if (!instance_id_) throw Error(ErrorKind::InvalidParameter, "instance_id is required");
    if (!caller_arn_)  throw Error(ErrorKind::InvalidParameter, "caller_arn is required");

    if (tenant_path_->empty()) {
        throw Error(ErrorKind::InvalidParameter, "tenant_path cannot be empty");
    }
    bool blank = std::all_of(instance_id_->begin(), instance_id_->end(),
                             [](unsigned char c) { return std::isspace(c) != 0; });
    if (blank) {
        throw Error(ErrorKind::InvalidParameter, "instance_id cannot be empty");
    }

    return WamiContext(*tenant_path_, *instance_id_, *caller_arn_, is_root_, region_,
                       session_info_);
}

} // namespace wami
