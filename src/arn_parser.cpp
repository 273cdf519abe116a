#include "wami/arn.hpp"
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

bool slash_free(const std::vector<std::string>& parts, std::size_t from, std::size_t count) {
    for (std::size_t i = from; i < from + count; ++i) {
        if (parts[i].find('/') != std::string::npos) return false;
    }
    return true;
}

constexpr std::size_t kMinParts       = 7;
constexpr std::size_t kCloudFieldsPos = 6;

struct LayoutRule {
    std::size_t min_parts;
    std::size_t cloud_fields;   // provider, account[, region]
    ArnLayout   layout;
};

// Checked in order; only the first rule whose min_parts is met applies.
constexpr LayoutRule kLayoutRules[] = {
    { 10, 3, ArnLayout::CloudRegional },
    {  9, 2, ArnLayout::CloudLegacy   },
};

Resource parse_resource(const std::string& token) {
    auto slash = token.find('/');
    if (slash == std::string::npos) {
        throw Error(ErrorKind::InvalidFormat,
            "Resource must be in format 'type/id', got '" + token + "'");
    }
    Resource resource{ token.substr(0, slash), token.substr(slash + 1) };
    if (resource.resource_type.empty() || resource.resource_id.empty()) {
        throw Error(ErrorKind::InvalidComponent, "Resource type and ID cannot be empty");
    }
    return resource;
}

} // namespace

ArnLayout detect_arn_layout(const std::vector<std::string>& parts) {
    for (const auto& rule : kLayoutRules) {
        if (parts.size() < rule.min_parts) continue;
        return slash_free(parts, kCloudFieldsPos, rule.cloud_fields) ? rule.layout
                                                                     : ArnLayout::Native;
    }
    return ArnLayout::Native;
}

WamiArn WamiArn::parse(const std::string& text) {
    auto parts = split(text, ':');

    if (parts.size() < kMinParts) {
        throw Error(ErrorKind::InvalidFormat,
            "Expected at least 7 parts, got " + std::to_string(parts.size()));
    }
    if (parts[0] != "arn") {
        throw Error(ErrorKind::InvalidFormat, "Expected 'arn' prefix, got '" + parts[0] + "'");
    }
    if (parts[1] != "wami") {
        throw Error(ErrorKind::InvalidFormat,
            "Expected 'wami' namespace, got '" + parts[1] + "'");
    }

    Service service = Service::from_str(parts[2]);

    TenantPath tenant_path = TenantPath::parse(parts[3]);

    if (parts[4] != "wami") {
        throw Error(ErrorKind::InvalidFormat,
            "Expected 'wami' marker at position 4, got '" + parts[4] + "'");
    }

    if (parts[5].empty()) {
        throw Error(ErrorKind::MissingComponent, "WAMI instance ID cannot be empty");
    }

    std::optional<CloudMapping> cloud_mapping;
    std::size_t resource_pos = kCloudFieldsPos;

    switch (detect_arn_layout(parts)) {
        case ArnLayout::CloudRegional: {
            const auto& provider = parts[6];
            const auto& account  = parts[7];
            const auto& region   = parts[8];
            if (provider.empty() || account.empty() || region.empty()) {
                throw Error(ErrorKind::InvalidComponent,
                    "Provider, account ID, and region cannot be empty");
            }
            cloud_mapping = region == "global" ? CloudMapping::global(provider, account)
                                               : CloudMapping::regional(provider, account, region);
            resource_pos = 9;
            break;
        }
        case ArnLayout::CloudLegacy: {
            const auto& provider = parts[6];
            const auto& account  = parts[7];
            if (provider.empty() || account.empty()) {
                throw Error(ErrorKind::InvalidComponent,
                    "Provider and account ID cannot be empty");
            }
            cloud_mapping = CloudMapping::global(provider, account);
            resource_pos = 8;
            break;
        }
        case ArnLayout::Native:
            break;
    }

    Resource resource = parse_resource(join(parts, resource_pos, ':'));

    return WamiArn(std::move(service), std::move(tenant_path), parts[5],
                   std::move(cloud_mapping), std::move(resource));
}

WamiArn parse_arn(const std::string& text) {
    try {
        return WamiArn::parse(text);
    } catch (const Error& e) {
        throw Error(ErrorKind::InvalidParameter, e.message());
    }
}

} // namespace wami
