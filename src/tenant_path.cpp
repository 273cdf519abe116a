#include "wami/tenant_path.hpp"
#include "wami/error.hpp"
#include "wami/tenant.hpp"

#include <charconv>
#include <sstream>

namespace wami {

std::optional<TenantPath::Segment> parse_tenant_segment(const std::string& text) {
    if (text.empty()) return std::nullopt;
    for (char c : text) {
        if (c < '0' || c > '9') return std::nullopt;
    }
    TenantPath::Segment value = 0;
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc() || ptr != end) return std::nullopt;
    return value;
}

// ── Construction ──────────────────────────────────────────────────────────────

TenantPath TenantPath::parse(const std::string& text) {
    if (text.empty()) {
        throw Error(ErrorKind::InvalidComponent, "Tenant path cannot be empty");
    }

    std::vector<Segment> segments;
    std::string::size_type start = 0;
    while (true) {
        auto slash = text.find('/', start);
        std::string token = text.substr(start, slash == std::string::npos ? std::string::npos
                                                                          : slash - start);
        auto segment = parse_tenant_segment(token);
        if (!segment) {
            throw Error(ErrorKind::InvalidComponent,
                "Invalid tenant path segment: '" + token + "' (must be an unsigned integer)");
        }
        segments.push_back(*segment);
        if (slash == std::string::npos) break;
        start = slash + 1;
    }
    return TenantPath(std::move(segments));
}

TenantPath TenantPath::from_tenant_id(const TenantId& id) {
    return parse(id.as_str());
}

// ── Queries ───────────────────────────────────────────────────────────────────

std::optional<TenantPath::Segment> TenantPath::root() const {
    if (segments_.empty()) return std::nullopt;
    return segments_.front();
}

std::optional<TenantPath::Segment> TenantPath::leaf() const {
    if (segments_.empty()) return std::nullopt;
    return segments_.back();
}

bool TenantPath::starts_with(const TenantPath& other) const {
    if (segments_.size() < other.segments_.size()) return false;
    for (std::size_t i = 0; i < other.segments_.size(); ++i) {
        if (segments_[i] != other.segments_[i]) return false;
    }
    return true;
}

bool TenantPath::is_descendant_of(const TenantPath& other) const {
    return segments_.size() > other.segments_.size() && starts_with(other);
}

std::string TenantPath::to_string() const {
    std::ostringstream os;
    for (std::size_t i = 0; i < segments_.size(); ++i) {
        if (i > 0) os << '/';
        os << segments_[i];
    }
    return os.str();
}

} // namespace wami
