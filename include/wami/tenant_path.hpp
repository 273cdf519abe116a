#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace wami {

class TenantId;

/**
 * TenantPath
 *
 * Ordered tenant segments, root first, rendered joined by '/'.
 * A path used inside an ARN or a context is never empty; emptiness is
 * rejected by ArnBuilder, WamiArn::parse and WamiContextBuilder.
 */
class TenantPath {
public:
    using Segment = std::uint64_t;

    TenantPath() = default;
    explicit TenantPath(std::vector<Segment> segments) : segments_(std::move(segments)) {}

    static TenantPath single(Segment tenant_id) { return TenantPath({ tenant_id }); }

    /// Parses "12/34/56". Throws Error(InvalidComponent) on an empty path or a non-numeric segment.
    static TenantPath parse(const std::string& text);

    /// Converts a numeric TenantId ("12/34"). Throws Error(InvalidComponent) otherwise.
    static TenantPath from_tenant_id(const TenantId& id);

    const std::vector<Segment>& segments() const { return segments_; }
    bool empty() const { return segments_.empty(); }
    std::size_t depth() const { return segments_.size(); }

    std::optional<Segment> root() const;
    std::optional<Segment> leaf() const;

    /// True iff other's segments are a prefix of ours (a path starts with itself).
    bool starts_with(const TenantPath& other) const;

    /// Strictly deeper and sharing other's segments as a prefix.
    bool is_descendant_of(const TenantPath& other) const;
    bool is_ancestor_of(const TenantPath& other) const { return other.is_descendant_of(*this); }

    std::string to_string() const;

    bool operator==(const TenantPath& other) const { return segments_ == other.segments_; }
    bool operator!=(const TenantPath& other) const { return !(*this == other); }

private:
    std::vector<Segment> segments_;
};

/// Parses one unsigned decimal segment. Returns nullopt on empty input, sign, stray
/// characters or overflow.
std::optional<TenantPath::Segment> parse_tenant_segment(const std::string& text);

inline std::ostream& operator<<(std::ostream& os, const TenantPath& p) {
    return os << p.to_string();
}

} // namespace wami
