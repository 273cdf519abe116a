#pragma once

#include "wami/arn.hpp"
#include "wami/arn_transformer.hpp"
#include "wami/authorization.hpp"
#include "wami/policy.hpp"
#include "wami/policy_engine.hpp"

#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace wami {

namespace json_detail {

inline std::string escape(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n";  break;
            case '\r': result += "\\r";  break;
            case '\t': result += "\\t";  break;
            default:   result += c;      break;
        }
    }
    return result;
}

inline std::string quoted(const std::string& s) {
    return "\"" + escape(s) + "\"";
}

inline std::string optional_quoted(const std::optional<std::string>& s) {
    return s ? quoted(*s) : "null";
}

inline std::string string_array(const std::vector<std::string>& values) {
    std::string out = "[";
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ", ";
        out += quoted(values[i]);
    }
    return out + "]";
}

inline std::string effect_str(Effect e) {
    return e == Effect::Allow ? "Allow" : "Deny";
}

inline std::string outcome_str(PolicyOutcome o) {
    switch (o) {
        case PolicyOutcome::Allow:     return "Allow";
        case PolicyOutcome::Deny:      return "Deny";
        case PolicyOutcome::NoMatch:   return "NoMatch";
        case PolicyOutcome::Malformed: return "Malformed";
        default:                       return "Unknown";
    }
}

} // namespace json_detail

// ── Policy documents ──────────────────────────────────────────────────────────

/// IAM JSON, parseable again by parse_policy_document.
inline std::string to_json(const PolicyDocument& doc) {
    std::ostringstream os;
    os << "{\n"
       << "  \"Version\": " << json_detail::quoted(doc.version) << ",\n"
       << "  \"Statement\": [";
    for (std::size_t i = 0; i < doc.statement.size(); ++i) {
        const auto& s = doc.statement[i];
        os << "\n    {";
        if (s.sid) os << " \"Sid\": " << json_detail::quoted(*s.sid) << ",";
        os << " \"Effect\": "   << json_detail::quoted(json_detail::effect_str(s.effect))
           << ", \"Action\": "   << json_detail::string_array(s.action)
           << ", \"Resource\": " << json_detail::string_array(s.resource);
        if (s.condition) os << ", \"Condition\": " << *s.condition;
        os << " }";
        if (i + 1 < doc.statement.size()) os << ",";
    }
    os << "\n  ]\n"
       << "}";
    return os.str();
}

// ── Simulation ────────────────────────────────────────────────────────────────

inline std::string to_json(const StatementMatch& m) {
    std::ostringstream os;
    os << "{ \"source_policy_id\": " << json_detail::optional_quoted(m.source_policy_id)
       << ", \"effect\": "           << json_detail::quoted(json_detail::effect_str(m.effect))
       << ", \"matched_action\": "   << (m.matched_action ? "true" : "false")
       << ", \"matched_resource\": " << (m.matched_resource ? "true" : "false")
       << " }";
    return os.str();
}

inline std::string to_json(const SimulationResult& result) {
    std::ostringstream os;
    os << "{\n"
       << "  \"action\": "   << json_detail::quoted(result.action) << ",\n"
       << "  \"resource\": " << json_detail::quoted(result.resource) << ",\n"
       << "  \"decision\": " << json_detail::quoted(result.allowed() ? "allowed" : "denied") << ",\n"
       << "  \"matched_statements\": [";
    for (std::size_t i = 0; i < result.matched_statements.size(); ++i) {
        os << "\n    " << to_json(result.matched_statements[i]);
        if (i + 1 < result.matched_statements.size()) os << ",";
    }
    os << "\n  ],\n"
       << "  \"missing_context_values\": "
       << json_detail::string_array(result.missing_context_values) << "\n"
       << "}";
    return os.str();
}

inline std::string to_json(const SimulatePolicyResponse& response) {
    std::ostringstream os;
    os << "{\n"
       << "  \"is_truncated\": " << (response.is_truncated ? "true" : "false") << ",\n"
       << "  \"evaluation_results\": [";
    for (std::size_t i = 0; i < response.evaluation_results.size(); ++i) {
        os << "\n" << to_json(response.evaluation_results[i]);
        if (i + 1 < response.evaluation_results.size()) os << ",";
    }
    os << "\n  ]\n"
       << "}";
    return os.str();
}

// ── Authorization ─────────────────────────────────────────────────────────────

inline std::string to_json(const PolicyStep& step) {
    std::ostringstream os;
    os << "{ \"source\": "  << json_detail::quoted(step.source)
       << ", \"kind\": "    << json_detail::quoted(step.kind == PolicySourceKind::Managed
                                                   ? "Managed" : "Inline")
       << ", \"outcome\": " << json_detail::quoted(json_detail::outcome_str(step.outcome))
       << " }";
    return os.str();
}

inline std::string to_json(const AuthorizationResult& result) {
    std::ostringstream os;
    os << "{\n"
       << "  \"allowed\": " << (result.allowed ? "true" : "false") << ",\n"
       << "  \"trace\": {\n"
       << "    \"root_bypass\": " << (result.trace.root_bypass ? "true" : "false") << ",\n"
       << "    \"steps\": [";
    for (std::size_t i = 0; i < result.trace.steps.size(); ++i) {
        os << "\n      " << to_json(result.trace.steps[i]);
        if (i + 1 < result.trace.steps.size()) os << ",";
    }
    os << "\n    ]\n"
       << "  }\n"
       << "}";
    return os.str();
}

// ── ARNs ──────────────────────────────────────────────────────────────────────

inline std::string to_json(const ProviderArnInfo& info) {
    std::ostringstream os;
    os << "{\n"
       << "  \"provider\": "      << json_detail::quoted(info.provider) << ",\n"
       << "  \"account_id\": "    << json_detail::quoted(info.account_id) << ",\n"
       << "  \"service\": "       << json_detail::quoted(info.service) << ",\n"
       << "  \"resource_type\": " << json_detail::quoted(info.resource_type) << ",\n"
       << "  \"resource_id\": "   << json_detail::quoted(info.resource_id) << ",\n"
       << "  \"region\": "        << json_detail::optional_quoted(info.region) << "\n"
       << "}";
    return os.str();
}

inline std::string to_json(const WamiArn& arn) {
    std::ostringstream os;
    os << "{\n"
       << "  \"arn\": "           << json_detail::quoted(arn.to_string()) << ",\n"
       << "  \"service\": "       << json_detail::quoted(arn.service().as_str()) << ",\n"
       << "  \"tenant_path\": "   << json_detail::quoted(arn.full_tenant_path()) << ",\n"
       << "  \"instance_id\": "   << json_detail::quoted(arn.wami_instance_id()) << ",\n"
       << "  \"cloud_mapping\": ";
    if (const auto& mapping = arn.cloud_mapping()) {
        os << "{ \"provider\": "   << json_detail::quoted(mapping->provider)
           << ", \"account_id\": " << json_detail::quoted(mapping->account_id)
           << ", \"region\": "     << json_detail::optional_quoted(mapping->region)
           << " }";
    } else {
        os << "null";
    }
    os << ",\n"
       << "  \"resource_type\": " << json_detail::quoted(arn.resource_type()) << ",\n"
       << "  \"resource_id\": "   << json_detail::quoted(arn.resource_id()) << "\n"
       << "}";
    return os.str();
}

} // namespace wami
