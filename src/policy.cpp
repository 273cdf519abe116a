#include "wami/policy.hpp"
#include "wami/error.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <algorithm>
#include <cctype>
#include <optional>
#include <utility>

namespace wami {

namespace {

using JsonValue = rapidjson::Value;

[[noreturn]] void malformed(const std::string& detail) {
    throw Error(ErrorKind::InvalidParameter, "Invalid policy document JSON: " + detail);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

const JsonValue* find_member(const JsonValue& object, const char* name) {
    auto it = object.FindMember(name);
    return it == object.MemberEnd() ? nullptr : &it->value;
}

/// "Action"/"Resource" accept a single string or an array of strings.
std::vector<std::string> string_or_array(const JsonValue& value, const char* field) {
    std::vector<std::string> out;
    if (value.IsString()) {
        out.emplace_back(value.GetString(), value.GetStringLength());
        return out;
    }
    if (!value.IsArray()) malformed(std::string(field) + " must be a string or an array of strings");
    for (const auto& item : value.GetArray()) {
        if (!item.IsString()) malformed(std::string(field) + " entries must be strings");
        out.emplace_back(item.GetString(), item.GetStringLength());
    }
    return out;
}

std::string write_raw(const JsonValue& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

/// Returns nullopt for a statement whose Effect is neither Allow nor Deny.
/// Such a statement can never match, and dropping it keeps the rest of the
/// document (its Deny statements in particular) in force.
std::optional<PolicyStatement> parse_statement(const JsonValue& value) {
    if (!value.IsObject()) malformed("Statement entries must be objects");

    PolicyStatement statement;

    const auto* effect = find_member(value, "Effect");
    if (!effect || !effect->IsString()) malformed("Statement is missing a string Effect");
    auto effect_name = lower(effect->GetString());
    bool known_effect = true;
    if (effect_name == "allow") {
        statement.effect = Effect::Allow;
    } else if (effect_name == "deny") {
        statement.effect = Effect::Deny;
    } else {
        known_effect = false;
    }

    const auto* action = find_member(value, "Action");
    if (!action) malformed("Statement is missing Action");
    statement.action = string_or_array(*action, "Action");

    const auto* resource = find_member(value, "Resource");
    if (!resource) malformed("Statement is missing Resource");
    statement.resource = string_or_array(*resource, "Resource");

    if (const auto* sid = find_member(value, "Sid")) {
        if (!sid->IsString()) malformed("Sid must be a string");
        statement.sid = sid->GetString();
    }
    if (const auto* condition = find_member(value, "Condition")) {
        statement.condition = write_raw(*condition);
    }
    if (!known_effect) return std::nullopt;
    return statement;
}

} // namespace

PolicyDocument parse_policy_document(const std::string& json) {
    rapidjson::Document doc;
    doc.Parse(json.c_str(), json.size());
    if (doc.HasParseError()) {
        malformed(std::string(rapidjson::GetParseError_En(doc.GetParseError())) + " at offset " +
                  std::to_string(doc.GetErrorOffset()));
    }
    if (!doc.IsObject()) malformed("top level must be an object");

    PolicyDocument policy;
    const auto* version = find_member(doc, "Version");
    if (!version || !version->IsString()) malformed("missing string Version");
    policy.version = version->GetString();

    const auto* statements = find_member(doc, "Statement");
    if (!statements) malformed("missing Statement");
    if (statements->IsArray()) {
        for (const auto& item : statements->GetArray()) {
            if (auto statement = parse_statement(item)) policy.statement.push_back(std::move(*statement));
        }
    } else if (auto statement = parse_statement(*statements)) {
        policy.statement.push_back(std::move(*statement));
    }
    return policy;
}

} // namespace wami
