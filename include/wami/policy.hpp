#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace wami {

enum class Effect { Allow, Deny };

inline std::ostream& operator<<(std::ostream& os, Effect e) {
    return os << (e == Effect::Allow ? "Allow" : "Deny");
}

struct PolicyStatement {
    std::optional<std::string> sid;
    Effect                     effect = Effect::Allow;
    std::vector<std::string>   action;     // patterns
    std::vector<std::string>   resource;   // patterns
    std::optional<std::string> condition;  // raw JSON, carried but not evaluated
};

struct PolicyDocument {
    std::string                  version = "2012-10-17";
    std::vector<PolicyStatement> statement;
};

/**
 * Parses an IAM policy document:
 *
 *   { "Version": "...", "Statement": [ { "Effect": "Allow"|"Deny",
 *     "Action": "s3:Get*" | [...], "Resource": "*" | [...],
 *     "Sid": "...", "Condition": {...} } ] }
 *
 * "Statement" may also be a single object. Statements with an Effect other
 * than Allow or Deny are dropped. Throws Error(InvalidParameter) on
 * malformed JSON or a structurally invalid document.
 */
PolicyDocument parse_policy_document(const std::string& json);

} // namespace wami
