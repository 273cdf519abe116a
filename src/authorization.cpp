#include "wami/authorization.hpp"
#include "wami/error.hpp"
#include "wami/policy.hpp"
#include "wami/policy_engine.hpp"

namespace wami {

AuthorizationService::AuthorizationService(const PolicyStore& store, AuthorizationOptions options)
    : store_(store), options_(options) {}

AuthorizationResult AuthorizationService::evaluate(const WamiContext& context,
                                                   const std::string& action,
                                                   const WamiArn& resource) const {
    AuthorizationResult result;

    if (context.is_root()) {
        result.allowed = true;
        result.trace.root_bypass = true;
        return result;
    }

    const WamiArn& caller = context.caller_arn();
    if (caller.resource_type() != "user") {
        throw Error(ErrorKind::InvalidParameter,
                    "caller is not a user: " + caller.to_string());
    }

    const std::string resource_str = resource.to_string();

    for (const auto& policy : collect_user_policies(store_, caller.resource_id())) {
        PolicyDocument document;
        bool malformed = false;
        try {
            document = parse_policy_document(policy.document);
        } catch (const Error& e) {
            if (options_.fail_closed_on_malformed_policy) {
                throw Error(ErrorKind::InvalidParameter,
                            "stored policy " + policy.source_id + " is malformed: " + e.message());
            }
            malformed = true;
        }

        if (malformed) {
            result.trace.steps.push_back({policy.source_id, policy.kind, PolicyOutcome::Malformed});
            continue;
        }

        switch (evaluate_document(document, action, resource_str)) {
            case PolicyEffect::Deny:
                result.trace.steps.push_back({policy.source_id, policy.kind, PolicyOutcome::Deny});
                result.allowed = false;
                return result;
            case PolicyEffect::Allow:
                result.trace.steps.push_back({policy.source_id, policy.kind, PolicyOutcome::Allow});
                result.allowed = true;
                return result;
            case PolicyEffect::NoMatch:
                result.trace.steps.push_back({policy.source_id, policy.kind, PolicyOutcome::NoMatch});
                break;
        }
    }

    result.allowed = false;
    return result;
}

bool AuthorizationService::authorize(const WamiContext& context, const std::string& action,
                                     const WamiArn& resource) const {
    return evaluate(context, action, resource).allowed;
}

void AuthorizationService::check_or_deny(const WamiContext& context, const std::string& action,
                                         const WamiArn& resource) const {
    if (!authorize(context, action, resource)) {
        throw AccessDeniedError(context.caller_arn().to_string(), action, resource.to_string());
    }
}

bool AuthorizationService::matches_action(const std::string& pattern, const std::string& action) {
    return matches_pattern(pattern, action);
}

bool AuthorizationService::matches_resource(const std::string& pattern,
                                            const std::string& resource) {
    return matches_pattern(pattern, resource);
}

bool AuthorizationService::wildcard_match(const std::string& pattern, const std::string& value) {
    return matches_pattern(pattern, value);
}

} // namespace wami
