#include "wami/arn.hpp"
#include "wami/authorization.hpp"
#include "wami/context.hpp"
#include "wami/error.hpp"
#include "wami/json.hpp"
#include "wami/memory_store.hpp"
#include "wami/simulation.hpp"

#include <iostream>
#include <optional>
#include <string>

using namespace wami;

// ── Helpers ──────────────────────────────────────────────────────────────────

static const std::string kInstance = "999888777";
static const std::string kS3FullArn = "arn:wami:iam:12345678:wami:999888777:policy/S3FullNoDelete";

static std::string allow(const std::string& action, const std::string& resource = "*") {
    return R"({"Version":"2012-10-17","Statement":{"Effect":"Allow","Action":")" + action +
           R"(","Resource":")" + resource + R"("}})";
}

static std::string deny(const std::string& action, const std::string& resource = "*") {
    return R"({"Version":"2012-10-17","Statement":{"Effect":"Deny","Action":")" + action +
           R"(","Resource":")" + resource + R"("}})";
}

static WamiArn user_arn(const std::string& name) {
    return WamiArn::parse("arn:wami:iam:12345678:wami:" + kInstance + ":user/" + name);
}

static WamiArn bucket_arn(const std::string& name) {
    return WamiArn::parse("arn:wami:s3:12345678:wami:" + kInstance + ":bucket/" + name);
}

static WamiContext context_for(const WamiArn& caller, bool is_root = false) {
    return WamiContext::builder()
        .tenant_path(caller.tenant_path())
        .instance_id(kInstance)
        .caller_arn(caller)
        .is_root(is_root)
        .build();
}

/// alice: managed S3 full access with DeleteObject denied.
/// bob:   inline read-only.
/// carol: no policies.
/// dave:  managed allow, then an inline deny on the same action.
static void seed(InMemoryStore& store) {
    for (const auto* name : { "alice", "bob", "carol", "dave" }) store.create_user(name);

    store.create_policy({ "S3FullNoDelete", kS3FullArn,
        R"({"Version":"2012-10-17","Statement":[
              {"Effect":"Allow","Action":"s3:*","Resource":"*"},
              {"Effect":"Deny","Action":"s3:DeleteObject","Resource":"*"}]})" });
    store.attach_user_policy("alice", kS3FullArn);

    store.put_user_policy("bob", "ReadOnly", allow("s3:Get*"));

    store.attach_user_policy("dave", kS3FullArn);
    store.put_user_policy("dave", "NoGet", deny("s3:GetObject"));
}

static int passed = 0;
static int failed = 0;

#define ASSERT_EQ(label, expected, actual)                                  \
    do {                                                                    \
        if ((expected) == (actual)) {                                       \
            std::cout << "  [PASS] " << label << "\n";                     \
            ++passed;                                                       \
        } else {                                                            \
            std::cout << "  [FAIL] " << label                              \
                      << "  (expected=" << (expected)                      \
                      << " got=" << (actual) << ")\n";                     \
            ++failed;                                                       \
        }                                                                   \
    } while (0)

#define ASSERT_TRUE(label, expr)                                            \
    do {                                                                    \
        if ((expr)) {                                                       \
            std::cout << "  [PASS] " << label << "\n";                     \
            ++passed;                                                       \
        } else {                                                            \
            std::cout << "  [FAIL] " << label << "\n";                     \
            ++failed;                                                       \
        }                                                                   \
    } while (0)

template <typename F>
static std::optional<ErrorKind> thrown_kind(F&& f) {
    try {
        f();
    } catch (const Error& e) {
        return e.kind();
    }
    return std::nullopt;
}

// ── Test suites ───────────────────────────────────────────────────────────────

void test_deny_overrides_allow() {
    std::cout << "\n[DenyOverridesAllow]\n";
    InMemoryStore store;
    seed(store);
    AuthorizationService authz(store);
    auto alice = context_for(user_arn("alice"));

    ASSERT_TRUE("get allowed", authz.authorize(alice, "s3:GetObject", bucket_arn("reports")));
    ASSERT_TRUE("put allowed", authz.authorize(alice, "s3:PutObject", bucket_arn("reports")));
    ASSERT_TRUE("delete denied", !authz.authorize(alice, "s3:DeleteObject", bucket_arn("reports")));
}

void test_wildcard_actions() {
    std::cout << "\n[WildcardActions]\n";
    InMemoryStore store;
    seed(store);
    AuthorizationService authz(store);
    auto bob = context_for(user_arn("bob"));

    ASSERT_TRUE("s3:Get* covers GetObject", authz.authorize(bob, "s3:GetObject", bucket_arn("a")));
    ASSERT_TRUE("s3:Get* covers GetBucketAcl", authz.authorize(bob, "s3:GetBucketAcl", bucket_arn("a")));
    ASSERT_TRUE("s3:Get* excludes PutObject", !authz.authorize(bob, "s3:PutObject", bucket_arn("a")));

    ASSERT_TRUE("static action helper", AuthorizationService::matches_action("iam:*", "iam:CreateUser"));
    ASSERT_TRUE("static resource helper",
                AuthorizationService::matches_resource("arn:wami:s3:*", bucket_arn("a").to_string()));
    ASSERT_TRUE("static wildcard helper", !AuthorizationService::wildcard_match("a*", "ba"));
}

void test_implicit_deny() {
    std::cout << "\n[ImplicitDeny]\n";
    InMemoryStore store;
    seed(store);
    AuthorizationService authz(store);

    auto result = authz.evaluate(context_for(user_arn("carol")), "s3:GetObject", bucket_arn("a"));
    ASSERT_TRUE("no policies denies", !result.allowed);
    ASSERT_TRUE("no steps", result.trace.steps.empty());

    auto unknown = authz.evaluate(context_for(user_arn("mallory")), "s3:GetObject", bucket_arn("a"));
    ASSERT_TRUE("unknown user denies", !unknown.allowed);
}

void test_root_bypass() {
    std::cout << "\n[RootBypass]\n";
    InMemoryStore store;
    seed(store);
    AuthorizationService authz(store);

    auto root = context_for(user_arn("carol"), true);
    auto result = authz.evaluate(root, "iam:DeleteUser", user_arn("alice"));
    ASSERT_TRUE("root allowed", result.allowed);
    ASSERT_TRUE("bypass recorded", result.trace.root_bypass);
    ASSERT_TRUE("no policy consulted", result.trace.steps.empty());

    // Root may be any principal type; the user check only applies to policy evaluation.
    auto role = WamiArn::parse("arn:wami:iam:12345678:wami:" + kInstance + ":role/ops");
    ASSERT_TRUE("root role allowed", authz.authorize(context_for(role, true), "s3:DeleteObject",
                                                     bucket_arn("a")));
}

void test_caller_must_be_user() {
    std::cout << "\n[CallerMustBeUser]\n";
    InMemoryStore store;
    AuthorizationService authz(store);
    auto role = WamiArn::parse("arn:wami:iam:12345678:wami:" + kInstance + ":role/ops");
    ASSERT_TRUE("role caller rejected", thrown_kind([&] {
        authz.authorize(context_for(role), "s3:GetObject", bucket_arn("a"));
    }) == ErrorKind::InvalidParameter);
}

void test_policy_order() {
    std::cout << "\n[PolicyOrder]\n";
    InMemoryStore store;
    seed(store);
    AuthorizationService authz(store);
    auto dave = context_for(user_arn("dave"));

    auto result = authz.evaluate(dave, "s3:GetObject", bucket_arn("a"));
    ASSERT_TRUE("managed allow decides first", result.allowed);
    ASSERT_EQ("one step", std::size_t(1), result.trace.steps.size());
    ASSERT_EQ("step source", kS3FullArn, result.trace.steps[0].source);
    ASSERT_TRUE("step kind", result.trace.steps[0].kind == PolicySourceKind::Managed);

    auto del = authz.evaluate(dave, "s3:DeleteObject", bucket_arn("a"));
    ASSERT_TRUE("managed deny decides first", !del.allowed);
    ASSERT_EQ("deny outcome", PolicyOutcome::Deny, del.trace.steps[0].outcome);

    store.put_user_policy("carol", "Other", allow("iam:*"));
    store.put_user_policy("carol", "S3", allow("s3:List*"));
    auto carol = authz.evaluate(context_for(user_arn("carol")), "s3:ListBucket", bucket_arn("a"));
    ASSERT_TRUE("inline allow found", carol.allowed);
    ASSERT_EQ("two steps", std::size_t(2), carol.trace.steps.size());
    ASSERT_EQ("first no match", PolicyOutcome::NoMatch, carol.trace.steps[0].outcome);
    ASSERT_EQ("second allow", PolicyOutcome::Allow, carol.trace.steps[1].outcome);
}

void test_malformed_stored_policy() {
    std::cout << "\n[MalformedStoredPolicy]\n";
    InMemoryStore store;
    store.create_user("erin");
    store.put_user_policy("erin", "Broken", "{ not json");
    store.put_user_policy("erin", "Reader", allow("s3:GetObject"));

    AuthorizationService tolerant(store);
    auto erin = context_for(user_arn("erin"));
    auto result = tolerant.evaluate(erin, "s3:GetObject", bucket_arn("a"));
    ASSERT_TRUE("skipped and allowed", result.allowed);
    ASSERT_EQ("malformed step", PolicyOutcome::Malformed, result.trace.steps[0].outcome);

    AuthorizationService strict(store, AuthorizationOptions{ true });
    ASSERT_TRUE("fail closed throws", thrown_kind([&] {
        strict.authorize(erin, "s3:GetObject", bucket_arn("a"));
    }) == ErrorKind::InvalidParameter);
}

void test_unknown_effect_keeps_deny() {
    std::cout << "\n[UnknownEffectKeepsDeny]\n";
    InMemoryStore store;
    store.create_user("frank");
    store.put_user_policy("frank", "NoDelete",
        R"({"Version":"2012-10-17","Statement":[
              {"Effect":"Deny","Action":"s3:DeleteObject","Resource":"*"},
              {"Effect":"Audit","Action":"s3:*","Resource":"*"}]})");
    store.put_user_policy("frank", "S3Full", allow("s3:*"));

    AuthorizationService authz(store);
    auto frank = context_for(user_arn("frank"));
    auto result = authz.evaluate(frank, "s3:DeleteObject", bucket_arn("a"));
    ASSERT_TRUE("deny survives unknown effect", !result.allowed);
    ASSERT_EQ("deny step", PolicyOutcome::Deny, result.trace.steps[0].outcome);
    ASSERT_TRUE("other actions allowed", authz.authorize(frank, "s3:GetObject", bucket_arn("a")));

    AuthorizationService strict(store, AuthorizationOptions{ true });
    ASSERT_TRUE("not treated as malformed",
                !strict.authorize(frank, "s3:DeleteObject", bucket_arn("a")));
}

void test_check_or_deny() {
    std::cout << "\n[CheckOrDeny]\n";
    InMemoryStore store;
    seed(store);
    AuthorizationService authz(store);
    auto bob = context_for(user_arn("bob"));

    bool threw = false;
    try {
        authz.check_or_deny(bob, "s3:GetObject", bucket_arn("a"));
    } catch (const Error&) {
        threw = true;
    }
    ASSERT_TRUE("allowed does not throw", !threw);

    try {
        authz.check_or_deny(bob, "s3:PutObject", bucket_arn("a"));
        ASSERT_TRUE("denied throws", false);
    } catch (const AccessDeniedError& e) {
        ASSERT_EQ("kind", ErrorKind::AccessDenied, e.kind());
        ASSERT_EQ("caller", user_arn("bob").to_string(), e.caller());
        ASSERT_EQ("action", std::string("s3:PutObject"), e.action());
        ASSERT_EQ("resource", bucket_arn("a").to_string(), e.resource());
        ASSERT_TRUE("message names action",
                    std::string(e.what()).find("s3:PutObject") != std::string::npos);
    }
}

void test_simulate_principal_policy() {
    std::cout << "\n[SimulatePrincipalPolicy]\n";
    InMemoryStore store;
    seed(store);

    SimulatePrincipalPolicyRequest request;
    request.policy_source_arn = user_arn("alice").to_string();
    request.action_names = { "s3:GetObject", "s3:DeleteObject" };
    auto response = simulate_principal_policy(store, request);
    ASSERT_EQ("result count", std::size_t(2), response.evaluation_results.size());
    ASSERT_TRUE("get allowed", response.evaluation_results[0].allowed());
    ASSERT_TRUE("delete denied", !response.evaluation_results[1].allowed());
    ASSERT_TRUE("managed source id",
                response.evaluation_results[0].matched_statements[0].source_policy_id == kS3FullArn);

    // Across all of dave's policies a deny anywhere wins.
    request.policy_source_arn = user_arn("dave").to_string();
    request.action_names = { "s3:GetObject" };
    ASSERT_TRUE("dave get denied in simulation",
                !simulate_principal_policy(store, request).evaluation_results[0].allowed());

    request.policy_source_arn = user_arn("carol").to_string();
    request.policy_input_list = { allow("s3:GetObject") };
    auto extra = simulate_principal_policy(store, request);
    ASSERT_TRUE("extra input allows", extra.evaluation_results[0].allowed());
    ASSERT_TRUE("extra input id", extra.evaluation_results[0].matched_statements[0].source_policy_id
                                  == std::string("PolicyInputList.1"));

    request.policy_source_arn = user_arn("mallory").to_string();
    ASSERT_TRUE("unknown user", thrown_kind([&] { simulate_principal_policy(store, request); })
                == ErrorKind::ResourceNotFound);
    request.policy_source_arn = "not-an-arn";
    ASSERT_TRUE("bad arn", thrown_kind([&] { simulate_principal_policy(store, request); })
                == ErrorKind::InvalidParameter);
}

void test_json_authorization_result() {
    std::cout << "\n[JsonAuthorizationResult]\n";
    InMemoryStore store;
    seed(store);
    AuthorizationService authz(store);
    auto json = to_json(authz.evaluate(context_for(user_arn("alice")), "s3:DeleteObject",
                                       bucket_arn("a")));
    ASSERT_TRUE("json contains allowed", json.find("\"allowed\": false") != std::string::npos);
    ASSERT_TRUE("json contains source",  json.find(kS3FullArn)           != std::string::npos);
    ASSERT_TRUE("json contains outcome", json.find("\"Deny\"")           != std::string::npos);
}

// ── Main ──────────────────────────────────────────────────────────────────────

int main() {
    std::cout << "=== Authorization Tests ===\n";

    test_deny_overrides_allow();
    test_wildcard_actions();
    test_implicit_deny();
    test_root_bypass();
    test_caller_must_be_user();
    test_policy_order();
    test_malformed_stored_policy();
    test_unknown_effect_keeps_deny();
    test_check_or_deny();
    test_simulate_principal_policy();
    test_json_authorization_result();

    std::cout << "\n--- Results: "
              << passed << " passed, " << failed << " failed ---\n";
    return failed == 0 ? 0 : 1;
}
