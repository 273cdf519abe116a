#include "wami/arn.hpp"
#include "wami/arn_transformer.hpp"
#include "wami/authorization.hpp"
#include "wami/context.hpp"
#include "wami/error.hpp"
#include "wami/json.hpp"
#include "wami/memory_store.hpp"
#include "wami/policy_engine.hpp"
#include "wami/tenant_authorization.hpp"

#include <iostream>
#include <string>
#include <utility>
#include <vector>

using namespace wami;

static std::string decision_str(bool allowed) {
    return allowed ? "[ALLOW]" : "[DENY] ";
}

static std::string outcome_str(PolicyOutcome o) {
    switch (o) {
        case PolicyOutcome::Allow:     return "Allow    ";
        case PolicyOutcome::Deny:      return "Deny     ";
        case PolicyOutcome::NoMatch:   return "NoMatch  ";
        case PolicyOutcome::Malformed: return "Malformed";
        default:                       return "Unknown  ";
    }
}

static void print_trace(const AuthorizationTrace& trace) {
    std::cout << "  Steps:\n";
    if (trace.root_bypass) {
        std::cout << "    [Bypass   ] root context\n";
        return;
    }
    for (const auto& step : trace.steps) {
        std::cout << "    [" << outcome_str(step.outcome) << "] " << step.source
                  << (step.kind == PolicySourceKind::Managed ? " (managed)" : " (inline)") << "\n";
    }
}

static void separator(const std::string& title) {
    std::cout << "\n" << std::string(55, '-') << "\n"
              << "  " << title << "\n"
              << std::string(55, '-') << "\n";
}

int main() {
    // ── Store ────────────────────────────────────────────────────────────────
    InMemoryStore store;

    store.create_user("alice");
    store.create_user("bob");

    store.create_policy({
        "S3FullAccess",
        "arn:wami:iam:12345678:wami:999888777:policy/S3FullAccess",
        R"({"Version":"2012-10-17","Statement":[
              {"Effect":"Allow","Action":"s3:*","Resource":"*"},
              {"Effect":"Deny","Action":"s3:DeleteObject","Resource":"*"}]})"
    });
    store.attach_user_policy("alice", "arn:wami:iam:12345678:wami:999888777:policy/S3FullAccess");
    store.put_user_policy("bob", "ReadOnly",
        R"({"Version":"2012-10-17","Statement":{"Effect":"Allow","Action":"s3:Get*","Resource":"*"}})");

    AuthorizationService authz(store);

    // ── ARNs ─────────────────────────────────────────────────────────────────
    separator("ARN CONSTRUCTION");

    auto alice_arn = WamiArn::builder()
        .service(Service::iam())
        .tenant_path(TenantPath::single(12345678))
        .wami_instance("999888777")
        .cloud_provider("aws", "223344556677")
        .resource("user", "alice")
        .build();

    auto bob_arn = WamiArn::builder()
        .service(Service::iam())
        .tenant_hierarchy({ "12345678", "87654321" })
        .wami_instance("999888777")
        .resource("user", "bob")
        .build();

    auto bucket_arn = WamiArn::builder()
        .service(Service::custom("s3"))
        .tenant(TenantPath::Segment{ 12345678 })
        .wami_instance("999888777")
        .resource("bucket", "reports/2026")
        .build();

    for (const auto* arn : { &alice_arn, &bob_arn, &bucket_arn }) {
        std::cout << "\n  ARN       : " << *arn << "\n"
                  << "  Tenant    : " << arn->tenant_path()
                  << (arn->is_cloud_synced() ? "  [cloud: " + *arn->provider() + "]" : "") << "\n";
    }

    // ── Provider Translation ─────────────────────────────────────────────────
    separator("PROVIDER TRANSLATION");

    for (const auto& name : supported_providers()) {
        auto transformer = get_transformer(name);
        auto synced = WamiArn::builder()
            .service(Service::iam())
            .tenant_path(alice_arn.tenant_path())
            .wami_instance(alice_arn.wami_instance_id())
            .cloud_provider(name, "223344556677")
            .resource("user", "alice")
            .build();
        std::cout << "\n  " << name << " : " << transformer->to_provider_arn(synced) << "\n";
    }

    {
        auto aws = get_transformer("aws");
        auto info = aws->from_provider_arn("arn:aws:iam::223344556677:user/alice");
        auto rebuilt = to_wami_arn(info, Service::iam(), TenantPath::single(12345678), "999888777");
        std::cout << "\n  round trip : " << rebuilt
                  << (rebuilt == alice_arn ? "  (matches)" : "  (differs)") << "\n";
    }

    // ── Access Control Scenarios ─────────────────────────────────────────────
    separator("ACCESS CONTROL EVALUATION");

    auto alice_ctx = WamiContext::builder()
        .tenant_path(alice_arn.tenant_path())
        .instance_id("999888777")
        .caller_arn(alice_arn)
        .build();
    auto bob_ctx = WamiContext::builder()
        .tenant_path(bob_arn.tenant_path())
        .instance_id("999888777")
        .caller_arn(bob_arn)
        .build();
    auto root_ctx = WamiContext::builder()
        .tenant_path(TenantPath::single(12345678))
        .instance_id("999888777")
        .caller_arn(alice_arn)
        .is_root(true)
        .build();

    struct Scenario {
        const WamiContext* context;
        std::string        action;
    };
    std::vector<Scenario> scenarios = {
        { &alice_ctx, "s3:GetObject"    },
        { &alice_ctx, "s3:DeleteObject" },
        { &bob_ctx,   "s3:GetObject"    },
        { &bob_ctx,   "s3:PutObject"    },
        { &root_ctx,  "s3:DeleteObject" },
    };

    for (const auto& s : scenarios) {
        auto result = authz.evaluate(*s.context, s.action, bucket_arn);
        std::cout << "\n  Caller    : " << s.context->caller_arn().resource_id()
                  << (s.context->is_root() ? " [root]" : "") << "\n"
                  << "  Action    : " << s.action << "\n"
                  << "  Decision  : " << decision_str(result.allowed) << "\n";
    }

    try {
        authz.check_or_deny(bob_ctx, "s3:PutObject", bucket_arn);
    } catch (const AccessDeniedError& e) {
        std::cout << "\n  check_or_deny -> " << e.what() << "\n";
    }

    // ── Tenant Containment ───────────────────────────────────────────────────
    separator("TENANT CONTAINMENT");

    for (const auto& target : { "12345678", "12345678/87654321", "99999999" }) {
        auto path = TenantPath::parse(target);
        std::cout << "\n  " << target << " : alice "
                  << (alice_ctx.can_access_tenant(path) ? "yes" : "no ")
                  << "  bob " << (bob_ctx.can_access_tenant(path) ? "yes" : "no ") << "\n";
    }

    // ── Evaluation Trace ─────────────────────────────────────────────────────
    separator("EVALUATION TRACE");

    {
        auto result = authz.evaluate(alice_ctx, "s3:DeleteObject", bucket_arn);
        std::cout << "\n  Caller    : alice\n"
                  << "  Action    : s3:DeleteObject\n"
                  << "  Decision  : " << decision_str(result.allowed) << "\n";
        print_trace(result.trace);
    }

    // ── Tenant Policies ──────────────────────────────────────────────────────
    separator("TENANT POLICIES");

    {
        TenantAuthorizer tenant_authz({ build_tenant_admin_policy("acme"),
                                        build_tenant_readonly_policy("globex") });
        const std::vector<std::pair<std::string, TenantAction>> checks = {
            { "acme/engineering", TenantAction::Delete },
            { "globex",           TenantAction::Read   },
            { "globex",           TenantAction::Update },
        };
        for (const auto& [tenant, action] : checks) {
            std::cout << "\n  " << action << " on " << tenant << " : "
                      << decision_str(tenant_authz.check_permission(alice_arn.to_string(), tenant, action))
                      << "\n";
        }
    }

    // ── JSON Output ──────────────────────────────────────────────────────────
    separator("JSON OUTPUT");

    {
        auto result = authz.evaluate(bob_ctx, "s3:GetObject", bucket_arn);
        std::cout << "\n  AuthorizationResult:\n" << to_json(result) << "\n";
    }

    {
        SimulateCustomPolicyRequest request;
        request.policy_input_list = {
            R"({"Version":"2012-10-17","Statement":[{"Effect":"Allow","Action":"s3:Get*","Resource":"*"}]})"
        };
        request.action_names = { "s3:GetObject" };
        auto response = simulate_custom_policy(request);
        std::cout << "\n  SimulationResult:\n" << to_json(response.evaluation_results.front()) << "\n";
    }

    std::cout << "\n  WamiArn:\n" << to_json(alice_arn) << "\n";

    std::cout << "\n" << std::string(55, '-') << "\n"
              << "  WAMI evaluation complete.\n"
              << std::string(55, '-') << "\n\n";
    return 0;
}
