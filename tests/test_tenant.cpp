#include "wami/error.hpp"
#include "wami/memory_store.hpp"
#include "wami/policy.hpp"
#include "wami/tenant.hpp"
#include "wami/tenant_authorization.hpp"

#include <algorithm>
#include <iostream>
#include <optional>
#include <string>

using namespace wami;

// ── Helpers ──────────────────────────────────────────────────────────────────

static Tenant make_tenant(const std::string& id) {
    TenantId tenant_id(id);
    return build_tenant(tenant_id, id.substr(id.rfind('/') + 1), std::nullopt, tenant_id.parent());
}

/// acme
/// ├── acme/eng
/// │   └── acme/eng/web
/// └── acme/sales
/// globex
static void seed(InMemoryStore& store) {
    for (const auto* id : { "acme", "acme/eng", "acme/eng/web", "acme/sales", "globex" }) {
        store.create_tenant(make_tenant(id));
    }
}

static bool contains(const std::vector<TenantId>& ids, const std::string& id) {
    return std::find(ids.begin(), ids.end(), TenantId(id)) != ids.end();
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

void test_tenant_id() {
    std::cout << "\n[TenantId]\n";
    auto web = TenantId::root("acme").child("eng").child("web");
    ASSERT_EQ("as_str", std::string("acme/eng/web"), web.as_str());
    ASSERT_EQ("depth", std::size_t(2), web.depth());
    ASSERT_EQ("root depth", std::size_t(0), TenantId("acme").depth());
    ASSERT_TRUE("parent", web.parent() == TenantId("acme/eng"));
    ASSERT_TRUE("root has no parent", !TenantId("acme").parent().has_value());

    auto ancestors = web.ancestors();
    ASSERT_EQ("ancestor count", std::size_t(2), ancestors.size());
    ASSERT_EQ("root first", TenantId("acme"), ancestors.front());
    ASSERT_EQ("parent last", TenantId("acme/eng"), ancestors.back());

    ASSERT_TRUE("descendant", web.is_descendant_of(TenantId("acme")));
    ASSERT_TRUE("not own descendant", !web.is_descendant_of(web));
    ASSERT_TRUE("name prefix is not ancestry", !TenantId("acme2").is_descendant_of(TenantId("acme")));
    ASSERT_TRUE("valid depth", is_valid_depth(web, 2));
    ASSERT_TRUE("too deep", !is_valid_depth(web, 1));
}

void test_tenant_names() {
    std::cout << "\n[TenantNames]\n";
    ASSERT_TRUE("valid name", !thrown_kind([] { validate_tenant_name("acme-corp_01"); }));
    ASSERT_TRUE("empty", thrown_kind([] { validate_tenant_name(""); }) == ErrorKind::InvalidParameter);
    ASSERT_TRUE("too long", thrown_kind([] { validate_tenant_name(std::string(65, 'a')); })
                == ErrorKind::InvalidParameter);
    ASSERT_TRUE("64 is fine", !thrown_kind([] { validate_tenant_name(std::string(64, 'a')); }));
    ASSERT_TRUE("space", thrown_kind([] { validate_tenant_name("acme corp"); })
                == ErrorKind::InvalidParameter);
    ASSERT_TRUE("slash", thrown_kind([] { validate_tenant_name("acme/eng"); })
                == ErrorKind::InvalidParameter);
}

void test_build_defaults() {
    std::cout << "\n[BuildDefaults]\n";
    auto tenant = build_tenant(TenantId("acme"), "Acme", std::string("Acme Inc"));
    ASSERT_EQ("status", TenantStatus::Active, tenant.status);
    ASSERT_TRUE("inherited quotas", tenant.quota_mode == QuotaMode::Inherited);
    ASSERT_EQ("max users", std::size_t(1000), tenant.quotas.max_users);
    ASSERT_EQ("max roles", std::size_t(500), tenant.quotas.max_roles);
    ASSERT_EQ("max sub tenants", std::size_t(10), tenant.quotas.max_sub_tenants);
    ASSERT_EQ("max child depth", std::size_t(3), tenant.max_child_depth);
    ASSERT_TRUE("organization", tenant.organization == std::string("Acme Inc"));
    ASSERT_TRUE("can create child", can_create_child(tenant));

    tenant.status = TenantStatus::Suspended;
    ASSERT_TRUE("suspended cannot create child", !can_create_child(tenant));
}

void test_quota_validation() {
    std::cout << "\n[QuotaValidation]\n";
    TenantQuotas parent;
    TenantQuotas child;
    child.max_users = 100;
    ASSERT_TRUE("smaller child ok", !thrown_kind([&] { child.validate_against_parent(parent); }));

    child.max_roles = 501;
    try {
        child.validate_against_parent(parent);
        ASSERT_TRUE("larger child rejected", false);
    } catch (const Error& e) {
        ASSERT_EQ("kind", ErrorKind::InvalidParameter, e.kind());
        ASSERT_TRUE("names the field", e.message().find("max_roles") != std::string::npos);
    }
}

void test_effective_quotas() {
    std::cout << "\n[EffectiveQuotas]\n";
    InMemoryStore store;
    seed(store);

    auto acme = *store.get_tenant(TenantId("acme"));
    acme.quotas.max_users = 42;
    store.update_tenant(acme);

    ASSERT_EQ("root uses own", std::size_t(42), effective_quotas(store, TenantId("acme")).max_users);
    ASSERT_EQ("grandchild inherits", std::size_t(42),
              effective_quotas(store, TenantId("acme/eng/web")).max_users);

    auto eng = *store.get_tenant(TenantId("acme/eng"));
    eng.quota_mode = QuotaMode::Override;
    eng.quotas.max_users = 7;
    store.update_tenant(eng);
    ASSERT_EQ("override stops inheritance", std::size_t(7),
              effective_quotas(store, TenantId("acme/eng/web")).max_users);
    ASSERT_EQ("sibling still inherits root", std::size_t(42),
              effective_quotas(store, TenantId("acme/sales")).max_users);

    ASSERT_TRUE("missing tenant", thrown_kind([&] { effective_quotas(store, TenantId("nope")); })
                == ErrorKind::ResourceNotFound);

    store.create_tenant(build_tenant(TenantId("orphan/child"), "child", std::nullopt,
                                     TenantId("orphan")));
    ASSERT_TRUE("dangling parent", thrown_kind([&] {
        effective_quotas(store, TenantId("orphan/child")); }) == ErrorKind::ResourceNotFound);
}

void test_hierarchy_queries() {
    std::cout << "\n[HierarchyQueries]\n";
    InMemoryStore store;
    seed(store);

    auto ancestors = tenant_ancestors(store, TenantId("acme/eng/web"));
    ASSERT_EQ("ancestor count", std::size_t(2), ancestors.size());
    ASSERT_EQ("root first", TenantId("acme"), ancestors[0].id);

    auto descendants = tenant_descendants(store, TenantId("acme"));
    ASSERT_EQ("descendant count", std::size_t(3), descendants.size());
    ASSERT_TRUE("includes grandchild", contains(descendants, "acme/eng/web"));
    ASSERT_TRUE("excludes other root", !contains(descendants, "globex"));

    ASSERT_EQ("children of acme", std::size_t(2), store.list_child_tenants(TenantId("acme")).size());

    auto tree = TenantNode::build_tree(store.list_tenants(), TenantId("acme"));
    ASSERT_TRUE("tree built", tree.has_value());
    ASSERT_EQ("tree descendants", std::size_t(3), tree->descendant_count());
    ASSERT_TRUE("tree lists grandchild", contains(tree->all_descendants(), "acme/eng/web"));
    ASSERT_TRUE("absent root", !TenantNode::build_tree(store.list_tenants(), TenantId("x")));
}

void test_store_errors() {
    std::cout << "\n[StoreErrors]\n";
    InMemoryStore store;
    seed(store);
    ASSERT_TRUE("duplicate create", thrown_kind([&] { store.create_tenant(make_tenant("acme")); })
                == ErrorKind::ResourceExists);
    ASSERT_TRUE("update missing", thrown_kind([&] { store.update_tenant(make_tenant("nope")); })
                == ErrorKind::ResourceNotFound);
    store.delete_tenant(TenantId("globex"));
    ASSERT_TRUE("deleted", !store.get_tenant(TenantId("globex")).has_value());
    ASSERT_TRUE("delete missing", thrown_kind([&] { store.delete_tenant(TenantId("globex")); })
                == ErrorKind::ResourceNotFound);
}

void test_tenant_authorizer() {
    std::cout << "\n[TenantAuthorizer]\n";
    const std::string principal = "arn:wami:iam:1:wami:9:user/alice";

    TenantAuthorizer admin({ build_tenant_admin_policy("acme") });
    ASSERT_TRUE("admin on tenant", admin.check_permission(principal, "acme", TenantAction::Delete));
    ASSERT_TRUE("admin on child", admin.check_permission(principal, "acme/eng", TenantAction::ManageUsers));
    ASSERT_TRUE("not on other tenant", !admin.check_permission(principal, "globex", TenantAction::Read));
    ASSERT_TRUE("not on name prefix", !admin.check_permission(principal, "acme2", TenantAction::Read));

    TenantAuthorizer readonly({ build_tenant_readonly_policy("acme/eng") });
    ASSERT_TRUE("read allowed", readonly.check_permission(principal, "acme/eng", TenantAction::Read));
    ASSERT_TRUE("update denied", !readonly.check_permission(principal, "acme/eng", TenantAction::Update));
    ASSERT_TRUE("child not covered", !readonly.check_permission(principal, "acme/eng/web", TenantAction::Read));

    TenantAuthorizer mixed({
        "{ broken",
        build_tenant_admin_policy("acme"),
        R"({"Version":"2012-10-17","Statement":{"Effect":"Deny","Action":"tenant:Delete",
            "Resource":"arn:wami:tenant::acme/*"}})",
    });
    ASSERT_EQ("malformed skipped", std::size_t(2), mixed.policy_count());
    ASSERT_TRUE("deny overrides admin", !mixed.check_permission(principal, "acme/eng", TenantAction::Delete));
    ASSERT_TRUE("other actions allowed", mixed.check_permission(principal, "acme/eng", TenantAction::Update));

    auto docs = TenantAuthorizer::from_documents({ parse_policy_document(build_tenant_readonly_policy("x")) });
    ASSERT_TRUE("from documents", docs.check_permission(principal, "x", TenantAction::Read));

    ASSERT_EQ("action string", std::string("tenant:CreateSubTenant"),
              std::string(to_action_string(TenantAction::CreateSubTenant)));
    ASSERT_EQ("all action", std::string("tenant:*"), std::string(to_action_string(TenantAction::All)));
}

void test_tenant_admin_check() {
    std::cout << "\n[TenantAdminCheck]\n";
    InMemoryStore store;
    seed(store);
    const std::string alice = "arn:wami:iam:1:wami:9:user/alice";
    const std::string bob   = "arn:wami:iam:1:wami:9:user/bob";

    auto acme = *store.get_tenant(TenantId("acme"));
    acme.admin_principals.push_back(alice);
    store.update_tenant(acme);

    auto eng = *store.get_tenant(TenantId("acme/eng"));
    eng.admin_principals.push_back(bob);
    store.update_tenant(eng);

    ASSERT_TRUE("admin of own tenant", check_tenant_admin(store, alice, TenantId("acme")));
    ASSERT_TRUE("admin via ancestor", check_tenant_admin(store, alice, TenantId("acme/eng/web")));
    ASSERT_TRUE("child admin below", check_tenant_admin(store, bob, TenantId("acme/eng/web")));
    ASSERT_TRUE("child admin not above", !check_tenant_admin(store, bob, TenantId("acme")));
    ASSERT_TRUE("child admin not sibling", !check_tenant_admin(store, bob, TenantId("acme/sales")));
    ASSERT_TRUE("other root", !check_tenant_admin(store, alice, TenantId("globex")));
}

// ── Main ──────────────────────────────────────────────────────────────────────

int main() {
    std::cout << "=== Tenant Tests ===\n";

    test_tenant_id();
    test_tenant_names();
    test_build_defaults();
    test_quota_validation();
    test_effective_quotas();
    test_hierarchy_queries();
    test_store_errors();
    test_tenant_authorizer();
    test_tenant_admin_check();

    std::cout << "\n--- Results: "
              << passed << " passed, " << failed << " failed ---\n";
    return failed == 0 ? 0 : 1;
}
