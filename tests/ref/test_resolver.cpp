// tests/ref/test_resolver.cpp - Tests for tag_store, layer_index, context,
//                                resolve() and resolution_scope
// Part of the architectural statement engine (C++20)

#include <archgov/graph/snapshot.h>
#include <archgov/ref/context.h>
#include <archgov/ref/layer_index.h>
#include <archgov/ref/reference.h>
#include <archgov/ref/resolver.h>
#include <archgov/ref/tag_store.h>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace archgov;
using namespace archgov::ref;

// =============================================================================
// Fixture
// =============================================================================

namespace {

// Components X{payment, api}, Y{payment}, Z{api}, W{legacy}.
// Layers: domain{X} with children pay{X, Y} and search{Z}; ops{W, X.pay}.
graph::graph_snapshot make_snapshot() {
    graph::graph_snapshot s;
    s.components = {{"X", "X", {"payment", "api"}},
                    {"Y", "Y", {"payment"}},
                    {"Z", "Z", {"api"}},
                    {"W", "W", {"legacy"}}};
    s.endpoints = {{"X.pay", "X", {"api"}}, {"Y.get", "Y", {}}};
    s.dependencies = {{"X", "Y", "call"}, {"Y", "Z", "call"}};
    s.layers = {{"domain", "Domain", "", false, {"X"}, {}},
                {"pay", "Payments", "domain", false, {"X", "Y"}, {}},
                {"search", "Search", "domain", false, {"Z"}, {}},
                {"ops", "Operations", "", true, {"W", "X.pay"}, {"infra"}}};
    return s;
}

context make_context(std::vector<reference_definition> refs = {}) {
    return context(make_snapshot(), std::move(refs));
}

} // namespace

// =============================================================================
// tag_store / layer_index
// =============================================================================

TEST(TagStore, TagsOfEntities) {
    tag_store store(make_snapshot());
    EXPECT_EQ(store.tags_of("X"), (key_set{"api", "payment"}));
    EXPECT_EQ(store.tags_of("ops"), (key_set{"infra"}));
    EXPECT_TRUE(store.tags_of("missing").empty());
    EXPECT_TRUE(store.has_tag("X.pay", "api"));
    EXPECT_EQ(store.entities_with("api"), (key_set{"X", "X.pay", "Z"}));
    EXPECT_EQ(store.tag_counts().at("payment"), 2u);
}

TEST(TagStore, AddMerges) {
    tag_store store;
    store.add("a", {"x"});
    store.add("a", {"y"});
    EXPECT_EQ(store.tags_of("a"), (key_set{"x", "y"}));
    EXPECT_EQ(store.size(), 1u);
}

TEST(LayerIndex, GroupsAndDescendants) {
    layer_index idx(make_snapshot().layers);
    EXPECT_EQ(idx.groups_of("domain"), (std::vector<std::string>{"pay", "search"}));
    EXPECT_TRUE(idx.groups_of("pay").empty());
    EXPECT_EQ(idx.descendants_of("domain"), (key_set{"pay", "search"}));
    EXPECT_EQ(idx.members_of("domain", false), (key_set{"X"}));
    EXPECT_EQ(idx.members_of("domain", true), (key_set{"X", "Y", "Z"}));
    EXPECT_TRUE(idx.members_of("nope", true).empty());
    EXPECT_EQ(idx.layers_of("X"), (key_set{"domain", "pay"}));
    EXPECT_EQ(idx.keys().size(), 4u);
}

TEST(LayerIndex, ParentCycleTerminates) {
    std::vector<graph::layer> layers{{"a", "A", "b", false, {"1"}, {}},
                                     {"b", "B", "a", false, {"2"}, {}}};
    layer_index idx(layers);
    EXPECT_EQ(idx.descendants_of("a"), (key_set{"b"}));
    EXPECT_EQ(idx.members_of("a", true), (key_set{"1", "2"}));
}

// =============================================================================
// resolve()
// =============================================================================

TEST(Resolve, TagExpressionConjunction) {
    auto ctx = make_context();
    auto r = resolve(tag_reference("R1", "'payment' AND 'api'"), ctx);
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(r.members, (key_set{"X"}));
}

TEST(Resolve, NotIsComplementWithinScope) {
    auto ctx = make_context();
    EXPECT_EQ(resolve(tag_reference("r", "NOT 'payment'"), ctx).members, (key_set{"W", "Z"}));
    EXPECT_EQ(resolve(tag_reference("r", "NOT 'api'", entity_scope::endpoints), ctx).members,
              (key_set{"Y.get"}));
}

TEST(Resolve, MalformedExpressionIsEmptyWithDiagnostic) {
    auto ctx = make_context();
    auto r = resolve(tag_reference("bad", "'a' AND ("), ctx);
    EXPECT_TRUE(r.members.empty());
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].kind, error_kind::syntax);
    EXPECT_EQ(r.errors[0].position, 9u);
}

TEST(Resolve, LayerWithAndWithoutDescendants) {
    auto ctx = make_context();
    EXPECT_EQ(resolve(layer_reference("d", "domain"), ctx).members, (key_set{"X"}));
    EXPECT_EQ(resolve(layer_reference("d", "domain", true), ctx).members,
              (key_set{"X", "Y", "Z"}));
}

TEST(Resolve, LayerRestrictedToScope) {
    auto ctx = make_context();
    EXPECT_EQ(resolve(layer_reference("o", "ops"), ctx).members, (key_set{"W"}));
    EXPECT_EQ(resolve(layer_reference("o", "ops", false, entity_scope::endpoints), ctx).members,
              (key_set{"X.pay"}));
}

TEST(Resolve, UnknownLayer) {
    auto ctx = make_context();
    auto r = resolve(layer_reference("ghost", "nowhere"), ctx);
    EXPECT_TRUE(r.members.empty());
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].kind, error_kind::unknown_layer);
    EXPECT_EQ(r.errors[0].token, "nowhere");
}

TEST(Resolve, ExplicitListDropsStaleKeys) {
    auto ctx = make_context();
    auto r = resolve(list_reference("l", {"X", "gone", "W", "X"}), ctx);
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(r.members, (key_set{"W", "X"}));
}

TEST(Resolve, ByNameAndUnknownName) {
    auto ctx = make_context({tag_reference("R1", "'payment' AND 'api'")});
    EXPECT_EQ(resolve("R1", ctx).members, (key_set{"X"}));

    auto r = resolve("nope", ctx);
    EXPECT_TRUE(r.members.empty());
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].kind, error_kind::unresolved_reference);
}

TEST(Resolve, RepeatedCallsAgree) {
    auto ctx = make_context();
    auto def = tag_reference("p", "payment OR legacy");
    auto first = resolve(def, ctx);
    auto second = resolve(def, ctx);
    EXPECT_EQ(first.members, second.members);
    EXPECT_EQ(first.members, (key_set{"W", "X", "Y"}));
}

TEST(Resolve, NewSnapshotChangesResult) {
    auto def = tag_reference("p", "'payment'");
    auto before = resolve(def, make_context());

    auto s = make_snapshot();
    s.components.push_back({"V", "V", {"payment"}});
    auto after = resolve(def, context(s, {}));

    EXPECT_EQ(before.members, (key_set{"X", "Y"}));
    EXPECT_EQ(after.members, (key_set{"V", "X", "Y"}));
}

TEST(Resolve, EmptySnapshot) {
    context ctx;
    EXPECT_TRUE(resolve(tag_reference("any", "NOT 'x'"), ctx).members.empty());
    EXPECT_TRUE(ctx.entities(entity_scope::components).empty());
}

// =============================================================================
// context
// =============================================================================

TEST(Context, DuplicateReferenceNameKeepsFirst) {
    auto ctx = make_context({list_reference("dup", {"X"}), list_reference("dup", {"Y"})});
    ASSERT_EQ(ctx.definition_errors().size(), 1u);
    EXPECT_EQ(ctx.definition_errors()[0].token, "dup");
    EXPECT_EQ(ctx.references().size(), 1u);
    EXPECT_EQ(resolve("dup", ctx).members, (key_set{"X"}));
}

TEST(Context, MalformedTagExpressionReported) {
    auto ctx = make_context({tag_reference("bad", "'a' AND ("), tag_reference("ok", "'api'"),
                             tag_reference("bad", "'b'")});
    ASSERT_EQ(ctx.definition_errors().size(), 2u);
    EXPECT_EQ(ctx.definition_errors()[0].kind, error_kind::syntax);
    EXPECT_EQ(ctx.definition_errors()[0].message, "reference 'bad': unexpected end of expression");
    EXPECT_EQ(ctx.definition_errors()[0].position, 9u);
    EXPECT_EQ(ctx.definition_errors()[1].kind, error_kind::invalid_snapshot);

    ASSERT_NE(ctx.definition_error("bad"), nullptr);
    EXPECT_EQ(ctx.definition_error("bad")->position, 9u);
    EXPECT_EQ(ctx.definition_error("ok"), nullptr);
    EXPECT_EQ(ctx.definition_error("missing"), nullptr);
    EXPECT_EQ(ctx.references().size(), 2u);
}

TEST(Context, GraphsPerScope) {
    auto ctx = make_context({list_reference("a", {}), list_reference("b", {})});
    EXPECT_EQ(ctx.reference_names(), (key_set{"a", "b"}));
    EXPECT_EQ(ctx.dependency_graph(entity_scope::components).node_count(), 4u);
    EXPECT_EQ(ctx.dependency_graph(entity_scope::components).edge_count(), 2u);
    EXPECT_EQ(ctx.dependency_graph(entity_scope::endpoints).node_count(), 2u);
    EXPECT_EQ(ctx.entities(entity_scope::endpoints), (key_set{"X.pay", "Y.get"}));
}

// =============================================================================
// resolution_scope
// =============================================================================

TEST(ResolutionScope, MemoisesByName) {
    auto ctx = make_context({tag_reference("R1", "'payment'"), list_reference("L", {"W"})});
    resolution_scope scope(ctx);

    EXPECT_EQ(scope.get("R1").members, (key_set{"X", "Y"}));
    EXPECT_EQ(scope.get("R1").members, (key_set{"X", "Y"}));
    EXPECT_EQ(scope.get("L").size(), 1u);
    EXPECT_FALSE(scope.get("missing").ok());

    auto const& st = scope.stats();
    EXPECT_EQ(st.memo_hits, 1u);
    EXPECT_EQ(st.memo_misses, 3u);
    EXPECT_EQ(st.resolutions, 3u);
    EXPECT_EQ(st.max_resolution_size, 2u);
    EXPECT_DOUBLE_EQ(st.cache_hit_rate(), 0.25);
}

TEST(ResolutionScope, StatsAggregate) {
    eval_stats a;
    a.memo_hits = 2;
    a.max_resolution_size = 5;
    eval_stats b;
    b.memo_hits = 1;
    b.max_resolution_size = 3;
    auto c = a + b;
    EXPECT_EQ(c.memo_hits, 3u);
    EXPECT_EQ(c.max_resolution_size, 5u);
    a += b;
    EXPECT_EQ(a, c);
}
