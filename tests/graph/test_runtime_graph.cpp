// tests/graph/test_runtime_graph.cpp - Tests for runtime_graph, the builder,
//                                       from_snapshot, transpose, edge filters
// Part of the architectural statement engine (C++20)

#include <archgov/graph/edge_filter.h>
#include <archgov/graph/from_snapshot.h>
#include <archgov/graph/runtime_graph.h>
#include <archgov/graph/snapshot.h>
#include <archgov/graph/transpose.h>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using namespace archgov;
using namespace archgov::graph;

// =============================================================================
// Helpers
// =============================================================================

namespace {

node_id id(runtime_graph const& g, std::string const& key) {
    auto const u = g.find(key);
    EXPECT_NE(u, invalid_node) << key;
    return u;
}

// web -> api -> db, api -> cache, worker -> db; inserted out of key order
runtime_graph make_service_graph() {
    runtime_graph_builder b;
    auto web = b.add_node("web");
    auto api = b.add_node("api");
    auto db = b.add_node("db");
    auto cache = b.add_node("cache");
    auto worker = b.add_node("worker");
    b.add_edge(web, api, "http");
    b.add_edge(api, db, "sql");
    b.add_edge(api, db, "sql");      // exact duplicate
    b.add_edge(api, db, "event");    // same pair, other type
    b.add_edge(api, cache, "tcp");
    b.add_edge(worker, db, "sql");
    return b.finalise();
}

graph_snapshot make_snapshot() {
    graph_snapshot s;
    s.components = {{"orders", "Orders", {"core"}},
                    {"billing", "Billing", {"core", "payment"}},
                    {"ledger", "Ledger", {"payment"}}};
    s.endpoints = {{"orders.place", "orders", {}},
                   {"orders.audit", "orders", {}},
                   {"billing.charge", "billing", {"api"}}};
    s.dependencies = {{"orders", "billing", "call"},
                      {"billing", "ledger", "event"},
                      {"orders.place", "billing.charge", "call"},
                      {"orders.place", "orders.audit", "call"},
                      {"orders", "ghost", "call"}};
    return s;
}

} // namespace

// =============================================================================
// Builder and canonicalisation
// =============================================================================

TEST(RuntimeGraph, EmptyGraph) {
    runtime_graph_builder b;
    auto g = b.finalise();
    EXPECT_TRUE(g.empty());
    EXPECT_EQ(g.node_count(), 0u);
    EXPECT_EQ(g.edge_count(), 0u);
    EXPECT_EQ(g.find("x"), invalid_node);
}

TEST(RuntimeGraph, NodesNumberedByKey) {
    auto g = make_service_graph();
    ASSERT_EQ(g.node_count(), 5u);
    EXPECT_EQ(g.key(node_id{0}), "api");
    EXPECT_EQ(g.key(node_id{1}), "cache");
    EXPECT_EQ(g.key(node_id{2}), "db");
    EXPECT_EQ(g.key(node_id{3}), "web");
    EXPECT_EQ(g.key(node_id{4}), "worker");
}

TEST(RuntimeGraph, AdjacencyDeduplicatedAcrossTypes) {
    auto g = make_service_graph();
    EXPECT_EQ(g.edge_count(), 4u);
    EXPECT_EQ(g.out_degree(id(g, "api")), 2u);
    EXPECT_TRUE(g.has_edge(id(g, "api"), id(g, "db")));
    EXPECT_FALSE(g.has_edge(id(g, "db"), id(g, "api")));
    // typed edges keep both dependency types of api -> db
    EXPECT_EQ(g.typed_edges().size(), 5u);
}

TEST(RuntimeGraph, SelfLoopKept) {
    runtime_graph_builder b;
    auto a = b.add_node("a");
    b.add_edge(a, a, "call");
    auto g = b.finalise();
    EXPECT_EQ(g.edge_count(), 1u);
    EXPECT_TRUE(g.has_self_loop(node_id{0}));
}

TEST(RuntimeGraph, BuilderMisuseThrows) {
    runtime_graph_builder b;
    EXPECT_THROW(b.add_edge(node_id{0}, node_id{0}), std::logic_error);
    auto a = b.add_node("a");
    EXPECT_THROW((void)b.add_node("a"), std::invalid_argument);
    EXPECT_THROW(b.add_edge(a, node_id{7}), std::out_of_range);
}

// =============================================================================
// Transforms
// =============================================================================

TEST(RuntimeGraph, TransposeReversesEdges) {
    auto g = make_service_graph();
    auto t = transpose(g);
    EXPECT_EQ(t.node_count(), g.node_count());
    EXPECT_EQ(t.edge_count(), g.edge_count());
    EXPECT_TRUE(t.has_edge(id(t, "db"), id(t, "api")));
    EXPECT_TRUE(t.has_edge(id(t, "db"), id(t, "worker")));
    EXPECT_FALSE(t.has_edge(id(t, "api"), id(t, "db")));
}

TEST(RuntimeGraph, FilterEdgeTypes) {
    auto g = make_service_graph();
    EXPECT_EQ(edge_types(g), (key_set{"event", "http", "sql", "tcp"}));

    auto sql = filter_edge_types(g, {"sql"});
    EXPECT_EQ(sql.node_count(), 5u);
    EXPECT_EQ(sql.edge_count(), 2u);
    EXPECT_TRUE(sql.has_edge(id(sql, "worker"), id(sql, "db")));
    EXPECT_FALSE(sql.has_edge(id(sql, "web"), id(sql, "api")));

    auto all = filter_edge_types(g, {});
    EXPECT_EQ(all.edge_count(), g.edge_count());
}

// =============================================================================
// from_snapshot
// =============================================================================

TEST(FromSnapshot, ComponentLevelLiftsEndpointEdges) {
    auto g = from_snapshot(make_snapshot());
    ASSERT_EQ(g.node_count(), 3u);
    EXPECT_TRUE(g.has_edge(id(g, "orders"), id(g, "billing")));
    EXPECT_TRUE(g.has_edge(id(g, "billing"), id(g, "ledger")));
    // orders.place -> orders.audit stays inside orders
    EXPECT_FALSE(g.has_self_loop(id(g, "orders")));
    EXPECT_EQ(g.edge_count(), 2u);
}

TEST(FromSnapshot, EndpointLevel) {
    auto g = from_snapshot(make_snapshot(), {granularity::endpoints, {}});
    ASSERT_EQ(g.node_count(), 3u);
    EXPECT_TRUE(g.has_edge(id(g, "orders.place"), id(g, "billing.charge")));
    EXPECT_TRUE(g.has_edge(id(g, "orders.place"), id(g, "orders.audit")));
    EXPECT_EQ(g.edge_count(), 2u);
}

TEST(FromSnapshot, EdgeTypeOption) {
    auto g = from_snapshot(make_snapshot(), {granularity::components, {"event"}});
    EXPECT_EQ(g.edge_count(), 1u);
    EXPECT_TRUE(g.has_edge(id(g, "billing"), id(g, "ledger")));
}

// =============================================================================
// validate
// =============================================================================

TEST(Snapshot, ValidateReportsDanglingDependency) {
    auto ds = validate(make_snapshot());
    ASSERT_EQ(ds.size(), 1u);
    EXPECT_EQ(ds[0].kind, error_kind::invalid_snapshot);
    EXPECT_EQ(ds[0].token, "ghost");
}

TEST(Snapshot, ValidateReportsLayerProblems) {
    graph_snapshot s;
    s.components = {{"a", "A", {}}, {"a", "A again", {}}};
    s.layers = {{"x", "X", "y", false, {}, {}},
                {"y", "Y", "x", false, {}, {}},
                {"z", "Z", "missing", false, {}, {}}};
    auto ds = validate(s);
    EXPECT_EQ(ds.size(), 4u);   // duplicate a, cycle at x and y, unknown parent of z
    EXPECT_TRUE(has_kind(ds, error_kind::invalid_snapshot));
}

TEST(Snapshot, EmptySnapshotIsValid) {
    EXPECT_TRUE(validate(graph_snapshot{}).empty());
    EXPECT_TRUE(from_snapshot(graph_snapshot{}).empty());
}
