// tests/graph/test_metrics.cpp - Tests for coupling and centrality metrics
// Part of the architectural statement engine (C++20)

#include <archgov/graph/metrics.h>
#include <archgov/graph/runtime_graph.h>

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>
#include <utility>
#include <vector>

using namespace archgov::graph;

namespace {

runtime_graph make_graph(std::vector<std::string> const& nodes,
                         std::vector<std::pair<std::string, std::string>> const& edges) {
    runtime_graph_builder b;
    for (auto const& n : nodes) (void)b.add_node(n);
    for (auto const& [u, v] : edges) b.add_edge(b.find(u), b.find(v), "call");
    return b.finalise();
}

// api, billing, search and web all depend on core
runtime_graph make_hub() {
    return make_graph({"api", "billing", "core", "search", "web"},
                      {{"api", "core"}, {"billing", "core"}, {"search", "core"},
                       {"web", "core"}});
}

} // namespace

TEST(Metrics, FanInFanOutAndInstability) {
    auto t = compute_metrics(make_hub());
    ASSERT_EQ(t.nodes.size(), 5u);

    auto const* core = t.find("core");
    ASSERT_NE(core, nullptr);
    EXPECT_EQ(core->fan_in, 4u);
    EXPECT_EQ(core->fan_out, 0u);
    EXPECT_DOUBLE_EQ(core->instability, 0.0);
    EXPECT_DOUBLE_EQ(core->coupling, 2.4);
    EXPECT_DOUBLE_EQ(core->degree_centrality, 0.5);

    auto const* web = t.find("web");
    ASSERT_NE(web, nullptr);
    EXPECT_EQ(web->fan_out, 1u);
    EXPECT_DOUBLE_EQ(web->instability, 1.0);
    EXPECT_DOUBLE_EQ(web->coupling, 0.4);
    EXPECT_EQ(web->dependency_types, 1u);

    EXPECT_EQ(t.find("nope"), nullptr);
}

TEST(Metrics, SelfEdgeNotCounted) {
    auto t = compute_metrics(make_graph({"a"}, {{"a", "a"}}));
    EXPECT_EQ(t.nodes[0].fan_in, 0u);
    EXPECT_EQ(t.nodes[0].fan_out, 0u);
    EXPECT_DOUBLE_EQ(t.nodes[0].instability, 0.0);
}

TEST(Metrics, DependencyTypesCountDistinct) {
    runtime_graph_builder b;
    auto a = b.add_node("a");
    auto c = b.add_node("c");
    auto d = b.add_node("d");
    b.add_edge(a, c, "call");
    b.add_edge(a, c, "event");
    b.add_edge(a, d, "call");
    auto t = compute_metrics(b.finalise());
    EXPECT_EQ(t.find("a")->dependency_types, 2u);
    EXPECT_EQ(t.find("c")->dependency_types, 0u);
}

TEST(Metrics, ChainBetweennessAndCloseness) {
    auto g = make_graph({"a", "b", "c"}, {{"a", "b"}, {"b", "c"}});
    auto between = betweenness_centrality(g);
    EXPECT_DOUBLE_EQ(between[0], 0.0);
    EXPECT_DOUBLE_EQ(between[1], 0.5);
    EXPECT_DOUBLE_EQ(between[2], 0.0);

    auto close = closeness_centrality(g);
    EXPECT_NEAR(close[0], 2.0 / 3.0, 1e-12);
    EXPECT_NEAR(close[1], 0.5, 1e-12);
    EXPECT_DOUBLE_EQ(close[2], 0.0);
}

TEST(Metrics, BetweennessZeroForTinyGraphs) {
    auto between = betweenness_centrality(make_graph({"a", "b"}, {{"a", "b"}}));
    EXPECT_EQ(between, (std::vector<double>{0.0, 0.0}));
}

TEST(Metrics, EigenvectorOnCycleIsUniform) {
    auto r = eigenvector_centrality(make_graph({"a", "b", "c"},
                                               {{"a", "b"}, {"b", "c"}, {"c", "a"}}));
    EXPECT_TRUE(r.converged);
    EXPECT_EQ(r.iterations, 2u);
    for (double v : r.values) EXPECT_NEAR(v, 1.0 / std::sqrt(3.0), 1e-12);
}

TEST(Metrics, EigenvectorIterationCapReported) {
    centrality_options opts;
    opts.max_iterations = 1;
    auto t = compute_metrics(make_graph({"a", "b", "c"}, {{"a", "b"}, {"b", "c"}, {"c", "a"}}),
                             opts);
    EXPECT_FALSE(t.eigenvector_converged);
    EXPECT_EQ(t.eigenvector_iterations, 1u);
    EXPECT_NEAR(t.nodes[0].eigenvector, 1.0 / std::sqrt(3.0), 1e-12);
}

TEST(Metrics, HubScoresHighestEigenvector) {
    auto t = compute_metrics(make_hub());
    auto const hub = t.find("core")->eigenvector;
    for (auto const& m : t.nodes) {
        if (m.key != "core") EXPECT_LT(m.eigenvector, hub);
    }
}

TEST(Metrics, HighCoupling) {
    auto t = compute_metrics(make_hub());
    auto top = high_coupling(t);
    ASSERT_EQ(top.size(), 1u);
    EXPECT_EQ(top[0].key, "core");

    EXPECT_EQ(high_coupling(t, 0.0).size(), 5u);
    EXPECT_TRUE(high_coupling(metrics_table{}).empty());
}

TEST(Metrics, HighCouplingClampsPercentile) {
    auto t = compute_metrics(make_hub());
    EXPECT_EQ(high_coupling(t, -0.5).size(), 5u);
    EXPECT_EQ(high_coupling(t, std::nan("")).size(), 5u);
    EXPECT_EQ(high_coupling(t, -std::numeric_limits<double>::infinity()).size(), 5u);

    auto top = high_coupling(t, 2.0);
    ASSERT_EQ(top.size(), 1u);
    EXPECT_EQ(top[0].key, "core");
    EXPECT_EQ(high_coupling(t, std::numeric_limits<double>::infinity()).size(), 1u);
}

TEST(Metrics, EmptyGraph) {
    auto t = compute_metrics(runtime_graph{});
    EXPECT_TRUE(t.nodes.empty());
    EXPECT_TRUE(t.eigenvector_converged);
}
