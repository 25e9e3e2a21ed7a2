// tests/graph/test_cycles.cpp - Tests for elementary cycle enumeration
// Part of the architectural statement engine (C++20)

#include <archgov/graph/cycles.h>
#include <archgov/graph/runtime_graph.h>

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

using namespace archgov::graph;

namespace {

using key_cycles = std::vector<std::vector<std::string>>;

runtime_graph make_graph(std::vector<std::string> const& nodes,
                         std::vector<std::pair<std::string, std::string>> const& edges) {
    runtime_graph_builder b;
    for (auto const& n : nodes) (void)b.add_node(n);
    for (auto const& [u, v] : edges) b.add_edge(b.find(u), b.find(v), "call");
    return b.finalise();
}

// a <-> b, b -> c -> a
runtime_graph make_two_cycles() {
    return make_graph({"a", "b", "c"}, {{"a", "b"}, {"b", "c"}, {"c", "a"}, {"b", "a"}});
}

} // namespace

TEST(Cycles, ShortestFirstSmallestKeyFirst) {
    auto g = make_two_cycles();
    auto r = enumerate_cycles(g);
    EXPECT_FALSE(r.truncated);
    EXPECT_EQ(cycle_keys(g, r), (key_cycles{{"a", "b"}, {"a", "b", "c"}}));
}

TEST(Cycles, CountCapTruncates) {
    auto g = make_two_cycles();
    auto r = enumerate_cycles(g, {1, 10});
    EXPECT_TRUE(r.truncated);
    EXPECT_EQ(cycle_keys(g, r), (key_cycles{{"a", "b"}}));

    auto exact = enumerate_cycles(g, {2, 10});
    EXPECT_FALSE(exact.truncated);
    EXPECT_EQ(exact.cycles.size(), 2u);
}

TEST(Cycles, LengthCapSkipsLongCycles) {
    auto g = make_two_cycles();
    auto r = enumerate_cycles(g, {100, 2});
    EXPECT_FALSE(r.truncated);
    EXPECT_EQ(cycle_keys(g, r), (key_cycles{{"a", "b"}}));
}

TEST(Cycles, EachCycleReportedOnce) {
    // Two triangles sharing the edge b->c.
    auto g = make_graph({"a", "b", "c", "d"},
                        {{"a", "b"}, {"b", "c"}, {"c", "a"}, {"c", "d"}, {"d", "b"}});
    auto r = enumerate_cycles(g);
    EXPECT_EQ(cycle_keys(g, r), (key_cycles{{"a", "b", "c"}, {"b", "c", "d"}}));
}

TEST(Cycles, SeparateComponents) {
    auto g = make_graph({"a", "b", "x", "y", "z"},
                        {{"a", "b"}, {"b", "a"}, {"b", "x"}, {"x", "y"}, {"y", "z"}, {"z", "x"}});
    auto r = enumerate_cycles(g);
    EXPECT_EQ(cycle_keys(g, r), (key_cycles{{"a", "b"}, {"x", "y", "z"}}));
}

TEST(Cycles, SelfEdgesAndAcyclicGraphs) {
    auto loop = make_graph({"a", "b"}, {{"a", "a"}, {"a", "b"}});
    EXPECT_TRUE(enumerate_cycles(loop).cycles.empty());

    auto dag = make_graph({"a", "b", "c"}, {{"a", "b"}, {"b", "c"}, {"a", "c"}});
    EXPECT_TRUE(enumerate_cycles(dag).cycles.empty());

    EXPECT_TRUE(enumerate_cycles(runtime_graph{}).cycles.empty());
}

TEST(Cycles, SelfEdgeInsideCycleIgnored) {
    auto g = make_graph({"a", "b"}, {{"a", "a"}, {"a", "b"}, {"b", "a"}});
    EXPECT_EQ(cycle_keys(g, enumerate_cycles(g)), (key_cycles{{"a", "b"}}));
}
