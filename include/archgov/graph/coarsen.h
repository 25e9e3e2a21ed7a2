// graph/coarsen.h - Graph coarsening via node grouping
// Part of the architectural statement engine (C++20)
//
// ALGORITHM:
// Given a graph G and a group assignment (node -> group id), produce a
// coarsened graph G' where:
// - Each group becomes a single super-node
// - Edges between groups are preserved and counted (edge multiplicity
//   becomes weight)
// - Edges within a group are collapsed into the group's internal weight
//
// COMPLEXITY: O(V + E log E)
//
// Two consumers:
// - scc: the condensation DAG is coarsen(g, component_of)
// - community: each Louvain level aggregates the weighted graph by the
//   communities found on the previous level
//
// The group assignment matches the output format of
// strongly_connected_components and detect_communities:
// group_of[node] in [0, group_count).

#ifndef ARCHGOV_GRAPH_COARSEN_H
#define ARCHGOV_GRAPH_COARSEN_H

#include "graph_concepts.h"
#include "weighted_graph.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace archgov::graph {

struct weighted_edge {
    std::uint32_t src;
    std::uint32_t dst;
    double weight;
};

/// Result of directed coarsening.
///
/// - edges: cross-group edges sorted by (src, dst), weights summed
/// - internal_weight[g]: edges with both ends in group g (self-edges too)
struct coarsen_result {
    std::size_t group_count = 0;
    std::vector<weighted_edge> edges;
    std::vector<double> internal_weight;

    /// Successor lists of the coarsened graph.
    [[nodiscard]] std::vector<std::vector<std::uint32_t>> successors() const {
        std::vector<std::vector<std::uint32_t>> out(group_count);
        for (auto const& e : edges) out[e.src].push_back(e.dst);
        return out;
    }
};

namespace detail {

inline void check_groups(std::size_t V, std::vector<std::uint32_t> const& group_of,
                         std::size_t group_count) {
    if (group_of.size() != V)
        throw std::invalid_argument("coarsen: group_of size differs from node count");
    for (auto grp : group_of) {
        if (grp >= group_count)
            throw std::out_of_range("coarsen: group_of[i] >= group_count (invalid group id)");
    }
}

} // namespace detail

/// Coarsen a directed graph by collapsing groups of nodes into super-nodes.
///
/// Example:
/// ```cpp
/// // Chain a->b->c->d, groups {a,b} and {c,d}
/// auto cr = coarsen(g, {0, 0, 1, 1}, 2);
/// // cr.edges == {0->1 weight 1}, cr.internal_weight == {1, 1}
/// ```
template<graph_queryable G>
[[nodiscard]] coarsen_result
coarsen(G const& g, std::vector<std::uint32_t> const& group_of, std::size_t group_count) {
    auto const V = g.node_count();
    detail::check_groups(V, group_of, group_count);

    coarsen_result result;
    result.group_count = group_count;
    result.internal_weight.assign(group_count, 0.0);

    std::vector<weighted_edge> raw;
    for (std::size_t u = 0; u < V; ++u) {
        auto const gu = group_of[u];
        for (auto v : g.out_neighbors(node_id{static_cast<std::uint32_t>(u)})) {
            auto const gv = group_of[to_index(v)];
            if (gu == gv) {
                result.internal_weight[gu] += 1.0;
            } else {
                raw.push_back(weighted_edge{gu, gv, 1.0});
            }
        }
    }

    std::sort(raw.begin(), raw.end(), [](auto const& a, auto const& b) {
        return a.src != b.src ? a.src < b.src : a.dst < b.dst;
    });
    for (auto const& e : raw) {
        auto& out = result.edges;
        if (!out.empty() && out.back().src == e.src && out.back().dst == e.dst) {
            out.back().weight += e.weight;
        } else {
            out.push_back(e);
        }
    }
    return result;
}

/// Aggregate an undirected weighted graph by group.
///
/// Cross-group weights are summed; weight inside a group (including the
/// members' own self weights) becomes the super-node's self weight, so
/// total_weight() is preserved.
[[nodiscard]] inline weighted_graph
coarsen(weighted_graph const& g, std::vector<std::uint32_t> const& group_of,
        std::size_t group_count) {
    auto const V = g.node_count();
    detail::check_groups(V, group_of, group_count);

    weighted_graph_builder b(group_count);
    for (std::size_t u = 0; u < V; ++u) {
        auto const gu = group_of[u];
        if (g.self_weight(u) != 0.0) b.add_edge(gu, gu, g.self_weight(u));
        for (auto const& a : g.neighbors(u)) {
            if (a.target < u) continue;   // each undirected edge once
            b.add_edge(gu, group_of[a.target], a.weight);
        }
    }
    return b.finalise();
}

} // namespace archgov::graph

#endif // ARCHGOV_GRAPH_COARSEN_H
