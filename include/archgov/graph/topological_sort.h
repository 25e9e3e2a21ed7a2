// graph/topological_sort.h - Topological ordering and layer checks
// Part of the architectural statement engine (C++20)
//
// ALGORITHM: Kahn's algorithm (BFS-based).
// Complexity: O(V log V + E)
// Determinism: when multiple nodes have in-degree 0, the smallest node_id
// (= smallest key) is chosen first.  This gives a unique, reproducible
// topological order.
//
// On a cyclic graph the order holds every node Kahn could emit, and
// cycle_edges lists the edges that lie on a cycle: both ends in the same
// non-trivial strongly connected component, or a self-edge.
//
// Also here:
// - layer_violations(): edges that run against a caller-supplied rank map
// - infer_layer_ranks(): longest-path ranks over the SCC condensation

#ifndef ARCHGOV_GRAPH_TOPOLOGICAL_SORT_H
#define ARCHGOV_GRAPH_TOPOLOGICAL_SORT_H

#include "edge_filter.h"
#include "graph_concepts.h"
#include "runtime_graph.h"
#include "scc.h"

#include <archgov/core/key_set.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <queue>
#include <string>
#include <utility>
#include <vector>

namespace archgov::graph {

/// Result of topological sort.
///
/// - order: nodes with every edge pointing forward (sources first)
/// - is_dag: false if a cycle (or self-edge) exists; order is then partial
/// - cycle_edges: edges on some cycle, sorted by (src, dst)
struct topo_result {
    std::vector<node_id> order;
    bool is_dag = true;
    std::vector<std::pair<node_id, node_id>> cycle_edges;
};

/// Topological sort via Kahn's algorithm.
///
/// Example:
/// ```cpp
/// auto g = make_diamond();  // a->b, a->c, b->d, c->d
/// auto r = topological_sort(g);
/// // r.is_dag, r.order == {a, b, c, d}
/// ```
[[nodiscard]] inline topo_result topological_sort(runtime_graph const& g) {
    topo_result result;
    auto const V = g.node_count();
    if (V == 0) return result;

    // Step 1: Compute in-degrees (a self-edge counts against its own node).
    std::vector<std::size_t> in_degree(V, 0);
    for (std::size_t u = 0; u < V; ++u) {
        for (auto v : g.out_neighbors(node_id{static_cast<std::uint32_t>(u)})) {
            in_degree[to_index(v)]++;
        }
    }

    // Step 2: Min-heap of ready nodes.
    std::priority_queue<node_id, std::vector<node_id>, std::greater<>> ready;
    for (std::size_t u = 0; u < V; ++u) {
        if (in_degree[u] == 0) ready.push(node_id{static_cast<std::uint32_t>(u)});
    }

    // Step 3: Kahn's iteration.
    while (!ready.empty()) {
        auto const chosen = ready.top();
        ready.pop();
        result.order.push_back(chosen);
        for (auto v : g.out_neighbors(chosen)) {
            if (--in_degree[to_index(v)] == 0) ready.push(v);
        }
    }

    if (result.order.size() == V) return result;

    // Cycle: report the edges inside cyclic SCCs.
    result.is_dag = false;
    auto const scc = tarjan_scc(g);
    for (std::size_t u = 0; u < V; ++u) {
        auto const uid = node_id{static_cast<std::uint32_t>(u)};
        for (auto v : g.out_neighbors(uid)) {
            if (v == uid || scc.component_of[u] == scc.component_of[to_index(v)]) {
                result.cycle_edges.emplace_back(uid, v);
            }
        }
    }
    return result;
}

/// Topological sort over the edges of the given dependency types only.
[[nodiscard]] inline topo_result
topological_sort(runtime_graph const& g, key_set const& edge_types) {
    return topological_sort(filter_edge_types(g, edge_types));
}

// =============================================================================
// Layer violations
// =============================================================================

enum class violation_severity {
    info,       ///< edge between two nodes of the same rank
    critical,   ///< edge from a higher rank to a lower rank
};

struct layer_violation {
    node_id source;
    node_id target;
    int source_rank = 0;
    int target_rank = 0;
    violation_severity severity = violation_severity::critical;
};

/// Check every edge against a rank map (key -> rank).
///
/// Dependencies may point from a lower rank to an equal or higher rank.
/// An edge from a higher rank to a lower rank is critical; an edge between
/// two distinct nodes of equal rank is reported as info.  Nodes missing
/// from the map are skipped, as are self-edges.  Output is in (src, dst)
/// order.
[[nodiscard]] inline std::vector<layer_violation>
layer_violations(runtime_graph const& g, std::map<std::string, int> const& rank) {
    std::vector<layer_violation> out;
    auto const V = g.node_count();
    for (std::size_t u = 0; u < V; ++u) {
        auto const uid = node_id{static_cast<std::uint32_t>(u)};
        auto const ru = rank.find(g.key(uid));
        if (ru == rank.end()) continue;
        for (auto v : g.out_neighbors(uid)) {
            if (v == uid) continue;
            auto const rv = rank.find(g.key(v));
            if (rv == rank.end()) continue;
            if (ru->second > rv->second) {
                out.push_back({uid, v, ru->second, rv->second, violation_severity::critical});
            } else if (ru->second == rv->second) {
                out.push_back({uid, v, ru->second, rv->second, violation_severity::info});
            }
        }
    }
    return out;
}

/// Longest-path ranks: nodes nothing depends on get rank 0, and every
/// edge u->v between different SCCs gets rank(v) > rank(u).  Members of
/// one SCC share a rank, so the result is defined for cyclic graphs too.
///
/// The returned map can be fed back into layer_violations(); it then
/// reports only same-rank (intra-SCC) edges.
[[nodiscard]] inline std::map<std::string, int>
infer_layer_ranks(runtime_graph const& g) {
    std::map<std::string, int> out;
    auto const V = g.node_count();
    if (V == 0) return out;

    auto const scc = strongly_connected_components(g);
    auto const C = scc.component_count();
    auto const succ = scc.condensed.successors();

    // Tarjan numbers components in reverse topological order: walk
    // from the highest id (sources) down.
    std::vector<int> comp_rank(C, 0);
    for (std::size_t c = C; c-- > 0;) {
        for (auto d : succ[c]) {
            if (comp_rank[d] < comp_rank[c] + 1) comp_rank[d] = comp_rank[c] + 1;
        }
    }
    for (std::size_t u = 0; u < V; ++u) {
        auto const uid = node_id{static_cast<std::uint32_t>(u)};
        out.emplace(g.key(uid), comp_rank[scc.component_of[u]]);
    }
    return out;
}

} // namespace archgov::graph

#endif // ARCHGOV_GRAPH_TOPOLOGICAL_SORT_H
