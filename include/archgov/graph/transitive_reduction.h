// graph/transitive_reduction.h - Redundant (transitive) dependency edges
// Part of the architectural statement engine (C++20)
//
// ALGORITHM:
// Visit the distinct edges u->v in (src, dst) order.  Remove u->v; if v is
// still reachable from u, the edge is transitive and stays removed,
// otherwise it is restored.  Because removals accumulate, two edges that
// each imply the other (inside a cycle) are never both dropped, and
// reachability between every pair of nodes is preserved.
//
// Self-edges are never transitive.
//
// COMPLEXITY: O(E * (V + E))

#ifndef ARCHGOV_GRAPH_TRANSITIVE_REDUCTION_H
#define ARCHGOV_GRAPH_TRANSITIVE_REDUCTION_H

#include "graph_concepts.h"
#include "runtime_graph.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace archgov::graph {

/// Distinct edges whose removal keeps their target reachable, in
/// (src, dst) order.
///
/// Example:
/// ```cpp
/// // a->b, b->c, a->c
/// auto t = transitive_edges(g);   // {(a, c)}
/// ```
[[nodiscard]] inline std::vector<std::pair<node_id, node_id>>
transitive_edges(runtime_graph const& g) {
    std::vector<std::pair<node_id, node_id>> out;
    auto const V = g.node_count();

    // removed[u][i]: i-th out-neighbour of u has been dropped.
    std::vector<std::vector<char>> removed(V);
    for (std::size_t u = 0; u < V; ++u) {
        removed[u].assign(g.out_degree(node_id{static_cast<std::uint32_t>(u)}), 0);
    }

    std::vector<char> seen(V, 0);
    std::vector<node_id> stack;
    auto still_reachable = [&](node_id from, node_id to) {
        std::fill(seen.begin(), seen.end(), 0);
        stack.assign(1, from);
        seen[to_index(from)] = 1;
        while (!stack.empty()) {
            auto const u = stack.back();
            stack.pop_back();
            auto const range = g.out_neighbors(u);
            for (std::size_t i = 0; i < range.size(); ++i) {
                if (removed[to_index(u)][i]) continue;
                auto const w = range.begin()[i];
                if (w == to) return true;
                if (!seen[to_index(w)]) {
                    seen[to_index(w)] = 1;
                    stack.push_back(w);
                }
            }
        }
        return false;
    };

    for (std::size_t ui = 0; ui < V; ++ui) {
        auto const u = node_id{static_cast<std::uint32_t>(ui)};
        auto const range = g.out_neighbors(u);
        for (std::size_t i = 0; i < range.size(); ++i) {
            auto const v = range.begin()[i];
            if (v == u) continue;
            removed[ui][i] = 1;
            if (still_reachable(u, v)) out.emplace_back(u, v);
            else removed[ui][i] = 0;
        }
    }
    return out;
}

/// The graph without its transitive edges.  Nodes and keys are unchanged;
/// every typed edge between a transitive pair is dropped.
[[nodiscard]] inline runtime_graph transitive_reduction(runtime_graph const& g) {
    auto const drop = transitive_edges(g);

    runtime_graph_builder builder;
    for (auto const& k : g.keys()) {
        (void)builder.add_node(k);
    }
    for (auto const& e : g.typed_edges()) {
        if (!std::binary_search(drop.begin(), drop.end(), std::pair{e.src, e.dst})) {
            builder.add_edge(e.src, e.dst, e.type);
        }
    }
    return builder.finalise();
}

} // namespace archgov::graph

#endif // ARCHGOV_GRAPH_TRANSITIVE_REDUCTION_H
