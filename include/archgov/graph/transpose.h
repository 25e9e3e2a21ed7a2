// graph/transpose.h - Reverse all edge directions
// Part of the architectural statement engine (C++20)
//
// ALGORITHM:
// Given a directed graph G, produce G' where every edge (u->v) in G
// becomes (v->u) in G'.  Keys, node ids, edge types and edge count are
// preserved.  Self-edges map to themselves.
//
// COMPLEXITY: O(V + E log E)
//
// Used for upstream traversal, in-degree computation and the incoming
// half of direction::both.

#ifndef ARCHGOV_GRAPH_TRANSPOSE_H
#define ARCHGOV_GRAPH_TRANSPOSE_H

#include "graph_concepts.h"
#include "runtime_graph.h"

#include <cstddef>

namespace archgov::graph {

/// Transpose a keyed graph: reverse every typed edge.
///
/// Example:
/// ```cpp
/// // Diamond: a->b, a->c, b->d, c->d
/// auto gt = transpose(g);
/// // gt has edges: b->a, c->a, d->b, d->c
/// ```
[[nodiscard]] inline runtime_graph transpose(runtime_graph const& g) {
    runtime_graph_builder builder;
    for (auto const& k : g.keys()) {
        (void)builder.add_node(k);
    }
    // Keys are inserted in id order, so builder ids equal graph ids.
    for (auto const& e : g.typed_edges()) {
        builder.add_edge(e.dst, e.src, e.type);
    }
    return builder.finalise();
}

} // namespace archgov::graph

#endif // ARCHGOV_GRAPH_TRANSPOSE_H
