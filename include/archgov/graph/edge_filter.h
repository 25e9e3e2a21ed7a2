// graph/edge_filter.h - Edge-type filtered view of a graph
// Part of the architectural statement engine (C++20)
//
// ALGORITHM:
// Given a graph G and a set T of dependency types, produce G' with the
// same nodes (identity-mapped ids and keys) and only those typed edges
// whose type is in T.  An empty T keeps every edge, so "no filter" and
// "filter by nothing" are the same call.
//
// COMPLEXITY: O(V + E log E)
//
// Every algorithm that accepts an edge-type filter runs on the filtered
// graph; none of them inspects types itself.

#ifndef ARCHGOV_GRAPH_EDGE_FILTER_H
#define ARCHGOV_GRAPH_EDGE_FILTER_H

#include "runtime_graph.h"

#include <archgov/core/key_set.h>

namespace archgov::graph {

/// Keep only edges whose type is in `types`.  Empty `types` keeps all.
///
/// Example:
/// ```cpp
/// auto calls_only = filter_edge_types(g, {"call"});
/// auto topo = topological_sort(calls_only);
/// ```
[[nodiscard]] inline runtime_graph
filter_edge_types(runtime_graph const& g, key_set const& types) {
    if (types.empty()) return g;

    runtime_graph_builder builder;
    for (auto const& k : g.keys()) {
        (void)builder.add_node(k);
    }
    for (auto const& e : g.typed_edges()) {
        if (types.count(e.type) != 0) {
            builder.add_edge(e.src, e.dst, e.type);
        }
    }
    return builder.finalise();
}

/// Distinct dependency types present in the graph.
[[nodiscard]] inline key_set edge_types(runtime_graph const& g) {
    key_set out;
    for (auto const& e : g.typed_edges()) out.insert(e.type);
    return out;
}

} // namespace archgov::graph

#endif // ARCHGOV_GRAPH_EDGE_FILTER_H
