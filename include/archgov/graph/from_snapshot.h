// graph/from_snapshot.h - Dependency graph factory for snapshots
// Part of the architectural statement engine (C++20)
//
// Builds the runtime_graph that every algorithm runs on from a
// graph_snapshot, at one of two granularities:
//
//   components - one node per component.  Component->component
//                dependencies map directly; endpoint->endpoint
//                dependencies are lifted to their owners.  A lifted edge
//                between two endpoints of the same component is internal
//                and dropped; an explicit component self-dependency stays.
//   endpoints  - one node per endpoint; only endpoint->endpoint
//                dependencies are kept.
//
// Dependencies naming unknown keys are skipped (validate() reports them).

#ifndef ARCHGOV_GRAPH_FROM_SNAPSHOT_H
#define ARCHGOV_GRAPH_FROM_SNAPSHOT_H

#include "edge_filter.h"
#include "runtime_graph.h"
#include "snapshot.h"

#include <archgov/core/key_set.h>

#include <cstddef>
#include <map>
#include <string>

namespace archgov::graph {

enum class granularity {
    components,
    endpoints,
};

/// Construction options.  edge_types empty = every dependency type.
struct graph_options {
    granularity level = granularity::components;
    key_set edge_types;
};

/// Build the dependency graph of a snapshot.
///
/// Example:
/// ```cpp
/// auto g = from_snapshot(snapshot);                      // components
/// auto calls = from_snapshot(snapshot, {granularity::components, {"call"}});
/// ```
[[nodiscard]] inline runtime_graph
from_snapshot(graph_snapshot const& s, graph_options const& opts = {}) {
    runtime_graph_builder b;

    if (opts.level == granularity::components) {
        std::map<std::string, std::string> owner_of;
        for (auto const& c : s.components) {
            if (b.find(c.key) == invalid_node) (void)b.add_node(c.key);
        }
        for (auto const& e : s.endpoints) owner_of.emplace(e.key, e.owner);

        for (auto const& d : s.dependencies) {
            auto src = b.find(d.source);
            auto dst = b.find(d.target);
            if (src == invalid_node && dst == invalid_node) {
                auto const so = owner_of.find(d.source);
                auto const to = owner_of.find(d.target);
                if (so == owner_of.end() || to == owner_of.end()) continue;
                if (so->second == to->second) continue;   // internal to one component
                src = b.find(so->second);
                dst = b.find(to->second);
            }
            if (src == invalid_node || dst == invalid_node) continue;
            b.add_edge(src, dst, d.type);
        }
    } else {
        for (auto const& e : s.endpoints) {
            if (b.find(e.key) == invalid_node) (void)b.add_node(e.key);
        }
        for (auto const& d : s.dependencies) {
            auto const src = b.find(d.source);
            auto const dst = b.find(d.target);
            if (src == invalid_node || dst == invalid_node) continue;
            b.add_edge(src, dst, d.type);
        }
    }

    auto g = b.finalise();
    if (!opts.edge_types.empty()) return filter_edge_types(g, opts.edge_types);
    return g;
}

} // namespace archgov::graph

#endif // ARCHGOV_GRAPH_FROM_SNAPSHOT_H
