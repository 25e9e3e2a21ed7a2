// graph/cycles.h - Bounded enumeration of elementary dependency cycles
// Part of the architectural statement engine (C++20)
//
// ALGORITHM:
// 1. Tarjan SCC; only components with two or more members can hold an
//    elementary cycle through distinct nodes.
// 2. For each start node s (ascending id), depth-first search inside s's
//    component, extending the path only with nodes w > s that are not
//    already on it.  An edge back to s closes a cycle.  Requiring every
//    other node to be greater than s reports each cycle once, rotated so
//    that its smallest node comes first.
// 3. Paths stop growing at max_length nodes; the search stops once
//    max_cycles cycles have been found and another one turns up.
// 4. Cycles are stable-sorted by length.
//
// COMPLEXITY: exponential in the worst case, bounded by the two caps.
//
// Self-edges are not reported here; scc_component::self_loop flags them.
//
// Iterative, with an explicit frame stack like tarjan_scc().

#ifndef ARCHGOV_GRAPH_CYCLES_H
#define ARCHGOV_GRAPH_CYCLES_H

#include "graph_concepts.h"
#include "runtime_graph.h"
#include "scc.h"

#include <archgov/core/limits.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace archgov::graph {

struct cycle_options {
    std::size_t max_cycles = limits::cycle_max_count;
    std::size_t max_length = limits::cycle_max_length;
};

/// Result of enumerate_cycles().
///
/// - cycles:    node ids in path order, smallest id first; shortest
///              cycles first
/// - truncated: more cycles exist than max_cycles allowed
struct cycle_result {
    std::vector<std::vector<node_id>> cycles;
    bool truncated = false;
};

/// Enumerate elementary cycles of at least two nodes.
///
/// Example:
/// ```cpp
/// // a->b, b->a, b->c, c->a
/// auto r = enumerate_cycles(g);
/// // r.cycles == {{a, b}, {a, b, c}}
/// ```
template<graph_queryable G>
[[nodiscard]] cycle_result enumerate_cycles(G const& g, cycle_options const& opts = {}) {
    cycle_result result;
    auto const V = g.node_count();
    if (V == 0) return result;

    auto const scc = tarjan_scc(g);
    std::vector<std::size_t> component_size(scc.component_count, 0);
    for (auto const c : scc.component_of) component_size[c]++;

    struct frame {
        std::uint32_t node;
        std::size_t neighbor_idx;
    };
    std::vector<frame> call_stack;
    std::vector<node_id> path;
    std::vector<char> on_path(V, 0);

    for (std::uint32_t s = 0; s < V && !result.truncated; ++s) {
        auto const comp = scc.component_of[s];
        if (component_size[comp] < 2) continue;

        path.assign(1, node_id{s});
        on_path[s] = 1;
        call_stack.push_back(frame{s, 0});

        while (!call_stack.empty()) {
            auto& top = call_stack.back();
            auto const range = g.out_neighbors(node_id{top.node});
            auto const count = static_cast<std::size_t>(range.end() - range.begin());

            if (top.neighbor_idx == count) {
                on_path[top.node] = 0;
                path.pop_back();
                call_stack.pop_back();
                continue;
            }

            auto const w = range.begin()[top.neighbor_idx].value;
            top.neighbor_idx++;

            if (w == s) {
                if (path.size() < 2) continue;   // self-edge
                if (result.cycles.size() == opts.max_cycles) {
                    result.truncated = true;
                    break;
                }
                result.cycles.push_back(path);
            } else if (w > s && !on_path[w] && scc.component_of[w] == comp
                       && path.size() < opts.max_length) {
                // `top` is invalidated.
                on_path[w] = 1;
                path.push_back(node_id{w});
                call_stack.push_back(frame{w, 0});
            }
        }

        for (auto const u : path) on_path[to_index(u)] = 0;
        path.clear();
        call_stack.clear();
    }

    std::stable_sort(result.cycles.begin(), result.cycles.end(),
                     [](auto const& a, auto const& b) { return a.size() < b.size(); });
    return result;
}

/// Keys of each enumerated cycle, in path order.
[[nodiscard]] inline std::vector<std::vector<std::string>>
cycle_keys(runtime_graph const& g, cycle_result const& r) {
    std::vector<std::vector<std::string>> out;
    out.reserve(r.cycles.size());
    for (auto const& c : r.cycles) {
        auto& keys = out.emplace_back();
        for (auto const u : c) keys.push_back(g.key(u));
    }
    return out;
}

} // namespace archgov::graph

#endif // ARCHGOV_GRAPH_CYCLES_H
