// graph/scc.h - Strongly connected components (Tarjan) and condensation
// Part of the architectural statement engine (C++20)
//
// ALGORITHM: Iterative Tarjan's algorithm.
// Complexity: O(V + E)
// Determinism: nodes visited in node_id (= key) order.  Component
// numbering follows reverse topological order of the condensation (SCCs
// numbered as they are completed).
//
// Iterative, with an explicit frame stack, so deep dependency chains
// cannot overflow the call stack.
//
// The result also carries, per component, its sorted member keys and the
// number of edges crossing its boundary, plus the condensation DAG
// (one node per SCC) built by coarsen().

#ifndef ARCHGOV_GRAPH_SCC_H
#define ARCHGOV_GRAPH_SCC_H

#include "coarsen.h"
#include "graph_concepts.h"
#include "runtime_graph.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace archgov::graph {

/// One strongly connected component.
///
/// - members:        node ids, ascending
/// - keys:           member keys, ascending
/// - external_edges: de-duplicated edges with exactly one end inside
///                   (both directions counted)
/// - self_loop:      a member depends on itself
struct scc_component {
    std::vector<node_id> members;
    std::vector<std::string> keys;
    std::size_t external_edges = 0;
    bool self_loop = false;

    [[nodiscard]] std::size_t size() const noexcept { return members.size(); }

    /// A component is a dependency cycle when it has more than one member
    /// or a member depends on itself.
    [[nodiscard]] bool is_cyclic() const noexcept {
        return members.size() > 1 || self_loop;
    }
};

/// Result of strongly connected components analysis.
///
/// - component_of[n]: component id for node n (0-based)
/// - components[c]:   description of component c
/// - condensed:       DAG over component ids (cross-component edges,
///                    weight = number of collapsed edges)
///
/// Component ids are assigned in reverse topological order of the
/// condensation DAG (i.e., source SCCs get higher ids).
struct scc_result {
    std::vector<std::uint32_t> component_of;
    std::vector<scc_component> components;
    coarsen_result condensed;

    [[nodiscard]] std::size_t component_count() const noexcept { return components.size(); }

    [[nodiscard]] bool same_component(node_id a, node_id b) const {
        return component_of.at(to_index(a)) == component_of.at(to_index(b));
    }

    /// Components that form dependency cycles, in component id order.
    [[nodiscard]] std::vector<scc_component> cyclic_components() const {
        std::vector<scc_component> out;
        for (auto const& c : components) {
            if (c.is_cyclic()) out.push_back(c);
        }
        return out;
    }
};

/// Component assignment only (no condensation, no keys).
struct scc_assignment {
    std::vector<std::uint32_t> component_of;
    std::size_t component_count = 0;
};

/// Iterative Tarjan over any graph_queryable.
///
/// Example:
/// ```cpp
/// // Cycle: a->b->c->a all in one SCC
/// auto a = tarjan_scc(g);
/// // a.component_count == 1
/// ```
template<graph_queryable G>
[[nodiscard]] scc_assignment tarjan_scc(G const& g) {
    scc_assignment result;
    auto const V = g.node_count();
    result.component_of.assign(V, 0);
    if (V == 0) return result;

    constexpr std::uint32_t UNVISITED = ~std::uint32_t{0};

    std::vector<std::uint32_t> index_of(V, UNVISITED);   // discovery index
    std::vector<std::uint32_t> lowlink(V, 0);             // lowest reachable index
    std::vector<char> on_stack(V, 0);                     // currently on Tarjan stack

    // Tarjan's stack (nodes awaiting SCC assignment).
    std::vector<std::uint32_t> tarjan_stack;

    // DFS call stack frame.
    struct frame {
        std::uint32_t node;
        std::size_t neighbor_idx;   // which neighbor we're processing next
    };
    std::vector<frame> call_stack;

    std::uint32_t next_index = 0;

    auto discover = [&](std::uint32_t w) {
        index_of[w] = next_index;
        lowlink[w] = next_index;
        ++next_index;
        on_stack[w] = 1;
        tarjan_stack.push_back(w);
        call_stack.push_back(frame{w, 0});
    };

    // Process each unvisited node (deterministic: ascending node_id order).
    for (std::size_t start = 0; start < V; ++start) {
        if (index_of[start] != UNVISITED) continue;
        discover(static_cast<std::uint32_t>(start));

        while (!call_stack.empty()) {
            auto& top = call_stack.back();
            auto const range = g.out_neighbors(node_id{top.node});
            auto const count = static_cast<std::size_t>(range.end() - range.begin());

            if (top.neighbor_idx < count) {
                auto const w = range.begin()[top.neighbor_idx].value;
                top.neighbor_idx++;

                if (index_of[w] == UNVISITED) {
                    // Tree edge: "recurse" into w.  `top` is invalidated.
                    discover(w);
                } else if (on_stack[w]) {
                    // Back edge: update lowlink.
                    if (index_of[w] < lowlink[top.node]) lowlink[top.node] = index_of[w];
                }
            } else {
                // All neighbors processed. Check if this is an SCC root.
                auto const u = top.node;
                call_stack.pop_back();

                if (lowlink[u] == index_of[u]) {
                    auto const comp_id = static_cast<std::uint32_t>(result.component_count);
                    while (true) {
                        auto const w = tarjan_stack.back();
                        tarjan_stack.pop_back();
                        on_stack[w] = 0;
                        result.component_of[w] = comp_id;
                        if (w == u) break;
                    }
                    result.component_count++;
                }

                // Update parent's lowlink.
                if (!call_stack.empty()) {
                    auto const parent = call_stack.back().node;
                    if (lowlink[u] < lowlink[parent]) lowlink[parent] = lowlink[u];
                }
            }
        }
    }

    return result;
}

/// Strongly connected components with per-component details and the
/// condensation DAG.
///
/// Example:
/// ```cpp
/// auto r = strongly_connected_components(g);
/// for (auto const& c : r.cyclic_components()) report_cycle(c.keys);
/// ```
[[nodiscard]] inline scc_result
strongly_connected_components(runtime_graph const& g) {
    auto const assignment = tarjan_scc(g);
    auto const V = g.node_count();

    scc_result result;
    result.component_of = assignment.component_of;
    result.components.resize(assignment.component_count);

    for (std::size_t u = 0; u < V; ++u) {
        auto const uid = node_id{static_cast<std::uint32_t>(u)};
        auto& comp = result.components[result.component_of[u]];
        comp.members.push_back(uid);      // ascending: u increases
        comp.keys.push_back(g.key(uid));  // keys ascend with ids
        for (auto v : g.out_neighbors(uid)) {
            if (v == uid) {
                comp.self_loop = true;
            } else if (result.component_of[to_index(v)] != result.component_of[u]) {
                comp.external_edges++;
                result.components[result.component_of[to_index(v)]].external_edges++;
            }
        }
    }

    result.condensed = coarsen(g, result.component_of, assignment.component_count);
    return result;
}

} // namespace archgov::graph

#endif // ARCHGOV_GRAPH_SCC_H
