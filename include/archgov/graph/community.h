// graph/community.h - Louvain community detection
// Part of the architectural statement engine (C++20)
//
// ALGORITHM: Louvain modularity optimisation.
//   1. Local moving: visit nodes in a shuffled order, move each node to
//      the neighbouring community with the largest modularity gain
//        gain(C) = k_i,in(C) - resolution * tot(C) * k_i / (2m)
//      and repeat passes until no node moves.
//   2. Aggregation: coarsen the graph by community and repeat from 1 on
//      the super-node graph.
//   3. Refinement: one final local-moving sweep on the original graph,
//      starting from the aggregated assignment.
//
// The dependency graph is treated as undirected with unit weight per
// connected pair (make_undirected).  Self-edges are ignored.
//
// Determinism: the visit order comes from std::mt19937 seeded with
// community_options::seed and a Fisher-Yates shuffle written here (the
// standard's std::shuffle is not specified bit-for-bit).  Ties between
// candidate communities keep the current community, then prefer the
// lowest community id.  Community ids are renumbered by first member.
//
// Complexity: O(passes * E) per level, in practice near-linear.

#ifndef ARCHGOV_GRAPH_COMMUNITY_H
#define ARCHGOV_GRAPH_COMMUNITY_H

#include "coarsen.h"
#include "graph_concepts.h"
#include "runtime_graph.h"
#include "weighted_graph.h"

#include <archgov/core/limits.h>

#include <cstddef>
#include <cstdint>
#include <map>
#include <numeric>
#include <random>
#include <utility>
#include <vector>

namespace archgov::graph {

struct community_options {
    std::uint32_t seed = limits::community_seed;
    double resolution = limits::community_resolution;
    std::size_t max_levels = limits::community_max_levels;
    std::size_t max_passes = limits::community_max_passes;
    bool refine = true;
};

/// Result of community detection.
///
/// - community_of[n]: community id of node n, ids in [0, community_count)
///   numbered by their lowest member
/// - modularity:      Q of the final assignment on the undirected graph
/// - levels[l]:       assignment of the original nodes after aggregation
///                    level l (the merge hierarchy; coarsest last)
struct community_result {
    std::vector<std::uint32_t> community_of;
    std::size_t community_count = 0;
    double modularity = 0.0;
    std::vector<std::vector<std::uint32_t>> levels;

    /// Members of each community, node ids ascending.
    [[nodiscard]] std::vector<std::vector<node_id>> members() const {
        std::vector<std::vector<node_id>> out(community_count);
        for (std::size_t u = 0; u < community_of.size(); ++u) {
            out[community_of[u]].push_back(node_id{static_cast<std::uint32_t>(u)});
        }
        return out;
    }
};

/// Modularity of an assignment:
///   Q = sum_c [ L_c / m - resolution * (d_c / 2m)^2 ]
/// with L_c the weight inside c (self weights included) and d_c the summed
/// degree of c.  0 for a graph without edges.
[[nodiscard]] inline double modularity(weighted_graph const& g,
                                       std::vector<std::uint32_t> const& community_of,
                                       double resolution = limits::community_resolution) {
    double const m = g.total_weight();
    if (m <= 0.0) return 0.0;

    std::map<std::uint32_t, double> inside;
    std::map<std::uint32_t, double> degree;
    for (std::size_t u = 0; u < g.node_count(); ++u) {
        auto const c = community_of[u];
        degree[c] += g.degree(u);
        inside[c] += g.self_weight(u);
        for (auto const& a : g.neighbors(u)) {
            if (a.target > u && community_of[a.target] == c) inside[c] += a.weight;
        }
    }

    double q = 0.0;
    for (auto const& [c, d] : degree) {
        double const frac = d / (2.0 * m);
        q += inside[c] / m - resolution * frac * frac;
    }
    return q;
}

namespace detail {

/// Fisher-Yates over 0..n-1 driven by mt19937 output.
inline std::vector<std::size_t> shuffled_order(std::size_t n, std::mt19937& rng) {
    std::vector<std::size_t> order(n);
    std::iota(order.begin(), order.end(), std::size_t{0});
    for (std::size_t i = n; i > 1; --i) {
        auto const j = static_cast<std::size_t>(rng() % i);
        std::swap(order[i - 1], order[j]);
    }
    return order;
}

/// Renumber community ids contiguously in order of first appearance.
/// Returns the number of communities.
inline std::size_t renumber(std::vector<std::uint32_t>& community_of) {
    std::map<std::uint32_t, std::uint32_t> remap;
    for (auto& c : community_of) {
        auto const [it, inserted] =
            remap.emplace(c, static_cast<std::uint32_t>(remap.size()));
        c = it->second;
    }
    return remap.size();
}

/// Local-moving phase.  Returns true if any node changed community.
inline bool local_moving(weighted_graph const& g, std::vector<std::uint32_t>& community_of,
                         std::mt19937& rng, community_options const& opts) {
    auto const n = g.node_count();
    double const m = g.total_weight();
    if (n == 0 || m <= 0.0) return false;

    std::vector<double> degree(n);
    std::vector<double> tot(n, 0.0);
    for (std::size_t u = 0; u < n; ++u) {
        degree[u] = g.degree(u);
        tot[community_of[u]] += degree[u];
    }

    auto const order = shuffled_order(n, rng);
    bool any = false;

    for (std::size_t pass = 0; pass < opts.max_passes; ++pass) {
        bool moved = false;
        for (auto u : order) {
            auto const cu = community_of[u];
            auto const ku = degree[u];

            std::map<std::uint32_t, double> to_comm;
            to_comm[cu] += 0.0;
            for (auto const& a : g.neighbors(u)) to_comm[community_of[a.target]] += a.weight;

            tot[cu] -= ku;
            auto gain = [&](std::uint32_t c, double w) {
                return w - opts.resolution * tot[c] * ku / (2.0 * m);
            };

            auto best = cu;
            double best_gain = gain(cu, to_comm[cu]);
            for (auto const& [c, w] : to_comm) {
                if (c == cu) continue;
                double const gc = gain(c, w);
                if (gc > best_gain + limits::community_min_gain) {
                    best = c;
                    best_gain = gc;
                }
            }

            tot[best] += ku;
            if (best != cu) {
                community_of[u] = best;
                moved = true;
                any = true;
            }
        }
        if (!moved) break;
    }
    return any;
}

} // namespace detail

/// Detect communities in a dependency graph.
///
/// Same graph and options give identical output.  An empty graph gives no
/// communities; a graph without edges gives one community per node.
///
/// Example:
/// ```cpp
/// auto r = detect_communities(g);          // seed 42
/// for (auto const& c : r.members()) report_cluster(c);
/// ```
[[nodiscard]] inline community_result
detect_communities(runtime_graph const& g, community_options const& opts = {}) {
    community_result result;
    auto const V = g.node_count();
    if (V == 0) return result;

    std::mt19937 rng(opts.seed);
    auto const base = make_undirected(g);

    std::vector<std::uint32_t> node_comm(V);
    std::iota(node_comm.begin(), node_comm.end(), std::uint32_t{0});

    auto level_graph = base;
    for (std::size_t level = 0; level < opts.max_levels; ++level) {
        std::vector<std::uint32_t> comm(level_graph.node_count());
        std::iota(comm.begin(), comm.end(), std::uint32_t{0});

        bool const moved = detail::local_moving(level_graph, comm, rng, opts);
        auto const count = detail::renumber(comm);
        if (!moved) break;

        for (auto& c : node_comm) c = comm[c];
        result.levels.push_back(node_comm);
        level_graph = coarsen(level_graph, comm, count);
    }

    if (opts.refine && !result.levels.empty()) {
        (void)detail::local_moving(base, node_comm, rng, opts);
    }

    result.community_count = detail::renumber(node_comm);
    result.community_of = std::move(node_comm);
    result.modularity = modularity(base, result.community_of, opts.resolution);
    return result;
}

} // namespace archgov::graph

#endif // ARCHGOV_GRAPH_COMMUNITY_H
