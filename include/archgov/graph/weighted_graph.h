// graph/weighted_graph.h - Undirected weighted graph for modularity work
// Part of the architectural statement engine (C++20)
//
// Louvain community detection works on an undirected, weighted graph that
// is repeatedly aggregated.  weighted_graph stores symmetric adjacency
// lists with weights plus one self-loop weight per node (the weight
// collapsed into a super-node by aggregation).
//
// CONSTRUCTION:
//   weighted_graph_builder collects (u, v, w) triples; finalise() merges
//   parallel entries by summing weights and sorts each adjacency list by
//   target.  add_edge(u, u, w) adds to u's self weight.

#ifndef ARCHGOV_GRAPH_WEIGHTED_GRAPH_H
#define ARCHGOV_GRAPH_WEIGHTED_GRAPH_H

#include "graph_concepts.h"
#include "runtime_graph.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace archgov::graph {

// Forward declaration for friend access.
class weighted_graph_builder;

class weighted_graph {
public:
    struct arc {
        std::uint32_t target;
        double weight;
    };

    weighted_graph() = default;

    [[nodiscard]] std::size_t node_count() const noexcept { return adj_.size(); }

    /// Neighbours other than u itself, sorted by target.
    [[nodiscard]] std::vector<arc> const& neighbors(std::size_t u) const { return adj_.at(u); }

    [[nodiscard]] double self_weight(std::size_t u) const { return self_.at(u); }

    /// Weighted degree k_u: a self-loop contributes twice.
    [[nodiscard]] double degree(std::size_t u) const {
        double k = 2.0 * self_[u];
        for (auto const& a : adj_[u]) k += a.weight;
        return k;
    }

    /// m: every undirected edge counted once, self-loops included.
    [[nodiscard]] double total_weight() const noexcept { return total_; }

private:
    std::vector<std::vector<arc>> adj_;
    std::vector<double> self_;
    double total_ = 0.0;

    friend class weighted_graph_builder;
};

class weighted_graph_builder {
public:
    explicit weighted_graph_builder(std::size_t node_count)
        : adj_(node_count), self_(node_count, 0.0) {}

    void add_edge(std::size_t u, std::size_t v, double w = 1.0) {
        if (u >= adj_.size() || v >= adj_.size())
            throw std::out_of_range("weighted_graph_builder: node not in graph");
        if (u == v) {
            self_[u] += w;
            return;
        }
        adj_[u].push_back({static_cast<std::uint32_t>(v), w});
        adj_[v].push_back({static_cast<std::uint32_t>(u), w});
    }

    [[nodiscard]] weighted_graph finalise() const {
        weighted_graph g;
        g.adj_.resize(adj_.size());
        g.self_ = self_;
        double twice_cross = 0.0;
        for (std::size_t u = 0; u < adj_.size(); ++u) {
            auto arcs = adj_[u];
            std::sort(arcs.begin(), arcs.end(),
                      [](auto const& a, auto const& b) { return a.target < b.target; });
            auto& out = g.adj_[u];
            for (auto const& a : arcs) {
                if (!out.empty() && out.back().target == a.target) out.back().weight += a.weight;
                else out.push_back(a);
                twice_cross += a.weight;
            }
        }
        g.total_ = twice_cross / 2.0;
        for (double s : self_) g.total_ += s;
        return g;
    }

private:
    std::vector<std::vector<weighted_graph::arc>> adj_;
    std::vector<double> self_;
};

/// Undirected unit-weight view of a dependency graph.
///
/// Each connected pair {u, v} gets weight 1 regardless of direction or of
/// edges in both directions.  Self-edges are ignored.
[[nodiscard]] inline weighted_graph make_undirected(runtime_graph const& g) {
    auto const V = g.node_count();
    weighted_graph_builder b(V);
    for (std::size_t u = 0; u < V; ++u) {
        auto const uid = node_id{static_cast<std::uint32_t>(u)};
        for (auto v : g.out_neighbors(uid)) {
            if (v == uid) continue;
            // {u, v} is added by the smaller end when both directions exist.
            if (to_index(v) < u && g.has_edge(v, uid)) continue;
            b.add_edge(u, to_index(v), 1.0);
        }
    }
    return b.finalise();
}

} // namespace archgov::graph

#endif // ARCHGOV_GRAPH_WEIGHTED_GRAPH_H
