// graph/bipartite_matching.h - Bipartite graph and Hopcroft-Karp matching
// Part of the architectural statement engine (C++20)
//
// ALGORITHM: Hopcroft-Karp maximum cardinality matching.
// Complexity: O(E * sqrt(V)) where V = L + R.
//
// GUARANTEES:
// - Returns a maximum cardinality matching
// - Deterministic: same graph -> same matching (BFS/DFS follow adjacency
//   order, which the builder sorts)
// - verify_matching() checks every matched pair is a real edge and no
//   vertex is used twice
//
// Correspondence checks model two layers' groups as the two sides and
// connect groups with identical member sets; a perfect matching is a 1:1
// correspondence.  Refinement checks use the same graph type with
// subset edges and read left_degree() directly.
//
// TERMINOLOGY:
// "Left index" = [0, L), "Right index" = [0, R).  All edges go left -> right.

#ifndef ARCHGOV_GRAPH_BIPARTITE_MATCHING_H
#define ARCHGOV_GRAPH_BIPARTITE_MATCHING_H

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <utility>
#include <vector>

namespace archgov::graph {

// =========================================================================
// bipartite_graph
// =========================================================================

class bipartite_graph_builder;

/// Immutable bipartite graph with an enforced left/right partition.
///
/// Constructed via bipartite_graph_builder::finalise().
///
/// Example:
/// ```cpp
/// bipartite_graph_builder b(3, 3);   // 3 left, 3 right
/// b.add_edge(0, 0);                  // left 0 -> right 0
/// b.add_edge(0, 1);
/// b.add_edge(1, 2);
/// auto bg = b.finalise();
/// ```
class bipartite_graph {
public:
    bipartite_graph() = default;

    [[nodiscard]] std::size_t left_count() const noexcept { return adj_.size(); }
    [[nodiscard]] std::size_t right_count() const noexcept { return R_; }
    [[nodiscard]] std::size_t edge_count() const noexcept { return E_; }

    /// Neighbors of left node i as right indices [0, R), ascending.
    [[nodiscard]] std::vector<std::size_t> const& left_neighbors(std::size_t i) const {
        return adj_.at(i);
    }

    [[nodiscard]] std::size_t left_degree(std::size_t i) const { return adj_.at(i).size(); }

    /// Number of left vertices adjacent to right vertex j.
    [[nodiscard]] std::size_t right_degree(std::size_t j) const {
        std::size_t d = 0;
        for (auto const& nbrs : adj_) {
            if (std::binary_search(nbrs.begin(), nbrs.end(), j)) ++d;
        }
        return d;
    }

private:
    std::vector<std::vector<std::size_t>> adj_;
    std::size_t R_ = 0;
    std::size_t E_ = 0;

    friend class bipartite_graph_builder;
};

/// Builder for bipartite_graph.  Rejects indices outside the partition;
/// duplicate edges are merged.
class bipartite_graph_builder {
public:
    bipartite_graph_builder(std::size_t left, std::size_t right)
        : adj_(left), R_(right) {}

    void add_edge(std::size_t left_idx, std::size_t right_idx) {
        if (left_idx >= adj_.size())
            throw std::out_of_range("bipartite_graph_builder: left index out of range");
        if (right_idx >= R_)
            throw std::out_of_range("bipartite_graph_builder: right index out of range");
        adj_[left_idx].push_back(right_idx);
    }

    [[nodiscard]] bipartite_graph finalise() const {
        bipartite_graph g;
        g.adj_ = adj_;
        g.R_ = R_;
        for (auto& nbrs : g.adj_) {
            std::sort(nbrs.begin(), nbrs.end());
            nbrs.erase(std::unique(nbrs.begin(), nbrs.end()), nbrs.end());
            g.E_ += nbrs.size();
        }
        return g;
    }

private:
    std::vector<std::vector<std::size_t>> adj_;
    std::size_t R_;
};

// =========================================================================
// Result type
// =========================================================================

/// Result of bipartite matching.
///
/// - match_left[i]:  right index matched to left i, or NIL if unmatched
/// - match_right[j]: left index matched to right j, or NIL if unmatched
/// - match_count:    number of matched pairs (= |matching|)
/// - verified:       true if verify_matching() has confirmed correctness
struct matching_result {
    static constexpr std::size_t NIL = ~std::size_t{0};

    std::vector<std::size_t> match_left;
    std::vector<std::size_t> match_right;
    std::size_t match_count = 0;
    bool verified = false;

    [[nodiscard]] std::size_t left_count() const noexcept { return match_left.size(); }
    [[nodiscard]] std::size_t right_count() const noexcept { return match_right.size(); }

    [[nodiscard]] bool left_matched(std::size_t i) const { return match_left.at(i) != NIL; }
    [[nodiscard]] bool right_matched(std::size_t j) const { return match_right.at(j) != NIL; }

    /// Both sides fully matched.
    [[nodiscard]] bool is_perfect() const noexcept {
        return match_count == match_left.size() && match_count == match_right.size();
    }
};

// =========================================================================
// Verification
// =========================================================================

/// O(E) verification that a matching is valid:
/// 1. match_left and match_right are consistent
/// 2. Every matched pair (i, j) corresponds to an actual edge
/// 3. match_count equals the number of matched left vertices
///
/// Sets result.verified accordingly.
[[nodiscard]] inline bool verify_matching(bipartite_graph const& g, matching_result& result) {
    constexpr auto NIL = matching_result::NIL;
    auto const L = g.left_count();
    auto const R = g.right_count();
    result.verified = false;
    if (result.match_left.size() != L || result.match_right.size() != R) return false;

    std::size_t count = 0;
    for (std::size_t i = 0; i < L; ++i) {
        auto const j = result.match_left[i];
        if (j == NIL) continue;
        if (j >= R || result.match_right[j] != i) return false;
        auto const& nbrs = g.left_neighbors(i);
        if (!std::binary_search(nbrs.begin(), nbrs.end(), j)) return false;
        ++count;
    }
    for (std::size_t j = 0; j < R; ++j) {
        auto const i = result.match_right[j];
        if (i == NIL) continue;
        if (i >= L || result.match_left[i] != j) return false;
    }
    if (count != result.match_count) return false;

    result.verified = true;
    return true;
}

// =========================================================================
// Hopcroft-Karp algorithm
// =========================================================================

namespace detail {

/// BFS phase: layer the left vertices by alternating-path distance from
/// the free left vertices.  Returns true if a free right vertex is
/// reachable (an augmenting path exists).
inline bool hopcroft_karp_bfs(bipartite_graph const& g,
                              std::vector<std::size_t> const& match_left,
                              std::vector<std::size_t> const& match_right,
                              std::vector<std::size_t>& dist) {
    constexpr std::size_t NIL = matching_result::NIL;
    constexpr std::size_t INF = ~std::size_t{0};
    auto const L = g.left_count();

    std::vector<std::size_t> queue;
    queue.reserve(L);
    for (std::size_t u = 0; u < L; ++u) {
        if (match_left[u] == NIL) {
            dist[u] = 0;
            queue.push_back(u);
        } else {
            dist[u] = INF;
        }
    }

    bool found = false;
    for (std::size_t head = 0; head < queue.size(); ++head) {
        auto const u = queue[head];
        for (auto v : g.left_neighbors(u)) {
            auto const w = match_right[v];   // left node matched to right v
            if (w == NIL) {
                found = true;
            } else if (dist[w] == INF) {
                dist[w] = dist[u] + 1;
                queue.push_back(w);
            }
        }
    }
    return found;
}

/// DFS phase: find an augmenting path from left node u along BFS layers
/// and flip it.
inline bool hopcroft_karp_dfs(bipartite_graph const& g, std::size_t u,
                              std::vector<std::size_t>& match_left,
                              std::vector<std::size_t>& match_right,
                              std::vector<std::size_t>& dist) {
    constexpr std::size_t NIL = matching_result::NIL;
    constexpr std::size_t INF = ~std::size_t{0};

    for (auto v : g.left_neighbors(u)) {
        auto const w = match_right[v];
        if (w == NIL ||
            (dist[w] == dist[u] + 1 &&
             hopcroft_karp_dfs(g, w, match_left, match_right, dist))) {
            match_left[u] = v;
            match_right[v] = u;
            return true;
        }
    }

    // No augmenting path from u: remove from layered graph.
    dist[u] = INF;
    return false;
}

} // namespace detail

/// Hopcroft-Karp maximum cardinality matching.
///
/// Example:
/// ```cpp
/// auto m = hopcroft_karp(bg);
/// if (m.is_perfect()) { /* 1:1 correspondence */ }
/// ```
[[nodiscard]] inline matching_result hopcroft_karp(bipartite_graph const& g) {
    constexpr std::size_t NIL = matching_result::NIL;
    auto const L = g.left_count();

    matching_result result;
    result.match_left.assign(L, NIL);
    result.match_right.assign(g.right_count(), NIL);

    std::vector<std::size_t> dist(L, 0);
    while (detail::hopcroft_karp_bfs(g, result.match_left, result.match_right, dist)) {
        for (std::size_t u = 0; u < L; ++u) {
            if (result.match_left[u] == NIL) {
                (void)detail::hopcroft_karp_dfs(g, u, result.match_left, result.match_right, dist);
            }
        }
    }

    for (std::size_t i = 0; i < L; ++i) {
        if (result.match_left[i] != NIL) ++result.match_count;
    }

    (void)verify_matching(g, result);
    return result;
}

} // namespace archgov::graph

#endif // ARCHGOV_GRAPH_BIPARTITE_MATCHING_H
