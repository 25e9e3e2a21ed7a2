// graph/runtime_graph.h - Keyed CSR dependency graph
// Part of the architectural statement engine (C++20)
//
// Immutable CSR-format directed graph whose nodes carry the snapshot key
// they were built from.  runtime_graph_builder collects nodes and typed
// edges, then finalise() produces the graph.
//
// CANONICALISATION (finalise):
//   1. Nodes renumbered in ascending key order
//   2. Adjacency sorted by (src, dst) and de-duplicated across types
//   3. Self-edges KEPT and flagged (a component may depend on itself)
//   4. Typed edges kept separately, sorted by (src, dst, type), exact
//      duplicates removed
//
// Algorithms read the de-duplicated adjacency; typed_edges() serves the
// consumers that care about dependency types (edge filtering, metrics).

#ifndef ARCHGOV_GRAPH_RUNTIME_GRAPH_H
#define ARCHGOV_GRAPH_RUNTIME_GRAPH_H

#include "graph_concepts.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace archgov::graph {

// Forward declaration for friend access.
class runtime_graph_builder;

/// One dependency edge with its type.
struct typed_edge {
    node_id src;
    node_id dst;
    std::string type;

    bool operator==(typed_edge const&) const = default;
    bool operator<(typed_edge const& o) const {
        return std::tie(src, dst, type) < std::tie(o.src, o.dst, o.type);
    }
};

// =============================================================================
// runtime_graph
// =============================================================================

/// Runtime-constructed, immutable, CSR-format directed graph with keys.
///
/// Constructed via runtime_graph_builder::finalise().
///
/// Example:
/// ```cpp
/// runtime_graph_builder b;
/// auto web = b.add_node("web");
/// auto db  = b.add_node("db");
/// b.add_edge(web, db, "sql");
/// auto g = b.finalise();
/// // ids follow key order: "db" is node 0, "web" is node 1
/// auto topo = topological_sort(g);   // order: {web, db}
/// ```
class runtime_graph {
public:
    runtime_graph() = default;

    // =========================================================================
    // Size queries
    // =========================================================================

    [[nodiscard]] std::size_t node_count() const noexcept { return keys_.size(); }
    [[nodiscard]] std::size_t edge_count() const noexcept { return neighbors_.size(); }
    [[nodiscard]] bool empty() const noexcept { return keys_.empty(); }

    // =========================================================================
    // Adjacency access
    // =========================================================================

    struct adjacency_range {
        node_id const* begin_;
        node_id const* end_;

        [[nodiscard]] node_id const* begin() const noexcept { return begin_; }
        [[nodiscard]] node_id const* end() const noexcept { return end_; }
        [[nodiscard]] std::size_t size() const noexcept {
            return static_cast<std::size_t>(end_ - begin_);
        }
        [[nodiscard]] bool empty() const noexcept { return begin_ == end_; }
    };

    [[nodiscard]] adjacency_range
    out_neighbors(node_id u) const noexcept {
        auto const idx = to_index(u);
        return {neighbors_.data() + offsets_[idx],
                neighbors_.data() + offsets_[idx + 1]};
    }

    [[nodiscard]] std::size_t out_degree(node_id u) const noexcept {
        auto const idx = to_index(u);
        return offsets_[idx + 1] - offsets_[idx];
    }

    [[nodiscard]] bool has_node(node_id u) const noexcept {
        return to_index(u) < keys_.size();
    }

    /// True if the de-duplicated adjacency contains u -> v.
    [[nodiscard]] bool has_edge(node_id u, node_id v) const noexcept {
        if (!has_node(u)) return false;
        auto const r = out_neighbors(u);
        return std::binary_search(r.begin(), r.end(), v);
    }

    [[nodiscard]] bool has_self_loop(node_id u) const noexcept {
        return has_edge(u, u);
    }

    // =========================================================================
    // Keys
    // =========================================================================

    [[nodiscard]] std::string const& key(node_id u) const { return keys_.at(to_index(u)); }

    [[nodiscard]] std::vector<std::string> const& keys() const noexcept { return keys_; }

    /// Node for a key, or invalid_node.  O(log V).
    [[nodiscard]] node_id find(std::string const& key) const noexcept {
        auto const it = std::lower_bound(keys_.begin(), keys_.end(), key);
        if (it == keys_.end() || *it != key) return invalid_node;
        return node_id{static_cast<std::uint32_t>(it - keys_.begin())};
    }

    // =========================================================================
    // Typed edges
    // =========================================================================

    [[nodiscard]] std::vector<typed_edge> const& typed_edges() const noexcept {
        return typed_;
    }

private:
    std::vector<std::string> keys_;        // sorted ascending; index = node id
    std::vector<std::size_t> offsets_{0};  // CSR offsets, size V + 1
    std::vector<node_id> neighbors_;
    std::vector<typed_edge> typed_;

    friend class runtime_graph_builder;
};

// Verify concept satisfaction.
static_assert(graph_queryable<runtime_graph>);
static_assert(sized_graph<runtime_graph>);
static_assert(keyed_graph<runtime_graph>);

// =============================================================================
// runtime_graph_builder
// =============================================================================

/// Builder for runtime_graph.
///
/// Ids returned by add_node() are builder-local; finalise() renumbers nodes
/// by ascending key.  Use runtime_graph::find() to look nodes up afterwards.
class runtime_graph_builder {
public:
    /// Add a node.  Throws std::invalid_argument on a duplicate key.
    [[nodiscard]] node_id add_node(std::string key) {
        auto const [it, inserted] =
            index_.emplace(key, static_cast<std::uint32_t>(keys_.size()));
        if (!inserted)
            throw std::invalid_argument("runtime_graph_builder: duplicate node key '" + key + "'");
        keys_.push_back(std::move(key));
        return node_id{it->second};
    }

    /// Builder-local id for a key, or invalid_node.
    [[nodiscard]] node_id find(std::string const& key) const noexcept {
        auto const it = index_.find(key);
        return it == index_.end() ? invalid_node : node_id{it->second};
    }

    void add_edge(node_id u, node_id v, std::string type = {}) {
        if (keys_.empty())
            throw std::logic_error("runtime_graph_builder: no nodes");
        if (to_index(u) >= keys_.size())
            throw std::out_of_range("runtime_graph_builder: source not in graph");
        if (to_index(v) >= keys_.size())
            throw std::out_of_range("runtime_graph_builder: target not in graph");
        edges_.push_back(typed_edge{u, v, std::move(type)});
    }

    [[nodiscard]] std::size_t node_count() const noexcept { return keys_.size(); }
    [[nodiscard]] std::size_t edge_count() const noexcept { return edges_.size(); }

    /// Build the immutable runtime_graph.
    [[nodiscard]] runtime_graph finalise() const {
        runtime_graph g;
        auto const V = keys_.size();

        // Renumber: builder id -> position in key order.
        // index_ is a std::map, so iteration is already key-ascending.
        std::vector<std::uint32_t> remap(V);
        g.keys_.reserve(V);
        for (auto const& [key, old_id] : index_) {
            remap[old_id] = static_cast<std::uint32_t>(g.keys_.size());
            g.keys_.push_back(key);
        }

        // Typed edges: remap, sort, drop exact duplicates.
        g.typed_.reserve(edges_.size());
        for (auto const& e : edges_) {
            g.typed_.push_back(typed_edge{node_id{remap[to_index(e.src)]},
                                          node_id{remap[to_index(e.dst)]},
                                          e.type});
        }
        std::sort(g.typed_.begin(), g.typed_.end());
        g.typed_.erase(std::unique(g.typed_.begin(), g.typed_.end()), g.typed_.end());

        // Build CSR over distinct (src, dst) pairs.
        g.offsets_.assign(V + 1, 0);
        for (std::size_t i = 0; i < g.typed_.size(); ++i) {
            auto const& e = g.typed_[i];
            if (i > 0 && g.typed_[i - 1].src == e.src && g.typed_[i - 1].dst == e.dst)
                continue;
            g.offsets_[to_index(e.src) + 1]++;
            g.neighbors_.push_back(e.dst);
        }
        for (std::size_t i = 1; i <= V; ++i) {
            g.offsets_[i] += g.offsets_[i - 1];
        }

        return g;
    }

private:
    std::vector<std::string> keys_;
    std::map<std::string, std::uint32_t> index_;
    std::vector<typed_edge> edges_;
};

} // namespace archgov::graph

#endif // ARCHGOV_GRAPH_RUNTIME_GRAPH_H
