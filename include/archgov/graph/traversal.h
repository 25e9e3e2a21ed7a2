// graph/traversal.h - Lazy breadth-first traversal
// Part of the architectural statement engine (C++20)
//
// ALGORITHM: Level-synchronous BFS.
// Complexity: O(V + E) for a full pass.
// Determinism: each depth level is emitted in ascending node id (= key)
// order.  The start node is never emitted.
//
// traverse() returns a traversal_view: a finite, restartable input range.
// Each begin() starts a fresh BFS, so a view can be iterated any number of
// times and a partially consumed iteration costs only the levels it
// touched.  The view borrows the graph passed to traverse(); the graph
// must outlive the view.
//
// reachable_from() answers the related question "which nodes can be
// reached by a path of length >= 1?", where a node on a cycle reaches
// itself.  Exclusion checks use it.

#ifndef ARCHGOV_GRAPH_TRAVERSAL_H
#define ARCHGOV_GRAPH_TRAVERSAL_H

#include "edge_filter.h"
#include "graph_concepts.h"
#include "runtime_graph.h"
#include "transpose.h"

#include <archgov/core/key_set.h>

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <memory>
#include <utility>
#include <vector>

namespace archgov::graph {

/// One node produced by a traversal.
struct reached_node {
    node_id node;
    std::size_t depth = 0;   ///< hops from the start node (>= 1)

    [[nodiscard]] bool direct() const noexcept { return depth == 1; }

    bool operator==(reached_node const&) const = default;
};

// =============================================================================
// traversal_view
// =============================================================================

class traversal_view {
public:
    traversal_view(runtime_graph const& g, node_id start, direction dir,
                   int max_depth, key_set const& edge_types)
        : graph_(&g), start_(start), dir_(dir), max_depth_(max_depth) {
        if (!edge_types.empty()) {
            filtered_ = std::make_shared<runtime_graph const>(filter_edge_types(g, edge_types));
        }
        if (dir_ != direction::outgoing) {
            backward_ = std::make_shared<runtime_graph const>(transpose(forward()));
        }
    }

    class iterator {
    public:
        using value_type = reached_node;
        using difference_type = std::ptrdiff_t;
        using iterator_concept = std::input_iterator_tag;

        iterator() = default;

        explicit iterator(traversal_view const* view) : view_(view) {
            auto const& g = view_->forward();
            if (!g.has_node(view_->start_)) return;
            visited_.assign(g.node_count(), 0);
            visited_[to_index(view_->start_)] = 1;
            level_.push_back(view_->start_);
            next_level();
        }

        [[nodiscard]] reached_node operator*() const { return {level_[pos_], depth_}; }

        iterator& operator++() {
            if (++pos_ == level_.size()) next_level();
            return *this;
        }

        void operator++(int) { ++*this; }

        friend bool operator==(iterator const& it, std::default_sentinel_t) noexcept {
            return it.level_.empty();
        }

    private:
        void next_level() {
            pos_ = 0;
            ++depth_;
            if (view_->max_depth_ > 0 &&
                depth_ > static_cast<std::size_t>(view_->max_depth_)) {
                level_.clear();
                return;
            }
            std::vector<node_id> next;
            auto visit = [&](node_id v) {
                if (!visited_[to_index(v)]) {
                    visited_[to_index(v)] = 1;
                    next.push_back(v);
                }
            };
            for (auto u : level_) {
                if (view_->dir_ != direction::incoming) {
                    for (auto v : view_->forward().out_neighbors(u)) visit(v);
                }
                if (view_->dir_ != direction::outgoing) {
                    for (auto v : view_->backward_->out_neighbors(u)) visit(v);
                }
            }
            std::sort(next.begin(), next.end());
            level_ = std::move(next);
        }

        traversal_view const* view_ = nullptr;
        std::vector<char> visited_;
        std::vector<node_id> level_;
        std::size_t pos_ = 0;
        std::size_t depth_ = 0;
    };

    [[nodiscard]] iterator begin() const { return iterator{this}; }
    [[nodiscard]] std::default_sentinel_t end() const noexcept { return {}; }

    [[nodiscard]] node_id start() const noexcept { return start_; }
    [[nodiscard]] runtime_graph const& graph() const noexcept { return forward(); }

private:
    [[nodiscard]] runtime_graph const& forward() const noexcept {
        return filtered_ ? *filtered_ : *graph_;
    }

    runtime_graph const* graph_;
    std::shared_ptr<runtime_graph const> filtered_;
    std::shared_ptr<runtime_graph const> backward_;
    node_id start_;
    direction dir_;
    int max_depth_;
};

static_assert(std::input_iterator<traversal_view::iterator>);

/// Lazy BFS from `start`.
///
/// - dir: outgoing (downstream), incoming (upstream) or both
/// - max_depth <= 0: unbounded
/// - edge_types empty: follow every dependency type
///
/// An unknown start node yields an empty sequence.
///
/// Example:
/// ```cpp
/// for (auto r : traverse(g, g.find("web"), direction::outgoing, 2)) {
///     std::cout << g.key(r.node) << " at depth " << r.depth << '\n';
/// }
/// ```
[[nodiscard]] inline traversal_view
traverse(runtime_graph const& g, node_id start,
         direction dir = direction::outgoing,
         int max_depth = 0,
         key_set const& edge_types = {}) {
    return traversal_view{g, start, dir, max_depth, edge_types};
}

// =============================================================================
// Direct / transitive partition
// =============================================================================

/// Traversal output split by distance.
///
/// - direct:     depth 1
/// - transitive: depth > 1
/// Both in emission order.
struct reach_result {
    std::vector<node_id> direct;
    std::vector<node_id> transitive;

    [[nodiscard]] std::size_t size() const noexcept {
        return direct.size() + transitive.size();
    }
};

[[nodiscard]] inline reach_result collect_reachable(traversal_view const& view) {
    reach_result out;
    for (auto r : view) {
        if (r.direct()) out.direct.push_back(r.node);
        else out.transitive.push_back(r.node);
    }
    return out;
}

// =============================================================================
// Reachability by non-empty paths
// =============================================================================

/// reached[v] == 1 iff a path of length >= 1 leads from `source` to v
/// (outgoing edges).  source itself is reached only through a cycle or a
/// self-edge.
[[nodiscard]] inline std::vector<char>
reachable_from(runtime_graph const& g, node_id source) {
    std::vector<char> reached(g.node_count(), 0);
    if (!g.has_node(source)) return reached;

    std::vector<node_id> stack;
    for (auto v : g.out_neighbors(source)) {
        if (!reached[to_index(v)]) {
            reached[to_index(v)] = 1;
            stack.push_back(v);
        }
    }
    while (!stack.empty()) {
        auto const u = stack.back();
        stack.pop_back();
        for (auto v : g.out_neighbors(u)) {
            if (!reached[to_index(v)]) {
                reached[to_index(v)] = 1;
                stack.push_back(v);
            }
        }
    }
    return reached;
}

} // namespace archgov::graph

#endif // ARCHGOV_GRAPH_TRAVERSAL_H
