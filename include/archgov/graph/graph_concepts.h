// graph/graph_concepts.h - Descriptor types and graph concepts
// Part of the architectural statement engine (C++20)
//
// node_id is an opaque dense index.  Graphs built from a snapshot assign
// ids in ascending key order, so every "ties broken by key" rule in the
// algorithms reduces to "ties broken by node id".  All semantics (keys,
// types, metrics) live beside the graph, never inside node_id.

#ifndef ARCHGOV_GRAPH_CONCEPTS_H
#define ARCHGOV_GRAPH_CONCEPTS_H

#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <string>

namespace archgov::graph {

// =============================================================================
// Descriptor Type
// =============================================================================

/// Opaque node identifier.
///
/// Valid only for the graph instance that produced it.  Transforms
/// (transpose, filter_edge_types, coarsen) either keep ids identity-mapped
/// or return an explicit remapping.
struct node_id {
    std::uint32_t value{};

    friend constexpr bool operator==(node_id, node_id) = default;
    friend constexpr auto operator<=>(node_id, node_id) = default;
};

/// Convert node_id to index for array access.
[[nodiscard]] constexpr std::size_t to_index(node_id n) noexcept {
    return static_cast<std::size_t>(n.value);
}

/// Sentinel value for invalid/unassigned node references.
inline constexpr node_id invalid_node{~std::uint32_t{0}};

/// Traversal / adjacency direction.
enum class direction {
    outgoing,   ///< follow edges source -> target (downstream)
    incoming,   ///< follow edges target -> source (upstream)
    both,       ///< union of the two
};

// =============================================================================
// Graph Concepts
// =============================================================================

/// A graph_queryable provides immutable adjacency queries.
///
/// Requirements:
/// - node_count(): number of nodes in the graph
/// - out_neighbors(u): range of node_id
///
/// Satisfied by runtime_graph.
template<typename G>
concept graph_queryable =
    requires(G const& g, node_id u) {
        { g.node_count() } -> std::convertible_to<std::size_t>;
        { g.out_neighbors(u) };
    };

/// A sized_graph additionally reports its de-duplicated edge count.
template<typename G>
concept sized_graph =
    graph_queryable<G> &&
    requires(G const& g) {
        { g.edge_count() } -> std::convertible_to<std::size_t>;
    };

/// A keyed_graph maps every node back to the snapshot key it came from.
template<typename G>
concept keyed_graph =
    sized_graph<G> &&
    requires(G const& g, node_id u) {
        { g.key(u) } -> std::convertible_to<std::string const&>;
    };

} // namespace archgov::graph

#endif // ARCHGOV_GRAPH_CONCEPTS_H
