// core/limits.h - Algorithm constants and per-call option defaults
// Part of the architectural statement engine (C++20)
//
// Every iterative algorithm has a documented cap and tolerance so that two
// runs over the same snapshot agree bit-for-bit.  The constants here are the
// defaults; each algorithm takes a plain options struct whose members are
// initialised from them, so callers override per call:
//
//   community_options opts;
//   opts.seed = 7;
//   auto communities = detect_communities(g, opts);

#ifndef ARCHGOV_CORE_LIMITS_H
#define ARCHGOV_CORE_LIMITS_H

#include <cstddef>
#include <cstdint>

namespace archgov {

namespace limits {

// =============================================================================
// Centrality
// =============================================================================

/// Power-iteration cap for eigenvector centrality.
inline constexpr std::size_t eigenvector_max_iterations = 100;

/// Convergence threshold: iteration stops when the L1 change of the
/// normalised vector drops below node_count * eigenvector_tolerance.
inline constexpr double eigenvector_tolerance = 1.0e-6;

// =============================================================================
// Community detection (Louvain)
// =============================================================================

/// Seed of the std::mt19937 that shuffles the node visit order.
inline constexpr std::uint32_t community_seed = 42;

/// Modularity resolution parameter (gamma).
inline constexpr double community_resolution = 1.0;

/// Maximum aggregation levels.
inline constexpr std::size_t community_max_levels = 16;

/// Maximum local-moving passes per level.
inline constexpr std::size_t community_max_passes = 32;

/// Minimum modularity gain for a node move to count.
inline constexpr double community_min_gain = 1.0e-12;

// =============================================================================
// Coupling
// =============================================================================

/// coupling = fan_in * coupling_fan_in_weight + fan_out * coupling_fan_out_weight
inline constexpr double coupling_fan_in_weight = 0.6;
inline constexpr double coupling_fan_out_weight = 0.4;

/// Default percentile for high_coupling().
inline constexpr double high_coupling_percentile = 0.9;

// =============================================================================
// Cycle enumeration
// =============================================================================

/// Maximum number of elementary cycles enumerate_cycles() returns.
inline constexpr std::size_t cycle_max_count = 100;

/// Longest cycle (in nodes) enumerate_cycles() looks for.
inline constexpr std::size_t cycle_max_length = 10;

// =============================================================================
// Tag expressions
// =============================================================================

/// Deepest nesting a tag expression may have: parentheses and NOT
/// operators while parsing, operator height of the parsed tree.
inline constexpr std::size_t tag_expression_max_depth = 256;

} // namespace limits

} // namespace archgov

#endif // ARCHGOV_CORE_LIMITS_H
