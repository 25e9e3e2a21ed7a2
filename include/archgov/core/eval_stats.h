// core/eval_stats.h - Counters from resolution and evaluation sweeps
// Part of the architectural statement engine (C++20)
//
// eval_stats is the engine's only observability channel: no logging, no
// global counters.  Each sweep fills one instance and callers aggregate
// with operator+.  Different stages populate different fields.

#ifndef ARCHGOV_CORE_EVAL_STATS_H
#define ARCHGOV_CORE_EVAL_STATS_H

#include <cstddef>

namespace archgov {

/// Statistics collected while resolving references and evaluating
/// statements.
///
/// All counters default to 0.  Unused fields stay at 0.
///
/// Example:
/// ```cpp
/// auto batch = evaluate_batch(texts, ctx);
/// auto total = previous.stats + batch.stats;
/// double reuse = total.cache_hit_rate();
/// ```
struct eval_stats {
    // =========================================================================
    // Resolution
    // =========================================================================

    /// Reference resolutions actually computed.
    std::size_t resolutions = 0;

    /// Lookups answered by a resolution_scope memo.
    std::size_t memo_hits = 0;

    /// Lookups that had to resolve.
    std::size_t memo_misses = 0;

    // =========================================================================
    // Statements
    // =========================================================================

    std::size_t statements_parsed = 0;
    std::size_t statements_evaluated = 0;
    std::size_t satisfied = 0;
    std::size_t violated = 0;
    std::size_t not_evaluated = 0;

    // =========================================================================
    // Graph work
    // =========================================================================

    /// Adjacency entries inspected by exclusion checks.
    std::size_t edges_scanned = 0;

    /// Largest resolved member set seen.
    std::size_t max_resolution_size = 0;

    // =========================================================================
    // Aggregation
    // =========================================================================

    /// Counters sum; max_resolution_size takes the max.
    constexpr eval_stats operator+(eval_stats const& other) const {
        return eval_stats{
            .resolutions = resolutions + other.resolutions,
            .memo_hits = memo_hits + other.memo_hits,
            .memo_misses = memo_misses + other.memo_misses,

            .statements_parsed = statements_parsed + other.statements_parsed,
            .statements_evaluated = statements_evaluated + other.statements_evaluated,
            .satisfied = satisfied + other.satisfied,
            .violated = violated + other.violated,
            .not_evaluated = not_evaluated + other.not_evaluated,

            .edges_scanned = edges_scanned + other.edges_scanned,
            .max_resolution_size = (max_resolution_size > other.max_resolution_size)
                ? max_resolution_size : other.max_resolution_size,  // max
        };
    }

    constexpr eval_stats& operator+=(eval_stats const& other) {
        *this = *this + other;
        return *this;
    }

    /// Memo hit rate (0.0 to 1.0); 0.0 when no lookups happened.
    [[nodiscard]] constexpr double cache_hit_rate() const {
        std::size_t const total = memo_hits + memo_misses;
        if (total == 0) return 0.0;
        return static_cast<double>(memo_hits) / static_cast<double>(total);
    }

    constexpr bool operator==(eval_stats const& other) const = default;
};

} // namespace archgov

#endif // ARCHGOV_CORE_EVAL_STATS_H
