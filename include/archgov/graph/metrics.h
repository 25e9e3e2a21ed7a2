// graph/metrics.h - Per-node coupling and centrality metrics
// Part of the architectural statement engine (C++20)
//
// For every node, in node id (= key) order:
//   fan_in / fan_out   distinct predecessors / successors, self-edges excluded
//   instability        fan_out / (fan_in + fan_out); 0 for isolated nodes
//   coupling           0.6 * fan_in + 0.4 * fan_out
//   degree             (fan_in + fan_out) / (2 (n - 1)); 0 when n <= 1
//   betweenness        Brandes, directed, unweighted, normalised by
//                      (n - 1)(n - 2); 0 when n <= 2
//   closeness          outgoing BFS distances with Wasserman-Faust scaling
//                      (r / (n - 1)) * (r / sum_d); 0 when nothing reachable
//   eigenvector        power iteration of x <- (A^T + I) x, L2-normalised
//   dependency_types   distinct types on outgoing typed edges
//
// Eigenvector centrality stops after centrality_options::max_iterations
// or when the L1 change drops below n * tolerance, whichever comes first.
// Defaults: limits::eigenvector_max_iterations (100) and
// limits::eigenvector_tolerance (1e-6).  Hitting the cap is not an error:
// the last iterate is returned and eigenvector_converged is false.
//
// Complexity: O(V E) for betweenness and closeness, O(iterations * E) for
// eigenvector, O(V + E) for the rest.

#ifndef ARCHGOV_GRAPH_METRICS_H
#define ARCHGOV_GRAPH_METRICS_H

#include "graph_concepts.h"
#include "runtime_graph.h"

#include <archgov/core/key_set.h>
#include <archgov/core/limits.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace archgov::graph {

struct centrality_options {
    std::size_t max_iterations = limits::eigenvector_max_iterations;
    double tolerance = limits::eigenvector_tolerance;
};

struct node_metrics {
    std::string key;
    std::size_t fan_in = 0;
    std::size_t fan_out = 0;
    double instability = 0.0;
    double coupling = 0.0;
    double degree_centrality = 0.0;
    double betweenness = 0.0;
    double closeness = 0.0;
    double eigenvector = 0.0;
    std::size_t dependency_types = 0;
};

/// Metrics for every node, index = node id.
struct metrics_table {
    std::vector<node_metrics> nodes;
    bool eigenvector_converged = true;
    std::size_t eigenvector_iterations = 0;

    [[nodiscard]] node_metrics const* find(std::string const& key) const {
        auto const it = std::lower_bound(nodes.begin(), nodes.end(), key,
            [](node_metrics const& m, std::string const& k) { return m.key < k; });
        if (it == nodes.end() || it->key != key) return nullptr;
        return &*it;
    }
};

// =============================================================================
// Individual centralities
// =============================================================================

/// Brandes betweenness (directed, unweighted), normalised.
[[nodiscard]] inline std::vector<double> betweenness_centrality(runtime_graph const& g) {
    auto const n = g.node_count();
    std::vector<double> cb(n, 0.0);
    if (n <= 2) return cb;

    std::vector<std::vector<std::uint32_t>> pred(n);
    std::vector<double> sigma(n);
    std::vector<long long> dist(n);
    std::vector<double> delta(n);
    std::vector<std::uint32_t> order;   // nodes in non-decreasing distance
    order.reserve(n);

    for (std::size_t s = 0; s < n; ++s) {
        for (std::size_t v = 0; v < n; ++v) {
            pred[v].clear();
            sigma[v] = 0.0;
            dist[v] = -1;
            delta[v] = 0.0;
        }
        order.clear();
        sigma[s] = 1.0;
        dist[s] = 0;

        order.push_back(static_cast<std::uint32_t>(s));
        for (std::size_t head = 0; head < order.size(); ++head) {
            auto const v = order[head];
            for (auto w : g.out_neighbors(node_id{v})) {
                auto const wi = to_index(w);
                if (dist[wi] < 0) {
                    dist[wi] = dist[v] + 1;
                    order.push_back(w.value);
                }
                if (dist[wi] == dist[v] + 1) {
                    sigma[wi] += sigma[v];
                    pred[wi].push_back(v);
                }
            }
        }

        for (std::size_t i = order.size(); i-- > 0;) {
            auto const w = order[i];
            for (auto v : pred[w]) {
                delta[v] += sigma[v] / sigma[w] * (1.0 + delta[w]);
            }
            if (w != s) cb[w] += delta[w];
        }
    }

    double const scale = 1.0 / (static_cast<double>(n - 1) * static_cast<double>(n - 2));
    for (auto& c : cb) c *= scale;
    return cb;
}

/// Closeness over outgoing paths, Wasserman-Faust scaled.
[[nodiscard]] inline std::vector<double> closeness_centrality(runtime_graph const& g) {
    auto const n = g.node_count();
    std::vector<double> out(n, 0.0);
    if (n <= 1) return out;

    std::vector<long long> dist(n);
    std::vector<std::uint32_t> queue;
    for (std::size_t s = 0; s < n; ++s) {
        std::fill(dist.begin(), dist.end(), -1);
        queue.assign(1, static_cast<std::uint32_t>(s));
        dist[s] = 0;
        double sum_d = 0.0;
        double reached = 0.0;
        for (std::size_t head = 0; head < queue.size(); ++head) {
            auto const v = queue[head];
            for (auto w : g.out_neighbors(node_id{v})) {
                if (dist[to_index(w)] >= 0) continue;
                dist[to_index(w)] = dist[v] + 1;
                sum_d += static_cast<double>(dist[to_index(w)]);
                reached += 1.0;
                queue.push_back(w.value);
            }
        }
        if (sum_d > 0.0) {
            out[s] = (reached / sum_d) * (reached / static_cast<double>(n - 1));
        }
    }
    return out;
}

struct eigenvector_result {
    std::vector<double> values;
    bool converged = true;
    std::size_t iterations = 0;
};

/// Power iteration x <- (A^T + I) x from the uniform vector.
/// A node's score grows with the scores of the nodes depending on it.
[[nodiscard]] inline eigenvector_result
eigenvector_centrality(runtime_graph const& g, centrality_options const& opts = {}) {
    eigenvector_result r;
    auto const n = g.node_count();
    if (n == 0) return r;

    std::vector<double> x(n, 1.0 / static_cast<double>(n));
    std::vector<double> next(n);
    r.converged = false;

    for (std::size_t it = 0; it < opts.max_iterations; ++it) {
        next = x;
        for (std::size_t u = 0; u < n; ++u) {
            for (auto v : g.out_neighbors(node_id{static_cast<std::uint32_t>(u)})) {
                next[to_index(v)] += x[u];
            }
        }
        double norm = 0.0;
        for (double v : next) norm += v * v;
        norm = std::sqrt(norm);
        if (norm == 0.0) norm = 1.0;

        double err = 0.0;
        for (std::size_t v = 0; v < n; ++v) {
            next[v] /= norm;
            err += std::fabs(next[v] - x[v]);
        }
        x.swap(next);
        r.iterations = it + 1;
        if (err < static_cast<double>(n) * opts.tolerance) {
            r.converged = true;
            break;
        }
    }
    r.values = std::move(x);
    return r;
}

// =============================================================================
// compute_metrics
// =============================================================================

/// Every metric for every node.
///
/// Example:
/// ```cpp
/// auto table = compute_metrics(g);
/// if (auto const* m = table.find("billing")) use(m->instability);
/// ```
[[nodiscard]] inline metrics_table
compute_metrics(runtime_graph const& g, centrality_options const& opts = {}) {
    metrics_table table;
    auto const n = g.node_count();
    table.nodes.resize(n);

    for (std::size_t u = 0; u < n; ++u) {
        auto const uid = node_id{static_cast<std::uint32_t>(u)};
        table.nodes[u].key = g.key(uid);
        for (auto v : g.out_neighbors(uid)) {
            if (v == uid) continue;
            table.nodes[u].fan_out++;
            table.nodes[to_index(v)].fan_in++;
        }
    }

    std::vector<key_set> types(n);
    for (auto const& e : g.typed_edges()) types[to_index(e.src)].insert(e.type);

    auto const between = betweenness_centrality(g);
    auto const close = closeness_centrality(g);
    auto const eigen = eigenvector_centrality(g, opts);
    table.eigenvector_converged = eigen.converged;
    table.eigenvector_iterations = eigen.iterations;

    for (std::size_t u = 0; u < n; ++u) {
        auto& m = table.nodes[u];
        auto const fi = static_cast<double>(m.fan_in);
        auto const fo = static_cast<double>(m.fan_out);
        m.instability = (m.fan_in + m.fan_out == 0) ? 0.0 : fo / (fi + fo);
        m.coupling = fi * limits::coupling_fan_in_weight + fo * limits::coupling_fan_out_weight;
        m.degree_centrality = (n <= 1) ? 0.0 : (fi + fo) / (2.0 * static_cast<double>(n - 1));
        m.betweenness = between[u];
        m.closeness = close[u];
        m.eigenvector = eigen.values[u];
        m.dependency_types = types[u].size();
    }
    return table;
}

/// Nodes whose coupling is at or above the given percentile (0..1) of all
/// coupling scores.  A percentile outside 0..1 is clamped; NaN counts as 0.
/// Output in key order.
[[nodiscard]] inline std::vector<node_metrics>
high_coupling(metrics_table const& table,
              double percentile = limits::high_coupling_percentile) {
    std::vector<node_metrics> out;
    if (table.nodes.empty()) return out;
    if (!(percentile >= 0.0)) percentile = 0.0;
    if (percentile > 1.0) percentile = 1.0;

    std::vector<double> scores;
    scores.reserve(table.nodes.size());
    for (auto const& m : table.nodes) scores.push_back(m.coupling);
    std::sort(scores.begin(), scores.end());

    auto idx = static_cast<std::size_t>(static_cast<double>(scores.size()) * percentile);
    if (idx >= scores.size()) idx = scores.size() - 1;
    double const threshold = scores[idx];

    for (auto const& m : table.nodes) {
        if (m.coupling >= threshold) out.push_back(m);
    }
    return out;
}

} // namespace archgov::graph

#endif // ARCHGOV_GRAPH_METRICS_H
