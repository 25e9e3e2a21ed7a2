// stmt/evaluator.h - Verdicts for formal statements
// Part of the architectural statement engine (C++20)
//
// SEMANTICS (A, B, R resolved through the context):
//   existence       R is non-empty
//   containment     A is a subset of B; evidence = A \ B
//   exclusion       no edge a -> b (direct) or no path of length >= 1
//                   (transitive) from a member of A to a member of B;
//                   evidence = offending (a, b) pairs
//   cardinality     |R| op N
//   coverage        every subject member lies in some group of L (in L
//                   itself when L has no groups); evidence = uncovered keys
//   correspondence  perfect 1:1 matching between the non-empty groups of
//                   A and B, matched groups having equal member sets
//   refinement      every non-empty A-group is a subset of exactly one
//                   B-group, and each B-group is the union of the A-groups
//                   mapped to it
//
// A group is a direct child layer; its member set is the union over its
// subtree, restricted to the entities of the reference scope.
//
// not_evaluated is returned, with diagnostics, when a reference is
// unknown or invalid, when a layer slot holds a non-layer reference
// (type_mismatch), or when two groups of one layer have identical member
// sets (ambiguous_match).  The modal only sets severity: violated + should
// is a warning, violated + must (or no modal) is an error.
//
// Complexity: containment and coverage O(|A| log |B|); exclusion O(E)
// direct, O(|A| (V + E)) transitive; correspondence and refinement
// O(G_a * G_b * S) set comparisons, G = group count, S = group size.

#ifndef ARCHGOV_STMT_EVALUATOR_H
#define ARCHGOV_STMT_EVALUATOR_H

#include "expression.h"
#include "parser.h"

#include <archgov/core/diagnostic.h>
#include <archgov/core/eval_stats.h>
#include <archgov/core/key_set.h>
#include <archgov/graph/bipartite_matching.h>
#include <archgov/graph/graph_concepts.h>
#include <archgov/graph/runtime_graph.h>
#include <archgov/graph/traversal.h>
#include <archgov/ref/context.h>
#include <archgov/ref/reference.h>
#include <archgov/ref/resolver.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace archgov::stmt {

// =============================================================================
// Result types
// =============================================================================

enum class verdict_status { satisfied, violated, not_evaluated };

[[nodiscard]] constexpr std::string_view to_string(verdict_status s) noexcept {
    switch (s) {
    case verdict_status::satisfied:     return "satisfied";
    case verdict_status::violated:      return "violated";
    case verdict_status::not_evaluated: return "not_evaluated";
    }
    return "unknown";
}

using key_pair = std::pair<std::string, std::string>;

struct verdict_evidence {
    key_set offending;               ///< uncovered or violating keys (entities or groups)
    std::vector<key_pair> edges;     ///< exclusion: offending (source, target) pairs
    std::vector<std::string> notes;

    [[nodiscard]] bool empty() const noexcept {
        return offending.empty() && edges.empty() && notes.empty();
    }
};

struct verdict {
    verdict_status status = verdict_status::not_evaluated;
    severity_level severity = severity_level::none;
    verdict_evidence evidence;
    diagnostics errors;

    [[nodiscard]] bool satisfied() const noexcept { return status == verdict_status::satisfied; }
    [[nodiscard]] bool violated() const noexcept { return status == verdict_status::violated; }
    [[nodiscard]] bool evaluated() const noexcept {
        return status != verdict_status::not_evaluated;
    }
};

struct evaluation_options {
    /// Reach of an exclusion whose text names none.
    exclusion_reach default_exclusion_reach = exclusion_reach::direct;
};

// =============================================================================
// Groups
// =============================================================================

struct group_set {
    std::string key;
    key_set members;
};

/// Non-empty groups of a layer reference, in layer key order.  errors
/// holds an ambiguous_match for each pair of groups with equal members.
struct group_partition {
    std::vector<group_set> groups;
    diagnostics errors;
};

[[nodiscard]] inline group_partition
groups_of(ref::reference_definition const& def, ref::context const& ctx) {
    group_partition out;
    auto const& scope = ctx.entities(def.scope);
    for (auto const& g : ctx.layers().groups_of(def.layer_key)) {
        auto members = set_intersection(ctx.layers().members_of(g, true), scope);
        if (members.empty()) continue;
        out.groups.push_back({g, std::move(members)});
    }
    for (std::size_t i = 0; i < out.groups.size(); ++i) {
        for (std::size_t j = i + 1; j < out.groups.size(); ++j) {
            if (out.groups[i].members != out.groups[j].members) continue;
            out.errors.push_back(make_diagnostic(error_kind::ambiguous_match,
                "groups '" + out.groups[i].key + "' and '" + out.groups[j].key
                    + "' of layer '" + def.layer_key + "' have identical members",
                no_position, out.groups[i].key + "," + out.groups[j].key));
        }
    }
    return out;
}

// =============================================================================
// Per-archetype checks
// =============================================================================

namespace detail {

struct evaluation_env {
    ref::context const& ctx;
    evaluation_options const& opts;
    ref::resolution_scope& scope;
};

/// Resolved members, or nullptr after recording why not.
[[nodiscard]] inline key_set const*
members(evaluation_env& env, std::string const& name, verdict& v) {
    auto const& r = env.scope.get(name);
    if (!r.ok()) {
        v.errors.insert(v.errors.end(), r.errors.begin(), r.errors.end());
        return nullptr;
    }
    return &r.members;
}

/// Definition behind a layer slot, or nullptr after recording why not.
[[nodiscard]] inline ref::reference_definition const*
layer_definition(evaluation_env& env, std::string const& name, verdict& v) {
    auto const* def = env.ctx.find_reference(name);
    if (def == nullptr) {
        v.errors.push_back(make_diagnostic(error_kind::unresolved_reference,
            "unknown reference '" + name + "'", no_position, name));
        return nullptr;
    }
    if (!def->layer_backed()) {
        v.errors.push_back(make_diagnostic(error_kind::type_mismatch,
            "reference '" + name + "' is not a layer reference", no_position, name));
        return nullptr;
    }
    if (!env.ctx.layers().contains(def->layer_key)) {
        v.errors.push_back(make_diagnostic(error_kind::unknown_layer,
            "reference '" + name + "' names an unknown layer", no_position, def->layer_key));
        return nullptr;
    }
    return def;
}

[[nodiscard]] inline verdict decide(bool holds, verdict v = {}) {
    v.status = holds ? verdict_status::satisfied : verdict_status::violated;
    return v;
}

[[nodiscard]] inline verdict check(evaluation_env& env, existence const& e) {
    verdict v;
    auto const* r = members(env, e.ref, v);
    if (r == nullptr) return v;
    if (r->empty()) v.evidence.notes.push_back("'" + e.ref + "' resolves to no members");
    return decide(!r->empty(), std::move(v));
}

[[nodiscard]] inline verdict check(evaluation_env& env, containment const& e) {
    verdict v;
    auto const* a = members(env, e.subject, v);
    auto const* b = members(env, e.container, v);
    if (a == nullptr || b == nullptr) return v;
    v.evidence.offending = set_difference(*a, *b);
    return decide(v.evidence.offending.empty(), std::move(v));
}

[[nodiscard]] inline verdict check(evaluation_env& env, exclusion const& e) {
    verdict v;
    auto const* a = members(env, e.source, v);
    auto const* b = members(env, e.target, v);
    if (a == nullptr || b == nullptr) return v;

    auto const* src_def = env.ctx.find_reference(e.source);
    auto const* dst_def = env.ctx.find_reference(e.target);
    if (src_def->scope != dst_def->scope) {
        v.errors.push_back(make_diagnostic(error_kind::type_mismatch,
            "'" + e.source + "' and '" + e.target + "' range over different entity kinds",
            no_position, e.target));
        return v;
    }

    auto reach = e.reach;
    if (!e.qualified) {
        reach = env.opts.default_exclusion_reach;
        v.evidence.notes.push_back("reach not stated; evaluated as "
                                   + std::string(to_string(reach)));
    }

    auto const& g = env.ctx.dependency_graph(src_def->scope);
    auto& stats = env.scope.stats();
    for (auto const& key : *a) {
        auto const u = g.find(key);
        if (u == graph::invalid_node) continue;

        if (reach == exclusion_reach::direct) {
            for (auto w : g.out_neighbors(u)) {
                ++stats.edges_scanned;
                if (b->count(g.key(w)) == 0) continue;
                v.evidence.edges.emplace_back(key, g.key(w));
                v.evidence.offending.insert(key);
            }
            continue;
        }

        auto const reached = graph::reachable_from(g, u);
        stats.edges_scanned += g.out_degree(u);
        for (std::size_t i = 0; i < reached.size(); ++i) {
            if (reached[i]) {
                stats.edges_scanned += g.out_degree(graph::node_id{static_cast<std::uint32_t>(i)});
            }
        }
        for (auto const& target : *b) {
            auto const t = g.find(target);
            if (t == graph::invalid_node || !reached[graph::to_index(t)]) continue;
            v.evidence.edges.emplace_back(key, target);
            v.evidence.offending.insert(key);
        }
    }
    return decide(v.evidence.edges.empty(), std::move(v));
}

[[nodiscard]] inline verdict check(evaluation_env& env, cardinality const& e) {
    verdict v;
    auto const* r = members(env, e.ref, v);
    if (r == nullptr) return v;
    v.evidence.notes.push_back("count " + std::to_string(r->size()) + " "
                               + std::string(symbol(e.op)) + " " + std::to_string(e.count));
    return decide(compare(r->size(), e.op, e.count), std::move(v));
}

[[nodiscard]] inline verdict check(evaluation_env& env, coverage const& e) {
    verdict v;
    auto const* def = layer_definition(env, e.layer, v);
    if (def == nullptr) return v;

    key_set const* subject = nullptr;
    if (e.covers_all()) {
        subject = &env.ctx.entities(def->scope);
    } else {
        subject = members(env, e.subject, v);
        if (subject == nullptr) return v;
    }

    key_set covered;
    auto const groups = env.ctx.layers().groups_of(def->layer_key);
    if (groups.empty()) {
        auto const* own = members(env, e.layer, v);
        if (own == nullptr) return v;
        covered = *own;
    } else {
        for (auto const& g : groups) {
            covered = set_union(covered, env.ctx.layers().members_of(g, true));
        }
    }
    v.evidence.offending = set_difference(*subject, covered);
    if (!v.evidence.offending.empty()) {
        v.evidence.notes.push_back(std::to_string(v.evidence.offending.size()) + " of "
                                   + std::to_string(subject->size()) + " not covered by '"
                                   + e.layer + "'");
    }
    return decide(v.evidence.offending.empty(), std::move(v));
}

/// Both layer slots as group partitions, or nullopt after recording why not.
[[nodiscard]] inline std::optional<std::pair<group_partition, group_partition>>
layer_pair(evaluation_env& env, std::string const& a, std::string const& b, verdict& v) {
    auto const* da = layer_definition(env, a, v);
    auto const* db = layer_definition(env, b, v);
    if (da == nullptr || db == nullptr) return std::nullopt;

    auto ga = groups_of(*da, env.ctx);
    auto gb = groups_of(*db, env.ctx);
    if (!ga.errors.empty() || !gb.errors.empty()) {
        for (auto const* p : {&ga, &gb}) {
            for (auto const& d : p->errors) {
                v.errors.push_back(d);
                v.evidence.notes.push_back(d.message);
            }
        }
        return std::nullopt;
    }
    return std::pair{std::move(ga), std::move(gb)};
}

[[nodiscard]] inline verdict check(evaluation_env& env, correspondence const& e) {
    verdict v;
    auto layers = layer_pair(env, e.a, e.b, v);
    if (!layers) return v;
    auto const& [ga, gb] = *layers;

    graph::bipartite_graph_builder builder(ga.groups.size(), gb.groups.size());
    for (std::size_t i = 0; i < ga.groups.size(); ++i) {
        for (std::size_t j = 0; j < gb.groups.size(); ++j) {
            if (ga.groups[i].members == gb.groups[j].members) builder.add_edge(i, j);
        }
    }
    auto const match = graph::hopcroft_karp(builder.finalise());

    for (std::size_t i = 0; i < ga.groups.size(); ++i) {
        if (match.left_matched(i)) continue;
        v.evidence.offending.insert(ga.groups[i].key);
        v.evidence.notes.push_back("group '" + ga.groups[i].key + "' of '" + e.a
                                   + "' has no identical group in '" + e.b + "'");
    }
    for (std::size_t j = 0; j < gb.groups.size(); ++j) {
        if (match.right_matched(j)) continue;
        v.evidence.offending.insert(gb.groups[j].key);
        v.evidence.notes.push_back("group '" + gb.groups[j].key + "' of '" + e.b
                                   + "' has no identical group in '" + e.a + "'");
    }
    return decide(match.is_perfect(), std::move(v));
}

[[nodiscard]] inline verdict check(evaluation_env& env, refinement const& e) {
    verdict v;
    auto layers = layer_pair(env, e.finer, e.coarser, v);
    if (!layers) return v;
    auto const& [fine, coarse] = *layers;

    graph::bipartite_graph_builder builder(fine.groups.size(), coarse.groups.size());
    for (std::size_t i = 0; i < fine.groups.size(); ++i) {
        for (std::size_t j = 0; j < coarse.groups.size(); ++j) {
            if (is_subset(fine.groups[i].members, coarse.groups[j].members)) {
                builder.add_edge(i, j);
            }
        }
    }
    auto const bg = builder.finalise();

    std::vector<key_set> mapped(coarse.groups.size());
    for (std::size_t i = 0; i < fine.groups.size(); ++i) {
        auto const& key = fine.groups[i].key;
        if (bg.left_degree(i) == 1) {
            auto const j = bg.left_neighbors(i).front();
            mapped[j] = set_union(mapped[j], fine.groups[i].members);
            continue;
        }
        v.evidence.offending.insert(key);
        v.evidence.notes.push_back(bg.left_degree(i) == 0
            ? "group '" + key + "' of '" + e.finer + "' is not inside any group of '"
                  + e.coarser + "'"
            : "group '" + key + "' of '" + e.finer + "' is inside more than one group of '"
                  + e.coarser + "'");
    }
    for (std::size_t j = 0; j < coarse.groups.size(); ++j) {
        if (mapped[j] == coarse.groups[j].members) continue;
        v.evidence.offending.insert(coarse.groups[j].key);
        v.evidence.notes.push_back("group '" + coarse.groups[j].key + "' of '" + e.coarser
                                   + "' is not exactly covered by groups of '" + e.finer
                                   + "'");
    }
    return decide(v.evidence.offending.empty(), std::move(v));
}

inline void finish(verdict& v, modal m, eval_stats& stats) {
    if (!v.errors.empty()) v.status = verdict_status::not_evaluated;
    v.severity = v.status == verdict_status::violated ? violation_severity(m)
                                                      : severity_level::none;
    switch (v.status) {
    case verdict_status::satisfied:     ++stats.satisfied; break;
    case verdict_status::violated:      ++stats.violated; break;
    case verdict_status::not_evaluated: ++stats.not_evaluated; break;
    }
}

} // namespace detail

// =============================================================================
// evaluate
// =============================================================================

/// Evaluate a formal expression.
///
/// With a resolution_scope, references are resolved through its memo
/// and counters land in its stats; without one, a scope local to this
/// call is used.
///
/// Example:
/// ```cpp
/// ref::resolution_scope scope(ctx);
/// auto v = evaluate(containment{"payment-services", "domain-layer"}, modal::must, ctx,
///                   {}, &scope);
/// if (v.violated()) report(v.evidence.offending);
/// ```
[[nodiscard]] inline verdict evaluate(formal_expression const& e, modal m,
                                      ref::context const& ctx,
                                      evaluation_options const& opts = {},
                                      ref::resolution_scope* scope = nullptr) {
    std::optional<ref::resolution_scope> local;
    if (scope == nullptr) scope = &local.emplace(ctx);

    detail::evaluation_env env{ctx, opts, *scope};
    auto v = std::visit([&env](auto const& x) { return detail::check(env, x); }, e);
    ++scope->stats().statements_evaluated;
    detail::finish(v, m, scope->stats());
    return v;
}

/// Evaluate a parsed statement.  Informal, semi-formal and invalid
/// statements are not evaluated; their parse diagnostics are carried over.
[[nodiscard]] inline verdict evaluate(parsed_statement const& p, ref::context const& ctx,
                                      evaluation_options const& opts = {},
                                      ref::resolution_scope* scope = nullptr) {
    if (p.is_formal() && p.expression) {
        return evaluate(*p.expression, p.modifier, ctx, opts, scope);
    }

    verdict v;
    v.errors = p.errors;
    v.evidence.notes.push_back("statement is " + std::string(to_string(p.classification)));
    if (scope != nullptr) ++scope->stats().not_evaluated;
    return v;
}

} // namespace archgov::stmt

#endif // ARCHGOV_STMT_EVALUATOR_H
