// ref/resolver.h - Reference resolution
// Part of the architectural statement engine (C++20)
//
// resolve() turns a reference definition into the set of entity keys it
// denotes in a context.  It is a pure function: every call recomputes from
// the snapshot, and nothing is cached between calls.
//
// Semantics:
//   tag_expression  candidates = every entity of the scope; a candidate is
//                   a member iff its tags satisfy the expression.  NOT is
//                   complement within the candidates.  A malformed
//                   expression resolves to {} with a syntax diagnostic.
//   layer           layer members (or subtree members), restricted to
//                   entities of the scope.  Unknown layer -> {} with an
//                   unknown_layer diagnostic.
//   explicit_list   listed keys that exist in the scope; stale keys are
//                   dropped without a diagnostic.
//
// resolution_scope is the one sanctioned memo: a caller-owned object whose
// lifetime is a single evaluation sweep (one statement, one batch).  It
// counts hits and misses in eval_stats.

#ifndef ARCHGOV_REF_RESOLVER_H
#define ARCHGOV_REF_RESOLVER_H

#include "context.h"
#include "reference.h"
#include "tag_expression.h"

#include <archgov/core/diagnostic.h>
#include <archgov/core/eval_stats.h>
#include <archgov/core/key_set.h>

#include <map>
#include <string>
#include <utility>

namespace archgov::ref {

/// Resolve a definition against a context.
///
/// Example:
/// ```cpp
/// auto r = resolve(tag_reference("pci", "'payments' AND NOT 'sandbox'"), ctx);
/// for (auto const& key : r.members) audit(key);
/// ```
[[nodiscard]] inline resolution
resolve(reference_definition const& def, context const& ctx) {
    resolution out;
    auto const& candidates = ctx.entities(def.scope);

    switch (def.kind) {
    case reference_kind::tag_expression: {
        auto parsed = parse_tag_expression(def.expression);
        if (!parsed.ok()) {
            out.errors.push_back(std::move(*parsed.error));
            return out;
        }
        for (auto const& key : candidates) {
            if (parsed.expression->matches(ctx.tags().tags_of(key))) out.members.insert(key);
        }
        break;
    }
    case reference_kind::layer: {
        if (!ctx.layers().contains(def.layer_key)) {
            out.errors.push_back(make_diagnostic(error_kind::unknown_layer,
                "reference '" + def.name + "' names an unknown layer",
                no_position, def.layer_key));
            return out;
        }
        out.members = set_intersection(
            ctx.layers().members_of(def.layer_key, def.include_descendants), candidates);
        break;
    }
    case reference_kind::explicit_list: {
        for (auto const& key : def.members) {
            if (candidates.count(key) != 0) out.members.insert(key);
        }
        break;
    }
    }
    return out;
}

/// Resolve a reference by name.  Unknown names produce an
/// unresolved_reference diagnostic and an empty set.
[[nodiscard]] inline resolution
resolve(std::string const& name, context const& ctx) {
    if (auto const* def = ctx.find_reference(name)) return resolve(*def, ctx);
    resolution out;
    out.errors.push_back(make_diagnostic(error_kind::unresolved_reference,
        "unknown reference '" + name + "'", no_position, name));
    return out;
}

// =============================================================================
// resolution_scope
// =============================================================================

/// Per-sweep memo of resolutions by reference name.
///
/// Holds a reference to the context; the context must outlive the scope.
/// Discard the scope when the sweep ends.
class resolution_scope {
public:
    explicit resolution_scope(context const& ctx) : ctx_(&ctx) {}

    [[nodiscard]] resolution const& get(std::string const& name) {
        auto const it = memo_.find(name);
        if (it != memo_.end()) {
            ++stats_.memo_hits;
            return it->second;
        }
        ++stats_.memo_misses;
        ++stats_.resolutions;
        auto r = resolve(name, *ctx_);
        if (r.members.size() > stats_.max_resolution_size)
            stats_.max_resolution_size = r.members.size();
        return memo_.emplace(name, std::move(r)).first->second;
    }

    [[nodiscard]] context const& ctx() const noexcept { return *ctx_; }
    [[nodiscard]] eval_stats const& stats() const noexcept { return stats_; }
    [[nodiscard]] eval_stats& stats() noexcept { return stats_; }

private:
    context const* ctx_;
    std::map<std::string, resolution> memo_;
    eval_stats stats_;
};

} // namespace archgov::ref

#endif // ARCHGOV_REF_RESOLVER_H
