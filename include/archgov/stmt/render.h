// stmt/render.h - Canonical statement text for formal expressions
// Part of the architectural statement engine (C++20)
//
// render() writes an expression back out with its primary scaffold.  The
// result parses to an equal expression with the same modal, which makes
// it suitable for normalising authored statements and for generating
// statement text from tooling.

#ifndef ARCHGOV_STMT_RENDER_H
#define ARCHGOV_STMT_RENDER_H

#include "expression.h"

#include <array>
#include <string>
#include <string_view>
#include <variant>

namespace archgov::stmt {

namespace detail {

[[nodiscard]] inline std::string token_text(std::string const& name) {
    return "$$$" + name + "$$$";
}

/// "must <base>", "should <base>", or the bare indicative form.
[[nodiscard]] inline std::string verb_phrase(modal m, std::string_view base,
                                             std::string_view indicative) {
    switch (m) {
    case modal::must:   return "must " + std::string(base);
    case modal::should: return "should " + std::string(base);
    case modal::none:   break;
    }
    return std::string(indicative);
}

[[nodiscard]] constexpr std::string_view op_words(cmp_op op) noexcept {
    switch (op) {
    case cmp_op::eq: return "exactly";
    case cmp_op::ne: return "not exactly";
    case cmp_op::ge: return "at least";
    case cmp_op::le: return "at most";
    case cmp_op::gt: return "more than";
    case cmp_op::lt: return "fewer than";
    }
    return "exactly";
}

} // namespace detail

/// Canonical text of an expression.
///
/// Example:
/// ```cpp
/// render(exclusion{"ui", "db", exclusion_reach::transitive, true}, modal::must);
/// // "$$$ui$$$ must not depend on $$$db$$$ transitively"
/// ```
[[nodiscard]] inline std::string render(formal_expression const& e, modal m) {
    using detail::token_text;
    using detail::verb_phrase;

    struct visitor {
        modal m;

        std::string operator()(existence const& x) const {
            return "there " + verb_phrase(m, "be", "is") + " " + token_text(x.ref);
        }
        std::string operator()(containment const& x) const {
            return token_text(x.subject) + " " + verb_phrase(m, "be", "is") + " in "
                 + token_text(x.container);
        }
        std::string operator()(exclusion const& x) const {
            auto out = token_text(x.source) + " " + verb_phrase(m, "not", "does not")
                     + " depend on " + token_text(x.target);
            if (x.qualified) {
                out += x.reach == exclusion_reach::transitive ? " transitively" : " directly";
            }
            return out;
        }
        std::string operator()(cardinality const& x) const {
            return "there " + verb_phrase(m, "be", "are") + " "
                 + std::string(detail::op_words(x.op)) + " " + std::to_string(x.count) + " "
                 + token_text(x.ref);
        }
        std::string operator()(coverage const& x) const {
            if (x.covers_all()) {
                return "all components " + verb_phrase(m, "belong", "belong")
                     + " to a group on " + token_text(x.layer);
            }
            return token_text(x.subject) + " " + verb_phrase(m, "belong", "belongs")
                 + " to a group on " + token_text(x.layer);
        }
        std::string operator()(correspondence const& x) const {
            return token_text(x.a) + " " + verb_phrase(m, "correspond", "corresponds")
                 + " to " + token_text(x.b);
        }
        std::string operator()(refinement const& x) const {
            return token_text(x.finer) + " " + verb_phrase(m, "refine", "refines") + " "
                 + token_text(x.coarser);
        }
    };
    return std::visit(visitor{m}, e);
}

// =============================================================================
// Templates
// =============================================================================

struct statement_template {
    statement_type type;
    std::string_view pattern;
};

/// Accepted phrasings, one entry per scaffold, in classification order.
/// A, B and R are $$$name$$$ tokens, L a layer reference, N a number.
[[nodiscard]] constexpr auto statement_templates() noexcept {
    return std::array<statement_template, 18>{{
        {statement_type::cardinality,    "there must be exactly|at least|at most N R"},
        {statement_type::cardinality,    "there must be more than|fewer than|less than N R"},
        {statement_type::cardinality,    "there must be not exactly N R"},
        {statement_type::cardinality,    "there must be no R"},
        {statement_type::coverage,       "all components must have an owner on L"},
        {statement_type::coverage,       "every component in the system must be covered by L"},
        {statement_type::coverage,       "[every] R must belong to a group on L"},
        {statement_type::correspondence, "A must correspond to|with B"},
        {statement_type::correspondence, "A must align|match with B"},
        {statement_type::refinement,     "A must refine B"},
        {statement_type::refinement,     "A must be a refinement of B"},
        {statement_type::refinement,     "A must nest within B"},
        {statement_type::existence,      "there must be R"},
        {statement_type::existence,      "R must exist"},
        {statement_type::containment,    "[every] A must be [contained] in B"},
        {statement_type::containment,    "[every] B must contain A"},
        {statement_type::exclusion,      "[every] A must not depend on B"},
        {statement_type::exclusion,      "A must not depend on B transitively|directly"},
    }};
}

} // namespace archgov::stmt

#endif // ARCHGOV_STMT_RENDER_H
