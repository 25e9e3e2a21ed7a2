// stmt/parser.h - Statement classification: scaffold combinators and parser
// Part of the architectural statement engine (C++20)
//
// PIPELINE:
//   1. scan_statement() splits the text into words and $$$name$$$ tokens.
//   2. The first "must" or "should" is removed and kept as the modal, so
//      the modal may sit anywhere in the sentence.
//   3. Scaffolds are tried in a fixed order: cardinality, coverage,
//      correspondence, refinement, existence, containment, exclusion.
//      A scaffold must consume every token.  The first match wins.
//   4. Classification:
//        no scaffold matches                  -> informal
//        scaffold matches, bad numeric slot   -> informal + syntax diagnostic
//        scaffold matches, unknown names      -> semi_formal
//        otherwise                            -> formal
//      The context overload also checks that layer slots are bound to
//      layer references (type_mismatch -> semi_formal).
//
// COMBINATORS (namespace scaffold)
//   A matcher is any callable (match_state&) -> bool.  On failure a
//   composite matcher restores the state it was given.
//
//   kw(w...)        next token is one of the words (case-insensitive)
//   reference()     next token is a reference; its name is captured
//   number()        next token is a word; captured for numeric validation
//   mark(l, m)      m matches; label l is recorded
//   opt(m)          m or nothing
//   seq(m...)       all in order
//   alt(m...)       first that matches
//   end()           no tokens left
//
// Each archetype has its own match_<type>() over the modal-free tokens,
// so archetypes can be tested one at a time.

#ifndef ARCHGOV_STMT_PARSER_H
#define ARCHGOV_STMT_PARSER_H

#include "expression.h"
#include "scanner.h"

#include <archgov/core/diagnostic.h>
#include <archgov/core/key_set.h>
#include <archgov/core/text.h>
#include <archgov/ref/context.h>

#include <algorithm>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace archgov::stmt {

// =============================================================================
// Match state and combinators
// =============================================================================

struct match_state {
    std::span<token const> tokens;
    std::size_t pos = 0;
    std::vector<std::string> refs;      ///< captured reference names, in order
    std::vector<token> numbers;         ///< captured numeric slot tokens
    std::vector<std::string> marks;     ///< labels recorded by mark()

    [[nodiscard]] token const* peek() const noexcept {
        return pos < tokens.size() ? &tokens[pos] : nullptr;
    }
};

namespace scaffold {

struct saved_state {
    std::size_t pos, refs, numbers, marks;

    explicit saved_state(match_state const& s) noexcept
        : pos(s.pos), refs(s.refs.size()), numbers(s.numbers.size()), marks(s.marks.size()) {}

    void restore(match_state& s) const {
        s.pos = pos;
        s.refs.resize(refs);
        s.numbers.resize(numbers);
        s.marks.resize(marks);
    }
};

template<typename M>
bool attempt(M const& m, match_state& s) {
    saved_state const saved(s);
    if (m(s)) return true;
    saved.restore(s);
    return false;
}

template<typename... Words>
[[nodiscard]] auto kw(Words... words) {
    return [... words = std::string_view(words)](match_state& s) -> bool {
        auto const* t = s.peek();
        if (t == nullptr || !(t->is(words) || ...)) return false;
        ++s.pos;
        return true;
    };
}

[[nodiscard]] inline auto reference() {
    return [](match_state& s) -> bool {
        auto const* t = s.peek();
        if (t == nullptr || !t->is_reference()) return false;
        s.refs.push_back(t->text);
        ++s.pos;
        return true;
    };
}

[[nodiscard]] inline auto number() {
    return [](match_state& s) -> bool {
        auto const* t = s.peek();
        if (t == nullptr || t->is_reference()) return false;
        s.numbers.push_back(*t);
        ++s.pos;
        return true;
    };
}

template<typename M>
[[nodiscard]] auto mark(std::string_view label, M m) {
    return [label, m](match_state& s) -> bool {
        if (!m(s)) return false;
        s.marks.emplace_back(label);
        return true;
    };
}

template<typename M>
[[nodiscard]] auto opt(M m) {
    return [m](match_state& s) -> bool {
        (void)attempt(m, s);
        return true;
    };
}

template<typename... Ms>
[[nodiscard]] auto seq(Ms... ms) {
    return [... ms = ms](match_state& s) -> bool {
        saved_state const saved(s);
        if ((ms(s) && ...)) return true;
        saved.restore(s);
        return false;
    };
}

template<typename... Ms>
[[nodiscard]] auto alt(Ms... ms) {
    return [... ms = ms](match_state& s) -> bool {
        return (attempt(ms, s) || ...);
    };
}

[[nodiscard]] inline auto end() {
    return [](match_state& s) -> bool { return s.pos == s.tokens.size(); };
}

// Shared phrases.
[[nodiscard]] inline auto be() { return kw("be", "is", "are"); }
[[nodiscard]] inline auto quantifier() { return opt(kw("every", "all", "each")); }

} // namespace scaffold

[[nodiscard]] inline bool has_mark(match_state const& s, std::string_view label) {
    return std::find(s.marks.begin(), s.marks.end(), label) != s.marks.end();
}

// =============================================================================
// Archetype scaffolds
// =============================================================================

/// Outcome of a scaffold that matched.  expression is empty when a slot
/// value is malformed; errors says which.
struct scaffold_match {
    statement_type type = statement_type::unclassified;
    std::optional<formal_expression> expression;
    diagnostics errors;
};

namespace detail {

template<typename M>
[[nodiscard]] std::optional<match_state> run(M const& m, std::span<token const> toks) {
    match_state s{toks};
    if (!m(s)) return std::nullopt;
    return s;
}

} // namespace detail

/// there must be R / R must exist
[[nodiscard]] inline std::optional<scaffold_match> match_existence(std::span<token const> toks) {
    using namespace scaffold;
    auto const m = alt(
        seq(kw("there"), kw("be", "is", "are", "exist", "exists"), reference(), end()),
        seq(reference(), kw("exist", "exists"), end()));
    auto s = detail::run(m, toks);
    if (!s) return std::nullopt;
    return scaffold_match{statement_type::existence, existence{s->refs[0]}, {}};
}

/// [every] A must be [contained] in B / [every] B must contain A
[[nodiscard]] inline std::optional<scaffold_match> match_containment(std::span<token const> toks) {
    using namespace scaffold;
    auto const m = alt(
        seq(quantifier(), reference(), be(), opt(kw("contained", "located", "placed")),
            kw("in", "within", "inside"), reference(), end()),
        mark("reversed", seq(quantifier(), reference(), kw("contain", "contains"), quantifier(),
                             reference(), end())));
    auto s = detail::run(m, toks);
    if (!s) return std::nullopt;
    containment c;
    if (has_mark(*s, "reversed")) {
        c.container = s->refs[0];
        c.subject = s->refs[1];
    } else {
        c.subject = s->refs[0];
        c.container = s->refs[1];
    }
    return scaffold_match{statement_type::containment, std::move(c), {}};
}

/// [every] A must not [transitively|directly] depend on B [transitively|directly]
[[nodiscard]] inline std::optional<scaffold_match> match_exclusion(std::span<token const> toks) {
    using namespace scaffold;
    auto const negation = alt(seq(opt(kw("does", "do")), kw("not")), kw("never", "cannot"));
    auto const reach = alt(mark("transitive", kw("transitively", "indirectly")),
                           mark("direct", kw("directly")));
    auto const m = seq(quantifier(), reference(), negation, opt(reach), kw("depend", "depends"),
                       opt(kw("on", "upon")), reference(), opt(reach), end());
    auto s = detail::run(m, toks);
    if (!s) return std::nullopt;
    exclusion e{s->refs[0], s->refs[1]};
    for (auto const& label : s->marks) {
        if (label != "transitive" && label != "direct") continue;
        e.reach = label == "transitive" ? exclusion_reach::transitive : exclusion_reach::direct;
        e.qualified = true;
        break;
    }
    return scaffold_match{statement_type::exclusion, std::move(e), {}};
}

namespace detail {

[[nodiscard]] constexpr cmp_op negate(cmp_op op) noexcept {
    switch (op) {
    case cmp_op::eq: return cmp_op::ne;
    case cmp_op::ne: return cmp_op::eq;
    case cmp_op::ge: return cmp_op::lt;
    case cmp_op::le: return cmp_op::gt;
    case cmp_op::gt: return cmp_op::le;
    case cmp_op::lt: return cmp_op::ge;
    }
    return op;
}

} // namespace detail

/// there must [not] be [not] OP N R / there must be no R
[[nodiscard]] inline std::optional<scaffold_match> match_cardinality(std::span<token const> toks) {
    using namespace scaffold;
    auto const op = alt(mark("eq", kw("exactly")),
                        mark("ge", seq(kw("at"), kw("least"))),
                        mark("le", seq(kw("at"), kw("most"))),
                        mark("gt", seq(kw("more"), kw("than"))),
                        mark("lt", seq(kw("fewer", "less"), kw("than"))));
    auto const m = seq(kw("there"), opt(mark("not", kw("not"))), be(),
                       alt(mark("none", kw("no")),
                           seq(opt(mark("not", kw("not"))), op, number())),
                       reference(), end());
    auto s = detail::run(m, toks);
    if (!s) return std::nullopt;

    scaffold_match out{statement_type::cardinality, std::nullopt, {}};
    cardinality c{s->refs[0]};
    // Each "not" flips the comparison; "not ... not" cancels out.
    auto const negated = std::count(s->marks.begin(), s->marks.end(), "not") % 2 == 1;
    if (has_mark(*s, "none")) {
        c.op = negated ? cmp_op::ne : cmp_op::eq;
        c.count = 0;
        out.expression = std::move(c);
        return out;
    }
    auto const& slot = s->numbers[0];
    auto const n = text::parse_count(slot.text);
    if (!n) {
        out.errors.push_back(make_diagnostic(error_kind::syntax,
            "expected a non-negative integer", slot.position, slot.text));
        return out;
    }
    c.count = *n;
    for (auto const& [label, value] : {std::pair{"eq", cmp_op::eq}, std::pair{"ge", cmp_op::ge},
                                       std::pair{"le", cmp_op::le}, std::pair{"gt", cmp_op::gt},
                                       std::pair{"lt", cmp_op::lt}}) {
        if (has_mark(*s, label)) c.op = value;
    }
    if (negated) c.op = detail::negate(c.op);
    out.expression = std::move(c);
    return out;
}

/// SUBJECT must have an owner on L / be covered by L / belong to a group on L
/// SUBJECT: all components | every component in the system | [every] R
[[nodiscard]] inline std::optional<scaffold_match> match_coverage(std::span<token const> toks) {
    using namespace scaffold;
    auto const subject = alt(
        mark("all", seq(kw("all", "every", "each"), kw("components", "component"),
                        opt(seq(kw("in"), kw("the"), kw("system"))))),
        seq(quantifier(), reference()));
    auto const place = seq(kw("on", "in", "by"), opt(kw("layer")));
    auto const predicate = alt(
        seq(kw("have", "has"), kw("an", "a"), kw("owner"), place, reference()),
        seq(be(), kw("covered"), kw("by"), opt(kw("layer")), reference()),
        seq(kw("belong", "belongs"), kw("to"), kw("a"), kw("group"), place, reference()));
    auto const m = seq(subject, predicate, end());
    auto s = detail::run(m, toks);
    if (!s) return std::nullopt;
    coverage c;
    if (has_mark(*s, "all")) {
        c.subject = std::string(all_components);
        c.layer = s->refs[0];
    } else {
        c.subject = s->refs[0];
        c.layer = s->refs[1];
    }
    return scaffold_match{statement_type::coverage, std::move(c), {}};
}

/// A must correspond to B (also align, match; with or to)
[[nodiscard]] inline std::optional<scaffold_match>
match_correspondence(std::span<token const> toks) {
    using namespace scaffold;
    auto const m = seq(reference(),
                       kw("correspond", "corresponds", "align", "aligns", "match", "matches"),
                       opt(kw("with", "to")), reference(), end());
    auto s = detail::run(m, toks);
    if (!s) return std::nullopt;
    return scaffold_match{statement_type::correspondence,
                          correspondence{s->refs[0], s->refs[1]}, {}};
}

/// A must refine B / A must be a refinement of B / A must nest within B
[[nodiscard]] inline std::optional<scaffold_match> match_refinement(std::span<token const> toks) {
    using namespace scaffold;
    auto const m = seq(reference(),
                       alt(kw("refine", "refines"),
                           seq(be(), kw("a"), kw("refinement"), kw("of")),
                           seq(kw("nest", "nests"), kw("within", "in", "inside"))),
                       reference(), end());
    auto s = detail::run(m, toks);
    if (!s) return std::nullopt;
    return scaffold_match{statement_type::refinement, refinement{s->refs[0], s->refs[1]}, {}};
}

/// Try every scaffold in classification order.
[[nodiscard]] inline std::optional<scaffold_match> match_scaffold(std::span<token const> toks) {
    using matcher = std::optional<scaffold_match> (*)(std::span<token const>);
    static constexpr matcher order[] = {
        match_cardinality, match_coverage,  match_correspondence, match_refinement,
        match_existence,   match_containment, match_exclusion,
    };
    for (auto const m : order) {
        if (auto r = m(toks)) return r;
    }
    return std::nullopt;
}

/// Guess the archetype of free text from indicator phrases alone, without
/// matching a scaffold.  Checked in order, case-insensitively: cardinality,
/// coverage, correspondence, refinement, exclusion, containment, existence.
/// Useful for suggesting a rewrite of an informal statement.
///
/// Example:
/// ```cpp
/// detect_statement_type("Payments must have at least two owners");
/// // statement_type::cardinality
/// ```
[[nodiscard]] inline std::optional<statement_type> detect_statement_type(std::string_view sv) {
    static constexpr std::string_view cardinality_words[] = {
        "exactly", "at least", "at most", "more than", "fewer than", "less than"};
    static constexpr std::string_view coverage_words[] = {
        "have an owner", "have a owner", "covered by", "belong to a group on",
        "belong to an group on"};
    static constexpr std::string_view correspondence_words[] = {
        "correspond", "aligns with", "align with", "matches with", "match with"};
    static constexpr std::string_view refinement_words[] = {
        "refine", "refinement of", "nests within", "nest within"};
    static constexpr std::string_view exclusion_words[] = {"not depend"};
    static constexpr std::string_view containment_words[] = {
        "be in", "be contained", "must contain", "should contain"};
    static constexpr std::string_view existence_words[] = {
        "exist", "there must be", "there should be"};

    auto const lowered = text::lower(sv);
    auto const any_of = [&](std::span<std::string_view const> words) {
        return std::any_of(words.begin(), words.end(), [&](std::string_view w) {
            return lowered.find(w) != std::string::npos;
        });
    };
    if (any_of(cardinality_words)) return statement_type::cardinality;
    if (any_of(coverage_words)) return statement_type::coverage;
    if (any_of(correspondence_words)) return statement_type::correspondence;
    if (any_of(refinement_words)) return statement_type::refinement;
    if (any_of(exclusion_words)) return statement_type::exclusion;
    if (any_of(containment_words)) return statement_type::containment;
    if (any_of(existence_words)) return statement_type::existence;
    return std::nullopt;
}

// =============================================================================
// parse_statement
// =============================================================================

struct parsed_statement {
    std::string text;
    statement_class classification = statement_class::informal;
    modal modifier = modal::none;
    statement_type type = statement_type::unclassified;
    std::optional<formal_expression> expression;    ///< formal and semi_formal only
    std::vector<std::string> references;             ///< every $$$name$$$, first appearance
    std::vector<std::string> unresolved_names;
    diagnostics errors;

    [[nodiscard]] bool is_formal() const noexcept {
        return classification == statement_class::formal;
    }
};

/// Remove the first must/should word and return its modal.
inline modal extract_modal(std::vector<token>& toks) {
    for (auto it = toks.begin(); it != toks.end(); ++it) {
        if (it->is("must") || it->is("should")) {
            auto const m = it->is("must") ? modal::must : modal::should;
            toks.erase(it);
            return m;
        }
    }
    return modal::none;
}

/// Classify a statement against the set of known reference names.
///
/// Example:
/// ```cpp
/// auto p = parse_statement("$$$payment-services$$$ must be in $$$domain-layer$$$",
///                          {"payment-services", "domain-layer"});
/// // p.classification == statement_class::formal, p.type == statement_type::containment
/// ```
[[nodiscard]] inline parsed_statement parse_statement(std::string_view text,
                                                      key_set const& known) {
    parsed_statement out;
    out.text = std::string(text);

    auto toks = scan_statement(text);
    for (auto const& t : toks) {
        if (t.is_reference()
            && std::find(out.references.begin(), out.references.end(), t.text)
                   == out.references.end()) {
            out.references.push_back(t.text);
        }
    }
    out.modifier = extract_modal(toks);

    auto m = match_scaffold(toks);
    if (!m) return out;
    if (!m->expression) {
        out.errors = std::move(m->errors);
        return out;
    }

    out.type = m->type;
    out.expression = std::move(m->expression);
    for (auto const& name : reference_names(*out.expression)) {
        if (known.count(name) != 0) continue;
        if (std::find(out.unresolved_names.begin(), out.unresolved_names.end(), name)
            != out.unresolved_names.end()) {
            continue;
        }
        out.unresolved_names.push_back(name);
        auto const tok = std::find_if(toks.begin(), toks.end(), [&](token const& t) {
            return t.is_reference() && t.text == name;
        });
        out.errors.push_back(make_diagnostic(error_kind::unresolved_reference,
            "unknown reference '" + name + "'",
            tok == toks.end() ? no_position : tok->position, name));
    }
    out.classification = out.unresolved_names.empty() ? statement_class::formal
                                                       : statement_class::semi_formal;
    return out;
}

/// Classify a statement against a context's references, and check that
/// layer slots are bound to layer references.  A statement naming a tag
/// expression reference that does not parse is invalid and carries the
/// definition's syntax error.
[[nodiscard]] inline parsed_statement parse_statement(std::string_view text,
                                                      ref::context const& ctx) {
    auto out = parse_statement(text, ctx.reference_names());
    if (!out.expression) return out;
    for (auto const& name : layer_slots(*out.expression)) {
        auto const* def = ctx.find_reference(name);
        if (def == nullptr || def->layer_backed()) continue;
        out.errors.push_back(make_diagnostic(error_kind::type_mismatch,
            "reference '" + name + "' is not a layer reference", no_position, name));
        out.classification = statement_class::semi_formal;
    }
    std::vector<std::string> broken;
    for (auto const& name : reference_names(*out.expression)) {
        auto const* err = ctx.definition_error(name);
        if (err == nullptr || std::find(broken.begin(), broken.end(), name) != broken.end()) {
            continue;
        }
        broken.push_back(name);
        out.errors.push_back(*err);
    }
    if (!broken.empty()) out.classification = statement_class::invalid;
    return out;
}

} // namespace archgov::stmt

#endif // ARCHGOV_STMT_PARSER_H
