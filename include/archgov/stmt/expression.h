// stmt/expression.h - Typed formal expressions for the seven archetypes
// Part of the architectural statement engine (C++20)
//
// A formal statement is one alternative of formal_expression.  Each
// alternative names its reference slots by role; the evaluator gives each
// role its meaning.
//
//   existence       there must be R
//   containment     A must be in B
//   exclusion       A must not depend on B
//   cardinality     there must be OP N R
//   coverage        R must belong to a group on L
//   correspondence  A must correspond to B
//   refinement      A must refine B
//
// The coverage, correspondence and refinement slots marked as layer slots
// must be bound to layer references.

#ifndef ARCHGOV_STMT_EXPRESSION_H
#define ARCHGOV_STMT_EXPRESSION_H

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace archgov::stmt {

// =============================================================================
// Enumerations
// =============================================================================

/// The must/should modal of a statement.  It sets the severity of a
/// violation and never changes the verdict.
enum class modal { none, must, should };

enum class severity_level { none, warning, error };

enum class statement_type {
    existence,
    containment,
    exclusion,
    cardinality,
    coverage,
    correspondence,
    refinement,
    unclassified,
};

/// invalid: the statement parsed formally but names a reference whose
/// definition does not parse.
enum class statement_class { informal, semi_formal, formal, invalid };

enum class cmp_op { eq, ne, ge, le, gt, lt };

enum class exclusion_reach { direct, transitive };

[[nodiscard]] constexpr std::string_view to_string(modal m) noexcept {
    switch (m) {
    case modal::none:   return "none";
    case modal::must:   return "must";
    case modal::should: return "should";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(severity_level s) noexcept {
    switch (s) {
    case severity_level::none:    return "none";
    case severity_level::warning: return "warning";
    case severity_level::error:   return "error";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(statement_type t) noexcept {
    switch (t) {
    case statement_type::existence:      return "existence";
    case statement_type::containment:    return "containment";
    case statement_type::exclusion:      return "exclusion";
    case statement_type::cardinality:    return "cardinality";
    case statement_type::coverage:       return "coverage";
    case statement_type::correspondence: return "correspondence";
    case statement_type::refinement:     return "refinement";
    case statement_type::unclassified:   return "unclassified";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(statement_class c) noexcept {
    switch (c) {
    case statement_class::informal:    return "informal";
    case statement_class::semi_formal: return "semi_formal";
    case statement_class::formal:      return "formal";
    case statement_class::invalid:     return "invalid";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(exclusion_reach r) noexcept {
    return r == exclusion_reach::direct ? "direct" : "transitive";
}

/// Mathematical symbol of a comparison.
[[nodiscard]] constexpr std::string_view symbol(cmp_op op) noexcept {
    switch (op) {
    case cmp_op::eq: return "==";
    case cmp_op::ne: return "!=";
    case cmp_op::ge: return ">=";
    case cmp_op::le: return "<=";
    case cmp_op::gt: return ">";
    case cmp_op::lt: return "<";
    }
    return "?";
}

[[nodiscard]] constexpr bool compare(std::size_t lhs, cmp_op op, std::size_t rhs) noexcept {
    switch (op) {
    case cmp_op::eq: return lhs == rhs;
    case cmp_op::ne: return lhs != rhs;
    case cmp_op::ge: return lhs >= rhs;
    case cmp_op::le: return lhs <= rhs;
    case cmp_op::gt: return lhs > rhs;
    case cmp_op::lt: return lhs < rhs;
    }
    return false;
}

/// Severity of a violated statement with this modal.  Statements
/// without a modal are treated as must.
[[nodiscard]] constexpr severity_level violation_severity(modal m) noexcept {
    return m == modal::should ? severity_level::warning : severity_level::error;
}

// =============================================================================
// Expressions
// =============================================================================

/// Subject of a coverage statement about every component in the system.
inline constexpr std::string_view all_components = "*";

struct existence {
    std::string ref;
    bool operator==(existence const&) const = default;
};

struct containment {
    std::string subject;
    std::string container;
    bool operator==(containment const&) const = default;
};

struct exclusion {
    std::string source;
    std::string target;
    exclusion_reach reach = exclusion_reach::direct;
    bool qualified = false;   ///< reach was stated in the text
    bool operator==(exclusion const&) const = default;
};

struct cardinality {
    std::string ref;
    cmp_op op = cmp_op::eq;
    std::size_t count = 0;
    bool operator==(cardinality const&) const = default;
};

struct coverage {
    std::string subject;      ///< reference name, or all_components
    std::string layer;        ///< layer slot
    [[nodiscard]] bool covers_all() const noexcept { return subject == all_components; }
    bool operator==(coverage const&) const = default;
};

struct correspondence {
    std::string a;            ///< layer slot
    std::string b;            ///< layer slot
    bool operator==(correspondence const&) const = default;
};

struct refinement {
    std::string finer;        ///< layer slot
    std::string coarser;      ///< layer slot
    bool operator==(refinement const&) const = default;
};

using formal_expression = std::variant<existence, containment, exclusion, cardinality,
                                       coverage, correspondence, refinement>;

[[nodiscard]] inline statement_type type_of(formal_expression const& e) noexcept {
    // Alternatives are declared in statement_type order.
    return static_cast<statement_type>(e.index());
}

/// Reference names in slot order.  The all_components subject is not a
/// reference and is left out.
[[nodiscard]] inline std::vector<std::string> reference_names(formal_expression const& e) {
    struct visitor {
        std::vector<std::string> operator()(existence const& x) const { return {x.ref}; }
        std::vector<std::string> operator()(containment const& x) const {
            return {x.subject, x.container};
        }
        std::vector<std::string> operator()(exclusion const& x) const {
            return {x.source, x.target};
        }
        std::vector<std::string> operator()(cardinality const& x) const { return {x.ref}; }
        std::vector<std::string> operator()(coverage const& x) const {
            if (x.covers_all()) return {x.layer};
            return {x.subject, x.layer};
        }
        std::vector<std::string> operator()(correspondence const& x) const { return {x.a, x.b}; }
        std::vector<std::string> operator()(refinement const& x) const {
            return {x.finer, x.coarser};
        }
    };
    return std::visit(visitor{}, e);
}

/// Names bound to slots that require a layer reference.
[[nodiscard]] inline std::vector<std::string> layer_slots(formal_expression const& e) {
    if (auto const* c = std::get_if<coverage>(&e)) return {c->layer};
    if (auto const* c = std::get_if<correspondence>(&e)) return {c->a, c->b};
    if (auto const* r = std::get_if<refinement>(&e)) return {r->finer, r->coarser};
    return {};
}

} // namespace archgov::stmt

#endif // ARCHGOV_STMT_EXPRESSION_H
