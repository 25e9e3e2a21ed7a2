// ref/reference.h - Named reference definitions
// Part of the architectural statement engine (C++20)
//
// A reference is a named, dynamically computed set of components (or
// endpoints).  The definition never stores membership: it is resolved
// against the current context on every request.  Three kinds:
//
//   tag_expression  entities whose tags satisfy a boolean tag expression
//   layer           the members of a layer, optionally with its subtree
//   explicit_list   a fixed list of keys; keys that no longer exist are
//                   dropped silently at resolution time
//
// Only layer references carry groups, so only they can fill the layer
// slots of coverage, correspondence and refinement statements.

#ifndef ARCHGOV_REF_REFERENCE_H
#define ARCHGOV_REF_REFERENCE_H

#include <archgov/core/diagnostic.h>
#include <archgov/core/key_set.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace archgov::ref {

enum class reference_kind { tag_expression, layer, explicit_list };

/// Which entities a reference ranges over.
enum class entity_scope { components, endpoints };

[[nodiscard]] constexpr std::string_view to_string(reference_kind k) noexcept {
    switch (k) {
    case reference_kind::tag_expression: return "tag_expression";
    case reference_kind::layer:          return "layer";
    case reference_kind::explicit_list:  return "explicit_list";
    }
    return "unknown";
}

struct reference_definition {
    std::string name;
    reference_kind kind = reference_kind::explicit_list;
    std::string expression;             ///< tag_expression source text
    std::string layer_key;              ///< layer
    bool include_descendants = false;   ///< layer
    std::vector<std::string> members;   ///< explicit_list
    entity_scope scope = entity_scope::components;

    [[nodiscard]] bool layer_backed() const noexcept { return kind == reference_kind::layer; }

    bool operator==(reference_definition const&) const = default;
};

[[nodiscard]] inline reference_definition
tag_reference(std::string name, std::string expression,
              entity_scope scope = entity_scope::components) {
    reference_definition d;
    d.name = std::move(name);
    d.kind = reference_kind::tag_expression;
    d.expression = std::move(expression);
    d.scope = scope;
    return d;
}

[[nodiscard]] inline reference_definition
layer_reference(std::string name, std::string layer_key, bool include_descendants = false,
                entity_scope scope = entity_scope::components) {
    reference_definition d;
    d.name = std::move(name);
    d.kind = reference_kind::layer;
    d.layer_key = std::move(layer_key);
    d.include_descendants = include_descendants;
    d.scope = scope;
    return d;
}

[[nodiscard]] inline reference_definition
list_reference(std::string name, std::vector<std::string> members,
               entity_scope scope = entity_scope::components) {
    reference_definition d;
    d.name = std::move(name);
    d.kind = reference_kind::explicit_list;
    d.members = std::move(members);
    d.scope = scope;
    return d;
}

/// Resolved membership of a reference.
///
/// A reference with a diagnostic (bad tag expression, unknown layer)
/// resolves to the empty set; the diagnostic says why.
struct resolution {
    key_set members;
    diagnostics errors;

    [[nodiscard]] bool ok() const noexcept { return errors.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return members.size(); }
};

} // namespace archgov::ref

#endif // ARCHGOV_REF_REFERENCE_H
