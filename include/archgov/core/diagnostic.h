// core/diagnostic.h - Error taxonomy carried as data
// Part of the architectural statement engine (C++20)
//
// Resolution, parsing and evaluation never throw for bad input.  Each
// problem becomes a diagnostic attached to the reference or statement it
// concerns.  Exceptions are reserved for builder misuse (a node id that
// is out of range, a duplicate node key), the same as the graph builders.

#ifndef ARCHGOV_CORE_DIAGNOSTIC_H
#define ARCHGOV_CORE_DIAGNOSTIC_H

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace archgov {

enum class error_kind {
    syntax,                 ///< malformed tag expression or statement slot
    unresolved_reference,   ///< statement names a reference that does not exist
    ambiguous_match,        ///< group matching has more than one valid answer
    type_mismatch,          ///< layer slot bound to a non-layer reference
    unknown_layer,          ///< layer reference names a missing layer
    invalid_snapshot,       ///< snapshot validation finding
};

[[nodiscard]] constexpr std::string_view to_string(error_kind k) noexcept {
    switch (k) {
    case error_kind::syntax:               return "syntax";
    case error_kind::unresolved_reference: return "unresolved_reference";
    case error_kind::ambiguous_match:      return "ambiguous_match";
    case error_kind::type_mismatch:        return "type_mismatch";
    case error_kind::unknown_layer:        return "unknown_layer";
    case error_kind::invalid_snapshot:     return "invalid_snapshot";
    }
    return "unknown";
}

/// Sentinel for diagnostics that have no source position.
inline constexpr std::size_t no_position = ~std::size_t{0};

/// One problem found in a reference, a statement or a snapshot.
///
/// - position: byte offset into the source text, or no_position
/// - token:    the offending token text (may be empty)
struct diagnostic {
    error_kind kind = error_kind::syntax;
    std::string message;
    std::size_t position = no_position;
    std::string token;

    [[nodiscard]] bool has_position() const noexcept {
        return position != no_position;
    }

    bool operator==(diagnostic const&) const = default;
};

using diagnostics = std::vector<diagnostic>;

[[nodiscard]] inline diagnostic make_diagnostic(error_kind kind,
                                                std::string message,
                                                std::size_t position = no_position,
                                                std::string token = {}) {
    return diagnostic{kind, std::move(message), position, std::move(token)};
}

/// True if any diagnostic in the list is of the given kind.
[[nodiscard]] inline bool has_kind(diagnostics const& ds, error_kind kind) noexcept {
    for (auto const& d : ds) {
        if (d.kind == kind) return true;
    }
    return false;
}

} // namespace archgov

#endif // ARCHGOV_CORE_DIAGNOSTIC_H
