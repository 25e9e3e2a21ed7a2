// ref/definition_parser.h - Reference definitions from their authored text
// Part of the architectural statement engine (C++20)
//
// Accepted phrasings (keywords case-insensitive):
//
//   components tagged with <tag expression>
//   endpoints tagged with <tag expression>
//   components on $$$layer$$$            layer members
//   components on layer $$$layer$$$
//   groups on [layer] $$$layer$$$        members of the layer and its subtree
//   components in $$$layer$$$
//   components under $$$layer$$$         members of the layer and its subtree
//   components: key-a, key-b, key-c
//
// Any leading "components" may be "endpoints" to range over endpoints.
// A syntax error inside a tag expression is reported at its position in
// the whole definition text, not in the expression.

#ifndef ARCHGOV_REF_DEFINITION_PARSER_H
#define ARCHGOV_REF_DEFINITION_PARSER_H

#include "reference.h"
#include "tag_expression.h"

#include <archgov/core/diagnostic.h>
#include <archgov/core/text.h>

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace archgov::ref {

struct definition_parse_result {
    std::optional<reference_definition> definition;
    diagnostics errors;

    [[nodiscard]] bool ok() const noexcept { return definition.has_value(); }
};

namespace detail {

/// Word-at-a-time cursor over a definition.
struct definition_cursor {
    std::string_view src;
    std::size_t pos = 0;

    void skip() noexcept { pos = text::skip_space(src, pos); }

    [[nodiscard]] bool at_end() noexcept {
        skip();
        return pos >= src.size();
    }

    /// Consume `word` if it is the next whole word.
    bool keyword(std::string_view word) noexcept {
        skip();
        if (!text::istarts_with(src, pos, word)) return false;
        auto const after = pos + word.size();
        if (after < src.size() && text::is_name_char(src[after])) return false;
        pos = after;
        return true;
    }

    bool symbol(char c) noexcept {
        skip();
        if (pos >= src.size() || src[pos] != c) return false;
        ++pos;
        return true;
    }

    /// Consume a `$$$key$$$` token and return its key.
    std::optional<std::string> layer_token() {
        skip();
        if (!text::istarts_with(src, pos, "$$$")) return std::nullopt;
        auto const start = pos + 3;
        auto end = start;
        while (end < src.size() && text::is_key_char(src[end])) ++end;
        if (end == start || !text::istarts_with(src, end, "$$$")) return std::nullopt;
        pos = end + 3;
        return std::string(src.substr(start, end - start));
    }
};

[[nodiscard]] inline diagnostic definition_error(std::string message, std::size_t pos,
                                                 std::string_view src) {
    auto const tail = text::trim(src.substr(std::min(pos, src.size())));
    return make_diagnostic(error_kind::syntax, std::move(message), pos,
                           std::string(tail.substr(0, tail.find(' '))));
}

} // namespace detail

/// Parse the authored text of a reference definition.
///
/// Example:
/// ```cpp
/// auto r = parse_reference_definition("pci", "components tagged with 'payment' AND 'api'");
/// // r.definition->kind == reference_kind::tag_expression
///
/// auto l = parse_reference_definition("teams", "groups on layer $$$ownership$$$");
/// // l.definition->layer_key == "ownership", include_descendants == true
/// ```
[[nodiscard]] inline definition_parse_result
parse_reference_definition(std::string name, std::string_view src) {
    definition_parse_result out;
    detail::definition_cursor cur{src};

    auto scope = entity_scope::components;
    bool groups = false;
    if (cur.keyword("groups")) {
        groups = true;
    } else if (cur.keyword("endpoints")) {
        scope = entity_scope::endpoints;
    } else if (!cur.keyword("components")) {
        cur.skip();
        out.errors.push_back(detail::definition_error(
            "expected 'components', 'endpoints' or 'groups'", cur.pos, src));
        return out;
    }

    // components: a, b, c
    if (!groups && cur.symbol(':')) {
        std::vector<std::string> keys;
        while (true) {
            cur.skip();
            auto const start = cur.pos;
            while (cur.pos < src.size() && text::is_key_char(src[cur.pos])) ++cur.pos;
            if (cur.pos == start) {
                out.errors.push_back(detail::definition_error("expected a key", start, src));
                return out;
            }
            keys.emplace_back(src.substr(start, cur.pos - start));
            if (!cur.symbol(',')) break;
        }
        if (!cur.at_end()) {
            out.errors.push_back(detail::definition_error(
                "unexpected text after key list", cur.pos, src));
            return out;
        }
        out.definition = list_reference(std::move(name), std::move(keys), scope);
        return out;
    }

    // components tagged with <expr>
    if (!groups && cur.keyword("tagged")) {
        if (!cur.keyword("with")) {
            cur.skip();
            out.errors.push_back(detail::definition_error("expected 'with'", cur.pos, src));
            return out;
        }
        cur.skip();
        auto const offset = cur.pos;
        auto const expr = text::trim(src.substr(offset));
        auto parsed = parse_tag_expression(expr);
        if (!parsed.ok()) {
            auto err = std::move(*parsed.error);
            if (err.has_position()) err.position += offset;
            out.errors.push_back(std::move(err));
            return out;
        }
        out.definition = tag_reference(std::move(name), std::string(expr), scope);
        return out;
    }

    bool descendants = groups;
    if (cur.keyword("on")) {
        (void)cur.keyword("layer");
    } else if (!groups && cur.keyword("in")) {
        descendants = false;
    } else if (!groups && cur.keyword("under")) {
        descendants = true;
    } else {
        cur.skip();
        out.errors.push_back(detail::definition_error(
            groups ? "expected 'on'" : "expected 'tagged with', 'on', 'in', 'under' or ':'",
            cur.pos, src));
        return out;
    }

    cur.skip();
    auto const layer_pos = cur.pos;
    auto layer = cur.layer_token();
    if (!layer) {
        out.errors.push_back(detail::definition_error(
            "expected a $$$layer$$$ token", layer_pos, src));
        return out;
    }
    (void)cur.symbol('.');
    if (!cur.at_end()) {
        out.errors.push_back(detail::definition_error(
            "unexpected text after layer", cur.pos, src));
        return out;
    }
    out.definition = layer_reference(std::move(name), std::move(*layer), descendants, scope);
    return out;
}

} // namespace archgov::ref

#endif // ARCHGOV_REF_DEFINITION_PARSER_H
