// stmt/scanner.h - Statement tokenizer
// Part of the architectural statement engine (C++20)
//
// Splits statement text into words and reference tokens.
//
//   reference  $$$name$$$ with name of [A-Za-z0-9_-]+
//   word       any other run of non-space characters
//
// A reference token may touch the surrounding text ("$$$a$$$," or
// "($$$a$$$)"); the characters around it become separate words.  A
// malformed "$$$" opener is kept as part of a word.  One period at the
// very end of the statement is dropped.  Positions are byte offsets into
// the original text.

#ifndef ARCHGOV_STMT_SCANNER_H
#define ARCHGOV_STMT_SCANNER_H

#include <archgov/core/text.h>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace archgov::stmt {

enum class token_kind { word, reference };

struct token {
    token_kind kind = token_kind::word;
    std::string text;          ///< word text, or the reference name
    std::size_t position = 0;

    [[nodiscard]] bool is_reference() const noexcept { return kind == token_kind::reference; }

    /// Case-insensitive keyword test; false for references.
    [[nodiscard]] bool is(std::string_view word) const noexcept {
        return kind == token_kind::word && text::iequals(text, word);
    }

    bool operator==(token const&) const = default;
};

namespace detail {

/// Length of the $$$name$$$ token at pos, if there is a well-formed one.
[[nodiscard]] inline std::optional<std::size_t>
reference_length(std::string_view sv, std::size_t pos) noexcept {
    if (sv.substr(pos, 3) != "$$$") return std::nullopt;
    auto end = pos + 3;
    while (end < sv.size() && text::is_name_char(sv[end])) ++end;
    if (end == pos + 3 || sv.substr(end, 3) != "$$$") return std::nullopt;
    return end + 3 - pos;
}

} // namespace detail

/// Tokenize a statement.
///
/// Example:
/// ```cpp
/// auto toks = scan_statement("$$$api$$$ must not depend on $$$db$$$.");
/// // {ref api} {must} {not} {depend} {on} {ref db}
/// ```
[[nodiscard]] inline std::vector<token> scan_statement(std::string_view sv) {
    // Drop one trailing period.
    auto const body = text::trim(sv);
    auto const offset = static_cast<std::size_t>(body.data() - sv.data());
    auto src = body;
    if (!src.empty() && src.back() == '.') src.remove_suffix(1);

    std::vector<token> out;
    std::size_t pos = 0;
    while (true) {
        pos = text::skip_space(src, pos);
        if (pos >= src.size()) break;

        if (auto const len = detail::reference_length(src, pos)) {
            out.push_back({token_kind::reference,
                           std::string(src.substr(pos + 3, *len - 6)), offset + pos});
            pos += *len;
            continue;
        }
        auto const start = pos;
        ++pos;
        while (pos < src.size() && !text::is_space(src[pos])
               && !detail::reference_length(src, pos)) {
            ++pos;
        }
        out.push_back({token_kind::word, std::string(src.substr(start, pos - start)),
                       offset + start});
    }
    return out;
}

/// Reference names in order of first appearance, without duplicates.
[[nodiscard]] inline std::vector<std::string> extract_reference_names(std::string_view sv) {
    std::vector<std::string> out;
    for (auto const& t : scan_statement(sv)) {
        if (!t.is_reference()) continue;
        bool seen = false;
        for (auto const& n : out) seen = seen || n == t.text;
        if (!seen) out.push_back(t.text);
    }
    return out;
}

} // namespace archgov::stmt

#endif // ARCHGOV_STMT_SCANNER_H
