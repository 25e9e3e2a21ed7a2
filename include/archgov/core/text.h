// core/text.h - Character-level parsing primitives
// Part of the architectural statement engine (C++20)
//
// Low-level scanning of words, quoted strings and unsigned integers from
// string_view.  No allocation beyond the returned strings, no iostream,
// no locale: case folding is ASCII only, so results never depend on the
// host's locale settings.
//
// Consumed by the tag expression lexer, the reference definition parser
// and the statement scanner.

#ifndef ARCHGOV_CORE_TEXT_H
#define ARCHGOV_CORE_TEXT_H

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace archgov::text {

[[nodiscard]] constexpr bool is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

[[nodiscard]] constexpr bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

[[nodiscard]] constexpr bool is_alpha(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

[[nodiscard]] constexpr bool is_alnum(char c) noexcept { return is_alpha(c) || is_digit(c); }

/// Characters allowed in a reference name: [A-Za-z0-9_-]
[[nodiscard]] constexpr bool is_name_char(char c) noexcept {
    return is_alnum(c) || c == '_' || c == '-';
}

/// Characters allowed in a bare tag or entity key: [A-Za-z0-9_.:-]
[[nodiscard]] constexpr bool is_key_char(char c) noexcept {
    return is_name_char(c) || c == '.' || c == ':';
}

[[nodiscard]] constexpr char to_lower(char c) noexcept {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

[[nodiscard]] inline std::string lower(std::string_view sv) {
    std::string out(sv);
    for (auto& c : out) c = to_lower(c);
    return out;
}

/// ASCII case-insensitive equality.
[[nodiscard]] constexpr bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (to_lower(a[i]) != to_lower(b[i])) return false;
    }
    return true;
}

/// Skip whitespace (newlines included).
[[nodiscard]] constexpr std::size_t skip_space(std::string_view sv, std::size_t pos) noexcept {
    while (pos < sv.size() && is_space(sv[pos])) ++pos;
    return pos;
}

/// Test whether sv at pos starts with prefix, ignoring ASCII case.
[[nodiscard]] constexpr bool istarts_with(std::string_view sv, std::size_t pos,
                                          std::string_view prefix) noexcept {
    if (pos > sv.size() || sv.size() - pos < prefix.size()) return false;
    return iequals(sv.substr(pos, prefix.size()), prefix);
}

/// Strip leading and trailing whitespace.
[[nodiscard]] constexpr std::string_view trim(std::string_view sv) noexcept {
    std::size_t b = 0;
    std::size_t e = sv.size();
    while (b < e && is_space(sv[b])) ++b;
    while (e > b && is_space(sv[e - 1])) --e;
    return sv.substr(b, e - b);
}

/// Parse a whole string as a non-negative decimal integer.
/// Empty input, any non-digit, or overflow -> nullopt.
[[nodiscard]] constexpr std::optional<std::size_t> parse_count(std::string_view sv) noexcept {
    if (sv.empty()) return std::nullopt;
    std::size_t val = 0;
    for (char c : sv) {
        if (!is_digit(c)) return std::nullopt;
        auto const digit = static_cast<std::size_t>(c - '0');
        if (val > (~std::size_t{0} - digit) / 10) return std::nullopt;
        val = val * 10 + digit;
    }
    return val;
}

} // namespace archgov::text

#endif // ARCHGOV_CORE_TEXT_H
