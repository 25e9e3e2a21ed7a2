// ref/tag_expression.h - Boolean tag expressions: lexer, parser, evaluator
// Part of the architectural statement engine (C++20)
//
// GRAMMAR (precedence NOT > AND > OR, keywords case-insensitive):
//
//   expr    := or
//   or      := and ( OR and )*
//   and     := unary ( AND unary )*
//   unary   := NOT unary | primary
//   primary := TAG | '(' or ')'
//   TAG     := 'quoted' | "quoted" | bare word of [A-Za-z0-9_.:-]
//
// A bare word spelling a keyword is the keyword; quote it to use it as a
// tag ("'not'").
//
// Parse errors are returned as a syntax diagnostic carrying the byte
// position and text of the offending token.  Nothing throws.
//
// Nesting is capped at limits::tag_expression_max_depth: parentheses and
// NOT operators while parsing, and the operator height of the tree (a long
// AND/OR chain is left-deep).  Deeper input is a syntax error, so parsing,
// matching and rendering never recurse past the cap.
//
// The parsed tree lives in a flat node vector (children by index), so a
// tag_expression is a regular value: copyable, comparable, no pointers.

#ifndef ARCHGOV_REF_TAG_EXPRESSION_H
#define ARCHGOV_REF_TAG_EXPRESSION_H

#include <archgov/core/diagnostic.h>
#include <archgov/core/key_set.h>
#include <archgov/core/limits.h>
#include <archgov/core/text.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace archgov::ref {

// =============================================================================
// Tokens
// =============================================================================

enum class tag_token_kind { tag, kw_and, kw_or, kw_not, lparen, rparen, end };

struct tag_token {
    tag_token_kind kind = tag_token_kind::end;
    std::string text;          ///< tag value (quotes stripped) or source text
    std::size_t position = 0;  ///< byte offset in the expression
};

struct tag_lex_result {
    std::vector<tag_token> tokens;   ///< always terminated by an end token
    std::optional<diagnostic> error;
};

/// Split an expression into tokens.
[[nodiscard]] inline tag_lex_result lex_tag_expression(std::string_view sv) {
    tag_lex_result out;
    std::size_t pos = 0;
    while (true) {
        pos = text::skip_space(sv, pos);
        if (pos >= sv.size()) break;
        char const c = sv[pos];

        if (c == '(' || c == ')') {
            out.tokens.push_back({c == '(' ? tag_token_kind::lparen : tag_token_kind::rparen,
                                  std::string(1, c), pos});
            ++pos;
        } else if (c == '\'' || c == '"') {
            auto const close = sv.find(c, pos + 1);
            if (close == std::string_view::npos) {
                out.error = make_diagnostic(error_kind::syntax, "unterminated quoted tag",
                                            pos, std::string(sv.substr(pos)));
                return out;
            }
            auto const value = sv.substr(pos + 1, close - pos - 1);
            if (value.empty()) {
                out.error = make_diagnostic(error_kind::syntax, "empty quoted tag", pos,
                                            std::string(sv.substr(pos, close - pos + 1)));
                return out;
            }
            out.tokens.push_back({tag_token_kind::tag, std::string(value), pos});
            pos = close + 1;
        } else if (text::is_key_char(c)) {
            auto const start = pos;
            while (pos < sv.size() && text::is_key_char(sv[pos])) ++pos;
            auto const word = sv.substr(start, pos - start);
            auto kind = tag_token_kind::tag;
            if (text::iequals(word, "and")) kind = tag_token_kind::kw_and;
            else if (text::iequals(word, "or")) kind = tag_token_kind::kw_or;
            else if (text::iequals(word, "not")) kind = tag_token_kind::kw_not;
            out.tokens.push_back({kind, std::string(word), start});
        } else {
            out.error = make_diagnostic(error_kind::syntax, "unexpected character",
                                        pos, std::string(1, c));
            return out;
        }
    }
    out.tokens.push_back({tag_token_kind::end, {}, sv.size()});
    return out;
}

// =============================================================================
// tag_expression
// =============================================================================

enum class tag_op : std::uint8_t { tag, op_not, op_and, op_or };

struct tag_node {
    tag_op op = tag_op::tag;
    std::string tag;            ///< op == tag only
    std::uint32_t lhs = 0;      ///< operand (not), left operand (and/or)
    std::uint32_t rhs = 0;      ///< right operand (and/or)

    bool operator==(tag_node const&) const = default;
};

/// Parsed boolean tag expression.
class tag_expression {
public:
    /// True if an entity with these tags satisfies the expression.
    [[nodiscard]] bool matches(key_set const& tags) const {
        return eval(root_, tags);
    }

    /// Every tag named in the expression.
    [[nodiscard]] key_set tags() const {
        key_set out;
        for (auto const& n : nodes_) {
            if (n.op == tag_op::tag) out.insert(n.tag);
        }
        return out;
    }

    /// Canonical, fully parenthesised text; re-parses to an equal expression.
    [[nodiscard]] std::string to_string() const { return render(root_); }

    [[nodiscard]] std::vector<tag_node> const& nodes() const noexcept { return nodes_; }

    bool operator==(tag_expression const& o) const {
        return to_string() == o.to_string();
    }

private:
    [[nodiscard]] bool eval(std::uint32_t i, key_set const& tags) const {
        auto const& n = nodes_[i];
        switch (n.op) {
        case tag_op::tag:    return tags.count(n.tag) != 0;
        case tag_op::op_not: return !eval(n.lhs, tags);
        case tag_op::op_and: return eval(n.lhs, tags) && eval(n.rhs, tags);
        case tag_op::op_or:  return eval(n.lhs, tags) || eval(n.rhs, tags);
        }
        return false;
    }

    [[nodiscard]] std::string render(std::uint32_t i) const {
        auto const& n = nodes_[i];
        switch (n.op) {
        case tag_op::tag:    return "'" + n.tag + "'";
        case tag_op::op_not: return "NOT " + render(n.lhs);
        case tag_op::op_and: return "(" + render(n.lhs) + " AND " + render(n.rhs) + ")";
        case tag_op::op_or:  return "(" + render(n.lhs) + " OR " + render(n.rhs) + ")";
        }
        return {};
    }

    std::vector<tag_node> nodes_;
    std::uint32_t root_ = 0;

    friend class tag_expression_parser;
};

struct tag_parse_result {
    std::optional<tag_expression> expression;
    std::optional<diagnostic> error;

    [[nodiscard]] bool ok() const noexcept { return expression.has_value(); }
};

// =============================================================================
// Parser
// =============================================================================

/// Recursive-descent parser over the token list.  Use
/// parse_tag_expression() rather than this class directly.
class tag_expression_parser {
public:
    explicit tag_expression_parser(std::vector<tag_token> tokens)
        : tokens_(std::move(tokens)) {}

    [[nodiscard]] tag_parse_result parse() {
        tag_parse_result out;
        if (peek().kind == tag_token_kind::end) {
            out.error = make_diagnostic(error_kind::syntax, "empty tag expression", 0);
            return out;
        }
        auto const root = parse_or();
        if (!error_ && peek().kind != tag_token_kind::end) {
            fail("unexpected token after expression");
        }
        if (error_) {
            out.error = std::move(error_);
            return out;
        }
        expr_.root_ = root;
        out.expression = std::move(expr_);
        return out;
    }

private:
    [[nodiscard]] tag_token const& peek() const { return tokens_[pos_]; }

    void fail(std::string message) {
        if (error_) return;
        auto const& t = peek();
        error_ = make_diagnostic(error_kind::syntax, std::move(message), t.position,
                                 t.kind == tag_token_kind::end ? std::string{} : t.text);
    }

    std::uint32_t push(tag_node n) {
        if (error_) return 0;
        std::size_t h = 0;
        if (n.op == tag_op::op_not) h = height_[n.lhs] + 1;
        else if (n.op != tag_op::tag) h = std::max(height_[n.lhs], height_[n.rhs]) + 1;
        if (h > limits::tag_expression_max_depth) {
            fail("expression nested too deeply");
            return 0;
        }
        height_.push_back(h);
        expr_.nodes_.push_back(std::move(n));
        return static_cast<std::uint32_t>(expr_.nodes_.size() - 1);
    }

    // Guards one level of NOT or '(' recursion.
    [[nodiscard]] bool enter() {
        if (depth_ >= limits::tag_expression_max_depth) {
            fail("expression nested too deeply");
            return false;
        }
        ++depth_;
        return true;
    }

    std::uint32_t parse_or() {
        auto lhs = parse_and();
        while (!error_ && peek().kind == tag_token_kind::kw_or) {
            ++pos_;
            auto const rhs = parse_and();
            lhs = push({tag_op::op_or, {}, lhs, rhs});
        }
        return lhs;
    }

    std::uint32_t parse_and() {
        auto lhs = parse_unary();
        while (!error_ && peek().kind == tag_token_kind::kw_and) {
            ++pos_;
            auto const rhs = parse_unary();
            lhs = push({tag_op::op_and, {}, lhs, rhs});
        }
        return lhs;
    }

    std::uint32_t parse_unary() {
        if (peek().kind == tag_token_kind::kw_not) {
            if (!enter()) return 0;
            ++pos_;
            auto const operand = parse_unary();
            --depth_;
            return push({tag_op::op_not, {}, operand, 0});
        }
        return parse_primary();
    }

    std::uint32_t parse_primary() {
        auto const& t = peek();
        if (t.kind == tag_token_kind::tag) {
            ++pos_;
            return push({tag_op::tag, t.text, 0, 0});
        }
        if (t.kind == tag_token_kind::lparen) {
            if (!enter()) return 0;
            ++pos_;
            auto const inner = parse_or();
            --depth_;
            if (error_) return inner;
            if (peek().kind != tag_token_kind::rparen) {
                fail("expected ')'");
                return inner;
            }
            ++pos_;
            return inner;
        }
        fail(t.kind == tag_token_kind::end ? "unexpected end of expression"
                                           : "expected tag or '('");
        return 0;
    }

    std::vector<tag_token> tokens_;
    std::size_t pos_ = 0;
    std::size_t depth_ = 0;
    std::vector<std::size_t> height_;   ///< operator height per node
    tag_expression expr_;
    std::optional<diagnostic> error_;
};

/// Parse a tag expression.
///
/// Example:
/// ```cpp
/// auto r = parse_tag_expression("'payments' AND NOT ('legacy' OR deprecated)");
/// if (r.ok()) bool hit = r.expression->matches({"payments"});   // true
///
/// auto bad = parse_tag_expression("'a' AND (");
/// // bad.error->position == 9, bad.error->message == "unexpected end of expression"
/// ```
[[nodiscard]] inline tag_parse_result parse_tag_expression(std::string_view sv) {
    auto lexed = lex_tag_expression(sv);
    if (lexed.error) {
        tag_parse_result out;
        out.error = std::move(lexed.error);
        return out;
    }
    return tag_expression_parser{std::move(lexed.tokens)}.parse();
}

} // namespace archgov::ref

#endif // ARCHGOV_REF_TAG_EXPRESSION_H
