// stmt/batch.h - Parse and evaluate a list of statements
// Part of the architectural statement engine (C++20)
//
// Every statement gets its own result; a statement that fails to parse,
// names an unknown reference or cannot be evaluated never affects its
// siblings.  One resolution_scope is shared across the batch, so each
// reference is resolved at most once per batch and never across batches.

#ifndef ARCHGOV_STMT_BATCH_H
#define ARCHGOV_STMT_BATCH_H

#include "evaluator.h"
#include "parser.h"

#include <archgov/core/eval_stats.h>
#include <archgov/ref/context.h>
#include <archgov/ref/resolver.h>

#include <cstddef>
#include <string>
#include <vector>

namespace archgov::stmt {

struct statement_result {
    parsed_statement statement;
    verdict result;
};

struct batch_result {
    std::vector<statement_result> items;   ///< input order
    std::size_t satisfied = 0;
    std::size_t violated = 0;
    std::size_t not_evaluated = 0;
    std::size_t warnings = 0;
    std::size_t errors = 0;
    eval_stats stats;

    [[nodiscard]] std::size_t size() const noexcept { return items.size(); }

    /// True if no statement was violated at error severity.
    [[nodiscard]] bool passed() const noexcept { return errors == 0; }
};

/// Parse and evaluate each statement against the context.
///
/// Example:
/// ```cpp
/// auto batch = evaluate_batch({
///     "$$$ui$$$ must not depend on $$$db$$$",
///     "there should be at least 2 $$$replicas$$$",
///     "keep it simple",                          // informal, not evaluated
/// }, ctx);
/// // batch.items.size() == 3
/// ```
[[nodiscard]] inline batch_result evaluate_batch(std::vector<std::string> const& texts,
                                                 ref::context const& ctx,
                                                 evaluation_options const& opts = {}) {
    batch_result out;
    out.items.reserve(texts.size());
    ref::resolution_scope scope(ctx);

    for (auto const& text : texts) {
        statement_result item;
        item.statement = parse_statement(text, ctx);
        ++scope.stats().statements_parsed;
        item.result = evaluate(item.statement, ctx, opts, &scope);

        switch (item.result.status) {
        case verdict_status::satisfied:     ++out.satisfied; break;
        case verdict_status::violated:      ++out.violated; break;
        case verdict_status::not_evaluated: ++out.not_evaluated; break;
        }
        if (item.result.severity == severity_level::warning) ++out.warnings;
        if (item.result.severity == severity_level::error) ++out.errors;
        out.items.push_back(std::move(item));
    }
    out.stats = scope.stats();
    return out;
}

} // namespace archgov::stmt

#endif // ARCHGOV_STMT_BATCH_H
