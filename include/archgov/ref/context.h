// ref/context.h - Immutable evaluation context
// Part of the architectural statement engine (C++20)
//
// A context bundles one graph_snapshot with the reference definitions in
// force and the indexes derived from them: the tag store, the layer
// index, and the component- and endpoint-level dependency graphs.  All of
// it is built once in the constructor and never changes, so a context can
// be shared by any number of readers.
//
// A context never caches resolved references: resolution always reads the
// current snapshot, so a stale result cannot outlive the data it came
// from.  To reflect an edit, build a new context.
//
// Tag expression definitions are parsed once here.  A definition that does
// not parse is kept, and its syntax error is reported by
// definition_errors() and definition_error(name).

#ifndef ARCHGOV_REF_CONTEXT_H
#define ARCHGOV_REF_CONTEXT_H

#include "layer_index.h"
#include "reference.h"
#include "tag_expression.h"
#include "tag_store.h"

#include <archgov/core/diagnostic.h>
#include <archgov/core/key_set.h>
#include <archgov/graph/from_snapshot.h>
#include <archgov/graph/runtime_graph.h>
#include <archgov/graph/snapshot.h>

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace archgov::ref {

class context {
public:
    context() : context(graph::graph_snapshot{}, {}) {}

    /// Later definitions with an already used name are ignored and
    /// reported by definition_errors().
    context(graph::graph_snapshot snapshot, std::vector<reference_definition> references)
        : snapshot_(std::move(snapshot)),
          tags_(snapshot_),
          layers_(snapshot_.layers),
          component_graph_(graph::from_snapshot(snapshot_, {graph::granularity::components, {}})),
          endpoint_graph_(graph::from_snapshot(snapshot_, {graph::granularity::endpoints, {}})),
          components_(snapshot_.component_keys()),
          endpoints_(snapshot_.endpoint_keys()) {
        for (auto& r : references) {
            if (index_.count(r.name) != 0) {
                definition_errors_.push_back(make_diagnostic(
                    error_kind::invalid_snapshot, "duplicate reference name", no_position, r.name));
                continue;
            }
            if (r.kind == reference_kind::tag_expression) {
                auto parsed = parse_tag_expression(r.expression);
                if (parsed.error) {
                    auto d = *parsed.error;
                    d.message = "reference '" + r.name + "': " + d.message;
                    definition_errors_.push_back(d);
                    syntax_errors_.emplace(r.name, std::move(d));
                }
            }
            index_.emplace(r.name, references_.size());
            references_.push_back(std::move(r));
        }
    }

    [[nodiscard]] graph::graph_snapshot const& snapshot() const noexcept { return snapshot_; }
    [[nodiscard]] tag_store const& tags() const noexcept { return tags_; }
    [[nodiscard]] layer_index const& layers() const noexcept { return layers_; }

    /// Dependency graph at the granularity of a reference scope.
    [[nodiscard]] graph::runtime_graph const& dependency_graph(entity_scope scope) const noexcept {
        return scope == entity_scope::components ? component_graph_ : endpoint_graph_;
    }

    /// Keys of every entity in a scope.
    [[nodiscard]] key_set const& entities(entity_scope scope) const noexcept {
        return scope == entity_scope::components ? components_ : endpoints_;
    }

    [[nodiscard]] std::vector<reference_definition> const& references() const noexcept {
        return references_;
    }

    [[nodiscard]] reference_definition const* find_reference(std::string const& name) const {
        auto const it = index_.find(name);
        return it == index_.end() ? nullptr : &references_[it->second];
    }

    [[nodiscard]] key_set reference_names() const {
        key_set out;
        for (auto const& [name, i] : index_) out.insert(name);
        return out;
    }

    [[nodiscard]] diagnostics const& definition_errors() const noexcept {
        return definition_errors_;
    }

    /// Syntax error of a tag expression definition, or nullptr.
    [[nodiscard]] diagnostic const* definition_error(std::string const& name) const {
        auto const it = syntax_errors_.find(name);
        return it == syntax_errors_.end() ? nullptr : &it->second;
    }

private:
    graph::graph_snapshot snapshot_;
    tag_store tags_;
    layer_index layers_;
    graph::runtime_graph component_graph_;
    graph::runtime_graph endpoint_graph_;
    key_set components_;
    key_set endpoints_;
    std::vector<reference_definition> references_;
    std::map<std::string, std::size_t> index_;
    diagnostics definition_errors_;
    std::map<std::string, diagnostic> syntax_errors_;
};

} // namespace archgov::ref

#endif // ARCHGOV_REF_CONTEXT_H
