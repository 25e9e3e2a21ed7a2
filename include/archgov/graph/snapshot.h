// graph/snapshot.h - Architecture snapshot data model
// Part of the architectural statement engine (C++20)
//
// A graph_snapshot is the immutable input of every operation: components,
// their endpoints, typed dependencies, and the layer hierarchy.  It is a
// plain aggregate; the engine never mutates one.  A host that edits its
// model builds a new snapshot (and a new ref::context) afterwards.
//
// Degenerate snapshots are valid: no components, isolated components,
// self-dependencies.  validate() reports structural problems as
// diagnostics and never throws.

#ifndef ARCHGOV_GRAPH_SNAPSHOT_H
#define ARCHGOV_GRAPH_SNAPSHOT_H

#include <archgov/core/diagnostic.h>
#include <archgov/core/key_set.h>

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace archgov::graph {

// =============================================================================
// Entities
// =============================================================================

struct component {
    std::string key;
    std::string name;
    key_set tags;
};

/// Sub-unit of a component (an API operation, a port).
struct endpoint {
    std::string key;
    std::string owner;   ///< key of the owning component
    key_set tags;
};

/// Directed dependency between two components or two endpoints.
///
/// Several dependencies may connect the same pair with different types;
/// the snapshot keeps all of them.
struct dependency {
    std::string source;
    std::string target;
    std::string type;
};

/// Named grouping of components and/or endpoints.
///
/// A layer's groups are its direct child layers.  Membership is
/// non-exclusive.  read_only marks layers imported from elsewhere.
struct layer {
    std::string key;
    std::string name;
    std::string parent;   ///< empty for a root layer
    bool read_only = false;
    key_set members;
    key_set tags;
};

// =============================================================================
// graph_snapshot
// =============================================================================

/// Immutable view of the architecture model at one point in time.
///
/// Example:
/// ```cpp
/// graph_snapshot s;
/// s.components = {{"api", "API", {"public"}}, {"db", "Database", {}}};
/// s.dependencies = {{"api", "db", "sql"}};
/// s.layers = {{"tiers", "Tiers", "", false, {}, {}},
///             {"front", "Front", "tiers", false, {"api"}, {}}};
/// ```
struct graph_snapshot {
    std::vector<component> components;
    std::vector<endpoint> endpoints;
    std::vector<dependency> dependencies;
    std::vector<layer> layers;

    [[nodiscard]] component const* find_component(std::string const& key) const {
        for (auto const& c : components) {
            if (c.key == key) return &c;
        }
        return nullptr;
    }

    [[nodiscard]] endpoint const* find_endpoint(std::string const& key) const {
        for (auto const& e : endpoints) {
            if (e.key == key) return &e;
        }
        return nullptr;
    }

    [[nodiscard]] layer const* find_layer(std::string const& key) const {
        for (auto const& l : layers) {
            if (l.key == key) return &l;
        }
        return nullptr;
    }

    [[nodiscard]] key_set component_keys() const {
        key_set out;
        for (auto const& c : components) out.insert(c.key);
        return out;
    }

    [[nodiscard]] key_set endpoint_keys() const {
        key_set out;
        for (auto const& e : endpoints) out.insert(e.key);
        return out;
    }
};

// =============================================================================
// Validation
// =============================================================================

/// Structural checks over a snapshot.
///
/// Reports (as invalid_snapshot diagnostics, token = offending key):
/// - duplicate component / endpoint / layer keys
/// - endpoints whose owner is not a component
/// - dependencies whose source or target is unknown
/// - dependencies mixing a component with an endpoint
/// - layers with an unknown parent, and parent cycles
[[nodiscard]] inline diagnostics validate(graph_snapshot const& s) {
    diagnostics out;
    auto report = [&out](std::string message, std::string const& key) {
        out.push_back(make_diagnostic(error_kind::invalid_snapshot,
                                      std::move(message), no_position, key));
    };

    key_set comp_keys;
    for (auto const& c : s.components) {
        if (!comp_keys.insert(c.key).second)
            report("duplicate component key", c.key);
    }

    key_set ep_keys;
    for (auto const& e : s.endpoints) {
        if (!ep_keys.insert(e.key).second || comp_keys.count(e.key) != 0)
            report("duplicate endpoint key", e.key);
        if (comp_keys.count(e.owner) == 0)
            report("endpoint owner is not a component", e.key);
    }

    for (auto const& d : s.dependencies) {
        bool const src_comp = comp_keys.count(d.source) != 0;
        bool const dst_comp = comp_keys.count(d.target) != 0;
        bool const src_ep = ep_keys.count(d.source) != 0;
        bool const dst_ep = ep_keys.count(d.target) != 0;
        if (!src_comp && !src_ep)
            report("dependency source not in snapshot", d.source);
        if (!dst_comp && !dst_ep)
            report("dependency target not in snapshot", d.target);
        if ((src_comp && dst_ep) || (src_ep && dst_comp))
            report("dependency mixes component and endpoint", d.source + "->" + d.target);
    }

    std::map<std::string, std::string> parent_of;
    for (auto const& l : s.layers) {
        if (parent_of.count(l.key) != 0) {
            report("duplicate layer key", l.key);
            continue;
        }
        parent_of.emplace(l.key, l.parent);
    }
    for (auto const& [key, parent] : parent_of) {
        if (!parent.empty() && parent_of.count(parent) == 0)
            report("layer parent not in snapshot", key);
    }

    // Parent cycle: walk up at most |layers| steps.
    for (auto const& [key, parent] : parent_of) {
        std::string cur = parent;
        std::size_t steps = 0;
        while (!cur.empty() && steps <= parent_of.size()) {
            if (cur == key) {
                report("layer parent cycle", key);
                break;
            }
            auto const it = parent_of.find(cur);
            if (it == parent_of.end()) break;
            cur = it->second;
            ++steps;
        }
    }

    return out;
}

} // namespace archgov::graph

#endif // ARCHGOV_GRAPH_SNAPSHOT_H
