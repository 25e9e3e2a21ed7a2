// ref/tag_store.h - Tags per component, endpoint and layer
// Part of the architectural statement engine (C++20)
//
// A flat mapping from entity key to its set of string tags.  Tags have no
// hierarchy and no namespace; "team:billing" is just a string.  The store
// is filled once from a snapshot and read by the resolver.

#ifndef ARCHGOV_REF_TAG_STORE_H
#define ARCHGOV_REF_TAG_STORE_H

#include <archgov/core/key_set.h>
#include <archgov/graph/snapshot.h>

#include <cstddef>
#include <map>
#include <string>
#include <utility>

namespace archgov::ref {

class tag_store {
public:
    tag_store() = default;

    explicit tag_store(graph::graph_snapshot const& s) {
        for (auto const& c : s.components) add(c.key, c.tags);
        for (auto const& e : s.endpoints) add(e.key, e.tags);
        for (auto const& l : s.layers) add(l.key, l.tags);
    }

    /// Add tags to an entity (merged with any it already has).
    void add(std::string const& key, key_set const& tags) {
        auto& slot = tags_[key];
        slot.insert(tags.begin(), tags.end());
    }

    /// Tags of an entity; empty for unknown keys.
    [[nodiscard]] key_set const& tags_of(std::string const& key) const {
        static key_set const none;
        auto const it = tags_.find(key);
        return it == tags_.end() ? none : it->second;
    }

    [[nodiscard]] bool has_tag(std::string const& key, std::string const& tag) const {
        return tags_of(key).count(tag) != 0;
    }

    /// Every entity carrying the tag.
    [[nodiscard]] key_set entities_with(std::string const& tag) const {
        key_set out;
        for (auto const& [key, tags] : tags_) {
            if (tags.count(tag) != 0) out.insert(key);
        }
        return out;
    }

    /// Usage count of every tag across all entities.
    [[nodiscard]] std::map<std::string, std::size_t> tag_counts() const {
        std::map<std::string, std::size_t> out;
        for (auto const& [key, tags] : tags_) {
            for (auto const& t : tags) out[t]++;
        }
        return out;
    }

    [[nodiscard]] std::size_t size() const noexcept { return tags_.size(); }

private:
    std::map<std::string, key_set> tags_;
};

} // namespace archgov::ref

#endif // ARCHGOV_REF_TAG_STORE_H
