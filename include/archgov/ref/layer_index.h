// ref/layer_index.h - Layer hierarchy and membership queries
// Part of the architectural statement engine (C++20)
//
// Indexes the layers of a snapshot by key and by parent.  A layer's
// groups are its direct child layers, listed in key order.  Walks down
// the hierarchy track visited layers, so a malformed snapshot with a
// parent cycle terminates (validate() reports the cycle).

#ifndef ARCHGOV_REF_LAYER_INDEX_H
#define ARCHGOV_REF_LAYER_INDEX_H

#include <archgov/core/key_set.h>
#include <archgov/graph/snapshot.h>

#include <map>
#include <string>
#include <vector>

namespace archgov::ref {

class layer_index {
public:
    layer_index() = default;

    explicit layer_index(std::vector<graph::layer> const& layers) {
        for (auto const& l : layers) {
            layers_.emplace(l.key, l);   // first definition of a key wins
        }
        for (auto const& [key, l] : layers_) {
            if (!l.parent.empty()) children_[l.parent].push_back(key);
        }
        // children_ lists are built from a key-ordered map, so they are sorted.
    }

    [[nodiscard]] bool contains(std::string const& key) const {
        return layers_.count(key) != 0;
    }

    [[nodiscard]] graph::layer const* find(std::string const& key) const {
        auto const it = layers_.find(key);
        return it == layers_.end() ? nullptr : &it->second;
    }

    /// Direct child layers, key order.  Empty for unknown or leaf layers.
    [[nodiscard]] std::vector<std::string> groups_of(std::string const& key) const {
        auto const it = children_.find(key);
        if (it == children_.end()) return {};
        return it->second;
    }

    /// Every layer below `key` (children, grandchildren, ...), key order.
    [[nodiscard]] key_set descendants_of(std::string const& key) const {
        key_set seen;
        std::vector<std::string> stack = groups_of(key);
        while (!stack.empty()) {
            auto cur = stack.back();
            stack.pop_back();
            if (cur == key || !seen.insert(cur).second) continue;
            for (auto const& child : groups_of(cur)) stack.push_back(child);
        }
        return seen;
    }

    /// Members of a layer; with include_descendants, the union over the
    /// whole subtree.  Empty for unknown layers.
    [[nodiscard]] key_set members_of(std::string const& key, bool include_descendants) const {
        auto const* l = find(key);
        if (l == nullptr) return {};
        key_set out = l->members;
        if (include_descendants) {
            for (auto const& d : descendants_of(key)) {
                auto const& m = layers_.at(d).members;
                out.insert(m.begin(), m.end());
            }
        }
        return out;
    }

    /// Layers that list the entity as a direct member.
    [[nodiscard]] key_set layers_of(std::string const& entity) const {
        key_set out;
        for (auto const& [key, l] : layers_) {
            if (l.members.count(entity) != 0) out.insert(key);
        }
        return out;
    }

    [[nodiscard]] std::vector<std::string> keys() const {
        std::vector<std::string> out;
        out.reserve(layers_.size());
        for (auto const& [key, l] : layers_) out.push_back(key);
        return out;
    }

private:
    std::map<std::string, graph::layer> layers_;
    std::map<std::string, std::vector<std::string>> children_;
};

} // namespace archgov::ref

#endif // ARCHGOV_REF_LAYER_INDEX_H
