// core/key_set.h - Ordered key sets and set algebra
// Part of the architectural statement engine (C++20)
//
// Every resolved reference, group and evidence list is a key_set: an
// ordered std::set of entity keys.  Ordering makes every result that is
// derived from a key_set independent of snapshot insertion order.

#ifndef ARCHGOV_CORE_KEY_SET_H
#define ARCHGOV_CORE_KEY_SET_H

#include <algorithm>
#include <iterator>
#include <set>
#include <string>
#include <vector>

namespace archgov {

using key_set = std::set<std::string>;

/// a ∪ b
[[nodiscard]] inline key_set set_union(key_set const& a, key_set const& b) {
    key_set out = a;
    out.insert(b.begin(), b.end());
    return out;
}

/// a ∩ b
[[nodiscard]] inline key_set set_intersection(key_set const& a, key_set const& b) {
    key_set out;
    std::set_intersection(a.begin(), a.end(), b.begin(), b.end(),
                          std::inserter(out, out.end()));
    return out;
}

/// a \ b
[[nodiscard]] inline key_set set_difference(key_set const& a, key_set const& b) {
    key_set out;
    std::set_difference(a.begin(), a.end(), b.begin(), b.end(),
                        std::inserter(out, out.end()));
    return out;
}

/// a ⊆ b (the empty set is a subset of everything)
[[nodiscard]] inline bool is_subset(key_set const& a, key_set const& b) {
    return std::includes(b.begin(), b.end(), a.begin(), a.end());
}

[[nodiscard]] inline bool intersects(key_set const& a, key_set const& b) {
    auto ia = a.begin();
    auto ib = b.begin();
    while (ia != a.end() && ib != b.end()) {
        if (*ia < *ib) ++ia;
        else if (*ib < *ia) ++ib;
        else return true;
    }
    return false;
}

[[nodiscard]] inline std::vector<std::string> to_vector(key_set const& s) {
    return {s.begin(), s.end()};
}

} // namespace archgov

#endif // ARCHGOV_CORE_KEY_SET_H
