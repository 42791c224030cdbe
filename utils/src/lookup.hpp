#pragma once

#include <iterator>

namespace prd {

// Returns a pointer to the first entry of an ordered table satisfying pred, or nullptr.
template <typename Table, typename Predicate>
const typename Table::value_type* first_match(const Table& table, Predicate pred) {
    for (auto it = std::begin(table); it != std::end(table); ++it) {
        if (pred(*it)) {
            return &(*it);
        }
    }
    return nullptr;
}

} // namespace prd
