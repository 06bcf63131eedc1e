#pragma once

#include <functional>
#include <ranges>

namespace dset {

// Linear scan, O(n) per call. The set algebra calls it once per element
// of the set, so union/intersection/difference are O(n * m).
template <
    std::ranges::input_range Range,
    typename T,
    typename KeyEqual = std::equal_to<T>>
[[nodiscard]] constexpr bool contains_any(
    const Range& collection,
    const T& value,
    KeyEqual equal = KeyEqual()
) noexcept {
    for (const auto& item : collection) {
        if (std::invoke(equal, item, value)) { return true; }
    }
    return false;
}

}  // namespace dset
