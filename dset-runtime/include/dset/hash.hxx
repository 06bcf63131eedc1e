#pragma once

#include "dset/common.hxx"
#include "dset/formatting.hxx"
#include "dset/unicode.hxx"

#include <fmt/format.h>

#include <string>
#include <string_view>

namespace dset {

template <typename T>
concept TextFormattable = fmt::is_formattable<T>::value;

// Deterministic text form of a value, used both for hashing and display.
template <typename T>
    requires TextFormattable<T>
[[nodiscard]] inline std::string to_text(const T& val) {
    return fmt::format(FMT_STRING("{}"), val);
}

// NOTE: Only depends on the multiset of code points, every pair of anagrams
// ("ab", "ba") collides. Kept on purpose, bucket placement relies on it.
[[nodiscard]] inline u32 code_point_sum(std::string_view text) noexcept {
    u32 sum = 0;
    for_each_code_point(text, [&sum](char32_t code_point) {
        sum += static_cast<u32>(code_point);
    });
    return sum;
}

template <typename T>
struct CharSumHash {
    [[nodiscard]] u32 operator()(const T& val) const noexcept {
        return code_point_sum(to_text(val));
    }
};

template <>
struct CharSumHash<std::string_view> {
    [[nodiscard]] u32 operator()(const std::string_view& strv) const noexcept {
        return code_point_sum(strv);
    }
};

template <>
struct CharSumHash<std::string> {
    [[nodiscard]] u32 operator()(const std::string& str) const noexcept {
        return code_point_sum(str);
    }
};

}  // namespace dset
