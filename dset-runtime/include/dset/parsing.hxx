#pragma once

#include "dset/common.hxx"
#include "dset/unicode.hxx"
#include "dset/value.hxx"

#include <charconv>
#include <cmath>
#include <iterator>
#include <string_view>
#include <system_error>

namespace dset {

namespace detail {

template <typename T>
[[nodiscard]] inline bool
parse_number(std::string_view text, T& value) noexcept {
    if (text.empty()) { return false; }
    const char* last = std::next(text.data(), static_cast<isize>(text.size()));
    const auto fcr = std::from_chars(text.data(), last, value);
    return fcr.ec == std::errc{} && fcr.ptr == last;
}

[[nodiscard]] inline bool
is_quoted(std::string_view text, char quote) noexcept {
    return text.size() >= 2 && text.front() == quote && text.back() == quote;
}

}  // namespace detail

// Reads a value written on the command line:
//   true / false      -> BOOL
//   42, -7            -> INT
//   2.5, 1e3          -> FLOAT (finite only)
//   'a'               -> CHAR (exactly one code point)
//   "text"            -> STRING without the quotes
//   anything else     -> STRING as is
[[nodiscard]] inline Value parse_value(std::string_view text) {
    if (text == "true") { return Value{true}; }
    if (text == "false") { return Value{false}; }
    if (detail::is_quoted(text, '"')) {
        return Value{text.substr(1, text.size() - 2)};
    }
    if (detail::is_quoted(text, '\'')) {
        const auto inner = text.substr(1, text.size() - 2);
        size_t code_point_count = 0;
        char32_t chr = U'\0';
        for_each_code_point(inner, [&](char32_t code_point) {
            chr = code_point;
            ++code_point_count;
        });
        if (code_point_count == 1) { return Value{chr}; }
    }
    int_t integer = 0;
    if (detail::parse_number(text, integer)) { return Value{integer}; }
    float_t scalar = 0.0;
    if (detail::parse_number(text, scalar) && std::isfinite(scalar)) {
        return Value{scalar};
    }
    return Value{text};
}

}  // namespace dset
