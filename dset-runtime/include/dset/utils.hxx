#pragma once

#include "dset/common.hxx"

#include <fmt/format.h>

#include <cassert>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <source_location>
#include <string_view>
#include <type_traits>

namespace dset {

template <typename Enum>
[[nodiscard]] inline constexpr std::underlying_type_t<Enum> to_underlying(
    Enum enumeration
) noexcept {
    return static_cast<std::underlying_type_t<Enum>>(enumeration);
}

[[noreturn]] inline void report_and_abort(
    std::string_view message,
    const std::source_location location = std::source_location::current()
) noexcept {
    fmt::print(
        stderr,
        FMT_STRING("[{:s}:{:d}:{:d}] Error in {:s}(): {}\n"),
        location.file_name(),
        location.line(),
        location.column(),
        location.function_name(),
        message
    );
    std::abort();
}

[[noreturn]] inline void unreachable(
    const std::source_location location = std::source_location::current()
) noexcept {
    if constexpr (IS_DEBUG_BUILD) {
        report_and_abort("This code should have been unreachable", location);
    }
    __builtin_unreachable();
}

[[nodiscard]] inline constexpr bool has_integer_value(float_t val) noexcept {
    float_t int_part = 0.0;
    const auto fract_part = std::modf(val, &int_part);
    return fract_part == 0.0 && !std::isinf(int_part);
}

[[nodiscard]] inline constexpr size_t grow_capacity(size_t capacity) noexcept {
    return (capacity == 0)  //
               ? DEFAULT_CAPACITY
               : (capacity * CAPACITY_SCALE_FACTOR);
}

}  // namespace dset
