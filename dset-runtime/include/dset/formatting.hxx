#pragma once

#include "dset/unicode.hxx"
#include "dset/utils.hxx"
#include "dset/value.hxx"

#include <fmt/format.h>

#include <string>
#include <string_view>

namespace fmt {

template <>
struct formatter<dset::Value> : formatter<string_view> {
    template <typename FormatContext>
    constexpr auto format(const dset::Value& value, FormatContext& ctx)
        const noexcept {
        switch (value.type) {
            using enum dset::Value::Type;
            case BOOL: return format_to(ctx.out(), "{}", value.as_bool());
            case INT: return format_to(ctx.out(), "{:d}", value.as_int());
            case FLOAT: {
                const auto val = value.as_float();
                if (dset::has_integer_value(val)) {
                    return format_to(ctx.out(), "{:.1f}", val);
                }
                return format_to(ctx.out(), "{}", val);
            }
            case CHAR:
                return format_to(
                    ctx.out(),
                    "{:s}",
                    dset::utf8_encode_single(value.as_char())
                );
            case STRING:
                return format_to(ctx.out(), "{:s}", value.as_string());
        }
        dset::unreachable();
    }
};

}  // namespace fmt

namespace dset {

// Display policy for set elements: characters single quoted, text double
// quoted, everything else as its plain text form.
template <typename T>
struct Describe {
    [[nodiscard]] std::string operator()(const T& val) const {
        return fmt::format(FMT_STRING("{}"), val);
    }
};

template <>
struct Describe<char> {
    [[nodiscard]] std::string operator()(char val) const {
        return fmt::format(FMT_STRING("'{}'"), val);
    }
};

template <>
struct Describe<char32_t> {
    [[nodiscard]] std::string operator()(char32_t val) const {
        return fmt::format(FMT_STRING("'{:s}'"), utf8_encode_single(val));
    }
};

template <>
struct Describe<std::string_view> {
    [[nodiscard]] std::string operator()(std::string_view val) const {
        return fmt::format(FMT_STRING("\"{:s}\""), val);
    }
};

template <>
struct Describe<std::string> {
    [[nodiscard]] std::string operator()(const std::string& val) const {
        return Describe<std::string_view>()(val);
    }
};

template <>
struct Describe<Value> {
    [[nodiscard]] std::string operator()(const Value& val) const {
        switch (val.type) {
            using enum Value::Type;
            case CHAR: return Describe<char32_t>()(val.as_char());
            case STRING: return Describe<std::string_view>()(val.as_string());
            case BOOL:
            case INT:
            case FLOAT: return fmt::format(FMT_STRING("{}"), val);
        }
        unreachable();
    }
};

}  // namespace dset
