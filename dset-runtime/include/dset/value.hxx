#pragma once

#include "dset/common.hxx"
#include "dset/utils.hxx"

#include <bit>
#include <cassert>
#include <string>
#include <string_view>
#include <utility>

namespace dset {

// Heterogeneous set element. Scalars live in the union, text in `str`.
struct Value {
    enum class Type {
        BOOL,
        INT,
        FLOAT,
        CHAR,
        STRING,
    };

    Type type;
    union {
        bool boolean;
        int_t integer;
        float_t scalar;
        char32_t chr = U'\0';
    } as;
    std::string str{};

    constexpr Value() noexcept = delete;

    constexpr explicit Value(bool val) noexcept
            : type(Type::BOOL)
            , as{.boolean = val} {}

    constexpr explicit Value(int_t val) noexcept
            : type(Type::INT)
            , as{.integer = val} {}

    constexpr explicit Value(float_t val) noexcept
            : type(Type::FLOAT)
            , as{.scalar = val} {}

    constexpr explicit Value(char32_t val) noexcept
            : type(Type::CHAR)
            , as{.chr = val} {}

    constexpr explicit Value(std::string val) noexcept
            : type(Type::STRING)
            , str(std::move(val)) {}

    constexpr explicit Value(std::string_view val)
            : Value(std::string(val)) {}

    constexpr explicit Value(const char* val)
            : Value(std::string(val)) {}

    [[nodiscard]] constexpr bool as_bool() const noexcept {
        assert(is_bool());
        // NOLINTNEXTLINE(*-union-access)
        return as.boolean;
    }

    [[nodiscard]] constexpr int_t as_int() const noexcept {
        assert(is_int());
        // NOLINTNEXTLINE(*-union-access)
        return as.integer;
    }

    [[nodiscard]] constexpr float_t as_float() const noexcept {
        assert(is_float());
        // NOLINTNEXTLINE(*-union-access)
        return as.scalar;
    }

    [[nodiscard]] constexpr char32_t as_char() const noexcept {
        assert(is_char());
        // NOLINTNEXTLINE(*-union-access)
        return as.chr;
    }

    [[nodiscard]] constexpr std::string_view as_string() const noexcept {
        assert(is_string());
        return str;
    }

    [[nodiscard]] constexpr bool is_bool() const noexcept {
        return type == Type::BOOL;
    }

    [[nodiscard]] constexpr bool is_int() const noexcept {
        return type == Type::INT;
    }

    [[nodiscard]] constexpr bool is_float() const noexcept {
        return type == Type::FLOAT;
    }

    [[nodiscard]] constexpr bool is_number() const noexcept {
        return type == Type::FLOAT || type == Type::INT;
    }

    [[nodiscard]] constexpr bool is_char() const noexcept {
        return type == Type::CHAR;
    }

    [[nodiscard]] constexpr bool is_string() const noexcept {
        return type == Type::STRING;
    }

    [[nodiscard]] friend constexpr bool
    operator==(const Value& lhs, const Value& rhs) noexcept {
        if (lhs.type != rhs.type) { return false; }
        switch (lhs.type) {
            using enum Value::Type;
            case BOOL: return lhs.as_bool() == rhs.as_bool();
            case INT: return lhs.as_int() == rhs.as_int();
            // Bitwise, like the text form: 0.0 and -0.0 differ, NaN == NaN.
            case FLOAT:
                return std::bit_cast<u64>(lhs.as_float())
                    == std::bit_cast<u64>(rhs.as_float());
            case CHAR: return lhs.as_char() == rhs.as_char();
            case STRING: return lhs.as_string() == rhs.as_string();
        }
        unreachable();
    }
};

}  // namespace dset
