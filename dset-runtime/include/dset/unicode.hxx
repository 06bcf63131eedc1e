#pragma once

#include "dset/common.hxx"

#include <array>
#include <codecvt>
#include <cwchar>
#include <string>
#include <string_view>
#include <utility>

namespace dset {

template <typename F>
struct NoLocaleFacet : F {
    template <typename... Args>
    explicit NoLocaleFacet(Args&&... args) : F(std::forward<Args>(args)...) {}
    NoLocaleFacet(const NoLocaleFacet& other) = delete;
    NoLocaleFacet(NoLocaleFacet&& other) = delete;
    ~NoLocaleFacet() override = default;
    NoLocaleFacet* operator=(const NoLocaleFacet& other) = delete;
    NoLocaleFacet* operator=(NoLocaleFacet&& other) = delete;
};

using Utf8Facet = std::codecvt<char32_t, char8_t, std::mbstate_t>;

[[nodiscard]] inline std::string utf8_encode_single(char32_t val) {
    std::array<char8_t, 4> buffer{};
    const char32_t* src_next = nullptr;
    char8_t* dst_next = nullptr;
    std::mbstate_t mb_state{};
    const auto facet = NoLocaleFacet<Utf8Facet>();
    const auto result = facet.out(
        mb_state,
        &val,
        std::next(&val),
        src_next,
        buffer.data(),
        std::next(buffer.data(), static_cast<isize>(buffer.size())),
        dst_next
    );
    if (result != std::codecvt_base::result::ok) { return {}; }
    return {buffer.data(), dst_next};
}

// Decodes `text` one code point at a time and calls `func` with each of them.
// Bytes that are not part of a valid UTF-8 sequence are passed on as is.
template <typename F>
inline void for_each_code_point(std::string_view text, F func) {
    const auto facet = NoLocaleFacet<Utf8Facet>();
    const auto* src = static_cast<const char8_t*>(
        static_cast<const void*>(text.data())
    );
    const auto* src_end = std::next(src, static_cast<isize>(text.size()));
    while (src != src_end) {
        char32_t code_point = 0;
        const char8_t* src_next = nullptr;
        char32_t* dst_next = nullptr;
        std::mbstate_t mb_state{};
        const auto result = facet.in(
            mb_state,
            src,
            src_end,
            src_next,
            &code_point,
            std::next(&code_point),
            dst_next
        );
        if (result == std::codecvt_base::result::error
            || dst_next == &code_point) {
            func(static_cast<char32_t>(static_cast<u8>(*src)));
            src = std::next(src);
            continue;
        }
        func(code_point);
        src = src_next;
    }
}

}  // namespace dset
