#include "dset/hash.hxx"
#include "dset/search.hxx"
#include "dset/value.hxx"

#include <catch2/catch.hpp>

#include <string>
#include <string_view>
#include <vector>

using dset::int_t;
using dset::u32;
using dset::Value;

TEST_CASE("Hash is the sum of the code points of the text", "[hash]") {
    CHECK(dset::code_point_sum("") == 0);
    CHECK(dset::code_point_sum("a") == 97);
    CHECK(dset::code_point_sum("ab") == 97 + 98);
    CHECK(dset::code_point_sum("\xC3\xA9") == 0xE9);
    CHECK(dset::code_point_sum("a\xE2\x82\xAC") == 97 + 0x20AC);
}

TEST_CASE("Invalid UTF-8 bytes count as code points", "[hash]") {
    CHECK(dset::code_point_sum("\xFF") == 0xFF);
    CHECK(dset::code_point_sum("a\xFF" "b") == 97 + 0xFF + 98);
}

TEST_CASE("Hash goes through the text form", "[hash]") {
    CHECK(dset::CharSumHash<int_t>()(1) == u32{'1'});
    CHECK(dset::CharSumHash<int_t>()(10) == u32{'1'} + u32{'0'});
    CHECK(dset::CharSumHash<std::string>()("ab") == 195);
    CHECK(dset::CharSumHash<std::string_view>()("ab") == 195);
    CHECK(dset::CharSumHash<Value>()(Value{"ab"}) == 195);
    CHECK(
        dset::CharSumHash<Value>()(Value{int_t{12}})
        == dset::CharSumHash<Value>()(Value{"12"})
    );
}

TEST_CASE("Anagrams always hash the same", "[hash]") {
    const dset::CharSumHash<std::string> hash;
    CHECK(hash("ab") == hash("ba"));
    CHECK(hash("listen") == hash("silent"));
    CHECK(dset::CharSumHash<int_t>()(123) == dset::CharSumHash<int_t>()(321));
}

TEST_CASE("Linear search scans the whole collection", "[search]") {
    const std::vector<int_t> values{4, 5, 6, 7};
    CHECK(dset::contains_any(values, int_t{4}));
    CHECK(dset::contains_any(values, int_t{7}));
    CHECK_FALSE(dset::contains_any(values, int_t{1}));
    CHECK_FALSE(dset::contains_any(std::vector<int_t>{}, int_t{1}));

    const auto same_parity = [](int_t lhs, int_t rhs) {
        return lhs % 2 == rhs % 2;
    };
    CHECK(dset::contains_any(std::vector<int_t>{2}, int_t{8}, same_parity));
    CHECK_FALSE(dset::contains_any(std::vector<int_t>{2}, int_t{3}, same_parity)
    );
}
