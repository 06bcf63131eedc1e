#include "dset/hash_set.hxx"
#include "dset/value.hxx"

#include <catch2/catch.hpp>

#include <string>
#include <vector>

using dset::int_t;
using dset::Value;

using Catch::Matchers::Equals;
using Catch::Matchers::UnorderedEquals;

namespace {

std::vector<int_t> to_vector(const dset::HashSet<int_t>::Sequence& values) {
    return {values.begin(), values.end()};
}

std::vector<int_t> to_vector(const dset::HashSet<int_t>& set) {
    return to_vector(set.enumerate());
}

}  // namespace

TEST_CASE("Reference scenario", "[hash_set][algebra]") {
    dset::HashSet<int_t> set;
    REQUIRE(set.capacity() == 10);

    set.union_update({1, 2, 3, 4, 5});
    CHECK(set.length() == 5);

    set.add(1);
    CHECK(set.length() == 5);

    set.intersection_update({4, 5, 2, 1});
    CHECK_THAT(
        to_vector(set),
        UnorderedEquals(std::vector<int_t>{1, 2, 4, 5})
    );
    CHECK(set.capacity() == 4);

    set.difference_update({4, 5, 6, 7});
    CHECK_THAT(to_vector(set), UnorderedEquals(std::vector<int_t>{1, 2}));
    CHECK(set.contains(2));
    CHECK(set.length() == 2);
    // Two buckets: "2" hashes to 0 and "1" to 1.
    CHECK(set.describe() == "{2, 1}");
}

TEST_CASE("Union update adds every value", "[hash_set][algebra]") {
    dset::HashSet<int_t> set{1, 2};

    SECTION("duplicates in the batch are added once") {
        set.union_update({2, 3, 3, 4});
        CHECK_THAT(
            to_vector(set),
            UnorderedEquals(std::vector<int_t>{1, 2, 3, 4})
        );
    }

    SECTION("empty batch") {
        set.union_update(std::vector<int_t>{});
        CHECK(set.length() == 2);
    }

    SECTION("a large batch grows the table several times") {
        std::vector<int_t> values;
        for (int_t i = 0; i < 100; ++i) { values.push_back(i); }
        set.union_update(values);
        CHECK(set.length() == 100);
        CHECK(set.capacity() == 160);
        for (const auto value : values) { REQUIRE(set.contains(value)); }
    }
}

TEST_CASE(
    "Construction from a batch is a union update",
    "[hash_set][algebra]"
) {
    const std::vector<int_t> values{3, 1, 3, 2};
    const dset::HashSet<int_t> set(values);
    CHECK(set.length() == 3);
    CHECK_THAT(to_vector(set), UnorderedEquals(std::vector<int_t>{1, 2, 3}));
}

TEST_CASE("Union leaves the set untouched", "[hash_set][algebra]") {
    const dset::HashSet<int_t> set{1, 2, 3};

    SECTION("batch first, then the values of the set it lacks") {
        // The set enumerates as 2, 3, 1.
        CHECK_THAT(
            to_vector(set.set_union({3, 4, 4})),
            Equals(std::vector<int_t>{3, 4, 4, 2, 1})
        );
    }

    SECTION("size is |S| + |A| - |S n A| for a batch without duplicates") {
        const std::vector<int_t> batch{2, 3, 6, 7};
        const auto result = set.set_union(batch);
        CHECK(result.size() == 3 + 4 - 2);
        for (const auto value : set) {
            CHECK(dset::contains_any(result, value));
        }
        for (const auto value : batch) {
            CHECK(dset::contains_any(result, value));
        }
    }

    SECTION("empty batch") {
        CHECK_THAT(
            to_vector(set.set_union(std::vector<int_t>{})),
            Equals(to_vector(set))
        );
    }

    CHECK(set.length() == 3);
    CHECK(set.capacity() == 10);
}

TEST_CASE(
    "Intersection update keeps the common values",
    "[hash_set][algebra]"
) {
    dset::HashSet<int_t> set{1, 2, 3, 4, 5};

    SECTION("the table is rebuilt to the exact size") {
        set.intersection_update({5, 3, 9});
        CHECK_THAT(to_vector(set), UnorderedEquals(std::vector<int_t>{3, 5}));
        CHECK(set.capacity() == 2);
        CHECK(set.length() == 2);
        CHECK(set.contains(3));
        CHECK(set.contains(5));
        CHECK_FALSE(set.contains(1));
    }

    SECTION("repeating it changes nothing") {
        set.intersection_update({5, 3, 9});
        const auto first = to_vector(set);
        set.intersection_update({5, 3, 9});
        CHECK_THAT(to_vector(set), Equals(first));
        CHECK(set.capacity() == 2);
    }

    SECTION("adding after a rebuild grows the table again") {
        set.intersection_update({5, 3});
        CHECK(set.add(7));
        CHECK(set.capacity() == 4);
        CHECK_THAT(
            to_vector(set),
            UnorderedEquals(std::vector<int_t>{3, 5, 7})
        );
    }
}

TEST_CASE(
    "Empty intersection leaves a zero capacity set",
    "[hash_set][algebra]"
) {
    dset::HashSet<int_t> set{1, 2, 3};

    SECTION("with disjoint values") { set.intersection_update({7, 8}); }

    SECTION("with an empty batch") {
        set.intersection_update(std::vector<int_t>{});
    }

    REQUIRE(set.capacity() == 0);
    CHECK(set.length() == 0);
    CHECK(set.empty());
    CHECK_FALSE(set.contains(1));
    CHECK_FALSE(set.remove(1));
    CHECK(set.begin() == set.end());
    CHECK(set.enumerate().empty());
    CHECK(set.describe() == "{}");
    CHECK(set.set_union({4}).size() == 1);

    set.intersection_update({1});
    set.difference_update({1});
    CHECK(set.capacity() == 0);

    CHECK(set.add(4));
    CHECK(set.capacity() == dset::DEFAULT_CAPACITY);
    CHECK(set.contains(4));
    CHECK(set.length() == 1);
}

TEST_CASE("Intersection leaves the set untouched", "[hash_set][algebra]") {
    const dset::HashSet<int_t> set{1, 2, 3, 4, 5};
    // Results follow the enumeration order of the set: 2, 3, 4, 5, 1.
    CHECK_THAT(
        to_vector(set.set_intersection({1, 5, 9, 2})),
        Equals(std::vector<int_t>{2, 5, 1})
    );
    CHECK(set.set_intersection({9}).empty());
    CHECK(set.length() == 5);
    CHECK(set.capacity() == 10);
}

TEST_CASE("Difference update drops the given values", "[hash_set][algebra]") {
    dset::HashSet<int_t> set{1, 2, 3, 4, 5};

    SECTION("only the matching values go") {
        set.difference_update({2, 4, 8});
        CHECK_THAT(
            to_vector(set),
            UnorderedEquals(std::vector<int_t>{1, 3, 5})
        );
        CHECK(set.capacity() == 3);
    }

    SECTION("an empty batch keeps every value but resizes the table") {
        set.difference_update(std::vector<int_t>{});
        CHECK(set.length() == 5);
        CHECK(set.capacity() == 5);
        for (int_t i = 1; i <= 5; ++i) { CHECK(set.contains(i)); }
    }

    SECTION("removing everything leaves a zero capacity set") {
        set.difference_update({1, 2, 3, 4, 5, 6});
        CHECK(set.length() == 0);
        CHECK(set.capacity() == 0);
        CHECK(set.add(6));
        CHECK(set.contains(6));
    }
}

TEST_CASE("Difference leaves the set untouched", "[hash_set][algebra]") {
    const dset::HashSet<int_t> set{1, 2, 3, 4, 5};
    CHECK_THAT(
        to_vector(set.set_difference({1, 5, 9})),
        Equals(std::vector<int_t>{2, 3, 4})
    );
    CHECK(set.length() == 5);
}

TEST_CASE("Set algebra on heterogeneous values", "[hash_set][algebra]") {
    dset::HashSet<Value> set{
        Value{int_t{1}},
        Value{U'a'},
        Value{"ab"},
        Value{"ba"},
        Value{2.5}};
    REQUIRE(set.length() == 5);

    set.intersection_update(
        {Value{"ba"}, Value{int_t{1}}, Value{"a"}, Value{2.5}}
    );
    CHECK(set.length() == 3);
    CHECK(set.contains(Value{"ba"}));
    CHECK(set.contains(Value{int_t{1}}));
    CHECK(set.contains(Value{2.5}));
    CHECK_FALSE(set.contains(Value{U'a'}));
    CHECK_FALSE(set.contains(Value{"ab"}));

    set.difference_update({Value{"1"}, Value{int_t{1}}});
    CHECK(set.length() == 2);
    CHECK_FALSE(set.contains(Value{int_t{1}}));
}
