#pragma once

#include "dset/common.hxx"
#include "dset/formatting.hxx"
#include "dset/hash.hxx"
#include "dset/memory.hxx"
#include "dset/search.hxx"
#include "dset/utils.hxx"

#include <fmt/format.h>
#include <gsl/gsl>

#include <cassert>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dset {

struct SetOptions {
    bool trace_rehash = false;
    bool trace_mutations = false;
};

// Hash set with separate chaining. Each bucket owns a singly linked chain,
// chain order is insertion order within the bucket. Every change of capacity
// relinks all the values into a new bucket array, so a value always sits in
// bucket `Hash()(value) % capacity()`.
//
// Not thread safe. Allocation failure aborts.
template <
    typename T,
    typename Hash = CharSumHash<T>,
    typename KeyEqual = std::equal_to<T>>
class HashSet {
    struct Node {
        T value;
        gsl::owner<Node*> next = nullptr;

        template <typename... Args>
        constexpr explicit Node(Args&&... args)
                : value(std::forward<Args>(args)...) {}
    };

    using Link = gsl::owner<Node*>;

  public:
    using Sequence = std::pmr::vector<T>;

    class ConstIterator {
      public:
        using iterator_category = std::forward_iterator_tag;
        using difference_type = std::ptrdiff_t;
        using value_type = T;
        using pointer = const value_type*;
        using reference = const value_type&;

      private:
        const HashSet* set_ptr = nullptr;
        size_t index = 0;
        const Node* node = nullptr;

        friend class HashSet;

        constexpr void advance() noexcept {
            while (node == nullptr && index < set_ptr->capacity_) {
                ++index;
                if (index < set_ptr->capacity_) {
                    node = *std::next(set_ptr->buckets, to_offset(index));
                }
            }
        }

      public:
        constexpr ConstIterator(
            const HashSet* set,
            size_t bucket_index,
            const Node* first
        ) noexcept
                : set_ptr(set)
                , index(bucket_index)
                , node(first) {}

        [[nodiscard]] constexpr bool operator==(const ConstIterator& other
        ) const noexcept {
            return node == other.node;
        }

        [[nodiscard]] constexpr bool operator!=(const ConstIterator& other
        ) const noexcept {
            return node != other.node;
        }

        constexpr ConstIterator& operator++() noexcept {
            node = node->next;
            advance();
            return *this;
        }

        constexpr ConstIterator operator++(int) noexcept {
            ConstIterator tmp = *this;
            ++(*this);
            return tmp;
        }

        [[nodiscard]] constexpr const T& operator*() const noexcept {
            return node->value;
        }

        [[nodiscard]] constexpr const T* operator->() const noexcept {
            return &node->value;
        }
    };

    using key_type = T;
    using value_type = T;
    using size_type = size_t;
    using difference_type = std::ptrdiff_t;
    using hasher = Hash;
    using key_equal = KeyEqual;
    using iterator = ConstIterator;
    using const_iterator = ConstIterator;
    using reference = const value_type&;
    using const_reference = const value_type&;

  private:
    SetOptions options{};
    Allocator allocator{};
    size_t count = 0;
    size_t capacity_ = 0;
    gsl::owner<Link*> buckets = nullptr;

  public:
    explicit HashSet(SetOptions opts = {}, const Allocator& alloc = {}) noexcept
            : options(opts)
            , allocator(alloc)
            , capacity_(DEFAULT_CAPACITY)
            , buckets(allocate_buckets(allocator, DEFAULT_CAPACITY)) {}

    explicit HashSet(
        std::span<const T> values,
        SetOptions opts = {},
        const Allocator& alloc = {}
    ) noexcept
            : HashSet(opts, alloc) {
        union_update(values);
    }

    HashSet(
        std::initializer_list<T> values,
        SetOptions opts = {},
        const Allocator& alloc = {}
    ) noexcept
            : HashSet(
                std::span<const T>(values.begin(), values.size()),
                opts,
                alloc
            ) {}

    HashSet(const HashSet& other) = delete;

    HashSet(HashSet&& other) noexcept
            : options(other.options)
            , allocator(other.allocator)
            , count(std::exchange(other.count, 0))
            , capacity_(std::exchange(other.capacity_, 0))
            , buckets(std::exchange(other.buckets, nullptr)) {}

    ~HashSet() noexcept { destroy(); }

    HashSet& operator=(const HashSet& other) = delete;

    // The allocator of a set never changes.
    HashSet& operator=(HashSet&& other) = delete;

    [[nodiscard]] Allocator get_allocator() const { return allocator; }

    [[nodiscard]] constexpr const SetOptions& get_options() const noexcept {
        return options;
    }

    [[nodiscard]] constexpr SetOptions& get_options() noexcept {
        return options;
    }

    [[nodiscard]] constexpr size_t length() const noexcept { return count; }

    [[nodiscard]] constexpr size_t size() const noexcept { return count; }

    [[nodiscard]] constexpr bool empty() const noexcept { return count == 0; }

    [[nodiscard]] constexpr size_t capacity() const noexcept {
        return capacity_;
    }

    [[nodiscard]] constexpr size_t bucket_count() const noexcept {
        return capacity_;
    }

    [[nodiscard]] size_t bucket(const T& value) const noexcept {
        assert(capacity_ > 0);
        return bucket_index(value, capacity_);
    }

    [[nodiscard]] size_t bucket_size(size_t index) const noexcept {
        size_t result = 0;
        for_each_in_bucket(index, [&result](const T& /*value*/) {
            ++result;
        });
        return result;
    }

    // Calls `func` with every value of bucket `index`, in chain order.
    template <typename F>
    void for_each_in_bucket(size_t index, F func) const {
        assert(index < capacity_);
        for (const Node* node = bucket_head(index); node != nullptr;
             node = node->next) {
            std::invoke(func, node->value);
        }
    }

    // Returns true if `value` was not in the set. An equal value already
    // present is replaced by `value`.
    bool add(T value) noexcept {
        if (Node* node = find_node(value); node != nullptr) {
            node->value = std::move(value);
            return false;
        }
        if (count + 1 >= capacity_) {
            size_t new_cap = grow_capacity(capacity_);
            while (count + 1 >= new_cap) { new_cap = grow_capacity(new_cap); }
            rehash_impl(new_cap, "grow");
        }
        Link node = new_object<Node>(allocator, std::move(value));
        link_at_tail(buckets, capacity_, node);
        ++count;
        trace_mutation("add", node->value);
        return true;
    }

    // Returns true if a value was removed, removing an absent value is not
    // an error.
    bool remove(const T& value) noexcept {
        if (capacity_ == 0) { return false; }
        Link* link = std::next(
            buckets,
            to_offset(bucket_index(value, capacity_))
        );
        while (*link != nullptr) {
            if (KeyEqual()((*link)->value, value)) {
                Link node = *link;
                *link = node->next;
                --count;
                trace_mutation("remove", node->value);
                delete_object(allocator, node);
                return true;
            }
            link = &(*link)->next;
        }
        return false;
    }

    [[nodiscard]] bool contains(const T& value) const noexcept {
        return find_node(value) != nullptr;
    }

    void clear() noexcept {
        for (size_t i = 0; i < capacity_; ++i) {
            Link& head = *std::next(buckets, to_offset(i));
            free_chain(head);
            head = nullptr;
        }
        count = 0;
    }

    // Snapshot of every value, in bucket order then chain order.
    [[nodiscard]] Sequence enumerate() const {
        Sequence result(allocator);
        result.reserve(count);
        for (const auto& value : *this) { result.push_back(value); }
        return result;
    }

    void union_update(std::span<const T> values) noexcept {
        for (const auto& value : values) { add(value); }
    }

    void union_update(std::initializer_list<T> values) noexcept {
        union_update(std::span<const T>(values.begin(), values.size()));
    }

    // The values as given, duplicates included, then every value of the set
    // that is not among them.
    [[nodiscard]] Sequence set_union(std::span<const T> values) const {
        size_t shared = 0;
        for (const auto& value : *this) {
            if (contains_any(values, value, KeyEqual())) { ++shared; }
        }
        Sequence result(allocator);
        result.reserve(count + values.size() - shared);
        result.insert(result.end(), values.begin(), values.end());
        for (const auto& value : *this) {
            if (!contains_any(values, value, KeyEqual())) {
                result.push_back(value);
            }
        }
        return result;
    }

    [[nodiscard]] Sequence set_union(std::initializer_list<T> values) const {
        return set_union(std::span<const T>(values.begin(), values.size()));
    }

    [[nodiscard]] Sequence set_intersection(std::span<const T> values) const {
        Sequence result(allocator);
        for (const auto& value : *this) {
            if (contains_any(values, value, KeyEqual())) {
                result.push_back(value);
            }
        }
        return result;
    }

    [[nodiscard]] Sequence set_intersection(std::initializer_list<T> values
    ) const {
        return set_intersection(
            std::span<const T>(values.begin(), values.size())
        );
    }

    [[nodiscard]] Sequence set_difference(std::span<const T> values) const {
        Sequence result(allocator);
        for (const auto& value : *this) {
            if (!contains_any(values, value, KeyEqual())) {
                result.push_back(value);
            }
        }
        return result;
    }

    [[nodiscard]] Sequence set_difference(std::initializer_list<T> values
    ) const {
        return set_difference(std::span<const T>(values.begin(), values.size())
        );
    }

    // The bucket array is rebuilt with exactly as many buckets as there are
    // values left, possibly zero.
    void intersection_update(std::span<const T> values) noexcept {
        const auto survivors = set_intersection(values);
        rebuild(survivors, survivors.size(), "intersection");
    }

    void intersection_update(std::initializer_list<T> values) noexcept {
        intersection_update(std::span<const T>(values.begin(), values.size()));
    }

    void difference_update(std::span<const T> values) noexcept {
        const auto survivors = set_difference(values);
        rebuild(survivors, survivors.size(), "difference");
    }

    void difference_update(std::initializer_list<T> values) noexcept {
        difference_update(std::span<const T>(values.begin(), values.size()));
    }

    template <typename F = Describe<T>>
    [[nodiscard]] std::string describe(F func = F()) const {
        fmt::memory_buffer buffer;
        auto out = std::back_inserter(buffer);
        fmt::format_to(out, FMT_STRING("{{"));
        std::string_view sep;
        for (const auto& value : *this) {
            fmt::format_to(
                out,
                FMT_STRING("{}{}"),
                sep,
                std::invoke(func, value)
            );
            sep = ", ";
        }
        fmt::format_to(out, FMT_STRING("}}"));
        return fmt::to_string(buffer);
    }

    [[nodiscard]] ConstIterator begin() const noexcept { return cbegin(); }

    [[nodiscard]] ConstIterator cbegin() const noexcept {
        if (capacity_ == 0) { return cend(); }
        ConstIterator iter(this, 0, bucket_head(0));
        iter.advance();
        return iter;
    }

    [[nodiscard]] ConstIterator end() const noexcept { return cend(); }

    [[nodiscard]] ConstIterator cend() const noexcept {
        return ConstIterator(this, capacity_, nullptr);
    }

  private:
    [[nodiscard]] static constexpr std::ptrdiff_t to_offset(size_t index
    ) noexcept {
        return gsl::narrow_cast<std::ptrdiff_t>(index);
    }

    [[nodiscard]] static size_t
    bucket_index(const T& value, size_t capacity) noexcept {
        return static_cast<size_t>(Hash()(value)) % capacity;
    }

    [[nodiscard]] static gsl::owner<Link*>
    allocate_buckets(Allocator alloc, size_t capacity) noexcept {
        gsl::owner<Link*> result = allocate<Link>(alloc, capacity);
        std::uninitialized_fill_n(result, capacity, nullptr);
        return result;
    }

    static void link_at_tail(Link* heads, size_t capacity, Link node) noexcept {
        Link* link = std::next(
            heads,
            to_offset(bucket_index(node->value, capacity))
        );
        while (*link != nullptr) { link = &(*link)->next; }
        *link = node;
    }

    [[nodiscard]] const Node* bucket_head(size_t index) const noexcept {
        return *std::next(buckets, to_offset(index));
    }

    [[nodiscard]] Node* find_node(const T& value) const noexcept {
        if (capacity_ == 0) { return nullptr; }
        Node* node = *std::next(
            buckets,
            to_offset(bucket_index(value, capacity_))
        );
        while (node != nullptr) {
            if (KeyEqual()(node->value, value)) { return node; }
            node = node->next;
        }
        return nullptr;
    }

    void free_chain(Link head) noexcept {
        while (head != nullptr) {
            Link next = head->next;
            delete_object(allocator, head);
            head = next;
        }
    }

    void destroy() noexcept {
        clear();
        free_array<Link>(allocator, buckets, capacity_);
        buckets = nullptr;
        capacity_ = 0;
    }

    // Moves every node into a new bucket array of `new_cap` buckets.
    void rehash_impl(size_t new_cap, std::string_view reason) noexcept {
        gsl::owner<Link*> new_buckets = allocate_buckets(allocator, new_cap);
        for (size_t i = 0; i < capacity_; ++i) {
            Link node = *std::next(buckets, to_offset(i));
            while (node != nullptr) {
                Link next = node->next;
                node->next = nullptr;
                link_at_tail(new_buckets, new_cap, node);
                node = next;
            }
        }
        trace_rehash(reason, capacity_, new_cap, count);
        free_array<Link>(allocator, buckets, capacity_);
        buckets = new_buckets;
        capacity_ = new_cap;
    }

    // Fills a new bucket array with copies of `survivors`, then swaps it in
    // and frees the old chains. `survivors` must hold distinct values.
    void rebuild(
        std::span<const T> survivors,
        size_t new_cap,
        std::string_view reason
    ) noexcept {
        gsl::owner<Link*> new_buckets = allocate_buckets(allocator, new_cap);
        for (const auto& value : survivors) {
            Link node = new_object<Node>(allocator, value);
            link_at_tail(new_buckets, new_cap, node);
        }
        trace_rehash(reason, capacity_, new_cap, survivors.size());
        destroy();
        buckets = new_buckets;
        capacity_ = new_cap;
        count = survivors.size();
    }

    void trace_rehash(
        std::string_view reason,
        size_t old_cap,
        size_t new_cap,
        size_t live
    ) const noexcept {
        if constexpr (HAS_DEBUG_FEATURES) {
            if (options.trace_rehash) {
                fmt::print(
                    stderr,
                    FMT_STRING("-- rehash {:s} {:d} -> {:d}, {:d} live\n"),
                    reason,
                    old_cap,
                    new_cap,
                    live
                );
            }
        }
    }

    void trace_mutation(std::string_view operation, const T& value)
        const noexcept {
        if constexpr (HAS_DEBUG_FEATURES && TextFormattable<T>) {
            if (options.trace_mutations) {
                fmt::print(
                    stderr,
                    FMT_STRING("-- {:s} {} in bucket {:d}, {:d} live\n"),
                    operation,
                    Describe<T>()(value),
                    bucket_index(value, capacity_),
                    count
                );
            }
        }
    }
};

}  // namespace dset

namespace fmt {

template <typename T, typename Hash, typename KeyEqual>
struct formatter<dset::HashSet<T, Hash, KeyEqual>> : formatter<string_view> {
    template <typename FormatContext>
    auto format(
        const dset::HashSet<T, Hash, KeyEqual>& set,
        FormatContext& ctx
    ) const {
        return format_to(ctx.out(), "{:s}", set.describe());
    }
};

}  // namespace fmt
