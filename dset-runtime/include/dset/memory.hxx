#pragma once

#include "dset/common.hxx"
#include "dset/utils.hxx"

#include <gsl/gsl>

#include <cassert>
#include <cstddef>
#include <memory>
#include <memory_resource>
#include <utility>

namespace dset {

using Allocator = std::pmr::polymorphic_allocator<std::byte>;

// NOTE: Allocation failure is fatal. A rebuild interrupted half way would
// leave the table without its invariants, so nothing is recovered.

[[nodiscard]] inline void* allocate_impl(
    Allocator alloc,
    size_t size,
    size_t alignment
) noexcept {
    assert(size > 0);
    void* result = alloc.allocate_bytes(
        static_cast<std::size_t>(size),
        static_cast<std::size_t>(alignment)
    );
    if (result == nullptr) { report_and_abort("Out of memory."); }
    return result;
}

inline void deallocate_impl(
    Allocator alloc,
    void* pointer,
    size_t size,
    size_t alignment
) noexcept {
    if (pointer == nullptr) { return; }
    alloc.deallocate_bytes(
        pointer,
        static_cast<std::size_t>(size),
        static_cast<std::size_t>(alignment)
    );
}

// Returns uninitialized storage for `count` objects, nullptr for zero.
template <typename T>
[[nodiscard]] gsl::owner<T*> allocate(Allocator alloc, size_t count) noexcept {
    if (count == 0) { return nullptr; }
    return static_cast<T*>(allocate_impl(alloc, sizeof(T) * count, alignof(T)));
}

template <typename T>
void free_array(Allocator alloc, T* pointer, size_t count) noexcept {
    deallocate_impl(alloc, pointer, sizeof(T) * count, alignof(T));
}

template <typename T, typename... Args>
[[nodiscard]] gsl::owner<T*>
new_object(Allocator alloc, Args&&... args) noexcept {
    gsl::owner<T*> ptr = allocate<T>(alloc, 1);
    return std::construct_at(ptr, std::forward<Args>(args)...);
}

template <typename T>
void delete_object(Allocator alloc, T* ptr) noexcept {
    std::destroy_at(ptr);
    free_array<T>(alloc, ptr, 1);
}

}  // namespace dset
