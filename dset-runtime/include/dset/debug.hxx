#pragma once

#include "dset/common.hxx"
#include "dset/formatting.hxx"
#include "dset/hash_set.hxx"

#include <fmt/format.h>

#include <cstdio>
#include <string_view>

namespace dset {

// Dumps the bucket array, one line per non empty bucket:
//   [0004] 4 -> 13
template <typename T, typename Hash, typename KeyEqual>
void print_buckets(
    const HashSet<T, Hash, KeyEqual>& set,
    std::string_view name,
    std::FILE* out = stdout
) {
    fmt::print(
        out,
        FMT_STRING("=={:=^40s}==\n"),
        fmt::format(
            FMT_STRING(" {:s} {:d}/{:d} "),
            name,
            set.length(),
            set.capacity()
        )
    );
    for (size_t i = 0; i < set.bucket_count(); ++i) {
        if (set.bucket_size(i) == 0) { continue; }
        fmt::print(out, FMT_STRING("[{:04d}]"), i);
        std::string_view sep = " ";
        set.for_each_in_bucket(i, [&](const T& value) {
            fmt::print(out, FMT_STRING("{:s}{:s}"), sep, Describe<T>()(value));
            sep = " -> ";
        });
        fmt::print(out, FMT_STRING("\n"));
    }
}

}  // namespace dset
