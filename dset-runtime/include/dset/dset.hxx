#pragma once

#include "dset/common.hxx"
#include "dset/debug.hxx"
#include "dset/exit_codes.hxx"
#include "dset/formatting.hxx"
#include "dset/hash.hxx"
#include "dset/hash_set.hxx"
#include "dset/memory.hxx"
#include "dset/parsing.hxx"
#include "dset/search.hxx"
#include "dset/unicode.hxx"
#include "dset/utils.hxx"
#include "dset/value.hxx"

namespace dset {

using ValueSet = HashSet<Value>;

}  // namespace dset
