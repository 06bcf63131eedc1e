#pragma once

// This file will be generated automatically when you run the CMake
// configuration step. It creates a namespace called `dset::cmake`.
// You can modify the source template at `configured_files/config.hxx.in`.
#include "internal_use_only/config.hxx"

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace dset {

#ifdef NDEBUG
inline constexpr bool IS_DEBUG_BUILD = false;
#else
inline constexpr bool IS_DEBUG_BUILD = true;
#endif

inline constexpr std::string_view PROJECT_NAME = cmake::project_name;
inline constexpr std::string_view VERSION = cmake::project_version;
inline constexpr int VERSION_MAJOR = cmake::project_version_major;
inline constexpr int VERSION_MINOR = cmake::project_version_minor;
inline constexpr int VERSION_PATCH = cmake::project_version_patch;
inline constexpr int VERSION_TWEAK = cmake::project_version_tweak;
inline constexpr std::string_view GIT_SHA = cmake::git_sha;

inline constexpr bool HAS_DEBUG_FEATURES = cmake::has_debug_features;

// Usefull short type aliases
using i8 = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;
using isize = std::ptrdiff_t;
using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;
using usize = std::size_t;
using f32 = float;
using f64 = double;

using int_t = i64;
using float_t = f64;

// NOTE: Size type used in collections
using size_t = usize;

// NOTE: Not configurable, the growth policy depends on these values
inline constexpr size_t DEFAULT_CAPACITY = 10;
inline constexpr size_t CAPACITY_SCALE_FACTOR = 2;

}  // namespace dset
