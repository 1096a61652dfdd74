#pragma once

#include <cstdint>  // int32_t, uint32_t...
#include <cstddef>  // size_t, ptrdiff_t

// =============================
// Types.hpp
// =============================
// Fixed-size and platform-consistent types used across Chronos.
// All modules should rely on these aliases instead of raw native
// types like 'int' or 'long'.
// =============================

namespace chr
{
// ---- Integer types ----
using int8 = std::int8_t;
using int16 = std::int16_t;
using int32 = std::int32_t;
using int64 = std::int64_t;

using uint8 = std::uint8_t;
using uint16 = std::uint16_t;
using uint32 = std::uint32_t;
using uint64 = std::uint64_t;

// ---- Short aliases (i*/u* pattern) ----
using i8  = int8;
using i16 = int16;
using i32 = int32;
using i64 = int64;

using u8  = uint8;
using u16 = uint16;
using u32 = uint32;
using u64 = uint64;

// ---- Floating point ----
using float32 = float;
using float64 = double;

// ---- Size and pointer-related ----
using usize = std::size_t;
using isize = std::ptrdiff_t;

// ---- Time ----
using Seconds   = float64; // Durations and deltas, in seconds.
using Timestamp = int64;   // Wall-clock instant, nanoseconds since the Unix epoch.

enum class DeterminismMode : u8
{
    Unknown = 0,
    Off,
    Replay,
    Strict
};

enum class ThreadSafetyMode : u8
{
    Unknown = 0,
    ExternalSync,
    ThreadSafe
};
} // namespace chr
