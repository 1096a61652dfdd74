#pragma once
//
// Chronos - Core/Diagnostics/Check.hpp
// Lightweight invariant macros (no heavy deps).
//
// Provided:
//   - CHR_CHECK(cond): soft check, no-op in Release. In Debug, optionally breaks.
//
// Not provided here (to avoid clashes with Logger.hpp):
//   - CHR_ASSERT(...) -> lives in Logger.hpp (rich formatting).
//
// Optional toggles (define before including this header):
//   - CHR_CHECK_BREAK   : CHR_CHECK breaks in Debug when cond fails
//

#ifndef CHR_DEBUG
#  ifndef NDEBUG
#    define CHR_DEBUG 1
#  else
#    define CHR_DEBUG 0
#  endif
#endif

#if CHR_DEBUG
#  if defined(_MSC_VER)
#    define CHR_INTERNAL_DEBUG_BREAK() __debugbreak()
#  elif defined(__clang__) || defined(__GNUC__)
#    define CHR_INTERNAL_DEBUG_BREAK() __builtin_trap()
#  else
#    include <cstdlib>
#    define CHR_INTERNAL_DEBUG_BREAK() std::abort()
#  endif
#else
#  define CHR_INTERNAL_DEBUG_BREAK() ((void)0)
#endif

#ifndef CHR_CHECK
#  if CHR_DEBUG && defined(CHR_CHECK_BREAK)
#    define CHR_CHECK(cond) do { if(!(cond)) { CHR_INTERNAL_DEBUG_BREAK(); } } while(0)
#  elif CHR_DEBUG
#    define CHR_CHECK(cond) do { if(!(cond)) { /* breakpoint here */ } } while(0)
#  else
#    define CHR_CHECK(cond) ((void)0)
#  endif
#endif
