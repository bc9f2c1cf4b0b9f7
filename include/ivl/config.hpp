// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef IVL_CONFIG_HPP
#define IVL_CONFIG_HPP

// Configuration and feature-detection for ivl.
//
// Baseline: C++20
//
// This header intentionally contains only preprocessor logic.  Every switch
// can be overridden on the compiler command line or before the first ivl
// include.

#ifndef IVL_DEBUG_THREAD_SAFETY
// When enabled, text containers carry an access tracker that detects a
// mutation overlapping another access to the same interval tree.
//
// This is a *debugging aid* only.  An interval tree must still be mutated by
// a single writer at a time.
#define IVL_DEBUG_THREAD_SAFETY 0
#endif

#ifndef IVL_DEBUG_THREAD_SAFETY_HISTORY
// Number of recent access events retained per container for diagnostics.
// Set to 0 to disable history recording (still reports basic conflicts).
#define IVL_DEBUG_THREAD_SAFETY_HISTORY 16
#endif

#ifndef IVL_THREAD_SAFETY_ABORT
#include <cstdlib>
#define IVL_THREAD_SAFETY_ABORT() std::abort()
#endif

#ifndef IVL_CHECK_INVARIANTS
// When enabled, every mutating text-container operation re-verifies the
// lengths and back-references of the whole tree before returning.  O(n).
#define IVL_CHECK_INVARIANTS 0
#endif

// IVL_INVARIANT_FAILURE(what) is invoked after a violated-invariant
// diagnostic has been printed.  The default (see ivl/error.hpp) throws
// ivl::violated_invariant.

// -------- Language version detection --------

#if defined(_MSVC_LANG)
#define IVL_CPP_LANG _MSVC_LANG
#else
#define IVL_CPP_LANG __cplusplus
#endif

#if IVL_CPP_LANG >= 202302L
#define IVL_HAS_CPP23 1
#else
#define IVL_HAS_CPP23 0
#endif

#if IVL_CPP_LANG >= 202002L
#define IVL_HAS_CPP20 1
#else
#define IVL_HAS_CPP20 0
#endif

#if !IVL_HAS_CPP20
#error "ivl requires C++20"
#endif

// Attributes / hints
#define IVL_NODISCARD [[nodiscard]]

#if defined(__GNUC__) || defined(__clang__)
#define IVL_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define IVL_UNLIKELY(x) (x)
#endif

// Source-location-ish helper.
#define IVL_STRINGIFY_IMPL(x) #x
#define IVL_STRINGIFY(x) IVL_STRINGIFY_IMPL(x)
#define IVL_SOURCE_LOC (__FILE__ ":" IVL_STRINGIFY(__LINE__))

#if IVL_DEBUG_THREAD_SAFETY
#define IVL_LOC IVL_SOURCE_LOC
#else
#define IVL_LOC nullptr
#endif

#endif  // IVL_CONFIG_HPP
