// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TYPECASE_CORE_API_INTERNAL_P_H_INCLUDED
#define TYPECASE_CORE_API_INTERNAL_P_H_INCLUDED

#include <typecase/core/api.h>

// C Headers
// =========

#include <stdarg.h>
#include <stddef.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

// C++ Headers
// ===========

#include <new>
#include <utility>

//! \cond INTERNAL
//! \addtogroup typecase_internal
//! \{

// Internal Compiler Features
// ==========================

//! \def TC_HIDDEN
//!
//! Decorates a function that is used across more than one source file, but should never be exported. Expands to
//! a compiler-specific code that affects the visibility.
#if defined(__GNUC__) && !defined(__MINGW32__)
  #define TC_HIDDEN __attribute__((__visibility__("hidden")))
#else
  #define TC_HIDDEN
#endif

#if defined(TC_BUILD_DEBUG)
  #define TC_INLINE_IF_NOT_DEBUG
#else
  #define TC_INLINE_IF_NOT_DEBUG TC_INLINE
#endif

//! Decorator used to mark all functions that are exported from the library.
#define TC_API_IMPL TC_API

// Internal Assertions
// ===================

//! Called when an assertion fails, prints the message and aborts.
TC_API void TC_CDECL tc_runtime_assertion_failure(const char* file, int line, const char* msg) noexcept;

//! \def TC_ASSERT(EXP)
//!
//! Run-time assertion executed in debug builds.
#if defined(TC_BUILD_DEBUG)
  #define TC_ASSERT(...)                                                      \
    do {                                                                      \
      if (TC_UNLIKELY(!(__VA_ARGS__)))                                        \
        tc_runtime_assertion_failure(__FILE__, __LINE__, #__VA_ARGS__);       \
    } while (0)
#else
  #define TC_ASSERT(...) ((void)0)
#endif

// Internal C++ Macros
// ===================

//! \def TC_NONCOPYABLE
//!
//! Makes a class noncopyable by making its copy constructor and copy assignment operator deleted.
#define TC_NONCOPYABLE(...)                                                   \
  __VA_ARGS__(const __VA_ARGS__& other) = delete;                             \
  __VA_ARGS__& operator=(const __VA_ARGS__& other) = delete;

#define TC_ARRAY_SIZE(X) uint32_t(sizeof(X) / sizeof(X[0]))

#define TC_PROPAGATE_(exp, cleanup)                                           \
  do {                                                                        \
    TCResult _result_to_propagate = (exp);                                    \
    if (TC_UNLIKELY(_result_to_propagate != TC_SUCCESS)) {                    \
      cleanup                                                                 \
      return _result_to_propagate;                                            \
    }                                                                         \
  } while (0)

#define TC_RETURN_ERROR_IF_NULL(ptr)                                          \
  do {                                                                        \
    if (!(ptr))                                                               \
      return tc_make_error(TC_ERROR_OUT_OF_MEMORY);                           \
  } while (0)

// Internal Constants
// ==================

//! Maximum number of faces per a single font collection.
static constexpr uint32_t TC_FONT_DATA_MAX_FACE_COUNT = 256u;

// Internal C++ Functions
// ======================

//! Returns the passed `result` - a place to put a breakpoint when debugging error propagation.
static TC_INLINE_NODEBUG TCResult tc_make_error(TCResult result) noexcept { return result; }

//! Used to silence warnings about unused arguments or variables.
template<typename... Args>
static TC_INLINE_NODEBUG void tc_unused(Args&&...) noexcept {}

template<typename T>
static constexpr TC_INLINE_NODEBUG T tc_min(const T& a, const T& b) noexcept { return b < a ? b : a; }

template<typename T>
static constexpr TC_INLINE_NODEBUG T tc_max(const T& a, const T& b) noexcept { return a < b ? b : a; }

//! \}
//! \endcond

#endif // TYPECASE_CORE_API_INTERNAL_P_H_INCLUDED
