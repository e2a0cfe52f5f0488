// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

// This is an internal header file that is always included first by each Typecase source file. This means that any
// macros we might need to define to build 'typecase' can be defined here instead of passing them to the compiler
// through command line.

#ifndef TYPECASE_CORE_API_BUILD_P_H_INCLUDED
#define TYPECASE_CORE_API_BUILD_P_H_INCLUDED

// Build - Export
// ==============

//! \cond INTERNAL

//! Export mode is on when `TC_BUILD_EXPORT` is defined - this MUST be defined before including any other header
//! as "api.h" uses `TC_BUILD_EXPORT` to define a proper `TC_API` decorator that is used by all exported functions.
#define TC_BUILD_EXPORT

//! \endcond

// Build - Configuration
// =====================

// #define TC_BUILD_DEBUG
// ----------------------
//
// Enables assertions (TC_ASSERT) and disables forced inlining. Defined by CMakeLists.txt for Debug builds.

// #define TC_TRACE_OT_ALL          // Trace OpenType features (all).
// #define TC_TRACE_OT_CBDT         // Trace OpenType bitmaps  ('CBLC', 'CBDT').
// #define TC_TRACE_OT_CMAP         // Trace OpenType cmap     ('cmap').
// #define TC_TRACE_OT_CORE         // Trace OpenType core     ('OS/2', 'head', 'maxp').
// #define TC_TRACE_OT_FACE         // Trace OpenType face     (construction and lazily loaded tables).
// #define TC_TRACE_OT_IMAGES       // Trace OpenType images   (selection of an embedded image source).
// #define TC_TRACE_OT_LAYOUT       // Trace OpenType layout   ('GDEF', 'GPOS', 'GSUB').
// #define TC_TRACE_OT_METRICS      // Trace OpenType metrics  ('hhea', 'hmtx', 'vhea', 'vmtx').
// #define TC_TRACE_OT_NAMES        // Trace OpenType names    (glyph names).
// #define TC_TRACE_OT_POST         // Trace OpenType post     ('post').
// #define TC_TRACE_OT_SBIX         // Trace OpenType images   ('sbix').
// #define TC_TRACE_OT_SVG          // Trace OpenType images   ('SVG ').
//
// Typecase provides traces that can be enabled during development. Traces can help to understand why a table was
// rejected and which path was taken when resolving glyph images. The CMake option `TYPECASE_TRACE` defines
// `TC_TRACE_OT_ALL`. Trace messages go through the runtime message sink, see `tc_runtime_set_message_sink()`.

// Build - Requirements
// ====================

//! \cond NEVER

#ifdef _MSC_VER
  #if !defined(_CRT_SECURE_NO_DEPRECATE)
    #define _CRT_SECURE_NO_DEPRECATE
  #endif
  #if !defined(_CRT_SECURE_NO_WARNINGS)
    #define _CRT_SECURE_NO_WARNINGS
  #endif
#endif

//! \endcond

// Build - Compiler Diagnostics
// ============================

//! \cond NEVER

#if defined(__clang__)
  #pragma clang diagnostic warning "-Wattributes"
  #pragma clang diagnostic ignored "-Wunused-function"
#elif defined(__GNUC__)
  #pragma GCC diagnostic warning "-Wattributes"
  #pragma GCC diagnostic ignored "-Wmaybe-uninitialized" // Unfortunately GCC emits lots of false positives.
  #pragma GCC diagnostic ignored "-Wunused-function"
#elif defined(_MSC_VER)
  #pragma warning(disable: 4127) // Conditional expression is constant.
  #pragma warning(disable: 4201) // Nameless struct/union.
  #pragma warning(disable: 4251) // Struct needs to have dll-interface.
  #pragma warning(disable: 4505) // Unreferenced local function has been removed.
  #pragma warning(disable: 4800) // Forcing value to bool true or false.
#endif

//! \endcond

// Build - Include API
// ===================

#include <typecase/core/api.h>
#include <typecase/core/api-internal_p.h>

#endif // TYPECASE_CORE_API_BUILD_P_H_INCLUDED
