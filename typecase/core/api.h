// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TYPECASE_CORE_API_H_INCLUDED
#define TYPECASE_CORE_API_H_INCLUDED

#include <stddef.h>
#include <stdint.h>
#include <string.h>

//! \addtogroup tc_globals
//! \{

// Typecase - Version
// ==================

//! Makes a version number representing a `MAJOR.MINOR.PATCH` combination.
#define TC_MAKE_VERSION(MAJOR, MINOR, PATCH) (((MAJOR) << 16) | ((MINOR) << 8) | (PATCH))

//! Typecase library version.
#define TC_VERSION TC_MAKE_VERSION(0, 4, 0)

// Typecase - Build Type
// =====================

//! \cond INTERNAL
#if defined(TC_STATIC)
  #define TC_API
#elif defined(_WIN32) && (defined(_MSC_VER) || defined(__MINGW32__))
  #if defined(TC_BUILD_EXPORT)
    #define TC_API __declspec(dllexport)
  #else
    #define TC_API __declspec(dllimport)
  #endif
#elif defined(__GNUC__)
  #define TC_API __attribute__((__visibility__("default")))
#else
  #define TC_API
#endif

#if defined(_MSC_VER) || defined(__MINGW32__)
  #define TC_CDECL __cdecl
#elif defined(__GNUC__) && (defined(__i386__) || defined(__i386))
  #define TC_CDECL __attribute__((__cdecl__))
#else
  #define TC_CDECL
#endif
//! \endcond

// Typecase - Compiler Features
// ============================

//! \def TC_INLINE
//!
//! Marks functions that should always be inlined.
#if defined(__GNUC__) && !defined(TC_BUILD_DEBUG)
  #define TC_INLINE inline __attribute__((__always_inline__))
#elif defined(_MSC_VER) && !defined(TC_BUILD_DEBUG)
  #define TC_INLINE __forceinline
#else
  #define TC_INLINE inline
#endif

//! \def TC_INLINE_NODEBUG
//!
//! Like \ref TC_INLINE, but also hides the function from the debugger.
#if defined(__clang__)
  #define TC_INLINE_NODEBUG inline __attribute__((__always_inline__, __nodebug__))
#else
  #define TC_INLINE_NODEBUG TC_INLINE
#endif

//! \def TC_NOINLINE
//!
//! Marks functions that should never be inlined.
#if defined(__GNUC__)
  #define TC_NOINLINE __attribute__((__noinline__))
#elif defined(_MSC_VER)
  #define TC_NOINLINE __declspec(noinline)
#else
  #define TC_NOINLINE
#endif

//! \def TC_LIKELY(EXP)
//!
//! Expression is likely to be true.
//!
//! \def TC_UNLIKELY(EXP)
//!
//! Expression is unlikely to be true.
#if defined(__GNUC__)
  #define TC_LIKELY(...) __builtin_expect(!!(__VA_ARGS__), 1)
  #define TC_UNLIKELY(...) __builtin_expect(!!(__VA_ARGS__), 0)
#else
  #define TC_LIKELY(...) (__VA_ARGS__)
  #define TC_UNLIKELY(...) (__VA_ARGS__)
#endif

// Typecase - Utilities
// ====================

//! Creates a 32-bit tag (uint32_t) from the given `A`, `B`, `C`, and `D` values.
#define TC_MAKE_TAG(A, B, C, D) ((TCTag)(((TCTag)(A) << 24) | ((TCTag)(B) << 16) | ((TCTag)(C) << 8) | ((TCTag)(D))))

//! Propagates a \ref TCResult `...` to the caller if it's not \ref TC_SUCCESS.
#define TC_PROPAGATE(...)                                                     \
  do {                                                                        \
    TCResult result_to_propagate = (__VA_ARGS__);                             \
    if (TC_UNLIKELY(result_to_propagate != TC_SUCCESS)) {                     \
      return result_to_propagate;                                             \
    }                                                                         \
  } while (0)

// Typecase - Types
// ================

//! Result code used by most Typecase functions (32-bit unsigned integer).
//!
//! The \ref TCResultCode enumeration contains Typecase result codes.
typedef uint32_t TCResult;

//! Tag is a 32-bit integer consisting of 4 characters in the following format:
//!
//! ```
//! tag = ((a << 24) | (b << 16) | (c << 8) | d)
//! ```
//!
//! Tags are used extensively by OpenType fonts and other binary formats like PNG. In most cases TAGs should only
//! contain ASCII letters, digits, and spaces.
typedef uint32_t TCTag;

//! Glyph id - a 32-bit unsigned integer.
//!
//! OpenType glyph identifiers are only 16-bit, values that don't fit into 16 bits are never mapped.
typedef uint32_t TCGlyphId;

// Typecase - Result Codes
// =======================

//! Typecase result code.
enum TCResultCode : uint32_t {
  //! Successful result code.
  TC_SUCCESS = 0,

  //! First error code, used as a base of all other error codes.
  TC_ERROR_START_INDEX = 0x00010000u,

  TC_ERROR_OUT_OF_MEMORY = 0x00010000u,  //!< Out of memory.
  TC_ERROR_INVALID_VALUE,                //!< Invalid value/argument.
  TC_ERROR_INVALID_STATE,                //!< Invalid state.
  TC_ERROR_NOT_IMPLEMENTED,              //!< Not implemented.

  TC_ERROR_INVALID_DATA,                 //!< Invalid data (structurally malformed table or sub-table).
  TC_ERROR_INVALID_SIGNATURE,            //!< Invalid signature, magic number, or version.
  TC_ERROR_DATA_TRUNCATED,               //!< Data is truncated (shorter than its header or records require).
  TC_ERROR_DATA_TOO_LARGE,               //!< Data or an offset is too large to be addressed.
  TC_ERROR_READ_FAILED,                  //!< Table provider failed to read the requested data.

  TC_ERROR_FONT_MISSING_TABLE,           //!< Font doesn't have the requested table.
  TC_ERROR_FONT_NOT_INITIALIZED,         //!< Font face has not been created or it's empty.

  //! Count of result codes.
  TC_RESULT_COUNT
};

// Typecase - Enumerations
// =======================

//! Character encoding of the character-map subtable selected by a font face.
enum TCCharEncoding : uint32_t {
  //! Unicode (either full repertoire or BMP only).
  TC_CHAR_ENCODING_UNICODE = 0,
  //! Windows symbol encoding (codes usually in the `U+F020..U+F0FF` range).
  TC_CHAR_ENCODING_SYMBOL = 1,
  //! Macintosh Roman encoding (single byte).
  TC_CHAR_ENCODING_APPLE_ROMAN = 2,
  //! Big5 encoding (double byte).
  TC_CHAR_ENCODING_BIG5 = 3,

  //! Maximum value of `TCCharEncoding`.
  TC_CHAR_ENCODING_MAX_VALUE = 3
};

//! Outline container format of a font face.
enum TCOutlineFormat : uint32_t {
  //! No outlines, or outlines are not used by the face (bitmap-only or 'sbix' / 'SVG ' faces).
  TC_OUTLINE_FORMAT_NONE = 0,
  //! TrueType outlines stored in 'glyf' table.
  TC_OUTLINE_FORMAT_GLYF = 1,
  //! PostScript outlines stored in 'CFF ' table.
  TC_OUTLINE_FORMAT_CFF = 2,

  //! Maximum value of `TCOutlineFormat`.
  TC_OUTLINE_FORMAT_MAX_VALUE = 2
};

//! Bit depth of embedded bitmap glyphs.
//!
//! The values are ordered so bit depths can be compared directly.
enum TCBitDepth : uint32_t {
  TC_BIT_DEPTH_1 = 1,
  TC_BIT_DEPTH_2 = 2,
  TC_BIT_DEPTH_4 = 4,
  TC_BIT_DEPTH_8 = 8,
  //! 32-bit color (BGRA), used by color bitmap tables ('CBDT', 'sbix').
  TC_BIT_DEPTH_32 = 32
};

//! \}

#endif // TYPECASE_CORE_API_H_INCLUDED
