// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TYPECASE_CORE_FONTFACE_H_INCLUDED
#define TYPECASE_CORE_FONTFACE_H_INCLUDED

#include <typecase/core/fontdata.h>
#include <typecase/core/fontdefs.h>
#include <typecase/core/fontlayout.h>
#include <typecase/core/glyphbitmap.h>

//! \addtogroup tc_text
//! \{

//! \name TCFontFace - Types
//! \{

//! Glyph name sink, called by \ref TCFontFace::glyph_names() once per glyph, in the order of the input glyph ids.
//!
//! `name` is null terminated and only valid during the call. Returning anything else than `TC_SUCCESS` stops the
//! enumeration and the result is propagated to the caller.
typedef TCResult (TC_CDECL* TCGlyphNameSinkFunc)(size_t index, TCGlyphId glyph_id, const char* name, size_t name_size, void* user_data) noexcept;

//! \}

//! \name TCFontFace - Impl
//! \{

struct TCFontFaceImpl;

//! \}

//! \name TCFontFace - C++ API
//! \{

//! Font face.
//!
//! A view of a single face of \ref TCFontData. Creating a face reads its character map and metrics ('cmap', 'maxp',
//! 'hhea', 'hmtx'), other tables are read on first use and cached by the face. Objects returned by the face, such
//! as \ref TCGDefTable or \ref TCBitmapGlyph, hold a reference to the font data, so they stay valid after the face
//! is destroyed.
//!
//! The face owns its caches, so it can be moved, but not copied. Functions that are not `const` may populate a
//! cache and require exclusive access to the face, there is no internal locking.
class TCFontFace {
public:
  //! \cond INTERNAL
  //! \name Internals
  //! \{

  TCFontFaceImpl* _impl;

  //! \}
  //! \endcond

  //! \name Construction & Destruction
  //! \{

  TC_INLINE_NODEBUG TCFontFace() noexcept
    : _impl(nullptr) {}

  TC_INLINE_NODEBUG TCFontFace(TCFontFace&& other) noexcept
    : _impl(other._impl) { other._impl = nullptr; }

  TCFontFace(const TCFontFace& other) = delete;

  TC_API ~TCFontFace() noexcept;

  //! \}

  //! \name Overloaded Operators
  //! \{

  TC_API TCFontFace& operator=(TCFontFace&& other) noexcept;
  TCFontFace& operator=(const TCFontFace& other) = delete;

  TC_INLINE_NODEBUG explicit operator bool() const noexcept { return !is_empty(); }

  //! \}

  //! \name Common Functionality
  //! \{

  //! Tests whether the face is empty, which means that it was not created or that the font has no usable face.
  [[nodiscard]]
  TC_INLINE_NODEBUG bool is_empty() const noexcept { return _impl == nullptr; }

  //! Destroys the face and all its caches.
  TC_API void reset() noexcept;

  //! \}

  //! \name Create Functionality
  //! \{

  //! Creates a face of `font_data` at `face_index`.
  //!
  //! A font without a supported character map ('cmap' encoding records) is not considered an error. The function
  //! succeeds in that case and the face stays empty. Errors are returned when any of the required tables ('cmap',
  //! 'maxp', 'hhea', 'hmtx') is missing or malformed.
  TC_API TCResult create_from_data(const TCFontData& font_data, uint32_t face_index = 0) noexcept;

  //! \}

  //! \name Accessors
  //! \{

  //! Returns the font data this face was created from.
  [[nodiscard]]
  TC_API TCFontData font_data() const noexcept;

  //! Returns the index of this face in its font data.
  [[nodiscard]]
  TC_API uint32_t face_index() const noexcept;

  //! Returns the number of glyphs provided by 'maxp' table.
  [[nodiscard]]
  TC_API uint32_t glyph_count() const noexcept;

  //! Returns the encoding of the selected character map.
  [[nodiscard]]
  TC_API TCCharEncoding char_encoding() const noexcept;

  //! Returns the outline container format, which doesn't change during the lifetime of the face.
  [[nodiscard]]
  TC_API TCOutlineFormat outline_format() const noexcept;

  //! Returns horizontal metrics header ('hhea').
  [[nodiscard]]
  TC_API TCFontMetricsHeader horizontal_header() const noexcept;

  //! \}

  //! \name Characters & Glyphs
  //! \{

  //! Maps a character code (interpreted according to `char_encoding()`) to a glyph id.
  //!
  //! Returns zero (the '.notdef' glyph) if the character is not mapped or the character map is malformed.
  [[nodiscard]]
  TC_API TCGlyphId lookup_glyph_index(uint32_t char_code) const noexcept;

  //! Passes names of `count` glyphs of `glyph_ids` to `sink`, in the same order.
  //!
  //! Names come from 'post' table, or are derived from the character map, or are 'g<id>' as a last resort. Names
  //! that were already produced for a previous glyph are suffixed by '.altNN', so the result has no duplicates.
  TC_API TCResult glyph_names(const TCGlyphId* glyph_ids, size_t count, TCGlyphNameSinkFunc sink, void* user_data) const noexcept;

  //! \}

  //! \name Metrics
  //! \{

  //! Stores the horizontal advance of `glyph_id` to `advance_out` and returns true, or returns false if the
  //! advance cannot be retrieved.
  TC_API bool horizontal_advance(TCGlyphId glyph_id, uint32_t* advance_out) const noexcept;

  //! Stores the vertical advance of `glyph_id` to `advance_out` and returns true, or returns false if the face
  //! doesn't have both 'vhea' and 'vmtx' tables or the advance cannot be retrieved.
  TC_API bool vertical_advance(TCGlyphId glyph_id, uint32_t* advance_out) noexcept;

  //! Retrieves vertical metrics header ('vhea'), `present_out` is set to false if the face doesn't have it.
  TC_API TCResult vertical_header(TCFontMetricsHeader* out, bool* present_out) noexcept;

  //! \}

  //! \name Tables
  //! \{

  //! Reads 'head' table, `present_out` is set to false if the face doesn't have it. The table is not cached.
  TC_API TCResult head_table(TCFontHeadInfo* out, bool* present_out) const noexcept;

  //! Reads 'OS/2' table, `present_out` is set to false if the face doesn't have it. The table is not cached.
  TC_API TCResult os2_table(TCFontOS2Info* out, bool* present_out) const noexcept;

  //! Retrieves the cached 'GDEF' table, `out` is empty if the face doesn't have it.
  TC_API TCResult gdef_table(TCGDefTable* out) noexcept;

  //! Retrieves the cached layout of 'GSUB' table, `out` is empty if the face doesn't have it.
  TC_API TCResult gsub_cache(TCLayoutCache* out) noexcept;

  //! Retrieves the cached layout of 'GPOS' table, `out` is empty if the face doesn't have it.
  TC_API TCResult gpos_cache(TCLayoutCache* out) noexcept;

  //! \}

  //! \name Embedded Images
  //! \{

  //! Looks up an embedded image of `glyph_id` closest to `target_size` (in pixels per em) and not deeper than
  //! `max_bit_depth`. Use \ref TC_BIT_DEPTH_32 to accept all bit depths.
  //!
  //! Color bitmap strikes ('CBLC' and 'CBDT') are preferred over 'sbix' images. A strike of the exact size is
  //! used if available, otherwise the nearest one, preferring a larger strike when two are equally near. `out`
  //! is empty if there is no such image.
  TC_API TCResult lookup_glyph_image(TCGlyphId glyph_id, uint32_t target_size, TCBitDepth max_bit_depth, TCBitmapGlyph* out) noexcept;

  //! Tests whether the face provides usable embedded images (emoji).
  [[nodiscard]]
  TC_API bool supports_emoji() noexcept;

  //! \}
};

//! \}

//! \}

#endif // TYPECASE_CORE_FONTFACE_H_INCLUDED
