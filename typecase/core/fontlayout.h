// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TYPECASE_CORE_FONTLAYOUT_H_INCLUDED
#define TYPECASE_CORE_FONTLAYOUT_H_INCLUDED

#include <typecase/core/fontdefs.h>
#include <typecase/core/object.h>

//! \addtogroup tc_text
//! \{

//! \name Layout - Constants
//! \{

//! Glyph class as defined by 'GDEF' glyph class definition table.
enum TCGlyphClass : uint32_t {
  //! Glyph is not classified.
  TC_GLYPH_CLASS_NONE = 0,
  //! Base glyph (single character, spacing glyph).
  TC_GLYPH_CLASS_BASE = 1,
  //! Ligature glyph (multiple character, spacing glyph).
  TC_GLYPH_CLASS_LIGATURE = 2,
  //! Mark glyph (non-spacing combining glyph).
  TC_GLYPH_CLASS_MARK = 3,
  //! Component glyph (part of single character, spacing glyph).
  TC_GLYPH_CLASS_COMPONENT = 4
};

//! Kind of a layout table wrapped by \ref TCLayoutCache.
enum TCLayoutKind : uint32_t {
  //! Glyph substitution table ('GSUB').
  TC_LAYOUT_KIND_GSUB = 0,
  //! Glyph positioning table ('GPOS').
  TC_LAYOUT_KIND_GPOS = 1
};

//! \}

//! \name Layout - Impl
//! \{

struct TCGDefTableImpl;
struct TCLayoutCacheImpl;

//! \}

//! \name Layout - C++ API
//! \{

//! Parsed 'GDEF' table.
//!
//! The table keeps a reference to the font data it was read from, so it stays valid after the face that created
//! it is destroyed. Copies share the same data.
class TCGDefTable : public TCObjectCore {
public:
  //! \cond INTERNAL
  [[nodiscard]]
  TC_INLINE_NODEBUG TCGDefTableImpl* _gdef_impl() const noexcept { return reinterpret_cast<TCGDefTableImpl*>(_impl); }
  //! \endcond

  TC_INLINE_NODEBUG TCGDefTable() noexcept = default;
  TC_INLINE_NODEBUG TCGDefTable(const TCGDefTable& other) noexcept = default;
  TC_INLINE_NODEBUG TCGDefTable(TCGDefTable&& other) noexcept = default;

  TC_INLINE_NODEBUG TCGDefTable& operator=(const TCGDefTable& other) noexcept = default;
  TC_INLINE_NODEBUG TCGDefTable& operator=(TCGDefTable&& other) noexcept = default;

  TC_INLINE_NODEBUG explicit operator bool() const noexcept { return !is_empty(); }

  [[nodiscard]]
  TC_INLINE_NODEBUG bool operator==(const TCGDefTable& other) const noexcept { return equals(other); }

  [[nodiscard]]
  TC_INLINE_NODEBUG bool operator!=(const TCGDefTable& other) const noexcept { return !equals(other); }

  //! Returns the raw table data.
  [[nodiscard]]
  TC_API TCFontTable table() const noexcept;

  //! Returns the table version as a 16.16 fixed point number (0x00010000, 0x00010002, or 0x00010003).
  [[nodiscard]]
  TC_API uint32_t version() const noexcept;

  [[nodiscard]]
  TC_API bool has_glyph_classes() const noexcept;

  [[nodiscard]]
  TC_API bool has_mark_attach_classes() const noexcept;

  //! Returns the number of mark glyph sets (only provided by GDEF 1.2 and later).
  [[nodiscard]]
  TC_API uint32_t mark_glyph_set_count() const noexcept;

  //! Returns the class of `glyph_id`, or \ref TC_GLYPH_CLASS_NONE if the glyph is not classified.
  [[nodiscard]]
  TC_API TCGlyphClass glyph_class(TCGlyphId glyph_id) const noexcept;

  //! Returns the mark attachment class of `glyph_id`, zero if the glyph has none.
  [[nodiscard]]
  TC_API uint32_t mark_attach_class(TCGlyphId glyph_id) const noexcept;
};

//! Layout cache of a 'GSUB' or 'GPOS' table.
//!
//! Wraps a validated layout table and provides access to its script, feature, and lookup lists, which are used by
//! a shaping engine. The cache keeps a reference to the font data it was read from.
class TCLayoutCache : public TCObjectCore {
public:
  //! \cond INTERNAL
  [[nodiscard]]
  TC_INLINE_NODEBUG TCLayoutCacheImpl* _layout_impl() const noexcept { return reinterpret_cast<TCLayoutCacheImpl*>(_impl); }
  //! \endcond

  TC_INLINE_NODEBUG TCLayoutCache() noexcept = default;
  TC_INLINE_NODEBUG TCLayoutCache(const TCLayoutCache& other) noexcept = default;
  TC_INLINE_NODEBUG TCLayoutCache(TCLayoutCache&& other) noexcept = default;

  TC_INLINE_NODEBUG TCLayoutCache& operator=(const TCLayoutCache& other) noexcept = default;
  TC_INLINE_NODEBUG TCLayoutCache& operator=(TCLayoutCache&& other) noexcept = default;

  TC_INLINE_NODEBUG explicit operator bool() const noexcept { return !is_empty(); }

  [[nodiscard]]
  TC_INLINE_NODEBUG bool operator==(const TCLayoutCache& other) const noexcept { return equals(other); }

  [[nodiscard]]
  TC_INLINE_NODEBUG bool operator!=(const TCLayoutCache& other) const noexcept { return !equals(other); }

  [[nodiscard]]
  TC_API TCFontTable table() const noexcept;

  [[nodiscard]]
  TC_API TCLayoutKind kind() const noexcept;

  //! Returns the table version as a 16.16 fixed point number.
  [[nodiscard]]
  TC_API uint32_t version() const noexcept;

  [[nodiscard]]
  TC_API uint32_t script_count() const noexcept;

  [[nodiscard]]
  TC_API uint32_t feature_count() const noexcept;

  [[nodiscard]]
  TC_API uint32_t lookup_count() const noexcept;

  //! Returns a tag of a script at `index` or zero if the index is out of range.
  [[nodiscard]]
  TC_API TCTag script_tag(uint32_t index) const noexcept;

  //! Returns a tag of a feature at `index` or zero if the index is out of range.
  [[nodiscard]]
  TC_API TCTag feature_tag(uint32_t index) const noexcept;

  //! Finds a script of the given `tag` and stores its index to `index_out`.
  TC_API bool find_script(TCTag tag, uint32_t* index_out) const noexcept;

  //! Returns a type of a lookup at `index`, extension lookups are resolved to the type they wrap. Returns zero if
  //! the index is out of range or the lookup is malformed.
  [[nodiscard]]
  TC_API uint32_t lookup_type(uint32_t index) const noexcept;

  //! Returns lookup flags of a lookup at `index`.
  [[nodiscard]]
  TC_API uint32_t lookup_flags(uint32_t index) const noexcept;
};

//! \}

//! \}

#endif // TYPECASE_CORE_FONTLAYOUT_H_INCLUDED
