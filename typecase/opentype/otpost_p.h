// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TYPECASE_OPENTYPE_OTPOST_P_H_INCLUDED
#define TYPECASE_OPENTYPE_OTPOST_P_H_INCLUDED

#include <typecase/opentype/otdefs_p.h>

#include <string>
#include <vector>

//! \cond INTERNAL
//! \addtogroup typecase_opentype_impl
//! \{

namespace tc::OpenType {

//! OpenType 'post' table.
//!
//! External Resources:
//!   - https://docs.microsoft.com/en-us/typography/opentype/spec/post
//!   - https://developer.apple.com/fonts/TrueType-Reference-Manual/RM06/Chap6post.html
struct PostTable {
  enum : uint32_t { kBaseSize = 32 };

  enum : uint32_t {
    kVersion1_0 = 0x00010000u,
    kVersion2_0 = 0x00020000u,
    kVersion2_5 = 0x00025000u,
    kVersion3_0 = 0x00030000u,
    kVersion4_0 = 0x00040000u
  };

  //! Number of glyph names in the standard Macintosh ordering.
  static inline constexpr uint32_t kMacStandardNameCount = 258;

  struct V2_0 {
    enum : uint32_t { kBaseSize = 2 };

    UInt16 glyph_count;
    /*
    UInt16 glyph_name_index[glyph_count];
    UInt8 string_data[];
    */
  };

  F16x16 version;
  F16x16 italic_angle;
  FWord underline_position;
  FWord underline_thickness;
  UInt32 is_fixed_pitch;
  UInt32 min_mem_type42;
  UInt32 max_mem_type42;
  UInt32 min_mem_type1;
  UInt32 max_mem_type1;
};

//! Glyph names provided by 'post' table.
//!
//! Holds a view of the table, which must outlive this object.
class PostNames {
public:
  //! \name Members
  //! \{

  uint32_t _version = 0;
  RawTable _table {};

  //! Number of glyphs that have a name index ('post' 2.0 and 2.5).
  uint32_t _glyph_count = 0;
  //! Offsets of Pascal strings that follow the name index array ('post' 2.0).
  std::vector<uint32_t> _string_offsets;

  //! \}

  //! \name Accessors
  //! \{

  TC_INLINE_NODEBUG uint32_t version() const noexcept { return _version; }

  //! Tests whether the table provides glyph names, version 3.0 and 4.0 tables don't.
  TC_INLINE_NODEBUG bool has_names() const noexcept {
    return _version == PostTable::kVersion1_0 || _version == PostTable::kVersion2_0 || _version == PostTable::kVersion2_5;
  }

  //! \}

  //! \name Interface
  //! \{

  //! Stores the name of `glyph_id` to `out` and returns true, or returns false if the table doesn't name the glyph.
  TC_HIDDEN bool glyph_name(TCGlyphId glyph_id, std::string& out) const;

  //! \}
};

namespace PostImpl {

//! Validates 'post' table and initializes `out` to use it.
TC_HIDDEN TCResult init_names(Table<PostTable> post, PostNames* out) noexcept;

//! Returns a glyph name of the standard Macintosh ordering at `index`, which must be less than 258.
TC_HIDDEN const char* mac_standard_name(uint32_t index) noexcept;

//! Returns a Unicode character of a glyph name of the standard Macintosh ordering at `index`, or zero if the glyph
//! doesn't represent a character ('.notdef', '.null', 'nonmarkingreturn').
TC_HIDDEN uint32_t mac_standard_unicode(uint32_t index) noexcept;

//! Returns an index of a standard Macintosh glyph name that represents `uc`, or `0xFFFFFFFF` if there is none.
TC_HIDDEN uint32_t find_mac_standard_name(uint32_t uc) noexcept;

} // {PostImpl}

} // {tc::OpenType}

//! \}
//! \endcond

#endif // TYPECASE_OPENTYPE_OTPOST_P_H_INCLUDED
