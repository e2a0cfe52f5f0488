// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TYPECASE_OPENTYPE_OTCMAP_P_H_INCLUDED
#define TYPECASE_OPENTYPE_OTCMAP_P_H_INCLUDED

#include <typecase/opentype/otdefs_p.h>
#include <typecase/support/ptrops_p.h>

//! \cond INTERNAL
//! \addtogroup typecase_opentype_impl
//! \{

namespace tc::OpenType {

//! OpenType 'cmap' table.
//!
//! External Resources:
//!   - https://docs.microsoft.com/en-us/typography/opentype/spec/cmap
//!   - https://developer.apple.com/fonts/TrueType-Reference-Manual/RM06/Chap6cmap.html
//!
//! Some names inside this table do not match 1:1 specifications of Apple and MS as they diverge as well. In general
//! the naming was normalized to be consistent in the following:
//!   - `first` - First character or glyph included in the set.
//!   - `last`  - Last character or glyph included in the set.
//!   - `count` - Count of something, specifies a range of [first, first + count).
struct CMapTable {
  // Header without encoding records.
  enum : uint32_t { kBaseSize = 4 };

  struct Encoding {
    UInt16 platform_id;
    UInt16 encoding_id;
    Offset32 offset;
  };

  struct Group {
    UInt32 first;
    UInt32 last;
    UInt32 glyph_id;
  };

  struct Format0 {
    enum : uint32_t { kBaseSize = 262 };

    UInt16 format;
    UInt16 length;
    UInt16 language;
    UInt8 glyph_id_array[256];
  };

  struct Format2 {
    enum : uint32_t { kBaseSize = 518 };

    struct SubHeader {
      UInt16 first_code;
      UInt16 entry_count;
      Int16 id_delta;
      UInt16 id_range_offset;
    };

    UInt16 format;
    UInt16 length;
    UInt16 language;
    UInt16 sub_header_keys[256];
    /*
    SubHeader sub_header_array[num_sub];
    UInt16 glyph_id_array[];
    */

    TC_INLINE const SubHeader* sub_header_array() const noexcept { return PtrOps::offset<const SubHeader>(this, sizeof(Format2)); }
  };

  struct Format4 {
    enum : uint32_t { kBaseSize = 24 };

    UInt16 format;
    UInt16 length;
    UInt16 mac_language_code;
    UInt16 numSegX2;
    UInt16 search_range;
    UInt16 entry_selector;
    UInt16 range_shift;
    /*
    UInt16 last_char_array[num_segs];
    UInt16 pad;
    UInt16 first_char_array[num_segs];
    Int16 id_delta_array[num_segs];
    UInt16 id_offset_array[num_segs];
    UInt16 glyph_id_array[];
    */

    TC_INLINE const UInt16* last_char_array() const noexcept { return PtrOps::offset<const UInt16>(this, sizeof(*this)); }
    TC_INLINE const UInt16* first_char_array(size_t num_seg) const noexcept { return PtrOps::offset<const UInt16>(this, sizeof(Format4) + 2u + num_seg * 2u); }
    TC_INLINE const UInt16* id_delta_array(size_t num_seg) const noexcept { return PtrOps::offset<const UInt16>(this, sizeof(Format4) + 2u + num_seg * 4u); }
    TC_INLINE const UInt16* id_offset_array(size_t num_seg) const noexcept { return PtrOps::offset<const UInt16>(this, sizeof(Format4) + 2u + num_seg * 6u); }
  };

  struct Format6 {
    enum : uint32_t { kBaseSize = 10 };

    UInt16 format;
    UInt16 length;
    UInt16 language;
    UInt16 first;
    UInt16 count;
    /*
    UInt16 glyph_id_array[count];
    */

    TC_INLINE const UInt16* glyph_id_array() const noexcept { return PtrOps::offset<const UInt16>(this, sizeof(Format6)); }
  };

  struct Format10 {
    enum : uint32_t { kBaseSize = 20 };

    UInt16 format;
    UInt16 reserved;
    UInt32 length;
    UInt32 language;
    UInt32 first;
    Array32<UInt16> glyph_ids;
  };

  struct Format12_13 {
    enum : uint32_t { kBaseSize = 16 };

    UInt16 format;
    UInt16 reserved;
    UInt32 length;
    UInt32 language;
    Array32<Group> groups;
  };

  UInt16 version;
  Array16<Encoding> encodings;
};

//! Validated character map sub-table.
struct CMapEncoding {
  //! Offset to get the sub-table of this encoding.
  uint32_t offset;
  //! Count of entries in that sub-table (possibly corrected).
  uint32_t entry_count;
  //! Sub-table format.
  uint32_t format;

  TC_INLINE void reset() noexcept { *this = CMapEncoding{}; }
};

namespace CMapImpl {

//! Unicode code points are within [0, kCharMax].
static constexpr uint32_t kCharMax = 0x10FFFFu;

//! Selects the best encoding record of `cmap_table`.
//!
//! Encoding records are tried in the following order, the first one found wins:
//!
//!   1. Windows, Unicode UCS-4             -> Unicode
//!   2. Windows, Unicode BMP (UCS-2)       -> Unicode
//!   3. Unicode, Unicode 2.0 full (UCS-4)  -> Unicode
//!   4. Unicode, any encoding              -> Unicode
//!   5. Windows, Symbol                    -> Symbol
//!   6. Macintosh, Roman                   -> AppleRoman
//!   7. Windows, Big5                      -> Big5
//!
//! Returns an error only if the 'cmap' header or its encoding records are malformed. When no record matches, the
//! function succeeds and sets `found` to false. The format of the selected sub-table is not validated.
TC_HIDDEN TCResult select_encoding(RawTable cmap_table, bool* found, TCCharEncoding* encoding_out, uint32_t* offset_out) noexcept;

//! Validates a sub-table of any supported format at `sub_table_offset`. On success a valid `CMapEncoding` is written
//! to `encoding_out`, otherwise an error is returned and `encoding_out` is kept unchanged.
TC_HIDDEN TCResult validate_sub_table(RawTable cmap_table, uint32_t sub_table_offset, CMapEncoding& encoding_out) noexcept;

//! Maps a character code to a glyph through a sub-table validated by `validate_sub_table()`, returns 0 if the code
//! is not mapped.
TC_HIDDEN TCGlyphId map_char(RawTable cmap_table, const CMapEncoding& encoding, uint32_t code) noexcept;

//! Fills `codes_out` (of `glyph_count` entries) with the lowest character code that maps to each glyph, glyphs that
//! are not mapped by any code get `0xFFFFFFFF`.
TC_HIDDEN void build_reverse_map(RawTable cmap_table, const CMapEncoding& encoding, uint32_t* codes_out, uint32_t glyph_count) noexcept;

} // {CMapImpl}
} // {tc::OpenType}

//! \}
//! \endcond

#endif // TYPECASE_OPENTYPE_OTCMAP_P_H_INCLUDED
