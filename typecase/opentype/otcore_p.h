// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TYPECASE_OPENTYPE_OTCORE_P_H_INCLUDED
#define TYPECASE_OPENTYPE_OTCORE_P_H_INCLUDED

#include <typecase/opentype/otdefs_p.h>

//! \cond INTERNAL
//! \addtogroup typecase_opentype_impl
//! \{

namespace tc::OpenType {

//! OpenType 'SFNT' header.
//!
//! External Resources:
//!   - https://docs.microsoft.com/en-us/typography/opentype/spec/font-file
struct SFNTHeader {
  enum : uint32_t { kBaseSize = 12 };

  enum VersionTag : uint32_t {
    kVersionTagOpenType   = TC_MAKE_TAG('O', 'T', 'T', 'O'),
    kVersionTagTrueTypeA  = TC_MAKE_TAG( 0,   1 ,  0 ,  0 ),
    kVersionTagTrueTypeB  = TC_MAKE_TAG('t', 'r', 'u', 'e'),
    kVersionTagType1      = TC_MAKE_TAG('t', 'y', 'p', '1')
  };

  struct TableRecord {
    UInt32 tag;
    CheckSum check_sum;
    UInt32 offset;
    UInt32 length;
  };

  UInt32 version_tag;
  UInt16 num_tables;
  UInt16 search_range;
  UInt16 entry_selector;
  UInt16 range_shift;

  TC_INLINE const TableRecord* table_records() const noexcept { return PtrOps::offset<const TableRecord>(this, sizeof(SFNTHeader)); }

  static TC_INLINE bool is_version_tag(uint32_t tag) noexcept {
    return tag == kVersionTagOpenType  ||
           tag == kVersionTagTrueTypeA ||
           tag == kVersionTagTrueTypeB ||
           tag == kVersionTagType1     ;
  }
};

//! OpenType 'TTCF' header.
//!
//! External Resources:
//!   - https://docs.microsoft.com/en-us/typography/opentype/spec/font-file
struct TTCFHeader {
  enum : uint32_t { kBaseSize = 12 };
  enum : uint32_t { kMaxFonts = 65536 };
  enum : uint32_t { kTag = TC_MAKE_TAG('t', 't', 'c', 'f') };

  TC_INLINE size_t calc_size(uint32_t num_fonts) const noexcept {
    uint32_t header_size = uint32_t(sizeof(TTCFHeader));

    if (num_fonts > kMaxFonts)
      return 0;

    if (version() >= 0x00020000u)
      header_size += 12;

    return header_size + num_fonts * 4;
  }

  // Version 1.
  UInt32 ttc_tag;
  F16x16 version;
  Array32<UInt32> fonts;
};

//! OpenType 'head' table.
//!
//! External Resources:
//!   - https://docs.microsoft.com/en-us/typography/opentype/spec/head
//!   - https://developer.apple.com/fonts/TrueType-Reference-Manual/RM06/Chap6head.html
struct HeadTable {
  enum : uint32_t { kBaseSize = 54 };

  enum : uint32_t {
    kMagicNumber             = TC_MAKE_TAG(0x5F, 0x0F, 0x3C, 0xF5)
  };

  enum IndexToLocFormat : uint16_t {
    kIndexToLocUInt16        = 0,
    kIndexToLocUInt32        = 1
  };

  F16x16 version;
  F16x16 revision;

  UInt32 check_sum_adjustment;
  UInt32 magic_number;
  UInt16 flags;
  UInt16 units_per_em;

  DateTime created;
  DateTime modified;

  Int16 x_min;
  Int16 y_min;
  Int16 x_max;
  Int16 y_max;

  UInt16 mac_style;
  UInt16 lowest_rec_ppem;

  Int16 font_direction_hint;
  Int16 index_to_loc_format;
  Int16 glyph_data_format;
};

//! OpenType 'maxp' table.
//!
//! External Resources:
//!   - https://docs.microsoft.com/en-us/typography/opentype/spec/maxp
//!   - https://developer.apple.com/fonts/TrueType-Reference-Manual/RM06/Chap6maxp.html
struct MaxPTable {
  enum : uint32_t { kBaseSize = 6 };

  enum : uint32_t {
    kVersion0_5 = 0x00005000u,
    kVersion1_0 = 0x00010000u
  };

  // V0.5 - Must be used with CFF Glyphs (OpenType).
  struct V0_5 {
    F16x16 version;
    UInt16 glyph_count;
  };

  // V1.0 - Must be used with TT Glyphs (TrueType).
  struct V1_0 : public V0_5 {
    enum : uint32_t { kBaseSize = 32 };

    UInt16 max_points;
    UInt16 max_contours;
    UInt16 max_component_points;
    UInt16 max_component_contours;
    UInt16 max_zones;
    UInt16 max_twilight_points;
    UInt16 max_storage;
    UInt16 max_function_defs;
    UInt16 max_instruction_defs;
    UInt16 max_stack_elements;
    UInt16 max_size_of_instructions;
    UInt16 max_component_elements;
    UInt16 max_component_depth;
  };

  V0_5 header;

  TC_INLINE const V0_5* v0_5() const noexcept { return PtrOps::offset<const V0_5>(this, 0); }
  TC_INLINE const V1_0* v1_0() const noexcept { return PtrOps::offset<const V1_0>(this, 0); }
};

//! OpenType 'OS/2' table.
//!
//!   - https://docs.microsoft.com/en-us/typography/opentype/spec/os2
//!   - https://developer.apple.com/fonts/TrueType-Reference-Manual/RM06/Chap6OS2.html
struct OS2Table {
  enum : uint32_t { kBaseSize = 68 };

  struct V0A {
    enum : uint32_t { kBaseSize = 68 };

    UInt16 version;
    Int16 x_avg_char_width;
    UInt16 weight_class;
    UInt16 width_class;
    UInt16 fs_type;
    Int16 y_subscript_x_size;
    Int16 y_subscript_y_size;
    Int16 y_subscript_x_offset;
    Int16 y_subscript_y_offset;
    Int16 y_superscript_x_size;
    Int16 y_superscript_y_size;
    Int16 y_superscript_x_offset;
    Int16 y_superscript_y_offset;
    Int16 y_strikeout_size;
    Int16 y_strikeout_position;
    Int16 family_class;
    UInt8 panose[10];
    UInt32 unicode_coverage[4];
    UInt32 vendor_id;
    UInt16 selection_flags;
    UInt16 first_char;
    UInt16 last_char;
  };

  struct V0B : public V0A {
    enum : uint32_t { kBaseSize = 78 };

    Int16 typo_ascender;
    Int16 typo_descender;
    Int16 typo_line_gap;
    UInt16 win_ascent;
    UInt16 win_descent;
  };

  struct V1 : public V0B {
    enum : uint32_t { kBaseSize = 86 };

    UInt32 code_page_range[2];
  };

  struct V2 : public V1 {
    enum : uint32_t { kBaseSize = 96 };

    Int16 x_height;
    Int16 cap_height;
    UInt16 default_char;
    UInt16 break_char;
    UInt16 max_context;
  };

  struct V5 : public V2 {
    enum : uint32_t { kBaseSize = 100 };

    UInt16 lower_optical_point_size;
    UInt16 upper_optical_point_size;
  };

  V0A header;

  TC_INLINE const V0A* v0a() const noexcept { return PtrOps::offset<const V0A>(this, 0); }
  TC_INLINE const V0B* v0b() const noexcept { return PtrOps::offset<const V0B>(this, 0); }
  TC_INLINE const V1* v1() const noexcept { return PtrOps::offset<const V1>(this, 0); }
  TC_INLINE const V2* v2() const noexcept { return PtrOps::offset<const V2>(this, 0); }
  TC_INLINE const V5* v5() const noexcept { return PtrOps::offset<const V5>(this, 0); }
};

namespace CoreImpl {

//! Reads the number of glyphs from 'maxp' table.
TC_HIDDEN TCResult read_maxp(Table<MaxPTable> maxp, uint32_t* glyph_count_out) noexcept;

//! Reads 'head' table into `out`.
TC_HIDDEN TCResult read_head(Table<HeadTable> head, TCFontHeadInfo* out) noexcept;

//! Reads 'OS/2' table into `out`, only fields provided by the table's version are filled, the rest is zeroed.
TC_HIDDEN TCResult read_os2(Table<OS2Table> os2, TCFontOS2Info* out) noexcept;

} // {CoreImpl}

} // {tc::OpenType}

//! \}
//! \endcond

#endif // TYPECASE_OPENTYPE_OTCORE_P_H_INCLUDED
