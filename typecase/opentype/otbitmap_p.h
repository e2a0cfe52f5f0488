// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TYPECASE_OPENTYPE_OTBITMAP_P_H_INCLUDED
#define TYPECASE_OPENTYPE_OTBITMAP_P_H_INCLUDED

#include <typecase/opentype/otdefs_p.h>

//! \cond INTERNAL
//! \addtogroup typecase_opentype_impl
//! \{

namespace tc::OpenType {

//! Glyph metrics stored in 'CBDT' image data and 'CBLC' index sub-tables (small variant).
struct SmallGlyphMetrics {
  UInt8 height;
  UInt8 width;
  Int8 bearing_x;
  Int8 bearing_y;
  UInt8 advance;
};

//! Glyph metrics stored in 'CBDT' image data and 'CBLC' index sub-tables (big variant).
struct BigGlyphMetrics {
  UInt8 height;
  UInt8 width;
  Int8 hori_bearing_x;
  Int8 hori_bearing_y;
  UInt8 hori_advance;
  Int8 vert_bearing_x;
  Int8 vert_bearing_y;
  UInt8 vert_advance;
};

//! OpenType 'CBLC' table (also 'EBLC' as the layout is shared).
//!
//! External Resources:
//!   - https://docs.microsoft.com/en-us/typography/opentype/spec/cblc
//!   - https://docs.microsoft.com/en-us/typography/opentype/spec/eblc
struct CBLCTable {
  enum : uint32_t { kBaseSize = 8 };

  enum BitmapFlags : uint8_t {
    kFlagHorizontalMetrics = 0x01u,
    kFlagVerticalMetrics = 0x02u
  };

  struct SbitLineMetrics {
    Int8 ascender;
    Int8 descender;
    UInt8 width_max;
    Int8 caret_slope_numerator;
    Int8 caret_slope_denominator;
    Int8 caret_offset;
    Int8 min_origin_sb;
    Int8 min_advance_sb;
    Int8 max_before_bl;
    Int8 min_after_bl;
    Int8 reserved[2];
  };

  struct BitmapSize {
    UInt32 index_sub_table_array_offset;
    UInt32 index_tables_size;
    UInt32 number_of_index_sub_tables;
    UInt32 color_ref;
    SbitLineMetrics hori;
    SbitLineMetrics vert;
    UInt16 start_glyph_index;
    UInt16 end_glyph_index;
    UInt8 ppem_x;
    UInt8 ppem_y;
    UInt8 bit_depth;
    Int8 flags;
  };

  struct IndexSubTableRecord {
    UInt16 first_glyph_index;
    UInt16 last_glyph_index;
    Offset32 additional_offset;
  };

  struct IndexSubHeader {
    enum : uint32_t { kBaseSize = 8 };

    UInt16 index_format;
    UInt16 image_format;
    Offset32 image_data_offset;
  };

  //! Variable metrics glyphs with 32-bit offsets.
  struct IndexFormat1 : public IndexSubHeader {
    /*
    Offset32 sbit_offsets[last - first + 2];
    */
  };

  //! All glyphs have identical metrics.
  struct IndexFormat2 : public IndexSubHeader {
    enum : uint32_t { kBaseSize = 20 };

    UInt32 image_size;
    BigGlyphMetrics big_metrics;
  };

  //! Variable metrics glyphs with 16-bit offsets.
  struct IndexFormat3 : public IndexSubHeader {
    /*
    Offset16 sbit_offsets[last - first + 2];
    */
  };

  struct GlyphIdOffsetPair {
    UInt16 glyph_id;
    Offset16 offset;
  };

  //! Variable metrics glyphs with sparse glyph codes.
  struct IndexFormat4 : public IndexSubHeader {
    enum : uint32_t { kBaseSize = 12 };

    UInt32 num_glyphs;
    /*
    GlyphIdOffsetPair glyph_array[num_glyphs + 1];
    */
  };

  //! Constant metrics glyphs with sparse glyph codes.
  struct IndexFormat5 : public IndexSubHeader {
    enum : uint32_t { kBaseSize = 24 };

    UInt32 image_size;
    BigGlyphMetrics big_metrics;
    UInt32 num_glyphs;
    /*
    UInt16 glyph_id_array[num_glyphs];
    */
  };

  UInt16 major_version;
  UInt16 minor_version;
  Array32<BitmapSize> bitmap_sizes;
};

//! OpenType 'CBDT' table (also 'EBDT' as the layout is shared).
//!
//! External Resources:
//!   - https://docs.microsoft.com/en-us/typography/opentype/spec/cbdt
//!   - https://docs.microsoft.com/en-us/typography/opentype/spec/ebdt
struct CBDTTable {
  enum : uint32_t { kBaseSize = 4 };

  UInt16 major_version;
  UInt16 minor_version;
};

//! OpenType 'sbix' table.
//!
//! External Resources:
//!   - https://docs.microsoft.com/en-us/typography/opentype/spec/sbix
//!   - https://developer.apple.com/fonts/TrueType-Reference-Manual/RM06/Chap6sbix.html
struct SbixTable {
  enum : uint32_t { kBaseSize = 8 };

  enum : uint32_t {
    kGraphicTypeDupe = TC_MAKE_TAG('d', 'u', 'p', 'e'),
    kGraphicTypeJpg  = TC_MAKE_TAG('j', 'p', 'g', ' '),
    kGraphicTypePdf  = TC_MAKE_TAG('p', 'd', 'f', ' '),
    kGraphicTypePng  = TC_MAKE_TAG('p', 'n', 'g', ' '),
    kGraphicTypeTiff = TC_MAKE_TAG('t', 'i', 'f', 'f')
  };

  struct Strike {
    enum : uint32_t { kBaseSize = 4 };

    UInt16 ppem;
    UInt16 ppi;
    /*
    Offset32 glyph_data_offsets[glyph_count + 1];
    */
  };

  struct GlyphData {
    enum : uint32_t { kBaseSize = 8 };

    Int16 origin_offset_x;
    Int16 origin_offset_y;
    UInt32 graphic_type;
    /*
    UInt8 data[];
    */
  };

  UInt16 version;
  UInt16 flags;
  Array32<Offset32> strike_offsets;
};

//! OpenType 'SVG ' table.
//!
//! External Resources:
//!   - https://docs.microsoft.com/en-us/typography/opentype/spec/svg
struct SVGTable {
  enum : uint32_t { kBaseSize = 10 };

  struct DocumentRecord {
    UInt16 start_glyph_id;
    UInt16 end_glyph_id;
    Offset32 document_offset;
    UInt32 document_length;
  };

  struct DocumentList {
    enum : uint32_t { kBaseSize = 2 };

    Array16<DocumentRecord> records;
  };

  UInt16 version;
  Offset32 document_list_offset;
  UInt32 reserved;
};

} // {tc::OpenType}

//! \}
//! \endcond

#endif // TYPECASE_OPENTYPE_OTBITMAP_P_H_INCLUDED
