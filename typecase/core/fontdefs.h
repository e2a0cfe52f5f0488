// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TYPECASE_CORE_FONTDEFS_H_INCLUDED
#define TYPECASE_CORE_FONTDEFS_H_INCLUDED

#include <typecase/core/api.h>

//! \addtogroup tc_text
//! \{

//! \name Font Tags
//! \{

//! Tags of all tables that Typecase reads.
enum TCFontTableTag : uint32_t {
  TC_FONT_TABLE_TAG_CBDT = TC_MAKE_TAG('C', 'B', 'D', 'T'),
  TC_FONT_TABLE_TAG_CBLC = TC_MAKE_TAG('C', 'B', 'L', 'C'),
  TC_FONT_TABLE_TAG_CFF  = TC_MAKE_TAG('C', 'F', 'F', ' '),
  TC_FONT_TABLE_TAG_CFF2 = TC_MAKE_TAG('C', 'F', 'F', '2'),
  TC_FONT_TABLE_TAG_CMAP = TC_MAKE_TAG('c', 'm', 'a', 'p'),
  TC_FONT_TABLE_TAG_GDEF = TC_MAKE_TAG('G', 'D', 'E', 'F'),
  TC_FONT_TABLE_TAG_GLYF = TC_MAKE_TAG('g', 'l', 'y', 'f'),
  TC_FONT_TABLE_TAG_GPOS = TC_MAKE_TAG('G', 'P', 'O', 'S'),
  TC_FONT_TABLE_TAG_GSUB = TC_MAKE_TAG('G', 'S', 'U', 'B'),
  TC_FONT_TABLE_TAG_HEAD = TC_MAKE_TAG('h', 'e', 'a', 'd'),
  TC_FONT_TABLE_TAG_HHEA = TC_MAKE_TAG('h', 'h', 'e', 'a'),
  TC_FONT_TABLE_TAG_HMTX = TC_MAKE_TAG('h', 'm', 't', 'x'),
  TC_FONT_TABLE_TAG_MAXP = TC_MAKE_TAG('m', 'a', 'x', 'p'),
  TC_FONT_TABLE_TAG_OS2  = TC_MAKE_TAG('O', 'S', '/', '2'),
  TC_FONT_TABLE_TAG_POST = TC_MAKE_TAG('p', 'o', 's', 't'),
  TC_FONT_TABLE_TAG_SBIX = TC_MAKE_TAG('s', 'b', 'i', 'x'),
  TC_FONT_TABLE_TAG_SVG  = TC_MAKE_TAG('S', 'V', 'G', ' '),
  TC_FONT_TABLE_TAG_VHEA = TC_MAKE_TAG('v', 'h', 'e', 'a'),
  TC_FONT_TABLE_TAG_VMTX = TC_MAKE_TAG('v', 'm', 't', 'x')
};

//! \}

//! \name Font Structs
//! \{

//! A read only data that represents a font table or its sub-table.
struct TCFontTable {
  //! \name Members
  //! \{

  //! Pointer to the beginning of the data interpreted as `uint8_t*`.
  const uint8_t* data;
  //! Size of `data` in bytes.
  size_t size;

  //! \}

  //! \name Common Functionality
  //! \{

  //! Tests whether the table has a content.
  //!
  //! \note This is essentially the opposite of `is_empty()`.
  TC_INLINE_NODEBUG explicit operator bool() const noexcept { return size != 0; }

  //! Tests whether the table is empty (has no content).
  TC_INLINE_NODEBUG bool is_empty() const noexcept { return !size; }

  TC_INLINE_NODEBUG void reset() noexcept { *this = TCFontTable{}; }

  TC_INLINE_NODEBUG void reset(const uint8_t* data_, size_t size_) noexcept {
    data = data_;
    size = size_;
  }

  //! \}
};

//! Information read from the 'head' table.
struct TCFontHeadInfo {
  //! Font revision as a 16.16 fixed point number.
  uint32_t revision;
  //! Font header flags.
  uint16_t flags;
  //! Font design units per em.
  uint16_t units_per_em;

  //! Creation time (seconds since 1904-01-01 00:00 UTC).
  int64_t created;
  //! Modification time (seconds since 1904-01-01 00:00 UTC).
  int64_t modified;

  //! Bounding box of all glyphs in font units.
  int16_t x_min;
  int16_t y_min;
  int16_t x_max;
  int16_t y_max;

  //! Macintosh style bits (bold, italic, ...).
  uint16_t mac_style;
  //! Smallest readable size in pixels.
  uint16_t lowest_rec_ppem;
  //! Deprecated font direction hint.
  int16_t font_direction_hint;
  //! Format of 'loca' offsets, 0 for 16-bit, 1 for 32-bit.
  int16_t index_to_loc_format;
  //! Glyph data format (always 0).
  int16_t glyph_data_format;

  TC_INLINE_NODEBUG void reset() noexcept { *this = TCFontHeadInfo{}; }
};

//! Information read from the 'OS/2' table.
//!
//! Fields that were added by later versions of the table are only valid when `version` is high enough, otherwise
//! they are zero.
struct TCFontOS2Info {
  uint16_t version;
  int16_t x_avg_char_width;
  uint16_t weight_class;
  uint16_t width_class;
  uint16_t fs_type;

  int16_t y_subscript_x_size;
  int16_t y_subscript_y_size;
  int16_t y_subscript_x_offset;
  int16_t y_subscript_y_offset;
  int16_t y_superscript_x_size;
  int16_t y_superscript_y_size;
  int16_t y_superscript_x_offset;
  int16_t y_superscript_y_offset;
  int16_t y_strikeout_size;
  int16_t y_strikeout_position;
  int16_t family_class;

  uint8_t panose[10];
  uint32_t unicode_ranges[4];
  TCTag vendor_id;

  uint16_t selection_flags;
  uint16_t first_char_index;
  uint16_t last_char_index;

  //! Version 0 tables written by Apple may end before these fields, `has_typo_metrics` tells whether they're valid.
  bool has_typo_metrics;
  int16_t typo_ascender;
  int16_t typo_descender;
  int16_t typo_line_gap;
  uint16_t win_ascent;
  uint16_t win_descent;

  //! Version 1+.
  uint32_t code_page_ranges[2];

  //! Version 2+.
  int16_t x_height;
  int16_t cap_height;
  uint16_t default_char;
  uint16_t break_char;
  uint16_t max_context;

  //! Version 5+.
  uint16_t lower_optical_point_size;
  uint16_t upper_optical_point_size;

  TC_INLINE_NODEBUG void reset() noexcept { *this = TCFontOS2Info{}; }
};

//! Horizontal or vertical metrics header read from 'hhea' or 'vhea' table.
//!
//! Both tables share the same layout, in case of 'vhea' the ascender and descender are vertical typo-ascender and
//! typo-descender and `caret_slope_rise` and `caret_slope_run` describe vertical caret.
struct TCFontMetricsHeader {
  uint32_t version;
  int16_t ascender;
  int16_t descender;
  int16_t line_gap;
  uint16_t max_advance;
  int16_t min_lsb;
  int16_t min_rsb;
  int16_t max_extent;
  int16_t caret_slope_rise;
  int16_t caret_slope_run;
  int16_t caret_offset;
  int16_t metric_data_format;
  //! Number of advance/side-bearing pairs in the matching 'hmtx' or 'vmtx' table.
  uint16_t long_metric_count;

  TC_INLINE_NODEBUG void reset() noexcept { *this = TCFontMetricsHeader{}; }
};

//! \}

//! \}

#endif // TYPECASE_CORE_FONTDEFS_H_INCLUDED
