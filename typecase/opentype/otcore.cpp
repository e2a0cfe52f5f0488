// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <typecase/core/api-build_p.h>
#include <typecase/core/trace_p.h>
#include <typecase/opentype/otcore_p.h>

namespace tc::OpenType {
namespace CoreImpl {

// tc::OpenType::CoreImpl - Trace
// ==============================

#if defined(TC_TRACE_OT_ALL) || defined(TC_TRACE_OT_CORE)
#define Trace TCDebugTrace
#else
#define Trace TCDummyTrace
#endif

// tc::OpenType::CoreImpl - 'maxp'
// ===============================

TCResult read_maxp(Table<MaxPTable> maxp, uint32_t* glyph_count_out) noexcept {
  Trace trace;
  trace.info("tc::OpenType::CoreImpl::ReadMaxP [Size=%u]\n", maxp.size);
  trace.indent();

  if (!maxp.fits()) {
    trace.fail("Table is truncated\n");
    return tc_make_error(TC_ERROR_DATA_TRUNCATED);
  }

  uint32_t version = maxp->v0_5()->version();
  if (version == MaxPTable::kVersion1_0) {
    if (!maxp.fits(MaxPTable::V1_0::kBaseSize)) {
      trace.fail("Table [v1.0] is truncated\n");
      return tc_make_error(TC_ERROR_DATA_TRUNCATED);
    }
  }
  else if (version != MaxPTable::kVersion0_5) {
    trace.fail("Invalid version [%08X]\n", version);
    return tc_make_error(TC_ERROR_INVALID_SIGNATURE);
  }

  uint32_t glyph_count = maxp->v0_5()->glyph_count();
  trace.info("GlyphCount: %u\n", glyph_count);

  *glyph_count_out = glyph_count;
  return TC_SUCCESS;
}

// tc::OpenType::CoreImpl - 'head'
// ===============================

TCResult read_head(Table<HeadTable> head, TCFontHeadInfo* out) noexcept {
  Trace trace;
  trace.info("tc::OpenType::CoreImpl::ReadHead [Size=%u]\n", head.size);
  trace.indent();

  if (!head.fits()) {
    trace.fail("Table is truncated\n");
    return tc_make_error(TC_ERROR_DATA_TRUNCATED);
  }

  if (head->magic_number() != HeadTable::kMagicNumber) {
    trace.fail("Invalid magic number [%08X]\n", head->magic_number());
    return tc_make_error(TC_ERROR_INVALID_SIGNATURE);
  }

  int32_t index_to_loc_format = head->index_to_loc_format();
  if (index_to_loc_format != HeadTable::kIndexToLocUInt16 && index_to_loc_format != HeadTable::kIndexToLocUInt32) {
    trace.fail("Invalid IndexToLocFormat [%d], expected [0:1]\n", index_to_loc_format);
    return tc_make_error(TC_ERROR_INVALID_DATA);
  }

  out->revision = head->revision();
  out->flags = head->flags();
  out->units_per_em = head->units_per_em();
  out->created = head->created();
  out->modified = head->modified();
  out->x_min = head->x_min();
  out->y_min = head->y_min();
  out->x_max = head->x_max();
  out->y_max = head->y_max();
  out->mac_style = head->mac_style();
  out->lowest_rec_ppem = head->lowest_rec_ppem();
  out->font_direction_hint = head->font_direction_hint();
  out->index_to_loc_format = int16_t(index_to_loc_format);
  out->glyph_data_format = head->glyph_data_format();

  trace.info("Revision: %u.%u\n", out->revision >> 16, out->revision & 0xFFFFu);
  trace.info("UnitsPerEm: %u\n", out->units_per_em);
  trace.info("LowestPPEM: %u\n", out->lowest_rec_ppem);
  trace.info("BoundingBox: [%d %d %d %d]\n", out->x_min, out->y_min, out->x_max, out->y_max);

  return TC_SUCCESS;
}

// tc::OpenType::CoreImpl - 'OS/2'
// ===============================

TCResult read_os2(Table<OS2Table> os2, TCFontOS2Info* out) noexcept {
  Trace trace;
  trace.info("tc::OpenType::CoreImpl::ReadOS/2 [Size=%u]\n", os2.size);
  trace.indent();

  out->reset();

  if (!os2.fits()) {
    trace.fail("Table is truncated\n");
    return tc_make_error(TC_ERROR_DATA_TRUNCATED);
  }

  // Version 0 tables written by Apple end after 'last_char', other versions must provide all their fields.
  uint32_t version = os2->v0a()->version();
  uint32_t required_size = OS2Table::V0A::kBaseSize;

  if (version >= 5)
    required_size = OS2Table::V5::kBaseSize;
  else if (version >= 2)
    required_size = OS2Table::V2::kBaseSize;
  else if (version >= 1)
    required_size = OS2Table::V1::kBaseSize;

  if (!os2.fits(required_size)) {
    trace.fail("Table [v%u] is truncated [Size=%u Required=%u]\n", version, os2.size, required_size);
    return tc_make_error(TC_ERROR_DATA_TRUNCATED);
  }

  const OS2Table::V0A* v0a = os2->v0a();
  out->version = uint16_t(version);
  out->x_avg_char_width = v0a->x_avg_char_width();
  out->weight_class = v0a->weight_class();
  out->width_class = v0a->width_class();
  out->fs_type = v0a->fs_type();
  out->y_subscript_x_size = v0a->y_subscript_x_size();
  out->y_subscript_y_size = v0a->y_subscript_y_size();
  out->y_subscript_x_offset = v0a->y_subscript_x_offset();
  out->y_subscript_y_offset = v0a->y_subscript_y_offset();
  out->y_superscript_x_size = v0a->y_superscript_x_size();
  out->y_superscript_y_size = v0a->y_superscript_y_size();
  out->y_superscript_x_offset = v0a->y_superscript_x_offset();
  out->y_superscript_y_offset = v0a->y_superscript_y_offset();
  out->y_strikeout_size = v0a->y_strikeout_size();
  out->y_strikeout_position = v0a->y_strikeout_position();
  out->family_class = v0a->family_class();

  for (uint32_t i = 0; i < 10; i++)
    out->panose[i] = v0a->panose[i]();

  for (uint32_t i = 0; i < 4; i++)
    out->unicode_ranges[i] = v0a->unicode_coverage[i]();

  out->vendor_id = v0a->vendor_id();
  out->selection_flags = v0a->selection_flags();
  out->first_char_index = v0a->first_char();
  out->last_char_index = v0a->last_char();

  trace.info("Version: %u\n", version);
  trace.info("Weight: %u\n", out->weight_class);
  trace.info("Width: %u\n", out->width_class);

  if (os2.fits(OS2Table::V0B::kBaseSize)) {
    const OS2Table::V0B* v0b = os2->v0b();
    out->has_typo_metrics = true;
    out->typo_ascender = v0b->typo_ascender();
    out->typo_descender = v0b->typo_descender();
    out->typo_line_gap = v0b->typo_line_gap();
    out->win_ascent = v0b->win_ascent();
    out->win_descent = v0b->win_descent();
  }

  if (version >= 1) {
    out->code_page_ranges[0] = os2->v1()->code_page_range[0]();
    out->code_page_ranges[1] = os2->v1()->code_page_range[1]();
  }

  if (version >= 2) {
    const OS2Table::V2* v2 = os2->v2();
    out->x_height = v2->x_height();
    out->cap_height = v2->cap_height();
    out->default_char = v2->default_char();
    out->break_char = v2->break_char();
    out->max_context = v2->max_context();

    trace.info("X-Height: %d\n", out->x_height);
    trace.info("Cap-Height: %d\n", out->cap_height);
  }

  if (version >= 5) {
    out->lower_optical_point_size = os2->v5()->lower_optical_point_size();
    out->upper_optical_point_size = os2->v5()->upper_optical_point_size();
  }

  return TC_SUCCESS;
}

} // {CoreImpl}
} // {tc::OpenType}
