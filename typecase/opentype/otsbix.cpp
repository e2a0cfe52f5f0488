// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <typecase/core/api-build_p.h>
#include <typecase/core/trace_p.h>
#include <typecase/opentype/otimages_p.h>

namespace tc::OpenType {
namespace SbixImpl {

// tc::OpenType::SbixImpl - Trace
// ==============================

#if defined(TC_TRACE_OT_ALL) || defined(TC_TRACE_OT_SBIX)
#define Trace TCDebugTrace
#else
#define Trace TCDummyTrace
#endif

// tc::OpenType::SbixImpl - Init
// =============================

TCResult create_bundle(const FontTableBlob& sbix_blob, uint32_t glyph_count, ImageBundle* out) noexcept {
  Table<SbixTable> sbix(sbix_blob.table());

  Trace trace;
  trace.info("tc::OpenType::SbixImpl::CreateBundle [Size=%u GlyphCount=%u]\n", sbix.size, glyph_count);
  trace.indent();

  if (!sbix.fits()) {
    trace.fail("Table is truncated\n");
    return tc_make_error(TC_ERROR_DATA_TRUNCATED);
  }

  uint32_t version = sbix->version();
  if (version != 1) {
    trace.fail("Invalid version (%u)\n", version);
    return tc_make_error(TC_ERROR_INVALID_SIGNATURE);
  }

  uint32_t strike_count = sbix->strike_offsets.count();
  if (strike_count > (sbix.size - SbixTable::kBaseSize) / 4u) {
    trace.fail("Strike offsets are truncated [Count=%u]\n", strike_count);
    return tc_make_error(TC_ERROR_DATA_TRUNCATED);
  }

  // Each strike has `glyph_count + 1` glyph data offsets, so the size of each record can be calculated.
  uint32_t strike_header_size = SbixTable::Strike::kBaseSize + (glyph_count + 1u) * 4u;
  const Offset32* strike_offsets = sbix->strike_offsets.array();

  for (uint32_t i = 0; i < strike_count; i++) {
    uint32_t strike_offset = strike_offsets[i].value();

    if (!sbix.fits(strike_offset, strike_header_size)) {
      trace.fail("Strike #%u has invalid offset (%u)\n", i, strike_offset);
      return tc_make_error(TC_ERROR_INVALID_DATA);
    }

    trace.info("Strike #%u [PPEM=%u PPI=%u]\n", i, sbix.readU16(strike_offset), sbix.readU16(strike_offset + 2u));
  }

  ImageBundleImpl* impl;
  TC_PROPAGATE(ObjectInternal::alloc_impl_t<ImageBundleImpl>(&impl));

  impl->kind = ImageBundleKind::kFixedSize;
  impl->index = sbix_blob;
  impl->record_count = strike_count;
  impl->glyph_count = glyph_count;

  ObjectInternal::replace_impl(out, impl);
  return TC_SUCCESS;
}

// tc::OpenType::SbixImpl - Lookup
// ===============================

static TC_INLINE uint32_t strike_offset_at(RawTable sbix, uint32_t index) noexcept {
  return sbix.data_as<SbixTable>()->strike_offsets.array()[index].value();
}

// Returns the range of glyph data of `glyph_id` relative to the start of the strike.
static TC_INLINE void glyph_data_range(RawTable sbix, uint32_t strike_offset, TCGlyphId glyph_id, uint32_t* start, uint32_t* end) noexcept {
  const Offset32* offsets = sbix.data_as<Offset32>(strike_offset + SbixTable::Strike::kBaseSize);
  *start = offsets[glyph_id].value();
  *end = offsets[glyph_id + 1].value();
}

static TCBitmapFormat format_from_graphic_type(uint32_t graphic_type) noexcept {
  switch (graphic_type) {
    case SbixTable::kGraphicTypePng : return TC_BITMAP_FORMAT_PNG;
    case SbixTable::kGraphicTypeJpg : return TC_BITMAP_FORMAT_JPEG;
    case SbixTable::kGraphicTypeTiff: return TC_BITMAP_FORMAT_TIFF;
    default:
      return TC_BITMAP_FORMAT_OTHER;
  }
}

static TCResult lookup_impl(Trace& trace, const ImageBundleImpl* impl, bool is_dupe, TCGlyphId glyph_id, uint32_t target_ppem, TCBitmapGlyph* out, bool* found_out) noexcept {
  RawTable sbix(impl->index.table());

  if (glyph_id >= impl->glyph_count)
    return TC_SUCCESS;

  // Only strikes that have data of the glyph are considered.
  StrikeMatcher matcher(target_ppem);
  for (uint32_t i = 0; i < impl->record_count; i++) {
    uint32_t strike_offset = strike_offset_at(sbix, i);
    uint32_t start, end;

    glyph_data_range(sbix, strike_offset, glyph_id, &start, &end);
    if (end > start)
      matcher.add(i, sbix.readU16(strike_offset));
  }

  if (!matcher.found())
    return TC_SUCCESS;

  uint32_t strike_offset = strike_offset_at(sbix, matcher.best_index());
  uint32_t start, end;
  glyph_data_range(sbix, strike_offset, glyph_id, &start, &end);

  RawTable strike = sbix.sub_table_unchecked(strike_offset);
  if (end - start < SbixTable::GlyphData::kBaseSize || !strike.fits(start, end - start)) {
    trace.fail("Glyph %u has invalid data [Start=%u End=%u]\n", glyph_id, start, end);
    return tc_make_error(TC_ERROR_INVALID_DATA);
  }

  RawTable record = strike.slice(start, end - start);
  const SbixTable::GlyphData* glyph_data = record.data_as<SbixTable::GlyphData>();

  uint32_t graphic_type = glyph_data->graphic_type();
  RawTable payload = record.sub_table_unchecked(SbixTable::GlyphData::kBaseSize);

  if (graphic_type == SbixTable::kGraphicTypeDupe) {
    // A 'dupe' pointing to another 'dupe' is not followed, that would allow cycles.
    if (is_dupe) {
      trace.warn("Glyph %u is a dupe of a dupe, not followed\n", glyph_id);
      return TC_SUCCESS;
    }

    if (!payload.fits(2u)) {
      trace.fail("Dupe record of glyph %u is truncated\n", glyph_id);
      return tc_make_error(TC_ERROR_DATA_TRUNCATED);
    }

    return lookup_impl(trace, impl, true, payload.readU16(0), target_ppem, out, found_out);
  }

  TCBitmapGlyph glyph;
  glyph._font_data = impl->index._font_data;
  glyph.source = TC_BITMAP_SOURCE_SBIX;
  glyph.format = format_from_graphic_type(graphic_type);
  glyph.bit_depth = TC_BIT_DEPTH_32;
  glyph.flags = TC_BITMAP_GLYPH_FLAG_ORIGIN;
  glyph.ppem_x = uint16_t(matcher.best_size());
  glyph.ppem_y = uint16_t(matcher.best_size());
  glyph.origin_x = glyph_data->origin_offset_x();
  glyph.origin_y = glyph_data->origin_offset_y();
  glyph.graphic_type = graphic_type;
  glyph.data.reset(payload.data, payload.size);

  *out = std::move(glyph);
  *found_out = true;
  return TC_SUCCESS;
}

TCResult lookup(const ImageBundleImpl* impl, TCGlyphId glyph_id, uint32_t target_ppem, uint32_t max_bit_depth, TCBitmapGlyph* out, bool* found_out) noexcept {
  TC_ASSERT(impl->kind == ImageBundleKind::kFixedSize);

  Trace trace;
  *found_out = false;

  // All 'sbix' images are 32-bit.
  if (max_bit_depth < TC_BIT_DEPTH_32)
    return TC_SUCCESS;

  return lookup_impl(trace, impl, false, glyph_id, target_ppem, out, found_out);
}

} // {SbixImpl}
} // {tc::OpenType}
