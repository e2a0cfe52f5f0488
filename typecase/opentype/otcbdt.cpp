// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <typecase/core/api-build_p.h>
#include <typecase/core/trace_p.h>
#include <typecase/opentype/otimages_p.h>

namespace tc::OpenType {
namespace CbdtImpl {

// tc::OpenType::CbdtImpl - Trace
// ==============================

#if defined(TC_TRACE_OT_ALL) || defined(TC_TRACE_OT_CBDT)
#define Trace TCDebugTrace
#else
#define Trace TCDummyTrace
#endif

// tc::OpenType::CbdtImpl - Utilities
// ==================================

static TC_INLINE bool is_valid_bit_depth(uint32_t bit_depth) noexcept {
  return bit_depth == 1 || bit_depth == 2 || bit_depth == 4 || bit_depth == 8 || bit_depth == 32;
}

static TC_INLINE bool is_supported_version(uint32_t major_version) noexcept {
  // EBLC/EBDT are 2.0, CBLC/CBDT are 3.0.
  return major_version == 2 || major_version == 3;
}

// tc::OpenType::CbdtImpl - Init
// =============================

TCResult create_bundle(const FontTableBlob& cblc_blob, const FontTableBlob& cbdt_blob, ImageBundle* out) noexcept {
  Table<CBLCTable> cblc(cblc_blob.table());
  Table<CBDTTable> cbdt(cbdt_blob.table());

  Trace trace;
  trace.info("tc::OpenType::CbdtImpl::CreateBundle [CBLC=%u CBDT=%u]\n", cblc.size, cbdt.size);
  trace.indent();

  if (!cblc.fits()) {
    trace.fail("CBLC is truncated\n");
    return tc_make_error(TC_ERROR_DATA_TRUNCATED);
  }

  if (!is_supported_version(cblc->major_version())) {
    trace.fail("CBLC has unsupported version [%u.%u]\n", cblc->major_version(), cblc->minor_version());
    return tc_make_error(TC_ERROR_INVALID_SIGNATURE);
  }

  if (!cbdt.fits()) {
    trace.fail("CBDT is truncated\n");
    return tc_make_error(TC_ERROR_DATA_TRUNCATED);
  }

  if (!is_supported_version(cbdt->major_version())) {
    trace.fail("CBDT has unsupported version [%u.%u]\n", cbdt->major_version(), cbdt->minor_version());
    return tc_make_error(TC_ERROR_INVALID_SIGNATURE);
  }

  uint32_t size_count = cblc->bitmap_sizes.count();
  if (size_count > (cblc.size - CBLCTable::kBaseSize) / uint32_t(sizeof(CBLCTable::BitmapSize))) {
    trace.fail("BitmapSize array is truncated [Count=%u]\n", size_count);
    return tc_make_error(TC_ERROR_DATA_TRUNCATED);
  }

  const CBLCTable::BitmapSize* sizes = cblc->bitmap_sizes.array();
  for (uint32_t i = 0; i < size_count; i++) {
    const CBLCTable::BitmapSize& bitmap_size = sizes[i];

    uint32_t bit_depth = bitmap_size.bit_depth();
    if (!is_valid_bit_depth(bit_depth)) {
      trace.fail("Strike #%u has invalid bit depth (%u)\n", i, bit_depth);
      return tc_make_error(TC_ERROR_INVALID_DATA);
    }

    uint32_t array_offset = bitmap_size.index_sub_table_array_offset();
    uint32_t record_count = bitmap_size.number_of_index_sub_tables();

    if (record_count > cblc.size / uint32_t(sizeof(CBLCTable::IndexSubTableRecord)) ||
        !cblc.fits(array_offset, record_count * uint32_t(sizeof(CBLCTable::IndexSubTableRecord)))) {
      trace.fail("Strike #%u has invalid IndexSubTableArray [Offset=%u Count=%u]\n", i, array_offset, record_count);
      return tc_make_error(TC_ERROR_INVALID_DATA);
    }

    trace.info("Strike #%u [PPEM=%u BitDepth=%u Glyphs=%u..%u]\n",
      i, bitmap_size.ppem_x(), bit_depth, bitmap_size.start_glyph_index(), bitmap_size.end_glyph_index());
  }

  ImageBundleImpl* impl;
  TC_PROPAGATE(ObjectInternal::alloc_impl_t<ImageBundleImpl>(&impl));

  impl->kind = ImageBundleKind::kBitmapStrikes;
  impl->index = cblc_blob;
  impl->data = cbdt_blob;
  impl->record_count = size_count;

  ObjectInternal::replace_impl(out, impl);
  return TC_SUCCESS;
}

// tc::OpenType::CbdtImpl - Lookup - Index
// =======================================

static constexpr uint32_t kNoRecord = 0xFFFFFFFFu;

// Returns an offset of IndexSubTableRecord that covers `glyph_id`, `kNoRecord` if there is no such record.
static uint32_t find_index_record(RawTable cblc, const CBLCTable::BitmapSize& bitmap_size, TCGlyphId glyph_id) noexcept {
  uint32_t array_offset = bitmap_size.index_sub_table_array_offset();
  uint32_t record_count = bitmap_size.number_of_index_sub_tables();

  const CBLCTable::IndexSubTableRecord* records = cblc.data_as<CBLCTable::IndexSubTableRecord>(array_offset);
  for (uint32_t i = 0; i < record_count; i++) {
    if (glyph_id >= records[i].first_glyph_index() && glyph_id <= records[i].last_glyph_index())
      return array_offset + i * uint32_t(sizeof(CBLCTable::IndexSubTableRecord));
  }

  return kNoRecord;
}

// Location of glyph image in 'CBDT' table.
struct ImageLocation {
  uint32_t image_format;
  uint64_t offset;
  uint32_t size;
  const BigGlyphMetrics* index_metrics;
};

static TCResult locate_image(Trace& trace, RawTable cblc, const CBLCTable::BitmapSize& bitmap_size, uint32_t record_offset, TCGlyphId glyph_id, ImageLocation* loc, bool* found_out) noexcept {
  const CBLCTable::IndexSubTableRecord* record = cblc.data_as<CBLCTable::IndexSubTableRecord>(record_offset);

  uint32_t first_glyph = record->first_glyph_index();
  uint32_t last_glyph = record->last_glyph_index();
  uint64_t sub_offset = uint64_t(bitmap_size.index_sub_table_array_offset()) + record->additional_offset();

  if (sub_offset > cblc.size || !cblc.fits(uint32_t(sub_offset), CBLCTable::IndexSubHeader::kBaseSize)) {
    trace.fail("IndexSubTable has invalid offset (%llu)\n", (unsigned long long)sub_offset);
    return tc_make_error(TC_ERROR_INVALID_DATA);
  }

  RawTable sub = cblc.sub_table_unchecked(uint32_t(sub_offset));
  const CBLCTable::IndexSubHeader* header = sub.data_as<CBLCTable::IndexSubHeader>();

  uint32_t index_format = header->index_format();
  uint32_t glyph_index = glyph_id - first_glyph;

  uint32_t start = 0;
  uint32_t end = 0;

  loc->image_format = header->image_format();
  loc->index_metrics = nullptr;

  switch (index_format) {
    case 1:
    case 3: {
      uint32_t entry_size = index_format == 1 ? 4u : 2u;
      uint32_t offset_count = last_glyph - first_glyph + 2u;

      if (!sub.fits(CBLCTable::IndexSubHeader::kBaseSize + offset_count * entry_size)) {
        trace.fail("IndexSubTable [Format %u] is truncated\n", index_format);
        return tc_make_error(TC_ERROR_DATA_TRUNCATED);
      }

      uint32_t entry_offset = CBLCTable::IndexSubHeader::kBaseSize + glyph_index * entry_size;
      if (index_format == 1) {
        start = sub.readU32(entry_offset);
        end = sub.readU32(entry_offset + 4u);
      }
      else {
        start = sub.readU16(entry_offset);
        end = sub.readU16(entry_offset + 2u);
      }
      break;
    }

    case 2: {
      if (!sub.fits(CBLCTable::IndexFormat2::kBaseSize)) {
        trace.fail("IndexSubTable [Format 2] is truncated\n");
        return tc_make_error(TC_ERROR_DATA_TRUNCATED);
      }

      const CBLCTable::IndexFormat2* fmt2 = sub.data_as<CBLCTable::IndexFormat2>();
      uint32_t image_size = fmt2->image_size();

      loc->image_format = fmt2->image_format();
      loc->offset = uint64_t(header->image_data_offset()) + uint64_t(image_size) * glyph_index;
      loc->size = image_size;
      loc->index_metrics = &fmt2->big_metrics;

      *found_out = image_size != 0;
      return TC_SUCCESS;
    }

    case 4: {
      if (!sub.fits(CBLCTable::IndexFormat4::kBaseSize)) {
        trace.fail("IndexSubTable [Format 4] is truncated\n");
        return tc_make_error(TC_ERROR_DATA_TRUNCATED);
      }

      uint32_t glyph_count = sub.data_as<CBLCTable::IndexFormat4>()->num_glyphs();
      if (glyph_count >= (sub.size - CBLCTable::IndexFormat4::kBaseSize) / uint32_t(sizeof(CBLCTable::GlyphIdOffsetPair))) {
        trace.fail("IndexSubTable [Format 4] is truncated [Count=%u]\n", glyph_count);
        return tc_make_error(TC_ERROR_DATA_TRUNCATED);
      }

      // The last pair only terminates the array, its glyph id is not searched.
      const CBLCTable::GlyphIdOffsetPair* pairs = sub.data_as<CBLCTable::GlyphIdOffsetPair>(CBLCTable::IndexFormat4::kBaseSize);
      uint32_t lo = 0;
      uint32_t hi = glyph_count;

      while (lo < hi) {
        uint32_t mid = (lo + hi) / 2u;
        uint32_t mid_glyph = pairs[mid].glyph_id();

        if (glyph_id < mid_glyph)
          hi = mid;
        else if (glyph_id > mid_glyph)
          lo = mid + 1;
        else {
          start = pairs[mid].offset();
          end = pairs[mid + 1].offset();
          break;
        }
      }

      if (lo >= hi) {
        *found_out = false;
        return TC_SUCCESS;
      }
      break;
    }

    case 5: {
      if (!sub.fits(CBLCTable::IndexFormat5::kBaseSize)) {
        trace.fail("IndexSubTable [Format 5] is truncated\n");
        return tc_make_error(TC_ERROR_DATA_TRUNCATED);
      }

      const CBLCTable::IndexFormat5* fmt5 = sub.data_as<CBLCTable::IndexFormat5>();
      uint32_t image_size = fmt5->image_size();
      uint32_t glyph_count = fmt5->num_glyphs();

      if (glyph_count > (sub.size - CBLCTable::IndexFormat5::kBaseSize) / 2u) {
        trace.fail("IndexSubTable [Format 5] is truncated [Count=%u]\n", glyph_count);
        return tc_make_error(TC_ERROR_DATA_TRUNCATED);
      }

      const UInt16* glyph_ids = sub.data_as<UInt16>(CBLCTable::IndexFormat5::kBaseSize);
      uint32_t lo = 0;
      uint32_t hi = glyph_count;

      while (lo < hi) {
        uint32_t mid = (lo + hi) / 2u;
        uint32_t mid_glyph = glyph_ids[mid].value();

        if (glyph_id < mid_glyph) {
          hi = mid;
        }
        else if (glyph_id > mid_glyph) {
          lo = mid + 1;
        }
        else {
          loc->image_format = fmt5->image_format();
          loc->offset = uint64_t(header->image_data_offset()) + uint64_t(image_size) * mid;
          loc->size = image_size;
          loc->index_metrics = &fmt5->big_metrics;

          *found_out = image_size != 0;
          return TC_SUCCESS;
        }
      }

      *found_out = false;
      return TC_SUCCESS;
    }

    default:
      trace.fail("IndexSubTable has invalid format (%u)\n", index_format);
      return tc_make_error(TC_ERROR_INVALID_DATA);
  }

  if (end < start) {
    trace.fail("IndexSubTable [Format %u] has decreasing offsets [%u > %u]\n", index_format, start, end);
    return tc_make_error(TC_ERROR_INVALID_DATA);
  }

  loc->offset = uint64_t(header->image_data_offset()) + start;
  loc->size = end - start;

  // Zero size means the glyph has no image in this strike.
  *found_out = loc->size != 0;
  return TC_SUCCESS;
}

// tc::OpenType::CbdtImpl - Lookup - Image
// =======================================

static void assign_small_metrics(const SmallGlyphMetrics* m, uint32_t strike_flags, TCBitmapGlyph* out) noexcept {
  TCBitmapMetrics metrics { int16_t(m->bearing_x()), int16_t(m->bearing_y()), uint16_t(m->advance()) };

  out->width = m->width();
  out->height = m->height();

  if ((strike_flags & CBLCTable::kFlagVerticalMetrics) && !(strike_flags & CBLCTable::kFlagHorizontalMetrics)) {
    out->vert_metrics = metrics;
    out->flags |= TC_BITMAP_GLYPH_FLAG_VERT_METRICS;
  }
  else {
    out->hori_metrics = metrics;
    out->flags |= TC_BITMAP_GLYPH_FLAG_HORI_METRICS;
  }
}

static void assign_big_metrics(const BigGlyphMetrics* m, TCBitmapGlyph* out) noexcept {
  out->width = m->width();
  out->height = m->height();
  out->hori_metrics = TCBitmapMetrics { int16_t(m->hori_bearing_x()), int16_t(m->hori_bearing_y()), uint16_t(m->hori_advance()) };
  out->vert_metrics = TCBitmapMetrics { int16_t(m->vert_bearing_x()), int16_t(m->vert_bearing_y()), uint16_t(m->vert_advance()) };
  out->flags |= TC_BITMAP_GLYPH_FLAG_HORI_METRICS | TC_BITMAP_GLYPH_FLAG_VERT_METRICS;
}

static TCResult assign_raw_data(Trace& trace, RawTable image, uint32_t offset, TCBitmapFormat format, TCBitmapGlyph* out) noexcept {
  uint64_t w = out->width;
  uint64_t h = out->height;
  uint64_t depth = out->bit_depth;

  uint64_t required_size = format == TC_BITMAP_FORMAT_BYTE_ALIGNED ? ((w * depth + 7u) / 8u) * h
                                                                     : (w * h * depth + 7u) / 8u;
  if (offset > image.size || required_size > uint64_t(image.size - offset)) {
    trace.fail("Image data is truncated [Size=%u Required=%llu]\n", image.size - tc_min(offset, image.size), (unsigned long long)required_size);
    return tc_make_error(TC_ERROR_DATA_TRUNCATED);
  }

  out->format = format;
  out->data.reset(image.data + offset, size_t(required_size));
  return TC_SUCCESS;
}

static TCResult assign_png_data(Trace& trace, RawTable image, uint32_t offset, TCBitmapGlyph* out) noexcept {
  if (!image.fits(offset, 4u)) {
    trace.fail("PNG image record is truncated\n");
    return tc_make_error(TC_ERROR_DATA_TRUNCATED);
  }

  uint32_t data_size = image.readU32(offset);
  if (!image.fits(offset + 4u, data_size)) {
    trace.fail("PNG data is truncated [Size=%u]\n", data_size);
    return tc_make_error(TC_ERROR_DATA_TRUNCATED);
  }

  out->format = TC_BITMAP_FORMAT_PNG;
  out->data.reset(image.data + offset + 4u, data_size);
  return TC_SUCCESS;
}

static TCResult decode_image(Trace& trace, RawTable image, const ImageLocation& loc, uint32_t strike_flags, TCBitmapGlyph* out) noexcept {
  constexpr uint32_t kSmallSize = uint32_t(sizeof(SmallGlyphMetrics));
  constexpr uint32_t kBigSize = uint32_t(sizeof(BigGlyphMetrics));

  switch (loc.image_format) {
    // Small metrics followed by byte-aligned (1) or bit-aligned (2) data.
    case 1:
    case 2: {
      if (!image.fits(kSmallSize))
        return tc_make_error(TC_ERROR_DATA_TRUNCATED);

      assign_small_metrics(image.data_as<SmallGlyphMetrics>(), strike_flags, out);
      return assign_raw_data(trace, image, kSmallSize, loc.image_format == 1 ? TC_BITMAP_FORMAT_BYTE_ALIGNED : TC_BITMAP_FORMAT_BIT_ALIGNED, out);
    }

    // Bit-aligned data, metrics are in the index sub-table.
    case 5: {
      if (!loc.index_metrics) {
        trace.fail("Image format 5 requires metrics in IndexSubTable\n");
        return tc_make_error(TC_ERROR_INVALID_DATA);
      }

      assign_big_metrics(loc.index_metrics, out);
      return assign_raw_data(trace, image, 0, TC_BITMAP_FORMAT_BIT_ALIGNED, out);
    }

    // Big metrics followed by byte-aligned (6) or bit-aligned (7) data.
    case 6:
    case 7: {
      if (!image.fits(kBigSize))
        return tc_make_error(TC_ERROR_DATA_TRUNCATED);

      assign_big_metrics(image.data_as<BigGlyphMetrics>(), out);
      return assign_raw_data(trace, image, kBigSize, loc.image_format == 6 ? TC_BITMAP_FORMAT_BYTE_ALIGNED : TC_BITMAP_FORMAT_BIT_ALIGNED, out);
    }

    // Composite bitmaps.
    case 8:
    case 9:
      trace.fail("Composite images are not supported [Format %u]\n", loc.image_format);
      return tc_make_error(TC_ERROR_NOT_IMPLEMENTED);

    // PNG with small metrics.
    case 17: {
      if (!image.fits(kSmallSize))
        return tc_make_error(TC_ERROR_DATA_TRUNCATED);

      assign_small_metrics(image.data_as<SmallGlyphMetrics>(), strike_flags, out);
      return assign_png_data(trace, image, kSmallSize, out);
    }

    // PNG with big metrics.
    case 18: {
      if (!image.fits(kBigSize))
        return tc_make_error(TC_ERROR_DATA_TRUNCATED);

      assign_big_metrics(image.data_as<BigGlyphMetrics>(), out);
      return assign_png_data(trace, image, kBigSize, out);
    }

    // PNG, metrics are in the index sub-table (if any).
    case 19: {
      if (loc.index_metrics)
        assign_big_metrics(loc.index_metrics, out);
      return assign_png_data(trace, image, 0, out);
    }

    default:
      trace.fail("Invalid image format (%u)\n", loc.image_format);
      return tc_make_error(TC_ERROR_INVALID_DATA);
  }
}

// tc::OpenType::CbdtImpl - Lookup
// ===============================

TCResult lookup(const ImageBundleImpl* impl, TCGlyphId glyph_id, uint32_t target_ppem, uint32_t max_bit_depth, TCBitmapGlyph* out, bool* found_out) noexcept {
  TC_ASSERT(impl->kind == ImageBundleKind::kBitmapStrikes);

  Trace trace;
  *found_out = false;

  Table<CBLCTable> cblc(impl->index.table());
  RawTable cbdt(impl->data.table());
  const CBLCTable::BitmapSize* sizes = cblc->bitmap_sizes.array();

  StrikeMatcher matcher(target_ppem);
  for (uint32_t i = 0; i < impl->record_count; i++) {
    const CBLCTable::BitmapSize& bitmap_size = sizes[i];

    if (bitmap_size.bit_depth() > max_bit_depth)
      continue;

    if (glyph_id < bitmap_size.start_glyph_index() || glyph_id > bitmap_size.end_glyph_index())
      continue;

    if (find_index_record(cblc, bitmap_size, glyph_id) == kNoRecord)
      continue;

    matcher.add(i, bitmap_size.ppem_x());
  }

  if (!matcher.found())
    return TC_SUCCESS;

  const CBLCTable::BitmapSize& strike = sizes[matcher.best_index()];
  uint32_t record_offset = find_index_record(cblc, strike, glyph_id);

  ImageLocation loc {};
  bool found = false;
  TC_PROPAGATE(locate_image(trace, cblc, strike, record_offset, glyph_id, &loc, &found));

  if (!found)
    return TC_SUCCESS;

  if (loc.offset > cbdt.size || !cbdt.fits(uint32_t(loc.offset), loc.size)) {
    trace.fail("Image of glyph %u is outside of CBDT [Offset=%llu Size=%u]\n", glyph_id, (unsigned long long)loc.offset, loc.size);
    return tc_make_error(TC_ERROR_INVALID_DATA);
  }

  TCBitmapGlyph glyph;
  glyph.source = TC_BITMAP_SOURCE_CBDT;
  glyph.bit_depth = strike.bit_depth();
  glyph.ppem_x = uint16_t(strike.ppem_x());
  glyph.ppem_y = uint16_t(strike.ppem_y());

  TC_PROPAGATE(decode_image(trace, cbdt.slice(uint32_t(loc.offset), loc.size), loc, uint32_t(uint8_t(strike.flags())), &glyph));

  glyph._font_data = impl->data._font_data;
  *out = std::move(glyph);
  *found_out = true;
  return TC_SUCCESS;
}

} // {CbdtImpl}
} // {tc::OpenType}
