// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <typecase/core/api-build_p.h>
#include <typecase/core/trace_p.h>
#include <typecase/opentype/otimages_p.h>

namespace tc::OpenType {
namespace SvgImpl {

// tc::OpenType::SvgImpl - Trace
// =============================

#if defined(TC_TRACE_OT_ALL) || defined(TC_TRACE_OT_SVG)
#define Trace TCDebugTrace
#else
#define Trace TCDummyTrace
#endif

// tc::OpenType::SvgImpl - Init
// ============================

TCResult create_bundle(const FontTableBlob& svg_blob, ImageBundle* out) noexcept {
  Table<SVGTable> svg(svg_blob.table());

  Trace trace;
  trace.info("tc::OpenType::SvgImpl::CreateBundle [Size=%u]\n", svg.size);
  trace.indent();

  if (!svg.fits()) {
    trace.fail("Table is truncated\n");
    return tc_make_error(TC_ERROR_DATA_TRUNCATED);
  }

  uint32_t version = svg->version();
  if (version != 0) {
    trace.fail("Invalid version (%u)\n", version);
    return tc_make_error(TC_ERROR_INVALID_SIGNATURE);
  }

  uint32_t list_offset = svg->document_list_offset();
  if (list_offset < SVGTable::kBaseSize || !svg.fits(list_offset, SVGTable::DocumentList::kBaseSize)) {
    trace.fail("Document list has invalid offset (%u)\n", list_offset);
    return tc_make_error(TC_ERROR_INVALID_DATA);
  }

  RawTable list = svg.sub_table_unchecked(list_offset);
  uint32_t record_count = list.data_as<SVGTable::DocumentList>()->records.count();

  if (!list.fits(SVGTable::DocumentList::kBaseSize + record_count * uint32_t(sizeof(SVGTable::DocumentRecord)))) {
    trace.fail("Document records are truncated [Count=%u]\n", record_count);
    return tc_make_error(TC_ERROR_DATA_TRUNCATED);
  }

  trace.info("DocumentCount: %u\n", record_count);

  ImageBundleImpl* impl;
  TC_PROPAGATE(ObjectInternal::alloc_impl_t<ImageBundleImpl>(&impl));

  impl->kind = ImageBundleKind::kVector;
  impl->index = svg_blob;
  impl->record_count = record_count;
  impl->document_list_offset = list_offset;

  ObjectInternal::replace_impl(out, impl);
  return TC_SUCCESS;
}

// tc::OpenType::SvgImpl - Lookup
// ==============================

TCResult lookup(const ImageBundleImpl* impl, TCGlyphId glyph_id, TCBitmapGlyph* out, bool* found_out) noexcept {
  TC_ASSERT(impl->kind == ImageBundleKind::kVector);

  Trace trace;
  *found_out = false;

  RawTable list = RawTable(impl->index.table()).sub_table_unchecked(impl->document_list_offset);
  const SVGTable::DocumentRecord* records = list.data_as<SVGTable::DocumentList>()->records.array();

  // Records are sorted by glyph ranges, which don't overlap.
  uint32_t lo = 0;
  uint32_t hi = impl->record_count;

  while (lo < hi) {
    uint32_t mid = (lo + hi) / 2u;
    const SVGTable::DocumentRecord& record = records[mid];

    if (glyph_id < record.start_glyph_id()) {
      hi = mid;
      continue;
    }

    if (glyph_id > record.end_glyph_id()) {
      lo = mid + 1;
      continue;
    }

    uint32_t document_offset = record.document_offset();
    uint32_t document_length = record.document_length();

    if (!list.fits(document_offset, document_length)) {
      trace.fail("Document of glyph %u is outside of the table [Offset=%u Length=%u]\n", glyph_id, document_offset, document_length);
      return tc_make_error(TC_ERROR_INVALID_DATA);
    }

    RawTable document = list.slice(document_offset, document_length);
    bool is_gzip = document.size >= 2u && document.readU8(0) == 0x1Fu && document.readU8(1) == 0x8Bu;

    TCBitmapGlyph glyph;
    glyph._font_data = impl->index._font_data;
    glyph.source = TC_BITMAP_SOURCE_SVG;
    glyph.format = is_gzip ? TC_BITMAP_FORMAT_SVGZ : TC_BITMAP_FORMAT_SVG;
    glyph.bit_depth = TC_BIT_DEPTH_32;
    glyph.data.reset(document.data, document.size);

    *out = std::move(glyph);
    *found_out = true;
    return TC_SUCCESS;
  }

  return TC_SUCCESS;
}

} // {SvgImpl}
} // {tc::OpenType}
