// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <typecase/core/api-build_p.h>
#include <typecase/core/trace_p.h>
#include <typecase/opentype/otimages_p.h>

namespace tc::OpenType {
namespace ImagesImpl {

// tc::OpenType::ImagesImpl - Trace
// ================================

#if defined(TC_TRACE_OT_ALL) || defined(TC_TRACE_OT_IMAGES)
#define Trace TCDebugTrace
#else
#define Trace TCDummyTrace
#endif

// tc::OpenType::ImagesImpl - Load
// ===============================

static TCResult load_bitmap_strikes(const FontTableProvider& provider, ImageBundle* out) noexcept {
  FontTableBlob cblc;
  FontTableBlob cbdt;

  TC_PROPAGATE(provider.read_table_data(TC_FONT_TABLE_TAG_CBLC, &cblc));
  TC_PROPAGATE(provider.read_table_data(TC_FONT_TABLE_TAG_CBDT, &cbdt));

  return CbdtImpl::create_bundle(cblc, cbdt, out);
}

TCResult load_images(const FontTableProvider& provider, uint32_t glyph_count, ImageBundle& out, bool& present) noexcept {
  Trace trace;
  trace.info("tc::OpenType::ImagesImpl::LoadImages\n");
  trace.indent();

  TCResult result = load_bitmap_strikes(provider, &out);
  if (result == TC_SUCCESS) {
    trace.info("Using bitmap strikes (CBLC/CBDT)\n");
    present = true;
    return TC_SUCCESS;
  }

  trace.info("Bitmap strikes not usable [Result=0x%08X]\n", result);

  FontTableBlob sbix;
  TC_PROPAGATE(provider.table_data(TC_FONT_TABLE_TAG_SBIX, &sbix));

  if (sbix.is_empty()) {
    trace.info("No embedded images\n");
    present = false;
    return TC_SUCCESS;
  }

  TC_PROPAGATE(SbixImpl::create_bundle(sbix, glyph_count, &out));

  trace.info("Using fixed size images (sbix)\n");
  present = true;
  return TC_SUCCESS;
}

// tc::OpenType::ImagesImpl - Lookup
// =================================

TCResult lookup_glyph_image(const ImageBundle& bundle, TCGlyphId glyph_id, uint32_t target_size, TCBitDepth max_bit_depth, TCBitmapGlyph* out, bool* found_out) noexcept {
  const ImageBundleImpl* impl = bundle.impl();

  switch (impl->kind) {
    case ImageBundleKind::kBitmapStrikes:
      // Strike sizes in 'CBLC' are 8-bit.
      return CbdtImpl::lookup(impl, glyph_id, tc_min<uint32_t>(target_size, 255u), max_bit_depth, out, found_out);

    case ImageBundleKind::kFixedSize:
      return SbixImpl::lookup(impl, glyph_id, target_size, max_bit_depth, out, found_out);

    case ImageBundleKind::kVector:
      return SvgImpl::lookup(impl, glyph_id, out, found_out);
  }

  *found_out = false;
  return tc_make_error(TC_ERROR_INVALID_STATE);
}

} // {ImagesImpl}
} // {tc::OpenType}
