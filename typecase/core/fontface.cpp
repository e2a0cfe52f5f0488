// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <typecase/core/api-build_p.h>
#include <typecase/core/fontface_p.h>
#include <typecase/core/trace_p.h>
#include <typecase/opentype/otcore_p.h>
#include <typecase/opentype/otglyphnames_p.h>
#include <typecase/opentype/otlayout_p.h>
#include <typecase/opentype/otmetrics_p.h>

using namespace tc::OpenType;

namespace tc {
namespace FontFaceInternal {

// tc::FontFace - Trace
// ====================

#if defined(TC_TRACE_OT_ALL) || defined(TC_TRACE_OT_FACE)
#define Trace TCDebugTrace
#else
#define Trace TCDummyTrace
#endif

// tc::FontFace - Init
// ===================

static TCOutlineFormat classify_outline_format(const FontTableProvider& provider) noexcept {
  // Faces that provide 'sbix' or 'SVG ' images are treated as image faces even when they have outlines.
  if (provider.has_table(TC_FONT_TABLE_TAG_SBIX) || provider.has_table(TC_FONT_TABLE_TAG_SVG))
    return TC_OUTLINE_FORMAT_NONE;

  if (provider.has_table(TC_FONT_TABLE_TAG_GLYF))
    return TC_OUTLINE_FORMAT_GLYF;

  if (provider.has_table(TC_FONT_TABLE_TAG_CFF))
    return TC_OUTLINE_FORMAT_CFF;

  return TC_OUTLINE_FORMAT_NONE;
}

TCResult init_impl(TCFontFaceImpl* impl, bool* found) noexcept {
  const FontTableProvider& provider = impl->provider;

  Trace trace;
  trace.info("tc::FontFace::Init [FaceIndex=%u]\n", provider.face_index());
  trace.indent();

  *found = false;

  // Character map is read first as it decides whether the face is usable at all.
  TC_PROPAGATE(provider.read_table_data(TC_FONT_TABLE_TAG_CMAP, &impl->cmap));

  RawTable cmap(impl->cmap.table());
  bool cmap_found = false;
  TC_PROPAGATE(CMapImpl::select_encoding(cmap, &cmap_found, &impl->char_encoding, &impl->cmap_offset));

  if (!cmap_found) {
    trace.warn("No supported character map\n");
    return TC_SUCCESS;
  }

  if (impl->cmap_offset >= cmap.size) {
    trace.fail("Character map sub-table is outside of the table [Offset=%u]\n", impl->cmap_offset);
    return tc_make_error(TC_ERROR_INVALID_DATA);
  }

  // A malformed sub-table doesn't make the face unusable, it just doesn't map any character.
  TCResult cmap_result = CMapImpl::validate_sub_table(cmap, impl->cmap_offset, impl->cmap_encoding);
  impl->cmap_valid = cmap_result == TC_SUCCESS;

  if (!impl->cmap_valid)
    trace.warn("Character map sub-table is malformed [Result=0x%08X]\n", cmap_result);

  FontTableBlob maxp;
  TC_PROPAGATE(provider.read_table_data(TC_FONT_TABLE_TAG_MAXP, &maxp));
  TC_PROPAGATE(CoreImpl::read_maxp(Table<MaxPTable>(maxp.table()), &impl->glyph_count));

  TC_PROPAGATE(provider.read_table_data(TC_FONT_TABLE_TAG_HMTX, &impl->hmtx));

  FontTableBlob hhea;
  TC_PROPAGATE(provider.read_table_data(TC_FONT_TABLE_TAG_HHEA, &hhea));
  TC_PROPAGATE(MetricsImpl::read_xhea(Table<XHeaTable>(hhea.table()), &impl->hhea));

  impl->outline_format = classify_outline_format(provider);

  trace.info("CharEncoding: %u\n", uint32_t(impl->char_encoding));
  trace.info("GlyphCount: %u\n", impl->glyph_count);
  trace.info("OutlineFormat: %u\n", uint32_t(impl->outline_format));

  *found = true;
  return TC_SUCCESS;
}

// tc::FontFace - Lazily Loaded Tables
// ===================================

TCResult vmtx_table(TCFontFaceImpl* impl, FontTableBlob* out, bool* present_out) noexcept {
  const FontTableProvider& provider = impl->provider;

  return impl->vmtx.get_or_load(*out, *present_out, [&](FontTableBlob& blob, bool& present) noexcept -> TCResult {
    TC_PROPAGATE(provider.table_data(TC_FONT_TABLE_TAG_VMTX, &blob));
    present = !blob.is_empty();
    return TC_SUCCESS;
  });
}

static TCResult vhea_table(TCFontFaceImpl* impl, TCFontMetricsHeader* out, bool* present_out) noexcept {
  const FontTableProvider& provider = impl->provider;

  return impl->vhea.get_or_load(*out, *present_out, [&](TCFontMetricsHeader& header, bool& present) noexcept -> TCResult {
    FontTableBlob blob;
    TC_PROPAGATE(provider.table_data(TC_FONT_TABLE_TAG_VHEA, &blob));

    if (blob.is_empty()) {
      present = false;
      return TC_SUCCESS;
    }

    TC_PROPAGATE(MetricsImpl::read_xhea(Table<XHeaTable>(blob.table()), &header));
    present = true;
    return TC_SUCCESS;
  });
}

static TCResult layout_cache(const FontTableProvider& provider, LazyLoad<TCLayoutCache>& cache, TCLayoutKind kind, TCLayoutCache* out) noexcept {
  TCTag tag = kind == TC_LAYOUT_KIND_GSUB ? TCTag(TC_FONT_TABLE_TAG_GSUB) : TCTag(TC_FONT_TABLE_TAG_GPOS);
  bool present = false;

  out->reset();
  return cache.get_or_load(*out, present, [&](TCLayoutCache& layout, bool& layout_present) noexcept -> TCResult {
    FontTableBlob blob;
    TC_PROPAGATE(provider.table_data(tag, &blob));

    if (blob.is_empty()) {
      layout_present = false;
      return TC_SUCCESS;
    }

    TC_PROPAGATE(LayoutImpl::create_layout_cache(kind, blob, &layout));
    layout_present = true;
    return TC_SUCCESS;
  });
}

TCResult embedded_images(TCFontFaceImpl* impl, ImageBundle* out, bool* present_out) noexcept {
  const FontTableProvider& provider = impl->provider;
  uint32_t glyph_count = impl->glyph_count;

  return impl->images.get_or_load(*out, *present_out, [&](ImageBundle& bundle, bool& present) noexcept -> TCResult {
    return ImagesImpl::load_images(provider, glyph_count, bundle, present);
  });
}

} // {FontFaceInternal}
} // {tc}

// tc::FontFace - API - Construction & Destruction
// ===============================================

TCFontFace::~TCFontFace() noexcept {
  tc::FontFaceInternal::destroy_impl(_impl);
}

TCFontFace& TCFontFace::operator=(TCFontFace&& other) noexcept {
  TCFontFaceImpl* impl = other._impl;
  other._impl = nullptr;

  tc::FontFaceInternal::destroy_impl(_impl);
  _impl = impl;
  return *this;
}

void TCFontFace::reset() noexcept {
  TCFontFaceImpl* impl = _impl;
  _impl = nullptr;
  tc::FontFaceInternal::destroy_impl(impl);
}

// tc::FontFace - API - Create
// ===========================

TCResult TCFontFace::create_from_data(const TCFontData& font_data, uint32_t face_index) noexcept {
  reset();

  if (TC_UNLIKELY(font_data.is_empty()))
    return tc_make_error(TC_ERROR_FONT_NOT_INITIALIZED);

  if (TC_UNLIKELY(face_index >= font_data.face_count()))
    return tc_make_error(TC_ERROR_INVALID_VALUE);

  TCFontFaceImpl* impl;
  TC_PROPAGATE(tc::FontFaceInternal::alloc_impl(&impl, font_data, face_index));

  bool found = false;
  TC_PROPAGATE_(tc::FontFaceInternal::init_impl(impl, &found), tc::FontFaceInternal::destroy_impl(impl););

  if (!found) {
    tc::FontFaceInternal::destroy_impl(impl);
    return TC_SUCCESS;
  }

  _impl = impl;
  return TC_SUCCESS;
}

// tc::FontFace - API - Accessors
// ==============================

TCFontData TCFontFace::font_data() const noexcept {
  return _impl ? _impl->provider.font_data() : TCFontData{};
}

uint32_t TCFontFace::face_index() const noexcept {
  return _impl ? _impl->provider.face_index() : 0u;
}

uint32_t TCFontFace::glyph_count() const noexcept {
  return _impl ? _impl->glyph_count : 0u;
}

TCCharEncoding TCFontFace::char_encoding() const noexcept {
  return _impl ? _impl->char_encoding : TC_CHAR_ENCODING_UNICODE;
}

TCOutlineFormat TCFontFace::outline_format() const noexcept {
  return _impl ? _impl->outline_format : TC_OUTLINE_FORMAT_NONE;
}

TCFontMetricsHeader TCFontFace::horizontal_header() const noexcept {
  return _impl ? _impl->hhea : TCFontMetricsHeader{};
}

// tc::FontFace - API - Characters & Glyphs
// ========================================

TCGlyphId TCFontFace::lookup_glyph_index(uint32_t char_code) const noexcept {
  if (!_impl || !_impl->cmap_valid)
    return 0;

  return CMapImpl::map_char(RawTable(_impl->cmap.table()), _impl->cmap_encoding, char_code);
}

TCResult TCFontFace::glyph_names(const TCGlyphId* glyph_ids, size_t count, TCGlyphNameSinkFunc sink, void* user_data) const noexcept {
  if (TC_UNLIKELY(!_impl))
    return tc_make_error(TC_ERROR_FONT_NOT_INITIALIZED);

  if (TC_UNLIKELY(!sink || (!glyph_ids && count)))
    return tc_make_error(TC_ERROR_INVALID_VALUE);

  // Names are best effort, a 'post' table that cannot be read is treated as missing.
  tc::FontTableBlob post;
  if (_impl->provider.table_data(TC_FONT_TABLE_TAG_POST, &post) != TC_SUCCESS)
    post.reset();

  GlyphNamer namer;
  namer.init_post(RawTable(post.table()));

  if (_impl->cmap_valid)
    namer.init_cmap(RawTable(_impl->cmap.table()), _impl->cmap_encoding, _impl->char_encoding, _impl->glyph_count);

  std::vector<std::string> names;
  TC_PROPAGATE(GlyphNamesImpl::glyph_names(namer, glyph_ids, count, names));

  for (size_t i = 0; i < count; i++)
    TC_PROPAGATE(sink(i, glyph_ids[i], names[i].c_str(), names[i].size(), user_data));

  return TC_SUCCESS;
}

// tc::FontFace - API - Metrics
// ============================

bool TCFontFace::horizontal_advance(TCGlyphId glyph_id, uint32_t* advance_out) const noexcept {
  if (!_impl)
    return false;

  RawTable hmtx(_impl->hmtx.table());
  return MetricsImpl::get_advance(_impl->glyph_count, _impl->hhea, hmtx, glyph_id, advance_out) == TC_SUCCESS;
}

bool TCFontFace::vertical_advance(TCGlyphId glyph_id, uint32_t* advance_out) noexcept {
  if (!_impl)
    return false;

  tc::FontTableBlob vmtx;
  bool vmtx_present = false;

  if (tc::FontFaceInternal::vmtx_table(_impl, &vmtx, &vmtx_present) != TC_SUCCESS || !vmtx_present)
    return false;

  TCFontMetricsHeader vhea {};
  bool vhea_present = false;

  if (tc::FontFaceInternal::vhea_table(_impl, &vhea, &vhea_present) != TC_SUCCESS || !vhea_present)
    return false;

  return MetricsImpl::get_advance(_impl->glyph_count, vhea, RawTable(vmtx.table()), glyph_id, advance_out) == TC_SUCCESS;
}

TCResult TCFontFace::vertical_header(TCFontMetricsHeader* out, bool* present_out) noexcept {
  *present_out = false;

  if (TC_UNLIKELY(!_impl))
    return tc_make_error(TC_ERROR_FONT_NOT_INITIALIZED);

  return tc::FontFaceInternal::vhea_table(_impl, out, present_out);
}

// tc::FontFace - API - Tables
// ===========================

TCResult TCFontFace::head_table(TCFontHeadInfo* out, bool* present_out) const noexcept {
  *present_out = false;

  if (TC_UNLIKELY(!_impl))
    return tc_make_error(TC_ERROR_FONT_NOT_INITIALIZED);

  tc::FontTableBlob blob;
  TC_PROPAGATE(_impl->provider.table_data(TC_FONT_TABLE_TAG_HEAD, &blob));

  if (blob.is_empty())
    return TC_SUCCESS;

  TC_PROPAGATE(CoreImpl::read_head(Table<HeadTable>(blob.table()), out));
  *present_out = true;
  return TC_SUCCESS;
}

TCResult TCFontFace::os2_table(TCFontOS2Info* out, bool* present_out) const noexcept {
  *present_out = false;

  if (TC_UNLIKELY(!_impl))
    return tc_make_error(TC_ERROR_FONT_NOT_INITIALIZED);

  tc::FontTableBlob blob;
  TC_PROPAGATE(_impl->provider.table_data(TC_FONT_TABLE_TAG_OS2, &blob));

  if (blob.is_empty())
    return TC_SUCCESS;

  TC_PROPAGATE(CoreImpl::read_os2(Table<OS2Table>(blob.table()), out));
  *present_out = true;
  return TC_SUCCESS;
}

TCResult TCFontFace::gdef_table(TCGDefTable* out) noexcept {
  out->reset();

  if (TC_UNLIKELY(!_impl))
    return tc_make_error(TC_ERROR_FONT_NOT_INITIALIZED);

  const tc::FontTableProvider& provider = _impl->provider;
  bool present = false;

  return _impl->gdef.get_or_load(*out, present, [&](TCGDefTable& gdef, bool& gdef_present) noexcept -> TCResult {
    tc::FontTableBlob blob;
    TC_PROPAGATE(provider.table_data(TC_FONT_TABLE_TAG_GDEF, &blob));

    if (blob.is_empty()) {
      gdef_present = false;
      return TC_SUCCESS;
    }

    TC_PROPAGATE(LayoutImpl::create_gdef(blob, &gdef));
    gdef_present = true;
    return TC_SUCCESS;
  });
}

TCResult TCFontFace::gsub_cache(TCLayoutCache* out) noexcept {
  out->reset();

  if (TC_UNLIKELY(!_impl))
    return tc_make_error(TC_ERROR_FONT_NOT_INITIALIZED);

  return tc::FontFaceInternal::layout_cache(_impl->provider, _impl->gsub, TC_LAYOUT_KIND_GSUB, out);
}

TCResult TCFontFace::gpos_cache(TCLayoutCache* out) noexcept {
  out->reset();

  if (TC_UNLIKELY(!_impl))
    return tc_make_error(TC_ERROR_FONT_NOT_INITIALIZED);

  return tc::FontFaceInternal::layout_cache(_impl->provider, _impl->gpos, TC_LAYOUT_KIND_GPOS, out);
}

// tc::FontFace - API - Embedded Images
// ====================================

TCResult TCFontFace::lookup_glyph_image(TCGlyphId glyph_id, uint32_t target_size, TCBitDepth max_bit_depth, TCBitmapGlyph* out) noexcept {
  out->reset();

  if (TC_UNLIKELY(!_impl))
    return tc_make_error(TC_ERROR_FONT_NOT_INITIALIZED);

  ImageBundle bundle;
  bool present = false;
  TC_PROPAGATE(tc::FontFaceInternal::embedded_images(_impl, &bundle, &present));

  if (!present)
    return TC_SUCCESS;

  bool found = false;
  TCResult result = ImagesImpl::lookup_glyph_image(bundle, glyph_id, target_size, max_bit_depth, out, &found);

  if (result != TC_SUCCESS || !found)
    out->reset();
  return result;
}

bool TCFontFace::supports_emoji() noexcept {
  if (!_impl)
    return false;

  ImageBundle bundle;
  bool present = false;
  return tc::FontFaceInternal::embedded_images(_impl, &bundle, &present) == TC_SUCCESS && present;
}
