// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <typecase/core/api-build_test_p.h>
#if defined(TC_TEST)

#include <typecase/opentype/otimages_p.h>
#include <commons/fontbuilder.h>

namespace tc::OpenType {
namespace Tests {

static FontTableBlob blob_of(const tctest::ByteBuilder& b) noexcept {
  FontTableBlob blob;
  blob._table.reset(b.data(), b.size());
  return blob;
}

static std::vector<uint8_t> png_bytes(size_t size, uint8_t fill) {
  std::vector<uint8_t> data(size, fill);
  if (size >= 4) {
    data[0] = 0x89;
    data[1] = 'P';
    data[2] = 'N';
    data[3] = 'G';
  }
  return data;
}

// Two 32-bit strikes (20 and 40 ppem), both have images of glyphs 1 and 2, glyph 3 has an image only at 40 ppem.
static void make_two_strikes(tctest::ByteBuilder& cblc, tctest::ByteBuilder& cbdt) {
  make_cblc_cbdt({
    tctest::CbdtStrike{20, 32, 1, { png_bytes(100, 1), png_bytes(110, 2), {} }},
    tctest::CbdtStrike{40, 32, 1, { png_bytes(200, 3), png_bytes(210, 4), png_bytes(220, 5) }}
  }, cblc, cbdt);
}

// tc::OpenType::Tests - StrikeMatcher
// ===================================

TEST(TCOpenTypeImages, StrikeMatcherPrefersExactSize) {
  StrikeMatcher matcher(20);
  EXPECT_FALSE(matcher.found());

  matcher.add(0, 16);
  matcher.add(1, 20);
  matcher.add(2, 21);

  EXPECT_TRUE(matcher.is_exact());
  EXPECT_EQ(matcher.best_index(), 1u);
  EXPECT_EQ(matcher.best_size(), 20u);
}

TEST(TCOpenTypeImages, StrikeMatcherPrefersNearestSize) {
  StrikeMatcher matcher(30);
  matcher.add(0, 16);
  matcher.add(1, 64);
  matcher.add(2, 27);

  EXPECT_FALSE(matcher.is_exact());
  EXPECT_EQ(matcher.best_index(), 2u);
}

TEST(TCOpenTypeImages, StrikeMatcherBreaksTiesTowardLarger) {
  StrikeMatcher a(30);
  a.add(0, 20);
  a.add(1, 40);
  EXPECT_EQ(a.best_size(), 40u);

  StrikeMatcher b(30);
  b.add(0, 40);
  b.add(1, 20);
  EXPECT_EQ(b.best_size(), 40u);
}

// tc::OpenType::Tests - CBLC & CBDT
// =================================

TEST(TCOpenTypeImages, CbdtLookup) {
  tctest::ByteBuilder cblc, cbdt;
  make_two_strikes(cblc, cbdt);

  ImageBundle bundle;
  ASSERT_SUCCESS(CbdtImpl::create_bundle(blob_of(cblc), blob_of(cbdt), &bundle));
  EXPECT_EQ(bundle.kind(), ImageBundleKind::kBitmapStrikes);

  TCBitmapGlyph glyph;
  bool found = false;

  ASSERT_SUCCESS(ImagesImpl::lookup_glyph_image(bundle, 1, 20, TC_BIT_DEPTH_32, &glyph, &found));
  ASSERT_TRUE(found);
  EXPECT_EQ(glyph.source, TC_BITMAP_SOURCE_CBDT);
  EXPECT_EQ(glyph.format, TC_BITMAP_FORMAT_PNG);
  EXPECT_EQ(glyph.bit_depth, 32u);
  EXPECT_EQ(glyph.ppem_x, 20u);
  EXPECT_EQ(glyph.ppem_y, 20u);
  EXPECT_EQ(glyph.width, 20u);
  EXPECT_EQ(glyph.height, 20u);
  EXPECT_TRUE(glyph.has_flag(TC_BITMAP_GLYPH_FLAG_HORI_METRICS));
  EXPECT_FALSE(glyph.has_flag(TC_BITMAP_GLYPH_FLAG_VERT_METRICS));
  EXPECT_EQ(glyph.hori_metrics.bearing_x, 1);
  EXPECT_EQ(glyph.hori_metrics.bearing_y, 18);
  EXPECT_EQ(glyph.hori_metrics.advance, 21u);
  EXPECT_EQ(glyph.data.size, 100u);
  EXPECT_EQ(glyph.data.data[0], 0x89u);
  EXPECT_EQ(glyph.data.data[99], 1u);

  ASSERT_SUCCESS(ImagesImpl::lookup_glyph_image(bundle, 2, 40, TC_BIT_DEPTH_32, &glyph, &found));
  ASSERT_TRUE(found);
  EXPECT_EQ(glyph.ppem_x, 40u);
  EXPECT_EQ(glyph.data.size, 210u);
}

TEST(TCOpenTypeImages, CbdtStrikeSelection) {
  tctest::ByteBuilder cblc, cbdt;
  make_two_strikes(cblc, cbdt);

  ImageBundle bundle;
  ASSERT_SUCCESS(CbdtImpl::create_bundle(blob_of(cblc), blob_of(cbdt), &bundle));

  TCBitmapGlyph glyph;
  bool found = false;

  // Equally distant from both strikes - the larger one wins.
  ASSERT_SUCCESS(ImagesImpl::lookup_glyph_image(bundle, 1, 30, TC_BIT_DEPTH_32, &glyph, &found));
  ASSERT_TRUE(found);
  EXPECT_EQ(glyph.ppem_x, 40u);

  ASSERT_SUCCESS(ImagesImpl::lookup_glyph_image(bundle, 1, 24, TC_BIT_DEPTH_32, &glyph, &found));
  ASSERT_TRUE(found);
  EXPECT_EQ(glyph.ppem_x, 20u);

  // Sizes larger than 255 are clamped, the nearest strike is the largest one.
  ASSERT_SUCCESS(ImagesImpl::lookup_glyph_image(bundle, 1, 1000, TC_BIT_DEPTH_32, &glyph, &found));
  ASSERT_TRUE(found);
  EXPECT_EQ(glyph.ppem_x, 40u);
}

TEST(TCOpenTypeImages, CbdtMissingImage) {
  tctest::ByteBuilder cblc, cbdt;
  make_two_strikes(cblc, cbdt);

  ImageBundle bundle;
  ASSERT_SUCCESS(CbdtImpl::create_bundle(blob_of(cblc), blob_of(cbdt), &bundle));

  TCBitmapGlyph glyph;
  bool found = true;

  // Glyph 3 is covered by the 20 ppem strike, which is an exact match, but it has no image there.
  EXPECT_SUCCESS(ImagesImpl::lookup_glyph_image(bundle, 3, 20, TC_BIT_DEPTH_32, &glyph, &found));
  EXPECT_FALSE(found);

  // Glyphs outside of all strikes.
  found = true;
  EXPECT_SUCCESS(ImagesImpl::lookup_glyph_image(bundle, 0, 20, TC_BIT_DEPTH_32, &glyph, &found));
  EXPECT_FALSE(found);

  found = true;
  EXPECT_SUCCESS(ImagesImpl::lookup_glyph_image(bundle, 4, 40, TC_BIT_DEPTH_32, &glyph, &found));
  EXPECT_FALSE(found);
}

TEST(TCOpenTypeImages, CbdtBitDepthFilter) {
  tctest::ByteBuilder cblc, cbdt;
  make_cblc_cbdt({
    tctest::CbdtStrike{20, 32, 1, { png_bytes(100, 1) }},
    tctest::CbdtStrike{12,  8, 1, { png_bytes(50, 2) }}
  }, cblc, cbdt);

  ImageBundle bundle;
  ASSERT_SUCCESS(CbdtImpl::create_bundle(blob_of(cblc), blob_of(cbdt), &bundle));

  TCBitmapGlyph glyph;
  bool found = false;

  ASSERT_SUCCESS(ImagesImpl::lookup_glyph_image(bundle, 1, 20, TC_BIT_DEPTH_8, &glyph, &found));
  ASSERT_TRUE(found);
  EXPECT_EQ(glyph.ppem_x, 12u);
  EXPECT_EQ(glyph.bit_depth, 8u);
  EXPECT_EQ(glyph.data.size, 50u);

  found = true;
  ASSERT_SUCCESS(ImagesImpl::lookup_glyph_image(bundle, 1, 20, TC_BIT_DEPTH_4, &glyph, &found));
  EXPECT_FALSE(found);
}

TEST(TCOpenTypeImages, CbdtInvalid) {
  tctest::ByteBuilder cblc, cbdt;
  make_two_strikes(cblc, cbdt);

  ImageBundle bundle;

  tctest::ByteBuilder bad_version = cblc;
  bad_version.patch_u16(0, 9);
  EXPECT_EQ(CbdtImpl::create_bundle(blob_of(bad_version), blob_of(cbdt), &bundle), TCResult(TC_ERROR_INVALID_SIGNATURE));

  tctest::ByteBuilder bad_count = cblc;
  bad_count.patch_u32(4, 1000);
  EXPECT_EQ(CbdtImpl::create_bundle(blob_of(bad_count), blob_of(cbdt), &bundle), TCResult(TC_ERROR_DATA_TRUNCATED));

  // Bit depth of the first strike is stored at 8 + 46.
  tctest::ByteBuilder bad_depth = cblc;
  bad_depth._data[54] = 3;
  EXPECT_EQ(CbdtImpl::create_bundle(blob_of(bad_depth), blob_of(cbdt), &bundle), TCResult(TC_ERROR_INVALID_DATA));

  tctest::ByteBuilder bad_array = cblc;
  bad_array.patch_u32(8, 0xFFFFFF00u);
  EXPECT_EQ(CbdtImpl::create_bundle(blob_of(bad_array), blob_of(cbdt), &bundle), TCResult(TC_ERROR_INVALID_DATA));

  tctest::ByteBuilder short_cbdt;
  short_cbdt.u16(3);
  EXPECT_EQ(CbdtImpl::create_bundle(blob_of(cblc), blob_of(short_cbdt), &bundle), TCResult(TC_ERROR_DATA_TRUNCATED));

  EXPECT_TRUE(bundle.is_empty());
}

TEST(TCOpenTypeImages, CbdtImageOutsideOfData) {
  tctest::ByteBuilder cblc, cbdt;
  make_two_strikes(cblc, cbdt);

  // Drop the tail of 'CBDT', which holds images of the 40 ppem strike.
  cbdt._data.resize(cbdt.size() - 100u);

  ImageBundle bundle;
  ASSERT_SUCCESS(CbdtImpl::create_bundle(blob_of(cblc), blob_of(cbdt), &bundle));

  TCBitmapGlyph glyph;
  bool found = false;

  EXPECT_SUCCESS(ImagesImpl::lookup_glyph_image(bundle, 1, 20, TC_BIT_DEPTH_32, &glyph, &found));
  EXPECT_TRUE(found);
  EXPECT_EQ(ImagesImpl::lookup_glyph_image(bundle, 3, 40, TC_BIT_DEPTH_32, &glyph, &found), TCResult(TC_ERROR_INVALID_DATA));
}

// tc::OpenType::Tests - sbix
// ==========================

// Glyph 1 has a PNG image, glyph 2 is a dupe of glyph 1, and glyph 3 is a dupe of glyph 2.
static tctest::ByteBuilder make_dupe_sbix() {
  return tctest::make_sbix({
    tctest::SbixStrike{64, { tctest::SbixGlyph{}, tctest::sbix_png(224), tctest::sbix_dupe(1), tctest::sbix_dupe(2) }}
  });
}

TEST(TCOpenTypeImages, SbixLookup) {
  tctest::ByteBuilder sbix = make_dupe_sbix();

  ImageBundle bundle;
  ASSERT_SUCCESS(SbixImpl::create_bundle(blob_of(sbix), 4, &bundle));
  EXPECT_EQ(bundle.kind(), ImageBundleKind::kFixedSize);

  TCBitmapGlyph glyph;
  bool found = false;

  ASSERT_SUCCESS(ImagesImpl::lookup_glyph_image(bundle, 1, 100, TC_BIT_DEPTH_32, &glyph, &found));
  ASSERT_TRUE(found);
  EXPECT_EQ(glyph.source, TC_BITMAP_SOURCE_SBIX);
  EXPECT_EQ(glyph.format, TC_BITMAP_FORMAT_PNG);
  EXPECT_EQ(glyph.graphic_type, TC_MAKE_TAG('p', 'n', 'g', ' '));
  EXPECT_EQ(glyph.bit_depth, 32u);
  EXPECT_EQ(glyph.ppem_x, 64u);
  EXPECT_TRUE(glyph.has_flag(TC_BITMAP_GLYPH_FLAG_ORIGIN));
  EXPECT_EQ(glyph.origin_x, 0);
  EXPECT_EQ(glyph.origin_y, -2);
  EXPECT_EQ(glyph.data.size, 224u);

  found = true;
  EXPECT_SUCCESS(ImagesImpl::lookup_glyph_image(bundle, 0, 100, TC_BIT_DEPTH_32, &glyph, &found));
  EXPECT_FALSE(found);

  found = true;
  EXPECT_SUCCESS(ImagesImpl::lookup_glyph_image(bundle, 4, 100, TC_BIT_DEPTH_32, &glyph, &found));
  EXPECT_FALSE(found);

  // 'sbix' images are always 32-bit.
  found = true;
  EXPECT_SUCCESS(ImagesImpl::lookup_glyph_image(bundle, 1, 100, TC_BIT_DEPTH_8, &glyph, &found));
  EXPECT_FALSE(found);
}

TEST(TCOpenTypeImages, SbixDupeIsFollowedOnce) {
  tctest::ByteBuilder sbix = make_dupe_sbix();

  ImageBundle bundle;
  ASSERT_SUCCESS(SbixImpl::create_bundle(blob_of(sbix), 4, &bundle));

  TCBitmapGlyph direct;
  TCBitmapGlyph dupe;
  bool found = false;

  ASSERT_SUCCESS(ImagesImpl::lookup_glyph_image(bundle, 1, 100, TC_BIT_DEPTH_32, &direct, &found));
  ASSERT_TRUE(found);

  ASSERT_SUCCESS(ImagesImpl::lookup_glyph_image(bundle, 2, 100, TC_BIT_DEPTH_32, &dupe, &found));
  ASSERT_TRUE(found);
  EXPECT_EQ(dupe.data.size, 224u);
  EXPECT_EQ(dupe.data.data, direct.data.data);

  // A dupe of a dupe is not followed.
  TCBitmapGlyph chained;
  found = true;
  EXPECT_SUCCESS(ImagesImpl::lookup_glyph_image(bundle, 3, 100, TC_BIT_DEPTH_32, &chained, &found));
  EXPECT_FALSE(found);
  EXPECT_TRUE(chained.is_empty());
}

TEST(TCOpenTypeImages, SbixDupeCycle) {
  tctest::ByteBuilder sbix = tctest::make_sbix({
    tctest::SbixStrike{32, { tctest::SbixGlyph{}, tctest::sbix_dupe(2), tctest::sbix_dupe(1) }}
  });

  ImageBundle bundle;
  ASSERT_SUCCESS(SbixImpl::create_bundle(blob_of(sbix), 3, &bundle));

  TCBitmapGlyph glyph;
  bool found = true;
  EXPECT_SUCCESS(ImagesImpl::lookup_glyph_image(bundle, 1, 32, TC_BIT_DEPTH_32, &glyph, &found));
  EXPECT_FALSE(found);
}

TEST(TCOpenTypeImages, SbixStrikeSelection) {
  // Glyph 1 only has data in the 96 ppem strike, glyph 2 in both.
  tctest::ByteBuilder sbix = tctest::make_sbix({
    tctest::SbixStrike{32, { tctest::SbixGlyph{}, tctest::SbixGlyph{}, tctest::sbix_png(10) }},
    tctest::SbixStrike{96, { tctest::SbixGlyph{}, tctest::sbix_png(30), tctest::sbix_png(31) }}
  });

  ImageBundle bundle;
  ASSERT_SUCCESS(SbixImpl::create_bundle(blob_of(sbix), 3, &bundle));

  TCBitmapGlyph glyph;
  bool found = false;

  ASSERT_SUCCESS(ImagesImpl::lookup_glyph_image(bundle, 1, 32, TC_BIT_DEPTH_32, &glyph, &found));
  ASSERT_TRUE(found);
  EXPECT_EQ(glyph.ppem_x, 96u);
  EXPECT_EQ(glyph.data.size, 30u);

  ASSERT_SUCCESS(ImagesImpl::lookup_glyph_image(bundle, 2, 40, TC_BIT_DEPTH_32, &glyph, &found));
  ASSERT_TRUE(found);
  EXPECT_EQ(glyph.ppem_x, 32u);
  EXPECT_EQ(glyph.data.size, 10u);
}

TEST(TCOpenTypeImages, SbixInvalid) {
  ImageBundle bundle;

  tctest::ByteBuilder bad_version = make_dupe_sbix();
  bad_version.patch_u16(0, 2);
  EXPECT_EQ(SbixImpl::create_bundle(blob_of(bad_version), 4, &bundle), TCResult(TC_ERROR_INVALID_SIGNATURE));

  tctest::ByteBuilder bad_count = make_dupe_sbix();
  bad_count.patch_u32(4, 100);
  EXPECT_EQ(SbixImpl::create_bundle(blob_of(bad_count), 4, &bundle), TCResult(TC_ERROR_DATA_TRUNCATED));

  tctest::ByteBuilder bad_offset = make_dupe_sbix();
  bad_offset.patch_u32(8, 0x10000u);
  EXPECT_EQ(SbixImpl::create_bundle(blob_of(bad_offset), 4, &bundle), TCResult(TC_ERROR_INVALID_DATA));

  // The strike cannot hold offsets of that many glyphs.
  EXPECT_EQ(SbixImpl::create_bundle(blob_of(make_dupe_sbix()), 1000, &bundle), TCResult(TC_ERROR_INVALID_DATA));

  EXPECT_TRUE(bundle.is_empty());
}

TEST(TCOpenTypeImages, SbixTruncatedDupe) {
  tctest::ByteBuilder sbix = tctest::make_sbix({
    tctest::SbixStrike{32, { tctest::SbixGlyph{}, tctest::SbixGlyph{TC_MAKE_TAG('d', 'u', 'p', 'e'), {0x00}} }}
  });

  ImageBundle bundle;
  ASSERT_SUCCESS(SbixImpl::create_bundle(blob_of(sbix), 2, &bundle));

  TCBitmapGlyph glyph;
  bool found = false;
  EXPECT_EQ(ImagesImpl::lookup_glyph_image(bundle, 1, 32, TC_BIT_DEPTH_32, &glyph, &found), TCResult(TC_ERROR_DATA_TRUNCATED));
}

// tc::OpenType::Tests - SVG
// =========================

TEST(TCOpenTypeImages, SvgLookup) {
  static const uint8_t gzip_document[] = { 0x1F, 0x8B, 0x08, 0x00, 0x00, 0x00 };

  tctest::ByteBuilder svg = tctest::make_svg({
    tctest::SvgDocument{1, 2, tctest::svg_text("<svg id=\"a\"/>")},
    tctest::SvgDocument{5, 5, std::vector<uint8_t>(gzip_document, gzip_document + sizeof(gzip_document))}
  });

  ImageBundle bundle;
  ASSERT_SUCCESS(SvgImpl::create_bundle(blob_of(svg), &bundle));
  EXPECT_EQ(bundle.kind(), ImageBundleKind::kVector);

  TCBitmapGlyph glyph;
  bool found = false;

  // Size and bit depth don't apply to SVG documents.
  ASSERT_SUCCESS(ImagesImpl::lookup_glyph_image(bundle, 2, 1, TC_BIT_DEPTH_1, &glyph, &found));
  ASSERT_TRUE(found);
  EXPECT_EQ(glyph.source, TC_BITMAP_SOURCE_SVG);
  EXPECT_EQ(glyph.format, TC_BITMAP_FORMAT_SVG);
  EXPECT_EQ(std::string(reinterpret_cast<const char*>(glyph.data.data), glyph.data.size), "<svg id=\"a\"/>");

  ASSERT_SUCCESS(ImagesImpl::lookup_glyph_image(bundle, 5, 0, TC_BIT_DEPTH_32, &glyph, &found));
  ASSERT_TRUE(found);
  EXPECT_EQ(glyph.format, TC_BITMAP_FORMAT_SVGZ);
  EXPECT_EQ(glyph.data.size, sizeof(gzip_document));

  for (TCGlyphId glyph_id : { 0u, 3u, 4u, 6u }) {
    found = true;
    EXPECT_SUCCESS(ImagesImpl::lookup_glyph_image(bundle, glyph_id, 0, TC_BIT_DEPTH_32, &glyph, &found));
    EXPECT_FALSE(found);
  }
}

TEST(TCOpenTypeImages, SvgInvalid) {
  tctest::ByteBuilder svg = tctest::make_svg({ tctest::SvgDocument{1, 1, tctest::svg_text("<svg/>")} });
  ImageBundle bundle;

  tctest::ByteBuilder bad_version = svg;
  bad_version.patch_u16(0, 1);
  EXPECT_EQ(SvgImpl::create_bundle(blob_of(bad_version), &bundle), TCResult(TC_ERROR_INVALID_SIGNATURE));

  tctest::ByteBuilder bad_list = svg;
  bad_list.patch_u32(2, 4);
  EXPECT_EQ(SvgImpl::create_bundle(blob_of(bad_list), &bundle), TCResult(TC_ERROR_INVALID_DATA));

  tctest::ByteBuilder bad_count = svg;
  bad_count.patch_u16(10, 50);
  EXPECT_EQ(SvgImpl::create_bundle(blob_of(bad_count), &bundle), TCResult(TC_ERROR_DATA_TRUNCATED));

  // A document that points outside of the table is only detected by a lookup.
  tctest::ByteBuilder bad_document = svg;
  bad_document.patch_u32(16, 1000);
  ASSERT_SUCCESS(SvgImpl::create_bundle(blob_of(bad_document), &bundle));

  TCBitmapGlyph glyph;
  bool found = false;
  EXPECT_EQ(ImagesImpl::lookup_glyph_image(bundle, 1, 0, TC_BIT_DEPTH_32, &glyph, &found), TCResult(TC_ERROR_INVALID_DATA));
}

// tc::OpenType::Tests - Loading
// =============================

static TCResult load_font_images(const tctest::FontBuilder& fb, ImageBundle& bundle, bool& present) {
  TCFontData font_data;
  TC_PROPAGATE(fb.build_font_data(font_data));

  FontTableProvider provider(font_data, 0);
  return ImagesImpl::load_images(provider, 4, bundle, present);
}

TEST(TCOpenTypeImages, LoadPrefersBitmapStrikes) {
  tctest::ByteBuilder cblc, cbdt;
  make_two_strikes(cblc, cbdt);

  tctest::FontBuilder fb = tctest::make_basic_font(4, {});
  fb.add_table(TC_FONT_TABLE_TAG_CBLC, cblc)
    .add_table(TC_FONT_TABLE_TAG_CBDT, cbdt)
    .add_table(TC_FONT_TABLE_TAG_SBIX, make_dupe_sbix());

  ImageBundle bundle;
  bool present = false;
  ASSERT_SUCCESS(load_font_images(fb, bundle, present));
  ASSERT_TRUE(present);
  EXPECT_EQ(bundle.kind(), ImageBundleKind::kBitmapStrikes);

  // The bundle keeps the font data alive.
  TCBitmapGlyph glyph;
  bool found = false;
  ASSERT_SUCCESS(ImagesImpl::lookup_glyph_image(bundle, 2, 20, TC_BIT_DEPTH_32, &glyph, &found));
  ASSERT_TRUE(found);
  EXPECT_EQ(glyph.data.size, 110u);
  EXPECT_FALSE(glyph._font_data.is_empty());
}

TEST(TCOpenTypeImages, LoadFallsBackToSbix) {
  tctest::ByteBuilder cblc, cbdt;
  make_two_strikes(cblc, cbdt);
  cblc.patch_u16(0, 9);

  // Invalid 'CBLC'.
  {
    tctest::FontBuilder fb = tctest::make_basic_font(4, {});
    fb.add_table(TC_FONT_TABLE_TAG_CBLC, cblc)
      .add_table(TC_FONT_TABLE_TAG_CBDT, cbdt)
      .add_table(TC_FONT_TABLE_TAG_SBIX, make_dupe_sbix());

    ImageBundle bundle;
    bool present = false;
    ASSERT_SUCCESS(load_font_images(fb, bundle, present));
    ASSERT_TRUE(present);
    EXPECT_EQ(bundle.kind(), ImageBundleKind::kFixedSize);
  }

  // Missing 'CBDT'.
  {
    tctest::FontBuilder fb = tctest::make_basic_font(4, {});
    fb.add_table(TC_FONT_TABLE_TAG_CBLC, cblc)
      .add_table(TC_FONT_TABLE_TAG_SBIX, make_dupe_sbix());

    ImageBundle bundle;
    bool present = false;
    ASSERT_SUCCESS(load_font_images(fb, bundle, present));
    ASSERT_TRUE(present);
    EXPECT_EQ(bundle.kind(), ImageBundleKind::kFixedSize);
  }
}

TEST(TCOpenTypeImages, LoadWithoutImages) {
  tctest::FontBuilder fb = tctest::make_basic_font(4, {});

  // 'SVG ' alone is never loaded.
  fb.add_table(TC_FONT_TABLE_TAG_SVG, tctest::make_svg({ tctest::SvgDocument{1, 1, tctest::svg_text("<svg/>")} }));

  ImageBundle bundle;
  bool present = true;
  ASSERT_SUCCESS(load_font_images(fb, bundle, present));
  EXPECT_FALSE(present);
  EXPECT_TRUE(bundle.is_empty());
}

TEST(TCOpenTypeImages, LoadInvalidSbix) {
  tctest::ByteBuilder sbix = make_dupe_sbix();
  sbix.patch_u16(0, 7);

  tctest::FontBuilder fb = tctest::make_basic_font(4, {});
  fb.add_table(TC_FONT_TABLE_TAG_SBIX, sbix);

  ImageBundle bundle;
  bool present = false;
  EXPECT_EQ(load_font_images(fb, bundle, present), TCResult(TC_ERROR_INVALID_SIGNATURE));
  EXPECT_TRUE(bundle.is_empty());
}

} // {Tests}
} // {tc::OpenType}

#endif // TC_TEST
