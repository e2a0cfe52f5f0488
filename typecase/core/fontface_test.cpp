// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <typecase/core/api-build_test_p.h>
#if defined(TC_TEST)

#include <typecase/core/fontface_p.h>
#include <commons/fontbuilder.h>

namespace tc {
namespace Tests {

using tctest::ByteBuilder;
using tctest::CMapRecord;
using tctest::FontBuilder;

static FontBuilder make_font() {
  return tctest::make_basic_font(4, { {0x41u, 1u}, {0x42u, 2u}, {0x43u, 3u} });
}

static TCResult create_face(const FontBuilder& fb, TCFontFace& face) {
  TCFontData font_data;
  TC_PROPAGATE(fb.build_font_data(font_data));
  return face.create_from_data(font_data, 0);
}

static std::vector<uint8_t> png_bytes(size_t size, uint8_t fill) {
  std::vector<uint8_t> data(size, fill);
  data[0] = 0x89;
  data[1] = 'P';
  data[2] = 'N';
  data[3] = 'G';
  return data;
}

// 'sbix' with a single 20 ppem strike: glyph 1 has an image, glyph 2 duplicates glyph 1, and glyph 3 duplicates
// glyph 2.
static ByteBuilder make_dupe_sbix() {
  return tctest::make_sbix({
    tctest::SbixStrike{20, { tctest::SbixGlyph{0, {}}, tctest::sbix_png(64), tctest::sbix_dupe(1), tctest::sbix_dupe(2) }}
  });
}

static TCResult TC_CDECL collect_glyph_name(size_t index, TCGlyphId glyph_id, const char* name, size_t name_size, void* user_data) noexcept {
  tc_unused(glyph_id);

  std::vector<std::string>* names = static_cast<std::vector<std::string>*>(user_data);
  EXPECT_EQ(index, names->size());
  EXPECT_EQ(strlen(name), name_size);
  names->emplace_back(name, name_size);
  return TC_SUCCESS;
}

static TCResult get_glyph_names(const TCFontFace& face, const TCGlyphId* glyph_ids, size_t count, std::vector<std::string>& out) {
  out.clear();
  return face.glyph_names(glyph_ids, count, collect_glyph_name, &out);
}

// tc::FontFace - Tests - Construction
// ===================================

TEST(TCFontFace, Create) {
  TCFontFace face;
  ASSERT_SUCCESS(create_face(make_font(), face));
  ASSERT_FALSE(face.is_empty());

  EXPECT_EQ(face.face_index(), 0u);
  EXPECT_EQ(face.font_data().face_count(), 1u);
  EXPECT_EQ(face.glyph_count(), 4u);
  EXPECT_EQ(face.char_encoding(), TC_CHAR_ENCODING_UNICODE);
  EXPECT_EQ(face.outline_format(), TC_OUTLINE_FORMAT_NONE);

  TCFontMetricsHeader hhea = face.horizontal_header();
  EXPECT_EQ(hhea.ascender, 800);
  EXPECT_EQ(hhea.descender, -200);
  EXPECT_EQ(hhea.long_metric_count, 4u);
}

TEST(TCFontFace, CreateWithoutUsableCharacterMap) {
  // Neither Macintosh Japanese nor ISO encodings are supported.
  FontBuilder fb = make_font();
  fb.add_table(TC_FONT_TABLE_TAG_CMAP, tctest::make_cmap({
    CMapRecord{1, 1, tctest::make_cmap_format0({ {0x41u, 1u} })},
    CMapRecord{2, 1, tctest::make_cmap_format0({ {0x41u, 1u} })}
  }));

  TCFontFace face;
  EXPECT_SUCCESS(create_face(fb, face));
  EXPECT_TRUE(face.is_empty());
  EXPECT_EQ(face.glyph_count(), 0u);
  EXPECT_EQ(face.lookup_glyph_index(0x41u), 0u);
}

TEST(TCFontFace, CreateWithoutRequiredTables) {
  static const TCTag required_tags[] = {
    TC_FONT_TABLE_TAG_CMAP,
    TC_FONT_TABLE_TAG_MAXP,
    TC_FONT_TABLE_TAG_HHEA,
    TC_FONT_TABLE_TAG_HMTX
  };

  for (TCTag tag : required_tags) {
    FontBuilder fb = make_font();
    fb.remove_table(tag);

    TCFontFace face;
    EXPECT_EQ(create_face(fb, face), TCResult(TC_ERROR_FONT_MISSING_TABLE));
    EXPECT_TRUE(face.is_empty());
  }
}

TEST(TCFontFace, CreateWithMalformedTables) {
  {
    FontBuilder fb = make_font();
    fb.add_table(TC_FONT_TABLE_TAG_MAXP, ByteBuilder().u32(0x00005000u));

    TCFontFace face;
    EXPECT_EQ(create_face(fb, face), TCResult(TC_ERROR_DATA_TRUNCATED));
    EXPECT_TRUE(face.is_empty());
  }

  {
    FontBuilder fb = make_font();
    fb.add_table(TC_FONT_TABLE_TAG_HHEA, ByteBuilder().u32(0x00010000u).zeros(8));

    TCFontFace face;
    EXPECT_EQ(create_face(fb, face), TCResult(TC_ERROR_DATA_TRUNCATED));
    EXPECT_TRUE(face.is_empty());
  }

  {
    // Encoding record points past the end of 'cmap'.
    ByteBuilder cmap;
    cmap.u16(0).u16(1).u16(3).u16(1).u32(100);

    FontBuilder fb = make_font();
    fb.add_table(TC_FONT_TABLE_TAG_CMAP, cmap);

    TCFontFace face;
    EXPECT_EQ(create_face(fb, face), TCResult(TC_ERROR_INVALID_DATA));
    EXPECT_TRUE(face.is_empty());
  }
}

static void TC_CDECL count_external_data_release(void* impl, void* external_data, void* user_data) noexcept {
  (void)impl;
  (void)external_data;
  (*static_cast<uint32_t*>(user_data))++;
}

TEST(TCFontFace, CreateFailureReleasesFontData) {
  FontBuilder fb = make_font();
  fb.add_table(TC_FONT_TABLE_TAG_MAXP, ByteBuilder().u32(0x00005000u));

  std::vector<uint8_t> data = fb.build();
  uint32_t release_count = 0;

  {
    TCFontData font_data;
    ASSERT_SUCCESS(font_data.create_from_data(data.data(), data.size(), count_external_data_release, &release_count));

    TCFontFace face;
    EXPECT_EQ(face.create_from_data(font_data, 0), TCResult(TC_ERROR_DATA_TRUNCATED));
    EXPECT_TRUE(face.is_empty());

    // The face must not keep a reference to the data after a failed construction.
    font_data.reset();
    EXPECT_EQ(release_count, 1u);
  }

  EXPECT_EQ(release_count, 1u);
}

TEST(TCFontFace, FaceKeepsFontDataAlive) {
  std::vector<uint8_t> data = make_font().build();
  uint32_t release_count = 0;

  TCFontFace face;
  {
    TCFontData font_data;
    ASSERT_SUCCESS(font_data.create_from_data(data.data(), data.size(), count_external_data_release, &release_count));
    ASSERT_SUCCESS(face.create_from_data(font_data, 0));
  }

  EXPECT_EQ(release_count, 0u);
  EXPECT_EQ(face.lookup_glyph_index(0x41u), 1u);

  face.reset();
  EXPECT_EQ(release_count, 1u);
}

TEST(TCFontFace, CreateWithInvalidArguments) {
  TCFontFace face;
  EXPECT_EQ(face.create_from_data(TCFontData{}, 0), TCResult(TC_ERROR_FONT_NOT_INITIALIZED));

  TCFontData font_data;
  ASSERT_SUCCESS(make_font().build_font_data(font_data));
  EXPECT_EQ(face.create_from_data(font_data, 1), TCResult(TC_ERROR_INVALID_VALUE));
  EXPECT_TRUE(face.is_empty());
}

TEST(TCFontFace, OutlineFormat) {
  static const uint8_t dummy[] = { 0, 1, 2, 3 };
  std::vector<uint8_t> data(dummy, dummy + sizeof(dummy));

  struct Case {
    std::vector<TCTag> tags;
    TCOutlineFormat expected;
  };

  const Case cases[] = {
    { { TC_FONT_TABLE_TAG_GLYF }, TC_OUTLINE_FORMAT_GLYF },
    { { TC_FONT_TABLE_TAG_CFF }, TC_OUTLINE_FORMAT_CFF },
    { { TC_FONT_TABLE_TAG_GLYF, TC_FONT_TABLE_TAG_CFF }, TC_OUTLINE_FORMAT_GLYF },
    { { TC_FONT_TABLE_TAG_GLYF, TC_FONT_TABLE_TAG_SBIX }, TC_OUTLINE_FORMAT_NONE },
    { { TC_FONT_TABLE_TAG_CFF, TC_FONT_TABLE_TAG_SVG }, TC_OUTLINE_FORMAT_NONE },
    { { TC_FONT_TABLE_TAG_CBDT }, TC_OUTLINE_FORMAT_NONE }
  };

  for (const Case& c : cases) {
    FontBuilder fb = make_font();
    for (TCTag tag : c.tags)
      fb.add_table(tag, data);

    TCFontFace face;
    ASSERT_SUCCESS(create_face(fb, face));
    EXPECT_EQ(face.outline_format(), c.expected);
  }
}

TEST(TCFontFace, Move) {
  TCFontFace a;
  ASSERT_SUCCESS(create_face(make_font(), a));

  TCFontFace b(std::move(a));
  EXPECT_TRUE(a.is_empty());
  EXPECT_EQ(b.lookup_glyph_index(0x42u), 2u);

  TCFontFace c;
  c = std::move(b);
  EXPECT_TRUE(b.is_empty());
  EXPECT_EQ(c.lookup_glyph_index(0x43u), 3u);

  c.reset();
  EXPECT_TRUE(c.is_empty());
}

TEST(TCFontFace, EmptyFace) {
  TCFontFace face;

  uint32_t advance = 0;
  EXPECT_EQ(face.lookup_glyph_index(0x41u), 0u);
  EXPECT_FALSE(face.horizontal_advance(1, &advance));
  EXPECT_FALSE(face.vertical_advance(1, &advance));
  EXPECT_FALSE(face.supports_emoji());

  TCGDefTable gdef;
  TCLayoutCache gsub;
  TCBitmapGlyph glyph;
  std::vector<std::string> names;

  EXPECT_EQ(face.gdef_table(&gdef), TCResult(TC_ERROR_FONT_NOT_INITIALIZED));
  EXPECT_EQ(face.gsub_cache(&gsub), TCResult(TC_ERROR_FONT_NOT_INITIALIZED));
  EXPECT_EQ(face.lookup_glyph_image(1, 20, TC_BIT_DEPTH_32, &glyph), TCResult(TC_ERROR_FONT_NOT_INITIALIZED));
  EXPECT_EQ(get_glyph_names(face, nullptr, 0, names), TCResult(TC_ERROR_FONT_NOT_INITIALIZED));
}

// tc::FontFace - Tests - Characters & Metrics
// ===========================================

TEST(TCFontFace, LookupGlyphIndex) {
  TCFontFace face;
  ASSERT_SUCCESS(create_face(make_font(), face));

  EXPECT_EQ(face.lookup_glyph_index(0x41u), 1u);
  EXPECT_EQ(face.lookup_glyph_index(0x43u), 3u);
  EXPECT_EQ(face.lookup_glyph_index(0x44u), 0u);
  EXPECT_EQ(face.lookup_glyph_index(0x1F600u), 0u);
}

TEST(TCFontFace, LookupGlyphIndexWithMalformedSubTable) {
  // Format 4 sub-table that is too short, the face is usable, but doesn't map anything.
  ByteBuilder sub_table;
  sub_table.u16(4).u16(6).u16(0);

  FontBuilder fb = make_font();
  fb.add_table(TC_FONT_TABLE_TAG_CMAP, tctest::make_cmap({ CMapRecord{3, 1, sub_table} }));

  TCFontFace face;
  ASSERT_SUCCESS(create_face(fb, face));
  ASSERT_FALSE(face.is_empty());
  EXPECT_EQ(face.lookup_glyph_index(0x41u), 0u);
}

TEST(TCFontFace, HorizontalAdvance) {
  TCFontFace face;
  ASSERT_SUCCESS(create_face(make_font(), face));

  uint32_t advance = 0;
  ASSERT_TRUE(face.horizontal_advance(2, &advance));
  EXPECT_EQ(advance, 520u);

  ASSERT_TRUE(face.horizontal_advance(0, &advance));
  EXPECT_EQ(advance, 500u);

  EXPECT_FALSE(face.horizontal_advance(4, &advance));
  EXPECT_FALSE(face.horizontal_advance(1000, &advance));
}

TEST(TCFontFace, HorizontalAdvanceWithTruncatedMetrics) {
  FontBuilder fb = make_font();
  fb.add_table(TC_FONT_TABLE_TAG_HMTX, tctest::make_hmtx({ {500u, 0} }));

  TCFontFace face;
  ASSERT_SUCCESS(create_face(fb, face));

  // 'hhea' declares 4 long metrics, which 'hmtx' doesn't have.
  uint32_t advance = 0;
  EXPECT_FALSE(face.horizontal_advance(0, &advance));
  EXPECT_FALSE(face.horizontal_advance(3, &advance));
}

TEST(TCFontFace, VerticalAdvance) {
  FontBuilder fb = make_font();
  fb.add_table(TC_FONT_TABLE_TAG_VHEA, tctest::make_hhea(500, -500, 0, 2, 0x00011000u))
    .add_table(TC_FONT_TABLE_TAG_VMTX, tctest::make_hmtx({ {1000u, 100}, {900u, 110} }, { 120, 130 }));

  TCFontFace face;
  ASSERT_SUCCESS(create_face(fb, face));

  uint32_t advance = 0;
  ASSERT_TRUE(face.vertical_advance(1, &advance));
  EXPECT_EQ(advance, 900u);

  // Glyphs after the last long metric share its advance.
  ASSERT_TRUE(face.vertical_advance(3, &advance));
  EXPECT_EQ(advance, 900u);

  EXPECT_FALSE(face.vertical_advance(4, &advance));

  TCFontMetricsHeader vhea {};
  bool present = false;
  ASSERT_SUCCESS(face.vertical_header(&vhea, &present));
  EXPECT_TRUE(present);
  EXPECT_EQ(vhea.version, 0x00011000u);
  EXPECT_EQ(vhea.long_metric_count, 2u);
}

TEST(TCFontFace, VerticalAdvanceRequiresBothTables) {
  {
    FontBuilder fb = make_font();
    fb.add_table(TC_FONT_TABLE_TAG_VHEA, tctest::make_hhea(500, -500, 0, 1));

    TCFontFace face;
    ASSERT_SUCCESS(create_face(fb, face));

    uint32_t advance = 0;
    EXPECT_FALSE(face.vertical_advance(0, &advance));
    EXPECT_EQ(face._impl->vmtx.state(), LazyLoadState::kLoadedAbsent);
  }

  {
    FontBuilder fb = make_font();
    fb.add_table(TC_FONT_TABLE_TAG_VMTX, tctest::make_hmtx({ {1000u, 100} }));

    TCFontFace face;
    ASSERT_SUCCESS(create_face(fb, face));

    uint32_t advance = 0;
    EXPECT_FALSE(face.vertical_advance(0, &advance));
    EXPECT_EQ(face._impl->vhea.state(), LazyLoadState::kLoadedAbsent);

    TCFontMetricsHeader vhea {};
    bool present = true;
    ASSERT_SUCCESS(face.vertical_header(&vhea, &present));
    EXPECT_FALSE(present);
  }
}

// tc::FontFace - Tests - Tables
// =============================

TEST(TCFontFace, HeadAndOS2Tables) {
  ByteBuilder os2;
  os2.u16(0).i16(480).u16(700).u16(5).zeros(60);

  FontBuilder fb = make_font();
  fb.add_table(TC_FONT_TABLE_TAG_HEAD, tctest::make_head(2048))
    .add_table(TC_FONT_TABLE_TAG_OS2, os2);

  TCFontFace face;
  ASSERT_SUCCESS(create_face(fb, face));

  TCFontHeadInfo head {};
  bool present = false;
  ASSERT_SUCCESS(face.head_table(&head, &present));
  EXPECT_TRUE(present);
  EXPECT_EQ(head.units_per_em, 2048u);

  TCFontOS2Info os2_info {};
  ASSERT_SUCCESS(face.os2_table(&os2_info, &present));
  EXPECT_TRUE(present);
  EXPECT_EQ(os2_info.version, 0u);
  EXPECT_EQ(os2_info.x_avg_char_width, 480);
  EXPECT_EQ(os2_info.weight_class, 700u);
  EXPECT_EQ(os2_info.width_class, 5u);
}

TEST(TCFontFace, HeadAndOS2TablesMissingOrMalformed) {
  {
    TCFontFace face;
    ASSERT_SUCCESS(create_face(make_font(), face));

    TCFontHeadInfo head {};
    TCFontOS2Info os2 {};
    bool present = true;

    ASSERT_SUCCESS(face.head_table(&head, &present));
    EXPECT_FALSE(present);

    present = true;
    ASSERT_SUCCESS(face.os2_table(&os2, &present));
    EXPECT_FALSE(present);
  }

  {
    FontBuilder fb = make_font();
    fb.add_table(TC_FONT_TABLE_TAG_HEAD, ByteBuilder().u32(0x00010000u));
    fb.add_table(TC_FONT_TABLE_TAG_OS2, ByteBuilder().u16(2).zeros(80));

    TCFontFace face;
    ASSERT_SUCCESS(create_face(fb, face));

    TCFontHeadInfo head {};
    TCFontOS2Info os2 {};
    bool present = true;

    EXPECT_EQ(face.head_table(&head, &present), TCResult(TC_ERROR_DATA_TRUNCATED));
    EXPECT_FALSE(present);
    EXPECT_EQ(face.os2_table(&os2, &present), TCResult(TC_ERROR_DATA_TRUNCATED));
    EXPECT_FALSE(present);
  }
}

TEST(TCFontFace, LayoutTablesAreCached) {
  ByteBuilder gdef;
  gdef.u32(0x00010000u).u16(0).u16(0).u16(0).u16(0);

  ByteBuilder gsub;
  gsub.u32(0x00010000u).u16(0).u16(0).u16(0);

  FontBuilder fb = make_font();
  fb.add_table(TC_FONT_TABLE_TAG_GDEF, gdef)
    .add_table(TC_FONT_TABLE_TAG_GSUB, gsub);

  TCFontFace face;
  ASSERT_SUCCESS(create_face(fb, face));

  TCGDefTable gdef1, gdef2;
  ASSERT_SUCCESS(face.gdef_table(&gdef1));
  ASSERT_SUCCESS(face.gdef_table(&gdef2));
  EXPECT_FALSE(gdef1.is_empty());
  EXPECT_EQ(gdef1, gdef2);
  EXPECT_EQ(gdef1.version(), 0x00010000u);

  TCLayoutCache gsub1, gsub2;
  ASSERT_SUCCESS(face.gsub_cache(&gsub1));
  ASSERT_SUCCESS(face.gsub_cache(&gsub2));
  EXPECT_FALSE(gsub1.is_empty());
  EXPECT_EQ(gsub1, gsub2);
  EXPECT_EQ(gsub1.kind(), TC_LAYOUT_KIND_GSUB);

  // Absence is cached as well.
  TCLayoutCache gpos;
  ASSERT_SUCCESS(face.gpos_cache(&gpos));
  EXPECT_TRUE(gpos.is_empty());
  EXPECT_EQ(face._impl->gpos.state(), LazyLoadState::kLoadedAbsent);

  ASSERT_SUCCESS(face.gpos_cache(&gpos));
  EXPECT_TRUE(gpos.is_empty());

  // Cached objects keep their data after the face is destroyed.
  face.reset();
  EXPECT_EQ(gdef1.version(), 0x00010000u);
  EXPECT_EQ(gsub1.table().size, gsub.size());
}

TEST(TCFontFace, MalformedLayoutTableIsNotCached) {
  ByteBuilder gdef;
  gdef.u32(0x00020000u).u16(0).u16(0).u16(0).u16(0);

  FontBuilder fb = make_font();
  fb.add_table(TC_FONT_TABLE_TAG_GDEF, gdef)
    .add_table(TC_FONT_TABLE_TAG_GPOS, ByteBuilder().u32(0x00010000u));

  TCFontFace face;
  ASSERT_SUCCESS(create_face(fb, face));

  TCGDefTable gdef_table;
  EXPECT_EQ(face.gdef_table(&gdef_table), TCResult(TC_ERROR_INVALID_SIGNATURE));
  EXPECT_TRUE(gdef_table.is_empty());
  EXPECT_EQ(face._impl->gdef.state(), LazyLoadState::kNotLoaded);

  // The next access tries again and fails the same way.
  EXPECT_EQ(face.gdef_table(&gdef_table), TCResult(TC_ERROR_INVALID_SIGNATURE));
  EXPECT_EQ(face._impl->gdef.state(), LazyLoadState::kNotLoaded);

  TCLayoutCache gpos;
  EXPECT_EQ(face.gpos_cache(&gpos), TCResult(TC_ERROR_DATA_TRUNCATED));
  EXPECT_EQ(face._impl->gpos.state(), LazyLoadState::kNotLoaded);
}

// tc::FontFace - Tests - Embedded Images
// ======================================

TEST(TCFontFace, EmbeddedImagesPreferBitmapStrikes) {
  ByteBuilder cblc, cbdt;
  tctest::make_cblc_cbdt({ tctest::CbdtStrike{20, 32, 1, { png_bytes(100, 1), png_bytes(150, 2) }} }, cblc, cbdt);

  FontBuilder fb = make_font();
  fb.add_table(TC_FONT_TABLE_TAG_CBLC, cblc)
    .add_table(TC_FONT_TABLE_TAG_CBDT, cbdt)
    .add_table(TC_FONT_TABLE_TAG_SBIX, make_dupe_sbix());

  TCFontFace face;
  ASSERT_SUCCESS(create_face(fb, face));
  EXPECT_TRUE(face.supports_emoji());

  TCBitmapGlyph glyph;
  ASSERT_SUCCESS(face.lookup_glyph_image(1, 20, TC_BIT_DEPTH_32, &glyph));
  ASSERT_FALSE(glyph.is_empty());
  EXPECT_EQ(glyph.source, TC_BITMAP_SOURCE_CBDT);
  EXPECT_EQ(glyph.format, TC_BITMAP_FORMAT_PNG);
  EXPECT_EQ(glyph.data.size, 100u);

  // Glyph 2 is a 'dupe' in 'sbix', but 'sbix' is never consulted.
  ASSERT_SUCCESS(face.lookup_glyph_image(2, 20, TC_BIT_DEPTH_32, &glyph));
  ASSERT_FALSE(glyph.is_empty());
  EXPECT_EQ(glyph.source, TC_BITMAP_SOURCE_CBDT);
  EXPECT_EQ(glyph.data.size, 150u);

  // Sizes above 255 are clamped to the largest strike size.
  ASSERT_SUCCESS(face.lookup_glyph_image(1, 1000, TC_BIT_DEPTH_32, &glyph));
  EXPECT_EQ(glyph.ppem_x, 20u);

  // No image of glyph 3 and no strike of 8-bit depth.
  ASSERT_SUCCESS(face.lookup_glyph_image(3, 20, TC_BIT_DEPTH_32, &glyph));
  EXPECT_TRUE(glyph.is_empty());

  ASSERT_SUCCESS(face.lookup_glyph_image(1, 20, TC_BIT_DEPTH_8, &glyph));
  EXPECT_TRUE(glyph.is_empty());
}

TEST(TCFontFace, EmbeddedImagesSbixDupe) {
  FontBuilder fb = make_font();
  fb.add_table(TC_FONT_TABLE_TAG_SBIX, make_dupe_sbix());

  TCFontFace face;
  ASSERT_SUCCESS(create_face(fb, face));
  EXPECT_TRUE(face.supports_emoji());
  EXPECT_EQ(face.outline_format(), TC_OUTLINE_FORMAT_NONE);

  TCBitmapGlyph direct;
  ASSERT_SUCCESS(face.lookup_glyph_image(1, 20, TC_BIT_DEPTH_32, &direct));
  ASSERT_FALSE(direct.is_empty());
  EXPECT_EQ(direct.source, TC_BITMAP_SOURCE_SBIX);

  // Glyph 2 resolves to the image of glyph 1.
  TCBitmapGlyph dupe;
  ASSERT_SUCCESS(face.lookup_glyph_image(2, 20, TC_BIT_DEPTH_32, &dupe));
  ASSERT_FALSE(dupe.is_empty());
  EXPECT_EQ(dupe.data.size, direct.data.size);
  EXPECT_EQ(memcmp(dupe.data.data, direct.data.data, direct.data.size), 0);

  // Glyph 3 duplicates a duplicate, which is not followed.
  TCBitmapGlyph chained;
  ASSERT_SUCCESS(face.lookup_glyph_image(3, 20, TC_BIT_DEPTH_32, &chained));
  EXPECT_TRUE(chained.is_empty());
}

TEST(TCFontFace, EmbeddedImagesMissing) {
  TCFontFace face;
  ASSERT_SUCCESS(create_face(make_font(), face));

  EXPECT_FALSE(face.supports_emoji());
  EXPECT_EQ(face._impl->images.state(), LazyLoadState::kLoadedAbsent);

  TCBitmapGlyph glyph;
  ASSERT_SUCCESS(face.lookup_glyph_image(1, 20, TC_BIT_DEPTH_32, &glyph));
  EXPECT_TRUE(glyph.is_empty());
}

TEST(TCFontFace, EmbeddedImagesMalformedSbix) {
  ByteBuilder sbix = make_dupe_sbix();
  sbix.patch_u16(0, 2);

  FontBuilder fb = make_font();
  fb.add_table(TC_FONT_TABLE_TAG_SBIX, sbix);

  TCFontFace face;
  ASSERT_SUCCESS(create_face(fb, face));

  EXPECT_FALSE(face.supports_emoji());
  EXPECT_EQ(face._impl->images.state(), LazyLoadState::kNotLoaded);

  TCBitmapGlyph glyph;
  EXPECT_EQ(face.lookup_glyph_image(1, 20, TC_BIT_DEPTH_32, &glyph), TCResult(TC_ERROR_INVALID_SIGNATURE));
  EXPECT_TRUE(glyph.is_empty());
}

TEST(TCFontFace, EmbeddedImagesAreCached) {
  FontBuilder fb = make_font();
  fb.add_table(TC_FONT_TABLE_TAG_SBIX, make_dupe_sbix());

  TCFontFace face;
  ASSERT_SUCCESS(create_face(fb, face));

  TCBitmapGlyph a;
  TCBitmapGlyph b;
  ASSERT_SUCCESS(face.lookup_glyph_image(1, 20, TC_BIT_DEPTH_32, &a));
  ASSERT_EQ(face._impl->images.state(), LazyLoadState::kLoadedPresent);

  OpenType::ImageBundle bundle = face._impl->images._value;
  ASSERT_SUCCESS(face.lookup_glyph_image(1, 20, TC_BIT_DEPTH_32, &b));
  EXPECT_TRUE(face._impl->images._value.equals(bundle));

  EXPECT_EQ(a.data.data, b.data.data);
  EXPECT_EQ(a.data.size, b.data.size);

  // The image stays valid after the face is destroyed.
  face.reset();
  EXPECT_EQ(a.data.data[8], 0x5Au);
}

// tc::FontFace - Tests - Glyph Names
// ==================================

TEST(TCFontFace, GlyphNames) {
  FontBuilder fb = make_font();
  fb.add_table(TC_FONT_TABLE_TAG_POST, tctest::make_post_header(0x00010000u));

  TCFontFace face;
  ASSERT_SUCCESS(create_face(fb, face));

  static const TCGlyphId notdef[] = { 0 };
  std::vector<std::string> names;

  ASSERT_SUCCESS(get_glyph_names(face, notdef, 1, names));
  ASSERT_EQ(names.size(), 1u);
  EXPECT_EQ(names[0], ".notdef");

  static const TCGlyphId glyph_ids[] = { 36, 36, 37, 36, 300 };
  ASSERT_SUCCESS(get_glyph_names(face, glyph_ids, TC_ARRAY_SIZE(glyph_ids), names));
  ASSERT_EQ(names.size(), 5u);
  EXPECT_EQ(names[0], "A");
  EXPECT_EQ(names[1], "A.alt01");
  EXPECT_EQ(names[2], "B");
  EXPECT_EQ(names[3], "A.alt02");
  EXPECT_EQ(names[4], "g300");
}

TEST(TCFontFace, GlyphNamesFromCharacterMap) {
  FontBuilder fb = make_font();
  fb.add_table(TC_FONT_TABLE_TAG_POST, tctest::make_post_header(0x00030000u));

  TCFontFace face;
  ASSERT_SUCCESS(create_face(fb, face));

  static const TCGlyphId glyph_ids[] = { 0, 1, 2, 3, 4 };
  std::vector<std::string> names;

  ASSERT_SUCCESS(get_glyph_names(face, glyph_ids, TC_ARRAY_SIZE(glyph_ids), names));
  ASSERT_EQ(names.size(), 5u);
  EXPECT_EQ(names[0], ".notdef");
  EXPECT_EQ(names[1], "A");
  EXPECT_EQ(names[2], "B");
  EXPECT_EQ(names[3], "C");
  EXPECT_EQ(names[4], "g4");
}

static TCResult TC_CDECL stop_after_first_glyph_name(size_t index, TCGlyphId glyph_id, const char* name, size_t name_size, void* user_data) noexcept {
  tc_unused(glyph_id, name, name_size);

  (*static_cast<uint32_t*>(user_data))++;
  return index == 0 ? TCResult(TC_SUCCESS) : tc_make_error(TC_ERROR_INVALID_STATE);
}

TEST(TCFontFace, GlyphNamesSinkError) {
  TCFontFace face;
  ASSERT_SUCCESS(create_face(make_font(), face));

  static const TCGlyphId glyph_ids[] = { 1, 2, 3 };
  uint32_t call_count = 0;

  EXPECT_EQ(face.glyph_names(glyph_ids, TC_ARRAY_SIZE(glyph_ids), stop_after_first_glyph_name, &call_count), TCResult(TC_ERROR_INVALID_STATE));
  EXPECT_EQ(call_count, 2u);

  EXPECT_EQ(face.glyph_names(glyph_ids, TC_ARRAY_SIZE(glyph_ids), nullptr, nullptr), TCResult(TC_ERROR_INVALID_VALUE));
  EXPECT_EQ(face.glyph_names(nullptr, 1, stop_after_first_glyph_name, &call_count), TCResult(TC_ERROR_INVALID_VALUE));
  EXPECT_EQ(call_count, 2u);
}

} // {Tests}
} // {tc}

#endif // TC_TEST
