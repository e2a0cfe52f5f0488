// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <typecase/core/api-build_test_p.h>
#if defined(TC_TEST)

#include <typecase/opentype/otglyphnames_p.h>
#include <commons/fontbuilder.h>

namespace tc::OpenType {
namespace Tests {

using tctest::ByteBuilder;
using tctest::CMapRecord;

static RawTable raw_table_of(const ByteBuilder& b) noexcept {
  return RawTable(b.data(), uint32_t(b.size()));
}

static std::string post_name(const PostNames& post, TCGlyphId glyph_id) {
  std::string name;
  if (!post.glyph_name(glyph_id, name))
    return std::string("<none>");
  return name;
}

// Initializes `namer` to use the only encoding record of `cmap`.
static void init_namer_cmap(GlyphNamer& namer, const ByteBuilder& cmap, uint32_t glyph_count) {
  bool found = false;
  TCCharEncoding encoding = TC_CHAR_ENCODING_UNICODE;
  uint32_t offset = 0;

  ASSERT_SUCCESS(CMapImpl::select_encoding(raw_table_of(cmap), &found, &encoding, &offset));
  ASSERT_TRUE(found);

  CMapEncoding sub_table {};
  ASSERT_SUCCESS(CMapImpl::validate_sub_table(raw_table_of(cmap), offset, sub_table));

  namer.init_cmap(raw_table_of(cmap), sub_table, encoding, glyph_count);
}

static std::vector<std::string> names_of(GlyphNamer& namer, const std::vector<TCGlyphId>& glyph_ids) {
  std::vector<std::string> names;
  EXPECT_SUCCESS(GlyphNamesImpl::glyph_names(namer, glyph_ids.data(), glyph_ids.size(), names));
  return names;
}

TEST(TCOpenTypeGlyphNames, MacStandardNames) {
  EXPECT_STREQ(PostImpl::mac_standard_name(0), ".notdef");
  EXPECT_STREQ(PostImpl::mac_standard_name(3), "space");
  EXPECT_STREQ(PostImpl::mac_standard_name(257), "dcroat");

  EXPECT_EQ(PostImpl::mac_standard_unicode(0), 0u);
  EXPECT_EQ(PostImpl::mac_standard_unicode(36), 0x41u);
  EXPECT_EQ(PostImpl::mac_standard_unicode(98), 0xC4u);
  EXPECT_EQ(PostImpl::mac_standard_unicode(189), 0xA4u);
  EXPECT_EQ(PostImpl::mac_standard_unicode(257), 0x111u);

  EXPECT_EQ(PostImpl::find_mac_standard_name(0x20u), 3u);
  EXPECT_EQ(PostImpl::find_mac_standard_name(0xA0u), 172u);
  EXPECT_EQ(PostImpl::find_mac_standard_name(0xA4u), 189u);
  EXPECT_EQ(PostImpl::find_mac_standard_name(0x20ACu), 0xFFFFFFFFu);
  EXPECT_EQ(PostImpl::find_mac_standard_name(0u), 0xFFFFFFFFu);
}

TEST(TCOpenTypeGlyphNames, PostVersion1) {
  ByteBuilder post = tctest::make_post_header(0x00010000u);

  PostNames names;
  ASSERT_SUCCESS(PostImpl::init_names(Table<PostTable>(raw_table_of(post)), &names));
  EXPECT_TRUE(names.has_names());

  EXPECT_EQ(post_name(names, 0), ".notdef");
  EXPECT_EQ(post_name(names, 36), "A");
  EXPECT_EQ(post_name(names, 257), "dcroat");
  EXPECT_EQ(post_name(names, 258), "<none>");
}

TEST(TCOpenTypeGlyphNames, PostVersion2) {
  ByteBuilder post = tctest::make_post_v2({ ".notdef", "A", "smiley", "A.swash" }, { {".notdef", 0u}, {"A", 36u} });

  PostNames names;
  ASSERT_SUCCESS(PostImpl::init_names(Table<PostTable>(raw_table_of(post)), &names));
  EXPECT_EQ(names._string_offsets.size(), 2u);

  EXPECT_EQ(post_name(names, 0), ".notdef");
  EXPECT_EQ(post_name(names, 1), "A");
  EXPECT_EQ(post_name(names, 2), "smiley");
  EXPECT_EQ(post_name(names, 3), "A.swash");
  EXPECT_EQ(post_name(names, 4), "<none>");
}

TEST(TCOpenTypeGlyphNames, PostVersion2WithMissingString) {
  ByteBuilder post = tctest::make_post_v2({ "first" });
  // Point the only glyph to a string that doesn't exist.
  post.patch_u16(34, 259);

  PostNames names;
  ASSERT_SUCCESS(PostImpl::init_names(Table<PostTable>(raw_table_of(post)), &names));
  EXPECT_EQ(post_name(names, 0), "<none>");
}

TEST(TCOpenTypeGlyphNames, PostVersion2_5) {
  ByteBuilder post = tctest::make_post_header(0x00025000u);
  post.u16(3).i8(0).i8(35).i8(-3);

  PostNames names;
  ASSERT_SUCCESS(PostImpl::init_names(Table<PostTable>(raw_table_of(post)), &names));

  EXPECT_EQ(post_name(names, 0), ".notdef");
  EXPECT_EQ(post_name(names, 1), "A");
  EXPECT_EQ(post_name(names, 2), "<none>");
}

TEST(TCOpenTypeGlyphNames, PostVersion3) {
  ByteBuilder post = tctest::make_post_header(0x00030000u);

  PostNames names;
  ASSERT_SUCCESS(PostImpl::init_names(Table<PostTable>(raw_table_of(post)), &names));
  EXPECT_FALSE(names.has_names());
  EXPECT_EQ(post_name(names, 0), "<none>");
}

TEST(TCOpenTypeGlyphNames, PostInvalid) {
  PostNames names;

  {
    ByteBuilder post;
    post.u32(0x00010000u).u32(0);
    EXPECT_EQ(PostImpl::init_names(Table<PostTable>(raw_table_of(post)), &names), TC_ERROR_DATA_TRUNCATED);
  }

  {
    ByteBuilder post = tctest::make_post_header(0x00070000u);
    EXPECT_EQ(PostImpl::init_names(Table<PostTable>(raw_table_of(post)), &names), TC_ERROR_INVALID_SIGNATURE);
  }

  {
    ByteBuilder post = tctest::make_post_header(0x00020000u);
    post.u16(4).u16(0);
    EXPECT_EQ(PostImpl::init_names(Table<PostTable>(raw_table_of(post)), &names), TC_ERROR_DATA_TRUNCATED);
  }

  {
    ByteBuilder post = tctest::make_post_v2({ "name" });
    post._data.pop_back();
    EXPECT_EQ(PostImpl::init_names(Table<PostTable>(raw_table_of(post)), &names), TC_ERROR_DATA_TRUNCATED);
  }

  EXPECT_FALSE(names.has_names());
}

TEST(TCOpenTypeGlyphNames, UnicodeName) {
  EXPECT_EQ(GlyphNamesImpl::unicode_name(0x41u), "A");
  EXPECT_EQ(GlyphNamesImpl::unicode_name(0xE9u), "eacute");
  EXPECT_EQ(GlyphNamesImpl::unicode_name(0x25B6u), "uni25B6");
  EXPECT_EQ(GlyphNamesImpl::unicode_name(0x1F600u), "u1F600");
  EXPECT_EQ(GlyphNamesImpl::unicode_name(0x10FFFFu), "u10FFFF");
}

TEST(TCOpenTypeGlyphNames, UniqueNames) {
  std::vector<std::string> names = { "A", "A", "B", "A", "B" };
  GlyphNamesImpl::make_unique_names(names);

  EXPECT_EQ(names[0], "A");
  EXPECT_EQ(names[1], "A.alt01");
  EXPECT_EQ(names[2], "B");
  EXPECT_EQ(names[3], "A.alt02");
  EXPECT_EQ(names[4], "B.alt01");
}

TEST(TCOpenTypeGlyphNames, UniqueNamesSkipTakenSuffixes) {
  {
    std::vector<std::string> names = { "A.alt01", "A", "A" };
    GlyphNamesImpl::make_unique_names(names);

    EXPECT_EQ(names[0], "A.alt01");
    EXPECT_EQ(names[1], "A");
    EXPECT_EQ(names[2], "A.alt02");
  }

  {
    std::vector<std::string> names = { "A", "A", "A.alt01", "A" };
    GlyphNamesImpl::make_unique_names(names);

    EXPECT_EQ(names[0], "A");
    EXPECT_EQ(names[1], "A.alt01");
    EXPECT_EQ(names[2], "A.alt01.alt01");
    EXPECT_EQ(names[3], "A.alt02");
  }
}

TEST(TCOpenTypeGlyphNames, NamerPrefersPost) {
  ByteBuilder cmap = tctest::make_cmap({ CMapRecord{3, 1, tctest::make_cmap_format4({ {0x41u, 1u}, {0x42u, 3u}, {0x25B6u, 2u} })} });
  ByteBuilder post = tctest::make_post_v2({ ".notdef", "alpha", "" });

  GlyphNamer namer;
  namer.init_post(raw_table_of(post));
  init_namer_cmap(namer, cmap, 5);

  std::vector<std::string> names = names_of(namer, { 0, 1, 2, 3, 4, 1000 });
  ASSERT_EQ(names.size(), 6u);

  EXPECT_EQ(names[0], ".notdef");
  EXPECT_EQ(names[1], "alpha");
  EXPECT_EQ(names[2], "uni25B6");
  EXPECT_EQ(names[3], "B");
  EXPECT_EQ(names[4], "g4");
  EXPECT_EQ(names[5], "g1000");
}

TEST(TCOpenTypeGlyphNames, NamerIgnoresInvalidPost) {
  ByteBuilder cmap = tctest::make_cmap({ CMapRecord{3, 1, tctest::make_cmap_format4({ {0x41u, 1u} })} });
  ByteBuilder post = tctest::make_post_header(0x00070000u);

  GlyphNamer namer;
  namer.init_post(raw_table_of(post));
  init_namer_cmap(namer, cmap, 3);

  std::vector<std::string> names = names_of(namer, { 0, 1, 2 });
  ASSERT_EQ(names.size(), 3u);

  EXPECT_EQ(names[0], ".notdef");
  EXPECT_EQ(names[1], "A");
  EXPECT_EQ(names[2], "g2");
}

TEST(TCOpenTypeGlyphNames, NamerWithoutPostAndCMap) {
  GlyphNamer namer;

  std::vector<std::string> names = names_of(namer, { 0, 7 });
  ASSERT_EQ(names.size(), 2u);

  EXPECT_EQ(names[0], ".notdef");
  EXPECT_EQ(names[1], "g7");
}

TEST(TCOpenTypeGlyphNames, NamerLegacyEncodings) {
  {
    // 0x8E is 'eacute' in Mac OS Roman.
    ByteBuilder cmap = tctest::make_cmap({ CMapRecord{1, 0, tctest::make_cmap_format0({ {0x8Eu, 1u}, {0x41u, 2u} })} });

    GlyphNamer namer;
    init_namer_cmap(namer, cmap, 3);

    std::vector<std::string> names = names_of(namer, { 1, 2 });
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0], "eacute");
    EXPECT_EQ(names[1], "A");
  }

  {
    ByteBuilder cmap = tctest::make_cmap({ CMapRecord{3, 0, tctest::make_cmap_format4({ {0xF041u, 1u} })} });

    GlyphNamer namer;
    init_namer_cmap(namer, cmap, 2);

    std::vector<std::string> names = names_of(namer, { 1 });
    ASSERT_EQ(names.size(), 1u);
    EXPECT_EQ(names[0], "uniF041");
  }

  {
    ByteBuilder cmap = tctest::make_cmap({ CMapRecord{3, 4, tctest::make_cmap_format4({ {0xA440u, 1u} })} });

    GlyphNamer namer;
    init_namer_cmap(namer, cmap, 2);

    std::vector<std::string> names = names_of(namer, { 1 });
    ASSERT_EQ(names.size(), 1u);
    EXPECT_EQ(names[0], "g1");
  }
}

TEST(TCOpenTypeGlyphNames, NamerMakesNamesUnique) {
  ByteBuilder post = tctest::make_post_v2({ ".notdef", "A", "A", "A" });

  GlyphNamer namer;
  namer.init_post(raw_table_of(post));

  std::vector<std::string> names = names_of(namer, { 1, 2, 3, 1 });
  ASSERT_EQ(names.size(), 4u);

  EXPECT_EQ(names[0], "A");
  EXPECT_EQ(names[1], "A.alt01");
  EXPECT_EQ(names[2], "A.alt02");
  EXPECT_EQ(names[3], "A.alt03");
}

} // {Tests}
} // {tc::OpenType}

#endif // TC_TEST
