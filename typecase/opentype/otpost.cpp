// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <typecase/core/api-build_p.h>
#include <typecase/core/trace_p.h>
#include <typecase/opentype/otplatform_p.h>
#include <typecase/opentype/otpost_p.h>

#include <new>

namespace tc::OpenType {
namespace PostImpl {

// tc::OpenType::PostImpl - Trace
// ==============================

#if defined(TC_TRACE_OT_ALL) || defined(TC_TRACE_OT_POST)
#define Trace TCDebugTrace
#else
#define Trace TCDummyTrace
#endif

// tc::OpenType::PostImpl - Standard Names
// =======================================

static const char* const kMacStandardNames[PostTable::kMacStandardNameCount] = {
  ".notdef", ".null", "nonmarkingreturn", "space", "exclam", "quotedbl", "numbersign", "dollar", "percent",
  "ampersand", "quotesingle", "parenleft", "parenright", "asterisk", "plus", "comma", "hyphen", "period", "slash",
  "zero", "one", "two", "three", "four", "five", "six", "seven", "eight", "nine", "colon", "semicolon", "less",
  "equal", "greater", "question", "at",
  "A", "B", "C", "D", "E", "F", "G", "H", "I", "J", "K", "L", "M", "N", "O", "P", "Q", "R", "S", "T", "U", "V", "W",
  "X", "Y", "Z",
  "bracketleft", "backslash", "bracketright", "asciicircum", "underscore", "grave",
  "a", "b", "c", "d", "e", "f", "g", "h", "i", "j", "k", "l", "m", "n", "o", "p", "q", "r", "s", "t", "u", "v", "w",
  "x", "y", "z",
  "braceleft", "bar", "braceright", "asciitilde", "Adieresis", "Aring", "Ccedilla", "Eacute", "Ntilde",
  "Odieresis", "Udieresis", "aacute", "agrave", "acircumflex", "adieresis", "atilde", "aring", "ccedilla", "eacute",
  "egrave", "ecircumflex", "edieresis", "iacute", "igrave", "icircumflex", "idieresis", "ntilde", "oacute", "ograve",
  "ocircumflex", "odieresis", "otilde", "uacute", "ugrave", "ucircumflex", "udieresis", "dagger", "degree", "cent",
  "sterling", "section", "bullet", "paragraph", "germandbls", "registered", "copyright", "trademark", "acute",
  "dieresis", "notequal", "AE", "Oslash", "infinity", "plusminus", "lessequal", "greaterequal", "yen", "mu",
  "partialdiff", "summation", "product", "pi", "integral", "ordfeminine", "ordmasculine", "Omega", "ae", "oslash",
  "questiondown", "exclamdown", "logicalnot", "radical", "florin", "approxequal", "Delta", "guillemotleft",
  "guillemotright", "ellipsis", "nonbreakingspace", "Agrave", "Atilde", "Otilde", "OE", "oe", "endash", "emdash",
  "quotedblleft", "quotedblright", "quoteleft", "quoteright", "divide", "lozenge", "ydieresis", "Ydieresis",
  "fraction", "currency", "guilsinglleft", "guilsinglright", "fi", "fl", "daggerdbl", "periodcentered",
  "quotesinglbase", "quotedblbase", "perthousand", "Acircumflex", "Ecircumflex", "Aacute", "Edieresis", "Egrave",
  "Iacute", "Icircumflex", "Idieresis", "Igrave", "Oacute", "Ocircumflex", "apple", "Ograve", "Uacute",
  "Ucircumflex", "Ugrave", "dotlessi", "circumflex", "tilde", "macron", "breve", "dotaccent", "ring", "cedilla",
  "hungarumlaut", "ogonek", "caron", "Lslash", "lslash", "Scaron", "scaron", "Zcaron", "zcaron", "brokenbar", "Eth",
  "eth", "Yacute", "yacute", "Thorn", "thorn", "minus", "multiply", "onesuperior", "twosuperior", "threesuperior",
  "onehalf", "onequarter", "threequarters", "franc", "Gbreve", "gbreve", "Idotaccent", "Scedilla", "scedilla",
  "Cacute", "cacute", "Ccaron", "ccaron", "dcroat"
};

// Names [98, 225] follow Mac OS Roman characters [0x80, 0xFF], the remaining ones are listed here.
static constexpr uint16_t kMacStandardTailUnicode[] = {
  0x0141, 0x0142, 0x0160, 0x0161, 0x017D, 0x017E, 0x00A6, 0x00D0, 0x00F0, 0x00DD, 0x00FD, 0x00DE, 0x00FE, 0x2212,
  0x00D7, 0x00B9, 0x00B2, 0x00B3, 0x00BD, 0x00BC, 0x00BE, 0x20A3, 0x011E, 0x011F, 0x0130, 0x015E, 0x015F, 0x0106,
  0x0107, 0x010C, 0x010D, 0x0111
};

static constexpr uint32_t kMacStandardAsciiFirst = 3;
static constexpr uint32_t kMacStandardRomanFirst = 98;
static constexpr uint32_t kMacStandardTailFirst = 226;
static constexpr uint32_t kMacStandardCurrency = 189;

static_assert(kMacStandardTailFirst + TC_ARRAY_SIZE(kMacStandardTailUnicode) == PostTable::kMacStandardNameCount,
              "Standard name tables must cover all 258 names");

const char* mac_standard_name(uint32_t index) noexcept {
  TC_ASSERT(index < PostTable::kMacStandardNameCount);
  return kMacStandardNames[index];
}

uint32_t mac_standard_unicode(uint32_t index) noexcept {
  if (index < kMacStandardAsciiFirst)
    return 0;

  if (index < kMacStandardRomanFirst)
    return 0x20u + (index - kMacStandardAsciiFirst);

  if (index < kMacStandardTailFirst) {
    // Mac OS Roman has the Euro sign at 0xDB, but the standard name there is 'currency'.
    if (index == kMacStandardCurrency)
      return 0x00A4u;
    return PlatformImpl::mac_roman_to_unicode(0x80u + (index - kMacStandardRomanFirst));
  }

  if (index < PostTable::kMacStandardNameCount)
    return kMacStandardTailUnicode[index - kMacStandardTailFirst];

  return 0;
}

uint32_t find_mac_standard_name(uint32_t uc) noexcept {
  if (uc == 0)
    return 0xFFFFFFFFu;

  if (uc >= 0x20u && uc <= 0x7Eu)
    return kMacStandardAsciiFirst + (uc - 0x20u);

  for (uint32_t i = kMacStandardRomanFirst; i < PostTable::kMacStandardNameCount; i++) {
    if (mac_standard_unicode(i) == uc)
      return i;
  }

  return 0xFFFFFFFFu;
}

// tc::OpenType::PostImpl - Init
// =============================

TCResult init_names(Table<PostTable> post, PostNames* out) noexcept {
  Trace trace;
  trace.info("tc::OpenType::PostImpl::InitNames [Size=%u]\n", post.size);
  trace.indent();

  if (!post.fits()) {
    trace.fail("Table is truncated\n");
    return tc_make_error(TC_ERROR_DATA_TRUNCATED);
  }

  uint32_t version = post->version();
  uint32_t glyph_count = 0;
  std::vector<uint32_t> string_offsets;

  switch (version) {
    case PostTable::kVersion1_0:
      glyph_count = PostTable::kMacStandardNameCount;
      break;

    case PostTable::kVersion2_0: {
      if (!post.fits(PostTable::kBaseSize + PostTable::V2_0::kBaseSize)) {
        trace.fail("Table [v2.0] is truncated\n");
        return tc_make_error(TC_ERROR_DATA_TRUNCATED);
      }

      glyph_count = post.readU16(PostTable::kBaseSize);
      uint32_t offset = PostTable::kBaseSize + PostTable::V2_0::kBaseSize + glyph_count * 2u;

      if (!post.fits(offset)) {
        trace.fail("Glyph name indexes are truncated [GlyphCount=%u]\n", glyph_count);
        return tc_make_error(TC_ERROR_DATA_TRUNCATED);
      }

      try {
        while (offset < post.size) {
          uint32_t length = post.readU8(offset);
          if (!post.fits(offset + 1u, length)) {
            trace.fail("Name #%zu is truncated [Offset=%u Length=%u]\n", string_offsets.size(), offset, length);
            return tc_make_error(TC_ERROR_DATA_TRUNCATED);
          }

          string_offsets.push_back(offset);
          offset += 1u + length;
        }
      }
      catch (const std::bad_alloc&) {
        return tc_make_error(TC_ERROR_OUT_OF_MEMORY);
      }
      break;
    }

    case PostTable::kVersion2_5: {
      if (!post.fits(PostTable::kBaseSize + PostTable::V2_0::kBaseSize)) {
        trace.fail("Table [v2.5] is truncated\n");
        return tc_make_error(TC_ERROR_DATA_TRUNCATED);
      }

      glyph_count = post.readU16(PostTable::kBaseSize);
      if (!post.fits(PostTable::kBaseSize + PostTable::V2_0::kBaseSize + glyph_count)) {
        trace.fail("Glyph name offsets are truncated [GlyphCount=%u]\n", glyph_count);
        return tc_make_error(TC_ERROR_DATA_TRUNCATED);
      }
      break;
    }

    case PostTable::kVersion3_0:
    case PostTable::kVersion4_0:
      break;

    default:
      trace.fail("Invalid version (0x%08X)\n", version);
      return tc_make_error(TC_ERROR_INVALID_SIGNATURE);
  }

  trace.info("Version: 0x%08X\n", version);
  trace.info("GlyphCount: %u\n", glyph_count);
  trace.info("StringCount: %zu\n", string_offsets.size());

  out->_version = version;
  out->_table = post;
  out->_glyph_count = glyph_count;
  out->_string_offsets = std::move(string_offsets);
  return TC_SUCCESS;
}

} // {PostImpl}

// tc::OpenType::PostNames - Lookup
// ================================

bool PostNames::glyph_name(TCGlyphId glyph_id, std::string& out) const {
  if (glyph_id >= _glyph_count)
    return false;

  uint32_t name_index = 0;
  switch (_version) {
    case PostTable::kVersion1_0:
      name_index = glyph_id;
      break;

    case PostTable::kVersion2_0: {
      name_index = _table.readU16(PostTable::kBaseSize + PostTable::V2_0::kBaseSize + glyph_id * 2u);
      if (name_index >= PostTable::kMacStandardNameCount) {
        size_t string_index = name_index - PostTable::kMacStandardNameCount;
        if (string_index >= _string_offsets.size())
          return false;

        uint32_t offset = _string_offsets[string_index];
        uint32_t length = _table.readU8(offset);

        out.assign(reinterpret_cast<const char*>(_table.data + offset + 1u), length);
        return true;
      }
      break;
    }

    case PostTable::kVersion2_5: {
      // Each glyph stores a signed difference between its index and the index of its standard name.
      int32_t delta = int8_t(_table.readU8(PostTable::kBaseSize + PostTable::V2_0::kBaseSize + glyph_id));
      int32_t index = int32_t(glyph_id) + delta;

      if (index < 0)
        return false;
      name_index = uint32_t(index);
      break;
    }

    default:
      return false;
  }

  if (name_index >= PostTable::kMacStandardNameCount)
    return false;

  out.assign(PostImpl::mac_standard_name(name_index));
  return true;
}

} // {tc::OpenType}
