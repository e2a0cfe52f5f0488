// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <typecase/core/api-build_p.h>
#include <typecase/core/trace_p.h>
#include <typecase/opentype/otglyphnames_p.h>
#include <typecase/opentype/otplatform_p.h>

#include <new>
#include <unordered_map>

namespace tc::OpenType {

// tc::OpenType::GlyphNamer - Trace
// ================================

#if defined(TC_TRACE_OT_ALL) || defined(TC_TRACE_OT_NAMES)
#define Trace TCDebugTrace
#else
#define Trace TCDummyTrace
#endif

// tc::OpenType::GlyphNamer - Init
// ===============================

void GlyphNamer::init_post(RawTable post) noexcept {
  Trace trace;

  if (post.is_empty()) {
    _has_post = false;
    return;
  }

  TCResult result = PostImpl::init_names(Table<PostTable>(post), &_post);
  if (result != TC_SUCCESS) {
    trace.warn("Ignoring 'post' table [Result=0x%08X]\n", result);
    _has_post = false;
    return;
  }

  _has_post = _post.has_names();
}

void GlyphNamer::init_cmap(RawTable cmap, const CMapEncoding& encoding, TCCharEncoding char_encoding, uint32_t glyph_count) noexcept {
  _cmap = cmap;
  _cmap_encoding = encoding;
  _char_encoding = char_encoding;
  _glyph_count = glyph_count;
  _has_cmap = true;
  _reverse_map_built = false;
}

// tc::OpenType::GlyphNamer - Names
// ================================

bool GlyphNamer::cmap_glyph_name(TCGlyphId glyph_id, std::string& out) {
  if (glyph_id == 0) {
    out.assign(".notdef");
    return true;
  }

  if (!_has_cmap || glyph_id >= _glyph_count)
    return false;

  if (!_reverse_map_built) {
    _reverse_map.resize(_glyph_count);
    CMapImpl::build_reverse_map(_cmap, _cmap_encoding, _reverse_map.data(), _glyph_count);
    _reverse_map_built = true;
  }

  uint32_t code = _reverse_map[glyph_id];
  if (code == 0xFFFFFFFFu)
    return false;

  switch (_char_encoding) {
    case TC_CHAR_ENCODING_UNICODE:
    case TC_CHAR_ENCODING_SYMBOL:
      out = GlyphNamesImpl::unicode_name(code);
      return true;

    case TC_CHAR_ENCODING_APPLE_ROMAN:
      if (code > 0xFFu)
        return false;
      out = GlyphNamesImpl::unicode_name(PlatformImpl::mac_roman_to_unicode(code));
      return true;

    default:
      return false;
  }
}

std::string GlyphNamer::glyph_name(TCGlyphId glyph_id) {
  std::string name;

  if (_has_post && _post.glyph_name(glyph_id, name) && !name.empty())
    return name;

  if (cmap_glyph_name(glyph_id, name))
    return name;

  char buf[16];
  snprintf(buf, sizeof(buf), "g%u", unsigned(glyph_id));
  return std::string(buf);
}

namespace GlyphNamesImpl {

// tc::OpenType::GlyphNamesImpl - Utilities
// ========================================

std::string unicode_name(uint32_t uc) {
  uint32_t index = PostImpl::find_mac_standard_name(uc);
  if (index != 0xFFFFFFFFu)
    return std::string(PostImpl::mac_standard_name(index));

  char buf[16];
  if (uc <= 0xFFFFu)
    snprintf(buf, sizeof(buf), "uni%04X", unsigned(uc));
  else
    snprintf(buf, sizeof(buf), "u%04X", unsigned(uc));
  return std::string(buf);
}

void make_unique_names(std::vector<std::string>& names) {
  std::unordered_map<std::string, uint32_t> seen;

  for (std::string& name : names) {
    auto result = seen.emplace(name, 0u);
    if (result.second)
      continue;

    // A suffixed name can already be taken by a name of the input ("A.alt01" before two "A"s), skip such numbers.
    uint32_t& alt = result.first->second;
    std::string unique_name;
    do {
      char buf[16];
      snprintf(buf, sizeof(buf), ".alt%02u", unsigned(++alt));
      unique_name = name + buf;
    } while (seen.find(unique_name) != seen.end());

    seen.emplace(unique_name, 0u);
    name = std::move(unique_name);
  }
}

// tc::OpenType::GlyphNamesImpl - Interface
// ========================================

TCResult glyph_names(GlyphNamer& namer, const TCGlyphId* glyph_ids, size_t count, std::vector<std::string>& out) noexcept {
  Trace trace;
  trace.info("tc::OpenType::GlyphNamesImpl::GlyphNames [Count=%zu]\n", count);

  try {
    std::vector<std::string> names;
    names.reserve(count);

    for (size_t i = 0; i < count; i++)
      names.push_back(namer.glyph_name(glyph_ids[i]));

    make_unique_names(names);
    out = std::move(names);
    return TC_SUCCESS;
  }
  catch (const std::bad_alloc&) {
    out.clear();
    return tc_make_error(TC_ERROR_OUT_OF_MEMORY);
  }
}

} // {GlyphNamesImpl}
} // {tc::OpenType}
