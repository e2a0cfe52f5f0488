// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TESTING_COMMONS_FONTBUILDER_H_INCLUDED
#define TESTING_COMMONS_FONTBUILDER_H_INCLUDED

#include <typecase/typecase.h>

#include <stdint.h>
#include <string.h>

#include <string>
#include <utility>
#include <vector>

namespace tctest {

//! Big-endian byte writer used to build font tables in memory.
class ByteBuilder {
public:
  std::vector<uint8_t> _data;

  ByteBuilder& u8(uint32_t v) { _data.push_back(uint8_t(v & 0xFFu)); return *this; }
  ByteBuilder& i8(int32_t v) { return u8(uint32_t(v)); }
  ByteBuilder& u16(uint32_t v) { return u8(v >> 8).u8(v); }
  ByteBuilder& i16(int32_t v) { return u16(uint32_t(v) & 0xFFFFu); }
  ByteBuilder& u24(uint32_t v) { return u8(v >> 16).u16(v); }
  ByteBuilder& u32(uint32_t v) { return u16(v >> 16).u16(v); }
  ByteBuilder& i32(int32_t v) { return u32(uint32_t(v)); }
  ByteBuilder& u64(uint64_t v) { return u32(uint32_t(v >> 32)).u32(uint32_t(v)); }

  ByteBuilder& tag(const char s[5]) { return u8(uint8_t(s[0])).u8(uint8_t(s[1])).u8(uint8_t(s[2])).u8(uint8_t(s[3])); }

  ByteBuilder& bytes(const void* data, size_t size) {
    const uint8_t* p = static_cast<const uint8_t*>(data);
    _data.insert(_data.end(), p, p + size);
    return *this;
  }

  ByteBuilder& bytes(const std::vector<uint8_t>& data) { return bytes(data.data(), data.size()); }
  ByteBuilder& append(const ByteBuilder& other) { return bytes(other._data); }
  ByteBuilder& zeros(size_t n) { _data.insert(_data.end(), n, uint8_t(0)); return *this; }

  ByteBuilder& align(size_t n) {
    while (_data.size() % n)
      _data.push_back(0);
    return *this;
  }

  void patch_u16(size_t offset, uint32_t v) {
    _data[offset + 0] = uint8_t((v >> 8) & 0xFFu);
    _data[offset + 1] = uint8_t(v & 0xFFu);
  }

  void patch_u32(size_t offset, uint32_t v) {
    patch_u16(offset + 0, v >> 16);
    patch_u16(offset + 2, v & 0xFFFFu);
  }

  size_t size() const { return _data.size(); }
  const uint8_t* data() const { return _data.data(); }
  const std::vector<uint8_t>& vec() const { return _data; }
};

//! Builds an SFNT container (a single font face) from a set of tables.
class FontBuilder {
public:
  struct Entry {
    TCTag tag;
    std::vector<uint8_t> data;
  };

  std::vector<Entry> _tables;

  FontBuilder& add_table(TCTag tag, const ByteBuilder& table) { return add_table(tag, table.vec()); }

  FontBuilder& add_table(TCTag tag, const std::vector<uint8_t>& table) {
    for (Entry& entry : _tables) {
      if (entry.tag == tag) {
        entry.data = table;
        return *this;
      }
    }
    _tables.push_back(Entry{tag, table});
    return *this;
  }

  FontBuilder& remove_table(TCTag tag) {
    for (size_t i = 0; i < _tables.size(); i++) {
      if (_tables[i].tag == tag) {
        _tables.erase(_tables.begin() + ptrdiff_t(i));
        break;
      }
    }
    return *this;
  }

  std::vector<uint8_t> build() const {
    uint32_t table_count = uint32_t(_tables.size());

    ByteBuilder out;
    out.u32(0x00010000u)
       .u16(table_count)
       .u16(0)
       .u16(0)
       .u16(0);

    uint32_t offset = 12u + table_count * 16u;
    for (const Entry& entry : _tables) {
      out.u32(entry.tag)
         .u32(0)
         .u32(offset)
         .u32(uint32_t(entry.data.size()));
      offset += (uint32_t(entry.data.size()) + 3u) & ~3u;
    }

    for (const Entry& entry : _tables)
      out.bytes(entry.data).align(4);

    return out._data;
  }

  TCResult build_font_data(TCFontData& font_data) const {
    std::vector<uint8_t> data = build();
    return font_data.create_from_data_copy(data.data(), data.size());
  }
};

// tctest - Tables
// ===============

//! 'maxp' version 0.5.
static inline ByteBuilder make_maxp(uint32_t glyph_count) {
  ByteBuilder b;
  b.u32(0x00005000u).u16(glyph_count);
  return b;
}

//! 'hhea' or 'vhea' (they share the same layout).
static inline ByteBuilder make_hhea(int32_t ascender, int32_t descender, int32_t line_gap, uint32_t long_metric_count, uint32_t version = 0x00010000u) {
  ByteBuilder b;
  b.u32(version)
   .i16(ascender)
   .i16(descender)
   .i16(line_gap)
   .u16(1000)       // advanceMax
   .i16(-10)        // minLeadingBearing
   .i16(-20)        // minTrailingBearing
   .i16(900)        // maxExtent
   .i16(1)          // caretSlopeRise
   .i16(0)          // caretSlopeRun
   .i16(0)          // caretOffset
   .zeros(8)        // reserved
   .i16(0)          // metricDataFormat
   .u16(long_metric_count);
  return b;
}

//! 'hmtx' or 'vmtx', `metrics` are (advance, bearing) pairs followed by `bearings` of the remaining glyphs.
static inline ByteBuilder make_hmtx(const std::vector<std::pair<uint32_t, int32_t>>& metrics, const std::vector<int32_t>& bearings = {}) {
  ByteBuilder b;
  for (const auto& m : metrics)
    b.u16(m.first).i16(m.second);
  for (int32_t bearing : bearings)
    b.i16(bearing);
  return b;
}

//! 'head' table.
static inline ByteBuilder make_head(uint32_t units_per_em = 1000, int32_t index_to_loc_format = 0) {
  ByteBuilder b;
  b.u32(0x00010000u)    // version
   .u32(0x00028000u)    // fontRevision (2.5)
   .u32(0)              // checksumAdjustment
   .u32(0x5F0F3CF5u)    // magicNumber
   .u16(0x000Bu)        // flags
   .u16(units_per_em)
   .u64(3600)           // created
   .u64(7200)           // modified
   .i16(-50)            // xMin
   .i16(-200)           // yMin
   .i16(950)            // xMax
   .i16(800)            // yMax
   .u16(0x0001u)        // macStyle
   .u16(9)              // lowestRecPPEM
   .i16(2)              // fontDirectionHint
   .i16(index_to_loc_format)
   .i16(0);             // glyphDataFormat
  return b;
}

//! A character map sub-table together with its encoding record.
struct CMapRecord {
  uint32_t platform_id;
  uint32_t encoding_id;
  ByteBuilder sub_table;
};

//! 'cmap' table, sub-tables are stored in the order of records.
static inline ByteBuilder make_cmap(const std::vector<CMapRecord>& records) {
  ByteBuilder b;
  b.u16(0).u16(uint32_t(records.size()));

  uint32_t offset = 4u + uint32_t(records.size()) * 8u;
  for (const CMapRecord& record : records) {
    b.u16(record.platform_id).u16(record.encoding_id).u32(offset);
    offset += uint32_t(record.sub_table.size());
  }

  for (const CMapRecord& record : records)
    b.append(record.sub_table);

  return b;
}

//! Format 0 sub-table, `map` contains (code, glyph) pairs.
static inline ByteBuilder make_cmap_format0(const std::vector<std::pair<uint32_t, uint32_t>>& map) {
  uint8_t glyph_ids[256] {};
  for (const auto& m : map)
    glyph_ids[m.first] = uint8_t(m.second);

  ByteBuilder b;
  b.u16(0).u16(262).u16(0).bytes(glyph_ids, 256);
  return b;
}

//! Format 4 sub-table with one segment per mapping, `map` contains (code, glyph) pairs sorted by code.
static inline ByteBuilder make_cmap_format4(const std::vector<std::pair<uint32_t, uint32_t>>& map) {
  uint32_t num_seg = uint32_t(map.size()) + 1u;

  ByteBuilder b;
  b.u16(4)
   .u16(16u + num_seg * 8u)
   .u16(0)
   .u16(num_seg * 2u)
   .u16(0)
   .u16(0)
   .u16(0);

  for (const auto& m : map) b.u16(m.first);
  b.u16(0xFFFF);
  b.u16(0);
  for (const auto& m : map) b.u16(m.first);
  b.u16(0xFFFF);
  for (const auto& m : map) b.u16((m.second - m.first) & 0xFFFFu);
  b.u16(1);
  for (size_t i = 0; i < num_seg; i++) b.u16(0);

  return b;
}

//! Format 12 sub-table, each group is (first, last, glyph).
struct CMapGroup {
  uint32_t first;
  uint32_t last;
  uint32_t glyph_id;
};

static inline ByteBuilder make_cmap_format12(const std::vector<CMapGroup>& groups) {
  ByteBuilder b;
  b.u16(12)
   .u16(0)
   .u32(16u + uint32_t(groups.size()) * 12u)
   .u32(0)
   .u32(uint32_t(groups.size()));

  for (const CMapGroup& group : groups)
    b.u32(group.first).u32(group.last).u32(group.glyph_id);

  return b;
}

//! A strike of 'CBLC' table, images are PNG payloads of consecutive glyphs starting at `first_glyph`.
//!
//! An empty payload means the glyph has no image in the strike.
struct CbdtStrike {
  uint32_t ppem;
  uint32_t bit_depth;
  uint32_t first_glyph;
  std::vector<std::vector<uint8_t>> images;
};

//! 'CBLC' and 'CBDT' tables (version 3.0), each strike has a single index sub-table (format 1) that references
//! images of format 17 (small metrics and PNG data).
static inline void make_cblc_cbdt(const std::vector<CbdtStrike>& strikes, ByteBuilder& cblc, ByteBuilder& cbdt) {
  cblc.u16(3).u16(0).u32(uint32_t(strikes.size()));
  cbdt.u16(3).u16(0);

  size_t sizes_offset = cblc.size();
  cblc.zeros(strikes.size() * 48u);

  for (size_t i = 0; i < strikes.size(); i++) {
    const CbdtStrike& strike = strikes[i];
    uint32_t first = strike.first_glyph;
    uint32_t last = first + uint32_t(strike.images.size()) - 1u;

    // IndexSubTableArray with one record followed by the index sub-table itself.
    uint32_t array_offset = uint32_t(cblc.size());
    cblc.u16(first).u16(last).u32(8);
    cblc.u16(1).u16(17).u32(uint32_t(cbdt.size()));

    uint32_t image_offset = 0;
    for (const std::vector<uint8_t>& png : strike.images) {
      cblc.u32(image_offset);
      if (!png.empty()) {
        cbdt.u8(strike.ppem).u8(strike.ppem).i8(1).i8(int32_t(strike.ppem) - 2).u8(strike.ppem + 1u);
        cbdt.u32(uint32_t(png.size())).bytes(png);
        image_offset += 9u + uint32_t(png.size());
      }
    }
    cblc.u32(image_offset);

    ByteBuilder bitmap_size;
    bitmap_size.u32(array_offset)
               .u32(uint32_t(cblc.size()) - array_offset)
               .u32(1)
               .u32(0)
               .zeros(24)
               .u16(first)
               .u16(last)
               .u8(strike.ppem)
               .u8(strike.ppem)
               .u8(strike.bit_depth)
               .u8(0x01);
    memcpy(cblc._data.data() + sizes_offset + i * 48u, bitmap_size.data(), 48u);
  }
}

//! Glyph data record of 'sbix' strike, zero `graphic_type` means the glyph has no data.
struct SbixGlyph {
  TCTag graphic_type;
  std::vector<uint8_t> data;
};

//! Strike of 'sbix' table, `glyphs` has an entry for every glyph of the face.
struct SbixStrike {
  uint32_t ppem;
  std::vector<SbixGlyph> glyphs;
};

static inline SbixGlyph sbix_png(size_t size, uint8_t fill = 0x5A) {
  return SbixGlyph{TC_MAKE_TAG('p', 'n', 'g', ' '), std::vector<uint8_t>(size, fill)};
}

static inline SbixGlyph sbix_dupe(uint32_t glyph_id) {
  return SbixGlyph{TC_MAKE_TAG('d', 'u', 'p', 'e'), std::vector<uint8_t>{uint8_t(glyph_id >> 8), uint8_t(glyph_id & 0xFFu)}};
}

//! 'sbix' table version 1.
static inline ByteBuilder make_sbix(const std::vector<SbixStrike>& strikes) {
  ByteBuilder b;
  b.u16(1).u16(1).u32(uint32_t(strikes.size()));

  size_t offsets_offset = b.size();
  b.zeros(strikes.size() * 4u);

  for (size_t i = 0; i < strikes.size(); i++) {
    const SbixStrike& strike = strikes[i];
    b.patch_u32(offsets_offset + i * 4u, uint32_t(b.size()));

    uint32_t glyph_offset = 4u + (uint32_t(strike.glyphs.size()) + 1u) * 4u;
    b.u16(strike.ppem).u16(72);

    for (const SbixGlyph& glyph : strike.glyphs) {
      b.u32(glyph_offset);
      if (glyph.graphic_type)
        glyph_offset += 8u + uint32_t(glyph.data.size());
    }
    b.u32(glyph_offset);

    for (const SbixGlyph& glyph : strike.glyphs) {
      if (glyph.graphic_type)
        b.i16(0).i16(-2).u32(glyph.graphic_type).bytes(glyph.data);
    }
  }

  return b;
}

//! SVG document covering glyphs [start_glyph, end_glyph].
struct SvgDocument {
  uint32_t start_glyph;
  uint32_t end_glyph;
  std::vector<uint8_t> content;
};

static inline std::vector<uint8_t> svg_text(const char* text) {
  return std::vector<uint8_t>(text, text + strlen(text));
}

//! 'SVG ' table version 0, document list directly follows the header.
static inline ByteBuilder make_svg(const std::vector<SvgDocument>& documents) {
  ByteBuilder b;
  b.u16(0).u32(10).u32(0);
  b.u16(uint32_t(documents.size()));

  uint32_t offset = 2u + uint32_t(documents.size()) * 12u;
  for (const SvgDocument& document : documents) {
    b.u16(document.start_glyph).u16(document.end_glyph).u32(offset).u32(uint32_t(document.content.size()));
    offset += uint32_t(document.content.size());
  }

  for (const SvgDocument& document : documents)
    b.bytes(document.content);

  return b;
}

//! 'post' table header of the given version without any version specific data.
static inline ByteBuilder make_post_header(uint32_t version) {
  ByteBuilder b;
  b.u32(version)
   .u32(0)
   .i16(-100)
   .i16(50)
   .u32(0)
   .zeros(16);
  return b;
}

//! 'post' version 2.0 naming glyphs by `names`.
//!
//! A name that matches a standard Macintosh name at `standard` uses its index, other names are stored as strings.
static inline ByteBuilder make_post_v2(const std::vector<std::string>& names, const std::vector<std::pair<std::string, uint32_t>>& standard = {}) {
  ByteBuilder b = make_post_header(0x00020000u);
  b.u16(uint32_t(names.size()));

  std::vector<std::string> strings;
  for (const std::string& name : names) {
    uint32_t index = 0xFFFFFFFFu;
    for (const auto& entry : standard) {
      if (entry.first == name)
        index = entry.second;
    }

    if (index == 0xFFFFFFFFu) {
      index = 258u + uint32_t(strings.size());
      strings.push_back(name);
    }
    b.u16(index);
  }

  for (const std::string& s : strings)
    b.u8(uint32_t(s.size())).bytes(s.data(), s.size());

  return b;
}

//! A minimal font with a Unicode (3, 1) character map, 'maxp', 'hhea', and 'hmtx' tables.
//!
//! Every glyph `i` has an advance of `500 + i * 10` and a left side bearing of `i`.
static inline FontBuilder make_basic_font(uint32_t glyph_count, const std::vector<std::pair<uint32_t, uint32_t>>& map) {
  std::vector<std::pair<uint32_t, int32_t>> metrics;
  for (uint32_t i = 0; i < glyph_count; i++)
    metrics.push_back(std::make_pair(500u + i * 10u, int32_t(i)));

  FontBuilder fb;
  fb.add_table(TC_MAKE_TAG('c', 'm', 'a', 'p'), make_cmap({ CMapRecord{3, 1, make_cmap_format4(map)} }))
    .add_table(TC_MAKE_TAG('m', 'a', 'x', 'p'), make_maxp(glyph_count))
    .add_table(TC_MAKE_TAG('h', 'h', 'e', 'a'), make_hhea(800, -200, 90, glyph_count))
    .add_table(TC_MAKE_TAG('h', 'm', 't', 'x'), make_hmtx(metrics));
  return fb;
}

} // {tctest}

#endif // TESTING_COMMONS_FONTBUILDER_H_INCLUDED
