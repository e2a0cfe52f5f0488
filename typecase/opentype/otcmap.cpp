// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <typecase/core/api-build_p.h>
#include <typecase/core/trace_p.h>
#include <typecase/opentype/otcmap_p.h>
#include <typecase/opentype/otplatform_p.h>
#include <typecase/support/memops_p.h>
#include <typecase/support/ptrops_p.h>

namespace tc::OpenType {
namespace CMapImpl {

// tc::OpenType::CMapImpl - Trace
// ==============================

#if defined(TC_TRACE_OT_ALL) || defined(TC_TRACE_OT_CMAP)
#define Trace TCDebugTrace
#else
#define Trace TCDummyTrace
#endif

// tc::OpenType::CMapImpl - Select Encoding
// ========================================

static constexpr uint32_t kAnyEncoding = 0xFFFFFFFFu;

static const CMapTable::Encoding* find_encoding_record(const CMapTable::Encoding* records, uint32_t count, uint32_t platform_id, uint32_t encoding_id) noexcept {
  for (uint32_t i = 0; i < count; i++) {
    const CMapTable::Encoding& record = records[i];
    if (record.platform_id() == platform_id && (encoding_id == kAnyEncoding || record.encoding_id() == encoding_id))
      return &record;
  }
  return nullptr;
}

TCResult select_encoding(RawTable cmap_table, bool* found, TCCharEncoding* encoding_out, uint32_t* offset_out) noexcept {
  Table<CMapTable> cmap(cmap_table);
  *found = false;

  Trace trace;
  trace.info("tc::OpenType::CMapImpl::SelectEncoding [Size=%u]\n", cmap.size);
  trace.indent();

  if (!cmap.fits()) {
    trace.fail("Table is truncated\n");
    return tc_make_error(TC_ERROR_DATA_TRUNCATED);
  }

  uint32_t encoding_count = cmap->encodings.count();
  if (cmap.size < CMapTable::kBaseSize + encoding_count * uint32_t(sizeof(CMapTable::Encoding))) {
    trace.fail("Table is truncated [EncodingCount=%u]\n", encoding_count);
    return tc_make_error(TC_ERROR_DATA_TRUNCATED);
  }

  struct Candidate {
    uint32_t platform_id;
    uint32_t encoding_id;
    TCCharEncoding encoding;
  };

  static const Candidate candidates[] = {
    { Platform::kPlatformWindows, Platform::kWindowsEncodingUCS4    , TC_CHAR_ENCODING_UNICODE     },
    { Platform::kPlatformWindows, Platform::kWindowsEncodingUCS2    , TC_CHAR_ENCODING_UNICODE     },
    { Platform::kPlatformUnicode, Platform::kUnicodeEncoding2_0Full , TC_CHAR_ENCODING_UNICODE     },
    { Platform::kPlatformUnicode, kAnyEncoding                      , TC_CHAR_ENCODING_UNICODE     },
    { Platform::kPlatformWindows, Platform::kWindowsEncodingSymbol  , TC_CHAR_ENCODING_SYMBOL      },
    { Platform::kPlatformMac    , Platform::kMacEncodingRoman       , TC_CHAR_ENCODING_APPLE_ROMAN },
    { Platform::kPlatformWindows, Platform::kWindowsEncodingBig5    , TC_CHAR_ENCODING_BIG5        }
  };

  const CMapTable::Encoding* records = cmap->encodings.array();
  for (const Candidate& candidate : candidates) {
    const CMapTable::Encoding* record = find_encoding_record(records, encoding_count, candidate.platform_id, candidate.encoding_id);
    if (record) {
      trace.info("Selected [PlatformId=%u EncodingId=%u Offset=%u]\n", record->platform_id(), record->encoding_id(), record->offset());

      *found = true;
      *encoding_out = candidate.encoding;
      *offset_out = record->offset();
      return TC_SUCCESS;
    }
  }

  trace.warn("No usable encoding record [EncodingCount=%u]\n", encoding_count);
  return TC_SUCCESS;
}

// tc::OpenType::CMapImpl - Validate
// =================================

TCResult validate_sub_table(RawTable cmap_table, uint32_t sub_table_offset, CMapEncoding& encoding_out) noexcept {
  if (cmap_table.size < 4u || sub_table_offset > cmap_table.size - 4u)
    return tc_make_error(TC_ERROR_INVALID_DATA);

  uint32_t format = cmap_table.readU16(sub_table_offset);
  switch (format) {
    // Format 0 - Byte Encoding Table
    // ------------------------------

    case 0: {
      Table<CMapTable::Format0> sub_table(cmap_table.sub_table_unchecked(sub_table_offset));
      if (!sub_table.fits())
        return tc_make_error(TC_ERROR_DATA_TRUNCATED);

      uint32_t length = sub_table->length();
      if (length < CMapTable::Format0::kBaseSize || length > sub_table.size)
        return tc_make_error(TC_ERROR_INVALID_DATA);

      encoding_out.offset = sub_table_offset;
      encoding_out.entry_count = 256;
      encoding_out.format = format;
      return TC_SUCCESS;
    }

    // Format 2 - High-Byte Mapping Through Table
    // ------------------------------------------

    case 2: {
      Table<CMapTable::Format2> sub_table(cmap_table.sub_table_unchecked(sub_table_offset));
      if (!sub_table.fits())
        return tc_make_error(TC_ERROR_DATA_TRUNCATED);

      uint32_t length = sub_table->length();
      if (length < CMapTable::Format2::kBaseSize || length > sub_table.size)
        return tc_make_error(TC_ERROR_INVALID_DATA);

      // Each key is a byte offset to the sub-header array (index * 8).
      uint32_t max_key = 0;
      for (uint32_t i = 0; i < 256; i++) {
        uint32_t key = sub_table->sub_header_keys[i]();
        if (key & 7u)
          return tc_make_error(TC_ERROR_INVALID_DATA);
        max_key = tc_max(max_key, key);
      }

      uint32_t sub_header_count = max_key / 8u + 1u;
      if (length < CMapTable::Format2::kBaseSize + sub_header_count * uint32_t(sizeof(CMapTable::Format2::SubHeader)))
        return tc_make_error(TC_ERROR_DATA_TRUNCATED);

      encoding_out.offset = sub_table_offset;
      encoding_out.entry_count = sub_header_count;
      encoding_out.format = format;
      return TC_SUCCESS;
    }

    // Format 4 - Segment Mapping to Delta Values
    // ------------------------------------------

    case 4: {
      Table<CMapTable::Format4> sub_table(cmap_table.sub_table_unchecked(sub_table_offset));
      if (!sub_table.fits())
        return tc_make_error(TC_ERROR_DATA_TRUNCATED);

      // Some fonts have a wrong 16-bit length (sub-tables larger than 64kB), use the real size in that case.
      uint32_t length = sub_table->length();
      if (length < CMapTable::Format4::kBaseSize)
        return tc_make_error(TC_ERROR_INVALID_DATA);
      length = tc_min(length, sub_table.size);

      uint32_t numSegX2 = sub_table->numSegX2();
      if (!numSegX2 || (numSegX2 & 1) != 0)
        return tc_make_error(TC_ERROR_INVALID_DATA);

      uint32_t num_seg = numSegX2 / 2;
      if (length < 16 + num_seg * 8)
        return tc_make_error(TC_ERROR_DATA_TRUNCATED);

      const UInt16* last_char_array = sub_table->last_char_array();
      const UInt16* first_char_array = sub_table->first_char_array(num_seg);
      const UInt16* id_offset_array = sub_table->id_offset_array(num_seg);

      uint32_t previous_end = 0;
      uint32_t num_seg_after_check = num_seg;

      for (uint32_t i = 0; i < num_seg; i++) {
        uint32_t last = last_char_array[i].value();
        uint32_t first = first_char_array[i].value();
        uint32_t id_offset = id_offset_array[i].value();

        if (first == 0xFFFF && last == 0xFFFF) {
          // We prefer number of segments without the ending mark(s). This handles also the case of data with
          // multiple ending marks.
          num_seg_after_check = tc_min(num_seg_after_check, i);
        }
        else {
          if (first < previous_end || first > last)
            return tc_make_error(TC_ERROR_INVALID_DATA);

          if (i != 0 && first == previous_end)
            return tc_make_error(TC_ERROR_INVALID_DATA);

          if (id_offset != 0) {
            // Offset to 16-bit data must be even.
            if (id_offset & 1)
              return tc_make_error(TC_ERROR_INVALID_DATA);

            // This just validates whether the table doesn't want us to jump somewhere outside, it doesn't validate
            // whether glyph ids are not outside the limit.
            uint32_t index_in_table = 16 + num_seg * 6u + i * 2u + id_offset + (last - first) * 2u;
            if (index_in_table + 2u > length)
              return tc_make_error(TC_ERROR_INVALID_DATA);
          }
        }

        previous_end = last;
      }

      if (!num_seg_after_check)
        return tc_make_error(TC_ERROR_INVALID_DATA);

      encoding_out.offset = sub_table_offset;
      encoding_out.entry_count = num_seg_after_check;
      encoding_out.format = format;
      return TC_SUCCESS;
    }

    // Format 6 - Trimmed Table Mapping
    // --------------------------------

    case 6: {
      Table<CMapTable::Format6> sub_table(cmap_table.sub_table_unchecked(sub_table_offset));
      if (!sub_table.fits())
        return tc_make_error(TC_ERROR_DATA_TRUNCATED);

      uint32_t length = sub_table->length();
      if (length < CMapTable::Format6::kBaseSize || length > sub_table.size)
        return tc_make_error(TC_ERROR_INVALID_DATA);

      uint32_t first = sub_table->first();
      uint32_t count = sub_table->count();

      if (first + count > 0x10000u)
        return tc_make_error(TC_ERROR_INVALID_DATA);

      if (length < uint32_t(sizeof(CMapTable::Format6)) + count * 2u)
        return tc_make_error(TC_ERROR_DATA_TRUNCATED);

      encoding_out.offset = sub_table_offset;
      encoding_out.entry_count = count;
      encoding_out.format = format;
      return TC_SUCCESS;
    }

    // Format 10 - Trimmed Array
    // -------------------------

    case 10: {
      Table<CMapTable::Format10> sub_table(cmap_table.sub_table_unchecked(sub_table_offset));
      if (!sub_table.fits())
        return tc_make_error(TC_ERROR_DATA_TRUNCATED);

      uint32_t length = sub_table->length();
      if (length < CMapTable::Format10::kBaseSize || length > sub_table.size)
        return tc_make_error(TC_ERROR_INVALID_DATA);

      uint32_t first = sub_table->first();
      uint32_t count = sub_table->glyph_ids.count();

      if (first > kCharMax || count > kCharMax + 1u || first + count > kCharMax + 1u)
        return tc_make_error(TC_ERROR_INVALID_DATA);

      if (length < uint32_t(sizeof(CMapTable::Format10)) + count * 2u)
        return tc_make_error(TC_ERROR_DATA_TRUNCATED);

      encoding_out.offset = sub_table_offset;
      encoding_out.entry_count = count;
      encoding_out.format = format;
      return TC_SUCCESS;
    }

    // Format 12 & 13 - Segmented Coverage / Many-To-One Range Mappings
    // ----------------------------------------------------------------

    case 12:
    case 13: {
      Table<CMapTable::Format12_13> sub_table(cmap_table.sub_table_unchecked(sub_table_offset));
      if (!sub_table.fits())
        return tc_make_error(TC_ERROR_DATA_TRUNCATED);

      uint32_t length = sub_table->length();
      if (length < CMapTable::Format12_13::kBaseSize || length > sub_table.size)
        return tc_make_error(TC_ERROR_INVALID_DATA);

      uint32_t count = sub_table->groups.count();
      if (count > kCharMax || length < uint32_t(sizeof(CMapTable::Format12_13)) + count * uint32_t(sizeof(CMapTable::Group)))
        return tc_make_error(TC_ERROR_DATA_TRUNCATED);

      const CMapTable::Group* group_array = sub_table->groups.array();
      uint32_t last = 0;

      for (uint32_t i = 0; i < count; i++) {
        uint32_t first = group_array[i].first();
        if (i != 0 && first <= last)
          return tc_make_error(TC_ERROR_INVALID_DATA);

        last = group_array[i].last();
        if (first > last || last > kCharMax)
          return tc_make_error(TC_ERROR_INVALID_DATA);
      }

      encoding_out.offset = sub_table_offset;
      encoding_out.entry_count = count;
      encoding_out.format = format;
      return TC_SUCCESS;
    }

    // Format 8 & 14 are not used for character to glyph mapping.
    case 8:
    case 14:
      return tc_make_error(TC_ERROR_NOT_IMPLEMENTED);

    // Invalid / Unknown
    // -----------------

    default:
      return tc_make_error(TC_ERROR_INVALID_DATA);
  }
}

// tc::OpenType::CMapImpl - Map
// ============================

static TCGlyphId map_format0(RawTable sub_table, uint32_t code) noexcept {
  if (code > 0xFFu)
    return 0;
  return sub_table.data_as<CMapTable::Format0>()->glyph_id_array[code].value();
}

static TCGlyphId map_format2(RawTable sub_table, uint32_t code) noexcept {
  if (code > 0xFFFFu)
    return 0;

  const CMapTable::Format2* table = sub_table.data_as<CMapTable::Format2>();
  uint32_t hi = code >> 8;
  uint32_t lo = code & 0xFFu;
  uint32_t sub_header_index;

  if (hi == 0) {
    // Single byte code, only valid if it's not a lead byte of a two byte sequence.
    if (table->sub_header_keys[lo]() != 0)
      return 0;
    sub_header_index = 0;
  }
  else {
    sub_header_index = table->sub_header_keys[hi]() / 8u;
    if (sub_header_index == 0)
      return 0;
  }

  const CMapTable::Format2::SubHeader& sub_header = table->sub_header_array()[sub_header_index];
  uint32_t first_code = sub_header.first_code();
  uint32_t entry_count = sub_header.entry_count();

  if (lo < first_code || lo - first_code >= entry_count)
    return 0;

  // The `id_range_offset` is relative to the location of the `id_range_offset` field itself.
  uint32_t field_offset = CMapTable::Format2::kBaseSize + sub_header_index * 8u + 6u;
  uint32_t glyph_offset = field_offset + sub_header.id_range_offset() + (lo - first_code) * 2u;

  if (!sub_table.fits(glyph_offset, 2u))
    return 0;

  uint32_t glyph_id = sub_table.readU16(glyph_offset);
  if (glyph_id != 0)
    glyph_id = (glyph_id + uint32_t(sub_header.id_delta())) & 0xFFFFu;
  return glyph_id;
}

static TCGlyphId map_format4(RawTable sub_table, uint32_t num_searchable_seg, uint32_t code) noexcept {
  if (code > 0xFFFFu)
    return 0;

  const CMapTable::Format4* table = sub_table.data_as<CMapTable::Format4>();
  size_t num_seg = size_t(table->numSegX2()) >> 1;

  const UInt16* last_char_array = table->last_char_array();
  const UInt16* first_char_array = table->first_char_array(num_seg);

  // Segments are sorted by their last character, find the first one that ends at or after `code`.
  size_t lo = 0;
  size_t hi = num_searchable_seg;

  while (lo < hi) {
    size_t mid = (lo + hi) >> 1;
    if (last_char_array[mid].value() < code)
      lo = mid + 1;
    else
      hi = mid;
  }

  if (lo == num_searchable_seg)
    return 0;

  uint32_t first = first_char_array[lo].value();
  if (code < first)
    return 0;

  uint32_t id_delta = table->id_delta_array(num_seg)[lo].value();
  uint32_t id_offset = table->id_offset_array(num_seg)[lo].value();

  if (id_offset == 0)
    return (code + id_delta) & 0xFFFFu;

  uint32_t glyph_offset = uint32_t(sizeof(CMapTable::Format4) + 2u + num_seg * 6u + lo * 2u) + id_offset + (code - first) * 2u;
  if (!sub_table.fits(glyph_offset, 2u))
    return 0;

  uint32_t glyph_id = sub_table.readU16(glyph_offset);
  if (glyph_id != 0)
    glyph_id = (glyph_id + id_delta) & 0xFFFFu;
  return glyph_id;
}

static TCGlyphId map_format6(RawTable sub_table, uint32_t code) noexcept {
  const CMapTable::Format6* table = sub_table.data_as<CMapTable::Format6>();
  uint32_t index = code - table->first();

  if (code < table->first() || index >= table->count())
    return 0;
  return table->glyph_id_array()[index].value();
}

static TCGlyphId map_format10(RawTable sub_table, uint32_t code) noexcept {
  const CMapTable::Format10* table = sub_table.data_as<CMapTable::Format10>();
  uint32_t index = code - table->first();

  if (code < table->first() || index >= table->glyph_ids.count())
    return 0;
  return table->glyph_ids.array()[index].value();
}

static TCGlyphId map_format12_13(RawTable sub_table, uint32_t group_count, uint32_t format, uint32_t code) noexcept {
  const CMapTable::Group* group_array = sub_table.data_as<CMapTable::Format12_13>()->groups.array();

  size_t lo = 0;
  size_t hi = group_count;

  while (lo < hi) {
    size_t mid = (lo + hi) >> 1;
    if (group_array[mid].last() < code)
      lo = mid + 1;
    else
      hi = mid;
  }

  if (lo == group_count)
    return 0;

  const CMapTable::Group& group = group_array[lo];
  uint32_t first = group.first();

  if (code < first)
    return 0;

  uint32_t glyph_id = format == 12 ? group.glyph_id() + (code - first) : group.glyph_id();
  return glyph_id <= 0xFFFFu ? glyph_id : 0u;
}

TCGlyphId map_char(RawTable cmap_table, const CMapEncoding& encoding, uint32_t code) noexcept {
  RawTable sub_table = cmap_table.sub_table(encoding.offset);

  switch (encoding.format) {
    case 0: return map_format0(sub_table, code);
    case 2: return map_format2(sub_table, code);
    case 4: return map_format4(sub_table, encoding.entry_count, code);
    case 6: return map_format6(sub_table, code);
    case 10: return map_format10(sub_table, code);
    case 12:
    case 13: return map_format12_13(sub_table, encoding.entry_count, encoding.format, code);
    default: return 0;
  }
}

// tc::OpenType::CMapImpl - Reverse Map
// ====================================

static TC_INLINE void add_reverse_mapping(uint32_t* codes_out, uint32_t glyph_count, uint32_t code, TCGlyphId glyph_id) noexcept {
  if (glyph_id != 0 && glyph_id < glyph_count && code < codes_out[glyph_id])
    codes_out[glyph_id] = code;
}

void build_reverse_map(RawTable cmap_table, const CMapEncoding& encoding, uint32_t* codes_out, uint32_t glyph_count) noexcept {
  for (uint32_t i = 0; i < glyph_count; i++)
    codes_out[i] = 0xFFFFFFFFu;

  RawTable sub_table = cmap_table.sub_table(encoding.offset);

  switch (encoding.format) {
    case 0: {
      for (uint32_t code = 0; code < 256u; code++)
        add_reverse_mapping(codes_out, glyph_count, code, map_format0(sub_table, code));
      break;
    }

    case 2: {
      const CMapTable::Format2* table = sub_table.data_as<CMapTable::Format2>();
      for (uint32_t hi = 0; hi < 256u; hi++) {
        uint32_t sub_header_index = table->sub_header_keys[hi]() / 8u;
        if (sub_header_index == 0) {
          add_reverse_mapping(codes_out, glyph_count, hi, map_format2(sub_table, hi));
          continue;
        }

        const CMapTable::Format2::SubHeader& sub_header = table->sub_header_array()[sub_header_index];
        uint32_t lo_first = sub_header.first_code();
        uint32_t lo_end = tc_min<uint32_t>(lo_first + sub_header.entry_count(), 256u);

        for (uint32_t lo = lo_first; lo < lo_end; lo++) {
          uint32_t code = (hi << 8) | lo;
          add_reverse_mapping(codes_out, glyph_count, code, map_format2(sub_table, code));
        }
      }
      break;
    }

    case 4: {
      const CMapTable::Format4* table = sub_table.data_as<CMapTable::Format4>();
      size_t num_seg = size_t(table->numSegX2()) >> 1;

      const UInt16* last_char_array = table->last_char_array();
      const UInt16* first_char_array = table->first_char_array(num_seg);

      for (uint32_t i = 0; i < encoding.entry_count; i++) {
        uint32_t first = first_char_array[i].value();
        uint32_t last = last_char_array[i].value();

        for (uint32_t code = first; code <= last; code++)
          add_reverse_mapping(codes_out, glyph_count, code, map_format4(sub_table, encoding.entry_count, code));
      }
      break;
    }

    case 6: {
      const CMapTable::Format6* table = sub_table.data_as<CMapTable::Format6>();
      uint32_t first = table->first();

      for (uint32_t i = 0; i < encoding.entry_count; i++)
        add_reverse_mapping(codes_out, glyph_count, first + i, table->glyph_id_array()[i].value());
      break;
    }

    case 10: {
      const CMapTable::Format10* table = sub_table.data_as<CMapTable::Format10>();
      uint32_t first = table->first();

      for (uint32_t i = 0; i < encoding.entry_count; i++)
        add_reverse_mapping(codes_out, glyph_count, first + i, table->glyph_ids.array()[i].value());
      break;
    }

    case 12:
    case 13: {
      const CMapTable::Group* group_array = sub_table.data_as<CMapTable::Format12_13>()->groups.array();

      for (uint32_t i = 0; i < encoding.entry_count; i++) {
        uint32_t first = group_array[i].first();
        uint32_t last = group_array[i].last();
        uint32_t glyph_id = group_array[i].glyph_id();

        if (encoding.format == 13) {
          add_reverse_mapping(codes_out, glyph_count, first, glyph_id);
          continue;
        }

        // Glyph ids grow with codes, stop as soon as they are out of range.
        for (uint32_t code = first; code <= last && glyph_id < glyph_count; code++, glyph_id++)
          add_reverse_mapping(codes_out, glyph_count, code, glyph_id);
      }
      break;
    }

    default:
      break;
  }
}

} // {CMapImpl}
} // {tc::OpenType}
