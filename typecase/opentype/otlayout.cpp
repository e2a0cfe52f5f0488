// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <typecase/core/api-build_p.h>
#include <typecase/core/fontlayout_p.h>
#include <typecase/core/object_p.h>
#include <typecase/core/trace_p.h>
#include <typecase/opentype/otlayout_p.h>

namespace tc::OpenType {
namespace LayoutImpl {

// tc::OpenType::LayoutImpl - Trace
// ================================

#if defined(TC_TRACE_OT_ALL) || defined(TC_TRACE_OT_LAYOUT)
#define Trace TCDebugTrace
#else
#define Trace TCDummyTrace
#endif

// tc::OpenType::LayoutImpl - ClassDef Validation
// ==============================================

static TC_NOINLINE bool validate_class_def_table(Trace& trace, Table<ClassDefTable> table, const char* table_name) noexcept {
  if (!table.fits())
    return trace.fail("%s is truncated [Size=%u Required=%u]\n", table_name, table.size, uint32_t(ClassDefTable::kBaseSize));

  uint32_t format = table->format();
  switch (format) {
    case 1: {
      const ClassDefTable::Format1* f = table->format1();
      uint32_t count = f->class_values.count();

      uint32_t header_size = ClassDefTable::Format1::kBaseSize + count * 2u;
      if (!table.fits(header_size))
        return trace.fail("%s is truncated [Size=%u Required=%u]\n", table_name, table.size, header_size);

      return true;
    }

    case 2: {
      const ClassDefTable::Format2* f = table->format2();
      uint32_t count = f->ranges.count();

      // An empty ClassDef is valid, it just doesn't classify any glyph.
      if (!count)
        return true;

      uint32_t header_size = ClassDefTable::Format2::kBaseSize + count * uint32_t(sizeof(ClassDefTable::Range));
      if (!table.fits(header_size))
        return trace.fail("%s is truncated [Size=%u Required=%u]\n", table_name, table.size, header_size);

      const ClassDefTable::Range* range_array = f->ranges.array();
      uint32_t last_glyph = range_array[0].last_glyph();

      if (range_array[0].first_glyph() > last_glyph)
        return trace.fail("%s Range[%u] first_glyph (%u) greater than last_glyph (%u)\n", table_name, 0u, range_array[0].first_glyph(), last_glyph);

      for (uint32_t i = 1; i < count; i++) {
        const ClassDefTable::Range& range = range_array[i];
        uint32_t first_glyph = range.first_glyph();

        if (first_glyph <= last_glyph)
          return trace.fail("%s Range[%u] first_glyph (%u) not greater than previous last_glyph (%u)\n", table_name, i, first_glyph, last_glyph);

        last_glyph = range.last_glyph();
        if (first_glyph > last_glyph)
          return trace.fail("%s Range[%u] first_glyph (%u) greater than last_glyph (%u)\n", table_name, i, first_glyph, last_glyph);
      }

      return true;
    }

    default:
      return trace.fail("%s has invalid format (%u)\n", table_name, format);
  }
}

static TCResult validate_class_def_offset(Trace& trace, RawTable table, uint32_t header_size, uint32_t offset, const char* table_name) noexcept {
  if (!offset)
    return TC_SUCCESS;

  if (offset < header_size || offset >= table.size) {
    trace.fail("%s has invalid offset (%u), valid range=[%u:%u]\n", table_name, offset, header_size, table.size);
    return tc_make_error(TC_ERROR_INVALID_DATA);
  }

  if (!validate_class_def_table(trace, table.sub_table_unchecked(offset), table_name))
    return tc_make_error(TC_ERROR_INVALID_DATA);

  return TC_SUCCESS;
}

// tc::OpenType::LayoutImpl - GDEF - Init
// ======================================

TCResult create_gdef(const FontTableBlob& blob, TCGDefTable* out) noexcept {
  Table<GDefTable> gdef(blob.table());

  Trace trace;
  trace.info("tc::OpenType::LayoutImpl::InitGDef [Size=%u]\n", gdef.size);
  trace.indent();

  if (!gdef.fits()) {
    trace.fail("Table is truncated\n");
    return tc_make_error(TC_ERROR_DATA_TRUNCATED);
  }

  uint32_t version = gdef->v1_0()->version();
  uint32_t header_size = GDefTable::HeaderV1_0::kBaseSize;

  if (version >= 0x00010002u)
    header_size = GDefTable::HeaderV1_2::kBaseSize;

  if (version >= 0x00010003u)
    header_size = GDefTable::HeaderV1_3::kBaseSize;

  if (TC_UNLIKELY(version < 0x00010000u || version > 0x00010003u)) {
    trace.fail("Invalid version [%08X]\n", version);
    return tc_make_error(TC_ERROR_INVALID_SIGNATURE);
  }

  if (TC_UNLIKELY(gdef.size < header_size)) {
    trace.fail("Table [v%u.%u] is truncated [Size=%u Required=%u]\n", version >> 16, version & 0xFFFFu, gdef.size, header_size);
    return tc_make_error(TC_ERROR_DATA_TRUNCATED);
  }

  uint32_t glyph_class_def_offset = gdef->v1_0()->glyph_class_def_offset();
  uint32_t mark_attach_class_def_offset = gdef->v1_0()->mark_attach_class_def_offset();
  uint32_t mark_glyph_sets_def_offset = version >= 0x00010002u ? uint32_t(gdef->v1_2()->mark_glyph_sets_def_offset()) : uint32_t(0);
  uint32_t mark_glyph_set_count = 0;

  // Some fonts have incorrect value of `GlyphClassDefOffset` set to 10. This collides with the header which is
  // 12 bytes. It's probably a result of some broken tool used to write such fonts in the past. We simply fix
  // this issue by changing the `header_size` to 10 and ignoring `mark_attach_class_def_offset`.
  if (glyph_class_def_offset == 10 && version == 0x00010000u) {
    header_size = 10;
    mark_attach_class_def_offset = 0;
  }

  TC_PROPAGATE(validate_class_def_offset(trace, gdef, header_size, glyph_class_def_offset, "GlyphClassDef"));
  TC_PROPAGATE(validate_class_def_offset(trace, gdef, header_size, mark_attach_class_def_offset, "MarkAttachClassDef"));

  if (mark_glyph_sets_def_offset) {
    if (mark_glyph_sets_def_offset < header_size || !gdef.fits(mark_glyph_sets_def_offset, GDefTable::MarkGlyphSets::kBaseSize)) {
      trace.fail("MarkGlyphSetsDef has invalid offset (%u)\n", mark_glyph_sets_def_offset);
      return tc_make_error(TC_ERROR_INVALID_DATA);
    }

    Table<GDefTable::MarkGlyphSets> sets(gdef.sub_table_unchecked(mark_glyph_sets_def_offset));
    if (sets->format() != 1) {
      trace.fail("MarkGlyphSetsDef has invalid format (%u)\n", sets->format());
      return tc_make_error(TC_ERROR_INVALID_DATA);
    }

    mark_glyph_set_count = sets->coverage_offsets.count();
    if (!sets.fits(GDefTable::MarkGlyphSets::kBaseSize + mark_glyph_set_count * 4u)) {
      trace.fail("MarkGlyphSetsDef is truncated [Count=%u]\n", mark_glyph_set_count);
      return tc_make_error(TC_ERROR_DATA_TRUNCATED);
    }
  }

  trace.info("Version: %u.%u\n", version >> 16, version & 0xFFFFu);
  trace.info("GlyphClassDef: %u\n", glyph_class_def_offset);
  trace.info("MarkAttachClassDef: %u\n", mark_attach_class_def_offset);
  trace.info("MarkGlyphSetCount: %u\n", mark_glyph_set_count);

  TCGDefTableImpl* impl;
  TC_PROPAGATE(ObjectInternal::alloc_impl_t<TCGDefTableImpl>(&impl));

  impl->blob = blob;
  impl->version = version;
  impl->glyph_class_def_offset = glyph_class_def_offset;
  impl->mark_attach_class_def_offset = mark_attach_class_def_offset;
  impl->mark_glyph_sets_def_offset = mark_glyph_sets_def_offset;
  impl->mark_glyph_set_count = mark_glyph_set_count;

  ObjectInternal::replace_impl(out, impl);
  return TC_SUCCESS;
}

// tc::OpenType::LayoutImpl - GSUB & GPOS - Init
// =============================================

// Validates a script or feature list - both are arrays of TagRef16 records pointing to tables of `target_size`.
static TCResult validate_tag_ref_list(Trace& trace, RawTable table, uint32_t header_size, uint32_t list_offset, uint32_t target_size, const char* list_name, uint32_t* count_out) noexcept {
  *count_out = 0;
  if (!list_offset)
    return TC_SUCCESS;

  if (list_offset < header_size || !table.fits(list_offset, 2u)) {
    trace.fail("%s has invalid offset (%u), valid range=[%u:%u]\n", list_name, list_offset, header_size, table.size);
    return tc_make_error(TC_ERROR_INVALID_DATA);
  }

  RawTable list = table.sub_table_unchecked(list_offset);
  uint32_t count = list.data_as<Array16<TagRef16>>()->count();
  uint32_t list_header_size = 2u + count * uint32_t(sizeof(TagRef16));

  if (!list.fits(list_header_size)) {
    trace.fail("%s is truncated [Size=%u Required=%u]\n", list_name, list.size, list_header_size);
    return tc_make_error(TC_ERROR_DATA_TRUNCATED);
  }

  const TagRef16* records = list.data_as<Array16<TagRef16>>()->array();
  for (uint32_t i = 0; i < count; i++) {
    uint32_t offset = records[i].offset();
    if (offset < list_header_size || !list.fits(offset, target_size)) {
      trace.fail("%s has invalid offset at #%u: Offset=%u, ValidRange=[%u:%u]\n", list_name, i, offset, list_header_size, list.size);
      return tc_make_error(TC_ERROR_INVALID_DATA);
    }
  }

  *count_out = count;
  return TC_SUCCESS;
}

static TCResult validate_lookup_list(Trace& trace, RawTable table, uint32_t header_size, uint32_t list_offset, uint32_t* count_out) noexcept {
  *count_out = 0;
  if (!list_offset)
    return TC_SUCCESS;

  if (list_offset < header_size || !table.fits(list_offset, 2u)) {
    trace.fail("LookupList has invalid offset (%u), valid range=[%u:%u]\n", list_offset, header_size, table.size);
    return tc_make_error(TC_ERROR_INVALID_DATA);
  }

  RawTable list = table.sub_table_unchecked(list_offset);
  uint32_t count = list.data_as<Array16<Offset16>>()->count();
  uint32_t list_header_size = 2u + count * 2u;

  if (!list.fits(list_header_size)) {
    trace.fail("LookupList is truncated [Size=%u Required=%u]\n", list.size, list_header_size);
    return tc_make_error(TC_ERROR_DATA_TRUNCATED);
  }

  const Offset16* offsets = list.data_as<Array16<Offset16>>()->array();
  for (uint32_t i = 0; i < count; i++) {
    uint32_t offset = offsets[i].value();
    if (offset < list_header_size || !list.fits(offset, GSubGPosTable::LookupTable::kBaseSize)) {
      trace.fail("LookupList has invalid offset at #%u: Offset=%u, ValidRange=[%u:%u]\n", i, offset, list_header_size, list.size);
      return tc_make_error(TC_ERROR_INVALID_DATA);
    }

    Table<GSubGPosTable::LookupTable> lookup(list.sub_table_unchecked(offset));
    uint32_t sub_table_count = lookup->sub_table_offsets.count();

    if (!lookup.fits(GSubGPosTable::LookupTable::kBaseSize + sub_table_count * 2u)) {
      trace.fail("Lookup #%u is truncated [SubTableCount=%u]\n", i, sub_table_count);
      return tc_make_error(TC_ERROR_DATA_TRUNCATED);
    }
  }

  *count_out = count;
  return TC_SUCCESS;
}

TCResult create_layout_cache(TCLayoutKind kind, const FontTableBlob& blob, TCLayoutCache* out) noexcept {
  Table<GSubGPosTable> table(blob.table());

  Trace trace;
  trace.info("tc::OpenType::LayoutImpl::Init%s [Size=%u]\n", kind == TC_LAYOUT_KIND_GSUB ? "GSUB" : "GPOS", table.size);
  trace.indent();

  if (!table.fits()) {
    trace.fail("Table is truncated\n");
    return tc_make_error(TC_ERROR_DATA_TRUNCATED);
  }

  uint32_t version = table->v1_0()->version();
  uint32_t header_size = GSubGPosTable::HeaderV1_0::kBaseSize;

  if (version == 0x00010001u)
    header_size = GSubGPosTable::HeaderV1_1::kBaseSize;
  else if (version != 0x00010000u) {
    trace.fail("Invalid version [%08X]\n", version);
    return tc_make_error(TC_ERROR_INVALID_SIGNATURE);
  }

  if (!table.fits(header_size)) {
    trace.fail("Table [v1.1] is truncated\n");
    return tc_make_error(TC_ERROR_DATA_TRUNCATED);
  }

  uint32_t script_list_offset = table->v1_0()->script_list_offset();
  uint32_t feature_list_offset = table->v1_0()->feature_list_offset();
  uint32_t lookup_list_offset = table->v1_0()->lookup_list_offset();

  uint32_t script_count;
  uint32_t feature_count;
  uint32_t lookup_count;

  TC_PROPAGATE(validate_tag_ref_list(trace, table, header_size, script_list_offset, GSubGPosTable::ScriptTable::kBaseSize, "ScriptList", &script_count));
  TC_PROPAGATE(validate_tag_ref_list(trace, table, header_size, feature_list_offset, GSubGPosTable::FeatureTable::kBaseSize, "FeatureList", &feature_count));
  TC_PROPAGATE(validate_lookup_list(trace, table, header_size, lookup_list_offset, &lookup_count));

  trace.info("Version: %u.%u\n", version >> 16, version & 0xFFFFu);
  trace.info("ScriptCount: %u\n", script_count);
  trace.info("FeatureCount: %u\n", feature_count);
  trace.info("LookupCount: %u\n", lookup_count);

  TCLayoutCacheImpl* impl;
  TC_PROPAGATE(ObjectInternal::alloc_impl_t<TCLayoutCacheImpl>(&impl));

  impl->blob = blob;
  impl->kind = kind;
  impl->version = version;
  impl->script_list_offset = script_list_offset;
  impl->feature_list_offset = feature_list_offset;
  impl->lookup_list_offset = lookup_list_offset;
  impl->script_count = script_count;
  impl->feature_count = feature_count;
  impl->lookup_count = lookup_count;

  ObjectInternal::replace_impl(out, impl);
  return TC_SUCCESS;
}

// tc::OpenType::LayoutImpl - Queries
// ==================================

uint32_t class_of_glyph(RawTable table, uint32_t offset, TCGlyphId glyph_id) noexcept {
  if (!offset)
    return 0;

  ClassDefTableIterator it;
  uint32_t format = it.init(table.sub_table(offset));
  return it.class_of_glyph_with_format(format, glyph_id);
}

TCTag list_record_tag(RawTable table, uint32_t list_offset, uint32_t index) noexcept {
  const Array16<TagRef16>* list = table.data_as<Array16<TagRef16>>(list_offset);
  return list->array()[index].tag();
}

RawTable lookup_table(const TCLayoutCacheImpl* impl, uint32_t index) noexcept {
  if (index >= impl->lookup_count)
    return RawTable();

  RawTable list = RawTable(impl->blob.table()).sub_table(impl->lookup_list_offset);
  uint32_t offset = list.data_as<Array16<Offset16>>()->array()[index].value();
  return list.sub_table(offset);
}

uint32_t resolve_lookup_type(const TCLayoutCacheImpl* impl, uint32_t index) noexcept {
  Table<GSubGPosTable::LookupTable> lookup(lookup_table(impl, index));
  if (lookup.is_empty())
    return 0;

  uint32_t extension_type = impl->kind == TC_LAYOUT_KIND_GSUB ? GSubGPosTable::kGSubExtensionType : GSubGPosTable::kGPosExtensionType;
  uint32_t lookup_type = lookup->lookup_type();

  if (lookup_type != extension_type)
    return lookup_type;

  // All sub-tables of an extension lookup must wrap the same lookup type, so checking the first one is enough.
  if (!lookup->sub_table_offsets.count())
    return 0;

  uint32_t sub_table_offset = lookup->sub_table_offsets.array()[0].value();
  if (!lookup.fits(sub_table_offset, GSubGPosTable::ExtensionLookup::kBaseSize))
    return 0;

  const GSubGPosTable::ExtensionLookup* extension = lookup.data_as<GSubGPosTable::ExtensionLookup>(sub_table_offset);
  uint32_t wrapped_type = extension->lookup_type();

  if (extension->format() != 1 || wrapped_type == extension_type)
    return 0;

  return wrapped_type;
}

} // {LayoutImpl}
} // {tc::OpenType}
