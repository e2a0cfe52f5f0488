// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TYPECASE_OPENTYPE_OTLAYOUT_P_H_INCLUDED
#define TYPECASE_OPENTYPE_OTLAYOUT_P_H_INCLUDED

#include <typecase/core/fontdata_p.h>
#include <typecase/core/fontlayout_p.h>
#include <typecase/opentype/otdefs_p.h>
#include <typecase/support/ptrops_p.h>

//! \cond INTERNAL
//! \addtogroup typecase_opentype_impl
//! \{

namespace tc::OpenType {

//! OpenType class-definition table.
struct ClassDefTable {
  // Let's assume that Format2 table would contain at least one record.
  enum : uint32_t { kBaseSize = 6 };

  struct Range {
    UInt16 first_glyph;
    UInt16 last_glyph;
    UInt16 class_value;
  };

  struct Format1 {
    enum : uint32_t { kBaseSize = 6 };

    UInt16 format;
    UInt16 first_glyph;
    Array16<UInt16> class_values;
  };

  struct Format2 {
    enum : uint32_t { kBaseSize = 4 };

    UInt16 format;
    Array16<Range> ranges;
  };

  UInt16 format;

  TC_INLINE_NODEBUG const Format1* format1() const noexcept { return PtrOps::offset<const Format1>(this, 0); }
  TC_INLINE_NODEBUG const Format2* format2() const noexcept { return PtrOps::offset<const Format2>(this, 0); }
};

//! Iterates a class-definition table, which must have been validated.
class ClassDefTableIterator {
public:
  typedef ClassDefTable::Range Range;

  const void* _array;
  uint32_t _size;
  uint32_t _first_glyph;

  //! Initializes the iterator and returns the format of the table, or zero if the table is empty or malformed.
  TC_INLINE_IF_NOT_DEBUG uint32_t init(RawTable table) noexcept {
    const void* array = nullptr;
    uint32_t size = 0;
    uint32_t format = 0;
    uint32_t first_glyph = 0;

    if (TC_LIKELY(table.size >= ClassDefTable::kBaseSize)) {
      uint32_t required_table_size = 0;
      format = table.data_as<ClassDefTable>()->format();

      switch (format) {
        case 1: {
          const ClassDefTable::Format1* fmt1 = table.data_as<ClassDefTable::Format1>();

          size = fmt1->class_values.count();
          array = fmt1->class_values.array();
          first_glyph = fmt1->first_glyph();
          required_table_size = uint32_t(sizeof(ClassDefTable::Format1)) + size * 2u;
          break;
        }

        case 2: {
          const ClassDefTable::Format2* fmt2 = table.data_as<ClassDefTable::Format2>();

          size = fmt2->ranges.count();
          array = fmt2->ranges.array();
          first_glyph = fmt2->ranges.array()[0].first_glyph();
          required_table_size = uint32_t(sizeof(ClassDefTable::Format2)) + size * uint32_t(sizeof(ClassDefTable::Range));
          break;
        }

        default:
          format = 0;
          break;
      }

      if (!size || required_table_size > table.size)
        format = 0;
    }

    _array = array;
    _size = size;
    _first_glyph = first_glyph;

    return format;
  }

  template<typename T>
  TC_INLINE_NODEBUG const T& at(size_t index) const noexcept { return static_cast<const T*>(_array)[index]; }

  template<uint32_t Format>
  TC_INLINE_IF_NOT_DEBUG uint32_t class_of_glyph(TCGlyphId glyph_id) const noexcept {
    if (Format == 1) {
      uint32_t index = glyph_id - _first_glyph;
      if (glyph_id < _first_glyph || index >= _size)
        return 0;
      return at<UInt16>(index).value();
    }
    else {
      const Range* base = static_cast<const Range*>(_array);
      uint32_t size = _size;

      while (uint32_t half = size / 2u) {
        const Range* middle = base + half;
        size -= half;
        if (glyph_id >= middle->first_glyph())
          base = middle;
      }

      uint32_t class_value = base->class_value();
      if (glyph_id < base->first_glyph() || glyph_id > base->last_glyph())
        class_value = 0;
      return class_value;
    }
  }

  TC_INLINE uint32_t class_of_glyph_with_format(uint32_t format, TCGlyphId glyph_id) const noexcept {
    if (format == 1)
      return class_of_glyph<1>(glyph_id);
    else if (format == 2)
      return class_of_glyph<2>(glyph_id);
    else
      return 0;
  }
};

//! OpenType 'GDEF' table.
//!
//! External Resources:
//!   - https://docs.microsoft.com/en-us/typography/opentype/spec/gdef
struct GDefTable {
  enum : uint32_t { kBaseSize = 12 };

  struct HeaderV1_0 {
    enum : uint32_t { kBaseSize = 12 };

    F16x16 version;
    Offset16 glyph_class_def_offset;
    Offset16 attach_list_offset;
    Offset16 lig_caret_list_offset;
    Offset16 mark_attach_class_def_offset;
  };

  struct HeaderV1_2 : public HeaderV1_0 {
    enum : uint32_t { kBaseSize = 14 };

    Offset16 mark_glyph_sets_def_offset;
  };

  struct HeaderV1_3 : public HeaderV1_2 {
    enum : uint32_t { kBaseSize = 18 };

    Offset32 item_var_store_offset;
  };

  struct MarkGlyphSets {
    enum : uint32_t { kBaseSize = 4 };

    UInt16 format;
    Array16<Offset32> coverage_offsets;
  };

  HeaderV1_0 header;

  TC_INLINE_NODEBUG const HeaderV1_0* v1_0() const noexcept { return &header; }
  TC_INLINE_NODEBUG const HeaderV1_2* v1_2() const noexcept { return PtrOps::offset<const HeaderV1_2>(this, 0); }
  TC_INLINE_NODEBUG const HeaderV1_3* v1_3() const noexcept { return PtrOps::offset<const HeaderV1_3>(this, 0); }
};

//! Base class for 'GSUB' and 'GPOS' tables.
//!
//! External Resources:
//!   - https://docs.microsoft.com/en-us/typography/opentype/spec/chapter2
struct GSubGPosTable {
  enum : uint32_t { kBaseSize = 10 };

  //! Lookup type of an extension lookup in 'GSUB' table.
  static inline constexpr uint32_t kGSubExtensionType = 7;
  //! Lookup type of an extension lookup in 'GPOS' table.
  static inline constexpr uint32_t kGPosExtensionType = 9;

  struct HeaderV1_0 {
    enum : uint32_t { kBaseSize = 10 };

    F16x16 version;
    Offset16 script_list_offset;
    Offset16 feature_list_offset;
    Offset16 lookup_list_offset;
  };

  struct HeaderV1_1 : public HeaderV1_0 {
    enum : uint32_t { kBaseSize = 14 };

    Offset32 feature_variations_offset;
  };

  struct ScriptTable {
    enum : uint32_t { kBaseSize = 4 };

    Offset16 lang_sys_default;
    Array16<TagRef16> lang_sys_offsets;
  };

  struct FeatureTable {
    enum : uint32_t { kBaseSize = 4 };

    Offset16 feature_params_offset;
    Array16<UInt16> lookup_list_indexes;
  };

  struct LookupTable {
    enum : uint32_t { kBaseSize = 6 };

    UInt16 lookup_type;
    UInt16 lookup_flags;
    Array16<Offset16> sub_table_offsets;
    /*
    UInt16 mark_filtering_set;
    */
  };

  struct ExtensionLookup {
    enum : uint32_t { kBaseSize = 8 };

    UInt16 format;
    UInt16 lookup_type;
    Offset32 offset;
  };

  HeaderV1_0 header;

  TC_INLINE_NODEBUG const HeaderV1_0* v1_0() const noexcept { return &header; }
  TC_INLINE_NODEBUG const HeaderV1_1* v1_1() const noexcept { return PtrOps::offset<const HeaderV1_1>(this, 0); }
};

namespace LayoutImpl {

//! Parses 'GDEF' table held by `blob` and stores the result in `out`.
TC_HIDDEN TCResult create_gdef(const FontTableBlob& blob, TCGDefTable* out) noexcept;

//! Parses 'GSUB' or 'GPOS' table held by `blob` and stores the result in `out`.
TC_HIDDEN TCResult create_layout_cache(TCLayoutKind kind, const FontTableBlob& blob, TCLayoutCache* out) noexcept;

//! Returns a class of `glyph_id` defined by a class-definition table at `offset` of `table` (zero if not defined).
TC_HIDDEN uint32_t class_of_glyph(RawTable table, uint32_t offset, TCGlyphId glyph_id) noexcept;

//! Returns a tag of a record at `index` of a script or feature list at `list_offset`.
TC_HIDDEN TCTag list_record_tag(RawTable table, uint32_t list_offset, uint32_t index) noexcept;

//! Returns a lookup table at `index`, extension lookups are not resolved.
TC_HIDDEN RawTable lookup_table(const TCLayoutCacheImpl* impl, uint32_t index) noexcept;

//! Resolves a type of a lookup at `index`, see \ref TCLayoutCache::lookup_type().
TC_HIDDEN uint32_t resolve_lookup_type(const TCLayoutCacheImpl* impl, uint32_t index) noexcept;

} // {LayoutImpl}
} // {tc::OpenType}

//! \}
//! \endcond

#endif // TYPECASE_OPENTYPE_OTLAYOUT_P_H_INCLUDED
