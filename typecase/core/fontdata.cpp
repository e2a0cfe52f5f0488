// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <typecase/core/api-build_p.h>
#include <typecase/core/fontdata_p.h>
#include <typecase/core/object_p.h>
#include <typecase/opentype/otcore_p.h>
#include <typecase/support/ptrops_p.h>

namespace tc {
namespace FontDataInternal {

// tc::FontData - Memory Impl
// ==========================

struct MemFontDataImpl : public TCFontDataImpl {
  //! Pointer to the start of font data.
  const void* data;
  //! Size of `data` [in bytes].
  uint32_t data_size;
  //! Offset to an array that contains offsets for each font face.
  uint32_t offset_array_index;

  //! Destroy function of external data, if provided.
  TCDestroyExternalDataFunc external_destroy_func;
  //! User data passed to `external_destroy_func`.
  void* user_data;
  //! Data owned by the implementation (when created by `create_from_data_copy()`).
  void* owned_data;

  TC_INLINE MemFontDataImpl() noexcept
    : data(nullptr),
      data_size(0),
      offset_array_index(0),
      external_destroy_func(nullptr),
      user_data(nullptr),
      owned_data(nullptr) {}

  TC_INLINE ~MemFontDataImpl() noexcept {
    if (external_destroy_func)
      external_destroy_func(this, const_cast<void*>(data), user_data);

    free(owned_data);
  }
};

static TCResult TC_CDECL mem_get_table_impl(const TCFontDataImpl* impl_, uint32_t face_index, TCTag tag, TCFontTable* out) noexcept {
  using namespace OpenType;

  const MemFontDataImpl* impl = static_cast<const MemFontDataImpl*>(impl_);
  const void* font_data = impl->data;
  size_t data_size = impl->data_size;

  out->reset();

  if (TC_UNLIKELY(face_index >= impl->face_count))
    return tc_make_error(TC_ERROR_INVALID_VALUE);

  uint32_t header_offset = 0;
  if (impl->offset_array_index)
    header_offset = PtrOps::offset<const UInt32>(font_data, impl->offset_array_index)[face_index].value();

  if (TC_UNLIKELY(data_size < sizeof(SFNTHeader) || header_offset > data_size - sizeof(SFNTHeader)))
    return tc_make_error(TC_ERROR_INVALID_DATA);

  const SFNTHeader* sfnt = PtrOps::offset<const SFNTHeader>(font_data, header_offset);
  if (!SFNTHeader::is_version_tag(sfnt->version_tag()))
    return tc_make_error(TC_ERROR_INVALID_SIGNATURE);

  // We can safely multiply `table_count` as SFNTHeader::num_tables is `UInt16`.
  uint32_t table_count = sfnt->num_tables();
  uint32_t min_data_size = uint32_t(sizeof(SFNTHeader)) + table_count * uint32_t(sizeof(SFNTHeader::TableRecord));

  if (TC_UNLIKELY(data_size - header_offset < min_data_size))
    return tc_make_error(TC_ERROR_DATA_TRUNCATED);

  const SFNTHeader::TableRecord* tables = sfnt->table_records();
  for (uint32_t table_index = 0; table_index < table_count; table_index++) {
    const SFNTHeader::TableRecord& table = tables[table_index];
    if (table.tag() != tag)
      continue;

    uint32_t table_offset = table.offset();
    uint32_t table_size = table.length();

    // A table that points outside of the data cannot be read - this is not the same as a missing table.
    if (TC_UNLIKELY(table_offset > data_size || table_size > data_size - table_offset))
      return tc_make_error(TC_ERROR_READ_FAILED);

    out->reset(PtrOps::offset<const uint8_t>(font_data, table_offset), table_size);
    return TC_SUCCESS;
  }

  return TC_SUCCESS;
}

static const TCFontDataVirt mem_font_data_virt = {
  mem_get_table_impl
};

} // {FontDataInternal}

// tc::FontTableProvider - Interface
// =================================

TCResult FontTableProvider::table_data(TCTag tag, FontTableBlob* out) const noexcept {
  out->reset();

  if (TC_UNLIKELY(_font_data.is_empty()))
    return tc_make_error(TC_ERROR_FONT_NOT_INITIALIZED);

  TCFontTable table {};
  TC_PROPAGATE(_font_data.get_table(_face_index, &table, tag));

  if (table.is_empty())
    return TC_SUCCESS;

  if (TC_UNLIKELY(sizeof(size_t) > 4 && table.size > 0xFFFFFFFFu))
    return tc_make_error(TC_ERROR_DATA_TOO_LARGE);

  out->_font_data = _font_data;
  out->_table = table;
  return TC_SUCCESS;
}

TCResult FontTableProvider::read_table_data(TCTag tag, FontTableBlob* out) const noexcept {
  TC_PROPAGATE(table_data(tag, out));

  if (out->is_empty())
    return tc_make_error(TC_ERROR_FONT_MISSING_TABLE);

  return TC_SUCCESS;
}

bool FontTableProvider::has_table(TCTag tag) const noexcept {
  FontTableBlob blob;
  return table_data(tag, &blob) == TC_SUCCESS && !blob.is_empty();
}

} // {tc}

// tc::FontData - API - Create
// ===========================

static TCResult tc_font_data_create_internal(TCFontData* self, const void* data, size_t data_size, TCDestroyExternalDataFunc destroy_func, void* user_data, bool copy) noexcept {
  using namespace tc::FontDataInternal;
  using namespace tc::OpenType;

  constexpr uint32_t kBaseSize = tc_min<uint32_t>(SFNTHeader::kBaseSize, TTCFHeader::kBaseSize);
  if (TC_UNLIKELY(!data || data_size < kBaseSize))
    return tc_make_error(TC_ERROR_INVALID_DATA);

  if (TC_UNLIKELY(sizeof(size_t) > 4 && data_size > 0xFFFFFFFFu))
    return tc_make_error(TC_ERROR_DATA_TOO_LARGE);

  uint32_t header_tag = tc::PtrOps::offset<const UInt32>(data, 0)->value();
  uint32_t face_count = 1;
  uint32_t data_flags = 0;
  uint32_t offset_array_index = 0;

  if (header_tag == TTCFHeader::kTag) {
    const TTCFHeader* header = tc::PtrOps::offset<const TTCFHeader>(data, 0);

    face_count = header->fonts.count();
    if (TC_UNLIKELY(!face_count || face_count > TC_FONT_DATA_MAX_FACE_COUNT))
      return tc_make_error(TC_ERROR_INVALID_DATA);

    size_t ttc_header_size = header->calc_size(face_count);
    if (TC_UNLIKELY(ttc_header_size > data_size))
      return tc_make_error(TC_ERROR_DATA_TRUNCATED);

    offset_array_index = uint32_t(tc::PtrOps::byte_offset(header, header->fonts.array()));
    data_flags |= TC_FONT_DATA_FLAG_COLLECTION;
  }
  else {
    if (!SFNTHeader::is_version_tag(header_tag))
      return tc_make_error(TC_ERROR_INVALID_SIGNATURE);
  }

  void* owned_data = nullptr;
  if (copy) {
    owned_data = malloc(data_size);
    TC_RETURN_ERROR_IF_NULL(owned_data);

    memcpy(owned_data, data, data_size);
    data = owned_data;
  }

  MemFontDataImpl* new_impl;
  TC_PROPAGATE_(tc::ObjectInternal::alloc_impl_t<MemFontDataImpl>(&new_impl), free(owned_data););

  init_impl(new_impl, &mem_font_data_virt);

  new_impl->face_count = face_count;
  new_impl->flags = data_flags;
  new_impl->data = data;
  new_impl->data_size = uint32_t(data_size);
  new_impl->offset_array_index = offset_array_index;
  new_impl->external_destroy_func = destroy_func;
  new_impl->user_data = user_data;
  new_impl->owned_data = owned_data;

  tc::ObjectInternal::replace_impl(self, new_impl);
  return TC_SUCCESS;
}

TCResult TCFontData::create_from_data(const void* data, size_t data_size, TCDestroyExternalDataFunc destroy_func, void* user_data) noexcept {
  return tc_font_data_create_internal(this, data, data_size, destroy_func, user_data, false);
}

TCResult TCFontData::create_from_data_copy(const void* data, size_t data_size) noexcept {
  return tc_font_data_create_internal(this, data, data_size, nullptr, nullptr, true);
}

// tc::FontData - API - Accessors
// ==============================

TCResult TCFontData::get_table(uint32_t face_index, TCFontTable* dst, TCTag tag) const noexcept {
  dst->reset();

  if (TC_UNLIKELY(is_empty()))
    return tc_make_error(TC_ERROR_FONT_NOT_INITIALIZED);

  const TCFontDataImpl* impl = tc::FontDataInternal::get_impl(this);
  return impl->virt->get_table(impl, face_index, tag, dst);
}
