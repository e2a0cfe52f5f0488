// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <typecase/core/api-build_p.h>
#include <typecase/core/fontlayout_p.h>
#include <typecase/opentype/otlayout_p.h>

using namespace tc::OpenType;

// tc::GDefTable - API
// ===================

TCFontTable TCGDefTable::table() const noexcept {
  return _impl ? tc::LayoutInternal::get_impl(this)->blob.table() : TCFontTable{};
}

uint32_t TCGDefTable::version() const noexcept {
  return _impl ? tc::LayoutInternal::get_impl(this)->version : 0u;
}

bool TCGDefTable::has_glyph_classes() const noexcept {
  return _impl && tc::LayoutInternal::get_impl(this)->glyph_class_def_offset != 0;
}

bool TCGDefTable::has_mark_attach_classes() const noexcept {
  return _impl && tc::LayoutInternal::get_impl(this)->mark_attach_class_def_offset != 0;
}

uint32_t TCGDefTable::mark_glyph_set_count() const noexcept {
  return _impl ? tc::LayoutInternal::get_impl(this)->mark_glyph_set_count : 0u;
}

TCGlyphClass TCGDefTable::glyph_class(TCGlyphId glyph_id) const noexcept {
  if (!_impl)
    return TC_GLYPH_CLASS_NONE;

  const TCGDefTableImpl* impl = tc::LayoutInternal::get_impl(this);
  uint32_t class_value = LayoutImpl::class_of_glyph(impl->blob.table(), impl->glyph_class_def_offset, glyph_id);

  // Classes greater than 4 are not defined, consider such glyph unclassified.
  if (class_value > TC_GLYPH_CLASS_COMPONENT)
    class_value = TC_GLYPH_CLASS_NONE;
  return TCGlyphClass(class_value);
}

uint32_t TCGDefTable::mark_attach_class(TCGlyphId glyph_id) const noexcept {
  if (!_impl)
    return 0u;

  const TCGDefTableImpl* impl = tc::LayoutInternal::get_impl(this);
  return LayoutImpl::class_of_glyph(impl->blob.table(), impl->mark_attach_class_def_offset, glyph_id);
}

// tc::LayoutCache - API
// =====================

TCFontTable TCLayoutCache::table() const noexcept {
  return _impl ? tc::LayoutInternal::get_impl(this)->blob.table() : TCFontTable{};
}

TCLayoutKind TCLayoutCache::kind() const noexcept {
  return _impl ? tc::LayoutInternal::get_impl(this)->kind : TC_LAYOUT_KIND_GSUB;
}

uint32_t TCLayoutCache::version() const noexcept {
  return _impl ? tc::LayoutInternal::get_impl(this)->version : 0u;
}

uint32_t TCLayoutCache::script_count() const noexcept {
  return _impl ? tc::LayoutInternal::get_impl(this)->script_count : 0u;
}

uint32_t TCLayoutCache::feature_count() const noexcept {
  return _impl ? tc::LayoutInternal::get_impl(this)->feature_count : 0u;
}

uint32_t TCLayoutCache::lookup_count() const noexcept {
  return _impl ? tc::LayoutInternal::get_impl(this)->lookup_count : 0u;
}

TCTag TCLayoutCache::script_tag(uint32_t index) const noexcept {
  if (index >= script_count())
    return 0u;

  const TCLayoutCacheImpl* impl = tc::LayoutInternal::get_impl(this);
  return LayoutImpl::list_record_tag(impl->blob.table(), impl->script_list_offset, index);
}

TCTag TCLayoutCache::feature_tag(uint32_t index) const noexcept {
  if (index >= feature_count())
    return 0u;

  const TCLayoutCacheImpl* impl = tc::LayoutInternal::get_impl(this);
  return LayoutImpl::list_record_tag(impl->blob.table(), impl->feature_list_offset, index);
}

bool TCLayoutCache::find_script(TCTag tag, uint32_t* index_out) const noexcept {
  uint32_t count = script_count();

  for (uint32_t i = 0; i < count; i++) {
    if (script_tag(i) == tag) {
      *index_out = i;
      return true;
    }
  }

  return false;
}

uint32_t TCLayoutCache::lookup_type(uint32_t index) const noexcept {
  if (!_impl)
    return 0u;
  return LayoutImpl::resolve_lookup_type(tc::LayoutInternal::get_impl(this), index);
}

uint32_t TCLayoutCache::lookup_flags(uint32_t index) const noexcept {
  if (!_impl)
    return 0u;

  Table<GSubGPosTable::LookupTable> lookup(LayoutImpl::lookup_table(tc::LayoutInternal::get_impl(this), index));
  return lookup.is_empty() ? 0u : uint32_t(lookup->lookup_flags());
}
