// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TYPECASE_CORE_FONTLAYOUT_P_H_INCLUDED
#define TYPECASE_CORE_FONTLAYOUT_P_H_INCLUDED

#include <typecase/core/api-internal_p.h>
#include <typecase/core/fontdata_p.h>
#include <typecase/core/fontlayout.h>
#include <typecase/core/object_p.h>

//! \cond INTERNAL
//! \addtogroup typecase_internal
//! \{

//! \name Layout - Impl
//! \{

//! 'GDEF' table [Impl].
//!
//! Offsets are relative to the start of the table and were validated, zero offset means the sub-table is absent.
struct TCGDefTableImpl : public TCObjectImpl {
  tc::FontTableBlob blob;
  uint32_t version {};
  uint32_t glyph_class_def_offset {};
  uint32_t mark_attach_class_def_offset {};
  uint32_t mark_glyph_sets_def_offset {};
  uint32_t mark_glyph_set_count {};
};

//! 'GSUB' or 'GPOS' layout cache [Impl].
struct TCLayoutCacheImpl : public TCObjectImpl {
  tc::FontTableBlob blob;
  TCLayoutKind kind {};
  uint32_t version {};

  //! Offsets of script, feature, and lookup lists, zero if the list is absent.
  uint32_t script_list_offset {};
  uint32_t feature_list_offset {};
  uint32_t lookup_list_offset {};

  uint32_t script_count {};
  uint32_t feature_count {};
  uint32_t lookup_count {};
};

//! \}

namespace tc {
namespace LayoutInternal {

static TC_INLINE TCGDefTableImpl* get_impl(const TCGDefTable* self) noexcept { return ObjectInternal::get_impl<TCGDefTableImpl>(self); }
static TC_INLINE TCLayoutCacheImpl* get_impl(const TCLayoutCache* self) noexcept { return ObjectInternal::get_impl<TCLayoutCacheImpl>(self); }

} // {LayoutInternal}
} // {tc}

//! \}
//! \endcond

#endif // TYPECASE_CORE_FONTLAYOUT_P_H_INCLUDED
