// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TYPECASE_CORE_FONTFACE_P_H_INCLUDED
#define TYPECASE_CORE_FONTFACE_P_H_INCLUDED

#include <typecase/core/api-internal_p.h>
#include <typecase/core/fontdata_p.h>
#include <typecase/core/fontface.h>
#include <typecase/opentype/otcmap_p.h>
#include <typecase/opentype/otimages_p.h>
#include <typecase/support/lazyload_p.h>

//! \cond INTERNAL
//! \addtogroup typecase_internal
//! \{

//! Font face [Impl].
//!
//! Owned exclusively by \ref TCFontFace, never shared.
struct TCFontFaceImpl {
  TC_NONCOPYABLE(TCFontFaceImpl)

  //! \name Required Tables
  //! \{

  //! Provider of all tables of this face.
  tc::FontTableProvider provider;

  //! 'cmap' table.
  tc::FontTableBlob cmap;
  //! Offset of the selected character map sub-table, always within `cmap`.
  uint32_t cmap_offset {};
  //! Validated sub-table at `cmap_offset`, only valid if `cmap_valid` is true.
  tc::OpenType::CMapEncoding cmap_encoding {};
  //! Whether the selected sub-table passed validation, if not, no character is mapped.
  bool cmap_valid {};
  //! Encoding of the selected sub-table.
  TCCharEncoding char_encoding {};

  //! Outline format determined when the face was created.
  TCOutlineFormat outline_format {};

  //! Number of glyphs ('maxp').
  uint32_t glyph_count {};
  //! Horizontal metrics header ('hhea').
  TCFontMetricsHeader hhea {};
  //! Horizontal metrics ('hmtx').
  tc::FontTableBlob hmtx;

  //! \}

  //! \name Lazily Loaded Tables
  //! \{

  tc::LazyLoad<tc::FontTableBlob> vmtx;
  tc::LazyLoad<TCFontMetricsHeader> vhea;
  tc::LazyLoad<TCGDefTable> gdef;
  tc::LazyLoad<TCLayoutCache> gsub;
  tc::LazyLoad<TCLayoutCache> gpos;
  tc::LazyLoad<tc::OpenType::ImageBundle> images;

  //! \}

  TC_INLINE TCFontFaceImpl(const TCFontData& font_data, uint32_t face_index) noexcept
    : provider(font_data, face_index) {}
};

namespace tc {
namespace FontFaceInternal {

//! \name TCFontFace - Internals
//! \{

static TC_INLINE TCResult alloc_impl(TCFontFaceImpl** out, const TCFontData& font_data, uint32_t face_index) noexcept {
  void* p = malloc(sizeof(TCFontFaceImpl));
  TC_RETURN_ERROR_IF_NULL(p);

  *out = new(p) TCFontFaceImpl(font_data, face_index);
  return TC_SUCCESS;
}

static TC_INLINE void destroy_impl(TCFontFaceImpl* impl) noexcept {
  if (impl) {
    impl->~TCFontFaceImpl();
    free(impl);
  }
}

//! Reads and parses the required tables of a face, `found` is set to false if the face has no usable character map.
TC_HIDDEN TCResult init_impl(TCFontFaceImpl* impl, bool* found) noexcept;

//! Loads 'vmtx' table on first use.
TC_HIDDEN TCResult vmtx_table(TCFontFaceImpl* impl, FontTableBlob* out, bool* present_out) noexcept;

//! Loads embedded images on first use.
TC_HIDDEN TCResult embedded_images(TCFontFaceImpl* impl, OpenType::ImageBundle* out, bool* present_out) noexcept;

//! \}

} // {FontFaceInternal}
} // {tc}

//! \}
//! \endcond

#endif // TYPECASE_CORE_FONTFACE_P_H_INCLUDED
