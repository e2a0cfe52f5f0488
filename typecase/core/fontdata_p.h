// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TYPECASE_CORE_FONTDATA_P_H_INCLUDED
#define TYPECASE_CORE_FONTDATA_P_H_INCLUDED

#include <typecase/core/api-internal_p.h>
#include <typecase/core/fontdata.h>
#include <typecase/core/object_p.h>

//! \cond INTERNAL
//! \addtogroup typecase_internal
//! \{

namespace tc {

//! \name TCFontData - Internals
//! \{

namespace FontDataInternal {

static TC_INLINE TCFontDataImpl* get_impl(const TCFontData* self) noexcept {
  return static_cast<TCFontDataImpl*>(self->_impl);
}

static TC_INLINE void init_impl(TCFontDataImpl* impl, const TCFontDataVirt* virt) noexcept {
  impl->virt = virt;
  impl->face_count = 0;
  impl->flags = 0;
}

} // {FontDataInternal}

//! \}

//! \name Font Table Blob
//! \{

//! Bytes of a single font table together with a reference to the font data that holds them.
//!
//! The bytes are immutable and never move, so views into them (and parsed structures built on top of such views)
//! stay valid for as long as the blob exists. A default constructed blob is empty.
class FontTableBlob {
public:
  //! \name Members
  //! \{

  TCFontData _font_data;
  TCFontTable _table {};

  //! \}

  //! \name Accessors
  //! \{

  TC_INLINE_NODEBUG bool is_empty() const noexcept { return _table.is_empty(); }
  TC_INLINE_NODEBUG const TCFontTable& table() const noexcept { return _table; }
  TC_INLINE_NODEBUG const uint8_t* data() const noexcept { return _table.data; }

  //! Size of the table, always fits into 32 bits, see `FontTableProvider`.
  TC_INLINE_NODEBUG uint32_t size() const noexcept { return uint32_t(_table.size); }

  TC_INLINE void reset() noexcept {
    _font_data.reset();
    _table.reset();
  }

  //! \}
};

//! \}

//! \name Font Table Provider
//! \{

//! Provides tables of a single face of \ref TCFontData.
//!
//! Tables larger than 4GB are refused with \ref TC_ERROR_DATA_TOO_LARGE as OpenType offsets are 32-bit.
class FontTableProvider {
public:
  //! \name Members
  //! \{

  TCFontData _font_data;
  uint32_t _face_index = 0;

  //! \}

  //! \name Construction & Destruction
  //! \{

  TC_INLINE_NODEBUG FontTableProvider() noexcept = default;

  TC_INLINE FontTableProvider(const TCFontData& font_data, uint32_t face_index) noexcept
    : _font_data(font_data),
      _face_index(face_index) {}

  //! \}

  //! \name Accessors
  //! \{

  TC_INLINE_NODEBUG const TCFontData& font_data() const noexcept { return _font_data; }
  TC_INLINE_NODEBUG uint32_t face_index() const noexcept { return _face_index; }

  //! \}

  //! \name Interface
  //! \{

  //! Reads an optional table - succeeds with an empty `out` if the table doesn't exist.
  TC_HIDDEN TCResult table_data(TCTag tag, FontTableBlob* out) const noexcept;

  //! Reads a required table - fails with \ref TC_ERROR_FONT_MISSING_TABLE if the table doesn't exist.
  TC_HIDDEN TCResult read_table_data(TCTag tag, FontTableBlob* out) const noexcept;

  //! Tests whether the table exists.
  //!
  //! A table that cannot be read is reported as not existing.
  TC_HIDDEN bool has_table(TCTag tag) const noexcept;

  //! \}
};

//! \}

} // {tc}

//! \}
//! \endcond

#endif // TYPECASE_CORE_FONTDATA_P_H_INCLUDED
