// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TYPECASE_CORE_FONTDATA_H_INCLUDED
#define TYPECASE_CORE_FONTDATA_H_INCLUDED

#include <typecase/core/fontdefs.h>
#include <typecase/core/object.h>

//! \addtogroup tc_text
//! \{

//! \name TCFontData - Constants
//! \{

//! Flags used by \ref TCFontData.
enum TCFontDataFlags : uint32_t {
  //! No flags.
  TC_FONT_DATA_NO_FLAGS = 0u,
  //! Font data references a font-collection.
  TC_FONT_DATA_FLAG_COLLECTION = 0x00000001u
};

//! \}

//! \name TCFontData - Impl
//! \{

struct TCFontDataImpl;

//! A function called when external data passed to \ref TCFontData::create_from_data() is no longer needed.
typedef void (TC_CDECL* TCDestroyExternalDataFunc)(void* impl, void* external_data, void* user_data) noexcept;

//! Font data [Virtual Function Table].
//!
//! Table provider interface, each implementation of \ref TCFontDataImpl provides its own.
struct TCFontDataVirt {
  //! Retrieves a table of the given `tag` of a face at `face_index`.
  //!
  //! Must return \ref TC_SUCCESS and an empty `out` table if the table doesn't exist, and an error only if the table
  //! exists, but cannot be read. The returned data must stay valid and unchanged for the whole lifetime of `impl`.
  TCResult (TC_CDECL* get_table)(const TCFontDataImpl* impl, uint32_t face_index, TCTag tag, TCFontTable* out) noexcept;
};

//! Font data [Impl].
struct TCFontDataImpl : public TCObjectImpl {
  //! Virtual function table.
  const TCFontDataVirt* virt;
  //! Number of font faces stored in this font data instance.
  uint32_t face_count;
  //! Font data flags.
  uint32_t flags;
};

//! \}

//! \name TCFontData - C++ API
//! \{

//! Font data.
//!
//! Font data is an immutable provider of font tables, which is shared by all faces created from it. The default
//! implementation reads tables of an in-memory OpenType font or a font collection ('ttcf').
class TCFontData : public TCObjectCore {
public:
  //! \cond INTERNAL
  //! \name Internals
  //! \{

  [[nodiscard]]
  TC_INLINE_NODEBUG TCFontDataImpl* _font_data_impl() const noexcept { return static_cast<TCFontDataImpl*>(_impl); }

  //! \}
  //! \endcond

  //! \name Construction & Destruction
  //! \{

  TC_INLINE_NODEBUG TCFontData() noexcept = default;
  TC_INLINE_NODEBUG TCFontData(const TCFontData& other) noexcept = default;
  TC_INLINE_NODEBUG TCFontData(TCFontData&& other) noexcept = default;

  //! \}

  //! \name Overloaded Operators
  //! \{

  TC_INLINE_NODEBUG TCFontData& operator=(const TCFontData& other) noexcept = default;
  TC_INLINE_NODEBUG TCFontData& operator=(TCFontData&& other) noexcept = default;

  TC_INLINE_NODEBUG explicit operator bool() const noexcept { return !is_empty(); }

  [[nodiscard]]
  TC_INLINE_NODEBUG bool operator==(const TCFontData& other) const noexcept { return  equals(other); }

  [[nodiscard]]
  TC_INLINE_NODEBUG bool operator!=(const TCFontData& other) const noexcept { return !equals(other); }

  //! \}

  //! \name Create Functionality
  //! \{

  //! Creates a \ref TCFontData from the given `data` of the given `size`.
  //!
  //! The data is not copied. Optionally a `destroy_func` can be used as a notifier that will be called with
  //! `user_data` when the data is no longer needed, otherwise the caller must keep the data alive as long as the
  //! font data or any face created from it exists.
  TC_API TCResult create_from_data(const void* data, size_t data_size, TCDestroyExternalDataFunc destroy_func = nullptr, void* user_data = nullptr) noexcept;

  //! Creates a \ref TCFontData from a copy of the given `data`.
  TC_API TCResult create_from_data_copy(const void* data, size_t data_size) noexcept;

  //! \}

  //! \name Accessors
  //! \{

  //! Returns the number of faces of this font data, zero if the font data is empty.
  [[nodiscard]]
  TC_INLINE_NODEBUG uint32_t face_count() const noexcept { return _impl ? _font_data_impl()->face_count : 0u; }

  //! Returns font data flags.
  [[nodiscard]]
  TC_INLINE_NODEBUG TCFontDataFlags flags() const noexcept { return TCFontDataFlags(_impl ? _font_data_impl()->flags : 0u); }

  //! Tests whether this font data is a font-collection.
  [[nodiscard]]
  TC_INLINE_NODEBUG bool is_collection() const noexcept { return (flags() & TC_FONT_DATA_FLAG_COLLECTION) != 0; }

  //! Retrieves a table of the given `tag` of a face at `face_index`.
  //!
  //! Succeeds with an empty `dst` if the table doesn't exist.
  TC_API TCResult get_table(uint32_t face_index, TCFontTable* dst, TCTag tag) const noexcept;

  //! \}
};

//! \}

//! \}

#endif // TYPECASE_CORE_FONTDATA_H_INCLUDED
