// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TYPECASE_OPENTYPE_OTGLYPHNAMES_P_H_INCLUDED
#define TYPECASE_OPENTYPE_OTGLYPHNAMES_P_H_INCLUDED

#include <typecase/opentype/otcmap_p.h>
#include <typecase/opentype/otpost_p.h>

#include <string>
#include <vector>

//! \cond INTERNAL
//! \addtogroup typecase_opentype_impl
//! \{

namespace tc::OpenType {

//! Produces glyph names from 'post' table, falling back to names derived from the character map.
//!
//! The namer keeps views of 'post' and 'cmap' tables, which must outlive it.
class GlyphNamer {
public:
  TC_NONCOPYABLE(GlyphNamer)

  //! \name Members
  //! \{

  uint32_t _glyph_count = 0;

  PostNames _post;
  bool _has_post = false;

  RawTable _cmap {};
  CMapEncoding _cmap_encoding {};
  TCCharEncoding _char_encoding = TC_CHAR_ENCODING_UNICODE;
  bool _has_cmap = false;

  //! Lowest character code of each glyph, built on first use.
  std::vector<uint32_t> _reverse_map;
  bool _reverse_map_built = false;

  //! \}

  TC_INLINE GlyphNamer() noexcept = default;

  //! \name Initialization
  //! \{

  //! Uses 'post' table as the primary source of names, a malformed table is ignored.
  TC_HIDDEN void init_post(RawTable post) noexcept;

  //! Uses a validated character map sub-table to derive names of glyphs that 'post' table doesn't name.
  TC_HIDDEN void init_cmap(RawTable cmap, const CMapEncoding& encoding, TCCharEncoding char_encoding, uint32_t glyph_count) noexcept;

  //! \}

  //! \name Names
  //! \{

  //! Returns the name of `glyph_id`, which is never empty. Names are not unique, see `make_unique_names()`.
  TC_HIDDEN std::string glyph_name(TCGlyphId glyph_id);

  //! Derives the name of `glyph_id` from the character map, returns false if it cannot be derived.
  TC_HIDDEN bool cmap_glyph_name(TCGlyphId glyph_id, std::string& out);

  //! \}
};

namespace GlyphNamesImpl {

//! Formats the name of a Unicode character, which is either its standard Macintosh name or 'uniXXXX' ('uXXXXX' for
//! characters outside of BMP).
TC_HIDDEN std::string unicode_name(uint32_t uc);

//! Makes `names` unique by appending '.altNN' to names that were seen before, where NN is the number of times the
//! name has been seen (at least two digits). A number whose suffixed name is already taken is skipped, so the
//! resulting names are always pairwise distinct.
TC_HIDDEN void make_unique_names(std::vector<std::string>& names);

//! Names `count` glyphs of `glyph_ids` and stores unique names to `out`.
//!
//! Returns `TC_ERROR_OUT_OF_MEMORY` if the names could not be allocated, `out` is cleared in that case.
TC_HIDDEN TCResult glyph_names(GlyphNamer& namer, const TCGlyphId* glyph_ids, size_t count, std::vector<std::string>& out) noexcept;

} // {GlyphNamesImpl}
} // {tc::OpenType}

//! \}
//! \endcond

#endif // TYPECASE_OPENTYPE_OTGLYPHNAMES_P_H_INCLUDED
