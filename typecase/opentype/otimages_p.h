// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TYPECASE_OPENTYPE_OTIMAGES_P_H_INCLUDED
#define TYPECASE_OPENTYPE_OTIMAGES_P_H_INCLUDED

#include <typecase/core/fontdata_p.h>
#include <typecase/core/glyphbitmap.h>
#include <typecase/core/object_p.h>
#include <typecase/opentype/otbitmap_p.h>
#include <typecase/opentype/otdefs_p.h>

//! \cond INTERNAL
//! \addtogroup typecase_opentype_impl
//! \{

namespace tc::OpenType {

//! Kind of embedded images held by \ref ImageBundle.
enum class ImageBundleKind : uint32_t {
  //! Color bitmap strikes - 'CBLC' and 'CBDT' tables.
  kBitmapStrikes = 0,
  //! Fixed size images - 'sbix' table.
  kFixedSize = 1,
  //! Vector images - 'SVG ' table.
  kVector = 2
};

//! Embedded images of a face [Impl].
//!
//! Holds the table bytes and the results of their validation. Only offsets and counts are stored, every lookup
//! derives what it reads from the table bytes, which are kept alive together with the bundle.
struct ImageBundleImpl : public TCObjectImpl {
  ImageBundleKind kind {};

  //! Either 'CBLC', 'sbix', or 'SVG ' table depending on `kind`.
  FontTableBlob index;
  //! 'CBDT' table, only used by \ref ImageBundleKind::kBitmapStrikes.
  FontTableBlob data;

  //! Number of strikes ('CBLC' and 'sbix') or SVG document records.
  uint32_t record_count {};
  //! Number of glyphs of the face, each 'sbix' strike has `glyph_count + 1` offsets.
  uint32_t glyph_count {};
  //! Offset of the SVG document list.
  uint32_t document_list_offset {};
};

//! Embedded images of a face.
//!
//! A reference counted handle, copies share the same \ref ImageBundleImpl.
class ImageBundle : public TCObjectCore {
public:
  TC_INLINE_NODEBUG ImageBundle() noexcept = default;
  TC_INLINE_NODEBUG ImageBundle(const ImageBundle& other) noexcept = default;
  TC_INLINE_NODEBUG ImageBundle(ImageBundle&& other) noexcept = default;

  TC_INLINE_NODEBUG ImageBundle& operator=(const ImageBundle& other) noexcept = default;
  TC_INLINE_NODEBUG ImageBundle& operator=(ImageBundle&& other) noexcept = default;

  TC_INLINE_NODEBUG const ImageBundleImpl* impl() const noexcept { return static_cast<const ImageBundleImpl*>(_impl); }
  TC_INLINE_NODEBUG ImageBundleKind kind() const noexcept { return impl()->kind; }
};

//! Selects a strike that best matches a target size.
//!
//! An exact match is preferred, otherwise the nearest size is selected and a tie between a smaller and a larger
//! strike is broken in favor of the larger one.
class StrikeMatcher {
public:
  static constexpr uint32_t kNotFound = 0xFFFFFFFFu;

  uint32_t _target_size;
  uint32_t _best_index = kNotFound;
  uint32_t _best_size = 0;

  TC_INLINE explicit StrikeMatcher(uint32_t target_size) noexcept
    : _target_size(target_size) {}

  TC_INLINE_NODEBUG bool found() const noexcept { return _best_index != kNotFound; }
  TC_INLINE_NODEBUG bool is_exact() const noexcept { return found() && _best_size == _target_size; }
  TC_INLINE_NODEBUG uint32_t best_index() const noexcept { return _best_index; }
  TC_INLINE_NODEBUG uint32_t best_size() const noexcept { return _best_size; }

  static TC_INLINE uint32_t distance(uint32_t a, uint32_t b) noexcept { return a < b ? b - a : a - b; }

  //! Offers a strike at `index` of the given `size`.
  TC_INLINE void add(uint32_t index, uint32_t size) noexcept {
    if (is_exact())
      return;

    if (found()) {
      uint32_t d_new = distance(size, _target_size);
      uint32_t d_best = distance(_best_size, _target_size);

      if (d_new > d_best || (d_new == d_best && size <= _best_size))
        return;
    }

    _best_index = index;
    _best_size = size;
  }
};

namespace CbdtImpl {

//! Validates 'CBLC' and 'CBDT' tables and creates a bitmap strikes bundle.
TC_HIDDEN TCResult create_bundle(const FontTableBlob& cblc, const FontTableBlob& cbdt, ImageBundle* out) noexcept;

//! Looks up an image of `glyph_id` in a bitmap strikes bundle, `target_ppem` must have been clamped to 255.
TC_HIDDEN TCResult lookup(const ImageBundleImpl* impl, TCGlyphId glyph_id, uint32_t target_ppem, uint32_t max_bit_depth, TCBitmapGlyph* out, bool* found_out) noexcept;

} // {CbdtImpl}

namespace SbixImpl {

//! Validates 'sbix' table and creates a fixed size images bundle.
TC_HIDDEN TCResult create_bundle(const FontTableBlob& sbix, uint32_t glyph_count, ImageBundle* out) noexcept;

//! Looks up an image of `glyph_id` in a fixed size images bundle, follows at most one 'dupe' record.
TC_HIDDEN TCResult lookup(const ImageBundleImpl* impl, TCGlyphId glyph_id, uint32_t target_ppem, uint32_t max_bit_depth, TCBitmapGlyph* out, bool* found_out) noexcept;

} // {SbixImpl}

namespace SvgImpl {

//! Validates 'SVG ' table and creates a vector images bundle.
TC_HIDDEN TCResult create_bundle(const FontTableBlob& svg, ImageBundle* out) noexcept;

//! Looks up an SVG document that contains `glyph_id`.
TC_HIDDEN TCResult lookup(const ImageBundleImpl* impl, TCGlyphId glyph_id, TCBitmapGlyph* out, bool* found_out) noexcept;

} // {SvgImpl}

namespace ImagesImpl {

//! Loads embedded images of a face provided by `provider`.
//!
//! Bitmap strikes are tried first, then 'sbix'. When bitmap strikes cannot be used for any reason 'sbix' is tried
//! instead, `present` is set to false when the face has neither. Vector images are never loaded here.
TC_HIDDEN TCResult load_images(const FontTableProvider& provider, uint32_t glyph_count, ImageBundle& out, bool& present) noexcept;

//! Looks up an image of `glyph_id` in `bundle`, dispatches by the kind of the bundle.
TC_HIDDEN TCResult lookup_glyph_image(const ImageBundle& bundle, TCGlyphId glyph_id, uint32_t target_size, TCBitDepth max_bit_depth, TCBitmapGlyph* out, bool* found_out) noexcept;

} // {ImagesImpl}

} // {tc::OpenType}

//! \}
//! \endcond

#endif // TYPECASE_OPENTYPE_OTIMAGES_P_H_INCLUDED
