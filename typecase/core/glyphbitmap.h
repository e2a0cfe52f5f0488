// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TYPECASE_CORE_GLYPHBITMAP_H_INCLUDED
#define TYPECASE_CORE_GLYPHBITMAP_H_INCLUDED

#include <typecase/core/fontdata.h>

//! \addtogroup tc_text
//! \{

//! \name Glyph Bitmap - Constants
//! \{

//! Format of a payload of \ref TCBitmapGlyph.
enum TCBitmapFormat : uint32_t {
  //! No bitmap.
  TC_BITMAP_FORMAT_NONE = 0,
  //! Uncompressed bitmap with byte-aligned rows, `stride = (width * bit_depth + 7) / 8`.
  TC_BITMAP_FORMAT_BYTE_ALIGNED = 1,
  //! Uncompressed bitmap with bit-aligned rows, rows are not padded.
  TC_BITMAP_FORMAT_BIT_ALIGNED = 2,
  //! PNG image.
  TC_BITMAP_FORMAT_PNG = 3,
  //! JPEG image.
  TC_BITMAP_FORMAT_JPEG = 4,
  //! TIFF image.
  TC_BITMAP_FORMAT_TIFF = 5,
  //! SVG document.
  TC_BITMAP_FORMAT_SVG = 6,
  //! Gzip compressed SVG document.
  TC_BITMAP_FORMAT_SVGZ = 7,
  //! Encapsulated image of an unknown type, see \ref TCBitmapGlyph::graphic_type.
  TC_BITMAP_FORMAT_OTHER = 8,

  //! Maximum value of `TCBitmapFormat`.
  TC_BITMAP_FORMAT_MAX_VALUE = 8
};

//! Table that provided \ref TCBitmapGlyph.
enum TCBitmapSource : uint32_t {
  //! No source.
  TC_BITMAP_SOURCE_NONE = 0,
  //! Color bitmap strikes ('CBLC' and 'CBDT' tables).
  TC_BITMAP_SOURCE_CBDT = 1,
  //! Standard bitmap graphics ('sbix' table).
  TC_BITMAP_SOURCE_SBIX = 2,
  //! SVG documents ('SVG ' table).
  TC_BITMAP_SOURCE_SVG = 3
};

//! Flags of \ref TCBitmapGlyph.
enum TCBitmapGlyphFlags : uint32_t {
  TC_BITMAP_GLYPH_NO_FLAGS = 0u,
  //! \ref TCBitmapGlyph::hori_metrics are valid.
  TC_BITMAP_GLYPH_FLAG_HORI_METRICS = 0x00000001u,
  //! \ref TCBitmapGlyph::vert_metrics are valid.
  TC_BITMAP_GLYPH_FLAG_VERT_METRICS = 0x00000002u,
  //! \ref TCBitmapGlyph::origin_x and \ref TCBitmapGlyph::origin_y are valid.
  TC_BITMAP_GLYPH_FLAG_ORIGIN = 0x00000004u
};

//! \}

//! \name Glyph Bitmap - Structs
//! \{

//! Bitmap metrics in pixels.
struct TCBitmapMetrics {
  int16_t bearing_x;
  int16_t bearing_y;
  uint16_t advance;

  TC_INLINE_NODEBUG void reset() noexcept { *this = TCBitmapMetrics{}; }
};

//! Embedded image of a single glyph.
//!
//! The payload referenced by `data` is a view into font data. The glyph holds a reference to that font data, so
//! the payload stays valid as long as the glyph exists, even when the face it was looked up from is destroyed.
class TCBitmapGlyph {
public:
  //! \name Members
  //! \{

  //! Keeps `data` alive.
  TCFontData _font_data;

  //! Table that provided the image.
  TCBitmapSource source {};
  //! Format of `data`.
  TCBitmapFormat format {};
  //! Bit depth of the strike the image was found in (32 for 'sbix' images).
  uint32_t bit_depth {};
  //! Flags, see \ref TCBitmapGlyphFlags.
  uint32_t flags {};

  //! Horizontal and vertical pixels per em of the strike (zero for SVG documents).
  uint16_t ppem_x {};
  uint16_t ppem_y {};

  //! Size of the bitmap in pixels, zero if not known (encapsulated images without metrics).
  uint32_t width {};
  uint32_t height {};

  TCBitmapMetrics hori_metrics {};
  TCBitmapMetrics vert_metrics {};

  //! Origin of the image relative to the glyph origin in font units ('sbix' only).
  int16_t origin_x {};
  int16_t origin_y {};

  //! Graphic type tag as stored in the font ('sbix' only), for example 'png '.
  TCTag graphic_type {};

  //! Image payload.
  TCFontTable data {};

  //! \}

  //! \name Common Functionality
  //! \{

  [[nodiscard]]
  TC_INLINE_NODEBUG bool is_empty() const noexcept { return format == TC_BITMAP_FORMAT_NONE; }

  [[nodiscard]]
  TC_INLINE_NODEBUG bool has_flag(TCBitmapGlyphFlags flag) const noexcept { return (flags & flag) != 0u; }

  TC_INLINE void reset() noexcept { *this = TCBitmapGlyph{}; }

  //! \}
};

//! \}

//! \}

#endif // TYPECASE_CORE_GLYPHBITMAP_H_INCLUDED
