// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TYPECASE_OPENTYPE_OTMETRICS_P_H_INCLUDED
#define TYPECASE_OPENTYPE_OTMETRICS_P_H_INCLUDED

#include <typecase/core/fontdefs.h>
#include <typecase/opentype/otcore_p.h>
#include <typecase/support/ptrops_p.h>

//! \cond INTERNAL
//! \addtogroup typecase_opentype_impl
//! \{

namespace tc::OpenType {

//! OpenType 'hhea' and 'vhea' tables.
//!
//! External Resources:
//!   - https://docs.microsoft.com/en-us/typography/opentype/spec/hhea
//!   - https://docs.microsoft.com/en-us/typography/opentype/spec/vhea
struct XHeaTable {
  enum : uint32_t { kBaseSize = 36 };

  F16x16 version;
  Int16 ascender;
  Int16 descender;
  Int16 line_gap;
  UInt16 max_advance;
  Int16 min_leading_bearing;
  Int16 min_trailing_bearing;
  Int16 max_extent;
  Int16 caret_slope_rise;
  Int16 caret_slope_run;
  Int16 caret_offset;
  Int16 reserved[4];
  Int16 long_metric_format;
  UInt16 long_metric_count;
};

//! OpenType 'hmtx' and 'vmtx' tables.
//!
//! External Resources:
//!   - https://docs.microsoft.com/en-us/typography/opentype/spec/hmtx
//!   - https://docs.microsoft.com/en-us/typography/opentype/spec/vmtx
struct XMtxTable {
  struct LongMetric {
    UInt16 advance;
    Int16 lsb;
  };

  /*
  LongMetric lm_array[];
  Int16 lsb_array[];
  */

  //! Paired advance width and left side bearing values, indexed by glyph ID.
  TC_INLINE const LongMetric* lm_array() const noexcept { return PtrOps::offset<const LongMetric>(this, 0); }
  //! Leading side bearings for glyph IDs greater than or equal to `metric_count`.
  TC_INLINE const Int16* lsb_array(size_t metric_count) const noexcept { return PtrOps::offset<const Int16>(this, metric_count * sizeof(LongMetric)); }
};

namespace MetricsImpl {

//! Reads 'hhea' or 'vhea' table into `out`.
TC_HIDDEN TCResult read_xhea(Table<XHeaTable> xhea, TCFontMetricsHeader* out) noexcept;

//! Returns the advance of `glyph_id` described by a metrics header and its 'hmtx' or 'vmtx' table.
//!
//! The metrics table must hold `long_metric_count` long metrics followed by side bearings of the remaining glyphs,
//! otherwise an error is returned. Glyphs after the last long metric share its advance.
TC_HIDDEN TCResult get_advance(uint32_t glyph_count, const TCFontMetricsHeader& header, RawTable xmtx, TCGlyphId glyph_id, uint32_t* advance_out) noexcept;

} // {MetricsImpl}
} // {tc::OpenType}

//! \}
//! \endcond

#endif // TYPECASE_OPENTYPE_OTMETRICS_P_H_INCLUDED
