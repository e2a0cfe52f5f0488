// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <typecase/core/api-build_p.h>
#include <typecase/core/trace_p.h>
#include <typecase/opentype/otmetrics_p.h>
#include <typecase/support/ptrops_p.h>

namespace tc::OpenType {
namespace MetricsImpl {

// tc::OpenType::MetricsImpl - Trace
// =================================

#if defined(TC_TRACE_OT_ALL) || defined(TC_TRACE_OT_METRICS)
#define Trace TCDebugTrace
#else
#define Trace TCDummyTrace
#endif

// tc::OpenType::MetricsImpl - 'hhea' & 'vhea'
// ===========================================

TCResult read_xhea(Table<XHeaTable> xhea, TCFontMetricsHeader* out) noexcept {
  Trace trace;
  trace.info("tc::OpenType::MetricsImpl::ReadXHea [Size=%u]\n", xhea.size);
  trace.indent();

  if (!xhea.fits()) {
    trace.fail("Table is truncated\n");
    return tc_make_error(TC_ERROR_DATA_TRUNCATED);
  }

  // Both 'hhea' 1.0 and 'vhea' 1.0 / 1.1 have a major version 1.
  uint32_t version = xhea->version();
  if ((version >> 16) != 1u) {
    trace.fail("Invalid version [%08X]\n", version);
    return tc_make_error(TC_ERROR_INVALID_SIGNATURE);
  }

  out->version = version;
  out->ascender = xhea->ascender();
  out->descender = xhea->descender();
  out->line_gap = xhea->line_gap();
  out->max_advance = xhea->max_advance();
  out->min_lsb = xhea->min_leading_bearing();
  out->min_rsb = xhea->min_trailing_bearing();
  out->max_extent = xhea->max_extent();
  out->caret_slope_rise = xhea->caret_slope_rise();
  out->caret_slope_run = xhea->caret_slope_run();
  out->caret_offset = xhea->caret_offset();
  out->metric_data_format = xhea->long_metric_format();
  out->long_metric_count = xhea->long_metric_count();

  trace.info("Ascender: %d\n", out->ascender);
  trace.info("Descender: %d\n", out->descender);
  trace.info("LineGap: %d\n", out->line_gap);
  trace.info("LongMetricCount: %u\n", out->long_metric_count);

  return TC_SUCCESS;
}

// tc::OpenType::MetricsImpl - Advance
// ===================================

TCResult get_advance(uint32_t glyph_count, const TCFontMetricsHeader& header, RawTable xmtx, TCGlyphId glyph_id, uint32_t* advance_out) noexcept {
  uint32_t long_metric_count = header.long_metric_count;

  if (TC_UNLIKELY(long_metric_count > glyph_count))
    return tc_make_error(TC_ERROR_INVALID_DATA);

  size_t required_size = size_t(long_metric_count) * sizeof(XMtxTable::LongMetric) +
                         size_t(glyph_count - long_metric_count) * 2u;
  if (TC_UNLIKELY(!xmtx.fits(required_size)))
    return tc_make_error(TC_ERROR_DATA_TRUNCATED);

  if (TC_UNLIKELY(!long_metric_count))
    return tc_make_error(TC_ERROR_INVALID_DATA);

  if (TC_UNLIKELY(glyph_id >= glyph_count))
    return tc_make_error(TC_ERROR_INVALID_VALUE);

  uint32_t metric_index = tc_min(glyph_id, long_metric_count - 1u);
  *advance_out = xmtx.data_as<XMtxTable>()->lm_array()[metric_index].advance();
  return TC_SUCCESS;
}

} // {MetricsImpl}
} // {tc::OpenType}
