// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <typecase/core/api-build_p.h>
#include <typecase/core/runtime.h>
#include <typecase/core/trace_p.h>

namespace tc {
namespace TraceInternal {

static const char severity_prefix[][8] = {
  "",
  "[WARN] ",
  "[FAIL] "
};

// Deeper nesting is clamped so that a runaway indentation cannot consume the whole line.
static constexpr uint32_t kMaxIndentation = 32;

} // {TraceInternal}
} // {tc}

// TCDebugTrace - Log
// ==================

void TCDebugTrace::log(TCTraceSeverity severity, uint32_t indentation, const char* fmt, ...) noexcept {
  using namespace tc::TraceInternal;

  // Each trace line reaches the message sink as a single message.
  char buf[1024];
  size_t pos = 0;

  if (indentation != kTraceNoIndentation) {
    uint32_t n = tc_min(indentation, kMaxIndentation) * 2u;
    memset(buf, ' ', n);
    pos = n;

    const char* prefix = severity_prefix[size_t(severity)];
    size_t prefix_size = strlen(prefix);
    memcpy(buf + pos, prefix, prefix_size);
    pos += prefix_size;
  }

  va_list ap;
  va_start(ap, fmt);
  int written = vsnprintf(buf + pos, TC_ARRAY_SIZE(buf) - pos, fmt, ap);
  va_end(ap);

  if (TC_UNLIKELY(written < 0))
    buf[pos] = '\0';

  tc_runtime_message_out(buf);
}
