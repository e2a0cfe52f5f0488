// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TYPECASE_CORE_TRACE_P_H_INCLUDED
#define TYPECASE_CORE_TRACE_P_H_INCLUDED

#include <typecase/core/api-internal_p.h>

//! \cond INTERNAL
//! \addtogroup typecase_internal
//! \{

//! Severity of a single trace line.
enum class TCTraceSeverity : uint32_t {
  kInfo = 0,
  kWarning = 1,
  kFailure = 2
};

//! Indentation passed by `TCDebugTrace::out()`, the line is emitted without indentation and severity prefix.
static constexpr uint32_t kTraceNoIndentation = 0xFFFFFFFFu;

// TCDummyTrace
// ============

//! Dummy trace - no tracing, no runtime overhead.
class TCDummyTrace {
public:
  TC_INLINE bool enabled() const noexcept { return false; };
  TC_INLINE void indent() noexcept {}
  TC_INLINE void deindent() noexcept {}

  template<typename... Args>
  TC_INLINE void out(Args&&...) noexcept {}

  template<typename... Args>
  TC_INLINE void info(Args&&...) noexcept {}

  template<typename... Args>
  TC_INLINE bool warn(Args&&...) noexcept { return false; }

  template<typename... Args>
  TC_INLINE bool fail(Args&&...) noexcept { return false; }
};

// TCDebugTrace
// ============

//! Debug trace - active / enabled trace that can be useful during debugging.
class TCDebugTrace {
public:
  TC_INLINE TCDebugTrace() noexcept
    : indentation(0) {}
  TC_INLINE TCDebugTrace(const TCDebugTrace& other) noexcept
    : indentation(other.indentation) {}

  TC_INLINE bool enabled() const noexcept { return true; };
  TC_INLINE void indent() noexcept { indentation++; }
  TC_INLINE void deindent() noexcept { if (indentation) indentation--; }

  template<typename... Args>
  TC_INLINE void out(Args&&... args) noexcept { log(TCTraceSeverity::kInfo, kTraceNoIndentation, std::forward<Args>(args)...); }

  template<typename... Args>
  TC_INLINE void info(Args&&... args) noexcept { log(TCTraceSeverity::kInfo, indentation, std::forward<Args>(args)...); }

  template<typename... Args>
  TC_INLINE bool warn(Args&&... args) noexcept { log(TCTraceSeverity::kWarning, indentation, std::forward<Args>(args)...); return false; }

  template<typename... Args>
  TC_INLINE bool fail(Args&&... args) noexcept { log(TCTraceSeverity::kFailure, indentation, std::forward<Args>(args)...); return false; }

  TC_HIDDEN static void log(TCTraceSeverity severity, uint32_t indentation, const char* fmt, ...) noexcept;

  uint32_t indentation;
};

//! \}
//! \endcond

#endif // TYPECASE_CORE_TRACE_P_H_INCLUDED
