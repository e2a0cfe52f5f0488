// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TYPECASE_CORE_RUNTIME_H_INCLUDED
#define TYPECASE_CORE_RUNTIME_H_INCLUDED

#include <typecase/core/api.h>

#include <stdarg.h>

//! \addtogroup tc_runtime
//! \{

//! Typecase runtime build type.
enum TCRuntimeBuildType : uint32_t {
  //! Describes a Typecase debug build.
  TC_RUNTIME_BUILD_TYPE_DEBUG = 0,
  //! Describes a Typecase release build.
  TC_RUNTIME_BUILD_TYPE_RELEASE = 1
};

//! Typecase build information.
struct TCRuntimeBuildInfo {
  //! Major version number.
  uint32_t major_version;
  //! Minor version number.
  uint32_t minor_version;
  //! Patch version number.
  uint32_t patch_version;

  //! Typecase build type, see \ref TCRuntimeBuildType.
  uint32_t build_type;

  //! Whether OpenType tracing was compiled in.
  uint32_t trace_enabled;

  //! Identification of the C++ compiler used to build Typecase.
  char compiler_info[32];

  TC_INLINE_NODEBUG void reset() noexcept { *this = TCRuntimeBuildInfo{}; }
};

//! Message sink - receives every message emitted through `tc_runtime_message_out()`, including traces.
//!
//! The default sink writes to `stderr`.
typedef void (TC_CDECL* TCRuntimeMessageSinkFunc)(const char* message, size_t size, void* user_data);

TC_API TCResult TC_CDECL tc_runtime_query_build_info(TCRuntimeBuildInfo* out) noexcept;

//! Replaces the runtime message sink. Passing `nullptr` as `sink` restores the default sink.
TC_API TCResult TC_CDECL tc_runtime_set_message_sink(TCRuntimeMessageSinkFunc sink, void* user_data) noexcept;

TC_API TCResult TC_CDECL tc_runtime_message_out(const char* msg) noexcept;
TC_API TCResult TC_CDECL tc_runtime_message_fmt(const char* fmt, ...) noexcept;
TC_API TCResult TC_CDECL tc_runtime_message_vfmt(const char* fmt, va_list ap) noexcept;

//! \}

#endif // TYPECASE_CORE_RUNTIME_H_INCLUDED
