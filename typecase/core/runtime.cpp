// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <typecase/core/api-build_p.h>
#include <typecase/core/runtime.h>

namespace tc {
namespace RuntimeInternal {

// tc::Runtime - Globals
// =====================

struct MessageSink {
  TCRuntimeMessageSinkFunc func;
  void* user_data;
};

static MessageSink message_sink;

static void TC_CDECL default_message_sink(const char* message, size_t size, void* user_data) {
  tc_unused(size, user_data);
  fputs(message, stderr);
}

} // {RuntimeInternal}
} // {tc}

// tc::Runtime - API - Build Info
// ==============================

TC_API_IMPL TCResult tc_runtime_query_build_info(TCRuntimeBuildInfo* out) noexcept {
  if (TC_UNLIKELY(!out))
    return tc_make_error(TC_ERROR_INVALID_VALUE);

  out->reset();
  out->major_version = TC_VERSION >> 16;
  out->minor_version = (TC_VERSION >> 8) & 0xFFu;
  out->patch_version = TC_VERSION & 0xFFu;

#if defined(TC_BUILD_DEBUG)
  out->build_type = TC_RUNTIME_BUILD_TYPE_DEBUG;
#else
  out->build_type = TC_RUNTIME_BUILD_TYPE_RELEASE;
#endif

#if defined(TC_TRACE_OT_ALL)
  out->trace_enabled = 1;
#endif

#if defined(__clang__)
  snprintf(out->compiler_info, sizeof(out->compiler_info), "Clang %d.%d.%d", __clang_major__, __clang_minor__, __clang_patchlevel__);
#elif defined(__GNUC__)
  snprintf(out->compiler_info, sizeof(out->compiler_info), "GCC %d.%d.%d", __GNUC__, __GNUC_MINOR__, __GNUC_PATCHLEVEL__);
#elif defined(_MSC_VER)
  snprintf(out->compiler_info, sizeof(out->compiler_info), "MSC %d", _MSC_VER);
#else
  snprintf(out->compiler_info, sizeof(out->compiler_info), "Unknown");
#endif

  return TC_SUCCESS;
}

// tc::Runtime - API - Message
// ===========================

TC_API_IMPL TCResult tc_runtime_set_message_sink(TCRuntimeMessageSinkFunc sink, void* user_data) noexcept {
  tc::RuntimeInternal::message_sink.func = sink;
  tc::RuntimeInternal::message_sink.user_data = sink ? user_data : nullptr;
  return TC_SUCCESS;
}

TC_API_IMPL TCResult tc_runtime_message_out(const char* msg) noexcept {
  using namespace tc::RuntimeInternal;

  TCRuntimeMessageSinkFunc func = message_sink.func ? message_sink.func : default_message_sink;
  func(msg, strlen(msg), message_sink.user_data);
  return TC_SUCCESS;
}

TC_API_IMPL TCResult tc_runtime_message_fmt(const char* fmt, ...) noexcept {
  va_list ap;
  va_start(ap, fmt);
  TCResult result = tc_runtime_message_vfmt(fmt, ap);
  va_end(ap);

  return result;
}

TC_API_IMPL TCResult tc_runtime_message_vfmt(const char* fmt, va_list ap) noexcept {
  char buf[1024];
  vsnprintf(buf, TC_ARRAY_SIZE(buf), fmt, ap);
  return tc_runtime_message_out(buf);
}

// tc::Runtime - API - Failure
// ===========================

TC_API_IMPL void tc_runtime_assertion_failure(const char* file, int line, const char* msg) noexcept {
  tc_runtime_message_fmt("[Typecase] ASSERTION FAILURE: '%s' at '%s' [line %d]\n", msg, file, line);
  abort();
}
