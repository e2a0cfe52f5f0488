// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <typecase/core/api-build_test_p.h>
#include <typecase/core/runtime.h>

int main(int argc, char* argv[]) {
  TCRuntimeBuildInfo build_info;
  tc_runtime_query_build_info(&build_info);

  tc_runtime_message_fmt(
    "Typecase Unit Tests [use --help for command line options]\n"
    "  Version    : %u.%u.%u\n"
    "  Build Type : %s\n"
    "  Tracing    : %s\n"
    "  Compiled By: %s\n\n",
    build_info.major_version,
    build_info.minor_version,
    build_info.patch_version,
    build_info.build_type == TC_RUNTIME_BUILD_TYPE_DEBUG ? "Debug" : "Release",
    build_info.trace_enabled ? "Enabled" : "Disabled",
    build_info.compiler_info);

  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
