// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

// This is an internal header file that is always included first by each Typecase test file.

#ifndef TYPECASE_CORE_API_BUILD_TEST_P_H_INCLUDED
#define TYPECASE_CORE_API_BUILD_TEST_P_H_INCLUDED

#include <typecase/core/api-build_p.h>

// tc::Build - Tests
// =================

//! \cond NEVER
// Make sure '#ifdef'ed unit tests are not disabled by IDE.
#if !defined(TC_TEST) && defined(__INTELLISENSE__)
  #define TC_TEST
#endif
//! \endcond

// Include a unit testing package if this is a `typecase_test` build.
#if defined(TC_TEST)

#include <gtest/gtest.h>

//! \cond INTERNAL
#define EXPECT_SUCCESS(...) EXPECT_EQ((__VA_ARGS__), TCResult(TC_SUCCESS))
#define ASSERT_SUCCESS(...) ASSERT_EQ((__VA_ARGS__), TCResult(TC_SUCCESS))
//! \endcond

#endif // TC_TEST

#endif // TYPECASE_CORE_API_BUILD_TEST_P_H_INCLUDED
