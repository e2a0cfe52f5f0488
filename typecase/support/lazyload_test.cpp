// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <typecase/core/api-build_test_p.h>
#if defined(TC_TEST)

#include <typecase/support/lazyload_p.h>

namespace tc {
namespace Tests {

TEST(TCLazyLoad, LoadsPresentValueOnce) {
  LazyLoad<uint32_t> cache;
  uint32_t calls = 0;

  auto load = [&](uint32_t& out, bool& present) noexcept -> TCResult {
    calls++;
    out = 42;
    present = true;
    return TC_SUCCESS;
  };

  EXPECT_EQ(cache.state(), LazyLoadState::kNotLoaded);
  EXPECT_FALSE(cache.is_loaded());

  for (uint32_t i = 0; i < 3; i++) {
    uint32_t value = 0;
    bool present = false;

    ASSERT_SUCCESS(cache.get_or_load(value, present, load));
    EXPECT_TRUE(present);
    EXPECT_EQ(value, 42u);
  }

  EXPECT_EQ(calls, 1u);
  EXPECT_EQ(cache.state(), LazyLoadState::kLoadedPresent);
}

TEST(TCLazyLoad, CachesAbsence) {
  LazyLoad<uint32_t> cache;
  uint32_t calls = 0;

  auto load = [&](uint32_t& out, bool& present) noexcept -> TCResult {
    (void)out;
    calls++;
    present = false;
    return TC_SUCCESS;
  };

  for (uint32_t i = 0; i < 2; i++) {
    uint32_t value = 7;
    bool present = true;

    ASSERT_SUCCESS(cache.get_or_load(value, present, load));
    EXPECT_FALSE(present);
    EXPECT_EQ(value, 7u);
  }

  EXPECT_EQ(calls, 1u);
  EXPECT_EQ(cache.state(), LazyLoadState::kLoadedAbsent);
}

TEST(TCLazyLoad, RetriesAfterFailure) {
  LazyLoad<uint32_t> cache;
  uint32_t calls = 0;

  // Fails twice, then succeeds.
  auto load = [&](uint32_t& out, bool& present) noexcept -> TCResult {
    if (++calls < 3)
      return tc_make_error(TC_ERROR_INVALID_DATA);

    out = 1000;
    present = true;
    return TC_SUCCESS;
  };

  uint32_t value = 0;
  bool present = false;

  EXPECT_EQ(cache.get_or_load(value, present, load), TCResult(TC_ERROR_INVALID_DATA));
  EXPECT_EQ(cache.state(), LazyLoadState::kNotLoaded);

  EXPECT_EQ(cache.get_or_load(value, present, load), TCResult(TC_ERROR_INVALID_DATA));
  EXPECT_EQ(cache.state(), LazyLoadState::kNotLoaded);
  EXPECT_EQ(value, 0u);

  ASSERT_SUCCESS(cache.get_or_load(value, present, load));
  EXPECT_TRUE(present);
  EXPECT_EQ(value, 1000u);
  EXPECT_EQ(cache.state(), LazyLoadState::kLoadedPresent);

  ASSERT_SUCCESS(cache.get_or_load(value, present, load));
  EXPECT_EQ(calls, 3u);
}

TEST(TCLazyLoad, FailureDoesNotStoreValue) {
  LazyLoad<uint32_t> cache;

  auto load = [&](uint32_t& out, bool& present) noexcept -> TCResult {
    out = 5;
    present = true;
    return tc_make_error(TC_ERROR_DATA_TRUNCATED);
  };

  uint32_t value = 0;
  bool present = false;

  EXPECT_EQ(cache.get_or_load(value, present, load), TCResult(TC_ERROR_DATA_TRUNCATED));
  EXPECT_EQ(value, 0u);
  EXPECT_FALSE(present);
  EXPECT_EQ(cache._value, 0u);
}

} // {Tests}
} // {tc}

#endif // TC_TEST
