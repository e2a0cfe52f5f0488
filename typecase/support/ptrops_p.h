// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TYPECASE_SUPPORT_PTROPS_P_H_INCLUDED
#define TYPECASE_SUPPORT_PTROPS_P_H_INCLUDED

#include <typecase/core/api-internal_p.h>

//! \cond INTERNAL
//! \addtogroup typecase_internal
//! \{

namespace tc {
namespace PtrOps {
namespace {

//! \name Pointer Arithmetic
//! \{

template<typename T, typename Offset>
[[nodiscard]]
static TC_INLINE_NODEBUG T* offset(T* ptr, Offset offset) noexcept { return (T*)((uintptr_t)(ptr) + (uintptr_t)(intptr_t)offset); }

template<typename T, typename P, typename Offset>
[[nodiscard]]
static TC_INLINE_NODEBUG T* offset(P* ptr, Offset offset) noexcept { return (T*)((uintptr_t)(ptr) + (uintptr_t)(intptr_t)offset); }

[[nodiscard]]
static TC_INLINE_NODEBUG size_t byte_offset(const void* base, const void* ptr) noexcept {
  // The result must be zero or positive as it's represented by an unsigned type.
  TC_ASSERT(static_cast<const uint8_t*>(ptr) >= static_cast<const uint8_t*>(base));

  return (size_t)(static_cast<const uint8_t*>(ptr) - static_cast<const uint8_t*>(base));
}

//! \}

} // {anonymous}
} // {PtrOps}
} // {tc}

//! \}
//! \endcond

#endif // TYPECASE_SUPPORT_PTROPS_P_H_INCLUDED
