// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TYPECASE_CORE_OBJECT_P_H_INCLUDED
#define TYPECASE_CORE_OBJECT_P_H_INCLUDED

#include <typecase/core/api-internal_p.h>
#include <typecase/core/object.h>

//! \cond INTERNAL
//! \addtogroup typecase_internal
//! \{

namespace tc {
namespace ObjectInternal {

//! \name Object - Internals - Impl - Allocation
//! \{

template<typename T>
static void TC_CDECL destroy_impl_t(TCObjectImpl* impl) noexcept {
  T* typed_impl = static_cast<T*>(impl);
  typed_impl->~T();
  free(typed_impl);
}

//! Allocates a new implementation of type `T` and initializes its reference count to 1.
//!
//! The implementation is constructed by `T(args...)` and destroyed by `~T()` when the last reference is released.
template<typename T, typename... Args>
static TC_INLINE TCResult alloc_impl_t(T** out, Args&&... args) noexcept {
  void* p = malloc(sizeof(T));
  TC_RETURN_ERROR_IF_NULL(p);

  T* impl = new(p) T(std::forward<Args>(args)...);
  impl->ref_count.store(1, std::memory_order_relaxed);
  impl->destroy_func = destroy_impl_t<T>;

  *out = impl;
  return TC_SUCCESS;
}

//! \}

//! \name Object - Internals - Impl - Reference Counting
//! \{

//! Returns a reference count of `impl`.
static TC_INLINE size_t get_impl_ref_count(const TCObjectImpl* impl) noexcept {
  return impl->ref_count.load(std::memory_order_relaxed);
}

static TC_INLINE void retain_impl(TCObjectImpl* impl, size_t n = 1u) noexcept {
  impl->ref_count.fetch_add(n, std::memory_order_relaxed);
}

static TC_INLINE bool deref_impl_and_test(TCObjectImpl* impl) noexcept {
  return impl->ref_count.fetch_sub(1, std::memory_order_acq_rel) == 1u;
}

static TC_INLINE void release_impl(TCObjectImpl* impl) noexcept {
  if (impl && deref_impl_and_test(impl))
    impl->destroy_func(impl);
}

//! \}

//! \name Object - Internals - Object Utilities
//! \{

template<typename T>
static TC_INLINE_NODEBUG T* get_impl(const TCObjectCore* self) noexcept { return static_cast<T*>(self->_impl); }

//! Replaces the implementation of `self` by `impl`, which is adopted (not retained).
static TC_INLINE void replace_impl(TCObjectCore* self, TCObjectImpl* impl) noexcept {
  TCObjectImpl* old_impl = self->_impl;
  self->_impl = impl;
  release_impl(old_impl);
}

//! \}

} // {ObjectInternal}
} // {tc}

//! \}
//! \endcond

#endif // TYPECASE_CORE_OBJECT_P_H_INCLUDED
