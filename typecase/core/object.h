// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TYPECASE_CORE_OBJECT_H_INCLUDED
#define TYPECASE_CORE_OBJECT_H_INCLUDED

#include <typecase/core/api.h>

#include <atomic>

//! \addtogroup tc_object
//! \{

struct TCObjectImpl;

//! Destroys an object implementation once its reference count reaches zero.
typedef void (TC_CDECL* TCDestroyImplFunc)(TCObjectImpl* impl) noexcept;

//! Base of all reference counted implementations.
//!
//! Every implementation is allocated by Typecase and destroyed by its `destroy_func` when the last reference to it
//! is released. Implementations are immutable once shared, which makes it safe to hold references from multiple
//! threads.
struct TCObjectImpl {
  //! Reference count.
  std::atomic<size_t> ref_count;
  //! Destroy function called when `ref_count` drops to zero.
  TCDestroyImplFunc destroy_func;
};

//! Base class of all reference counted Typecase objects.
//!
//! Copying an object only increases the reference count of its implementation, so all copies share the same
//! (immutable) data. A default constructed object is empty and doesn't hold any implementation.
class TCObjectCore {
public:
  //! \name Members
  //! \{

  TCObjectImpl* _impl;

  //! \}

  //! \name Construction & Destruction
  //! \{

  TC_INLINE_NODEBUG TCObjectCore() noexcept
    : _impl(nullptr) {}

  TC_INLINE_NODEBUG TCObjectCore(TCObjectCore&& other) noexcept
    : _impl(other._impl) { other._impl = nullptr; }

  TC_API TCObjectCore(const TCObjectCore& other) noexcept;
  TC_API ~TCObjectCore() noexcept;

  //! \}

  //! \name Overloaded Operators
  //! \{

  TC_API TCObjectCore& operator=(const TCObjectCore& other) noexcept;
  TC_API TCObjectCore& operator=(TCObjectCore&& other) noexcept;

  //! Tests whether two objects share the same implementation.
  TC_INLINE_NODEBUG bool equals(const TCObjectCore& other) const noexcept { return _impl == other._impl; }

  //! \}

  //! \name Common Functionality
  //! \{

  //! Tests whether the object is empty (doesn't hold any implementation).
  TC_INLINE_NODEBUG bool is_empty() const noexcept { return _impl == nullptr; }

  //! Releases the implementation held by the object and makes it empty.
  TC_API void reset() noexcept;

  //! \}
};

//! \}

#endif // TYPECASE_CORE_OBJECT_H_INCLUDED
