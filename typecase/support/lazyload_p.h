// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TYPECASE_SUPPORT_LAZYLOAD_P_H_INCLUDED
#define TYPECASE_SUPPORT_LAZYLOAD_P_H_INCLUDED

#include <typecase/core/api-internal_p.h>

//! \cond INTERNAL
//! \addtogroup typecase_internal
//! \{

namespace tc {

//! State of \ref LazyLoad.
enum class LazyLoadState : uint32_t {
  //! The value was not loaded yet (or the last attempt to load it failed).
  kNotLoaded = 0,
  //! The value was loaded and it's present.
  kLoadedPresent = 1,
  //! The value was loaded successfully, but it's absent (for example the font doesn't have the table).
  kLoadedAbsent = 2
};

//! A value that is computed at most once, on first access.
//!
//! The load function has a `TCResult(T& out, bool& present)` signature. When it succeeds, its outcome (either a
//! present value or absence) is stored and every further call to `get_or_load()` returns a copy of it without calling
//! the load function again. When it fails, nothing is stored, the error is returned, and the next access retries.
//!
//! `T` must be cheap to copy, a plain value or a reference counted handle, as each access returns a copy.
template<typename T>
class LazyLoad {
public:
  TC_NONCOPYABLE(LazyLoad)

  //! \name Members
  //! \{

  LazyLoadState _state {};
  T _value {};

  //! \}

  //! \name Construction & Destruction
  //! \{

  TC_INLINE_NODEBUG LazyLoad() noexcept = default;

  //! \}

  //! \name Accessors
  //! \{

  TC_INLINE_NODEBUG LazyLoadState state() const noexcept { return _state; }
  TC_INLINE_NODEBUG bool is_loaded() const noexcept { return _state != LazyLoadState::kNotLoaded; }

  //! \}

  //! \name Interface
  //! \{

  //! Returns the stored value in `out` and sets `present` accordingly, loads it by calling `load_func` if necessary.
  //!
  //! When the value is absent `out` is left untouched.
  template<typename LoadFunc>
  TCResult get_or_load(T& out, bool& present, LoadFunc&& load_func) noexcept {
    switch (_state) {
      case LazyLoadState::kLoadedPresent:
        out = _value;
        present = true;
        return TC_SUCCESS;

      case LazyLoadState::kLoadedAbsent:
        present = false;
        return TC_SUCCESS;

      case LazyLoadState::kNotLoaded:
        break;
    }

    T value {};
    bool value_present = false;
    TC_PROPAGATE(load_func(value, value_present));

    if (value_present) {
      _value = value;
      _state = LazyLoadState::kLoadedPresent;
      out = std::move(value);
    }
    else {
      _state = LazyLoadState::kLoadedAbsent;
    }

    present = value_present;
    return TC_SUCCESS;
  }

  //! \}
};

} // {tc}

//! \}
//! \endcond

#endif // TYPECASE_SUPPORT_LAZYLOAD_P_H_INCLUDED
