// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <typecase/core/api-build_p.h>
#include <typecase/core/object_p.h>

// TCObjectCore - API - Construction & Destruction
// ===============================================

TCObjectCore::TCObjectCore(const TCObjectCore& other) noexcept
  : _impl(other._impl) {

  if (_impl)
    tc::ObjectInternal::retain_impl(_impl);
}

TCObjectCore::~TCObjectCore() noexcept {
  tc::ObjectInternal::release_impl(_impl);
}

// TCObjectCore - API - Assignment
// ===============================

TCObjectCore& TCObjectCore::operator=(const TCObjectCore& other) noexcept {
  TCObjectImpl* impl = other._impl;
  if (impl)
    tc::ObjectInternal::retain_impl(impl);

  tc::ObjectInternal::replace_impl(this, impl);
  return *this;
}

TCObjectCore& TCObjectCore::operator=(TCObjectCore&& other) noexcept {
  TCObjectImpl* impl = other._impl;
  other._impl = nullptr;

  tc::ObjectInternal::replace_impl(this, impl);
  return *this;
}

// TCObjectCore - API - Reset
// ==========================

void TCObjectCore::reset() noexcept {
  tc::ObjectInternal::replace_impl(this, nullptr);
}
