// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TYPECASE_SUPPORT_MEMOPS_P_H_INCLUDED
#define TYPECASE_SUPPORT_MEMOPS_P_H_INCLUDED

#include <typecase/core/api-internal_p.h>

//! \cond INTERNAL
//! \addtogroup typecase_internal
//! \{

//! Little endian byte order.
static constexpr uint32_t TC_BYTE_ORDER_LE = 0;
//! Big endian byte order.
static constexpr uint32_t TC_BYTE_ORDER_BE = 1;

namespace tc {
namespace MemOps {
namespace {

//! \name Memory Read
//!
//! All reads are composed from individual bytes so they work regardless of the alignment of `p` and the byte order
//! of the host. Font data is never guaranteed to be aligned as tables can start at any offset.
//!
//! \{

[[nodiscard]]
static TC_INLINE_NODEBUG uint32_t readU8(const void* p) noexcept { return uint32_t(static_cast<const uint8_t*>(p)[0]); }

template<uint32_t ByteOrder>
[[nodiscard]]
static TC_INLINE_NODEBUG uint32_t readU16(const void* p) noexcept {
  uint32_t hi = readU8(static_cast<const uint8_t*>(p) + (ByteOrder == TC_BYTE_ORDER_LE ? 1 : 0));
  uint32_t lo = readU8(static_cast<const uint8_t*>(p) + (ByteOrder == TC_BYTE_ORDER_LE ? 0 : 1));
  return (hi << 8) | lo;
}

template<uint32_t ByteOrder>
[[nodiscard]]
static TC_INLINE_NODEBUG uint32_t readU32(const void* p) noexcept {
  uint32_t hi = readU16<ByteOrder>(static_cast<const uint8_t*>(p) + (ByteOrder == TC_BYTE_ORDER_LE ? 2 : 0));
  uint32_t lo = readU16<ByteOrder>(static_cast<const uint8_t*>(p) + (ByteOrder == TC_BYTE_ORDER_LE ? 0 : 2));
  return (hi << 16) | lo;
}

template<uint32_t ByteOrder>
[[nodiscard]]
static TC_INLINE_NODEBUG uint64_t readU64(const void* p) noexcept {
  uint64_t hi = readU32<ByteOrder>(static_cast<const uint8_t*>(p) + (ByteOrder == TC_BYTE_ORDER_LE ? 4 : 0));
  uint64_t lo = readU32<ByteOrder>(static_cast<const uint8_t*>(p) + (ByteOrder == TC_BYTE_ORDER_LE ? 0 : 4));
  return (hi << 32) | lo;
}

[[nodiscard]] static TC_INLINE_NODEBUG uint32_t readU16uBE(const void* p) noexcept { return readU16<TC_BYTE_ORDER_BE>(p); }
[[nodiscard]] static TC_INLINE_NODEBUG uint32_t readU32uBE(const void* p) noexcept { return readU32<TC_BYTE_ORDER_BE>(p); }

//! \}

} // {anonymous}
} // {MemOps}
} // {tc}

//! \}
//! \endcond

#endif // TYPECASE_SUPPORT_MEMOPS_P_H_INCLUDED
