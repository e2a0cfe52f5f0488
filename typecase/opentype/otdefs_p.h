// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TYPECASE_OPENTYPE_OTDEFS_P_H_INCLUDED
#define TYPECASE_OPENTYPE_OTDEFS_P_H_INCLUDED

#include <typecase/core/api-internal_p.h>
#include <typecase/core/fontdefs.h>
#include <typecase/support/memops_p.h>
#include <typecase/support/ptrops_p.h>

//! \cond INTERNAL
//! \addtogroup typecase_opentype_impl
//! \{

//! \namespace tc::OpenType
//! Low-level OpenType functionality, not exposed to users directly.

namespace tc::OpenType {

//! A read only data that represents a font table or its sub-table.
//!
//! \note This is functionally similar compared to \ref TCFontTable. The difference is that we prefer to have table
//! size as `uint32_t` integer instead of `size_t` as various offsets and slices in OpenType are 32-bit integers.
struct RawTable {
  //! \name Members
  //! \{

  //! Pointer to the beginning of the data interpreted as `uint8_t*`.
  const uint8_t* data;
  //! Size of `data` in bytes.
  uint32_t size;

  //! \}

  //! \name Construction & Destruction
  //! \{

  TC_INLINE_NODEBUG RawTable() noexcept = default;
  TC_INLINE_NODEBUG RawTable(const RawTable& other) noexcept = default;

  //! The size of `other` must have been checked to fit into 32 bits by the caller.
  TC_INLINE_NODEBUG RawTable(const TCFontTable& other) noexcept
    : data(other.data),
      size(uint32_t(other.size)) {}

  TC_INLINE_NODEBUG RawTable(const uint8_t* data, uint32_t size) noexcept
    : data(data),
      size(size) {}

  //! \}

  //! \name Overloaded Operators
  //! \{

  //! Tests whether the table has a content.
  TC_INLINE_NODEBUG explicit operator bool() const noexcept { return size != 0; }

  TC_INLINE_NODEBUG RawTable& operator=(const RawTable& other) noexcept = default;

  //! \}

  //! \name Common Functionality
  //! \{

  //! Tests whether the table is empty (has no content).
  TC_INLINE_NODEBUG bool is_empty() const noexcept { return !size; }

  TC_INLINE_NODEBUG void reset() noexcept {
    data = nullptr;
    size = 0;
  }

  TC_INLINE_NODEBUG void reset(const uint8_t* data_, uint32_t size_) noexcept {
    data = data_;
    size = size_;
  }

  template<typename SizeT>
  TC_INLINE_NODEBUG bool fits(const SizeT& n_bytes) const noexcept { return n_bytes <= size; }

  //! Tests whether `n_bytes` starting at `offset` fit into the table (overflow safe).
  TC_INLINE_NODEBUG bool fits(uint32_t offset, uint32_t n_bytes) const noexcept {
    return offset <= size && n_bytes <= size - offset;
  }

  //! \}

  //! \name Accessors
  //! \{

  template<typename T>
  TC_INLINE const T* data_as(size_t offset = 0u) const noexcept {
    TC_ASSERT(offset <= size);
    return reinterpret_cast<const T*>(data + offset);
  }

  TC_INLINE uint32_t readU8(size_t offset) const noexcept {
    TC_ASSERT(offset < size);
    return data[offset];
  }

  TC_INLINE uint32_t readU16(size_t offset) const noexcept {
    TC_ASSERT(offset + 2 <= size);
    return MemOps::readU16uBE(data + offset);
  }

  TC_INLINE uint32_t readU32(size_t offset) const noexcept {
    TC_ASSERT(offset + 4 <= size);
    return MemOps::readU32uBE(data + offset);
  }

  TC_INLINE RawTable sub_table(uint32_t offset) const noexcept {
    offset = tc_min(offset, size);
    return RawTable(data + offset, size - offset);
  }

  //! Returns a slice of `n_bytes` starting at `offset`, which must have been validated by `fits(offset, n_bytes)`.
  TC_INLINE RawTable slice(uint32_t offset, uint32_t n_bytes) const noexcept {
    TC_ASSERT(fits(offset, n_bytes));
    return RawTable(data + offset, n_bytes);
  }

  TC_INLINE RawTable sub_table_unchecked(uint32_t offset) const noexcept {
    TC_ASSERT(offset <= size);
    return RawTable(data + offset, size - offset);
  }

  //! \}
};

//! A convenience class that maps `RawTable` to a typed table.
template<typename T>
struct Table : public RawTable {
  //! \name Construction & Destruction
  //! \{

  TC_INLINE_NODEBUG Table() noexcept = default;
  TC_INLINE_NODEBUG Table(const Table& other) noexcept = default;

  TC_INLINE_NODEBUG Table(const RawTable& other) noexcept
    : RawTable(other.data, other.size) {}

  TC_INLINE_NODEBUG Table(const TCFontTable& other) noexcept
    : RawTable(other) {}

  TC_INLINE_NODEBUG Table(const uint8_t* data, uint32_t size) noexcept
    : RawTable(data, size) {}

  //! \}

  //! \name Overloaded Operators
  //! \{

  TC_INLINE_NODEBUG Table& operator=(const Table& other) noexcept = default;
  TC_INLINE_NODEBUG const T* operator->() const noexcept { return data_as<T>(); }

  //! \}

  //! \name Helpers
  //! \{

  using RawTable::fits;

  TC_INLINE_NODEBUG bool fits() const noexcept { return size >= T::kBaseSize; }

  //! \}
};

template<size_t Size>
struct DataAccess {};

template<>
struct DataAccess<1> {
  template<uint32_t ByteOrder>
  static TC_INLINE_NODEBUG uint32_t read_value(const uint8_t* data) noexcept { return MemOps::readU8(data); }
};

template<>
struct DataAccess<2> {
  template<uint32_t ByteOrder>
  static TC_INLINE_NODEBUG uint32_t read_value(const uint8_t* data) noexcept { return MemOps::readU16<ByteOrder>(data); }
};

template<>
struct DataAccess<4> {
  template<uint32_t ByteOrder>
  static TC_INLINE_NODEBUG uint32_t read_value(const uint8_t* data) noexcept { return MemOps::readU32<ByteOrder>(data); }
};

template<>
struct DataAccess<8> {
  template<uint32_t ByteOrder>
  static TC_INLINE_NODEBUG uint64_t read_value(const uint8_t* data) noexcept { return MemOps::readU64<ByteOrder>(data); }
};

//! A value stored in font data in the given `ByteOrder`.
//!
//! Typecase never writes to font data, thus only read access is provided.
#pragma pack(push, 1)
template<typename T, uint32_t ByteOrder, size_t Size>
struct DataType {
  uint8_t data[Size];

  TC_INLINE_NODEBUG T value() const noexcept { return T(DataAccess<Size>::template read_value<ByteOrder>(data)); }
  TC_INLINE_NODEBUG T operator()() const noexcept { return value(); }
};
#pragma pack(pop)

// Everything in OpenType is big-endian.
typedef DataType<int8_t  , TC_BYTE_ORDER_BE, 1> Int8;
typedef DataType<int16_t , TC_BYTE_ORDER_BE, 2> Int16;
typedef DataType<int64_t , TC_BYTE_ORDER_BE, 8> Int64;

typedef DataType<uint8_t , TC_BYTE_ORDER_BE, 1> UInt8;
typedef DataType<uint16_t, TC_BYTE_ORDER_BE, 2> UInt16;
typedef DataType<uint32_t, TC_BYTE_ORDER_BE, 4> UInt32;

typedef UInt16 Offset16;
typedef UInt32 Offset32;

typedef Int16 FWord;
typedef UInt32 F16x16;
typedef UInt32 CheckSum;
typedef Int64 DateTime;

template<typename T>
struct Array16 {
  enum : uint32_t { kBaseSize = 2 };

  UInt16 count;
  TC_INLINE_NODEBUG const T* array() const noexcept { return PtrOps::offset<const T>(this, 2); }
};

template<typename T>
struct Array32 {
  enum : uint32_t { kBaseSize = 4 };

  UInt32 count;
  TC_INLINE_NODEBUG const T* array() const noexcept { return PtrOps::offset<const T>(this, 4); }
};

//! Tag and offset.
//!
//! Replaces a lot of OpenType tables that use this structure (GDEF|GPOS|GSUB).
struct TagRef16 {
  UInt32 tag;
  Offset16 offset;
};

} // {tc::OpenType}

//! \}
//! \endcond

#endif // TYPECASE_OPENTYPE_OTDEFS_P_H_INCLUDED
