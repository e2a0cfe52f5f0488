// This file is part of Typecase project
//
// See typecase.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TYPECASE_OPENTYPE_OTPLATFORM_P_H_INCLUDED
#define TYPECASE_OPENTYPE_OTPLATFORM_P_H_INCLUDED

#include <typecase/opentype/otdefs_p.h>

//! \cond INTERNAL
//! \addtogroup typecase_opentype_impl
//! \{

namespace tc::OpenType {

//! Platform and encoding identifiers used by 'cmap' and 'name' tables.
//!
//! External Resources:
//!   - https://docs.microsoft.com/en-us/typography/opentype/spec/name#platform-ids
//!   - https://docs.microsoft.com/en-us/typography/opentype/spec/cmap#platform-ids
struct Platform {
  enum PlatformId : uint32_t {
    kPlatformUnicode = 0,
    kPlatformMac = 1,
    kPlatformISO = 2,
    kPlatformWindows = 3,
    kPlatformCustom = 4
  };

  enum UnicodeEncodingId : uint32_t {
    kUnicodeEncoding1_0 = 0,
    kUnicodeEncoding1_1 = 1,
    kUnicodeEncodingISO10646 = 2,
    kUnicodeEncoding2_0BMP = 3,
    kUnicodeEncoding2_0Full = 4,
    kUnicodeEncodingVariationSequences = 5,
    kUnicodeEncodingFull = 6
  };

  enum WindowsEncodingId : uint32_t {
    kWindowsEncodingSymbol = 0,
    kWindowsEncodingUCS2 = 1,
    kWindowsEncodingShiftJIS = 2,
    kWindowsEncodingPRC = 3,
    kWindowsEncodingBig5 = 4,
    kWindowsEncodingWansung = 5,
    kWindowsEncodingJohab = 6,
    kWindowsEncodingUCS4 = 10
  };

  enum MacEncodingId : uint32_t {
    kMacEncodingRoman = 0
  };
};

namespace PlatformImpl {

//! Maps Macintosh Roman characters in [0x80, 0xFF] range to Unicode, characters below 0x80 are ASCII.
static constexpr uint16_t kMacRomanToUnicode[128] = {
  0x00C4, 0x00C5, 0x00C7, 0x00C9, 0x00D1, 0x00D6, 0x00DC, 0x00E1, // 0x80
  0x00E0, 0x00E2, 0x00E4, 0x00E3, 0x00E5, 0x00E7, 0x00E9, 0x00E8, // 0x88
  0x00EA, 0x00EB, 0x00ED, 0x00EC, 0x00EE, 0x00EF, 0x00F1, 0x00F3, // 0x90
  0x00F2, 0x00F4, 0x00F6, 0x00F5, 0x00FA, 0x00F9, 0x00FB, 0x00FC, // 0x98
  0x2020, 0x00B0, 0x00A2, 0x00A3, 0x00A7, 0x2022, 0x00B6, 0x00DF, // 0xA0
  0x00AE, 0x00A9, 0x2122, 0x00B4, 0x00A8, 0x2260, 0x00C6, 0x00D8, // 0xA8
  0x221E, 0x00B1, 0x2264, 0x2265, 0x00A5, 0x00B5, 0x2202, 0x2211, // 0xB0
  0x220F, 0x03C0, 0x222B, 0x00AA, 0x00BA, 0x03A9, 0x00E6, 0x00F8, // 0xB8
  0x00BF, 0x00A1, 0x00AC, 0x221A, 0x0192, 0x2248, 0x2206, 0x00AB, // 0xC0
  0x00BB, 0x2026, 0x00A0, 0x00C0, 0x00C3, 0x00D5, 0x0152, 0x0153, // 0xC8
  0x2013, 0x2014, 0x201C, 0x201D, 0x2018, 0x2019, 0x00F7, 0x25CA, // 0xD0
  0x00FF, 0x0178, 0x2044, 0x20AC, 0x2039, 0x203A, 0xFB01, 0xFB02, // 0xD8
  0x2021, 0x00B7, 0x201A, 0x201E, 0x2030, 0x00C2, 0x00CA, 0x00C1, // 0xE0
  0x00CB, 0x00C8, 0x00CD, 0x00CE, 0x00CF, 0x00CC, 0x00D3, 0x00D4, // 0xE8
  0xF8FF, 0x00D2, 0x00DA, 0x00DB, 0x00D9, 0x0131, 0x02C6, 0x02DC, // 0xF0
  0x00AF, 0x02D8, 0x02D9, 0x02DA, 0x00B8, 0x02DD, 0x02DB, 0x02C7  // 0xF8
};

//! Converts a Macintosh Roman character `c` to Unicode.
static TC_INLINE uint32_t mac_roman_to_unicode(uint32_t c) noexcept {
  TC_ASSERT(c < 256u);
  return c < 0x80u ? c : uint32_t(kMacRomanToUnicode[c - 0x80u]);
}

} // {PlatformImpl}

} // {tc::OpenType}

//! \}
//! \endcond

#endif // TYPECASE_OPENTYPE_OTPLATFORM_P_H_INCLUDED
