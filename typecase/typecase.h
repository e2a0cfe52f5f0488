// This file is part of Typecase project
//
// SPDX-License-Identifier: Zlib
//
// Copyright (c) 2024-2026 The Typecase Authors
//
// This software is provided 'as-is', without any express or implied
// warranty. In no event will the authors be held liable for any damages
// arising from the use of this software.
//
// Permission is granted to anyone to use this software for any purpose,
// including commercial applications, and to alter it and redistribute it
// freely, subject to the following restrictions:
//
// 1. The origin of this software must not be misrepresented; you must not
//    claim that you wrote the original software. If you use this software
//    in a product, an acknowledgment in the product documentation would be
//    appreciated but is not required.
// 2. Altered source versions must be plainly marked as such, and must not be
//    misrepresented as being the original software.
// 3. This notice may not be removed or altered from any source distribution.

// ----------------------------------------------------------------------------
// This is a public header file designed to be used by Typecase users. It
// includes all the necessary files required to use Typecase library and it's
// the only header that is guaranteed to always be provided.
//
// Headers that end with "_p" suffix are private and should never be included,
// they are not part of the public API.
// ----------------------------------------------------------------------------

#ifndef TYPECASE_H_INCLUDED
#define TYPECASE_H_INCLUDED

#if defined(_MSC_VER)
  #pragma warning(push)
  #pragma warning(disable: 4201) // Nameless struct/union.
#endif

#include <typecase/core/api.h>
#include <typecase/core/fontdata.h>
#include <typecase/core/fontdefs.h>
#include <typecase/core/fontface.h>
#include <typecase/core/fontlayout.h>
#include <typecase/core/glyphbitmap.h>
#include <typecase/core/object.h>
#include <typecase/core/runtime.h>

#if defined(_MSC_VER)
  #pragma warning(pop)
#endif

#endif // TYPECASE_H_INCLUDED
