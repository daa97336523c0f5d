//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// At library main header

#ifndef AtLib_HH
#define AtLib_HH

// why no At namespace for the main types?
// - consistency with the pre-processor (AtLOG, AtAPI, ...)
// - a short prefix is more succinct
// - At:: is used for small focused sets of constants (severities, weekdays)

#include <stdint.h>

#ifdef _WIN32

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif

#ifndef NOMINMAX
#define NOMINMAX
#endif

#include <windows.h>

#define AtExport_API __declspec(dllexport)
#define AtExport_Explicit
#define AtImport_API __declspec(dllimport)
#define AtImport_Explicit extern

#ifdef AT_EXPORTS
#define AtAPI AtExport_API
#define AtExplicit AtExport_Explicit
#else
#define AtAPI AtImport_API
#define AtExplicit AtImport_Explicit
#endif
#define AtExtern extern AtAPI

#else /* _WIN32 */

#define AtAPI
#define AtExplicit
#define AtExtern extern

#endif /* _WIN32 */

// sanity check platform
#include <limits.h>
#if CHAR_BIT != 8
#error "Broken platform - CHAR_BIT is not 8 - a byte is not 8 bits!"
#endif

// branch prediction hints
#ifdef __GNUC__
#define AtLikely(x) __builtin_expect(!!(x), 1)
#define AtUnlikely(x) __builtin_expect(!!(x), 0)
#else
#define AtLikely(x) (x)
#define AtUnlikely(x) (x)
#endif

// operator bool() in terms of operator !()
#define AtOpBool \
  explicit operator bool() const { return !this->operator !(); }

AtExtern const char AtLib[];

#endif /* AtLib_HH */
