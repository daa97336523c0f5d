//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// Absolute Time Library

#include <atlib/AtLib.hh>

#include "../../version.h"

AtExtern const char AtLib[] = "@(#) Absolute Time Library v" AT_VERNAME;
