//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// value type encode/decode contract

// shared by all value types; consumed by external markup and binary
// encoders - the element name identifies the value type in markup, the
// binary code identifies it in the binary serialization registry, the
// encoded text is the value representation in both display and markup

#ifndef AtVal_HH
#define AtVal_HH

#ifndef AtLib_HH
#include <atlib/AtLib.hh>
#endif

#include <string>
#include <string_view>

// binary serialization registry codes
namespace AtBinCode {
  enum {
    Obj = 1,
    Bool,
    Int,
    Real,
    Str,
    Enum,
    Uri,
    Abstime,
    Reltime,
    Date,
    Time,
    List,
    Op,
    Feed,
    Ref,
    Err
  };
}

class AtAPI AtVal {
public:
  virtual ~AtVal() { }

  virtual const char *element() const = 0;	// markup element name
  virtual int binCode() const = 0;		// AtBinCode

  virtual std::string encode() const = 0;
  // throws AtInvalidFormat
  virtual void decode(std::string_view s) = 0;
};

#endif /* AtVal_HH */
