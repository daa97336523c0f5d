//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// time zones and time zone providers

#include <atlib/AtZone.hh>
#include <atlib/AtScan.hh>

int64_t AtZone::localToUtc(int64_t local) const
{
  // 2-pass algorithm
  int64_t utc = local - rawOffset();
  int offset = this->offset(utc).offset;	// 1st pass - standard time
  utc = local - offset;
  int offset_ = this->offset(utc).offset;	// 2nd pass (including DST)
  if (offset_ != offset) utc = local - offset_;
  return utc;
}

std::string AtFixedZone::name(int offset)
{
  if (!offset) return "UTC";

  int offset_ = offset < 0 ? -offset : offset;
  int oH = offset_ / 3600000, oM = (offset_ % 3600000) / 60000;
  char buf[6];
  buf[0] = offset < 0 ? '-' : '+';
  buf[1] = oH / 10 + '0';
  buf[2] = oH % 10 + '0';
  buf[3] = ':';
  buf[4] = oM / 10 + '0';
  buf[5] = oM % 10 + '0';

  std::string s{"UTC"};
  s.append(buf, 6);
  return s;
}

bool AtFixedZone::scan(std::string_view id, int &offset)
{
  AtScanner s{id};

  if (s.literal('Z')) {
    if (!s.end()) return false;
    offset = 0;
    return true;
  }

  if (!s.literal("UTC") && !s.literal("GMT")) return false;
  if (s.end()) { offset = 0; return true; }

  int sign, hours, minutes = 0;
  if (!s.sign(sign)) return false;
  if (!s.digits(hours, 2) && !s.digits(hours, 1)) return false;
  if (!s.end()) {
    s.literal(':');
    if (!s.digits(minutes, 2) || !s.end()) return false;
  }
  if (hours > 23 || minutes > 59) return false;

  offset = sign * (hours * 3600000 + minutes * 60000);
  return true;
}

const AtZoneRef &AtFixedZone::utc()
{
  static const AtZoneRef zone{new AtFixedZone{0}};
  return zone;
}
