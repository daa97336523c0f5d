//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// time zones and time zone providers

// AtZone - immutable view used to derive civil fields from an instant
// - offset(millis) resolves the UTC offset (including DST) in effect at
//   an instant (millis since 1 Jan 1970 UTC)
// - localToUtc() resolves local (wall clock) millis to an instant; local
//   times skipped by a DST transition resolve using the offset in effect
//   before the transition, repeated local times resolve to standard time
// - zones are shared by reference (AtRef<AtZone>) and never modified

// AtZoneProvider - resolves zone identifiers; passed explicitly to
// whatever needs to resolve an identifier (there is no global provider)

#ifndef AtZone_HH
#define AtZone_HH

#ifndef AtLib_HH
#include <atlib/AtLib.hh>
#endif

#include <string>
#include <string_view>

#include <atlib/AtPolymorph.hh>

struct AtZoneOffset {
  int	offset = 0;	// millis east of UTC, including DST
  bool	dst = false;	// daylight savings time in effect
};

class AtAPI AtZone : public AtPolymorph {
public:
  AtZone(std::string id) : m_id{std::move(id)} { }

  const std::string &id() const { return m_id; }

  // standard (non-DST) offset, millis east of UTC
  virtual int rawOffset() const = 0;

  virtual AtZoneOffset offset(int64_t millis) const = 0;

  // abbreviated name for display, e.g. "EST"
  virtual std::string abbrev(int64_t) const { return m_id; }

  int64_t localToUtc(int64_t local) const;

  bool equals(const AtZone &zone) const { return m_id == zone.m_id; }

private:
  std::string	m_id;
};

using AtZoneRef = AtRef<AtZone>;

// constant offset from UTC, never in DST
class AtAPI AtFixedZone : public AtZone {
public:
  AtFixedZone(int offset) : AtZone{name(offset)}, m_offset{offset} { }

  int rawOffset() const { return m_offset; }
  AtZoneOffset offset(int64_t) const { return {m_offset, false}; }

  // "UTC", "UTC+05:30", "UTC-08:00"
  static std::string name(int offset);

  // parses "UTC", "GMT", "Z", "UTC+05:30", "GMT-8", "UTC+0530", ...
  // - returns false if the identifier is not a fixed-offset identifier
  static bool scan(std::string_view id, int &offset);

  static const AtZoneRef &utc();

private:
  int		m_offset;	// millis
};

class AtAPI AtZoneProvider {
public:
  virtual ~AtZoneProvider() { }

  // returns null if the identifier cannot be resolved
  virtual AtZoneRef resolve(std::string_view id) const = 0;

  virtual AtZoneRef utc() const { return AtFixedZone::utc(); }

  virtual AtZoneRef dflt() const = 0;
};

#endif /* AtZone_HH */
