//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// system time zone database (zoneinfo)

// AtTzZone::offset() calls tzset() for the zone on every call
// - it sets and reverts the TZ environment variable as necessary
// - it acquires and releases a global lock to ensure serialization
//   (tzset() is not thread-safe in any case)
// - it should not be called with high frequency by high-performance
//   applications since
// - it is potentially time-consuming
// - it is single-threaded
// - it accesses and temporarily modifies global environment variables
// - tzset() accesses the zoneinfo database files

// AtSysZones zones{AtZoneParams{}.dfltZone("America/New_York")};
// AtAbstime t{AtAbstime::parse("2024-07-04T12:00:00Z"), zones.dflt()};
// t.hour();	// 8

#ifndef AtTimeZone_HH
#define AtTimeZone_HH

#ifndef AtLib_HH
#include <atlib/AtLib.hh>
#endif

#include <time.h>

#include <string>
#include <string_view>

#include <atlib/AtZone.hh>
#include <atlib/AtParams.hh>

namespace At {

// timezone manipulation
#ifndef _WIN32
inline void tzset(void) { ::tzset(); }
#else
inline void tzset(void) { ::_tzset(); }
#endif

}

// named zone resolved against the zoneinfo database
class AtAPI AtTzZone : public AtZone {
public:
  // tz is the TZ environment variable value for this zone
  AtTzZone(std::string id, std::string tz);

  const std::string &tz() const { return m_tz; }

  int rawOffset() const { return m_rawOffset; }
  AtZoneOffset offset(int64_t millis) const;
  std::string abbrev(int64_t millis) const;

private:
  std::string	m_tz;
  int		m_rawOffset = 0;
};

class AtAPI AtSysZones : public AtZoneProvider {
public:
  AtSysZones() : AtSysZones{AtZoneParams{}} { }
  AtSysZones(const AtZoneParams &params);

  const std::string &zoneinfo() const { return m_zoneinfo; }

  AtZoneRef resolve(std::string_view id) const;

  AtZoneRef dflt() const { return m_dflt; }

private:
  std::string detect() const;

  std::string	m_zoneinfo;
  AtZoneRef	m_dflt;
};

#endif /* AtTimeZone_HH */
