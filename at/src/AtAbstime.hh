//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// absolute time - an instant in time as millis since 1 Jan 1970 UTC,
// viewed in a time zone

// * the instant (millis) alone determines ordering, equality and hashing;
//   the zone only affects derived civil fields (year, month, day, hour,
//   minute, second, millisecond, weekday, daylight savings flag)

// * civil fields are derived lazily and cached; the cache is a single
//   atomic word, so a reader racing a cache fill sees either no cache or
//   a complete one - a lost race recomputes the same result

// * concurrent mutation of the same instance (set(), tz()) requires
//   external serialization

// * the "null" value is a default-constructed instance that has never
//   been set; format() renders it as "null"

// * canonical text form (encode / decode):
//     YYYY-MM-DDThh:mm:ss.mmm followed by Z or +hh:mm / -hh:mm
//   decode() yields an instance viewed in a fixed-offset zone built from
//   the parsed offset; years are 4 digits, optionally preceded by '-'

// AtSysZones zones;
// AtAbstime t{2024, 1, 31, 9, 30, 0, 0, zones.dflt()};
// AtAbstime u = t.nextMonth();		// 29th February, 09:30
// u = u.nextWeekday(At::Friday);
// u.encode();
// AtAbstime v = AtAbstime::parse("2024-02-29T09:30:00.000-05:00");

#ifndef AtAbstime_HH
#define AtAbstime_HH

#ifndef AtLib_HH
#include <atlib/AtLib.hh>
#endif

#include <atomic>
#include <compare>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <functional>

#include <atlib/AtVal.hh>
#include <atlib/AtZone.hh>
#include <atlib/AtCalendar.hh>

class AtAPI AtAbstime : public AtVal {
public:
  // millis from 1 Jan 1970 UTC to 1 Jan 2000 UTC
  static constexpr int64_t Epoch2000 = 946684800000LL;

  // civil fields as observed in the zone
  struct Fields {
    int		year = 0;
    int		month = 0;		// 1-12
    int		day = 0;		// 1-31
    int		hour = 0;		// 0-23
    int		minute = 0;		// 0-59
    int		second = 0;		// 0-59
    int		millisecond = 0;	// 0-999
    int		weekday = 0;		// 0-6, Sunday is 0
    bool	dst = false;
  };

  // null
  AtAbstime() : m_zone{AtFixedZone::utc()} { }

  AtAbstime(int64_t millis, AtZoneRef zone) { set(millis, zone); }

  // same instant, different zone
  AtAbstime(const AtAbstime &t, AtZoneRef zone) { set(t.m_millis, zone); }

  // from civil fields in zone (UTC if zone is null) - throws
  // AtInvalidArgument if month is outside 1-12; other fields are lenient
  // (e.g. day 32 of January is 1st February, hour 24 is midnight of the
  // next day)
  AtAbstime(
      int year, int month, int day,
      int hour, int minute, int second, int millisecond,
      AtZoneRef zone);
  AtAbstime(int year, int month, int day, AtZoneRef zone) :
    AtAbstime{year, month, day, 0, 0, 0, 0, zone} { }

  AtAbstime(const AtAbstime &t);
  AtAbstime &operator =(const AtAbstime &t);

  // replaces both the instant and the zone, clears the field cache
  // - a null zone is replaced by UTC
  void set(int64_t millis, AtZoneRef zone);

// accessors

  int64_t millis() const { return m_millis; }
  int64_t millis2000() const { return m_millis - Epoch2000; }

  const AtZoneRef &zone() const { return m_zone; }

  Fields fields() const;

  int year() const { return fields().year; }
  int month() const { return fields().month; }
  int day() const { return fields().day; }
  int hour() const { return fields().hour; }
  int minute() const { return fields().minute; }
  int second() const { return fields().second; }
  int millisecond() const { return fields().millisecond; }
  int weekday() const { return fields().weekday; }

  // millis into the day, e.g. 1:00AM is 3600000
  int64_t timeOfDayMillis() const;

  // offset from UTC in millis, including DST
  int tzOffset() const { return m_zone->offset(m_millis).offset; }
  bool inDaylightTime() const { return fields().dst; }

// conversions

  AtAbstime toUtcTime() const;
  AtAbstime toLocalTime(const AtZoneProvider &zones) const;

// comparison - zone is disregarded

  bool equals(const AtAbstime &t) const { return m_millis == t.m_millis; }
  int cmp(const AtAbstime &t) const {
    return m_millis < t.m_millis ? -1 : m_millis > t.m_millis ? 1 : 0;
  }
  friend inline bool operator ==(const AtAbstime &l, const AtAbstime &r) {
    return l.equals(r);
  }
  friend inline std::strong_ordering operator <=>(
      const AtAbstime &l, const AtAbstime &r) {
    return l.m_millis <=> r.m_millis;
  }

  bool isBefore(const AtAbstime &t) const { return cmp(t) < 0; }
  bool isAfter(const AtAbstime &t) const { return cmp(t) > 0; }

  // same year, month, day / same time of day, each in its own zone
  bool dateEquals(const AtAbstime &t) const;
  bool timeEquals(const AtAbstime &t) const;

  uint32_t hash() const { return uint32_t(m_millis ^ (m_millis >> 32)); }

  bool operator !() const { return m_null; }
  AtOpBool

  bool isNull() const { return m_null; }

// algebra

  AtAbstime add(int64_t millis) const {
    return AtAbstime{m_millis + millis, m_zone};
  }
  AtAbstime subtract(int64_t millis) const {
    return AtAbstime{m_millis - millis, m_zone};
  }
  // positive if t is after this time
  int64_t delta(const AtAbstime &t) const { return t.m_millis - m_millis; }

  // same date, different time of day
  AtAbstime timeOfDay(int hour, int minute, int second, int millis) const;

  AtAbstime nextDay() const;
  AtAbstime prevDay() const;

  // the same day and time in the next / previous month; the last day
  // of a month maps to the last day of the destination month, other
  // days are capped to the length of the destination month
  AtAbstime nextMonth() const;
  AtAbstime prevMonth() const;

  // the same month, day and time in the next / previous year; a leap
  // day maps to 28th February
  AtAbstime nextYear() const;
  AtAbstime prevYear() const;

  // next / previous day with the given weekday (0-6, Sunday is 0), never
  // the same day - throws AtInvalidArgument if weekday is out of range
  AtAbstime nextWeekday(int weekday) const;
  AtAbstime prevWeekday(int weekday) const;

  bool isLeapDay() const {
    Fields f = fields();
    return f.month == 2 && f.day == 29;
  }

  static bool isLeapYear(int year) { return AtCalendar::isLeapYear(year); }
  static int daysInMonth(int year, int month) {
    return AtCalendar::daysInMonth(year, month);
  }
  static int daysInYear(int year) { return AtCalendar::daysInYear(year); }

// encoding

  const char *element() const { return "abstime"; }
  int binCode() const;

  std::string encode() const;
  void decode(std::string_view s);

  // throws AtInvalidFormat
  static AtAbstime parse(std::string_view s);

  // human readable, e.g. "10:30:00 01-Dec-98 EST"
  std::string format() const;

  friend std::ostream &operator <<(std::ostream &s, const AtAbstime &t) {
    return s << t.encode();
  }

// facets - advisory only, never enforced

  std::optional<AtAbstime> min() const;
  void min(const std::optional<AtAbstime> &t);
  std::optional<AtAbstime> max() const;
  void max(const std::optional<AtAbstime> &t);

  // declared zone identifier
  const std::string &tz() const { return m_tz; }
  // resolves id - if unresolvable, logs a warning and does nothing,
  // otherwise the resolved zone becomes the zone of this instance
  void tz(const AtZoneProvider &zones, std::string_view id);

private:
  void invalidate() { m_fields.store(0, std::memory_order_relaxed); }

  Fields decompose() const;

  static bool pack(const Fields &f, uint64_t &v);
  static Fields unpack(uint64_t v);

  static int64_t localMillis(
      int year, int month, int day,
      int hour, int minute, int second, int millis);

  struct Bound {
    int64_t	millis;
    AtZoneRef	zone;
  };

  int64_t			m_millis = 0;
  AtZoneRef			m_zone;
  mutable std::atomic<uint64_t>	m_fields{0};	// packed Fields + valid bit
  bool				m_null = true;
  std::string			m_tz;
  std::optional<Bound>		m_min;
  std::optional<Bound>		m_max;
};

template <> struct std::hash<AtAbstime> {
  size_t operator ()(const AtAbstime &t) const { return t.hash(); }
};

#endif /* AtAbstime_HH */
