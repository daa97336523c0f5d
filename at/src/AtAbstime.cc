//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// absolute time

#include <atlib/AtAbstime.hh>
#include <atlib/AtScan.hh>
#include <atlib/AtError.hh>
#include <atlib/AtLog.hh>

// packed field cache layout (LSB first)
// weekday:3 second:6 minute:6 hour:5 day:5 month:4 millisecond:10
// year:23 (biased) dst:1 valid:1
namespace {
  enum {
    WeekdayShift = 0, WeekdayBits = 3,
    SecondShift = 3, SecondBits = 6,
    MinuteShift = 9, MinuteBits = 6,
    HourShift = 15, HourBits = 5,
    DayShift = 20, DayBits = 5,
    MonthShift = 25, MonthBits = 4,
    MilliShift = 29, MilliBits = 10,
    YearShift = 39, YearBits = 23,
    DSTShift = 62,
    ValidShift = 63
  };
  constexpr int64_t YearBias = int64_t(1)<<(YearBits - 1);
  constexpr uint64_t Valid = uint64_t(1)<<ValidShift;

  constexpr uint64_t mask(unsigned bits) { return (uint64_t(1)<<bits) - 1; }
  inline int field(uint64_t v, unsigned shift, unsigned bits) {
    return int((v>>shift) & mask(bits));
  }

  // writes n zero-padded decimal digits
  inline void digits(std::string &s, unsigned v, unsigned n) {
    char buf[10];
    for (unsigned i = n; i-- > 0; v /= 10) buf[i] = '0' + (v % 10);
    s.append(buf, n);
  }
}

AtAbstime::AtAbstime(
    int year, int month, int day,
    int hour, int minute, int second, int millisecond,
    AtZoneRef zone)
{
  AtCalendar::checkMonth(month);
  if (AtUnlikely(!zone)) zone = AtFixedZone::utc();
  int64_t local =
    localMillis(year, month, day, hour, minute, second, millisecond);
  set(zone->localToUtc(local), zone);
}

AtAbstime::AtAbstime(const AtAbstime &t) :
  m_millis{t.m_millis},
  m_zone{t.m_zone},
  m_fields{t.m_fields.load(std::memory_order_relaxed)},
  m_null{t.m_null},
  m_tz{t.m_tz},
  m_min{t.m_min},
  m_max{t.m_max} { }

AtAbstime &AtAbstime::operator =(const AtAbstime &t)
{
  if (this == &t) return *this;
  m_millis = t.m_millis;
  m_zone = t.m_zone;
  m_fields.store(
      t.m_fields.load(std::memory_order_relaxed), std::memory_order_relaxed);
  m_null = t.m_null;
  m_tz = t.m_tz;
  m_min = t.m_min;
  m_max = t.m_max;
  return *this;
}

void AtAbstime::set(int64_t millis, AtZoneRef zone)
{
  invalidate();
  m_millis = millis;
  if (AtUnlikely(!zone)) zone = AtFixedZone::utc();
  m_zone = std::move(zone);
  m_null = false;
  m_tz = m_zone->id();
}

int64_t AtAbstime::localMillis(
    int year, int month, int day,
    int hour, int minute, int second, int millis)
{
  return
    (AtCalendar::julian(year, month, day) - AtCalendar::EpochJulian) *
      AtCalendar::DayMillis +
    int64_t(hour) * 3600000 + int64_t(minute) * 60000 +
    int64_t(second) * 1000 + millis;
}

AtAbstime::Fields AtAbstime::decompose() const
{
  AtZoneOffset offset = m_zone->offset(m_millis);
  int64_t local = m_millis + offset.offset;
  int64_t days = AtCalendar::floorDiv(local, AtCalendar::DayMillis);
  int64_t ms = local - days * AtCalendar::DayMillis;
  int64_t julian = days + AtCalendar::EpochJulian;

  Fields f;
  AtCalendar::ymd(julian, f.year, f.month, f.day);
  f.hour = int(ms / 3600000);
  f.minute = int((ms / 60000) % 60);
  f.second = int((ms / 1000) % 60);
  f.millisecond = int(ms % 1000);
  f.weekday = AtCalendar::weekday(julian);
  f.dst = offset.dst;
  return f;
}

bool AtAbstime::pack(const Fields &f, uint64_t &v)
{
  int64_t year = int64_t(f.year) + YearBias;
  if (AtUnlikely(year < 0 || year > int64_t(mask(YearBits)))) return false;
  v = Valid |
    (uint64_t(f.dst)<<DSTShift) |
    (uint64_t(year)<<YearShift) |
    (uint64_t(f.millisecond)<<MilliShift) |
    (uint64_t(f.month)<<MonthShift) |
    (uint64_t(f.day)<<DayShift) |
    (uint64_t(f.hour)<<HourShift) |
    (uint64_t(f.minute)<<MinuteShift) |
    (uint64_t(f.second)<<SecondShift) |
    (uint64_t(f.weekday)<<WeekdayShift);
  return true;
}

AtAbstime::Fields AtAbstime::unpack(uint64_t v)
{
  Fields f;
  f.year = int(int64_t(field(v, YearShift, YearBits)) - YearBias);
  f.month = field(v, MonthShift, MonthBits);
  f.day = field(v, DayShift, DayBits);
  f.hour = field(v, HourShift, HourBits);
  f.minute = field(v, MinuteShift, MinuteBits);
  f.second = field(v, SecondShift, SecondBits);
  f.millisecond = field(v, MilliShift, MilliBits);
  f.weekday = field(v, WeekdayShift, WeekdayBits);
  f.dst = (v>>DSTShift) & 1;
  return f;
}

// a racing reader either sees the valid bit clear and recomputes, or
// sees a complete word
AtAbstime::Fields AtAbstime::fields() const
{
  uint64_t v = m_fields.load(std::memory_order_relaxed);
  if (AtLikely(v & Valid)) return unpack(v);
  Fields f = decompose();
  if (pack(f, v)) m_fields.store(v, std::memory_order_relaxed);
  return f;
}

int64_t AtAbstime::timeOfDayMillis() const
{
  Fields f = fields();
  return
    int64_t(f.hour) * 3600000 + int64_t(f.minute) * 60000 +
    int64_t(f.second) * 1000 + f.millisecond;
}

AtAbstime AtAbstime::toUtcTime() const
{
  return AtAbstime{*this, AtFixedZone::utc()};
}

AtAbstime AtAbstime::toLocalTime(const AtZoneProvider &zones) const
{
  return AtAbstime{*this, zones.dflt()};
}

bool AtAbstime::dateEquals(const AtAbstime &t) const
{
  Fields l = fields(), r = t.fields();
  return l.year == r.year && l.month == r.month && l.day == r.day;
}

bool AtAbstime::timeEquals(const AtAbstime &t) const
{
  Fields l = fields(), r = t.fields();
  return
    l.hour == r.hour && l.minute == r.minute &&
    l.second == r.second && l.millisecond == r.millisecond;
}

AtAbstime AtAbstime::timeOfDay(
    int hour, int minute, int second, int millis) const
{
  Fields f = fields();
  return AtAbstime{
    f.year, f.month, f.day, hour, minute, second, millis, m_zone};
}

// steps by Julian day number, which also skips 5th - 14th October 1582;
// a date skipped entirely by the zone (e.g. a date line shift) resolves
// to an instant outside the target date and is passed over
AtAbstime AtAbstime::nextDay() const
{
  Fields f = fields();
  int64_t julian = AtCalendar::julian(f.year, f.month, f.day);
  for (;;) {
    int year, month, day;
    AtCalendar::ymd(++julian, year, month, day);
    AtAbstime t{
      year, month, day, f.hour, f.minute, f.second, f.millisecond, m_zone};
    if (t.m_millis <= m_millis) continue;
    Fields g = t.fields();
    if (AtCalendar::julian(g.year, g.month, g.day) >= julian) return t;
  }
}

AtAbstime AtAbstime::prevDay() const
{
  Fields f = fields();
  int64_t julian = AtCalendar::julian(f.year, f.month, f.day);
  for (;;) {
    int year, month, day;
    AtCalendar::ymd(--julian, year, month, day);
    AtAbstime t{
      year, month, day, f.hour, f.minute, f.second, f.millisecond, m_zone};
    if (t.m_millis >= m_millis) continue;
    Fields g = t.fields();
    if (AtCalendar::julian(g.year, g.month, g.day) <= julian) return t;
  }
}

AtAbstime AtAbstime::nextMonth() const
{
  Fields f = fields();
  bool last = f.day == daysInMonth(f.year, f.month);
  if (++f.month > 12) { f.month = 1; ++f.year; }
  int n = daysInMonth(f.year, f.month);
  if (last || f.day > n) f.day = n;
  return AtAbstime{
    f.year, f.month, f.day,
    f.hour, f.minute, f.second, f.millisecond, m_zone};
}

AtAbstime AtAbstime::prevMonth() const
{
  Fields f = fields();
  bool last = f.day == daysInMonth(f.year, f.month);
  if (--f.month < 1) { f.month = 12; --f.year; }
  int n = daysInMonth(f.year, f.month);
  if (last || f.day > n) f.day = n;
  return AtAbstime{
    f.year, f.month, f.day,
    f.hour, f.minute, f.second, f.millisecond, m_zone};
}

AtAbstime AtAbstime::nextYear() const
{
  Fields f = fields();
  if (f.month == 2 && f.day == 29) f.day = 28;
  return AtAbstime{
    f.year + 1, f.month, f.day,
    f.hour, f.minute, f.second, f.millisecond, m_zone};
}

AtAbstime AtAbstime::prevYear() const
{
  Fields f = fields();
  if (f.month == 2 && f.day == 29) f.day = 28;
  return AtAbstime{
    f.year - 1, f.month, f.day,
    f.hour, f.minute, f.second, f.millisecond, m_zone};
}

AtAbstime AtAbstime::nextWeekday(int weekday) const
{
  if (AtUnlikely(weekday < At::Sunday || weekday > At::Saturday))
    throw AtInvalidArgument{"weekday", weekday};
  AtAbstime t = nextDay();
  while (t.weekday() != weekday) t = t.nextDay();
  return t;
}

AtAbstime AtAbstime::prevWeekday(int weekday) const
{
  if (AtUnlikely(weekday < At::Sunday || weekday > At::Saturday))
    throw AtInvalidArgument{"weekday", weekday};
  AtAbstime t = prevDay();
  while (t.weekday() != weekday) t = t.prevDay();
  return t;
}

int AtAbstime::binCode() const
{
  return AtBinCode::Abstime;
}

// YYYY-MM-DDThh:mm:ss.mmm{Z|+hh:mm|-hh:mm}
std::string AtAbstime::encode() const
{
  Fields f = fields();
  int offset = tzOffset();

  std::string s;
  s.reserve(32);

  unsigned year;
  if (f.year < 0) {
    s.push_back('-');
    year = unsigned(-int64_t(f.year));
  } else
    year = f.year;
  if (AtUnlikely(year > 9999))
    s.append(std::to_string(year));
  else
    digits(s, year, 4);
  s.push_back('-'); digits(s, f.month, 2);
  s.push_back('-'); digits(s, f.day, 2);
  s.push_back('T'); digits(s, f.hour, 2);
  s.push_back(':'); digits(s, f.minute, 2);
  s.push_back(':'); digits(s, f.second, 2);
  s.push_back('.'); digits(s, f.millisecond, 3);

  if (!offset) {
    s.push_back('Z');
    return s;
  }

  int hours = offset / 3600000, minutes = (offset % 3600000) / 60000;
  if (hours < 0) hours = -hours;
  if (minutes < 0) minutes = -minutes;
  s.push_back(offset < 0 ? '-' : '+');
  digits(s, hours, 2);
  s.push_back(':');
  digits(s, minutes, 2);
  return s;
}

// month, day, time of day and offset are range-checked - a value that
// encode() cannot produce is rejected
void AtAbstime::decode(std::string_view s_)
{
  {
    AtScanner s{s_};
    int year, month, day, hour, minute, second, millisecond = 0;
    int sign = 1, oHours = 0, oMinutes = 0;
    bool bc = s.literal('-');

    if (!s.digits(year, 4) || !s.literal('-') ||
	!s.digits(month, 2) || !s.literal('-') ||
	!s.digits(day, 2) || !s.literal('T') ||
	!s.digits(hour, 2) || !s.literal(':') ||
	!s.digits(minute, 2) || !s.literal(':') ||
	!s.digits(second, 2)) goto invalid;

    if (s.literal('.') && !s.frac(millisecond, 3)) goto invalid;

    if (!s.literal('Z')) {
      if (!s.sign(sign) || !s.digits(oHours, 2)) goto invalid;
      if (s.literal(':') && !s.digits(oMinutes, 2)) goto invalid;
    }

    if (!s.end()) goto invalid;

    if (bc) year = -year;

    if (AtUnlikely(
	month < 1 || month > 12 ||
	day < 1 || day > daysInMonth(year, month) ||
	hour > 23 || minute > 59 || second > 59 ||
	oHours > 23 || oMinutes > 59)) goto invalid;

    int offset = sign * (oHours * 3600000 + oMinutes * 60000);
    AtZoneRef zone =
      offset ? AtZoneRef{new AtFixedZone{offset}} : AtFixedZone::utc();
    set(localMillis(
	  year, month, day, hour, minute, second, millisecond) - offset,
	std::move(zone));
    return;
  }

invalid:
  throw AtInvalidFormat{"abstime", s_};
}

AtAbstime AtAbstime::parse(std::string_view s)
{
  AtAbstime t;
  t.decode(s);
  return t;
}

// hh:mm:ss DD-Mon-YY zone
std::string AtAbstime::format() const
{
  if (m_null) return "null";

  Fields f = fields();

  std::string s;
  s.reserve(32);
  digits(s, f.hour, 2);
  s.push_back(':'); digits(s, f.minute, 2);
  s.push_back(':'); digits(s, f.second, 2);
  s.push_back(' '); digits(s, f.day, 2);
  s.push_back('-'); s.append(AtCalendar::monthShortName(f.month));
  s.push_back('-');
  digits(s, unsigned(f.year < 0 ? -f.year : f.year) % 100, 2);
  s.push_back(' ');
  s.append(m_zone->abbrev(m_millis));
  return s;
}

std::optional<AtAbstime> AtAbstime::min() const
{
  if (!m_min) return {};
  return AtAbstime{m_min->millis, m_min->zone};
}

void AtAbstime::min(const std::optional<AtAbstime> &t)
{
  if (!t) { m_min.reset(); return; }
  m_min = Bound{t->m_millis, t->m_zone};
}

std::optional<AtAbstime> AtAbstime::max() const
{
  if (!m_max) return {};
  return AtAbstime{m_max->millis, m_max->zone};
}

void AtAbstime::max(const std::optional<AtAbstime> &t)
{
  if (!t) { m_max.reset(); return; }
  m_max = Bound{t->m_millis, t->m_zone};
}

void AtAbstime::tz(const AtZoneProvider &zones, std::string_view id)
{
  if (id.empty()) return;

  AtZoneRef zone = zones.resolve(id);
  if (!zone) {
    AtLOG(Warning, [id = std::string{id}](auto &s) {
      s << "unknown time zone \"" << id << "\" - ignored";
    });
    return;
  }

  m_tz = id;
  if (!m_zone || !m_zone->equals(*zone)) {
    invalidate();
    m_zone = std::move(zone);
  }
}
