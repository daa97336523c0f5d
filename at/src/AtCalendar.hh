//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// civil calendar primitives - Julian day number based

// * year/month/day conversions account for the reformation of
//   15th October 1582 and the adoption of the Gregorian calendar;
//   the preceding day is 4th October 1582 (Julian calendar)

// * leap years follow the Gregorian rule from 1582 onwards and the
//   Julian rule (every 4th year) before 1582

// * years are astronomical - 1BC is year 0, 2BC is year -1

// * dates before 1st January 4713BC (Julian day 0) are handled by
//   shifting whole 4-year Julian cycles

#ifndef AtCalendar_HH
#define AtCalendar_HH

#ifndef AtLib_HH
#include <atlib/AtLib.hh>
#endif

namespace At {
  enum { Sunday = 0, Monday, Tuesday, Wednesday, Thursday, Friday, Saturday };
}

namespace AtCalendar {

// Julian day number of 1st January 1970 (the POSIX epoch)
constexpr int64_t EpochJulian = 2440588;

// Julian day number of 15th October 1582 (first Gregorian day)
constexpr int64_t ReformationJulian = 2299161;
constexpr int ReformationYear = 1582;
constexpr int ReformationMonth = 10;
constexpr int ReformationDay = 15;

constexpr int64_t DayMillis = 86400000;

// throws AtInvalidArgument unless 1 <= month <= 12
AtExtern int checkMonth(int month);

inline bool isLeapYear(int year) {
  if (year >= ReformationYear) // Gregorian
    return (year % 4 == 0) && ((year % 100 != 0) || (year % 400 == 0));
  // Julian
  return year % 4 == 0;
}

// month 1-12, throws AtInvalidArgument if month is out of range
AtExtern int daysInMonth(int year, int month);

inline int daysInYear(int year) { return isLeapYear(year) ? 366 : 365; }

// day is not range-checked - day 0 is the last day of the prior month
AtExtern int64_t julian(int year, int month, int day);

AtExtern void ymd(int64_t julian, int &year, int &month, int &day);

// 0-6, Sunday is 0
inline int weekday(int64_t julian) {
  int64_t w = (julian + 1) % 7;
  if (w < 0) w += 7;
  return int(w);
}

// floor division and modulus for millis <-> days
inline int64_t floorDiv(int64_t n, int64_t d) {
  int64_t q = n / d;
  if ((n % d) && ((n < 0) != (d < 0))) --q;
  return q;
}
inline int64_t floorMod(int64_t n, int64_t d) {
  return n - floorDiv(n, d) * d;
}

// 0-6 (Sunday is 0), 1-12
AtExtern const char *dayShortName(int weekday);
AtExtern const char *monthShortName(int month);

} // AtCalendar

#endif /* AtCalendar_HH */
