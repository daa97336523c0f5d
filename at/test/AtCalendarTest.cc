//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

#include <atlib/AtLib.hh>

#include <stdio.h>
#include <string.h>

#include <atlib/AtCalendar.hh>
#include <atlib/AtError.hh>

static unsigned failed = 0;

#define CHECK(x) ((x) ? puts("OK  " #x) : (++failed, puts("NOK " #x)))

template <typename E, typename L>
static bool throws(L l)
{
  try { l(); } catch (const E &) { return true; }
  return false;
}

static bool roundTrip(int year, int month, int day)
{
  int y, m, d;
  AtCalendar::ymd(AtCalendar::julian(year, month, day), y, m, d);
  return y == year && m == month && d == day;
}

int main()
{
  using namespace AtCalendar;

  CHECK(isLeapYear(2000));
  CHECK(!isLeapYear(1900));
  CHECK(isLeapYear(1600));
  CHECK(isLeapYear(1500));	// Julian rule before 1582
  CHECK(isLeapYear(1100));
  CHECK(!isLeapYear(1582));
  CHECK(isLeapYear(2024));
  CHECK(!isLeapYear(2023));
  CHECK(!isLeapYear(2100));

  CHECK(daysInMonth(2001, 2) == 28);
  CHECK(daysInMonth(2004, 2) == 29);
  CHECK(daysInMonth(1900, 2) == 28);
  CHECK(daysInMonth(1500, 2) == 29);
  CHECK(daysInMonth(2023, 1) == 31);
  CHECK(daysInMonth(2023, 4) == 30);
  CHECK(daysInMonth(2023, 12) == 31);
  CHECK(daysInYear(2000) == 366);
  CHECK(daysInYear(1900) == 365);

  CHECK(throws<AtInvalidArgument>([]() { daysInMonth(2023, 0); }));
  CHECK(throws<AtInvalidArgument>([]() { daysInMonth(2023, 13); }));
  CHECK(throws<AtInvalidArgument>([]() { checkMonth(-1); }));
  CHECK(checkMonth(12) == 12);

  try {
    checkMonth(13);
  } catch (const AtInvalidArgument &e) {
    CHECK(e.name() == "month");
    CHECK(e.value() == 13);
    CHECK(e.message() == "invalid month: 13 (month must be 1 to 12)");
  }

  CHECK(julian(1970, 1, 1) == EpochJulian);
  CHECK(julian(1582, 10, 15) == ReformationJulian);
  CHECK(julian(1582, 10, 4) == ReformationJulian - 1);
  CHECK(julian(-4712, 1, 1) == 0);
  CHECK(julian(2024, 2, 29) == 2460370);

  // day argument is lenient
  CHECK(julian(2023, 1, 32) == julian(2023, 2, 1));
  CHECK(julian(2023, 3, 0) == julian(2023, 2, 28));

  {
    int y, m, d;
    ymd(ReformationJulian - 1, y, m, d);
    CHECK(y == 1582 && m == 10 && d == 4);
    ymd(ReformationJulian, y, m, d);
    CHECK(y == 1582 && m == 10 && d == 15);
    ymd(EpochJulian, y, m, d);
    CHECK(y == 1970 && m == 1 && d == 1);
  }

  {
    bool ok = true;
    for (int year = -4712; year <= 3000; year += 7)
      for (int month = 1; month <= 12; month++)
	for (int day = 1, n = daysInMonth(year, month); day <= n; day += 3) {
	  if (year == 1582 && month == 10 && day > 4 && day < 15) continue;
	  if (!roundTrip(year, month, day)) {
	    printf("%d-%d-%d\n", year, month, day);
	    ok = false;
	  }
	}
    CHECK(ok);
  }
  // before Julian day 0 (1st January 4713BC)
  CHECK(julian(-4713, 12, 31) == -1);
  {
    int y, m, d;
    ymd(-1, y, m, d);
    CHECK(y == -4713 && m == 12 && d == 31);
    ymd(-1031635, y, m, d);
    CHECK(y == -7537 && m == 7 && d == 16);
  }
  {
    bool ok = true;
    int y = -20000, m = 1, d = 1;
    for (int64_t j = julian(y, m, d), e = julian(-4000, 1, 1); j < e; j++) {
      int y_, m_, d_;
      ymd(j, y_, m_, d_);
      if (y_ != y || m_ != m || d_ != d || julian(y, m, d) != j) {
	printf("%lld %d-%d-%d\n", static_cast<long long>(j), y, m, d);
	ok = false;
	break;
      }
      if (++d > daysInMonth(y, m)) {
	d = 1;
	if (++m > 12) { m = 1; ++y; }
      }
    }
    CHECK(ok);
  }
  CHECK(weekday(-1) == At::Sunday);
  CHECK(weekday(0) == At::Monday);

  CHECK(roundTrip(5000000, 1, 1));
  CHECK(roundTrip(0, 2, 29));
  CHECK(roundTrip(-1, 12, 31));

  CHECK(weekday(EpochJulian) == At::Thursday);
  CHECK(weekday(julian(2024, 2, 29)) == At::Thursday);
  CHECK(weekday(julian(2024, 5, 17)) == At::Friday);
  CHECK(weekday(ReformationJulian) == At::Friday);
  CHECK(weekday(ReformationJulian - 1) == At::Thursday);

  CHECK(floorDiv(-1, DayMillis) == -1);
  CHECK(floorDiv(DayMillis, DayMillis) == 1);
  CHECK(floorMod(-1, DayMillis) == DayMillis - 1);

  CHECK(!strcmp(dayShortName(At::Sunday), "Sun"));
  CHECK(!strcmp(dayShortName(At::Saturday), "Sat"));
  CHECK(!strcmp(dayShortName(7), "???"));
  CHECK(!strcmp(monthShortName(1), "Jan"));
  CHECK(!strcmp(monthShortName(12), "Dec"));
  CHECK(!strcmp(monthShortName(0), "???"));

  return failed ? 1 : 0;
}
