//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// civil calendar primitives - Julian day number based

#include <atlib/AtCalendar.hh>
#include <atlib/AtError.hh>

int AtCalendar::checkMonth(int month)
{
  if (AtUnlikely(month < 1 || month > 12))
    throw AtInvalidArgument{"month", month};
  return month;
}

int AtCalendar::daysInMonth(int year, int month)
{
  static const int days[] =
    { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };

  checkMonth(month);
  if (month == 2) return isLeapYear(year) ? 29 : 28;
  return days[month - 1];
}

int64_t AtCalendar::julian(int year, int month, int day)
{
  if (year > ReformationYear ||
      (year == ReformationYear &&
	(month > ReformationMonth ||
	  (month == ReformationMonth && day >= ReformationDay)))) {
    int64_t y = year, o = (month <= 2 ? -1 : 0);

    return ((1461 * (y + 4800 + o))>>2) +
      (367 * (month - 2 - 12 * o)) / 12 -
      ((3 * ((y + 4900 + o) / 100))>>2) +
      day - 32075;
  } else {
    // shift by whole 4-year Julian cycles (1461 days) to keep the
    // formula's intermediate terms non-negative
    if (AtUnlikely(year < -4712)) {
      int64_t n = floorDiv(int64_t(year) + 4712, 4);
      return julian(int(year - 4 * n), month, day) + n * 1461;
    }

    int64_t y = year;

    return 367 * y - ((7 * (y + 5001 + (month - 9) / 7))>>2) +
      (275 * month) / 9 + day + 1729777;
  }
}

void AtCalendar::ymd(int64_t julian, int &year, int &month, int &day)
{
  if (AtLikely(julian >= ReformationJulian)) {
    int64_t i, j, l, n;

    l = julian + 68569;
    n = (l<<2) / 146097;
    l = l - ((146097 * n + 3)>>2);
    i = (4000 * (l + 1)) / 1461001;
    l = l - ((1461 * i)>>2) + 31;
    j = (80 * l) / 2447;
    day = int(l - (2447 * j) / 80);
    l = j / 11;
    month = int(j + 2 - 12 * l);
    year = int(100 * (n - 49) + i + l);
  } else {
    int64_t i, j, k, l, n;

    if (AtUnlikely(julian < 0)) {
      n = floorDiv(julian, 1461);
      ymd(julian - n * 1461, year, month, day);
      year += int(4 * n);
      return;
    }

    j = julian + 1402;
    k = (j - 1) / 1461;
    l = j - 1461 * k;
    n = (l - 1) / 365 - l / 1461;
    i = l - 365 * n + 30;
    j = (80 * i) / 2447;
    day = int(i - (2447 * j) / 80);
    i = j / 11;
    month = int(j + 2 - 12 * i);
    year = int((k<<2) + n + i - 4716);
  }
}

const char *AtCalendar::dayShortName(int i)
{
  static const char *s[] =
    { "Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat" };
  if (i < 0 || i >= 7) return "???";
  return s[i];
}

const char *AtCalendar::monthShortName(int i)
{
  static const char *s[] =
    { "Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep",
      "Oct", "Nov", "Dec" };
  if (--i < 0 || i >= 12) return "???";
  return s[i];
}
