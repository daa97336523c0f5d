//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

#include <atlib/AtLib.hh>

#include <stdio.h>
#include <stdlib.h>

#include <string>

#include <atlib/AtAbstime.hh>
#include <atlib/AtTimeZone.hh>
#include <atlib/AtLog.hh>

static unsigned failed = 0;

#define CHECK(x) ((x) ? puts("OK  " #x) : (++failed, puts("NOK " #x)))

static bool scan(const char *id, int offset)
{
  int offset_ = -1;
  return AtFixedZone::scan(id, offset_) && offset_ == offset;
}

static bool noScan(const char *id)
{
  int offset;
  return !AtFixedZone::scan(id, offset);
}

static void newYork(const AtSysZones &zones)
{
  AtZoneRef ny = zones.resolve("America/New_York");
  if (!ny) {
    puts("SKIP America/New_York not found");
    return;
  }

  CHECK(ny->id() == "America/New_York");
  CHECK(ny->rawOffset() == -5 * 3600000);

  AtAbstime summer{AtAbstime::parse("2024-07-04T12:00:00Z"), ny};
  CHECK(summer.hour() == 8);
  CHECK(summer.inDaylightTime());
  CHECK(summer.tzOffset() == -4 * 3600000);
  CHECK(summer.encode() == "2024-07-04T08:00:00.000-04:00");
  CHECK(summer.format() == "08:00:00 04-Jul-24 EDT");
  CHECK(summer.tz() == "America/New_York");

  AtAbstime winter{AtAbstime::parse("2024-01-15T12:00:00Z"), ny};
  CHECK(winter.hour() == 7);
  CHECK(!winter.inDaylightTime());
  CHECK(winter.tzOffset() == -5 * 3600000);
  CHECK(winter.encode() == "2024-01-15T07:00:00.000-05:00");
  CHECK(winter.format() == "07:00:00 15-Jan-24 EST");

  // decoding yields a fixed-offset zone, not the named zone
  AtAbstime decoded = AtAbstime::parse(summer.encode());
  CHECK(decoded == summer);
  CHECK(decoded.zone()->id() == "UTC-04:00");

  // skipped local time uses the offset in effect before the transition
  AtAbstime skipped{2024, 3, 10, 2, 30, 0, 0, ny};
  CHECK(skipped.millis() == 1710055800000LL);
  CHECK(skipped.hour() == 3 && skipped.minute() == 30);
  CHECK(skipped.inDaylightTime());

  // repeated local time resolves to standard time
  AtAbstime repeated{2024, 11, 3, 1, 30, 0, 0, ny};
  CHECK(repeated.millis() == 1730615400000LL);
  CHECK(!repeated.inDaylightTime());

  // calendar stepping preserves wall clock time across DST transitions
  AtAbstime before{2024, 3, 9, 12, 0, 0, 0, ny};
  AtAbstime after = before.nextDay();
  CHECK(after.day() == 10 && after.hour() == 12);
  CHECK(before.delta(after) == 23 * 3600000);
  CHECK(after.prevDay() == before);
  CHECK(AtAbstime(2024, 1, 31, 12, 0, 0, 0, ny).nextMonth().day() == 29);

  AtSysZones nyZones{AtZoneParams{}.dfltZone("America/New_York")};
  CHECK(nyZones.dflt()->id() == "America/New_York");
  AtAbstime local = AtAbstime::parse("2024-07-04T12:00:00Z").
    toLocalTime(nyZones);
  CHECK(local.hour() == 8);
  CHECK(local.toUtcTime().hour() == 12);
}

static void london(const AtSysZones &zones)
{
  AtZoneRef london = zones.resolve("Europe/London");
  if (!london) {
    puts("SKIP Europe/London not found");
    return;
  }

  AtAbstime summer{AtAbstime::parse("2024-07-04T12:00:00Z"), london};
  CHECK(summer.hour() == 13);
  CHECK(summer.encode() == "2024-07-04T13:00:00.000+01:00");

  // zero effective offset is rendered as Z even in a named zone
  AtAbstime winter{AtAbstime::parse("2024-01-15T12:00:00Z"), london};
  CHECK(!winter.inDaylightTime());
  CHECK(winter.encode() == "2024-01-15T12:00:00.000Z");
  CHECK(winter.format() == "12:00:00 15-Jan-24 GMT");
}

static bool ymd(const AtAbstime &t, int year, int month, int day)
{
  return t.year() == year && t.month() == month && t.day() == day;
}

static void apia(const AtSysZones &zones)
{
  AtZoneRef apia = zones.resolve("Pacific/Apia");
  if (!apia) {
    puts("SKIP Pacific/Apia not found");
    return;
  }

  // Samoa skipped 30th December 2011, moving from UTC-10 to UTC+14
  AtAbstime thu{2011, 12, 29, 10, 0, 0, 0, apia};
  CHECK(thu.tzOffset() == -10 * 3600000);
  CHECK(thu.weekday() == At::Thursday);

  AtAbstime sat = thu.nextDay();
  CHECK(sat.isAfter(thu));
  CHECK(ymd(sat, 2011, 12, 31));
  CHECK(sat.hour() == 10);
  CHECK(sat.tzOffset() == 14 * 3600000);
  CHECK(thu.delta(sat) == AtCalendar::DayMillis);
  CHECK(sat.prevDay() == thu);
  CHECK(sat.prevDay().isBefore(sat));

  // weekday search passes over the missing Friday
  CHECK(thu.nextWeekday(At::Saturday) == sat);
  CHECK(ymd(thu.nextWeekday(At::Friday), 2012, 1, 6));
  CHECK(ymd(sat.prevWeekday(At::Friday), 2011, 12, 23));
  CHECK(ymd(sat.prevWeekday(At::Thursday), 2011, 12, 29));
}

int main()
{
  const AtZoneRef &utc = AtFixedZone::utc();

  // fixed zones
  CHECK(AtFixedZone::name(0) == "UTC");
  CHECK(AtFixedZone::name(5 * 3600000 + 30 * 60000) == "UTC+05:30");
  CHECK(AtFixedZone::name(-8 * 3600000) == "UTC-08:00");
  CHECK(AtFixedZone::name(-30 * 60000) == "UTC-00:30");

  CHECK(scan("Z", 0));
  CHECK(scan("UTC", 0));
  CHECK(scan("GMT", 0));
  CHECK(scan("UTC+05:30", 5 * 3600000 + 30 * 60000));
  CHECK(scan("UTC+0530", 5 * 3600000 + 30 * 60000));
  CHECK(scan("UTC+5:30", 5 * 3600000 + 30 * 60000));
  CHECK(scan("GMT-8", -8 * 3600000));
  CHECK(scan("UTC-00:30", -30 * 60000));
  CHECK(noScan(""));
  CHECK(noScan("Zulu"));
  CHECK(noScan("EST"));
  CHECK(noScan("UTC+"));
  CHECK(noScan("UTC+24"));
  CHECK(noScan("UTC+05:60"));
  CHECK(noScan("UTC+05:3"));
  CHECK(noScan("UTC 5"));

  {
    AtFixedZone cet{3600000};
    CHECK(cet.id() == "UTC+01:00");
    CHECK(cet.rawOffset() == 3600000);
    CHECK(cet.offset(0).offset == 3600000);
    CHECK(!cet.offset(0).dst);
    CHECK(cet.abbrev(0) == "UTC+01:00");
    CHECK(cet.localToUtc(3600000) == 0);
    CHECK(!cet.equals(*utc));
    CHECK(AtFixedZone{0}.equals(*utc));
    CHECK(utc == AtFixedZone::utc());
  }

  // system zones
  {
    AtSysZones zones{AtZoneParams{}.dfltZone("UTC")};
    CHECK(zones.zoneinfo() == "/usr/share/zoneinfo");
    CHECK(zones.utc() == utc);
    CHECK(zones.dflt() == utc);
    CHECK(zones.resolve("Z") == utc);
    CHECK(zones.resolve("GMT+00:00") == utc);
    CHECK(zones.resolve("GMT-8")->rawOffset() == -8 * 3600000);
    CHECK(!zones.resolve(""));
    CHECK(!zones.resolve("Nowhere/Atlantis"));
    CHECK(!zones.resolve("../zoneinfo/UTC"));
    CHECK(!zones.resolve("/etc/passwd"));
    CHECK(!zones.resolve("America"));	// directory

    newYork(zones);
    london(zones);
    apia(zones);
  }

  // unresolvable default zone falls back to UTC with a warning
  {
    unsigned warnings = 0;
    AtLog::sink(AtLog::lambdaSink(
	  [&warnings](const AtEventInfo &info, std::string_view) {
	    if (info.severity == At::Warning) ++warnings;
	  }));
    AtSysZones zones{
      AtZoneParams{}.zoneinfo("/nonexistent").dfltZone("America/New_York")};
    CHECK(zones.dflt() == utc);
    CHECK(warnings == 1);
    AtLog::sink(AtLog::fileSink());
  }

  // default zone detection from TZ
  {
    const char *tz = ::getenv("TZ");
    std::string oldTz = tz ? tz : "";

    ::setenv("TZ", "UTC", 1);
    CHECK(AtSysZones{}.dflt() == utc);

    ::setenv("TZ", ":America/New_York", 1);
    {
      AtSysZones zones;
      if (!zones.resolve("America/New_York"))
	puts("SKIP America/New_York not found");
      else
	CHECK(zones.dflt()->id() == "America/New_York");
    }

    if (tz)
      ::setenv("TZ", oldTz.c_str(), 1);
    else
      ::unsetenv("TZ");
  }

  return failed ? 1 : 0;
}
