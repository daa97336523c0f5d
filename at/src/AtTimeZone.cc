//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

#include <time.h>
#include <stdlib.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <unistd.h>
#include <limits.h>

#include <mutex>

#include <atlib/AtTimeZone.hh>
#include <atlib/AtCalendar.hh>
#include <atlib/AtLog.hh>

namespace {

std::mutex &tzLock()
{
  static std::mutex lock;
  return lock;
}

class TzGuard {
  TzGuard(const TzGuard &) = delete;
  TzGuard &operator =(const TzGuard &) = delete;

public:
  TzGuard(const std::string &tz) : m_guard{tzLock()} {
    if (const char *oldTz = ::getenv("TZ")) {
      m_oldTz = oldTz;
      m_restore = true;
    }
    ::setenv("TZ", tz.c_str(), 1);
    At::tzset();
  }
  ~TzGuard() {
    if (m_restore)
      ::setenv("TZ", m_oldTz.c_str(), 1);
    else
      ::unsetenv("TZ");
    At::tzset();
  }

private:
  std::lock_guard<std::mutex>	m_guard;
  std::string			m_oldTz;
  bool				m_restore = false;
};

}

AtTzZone::AtTzZone(std::string id, std::string tz) :
  AtZone{std::move(id)}, m_tz{std::move(tz)}
{
  TzGuard guard{m_tz};
  m_rawOffset = int(-timezone) * 1000;
}

AtZoneOffset AtTzZone::offset(int64_t millis) const
{
  time_t t = AtCalendar::floorDiv(millis, 1000);
  struct tm tm_;

  TzGuard guard{m_tz};

  if (AtUnlikely(!localtime_r(&t, &tm_))) // out of range
    return {m_rawOffset, false};

  return {int(tm_.tm_gmtoff) * 1000, tm_.tm_isdst > 0};
}

std::string AtTzZone::abbrev(int64_t millis) const
{
  time_t t = AtCalendar::floorDiv(millis, 1000);
  struct tm tm_;

  TzGuard guard{m_tz};

  if (AtUnlikely(!localtime_r(&t, &tm_) || !tm_.tm_zone)) return id();

  return tm_.tm_zone;
}

AtSysZones::AtSysZones(const AtZoneParams &params) :
  m_zoneinfo{params.zoneinfo()}
{
  std::string id = params.dfltZone();
  if (id.empty()) id = detect();
  if (!id.empty()) m_dflt = resolve(id);
  if (!m_dflt) {
    if (!id.empty())
      AtLOG(Warning, [id](auto &s) {
	s << "default time zone \"" << id << "\" not found - using UTC";
      });
    m_dflt = utc();
  }
  AtLOG(Debug, [id = m_dflt->id()](auto &s) {
    s << "default time zone: " << id;
  });
}

// TZ if set, otherwise the target of the /etc/localtime link
std::string AtSysZones::detect() const
{
  std::string id;

  if (const char *tz = ::getenv("TZ")) {
    id = tz;
    if (!id.empty() && id[0] == ':') id.erase(0, 1);
  } else {
    char buf[PATH_MAX];
    ssize_t n = ::readlink("/etc/localtime", buf, sizeof(buf) - 1);
    if (n <= 0) return id;
    id.assign(buf, n);
  }

  // strip zoneinfo directory prefix, if any
  static const std::string_view dir{"zoneinfo/"};
  auto i = id.rfind(dir);
  if (i != std::string::npos) id.erase(0, i + dir.size());
  return id;
}

AtZoneRef AtSysZones::resolve(std::string_view id) const
{
  if (id.empty()) return {};

  int offset;
  if (AtFixedZone::scan(id, offset)) {
    if (!offset) return utc();
    return new AtFixedZone{offset};
  }

  if (id[0] == '/' || id.find("..") != std::string_view::npos) return {};

  std::string path = m_zoneinfo;
  path += '/';
  path += id;

  struct stat st;
  if (::stat(path.c_str(), &st) < 0 || !S_ISREG(st.st_mode)) {
    AtLOG(Debug, [path](auto &s) { s << "no zoneinfo file " << path; });
    return {};
  }

  return new AtTzZone{std::string{id}, std::string{":"} + path};
}
