//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// library configuration, injected once during process setup

// AtSysZones zones{AtZoneParams{}.dfltZone("Europe/London")};
// AtLog::init(AtLogParams{}.program("app").level(At::Warning));

#ifndef AtParams_HH
#define AtParams_HH

#ifndef AtLib_HH
#include <atlib/AtLib.hh>
#endif

#include <string>
#include <string_view>

struct AtZoneParams {
  AtZoneParams &zoneinfo(std::string_view s) { m_zoneinfo = s; return *this; }
  AtZoneParams &dfltZone(std::string_view s) { m_dfltZone = s; return *this; }

  const auto &zoneinfo() const { return m_zoneinfo; }
  const auto &dfltZone() const { return m_dfltZone; }

private:
  std::string	m_zoneinfo = "/usr/share/zoneinfo";
  std::string	m_dfltZone;	// empty - detect from TZ / /etc/localtime
};

struct AtLogParams {
  AtLogParams &program(std::string_view s) { m_program = s; return *this; }
  AtLogParams &level(int l) { m_level = l; return *this; }
  AtLogParams &path(std::string_view s) { m_path = s; return *this; }

  const auto &program() const { return m_program; }
  auto level() const { return m_level; }
  const auto &path() const { return m_path; }

private:
  std::string	m_program;
  int		m_level = 1;	// At::Info
  std::string	m_path;		// empty - stderr
};

#endif /* AtParams_HH */
