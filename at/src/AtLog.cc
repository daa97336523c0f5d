//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// singleton logger

#include <chrono>

#include <atlib/AtLog.hh>
#include <atlib/AtZone.hh>
#include <atlib/AtAbstime.hh>

const char *At::severity(unsigned i)
{
  static const char * const name[] = {
    "DEBUG", "INFO", "WARNING", "ERROR", "FATAL"
  };

  return i > 4 ? "UNKNOWN" : name[i];
}

std::string_view At::file(std::string_view s)
{
#ifndef _WIN32
  auto i = s.find_last_of('/');
#else
  auto i = s.find_last_of(":/\\");
#endif
  if (i == std::string_view::npos) return s;
  return s.substr(i + 1);
}

AtEventInfo::AtEventInfo(
    int severity_,
    const char *file_, int line_,
    const char *function_) :
  time{std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now().time_since_epoch()).count()},
  severity{severity_},
  file{file_}, line{line_},
  function{function_} { }

AtLog::AtLog() : m_level{At::Info} { }

AtLog *AtLog::instance()
{
  static AtLog log;
  return &log;
}

#ifdef __linux__
extern "C" {
  extern char *program_invocation_short_name;
}
#endif

void AtLog::init_(const AtLogParams &params)
{
  // intentionally not idempotent - permit re-initialization
  AtRef<AtSink> sink = params.path().empty() ?
    fileSink() : fileSink(params.path());
  Guard guard(m_lock);
  m_program = params.program();
  m_level.store(params.level());
  m_sink = std::move(sink);
}

std::string AtLog::program_()
{
  Guard guard(m_lock);
  if (m_program.empty()) {
#ifdef __linux__
    m_program = program_invocation_short_name;
#else
    m_program = "AtLog";
#endif
  }
  return m_program;
}

AtRef<AtSink> AtLog::sink_()
{
  Guard guard(m_lock);
  if (AtUnlikely(!m_sink)) m_sink = fileSink();	// default to stderr
  return m_sink;
}

void AtLog::sink_(AtRef<AtSink> sink)
{
  Guard guard(m_lock);
  m_sink = std::move(sink);
}

void AtLog::log__(const AtEventInfo &info, std::string_view msg)
{
  auto sink = sink_();
  Guard guard(m_lock);
  sink->log(info, msg);
}

// suppress security warnings about fopen()
#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable:4996)
#endif

void AtFileSink::open()
{
  if (!m_path.empty()) m_file = fopen(m_path.c_str(), "a");

  if (!m_file)
    m_file = stderr;
  else
    setvbuf(m_file, 0, _IOLBF, BUFSIZ);
}

AtFileSink::~AtFileSink()
{
  if (m_file && m_file != stderr) fclose(m_file);
}

void AtFileSink::log(const AtEventInfo &info, std::string_view msg)
{
  if (AtUnlikely(!m_file)) open();

  std::ostringstream s;
  s << AtAbstime{info.time, AtFixedZone::utc()} << ' ' <<
    At::severity(info.severity) << ' ';
  if (info.severity == At::Debug || info.severity == At::Fatal)
    s << '\"' << At::file(info.file) << "\":" << info.line << ' ';
  s << info.function << "() " << msg;

  auto buf = std::move(s).str();
  if (buf.empty() || buf.back() != '\n') buf.push_back('\n');

  fwrite(buf.data(), 1, buf.size(), m_file);
  if (info.severity > At::Debug) fflush(m_file);
}

#ifdef _MSC_VER
#pragma warning(pop)
#endif
