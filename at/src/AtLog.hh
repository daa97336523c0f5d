//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// singleton logger

// AtLog::init(AtLogParams{}.program("program"));
// AtLog::sink(AtLog::fileSink("app.log"));	// default sink is stderr
// AtLOG(Debug, "debug message");		// AtLOG() is macro
// AtLOG(Warning, [tz](auto &s) { s << "no timezone: " << tz; });
// try { ... } catch (const AtError &e) { AtLOG(Error, e); }

// logging is synchronous - each event is formatted and written by the
// calling thread while holding the logger lock; the lock is recursive,
// so a sink may itself log (it must bound its own recursion)

#ifndef AtLog_HH
#define AtLog_HH

#ifndef AtLib_HH
#include <atlib/AtLib.hh>
#endif

#include <stdio.h>

#include <string>
#include <string_view>
#include <sstream>
#include <mutex>
#include <atomic>
#include <utility>
#include <type_traits>

#include <atlib/AtPolymorph.hh>
#include <atlib/AtParams.hh>

// normalized severity levels
namespace At {
  enum { Debug = 0, Info, Warning, Error, Fatal, NSeverities };

  AtExtern const char *severity(unsigned i);
  AtExtern std::string_view file(std::string_view path);
}

// event time, severity, file name, line number, function
struct AtAPI AtEventInfo {
  int64_t	time;		// millis since 1 Jan 1970 UTC
  int		severity;	// At:: Debug, Info, Warning, Error, Fatal
  const char	*file;
  int		line;
  const char	*function;

  AtEventInfo(
      int severity_,
      const char *file_, int line_,
      const char *function_);
};

// event enriched with lambda message - [...](auto &s) { s << ... }
template <typename L>
struct AtEvent : public AtEventInfo {
  mutable L	l;

  template <typename L_>
  AtEvent(
      int severity_,
      const char *file_, int line_,
      const char *function_, L_ &&l_) :
    AtEventInfo{severity_, file_, line_, function_},
    l{std::forward<L_>(l_)} { }

  AtEvent(const AtEvent &) = delete;
  AtEvent &operator =(const AtEvent &) = delete;
  AtEvent(AtEvent &&) = default;
  AtEvent &operator =(AtEvent &&) = default;
};

// convert string/printable to lambda
namespace AtMsg_ {
template <typename Msg>
inline auto fn(Msg &&msg) {
  using U = std::decay_t<Msg>;
  if constexpr (std::is_invocable_v<U &, std::ostream &>) {
    return U{std::forward<Msg>(msg)};
  } else if constexpr (std::is_convertible_v<Msg, const char *>) {
    return [msg = static_cast<const char *>(msg)](auto &s) { s << msg; };
  } else {
    // render eagerly - the message may be abstract or short-lived
    std::ostringstream o;
    o << msg;
    return [msg = std::move(o).str()](auto &s) { s << msg; };
  }
}
} // AtMsg_

template <typename Msg>
inline auto AtMkEvent(
    int severity_,
    const char *file_, int line_,
    const char *function_, Msg &&msg) {
  auto l = AtMsg_::fn(std::forward<Msg>(msg));
  return AtEvent<decltype(l)>{
    severity_, file_, line_, function_, std::move(l)};
}
#define AtEVENT_(sev, ...) \
  AtMkEvent(sev, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define AtEVENT(sev, ...) AtEVENT_(At:: sev, __VA_ARGS__)

namespace AtSinkType {
  enum { File = 0, Lambda };
}
struct AtSink : public AtPolymorph {
  int	type;	// AtSinkType

  AtSink(int type_) : type{type_} { }

  virtual void log(const AtEventInfo &, std::string_view msg) = 0;
};

class AtAPI AtFileSink : public AtSink {
public:
  AtFileSink() : AtSink{AtSinkType::File} { }
  AtFileSink(std::string_view path) :
    AtSink{AtSinkType::File}, m_path{path} { }

  ~AtFileSink();

  const std::string &path() const { return m_path; }

  void log(const AtEventInfo &, std::string_view msg);

private:
  void open();

  std::string	m_path;		// empty - stderr
  FILE		*m_file = nullptr;
};

template <typename L>
struct AtLambdaSink : public AtSink {
  L	l;

  AtLambdaSink(L l_) : AtSink{AtSinkType::Lambda}, l{std::move(l_)} { }

  void log(const AtEventInfo &info, std::string_view msg) { l(info, msg); }
};

class AtAPI AtLog {
  AtLog(const AtLog &) = delete;
  AtLog &operator =(const AtLog &) = delete;	// prevent mis-use

  using Lock = std::recursive_mutex;	// sinks may log
  using Guard = std::lock_guard<Lock>;

  AtLog();

public:
  static AtLog *instance();

  template <typename ...Args>
  static AtRef<AtSink> fileSink(Args &&...args) {
    return new AtFileSink(std::forward<Args>(args)...);
  }
  template <typename L>
  static AtRef<AtSink> lambdaSink(L &&l) {
    return new AtLambdaSink<std::decay_t<L>>(std::forward<L>(l));
  }

  static void init(const AtLogParams &params) {
    instance()->init_(params);
  }

  static std::string program() { return instance()->program_(); }

  static int level() { return instance()->m_level.load(); }
  static void level(int l) { instance()->m_level.store(l); }

  static void sink(AtRef<AtSink> sink) { instance()->sink_(std::move(sink)); }
  static AtRef<AtSink> sink() { return instance()->sink_(); }

  template <typename L>
  static void log(AtEvent<L> e) {
    instance()->log_(std::move(e));
  }
  template <typename L>
  void log_(AtEvent<L> e) {
    if (e.severity < m_level.load(std::memory_order_relaxed)) return;
    std::ostringstream s;
    e.l(s);
    log__(e, s.view());
  }

private:
  void init_(const AtLogParams &params);

  std::string program_();

  AtRef<AtSink> sink_();
  void sink_(AtRef<AtSink> sink);

  void log__(const AtEventInfo &info, std::string_view msg);

private:
  std::atomic<int>	m_level;

  Lock			m_lock;
    std::string		  m_program;
    AtRef<AtSink>	  m_sink;
};

#ifndef ATDEBUG

// filter out DEBUG messages in production builds
#define AtLOG_(sev, ...) \
  ((sev > At::Debug) ? AtLog::log(AtEVENT_(sev, __VA_ARGS__)) : void())

#else /* !ATDEBUG */

#define AtLOG_(sev, ...) AtLog::log(AtEVENT_(sev, __VA_ARGS__))

#endif /* !ATDEBUG */

// the message may contain unparenthesized commas, e.g. lambda captures
#define AtLOG(sev, ...) AtLOG_(At:: sev, __VA_ARGS__)

#endif /* AtLog_HH */
