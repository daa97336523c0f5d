//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// generic At error exceptions

// try { ... } catch (const AtError &e) { AtLOG(Error, e); }

#ifndef AtError_HH
#define AtError_HH

#ifndef AtLib_HH
#include <atlib/AtLib.hh>
#endif

#include <string>
#include <string_view>
#include <sstream>
#include <ostream>
#include <utility>

class AtAPI AtError {
public:
  virtual ~AtError() { }
  virtual void print_(std::ostream &) const = 0;

  std::string message() const {
    std::ostringstream s;
    print_(s);
    return std::move(s).str();
  }

  friend std::ostream &operator <<(std::ostream &s, const AtError &e) {
    e.print_(s);
    return s;
  }
};

// thrown when an argument is out of range, e.g. a month outside 1-12
class AtAPI AtInvalidArgument : public AtError {
public:
  AtInvalidArgument(std::string_view name, int64_t value) :
    m_name{name}, m_value{value} { }

  const std::string &name() const { return m_name; }
  int64_t value() const { return m_value; }

  void print_(std::ostream &s) const {
    s << "invalid " << m_name << ": " << m_value;
    if (m_name == "month") s << " (month must be 1 to 12)";
  }

private:
  std::string	m_name;
  int64_t	m_value;
};

// thrown when text cannot be decoded - carries the input text verbatim
class AtAPI AtInvalidFormat : public AtError {
public:
  AtInvalidFormat(std::string_view type, std::string_view text) :
    m_type{type}, m_text{text} { }

  const std::string &type() const { return m_type; }
  const std::string &text() const { return m_text; }

  void print_(std::ostream &s) const {
    s << "invalid " << m_type << ": \"" << m_text << '"';
  }

private:
  std::string	m_type;
  std::string	m_text;
};

#endif /* AtError_HH */
