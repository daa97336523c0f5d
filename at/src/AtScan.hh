//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// fixed-position text scanner

// each scan function either consumes exactly what it matched and returns
// true (or a non-zero count), or consumes nothing and returns false (0)

// AtScanner s{"2024-02-29"};
// int year, month, day;
// if (!s.digits(year, 4) || !s.literal('-') ||
//     !s.digits(month, 2) || !s.literal('-') ||
//     !s.digits(day, 2) || !s.end()) goto invalid;

#ifndef AtScan_HH
#define AtScan_HH

#ifndef AtLib_HH
#include <atlib/AtLib.hh>
#endif

#include <string_view>

class AtScanner {
public:
  AtScanner(std::string_view s) : m_s{s} { }

  unsigned offset() const { return m_offset; }
  bool end() const { return m_offset >= m_s.size(); }

  bool peek(char c) const { return !end() && m_s[m_offset] == c; }
  bool peekDigit() const { return !end() && digit(m_s[m_offset]) < 10; }

  // expect literal character
  bool literal(char c) {
    if (!peek(c)) return false;
    ++m_offset;
    return true;
  }
  // expect literal string
  bool literal(std::string_view l) {
    if (m_s.substr(m_offset, l.size()) != l) return false;
    m_offset += l.size();
    return true;
  }

  // expect exactly n decimal digits
  bool digits(int &v, unsigned n) {
    if (m_s.size() - m_offset < n) return false;
    int v_ = 0;
    for (unsigned i = 0; i < n; i++) {
      unsigned c = digit(m_s[m_offset + i]);
      if (AtUnlikely(c >= 10)) return false;
      v_ = v_ * 10 + int(c);
    }
    v = v_;
    m_offset += n;
    return true;
  }

  // fraction - at least 1 digit, up to n significant digits scaled to n
  // places; any further digits are consumed and discarded
  // - returns the total number of digits consumed
  unsigned frac(int &v, unsigned n) {
    unsigned i = 0;
    int v_ = 0;
    while (!end()) {
      unsigned c = digit(m_s[m_offset]);
      if (c >= 10) break;
      if (i < n) v_ = v_ * 10 + int(c);
      ++i, ++m_offset;
    }
    if (!i) return 0;
    for (unsigned j = i; j < n; j++) v_ *= 10;
    v = v_;
    return i;
  }

  // '+' or '-' - sign is 1 or -1
  bool sign(int &sign) {
    if (literal('+')) { sign = 1; return true; }
    if (literal('-')) { sign = -1; return true; }
    return false;
  }

private:
  static unsigned digit(char c) { return unsigned(c) - unsigned('0'); }

  std::string_view	m_s;
  unsigned		m_offset = 0;
};

#endif /* AtScan_HH */
