//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// intrusively reference-counted polymorphic object (base class)
// - atomic reference count, shared read-only between threads
// - 8 bytes of overhead compared with 32 bytes overhead for std::shared_ptr

// AtRef<T> - smart pointer to a reference-counted object
// - any raw pointer assigned to an AtRef must point to a heap object
// - AtRef<T> is implicitly convertible from AtRef<U> where U derives from T

#ifndef AtPolymorph_HH
#define AtPolymorph_HH

#ifndef AtLib_HH
#include <atlib/AtLib.hh>
#endif

#include <stddef.h>

#include <atomic>
#include <utility>
#include <type_traits>

class AtPolymorph {
  AtPolymorph(const AtPolymorph &) = delete;
  AtPolymorph &operator =(const AtPolymorph &) = delete;

public:
  AtPolymorph() : m_refCount{0} { }

  virtual ~AtPolymorph() { }

  int refCount() const { return m_refCount.load(std::memory_order_relaxed); }

  void ref() const {
    m_refCount.fetch_add(1, std::memory_order_relaxed);
  }
  bool deref() const {
    return m_refCount.fetch_sub(1, std::memory_order_acq_rel) == 1;
  }

private:
  mutable std::atomic<int>	m_refCount;
};

template <typename T_> class AtRef {
template <typename> friend class AtRef;

public:
  using T = T_;

  AtRef() = default;
  AtRef(const AtRef &r) : m_object{r.m_object} {
    if (T *o = m_object) o->ref();
  }
  AtRef(AtRef &&r) noexcept : m_object{r.m_object} {
    r.m_object = nullptr;
  }
  template <typename U,
    typename = std::enable_if_t<std::is_base_of_v<T, U>>>
  AtRef(const AtRef<U> &r) : m_object{r.m_object} {
    if (T *o = m_object) o->ref();
  }
  template <typename U,
    typename = std::enable_if_t<std::is_base_of_v<T, U>>>
  AtRef(AtRef<U> &&r) noexcept : m_object{r.m_object} {
    r.m_object = nullptr;
  }
  AtRef(T *o) : m_object{o} {
    if (o) o->ref();
  }
  ~AtRef() {
    if (T *o = m_object) if (o->deref()) delete o;
  }

  AtRef &operator =(AtRef r) noexcept {
    std::swap(m_object, r.m_object);
    return *this;
  }

  T *ptr() const { return m_object; }
  T &operator *() const { return *m_object; }
  T *operator ->() const { return m_object; }

  bool operator !() const { return !m_object; }
  AtOpBool

  friend bool operator ==(const AtRef &l, const AtRef &r) {
    return l.m_object == r.m_object;
  }

private:
  T	*m_object = nullptr;
};

#endif /* AtPolymorph_HH */
