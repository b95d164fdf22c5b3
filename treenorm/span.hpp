// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __TREENORM__SPAN__HPP__
#define __TREENORM__SPAN__HPP__ 1

#include <stdint.h>
#include <cstddef>

#include <iostream>

namespace treenorm
{
  // terminal positions covered by a constituent, [first_, last_)
  struct Span
  {
    typedef size_t    size_type;
    typedef ptrdiff_t difference_type;
    typedef int32_t   index_type;

    Span() : first_(0), last_(0) {}
    Span(const index_type& first, const index_type& last) : first_(first), last_(last) {}

    bool empty() const { return first_ == last_; }
    difference_type size() const { return last_ - first_; }

    index_type first_;
    index_type last_;
  };

  // written as first..last, as in the debug output of evalb
  inline
  std::ostream& operator<<(std::ostream& os, const Span& x)
  {
    os << x.first_ << ".." << x.last_;
    return os;
  }

  inline
  bool operator==(const Span& x, const Span& y)
  {
    return x.first_ == y.first_ && x.last_ == y.last_;
  }

  inline
  bool operator!=(const Span& x, const Span& y)
  {
    return ! (x == y);
  }

  // ordered by start, then by end
  inline
  bool operator<(const Span& x, const Span& y)
  {
    return x.first_ < y.first_ || (x.first_ == y.first_ && x.last_ < y.last_);
  }
};

#endif
