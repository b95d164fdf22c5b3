// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __TREENORM__ERROR__HPP__
#define __TREENORM__ERROR__HPP__ 1

#include <stdexcept>
#include <string>

namespace treenorm
{
  // malformed bracket text
  struct SyntaxError : public std::runtime_error
  {
    SyntaxError(const std::string& message) : std::runtime_error(message) {}
  };

  // a tree breaks an invariant of the binarization encoding
  struct StructuralInvariantError : public std::runtime_error
  {
    StructuralInvariantError(const std::string& message) : std::runtime_error(message) {}
  };

  // hypothesis and gold do not cover the same sentence
  struct ScoringAlignmentError : public std::runtime_error
  {
    ScoringAlignmentError(const std::string& message) : std::runtime_error(message) {}
  };
};

#endif
