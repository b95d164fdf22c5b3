// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __TREENORM__BINARIZE__HPP__
#define __TREENORM__BINARIZE__HPP__ 1

#include <treenorm/binarize_left.hpp>
#include <treenorm/binarize_right.hpp>
#include <treenorm/binarize_heuristic.hpp>

#endif
