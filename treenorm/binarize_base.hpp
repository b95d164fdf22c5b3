// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __TREENORM__BINARIZE_BASE__HPP__
#define __TREENORM__BINARIZE_BASE__HPP__ 1

// shared by left/right binarization: label checks and unary chain fusion

#include <treenorm/tree.hpp>
#include <treenorm/error.hpp>

namespace treenorm
{
  struct BinarizeBase
  {
    typedef Tree tree_type;

    typedef tree_type::symbol_type symbol_type;

    BinarizeBase(const symbol_type& top) : top_(top) {}

    void check(const tree_type& source) const
    {
      if (source.label_.reserved())
	throw StructuralInvariantError("reserved marker '*' or '_' in label: " + source.label_.strip());
    }

    bool exempt(const tree_type& source, const bool root) const
    {
      return root && source.label_ == top_;
    }

    // target has been binarized bottom-up, thus its only antecedent is already fused
    void collapse(tree_type& target) const
    {
      if (target.antecedent_.size() != 1 || ! target.antecedent_.front().internal()) return;

      tree_type& antecedent = target.antecedent_.front();

      const symbol_type label = symbol_type::non_terminal(target.label_.strip() + symbol_type::FUSED + antecedent.label_.strip());

      tree_type::antecedent_type antecedents;
      antecedents.swap(antecedent.antecedent_);

      target.label_ = label;
      target.antecedent_.swap(antecedents);
    }

    symbol_type top_;
  };
};

#endif
