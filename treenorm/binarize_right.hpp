// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __TREENORM__BINARIZE_RIGHT__HPP__
#define __TREENORM__BINARIZE_RIGHT__HPP__ 1

// right-recursive binarization (or right heavy binarization)

#include <iterator>

#include <treenorm/tree.hpp>
#include <treenorm/binarize_base.hpp>

namespace treenorm
{
  struct BinarizeRight : public BinarizeBase
  {
    BinarizeRight(const symbol_type& top=symbol_type::TOP) : BinarizeBase(top) {}

    void operator()(const tree_type& source, tree_type& target)
    {
      binarize(source, target, true);
    }

    void binarize(const tree_type& source, tree_type& target, const bool root)
    {
      if (source.antecedent_.empty())
	target = source;
      else if (source.preterminal()) {
	check(source);
	target = source;
      } else if (source.antecedent_.size() <= 2) {
	check(source);

	target.label_ = source.label_;
	target.antecedent_.resize(source.antecedent_.size());

	for (size_t i = 0; i != source.antecedent_.size(); ++ i)
	  binarize(source.antecedent_[i], target.antecedent_[i], false);

	if (! exempt(source, root))
	  collapse(target);
      } else {
	check(source);

	target.label_ = source.label_;
	target.antecedent_.resize(2);

	// right-heavy binarization
	binarize(source.antecedent_.front(), target.antecedent_.front(), false);

	binarize(source.label_.binarize(),
		 source.antecedent_.begin() + 1, source.antecedent_.end(),
		 target.antecedent_.back());
      }
    }

    template <typename Iterator>
    void binarize(const symbol_type& label, Iterator first, Iterator last, tree_type& target)
    {
      target.label_ = label;
      target.antecedent_.resize(2);

      if (std::distance(first, last) == 2) {
	binarize(*first,       target.antecedent_.front(), false);
	binarize(*(first + 1), target.antecedent_.back(), false);
      } else {
	binarize(*first,       target.antecedent_.front(), false);
	binarize(label, first + 1, last, target.antecedent_.back());
      }
    }
  };

  inline
  void binarize_right(const Tree& source, Tree& target, const Symbol& top=Symbol::TOP)
  {
    BinarizeRight binarize(top);
    binarize(source, target);
  }

  inline
  void binarize_right(Tree& tree, const Symbol& top=Symbol::TOP)
  {
    Tree binarized;
    binarize_right(tree, binarized, top);
    binarized.swap(tree);
  }
};

#endif
