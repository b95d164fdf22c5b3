// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __TREENORM__BINARIZE_LEFT__HPP__
#define __TREENORM__BINARIZE_LEFT__HPP__ 1

// left-recursive binarization (or left heavy binarization)

#include <iterator>

#include <treenorm/tree.hpp>
#include <treenorm/binarize_base.hpp>

namespace treenorm
{
  struct BinarizeLeft : public BinarizeBase
  {
    BinarizeLeft(const symbol_type& top=symbol_type::TOP) : BinarizeBase(top) {}

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

	// left-heavy binarization
	binarize(source.label_.binarize(),
		 source.antecedent_.begin(), source.antecedent_.end() - 1,
		 target.antecedent_.front());

	binarize(source.antecedent_.back(), target.antecedent_.back(), false);
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
	binarize(label, first, last - 1, target.antecedent_.front());
	binarize(*(last - 1),            target.antecedent_.back(), false);
      }
    }
  };

  inline
  void binarize_left(const Tree& source, Tree& target, const Symbol& top=Symbol::TOP)
  {
    BinarizeLeft binarize(top);
    binarize(source, target);
  }

  inline
  void binarize_left(Tree& tree, const Symbol& top=Symbol::TOP)
  {
    Tree binarized;
    binarize_left(tree, binarized, top);
    binarized.swap(tree);
  }
};

#endif
