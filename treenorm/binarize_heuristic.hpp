// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __TREENORM__BINARIZE_HEURISTIC__HPP__
#define __TREENORM__BINARIZE_HEURISTIC__HPP__ 1

// label driven binarization: constituents whose label is in the right set are right-heavy, others left-heavy

#include <iterator>

#include <boost/unordered_set.hpp>
#include <boost/functional/hash/hash.hpp>

#include <treenorm/tree.hpp>
#include <treenorm/binarize_base.hpp>

namespace treenorm
{
  struct BinarizeHeuristic : public BinarizeBase
  {
    typedef boost::unordered_set<symbol_type, boost::hash<symbol_type>, std::equal_to<symbol_type>,
				 std::allocator<symbol_type> > label_set_type;

    BinarizeHeuristic(const symbol_type& top=symbol_type::TOP)
      : BinarizeBase(top) { right_.insert(symbol_type::non_terminal("SQ")); }

    template <typename Iterator>
    BinarizeHeuristic(Iterator first, Iterator last, const symbol_type& top=symbol_type::TOP)
      : BinarizeBase(top), right_(first, last) {}

    bool right(const symbol_type& label) const { return right_.find(label) != right_.end(); }

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

	if (right(source.label_)) {
	  binarize(source.antecedent_.front(), target.antecedent_.front(), false);

	  binarize_right(source.label_.binarize(),
			 source.antecedent_.begin() + 1, source.antecedent_.end(),
			 target.antecedent_.back());
	} else {
	  binarize_left(source.label_.binarize(),
			source.antecedent_.begin(), source.antecedent_.end() - 1,
			target.antecedent_.front());

	  binarize(source.antecedent_.back(), target.antecedent_.back(), false);
	}
      }
    }

    template <typename Iterator>
    void binarize_right(const symbol_type& label, Iterator first, Iterator last, tree_type& target)
    {
      target.label_ = label;
      target.antecedent_.resize(2);

      binarize(*first, target.antecedent_.front(), false);

      if (std::distance(first, last) == 2)
	binarize(*(first + 1), target.antecedent_.back(), false);
      else
	binarize_right(label, first + 1, last, target.antecedent_.back());
    }

    template <typename Iterator>
    void binarize_left(const symbol_type& label, Iterator first, Iterator last, tree_type& target)
    {
      target.label_ = label;
      target.antecedent_.resize(2);

      if (std::distance(first, last) == 2)
	binarize(*first, target.antecedent_.front(), false);
      else
	binarize_left(label, first, last - 1, target.antecedent_.front());

      binarize(*(last - 1), target.antecedent_.back(), false);
    }

    label_set_type right_;
  };

  inline
  void binarize_heuristic(const Tree& source, Tree& target, const Symbol& top=Symbol::TOP)
  {
    BinarizeHeuristic binarize(top);
    binarize(source, target);
  }

  inline
  void binarize_heuristic(Tree& tree, const Symbol& top=Symbol::TOP)
  {
    Tree binarized;
    binarize_heuristic(tree, binarized, top);
    binarized.swap(tree);
  }
};

#endif
