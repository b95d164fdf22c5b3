// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __TREENORM__DEBINARIZE__HPP__
#define __TREENORM__DEBINARIZE__HPP__ 1

// debinarization: splice [X*] antecedents into their parent, and re-expand [A_B] into unary chains

#include <vector>

#include <treenorm/tree.hpp>
#include <treenorm/error.hpp>

namespace treenorm
{
  struct Debinarize
  {
    typedef Tree tree_type;

    typedef tree_type::symbol_type symbol_type;

    typedef std::vector<tree_type, std::allocator<tree_type> > tree_set_type;
    typedef std::vector<symbol_type, std::allocator<symbol_type> > label_set_type;

    void operator()(const tree_type& source, tree_type& target)
    {
      if (source.antecedent_.empty()) {
	target = source;
	return;
      }

      if (source.label_.binarized())
	throw StructuralInvariantError("binarized label at root: " + source.label_.strip());

      tree_set_type antecedent;

      debinarize(source.antecedent_.begin(), source.antecedent_.end(), antecedent);

      expand(source.label_, antecedent, target);
    }

    template <typename Iterator>
    void debinarize(Iterator first, Iterator last, tree_set_type& antecedents)
    {
      for (/**/; first != last; ++ first)
	if (first->terminal())
	  antecedents.push_back(*first);
	else if (first->label_.binarized()) {
	  if (first->antecedent_.size() < 2)
	    throw StructuralInvariantError("binarized label with less than two antecedents: " + first->string());

	  debinarize(first->antecedent_.begin(), first->antecedent_.end(), antecedents);
	} else {
	  tree_set_type antecedent;

	  debinarize(first->antecedent_.begin(), first->antecedent_.end(), antecedent);

	  antecedents.push_back(tree_type());
	  expand(first->label_, antecedent, antecedents.back());
	}
    }

    // [A_B_C] over antecedent => (A (B (C antecedent...)))
    void expand(const symbol_type& label, tree_set_type& antecedent, tree_type& target)
    {
      label_set_type labels;
      label.split(labels);

      for (label_set_type::const_iterator liter = labels.begin(); liter != labels.end(); ++ liter)
	if (! liter->non_terminal())
	  throw StructuralInvariantError("empty label in fused unary chain: " + label.strip());

      tree_type node(labels.back());
      node.antecedent_.swap(antecedent);

      for (label_set_type::const_reverse_iterator liter = labels.rbegin() + 1; liter != labels.rend(); ++ liter) {
	tree_type parent(*liter);
	parent.antecedent_.resize(1);
	parent.antecedent_.front().swap(node);
	node.swap(parent);
      }

      target.swap(node);
    }
  };

  inline
  void debinarize(const Tree& source, Tree& target)
  {
    Debinarize debinarize;
    debinarize(source, target);
  }

  inline
  void debinarize(Tree& tree)
  {
    Tree debinarized;
    debinarize(tree, debinarized);
    debinarized.swap(tree);
  }
};

#endif
