// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __TREENORM__TREEBANK__HPP__
#define __TREENORM__TREEBANK__HPP__ 1

#include <iostream>
#include <string>

#include <treenorm/symbol.hpp>
#include <treenorm/tree.hpp>
#include <treenorm/error.hpp>

namespace treenorm
{
  // one tree per line. A malformed line yields the empty tree, so that the line alignment with
  // other files is kept, and the error is remembered for the caller to report.
  class Treebank
  {
  public:
    typedef size_t    size_type;
    typedef ptrdiff_t difference_type;

    typedef Tree tree_type;

  public:
    Treebank(std::istream& is) : is_(is), line_(0), errors_(0) {}

    bool read(tree_type& tree)
    {
      error_.clear();

      if (! std::getline(is_, buffer_)) {
	tree.clear();
	return false;
      }

      ++ line_;

      try {
	tree.assign(buffer_);
      }
      catch (const SyntaxError& err) {
	tree.clear();

	++ errors_;
	error_ = "line " + std::to_string(line_) + ": " + err.what();
      }

      return true;
    }

    // error of the last read, if any
    const std::string& error() const { return error_; }
    bool failed() const { return ! error_.empty(); }

    size_type line() const { return line_; }
    size_type errors() const { return errors_; }

  private:
    std::istream& is_;
    std::string   buffer_;
    std::string   error_;

    size_type line_;
    size_type errors_;
  };

  // remove empty elements (-NONE-) and the constituents left without antecedents
  struct RemoveNone
  {
    typedef Tree tree_type;

    typedef tree_type::symbol_type symbol_type;

    void operator()(const tree_type& source, tree_type& target) const
    {
      if (! remove(source, target))
	target.clear();
    }

    bool remove(const tree_type& source, tree_type& target) const
    {
      if (source.terminal()) {
	target = source;
	return true;
      }

      if (source.label_ == symbol_type::NONE)
	return false;

      target.label_ = source.label_;
      target.antecedent_.clear();

      for (tree_type::const_iterator aiter = source.begin(); aiter != source.end(); ++ aiter) {
	tree_type antecedent;

	if (remove(*aiter, antecedent)) {
	  target.antecedent_.push_back(tree_type());
	  target.antecedent_.back().swap(antecedent);
	}
      }

      return ! target.antecedent_.empty();
    }
  };

  inline
  void remove_none(const Tree& source, Tree& target)
  {
    RemoveNone remove;
    remove(source, target);
  }

  inline
  void remove_none(Tree& tree)
  {
    Tree removed;
    remove_none(tree, removed);
    removed.swap(tree);
  }

  namespace impl
  {
    inline
    void validate_label(const Tree& tree)
    {
      if (tree.terminal()) return;

      if (tree.label_.reserved())
	throw StructuralInvariantError("reserved marker '*' or '_' in label: " + tree.label_.strip());

      for (Tree::const_iterator aiter = tree.begin(); aiter != tree.end(); ++ aiter)
	validate_label(*aiter);
    }
  };

  // a source tree is rooted by the top label and is free of the binarization markers
  inline
  void validate(const Tree& tree, const Symbol& top=Symbol::TOP)
  {
    if (tree.empty()) return;

    if (tree.label_ != top)
      throw StructuralInvariantError("root label is not " + top.strip() + ": " + tree.label_.strip());

    impl::validate_label(tree);
  }
};

#endif
