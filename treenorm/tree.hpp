// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __TREENORM__TREE__HPP__
#define __TREENORM__TREE__HPP__ 1

#include <iostream>
#include <vector>
#include <string>

#include <boost/functional/hash/hash.hpp>

#include <treenorm/symbol.hpp>

namespace treenorm
{
  // A node is one of
  //   terminal:    no antecedent, label is the word
  //   preterminal: a single terminal antecedent, label is the POS tag
  //   internal:    one or more preterminal/internal antecedents
  // the empty tree has an empty label and no antecedent.

  class Tree
  {
  public:
    typedef size_t    size_type;
    typedef ptrdiff_t difference_type;

    typedef treenorm::Symbol symbol_type;

    typedef Tree tree_type;
    typedef std::vector<tree_type, std::allocator<tree_type> > antecedent_type;

    typedef antecedent_type::const_iterator const_iterator;
    typedef antecedent_type::iterator       iterator;

  public:
    Tree() {}
    Tree(const symbol_type& label) : label_(label), antecedent_() {}
    Tree(const symbol_type& label, const antecedent_type& antecedent) : label_(label), antecedent_(antecedent) {}
    template <typename Iterator>
    Tree(const symbol_type& label, Iterator first, Iterator last) : label_(label), antecedent_(first, last) {}
    Tree(const std::string& x) { assign(x); }

  public:
    void assign(const std::string& x);
    bool assign(std::string::const_iterator& iter, std::string::const_iterator end);

    std::string string() const;

    void clear()
    {
      label_ = symbol_type();
      antecedent_.clear();
    }

    void swap(Tree& x)
    {
      label_.swap(x.label_);
      antecedent_.swap(x.antecedent_);
    }

  public:
    bool empty() const { return label_ == symbol_type::EMPTY && antecedent_.empty(); }
    bool terminal() const { return ! empty() && antecedent_.empty(); }
    bool preterminal() const { return antecedent_.size() == 1 && antecedent_.front().terminal(); }
    bool internal() const { return ! antecedent_.empty() && ! preterminal(); }

    // # of terminals
    size_type size() const
    {
      if (empty()) return 0;
      if (terminal()) return 1;

      size_type num = 0;
      for (const_iterator aiter = begin(); aiter != end(); ++ aiter)
	num += aiter->size();
      return num;
    }

    // terminals, left to right
    template <typename Output>
    void leaves(Output output) const
    {
      if (terminal()) {
	*output = label_;
	++ output;
      } else
	for (const_iterator aiter = begin(); aiter != end(); ++ aiter)
	  aiter->leaves(output);
    }

  public:
    inline const_iterator begin() const { return antecedent_.begin(); }
    inline       iterator begin()       { return antecedent_.begin(); }
    inline const_iterator end() const { return antecedent_.end(); }
    inline       iterator end()       { return antecedent_.end(); }

  public:
    friend
    std::ostream& operator<<(std::ostream& os, const Tree& tree);
    friend
    std::istream& operator>>(std::istream& is, Tree& tree);

  public:
    symbol_type     label_;
    antecedent_type antecedent_;
  };

  namespace impl
  {
    inline
    size_t hash_value(Tree const& x, size_t seed)
    {
      for (Tree::const_iterator aiter = x.begin(); aiter != x.end(); ++ aiter)
	seed = hash_value(*aiter, seed);

      boost::hash_combine(seed, x.label_.id());
      return seed;
    }
  };

  inline
  size_t hash_value(Tree const& x)
  {
    return impl::hash_value(x, 0);
  }

  inline
  bool operator==(const Tree& x, const Tree& y)
  {
    return x.label_ == y.label_ && x.antecedent_ == y.antecedent_;
  }

  inline
  bool operator!=(const Tree& x, const Tree& y)
  {
    return x.label_ != y.label_ || x.antecedent_ != y.antecedent_;
  }

  inline
  bool operator<(const Tree& x, const Tree& y)
  {
    return (x.label_ < y.label_ || (!(y.label_ < x.label_) && x.antecedent_ < y.antecedent_));
  }

  inline
  bool operator>(const Tree& x, const Tree& y)
  {
    return y < x;
  }

  inline
  bool operator<=(const Tree& x, const Tree& y)
  {
    return ! (y < x);
  }

  inline
  bool operator>=(const Tree& x, const Tree& y)
  {
    return ! (x < y);
  }
};

namespace std
{
  inline
  void swap(treenorm::Tree& x, treenorm::Tree& y)
  {
    x.swap(y);
  }
};

#endif
