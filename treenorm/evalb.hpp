// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __TREENORM__EVALB__HPP__
#define __TREENORM__EVALB__HPP__ 1

#include <stdint.h>
#include <cstddef>

#include <algorithm>
#include <iostream>
#include <iterator>
#include <sstream>
#include <vector>

#include <treenorm/symbol.hpp>
#include <treenorm/span.hpp>
#include <treenorm/tree.hpp>
#include <treenorm/error.hpp>

namespace treenorm
{
  struct Evalb
  {
    typedef size_t    size_type;
    typedef ptrdiff_t difference_type;

    typedef int32_t count_type;

    Evalb() : match_(0), gold_(0), test_(0) {}

    Evalb(const count_type& match,
	  const count_type& gold,
	  const count_type& test)
      : match_(match), gold_(gold), test_(test) {}

  public:
    void clear()
    {
      match_ = 0;
      gold_  = 0;
      test_  = 0;
    }

  public:
    Evalb& operator+=(const Evalb& x)
    {
      match_ += x.match_;
      gold_  += x.gold_;
      test_  += x.test_;
      return *this;
    }

    Evalb& operator-=(const Evalb& x)
    {
      match_ -= x.match_;
      gold_  -= x.gold_;
      test_  -= x.test_;
      return *this;
    }

  public:
    friend
    std::ostream& operator<<(std::ostream& os, const Evalb& evalb);

  public:
    double recall() const { return (! gold_ ? 0.0 : double(match_) / gold_); }
    double precision() const { return (! test_ ? 0.0 : double(match_) / test_); }

    double f() const
    {
      if (! match_ || ! gold_ || ! test_)
	return 0.0;
      else {
	const double p = precision();
	const double r = recall();

	return 2 * p * r / (p + r);
      }
    }

    double operator()() const { return f(); }

    count_type match_;
    count_type gold_;
    count_type test_;
  };

  // labeled bracket scoring. The top wrapper, preterminals, binarized nodes and a unary node above
  // an identically labeled antecedent covering the whole sentence do not count as constituents.
  struct EvalbScorer
  {
    typedef Evalb evalb_type;

    typedef evalb_type::size_type       size_type;
    typedef evalb_type::difference_type difference_type;
    typedef evalb_type::count_type      count_type;

    typedef Symbol symbol_type;
    typedef Span   span_type;
    typedef Tree   tree_type;

    typedef std::pair<span_type, symbol_type> stat_type;
    typedef std::vector<stat_type, std::allocator<stat_type> > stat_set_type;

    typedef std::vector<symbol_type, std::allocator<symbol_type> > sentence_type;

  public:
    EvalbScorer(const symbol_type& top=symbol_type::TOP) : top_(top) {}
    EvalbScorer(const tree_type& tree, const symbol_type& top=symbol_type::TOP) : top_(top) { assign(tree); }

    void assign(const tree_type& tree)
    {
      sentence_.clear();
      tree.leaves(std::back_inserter(sentence_));

      collect(tree, gold_);
    }

    evalb_type operator()(const tree_type& tree) const
    {
      stat_set_type test;

      verify(tree);

      collect(tree, test);

      return evalb_type(matched(gold_, test), count_type(gold_.size()), count_type(test.size()));
    }

    const stat_set_type& gold() const { return gold_; }

    // sorted constituents of tree
    void collect(const tree_type& tree, stat_set_type& stats) const
    {
      stats.clear();

      if (tree.empty()) return;

      span_type span(0, 0);
      collect(tree, span, stats, true, span_type::index_type(tree.size()));

      std::sort(stats.begin(), stats.end(), std::less<stat_type>());
    }

    // multiset intersection of two sorted constituent sets
    static count_type matched(const stat_set_type& gold, const stat_set_type& test)
    {
      stat_set_type::const_iterator giter     = gold.begin();
      stat_set_type::const_iterator giter_end = gold.end();

      stat_set_type::const_iterator titer     = test.begin();
      stat_set_type::const_iterator titer_end = test.end();

      count_type match = 0;

      while (giter != giter_end && titer != titer_end) {
	if (*giter < *titer)
	  ++ giter;
	else if (*titer < *giter)
	  ++ titer;
	else {
	  ++ match;
	  ++ giter;
	  ++ titer;
	}
      }

      return match;
    }

  private:
    void verify(const tree_type& tree) const
    {
      if (tree.empty())
	throw ScoringAlignmentError("no parse");

      sentence_type sentence;
      tree.leaves(std::back_inserter(sentence));

      if (sentence.size() != sentence_.size()) {
	std::ostringstream stream;
	stream << "# of terminals differ: gold: " << sentence_.size() << " test: " << sentence.size();
	throw ScoringAlignmentError(stream.str());
      }

      std::pair<sentence_type::const_iterator, sentence_type::const_iterator> result = std::mismatch(sentence_.begin(), sentence_.end(), sentence.begin());

      if (result.first != sentence_.end()) {
	std::ostringstream stream;
	stream << "terminal differ at " << (result.first - sentence_.begin())
	       << ": gold: " << *result.first << " test: " << *result.second;
	throw ScoringAlignmentError(stream.str());
      }
    }

    void collect(const tree_type& tree, span_type& span, stat_set_type& stats, const bool root, const span_type::index_type length) const
    {
      tree_type::const_iterator titer_end = tree.end();
      for (tree_type::const_iterator titer = tree.begin(); titer != titer_end; ++ titer) {
	const tree_type& antecedent = *titer;

	if (antecedent.terminal())
	  ++ span.last_;
	else {
	  span_type span_ant(span.last_, span.last_);
	  collect(antecedent, span_ant, stats, false, length);

	  span.last_ = span_ant.last_;
	}
      }

      // post-traversal
      if (tree.preterminal() || ! tree.label_.non_terminal() || tree.label_.binarized()) return;
      if (root && tree.label_ == top_) return;
      // a unary duplicate is vacuous only when it spans the whole sentence
      if (tree.antecedent_.size() == 1 && tree.antecedent_.front().label_ == tree.label_
	  && span.first_ == 0 && span.last_ == length) return;

      stats.push_back(stat_type(span, tree.label_));
    }

  private:
    symbol_type   top_;
    sentence_type sentence_;
    stat_set_type gold_;
  };

  inline
  Evalb operator+(const Evalb& x, const Evalb& y)
  {
    Evalb ret = x;
    ret += y;
    return ret;
  }

  inline
  Evalb operator-(const Evalb& x, const Evalb& y)
  {
    Evalb ret = x;
    ret -= y;
    return ret;
  }

};

#endif
