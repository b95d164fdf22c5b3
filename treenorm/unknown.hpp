// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __TREENORM__UNKNOWN__HPP__
#define __TREENORM__UNKNOWN__HPP__ 1

// rare word masking. Count terminals over the whole treebank first, then replace the rare ones by <unk>

#include <stdint.h>

#include <boost/unordered_map.hpp>
#include <boost/functional/hash/hash.hpp>

#include <treenorm/symbol.hpp>
#include <treenorm/tree.hpp>

namespace treenorm
{
  struct Frequency
  {
    typedef size_t    size_type;
    typedef ptrdiff_t difference_type;

    typedef uint64_t count_type;

    typedef Symbol symbol_type;
    typedef Tree   tree_type;

    typedef boost::unordered_map<symbol_type, count_type,
				 boost::hash<symbol_type>, std::equal_to<symbol_type>,
				 std::allocator<std::pair<const symbol_type, count_type> > > count_set_type;

    typedef count_set_type::const_iterator const_iterator;

  public:
    Frequency() {}
    Frequency(const tree_type& tree) { collect(tree); }

    void collect(const tree_type& tree)
    {
      if (tree.terminal())
	++ counts_[tree.label_];
      else
	for (tree_type::const_iterator aiter = tree.begin(); aiter != tree.end(); ++ aiter)
	  collect(*aiter);
    }

    count_type operator[](const symbol_type& word) const
    {
      const_iterator iter = counts_.find(word);

      return (iter == counts_.end() ? count_type(0) : iter->second);
    }

    Frequency& operator+=(const Frequency& x)
    {
      for (const_iterator iter = x.begin(); iter != x.end(); ++ iter)
	counts_[iter->first] += iter->second;
      return *this;
    }

    void clear() { counts_.clear(); }
    void swap(Frequency& x) { counts_.swap(x.counts_); }

    size_type size() const { return counts_.size(); }
    bool empty() const { return counts_.empty(); }

    const_iterator begin() const { return counts_.begin(); }
    const_iterator end() const { return counts_.end(); }

  private:
    count_set_type counts_;
  };

  struct MaskUnknown
  {
    typedef Frequency frequency_type;
    typedef Tree      tree_type;

    typedef frequency_type::count_type  count_type;
    typedef frequency_type::symbol_type symbol_type;

    // terminals observed less than cutoff times are replaced; the default masks singletons
    MaskUnknown(const frequency_type& frequency, const count_type cutoff=2)
      : frequency_(frequency), cutoff_(cutoff) {}

    bool unknown(const symbol_type& word) const
    {
      return word != symbol_type::UNK && frequency_[word] < cutoff_;
    }

    void operator()(const tree_type& source, tree_type& target) const
    {
      if (source.terminal()) {
	target.label_ = (unknown(source.label_) ? symbol_type::UNK : source.label_);
	target.antecedent_.clear();
      } else {
	target.label_ = source.label_;
	target.antecedent_.resize(source.antecedent_.size());

	for (size_t i = 0; i != source.antecedent_.size(); ++ i)
	  operator()(source.antecedent_[i], target.antecedent_[i]);
      }
    }

    const frequency_type& frequency_;
    count_type cutoff_;
  };

  inline
  void mask_unknown(const Frequency& frequency, const Tree& source, Tree& target, const Frequency::count_type cutoff=2)
  {
    MaskUnknown mask(frequency, cutoff);
    mask(source, target);
  }

  inline
  void mask_unknown(const Frequency& frequency, Tree& tree, const Frequency::count_type cutoff=2)
  {
    Tree masked;
    mask_unknown(frequency, tree, masked, cutoff);
    masked.swap(tree);
  }
};

#endif
