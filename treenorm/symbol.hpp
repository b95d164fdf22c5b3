// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __TREENORM__SYMBOL__HPP__
#define __TREENORM__SYMBOL__HPP__ 1

#include <stdint.h>

#include <iostream>
#include <string>
#include <vector>

namespace treenorm
{
  // interned symbol. Non-terminal labels are kept as [LABEL] so that the marker predicates never
  // apply to terminal tokens.

  class Symbol
  {
  public:
    typedef std::string  symbol_type;
    typedef uint32_t     id_type;

    typedef symbol_type::size_type              size_type;
    typedef symbol_type::difference_type        difference_type;

    typedef symbol_type::value_type             value_type;
    typedef symbol_type::const_iterator         const_iterator;
    typedef symbol_type::const_reverse_iterator const_reverse_iterator;
    typedef symbol_type::const_reference        const_reference;

    typedef std::vector<symbol_type, std::allocator<symbol_type> > symbol_set_type;

  public:
    // reserved markers
    static const char BINARIZED = '*';
    static const char FUSED     = '_';

    // constants
    static const Symbol EMPTY;
    static const Symbol UNK;
    static const Symbol NONE;
    static const Symbol TOP;

  public:
    Symbol() : id_(__allocate_empty()) { }
    Symbol(const symbol_type& x) : id_(__allocate(x)) { }
    Symbol(const char* x) : id_(__allocate(x)) { }
    template <typename Iterator>
    Symbol(Iterator first, Iterator last) : id_(__allocate(symbol_type(first, last))) { }

    void assign(const symbol_type& x) { id_ = __allocate(x); }
    void assign(const char* x) { id_ = __allocate(x); }
    template <typename Iterator>
    void assign(Iterator first, Iterator last) { id_ = __allocate(symbol_type(first, last)); }

  public:
    void swap(Symbol& x) { std::swap(id_, x.id_); }

    id_type id() const { return id_; }
    operator const symbol_type&() const { return symbol(); }

    const symbol_type& symbol() const;

    const_iterator begin() const { return symbol().begin(); }
    const_iterator end() const { return symbol().end(); }

    const_reverse_iterator rbegin() const { return symbol().rbegin(); }
    const_reverse_iterator rend() const { return symbol().rend(); }

    const_reference operator[](size_type x) const { return symbol()[x]; }

    size_type size() const { return symbol().size(); }
    bool empty() const { return symbol().empty(); }

    // non-terminal is [syntactic-label]
    bool terminal() const { return ! non_terminal(); }
    bool non_terminal() const;

    // synthetic node introduced by binarization: [LABEL*]
    bool binarized() const;
    // collapsed unary chain: [A_B]
    bool fused() const;
    // label carries one of the reserved markers
    bool reserved() const;

    // non-terminal is [syntactic-label]. This will strip the squared brackets
    symbol_type strip() const
    {
      if (non_terminal()) {
	const symbol_type& label = symbol();

	return label.substr(1, label.size() - 2);
      } else
	return symbol();
    }

    // [LABEL] -> [LABEL*]
    Symbol binarize() const;

    // [A_B_C] -> [A] [B] [C]
    void split(std::vector<Symbol, std::allocator<Symbol> >& labels) const;

  public:
    static Symbol non_terminal(const symbol_type& x) { return Symbol('[' + x + ']'); }

  public:
    // boost hash
    friend
    size_t  hash_value(Symbol const& x);

    // iostreams
    friend
    std::ostream& operator<<(std::ostream& os, const Symbol& x);

    // comparison...
    friend
    bool operator==(const Symbol& x, const Symbol& y);
    friend
    bool operator!=(const Symbol& x, const Symbol& y);
    friend
    bool operator<(const Symbol& x, const Symbol& y);
    friend
    bool operator>(const Symbol& x, const Symbol& y);
    friend
    bool operator<=(const Symbol& x, const Symbol& y);
    friend
    bool operator>=(const Symbol& x, const Symbol& y);

  public:
    static bool exists(const symbol_type& x);
    static size_t allocated();

  private:
    static const id_type& __allocate_empty()
    {
      static const id_type id_ = __allocate("");
      return id_;
    }

    static id_type __allocate(const symbol_type& x);

  private:
    id_type id_;
  };

  typedef std::vector<Symbol, std::allocator<Symbol> > symbol_set_type;

  inline
  size_t hash_value(Symbol const& x)
  {
    return x.id_;
  }

  inline
  std::ostream& operator<<(std::ostream& os, const Symbol& x)
  {
    os << x.symbol();
    return os;
  }

  inline
  bool operator==(const Symbol& x, const Symbol& y)
  {
    return x.id_ == y.id_;
  }

  inline
  bool operator!=(const Symbol& x, const Symbol& y)
  {
    return x.id_ != y.id_;
  }

  inline
  bool operator<(const Symbol& x, const Symbol& y)
  {
    return x.id_ < y.id_;
  }

  inline
  bool operator>(const Symbol& x, const Symbol& y)
  {
    return x.id_ > y.id_;
  }

  inline
  bool operator<=(const Symbol& x, const Symbol& y)
  {
    return x.id_ <= y.id_;
  }

  inline
  bool operator>=(const Symbol& x, const Symbol& y)
  {
    return x.id_ >= y.id_;
  }

};

namespace std
{
  inline
  void swap(treenorm::Symbol& x, treenorm::Symbol& y)
  {
    x.swap(y);
  }
};

#endif
