//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <deque>
#include <stdexcept>

#include <boost/unordered_map.hpp>
#include <boost/functional/hash/hash.hpp>
#include <boost/thread/shared_mutex.hpp>
#include <boost/thread/locks.hpp>

#include "symbol.hpp"

namespace treenorm
{
  struct SymbolImpl
  {
    typedef Symbol::symbol_type symbol_type;
    typedef Symbol::id_type     id_type;

    typedef boost::shared_mutex                    mutex_type;
    typedef boost::shared_lock<mutex_type>         scoped_reader_lock;
    typedef boost::unique_lock<mutex_type>         scoped_writer_lock;

    typedef boost::unordered_map<symbol_type, id_type,
				 boost::hash<symbol_type>, std::equal_to<symbol_type>,
				 std::allocator<std::pair<const symbol_type, id_type> > > symbol_index_type;
    // deque keeps references stable while the table grows
    typedef std::deque<symbol_type, std::allocator<symbol_type> > symbol_set_type;

    static mutex_type& mutex()
    {
      static mutex_type __mutex;
      return __mutex;
    }

    static symbol_index_type& index()
    {
      static symbol_index_type __index;
      return __index;
    }

    static symbol_set_type& symbols()
    {
      static symbol_set_type __symbols;
      return __symbols;
    }
  };

  // constants
  const Symbol Symbol::EMPTY = Symbol("");
  const Symbol Symbol::UNK   = Symbol("<unk>");
  const Symbol Symbol::NONE  = Symbol("[-NONE-]");
  const Symbol Symbol::TOP   = Symbol("[TOP]");

  Symbol::id_type Symbol::__allocate(const symbol_type& x)
  {
    {
      SymbolImpl::scoped_reader_lock lock(SymbolImpl::mutex());

      SymbolImpl::symbol_index_type::const_iterator iter = SymbolImpl::index().find(x);
      if (iter != SymbolImpl::index().end())
	return iter->second;
    }

    SymbolImpl::scoped_writer_lock lock(SymbolImpl::mutex());

    SymbolImpl::symbol_index_type& index = SymbolImpl::index();
    SymbolImpl::symbol_set_type& symbols = SymbolImpl::symbols();

    std::pair<SymbolImpl::symbol_index_type::iterator, bool> result = index.insert(std::make_pair(x, id_type(symbols.size())));

    if (result.second)
      symbols.push_back(x);

    return result.first->second;
  }

  const Symbol::symbol_type& Symbol::symbol() const
  {
    SymbolImpl::scoped_reader_lock lock(SymbolImpl::mutex());

    return SymbolImpl::symbols()[id_];
  }

  bool Symbol::exists(const symbol_type& x)
  {
    SymbolImpl::scoped_reader_lock lock(SymbolImpl::mutex());

    return SymbolImpl::index().find(x) != SymbolImpl::index().end();
  }

  size_t Symbol::allocated()
  {
    SymbolImpl::scoped_reader_lock lock(SymbolImpl::mutex());

    return SymbolImpl::symbols().size();
  }

  bool Symbol::non_terminal() const
  {
    const symbol_type& word = symbol();

    return word.size() >= 3 && word[0] == '[' && word[word.size() - 1] == ']';
  }

  bool Symbol::binarized() const
  {
    if (! non_terminal()) return false;

    const symbol_type& word = symbol();

    return word[word.size() - 2] == BINARIZED;
  }

  bool Symbol::fused() const
  {
    if (! non_terminal()) return false;

    return symbol().find(FUSED) != symbol_type::npos;
  }

  bool Symbol::reserved() const
  {
    if (! non_terminal()) return false;

    return symbol().find_first_of("*_") != symbol_type::npos;
  }

  Symbol Symbol::binarize() const
  {
    if (! non_terminal())
      throw std::runtime_error("binarizing a terminal symbol: " + symbol());

    if (binarized())
      return *this;

    return non_terminal(strip() + BINARIZED);
  }

  void Symbol::split(std::vector<Symbol, std::allocator<Symbol> >& labels) const
  {
    labels.clear();

    if (! fused()) {
      labels.push_back(*this);
      return;
    }

    const symbol_type stripped = strip();

    symbol_type::size_type first = 0;
    for (;;) {
      const symbol_type::size_type last = stripped.find(FUSED, first);

      if (last == symbol_type::npos) {
	labels.push_back(non_terminal(stripped.substr(first)));
	break;
      }

      labels.push_back(non_terminal(stripped.substr(first, last - first)));
      first = last + 1;
    }
  }

};
