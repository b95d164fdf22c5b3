//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include "evalb.hpp"

namespace treenorm
{
  std::ostream& operator<<(std::ostream& os, const Evalb& evalb)
  {
    os << "precision: " << evalb.precision()
       << " recall: " << evalb.recall()
       << " f: " << evalb.f()
       << " match: " << evalb.match_
       << " gold: " << evalb.gold_
       << " test: " << evalb.test_;
    return os;
  }

};
