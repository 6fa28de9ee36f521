/*

    Copyright the Ontology authors, 2026

    This file is part of Ontology.

    Ontology is free software: you can redistribute it and/or modify
    it under the terms of the GNU Affero General Public License as
    published by the Free Software Foundation, either version 3 of the
    License, or (at your option) any later version.

    Ontology is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU Affero General Public License for more details.

    You should have received a copy of the GNU Affero General Public License
    along with Ontology.  If not, see <http://www.gnu.org/licenses/>.

*/

#ifndef ONTOLOGY_POLARITY_HPP__
#define ONTOLOGY_POLARITY_HPP__

#include <ostream>
#include <boost/functional/hash.hpp>

namespace ontology {

// The sign bit of the unbounded kinds.  Zero and Infinite carry one;
// a Zero and an Infinite of opposite polarity are reciprocals.
class polarity {
public:
  constexpr static polarity positive() {
    return polarity(false);
  }
  constexpr static polarity negative() {
    return polarity(true);
  }
  constexpr static polarity of_sign(bool is_positive) {
    return polarity(!is_positive);
  }

  constexpr bool is_positive()const { return !negative_; }
  constexpr bool is_negative()const { return negative_; }
  constexpr int sign()const { return negative_ ? -1 : 1; }
  constexpr polarity inverted()const { return polarity(!negative_); }
  // Product rule: like signs give positive.
  constexpr polarity times(polarity o)const { return polarity(negative_ != o.negative_); }

  constexpr bool operator==(polarity const& o)const { return negative_ == o.negative_; }
  constexpr bool operator!=(polarity const& o)const { return negative_ != o.negative_; }
  // positive sorts first
  constexpr bool operator<(polarity const& o)const { return !negative_ && o.negative_; }

  friend inline std::ostream& operator<<(std::ostream& os, polarity p) {
    return os << (p.negative_ ? '-' : '+');
  }
  friend inline size_t hash_value(polarity p) {
    return boost::hash_value(p.negative_);
  }
private:
  constexpr explicit polarity(bool negative) : negative_(negative) {}
  bool negative_;
};

} /* end namespace ontology */

#endif
