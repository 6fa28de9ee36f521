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

#ifndef ONTOLOGY_EXISTENCE_SET_HPP__
#define ONTOLOGY_EXISTENCE_SET_HPP__

// A finite, unordered, deduplicated set of sub-entities.  Something
// made of an existence_set is identified by what it contains and
// nothing else: two sets are equal iff they have the same members,
// whatever order they were given in.
//
// Member must be
//  - contextually convertible to bool, false meaning "absent";
//  - totally ordered by operator< and consistent with operator==;
//  - hashable through an ADL-visible hash_value().
//
// Members are kept sorted and unique, so equality and ordering are
// plain sequence comparisons.  The hash is still computed with a
// commutative combination so that it never depends on the order.

#include <algorithm>
#include <initializer_list>
#include <vector>
#include <boost/functional/hash.hpp>

#include "../config.hpp"

namespace ontology {

template<typename Member>
class existence_set {
public:
  typedef Member value_type;
  typedef typename std::vector<Member>::const_iterator const_iterator;
  typedef const_iterator iterator;

  existence_set() {}
  existence_set(std::initializer_list<Member> members) : members_(members) { normalize(); }
  explicit existence_set(std::vector<Member> members) : members_(std::move(members)) { normalize(); }

  size_t size()const { return members_.size(); }
  bool empty()const { return members_.empty(); }
  const_iterator begin()const { return members_.begin(); }
  const_iterator end()const { return members_.end(); }

  bool contains(Member const& m)const {
    return std::binary_search(members_.begin(), members_.end(), m);
  }
  // A new set with m added; m must not be absent.
  existence_set with(Member const& m)const {
    std::vector<Member> members = members_;
    members.push_back(m);
    return existence_set(std::move(members));
  }

  friend inline bool operator==(existence_set const& a, existence_set const& b) {
    return a.members_ == b.members_;
  }
  friend inline bool operator!=(existence_set const& a, existence_set const& b) {
    return !(a == b);
  }
  friend inline bool operator<(existence_set const& a, existence_set const& b) {
    return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end());
  }

  friend inline size_t hash_value(existence_set const& s) {
    size_t result = s.members_.size();
    for(Member const& m : s.members_) {
      // Sum rather than hash_combine: member order must not matter.
      result += boost::hash<Member>()(m);
    }
    return result;
  }
private:
  void normalize() {
    for(Member const& m : members_) {
      caller_error_if(!m, "an existence set cannot contain an absent member");
    }
    std::sort(members_.begin(), members_.end());
    members_.erase(std::unique(members_.begin(), members_.end()), members_.end());
  }
  std::vector<Member> members_;
};

} /* end namespace ontology */

#endif
