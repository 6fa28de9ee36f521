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

#ifndef ONTOLOGY_ENTITY_HPP__
#define ONTOLOGY_ENTITY_HPP__

// Everything in this library is an entity: an immutable value made of
// a finite set of other entities (its members) and, for the number
// kinds, a payload.  The kinds form a closed set:
//
//   existence            does not exist; made of whatever it's made of
//   nature               exists
//     being, void        opposites of each other under negation
//   linear numbers       ordered, signed, zero-testable
//     zero, infinite     unbounded; carry a polarity
//     natural, integer   arbitrary precision
//     real, rational, irrational
//   structural numbers   pairs on unordered axes
//     complex, natural_complex
//
// The payloads are alternatives of one boost::variant and an entity is
// a shared handle to (payload, members).  A default-constructed handle
// is the absent entity, which stands for a missing reference.

#include <memory>
#include <ostream>
#include <string>
#include <vector>
#include <boost/functional/hash.hpp>
#include <boost/optional.hpp>
#include <boost/variant.hpp>
#include <gmpxx.h>

#include "config.hpp"
#include "data_structures/existence_set.hpp"
#include "data_structures/polarity.hpp"

namespace ontology {

// Same order as the alternatives of entity::payload_type.
enum entity_kind {
  existence_kind,
  nature_kind,
  being_kind,
  void_kind,
  zero_kind,
  infinite_kind,
  natural_kind,
  integer_kind,
  real_kind,
  rational_kind,
  irrational_kind,
  complex_kind,
  natural_complex_kind
};
const char* kind_name(entity_kind k);

// Every name a kind answers to, kind_name(k) first.  Some are Chinese,
// in UTF-8.
std::vector<std::string> const& aliases(entity_kind k);
// The kind with that alias, matched exactly.
boost::optional<entity_kind> kind_with_alias(std::string const& alias);

template<entity_kind Kind>
struct bare_tag {
  bool operator==(bare_tag const&)const { return true; }
  bool operator<(bare_tag const&)const { return false; }
};
typedef bare_tag<existence_kind> existence_tag;
typedef bare_tag<nature_kind> nature_tag;
typedef bare_tag<being_kind> being_tag;
typedef bare_tag<void_kind> void_tag;

struct zero_value {
  polarity pole;
  bool operator==(zero_value const& o)const { return pole == o.pole; }
  bool operator<(zero_value const& o)const { return pole < o.pole; }
};
struct infinite_value {
  polarity pole;
  bool operator==(infinite_value const& o)const { return pole == o.pole; }
  bool operator<(infinite_value const& o)const { return pole < o.pole; }
};

struct natural_value {
  mpz_class n;
  bool operator==(natural_value const& o)const { return n == o.n; }
  bool operator<(natural_value const& o)const { return n < o.n; }
};
struct integer_value {
  mpz_class n;
  bool operator==(integer_value const& o)const { return n == o.n; }
  bool operator<(integer_value const& o)const { return n < o.n; }
};

struct real_value {
  double x;
  bool operator==(real_value const& o)const { return x == o.x; }
  bool operator<(real_value const& o)const { return x < o.x; }
};
// A real tagged with the numerator/denominator pair it came from.
// The denominator is never zero and is kept positive.  Two rationals
// with the same quotient are the same number.
struct rational_value {
  double numerator;
  double denominator;
  double x()const { return numerator / denominator; }
  bool operator==(rational_value const& o)const { return x() == o.x(); }
  bool operator<(rational_value const& o)const { return x() < o.x(); }
};
// A real with no exact numerator/denominator, e.g. Pi.
struct irrational_value {
  double x;
  bool operator==(irrational_value const& o)const { return x == o.x; }
  bool operator<(irrational_value const& o)const { return x < o.x; }
};

struct complex_value {
  double re;
  double im;
  bool operator==(complex_value const& o)const { return re == o.re && im == o.im; }
  bool operator<(complex_value const& o)const {
    if(re != o.re) { return re < o.re; }
    return im < o.im;
  }
};
struct natural_complex_value {
  mpz_class re;
  mpz_class im;
  bool operator==(natural_complex_value const& o)const { return re == o.re && im == o.im; }
  bool operator<(natural_complex_value const& o)const {
    if(re != o.re) { return re < o.re; }
    return im < o.im;
  }
};

class entity {
public:
  typedef existence_set<entity> member_set;
  typedef boost::variant<
    existence_tag,
    nature_tag,
    being_tag,
    void_tag,
    zero_value,
    infinite_value,
    natural_value,
    integer_value,
    real_value,
    rational_value,
    irrational_value,
    complex_value,
    natural_complex_value
  > payload_type;

  // The absent entity.
  entity() {}
  entity(payload_type payload, member_set members);

  explicit operator bool()const { return bool(data_); }

  // None of these may be called on the absent entity.
  entity_kind kind()const;
  payload_type const& payload()const;
  member_set const& members()const;

  // The payload as T, or null if this is some other kind (or absent).
  template<typename T>
  T const* get()const {
    if(!data_) { return nullptr; }
    return boost::get<T>(&payload());
  }

  // Same kind, same payload, same members.
  friend bool operator==(entity const& a, entity const& b);
  friend inline bool operator!=(entity const& a, entity const& b) { return !(a == b); }
  // An arbitrary total order consistent with ==.  Absent sorts first,
  // then by kind, payload and members.
  friend bool operator<(entity const& a, entity const& b);
  friend size_t hash_value(entity const& e);
private:
  struct data;
  std::shared_ptr<const data> data_;
};

typedef entity::member_set member_set;

// The existence-set law: true iff a and b are made of the same members,
// whatever their kinds.
bool structurally_equal(entity const& a, entity const& b);

// An entity renders as its comma-separated members in parentheses,
// or as its kind name if it has none.
std::ostream& operator<<(std::ostream& os, entity const& e);
std::string to_string(entity const& e);

entity make_existence(member_set members = member_set());
entity make_nature(member_set members = member_set());
entity make_being(member_set members = member_set());
entity make_void(member_set members = member_set());

entity make_zero(polarity pole = polarity::positive(), member_set members = member_set());
entity make_infinite(polarity pole = polarity::positive(), member_set members = member_set());

// Throws invalid_argument_error for n < 0.
entity make_natural(mpz_class const& n, member_set members = member_set());
entity make_integer(mpz_class const& n, member_set members = member_set());

// Real-valued payloads must be finite; unbounded values are Infinite.
entity make_real(double x, member_set members = member_set());
entity make_rational(double numerator, double denominator, member_set members = member_set());
entity make_irrational(double x, member_set members = member_set());

entity make_complex(double re, double im, member_set members = member_set());
entity make_natural_complex(mpz_class const& re, mpz_class const& im, member_set members = member_set());

// A bare existence doesn't exist; everything from nature down does.
bool exists(entity const& e);

// Whether e is bounded.  Existence, nature (the limitless) and
// infinite are not; being, void and every other number are.  The
// absent entity is not limited.
bool is_limited(entity const& e);

} /* end namespace ontology */

namespace std {
  template<>
  struct hash<ontology::entity> {
    inline size_t operator()(ontology::entity const& e)const {
      return hash_value(e);
    }
  };
}

#endif
