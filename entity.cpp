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

#include <cmath>
#include <sstream>

#include "entity.hpp"
#include "data_structures/mpz_hash.hpp"

namespace ontology {

struct entity::data {
  data(payload_type payload, member_set members) :
    payload(std::move(payload)), members(std::move(members)) {}
  const payload_type payload;
  const member_set members;
};

const char* kind_name(entity_kind k) {
  switch(k) {
    case existence_kind: return "Existence";
    case nature_kind: return "Nature";
    case being_kind: return "Being";
    case void_kind: return "Void";
    case zero_kind: return "Zero";
    case infinite_kind: return "Infinite";
    case natural_kind: return "Natural";
    case integer_kind: return "Integer";
    case real_kind: return "Real";
    case rational_kind: return "Rational";
    case irrational_kind: return "Irrational";
    case complex_kind: return "Complex";
    case natural_complex_kind: return "NaturalComplex";
  }
  caller_error("unknown entity kind");
}

std::vector<std::string> const& aliases(entity_kind k) {
  static const std::vector<std::string> table[] = {
    /* existence_kind */ {"Existence", "存在"},
    /* nature_kind */ {"Nature", "自然", "Tao", "道", "Onto", "本体", "Limitless", "无限"},
    /* being_kind */ {"Being", "有", "存有"},
    /* void_kind */ {"Void", "不存在", "虚无"},
    /* zero_kind */ {"Zero", "0"},
    /* infinite_kind */ {"Infinite", "无穷", "无穷大"},
    /* natural_kind */ {"Natural", "自然数"},
    /* integer_kind */ {"Integer", "整数"},
    /* real_kind */ {"Real", "实数"},
    /* rational_kind */ {"Rational", "有理数"},
    /* irrational_kind */ {"Irrational", "无理数"},
    /* complex_kind */ {"Complex", "复数", "实复数"},
    /* natural_complex_kind */ {"NaturalComplex", "自然复数"}
  };
  caller_correct_if(k >= existence_kind && k <= natural_complex_kind, "unknown entity kind");
  return table[k];
}

boost::optional<entity_kind> kind_with_alias(std::string const& alias) {
  for(int k = existence_kind; k <= natural_complex_kind; ++k) {
    for(std::string const& name : aliases(entity_kind(k))) {
      if(name == alias) { return entity_kind(k); }
    }
  }
  return boost::none;
}

entity::entity(payload_type payload, member_set members) :
  data_(std::make_shared<const data>(std::move(payload), std::move(members))) {}

entity_kind entity::kind()const {
  caller_correct_if(bool(data_), "the absent entity has no kind");
  return static_cast<entity_kind>(data_->payload.which());
}
entity::payload_type const& entity::payload()const {
  caller_correct_if(bool(data_), "the absent entity has no payload");
  return data_->payload;
}
entity::member_set const& entity::members()const {
  caller_correct_if(bool(data_), "the absent entity has no members");
  return data_->members;
}

bool operator==(entity const& a, entity const& b) {
  if(a.data_ == b.data_) { return true; }
  if(!a.data_ || !b.data_) { return false; }
  return a.data_->payload == b.data_->payload
      && a.data_->members == b.data_->members;
}

bool operator<(entity const& a, entity const& b) {
  if(a.data_ == b.data_) { return false; }
  if(!a.data_) { return true; }
  if(!b.data_) { return false; }
  if(a.data_->payload < b.data_->payload) { return true; }
  if(b.data_->payload < a.data_->payload) { return false; }
  return a.data_->members < b.data_->members;
}

namespace {

// -0.0 == 0.0, so they have to hash alike.
inline size_t hash_double(double x) {
  return boost::hash_value(x == 0.0 ? 0.0 : x);
}

struct payload_hasher : public boost::static_visitor<size_t> {
  template<entity_kind Kind>
  size_t operator()(bare_tag<Kind> const&)const { return 0; }
  size_t operator()(zero_value const& v)const { return hash_value(v.pole); }
  size_t operator()(infinite_value const& v)const { return hash_value(v.pole); }
  size_t operator()(natural_value const& v)const { return hash_mpz(v.n); }
  size_t operator()(integer_value const& v)const { return hash_mpz(v.n); }
  size_t operator()(real_value const& v)const { return hash_double(v.x); }
  size_t operator()(rational_value const& v)const { return hash_double(v.x()); }
  size_t operator()(irrational_value const& v)const { return hash_double(v.x); }
  size_t operator()(complex_value const& v)const {
    size_t seed = 0;
    boost::hash_combine(seed, hash_double(v.re));
    boost::hash_combine(seed, hash_double(v.im));
    return seed;
  }
  size_t operator()(natural_complex_value const& v)const {
    size_t seed = 0;
    boost::hash_combine(seed, hash_mpz(v.re));
    boost::hash_combine(seed, hash_mpz(v.im));
    return seed;
  }
};

} /* end anonymous namespace */

size_t hash_value(entity const& e) {
  if(!e.data_) { return 0; }
  size_t seed = 0;
  boost::hash_combine(seed, e.data_->payload.which());
  boost::hash_combine(seed, boost::apply_visitor(payload_hasher(), e.data_->payload));
  boost::hash_combine(seed, hash_value(e.data_->members));
  return seed;
}

bool structurally_equal(entity const& a, entity const& b) {
  if(!a || !b) { return !a && !b; }
  return a.members() == b.members();
}

std::ostream& operator<<(std::ostream& os, entity const& e) {
  if(!e) {
    return os << "<absent>";
  }
  if(e.members().empty()) {
    return os << kind_name(e.kind());
  }
  os << '(';
  bool first = true;
  for(entity const& m : e.members()) {
    if(!first) { os << ','; }
    first = false;
    os << m;
  }
  return os << ')';
}

std::string to_string(entity const& e) {
  std::ostringstream os;
  os << e;
  return os.str();
}

namespace {
void check_real_payload(double x) {
  caller_error_if(std::isnan(x), "a real number cannot be NaN");
  caller_error_if(std::isinf(x), "a real number must be finite; use an Infinite for unbounded values");
}
}

entity make_existence(member_set members) {
  return entity(existence_tag(), std::move(members));
}
entity make_nature(member_set members) {
  return entity(nature_tag(), std::move(members));
}
entity make_being(member_set members) {
  return entity(being_tag(), std::move(members));
}
entity make_void(member_set members) {
  return entity(void_tag(), std::move(members));
}

entity make_zero(polarity pole, member_set members) {
  return entity(zero_value{pole}, std::move(members));
}
entity make_infinite(polarity pole, member_set members) {
  return entity(infinite_value{pole}, std::move(members));
}

entity make_natural(mpz_class const& n, member_set members) {
  caller_error_if(n < 0, "a natural number cannot be negative");
  return entity(natural_value{n}, std::move(members));
}
entity make_integer(mpz_class const& n, member_set members) {
  return entity(integer_value{n}, std::move(members));
}

entity make_real(double x, member_set members) {
  check_real_payload(x);
  return entity(real_value{x}, std::move(members));
}
entity make_rational(double numerator, double denominator, member_set members) {
  check_real_payload(numerator);
  check_real_payload(denominator);
  caller_error_if(denominator == 0.0, "a rational number cannot have a zero denominator");
  if(denominator < 0.0) {
    numerator = -numerator;
    denominator = -denominator;
  }
  check_real_payload(numerator / denominator);
  return entity(rational_value{numerator, denominator}, std::move(members));
}
entity make_irrational(double x, member_set members) {
  check_real_payload(x);
  return entity(irrational_value{x}, std::move(members));
}

entity make_complex(double re, double im, member_set members) {
  check_real_payload(re);
  check_real_payload(im);
  return entity(complex_value{re, im}, std::move(members));
}
entity make_natural_complex(mpz_class const& re, mpz_class const& im, member_set members) {
  caller_error_if(re < 0 || im < 0, "a natural complex number cannot have a negative part");
  return entity(natural_complex_value{re, im}, std::move(members));
}

bool exists(entity const& e) {
  return e && e.kind() != existence_kind;
}

bool is_limited(entity const& e) {
  if(!e) { return false; }
  const entity_kind k = e.kind();
  return k != existence_kind && k != nature_kind && k != infinite_kind;
}

} /* end namespace ontology */
