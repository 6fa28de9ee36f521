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

#include "conversions.hpp"

namespace ontology {

namespace {

inline void require_kind(entity const& e, entity_kind k, const char* error) {
  caller_correct_if(e.kind() == k, error);
}

inline bool is_real_family(entity const& e) {
  const entity_kind k = e.kind();
  return k == real_kind || k == rational_kind || k == irrational_kind;
}

// x is a finite double with no fractional part.
inline bool is_integral_double(double x) {
  return std::trunc(x) == x;
}

} /* end anonymous namespace */

entity zero_to_infinite(entity const& z) {
  if(!z) { return z; }
  require_kind(z, zero_kind, "zero_to_infinite needs a Zero");
  return make_infinite(z.get<zero_value>()->pole.inverted(), z.members());
}

entity infinite_to_zero(entity const& i) {
  if(!i) { return i; }
  require_kind(i, infinite_kind, "infinite_to_zero needs an Infinite");
  return make_zero(i.get<infinite_value>()->pole.inverted(), i.members());
}

entity zero_to_void(entity const& z) {
  if(!z) { return z; }
  require_kind(z, zero_kind, "zero_to_void needs a Zero");
  return make_void(z.members());
}

entity void_to_zero(entity const& v) {
  if(!v) { return v; }
  require_kind(v, void_kind, "void_to_zero needs a Void");
  return make_zero(polarity::positive(), v.members());
}

entity being_to_void(entity const& b) {
  if(!b) { return b; }
  require_kind(b, being_kind, "being_to_void needs a Being");
  return make_void(b.members());
}

entity void_to_being(entity const& v) {
  if(!v) { return v; }
  require_kind(v, void_kind, "void_to_being needs a Void");
  return make_being(v.members());
}

entity integer_to_real(entity const& i) {
  if(!i) { return i; }
  caller_correct_if(i.kind() == natural_kind || i.kind() == integer_kind,
                    "integer_to_real needs a Natural or an Integer");
  const double x = scalar_value(i);
  if(!std::isfinite(x)) { return entity(); }
  return make_real(x, i.members());
}

entity real_to_integer(entity const& r) {
  if(!r) { return r; }
  caller_correct_if(is_real_family(r), "real_to_integer needs a Real");
  const double x = scalar_value(r);
  if(!is_integral_double(x)) { return entity(); }
  return make_integer(mpz_class(x), r.members());
}

entity truncate_to_integer(entity const& r) {
  if(!r) { return r; }
  caller_correct_if(is_real_family(r), "truncate_to_integer needs a Real");
  // mpz_class(double) truncates toward zero.
  return make_integer(mpz_class(scalar_value(r)), r.members());
}

entity natural_to_integer(entity const& n) {
  if(!n) { return n; }
  require_kind(n, natural_kind, "natural_to_integer needs a Natural");
  return make_integer(n.get<natural_value>()->n, n.members());
}

entity integer_to_natural(entity const& i) {
  if(!i) { return i; }
  require_kind(i, integer_kind, "integer_to_natural needs an Integer");
  mpz_class const& n = i.get<integer_value>()->n;
  if(n < 0) { return entity(); }
  return make_natural(n, i.members());
}

entity natural_complex_to_complex(entity const& c) {
  if(!c) { return c; }
  require_kind(c, natural_complex_kind, "natural_complex_to_complex needs a NaturalComplex");
  natural_complex_value const& v = *c.get<natural_complex_value>();
  const double re = v.re.get_d();
  const double im = v.im.get_d();
  if(!std::isfinite(re) || !std::isfinite(im)) { return entity(); }
  return make_complex(re, im, c.members());
}

entity complex_to_natural_complex(entity const& c) {
  if(!c) { return c; }
  require_kind(c, complex_kind, "complex_to_natural_complex needs a Complex");
  complex_value const& v = *c.get<complex_value>();
  if(v.re < 0.0 || v.im < 0.0 || !is_integral_double(v.re) || !is_integral_double(v.im)) {
    return entity();
  }
  return make_natural_complex(mpz_class(v.re), mpz_class(v.im), c.members());
}

} /* end namespace ontology */
