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
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <sstream>
#include <boost/optional.hpp>

#include "numbers.hpp"

namespace ontology {

namespace {

enum arithmetic_op {
  add_op,
  subtract_op,
  multiply_op
};

inline bool is_integral_kind(entity_kind k) {
  return k == natural_kind || k == integer_kind;
}
inline bool is_real_like_kind(entity_kind k) {
  return k == real_kind || k == irrational_kind;
}

mpz_class const& integral_of(entity const& e) {
  if(natural_value const* v = e.get<natural_value>()) { return v->n; }
  if(integer_value const* v = e.get<integer_value>()) { return v->n; }
  caller_error("not an integral number");
}

struct ratio {
  double numerator;
  double denominator;
};
ratio ratio_of(entity const& e) {
  if(rational_value const* v = e.get<rational_value>()) {
    return ratio{v->numerator, v->denominator};
  }
  return ratio{integral_of(e).get_d(), 1.0};
}

// Parts past double's range come out infinite.
complex_value complex_parts(entity const& e) {
  if(complex_value const* v = e.get<complex_value>()) { return *v; }
  if(natural_complex_value const* v = e.get<natural_complex_value>()) {
    return complex_value{v->re.get_d(), v->im.get_d()};
  }
  caller_correct_if(is_finite_number(e), "only finite and structural numbers lie in the complex plane");
  return complex_value{scalar_value(e), 0.0};
}

// The point of the complex plane e stands for, or none if e is too big
// for a double.
boost::optional<complex_value> complex_of(entity const& e) {
  const complex_value c = complex_parts(e);
  if(!std::isfinite(c.re) || !std::isfinite(c.im)) { return boost::none; }
  return c;
}

inline int normalized_sign(int c) {
  return (c > 0) - (c < 0);
}
inline int sign_of_double(double x) {
  return (x > 0.0) - (x < 0.0);
}

// Past the end of double's range a real result is unbounded.
// An indeterminate one (infinity times zero) is absent.
entity real_or_saturated(double x) {
  if(std::isnan(x)) { return entity(); }
  if(std::isinf(x)) {
    return make_infinite(polarity::of_sign(x > 0.0));
  }
  return make_real(x);
}

// A complex result with an unbounded part is an Infinite, signed by the
// real part if that one is unbounded and by the imaginary part otherwise.
entity complex_or_saturated(double re, double im) {
  if(std::isinf(re)) { return make_infinite(polarity::of_sign(re > 0.0)); }
  if(std::isinf(im)) { return make_infinite(polarity::of_sign(im > 0.0)); }
  if(std::isnan(re) || std::isnan(im)) { return entity(); }
  return make_complex(re, im);
}

entity natural_complex_or_complex(mpz_class const& re, mpz_class const& im) {
  if(re >= 0 && im >= 0) {
    return make_natural_complex(re, im);
  }
  return complex_or_saturated(re.get_d(), im.get_d());
}

entity structural_arithmetic(arithmetic_op op, entity const& a, entity const& b) {
  natural_complex_value const* na = a.get<natural_complex_value>();
  natural_complex_value const* nb = b.get<natural_complex_value>();
  if(na && nb) {
    switch(op) {
      case add_op: return make_natural_complex(na->re + nb->re, na->im + nb->im);
      case subtract_op: return natural_complex_or_complex(na->re - nb->re, na->im - nb->im);
      case multiply_op: return natural_complex_or_complex(
        na->re * nb->re - na->im * nb->im,
        na->re * nb->im + na->im * nb->re);
    }
  }
  const boost::optional<complex_value> oa = complex_of(a);
  const boost::optional<complex_value> ob = complex_of(b);
  if(!oa || !ob) { return entity(); }
  complex_value const& ca = *oa;
  complex_value const& cb = *ob;
  switch(op) {
    case add_op: return complex_or_saturated(ca.re + cb.re, ca.im + cb.im);
    case subtract_op: return complex_or_saturated(ca.re - cb.re, ca.im - cb.im);
    case multiply_op: return complex_or_saturated(
      ca.re * cb.re - ca.im * cb.im,
      ca.re * cb.im + ca.im * cb.re);
  }
  caller_error("unknown arithmetic operation");
}

entity finite_arithmetic(arithmetic_op op, entity const& a, entity const& b) {
  const entity_kind ka = a.kind();
  const entity_kind kb = b.kind();
  if(ka == natural_kind && kb == natural_kind) {
    mpz_class const& x = integral_of(a);
    mpz_class const& y = integral_of(b);
    switch(op) {
      case add_op: return make_natural(x + y);
      case subtract_op: return make_integer(x - y);
      case multiply_op: return make_natural(x * y);
    }
  }
  if(is_integral_kind(ka) && is_integral_kind(kb)) {
    mpz_class const& x = integral_of(a);
    mpz_class const& y = integral_of(b);
    switch(op) {
      case add_op: return make_integer(x + y);
      case subtract_op: return make_integer(x - y);
      case multiply_op: return make_integer(x * y);
    }
  }
  if(!is_real_like_kind(ka) && !is_real_like_kind(kb)) {
    // rational with rational or integral
    const ratio x = ratio_of(a);
    const ratio y = ratio_of(b);
    ratio r = {0.0, 0.0};
    switch(op) {
      case add_op:
        r = ratio{x.numerator * y.denominator + y.numerator * x.denominator, x.denominator * y.denominator};
        break;
      case subtract_op:
        r = ratio{x.numerator * y.denominator - y.numerator * x.denominator, x.denominator * y.denominator};
        break;
      case multiply_op:
        r = ratio{x.numerator * y.numerator, x.denominator * y.denominator};
        break;
    }
    if(std::isfinite(r.numerator) && std::isfinite(r.denominator) && r.denominator != 0.0
       && std::isfinite(r.numerator / r.denominator)) {
      return make_rational(r.numerator, r.denominator);
    }
    // The pair overflowed; the quotient may still be representable.
  }
  const double x = scalar_value(a);
  const double y = scalar_value(b);
  switch(op) {
    case add_op: return real_or_saturated(x + y);
    case subtract_op: return real_or_saturated(x - y);
    case multiply_op: return real_or_saturated(x * y);
  }
  caller_error("unknown arithmetic operation");
}

entity arithmetic(arithmetic_op op, entity const& a, entity const& b) {
  if(!a || !b) { return entity(); }
  caller_correct_if(is_number(a) && is_number(b), "arithmetic is only defined on numbers");

  if(a.kind() == infinite_kind) { return a; }
  if(b.kind() == infinite_kind) { return (op == subtract_op) ? negate(b) : b; }

  const bool za = (a.kind() == zero_kind);
  const bool zb = (b.kind() == zero_kind);
  if(za || zb) {
    switch(op) {
      case add_op: return za ? b : a;
      case subtract_op: return zb ? a : negate(b);
      case multiply_op: {
        entity const& z = za ? a : b;
        entity const& other = za ? b : a;
        polarity pole = z.get<zero_value>()->pole;
        if(is_linear_number(other)) { pole = pole.times(polarity_of(other)); }
        return make_zero(pole);
      }
    }
  }

  if(is_structural_number(a) || is_structural_number(b)) {
    return structural_arithmetic(op, a, b);
  }
  return finite_arithmetic(op, a, b);
}

std::string double_string(double x) {
  // The shortest decimal that reads back as x.
  for(int precision = 1; precision < 17; ++precision) {
    std::ostringstream os;
    os << std::setprecision(precision) << x;
    if(std::strtod(os.str().c_str(), nullptr) == x) { return os.str(); }
  }
  std::ostringstream os;
  os << std::setprecision(17) << x;
  return os.str();
}

} /* end anonymous namespace */

bool is_number(entity const& e) {
  return e && e.kind() >= zero_kind;
}
bool is_linear_number(entity const& e) {
  return e && e.kind() >= zero_kind && e.kind() <= irrational_kind;
}
bool is_finite_number(entity const& e) {
  return e && e.kind() >= natural_kind && e.kind() <= irrational_kind;
}
bool is_structural_number(entity const& e) {
  return e && (e.kind() == complex_kind || e.kind() == natural_complex_kind);
}

int sign(entity const& e) {
  caller_correct_if(is_linear_number(e), "sign is only defined on linear numbers");
  switch(e.kind()) {
    case zero_kind: return 0;
    case infinite_kind: return e.get<infinite_value>()->pole.sign();
    case natural_kind:
    case integer_kind: return normalized_sign(sgn(integral_of(e)));
    default: return sign_of_double(scalar_value(e));
  }
}

bool is_zero(entity const& e) {
  if(natural_complex_value const* v = e.get<natural_complex_value>()) {
    return v->re == 0 && v->im == 0;
  }
  if(complex_value const* v = e.get<complex_value>()) {
    return v->re == 0.0 && v->im == 0.0;
  }
  return sign(e) == 0;
}

bool is_positive(entity const& e) {
  return polarity_of(e).is_positive();
}

polarity polarity_of(entity const& e) {
  caller_correct_if(is_linear_number(e), "polarity is only defined on linear numbers");
  if(zero_value const* z = e.get<zero_value>()) { return z->pole; }
  if(infinite_value const* i = e.get<infinite_value>()) { return i->pole; }
  return polarity::of_sign(sign(e) >= 0);
}

int compare(entity const& a, entity const& b) {
  caller_correct_if(is_linear_number(a) && is_linear_number(b), "only linear numbers are ordered");
  const int ia = (a.kind() == infinite_kind) ? a.get<infinite_value>()->pole.sign() : 0;
  const int ib = (b.kind() == infinite_kind) ? b.get<infinite_value>()->pole.sign() : 0;
  if(ia != 0 || ib != 0) {
    return normalized_sign(ia - ib);
  }
  const bool exact_a = is_integral_kind(a.kind()) || a.kind() == zero_kind;
  const bool exact_b = is_integral_kind(b.kind()) || b.kind() == zero_kind;
  if(exact_a && exact_b) {
    const mpz_class x = (a.kind() == zero_kind) ? mpz_class(0) : integral_of(a);
    const mpz_class y = (b.kind() == zero_kind) ? mpz_class(0) : integral_of(b);
    return normalized_sign(cmp(x, y));
  }
  if(exact_a && a.kind() != zero_kind) {
    return normalized_sign(cmp(integral_of(a), scalar_value(b)));
  }
  if(exact_b && b.kind() != zero_kind) {
    return -normalized_sign(cmp(integral_of(b), scalar_value(a)));
  }
  return sign_of_double(scalar_value(a) - scalar_value(b));
}

double scalar_value(entity const& e) {
  caller_correct_if(is_linear_number(e), "only linear numbers have a scalar value");
  switch(e.kind()) {
    case zero_kind:
      return e.get<zero_value>()->pole.is_positive() ? 0.0 : -0.0;
    case infinite_kind:
      return e.get<infinite_value>()->pole.sign() * std::numeric_limits<double>::infinity();
    case natural_kind:
    case integer_kind:
      return integral_of(e).get_d();
    case real_kind:
      return e.get<real_value>()->x;
    case rational_kind:
      return e.get<rational_value>()->x();
    case irrational_kind:
      return e.get<irrational_value>()->x;
    default:
      caller_error("only linear numbers have a scalar value");
  }
}

double magnitude(entity const& e) {
  caller_correct_if(is_structural_number(e), "magnitude is only defined on structural numbers");
  const complex_value c = complex_parts(e);
  return std::hypot(c.re, c.im);
}
double phase(entity const& e) {
  caller_correct_if(is_structural_number(e), "phase is only defined on structural numbers");
  const complex_value c = complex_parts(e);
  return std::atan2(c.im, c.re);
}

entity with_sign(entity const& e, bool positive) {
  if(!e) { return e; }
  caller_correct_if(is_linear_number(e), "sign is only defined on linear numbers");
  member_set const& members = e.members();
  switch(e.kind()) {
    case zero_kind:
      return make_zero(polarity::of_sign(positive), members);
    case infinite_kind:
      return make_infinite(polarity::of_sign(positive), members);
    case natural_kind:
      sign_domain_error_if(!positive, "a natural number cannot be made negative");
      return e;
    case integer_kind: {
      const mpz_class m = abs(integral_of(e));
      return make_integer(positive ? m : mpz_class(-m), members);
    }
    case real_kind:
      return make_real(positive ? std::fabs(scalar_value(e)) : -std::fabs(scalar_value(e)), members);
    case rational_kind: {
      rational_value const& r = *e.get<rational_value>();
      const double n = std::fabs(r.numerator);
      return make_rational(positive ? n : -n, r.denominator, members);
    }
    case irrational_kind:
      return make_irrational(positive ? std::fabs(scalar_value(e)) : -std::fabs(scalar_value(e)), members);
    default:
      caller_error("sign is only defined on linear numbers");
  }
}

entity negate(entity const& e) {
  if(!e) { return e; }
  member_set const& members = e.members();
  switch(e.kind()) {
    case existence_kind:
    case nature_kind:
      return e;
    case being_kind:
      return make_void(members);
    case void_kind:
      return make_being(members);
    case zero_kind:
      return make_zero(e.get<zero_value>()->pole.inverted(), members);
    case infinite_kind:
      return make_infinite(e.get<infinite_value>()->pole.inverted(), members);
    case natural_kind:
    case integer_kind:
      return make_integer(-integral_of(e), members);
    case real_kind:
      return make_real(-e.get<real_value>()->x, members);
    case rational_kind: {
      rational_value const& r = *e.get<rational_value>();
      return make_rational(-r.numerator, r.denominator, members);
    }
    case irrational_kind:
      return make_irrational(-e.get<irrational_value>()->x, members);
    case complex_kind:
    case natural_complex_kind: {
      const boost::optional<complex_value> c = complex_of(e);
      if(!c) { return entity(); }
      return make_complex(-c->re, -c->im, members);
    }
  }
  caller_error("unknown entity kind");
}

entity add(entity const& a, entity const& b) {
  return arithmetic(add_op, a, b);
}
entity subtract(entity const& a, entity const& b) {
  return arithmetic(subtract_op, a, b);
}
entity multiply(entity const& a, entity const& b) {
  return arithmetic(multiply_op, a, b);
}

std::string value_string(entity const& e) {
  if(!e) { return "<absent>"; }
  switch(e.kind()) {
    case zero_kind:
      return e.get<zero_value>()->pole.is_positive() ? "+0" : "-0";
    case infinite_kind:
      return e.get<infinite_value>()->pole.is_positive() ? "+Infinite" : "-Infinite";
    case natural_kind:
    case integer_kind:
      return integral_of(e).get_str();
    case real_kind:
    case irrational_kind:
      return double_string(scalar_value(e));
    case rational_kind: {
      rational_value const& r = *e.get<rational_value>();
      return double_string(r.numerator) + "/" + double_string(r.denominator);
    }
    case complex_kind: {
      complex_value const& c = *e.get<complex_value>();
      return "(" + double_string(c.re) + "," + double_string(c.im) + ")";
    }
    case natural_complex_kind: {
      natural_complex_value const& c = *e.get<natural_complex_value>();
      return "(" + c.re.get_str() + "," + c.im.get_str() + ")";
    }
    default:
      return kind_name(e.kind());
  }
}

} /* end namespace ontology */
