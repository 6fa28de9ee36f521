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

#ifndef ONTOLOGY_CONVERSIONS_HPP__
#define ONTOLOGY_CONVERSIONS_HPP__

// The exact relationships between kinds, as named one-way functions.
// Every conversion here:
//  - maps the absent entity to the absent entity;
//  - throws invalid_argument_error when handed the wrong kind;
//  - keeps the member set.
// The partial ones return the absent entity when the value has no
// exact image in the target kind.

#include <cstdint>
#include <limits>
#include <type_traits>
#include <boost/utility/enable_if.hpp>

#include "entity.hpp"
#include "numbers.hpp"

namespace ontology {

// Zero and Infinite of opposite polarity are reciprocals, so each
// conversion inverts the polarity and the round trip is the identity.
entity zero_to_infinite(entity const& z);
entity infinite_to_zero(entity const& i);

// An empty Zero and an empty Void are interchangeable.
entity zero_to_void(entity const& z);
entity void_to_zero(entity const& v);   // Zero(+)

entity being_to_void(entity const& b);
entity void_to_being(entity const& v);

// Natural or Integer to Real.  Absent past double's range.
entity integer_to_real(entity const& i);
// Exact: absent if r has a fractional part.
entity real_to_integer(entity const& r);
// Lossy, rounding toward zero.
entity truncate_to_integer(entity const& r);

entity natural_to_integer(entity const& n);
// Absent for negative values.
entity integer_to_natural(entity const& i);

// Absent if either part is past double's range.
entity natural_complex_to_complex(entity const& c);
// Absent unless both parts are non-negative integral values.
entity complex_to_natural_complex(entity const& c);

namespace impl {
  template<typename T>
  struct is_coercion_target {
    static const bool value =
      std::is_same<T, int8_t>::value || std::is_same<T, int16_t>::value ||
      std::is_same<T, int32_t>::value || std::is_same<T, int64_t>::value ||
      std::is_same<T, uint8_t>::value || std::is_same<T, uint16_t>::value ||
      std::is_same<T, uint32_t>::value || std::is_same<T, uint64_t>::value ||
      std::is_same<T, float>::value || std::is_same<T, double>::value;
  };

  // The extremes a bounded value saturates to.
  template<typename T>
  inline T saturated(polarity pole, typename boost::enable_if_c<std::is_integral<T>::value>::type* = 0) {
    return pole.is_positive() ? std::numeric_limits<T>::max() : std::numeric_limits<T>::min();
  }
  template<typename T>
  inline T saturated(polarity pole, typename boost::enable_if_c<std::is_floating_point<T>::value>::type* = 0) {
    return pole.is_positive() ? std::numeric_limits<T>::infinity() : -std::numeric_limits<T>::infinity();
  }

  template<typename T>
  inline T from_integral(mpz_class const& n, typename boost::enable_if_c<std::is_integral<T>::value>::type* = 0) {
    if(n > mpz_class(std::numeric_limits<T>::max())) { return std::numeric_limits<T>::max(); }
    if(n < mpz_class(std::numeric_limits<T>::min())) { return std::numeric_limits<T>::min(); }
    return std::is_signed<T>::value ? static_cast<T>(n.get_si()) : static_cast<T>(n.get_ui());
  }
  template<typename T>
  inline T from_integral(mpz_class const& n, typename boost::enable_if_c<std::is_floating_point<T>::value>::type* = 0) {
    return static_cast<T>(n.get_d());
  }

  template<typename T>
  inline T from_double(double x, typename boost::enable_if_c<std::is_integral<T>::value>::type* = 0) {
    if(x >= static_cast<double>(std::numeric_limits<T>::max())) { return std::numeric_limits<T>::max(); }
    if(x <= static_cast<double>(std::numeric_limits<T>::min())) { return std::numeric_limits<T>::min(); }
    return static_cast<T>(x);
  }
  template<typename T>
  inline T from_double(double x, typename boost::enable_if_c<std::is_floating_point<T>::value>::type* = 0) {
    return static_cast<T>(x);
  }
}

// A linear number as a fixed-width primitive.
//  - Infinite saturates to T's max or min (+-infinity for floats);
//  - Zero is T(0);
//  - finite values clamp to T's range, reals rounding toward zero.
// The absent entity becomes T(0).
template<typename T>
T coerce(entity const& e) {
  static_assert(impl::is_coercion_target<T>::value, "coerce only targets fixed-width integers, float and double");
  if(!e) { return T(0); }
  switch(e.kind()) {
    case zero_kind:
      return T(0);
    case infinite_kind:
      return impl::saturated<T>(e.get<infinite_value>()->pole);
    case natural_kind:
      return impl::from_integral<T>(e.get<natural_value>()->n);
    case integer_kind:
      return impl::from_integral<T>(e.get<integer_value>()->n);
    case real_kind:
    case rational_kind:
    case irrational_kind:
      return impl::from_double<T>(scalar_value(e));
    default:
      caller_error("only linear numbers coerce to primitives");
  }
}

} /* end namespace ontology */

#endif
