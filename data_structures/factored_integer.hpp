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

#ifndef ONTOLOGY_FACTORED_INTEGER_HPP__
#define ONTOLOGY_FACTORED_INTEGER_HPP__

// Integers kept as products of powers whose exponents are themselves
// such products, so that a value like 2^(3^40) can be named without
// being materialized.
//
//   factored_integer  N = P * P * ... (no factors: N = 1)
//   power             P = base^N

#include <initializer_list>
#include <memory>
#include <ostream>
#include <vector>
#include <gmpxx.h>

#include "../config.hpp"

namespace ontology {

// base^exponent for an exponent of any size.  mpz_pow_ui only takes an
// unsigned long exponent; past `ceiling` the exponent is split as
// q*ceiling + r and the result built as (base^ceiling)^q * base^r, with
// the q multiplications done one at a time.
//
// Throws invalid_argument_error for a negative base or exponent, or a
// zero ceiling, and representation_error if the result would have more
// bits than an mpz can hold.
mpz_class full_range_pow(mpz_class const& base, mpz_class const& exponent,
                         unsigned long ceiling = ONTOLOGY_DIRECT_POW_CEILING);

class factored_integer;

class power {
public:
  // base^1
  explicit power(mpz_class const& base);
  power(mpz_class const& base, mpz_class const& exponent);
  power(mpz_class const& base, factored_integer const& exponent);

  mpz_class const& base()const { return base_; }
  factored_integer const& exponent()const;

  mpz_class exponent_value()const;
  mpz_class value(unsigned long ceiling = ONTOLOGY_DIRECT_POW_CEILING)const;

  // By value: 2^4 == 4^2.
  friend bool operator==(power const& a, power const& b);
  friend inline bool operator!=(power const& a, power const& b) { return !(a == b); }
  friend size_t hash_value(power const& p);
  friend std::ostream& operator<<(std::ostream& os, power const& p);
private:
  mpz_class base_;
  std::shared_ptr<const factored_integer> exponent_;
};

class factored_integer {
public:
  // The empty product, 1.
  factored_integer() {}
  factored_integer(std::initializer_list<power> factors) : factors_(factors) {}
  explicit factored_integer(std::vector<power> factors) : factors_(std::move(factors)) {}
  explicit factored_integer(power const& p) : factors_(1, p) {}

  std::vector<power> const& factors()const { return factors_; }

  mpz_class value(unsigned long ceiling = ONTOLOGY_DIRECT_POW_CEILING)const;

  friend inline factored_integer operator*(factored_integer a, power const& b) {
    a.factors_.push_back(b);
    return a;
  }
  friend inline factored_integer operator*(factored_integer a, factored_integer const& b) {
    a.factors_.insert(a.factors_.end(), b.factors_.begin(), b.factors_.end());
    return a;
  }

  // By value: 6 == 2 * 3 == 6^1.
  friend bool operator==(factored_integer const& a, factored_integer const& b);
  friend inline bool operator!=(factored_integer const& a, factored_integer const& b) { return !(a == b); }
  friend size_t hash_value(factored_integer const& n);
  friend std::ostream& operator<<(std::ostream& os, factored_integer const& n);
private:
  std::vector<power> factors_;
};

inline factored_integer operator*(power const& a, power const& b) {
  return factored_integer{a, b};
}

} /* end namespace ontology */

#endif
