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

#include <climits>

#include "factored_integer.hpp"
#include "mpz_hash.hpp"

namespace ontology {

namespace {

// The empty product, shared by every power with exponent 1.
std::shared_ptr<const factored_integer> const& unit_exponent() {
  static const std::shared_ptr<const factored_integer> one = std::make_shared<factored_integer>();
  return one;
}

// Decided from the structure alone: a tower's value may be far too big
// to compute.  An exponent is one if each of its factors has base 1 or
// exponent zero, and zero if some factor has base 0 and a nonzero exponent.
bool is_structurally_zero(factored_integer const& n);
bool is_structurally_one(factored_integer const& n) {
  for(power const& p : n.factors()) {
    if(p.base() != 1 && !is_structurally_zero(p.exponent())) { return false; }
  }
  return true;
}
bool is_structurally_zero(factored_integer const& n) {
  for(power const& p : n.factors()) {
    if(p.base() == 0 && !is_structurally_zero(p.exponent())) { return true; }
  }
  return false;
}

bool renders_bare(factored_integer const& exponent) {
  return exponent.factors().size() == 1 && is_structurally_one(exponent.factors().front().exponent());
}

// The most bits an mpz can have: its limb count is an int.
mpz_class max_mpz_bits() {
  return mpz_class(INT_MAX) * GMP_NUMB_BITS;
}

} /* end anonymous namespace */

mpz_class full_range_pow(mpz_class const& base, mpz_class const& exponent, unsigned long ceiling) {
  caller_error_if(base < 0, "full_range_pow: negative base");
  caller_error_if(exponent < 0, "full_range_pow: negative exponent");
  caller_error_if(ceiling == 0, "full_range_pow: zero ceiling");

  if(base == 0) { return (exponent == 0) ? mpz_class(1) : mpz_class(0); }
  if(base == 1) { return mpz_class(1); }

  // base >= 2 has at least (bits(base) - 1) * exponent + 1 bits in its power.
  const mpz_class least_bits = mpz_class(mpz_sizeinbase(base.get_mpz_t(), 2) - 1) * exponent + 1;
  if(least_bits > max_mpz_bits()) {
    throw representation_error("full_range_pow: the result has more bits than an mpz can hold");
  }

  mpz_class result;
  if(exponent <= ceiling) {
    mpz_pow_ui(result.get_mpz_t(), base.get_mpz_t(), exponent.get_ui());
    return result;
  }

  mpz_class chunks;
  mpz_class remainder;
  mpz_fdiv_qr_ui(chunks.get_mpz_t(), remainder.get_mpz_t(), exponent.get_mpz_t(), ceiling);

  mpz_class chunk;
  mpz_pow_ui(chunk.get_mpz_t(), base.get_mpz_t(), ceiling);
  mpz_pow_ui(result.get_mpz_t(), base.get_mpz_t(), remainder.get_ui());
  for(mpz_class i = 0; i < chunks; ++i) {
    result *= chunk;
  }
  return result;
}

power::power(mpz_class const& base) : base_(base), exponent_(unit_exponent()) {
  caller_error_if(base < 0, "a power's base cannot be negative");
}

power::power(mpz_class const& base, mpz_class const& exponent) : base_(base) {
  caller_error_if(base < 0, "a power's base cannot be negative");
  caller_error_if(exponent < 0, "a power's exponent cannot be negative");
  if(exponent == 1) {
    exponent_ = unit_exponent();
  }
  else {
    exponent_ = std::make_shared<factored_integer>(power(exponent));
  }
}

power::power(mpz_class const& base, factored_integer const& exponent) :
  base_(base), exponent_(std::make_shared<factored_integer>(exponent)) {
  caller_error_if(base < 0, "a power's base cannot be negative");
}

factored_integer const& power::exponent()const {
  return *exponent_;
}

mpz_class power::exponent_value()const {
  return exponent_->value();
}

mpz_class power::value(unsigned long ceiling)const {
  return full_range_pow(base_, exponent_->value(ceiling), ceiling);
}

bool operator==(power const& a, power const& b) {
  return a.value() == b.value();
}

size_t hash_value(power const& p) {
  return hash_mpz(p.value());
}

std::ostream& operator<<(std::ostream& os, power const& p) {
  os << p.base_.get_str();
  if(is_structurally_one(*p.exponent_)) { return os; }
  os << '^';
  if(renders_bare(*p.exponent_)) {
    return os << *p.exponent_;
  }
  return os << '(' << *p.exponent_ << ')';
}

mpz_class factored_integer::value(unsigned long ceiling)const {
  mpz_class result = 1;
  for(power const& p : factors_) {
    result *= p.value(ceiling);
  }
  return result;
}

bool operator==(factored_integer const& a, factored_integer const& b) {
  return a.value() == b.value();
}

size_t hash_value(factored_integer const& n) {
  return hash_mpz(n.value());
}

std::ostream& operator<<(std::ostream& os, factored_integer const& n) {
  if(n.factors_.empty()) { return os << '1'; }
  bool first = true;
  for(power const& p : n.factors_) {
    if(!first) { os << " * "; }
    os << p;
    first = false;
  }
  return os;
}

} /* end namespace ontology */
