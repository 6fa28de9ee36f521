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

#define TESTS_FILE factored_integer_tests
#include "test_header.hpp"

#include <climits>
#include <sstream>
#include <string>
#include "../data_structures/factored_integer.hpp"

using namespace ontology;

namespace /* anonymous */ {
template<typename T>
std::string rendered(T const& t) {
  std::ostringstream os;
  os << t;
  return os.str();
}

mpz_class reference_pow(unsigned long base, unsigned long exponent) {
  mpz_class result;
  mpz_ui_pow_ui(result.get_mpz_t(), base, exponent);
  return result;
}
} /* end anonymous namespace */

BOOST_AUTO_TEST_CASE(small_values) {
  BOOST_CHECK_EQUAL(power(2, 3).value(), 8);
  BOOST_CHECK_EQUAL(power(7).value(), 7);
  BOOST_CHECK_EQUAL(power(5, 0).value(), 1);
  BOOST_CHECK_EQUAL((factored_integer{power(2, 1), power(3, 1)}).value(), 6);
  BOOST_CHECK_EQUAL(factored_integer().value(), 1);
  BOOST_CHECK_EQUAL(power(2, 10).exponent_value(), 10);
  BOOST_CHECK_EQUAL(power(2).exponent_value(), 1);
}

BOOST_AUTO_TEST_CASE(chunked_power_matches_direct_power) {
  // One past the ceiling: a single chunk and a remainder of one.
  BOOST_CHECK_EQUAL(full_range_pow(3, 65, 64), reference_pow(3, 65));
  BOOST_CHECK_EQUAL(full_range_pow(3, 130, 64), reference_pow(3, 130));
  // No remainder.
  BOOST_CHECK_EQUAL(full_range_pow(7, 128, 64), reference_pow(7, 128));
  BOOST_CHECK_EQUAL(full_range_pow(2, 1000, 1), reference_pow(2, 1000));
  BOOST_CHECK_EQUAL(full_range_pow(10, 20, 64), reference_pow(10, 20));

  // Nested exponents use the same ceiling all the way down.
  const power tower(2, factored_integer(power(3, 2)));
  BOOST_CHECK_EQUAL(tower.value(4), 512);
  BOOST_CHECK_EQUAL(tower.value(), 512);
}

BOOST_AUTO_TEST_CASE(trivial_bases_skip_the_chunks) {
  const mpz_class beyond = mpz_class(ULONG_MAX) + 1;
  BOOST_CHECK_EQUAL(full_range_pow(0, beyond), 0);
  BOOST_CHECK_EQUAL(full_range_pow(1, beyond), 1);
  BOOST_CHECK_EQUAL(full_range_pow(0, 0), 1);
  BOOST_CHECK_EQUAL(full_range_pow(1, 0), 1);
  BOOST_CHECK_EQUAL(power(1, factored_integer(power(10, 100))).value(), 1);
}

BOOST_AUTO_TEST_CASE(bad_arguments) {
  BOOST_CHECK_THROW(full_range_pow(-2, 3), invalid_argument_error);
  BOOST_CHECK_THROW(full_range_pow(2, -3), invalid_argument_error);
  BOOST_CHECK_THROW(full_range_pow(2, 3, 0), invalid_argument_error);
  BOOST_CHECK_THROW(power(-2), invalid_argument_error);
  BOOST_CHECK_THROW(power(2, -1), invalid_argument_error);
  BOOST_CHECK_THROW(power(-2, factored_integer()), invalid_argument_error);
}

BOOST_AUTO_TEST_CASE(huge_exponents_stay_factored) {
  // 2^(3^40) has about 10^19 bits; naming it must not compute it.
  const power p(2, factored_integer(power(3, 40)));
  BOOST_CHECK_EQUAL(p.exponent_value(), reference_pow(3, 40));
  BOOST_CHECK_EQUAL(p.base(), 2);
  BOOST_CHECK_EQUAL(rendered(p), "2^(3^40)");
}

BOOST_AUTO_TEST_CASE(towers_render_without_evaluating) {
  // The middle exponent, 2^(2^40), is too big for any mpz.
  const power tower(2, factored_integer(power(2, factored_integer(power(2, 40)))));
  BOOST_CHECK_EQUAL(rendered(tower), "2^(2^(2^40))");
  BOOST_CHECK_EQUAL(rendered(factored_integer{tower, power(3)}), "2^(2^(2^40)) * 3");
  // Exponents that are one by structure render bare.
  BOOST_CHECK_EQUAL(rendered(power(5, factored_integer(power(1, 7)))), "5");
  BOOST_CHECK_EQUAL(rendered(power(5, factored_integer(power(9, 0)))), "5");
  BOOST_CHECK_EQUAL(rendered(power(5, factored_integer(power(0, 3)))), "5^(0^3)");
}

BOOST_AUTO_TEST_CASE(unrepresentable_powers_throw) {
  const mpz_class beyond = mpz_class(ULONG_MAX) + 1;
  // The chunked path with the default ceiling.
  BOOST_CHECK_THROW(full_range_pow(2, beyond), representation_error);
  // The direct path.
  BOOST_CHECK_THROW(full_range_pow(3, ULONG_MAX), representation_error);
  const power tower(2, factored_integer(power(2, factored_integer(power(2, 40)))));
  BOOST_CHECK_THROW(tower.value(), representation_error);
  BOOST_CHECK_THROW(tower.exponent_value(), representation_error);
}

BOOST_AUTO_TEST_CASE(products) {
  const factored_integer six = power(2) * power(3);
  BOOST_CHECK_EQUAL(six.factors().size(), 2u);
  BOOST_CHECK_EQUAL(six.value(), 6);
  const factored_integer thirty = six * power(5);
  BOOST_CHECK_EQUAL(thirty.factors().size(), 3u);
  BOOST_CHECK_EQUAL(thirty.value(), 30);
  const factored_integer thirty_six = six * six;
  BOOST_CHECK_EQUAL(thirty_six.factors().size(), 4u);
  BOOST_CHECK_EQUAL(thirty_six.value(), 36);
  BOOST_CHECK_EQUAL((factored_integer() * power(4, 2)).value(), 16);
}

BOOST_AUTO_TEST_CASE(equality_is_by_value) {
  const factored_integer a{power(2), power(3)};
  const factored_integer b{power(3), power(2)};
  const factored_integer c(power(6));
  BOOST_CHECK(a == b);
  BOOST_CHECK(a == c);
  BOOST_CHECK_EQUAL(hash_value(a), hash_value(b));
  BOOST_CHECK_EQUAL(hash_value(a), hash_value(c));
  BOOST_CHECK(factored_integer(power(2, 3)) != factored_integer(power(3, 2)));
  BOOST_CHECK(factored_integer() == factored_integer(power(1)));

  BOOST_CHECK(power(2, 4) == power(4, 2));
  BOOST_CHECK(power(2, 4) == power(16));
  BOOST_CHECK_EQUAL(hash_value(power(2, 4)), hash_value(power(4, 2)));
  BOOST_CHECK(power(2, 4) != power(2, 5));
  BOOST_CHECK(power(2, factored_integer{power(2), power(3)}) == power(8, 2));
}

BOOST_AUTO_TEST_CASE(rendering) {
  BOOST_CHECK_EQUAL(rendered(factored_integer()), "1");
  BOOST_CHECK_EQUAL(rendered(power(7)), "7");
  BOOST_CHECK_EQUAL(rendered(power(7, 1)), "7");
  BOOST_CHECK_EQUAL(rendered(power(2, 3)), "2^3");
  BOOST_CHECK_EQUAL(rendered(power(2, 0)), "2^0");
  BOOST_CHECK_EQUAL(rendered(factored_integer{power(2), power(3, 2)}), "2 * 3^2");
  BOOST_CHECK_EQUAL(rendered(power(2, factored_integer(power(3, 2)))), "2^(3^2)");
  BOOST_CHECK_EQUAL(rendered(power(2, factored_integer{power(3), power(5)})), "2^(3 * 5)");
}

REGISTER_TESTS // This must come last in the file.
