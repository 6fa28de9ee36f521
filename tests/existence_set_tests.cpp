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

// When you add a new tests file, define a new name here and with
// DECLARE_TESTS_FILE near the top of test_header.hpp, and put at
// the bottom of your tests file:
// REGISTER_TESTS // This must come last in the file.
#define TESTS_FILE existence_set_tests
#include "test_header.hpp"

#include "../entity.hpp"

using namespace ontology;

BOOST_AUTO_TEST_CASE(existence_set_ignores_order_and_duplicates) {
  const entity a = make_natural(1);
  const entity b = make_natural(2);
  const member_set ab{a, b};
  const member_set ba{b, a};
  BOOST_CHECK(ab == ba);
  BOOST_CHECK_EQUAL(hash_value(ab), hash_value(ba));
  BOOST_CHECK_EQUAL(ab.size(), 2u);

  const member_set aab{a, a, b};
  BOOST_CHECK(aab == ab);
  BOOST_CHECK_EQUAL(aab.size(), 2u);

  BOOST_CHECK(member_set{a} != ab);
  BOOST_CHECK(member_set() != member_set{a});
  BOOST_CHECK(member_set().empty());
}

BOOST_AUTO_TEST_CASE(existence_set_membership) {
  const entity a = make_natural(1);
  const entity b = make_being();
  const entity c = make_real(0.5);
  const member_set s{a, b};
  BOOST_CHECK(s.contains(a));
  BOOST_CHECK(s.contains(b));
  BOOST_CHECK(!s.contains(c));
  // Members are compared by value, not identity.
  BOOST_CHECK(s.contains(make_natural(1)));

  const member_set t = s.with(c);
  BOOST_CHECK_EQUAL(t.size(), 3u);
  BOOST_CHECK(t.contains(c));
  BOOST_CHECK_EQUAL(s.size(), 2u);
  BOOST_CHECK(s.with(a) == s);
}

BOOST_AUTO_TEST_CASE(existence_set_rejects_absent_members) {
  BOOST_CHECK_THROW(member_set({make_natural(1), entity()}), invalid_argument_error);
  BOOST_CHECK_THROW(member_set().with(entity()), invalid_argument_error);
  BOOST_CHECK_THROW(make_being(member_set{entity()}), invalid_argument_error);
}

BOOST_AUTO_TEST_CASE(existence_set_nests) {
  const entity inner = make_being(member_set{make_natural(3)});
  const entity outer = make_existence(member_set{inner, make_void()});
  BOOST_CHECK(outer.members().contains(inner));
  BOOST_CHECK(outer.members().contains(make_void()));
  BOOST_CHECK(!outer.members().contains(make_being()));
}

REGISTER_TESTS // This must come last in the file.
