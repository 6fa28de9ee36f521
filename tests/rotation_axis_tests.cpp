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

#define TESTS_FILE rotation_axis_tests
#include "test_header.hpp"

#include "../rotation_axis.hpp"
#include "../numbers.hpp"

using namespace ontology;

BOOST_AUTO_TEST_CASE(quarter_turns_close_after_four) {
  const rotation_axis axis(make_infinite(), make_complex(1, 0));
  const std::array<entity, 5> i = axis.cycle();
  BOOST_CHECK(i[0] == make_complex(1, 0));
  BOOST_CHECK(i[1] == make_complex(0, 1));
  BOOST_CHECK(i[2] == make_complex(-1, 0));
  BOOST_CHECK(i[3] == make_complex(0, -1));
  BOOST_CHECK(i[4] == i[0]);
  BOOST_CHECK(i[2] == negate(i[0]));
  BOOST_CHECK(multiply(i[1], i[1]) == i[2]);
  BOOST_CHECK_EQUAL(hash_value(i[4]), hash_value(i[0]));
}

BOOST_AUTO_TEST_CASE(applying_the_axis_multiplies_by_the_generator) {
  const rotation_axis axis(make_infinite(), make_real(1));
  BOOST_CHECK(axis.unit() == make_complex(1, 0));
  BOOST_CHECK(axis.generator() == make_complex(0, 1));
  BOOST_CHECK(axis.turn() == axis.generator());
  BOOST_CHECK(axis(make_complex(2, 3)) == make_complex(-3, 2));
  BOOST_CHECK(axis(make_natural(5)) == make_complex(0, 5));
  BOOST_CHECK(axis(make_infinite(polarity::negative())) == make_infinite(polarity::negative()));
  BOOST_CHECK(axis(entity()) == entity());
}

BOOST_AUTO_TEST_CASE(a_negative_pole_turns_the_other_way) {
  const rotation_axis axis(make_infinite(polarity::negative()), make_natural(1));
  BOOST_CHECK(axis.generator() == make_complex(0, -1));
  BOOST_CHECK(axis(make_complex(0, 1)) == make_complex(1, 0));
  const std::array<entity, 5> i = axis.cycle();
  BOOST_CHECK(i[1] == make_complex(0, -1));
  BOOST_CHECK(i[2] == negate(i[0]));
  BOOST_CHECK(i[4] == i[0]);
}

BOOST_AUTO_TEST_CASE(any_unit_closes) {
  const rotation_axis axis(make_infinite(), make_complex(0, -1));
  const std::array<entity, 5> i = axis.cycle();
  BOOST_CHECK(i[1] == make_complex(1, 0));
  BOOST_CHECK(axis.generator() == i[1]);
  BOOST_CHECK(axis.turn() == make_complex(0, 1));
  BOOST_CHECK(i[4] == i[0]);
  BOOST_CHECK(i[2] == negate(i[0]));

  const rotation_axis from_naturals(make_infinite(), make_natural_complex(0, 1));
  BOOST_CHECK(from_naturals.unit() == make_complex(0, 1));
  BOOST_CHECK(from_naturals.pole() == make_infinite());
}

BOOST_AUTO_TEST_CASE(bad_axes_are_rejected) {
  BOOST_CHECK_THROW(rotation_axis(make_zero(), make_complex(1, 0)), invalid_argument_error);
  BOOST_CHECK_THROW(rotation_axis(entity(), make_complex(1, 0)), invalid_argument_error);
  BOOST_CHECK_THROW(rotation_axis(make_infinite(), entity()), invalid_argument_error);
  BOOST_CHECK_THROW(rotation_axis(make_infinite(), make_complex(1, 1)), invalid_argument_error);
  BOOST_CHECK_THROW(rotation_axis(make_infinite(), make_real(0.5)), invalid_argument_error);
  BOOST_CHECK_THROW(rotation_axis(make_infinite(), make_zero()), invalid_argument_error);
  BOOST_CHECK_THROW(rotation_axis(make_infinite(), make_being()), invalid_argument_error);
}

REGISTER_TESTS // This must come last in the file.
