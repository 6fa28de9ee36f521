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

#include <stdexcept>

#include "constants.hpp"
#include "numbers.hpp"

namespace ontology {

namespace {

entity traced(const char* name, entity const& e) {
  if(ONTOLOGY_TRACE_CONSTANTS) {
    LOG << "constant " << name << " = " << value_string(e) << '\n';
  }
  return e;
}

bool closes(std::array<entity, 5> const& cycle) {
  return cycle[4] == cycle[0]
      && cycle[2] == negate(cycle[0])
      && multiply(cycle[1], cycle[1]) == cycle[2];
}

} /* end anonymous namespace */

double pi_series(unsigned long terms) {
  double result = 2.0 * terms + 1.0;
  for(unsigned long n = terms; n-- > 1; ) {
    result = 2.0 + n / (2.0 * n + 1.0) * result;
  }
  return result;
}

double e_series(unsigned long terms, double x) {
  double result = 1.0;
  for(unsigned long n = terms; n-- > 1; ) {
    result = 1.0 + x / n * result;
  }
  return result;
}

constants const& constants::get() {
  static const constants registry;
  return registry;
}

constants::constants() :
  sole(traced("Sole", make_nature())),

  zero(traced("Zero", make_zero())),
  the_infinite(traced("TheInfinite", make_infinite())),
  negative_zero(traced("-Zero", negate(zero))),
  negative_infinite(traced("-TheInfinite", negate(the_infinite))),

  natural_zero(traced("Natural.Zero", make_natural(0))),
  natural_one(traced("Natural.One", make_natural(1))),

  integer_zero(traced("Integer.Zero", make_integer(0))),
  integer_one(traced("Integer.One", make_integer(1))),
  integer_minus_one(traced("Integer.MinusOne", make_integer(-1))),

  real_zero(traced("Real.Zero", make_real(0.0))),
  real_one(traced("Real.One", make_real(1.0))),
  real_minus_one(traced("Real.MinusOne", make_real(-1.0))),

  rational_zero(traced("Rational.Zero", make_rational(scalar_value(real_zero), scalar_value(real_one)))),
  rational_one(traced("Rational.One", make_rational(scalar_value(real_one), scalar_value(real_one)))),

  pi(traced("Pi", make_irrational(pi_series(ONTOLOGY_SERIES_TERMS)))),
  e(traced("E", make_irrational(e_series(ONTOLOGY_SERIES_TERMS)))),

  complex_zero(traced("Complex.Zero", make_complex(0.0, 0.0))),
  complex_one(traced("Complex.One", make_complex(scalar_value(real_one), 0.0))),
  complex_minus_one(traced("Complex.MinusOne", make_complex(scalar_value(real_minus_one), 0.0))),
  complex_i(traced("Complex.I", make_complex(scalar_value(real_zero), scalar_value(real_one)))),
  complex_minus_i(traced("Complex.MinusI", make_complex(scalar_value(real_zero), scalar_value(real_minus_one)))),

  natural_complex_zero(traced("NaturalComplex.Zero", make_natural_complex(0, 0))),
  natural_complex_one(traced("NaturalComplex.One", make_natural_complex(natural_one.get<natural_value>()->n, 0))),
  natural_complex_j(traced("NaturalComplex.J", make_natural_complex(0, natural_one.get<natural_value>()->n))),
  natural_complex_one_j(traced("NaturalComplex.OneJ", make_natural_complex(
    natural_one.get<natural_value>()->n, natural_one.get<natural_value>()->n))),

  axis(the_infinite, complex_one),
  rotation(axis.cycle())
{
  if(!closes(rotation)) {
    LOG << "rotation about " << value_string(axis.pole()) << " does not close:";
    for(entity const& step : rotation) {
      LOG << ' ' << value_string(step);
    }
    LOG << '\n';
    throw std::logic_error("the canonical rotation axis does not close");
  }
  if(ONTOLOGY_TRACE_CONSTANTS) {
    LOG << "rotation about " << value_string(axis.pole()) << " closes\n";
  }
}

} /* end namespace ontology */
