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

#ifndef ONTOLOGY_CONSTANTS_HPP__
#define ONTOLOGY_CONSTANTS_HPP__

#include <array>
#include "entity.hpp"
#include "rotation_axis.hpp"

namespace ontology {

// Pi = 2 + (1/3)(2 + (2/5)(2 + (3/7)(...))), cut off after `terms`
// levels where the innermost level is 2*terms + 1.
double pi_series(unsigned long terms);
// e^x = 1 + (x/1)(1 + (x/2)(1 + (x/3)(...))), cut off after `terms`
// levels where the innermost level is 1.
double e_series(unsigned long terms, double x = 1.0);

// The named constants, built once on first use.  Members are declared
// (and so constructed) in dependency order: later groups are built
// from earlier ones.
struct constants {
  static constants const& get();

  entity const sole;            // the one Nature

  entity const zero;
  entity const the_infinite;
  entity const negative_zero;
  entity const negative_infinite;

  entity const natural_zero;
  entity const natural_one;

  entity const integer_zero;
  entity const integer_one;
  entity const integer_minus_one;

  entity const real_zero;
  entity const real_one;
  entity const real_minus_one;

  entity const rational_zero;
  entity const rational_one;

  entity const pi;
  entity const e;

  entity const complex_zero;
  entity const complex_one;
  entity const complex_minus_one;
  entity const complex_i;
  entity const complex_minus_i;

  entity const natural_complex_zero;
  entity const natural_complex_one;
  entity const natural_complex_j;
  entity const natural_complex_one_j;

  // Pole the_infinite, unit complex_one.  rotation[1] is the imaginary
  // unit and rotation[4] closes the cycle.
  rotation_axis const axis;
  std::array<entity, 5> const rotation;

private:
  constants();
  constants(constants const&) = delete;
  constants& operator=(constants const&) = delete;
};

} /* end namespace ontology */

#endif
