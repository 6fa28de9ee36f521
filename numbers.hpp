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

#ifndef ONTOLOGY_NUMBERS_HPP__
#define ONTOLOGY_NUMBERS_HPP__

// What the number kinds can do.  Everything here dispatches on the
// entity's kind; the operations are named functions rather than
// operators so that every cross-kind step is visible at the call site.

#include <string>
#include "entity.hpp"

namespace ontology {

bool is_number(entity const& e);
// zero, infinite, and the finite kinds
bool is_linear_number(entity const& e);
// natural, integer, real, rational, irrational
bool is_finite_number(entity const& e);
// complex, natural_complex
bool is_structural_number(entity const& e);

// -1, 0 or 1.  Zero is 0 whatever its polarity.
int sign(entity const& e);
bool is_zero(entity const& e);
// For zero and infinite: the polarity.  For finite numbers: value >= 0.
bool is_positive(entity const& e);
polarity polarity_of(entity const& e);

// Total order over linear numbers, -1/0/1.
// -Infinite < every finite number < +Infinite.
int compare(entity const& a, entity const& b);

// The semantic scalar view of a linear number.
// Zero is a signed 0.0 and Infinite a signed infinity.
double scalar_value(entity const& e);

// For structural numbers.
double magnitude(entity const& e);
double phase(entity const& e);

// e with the requested sign.  Naturals can't be made negative:
// that throws domain_violation_error.
entity with_sign(entity const& e, bool positive);

// Additive inverse, extended to every kind: existence and nature are
// their own opposites, being and void are each other's, and the
// unbounded kinds flip polarity.  Members are kept.  A NaturalComplex
// too big for the complex plane has no negation there: absent.
entity negate(entity const& e);

// Arithmetic, with the arms tried in this order:
//   - an absent operand makes the result absent;
//   - Infinite absorbs: Infinite op x is the left Infinite unchanged,
//     and x op Infinite is the right one (negated for subtract);
//   - Zero is the identity of add and subtract and absorbs multiply;
//   - with a complex operand, both sides are promoted to the complex
//     plane (absent if one is too big for it), and a part beyond
//     double range saturates the result to Infinite;
//   - otherwise the narrowest finite kind that holds the result.
//     A real result beyond double range saturates to Infinite, and an
//     indeterminate one (infinity times zero) is absent.
entity add(entity const& a, entity const& b);
entity subtract(entity const& a, entity const& b);
entity multiply(entity const& a, entity const& b);

// The scalar view as text: "+0", "-Infinite", "42", "1/3", "(0,1)".
std::string value_string(entity const& e);

} /* end namespace ontology */

#endif
