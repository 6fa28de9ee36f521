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

#ifndef ONTOLOGY_ROTATION_AXIS_HPP__
#define ONTOLOGY_ROTATION_AXIS_HPP__

#include <array>
#include "entity.hpp"

namespace ontology {

// The quarter turn spanned by a pole and a unit.
//
// The pole is an Infinite and picks the direction of the turn: applying
// the axis to n multiplies n by i for a positive pole and by -i for a
// negative one.  The unit is any number of magnitude exactly 1, taken
// into the complex plane, and seeds the cycle.  The generator is the
// unit turned once: (-im, re) for a positive pole, (im, -re) for a
// negative one.  With the real unit as the unit the generator is the
// imaginary unit.  Four turns bring any finite value back to itself.
class rotation_axis {
public:
  // Throws invalid_argument_error unless pole is an Infinite and unit
  // has magnitude 1.
  rotation_axis(entity const& pole, entity const& unit);

  entity operator()(entity const& n)const;

  entity const& pole()const { return pole_; }
  // The unit as a Complex.
  entity const& unit()const { return unit_; }
  entity const& generator()const { return generator_; }
  // i or -i
  entity const& turn()const { return turn_; }

  // unit, R(unit), R(R(unit)), ... five entries, so that the last one
  // closes the cycle.
  std::array<entity, 5> cycle()const;
private:
  entity pole_;
  entity unit_;
  entity turn_;
  entity generator_;
};

} /* end namespace ontology */

#endif
