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

#include "rotation_axis.hpp"
#include "numbers.hpp"

namespace ontology {

namespace {

complex_value unit_in_complex_plane(entity const& unit) {
  if(complex_value const* c = unit.get<complex_value>()) { return *c; }
  if(natural_complex_value const* c = unit.get<natural_complex_value>()) {
    return complex_value{c->re.get_d(), c->im.get_d()};
  }
  caller_correct_if(is_finite_number(unit), "a rotation unit must be a finite or structural number");
  return complex_value{scalar_value(unit), 0.0};
}

} /* end anonymous namespace */

rotation_axis::rotation_axis(entity const& pole, entity const& unit) {
  caller_correct_if(pole && pole.kind() == infinite_kind, "a rotation pole must be an Infinite");
  caller_correct_if(bool(unit), "a rotation axis needs a unit");
  const complex_value u = unit_in_complex_plane(unit);
  // Exactly 1, not merely close: the cycle has to close exactly.
  caller_correct_if(u.re * u.re + u.im * u.im == 1.0, "a rotation unit must have magnitude 1");

  pole_ = pole;
  unit_ = make_complex(u.re, u.im);
  if(pole.get<infinite_value>()->pole.is_positive()) {
    turn_ = make_complex(0.0, 1.0);
    generator_ = make_complex(-u.im, u.re);
  }
  else {
    turn_ = make_complex(0.0, -1.0);
    generator_ = make_complex(u.im, -u.re);
  }
}

entity rotation_axis::operator()(entity const& n)const {
  return multiply(turn_, n);
}

std::array<entity, 5> rotation_axis::cycle()const {
  std::array<entity, 5> result;
  result[0] = unit_;
  for(size_t i = 1; i < result.size(); ++i) {
    result[i] = (*this)(result[i - 1]);
  }
  return result;
}

} /* end namespace ontology */
