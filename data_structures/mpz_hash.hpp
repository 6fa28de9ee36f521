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

#ifndef ONTOLOGY_MPZ_HASH_HPP__
#define ONTOLOGY_MPZ_HASH_HPP__

#include <boost/functional/hash.hpp>
#include <gmpxx.h>

namespace ontology {

// Hashes the magnitude limb by limb, then the sign.
inline size_t hash_mpz(mpz_class const& a) {
  size_t seed = 0;
  const size_t limbs = mpz_size(a.get_mpz_t());
  for(size_t ia = 0; ia != limbs; ++ia) {
    boost::hash_combine(seed, mpz_getlimbn(a.get_mpz_t(), ia));
  }
  boost::hash_combine(seed, sgn(a));
  return seed;
}

} /* end namespace ontology */

#endif
