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

#ifndef ONTOLOGY_CONFIG_HPP__
#define ONTOLOGY_CONFIG_HPP__

#include <climits>
#include <iostream>
#include <stdexcept>
#include <string>

// Build-time knobs.  The CMake cache options of the same names
// override these.

// Largest exponent handed directly to mpz_pow_ui; larger ones are
// computed in chunks of this size.
#ifndef ONTOLOGY_DIRECT_POW_CEILING
#define ONTOLOGY_DIRECT_POW_CEILING ULONG_MAX
#endif

// Depth of the series that produce the Pi and E constants.
#ifndef ONTOLOGY_SERIES_TERMS
#define ONTOLOGY_SERIES_TERMS 100
#endif

#ifndef ONTOLOGY_TRACE_CONSTANTS
#define ONTOLOGY_TRACE_CONSTANTS 0
#endif

#define LOG std::cerr

namespace ontology {

// A caller handed us something we cannot accept: an absent member,
// a negative natural, a payload outside its kind.
struct invalid_argument_error : public std::invalid_argument {
  explicit invalid_argument_error(std::string const& what) : std::invalid_argument(what) {}
};

// A caller tried to push a value off the only sign its kind admits.
struct domain_violation_error : public std::domain_error {
  explicit domain_violation_error(std::string const& what) : std::domain_error(what) {}
};

// A value is too big for GMP to hold at all.
struct representation_error : public std::length_error {
  explicit representation_error(std::string const& what) : std::length_error(what) {}
};

} /* end namespace ontology */

[[noreturn]] inline void caller_error(const char* error) {
  throw ontology::invalid_argument_error(error);
}
inline void caller_error_if(bool cond, const char* error) {
  if(cond) { caller_error(error); }
}
inline void caller_correct_if(bool cond, const char* error) {
  if(!cond) { caller_error(error); }
}

inline void sign_domain_error_if(bool cond, const char* error) {
  if(cond) { throw ontology::domain_violation_error(error); }
}

#endif
