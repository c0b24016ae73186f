//
// Varpos - Variant Position Notation Library
// Copyright (c) 2013-2019 Illumina, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
//

/// \file
///

#pragma once

#include <string>

namespace varpos {
namespace blt_util {

/// advance s over a (possibly empty) run of decimal digits
///
/// \return the number of digits consumed
unsigned skip_digits(const char*& s);

/// parse c-string to int
///
/// tolerates a non-int suffix, but a non-empty prefix must be parsable as an int,
/// on completion the value of s will reflect the extent of the parse
///
int parse_int(const char*& s);

/// parse c-string to int
///
/// similar to above but:
/// - entire string must be convertible, no trailing suffix is allowed
/// - appropriate for rvalue char pointers
///
int parse_int_rvalue(const char* s);

/// parse std::string to int
///
/// entire string must be convertible, no trailing suffix is allowed
///
int parse_int_str(const std::string& s);

}  // namespace blt_util
}  // namespace varpos
