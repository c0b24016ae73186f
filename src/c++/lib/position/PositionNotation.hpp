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
/// \brief Grammar matcher for the variant position notation
///
/// A position string has exactly one of four shapes, where <num> is a decimal
/// number without leading zeros and without a bare zero ([1-9][0-9]*):
///
///     SIMPLE        <num>              "88"
///     INTRONIC      <num>[+-]<num>     "88+7", "88-7"
///     UTR           [*-]<num>          "*12", "-12"
///     UTR_INTRONIC  [*-]<num>[+-]<num> "*12+3", "-12-3"
///
/// The whole string must match a shape.
///

#pragma once

#include <iosfwd>
#include <string>

namespace varpos {

namespace POSITION_SHAPE {

enum index_t { SIMPLE, INTRONIC, UTR, UTR_INTRONIC, SIZE };

inline const char* label(const index_t i)
{
  switch (i) {
  case SIMPLE:
    return "simple";
  case INTRONIC:
    return "intronic";
  case UTR:
    return "utr";
  case UTR_INTRONIC:
    return "utr_intronic";
  default:
    return "unknown";
  }
}

}  // namespace POSITION_SHAPE

/// \brief raw result of matching a string against the position notation grammar
///
/// Only the captures used by the matched shape are populated, all others stay
/// at their empty values:
/// - utrSymbol is '*' or '-' for the UTR shapes, '\0' otherwise
/// - anchorDigits is the first number (position or UTR offset), always set
/// - intronSign is '+' or '-' for the intronic shapes, '\0' otherwise
/// - intronDigits is the unsigned intronic offset for the intronic shapes
///
struct PositionNotationMatch {
  PositionNotationMatch() : shape(POSITION_SHAPE::SIZE), utrSymbol('\0'), intronSign('\0') {}

  POSITION_SHAPE::index_t shape;
  char                    utrSymbol;
  std::string             anchorDigits;
  char                    intronSign;
  std::string             intronDigits;
};

/// match posStr against the position notation grammar
///
/// Every digit run in the returned match is guaranteed to fit in pos_t.
///
/// \throws common::InvalidPositionSyntaxException if posStr does not match any
/// shape or a number is too large to represent
PositionNotationMatch matchPositionNotation(const std::string& posStr);

std::ostream& operator<<(std::ostream& os, const PositionNotationMatch& match);

}  // namespace varpos
