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
/// \brief Parsed variant position with support for the extended (intronic/UTR) syntax
///

#pragma once

#include "blt_util/blt_types.hpp"
#include "position/PositionNotation.hpp"

#include "blt_util/thirdparty_push.h"

#include "boost/operators.hpp"
#include "boost/optional.hpp"

#include "blt_util/thirdparty_pop.h"

#include <iosfwd>
#include <string>

namespace varpos {

namespace UTR_SIDE {

enum index_t { FIVE_PRIME, THREE_PRIME, SIZE };

inline const char* label(const index_t i)
{
  switch (i) {
  case FIVE_PRIME:
    return "5p";
  case THREE_PRIME:
    return "3p";
  default:
    return "UNKNOWN";
  }
}

}  // namespace UTR_SIDE

/// \brief a single position in a transcript or coding sequence
///
/// Positions are parsed from the variant position notation (see PositionNotation.hpp)
/// and hold the following optional fields:
///
/// position: the integer position, unset for UTR positions.
///
/// intronicPosition: the number of bases into the intron for intronic positions, never zero.
/// Bases towards the 5' end of the intron have a positive intronicPosition and their anchor is
/// the last base of the 5' exon. Bases towards the 3' end of the intron have a negative
/// intronicPosition and their anchor is the first base of the 3' exon.
///
/// utr: the side of the UTR for UTR positions ('-' is 5', '*' is 3').
///
/// utrPosition: the number of bases into the UTR for UTR positions.
///
/// Positions are totally ordered: 5' UTR < coding/non-UTR < 3' UTR, then by the
/// position (or UTR position), with intronic offsets resolving ties such that a bare
/// anchor sorts between its negative and positive intronic offsets.
///
class VariantPosition : private boost::totally_ordered<VariantPosition> {
public:
  /// \throws common::InvalidPositionSyntaxException for strings not in the position notation
  explicit VariantPosition(const std::string& posStr);

  /// build a position from an existing grammar match
  ///
  /// \throws common::LogicException if the match could not have been produced by
  /// matchPositionNotation (unknown shape, captures of another shape, malformed or zero numbers)
  explicit VariantPosition(const PositionNotationMatch& match);

  const boost::optional<pos_t>& position() const { return _position; }

  const boost::optional<pos_t>& intronicPosition() const { return _intronicPosition; }

  const boost::optional<UTR_SIDE::index_t>& utr() const { return _utr; }

  const boost::optional<pos_t>& utrPosition() const { return _utrPosition; }

  bool isUtr() const { return static_cast<bool>(_utr); }

  bool isIntronic() const { return static_cast<bool>(_intronicPosition); }

  /// true if the position was described with anything beyond the simple integer syntax
  bool isExtended() const { return (isIntronic() || isUtr()); }

  /// true if this and rhs are immediately adjacent bases in sequence space
  ///
  /// Only simple (non-extended) positions are supported. The last base of a transcript
  /// and the first base of its 3' UTR are never found adjacent, because sequence length
  /// is unknown here.
  ///
  /// \throws common::FeatureNotAvailableException if either position is extended
  bool isAdjacent(const VariantPosition& rhs) const;

  bool operator<(const VariantPosition& rhs) const;

  bool operator==(const VariantPosition& rhs) const
  {
    return ((_position == rhs._position) && (_intronicPosition == rhs._intronicPosition) &&
            (_utr == rhs._utr) && (_utrPosition == rhs._utrPosition));
  }

private:
  boost::optional<pos_t>             _position;
  boost::optional<pos_t>             _intronicPosition;
  boost::optional<UTR_SIDE::index_t> _utr;
  boost::optional<pos_t>             _utrPosition;
};

/// debug printer, this is not the position notation
std::ostream& operator<<(std::ostream& os, const VariantPosition& vpos);

}  // namespace varpos
