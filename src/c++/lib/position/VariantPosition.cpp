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

#include "position/VariantPosition.hpp"

#include "blt_util/blt_exception.hpp"
#include "blt_util/log.hpp"
#include "blt_util/parse_util.hpp"
#include "common/Exceptions.hpp"

#include <cstdlib>

#include <iostream>
#include <sstream>

//#define DEBUG_VARIANT_POSITION

namespace varpos {

/// report a match record which could not have come from matchPositionNotation
static void throwInconsistentMatch(const PositionNotationMatch& match, const char* reason)
{
  std::ostringstream oss;
  oss << "Inconsistent position notation match (" << reason << ") in " << match;
  log_os << "ERROR: " << oss.str() << "\n";
  BOOST_THROW_EXCEPTION(common::LogicException(oss.str()));
}

/// convert a captured number token ([1-9][0-9]*) to pos_t
static pos_t getCapturedNumber(const PositionNotationMatch& match, const std::string& token)
{
  const char* s(token.c_str());
  if ((*s < '1') || (*s > '9')) throwInconsistentMatch(match, "number token must start with 1-9");
  blt_util::skip_digits(s);
  if (s != (token.c_str() + token.size())) throwInconsistentMatch(match, "number token must be all digits");

  try {
    return blt_util::parse_int_str(token);
  } catch (const blt_exception&) {
    throwInconsistentMatch(match, "number out of range");
  }
  return 0;
}

static UTR_SIDE::index_t getUtrSide(const PositionNotationMatch& match)
{
  if (match.utrSymbol == '*') return UTR_SIDE::THREE_PRIME;
  if (match.utrSymbol != '-') throwInconsistentMatch(match, "UTR symbol must be '*' or '-'");
  return UTR_SIDE::FIVE_PRIME;
}

static pos_t getIntronicPosition(const PositionNotationMatch& match)
{
  if ((match.intronSign != '+') && (match.intronSign != '-')) {
    throwInconsistentMatch(match, "intron sign must be '+' or '-'");
  }
  const pos_t offset(getCapturedNumber(match, match.intronDigits));
  return ((match.intronSign == '-') ? -offset : offset);
}

VariantPosition::VariantPosition(const std::string& posStr) : VariantPosition(matchPositionNotation(posStr))
{
}

VariantPosition::VariantPosition(const PositionNotationMatch& match)
{
  using namespace POSITION_SHAPE;

  const bool isUtrShape((match.shape == UTR) || (match.shape == UTR_INTRONIC));
  const bool isIntronicShape((match.shape == INTRONIC) || (match.shape == UTR_INTRONIC));

  // captures of other shapes must be empty:
  if ((!isUtrShape) && (match.utrSymbol != '\0')) {
    throwInconsistentMatch(match, "UTR symbol set for a non-UTR shape");
  }
  if ((!isIntronicShape) && ((match.intronSign != '\0') || (!match.intronDigits.empty()))) {
    throwInconsistentMatch(match, "intronic offset set for a non-intronic shape");
  }

  switch (match.shape) {
  case SIMPLE:
    _position = getCapturedNumber(match, match.anchorDigits);
    break;
  case INTRONIC:
    _position         = getCapturedNumber(match, match.anchorDigits);
    _intronicPosition = getIntronicPosition(match);
    break;
  case UTR:
    _utr         = getUtrSide(match);
    _utrPosition = getCapturedNumber(match, match.anchorDigits);
    break;
  case UTR_INTRONIC:
    _utr              = getUtrSide(match);
    _utrPosition      = getCapturedNumber(match, match.anchorDigits);
    _intronicPosition = getIntronicPosition(match);
    break;
  default:
    throwInconsistentMatch(match, "unknown shape");
  }

#ifdef DEBUG_VARIANT_POSITION
  log_os << __FUNCTION__ << ": " << match << " -> " << *this << "\n";
#endif
}

bool VariantPosition::isAdjacent(const VariantPosition& rhs) const
{
  if (isExtended() || rhs.isExtended()) {
    std::ostringstream oss;
    oss << "Adjacency is only available for simple positions, can't compare " << *this << " and " << rhs;
    BOOST_THROW_EXCEPTION(common::FeatureNotAvailableException(oss.str()));
  }

  return (std::abs(*_position - *rhs._position) == 1);
}

/// compare two positions which are equal in all fields except (possibly) the intronic position
///
/// an unset intronic position is the anchor itself, which falls after all negative
/// and before all positive intronic positions at the same anchor
static bool isIntronicLess(const boost::optional<pos_t>& lhs, const boost::optional<pos_t>& rhs)
{
  if (lhs == rhs) return false;
  if (!lhs) return (*rhs < 0);
  if (!rhs) return (*lhs < 0);
  return (*lhs < *rhs);
}

/// 5' UTR < non-UTR < 3' UTR
static int getUtrRank(const boost::optional<UTR_SIDE::index_t>& utr)
{
  if (!utr) return 1;
  return ((*utr == UTR_SIDE::FIVE_PRIME) ? 0 : 2);
}

bool VariantPosition::operator<(const VariantPosition& rhs) const
{
  if (_utr != rhs._utr) {
    return (getUtrRank(_utr) < getUtrRank(rhs._utr));
  }

  if (_utr) {
    if (*_utrPosition != *rhs._utrPosition) return (*_utrPosition < *rhs._utrPosition);
  } else {
    if (*_position != *rhs._position) return (*_position < *rhs._position);
  }
  return isIntronicLess(_intronicPosition, rhs._intronicPosition);
}

template <typename T>
static void printOptional(std::ostream& os, const char* label, const boost::optional<T>& val)
{
  os << " " << label << ": ";
  if (val) {
    os << *val;
  } else {
    os << "NA";
  }
}

std::ostream& operator<<(std::ostream& os, const VariantPosition& vpos)
{
  os << "VariantPosition:";
  printOptional(os, "position", vpos.position());
  printOptional(os, "intronicPosition", vpos.intronicPosition());
  os << " utr: " << (vpos.utr() ? UTR_SIDE::label(*vpos.utr()) : "NA");
  printOptional(os, "utrPosition", vpos.utrPosition());
  return os;
}

}  // namespace varpos
