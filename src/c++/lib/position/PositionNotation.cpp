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

#include "position/PositionNotation.hpp"

#include "blt_util/blt_exception.hpp"
#include "blt_util/log.hpp"
#include "blt_util/parse_util.hpp"
#include "common/Exceptions.hpp"

#include <iostream>
#include <sstream>

//#define DEBUG_POSITION_NOTATION

namespace varpos {

static void throwInvalidSyntax(const std::string& posStr, const char* reason)
{
  using namespace varpos::common;

  std::ostringstream oss;
  oss << "Invalid variant position string '" << posStr << "': " << reason;
  BOOST_THROW_EXCEPTION(InvalidPositionSyntaxException(posStr, oss.str()));
}

/// consume a number token ([1-9][0-9]*) from s and copy it to token
///
/// \return false without consuming anything if s does not start with a number token
static bool scanNumberToken(const char*& s, std::string& token)
{
  if ((*s < '1') || (*s > '9')) return false;

  const char* const begin(s);
  ++s;
  blt_util::skip_digits(s);
  token.assign(begin, s);
  return true;
}

/// verify that a number token can be stored in pos_t
static void checkNumberRange(const std::string& posStr, const std::string& token)
{
  try {
    blt_util::parse_int_str(token);
  } catch (const blt_exception&) {
    throwInvalidSyntax(posStr, "number out of range");
  }
}

PositionNotationMatch matchPositionNotation(const std::string& posStr)
{
  PositionNotationMatch match;

  const char*       s(posStr.c_str());
  const char* const end(s + posStr.size());

  if ((*s == '*') || (*s == '-')) {
    match.utrSymbol = *s;
    ++s;
  }

  if (!scanNumberToken(s, match.anchorDigits)) {
    throwInvalidSyntax(posStr, "expected a position number");
  }

  if ((*s == '+') || (*s == '-')) {
    match.intronSign = *s;
    ++s;
    if (!scanNumberToken(s, match.intronDigits)) {
      throwInvalidSyntax(posStr, "expected an intronic offset after the sign");
    }
  }

  // also catches embedded null characters:
  if (s != end) {
    throwInvalidSyntax(posStr, "unexpected trailing characters");
  }

  checkNumberRange(posStr, match.anchorDigits);
  if (match.intronSign != '\0') checkNumberRange(posStr, match.intronDigits);

  using namespace POSITION_SHAPE;
  if (match.utrSymbol != '\0') {
    match.shape = ((match.intronSign != '\0') ? UTR_INTRONIC : UTR);
  } else {
    match.shape = ((match.intronSign != '\0') ? INTRONIC : SIMPLE);
  }

#ifdef DEBUG_POSITION_NOTATION
  log_os << __FUNCTION__ << ": '" << posStr << "' " << match << "\n";
#endif

  return match;
}

std::ostream& operator<<(std::ostream& os, const PositionNotationMatch& match)
{
  os << "PositionNotationMatch: " << POSITION_SHAPE::label(match.shape) << " anchor: " << match.anchorDigits;
  if (match.utrSymbol != '\0') os << " utrSymbol: " << match.utrSymbol;
  if (match.intronSign != '\0') os << " intron: " << match.intronSign << match.intronDigits;
  return os;
}

}  // namespace varpos
