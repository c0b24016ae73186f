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

#include "boost/test/unit_test.hpp"

#include "common/Exceptions.hpp"
#include "position/PositionNotation.hpp"

#include <string>

BOOST_AUTO_TEST_SUITE(test_PositionNotation)

using namespace varpos;

BOOST_AUTO_TEST_CASE(test_PositionNotation_Simple)
{
  const PositionNotationMatch match(matchPositionNotation("1042"));
  BOOST_REQUIRE_EQUAL(match.shape, POSITION_SHAPE::SIMPLE);
  BOOST_REQUIRE_EQUAL(match.anchorDigits, "1042");
  BOOST_REQUIRE_EQUAL(match.utrSymbol, '\0');
  BOOST_REQUIRE_EQUAL(match.intronSign, '\0');
  BOOST_REQUIRE(match.intronDigits.empty());
}

BOOST_AUTO_TEST_CASE(test_PositionNotation_Intronic)
{
  const PositionNotationMatch plus(matchPositionNotation("88+7"));
  BOOST_REQUIRE_EQUAL(plus.shape, POSITION_SHAPE::INTRONIC);
  BOOST_REQUIRE_EQUAL(plus.anchorDigits, "88");
  BOOST_REQUIRE_EQUAL(plus.intronSign, '+');
  BOOST_REQUIRE_EQUAL(plus.intronDigits, "7");
  BOOST_REQUIRE_EQUAL(plus.utrSymbol, '\0');

  const PositionNotationMatch minus(matchPositionNotation("88-70"));
  BOOST_REQUIRE_EQUAL(minus.shape, POSITION_SHAPE::INTRONIC);
  BOOST_REQUIRE_EQUAL(minus.anchorDigits, "88");
  BOOST_REQUIRE_EQUAL(minus.intronSign, '-');
  BOOST_REQUIRE_EQUAL(minus.intronDigits, "70");
}

BOOST_AUTO_TEST_CASE(test_PositionNotation_Utr)
{
  const PositionNotationMatch fivePrime(matchPositionNotation("-12"));
  BOOST_REQUIRE_EQUAL(fivePrime.shape, POSITION_SHAPE::UTR);
  BOOST_REQUIRE_EQUAL(fivePrime.utrSymbol, '-');
  BOOST_REQUIRE_EQUAL(fivePrime.anchorDigits, "12");
  BOOST_REQUIRE_EQUAL(fivePrime.intronSign, '\0');

  const PositionNotationMatch threePrime(matchPositionNotation("*3"));
  BOOST_REQUIRE_EQUAL(threePrime.shape, POSITION_SHAPE::UTR);
  BOOST_REQUIRE_EQUAL(threePrime.utrSymbol, '*');
  BOOST_REQUIRE_EQUAL(threePrime.anchorDigits, "3");
}

BOOST_AUTO_TEST_CASE(test_PositionNotation_UtrIntronic)
{
  const PositionNotationMatch match(matchPositionNotation("-12-3"));
  BOOST_REQUIRE_EQUAL(match.shape, POSITION_SHAPE::UTR_INTRONIC);
  BOOST_REQUIRE_EQUAL(match.utrSymbol, '-');
  BOOST_REQUIRE_EQUAL(match.anchorDigits, "12");
  BOOST_REQUIRE_EQUAL(match.intronSign, '-');
  BOOST_REQUIRE_EQUAL(match.intronDigits, "3");

  const PositionNotationMatch match2(matchPositionNotation("*110+29"));
  BOOST_REQUIRE_EQUAL(match2.shape, POSITION_SHAPE::UTR_INTRONIC);
  BOOST_REQUIRE_EQUAL(match2.utrSymbol, '*');
  BOOST_REQUIRE_EQUAL(match2.anchorDigits, "110");
  BOOST_REQUIRE_EQUAL(match2.intronSign, '+');
  BOOST_REQUIRE_EQUAL(match2.intronDigits, "29");
}

BOOST_AUTO_TEST_CASE(test_PositionNotation_Rejected)
{
  using common::InvalidPositionSyntaxException;

  static const char* const badStrings[] = {"",     "12a",  "0",     "+5",    "12++5", "**3",  "-",
                                           "*",    "12+",  "12-",   "012",   "00",    "-0",   "*01",
                                           "12+0", "12-05", "+*12", "*-12",  "12*",   "12+3+4", " 12",
                                           "12 ",  "1.5",  "c.12", "-12+-3", "12--3", "*12*3"};

  for (const char* badString : badStrings) {
    BOOST_REQUIRE_THROW(matchPositionNotation(badString), InvalidPositionSyntaxException);
  }
}

BOOST_AUTO_TEST_CASE(test_PositionNotation_EmbeddedNull)
{
  const std::string withNull("12\0" "3", 4);
  BOOST_REQUIRE_THROW(matchPositionNotation(withNull), common::InvalidPositionSyntaxException);
}

BOOST_AUTO_TEST_CASE(test_PositionNotation_NumberRange)
{
  using common::InvalidPositionSyntaxException;

  BOOST_REQUIRE_EQUAL(matchPositionNotation("2147483647").anchorDigits, "2147483647");
  BOOST_REQUIRE_THROW(matchPositionNotation("2147483648"), InvalidPositionSyntaxException);
  BOOST_REQUIRE_THROW(matchPositionNotation("99999999999"), InvalidPositionSyntaxException);
  BOOST_REQUIRE_THROW(matchPositionNotation("12+99999999999"), InvalidPositionSyntaxException);
  BOOST_REQUIRE_THROW(matchPositionNotation("*99999999999999999999999"), InvalidPositionSyntaxException);
}

BOOST_AUTO_TEST_CASE(test_PositionNotation_ErrorCarriesString)
{
  try {
    matchPositionNotation("12++5");
    BOOST_FAIL("expected InvalidPositionSyntaxException");
  } catch (const common::InvalidPositionSyntaxException& e) {
    BOOST_REQUIRE_EQUAL(e.getPositionString(), "12++5");
    const std::string* info(boost::get_error_info<common::PositionStringInfo>(e));
    BOOST_REQUIRE(info != nullptr);
    BOOST_REQUIRE_EQUAL(*info, "12++5");
    BOOST_REQUIRE(std::string(e.what()).find("'12++5'") != std::string::npos);
  }
}

BOOST_AUTO_TEST_SUITE_END()
