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

/**
 ** \file
 ** \brief Declaration of the common exception mechanism.
 **
 ** All exceptions must carry the same data (independently of the
 ** exception type) to homogenize the reporting and processing of
 ** errors.
 **
 **/

#pragma once

#include "blt_util/thirdparty_push.h"

#include "boost/cerrno.hpp"
#include "boost/exception/all.hpp"
#include "boost/throw_exception.hpp"

#include "blt_util/thirdparty_pop.h"

#include <stdexcept>
#include <string>

namespace varpos {
namespace common {

/// the offending position string of a failed position parse, attached to
/// InvalidPositionSyntaxException
typedef boost::error_info<struct position_string_info, std::string> PositionStringInfo;

/// \brief Virtual base class to all the exception classes
///
/// Use BOOST_THROW_EXCEPTION to get the context info (file, function, line)
/// at the throw site.
///
class ExceptionData : public boost::exception {
public:
  ExceptionData(const std::string& message, const int errorNumber = 0)
    : boost::exception(), _message(message), _errorNumber(errorNumber)
  {
  }

  ExceptionData(const ExceptionData&) = default;
  ExceptionData& operator=(const ExceptionData&) = delete;

  const std::string& getMessage() const { return _message; }

  int getErrorNumber() const { return _errorNumber; }

  std::string getContext() const;

private:
  const std::string _message;
  const int         _errorNumber;
};

/// A general purpose exception type
///
/// Use BOOST_THROW_EXCEPTION to get the context info (file, function, line)
/// at the throw site as follows:
///
///     BOOST_THROW_EXCEPTION(GeneralException("Error message"));
///
class GeneralException : public std::logic_error, public ExceptionData {
public:
  explicit GeneralException(const std::string& message, const int errorNumber = 0)
    : std::logic_error(message), ExceptionData(message, errorNumber)
  {
  }
};

/// \brief Thrown when an internal invariant is violated
///
/// This signals a programming defect, never a problem with user input.
///
class LogicException : public std::logic_error, public ExceptionData {
public:
  explicit LogicException(const std::string& message)
    : std::logic_error(message), ExceptionData(message, EPERM)
  {
  }
};

/// \brief Thrown when the requested functionality is not available.
///
class FeatureNotAvailableException : public std::logic_error, public ExceptionData {
public:
  explicit FeatureNotAvailableException(const std::string& message)
    : std::logic_error(message), ExceptionData(message, ENOSYS)
  {
  }
};

/// \brief Thrown when a string does not conform to the variant position notation
///
/// The offending string is available from getPositionString() and is also
/// attached to the exception as PositionStringInfo.
///
class InvalidPositionSyntaxException : public std::invalid_argument, public ExceptionData {
public:
  InvalidPositionSyntaxException(const std::string& positionString, const std::string& message);

  const std::string& getPositionString() const { return _positionString; }

private:
  const std::string _positionString;
};

}  // namespace common
}  // namespace varpos
