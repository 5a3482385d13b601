//  SPDX-License-Identifier: GPL-3.0-or-later
//
//  Copyright (c) 2013-2025 plan44.ch / Lukas Zeller, Zurich, Switzerland
//
//  Author: Lukas Zeller <luz@plan44.ch>
//
//  This file is part of ledbetter.
//
//  ledbetter is free software: you can redistribute it and/or modify
//  it under the terms of the GNU General Public License as published by
//  the Free Software Foundation, either version 3 of the License, or
//  (at your option) any later version.
//
//  ledbetter is distributed in the hope that it will be useful,
//  but WITHOUT ANY WARRANTY; without even the implied warranty of
//  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//  GNU General Public License for more details.
//
//  You should have received a copy of the GNU General Public License
//  along with ledbetter. If not, see <http://www.gnu.org/licenses/>.
//

#include "error.hpp"

#include <string.h>
#include <errno.h>

#include "utils.hpp"

using namespace lb;

// MARK: - error base class

Error::Error(ErrorCode aErrorCode) :
  mErrorCode(aErrorCode)
{
}


Error::Error(ErrorCode aErrorCode, const std::string &aErrorMessage) :
  mErrorCode(aErrorCode),
  mErrorMessage(aErrorMessage)
{
}


void Error::setFormattedMessage(const char *aFmt, va_list aArgs, bool aAppend)
{
  string_format_v(mErrorMessage, aAppend, aFmt, aArgs);
  mTextCache.clear();
}


void Error::prefixMessage(const char *aFmt, ...)
{
  string msg;
  va_list args;
  va_start(args, aFmt);
  string_format_v(msg, false, aFmt, args);
  va_end(args);
  mErrorMessage.insert(0, msg);
  mTextCache.clear();
}


ErrorPtr Error::withPrefix(const char *aFmt, ...)
{
  string msg;
  va_list args;
  va_start(args, aFmt);
  string_format_v(msg, false, aFmt, args);
  va_end(args);
  mErrorMessage.insert(0, msg);
  mTextCache.clear();
  return ErrorPtr(this);
}


const char *Error::domain()
{
  return "Error";
}


const char *Error::getErrorDomain() const
{
  return Error::domain();
}


const char *Error::getErrorMessage() const
{
  return mErrorMessage.c_str();
}


string Error::description() const
{
  string errorText = mErrorMessage;
  if (errorText.empty()) {
    errorText = isOK() ? "OK" : "Error";
  }
  #if ENABLE_NAMED_ERRORS
  const char *name = errorName();
  if (name) {
    // named error
    if (*name) string_format_append(errorText, " (%s::%s)", getErrorDomain(), name);
    return errorText;
  }
  #endif // ENABLE_NAMED_ERRORS
  string_format_append(errorText, " (%s:%ld)", getErrorDomain(), getErrorCode());
  return errorText;
}


const char* Error::text()
{
  mTextCache = description();
  return mTextCache.c_str();
}


bool Error::isError(const char *aDomain, ErrorCode aErrorCode) const
{
  return aErrorCode==mErrorCode && isDomain(aDomain);
}


bool Error::isError(ErrorPtr aError, const char *aDomain, ErrorCode aErrorCode)
{
  if (!aError) return false;
  return aError->isError(aDomain, aErrorCode);
}


bool Error::isDomain(const char *aDomain) const
{
  return aDomain==NULL || strcmp(aDomain, getErrorDomain())==0;
}


const char* Error::text(ErrorPtr aError)
{
  if (!aError) return "<none>";
  return aError->text();
}


ErrorPtr Error::ok(ErrorPtr aError)
{
  if (Error::notOK(aError)) return aError;
  return ErrorPtr(new Error(Error::OK));
}


// MARK: - system error

const char *SysError::domain()
{
  return "System";
}


const char *SysError::getErrorDomain() const
{
  return SysError::domain();
}


SysError::SysError(const char *aContextMessage) :
  Error(ErrorCode(errno), string(nonNullCStr(aContextMessage)).append(strerror(errno)))
{
}


SysError::SysError(int aErrNo, const char *aContextMessage) :
  Error(ErrorCode(aErrNo), string(nonNullCStr(aContextMessage)).append(strerror(aErrNo)))
{
}


ErrorPtr SysError::errNo(const char *aContextMessage)
{
  if (errno==0) return ErrorPtr(); // optimization
  return ErrorPtr(new SysError(aContextMessage));
}


ErrorPtr SysError::err(int aErrNo, const char *aContextMessage)
{
  if (aErrNo==0) return ErrorPtr(); // optimization
  return ErrorPtr(new SysError(aErrNo, aContextMessage));
}


// MARK: - text error

ErrorPtr TextError::err(const char *aFmt, ...)
{
  Error *errP = new TextError();
  va_list args;
  va_start(args, aFmt);
  errP->setFormattedMessage(aFmt, args, false);
  va_end(args);
  return ErrorPtr(errP);
}
