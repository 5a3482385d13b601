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

#ifndef __ledbetter__utils__
#define __ledbetter__utils__

#include "ledbetter_minimal.hpp"
#include "ledbetter_defs.hpp"

#include <string>
#include <stdarg.h>
#include <stdint.h>
#include <stdio.h>
#include <time.h>

#ifndef __printflike
#define __printflike(...)
#endif
#ifndef __strftimelike
#define __strftimelike(...)
#endif

using namespace std;

/// Basic utilities that DO NOT HAVE DEPENDENCIES on other ledbetter classes

namespace lb {

  /// printf-style format into string
  /// @param aFormat printf-style format string
  /// @param aStringObj string to receive formatted result
  /// @param aAppend if true, aStringObj will be appended to, otherwise contents will be replaced
  /// @param aArgs va_list of vprintf arguments
  void string_format_v(string &aStringObj, bool aAppend, const char *aFormat, va_list aArgs) __printflike(3,0);

  /// printf-style format into string
  /// @param aFormat printf-style format string
  /// @return formatted string
  string string_format(const char *aFormat, ...) __printflike(1,2);

  /// printf-style format appending to string
  /// @param aStringToAppendTo string to append formatted string to
  /// @param aFormat printf-style format string
  void string_format_append(string &aStringToAppendTo, const char *aFormat, ...) __printflike(2,3);

  /// strftime with output to string
  /// @param aFormat strftime-style format string
  /// @param aTimeP aTime time to format, or NULL for current local time
  /// @return formatted time string
  string string_ftime(const char *aFormat, const struct tm *aTimeP = NULL) __strftimelike(1);

  /// strftime appending to string
  void string_ftime_append(string &aStringToAppendTo, const char *aFormat, const struct tm *aTimeP = NULL) __strftimelike(2);

  /// get entire file into string
  /// @param aFile file open for read
  /// @param aData string to store data
  /// @return true if file could be read, false otherwise
  bool string_fgetfile(FILE *aFile, string &aData);

  /// always return a valid C String, if NULL is passed, an empty string is returned
  /// @param aNULLOrCStr NULL or C-String
  /// @return the input string if it is non-NULL, or an empty string
  const char *nonNullCStr(const char *aNULLOrCStr);

  /// convenience for case insensitive equaltest
  bool uequals(const string& aString, const char *aCmp);
  bool uequals(const string& aString, const string& aCmp);

  /// return simple (non locale aware) ASCII lowercase version of string
  /// @param aString string pinter
  /// @return lowercase (char by char tolower())
  string lowerCase(const string &aString);

  /// return string with trailimg and/or leading spaces removed
  /// @param aString a string
  /// @param aLeading if set, remove leading spaces
  /// @param aTrailing if set, remove trailing spaces
  /// @return trimmed string
  string trimWhiteSpace(const string &aString, bool aLeading = true, bool aTrailing = true);

  /// return next part from a separated string
  /// @param aCursor at entry, must point to the beginning of a string
  ///   After return, this is updated to point to next char following aSeparator or to end-of-string
  /// @param aPart the part found between aCursor and the next aSeparator (or end of string)
  /// @param aSeparator the separator char
  /// @return true if a part could be extracted, false if no more parts found
  bool nextPart(const char *&aCursor, string &aPart, char aSeparator);

  /// split host specification into hostname and port
  /// @param aHostSpec a host specification in the host[:port] format
  /// @param aHostName if not NULL, returns the host name/IP address, empty string if none
  /// @param aPortNumber if not NULL, returns the port number. Is left untouched if no port number is specified
  ///   (such that variable passed can be initialized with the default port to use beforehand)
  void splitHost(const char *aHostSpec, string *aHostName, uint16_t *aPortNumber);

  /// hex string to binary string conversion
  /// @param aHexString bytes string in hex notation, byte-separating dashes and colons allowed
  /// @param aBinary receives the binary string
  /// @return true if the entire input was valid hex, false otherwise
  bool hexToBinaryString(const char *aHexString, string &aBinary);

  /// binary string to hex string conversion
  /// @param aBinaryString binary string
  /// @param aSeparator character to be used to separate hex bytes, 0 for no separator
  /// @return hex string
  string binaryToHexString(const string &aBinaryString, char aSeparator = 0);

  /// base64 (RFC 4648, with padding) to binary string conversion
  /// @param aBase64 base64 encoded text, whitespace is ignored
  /// @param aBinary receives the decoded bytes
  /// @return true if aBase64 was valid
  bool base64ToBinaryString(const string &aBase64, string &aBinary);

  /// @return aValue, limited to be between and including aMin and aMax
  double limited(double aValue, double aMin, double aMax);

} // namespace lb

#endif /* defined(__ledbetter__utils__) */
