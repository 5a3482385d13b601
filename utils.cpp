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

#include "utils.hpp"

#include <string.h>
#include <strings.h>
#include <ctype.h>
#include <sys/types.h> // for ssize_t, size_t etc.

#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <boost/archive/iterators/dataflow_exception.hpp>

using namespace lb;

// old-style C-formatted output into string object
void lb::string_format_v(std::string &aStringObj, bool aAppend, const char *aFormat, va_list aArgs)
{
  const size_t bufsiz=128;
  ssize_t actualsize;
  char buf[bufsiz];

  buf[0]='\0';
  if (!aAppend) aStringObj.erase();
  // vsnprintf() consumes aArgs, a second pass needs a copy
  va_list args;
  va_copy(args, aArgs);
  actualsize = vsnprintf(buf, bufsiz, aFormat, aArgs);
  if (actualsize>=(ssize_t)bufsiz) {
    // default buffer was too small, create bigger dynamic buffer
    char *bufP = new char[actualsize+1];
    actualsize = vsnprintf(bufP, actualsize+1, aFormat, args);
    if (actualsize>0) {
      aStringObj += bufP;
    }
    delete [] bufP;
  }
  else if (actualsize>=0) {
    aStringObj += buf;
  }
  va_end(args);
}


std::string lb::string_format(const char *aFormat, ...)
{
  va_list args;
  va_start(args, aFormat);
  std::string s;
  string_format_v(s, false, aFormat, args);
  va_end(args);
  return s;
}


void lb::string_format_append(std::string &aStringToAppendTo, const char *aFormat, ...)
{
  va_list args;
  va_start(args, aFormat);
  string_format_v(aStringToAppendTo, true, aFormat, args);
  va_end(args);
}


std::string lb::string_ftime(const char *aFormat, const struct tm *aTimeP)
{
  std::string s;
  string_ftime_append(s, aFormat, aTimeP);
  return s;
}


void lb::string_ftime_append(std::string &aStringToAppendTo, const char *aFormat, const struct tm *aTimeP)
{
  struct tm nowtime;
  if (aTimeP==NULL) {
    time_t t = time(NULL);
    localtime_r(&t, &nowtime);
    aTimeP = &nowtime;
  }
  const size_t bufsiz=42;
  char buf[bufsiz];
  if (strftime(buf, bufsiz, aFormat, aTimeP)==0) {
    // not enough buffer, assume a specifier does not expand to more than 5 times its size
    size_t n = strlen(aFormat)*5;
    char *bufP = new char[n];
    if (strftime(bufP, n, aFormat, aTimeP)>0) {
      aStringToAppendTo += bufP;
    }
    delete [] bufP;
  }
  else {
    aStringToAppendTo += buf;
  }
}


bool lb::string_fgetfile(FILE *aFile, string &aData)
{
  const size_t bufLen = 1024;
  char buf[bufLen];
  aData.clear();
  while (!feof(aFile)) {
    size_t n = fread(buf, 1, bufLen-1, aFile);
    if (n>0) {
      aData.append(buf, n);
    }
    else if (ferror(aFile)) {
      return false;
    }
  }
  return true;
}


const char *lb::nonNullCStr(const char *aNULLOrCStr)
{
  if (aNULLOrCStr==NULL) return "";
  return aNULLOrCStr;
}


bool lb::uequals(const string& aString, const char *aCmp)
{
  return strcasecmp(aString.c_str(), nonNullCStr(aCmp))==0;
}


bool lb::uequals(const string& aString, const string& aCmp)
{
  return strcasecmp(aString.c_str(), aCmp.c_str())==0;
}


string lb::lowerCase(const string &aString)
{
  string s;
  for (size_t i=0; i<aString.size(); i++) {
    s += (char)tolower((uint8_t)aString[i]);
  }
  return s;
}


string lb::trimWhiteSpace(const string &aString, bool aLeading, bool aTrailing)
{
  size_t n = aString.length();
  size_t s = 0;
  size_t e = n;
  if (aLeading) {
    while (s<n && isspace((uint8_t)aString[s])) ++s;
  }
  if (aTrailing) {
    while (e>s && isspace((uint8_t)aString[e-1])) --e;
  }
  return aString.substr(s,e-s);
}


bool lb::nextPart(const char *&aCursor, string &aPart, char aSeparator)
{
  const char *p = aCursor;
  if (!p || *p==0) return false; // no input or end of text -> no part
  char c;
  do {
    c = *p;
    if (c==0 || c==aSeparator) {
      aPart.assign(aCursor,p-aCursor);
      if (c==aSeparator) p++; // skip the separator
      aCursor = p; // start of next part or end of string
      return true;
    }
    ++p;
  } while (true);
}


void lb::splitHost(const char *aHostSpec, string *aHostName, uint16_t *aPortNumber)
{
  const char *p = aHostSpec;
  if (!p) return;
  const char *q = strchr(p,':');
  if (q) {
    // there is a port specification
    unsigned int port;
    if (sscanf(q+1,"%u", &port)==1 && port<=0xFFFF) {
      if (aPortNumber) *aPortNumber = (uint16_t)port;
    }
    if (aHostName) aHostName->assign(p,q-p);
  }
  else {
    if (aHostName) aHostName->assign(p);
  }
}


bool lb::hexToBinaryString(const char *aHexString, string &aBinary)
{
  aBinary.clear();
  uint8_t b = 0;
  bool firstNibble = true;
  char c;
  while ((c = *aHexString++)) {
    if (c=='-' || c==':' || isspace((uint8_t)c)) {
      if (!firstNibble) return false; // separator in the middle of a byte
      continue;
    }
    if (!isxdigit((uint8_t)c)) return false;
    uint8_t n = isdigit((uint8_t)c) ? (uint8_t)(c-'0') : (uint8_t)(toupper((uint8_t)c)-'A'+10);
    if (firstNibble) {
      b = n;
      firstNibble = false;
    }
    else {
      b = (uint8_t)((b<<4) | n);
      aBinary.append((char *)&b,1);
      firstNibble = true;
    }
  }
  return firstNibble;
}


string lb::binaryToHexString(const string &aBinaryString, char aSeparator)
{
  string s;
  size_t n = aBinaryString.size();
  for (size_t i=0; i<n; i++) {
    if (aSeparator && i!=0) s += aSeparator;
    string_format_append(s, "%02X", (uint8_t)aBinaryString[i]);
  }
  return s;
}


bool lb::base64ToBinaryString(const string &aBase64, string &aBinary)
{
  using namespace boost::archive::iterators;
  typedef transform_width<binary_from_base64<string::const_iterator>, 8, 6> Base64Decoder;

  aBinary.clear();
  string b64;
  for (size_t i=0; i<aBase64.size(); i++) {
    if (!isspace((uint8_t)aBase64[i])) b64 += aBase64[i];
  }
  if (b64.size()%4!=0) return false;
  size_t pad = 0;
  while (pad<2 && pad<b64.size() && b64[b64.size()-1-pad]=='=') pad++;
  // padding decodes as zero bits which are cut off afterwards
  for (size_t i=0; i<pad; i++) b64[b64.size()-1-i] = 'A';
  try {
    aBinary.assign(Base64Decoder(b64.begin()), Base64Decoder(b64.end()));
  }
  catch (dataflow_exception &e) {
    aBinary.clear();
    return false;
  }
  if (aBinary.size()<pad) return false;
  aBinary.erase(aBinary.size()-pad);
  return true;
}


double lb::limited(double aValue, double aMin, double aMax)
{
  if (aValue<aMin) return aMin;
  if (aValue>aMax) return aMax;
  return aValue;
}
