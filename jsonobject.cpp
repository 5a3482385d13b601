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

#include "jsonobject.hpp"

using namespace lb;


// MARK: - constructors / destructor

// construct from raw json_object, passing ownership
JsonObject::JsonObject(struct json_object *aObjPassingOwnership) :
  mJson_obj(aObjPassingOwnership)
{
}


// construct empty
JsonObject::JsonObject() :
  mJson_obj(json_object_new_object())
{
}


JsonObject::~JsonObject()
{
  if (mJson_obj) {
    json_object_put(mJson_obj);
    mJson_obj = NULL;
  }
}


// MARK: - parsing text and files

// removes C style block and line comments outside of JSON strings
static string stripComments(const char *aText, size_t aLen)
{
  string out;
  bool inString = false;
  size_t i = 0;
  while (i<aLen) {
    char c = aText[i];
    if (inString) {
      out += c;
      if (c=='\\' && i+1<aLen) { out += aText[++i]; }
      else if (c=='"') inString = false;
      i++;
      continue;
    }
    if (c=='"') inString = true;
    else if (c=='/' && i+1<aLen && aText[i+1]=='*') {
      i += 2;
      while (i+1<aLen && !(aText[i]=='*' && aText[i+1]=='/')) {
        // keep line structure for error positions
        if (aText[i]=='\n') out += '\n';
        i++;
      }
      i += 2;
      continue;
    }
    else if (c=='/' && i+1<aLen && aText[i+1]=='/') {
      while (i<aLen && aText[i]!='\n') i++;
      continue;
    }
    out += c;
    i++;
  }
  return out;
}


JsonObjectPtr JsonObject::objFromText(const char *aJsonText, ssize_t aMaxChars, ErrorPtr *aErrorP, bool aAllowCComments)
{
  JsonObjectPtr obj;
  if (aMaxChars<0) aMaxChars = (ssize_t)strlen(aJsonText);
  string text;
  if (aAllowCComments) text = stripComments(aJsonText, (size_t)aMaxChars);
  else text.assign(aJsonText, (size_t)aMaxChars);
  struct json_tokener* tokener = json_tokener_new();
  struct json_object *o = json_tokener_parse_ex(tokener, text.c_str(), (int)text.size());
  JsonError::ErrorCodes jerr = json_tokener_get_error(tokener);
  size_t end = (size_t)tokener->char_offset;
  if (!o && jerr==json_tokener_continue) {
    end = text.size(); // all text consumed
    // pass a null char explicitly to indicate end of JSON, so "unexpected end" errors can actually occur
    o = json_tokener_parse_ex(tokener, "", 1);
    jerr = json_tokener_get_error(tokener);
  }
  if (o) {
    // anything but whitespace after the JSON value makes the text invalid
    while (end<text.size() && isspace((uint8_t)text[end])) end++;
    if (end<text.size()) {
      json_object_put(o);
      o = NULL;
      jerr = json_tokener_error_parse_unexpected;
    }
    else {
      obj = JsonObject::newObj(o);
    }
  }
  else if (jerr==json_tokener_success) {
    // only whitespace, or the literal null
    jerr = json_tokener_error_parse_eof;
    size_t p = 0;
    while (p<text.size() && isspace((uint8_t)text[p])) p++;
    if (text.compare(p, 4, "null")==0) {
      obj = JsonObject::newNull();
    }
  }
  if (!obj && aErrorP) {
    // report position as line and column
    int line = 1;
    size_t col = 1;
    size_t errPos = end;
    for (size_t i=0; i<errPos && i<text.size(); i++) {
      if (text[i]=='\n') { line++; col = 1; }
      else col++;
    }
    *aErrorP = ErrorPtr(new JsonError(jerr));
    (*aErrorP)->prefixMessage("in line %d at char %zu: ", line, col);
  }
  json_tokener_free(tokener);
  return obj;
}


JsonObjectPtr JsonObject::objFromFile(const char *aJsonFilePath, ErrorPtr *aErrorP, bool aAllowCComments)
{
  FILE *f = fopen(aJsonFilePath, "r");
  if (!f) {
    if (aErrorP) {
      *aErrorP = SysError::errNo();
      (*aErrorP)->prefixMessage("JSON reader cannot open file '%s': ", aJsonFilePath);
    }
    return JsonObjectPtr();
  }
  string data;
  bool ok = string_fgetfile(f, data);
  fclose(f);
  if (!ok) {
    if (aErrorP) {
      *aErrorP = SysError::errNo();
      (*aErrorP)->prefixMessage("JSON reader cannot read file '%s': ", aJsonFilePath);
    }
    return JsonObjectPtr();
  }
  ErrorPtr err;
  JsonObjectPtr obj = objFromText(data.c_str(), (ssize_t)data.size(), &err, aAllowCComments);
  if (Error::notOK(err)) {
    err->prefixMessage("file '%s' ", aJsonFilePath);
    if (aErrorP) *aErrorP = err;
  }
  return obj;
}


// MARK: - type

json_type JsonObject::type() const
{
  return json_object_get_type(mJson_obj);
}


bool JsonObject::isType(json_type aRefType) const
{
  return json_object_is_type(mJson_obj, aRefType);
}


bool JsonObject::isNumber() const
{
  return isType(json_type_int) || isType(json_type_double);
}


// MARK: - conversion to string

const char *JsonObject::json_c_str(int aFlags)
{
  return json_object_to_json_string_ext(mJson_obj, aFlags);
}


string JsonObject::json_str(int aFlags)
{
  return string(json_c_str(aFlags));
}


// MARK: - add and get by key

void JsonObject::add(const char* aKey, JsonObjectPtr aObj)
{
  // json_object_object_add takes over one reference, but the object still belongs to aObj as well
  json_object_object_add(mJson_obj, aKey, aObj ? json_object_get(aObj->mJson_obj) : NULL);
}


bool JsonObject::get(const char *aKey, JsonObjectPtr &aJsonObject, bool aNonNull)
{
  json_object *weakObjRef = NULL;
  if (json_object_object_get_ex(mJson_obj, aKey, &weakObjRef)) {
    if (weakObjRef==NULL) {
      if (aNonNull) return false;
      aJsonObject = JsonObjectPtr();
    }
    else {
      // claim ownership as json_object_object_get_ex does not do that automatically
      aJsonObject = newObj(json_object_get(weakObjRef));
    }
    return true;
  }
  return false; // key does not exist, aJsonObject unchanged
}


JsonObjectPtr JsonObject::get(const char *aKey)
{
  JsonObjectPtr p;
  get(aKey, p);
  return p;
}


// MARK: - arrays

int JsonObject::arrayLength() const
{
  if (type()!=json_type_array) return 0;
  return (int)json_object_array_length(mJson_obj);
}


JsonObjectPtr JsonObject::arrayGet(int aAtIndex)
{
  if (aAtIndex<0 || aAtIndex>=arrayLength()) return JsonObjectPtr();
  json_object *weakObjRef = json_object_array_get_idx(mJson_obj, (size_t)aAtIndex);
  if (!weakObjRef) return JsonObjectPtr();
  return newObj(json_object_get(weakObjRef));
}


// MARK: - object keys

int JsonObject::numKeys()
{
  if (!isType(json_type_object)) return 0;
  return json_object_object_length(mJson_obj);
}


// MARK: - factories and value getters

JsonObjectPtr JsonObject::newObj(struct json_object *aObjPassingOwnership)
{
  return JsonObjectPtr(new JsonObject(aObjPassingOwnership));
}


JsonObjectPtr JsonObject::newObj()
{
  return JsonObjectPtr(new JsonObject());
}


JsonObjectPtr JsonObject::newNull()
{
  // a plain C NULL pointer represents null in json-c
  return JsonObjectPtr(new JsonObject(NULL));
}


JsonObjectPtr JsonObject::newBool(bool aBool)
{
  return newObj(json_object_new_boolean(aBool));
}


bool JsonObject::boolValue() const
{
  // json_object_get_boolean() returns false for arrays and objects in some json-c versions
  json_type t = json_object_get_type(mJson_obj);
  if (t==json_type_object || t==json_type_array) return true;
  return json_object_get_boolean(mJson_obj);
}


JsonObjectPtr JsonObject::newInt32(int32_t aInt32)
{
  return newObj(json_object_new_int(aInt32));
}


JsonObjectPtr JsonObject::newInt64(int64_t aInt64)
{
  return newObj(json_object_new_int64(aInt64));
}


int32_t JsonObject::int32Value() const
{
  return json_object_get_int(mJson_obj);
}


int64_t JsonObject::int64Value() const
{
  return json_object_get_int64(mJson_obj);
}


JsonObjectPtr JsonObject::newDouble(double aDouble)
{
  return newObj(json_object_new_double(aDouble));
}


double JsonObject::doubleValue() const
{
  return json_object_get_double(mJson_obj);
}


JsonObjectPtr JsonObject::newString(const char *aCStr)
{
  if (!aCStr) return JsonObjectPtr();
  return newObj(json_object_new_string(aCStr));
}


JsonObjectPtr JsonObject::newString(const string &aString, bool aEmptyIsNull)
{
  if (aEmptyIsNull && aString.empty()) return JsonObjectPtr();
  return newObj(json_object_new_string_len(aString.c_str(), (int)aString.size()));
}


const char *JsonObject::c_strValue() const
{
  return json_object_get_string(mJson_obj);
}


size_t JsonObject::stringLength() const
{
  return (size_t)json_object_get_string_len(mJson_obj);
}


string JsonObject::stringValue() const
{
  const char *s = c_strValue();
  if (!s) return "";
  return string(s, stringLength());
}
