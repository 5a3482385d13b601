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

#ifndef __ledbetter__jsonobject__
#define __ledbetter__jsonobject__

#include "ledbetter_common.hpp"

#include <json-c/json.h>

using namespace std;

namespace lb {

  /// JSON parsing errors, codes are json-c's tokener errors
  class JsonError : public Error
  {
  public:
    typedef enum json_tokener_error ErrorCodes;

    static const char *domain() { return "JsonObject"; }
    virtual const char *getErrorDomain() const LB_OVERRIDE { return JsonError::domain(); };
    JsonError(ErrorCodes aError) : Error(ErrorCode(aError), json_tokener_error_desc(aError)) {};
  };


  class JsonObject;

  /// smart pointer to JsonObject
  typedef boost::intrusive_ptr<JsonObject> JsonObjectPtr;

  /// wrapper around json-c / libjson0 object
  class JsonObject : public LBObj
  {
    struct json_object *mJson_obj; ///< the json-c object

    /// construct object as wrapper of json-c json_object.
    /// @param aObjPassingOwnership json_object, ownership is passed into this JsonObject, caller looses ownership!
    JsonObject(struct json_object *aObjPassingOwnership);

    /// construct empty object
    JsonObject();

    JsonObject(const JsonObject& aObj); ///< no copying
    JsonObject& operator=(const JsonObject& aObj); ///< no assignment

  public:

    virtual ~JsonObject();

    /// factory to return smart pointer to new wrapper of a newly created json_object
    /// @param aObjPassingOwnership json_object, ownership is passed into this JsonObject, caller looses ownership!
    static JsonObjectPtr newObj(struct json_object *aObjPassingOwnership);

    /// get type
    /// @return type code
    json_type type() const;

    /// check type
    /// @param aRefType type to check for
    /// @return true if object matches given type
    bool isType(json_type aRefType) const;

    /// @return true if this is a JSON number, integer or not
    bool isNumber() const;

    /// get as JSON string
    /// @param aFlags JSON_C_TO_STRING_xxx flags
    /// @return JSON string representation of object.
    const char *json_c_str(int aFlags=0);
    string json_str(int aFlags=0);

    /// add object for key
    void add(const char* aKey, JsonObjectPtr aObj);

    /// get object by key
    /// @param aKey key of object
    /// @return the value of the object, NULL if key does not exist OR value is the JSON null
    JsonObjectPtr get(const char *aKey);

    /// get object by key
    /// @param aKey key of object
    /// @param aJsonObject will be set to the value of the object, NULL for JSON null
    /// @param aNonNull if set, the result is only true if the key exists AND has a non-null value
    /// @return true if key exists (and is not null if aNonNull is set)
    bool get(const char *aKey, JsonObjectPtr &aJsonObject, bool aNonNull = false);

    /// get array length
    /// @return length of array. Returns 0 for empty arrays and all non-array objects
    int arrayLength() const;

    /// get from a specific position in the array
    /// @return NULL if index out of range
    JsonObjectPtr arrayGet(int aAtIndex);

    /// @return number of keys in an object, 0 for all other types
    int numKeys();

    /// create new empty object
    static JsonObjectPtr newObj();

    /// create new NULL object (does not embed a real JSON-C object, just a NULL pointer)
    static JsonObjectPtr newNull();

    /// create new object from text
    /// @param aJsonText the text to parse
    /// @param aMaxChars max number of chars to parse from aJsonText, or -1 if entire text should be parsed
    /// @param aErrorP if set, a parsing error will be stored here
    /// @param aAllowCComments if set, C style comments are skipped
    /// @return NULL if parsing fails
    static JsonObjectPtr objFromText(const char *aJsonText, ssize_t aMaxChars = -1, ErrorPtr *aErrorP = NULL, bool aAllowCComments = false);

    /// create new object from file
    /// @param aJsonFilePath the path of the file to read and parse
    /// @param aErrorP if set, a parsing or file error will be stored here
    /// @param aAllowCComments if set, C style comments are skipped
    /// @return NULL if reading or parsing fails
    static JsonObjectPtr objFromFile(const char *aJsonFilePath, ErrorPtr *aErrorP = NULL, bool aAllowCComments = false);

    static JsonObjectPtr newBool(bool aBool);
    bool boolValue() const;

    static JsonObjectPtr newInt32(int32_t aInt32);
    static JsonObjectPtr newInt64(int64_t aInt64);
    int32_t int32Value() const;
    int64_t int64Value() const;

    static JsonObjectPtr newDouble(double aDouble);
    double doubleValue() const;

    static JsonObjectPtr newString(const char *aCStr);
    static JsonObjectPtr newString(const string &aString, bool aEmptyIsNull = false);
    const char* c_strValue() const;
    size_t stringLength() const;
    string stringValue() const;

  };

} // namespace lb

#endif /* defined(__ledbetter__jsonobject__) */
