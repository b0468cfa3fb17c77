/**
 *    Copyright (C) 2018-present MongoDB, Inc.
 *
 *    This program is free software: you can redistribute it and/or modify
 *    it under the terms of the Server Side Public License, version 1,
 *    as published by MongoDB, Inc.
 *
 *    This program is distributed in the hope that it will be useful,
 *    but WITHOUT ANY WARRANTY; without even the implied warranty of
 *    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *    Server Side Public License for more details.
 *
 *    You should have received a copy of the Server Side Public License
 *    along with this program. If not, see
 *    <http://www.mongodb.com/licensing/server-side-public-license>.
 *
 *    As a special exception, the copyright holders give permission to link the
 *    code of portions of this program with the OpenSSL library under certain
 *    conditions as described in each individual source file and distribute
 *    linked combinations including the program with the OpenSSL library. You
 *    must comply with the Server Side Public License in all respects for
 *    all of the code used other than as permitted herein. If you modify file(s)
 *    with this exception, you may extend this exception to your version of the
 *    file(s), but you are not obligated to do so. If you do not wish to do so,
 *    delete this exception statement from your version. If you delete this
 *    exception statement from all source files in the program, then also delete
 *    it in the license file.
 */

#include "fastbson/bson/bsontypes.h"

#include <iterator>
#include <ostream>

namespace fastbson {

namespace {

// Indexed by tag for eoo through numberDecimal.
constexpr const char* kTypeNames[] = {
    "missing",             // eoo
    "double",              // numberDouble
    "string",              // string
    "object",              // object
    "array",               // array
    "binData",             // binData
    "undefined",           // undefined
    "objectId",            // oid
    "bool",                // boolean
    "date",                // date
    "null",                // null
    "regex",               // regEx
    "dbPointer",           // dbRef
    "javascript",          // code
    "symbol",              // symbol
    "javascriptWithScope", // codeWScope
    "int",                 // numberInt
    "timestamp",           // timestamp
    "long",                // numberLong
    "decimal",             // numberDecimal
};

constexpr int kLastOrdinaryTag = static_cast<int>(BSONType::numberDecimal);
static_assert(std::size(kTypeNames) == kLastOrdinaryTag + 1);

}  // namespace

const char* typeName(BSONType type) {
    if (type == BSONType::minKey)
        return "minKey";
    if (type == BSONType::maxKey)
        return "maxKey";
    if (!isValidBSONType(static_cast<int>(type)))
        return "invalid";
    return kTypeNames[static_cast<int>(type)];
}

std::ostream& operator<<(std::ostream& stream, BSONType type) {
    return stream << typeName(type);
}

bool isValidBSONType(int type) {
    return type == static_cast<int>(BSONType::minKey) ||
        type == static_cast<int>(BSONType::maxKey) || (type >= 0 && type <= kLastOrdinaryTag);
}

}  // namespace fastbson
