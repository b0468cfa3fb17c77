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

#pragma once

#include <cstdint>
#include <iosfwd>
#include <string_view>  // NOLINT

#include <fmt/format.h>

#include "fastbson/base/string_data.h"

namespace fastbson {

/**
 *  The complete list of valid BSON types. See also bsonspec.org.
 */
enum class BSONType : int {
    /** smaller than all other types */
    minKey = -1,
    /** end of object */
    eoo = 0,
    /** double precision floating point value */
    numberDouble = 1,
    /** character string, stored in utf8 */
    string = 2,
    /** an embedded object */
    object = 3,
    /** an embedded array */
    array = 4,
    /** binary data */
    binData = 5,
    /** (Deprecated) Undefined type */
    undefined = 6,
    /** ObjectId */
    oid = 7,
    /** boolean type */
    boolean = 8,
    /** date type */
    date = 9,
    /** null type */
    null = 10,
    /** regular expression, a pattern with options */
    regEx = 11,
    /** (Deprecated) a namespace string followed by an ObjectId */
    dbRef = 12,
    /** code type */
    code = 13,
    /** (Deprecated) a programming language (e.g., Python) symbol */
    symbol = 14,
    /** (Deprecated) javascript code with a scope document */
    codeWScope = 15,
    /** 32 bit signed integer */
    numberInt = 16,
    /** Two 32 bit unsigned integers */
    timestamp = 17,
    /** 64 bit integer */
    numberLong = 18,
    /** 128 bit decimal */
    numberDecimal = 19,
    /** larger than all other types */
    maxKey = 127
};

/**
 * returns the name of the argument's type
 */
const char* typeName(BSONType type);

/**
 * Prints the name of the argument's type to the given stream.
 */
std::ostream& operator<<(std::ostream& stream, BSONType type);

/**
 * Returns whether or not 'type' can be converted to a valid BSONType.
 */
bool isValidBSONType(int type);

/**
 * Interprets a raw type tag byte. The tag is signed on the wire so that 0xFF reads as minKey.
 * The result is only meaningful if isValidBSONType() accepts it.
 */
inline BSONType typeFromTagByte(char tag) {
    return static_cast<BSONType>(static_cast<signed char>(tag));
}

/**
 * Types whose payload is a length-prefixed UTF-8 string. getString() accepts all three.
 */
inline bool isStringLikeType(BSONType type) {
    return type == BSONType::string || type == BSONType::code || type == BSONType::symbol;
}

/* subtypes of BinData.
   bdtCustom and above are ones that the JS compiler understands, but are
   opaque to the database.
*/
enum BinDataType {
    BinDataGeneral = 0,
    Function = 1,
    ByteArrayDeprecated = 2, /* use BinGeneral instead */
    bdtUUID = 3,             /* deprecated */
    newUUID = 4,             /* language-independent UUID format across all drivers */
    MD5Type = 5,
    Encrypt = 6,   /* encryption placeholder or encrypted data */
    Column = 7,    /* compressed column */
    Sensitive = 8, /* data that should be redacted and protected from unnecessary exposure */
    Vector = 9,    /* A denser format of an array of numbers representing a vector */
    bdtCustom = 128
};

}  // namespace fastbson

template <>
struct fmt::formatter<fastbson::BSONType> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(fastbson::BSONType type, FormatContext& ctx) const {
        return fmt::formatter<std::string_view>::format(fastbson::typeName(type), ctx);
    }
};
