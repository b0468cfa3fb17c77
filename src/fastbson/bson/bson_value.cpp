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

#include "fastbson/bson/bson_value.h"

#include <cstring>
#include <ostream>
#include <type_traits>

#include "fastbson/bson/document.h"

namespace fastbson {

namespace {

template <typename T>
struct BSONTypeOf;

#define FASTBSON_BSON_TYPE_OF(cppType, bsonType)                \
    template <>                                                 \
    struct BSONTypeOf<cppType> {                                \
        static constexpr BSONType value = BSONType::bsonType;   \
    };

FASTBSON_BSON_TYPE_OF(BSONNull, null)
FASTBSON_BSON_TYPE_OF(BSONUndefined, undefined)
FASTBSON_BSON_TYPE_OF(MinKey, minKey)
FASTBSON_BSON_TYPE_OF(MaxKey, maxKey)
FASTBSON_BSON_TYPE_OF(double, numberDouble)
FASTBSON_BSON_TYPE_OF(StringData, string)
FASTBSON_BSON_TYPE_OF(DocumentPtr, object)
FASTBSON_BSON_TYPE_OF(ArrayPtr, array)
FASTBSON_BSON_TYPE_OF(BSONBinData, binData)
FASTBSON_BSON_TYPE_OF(OID, oid)
FASTBSON_BSON_TYPE_OF(bool, boolean)
FASTBSON_BSON_TYPE_OF(Date_t, date)
FASTBSON_BSON_TYPE_OF(BSONRegEx, regEx)
FASTBSON_BSON_TYPE_OF(BSONDBRef, dbRef)
FASTBSON_BSON_TYPE_OF(BSONCode, code)
FASTBSON_BSON_TYPE_OF(BSONSymbol, symbol)
FASTBSON_BSON_TYPE_OF(BSONCodeWScope, codeWScope)
FASTBSON_BSON_TYPE_OF(std::int32_t, numberInt)
FASTBSON_BSON_TYPE_OF(Timestamp, timestamp)
FASTBSON_BSON_TYPE_OF(std::int64_t, numberLong)
FASTBSON_BSON_TYPE_OF(Decimal128, numberDecimal)

#undef FASTBSON_BSON_TYPE_OF

bool sameBytes(const DocumentPtr& a, const DocumentPtr& b) {
    if (!a || !b)
        return a == b;
    return a == b || a->toBSON() == b->toBSON();
}

bool sameBytes(const ArrayPtr& a, const ArrayPtr& b) {
    if (!a || !b)
        return a == b;
    return a == b || a->toBSON() == b->toBSON();
}

}  // namespace

bool BSONCodeWScope::operator==(const BSONCodeWScope& other) const {
    return code == other.code && sameBytes(scope, other.scope);
}

BSONType BSONValue::type() const {
    return std::visit(
        [](const auto& v) { return BSONTypeOf<std::decay_t<decltype(v)>>::value; }, _storage);
}

bool BSONValue::operator==(const BSONValue& other) const {
    if (_storage.index() != other._storage.index())
        return false;
    if (auto doc = getIf<DocumentPtr>())
        return sameBytes(*doc, *other.getIf<DocumentPtr>());
    if (auto arr = getIf<ArrayPtr>())
        return sameBytes(*arr, *other.getIf<ArrayPtr>());
    if (auto d = getIf<double>())
        return std::memcmp(d, other.getIf<double>(), sizeof(double)) == 0;
    return _storage == other._storage;
}

std::string BSONValue::toString() const {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, BSONNull>) {
                return "null";
            } else if constexpr (std::is_same_v<T, BSONUndefined>) {
                return "undefined";
            } else if constexpr (std::is_same_v<T, MinKey>) {
                return "MinKey";
            } else if constexpr (std::is_same_v<T, MaxKey>) {
                return "MaxKey";
            } else if constexpr (std::is_same_v<T, StringData>) {
                return fmt::format("\"{}\"", v);
            } else if constexpr (std::is_same_v<T, DocumentPtr>) {
                return fmt::format("object({} fields)", v ? v->fieldCount() : 0);
            } else if constexpr (std::is_same_v<T, ArrayPtr>) {
                return fmt::format("array({} elements)", v ? v->size() : 0);
            } else if constexpr (std::is_same_v<T, BSONBinData>) {
                return fmt::format("BinData({}, {} bytes)", static_cast<int>(v.type), v.length);
            } else if constexpr (std::is_same_v<T, OID>) {
                return fmt::format("ObjectId('{}')", v.toString());
            } else if constexpr (std::is_same_v<T, Date_t>) {
                return fmt::format("Date({})", v.toMillisSinceEpoch());
            } else if constexpr (std::is_same_v<T, BSONRegEx>) {
                return fmt::format("/{}/{}", v.pattern, v.flags);
            } else if constexpr (std::is_same_v<T, BSONDBRef>) {
                return fmt::format("DBRef('{}', {})", v.ns, v.oid.toString());
            } else if constexpr (std::is_same_v<T, BSONCode>) {
                return fmt::format("Code({})", v.code);
            } else if constexpr (std::is_same_v<T, BSONSymbol>) {
                return fmt::format("Symbol({})", v.symbol);
            } else if constexpr (std::is_same_v<T, BSONCodeWScope>) {
                return fmt::format("CodeWScope({})", v.code);
            } else if constexpr (std::is_same_v<T, Timestamp> || std::is_same_v<T, Decimal128>) {
                return v.toString();
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return fmt::format("NumberLong({})", v);
            } else {
                return fmt::format("{}", v);
            }
        },
        _storage);
}

std::ostream& operator<<(std::ostream& os, const BSONValue& value) {
    return os << value.toString();
}

}  // namespace fastbson
