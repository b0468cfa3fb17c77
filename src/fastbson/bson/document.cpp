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

#include "fastbson/bson/document.h"

#include <fmt/format.h>

#include "fastbson/util/assert_util.h"

namespace fastbson {
namespace {

/**
 * Maps each getter's return type to the BSON types it accepts and how to pull it out of a
 * decoded BSONValue.
 */
template <typename T>
struct ValueTraits {
    static bool accepts(BSONType type) {
        return type == BSONValue(T{}).type();
    }
    static T extract(const BSONValue& value) {
        return value.get<T>();
    }
};

template <>
struct ValueTraits<StringData> {
    static bool accepts(BSONType type) {
        return isStringLikeType(type);
    }
    static StringData extract(const BSONValue& value) {
        if (auto code = value.getIf<BSONCode>())
            return code->code;
        if (auto symbol = value.getIf<BSONSymbol>())
            return symbol->symbol;
        return value.get<StringData>();
    }
};

template <>
struct ValueTraits<DocumentPtr> {
    static bool accepts(BSONType type) {
        return type == BSONType::object;
    }
    static DocumentPtr extract(const BSONValue& value) {
        return value.get<DocumentPtr>();
    }
};

template <>
struct ValueTraits<ArrayPtr> {
    static bool accepts(BSONType type) {
        return type == BSONType::array;
    }
    static ArrayPtr extract(const BSONValue& value) {
        return value.get<ArrayPtr>();
    }
};

std::string describeKey(StringData name) {
    return fmt::format("field '{}'", name);
}

std::string describeKey(std::size_t position) {
    return fmt::format("element {}", position);
}

}  // namespace

template <typename Key>
template <typename T>
StatusWith<T> TypedValueAccessor<Key>::_getAs(Key key) const {
    auto slot = _slotFor(key);
    if (!slot)
        return Status(ErrorCodes::NoSuchKey, fmt::format("no {}", describeKey(key)));

    auto type = _typeAt(*slot);
    if (!ValueTraits<T>::accepts(type))
        return Status(ErrorCodes::TypeMismatch,
                      fmt::format("{} has type {}", describeKey(key), type));

    try {
        return ValueTraits<T>::extract(_valueAt(*slot));
    } catch (const DBException& ex) {
        return ex.toStatus(fmt::format("Failed to decode {}", describeKey(key)));
    }
}

template <typename Key>
template <typename T>
T TypedValueAccessor<Key>::_getAsOr(Key key, T defaultValue) const {
    auto slot = _slotFor(key);
    if (!slot || !ValueTraits<T>::accepts(_typeAt(*slot)))
        return defaultValue;
    return ValueTraits<T>::extract(_valueAt(*slot));
}

#define FASTBSON_DEFINE_TYPED_GETTER(NAME, T)                                   \
    template <typename Key>                                                     \
    T TypedValueAccessor<Key>::get##NAME(Key key) const {                       \
        return uassertStatusOK(_getAs<T>(key));                                 \
    }                                                                           \
    template <typename Key>                                                     \
    StatusWith<T> TypedValueAccessor<Key>::get##NAME##NoThrow(Key key) const {  \
        return _getAs<T>(key);                                                  \
    }                                                                           \
    template <typename Key>                                                     \
    T TypedValueAccessor<Key>::get##NAME##Or(Key key, T defaultValue) const {   \
        return _getAsOr<T>(key, std::move(defaultValue));                       \
    }

FASTBSON_DEFINE_TYPED_GETTER(Int32, std::int32_t)
FASTBSON_DEFINE_TYPED_GETTER(Int64, std::int64_t)
FASTBSON_DEFINE_TYPED_GETTER(Double, double)
FASTBSON_DEFINE_TYPED_GETTER(Boolean, bool)
FASTBSON_DEFINE_TYPED_GETTER(String, StringData)
FASTBSON_DEFINE_TYPED_GETTER(Document, DocumentPtr)
FASTBSON_DEFINE_TYPED_GETTER(Array, ArrayPtr)
FASTBSON_DEFINE_TYPED_GETTER(BinData, BSONBinData)
FASTBSON_DEFINE_TYPED_GETTER(OID, OID)
FASTBSON_DEFINE_TYPED_GETTER(Date, Date_t)
FASTBSON_DEFINE_TYPED_GETTER(Timestamp, Timestamp)
FASTBSON_DEFINE_TYPED_GETTER(Decimal128, Decimal128)
FASTBSON_DEFINE_TYPED_GETTER(RegEx, BSONRegEx)

#undef FASTBSON_DEFINE_TYPED_GETTER

template <typename Key>
boost::optional<BSONValue> TypedValueAccessor<Key>::get(Key key) const {
    auto slot = _slotFor(key);
    if (!slot)
        return boost::none;
    return _valueAt(*slot);
}

template <typename Key>
StatusWith<BSONValue> TypedValueAccessor<Key>::getNoThrow(Key key) const {
    auto slot = _slotFor(key);
    if (!slot)
        return Status(ErrorCodes::NoSuchKey, fmt::format("no {}", describeKey(key)));
    try {
        return _valueAt(*slot);
    } catch (const DBException& ex) {
        return ex.toStatus(fmt::format("Failed to decode {}", describeKey(key)));
    }
}

template <typename Key>
boost::optional<BSONType> TypedValueAccessor<Key>::typeOf(Key key) const {
    auto slot = _slotFor(key);
    if (!slot)
        return boost::none;
    return _typeAt(*slot);
}

template <typename Key>
bool TypedValueAccessor<Key>::isNull(Key key) const {
    auto slot = _slotFor(key);
    return slot && _typeAt(*slot) == BSONType::null;
}

template class TypedValueAccessor<StringData>;
template class TypedValueAccessor<std::size_t>;

std::vector<BSONValue> Array::values() const {
    std::vector<BSONValue> out;
    out.reserve(size());
    for (std::size_t i = 0; i < size(); ++i) {
        out.push_back(_valueAt(i));
    }
    return out;
}

}  // namespace fastbson
