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

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include <boost/optional.hpp>

#include "fastbson/base/data_range.h"
#include "fastbson/base/status_with.h"
#include "fastbson/base/string_data.h"
#include "fastbson/bson/bson_value.h"
#include "fastbson/bson/bsontypes.h"

namespace fastbson {

/**
 * Typed read access shared by Document, keyed by field name, and Array, keyed by position.
 *
 * Every getter comes in three forms:
 *   getX(key)            throws AssertionException on any failure.
 *   getXNoThrow(key)     returns the same failure as a Status.
 *   getXOr(key, def)     returns 'def' when the key is absent OR holds another type. Errors in
 *                        the bytes themselves still throw.
 *
 * Failures are reported as:
 *   NoSuchKey      the key is absent. A present null is not absent.
 *   TypeMismatch   the key is present with a different type.
 *   any code for which ErrorCodes::isDataCorruption() holds, when decoding the value finds
 *   broken bytes.
 *
 * getString() accepts string, code and symbol values.
 */
template <typename Key>
class TypedValueAccessor {
public:
    virtual ~TypedValueAccessor() = default;

    std::int32_t getInt32(Key key) const;
    StatusWith<std::int32_t> getInt32NoThrow(Key key) const;
    std::int32_t getInt32Or(Key key, std::int32_t defaultValue) const;

    std::int64_t getInt64(Key key) const;
    StatusWith<std::int64_t> getInt64NoThrow(Key key) const;
    std::int64_t getInt64Or(Key key, std::int64_t defaultValue) const;

    double getDouble(Key key) const;
    StatusWith<double> getDoubleNoThrow(Key key) const;
    double getDoubleOr(Key key, double defaultValue) const;

    bool getBoolean(Key key) const;
    StatusWith<bool> getBooleanNoThrow(Key key) const;
    bool getBooleanOr(Key key, bool defaultValue) const;

    StringData getString(Key key) const;
    StatusWith<StringData> getStringNoThrow(Key key) const;
    StringData getStringOr(Key key, StringData defaultValue) const;

    DocumentPtr getDocument(Key key) const;
    StatusWith<DocumentPtr> getDocumentNoThrow(Key key) const;
    DocumentPtr getDocumentOr(Key key, DocumentPtr defaultValue) const;

    ArrayPtr getArray(Key key) const;
    StatusWith<ArrayPtr> getArrayNoThrow(Key key) const;
    ArrayPtr getArrayOr(Key key, ArrayPtr defaultValue) const;

    BSONBinData getBinData(Key key) const;
    StatusWith<BSONBinData> getBinDataNoThrow(Key key) const;
    BSONBinData getBinDataOr(Key key, BSONBinData defaultValue) const;

    OID getOID(Key key) const;
    StatusWith<OID> getOIDNoThrow(Key key) const;
    OID getOIDOr(Key key, OID defaultValue) const;

    Date_t getDate(Key key) const;
    StatusWith<Date_t> getDateNoThrow(Key key) const;
    Date_t getDateOr(Key key, Date_t defaultValue) const;

    Timestamp getTimestamp(Key key) const;
    StatusWith<Timestamp> getTimestampNoThrow(Key key) const;
    Timestamp getTimestampOr(Key key, Timestamp defaultValue) const;

    Decimal128 getDecimal128(Key key) const;
    StatusWith<Decimal128> getDecimal128NoThrow(Key key) const;
    Decimal128 getDecimal128Or(Key key, Decimal128 defaultValue) const;

    BSONRegEx getRegEx(Key key) const;
    StatusWith<BSONRegEx> getRegExNoThrow(Key key) const;
    BSONRegEx getRegExOr(Key key, BSONRegEx defaultValue) const;

    /**
     * Untyped access. boost::none means absent; a present null is a BSONValue holding BSONNull.
     */
    boost::optional<BSONValue> get(Key key) const;

    /**
     * Like get(), but absence is the NoSuchKey error.
     */
    StatusWith<BSONValue> getNoThrow(Key key) const;

    bool contains(Key key) const {
        return _slotFor(key).has_value();
    }

    /** The stored type, without decoding the value. */
    boost::optional<BSONType> typeOf(Key key) const;

    /** True only when the key is present and holds null. */
    bool isNull(Key key) const;

    /** The raw bytes this view covers, length prefix through terminator. */
    virtual ConstDataRange toBSON() const = 0;

protected:
    virtual boost::optional<std::size_t> _slotFor(Key key) const = 0;
    virtual BSONType _typeAt(std::size_t slot) const = 0;

    /**
     * Returns the decoded value in 'slot', decoding it if necessary. Throws on corrupt bytes.
     */
    virtual const BSONValue& _valueAt(std::size_t slot) const = 0;

private:
    template <typename T>
    StatusWith<T> _getAs(Key key) const;

    template <typename T>
    T _getAsOr(Key key, T defaultValue) const;
};

/**
 * A BSON document. Implementations differ in when they decode (LazyDocument on first access,
 * MaterializedDocument up front) but are interchangeable behind this interface.
 *
 * Documents are immutable once built and safe to read from several threads at once.
 */
class Document : public TypedValueAccessor<StringData> {
public:
    virtual std::size_t fieldCount() const = 0;

    bool isEmpty() const {
        return fieldCount() == 0;
    }

    /** Field names in wire order, duplicates included. */
    virtual std::vector<StringData> fieldNames() const = 0;
};

/**
 * A BSON array, addressed by position in wire order.
 */
class Array : public TypedValueAccessor<std::size_t> {
public:
    virtual std::size_t size() const = 0;

    bool isEmpty() const {
        return size() == 0;
    }

    /** Decodes every element. */
    std::vector<BSONValue> values() const;
};

extern template class TypedValueAccessor<StringData>;
extern template class TypedValueAccessor<std::size_t>;

}  // namespace fastbson
