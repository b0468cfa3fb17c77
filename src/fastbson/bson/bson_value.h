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
#include <memory>
#include <string>
#include <variant>

#include <fmt/format.h>

#include "fastbson/base/string_data.h"
#include "fastbson/bson/bsontypes.h"
#include "fastbson/bson/oid.h"
#include "fastbson/bson/timestamp.h"
#include "fastbson/platform/decimal128.h"
#include "fastbson/util/assert_util.h"
#include "fastbson/util/time_support.h"

namespace fastbson {

class Document;
class Array;

using DocumentPtr = std::shared_ptr<const Document>;
using ArrayPtr = std::shared_ptr<const Array>;

struct BSONNull {
    bool operator==(const BSONNull&) const = default;
};

struct BSONUndefined {
    bool operator==(const BSONUndefined&) const = default;
};

struct MinKey {
    bool operator==(const MinKey&) const = default;
};

struct MaxKey {
    bool operator==(const MaxKey&) const = default;
};

/**
 * Binary payload with its subtype. 'data' points into the source buffer.
 */
struct BSONBinData {
    BSONBinData() = default;
    BSONBinData(const void* d, int l, BinDataType t) : data(d), length(l), type(t) {}

    StringData bytes() const {
        return StringData(static_cast<const char*>(data), length);
    }

    bool operator==(const BSONBinData& other) const {
        return type == other.type && bytes() == other.bytes();
    }

    const void* data = nullptr;
    int length = 0;
    BinDataType type = BinDataGeneral;
};

struct BSONRegEx {
    StringData pattern;
    StringData flags;

    bool operator==(const BSONRegEx&) const = default;
};

/**
 * The deprecated DBPointer type: a namespace string and an ObjectId.
 */
struct BSONDBRef {
    StringData ns;
    OID oid;

    bool operator==(const BSONDBRef&) const = default;
};

struct BSONCode {
    StringData code;

    bool operator==(const BSONCode&) const = default;
};

struct BSONSymbol {
    StringData symbol;

    bool operator==(const BSONSymbol&) const = default;
};

struct BSONCodeWScope {
    StringData code;
    DocumentPtr scope;

    bool operator==(const BSONCodeWScope& other) const;
};

/**
 * One decoded BSON value. The active alternative always agrees with type(); there is no state in
 * which a value is present but of an unknown kind.
 *
 * Strings, regex parts and binary payloads are views into the source buffer. Nested documents
 * and arrays are shared views over the same buffer.
 */
class BSONValue {
public:
    using Storage = std::variant<BSONNull,
                                 BSONUndefined,
                                 MinKey,
                                 MaxKey,
                                 double,
                                 StringData,
                                 DocumentPtr,
                                 ArrayPtr,
                                 BSONBinData,
                                 OID,
                                 bool,
                                 Date_t,
                                 BSONRegEx,
                                 BSONDBRef,
                                 BSONCode,
                                 BSONSymbol,
                                 BSONCodeWScope,
                                 std::int32_t,
                                 Timestamp,
                                 std::int64_t,
                                 Decimal128>;

    BSONValue() : _storage(BSONNull{}) {}

    template <typename T>
    requires std::is_constructible_v<Storage, T&&> BSONValue(T&& value)
        : _storage(std::forward<T>(value)) {}

    BSONType type() const;

    bool isNull() const {
        return std::holds_alternative<BSONNull>(_storage);
    }

    template <typename T>
    bool is() const {
        return std::holds_alternative<T>(_storage);
    }

    /**
     * Returns the value as a T. Throws TypeMismatch if the active alternative is not T.
     */
    template <typename T>
    const T& get() const {
        const T* value = std::get_if<T>(&_storage);
        uassert(ErrorCodes::TypeMismatch,
                fmt::format("BSON value is {}, not the requested type", type()),
                value);
        return *value;
    }

    template <typename T>
    const T* getIf() const {
        return std::get_if<T>(&_storage);
    }

    const Storage& storage() const {
        return _storage;
    }

    /**
     * Debug rendering. Nested documents and arrays are summarized rather than expanded.
     */
    std::string toString() const;

    /**
     * Scalars compare by value, except doubles, which compare by bit pattern so that a NaN
     * equals itself and -0.0 differs from 0.0. Documents and arrays compare equal when they view
     * the same bytes of the same buffer.
     */
    bool operator==(const BSONValue& other) const;

private:
    Storage _storage;
};

std::ostream& operator<<(std::ostream& os, const BSONValue& value);

}  // namespace fastbson

template <>
struct fmt::formatter<fastbson::BSONValue> : fmt::formatter<std::string> {
    template <typename FormatContext>
    auto format(const fastbson::BSONValue& value, FormatContext& ctx) const {
        return fmt::formatter<std::string>::format(value.toString(), ctx);
    }
};
