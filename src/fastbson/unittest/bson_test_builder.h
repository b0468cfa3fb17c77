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
#include <cstring>
#include <string>

#include "fastbson/base/data_range.h"
#include "fastbson/base/string_data.h"
#include "fastbson/bson/bsontypes.h"
#include "fastbson/bson/oid.h"
#include "fastbson/platform/endian.h"

namespace fastbson {
namespace unittest {

/**
 * Writes BSON wire format for test fixtures. The library itself never encodes; this builder
 * exists so tests can describe documents, including malformed ones, without hex dumps.
 *
 *     std::string bytes = BSONTestBuilder()
 *                             .appendInt32("a", 1)
 *                             .appendString("b", "x")
 *                             .appendDocument("c", BSONTestBuilder().appendInt32("d", 2).obj())
 *                             .obj();
 *
 * Array fixtures are plain builders with element names "0", "1", ...
 */
class BSONTestBuilder {
public:
    BSONTestBuilder() {
        _buf.resize(sizeof(std::int32_t));
    }

    BSONTestBuilder& appendDouble(StringData name, double value) {
        _appendHeader(BSONType::numberDouble, name);
        return _appendLittleEndian(value);
    }

    BSONTestBuilder& appendInt32(StringData name, std::int32_t value) {
        _appendHeader(BSONType::numberInt, name);
        return _appendLittleEndian(value);
    }

    BSONTestBuilder& appendInt64(StringData name, std::int64_t value) {
        _appendHeader(BSONType::numberLong, name);
        return _appendLittleEndian(value);
    }

    BSONTestBuilder& appendBool(StringData name, bool value) {
        _appendHeader(BSONType::boolean, name);
        _buf.push_back(value ? 1 : 0);
        return *this;
    }

    BSONTestBuilder& appendString(StringData name, StringData value) {
        _appendHeader(BSONType::string, name);
        return _appendLengthPrefixedString(value);
    }

    BSONTestBuilder& appendCode(StringData name, StringData code) {
        _appendHeader(BSONType::code, name);
        return _appendLengthPrefixedString(code);
    }

    BSONTestBuilder& appendSymbol(StringData name, StringData symbol) {
        _appendHeader(BSONType::symbol, name);
        return _appendLengthPrefixedString(symbol);
    }

    BSONTestBuilder& appendDocument(StringData name, const std::string& document) {
        _appendHeader(BSONType::object, name);
        _buf += document;
        return *this;
    }

    BSONTestBuilder& appendArray(StringData name, const std::string& array) {
        _appendHeader(BSONType::array, name);
        _buf += array;
        return *this;
    }

    BSONTestBuilder& appendBinData(StringData name, BinDataType subType, StringData bytes) {
        _appendHeader(BSONType::binData, name);
        _appendLittleEndian(static_cast<std::int32_t>(bytes.size()));
        _buf.push_back(static_cast<char>(subType));
        _buf.append(bytes.data(), bytes.size());
        return *this;
    }

    BSONTestBuilder& appendOID(StringData name, const OID& oid) {
        _appendHeader(BSONType::oid, name);
        _buf.append(reinterpret_cast<const char*>(oid.view()), OID::kOIDSize);
        return *this;
    }

    BSONTestBuilder& appendDate(StringData name, std::int64_t millis) {
        _appendHeader(BSONType::date, name);
        return _appendLittleEndian(millis);
    }

    BSONTestBuilder& appendTimestamp(StringData name, std::uint32_t secs, std::uint32_t inc) {
        _appendHeader(BSONType::timestamp, name);
        return _appendLittleEndian((static_cast<std::uint64_t>(secs) << 32) | inc);
    }

    BSONTestBuilder& appendDecimal128(StringData name, std::uint64_t low, std::uint64_t high) {
        _appendHeader(BSONType::numberDecimal, name);
        _appendLittleEndian(low);
        return _appendLittleEndian(high);
    }

    BSONTestBuilder& appendRegEx(StringData name, StringData pattern, StringData flags) {
        _appendHeader(BSONType::regEx, name);
        _appendCString(pattern);
        return _appendCString(flags);
    }

    BSONTestBuilder& appendDBRef(StringData name, StringData ns, const OID& oid) {
        _appendHeader(BSONType::dbRef, name);
        _appendLengthPrefixedString(ns);
        _buf.append(reinterpret_cast<const char*>(oid.view()), OID::kOIDSize);
        return *this;
    }

    BSONTestBuilder& appendCodeWScope(StringData name,
                                      StringData code,
                                      const std::string& scope) {
        _appendHeader(BSONType::codeWScope, name);
        const std::size_t start = _buf.size();
        _appendLittleEndian(std::int32_t{0});
        _appendLengthPrefixedString(code);
        _buf += scope;
        _patchLength(start, _buf.size() - start);
        return *this;
    }

    BSONTestBuilder& appendNull(StringData name) {
        _appendHeader(BSONType::null, name);
        return *this;
    }

    BSONTestBuilder& appendUndefined(StringData name) {
        _appendHeader(BSONType::undefined, name);
        return *this;
    }

    BSONTestBuilder& appendMinKey(StringData name) {
        _appendHeader(BSONType::minKey, name);
        return *this;
    }

    BSONTestBuilder& appendMaxKey(StringData name) {
        _appendHeader(BSONType::maxKey, name);
        return *this;
    }

    /**
     * Appends a tag, name and payload verbatim. Used to produce malformed elements.
     */
    BSONTestBuilder& appendRaw(char tag, StringData name, StringData payload) {
        _buf.push_back(tag);
        _appendCString(name);
        _buf.append(payload.data(), payload.size());
        return *this;
    }

    /** Terminates the document, fills in its length and returns the bytes. */
    std::string obj() {
        _buf.push_back(0);
        _patchLength(0, _buf.size());
        return std::move(_buf);
    }

private:
    void _appendHeader(BSONType type, StringData name) {
        _buf.push_back(static_cast<char>(type));
        _appendCString(name);
    }

    BSONTestBuilder& _appendCString(StringData value) {
        _buf.append(value.data(), value.size());
        _buf.push_back(0);
        return *this;
    }

    BSONTestBuilder& _appendLengthPrefixedString(StringData value) {
        _appendLittleEndian(static_cast<std::int32_t>(value.size() + 1));
        return _appendCString(value);
    }

    template <typename T>
    BSONTestBuilder& _appendLittleEndian(T value) {
        const T little = endian::nativeToLittle(value);
        char bytes[sizeof(T)];
        std::memcpy(bytes, &little, sizeof(T));
        _buf.append(bytes, sizeof(T));
        return *this;
    }

    void _patchLength(std::size_t offset, std::size_t length) {
        const std::int32_t little = endian::nativeToLittle(static_cast<std::int32_t>(length));
        std::memcpy(&_buf[offset], &little, sizeof(little));
    }

    std::string _buf;
};

/**
 * Returns a copy of 'bytes' with its leading int32 length replaced by 'length'.
 */
inline std::string withDeclaredLength(std::string bytes, std::int32_t length) {
    const std::int32_t little = endian::nativeToLittle(length);
    std::memcpy(&bytes[0], &little, sizeof(little));
    return bytes;
}

}  // namespace unittest
}  // namespace fastbson
