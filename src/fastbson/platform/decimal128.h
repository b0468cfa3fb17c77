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
#include <string>

namespace fastbson {

/**
 * A 128 bit IEEE 754-2008 decimal in the BID encoding, carried as opaque bits. Nothing in this
 * library does decimal arithmetic; values are decoded, compared bitwise and handed back.
 */
class Decimal128 {
public:
    /**
     * The raw bits, split into the two little endian halves they are stored as on the wire.
     */
    struct Value {
        std::uint64_t low64;
        std::uint64_t high64;

        bool operator==(const Value& other) const = default;
    };

    Decimal128() = default;
    explicit Decimal128(Value dec128Value) : _value(dec128Value) {}

    Value getValue() const {
        return _value;
    }

    bool isNegative() const {
        return (_value.high64 & kSignMask) != 0;
    }

    /** Hex rendering of the raw bits, high half first. */
    std::string toString() const;

    bool operator==(const Decimal128& other) const {
        return _value == other._value;
    }

private:
    static constexpr std::uint64_t kSignMask = 1ull << 63;

    Value _value{0, 0};
};

std::ostream& operator<<(std::ostream& os, const Decimal128& d);

}  // namespace fastbson
