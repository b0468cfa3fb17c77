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

#include <array>
#include <cstring>
#include <iosfwd>
#include <string>

#include <fmt/format.h>

namespace fastbson {

/**
 * Object ID type. The 12 bytes are kept exactly as they appear on the wire: a 4 byte big endian
 * timestamp, 5 bytes of per-process randomness and a 3 byte big endian counter.
 */
class OID {
public:
    enum { kOIDSize = 12, kTimestampSize = 4, kInstanceUniqueSize = 5, kIncrementSize = 3 };

    OID() : _data() {}

    /** init from a reference to a 12-byte array */
    explicit OID(const unsigned char (&arr)[kOIDSize]) {
        std::memcpy(_data.data(), arr, kOIDSize);
    }

    /** Copies kOIDSize bytes from 'data'. */
    static OID from(const void* data) {
        OID oid;
        std::memcpy(oid._data.data(), data, kOIDSize);
        return oid;
    }

    int compare(const OID& other) const {
        return std::memcmp(_data.data(), other._data.data(), kOIDSize);
    }

    /** The leading timestamp, in seconds since the epoch. */
    std::uint32_t getTimestamp() const;

    /** @return the object ID output as 24 hex digits */
    std::string toString() const;

    const unsigned char* view() const {
        return _data.data();
    }

    friend bool operator==(const OID& lhs, const OID& rhs) {
        return lhs.compare(rhs) == 0;
    }

private:
    std::array<unsigned char, kOIDSize> _data;
};

std::ostream& operator<<(std::ostream& s, const OID& o);

}  // namespace fastbson

template <>
struct fmt::formatter<fastbson::OID> : fmt::formatter<std::string> {
    template <typename FormatContext>
    auto format(const fastbson::OID& oid, FormatContext& ctx) const {
        return fmt::formatter<std::string>::format(oid.toString(), ctx);
    }
};
