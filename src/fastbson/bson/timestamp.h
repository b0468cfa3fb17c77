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
 * The BSON timestamp type: an increment and a seconds counter, stored on the wire as one little
 * endian 64 bit value with the increment in the low-order half.
 */
class Timestamp {
public:
    /**
     * Splits the wire value: seconds in the high-order 32 bits, increment in the low-order 32.
     */
    explicit Timestamp(unsigned long long wire)
        : _secs(static_cast<std::uint32_t>(wire >> 32)),
          _inc(static_cast<std::uint32_t>(wire)) {}

    Timestamp(std::uint32_t secs, std::uint32_t inc) : _secs(secs), _inc(inc) {}

    Timestamp() = default;

    std::uint32_t getSecs() const {
        return _secs;
    }

    std::uint32_t getInc() const {
        return _inc;
    }

    std::string toString() const;

    bool operator==(const Timestamp& other) const = default;

private:
    std::uint32_t _secs = 0;
    std::uint32_t _inc = 0;
};

std::ostream& operator<<(std::ostream& s, const Timestamp& ts);

}  // namespace fastbson
