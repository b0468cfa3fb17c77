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

#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <string>

namespace fastbson {

/**
 * Representation of a point in time, with millisecond resolution. This is the decoded form of
 * the BSON date type: signed milliseconds since the Unix epoch, UTC.
 */
class Date_t {
public:
    static constexpr Date_t fromMillisSinceEpoch(long long m) {
        return Date_t(m);
    }

    constexpr Date_t() = default;

    constexpr long long toMillisSinceEpoch() const {
        return millis;
    }

    std::chrono::system_clock::time_point toSystemTimePoint() const {
        return std::chrono::system_clock::time_point(std::chrono::milliseconds(millis));
    }

    /** ISO 8601 rendering in UTC, e.g. 2024-01-31T10:00:00.000Z */
    std::string toString() const;

    constexpr bool operator==(const Date_t& other) const = default;

    constexpr bool operator<(const Date_t& other) const {
        return millis < other.millis;
    }

private:
    constexpr explicit Date_t(long long m) : millis(m) {}

    long long millis = 0;
};

std::ostream& operator<<(std::ostream& os, Date_t date);

}  // namespace fastbson
