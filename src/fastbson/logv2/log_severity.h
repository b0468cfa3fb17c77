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

#include "fastbson/base/string_data.h"

namespace fastbson::logv2 {

/**
 * Representation of the severity / priority of a log message.
 *
 * Severities are totally ordered, from most severe to least severe as follows:
 * Severe, Error, Warning, Info, Debug(1), Debug(2), ...
 */
class LogSeverity {
public:
    static constexpr LogSeverity Severe() {
        return LogSeverity(4);
    }
    static constexpr LogSeverity Error() {
        return LogSeverity(3);
    }
    static constexpr LogSeverity Warning() {
        return LogSeverity(2);
    }
    static constexpr LogSeverity Info() {
        return LogSeverity(0);
    }

    /**
     * Debug severities are numbered from 1 (least verbose) to 5 (most verbose). Levels outside
     * that range are clamped.
     */
    static constexpr LogSeverity Debug(int debugLevel) {
        if (debugLevel < 1)
            debugLevel = 1;
        if (debugLevel > 5)
            debugLevel = 5;
        return LogSeverity(-debugLevel);
    }

    constexpr int toInt() const {
        return _severity;
    }

    /**
     * Short form used in the "s" field of every log line: "F", "E", "W", "I", "D1" through "D5".
     */
    StringData toStringDataCompact() const;

    constexpr bool operator==(const LogSeverity& other) const = default;

    constexpr bool operator<(LogSeverity other) const {
        return _severity < other._severity;
    }
    constexpr bool operator<=(LogSeverity other) const {
        return _severity <= other._severity;
    }
    constexpr bool operator>(LogSeverity other) const {
        return _severity > other._severity;
    }
    constexpr bool operator>=(LogSeverity other) const {
        return _severity >= other._severity;
    }

private:
    constexpr explicit LogSeverity(int severity) : _severity(severity) {}

    int _severity;
};

}  // namespace fastbson::logv2
