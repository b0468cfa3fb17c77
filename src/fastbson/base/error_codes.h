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

#include <fmt/format.h>

namespace fastbson {

/**
 * The table of error codes used by Status and DBException.
 *
 * Numeric values are part of the public contract and must never be reused. Add new codes at the
 * end, before MaxError, and give each one a name in errorString().
 */
class ErrorCodes {
public:
    // Explicitly 32-bits wide so that non-symbolic values, like uassert codes, are valid.
    enum Error : std::int32_t {
        OK = 0,
        InternalError = 1,
        BadValue = 2,
        NoSuchKey = 4,
        TypeMismatch = 14,
        UnexpectedEndOfBuffer = 50,
        MissingTerminator = 51,
        InvalidTypeTag = 52,
        InvalidUTF8 = 53,
        InvalidBSONLength = 54,
        MalformedArray = 55,
        MaxNestingDepthExceeded = 56,
        MaxError
    };

    static std::string errorString(Error err);

    /**
     * True when the error means the input bytes are structurally broken, as opposed to a lookup
     * miss or a type disagreement. Callers treat these as data-integrity failures.
     */
    static bool isDataCorruption(Error err);
};

std::ostream& operator<<(std::ostream& stream, ErrorCodes::Error code);

}  // namespace fastbson

template <>
struct fmt::formatter<fastbson::ErrorCodes::Error> : fmt::formatter<std::string> {
    template <typename FormatContext>
    auto format(fastbson::ErrorCodes::Error code, FormatContext& ctx) const {
        return fmt::formatter<std::string>::format(fastbson::ErrorCodes::errorString(code), ctx);
    }
};
