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

#include <sstream>
#include <string>

#include "fastbson/base/string_data.h"

namespace fastbson::str {

/**
 * Helper for building messages inline:
 *
 *     uasserted(ErrorCodes::BadValue, str::stream() << "bad field " << name);
 *
 * str::stream converts implicitly to std::string, which is what Status and the assertion
 * helpers accept.
 */
class stream {
public:
    template <typename T>
    stream& operator<<(const T& v) {
        _ss << v;
        return *this;
    }

    operator std::string() const {
        return _ss.str();
    }

    std::string str() const {
        return _ss.str();
    }

private:
    std::ostringstream _ss;
};

/**
 * Returns true if 'text' is well formed UTF-8. Overlong two byte leads (0xC0, 0xC1), leads that
 * would encode code points above U+10FFFF, stray continuation bytes and sequences cut short by the
 * end of the input are all rejected. Embedded NUL bytes are allowed.
 */
bool validUTF8(StringData text);

/**
 * Escapes 'text' for use inside a JSON string literal. Control characters become \uXXXX; bytes
 * above 0x7F are passed through unchanged.
 */
std::string escapeForJSON(StringData text);

}  // namespace fastbson::str
