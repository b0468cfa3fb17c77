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

namespace fastbson {

using FieldNameHash = std::uint32_t;

/**
 * Hash of a field name's raw UTF-8 bytes: h = 31 * h + byte, wrapping at 32 bits. The same
 * function hashes names while indexing a buffer and keys passed to lookups, so a name always
 * hashes the same way whether it is still in the buffer or supplied by a caller.
 *
 * The function is simple enough that colliding names are easy to construct ("Aa" and "BB"),
 * which lookups must and do handle.
 */
inline FieldNameHash fieldNameHash(const char* bytes, std::size_t len) {
    FieldNameHash h = 0;
    for (std::size_t i = 0; i < len; ++i)
        h = 31 * h + static_cast<unsigned char>(bytes[i]);
    return h;
}

inline FieldNameHash fieldNameHash(StringData name) {
    return fieldNameHash(name.data(), name.size());
}

}  // namespace fastbson
