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

#include <cstddef>
#include <cstdint>

#include "fastbson/base/data_range.h"
#include "fastbson/base/status_with.h"
#include "fastbson/bson/bsontypes.h"

namespace fastbson {

/**
 * Layout constants shared by everything that walks BSON bytes.
 */
struct BSONLayout {
    static constexpr int kCountBytes = 4;
    static constexpr int kBinDataSubTypeBytes = 1;
    static constexpr int kStringTerminatorBytes = 1;
    static constexpr int kMinDocumentSize = 5;
    // length + minimal string (length + NUL) + minimal document
    static constexpr int kMinCodeWScopeSize = 14;
};

/**
 * Size in bytes of a value of 'type' when that size does not depend on the bytes, or -1 for the
 * variable width types. Returns -1 for eoo and for tags that are not BSON types at all.
 */
int fixedValueSize(BSONType type);

/**
 * Computes how many bytes the value of 'type' starting at value.data() occupies, without
 * decoding it. 'value' extends to the end of the enclosing document, so a length prefix that
 * points past it is caught here.
 *
 * Errors:
 *   InvalidTypeTag        'type' is eoo or not a BSON type.
 *   UnexpectedEndOfBuffer a fixed width value, length prefix or C string runs past the end.
 *   InvalidBSONLength     a length prefix is below its minimum or overruns 'value'.
 */
StatusWith<std::size_t> valueSizeNoThrow(BSONType type, ConstDataRange value);

std::size_t valueSize(BSONType type, ConstDataRange value);

/**
 * Frames the document that starts at buffer.data(): reads its length prefix and returns exactly
 * the bytes it declares. The prefix must be at least five, must not exceed 'buffer' and the last
 * declared byte must be the NUL terminator.
 *
 * Errors:
 *   InvalidBSONLength     the prefix is below five.
 *   MissingTerminator     the last declared byte is not NUL, or is the one byte 'buffer' lacks.
 *   UnexpectedEndOfBuffer fewer than four bytes, or the prefix overruns 'buffer' further.
 */
StatusWith<ConstDataRange> documentRangeNoThrow(ConstDataRange buffer);

}  // namespace fastbson
