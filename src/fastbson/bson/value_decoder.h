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

#include "fastbson/base/data_range_cursor.h"
#include "fastbson/base/status_with.h"
#include "fastbson/bson/bson_value.h"
#include "fastbson/bson/bsontypes.h"
#include "fastbson/bson/parse_options.h"

namespace fastbson {

/**
 * Decodes one value of 'type' starting at the cursor and advances the cursor past it. On success
 * the cursor has moved by exactly valueSizeNoThrow(type, ...) bytes. On failure the cursor
 * position is unspecified.
 *
 * 'depth' is the nesting level of the document that holds the value; embedded documents and
 * arrays are built at depth + 1 with the backend options.backend selects.
 *
 * Errors: any data corruption code, InvalidUTF8 when options.validateUTF8 is set, and
 * MaxNestingDepthExceeded.
 */
StatusWith<BSONValue> decodeValueNoThrow(BSONType type,
                                         ConstDataRangeCursor* cursor,
                                         const ParseOptions& options,
                                         int depth);

BSONValue decodeValue(BSONType type,
                      ConstDataRangeCursor* cursor,
                      const ParseOptions& options,
                      int depth);

/**
 * Builds the Document or Array for the embedded bytes at the start of 'bson' with the backend
 * options.backend selects. 'depth' is the nesting level of the new document.
 */
StatusWith<DocumentPtr> makeDocumentNoThrow(ConstDataRange bson,
                                            const ParseOptions& options,
                                            int depth);

StatusWith<ArrayPtr> makeArrayNoThrow(ConstDataRange bson, const ParseOptions& options, int depth);

/**
 * Fails with MaxNestingDepthExceeded when 'depth' is beyond options.maxNestingDepth.
 */
Status checkNestingDepth(const ParseOptions& options, int depth);

}  // namespace fastbson
