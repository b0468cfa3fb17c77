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

#include "fastbson/bson/lazy_array.h"

#include "fastbson/base/data_range_cursor.h"
#include "fastbson/bson/value_decoder.h"

namespace fastbson {

LazyArray::LazyArray(FieldIndex index, const ParseOptions& options, int depth)
    : _index(std::move(index)), _options(options), _depth(depth), _cache(_index.size()) {}

StatusWith<std::shared_ptr<const LazyArray>> LazyArray::parseNoThrow(ConstDataRange bson,
                                                                     const ParseOptions& options,
                                                                     int depth) {
    Status depthStatus = checkNestingDepth(options, depth);
    if (!depthStatus.isOK())
        return depthStatus;

    auto swIndex = FieldIndex::buildNoThrow(bson, FieldIndex::Order::kScanOrder, options);
    if (!swIndex.isOK())
        return swIndex.getStatus();

    return std::shared_ptr<const LazyArray>(
        new LazyArray(std::move(swIndex.getValue()), options, depth));
}

std::shared_ptr<const LazyArray> LazyArray::parse(ConstDataRange bson,
                                                  const ParseOptions& options) {
    return uassertStatusOK(parseNoThrow(bson, options));
}

const BSONValue& LazyArray::_valueAt(std::size_t slot) const {
    return _cache.getOrDecode(slot, [&] {
        ConstDataRangeCursor cursor(_index.valueAt(slot));
        return decodeValue(_index.entry(slot).type, &cursor, _options, _depth);
    });
}

}  // namespace fastbson
