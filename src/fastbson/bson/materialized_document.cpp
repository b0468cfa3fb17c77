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

#include "fastbson/bson/materialized_document.h"

#include <fmt/format.h>

#include "fastbson/base/data_range_cursor.h"
#include "fastbson/bson/field_index.h"
#include "fastbson/bson/value_decoder.h"

namespace fastbson {

namespace {

/**
 * Decodes every element of 'index' in wire order, calling 'onValue(slot, value)' for each.
 */
template <typename OnValue>
Status decodeAll(const FieldIndex& index,
                 const ParseOptions& options,
                 int depth,
                 OnValue&& onValue) {
    for (std::size_t slot : index.slotsInScanOrder()) {
        ConstDataRangeCursor cursor(index.valueAt(slot));
        auto swValue = decodeValueNoThrow(index.entry(slot).type, &cursor, options, depth);
        if (!swValue.isOK())
            return swValue.getStatus().withContext(
                fmt::format("Invalid value for field '{}'", index.nameAt(slot)));
        onValue(slot, std::move(swValue.getValue()));
    }
    return Status::OK();
}

}  // namespace

StatusWith<std::shared_ptr<const MaterializedDocument>> MaterializedDocument::parseNoThrow(
    ConstDataRange bson, const ParseOptions& options, int depth) {
    Status depthStatus = checkNestingDepth(options, depth);
    if (!depthStatus.isOK())
        return depthStatus;

    auto swIndex = FieldIndex::buildNoThrow(bson, FieldIndex::Order::kByNameHash, options);
    if (!swIndex.isOK())
        return swIndex.getStatus();
    const FieldIndex& index = swIndex.getValue();

    std::shared_ptr<MaterializedDocument> document(new MaterializedDocument(index.document()));
    document->_names.reserve(index.size());
    document->_values.reserve(index.size());
    document->_slots.reserve(index.size());

    Status status = decodeAll(index, options, depth, [&](std::size_t slot, BSONValue value) {
        const StringData name = index.nameAt(slot);
        document->_slots.try_emplace(name, document->_values.size());
        document->_names.push_back(name);
        document->_values.push_back(std::move(value));
    });
    if (!status.isOK())
        return status;

    return std::shared_ptr<const MaterializedDocument>(std::move(document));
}

std::shared_ptr<const MaterializedDocument> MaterializedDocument::parse(
    ConstDataRange bson, const ParseOptions& options) {
    return uassertStatusOK(parseNoThrow(bson, options));
}

boost::optional<std::size_t> MaterializedDocument::_slotFor(StringData name) const {
    auto it = _slots.find(name);
    if (it == _slots.end())
        return boost::none;
    return it->second;
}

StatusWith<std::shared_ptr<const MaterializedArray>> MaterializedArray::parseNoThrow(
    ConstDataRange bson, const ParseOptions& options, int depth) {
    Status depthStatus = checkNestingDepth(options, depth);
    if (!depthStatus.isOK())
        return depthStatus;

    auto swIndex = FieldIndex::buildNoThrow(bson, FieldIndex::Order::kScanOrder, options);
    if (!swIndex.isOK())
        return swIndex.getStatus();
    const FieldIndex& index = swIndex.getValue();

    std::shared_ptr<MaterializedArray> array(new MaterializedArray(index.document()));
    array->_values.reserve(index.size());

    Status status = decodeAll(index, options, depth, [&](std::size_t, BSONValue value) {
        array->_values.push_back(std::move(value));
    });
    if (!status.isOK())
        return status;

    return std::shared_ptr<const MaterializedArray>(std::move(array));
}

}  // namespace fastbson
