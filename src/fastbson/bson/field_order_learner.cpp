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

#define FASTBSON_LOGV2_DEFAULT_COMPONENT ::fastbson::logv2::LogComponent::kBson

#include "fastbson/bson/field_order_learner.h"

#include <string_view>

#include <fmt/format.h>

#include "fastbson/bson/field_index.h"
#include "fastbson/logv2/log.h"

namespace fastbson {

Status FieldOrderLearner::observe(StringData schemaId, ConstDataRange bson) {
    {
        std::lock_guard<std::mutex> lk(_mutex);
        if (_orders.contains(absl::string_view(schemaId.data(), schemaId.size())))
            return Status::OK();
    }

    // Index outside the lock; a concurrent observer of the same schema may do the same work, and
    // the first to insert wins.
    auto swIndex = FieldIndex::buildNoThrow(bson, FieldIndex::Order::kByNameHash);
    if (!swIndex.isOK())
        return swIndex.getStatus();
    const FieldIndex& index = swIndex.getValue();

    std::vector<std::string> order;
    order.reserve(index.size());
    for (std::size_t slot : index.slotsInScanOrder()) {
        order.push_back(index.nameAt(slot).toString());
    }

    std::lock_guard<std::mutex> lk(_mutex);
    auto [it, inserted] = _orders.try_emplace(schemaId.toString(), std::move(order));
    if (inserted) {
        LOGV2(7310301,
              "Learned field order",
              "schema"_attr = schemaId,
              "fields"_attr = it->second.size(),
              "order"_attr = fmt::format("{}", fmt::join(it->second, ",")));
    }
    return Status::OK();
}

boost::optional<std::vector<std::string>> FieldOrderLearner::learnedOrder(
    StringData schemaId) const {
    std::lock_guard<std::mutex> lk(_mutex);
    auto it = _orders.find(absl::string_view(schemaId.data(), schemaId.size()));
    if (it == _orders.end())
        return boost::none;
    return it->second;
}

bool FieldOrderLearner::forget(StringData schemaId) {
    std::lock_guard<std::mutex> lk(_mutex);
    return _orders.erase(absl::string_view(schemaId.data(), schemaId.size())) > 0;
}

void FieldOrderLearner::clear() {
    std::lock_guard<std::mutex> lk(_mutex);
    _orders.clear();
}

std::size_t FieldOrderLearner::size() const {
    std::lock_guard<std::mutex> lk(_mutex);
    return _orders.size();
}

}  // namespace fastbson
