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

#include "fastbson/bson/ordered_field_matcher.h"

#include <string_view>

#include "fastbson/util/assert_util.h"

namespace fastbson {

OrderedFieldMatcher::OrderedFieldMatcher(const std::vector<std::string>& targets,
                                         const std::vector<std::string>& expectedOrder) {
    uassert(ErrorCodes::BadValue,
            "OrderedFieldMatcher requires at least one target",
            !targets.empty());

    auto tables = std::make_shared<Tables>();
    tables->targets = targets;
    tables->targetIndex.reserve(targets.size());
    for (std::size_t i = 0; i < targets.size(); ++i) {
        tables->targetIndex.try_emplace(targets[i], i);
    }

    tables->expected.reserve(expectedOrder.size());
    for (const auto& name : expectedOrder) {
        boost::optional<std::size_t> target;
        if (auto it = tables->targetIndex.find(name); it != tables->targetIndex.end())
            target = it->second;
        tables->expected.push_back({name, target});
    }

    _tables = std::move(tables);
}

boost::optional<std::size_t> OrderedFieldMatcher::match(StringData name) {
    const std::size_t position = _position++;

    if (position < _tables->expected.size()) {
        const Expected& expected = _tables->expected[position];
        if (name == StringData(expected.name)) {
            if (expected.target)
                ++_fastPathHits;
            return expected.target;
        }
    }

    ++_slowPathFallbacks;
    auto it = _tables->targetIndex.find(absl::string_view(name.data(), name.size()));
    if (it == _tables->targetIndex.end())
        return boost::none;
    return it->second;
}

double OrderedFieldMatcher::fastPathHitRate() const {
    const std::size_t total = _fastPathHits + _slowPathFallbacks;
    return total == 0 ? 0.0 : static_cast<double>(_fastPathHits) / total;
}

}  // namespace fastbson
