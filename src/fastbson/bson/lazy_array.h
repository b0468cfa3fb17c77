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
#include <memory>

#include "fastbson/base/data_range.h"
#include "fastbson/base/status_with.h"
#include "fastbson/bson/document.h"
#include "fastbson/bson/field_index.h"
#include "fastbson/bson/lazy_value_cache.h"
#include "fastbson/bson/parse_options.h"

namespace fastbson {

/**
 * The Array counterpart of LazyDocument. Elements are indexed in wire order, so position i is
 * slot i; their names are parsed and, under ArrayIndexPolicy::kStrict, checked.
 */
class LazyArray final : public Array {
public:
    static StatusWith<std::shared_ptr<const LazyArray>> parseNoThrow(
        ConstDataRange bson, const ParseOptions& options = {}, int depth = 0);

    static std::shared_ptr<const LazyArray> parse(ConstDataRange bson,
                                                  const ParseOptions& options = {});

    std::size_t size() const override {
        return _index.size();
    }

    ConstDataRange toBSON() const override {
        return _index.document();
    }

    std::size_t decodeCount() const {
        return _cache.decodeCount();
    }

protected:
    boost::optional<std::size_t> _slotFor(std::size_t position) const override {
        if (position >= _index.size())
            return boost::none;
        return position;
    }

    BSONType _typeAt(std::size_t slot) const override {
        return _index.entry(slot).type;
    }

    const BSONValue& _valueAt(std::size_t slot) const override;

private:
    LazyArray(FieldIndex index, const ParseOptions& options, int depth);

    const FieldIndex _index;
    const ParseOptions _options;
    const int _depth;
    LazyValueCache _cache;
};

}  // namespace fastbson
