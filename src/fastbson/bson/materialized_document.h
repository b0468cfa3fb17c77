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
#include <vector>

#include <absl/container/flat_hash_map.h>

#include "fastbson/base/data_range.h"
#include "fastbson/base/status_with.h"
#include "fastbson/bson/document.h"
#include "fastbson/bson/parse_options.h"

namespace fastbson {

/**
 * The eager backend. Every value, nested ones included, is decoded during construction, so
 * getters never fail on corrupt bytes and never decode. Suited to callers that read most fields.
 *
 * String-like values still point into the source buffer, which must outlive the document.
 */
class MaterializedDocument final : public Document {
public:
    static StatusWith<std::shared_ptr<const MaterializedDocument>> parseNoThrow(
        ConstDataRange bson, const ParseOptions& options = {}, int depth = 0);

    static std::shared_ptr<const MaterializedDocument> parse(ConstDataRange bson,
                                                             const ParseOptions& options = {});

    std::size_t fieldCount() const override {
        return _values.size();
    }

    std::vector<StringData> fieldNames() const override {
        return _names;
    }

    ConstDataRange toBSON() const override {
        return _bson;
    }

protected:
    boost::optional<std::size_t> _slotFor(StringData name) const override;

    BSONType _typeAt(std::size_t slot) const override {
        return _values[slot].type();
    }

    const BSONValue& _valueAt(std::size_t slot) const override {
        return _values[slot];
    }

private:
    explicit MaterializedDocument(ConstDataRange bson) : _bson(bson) {}

    ConstDataRange _bson;

    // Wire order.
    std::vector<StringData> _names;
    std::vector<BSONValue> _values;

    // First occurrence of each name.
    absl::flat_hash_map<StringData, std::size_t> _slots;
};

class MaterializedArray final : public Array {
public:
    static StatusWith<std::shared_ptr<const MaterializedArray>> parseNoThrow(
        ConstDataRange bson, const ParseOptions& options = {}, int depth = 0);

    std::size_t size() const override {
        return _values.size();
    }

    ConstDataRange toBSON() const override {
        return _bson;
    }

protected:
    boost::optional<std::size_t> _slotFor(std::size_t position) const override {
        if (position >= _values.size())
            return boost::none;
        return position;
    }

    BSONType _typeAt(std::size_t slot) const override {
        return _values[slot].type();
    }

    const BSONValue& _valueAt(std::size_t slot) const override {
        return _values[slot];
    }

private:
    explicit MaterializedArray(ConstDataRange bson) : _bson(bson) {}

    ConstDataRange _bson;
    std::vector<BSONValue> _values;
};

}  // namespace fastbson
