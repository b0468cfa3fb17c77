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
#include <string>
#include <vector>

#include <absl/container/flat_hash_map.h>
#include <boost/optional.hpp>

#include "fastbson/base/data_range.h"
#include "fastbson/base/status_with.h"
#include "fastbson/bson/bson_value.h"
#include "fastbson/bson/ordered_field_matcher.h"
#include "fastbson/bson/parse_options.h"

namespace fastbson {

using SelectedFields = absl::flat_hash_map<std::string, BSONValue>;

/**
 * Counters for one select() call.
 */
struct SelectStats {
    std::size_t fieldsScanned = 0;
    std::size_t valuesDecoded = 0;
    std::size_t valuesSkipped = 0;
    std::size_t bytesSkipped = 0;
    std::size_t orderedHits = 0;
    std::size_t orderedFallbacks = 0;
};

/**
 * Extracts a fixed set of top level fields from BSON documents in one forward pass, without
 * building a FieldIndex. Values of fields that are not targets are stepped over using their
 * encoded sizes and never decoded. With earlyExit the scan stops once every target was found.
 *
 * When the document holds a name more than once, the first occurrence is selected.
 *
 * A selector is immutable after construction and may be shared between threads.
 */
class PartialFieldSelector {
public:
    /**
     * Throws BadValue when 'targets' is empty.
     */
    explicit PartialFieldSelector(std::vector<std::string> targets, SelectOptions options = {});

    /**
     * Scans the document at the start of 'bson'. Targets that do not occur are absent from the
     * result. Errors are those of FieldIndex::build() and decodeValue() for the bytes actually
     * visited; bytes after an early exit are not examined.
     */
    StatusWith<SelectedFields> select(ConstDataRange bson, SelectStats* stats = nullptr) const;

    const std::vector<std::string>& targets() const {
        return _targets;
    }

private:
    boost::optional<std::size_t> _lookup(StringData name) const;

    std::vector<std::string> _targets;
    absl::flat_hash_map<std::string, std::size_t> _targetIndex;
    SelectOptions _options;
    boost::optional<OrderedFieldMatcher> _matcher;
};

}  // namespace fastbson
