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
#include <mutex>
#include <string>
#include <vector>

#include <absl/container/flat_hash_map.h>
#include <boost/optional.hpp>

#include "fastbson/base/data_range.h"
#include "fastbson/base/status.h"
#include "fastbson/base/string_data.h"

namespace fastbson {

/**
 * Remembers, per schema id, the top level field order of the first document observed for that
 * schema. The learned order is meant to be passed back as SelectOptions::fieldOrderHint.
 *
 * The learner is owned by its caller; there is no process-wide instance. All methods are thread
 * safe.
 */
class FieldOrderLearner {
public:
    /**
     * Learns the field order of 'bson' for 'schemaId' unless one is already known. Returns the
     * index build error if 'bson' is not a valid document, in which case nothing is learned.
     */
    Status observe(StringData schemaId, ConstDataRange bson);

    boost::optional<std::vector<std::string>> learnedOrder(StringData schemaId) const;

    /** Drops what was learned for 'schemaId'. Returns false if nothing was. */
    bool forget(StringData schemaId);

    void clear();

    std::size_t size() const;

private:
    mutable std::mutex _mutex;
    absl::flat_hash_map<std::string, std::vector<std::string>> _orders;
};

}  // namespace fastbson
