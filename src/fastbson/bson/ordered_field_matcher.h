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
#include <string>
#include <vector>

#include <absl/container/flat_hash_map.h>
#include <boost/optional.hpp>

#include "fastbson/base/string_data.h"

namespace fastbson {

/**
 * Matches the field names of one document, in wire order, against a fixed set of targets, using
 * a previously observed field order as a hint.
 *
 * For the i-th name seen since reset(), the matcher first compares it with the i-th name of the
 * expected order. If they agree the answer is known without consulting the target set (a fast
 * path hit when that name is a target). If they disagree, or the document is longer than the
 * expected order, it falls back to a hash lookup in the target set.
 *
 * Copies share the immutable tables and have independent positions and counters, so a shared
 * matcher is used by copying it per document. A single instance is not thread safe.
 */
class OrderedFieldMatcher {
public:
    /**
     * 'targets' must not be empty. Duplicate targets keep their first index.
     */
    OrderedFieldMatcher(const std::vector<std::string>& targets,
                        const std::vector<std::string>& expectedOrder);

    /** Rewinds to the first position. Statistics are kept. */
    void reset() {
        _position = 0;
    }

    /**
     * Returns the index into 'targets' of 'name', or boost::none if it is not a target.
     */
    boost::optional<std::size_t> match(StringData name);

    std::size_t targetCount() const {
        return _tables->targets.size();
    }

    std::size_t fastPathHits() const {
        return _fastPathHits;
    }

    std::size_t slowPathFallbacks() const {
        return _slowPathFallbacks;
    }

    /** fastPathHits / (fastPathHits + slowPathFallbacks), 0 before any match. */
    double fastPathHitRate() const;

    void resetStatistics() {
        _fastPathHits = 0;
        _slowPathFallbacks = 0;
    }

private:
    struct Expected {
        std::string name;
        boost::optional<std::size_t> target;
    };

    struct Tables {
        std::vector<std::string> targets;
        absl::flat_hash_map<std::string, std::size_t> targetIndex;
        std::vector<Expected> expected;
    };

    std::shared_ptr<const Tables> _tables;
    std::size_t _position = 0;
    std::size_t _fastPathHits = 0;
    std::size_t _slowPathFallbacks = 0;
};

}  // namespace fastbson
