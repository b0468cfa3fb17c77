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

#include <string>
#include <vector>

#include <boost/optional.hpp>

namespace fastbson {

/**
 * Options that control how a BSON buffer is indexed and decoded. Passed explicitly wherever a
 * document is parsed; there is no process-wide default to change.
 */
struct ParseOptions {
    /**
     * How array element names are treated. BSON spells array positions as decimal field names,
     * but nothing stops a writer from emitting gaps or out of order names.
     */
    enum class ArrayIndexPolicy {
        // Elements are taken in wire order regardless of their names.
        kPositional,
        // Names must be "0", "1", ... in sequence; anything else fails with MalformedArray.
        kStrict,
    };

    enum class Backend {
        // Zero-copy field index with values decoded on first access.
        kLazy,
        // Everything decoded up front into hash maps.
        kMaterialized,
    };

    static constexpr int kDefaultMaxNestingDepth = 200;

    // String, code, symbol and regex bytes are checked for well formed UTF-8 when decoded.
    bool validateUTF8 = true;

    ArrayIndexPolicy arrayIndexPolicy = ArrayIndexPolicy::kPositional;

    Backend backend = Backend::kLazy;

    // Documents nested deeper than this fail with MaxNestingDepthExceeded.
    int maxNestingDepth = kDefaultMaxNestingDepth;
};

/**
 * Options for PartialFieldSelector.
 */
struct SelectOptions {
    // Stop scanning as soon as every target has been found.
    bool earlyExit = true;

    // Field order previously observed for documents of this shape. When set, each field name is
    // first compared with the name expected at its position before the target set is consulted.
    boost::optional<std::vector<std::string>> fieldOrderHint;

    // Governs decoding of the selected values.
    ParseOptions parseOptions;
};

}  // namespace fastbson
