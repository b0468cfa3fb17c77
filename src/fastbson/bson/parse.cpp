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

#include "fastbson/bson/parse.h"

#include "fastbson/bson/value_decoder.h"

namespace fastbson {

StatusWith<DocumentPtr> parseDocument(ConstDataRange bson, const ParseOptions& options) {
    return makeDocumentNoThrow(bson, options, 0);
}

std::shared_ptr<const LazyDocument> parse(ConstDataRange bson) {
    return LazyDocument::parse(bson);
}

StatusWith<SelectedFields> selectFields(ConstDataRange bson,
                                        const std::vector<std::string>& targets,
                                        bool earlyExit) {
    if (targets.empty())
        return Status(ErrorCodes::BadValue, "selectFields requires at least one target field");

    SelectOptions options;
    options.earlyExit = earlyExit;
    return PartialFieldSelector(targets, std::move(options)).select(bson);
}

}  // namespace fastbson
