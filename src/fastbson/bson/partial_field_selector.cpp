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

#include "fastbson/bson/partial_field_selector.h"

#include <string_view>

#include "fastbson/base/data_range_cursor.h"
#include "fastbson/base/data_type_terminated.h"
#include "fastbson/bson/bson_value_size.h"
#include "fastbson/bson/value_decoder.h"
#include "fastbson/logv2/log.h"
#include "fastbson/util/assert_util.h"
#include "fastbson/util/str.h"

namespace fastbson {

PartialFieldSelector::PartialFieldSelector(std::vector<std::string> targets,
                                           SelectOptions options)
    : _options(std::move(options)) {
    uassert(ErrorCodes::BadValue,
            "PartialFieldSelector requires at least one target field",
            !targets.empty());

    for (auto& target : targets) {
        if (_targetIndex.try_emplace(target, _targets.size()).second)
            _targets.push_back(std::move(target));
    }

    if (_options.fieldOrderHint)
        _matcher.emplace(_targets, *_options.fieldOrderHint);
}

boost::optional<std::size_t> PartialFieldSelector::_lookup(StringData name) const {
    auto it = _targetIndex.find(absl::string_view(name.data(), name.size()));
    if (it == _targetIndex.end())
        return boost::none;
    return it->second;
}

StatusWith<SelectedFields> PartialFieldSelector::select(ConstDataRange bson,
                                                        SelectStats* stats) const {
    auto swDocument = documentRangeNoThrow(bson);
    if (!swDocument.isOK())
        return swDocument.getStatus();
    const ConstDataRange document = swDocument.getValue();

    SelectStats local;
    boost::optional<OrderedFieldMatcher> matcher = _matcher;

    SelectedFields selected;
    selected.reserve(_targets.size());
    std::vector<bool> found(_targets.size(), false);
    std::size_t remaining = _targets.size();

    ConstDataRangeCursor cursor(document);
    cursor.advance(BSONLayout::kCountBytes);

    while (true) {
        if (cursor.empty()) {
            return Status(ErrorCodes::MissingTerminator,
                          str::stream() << "BSON document of length " << document.length()
                                        << " ended without EOO at offset: "
                                        << cursor.debug_offset());
        }

        const char tag = cursor.readAndAdvance<char>();
        if (tag == 0) {
            if (!cursor.empty()) {
                return Status(ErrorCodes::InvalidBSONLength,
                              str::stream() << "EOO found " << cursor.length()
                                            << " bytes before the declared end of the document"
                                            << " at offset: " << cursor.debug_offset() - 1);
            }
            break;
        }

        const BSONType type = typeFromTagByte(tag);
        if (!isValidBSONType(static_cast<int>(type))) {
            return Status(ErrorCodes::InvalidTypeTag,
                          str::stream() << "Unrecognized BSON type " << static_cast<int>(tag)
                                        << " at offset: " << cursor.debug_offset() - 1);
        }

        Terminated<'\0', StringData> name;
        Status nameStatus = cursor.readAndAdvanceNoThrow(&name);
        if (!nameStatus.isOK())
            return nameStatus;
        ++local.fieldsScanned;

        const boost::optional<std::size_t> target =
            matcher ? matcher->match(name.value) : _lookup(name.value);

        if (target && !found[*target]) {
            auto swValue = decodeValueNoThrow(type, &cursor, _options.parseOptions, 0);
            if (!swValue.isOK())
                return swValue.getStatus().withContext(
                    fmt::format("Invalid value for field '{}'", name.value));
            selected.try_emplace(_targets[*target], std::move(swValue.getValue()));
            found[*target] = true;
            ++local.valuesDecoded;

            if (--remaining == 0 && _options.earlyExit)
                break;
            continue;
        }

        auto swSize = valueSizeNoThrow(type, cursor);
        if (!swSize.isOK())
            return swSize.getStatus().withContext(
                fmt::format("Invalid value for field '{}'", name.value));
        cursor.advance(swSize.getValue());
        ++local.valuesSkipped;
        local.bytesSkipped += swSize.getValue();
    }

    if (matcher) {
        local.orderedHits = matcher->fastPathHits();
        local.orderedFallbacks = matcher->slowPathFallbacks();
    }

    LOGV2_DEBUG(7310201,
                3,
                "Selected fields from BSON document",
                "targets"_attr = _targets.size(),
                "found"_attr = selected.size(),
                "scanned"_attr = local.fieldsScanned,
                "bytesSkipped"_attr = local.bytesSkipped);

    if (stats)
        *stats = local;
    return std::move(selected);
}

}  // namespace fastbson
