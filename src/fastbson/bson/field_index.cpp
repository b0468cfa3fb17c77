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

#include "fastbson/bson/field_index.h"

#include <algorithm>
#include <numeric>

#include <fmt/format.h>

#include "fastbson/base/data_range_cursor.h"
#include "fastbson/base/data_type_terminated.h"
#include "fastbson/bson/bson_value_size.h"
#include "fastbson/logv2/log.h"
#include "fastbson/util/str.h"

namespace fastbson {

StatusWith<FieldIndex> FieldIndex::buildNoThrow(ConstDataRange bson,
                                                Order order,
                                                const ParseOptions& options) {
    auto swDocument = documentRangeNoThrow(bson);
    if (!swDocument.isOK())
        return swDocument.getStatus();

    const ConstDataRange document = swDocument.getValue();
    const char* const base = document.data();
    const bool isArray = order == Order::kScanOrder;
    const bool strictArray =
        isArray && options.arrayIndexPolicy == ParseOptions::ArrayIndexPolicy::kStrict;
    bool reportedPositionGap = false;

    FieldIndex index(document, order);
    ConstDataRangeCursor cursor(document);
    cursor.advance(BSONLayout::kCountBytes);

    while (true) {
        // The terminator check in documentRangeNoThrow() guarantees a NUL in the last byte, but
        // the last element may have consumed it as part of its value.
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

        const char* const nameStart = cursor.data();
        Terminated<'\0', StringData> name;
        Status nameStatus = cursor.readAndAdvanceNoThrow(&name);
        if (!nameStatus.isOK())
            return nameStatus;

        const std::uint32_t ordinal = static_cast<std::uint32_t>(index._entries.size());
        if (isArray) {
            const fmt::format_int expected(ordinal);
            const StringData expectedName(expected.data(), expected.size());
            if (name.value != expectedName) {
                if (strictArray) {
                    return Status(ErrorCodes::MalformedArray,
                                  str::stream()
                                      << "Array element " << ordinal << " is named '"
                                      << name.value << "', expected '" << expectedName
                                      << "' at offset: " << nameStart - base +
                                          document.debug_offset());
                }
                if (!reportedPositionGap) {
                    reportedPositionGap = true;
                    LOGV2_WARNING(7310101,
                                  "Array element name does not match its position, using wire "
                                  "order",
                                  "position"_attr = ordinal,
                                  "name"_attr = name.value);
                }
            }
        }

        auto swSize = valueSizeNoThrow(type, cursor);
        if (!swSize.isOK())
            return swSize.getStatus().withContext(
                fmt::format("Invalid value for field '{}'", name.value));
        const std::size_t size = swSize.getValue();

        index._entries.push_back(
            FieldEntry{fieldNameHash(name.value),
                       static_cast<std::uint32_t>(nameStart - base),
                       static_cast<std::uint32_t>(name.value.size()),
                       static_cast<std::uint32_t>(cursor.data() - base),
                       static_cast<std::uint32_t>(size),
                       ordinal,
                       type});

        cursor.advance(size);
    }

    if (order == Order::kByNameHash) {
        std::stable_sort(index._entries.begin(),
                         index._entries.end(),
                         [](const FieldEntry& a, const FieldEntry& b) {
                             return a.nameHash < b.nameHash;
                         });
    }

    LOGV2_DEBUG(7310102,
                3,
                "Indexed BSON document",
                "fields"_attr = index._entries.size(),
                "bytes"_attr = document.length(),
                "isArray"_attr = isArray);

    return std::move(index);
}

FieldIndex FieldIndex::build(ConstDataRange bson, Order order, const ParseOptions& options) {
    return uassertStatusOK(buildNoThrow(bson, order, options));
}

boost::optional<std::size_t> FieldIndex::find(StringData name) const {
    if (_order == Order::kScanOrder)
        return findLinear(name);

    const FieldNameHash hash = fieldNameHash(name);
    auto it = std::lower_bound(
        _entries.begin(), _entries.end(), hash, [](const FieldEntry& entry, FieldNameHash h) {
            return entry.nameHash < h;
        });

    // Entries with equal hashes sit together in wire order, so the first byte match is the
    // first occurrence of the name.
    for (; it != _entries.end() && it->nameHash == hash; ++it) {
        if (_nameEquals(*it, name))
            return static_cast<std::size_t>(it - _entries.begin());
    }
    return boost::none;
}

boost::optional<std::size_t> FieldIndex::findLinear(StringData name) const {
    boost::optional<std::size_t> best;
    for (std::size_t slot = 0; slot < _entries.size(); ++slot) {
        if (!_nameEquals(_entries[slot], name))
            continue;
        if (!best || _entries[slot].ordinal < _entries[*best].ordinal)
            best = slot;
    }
    return best;
}

StringData FieldIndex::nameAt(std::size_t slot) const {
    const FieldEntry& e = _entries[slot];
    return StringData(_document.data() + e.nameOffset, e.nameLength);
}

ConstDataRange FieldIndex::valueAt(std::size_t slot) const {
    const FieldEntry& e = _entries[slot];
    return ConstDataRange(
        _document.data() + e.valueOffset, e.valueLength, _document.debug_offset() + e.valueOffset);
}

std::vector<std::size_t> FieldIndex::slotsInScanOrder() const {
    std::vector<std::size_t> slots(_entries.size());
    std::iota(slots.begin(), slots.end(), 0);
    if (_order == Order::kByNameHash) {
        std::sort(slots.begin(), slots.end(), [this](std::size_t a, std::size_t b) {
            return _entries[a].ordinal < _entries[b].ordinal;
        });
    }
    return slots;
}

}  // namespace fastbson
