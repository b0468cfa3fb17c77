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
#include <cstdint>
#include <vector>

#include <boost/optional.hpp>

#include "fastbson/base/data_range.h"
#include "fastbson/base/status_with.h"
#include "fastbson/base/string_data.h"
#include "fastbson/bson/bsontypes.h"
#include "fastbson/bson/field_name_hash.h"
#include "fastbson/bson/parse_options.h"

namespace fastbson {

/**
 * Location of one element of a document, recorded without decoding its value. Offsets are
 * relative to the start of the indexed document.
 */
struct FieldEntry {
    FieldNameHash nameHash;
    std::uint32_t nameOffset;
    std::uint32_t nameLength;
    std::uint32_t valueOffset;
    std::uint32_t valueLength;
    // Position of the element in wire order.
    std::uint32_t ordinal;
    BSONType type;
};

/**
 * The field index of one document or array: a single forward scan records a FieldEntry per
 * element. Documents keep their entries sorted by name hash for binary search; arrays keep wire
 * order so positions map straight to entries.
 *
 * The index does not own the bytes it describes.
 */
class FieldIndex {
public:
    enum class Order {
        kByNameHash,
        kScanOrder,
    };

    /**
     * Scans the document that starts at bson.data(). 'bson' may extend past the document; only
     * the bytes its length prefix declares are indexed.
     *
     * For kScanOrder under ParseOptions::ArrayIndexPolicy::kStrict, element names must be the
     * decimal positions "0", "1", ... in sequence.
     */
    static StatusWith<FieldIndex> buildNoThrow(ConstDataRange bson,
                                               Order order,
                                               const ParseOptions& options = {});

    static FieldIndex build(ConstDataRange bson, Order order, const ParseOptions& options = {});

    /**
     * Returns the slot of the first element named 'name' in wire order. Hashes 'name', binary
     * searches the entries and compares raw name bytes only among entries with an equal hash.
     */
    boost::optional<std::size_t> find(StringData name) const;

    /**
     * Same contract as find() by comparing every entry in turn. Used to check find().
     */
    boost::optional<std::size_t> findLinear(StringData name) const;

    const FieldEntry& entry(std::size_t slot) const {
        return _entries[slot];
    }

    std::size_t size() const {
        return _entries.size();
    }

    bool empty() const {
        return _entries.empty();
    }

    Order order() const {
        return _order;
    }

    /** The document's own bytes, length prefix through terminator. */
    ConstDataRange document() const {
        return _document;
    }

    StringData nameAt(std::size_t slot) const;
    ConstDataRange valueAt(std::size_t slot) const;

    /**
     * Slots listed in wire order. For kScanOrder this is 0..size()-1.
     */
    std::vector<std::size_t> slotsInScanOrder() const;

private:
    FieldIndex(ConstDataRange document, Order order) : _document(document), _order(order) {}

    bool _nameEquals(const FieldEntry& entry, StringData name) const {
        return name.equalsBytes(_document.data() + entry.nameOffset, entry.nameLength);
    }

    ConstDataRange _document;
    Order _order;
    std::vector<FieldEntry> _entries;
};

}  // namespace fastbson
