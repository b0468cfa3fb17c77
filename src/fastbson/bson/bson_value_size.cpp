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

#include "fastbson/bson/bson_value_size.h"

#include <iterator>

#include "fastbson/base/data_range_cursor.h"
#include "fastbson/base/data_type_endian.h"
#include "fastbson/base/data_type_terminated.h"
#include "fastbson/bson/oid.h"
#include "fastbson/util/str.h"

namespace fastbson {

namespace {

enum SizeStyle : std::uint8_t {
    kSkip0 = 0,   // Undefined, Null
    kSkip1 = 1,   // Bool
    kSkip4 = 4,   // Int
    kSkip8 = 8,   // Double, Date, Timestamp, Long
    kSkip12 = 12, // OID
    kSkip16 = 16, // Decimal
    kString,      // String, Code, Symbol: int32 length counting the NUL, then the bytes
    kObjectOrArray,
    kBinData,
    kRegEx,
    kDBRef,
    kCodeWScope,
    kInvalid,
};

constexpr SizeStyle kSizeTable[20] = {
    kInvalid,        // \x00 EOO
    kSkip8,          // \x01 NumberDouble
    kString,         // \x02 String
    kObjectOrArray,  // \x03 Object
    kObjectOrArray,  // \x04 Array
    kBinData,        // \x05 BinData
    kSkip0,          // \x06 Undefined
    kSkip12,         // \x07 OID
    kSkip1,          // \x08 Bool
    kSkip8,          // \x09 Date
    kSkip0,          // \x0a Null
    kRegEx,          // \x0b Regex (two nul-terminated strings)
    kDBRef,          // \x0c DBRef
    kString,         // \x0d Code
    kString,         // \x0e Symbol
    kCodeWScope,     // \x0f CodeWScope
    kSkip4,          // \x10 Int
    kSkip8,          // \x11 Timestamp
    kSkip8,          // \x12 Long
    kSkip16,         // \x13 Decimal
};

SizeStyle sizeStyleFor(BSONType type) {
    const int tag = static_cast<int>(type);
    if (type == BSONType::minKey || type == BSONType::maxKey)
        return kSkip0;
    if (tag < 0 || tag >= static_cast<int>(std::size(kSizeTable)))
        return kInvalid;
    return kSizeTable[tag];
}

Status makeLengthStatus(BSONType type, std::int64_t declared, const ConstDataRange& value) {
    return Status(ErrorCodes::InvalidBSONLength,
                  str::stream() << "Invalid " << typeName(type) << " length " << declared
                                << " with " << value.length()
                                << " bytes available at offset: " << value.debug_offset());
}

/**
 * Reads a length prefix and checks 'minimum <= length' and 'prefixBytes + length + extra' fits in
 * 'value'. Returns the full size of the value.
 */
StatusWith<std::size_t> sizeFromPrefix(BSONType type,
                                       ConstDataRange value,
                                       std::int32_t minimum,
                                       std::size_t prefixBytes,
                                       std::size_t extra) {
    auto swLength = value.readNoThrow<LittleEndian<std::int32_t>>();
    if (!swLength.isOK())
        return swLength.getStatus();
    const std::int32_t length = swLength.getValue();
    if (length < minimum)
        return makeLengthStatus(type, length, value);
    const std::size_t total = prefixBytes + static_cast<std::size_t>(length) + extra;
    if (total > value.length())
        return makeLengthStatus(type, length, value);
    return total;
}

}  // namespace

int fixedValueSize(BSONType type) {
    const SizeStyle style = sizeStyleFor(type);
    return style <= kSkip16 ? static_cast<int>(style) : -1;
}

StatusWith<std::size_t> valueSizeNoThrow(BSONType type, ConstDataRange value) {
    const SizeStyle style = sizeStyleFor(type);
    if (FASTBSON_likely(style <= kSkip16)) {
        if (static_cast<std::size_t>(style) > value.length()) {
            return Status(ErrorCodes::UnexpectedEndOfBuffer,
                          str::stream() << typeName(type) << " value needs "
                                        << static_cast<int>(style) << " bytes but only "
                                        << value.length()
                                        << " remain at offset: " << value.debug_offset());
        }
        return static_cast<std::size_t>(style);
    }

    switch (style) {
        case kString:
            return sizeFromPrefix(type, value, 1, BSONLayout::kCountBytes, 0);
        case kObjectOrArray:
            return sizeFromPrefix(type, value, BSONLayout::kMinDocumentSize, 0, 0);
        case kBinData:
            return sizeFromPrefix(
                type, value, 0, BSONLayout::kCountBytes, BSONLayout::kBinDataSubTypeBytes);
        case kDBRef:
            return sizeFromPrefix(type, value, 1, BSONLayout::kCountBytes, OID::kOIDSize);
        case kCodeWScope:
            return sizeFromPrefix(type, value, BSONLayout::kMinCodeWScopeSize, 0, 0);
        case kRegEx: {
            ConstDataRangeCursor cursor(value);
            Status s = cursor.skipNoThrow<Terminated<'\0', StringData>>();
            if (s.isOK())
                s = cursor.skipNoThrow<Terminated<'\0', StringData>>();
            if (!s.isOK())
                return s;
            return value.length() - cursor.length();
        }
        default:
            return Status(ErrorCodes::InvalidTypeTag,
                          str::stream() << "Unrecognized BSON type " << static_cast<int>(type)
                                        << " at offset: " << value.debug_offset());
    }
}

std::size_t valueSize(BSONType type, ConstDataRange value) {
    return uassertStatusOK(valueSizeNoThrow(type, value));
}

StatusWith<ConstDataRange> documentRangeNoThrow(ConstDataRange buffer) {
    auto swLength = buffer.readNoThrow<LittleEndian<std::int32_t>>();
    if (!swLength.isOK())
        return swLength.getStatus();
    const std::int32_t length = swLength.getValue();
    if (length < BSONLayout::kMinDocumentSize) {
        return Status(ErrorCodes::InvalidBSONLength,
                      str::stream() << "BSON document length " << length
                                    << " is below the minimum of " << BSONLayout::kMinDocumentSize
                                    << " at offset: " << buffer.debug_offset());
    }
    const std::size_t declared = static_cast<std::size_t>(length);
    if (declared == buffer.length() + 1) {
        // Everything but the final byte is present.
        return Status(ErrorCodes::MissingTerminator,
                      str::stream() << "BSON document of length " << length
                                    << " ends before its EOO terminator at offset: "
                                    << buffer.debug_offset());
    }
    if (declared > buffer.length()) {
        return Status(ErrorCodes::UnexpectedEndOfBuffer,
                      str::stream() << "BSON document length " << length << " overruns a "
                                    << buffer.length()
                                    << " byte buffer at offset: " << buffer.debug_offset());
    }
    ConstDataRange document = buffer.slice(0, length);
    if (document.data()[length - 1] != 0) {
        return Status(ErrorCodes::MissingTerminator,
                      str::stream() << "BSON document of length " << length
                                    << " is not terminated with EOO at offset: "
                                    << buffer.debug_offset());
    }
    return document;
}

}  // namespace fastbson
