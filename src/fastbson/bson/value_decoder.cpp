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

#include "fastbson/bson/value_decoder.h"

#include <cstdint>

#include "fastbson/base/data_type_endian.h"
#include "fastbson/base/data_type_terminated.h"
#include "fastbson/bson/bson_value_size.h"
#include "fastbson/bson/lazy_array.h"
#include "fastbson/bson/lazy_document.h"
#include "fastbson/bson/materialized_document.h"
#include "fastbson/util/str.h"

namespace fastbson {

namespace {

Status makeInvalidUTF8Status(BSONType type, std::ptrdiff_t offset) {
    return Status(ErrorCodes::InvalidUTF8,
                  str::stream() << typeName(type)
                                << " value is not valid UTF-8 at offset: " << offset);
}

template <typename T>
StatusWith<BSONValue> readLittleEndian(ConstDataRangeCursor* cursor) {
    auto swValue = cursor->readAndAdvanceNoThrow<LittleEndian<T>>();
    if (!swValue.isOK())
        return swValue.getStatus();
    return BSONValue(static_cast<T>(swValue.getValue()));
}

/**
 * Reads the int32 length, bytes and NUL of a string, code, symbol or dbPointer namespace. The
 * length counts the NUL, so it is at least one.
 */
StatusWith<StringData> readString(BSONType type,
                                  ConstDataRangeCursor* cursor,
                                  const ParseOptions& options) {
    const std::ptrdiff_t offset = cursor->debug_offset();
    auto swLength = cursor->readAndAdvanceNoThrow<LittleEndian<std::int32_t>>();
    if (!swLength.isOK())
        return swLength.getStatus();
    const std::int32_t length = swLength.getValue();

    if (length < 1 || static_cast<std::size_t>(length) > cursor->length()) {
        return Status(ErrorCodes::InvalidBSONLength,
                      str::stream() << "Invalid " << typeName(type) << " length " << length
                                    << " at offset: " << offset);
    }
    if (cursor->data()[length - 1] != '\0') {
        return Status(ErrorCodes::MissingTerminator,
                      str::stream() << typeName(type)
                                    << " value is not NUL terminated at offset: " << offset);
    }

    const StringData value(cursor->data(), length - 1);
    if (options.validateUTF8 && !str::validUTF8(value))
        return makeInvalidUTF8Status(type, offset);

    cursor->advance(length);
    return value;
}

StatusWith<StringData> readCString(BSONType type,
                                   ConstDataRangeCursor* cursor,
                                   const ParseOptions& options) {
    const std::ptrdiff_t offset = cursor->debug_offset();
    Terminated<'\0', StringData> value;
    Status status = cursor->readAndAdvanceNoThrow(&value);
    if (!status.isOK())
        return status;
    if (options.validateUTF8 && !str::validUTF8(value.value))
        return makeInvalidUTF8Status(type, offset);
    return value.value;
}

StatusWith<OID> readOID(ConstDataRangeCursor* cursor) {
    const char* const data = cursor->data();
    Status status = cursor->advanceNoThrow(OID::kOIDSize);
    if (!status.isOK())
        return status;
    return OID::from(data);
}

StatusWith<BSONValue> readBinData(ConstDataRangeCursor* cursor) {
    const std::ptrdiff_t offset = cursor->debug_offset();
    auto swLength = cursor->readAndAdvanceNoThrow<LittleEndian<std::int32_t>>();
    if (!swLength.isOK())
        return swLength.getStatus();
    const std::int32_t length = swLength.getValue();

    if (length < 0 ||
        static_cast<std::size_t>(length) + BSONLayout::kBinDataSubTypeBytes > cursor->length()) {
        return Status(ErrorCodes::InvalidBSONLength,
                      str::stream() << "Invalid binData length " << length
                                    << " at offset: " << offset);
    }

    const auto subType = static_cast<BinDataType>(
        static_cast<unsigned char>(cursor->readAndAdvance<char>()));
    const char* const data = cursor->data();
    cursor->advance(length);
    return BSONValue(BSONBinData(data, length, subType));
}

StatusWith<BSONValue> readCodeWScope(ConstDataRangeCursor* cursor,
                                     const ParseOptions& options,
                                     int depth) {
    const std::ptrdiff_t offset = cursor->debug_offset();
    auto swTotal = cursor->readNoThrow<LittleEndian<std::int32_t>>();
    if (!swTotal.isOK())
        return swTotal.getStatus();
    const std::int32_t total = swTotal.getValue();

    if (total < BSONLayout::kMinCodeWScopeSize ||
        static_cast<std::size_t>(total) > cursor->length()) {
        return Status(ErrorCodes::InvalidBSONLength,
                      str::stream() << "Invalid codeWScope length " << total
                                    << " at offset: " << offset);
    }

    // Everything after the total length must fit exactly inside it.
    ConstDataRangeCursor inner(cursor->slice(0, total));
    inner.advance(BSONLayout::kCountBytes);

    auto swCode = readString(BSONType::codeWScope, &inner, options);
    if (!swCode.isOK())
        return swCode.getStatus();

    auto swScope = makeDocumentNoThrow(inner, options, depth + 1);
    if (!swScope.isOK())
        return swScope.getStatus();
    DocumentPtr scope = std::move(swScope.getValue());

    if (scope->toBSON().length() != inner.length()) {
        return Status(ErrorCodes::InvalidBSONLength,
                      str::stream() << "codeWScope length " << total
                                    << " does not match its contents at offset: " << offset);
    }

    cursor->advance(total);
    return BSONValue(BSONCodeWScope{swCode.getValue(), std::move(scope)});
}

}  // namespace

Status checkNestingDepth(const ParseOptions& options, int depth) {
    if (depth > options.maxNestingDepth) {
        return Status(ErrorCodes::MaxNestingDepthExceeded,
                      str::stream() << "BSON nesting depth " << depth << " exceeds the limit of "
                                    << options.maxNestingDepth);
    }
    return Status::OK();
}

StatusWith<DocumentPtr> makeDocumentNoThrow(ConstDataRange bson,
                                            const ParseOptions& options,
                                            int depth) {
    if (options.backend == ParseOptions::Backend::kMaterialized) {
        auto swDocument = MaterializedDocument::parseNoThrow(bson, options, depth);
        if (!swDocument.isOK())
            return swDocument.getStatus();
        return DocumentPtr(std::move(swDocument.getValue()));
    }

    auto swDocument = LazyDocument::parseNoThrow(bson, options, depth);
    if (!swDocument.isOK())
        return swDocument.getStatus();
    return DocumentPtr(std::move(swDocument.getValue()));
}

StatusWith<ArrayPtr> makeArrayNoThrow(ConstDataRange bson, const ParseOptions& options, int depth) {
    if (options.backend == ParseOptions::Backend::kMaterialized) {
        auto swArray = MaterializedArray::parseNoThrow(bson, options, depth);
        if (!swArray.isOK())
            return swArray.getStatus();
        return ArrayPtr(std::move(swArray.getValue()));
    }

    auto swArray = LazyArray::parseNoThrow(bson, options, depth);
    if (!swArray.isOK())
        return swArray.getStatus();
    return ArrayPtr(std::move(swArray.getValue()));
}

StatusWith<BSONValue> decodeValueNoThrow(BSONType type,
                                         ConstDataRangeCursor* cursor,
                                         const ParseOptions& options,
                                         int depth) {
    switch (type) {
        case BSONType::numberDouble:
            return readLittleEndian<double>(cursor);
        case BSONType::numberInt:
            return readLittleEndian<std::int32_t>(cursor);
        case BSONType::numberLong:
            return readLittleEndian<std::int64_t>(cursor);

        case BSONType::string: {
            auto swString = readString(type, cursor, options);
            if (!swString.isOK())
                return swString.getStatus();
            return BSONValue(swString.getValue());
        }
        case BSONType::code: {
            auto swString = readString(type, cursor, options);
            if (!swString.isOK())
                return swString.getStatus();
            return BSONValue(BSONCode{swString.getValue()});
        }
        case BSONType::symbol: {
            auto swString = readString(type, cursor, options);
            if (!swString.isOK())
                return swString.getStatus();
            return BSONValue(BSONSymbol{swString.getValue()});
        }

        case BSONType::object: {
            auto swDocument = makeDocumentNoThrow(*cursor, options, depth + 1);
            if (!swDocument.isOK())
                return swDocument.getStatus();
            DocumentPtr document = std::move(swDocument.getValue());
            cursor->advance(document->toBSON().length());
            return BSONValue(std::move(document));
        }
        case BSONType::array: {
            auto swArray = makeArrayNoThrow(*cursor, options, depth + 1);
            if (!swArray.isOK())
                return swArray.getStatus();
            ArrayPtr array = std::move(swArray.getValue());
            cursor->advance(array->toBSON().length());
            return BSONValue(std::move(array));
        }

        case BSONType::binData:
            return readBinData(cursor);

        case BSONType::oid: {
            auto swOID = readOID(cursor);
            if (!swOID.isOK())
                return swOID.getStatus();
            return BSONValue(swOID.getValue());
        }

        case BSONType::boolean: {
            auto swByte = cursor->readAndAdvanceNoThrow<char>();
            if (!swByte.isOK())
                return swByte.getStatus();
            return BSONValue(swByte.getValue() != 0);
        }

        case BSONType::date: {
            auto swMillis = cursor->readAndAdvanceNoThrow<LittleEndian<std::int64_t>>();
            if (!swMillis.isOK())
                return swMillis.getStatus();
            return BSONValue(Date_t::fromMillisSinceEpoch(swMillis.getValue()));
        }

        case BSONType::timestamp: {
            auto swBits = cursor->readAndAdvanceNoThrow<LittleEndian<std::uint64_t>>();
            if (!swBits.isOK())
                return swBits.getStatus();
            return BSONValue(Timestamp(static_cast<unsigned long long>(swBits.getValue())));
        }

        case BSONType::numberDecimal: {
            auto swLow = cursor->readAndAdvanceNoThrow<LittleEndian<std::uint64_t>>();
            if (!swLow.isOK())
                return swLow.getStatus();
            auto swHigh = cursor->readAndAdvanceNoThrow<LittleEndian<std::uint64_t>>();
            if (!swHigh.isOK())
                return swHigh.getStatus();
            return BSONValue(Decimal128(Decimal128::Value{swLow.getValue(), swHigh.getValue()}));
        }

        case BSONType::regEx: {
            auto swPattern = readCString(type, cursor, options);
            if (!swPattern.isOK())
                return swPattern.getStatus();
            auto swFlags = readCString(type, cursor, options);
            if (!swFlags.isOK())
                return swFlags.getStatus();
            return BSONValue(BSONRegEx{swPattern.getValue(), swFlags.getValue()});
        }

        case BSONType::dbRef: {
            auto swNamespace = readString(type, cursor, options);
            if (!swNamespace.isOK())
                return swNamespace.getStatus();
            auto swOID = readOID(cursor);
            if (!swOID.isOK())
                return swOID.getStatus();
            return BSONValue(BSONDBRef{swNamespace.getValue(), swOID.getValue()});
        }

        case BSONType::codeWScope:
            return readCodeWScope(cursor, options, depth);

        case BSONType::null:
            return BSONValue(BSONNull{});
        case BSONType::undefined:
            return BSONValue(BSONUndefined{});
        case BSONType::minKey:
            return BSONValue(MinKey{});
        case BSONType::maxKey:
            return BSONValue(MaxKey{});

        case BSONType::eoo:
            break;
    }

    return Status(ErrorCodes::InvalidTypeTag,
                  str::stream() << "Unrecognized BSON type " << static_cast<int>(type)
                                << " at offset: " << cursor->debug_offset());
}

BSONValue decodeValue(BSONType type,
                      ConstDataRangeCursor* cursor,
                      const ParseOptions& options,
                      int depth) {
    return uassertStatusOK(decodeValueNoThrow(type, cursor, options, depth));
}

}  // namespace fastbson
