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

#include "fastbson/bson/field_index.h"

#include <string>
#include <vector>

#include <fmt/format.h>

#include "fastbson/bson/field_name_hash.h"
#include "fastbson/unittest/bson_test_builder.h"
#include "fastbson/unittest/unittest.h"

namespace fastbson {
namespace {

using unittest::BSONTestBuilder;

TEST(FieldNameHash, PolynomialOverBytes) {
    ASSERT_EQUALS(0u, fieldNameHash(""_sd));
    ASSERT_EQUALS(static_cast<FieldNameHash>('a'), fieldNameHash("a"_sd));
    ASSERT_EQUALS(31u * 'a' + 'b', fieldNameHash("ab"_sd));
    // The classic collision.
    ASSERT_EQUALS(fieldNameHash("Aa"_sd), fieldNameHash("BB"_sd));
    ASSERT_EQUALS(fieldNameHash("AaAa"_sd), fieldNameHash("BBBB"_sd));
    ASSERT_EQUALS(fieldNameHash("AaBB"_sd), fieldNameHash("BBAa"_sd));
}

TEST(FieldIndex, RecordsEntriesWithoutDecoding) {
    const std::string doc = BSONTestBuilder()
                                .appendInt32("a", 1)
                                .appendString("b", "x")
                                .appendDocument("c", BSONTestBuilder().appendInt32("d", 2).obj())
                                .obj();
    FieldIndex index = FieldIndex::build(ConstDataRange(doc), FieldIndex::Order::kByNameHash);

    ASSERT_EQUALS(3u, index.size());
    ASSERT_EQUALS(doc.size(), index.document().length());

    auto a = index.find("a");
    ASSERT_TRUE(a);
    ASSERT_EQUALS(BSONType::numberInt, index.entry(*a).type);
    ASSERT_EQUALS(4u, index.entry(*a).valueLength);
    ASSERT_EQUALS(0u, index.entry(*a).ordinal);
    ASSERT_EQUALS("a"_sd, index.nameAt(*a));
    // Tag at 4, name "a\0" at 5, value at 7.
    ASSERT_EQUALS(5u, index.entry(*a).nameOffset);
    ASSERT_EQUALS(7u, index.entry(*a).valueOffset);

    auto b = index.find("b");
    ASSERT_TRUE(b);
    ASSERT_EQUALS(BSONType::string, index.entry(*b).type);
    ASSERT_EQUALS(4u + 2u, index.entry(*b).valueLength);

    auto c = index.find("c");
    ASSERT_TRUE(c);
    ASSERT_EQUALS(BSONType::object, index.entry(*c).type);
    ASSERT_EQUALS(index.entry(*c).valueLength, index.valueAt(*c).length());

    ASSERT_FALSE(index.find("z"));
    ASSERT_FALSE(index.find(""));
}

TEST(FieldIndex, EmptyDocument) {
    const std::string doc = BSONTestBuilder().obj();
    FieldIndex index = FieldIndex::build(ConstDataRange(doc), FieldIndex::Order::kByNameHash);
    ASSERT_TRUE(index.empty());
    ASSERT_FALSE(index.find("a"));
}

TEST(FieldIndex, SlotsInScanOrder) {
    const std::string doc = BSONTestBuilder()
                                .appendInt32("zeta", 1)
                                .appendInt32("alpha", 2)
                                .appendInt32("mid", 3)
                                .obj();
    FieldIndex index = FieldIndex::build(ConstDataRange(doc), FieldIndex::Order::kByNameHash);

    std::vector<std::string> names;
    for (std::size_t slot : index.slotsInScanOrder())
        names.push_back(index.nameAt(slot).toString());
    ASSERT_EQUALS((std::vector<std::string>{"zeta", "alpha", "mid"}), names);
}

TEST(FieldIndex, DuplicateNamesFindFirstOccurrence) {
    const std::string doc =
        BSONTestBuilder().appendInt32("a", 1).appendInt32("b", 2).appendInt32("a", 3).obj();
    FieldIndex index = FieldIndex::build(ConstDataRange(doc), FieldIndex::Order::kByNameHash);

    auto slot = index.find("a");
    ASSERT_TRUE(slot);
    ASSERT_EQUALS(0u, index.entry(*slot).ordinal);
    ASSERT_EQUALS(index.findLinear("a"), slot);
}

// Names engineered to share a hash must still resolve to the right entry, the same one the
// linear reference scan finds.
TEST(FieldIndex, HashCollisionsAgreeWithLinearScan) {
    const std::vector<std::string> names = {
        "Aa", "BB", "AaAa", "BBBB", "AaBB", "BBAa", "x", "C#", "Ab", "y"};
    ASSERT_EQUALS(fieldNameHash("Aa"_sd), fieldNameHash("C#"_sd));

    BSONTestBuilder builder;
    for (std::size_t i = 0; i < names.size(); ++i)
        builder.appendInt32(names[i], static_cast<std::int32_t>(i));
    const std::string doc = builder.obj();

    FieldIndex index = FieldIndex::build(ConstDataRange(doc), FieldIndex::Order::kByNameHash);
    ASSERT_EQUALS(names.size(), index.size());

    for (std::size_t i = 0; i < names.size(); ++i) {
        auto found = index.find(names[i]);
        ASSERT_TRUE(found) << names[i];
        ASSERT_EQUALS(index.findLinear(names[i]), found) << names[i];
        ASSERT_EQUALS(i, index.entry(*found).ordinal) << names[i];
        ASSERT_EQUALS(StringData(names[i]), index.nameAt(*found));
    }

    // Absent names, including ones that collide with present names.
    for (StringData missing : {"BBAaAa"_sd, "AaAaBB"_sd, "Ba"_sd, "z"_sd}) {
        ASSERT_FALSE(index.find(missing)) << missing;
        ASSERT_FALSE(index.findLinear(missing)) << missing;
    }
    ASSERT_EQUALS(fieldNameHash("BBAaAa"_sd), fieldNameHash("AaAaBB"_sd));
}

TEST(FieldIndex, CollidingDuplicatesFindFirstOccurrence) {
    const std::string doc = BSONTestBuilder()
                                .appendInt32("BB", 1)
                                .appendInt32("Aa", 2)
                                .appendInt32("BB", 3)
                                .appendInt32("Aa", 4)
                                .obj();
    FieldIndex index = FieldIndex::build(ConstDataRange(doc), FieldIndex::Order::kByNameHash);
    ASSERT_EQUALS(0u, index.entry(*index.find("BB")).ordinal);
    ASSERT_EQUALS(1u, index.entry(*index.find("Aa")).ordinal);
    ASSERT_EQUALS(index.findLinear("BB"), index.find("BB"));
    ASSERT_EQUALS(index.findLinear("Aa"), index.find("Aa"));
}

TEST(FieldIndex, ManyFields) {
    BSONTestBuilder builder;
    for (int i = 0; i < 500; ++i)
        builder.appendInt32(fmt::format("field{}", i), i);
    const std::string doc = builder.obj();

    FieldIndex index = FieldIndex::build(ConstDataRange(doc), FieldIndex::Order::kByNameHash);
    ASSERT_EQUALS(500u, index.size());
    for (int i = 0; i < 500; ++i) {
        const std::string name = fmt::format("field{}", i);
        auto found = index.find(name);
        ASSERT_TRUE(found) << name;
        ASSERT_EQUALS(static_cast<std::uint32_t>(i), index.entry(*found).ordinal);
    }
}

TEST(FieldIndex, MissingTerminator) {
    // The declared length fits the buffer but the last byte is not EOO.
    std::string doc = BSONTestBuilder().appendInt32("a", 1).obj();
    doc.back() = 'x';
    ASSERT_STATUS_CODE(
        ErrorCodes::MissingTerminator,
        FieldIndex::buildNoThrow(ConstDataRange(doc), FieldIndex::Order::kByNameHash));
}

TEST(FieldIndex, ValueRunsIntoTerminator) {
    // {a: int32} whose declared length leaves the int32 ending exactly at the final NUL.
    const std::string doc = BSONTestBuilder().appendInt32("a", 0x01020304).obj();
    const std::string truncated =
        unittest::withDeclaredLength(doc.substr(0, doc.size() - 2) + std::string(1, '\0'),
                                     static_cast<std::int32_t>(doc.size() - 1));
    ASSERT_STATUS_CODE(
        ErrorCodes::MissingTerminator,
        FieldIndex::buildNoThrow(ConstDataRange(truncated), FieldIndex::Order::kByNameHash));
}

TEST(FieldIndex, DeclaredLengthBeyondBuffer) {
    const std::string doc = BSONTestBuilder().appendInt32("a", 1).obj();
    const std::string lying =
        unittest::withDeclaredLength(doc, static_cast<std::int32_t>(doc.size() + 10));
    ASSERT_STATUS_CODE(
        ErrorCodes::UnexpectedEndOfBuffer,
        FieldIndex::buildNoThrow(ConstDataRange(lying), FieldIndex::Order::kByNameHash));
}

TEST(FieldIndex, EarlyTerminator) {
    // EOO, then more bytes before the declared end.
    const std::string element("\x10" "a\0\x01\x00\x00\x00\0", 8);
    const std::string doc =
        unittest::withDeclaredLength(std::string(4, '\0') + std::string(1, '\0') + element, 13);
    ASSERT_STATUS_CODE(
        ErrorCodes::InvalidBSONLength,
        FieldIndex::buildNoThrow(ConstDataRange(doc), FieldIndex::Order::kByNameHash));
}

TEST(FieldIndex, InvalidTypeTag) {
    const std::string doc = BSONTestBuilder().appendRaw('\x20', "a", "\x01\x02\x03\x04").obj();
    auto status =
        FieldIndex::buildNoThrow(ConstDataRange(doc), FieldIndex::Order::kByNameHash).getStatus();
    ASSERT_EQUALS(ErrorCodes::InvalidTypeTag, status.code());
    ASSERT_STRING_CONTAINS(status.reason(), "at offset: 4");
}

TEST(FieldIndex, BadValueLengthNamesTheField) {
    const std::string doc =
        BSONTestBuilder()
            .appendInt32("ok", 1)
            .appendRaw(static_cast<char>(BSONType::string), "broken", std::string("\0\0\0\0", 4))
            .obj();
    auto status =
        FieldIndex::buildNoThrow(ConstDataRange(doc), FieldIndex::Order::kByNameHash).getStatus();
    ASSERT_EQUALS(ErrorCodes::InvalidBSONLength, status.code());
    ASSERT_STRING_CONTAINS(status.reason(), "Invalid value for field 'broken'");
}

TEST(FieldIndex, ArrayKeepsWireOrder) {
    const std::string arr = BSONTestBuilder()
                                .appendInt32("0", 10)
                                .appendInt32("1", 20)
                                .appendInt32("2", 30)
                                .obj();
    ParseOptions strict;
    strict.arrayIndexPolicy = ParseOptions::ArrayIndexPolicy::kStrict;
    FieldIndex index =
        FieldIndex::build(ConstDataRange(arr), FieldIndex::Order::kScanOrder, strict);

    ASSERT_EQUALS(3u, index.size());
    for (std::size_t i = 0; i < 3; ++i) {
        ASSERT_EQUALS(i, index.entry(i).ordinal);
        ASSERT_EQUALS(StringData(std::to_string(i)), index.nameAt(i));
    }
}

TEST(FieldIndex, StrictArrayRejectsGaps) {
    const std::string arr = BSONTestBuilder().appendInt32("1", 20).appendInt32("2", 30).obj();
    ParseOptions strict;
    strict.arrayIndexPolicy = ParseOptions::ArrayIndexPolicy::kStrict;

    auto status =
        FieldIndex::buildNoThrow(ConstDataRange(arr), FieldIndex::Order::kScanOrder, strict)
            .getStatus();
    ASSERT_EQUALS(ErrorCodes::MalformedArray, status.code());
    ASSERT_STRING_CONTAINS(status.reason(), "named '1', expected '0'");
}

class FieldIndexLogTest : public unittest::Test {};

TEST_F(FieldIndexLogTest, PositionalArrayAcceptsGapsAndWarnsOnce) {
    const std::string arr =
        BSONTestBuilder().appendInt32("1", 20).appendInt32("2", 30).appendInt32("x", 40).obj();

    startCapturingLogMessages();
    FieldIndex index = FieldIndex::build(ConstDataRange(arr), FieldIndex::Order::kScanOrder);
    stopCapturingLogMessages();

    ASSERT_EQUALS(3u, index.size());
    ASSERT_EQUALS("1"_sd, index.nameAt(0));
    ASSERT_EQUALS("x"_sd, index.nameAt(2));
    ASSERT_EQUALS(1u, countTextFormatLogLinesContaining("\"id\":7310101"));
}

}  // namespace
}  // namespace fastbson
