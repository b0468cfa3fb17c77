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

#include "fastbson/bson/materialized_document.h"

#include <string>
#include <vector>

#include "fastbson/bson/lazy_document.h"
#include "fastbson/bson/parse.h"
#include "fastbson/unittest/bson_test_builder.h"
#include "fastbson/unittest/unittest.h"

namespace fastbson {
namespace {

using unittest::BSONTestBuilder;

ParseOptions materialized() {
    ParseOptions options;
    options.backend = ParseOptions::Backend::kMaterialized;
    return options;
}

std::string mixedDocument() {
    return BSONTestBuilder()
        .appendInt32("a", 1)
        .appendString("b", "x")
        .appendDocument("c", BSONTestBuilder().appendInt32("d", 2).obj())
        .appendArray("e",
                     BSONTestBuilder().appendDouble("0", 1.5).appendBool("1", true).obj())
        .appendNull("n")
        .appendInt64("l", -7)
        .appendRegEx("r", "ab+", "i")
        .obj();
}

TEST(MaterializedDocument, SameContractAsLazy) {
    const std::string bytes = mixedDocument();
    auto eager = MaterializedDocument::parse(ConstDataRange(bytes));
    auto lazy = LazyDocument::parse(ConstDataRange(bytes));

    ASSERT_EQUALS(lazy->fieldCount(), eager->fieldCount());
    ASSERT_EQUALS(lazy->fieldNames(), eager->fieldNames());
    for (StringData name : lazy->fieldNames()) {
        ASSERT_EQUALS(*lazy->typeOf(name), *eager->typeOf(name)) << name;
        ASSERT_EQUALS(*lazy->get(name), *eager->get(name)) << name;
    }

    ASSERT_EQUALS(1, eager->getInt32("a"));
    ASSERT_EQUALS("x"_sd, eager->getString("b"));
    ASSERT_EQUALS(2, eager->getDocument("c")->getInt32("d"));
    ASSERT_EQUALS(1.5, eager->getArray("e")->getDouble(0));
    ASSERT_TRUE(eager->getArray("e")->getBoolean(1));
    ASSERT_TRUE(eager->isNull("n"));
    ASSERT_EQUALS(-7, eager->getInt64("l"));
    ASSERT_EQUALS("ab+"_sd, eager->getRegEx("r").pattern);
    ASSERT_EQUALS(bytes.size(), eager->toBSON().length());
}

TEST(MaterializedDocument, ErrorsMatchLazy) {
    const std::string bytes = mixedDocument();
    auto eager = MaterializedDocument::parse(ConstDataRange(bytes));

    ASSERT_STATUS_CODE(ErrorCodes::NoSuchKey, eager->getInt32NoThrow("z"));
    ASSERT_STATUS_CODE(ErrorCodes::TypeMismatch, eager->getInt32NoThrow("b"));
    ASSERT_THROWS_CODE(eager->getString("a"), AssertionException, ErrorCodes::TypeMismatch);
    ASSERT_EQUALS(9, eager->getInt32Or("z", 9));
    ASSERT_EQUALS(9, eager->getInt32Or("b", 9));
    ASSERT_FALSE(eager->contains("z"));
    ASSERT_FALSE(eager->get("z"));
}

TEST(MaterializedDocument, DuplicateNamesReturnFirstOccurrence) {
    const std::string bytes = BSONTestBuilder()
                                  .appendInt32("BB", 1)
                                  .appendInt32("Aa", 2)
                                  .appendString("BB", "later")
                                  .obj();
    auto eager = MaterializedDocument::parse(ConstDataRange(bytes));
    ASSERT_EQUALS(3u, eager->fieldCount());
    ASSERT_EQUALS(1, eager->getInt32("BB"));
    ASSERT_EQUALS(2, eager->getInt32("Aa"));
    ASSERT_EQUALS((std::vector<StringData>{"BB"_sd, "Aa"_sd, "BB"_sd}), eager->fieldNames());
}

TEST(MaterializedDocument, DecodeErrorsSurfaceAtParse) {
    const std::string bytes = BSONTestBuilder()
                                  .appendInt32("ok", 1)
                                  .appendString("bad", StringData("\xc3\x28", 2))
                                  .obj();

    // The lazy backend only fails when the field is read.
    auto lazy = LazyDocument::parse(ConstDataRange(bytes));
    ASSERT_EQUALS(1, lazy->getInt32("ok"));

    auto sw = MaterializedDocument::parseNoThrow(ConstDataRange(bytes));
    ASSERT_EQUALS(ErrorCodes::InvalidUTF8, sw.getStatus().code());
    ASSERT_STRING_CONTAINS(sw.getStatus().reason(), "field 'bad'");

    ParseOptions lenient;
    lenient.validateUTF8 = false;
    ASSERT_OK(MaterializedDocument::parseNoThrow(ConstDataRange(bytes), lenient));
}

TEST(MaterializedDocument, NestedValuesUseTheSameBackend) {
    const std::string bytes = mixedDocument();
    auto swDocument = parseDocument(ConstDataRange(bytes), materialized());
    ASSERT_OK(swDocument);
    const DocumentPtr& doc = swDocument.getValue();

    ASSERT_TRUE(dynamic_cast<const MaterializedDocument*>(doc.get()));
    ASSERT_TRUE(dynamic_cast<const MaterializedDocument*>(doc->getDocument("c").get()));
    ASSERT_TRUE(dynamic_cast<const MaterializedArray*>(doc->getArray("e").get()));
}

TEST(MaterializedDocument, NestingDepthCheckedEagerly) {
    const std::string bytes =
        BSONTestBuilder()
            .appendDocument(
                "a",
                BSONTestBuilder()
                    .appendArray("b", BSONTestBuilder().appendInt32("0", 1).obj())
                    .obj())
            .obj();

    ParseOptions options = materialized();
    options.maxNestingDepth = 1;
    ASSERT_STATUS_CODE(ErrorCodes::MaxNestingDepthExceeded,
                       parseDocument(ConstDataRange(bytes), options));

    options.maxNestingDepth = 2;
    ASSERT_OK(parseDocument(ConstDataRange(bytes), options));
}

TEST(MaterializedDocument, StrictArraysCheckedEagerly) {
    const std::string bytes =
        BSONTestBuilder()
            .appendArray("xs", BSONTestBuilder().appendInt32("1", 1).obj())
            .obj();

    ParseOptions options = materialized();
    ASSERT_OK(parseDocument(ConstDataRange(bytes), options));

    options.arrayIndexPolicy = ParseOptions::ArrayIndexPolicy::kStrict;
    ASSERT_STATUS_CODE(ErrorCodes::MalformedArray, parseDocument(ConstDataRange(bytes), options));
}

TEST(MaterializedArray, PositionalAccess) {
    const std::string arr = BSONTestBuilder()
                                .appendInt32("0", 10)
                                .appendInt32("1", 20)
                                .appendInt32("2", 30)
                                .obj();
    auto swArray = MaterializedArray::parseNoThrow(ConstDataRange(arr));
    ASSERT_OK(swArray);
    const auto& xs = swArray.getValue();

    ASSERT_EQUALS(3u, xs->size());
    ASSERT_EQUALS(20, xs->getInt32(1));
    ASSERT_STATUS_CODE(ErrorCodes::NoSuchKey, xs->getInt32NoThrow(3));
    ASSERT_EQUALS(3u, xs->values().size());
}

}  // namespace
}  // namespace fastbson
