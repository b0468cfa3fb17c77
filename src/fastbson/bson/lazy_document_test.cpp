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

#include "fastbson/bson/lazy_document.h"

#include <limits>
#include <string>
#include <thread>
#include <vector>

#include <fmt/format.h>

#include "fastbson/bson/lazy_array.h"
#include "fastbson/bson/materialized_document.h"
#include "fastbson/unittest/bson_test_builder.h"
#include "fastbson/unittest/unittest.h"

namespace fastbson {
namespace {

using unittest::BSONTestBuilder;

std::string sampleDocument() {
    return BSONTestBuilder()
        .appendInt32("a", 1)
        .appendString("b", "x")
        .appendDocument("c", BSONTestBuilder().appendInt32("d", 2).obj())
        .obj();
}

bool pointsInto(const std::string& buffer, const char* p) {
    return p >= buffer.data() && p < buffer.data() + buffer.size();
}

TEST(LazyDocument, BasicAccess) {
    const std::string bytes = sampleDocument();
    auto doc = LazyDocument::parse(ConstDataRange(bytes));

    ASSERT_EQUALS(3u, doc->fieldCount());
    ASSERT_FALSE(doc->isEmpty());
    ASSERT_EQUALS(1, doc->getInt32("a"));
    ASSERT_EQUALS("x"_sd, doc->getString("b"));
    ASSERT_EQUALS(2, doc->getDocument("c")->getInt32("d"));
    ASSERT_TRUE(doc->contains("a"));
    ASSERT_FALSE(doc->contains("z"));
    ASSERT_EQUALS(bytes.size(), doc->toBSON().length());
}

TEST(LazyDocument, NothingDecodedUntilAccessed) {
    const std::string bytes = sampleDocument();
    auto doc = LazyDocument::parse(ConstDataRange(bytes));
    ASSERT_EQUALS(0u, doc->decodeCount());

    ASSERT_TRUE(doc->contains("c"));
    ASSERT_EQUALS(BSONType::object, *doc->typeOf("c"));
    ASSERT_EQUALS(0u, doc->decodeCount());

    ASSERT_EQUALS(1, doc->getInt32("a"));
    ASSERT_EQUALS(1u, doc->decodeCount());
}

TEST(LazyDocument, RepeatedAccessDecodesOnce) {
    const std::string bytes = sampleDocument();
    auto doc = LazyDocument::parse(ConstDataRange(bytes));

    for (int i = 0; i < 5; ++i) {
        ASSERT_EQUALS(1, doc->getInt32("a"));
        ASSERT_EQUALS(1, doc->getInt32Or("a", 9));
        ASSERT_EQUALS(BSONValue(1), *doc->get("a"));
    }
    ASSERT_EQUALS(1u, doc->decodeCount());

    auto first = doc->getDocument("c");
    auto second = doc->getDocument("c");
    ASSERT_EQUALS(first.get(), second.get());
    ASSERT_EQUALS(2u, doc->decodeCount());
}

TEST(LazyDocument, NaNValueEqualsItselfOnRepeatedAccess) {
    const std::string bytes = BSONTestBuilder()
                                  .appendDouble("nan", std::numeric_limits<double>::quiet_NaN())
                                  .appendDouble("zero", 0.0)
                                  .appendDouble("negZero", -0.0)
                                  .obj();
    auto doc = LazyDocument::parse(ConstDataRange(bytes));

    ASSERT_TRUE(*doc->get("nan") == *doc->get("nan"));
    ASSERT_EQUALS(1u, doc->decodeCount());
    ASSERT_FALSE(*doc->get("zero") == *doc->get("negZero"));
    ASSERT_TRUE(*doc->get("zero") == BSONValue(0.0));
}

TEST(LazyDocument, StringsViewTheInputBuffer) {
    const std::string bytes = sampleDocument();
    auto doc = LazyDocument::parse(ConstDataRange(bytes));

    StringData b = doc->getString("b");
    ASSERT_TRUE(pointsInto(bytes, b.data()));
    ASSERT_TRUE(pointsInto(bytes, doc->getDocument("c")->toBSON().data()));
    for (StringData name : doc->fieldNames())
        ASSERT_TRUE(pointsInto(bytes, name.data()));
}

TEST(LazyDocument, FieldNamesInWireOrder) {
    const std::string bytes = BSONTestBuilder()
                                  .appendInt32("zeta", 1)
                                  .appendInt32("alpha", 2)
                                  .appendInt32("BB", 3)
                                  .appendInt32("Aa", 4)
                                  .obj();
    auto doc = LazyDocument::parse(ConstDataRange(bytes));
    ASSERT_EQUALS((std::vector<StringData>{"zeta"_sd, "alpha"_sd, "BB"_sd, "Aa"_sd}),
                  doc->fieldNames());
    ASSERT_EQUALS(3, doc->getInt32("BB"));
    ASSERT_EQUALS(4, doc->getInt32("Aa"));
}

TEST(LazyDocument, DuplicateNamesReturnFirstOccurrence) {
    const std::string bytes =
        BSONTestBuilder().appendInt32("a", 1).appendString("a", "second").obj();
    auto doc = LazyDocument::parse(ConstDataRange(bytes));
    ASSERT_EQUALS(2u, doc->fieldCount());
    ASSERT_EQUALS(1, doc->getInt32("a"));
    ASSERT_STATUS_CODE(ErrorCodes::TypeMismatch, doc->getStringNoThrow("a"));
}

TEST(LazyDocument, EmptyDocument) {
    const std::string bytes = BSONTestBuilder().obj();
    auto doc = LazyDocument::parse(ConstDataRange(bytes));
    ASSERT_TRUE(doc->isEmpty());
    ASSERT_TRUE(doc->fieldNames().empty());
    ASSERT_FALSE(doc->get("a"));
}

TEST(LazyDocument, EveryTypedGetter) {
    const unsigned char oidBytes[OID::kOIDSize] = {
        1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12};
    const OID oid(oidBytes);
    const std::string bytes =
        BSONTestBuilder()
            .appendInt32("i32", -5)
            .appendInt64("i64", 1LL << 40)
            .appendDouble("dbl", 2.5)
            .appendBool("t", true)
            .appendBool("f", false)
            .appendString("str", "hello")
            .appendDocument("doc", BSONTestBuilder().appendString("k", "v").obj())
            .appendArray("arr", BSONTestBuilder().appendInt32("0", 7).obj())
            .appendBinData("bin", bdtUUID, StringData("\x01\x00\x02", 3))
            .appendOID("oid", oid)
            .appendDate("date", 1700000000123LL)
            .appendTimestamp("ts", 42, 7)
            .appendDecimal128("dec", 0x1234, 0x3040000000000000ULL)
            .appendRegEx("re", "^a.*", "im")
            .obj();
    auto doc = LazyDocument::parse(ConstDataRange(bytes));

    ASSERT_EQUALS(-5, doc->getInt32("i32"));
    ASSERT_EQUALS(1LL << 40, doc->getInt64("i64"));
    ASSERT_EQUALS(2.5, doc->getDouble("dbl"));
    ASSERT_TRUE(doc->getBoolean("t"));
    ASSERT_FALSE(doc->getBoolean("f"));
    ASSERT_EQUALS("hello"_sd, doc->getString("str"));
    ASSERT_EQUALS("v"_sd, doc->getDocument("doc")->getString("k"));
    ASSERT_EQUALS(7, doc->getArray("arr")->getInt32(0));

    BSONBinData bin = doc->getBinData("bin");
    ASSERT_EQUALS(bdtUUID, bin.type);
    ASSERT_EQUALS(3, bin.length);
    ASSERT_EQUALS(StringData("\x01\x00\x02", 3), bin.bytes());

    ASSERT_EQUALS(oid, doc->getOID("oid"));
    ASSERT_EQUALS(1700000000123LL, doc->getDate("date").toMillisSinceEpoch());

    Timestamp ts = doc->getTimestamp("ts");
    ASSERT_EQUALS(42u, ts.getSecs());
    ASSERT_EQUALS(7u, ts.getInc());

    Decimal128 dec = doc->getDecimal128("dec");
    ASSERT_EQUALS(0x1234u, dec.getValue().low64);
    ASSERT_EQUALS(0x3040000000000000ULL, dec.getValue().high64);

    BSONRegEx re = doc->getRegEx("re");
    ASSERT_EQUALS("^a.*"_sd, re.pattern);
    ASSERT_EQUALS("im"_sd, re.flags);
}

TEST(LazyDocument, MissingFieldAndWrongType) {
    const std::string bytes = sampleDocument();
    auto doc = LazyDocument::parse(ConstDataRange(bytes));

    auto missing = doc->getInt32NoThrow("z");
    ASSERT_EQUALS(ErrorCodes::NoSuchKey, missing.getStatus().code());
    ASSERT_STRING_CONTAINS(missing.getStatus().reason(), "no field 'z'");

    auto wrongType = doc->getInt32NoThrow("b");
    ASSERT_EQUALS(ErrorCodes::TypeMismatch, wrongType.getStatus().code());
    ASSERT_STRING_CONTAINS(wrongType.getStatus().reason(), "field 'b'");

    ASSERT_THROWS_CODE(doc->getInt32("z"), AssertionException, ErrorCodes::NoSuchKey);
    ASSERT_THROWS_CODE(doc->getString("a"), AssertionException, ErrorCodes::TypeMismatch);
    // No numeric coercion.
    ASSERT_THROWS_CODE(doc->getInt64("a"), AssertionException, ErrorCodes::TypeMismatch);
    ASSERT_THROWS_CODE(doc->getDouble("a"), AssertionException, ErrorCodes::TypeMismatch);

    ASSERT_STATUS_CODE(ErrorCodes::NoSuchKey, doc->getNoThrow("z"));
    ASSERT_FALSE(doc->typeOf("z"));
    ASSERT_EQUALS(0u, doc->decodeCount());
}

TEST(LazyDocument, OrGettersFallBackOnAbsenceAndWrongType) {
    const std::string bytes = sampleDocument();
    auto doc = LazyDocument::parse(ConstDataRange(bytes));

    ASSERT_EQUALS(1, doc->getInt32Or("a", 42));
    ASSERT_EQUALS(42, doc->getInt32Or("z", 42));
    ASSERT_EQUALS(42, doc->getInt32Or("b", 42));
    ASSERT_EQUALS("x"_sd, doc->getStringOr("b", "dflt"_sd));
    ASSERT_EQUALS("dflt"_sd, doc->getStringOr("a", "dflt"_sd));
    ASSERT_EQUALS(nullptr, doc->getArrayOr("c", nullptr));
    ASSERT_NOT_EQUALS(nullptr, doc->getDocumentOr("c", nullptr));
    ASSERT_TRUE(doc->getBooleanOr("z", true));
}

TEST(LazyDocument, NullIsPresentButNotAValue) {
    const std::string bytes =
        BSONTestBuilder().appendNull("n").appendUndefined("u").appendInt32("i", 0).obj();
    auto doc = LazyDocument::parse(ConstDataRange(bytes));

    ASSERT_TRUE(doc->contains("n"));
    ASSERT_TRUE(doc->isNull("n"));
    ASSERT_FALSE(doc->isNull("u"));
    ASSERT_FALSE(doc->isNull("i"));
    ASSERT_FALSE(doc->isNull("absent"));
    ASSERT_FALSE(doc->contains("absent"));

    auto value = doc->get("n");
    ASSERT_TRUE(value);
    ASSERT_TRUE(value->isNull());
    ASSERT_EQUALS(BSONType::undefined, doc->get("u")->type());

    ASSERT_STATUS_CODE(ErrorCodes::TypeMismatch, doc->getInt32NoThrow("n"));
    ASSERT_EQUALS(5, doc->getInt32Or("n", 5));
}

TEST(LazyDocument, StringGetterAcceptsCodeAndSymbol) {
    const std::string bytes = BSONTestBuilder()
                                  .appendCode("code", "function() {}")
                                  .appendSymbol("sym", "token")
                                  .obj();
    auto doc = LazyDocument::parse(ConstDataRange(bytes));
    ASSERT_EQUALS("function() {}"_sd, doc->getString("code"));
    ASSERT_EQUALS("token"_sd, doc->getString("sym"));
    ASSERT_EQUALS(BSONType::code, *doc->typeOf("code"));
    ASSERT_TRUE(doc->get("sym")->is<BSONSymbol>());
}

TEST(LazyDocument, DeprecatedTypes) {
    const unsigned char oidBytes[OID::kOIDSize] = {};
    const std::string scope = BSONTestBuilder().appendInt32("x", 3).obj();
    const std::string bytes = BSONTestBuilder()
                                  .appendDBRef("ref", "db.coll", OID(oidBytes))
                                  .appendCodeWScope("cws", "return x;", scope)
                                  .appendMinKey("min")
                                  .appendMaxKey("max")
                                  .obj();
    auto doc = LazyDocument::parse(ConstDataRange(bytes));

    const BSONDBRef ref = doc->get("ref")->get<BSONDBRef>();
    ASSERT_EQUALS("db.coll"_sd, ref.ns);

    auto cws = doc->get("cws");
    const auto& codeWScope = cws->get<BSONCodeWScope>();
    ASSERT_EQUALS("return x;"_sd, codeWScope.code);
    ASSERT_EQUALS(3, codeWScope.scope->getInt32("x"));

    ASSERT_EQUALS(BSONType::minKey, doc->get("min")->type());
    ASSERT_EQUALS(BSONType::maxKey, doc->get("max")->type());
}

TEST(LazyDocument, LastByteDroppedIsMissingTerminator) {
    const std::string bytes = BSONTestBuilder().appendInt32("a", 1).appendString("b", "x").obj();
    const std::string truncated = bytes.substr(0, bytes.size() - 1);

    auto swDocument = LazyDocument::parseNoThrow(ConstDataRange(truncated));
    ASSERT_STATUS_CODE(ErrorCodes::MissingTerminator, swDocument);
    ASSERT_STRING_CONTAINS(swDocument.getStatus().reason(), "EOO");
    ASSERT_STATUS_CODE(ErrorCodes::MissingTerminator,
                       MaterializedDocument::parseNoThrow(ConstDataRange(truncated)));
    ASSERT_THROWS_CODE(LazyDocument::parse(ConstDataRange(truncated)),
                       AssertionException,
                       ErrorCodes::MissingTerminator);
}

TEST(LazyDocument, TruncatedInputIsRejectedAtParse) {
    const std::string bytes = BSONTestBuilder().appendInt32("a", 1).appendString("b", "x").obj();

    // Dropping the terminator leaves the string's NUL as the last byte.
    const std::string noTerminator = unittest::withDeclaredLength(
        bytes.substr(0, bytes.size() - 1), static_cast<std::int32_t>(bytes.size() - 1));
    ASSERT_STATUS_CODE(ErrorCodes::MissingTerminator,
                       LazyDocument::parseNoThrow(ConstDataRange(noTerminator)));

    const std::string cut = unittest::withDeclaredLength(
        bytes.substr(0, bytes.size() - 2), static_cast<std::int32_t>(bytes.size() - 2));
    ASSERT_STATUS_CODE(ErrorCodes::MissingTerminator,
                       LazyDocument::parseNoThrow(ConstDataRange(cut)));

    // The buffer itself is shorter than the declared length.
    ASSERT_STATUS_CODE(ErrorCodes::UnexpectedEndOfBuffer,
                       LazyDocument::parseNoThrow(ConstDataRange(bytes.data(), bytes.size() - 2)));
    ASSERT_STATUS_CODE(ErrorCodes::UnexpectedEndOfBuffer,
                       LazyDocument::parseNoThrow(ConstDataRange(bytes.data(), 3)));

    ASSERT_THROWS_CODE(LazyDocument::parse(ConstDataRange(cut)),
                       AssertionException,
                       ErrorCodes::MissingTerminator);
}

TEST(LazyDocument, TrailingBytesAfterDocumentAreIgnored) {
    const std::string bytes = sampleDocument() + "garbage";
    auto doc = LazyDocument::parse(ConstDataRange(bytes));
    ASSERT_EQUALS(bytes.size() - 7, doc->toBSON().length());
    ASSERT_EQUALS(1, doc->getInt32("a"));
}

TEST(LazyDocument, InvalidUTF8SurfacesOnAccess) {
    const std::string bytes = BSONTestBuilder()
                                  .appendString("bad", StringData("\xff\xfe", 2))
                                  .appendString("good", "ok")
                                  .obj();
    auto doc = LazyDocument::parse(ConstDataRange(bytes));
    ASSERT_EQUALS("ok"_sd, doc->getString("good"));

    auto sw = doc->getStringNoThrow("bad");
    ASSERT_EQUALS(ErrorCodes::InvalidUTF8, sw.getStatus().code());
    ASSERT_STRING_CONTAINS(sw.getStatus().reason(), "Failed to decode field 'bad'");
    ASSERT_THROWS_CODE(doc->getString("bad"), AssertionException, ErrorCodes::InvalidUTF8);
    ASSERT_THROWS_CODE(
        doc->getStringOr("bad", "dflt"_sd), AssertionException, ErrorCodes::InvalidUTF8);
    ASSERT_EQUALS(1u, doc->decodeCount());

    ParseOptions lenient;
    lenient.validateUTF8 = false;
    auto raw = LazyDocument::parse(ConstDataRange(bytes), lenient);
    ASSERT_EQUALS(StringData("\xff\xfe", 2), raw->getString("bad"));
}

TEST(LazyDocument, MalformedNestedValueSurfacesOnAccess) {
    // The nested document frames correctly but one of its values has a bad string length.
    const std::string inner =
        BSONTestBuilder()
            .appendRaw(static_cast<char>(BSONType::string), "s", std::string("\x00\x00\x00\x00", 4))
            .obj();
    const std::string bytes =
        BSONTestBuilder().appendInt32("ok", 1).appendRaw('\x03', "nested", inner).obj();

    // Indexing only sizes the nested document, so the outer parse succeeds.
    auto doc = LazyDocument::parse(ConstDataRange(bytes));
    ASSERT_EQUALS(1, doc->getInt32("ok"));
    ASSERT_STATUS_CODE(ErrorCodes::InvalidBSONLength, doc->getDocumentNoThrow("nested"));
}

TEST(LazyDocument, NestingDepthLimit) {
    const std::string bytes =
        BSONTestBuilder()
            .appendDocument(
                "a",
                BSONTestBuilder()
                    .appendDocument(
                        "b",
                        BSONTestBuilder()
                            .appendDocument("c", BSONTestBuilder().appendInt32("d", 1).obj())
                            .obj())
                    .obj())
            .obj();

    ParseOptions options;
    options.maxNestingDepth = 2;
    auto doc = LazyDocument::parse(ConstDataRange(bytes), options);
    auto b = doc->getDocument("a")->getDocument("b");
    ASSERT_THROWS_CODE(
        b->getDocument("c"), AssertionException, ErrorCodes::MaxNestingDepthExceeded);

    options.maxNestingDepth = 3;
    auto deeper = LazyDocument::parse(ConstDataRange(bytes), options);
    ASSERT_EQUALS(
        1, deeper->getDocument("a")->getDocument("b")->getDocument("c")->getInt32("d"));

    ASSERT_STATUS_CODE(ErrorCodes::MaxNestingDepthExceeded,
                       LazyDocument::parseNoThrow(ConstDataRange(bytes), options, 4));
}

TEST(LazyDocument, ConcurrentReadersDecodeOnce) {
    BSONTestBuilder builder;
    builder.appendDocument("shared", sampleDocument());
    for (int i = 0; i < 50; ++i)
        builder.appendInt32(fmt::format("f{}", i), i);
    const std::string bytes = builder.obj();
    auto doc = LazyDocument::parse(ConstDataRange(bytes));

    constexpr int kThreads = 8;
    std::vector<const Document*> seen(kThreads, nullptr);
    std::vector<int> sums(kThreads, 0);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            seen[t] = doc->getDocument("shared").get();
            for (int i = 0; i < 50; ++i)
                sums[t] += doc->getInt32(fmt::format("f{}", i));
        });
    }
    for (auto& thread : threads)
        thread.join();

    for (int t = 0; t < kThreads; ++t) {
        ASSERT_EQUALS(seen[0], seen[t]);
        ASSERT_EQUALS(49 * 50 / 2, sums[t]);
    }
    ASSERT_EQUALS(51u, doc->decodeCount());
}

TEST(LazyArray, PositionalAccess) {
    const std::string arr = BSONTestBuilder()
                                .appendInt32("0", 10)
                                .appendInt32("1", 20)
                                .appendInt32("2", 30)
                                .obj();
    const std::string bytes = BSONTestBuilder().appendArray("xs", arr).obj();
    auto doc = LazyDocument::parse(ConstDataRange(bytes));

    ArrayPtr xs = doc->getArray("xs");
    ASSERT_EQUALS(3u, xs->size());
    ASSERT_EQUALS(20, xs->getInt32(1));
    ASSERT_TRUE(xs->contains(2));
    ASSERT_FALSE(xs->contains(3));
    ASSERT_EQUALS(-1, xs->getInt32Or(3, -1));

    auto outOfRange = xs->getInt32NoThrow(3);
    ASSERT_EQUALS(ErrorCodes::NoSuchKey, outOfRange.getStatus().code());
    ASSERT_STRING_CONTAINS(outOfRange.getStatus().reason(), "no element 3");

    ASSERT_EQUALS((std::vector<BSONValue>{BSONValue(10), BSONValue(20), BSONValue(30)}),
                  xs->values());
}

TEST(LazyArray, MixedTypesAndEmpty) {
    const std::string arr = BSONTestBuilder()
                                .appendString("0", "s")
                                .appendNull("1")
                                .appendArray("2", BSONTestBuilder().obj())
                                .obj();
    auto xs = LazyArray::parse(ConstDataRange(arr));
    ASSERT_EQUALS("s"_sd, xs->getString(0));
    ASSERT_TRUE(xs->isNull(1));
    ASSERT_TRUE(xs->getArray(2)->isEmpty());
    ASSERT_STATUS_CODE(ErrorCodes::TypeMismatch, xs->getInt32NoThrow(0));
    ASSERT_EQUALS(1u, xs->decodeCount());
}

TEST(LazyArray, IndexGapsFollowPolicy) {
    const std::string arr = BSONTestBuilder()
                                .appendInt32("0", 10)
                                .appendInt32("2", 30)
                                .appendInt32("5", 60)
                                .obj();
    const std::string bytes = BSONTestBuilder().appendArray("xs", arr).obj();

    auto positional = LazyDocument::parse(ConstDataRange(bytes))->getArray("xs");
    ASSERT_EQUALS(3u, positional->size());
    ASSERT_EQUALS(30, positional->getInt32(1));
    ASSERT_EQUALS(60, positional->getInt32(2));

    ParseOptions strict;
    strict.arrayIndexPolicy = ParseOptions::ArrayIndexPolicy::kStrict;
    auto doc = LazyDocument::parse(ConstDataRange(bytes), strict);
    ASSERT_STATUS_CODE(ErrorCodes::MalformedArray, doc->getArrayNoThrow("xs"));
    ASSERT_STATUS_CODE(ErrorCodes::MalformedArray,
                       LazyArray::parseNoThrow(ConstDataRange(arr), strict));
}

}  // namespace
}  // namespace fastbson
