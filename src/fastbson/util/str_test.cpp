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

#include "fastbson/util/str.h"

#include <string>

#include "fastbson/unittest/unittest.h"

namespace fastbson {
namespace {

TEST(StrStream, BuildsMessage) {
    std::string message = str::stream() << "field '" << "a"_sd << "' at offset: " << 12;
    ASSERT_EQUALS(message, "field 'a' at offset: 12");
}

TEST(ValidUTF8, AcceptsWellFormed) {
    ASSERT_TRUE(str::validUTF8(""));
    ASSERT_TRUE(str::validUTF8("plain ascii"));
    ASSERT_TRUE(str::validUTF8("\xc3\xa9"));          // U+00E9
    ASSERT_TRUE(str::validUTF8("\xe2\x82\xac"));      // U+20AC
    ASSERT_TRUE(str::validUTF8("\xf0\x9f\x98\x80"));  // U+1F600
    ASSERT_TRUE(str::validUTF8("\xf4\x8f\xbf\xbf"));  // U+10FFFF
    ASSERT_TRUE(str::validUTF8(StringData("a\0b", 3)));
}

TEST(ValidUTF8, RejectsMalformed) {
    // Stray continuation byte.
    ASSERT_FALSE(str::validUTF8("\x80"));
    ASSERT_FALSE(str::validUTF8("a\xbf"));
    // Overlong two byte encodings.
    ASSERT_FALSE(str::validUTF8("\xc0\x80"));
    ASSERT_FALSE(str::validUTF8("\xc1\xbf"));
    // Beyond U+10FFFF.
    ASSERT_FALSE(str::validUTF8("\xf5\x80\x80\x80"));
    ASSERT_FALSE(str::validUTF8("\xff"));
    // Truncated sequences.
    ASSERT_FALSE(str::validUTF8("\xe2\x82"));
    ASSERT_FALSE(str::validUTF8("\xf0\x9f\x98"));
    // Lead byte where a continuation is expected.
    ASSERT_FALSE(str::validUTF8("\xe2\xc3\xa9"));
}

TEST(ValidUTF8, RejectsOverlongSurrogatesAndOutOfRange) {
    ASSERT_FALSE(str::validUTF8("\xe0\x80\xaf"));      // overlong '/'
    ASSERT_FALSE(str::validUTF8("\xe0\x9f\xbf"));      // overlong U+07FF
    ASSERT_TRUE(str::validUTF8("\xe0\xa0\x80"));       // U+0800
    ASSERT_FALSE(str::validUTF8("\xed\xa0\x80"));      // U+D800
    ASSERT_FALSE(str::validUTF8("\xed\xbf\xbf"));      // U+DFFF
    ASSERT_TRUE(str::validUTF8("\xed\x9f\xbf"));       // U+D7FF
    ASSERT_FALSE(str::validUTF8("\xf0\x8f\xbf\xbf"));  // overlong U+FFFF
    ASSERT_TRUE(str::validUTF8("\xf0\x90\x80\x80"));   // U+10000
    ASSERT_FALSE(str::validUTF8("\xf4\x90\x80\x80"));  // U+110000
}

TEST(EscapeForJSON, Escapes) {
    ASSERT_EQUALS(str::escapeForJSON("say \"hi\"\n"), "say \\\"hi\\\"\\n");
    ASSERT_EQUALS(str::escapeForJSON(StringData("\0", 1)), "\\u0000");
    ASSERT_EQUALS(str::escapeForJSON("back\\slash\t"), "back\\\\slash\\t");
    ASSERT_EQUALS(str::escapeForJSON("\xc3\xa9"), "\xc3\xa9");
}

}  // namespace
}  // namespace fastbson
