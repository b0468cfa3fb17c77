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

#include "fastbson/bson/ordered_field_matcher.h"

#include <string>
#include <vector>

#include "fastbson/unittest/unittest.h"

namespace fastbson {
namespace {

using Names = std::vector<std::string>;

TEST(OrderedFieldMatcher, RequiresTargets) {
    ASSERT_THROWS_CODE(
        OrderedFieldMatcher(Names(), Names{"a"}), AssertionException, ErrorCodes::BadValue);
}

TEST(OrderedFieldMatcher, MatchingOrderTakesTheFastPath) {
    OrderedFieldMatcher matcher(Names{"b", "d"}, Names{"a", "b", "c", "d"});
    ASSERT_EQUALS(2u, matcher.targetCount());

    ASSERT_FALSE(matcher.match("a"));
    ASSERT_EQUALS(boost::optional<std::size_t>(0), matcher.match("b"));
    ASSERT_FALSE(matcher.match("c"));
    ASSERT_EQUALS(boost::optional<std::size_t>(1), matcher.match("d"));

    ASSERT_EQUALS(2u, matcher.fastPathHits());
    ASSERT_EQUALS(0u, matcher.slowPathFallbacks());
    ASSERT_EQUALS(1.0, matcher.fastPathHitRate());
}

TEST(OrderedFieldMatcher, UnexpectedNamesFallBackToLookup) {
    OrderedFieldMatcher matcher(Names{"b", "d"}, Names{"a", "b", "c", "d"});

    // An extra leading field shifts every position.
    ASSERT_FALSE(matcher.match("x"));
    ASSERT_FALSE(matcher.match("a"));
    ASSERT_EQUALS(boost::optional<std::size_t>(0), matcher.match("b"));
    ASSERT_FALSE(matcher.match("c"));
    // Past the end of the expected order.
    ASSERT_EQUALS(boost::optional<std::size_t>(1), matcher.match("d"));

    ASSERT_EQUALS(0u, matcher.fastPathHits());
    ASSERT_EQUALS(5u, matcher.slowPathFallbacks());
    ASSERT_EQUALS(0.0, matcher.fastPathHitRate());
}

TEST(OrderedFieldMatcher, ResetKeepsStatistics) {
    OrderedFieldMatcher matcher(Names{"a"}, Names{"a", "b"});
    ASSERT_EQUALS(0.0, matcher.fastPathHitRate());

    ASSERT_TRUE(matcher.match("a"));
    matcher.reset();
    ASSERT_TRUE(matcher.match("a"));
    ASSERT_FALSE(matcher.match("b"));
    ASSERT_EQUALS(2u, matcher.fastPathHits());

    // Without reset the next document starts past the expected order.
    ASSERT_TRUE(matcher.match("a"));
    ASSERT_EQUALS(1u, matcher.slowPathFallbacks());
    ASSERT_EQUALS(2.0 / 3.0, matcher.fastPathHitRate());

    matcher.resetStatistics();
    ASSERT_EQUALS(0u, matcher.fastPathHits());
    ASSERT_EQUALS(0u, matcher.slowPathFallbacks());
}

TEST(OrderedFieldMatcher, DuplicateTargetsKeepFirstIndex) {
    OrderedFieldMatcher matcher(Names{"a", "b", "a"}, Names{});
    ASSERT_EQUALS(boost::optional<std::size_t>(0), matcher.match("a"));
    ASSERT_EQUALS(boost::optional<std::size_t>(1), matcher.match("b"));
    ASSERT_FALSE(matcher.match("c"));
    ASSERT_EQUALS(3u, matcher.slowPathFallbacks());
}

TEST(OrderedFieldMatcher, CopiesHaveIndependentPositions) {
    OrderedFieldMatcher original(Names{"a", "b"}, Names{"a", "b"});
    ASSERT_TRUE(original.match("a"));

    OrderedFieldMatcher copy = original;
    copy.reset();
    ASSERT_EQUALS(boost::optional<std::size_t>(0), copy.match("a"));
    ASSERT_EQUALS(boost::optional<std::size_t>(1), original.match("b"));
    ASSERT_EQUALS(2u, original.fastPathHits());
    ASSERT_EQUALS(2u, copy.fastPathHits());
}

}  // namespace
}  // namespace fastbson
