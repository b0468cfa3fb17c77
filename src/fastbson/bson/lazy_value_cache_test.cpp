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

#include "fastbson/bson/lazy_value_cache.h"

#include <atomic>
#include <thread>
#include <vector>

#include "fastbson/unittest/unittest.h"

namespace fastbson {
namespace {

TEST(LazyValueCache, UntouchedCacheDecodesNothing) {
    LazyValueCache cache(8);
    ASSERT_EQUALS(8u, cache.size());
    ASSERT_EQUALS(0u, cache.decodeCount());
}

TEST(LazyValueCache, EachSlotDecodesOnce) {
    LazyValueCache cache(3);
    int calls = 0;
    auto decode = [&] {
        ++calls;
        return BSONValue(42);
    };
    ASSERT_EQUALS(BSONValue(42), cache.getOrDecode(1, decode));
    const BSONValue* first = &cache.getOrDecode(1, decode);
    ASSERT_EQUALS(first, &cache.getOrDecode(1, decode));
    ASSERT_EQUALS(1, calls);
    ASSERT_EQUALS(1u, cache.decodeCount());

    cache.getOrDecode(2, decode);
    ASSERT_EQUALS(2, calls);
    ASSERT_EQUALS(2u, cache.decodeCount());
}

TEST(LazyValueCache, FailedDecodeLeavesTheSlotEmpty) {
    LazyValueCache cache(1);
    auto failing = []() -> BSONValue {
        uasserted(Status(ErrorCodes::InvalidUTF8, "bad bytes"));
    };
    ASSERT_THROWS_CODE(cache.getOrDecode(0, failing), AssertionException, ErrorCodes::InvalidUTF8);
    ASSERT_EQUALS(0u, cache.decodeCount());

    ASSERT_EQUALS(BSONValue(7), cache.getOrDecode(0, [] { return BSONValue(7); }));
    ASSERT_EQUALS(1u, cache.decodeCount());
}

TEST(LazyValueCache, ConcurrentFirstAccessSharesOneArray) {
    // Many caches, each raced by several threads, exercise the lost-race path of the slot array.
    for (int round = 0; round < 50; ++round) {
        LazyValueCache cache(4);
        std::atomic<int> calls{0};
        std::vector<const BSONValue*> seen(8, nullptr);
        std::vector<std::thread> threads;
        for (int t = 0; t < 8; ++t) {
            threads.emplace_back([&, t] {
                seen[t] = &cache.getOrDecode(static_cast<std::size_t>(t % 4), [&] {
                    calls.fetch_add(1);
                    return BSONValue(t % 4);
                });
            });
        }
        for (auto& thread : threads)
            thread.join();

        ASSERT_EQUALS(4, calls.load());
        ASSERT_EQUALS(4u, cache.decodeCount());
        for (int t = 0; t < 8; ++t) {
            ASSERT_EQUALS(seen[t], seen[t % 4]);
            ASSERT_EQUALS(BSONValue(t % 4), *seen[t]);
        }
    }
}

}  // namespace
}  // namespace fastbson
