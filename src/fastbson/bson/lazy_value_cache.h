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

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>

#include <boost/optional.hpp>

#include "fastbson/bson/bson_value.h"
#include "fastbson/platform/compiler.h"
#include "fastbson/util/assert_util.h"

namespace fastbson {

/**
 * One compute-once cell per field of a lazily decoded document.
 *
 * The slot array itself is allocated on first use, so a document that is indexed but never read
 * costs no cache memory. Concurrent first accesses to a slot run the decoder exactly once and
 * every caller observes the fully built value. A decoder that throws leaves the slot empty; the
 * next access decodes again and fails the same way.
 */
class LazyValueCache {
public:
    explicit LazyValueCache(std::size_t size) : _size(size) {}

    LazyValueCache(const LazyValueCache&) = delete;
    LazyValueCache& operator=(const LazyValueCache&) = delete;

    // _slots owns the array published by _slotArray().
    ~LazyValueCache() {
        delete[] _slots.load(std::memory_order_acquire);
    }

    template <typename DecodeFn>
    const BSONValue& getOrDecode(std::size_t slot, DecodeFn&& decode) const {
        invariant(slot < _size);
        Slot& cell = _slotArray()[slot];
        std::call_once(cell.once, [&] {
            cell.value.emplace(decode());
            _decodeCount.fetch_add(1, std::memory_order_relaxed);
        });
        return *cell.value;
    }

    /** Number of slots decoded so far. */
    std::size_t decodeCount() const {
        return _decodeCount.load(std::memory_order_relaxed);
    }

    std::size_t size() const {
        return _size;
    }

private:
    struct Slot {
        std::once_flag once;
        boost::optional<BSONValue> value;
    };

    Slot* _slotArray() const {
        Slot* slots = _slots.load(std::memory_order_acquire);
        if (FASTBSON_likely(slots != nullptr))
            return slots;

        auto fresh = std::make_unique<Slot[]>(_size);
        if (_slots.compare_exchange_strong(
                slots, fresh.get(), std::memory_order_acq_rel, std::memory_order_acquire)) {
            // Ownership passes to _slots; the destructor frees it.
            return fresh.release();
        }
        // Lost the race; 'slots' now holds the winner's array.
        return slots;
    }

    const std::size_t _size;
    mutable std::atomic<Slot*> _slots{nullptr};
    mutable std::atomic<std::size_t> _decodeCount{0};
};

}  // namespace fastbson
